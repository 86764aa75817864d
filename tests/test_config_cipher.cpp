#include <gtest/gtest.h>
#include "store/config_cipher.hpp"
#include "common/config.hpp"
#include "common/crypto.hpp"

using namespace dashstore;
using namespace dashstore::store;
namespace json = boost::json;

namespace {

constexpr const char* KEY_HEX = "00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff";
constexpr const char* OTHER_KEY_HEX = "ffeeddccbbaa99887766554433221100ffeeddccbbaa99887766554433221100";

json::object sample_config() {
    json::object config;
    config["url"] = "http://sonarr.local:8989";
    config["apiKey"] = "0123456789abcdef";
    config["timeout"] = 30;
    return config;
}

}  // anonymous namespace

class ConfigCipherTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::init());
    }
};

TEST_F(ConfigCipherTest, ParseMode) {
    EXPECT_EQ(parse_cipher_mode("plaintext"), CipherMode::Plaintext);
    EXPECT_EQ(parse_cipher_mode("encrypted"), CipherMode::Encrypted);
    EXPECT_FALSE(parse_cipher_mode("aes").has_value());
}

TEST_F(ConfigCipherTest, PlaintextModeSerializes) {
    auto stored = encrypt_config(sample_config(), CipherMode::Plaintext, KEY_HEX);
    EXPECT_EQ(stored, json::serialize(sample_config()));

    auto opened = decrypt_config(stored, CipherMode::Plaintext, KEY_HEX);
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(*opened, sample_config());
}

TEST_F(ConfigCipherTest, EncryptedRoundtrip) {
    auto stored = encrypt_config(sample_config(), CipherMode::Encrypted, KEY_HEX);
    EXPECT_TRUE(is_likely_encrypted(stored));
    EXPECT_EQ(stored.find("sonarr"), std::string::npos);

    auto opened = decrypt_config(stored, CipherMode::Encrypted, KEY_HEX);
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(*opened, sample_config());
}

TEST_F(ConfigCipherTest, SealedLayout) {
    auto stored = encrypt_config(sample_config(), CipherMode::Encrypted, KEY_HEX);
    auto raw = crypto::base64_decode(stored);
    ASSERT_TRUE(raw.has_value());

    auto plain = json::serialize(sample_config());
    EXPECT_EQ(raw->size(), crypto::GCM_IV_SIZE + crypto::GCM_TAG_SIZE + plain.size());
}

TEST_F(ConfigCipherTest, FreshIvEachTime) {
    auto a = encrypt_config(sample_config(), CipherMode::Encrypted, KEY_HEX);
    auto b = encrypt_config(sample_config(), CipherMode::Encrypted, KEY_HEX);
    EXPECT_NE(a, b);
}

TEST_F(ConfigCipherTest, MissingKeyFallsBackToPlaintext) {
    auto stored = encrypt_config(sample_config(), CipherMode::Encrypted, std::nullopt);
    EXPECT_EQ(stored, json::serialize(sample_config()));

    auto short_key = encrypt_config(sample_config(), CipherMode::Encrypted, "abcdef");
    EXPECT_EQ(short_key, json::serialize(sample_config()));

    auto opened = decrypt_config(stored, CipherMode::Encrypted, std::nullopt);
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(*opened, sample_config());
}

TEST_F(ConfigCipherTest, PlaintextRowsReadableWithKey) {
    auto opened = decrypt_config(R"({"url":"http://plex:32400"})", CipherMode::Encrypted, KEY_HEX);
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ((*opened)["url"].as_string(), "http://plex:32400");
}

TEST_F(ConfigCipherTest, WrongKeyFails) {
    auto stored = encrypt_config(sample_config(), CipherMode::Encrypted, KEY_HEX);
    auto opened = decrypt_config(stored, CipherMode::Encrypted, OTHER_KEY_HEX);
    ASSERT_FALSE(opened.has_value());
    EXPECT_EQ(opened.error(), CipherError::DECRYPT_FAILED);
}

TEST_F(ConfigCipherTest, TamperedValueFails) {
    auto stored = encrypt_config(sample_config(), CipherMode::Encrypted, KEY_HEX);
    auto raw = crypto::base64_decode(stored);
    ASSERT_TRUE(raw.has_value());
    raw->back() ^= 0x20;

    auto opened = decrypt_config(crypto::base64_encode(*raw), CipherMode::Encrypted, KEY_HEX);
    ASSERT_FALSE(opened.has_value());
    EXPECT_EQ(opened.error(), CipherError::DECRYPT_FAILED);
}

TEST_F(ConfigCipherTest, NonObjectJsonRejected) {
    auto array = decrypt_config("[1,2,3]", CipherMode::Plaintext, std::nullopt);
    ASSERT_FALSE(array.has_value());
    EXPECT_EQ(array.error(), CipherError::NOT_AN_OBJECT);

    auto garbage = decrypt_config("{oops", CipherMode::Plaintext, std::nullopt);
    ASSERT_FALSE(garbage.has_value());
    EXPECT_EQ(garbage.error(), CipherError::INVALID_JSON);
}

TEST_F(ConfigCipherTest, LikelyEncryptedHeuristic) {
    EXPECT_FALSE(is_likely_encrypted(""));
    EXPECT_FALSE(is_likely_encrypted("c2hvcnQ="));
    EXPECT_FALSE(is_likely_encrypted(R"({"url":"http://a-very-long-hostname.example.com:8080/api"})"));
    EXPECT_FALSE(is_likely_encrypted(std::string(60, 'A') + " "));
    EXPECT_TRUE(is_likely_encrypted(std::string(44, 'A')));
    EXPECT_TRUE(is_likely_encrypted(std::string(40, 'z') + "+/=="));
}

TEST_F(ConfigCipherTest, CipherObject) {
    ConfigCipher cipher(CipherMode::Encrypted, KEY_HEX);
    EXPECT_TRUE(cipher.encrypts());
    EXPECT_FALSE(cipher.fallback());

    auto stored = cipher.seal(sample_config());
    EXPECT_TRUE(is_likely_encrypted(stored));
    auto opened = cipher.open(stored);
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(*opened, sample_config());

    // Interoperates with the free functions
    auto via_free = decrypt_config(stored, CipherMode::Encrypted, KEY_HEX);
    ASSERT_TRUE(via_free.has_value());
    EXPECT_EQ(*via_free, sample_config());
}

TEST_F(ConfigCipherTest, CipherFallbackAndPlaintext) {
    ConfigCipher no_key(CipherMode::Encrypted, std::nullopt);
    EXPECT_FALSE(no_key.encrypts());
    EXPECT_TRUE(no_key.fallback());
    EXPECT_EQ(no_key.seal(sample_config()), json::serialize(sample_config()));

    auto plain = ConfigCipher::plaintext();
    EXPECT_EQ(plain.mode(), CipherMode::Plaintext);
    EXPECT_FALSE(plain.encrypts());
    EXPECT_FALSE(plain.fallback());
}

TEST_F(ConfigCipherTest, FromConfig) {
    MigrateConfig config;
    config.encryption.key = KEY_HEX;
    EXPECT_TRUE(ConfigCipher::from_config(config).encrypts());

    config.encryption.mode = "plaintext";
    EXPECT_FALSE(ConfigCipher::from_config(config).encrypts());

    config.encryption.mode = "encrypted";
    config.encryption.key.clear();
    EXPECT_TRUE(ConfigCipher::from_config(config).fallback());
}
