#include "store/config_cipher.hpp"
#include "common/config.hpp"
#include "common/log.hpp"
#include <atomic>

namespace json = boost::json;

namespace dashstore::store {

namespace {

// base64(iv || tag) with no ciphertext is already 44 chars
constexpr size_t MIN_SEALED_CHARS = 44;

std::atomic<bool> g_fallback_warned{false};

void warn_fallback_once() {
    if (!g_fallback_warned.exchange(true)) {
        NLOG_WARN(log::CRYPTO_LOGGER,
                  "Encryption requested but no valid 64-hex-character key is configured; "
                  "integration configs are stored as plaintext");
    }
}

std::optional<crypto::Aes256Key> resolve_key(CipherMode mode, std::optional<std::string_view> key_hex) {
    if (mode != CipherMode::Encrypted || !key_hex) {
        return std::nullopt;
    }
    auto key = crypto::key_from_hex(*key_hex);
    if (!key) {
        return std::nullopt;
    }
    return *key;
}

std::expected<json::object, CipherError> parse_object(std::string_view text) {
    boost::system::error_code ec;
    auto jv = json::parse(text, ec);
    if (ec) {
        return std::unexpected(CipherError::INVALID_JSON);
    }
    if (!jv.is_object()) {
        return std::unexpected(CipherError::NOT_AN_OBJECT);
    }
    return std::move(jv.as_object());
}

std::string seal_with(const crypto::Aes256Key& key, const json::object& config) {
    auto text = json::serialize(config);
    auto sealed = crypto::aes256_gcm_encrypt(
        key, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
    if (!sealed) {
        NLOG_ERROR(log::CRYPTO_LOGGER, "Config encryption failed: {}",
                   crypto::crypto_error_message(sealed.error()));
        return text;
    }

    std::vector<uint8_t> combined;
    combined.reserve(crypto::GCM_IV_SIZE + crypto::GCM_TAG_SIZE + sealed->ciphertext.size());
    combined.insert(combined.end(), sealed->iv.begin(), sealed->iv.end());
    combined.insert(combined.end(), sealed->tag.begin(), sealed->tag.end());
    combined.insert(combined.end(), sealed->ciphertext.begin(), sealed->ciphertext.end());
    return crypto::base64_encode(combined);
}

std::expected<json::object, CipherError> open_with(const crypto::Aes256Key& key, std::string_view stored) {
    auto combined = crypto::base64_decode(stored);
    if (!combined || combined->size() < crypto::GCM_IV_SIZE + crypto::GCM_TAG_SIZE) {
        return std::unexpected(CipherError::INVALID_ENCODING);
    }

    std::span<const uint8_t> bytes(*combined);
    auto plain = crypto::aes256_gcm_decrypt(
        key,
        bytes.subspan<0, crypto::GCM_IV_SIZE>(),
        bytes.subspan<crypto::GCM_IV_SIZE, crypto::GCM_TAG_SIZE>(),
        bytes.subspan(crypto::GCM_IV_SIZE + crypto::GCM_TAG_SIZE));
    if (!plain) {
        return std::unexpected(CipherError::DECRYPT_FAILED);
    }

    std::string text(plain->begin(), plain->end());
    crypto::secure_wipe(*plain);
    return parse_object(text);
}

}  // anonymous namespace

std::optional<CipherMode> parse_cipher_mode(std::string_view mode) {
    if (mode == "plaintext") return CipherMode::Plaintext;
    if (mode == "encrypted") return CipherMode::Encrypted;
    return std::nullopt;
}

std::string cipher_error_message(CipherError error) {
    switch (error) {
        case CipherError::INVALID_ENCODING: return "Stored value is not valid sealed data";
        case CipherError::DECRYPT_FAILED: return "Decryption failed (wrong key or tampered data)";
        case CipherError::INVALID_JSON: return "Stored value is not valid JSON";
        case CipherError::NOT_AN_OBJECT: return "Stored JSON is not an object";
        default: return "Unknown cipher error";
    }
}

bool is_likely_encrypted(std::string_view value) {
    if (value.size() < MIN_SEALED_CHARS) {
        return false;
    }
    if (value.front() == '{' || value.front() == '[') {
        return false;
    }
    for (char c : value) {
        bool base64_char = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                           (c >= '0' && c <= '9') || c == '+' || c == '/' || c == '=';
        if (!base64_char) {
            return false;
        }
    }
    return true;
}

std::string encrypt_config(const json::object& config, CipherMode mode,
                           std::optional<std::string_view> key_hex) {
    auto key = resolve_key(mode, key_hex);
    if (!key) {
        if (mode == CipherMode::Encrypted) {
            warn_fallback_once();
        }
        return json::serialize(config);
    }
    auto sealed = seal_with(*key, config);
    crypto::secure_wipe(*key);
    return sealed;
}

std::expected<json::object, CipherError> decrypt_config(std::string_view stored, CipherMode mode,
                                                        std::optional<std::string_view> key_hex) {
    auto key = resolve_key(mode, key_hex);
    if (!key || !is_likely_encrypted(stored)) {
        return parse_object(stored);
    }
    auto result = open_with(*key, stored);
    crypto::secure_wipe(*key);
    return result;
}

// ============================================================================
// ConfigCipher
// ============================================================================

ConfigCipher::ConfigCipher(CipherMode mode, std::optional<std::string_view> key_hex)
    : mode_(mode), key_(resolve_key(mode, key_hex)) {
    if (fallback()) {
        warn_fallback_once();
    }
}

ConfigCipher ConfigCipher::from_config(const MigrateConfig& config) {
    auto mode = parse_cipher_mode(config.encryption.mode).value_or(CipherMode::Encrypted);
    std::optional<std::string_view> key;
    if (!config.encryption.key.empty()) {
        key = config.encryption.key;
    }
    return ConfigCipher(mode, key);
}

std::string ConfigCipher::seal(const json::object& config) const {
    if (!key_) {
        return json::serialize(config);
    }
    return seal_with(*key_, config);
}

std::expected<json::object, CipherError> ConfigCipher::open(std::string_view stored) const {
    if (!key_ || !is_likely_encrypted(stored)) {
        return parse_object(stored);
    }
    return open_with(*key_, stored);
}

} // namespace dashstore::store
