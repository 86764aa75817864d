#include "common/crypto.hpp"
#include <boost/beast/core/detail/base64.hpp>
#include <openssl/evp.h>
#include <sodium.h>
#include <iomanip>
#include <sstream>

namespace dashstore::crypto {

namespace base64 = boost::beast::detail::base64;

void EvpCipherCtxDeleter::operator()(EVP_CIPHER_CTX* p) const {
    EVP_CIPHER_CTX_free(p);
}

std::string crypto_error_message(CryptoError error) {
    switch (error) {
        case CryptoError::INIT_FAILED: return "Crypto initialization failed";
        case CryptoError::ENCRYPT_FAILED: return "Encryption failed";
        case CryptoError::DECRYPT_FAILED: return "Decryption failed";
        case CryptoError::INVALID_KEY_SIZE: return "Invalid key size";
        case CryptoError::INVALID_ENCODING: return "Invalid encoding";
        case CryptoError::BUFFER_TOO_SMALL: return "Buffer too small";
        default: return "Unknown crypto error";
    }
}

bool init() {
    // sodium_init returns 1 when already initialized
    return sodium_init() >= 0;
}

// ============================================================================
// AES-256-GCM (AEAD Encryption)
// ============================================================================

std::expected<GcmSealed, CryptoError> aes256_gcm_encrypt(
    const Aes256Key& key,
    std::span<const uint8_t> plaintext) {

    GcmSealed sealed;
    random_bytes(sealed.iv);

    EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::unexpected(CryptoError::INIT_FAILED);
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(GCM_IV_SIZE), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), sealed.iv.data()) != 1) {
        return std::unexpected(CryptoError::ENCRYPT_FAILED);
    }

    sealed.ciphertext.resize(plaintext.size() + EVP_MAX_BLOCK_LENGTH);
    int out_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), sealed.ciphertext.data(), &out_len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
        return std::unexpected(CryptoError::ENCRYPT_FAILED);
    }

    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), sealed.ciphertext.data() + out_len, &final_len) != 1) {
        return std::unexpected(CryptoError::ENCRYPT_FAILED);
    }
    sealed.ciphertext.resize(static_cast<size_t>(out_len + final_len));

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(GCM_TAG_SIZE), sealed.tag.data()) != 1) {
        return std::unexpected(CryptoError::ENCRYPT_FAILED);
    }

    return sealed;
}

std::expected<std::vector<uint8_t>, CryptoError> aes256_gcm_decrypt(
    const Aes256Key& key,
    std::span<const uint8_t, GCM_IV_SIZE> iv,
    std::span<const uint8_t, GCM_TAG_SIZE> tag,
    std::span<const uint8_t> ciphertext) {

    EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::unexpected(CryptoError::INIT_FAILED);
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(GCM_IV_SIZE), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1) {
        return std::unexpected(CryptoError::DECRYPT_FAILED);
    }

    std::vector<uint8_t> plaintext(ciphertext.size() + EVP_MAX_BLOCK_LENGTH);
    int out_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &out_len,
                          ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
        return std::unexpected(CryptoError::DECRYPT_FAILED);
    }

    // OpenSSL takes a non-const tag pointer for SET_TAG
    std::array<uint8_t, GCM_TAG_SIZE> tag_copy;
    std::copy(tag.begin(), tag.end(), tag_copy.begin());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(GCM_TAG_SIZE), tag_copy.data()) != 1) {
        return std::unexpected(CryptoError::DECRYPT_FAILED);
    }

    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + out_len, &final_len) != 1) {
        secure_wipe(plaintext);
        return std::unexpected(CryptoError::DECRYPT_FAILED);
    }
    plaintext.resize(static_cast<size_t>(out_len + final_len));

    return plaintext;
}

// ============================================================================
// Random Generation
// ============================================================================

void random_bytes(std::span<uint8_t> buffer) {
    randombytes_buf(buffer.data(), buffer.size());
}

std::vector<uint8_t> random_bytes(size_t length) {
    std::vector<uint8_t> buffer(length);
    randombytes_buf(buffer.data(), length);
    return buffer;
}

std::string random_uuid() {
    std::array<uint8_t, 16> b;
    random_bytes(b);
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);  // version 4
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);  // RFC 4122 variant

    std::string hex = bytes_to_hex(b);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

// ============================================================================
// Utility Functions
// ============================================================================

void secure_wipe(std::span<uint8_t> memory) {
    sodium_memzero(memory.data(), memory.size());
}

std::string bytes_to_hex(std::span<const uint8_t> bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

std::expected<std::vector<uint8_t>, CryptoError> hex_to_bytes(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return std::unexpected(CryptoError::INVALID_ENCODING);
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);

    for (size_t i = 0; i < hex.size(); i += 2) {
        uint8_t byte = 0;
        for (int j = 0; j < 2; ++j) {
            char c = hex[i + j];
            byte <<= 4;
            if (c >= '0' && c <= '9') {
                byte |= (c - '0');
            } else if (c >= 'a' && c <= 'f') {
                byte |= (c - 'a' + 10);
            } else if (c >= 'A' && c <= 'F') {
                byte |= (c - 'A' + 10);
            } else {
                return std::unexpected(CryptoError::INVALID_ENCODING);
            }
        }
        bytes.push_back(byte);
    }

    return bytes;
}

std::expected<Aes256Key, CryptoError> key_from_hex(std::string_view hex) {
    if (hex.size() != AES256_KEY_SIZE * 2) {
        return std::unexpected(CryptoError::INVALID_KEY_SIZE);
    }

    auto bytes = hex_to_bytes(hex);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }

    Aes256Key key;
    std::copy(bytes->begin(), bytes->end(), key.begin());
    secure_wipe(*bytes);
    return key;
}

std::string base64_encode(std::span<const uint8_t> data) {
    std::string result;
    result.resize(base64::encoded_size(data.size()));
    result.resize(base64::encode(result.data(), data.data(), data.size()));
    return result;
}

std::expected<std::vector<uint8_t>, CryptoError> base64_decode(std::string_view encoded) {
    std::vector<uint8_t> out(base64::decoded_size(encoded.size()));
    auto [written, read] = base64::decode(out.data(), encoded.data(), encoded.size());

    // Decoding stops at the first '=' or foreign character; only padding may follow
    for (size_t i = read; i < encoded.size(); ++i) {
        if (encoded[i] != '=') {
            return std::unexpected(CryptoError::INVALID_ENCODING);
        }
    }
    if (encoded.size() - read > 2) {
        return std::unexpected(CryptoError::INVALID_ENCODING);
    }

    out.resize(written);
    return out;
}

} // namespace dashstore::crypto
