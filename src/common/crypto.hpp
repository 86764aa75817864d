#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations for OpenSSL types
typedef struct evp_cipher_ctx_st EVP_CIPHER_CTX;

namespace dashstore::crypto {

// ============================================================================
// OpenSSL RAII Wrappers
// ============================================================================

struct EvpCipherCtxDeleter { void operator()(EVP_CIPHER_CTX* p) const; };

using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EvpCipherCtxDeleter>;

// AES-256-GCM sizes used for at-rest configuration blobs
constexpr size_t AES256_KEY_SIZE = 32;
constexpr size_t GCM_IV_SIZE = 16;
constexpr size_t GCM_TAG_SIZE = 16;

using Aes256Key = std::array<uint8_t, AES256_KEY_SIZE>;

// Error types
enum class CryptoError {
    INIT_FAILED,
    ENCRYPT_FAILED,
    DECRYPT_FAILED,
    INVALID_KEY_SIZE,
    INVALID_ENCODING,
    BUFFER_TOO_SMALL,
};

std::string crypto_error_message(CryptoError error);

// Initialize crypto library (call once at startup; safe to call again)
bool init();

// ============================================================================
// AES-256-GCM (AEAD Encryption)
// ============================================================================

struct GcmSealed {
    std::array<uint8_t, GCM_IV_SIZE> iv{};
    std::array<uint8_t, GCM_TAG_SIZE> tag{};
    std::vector<uint8_t> ciphertext;
};

// Encrypt with a fresh random 16-byte IV
std::expected<GcmSealed, CryptoError> aes256_gcm_encrypt(
    const Aes256Key& key,
    std::span<const uint8_t> plaintext);

// Decrypt and verify the auth tag
std::expected<std::vector<uint8_t>, CryptoError> aes256_gcm_decrypt(
    const Aes256Key& key,
    std::span<const uint8_t, GCM_IV_SIZE> iv,
    std::span<const uint8_t, GCM_TAG_SIZE> tag,
    std::span<const uint8_t> ciphertext);

// ============================================================================
// Random Generation
// ============================================================================

// Generate cryptographically secure random bytes
void random_bytes(std::span<uint8_t> buffer);

// Generate random bytes and return as vector
std::vector<uint8_t> random_bytes(size_t length);

// Random RFC 4122 version 4 UUID string
std::string random_uuid();

// ============================================================================
// Utility Functions
// ============================================================================

// Secure memory wipe
void secure_wipe(std::span<uint8_t> memory);

// Lower-case hex encoding
std::string bytes_to_hex(std::span<const uint8_t> bytes);

// Parse hex string to bytes
std::expected<std::vector<uint8_t>, CryptoError> hex_to_bytes(std::string_view hex);

// Parse a 64-character hex string into an AES-256 key
std::expected<Aes256Key, CryptoError> key_from_hex(std::string_view hex);

// Standard (padded) base64
std::string base64_encode(std::span<const uint8_t> data);
std::expected<std::vector<uint8_t>, CryptoError> base64_decode(std::string_view encoded);

} // namespace dashstore::crypto
