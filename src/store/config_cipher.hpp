#pragma once

#include "common/crypto.hpp"
#include <boost/json.hpp>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace dashstore {
struct MigrateConfig;
}

namespace dashstore::store {

enum class CipherMode {
    Plaintext,
    Encrypted,
};

// "plaintext" / "encrypted"
std::optional<CipherMode> parse_cipher_mode(std::string_view mode);

enum class CipherError {
    INVALID_ENCODING,
    DECRYPT_FAILED,
    INVALID_JSON,
    NOT_AN_OBJECT,
};

std::string cipher_error_message(CipherError error);

// Serialize `config` for storage. Encrypted mode without a valid 64-hex-char key
// falls back to plaintext and logs a warning once per process.
// Sealed form: base64(iv(16) || tag(16) || ciphertext).
std::string encrypt_config(const boost::json::object& config, CipherMode mode,
                           std::optional<std::string_view> key_hex);

// Inverse of encrypt_config. Values that do not look encrypted are parsed as JSON.
std::expected<boost::json::object, CipherError> decrypt_config(std::string_view stored, CipherMode mode,
                                                               std::optional<std::string_view> key_hex);

// At least 44 chars, not a JSON object/array, base64 alphabet only
bool is_likely_encrypted(std::string_view value);

// Mode and key resolved once and handed to every unit
class ConfigCipher {
public:
    ConfigCipher(CipherMode mode, std::optional<std::string_view> key_hex);

    static ConfigCipher plaintext() { return ConfigCipher(CipherMode::Plaintext, std::nullopt); }
    static ConfigCipher from_config(const MigrateConfig& config);

    CipherMode mode() const { return mode_; }

    // True when seal() produces ciphertext
    bool encrypts() const { return key_.has_value(); }

    // Encrypted mode requested but no usable key
    bool fallback() const { return mode_ == CipherMode::Encrypted && !key_; }

    std::string seal(const boost::json::object& config) const;
    std::expected<boost::json::object, CipherError> open(std::string_view stored) const;

private:
    CipherMode mode_;
    std::optional<crypto::Aes256Key> key_;
};

} // namespace dashstore::store
