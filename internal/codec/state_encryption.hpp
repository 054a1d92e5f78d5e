#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace flowstate::runtime::config {
class EncryptionConfig;
}

namespace flowstate::codec {

std::string                Base64Encode(std::string_view bytes);
std::optional<std::string> Base64Decode(std::string_view text);

/*
  AES-256-GCM with a random 96-bit nonce per message.

  Wire form of a sealed message: nonce(12) || ciphertext || tag(16).
  The key is held for the object's lifetime and wiped on destruction.
*/
class StateEncryption {
 public:
  static constexpr std::size_t kKeySize   = 32;
  static constexpr std::size_t kNonceSize = 12;
  static constexpr std::size_t kTagSize   = 16;

  static constexpr std::string_view kAlgorithm = "AES-256-GCM";

  // Throws EncryptionError unless key is exactly kKeySize bytes.
  explicit StateEncryption(std::string key);
  ~StateEncryption();

  StateEncryption(const StateEncryption&)            = delete;
  StateEncryption& operator=(const StateEncryption&) = delete;

  // Key material resolution order: base64 key from config.key_env, then
  // PBKDF2-HMAC-SHA256 over the password in config.password_env.
  // Throws EncryptionError when neither is available.
  static std::shared_ptr<StateEncryption> FromConfig(const flowstate::runtime::config::EncryptionConfig& config);

  static std::string DeriveKey(std::string_view password, std::string_view salt, int iterations);

  std::string Seal(std::string_view plaintext) const;

  // Throws EncryptionError on truncated input or authentication failure.
  std::string Open(std::string_view sealed) const;

  std::string SealToBase64(std::string_view plaintext) const;
  std::string OpenFromBase64(std::string_view text) const;

 private:
  std::string key_;
};

} // namespace flowstate::codec
