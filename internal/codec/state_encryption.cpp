#include "internal/codec/state_encryption.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <cstdlib>
#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace flowstate::codec {

namespace {

int AsInt(std::size_t n) {
  return static_cast<int>(n);
}

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const {
    EVP_CIPHER_CTX_free(ctx);
  }
};

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

CipherCtx NewContext() {
  CipherCtx ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    throw util::EncryptionError("EVP_CIPHER_CTX_new failed");
  }
  return ctx;
}

const unsigned char* Bytes(std::string_view s) {
  return reinterpret_cast<const unsigned char*>(s.data());
}

unsigned char* MutableBytes(std::string& s) {
  return reinterpret_cast<unsigned char*>(s.data());
}

} // namespace

std::string Base64Encode(std::string_view bytes) {
  if (bytes.empty()) {
    return {};
  }
  std::string out(4 * ((bytes.size() + 2) / 3), '\0');
  const int   written = EVP_EncodeBlock(MutableBytes(out), Bytes(bytes), AsInt(bytes.size()));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

std::optional<std::string> Base64Decode(std::string_view text) {
  if (text.empty()) {
    return std::string{};
  }
  if (text.size() % 4 != 0) {
    return std::nullopt;
  }
  std::string out(3 * (text.size() / 4), '\0');
  const int   written = EVP_DecodeBlock(MutableBytes(out), Bytes(text), AsInt(text.size()));
  if (written < 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock keeps the bytes produced by '=' padding.
  std::size_t padding = 0;
  if (text.back() == '=') {
    ++padding;
    if (text[text.size() - 2] == '=') {
      ++padding;
    }
  }
  out.resize(static_cast<std::size_t>(written) - padding);
  return out;
}

StateEncryption::StateEncryption(std::string key) : key_(std::move(key)) {
  if (key_.size() != kKeySize) {
    OPENSSL_cleanse(key_.data(), key_.size());
    throw util::EncryptionError("encryption key must be " + std::to_string(kKeySize) + " bytes");
  }
}

StateEncryption::~StateEncryption() {
  OPENSSL_cleanse(key_.data(), key_.size());
}

std::shared_ptr<StateEncryption> StateEncryption::FromConfig(const flowstate::runtime::config::EncryptionConfig& config) {
  if (!config.key_env().empty()) {
    if (const char* encoded = std::getenv(config.key_env().c_str()); encoded && *encoded) {
      auto key = Base64Decode(encoded);
      if (!key || key->size() != kKeySize) {
        throw util::EncryptionError(config.key_env() + " must hold base64 of a " + std::to_string(kKeySize) + "-byte key");
      }
      return std::make_shared<StateEncryption>(std::move(*key));
    }
  }

  if (!config.password_env().empty()) {
    if (const char* password = std::getenv(config.password_env().c_str()); password && *password) {
      FLOWSTATE_LOG_INFO("Deriving state encryption key from password",
                         {observability::StringField("password_env", config.password_env()),
                          observability::IntField("iterations", config.kdf_iterations())});
      return std::make_shared<StateEncryption>(DeriveKey(password, config.salt(), AsInt(config.kdf_iterations())));
    }
  }

  throw util::EncryptionError("no encryption key material: set " + config.key_env() + " or " + config.password_env());
}

std::string StateEncryption::DeriveKey(std::string_view password, std::string_view salt, int iterations) {
  std::string key(kKeySize, '\0');
  if (PKCS5_PBKDF2_HMAC(password.data(), AsInt(password.size()), Bytes(salt), AsInt(salt.size()), iterations, EVP_sha256(), AsInt(key.size()),
                        MutableBytes(key)) != 1) {
    throw util::EncryptionError("PBKDF2 key derivation failed");
  }
  return key;
}

std::string StateEncryption::Seal(std::string_view plaintext) const {
  std::string out(kNonceSize + plaintext.size() + kTagSize, '\0');
  auto*       nonce = MutableBytes(out);
  if (RAND_bytes(nonce, AsInt(kNonceSize)) != 1) {
    throw util::EncryptionError("RAND_bytes failed");
  }

  auto ctx = NewContext();
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, AsInt(kNonceSize), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, Bytes(key_), nonce) != 1) {
    throw util::EncryptionError("cipher init failed");
  }

  int len = 0;
  if (!plaintext.empty() && EVP_EncryptUpdate(ctx.get(), nonce + kNonceSize, &len, Bytes(plaintext), AsInt(plaintext.size())) != 1) {
    throw util::EncryptionError("encrypt update failed");
  }
  int final_len = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), nonce + kNonceSize + len, &final_len) != 1) {
    throw util::EncryptionError("encrypt finalize failed");
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, AsInt(kTagSize), nonce + kNonceSize + len + final_len) != 1) {
    throw util::EncryptionError("reading GCM tag failed");
  }
  return out;
}

std::string StateEncryption::Open(std::string_view sealed) const {
  if (sealed.size() < kNonceSize + kTagSize) {
    throw util::EncryptionError("ciphertext too short");
  }
  const auto nonce      = sealed.substr(0, kNonceSize);
  const auto ciphertext = sealed.substr(kNonceSize, sealed.size() - kNonceSize - kTagSize);
  std::string tag(sealed.substr(sealed.size() - kTagSize));

  auto ctx = NewContext();
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, AsInt(kNonceSize), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, Bytes(key_), Bytes(nonce)) != 1) {
    throw util::EncryptionError("cipher init failed");
  }

  std::string plaintext(ciphertext.size(), '\0');
  int         len = 0;
  if (!ciphertext.empty() && EVP_DecryptUpdate(ctx.get(), MutableBytes(plaintext), &len, Bytes(ciphertext), AsInt(ciphertext.size())) != 1) {
    throw util::EncryptionError("decrypt update failed");
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, AsInt(kTagSize), tag.data()) != 1) {
    throw util::EncryptionError("setting GCM tag failed");
  }
  int final_len = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), MutableBytes(plaintext) + len, &final_len) != 1) {
    throw util::EncryptionError("authentication failed: ciphertext was tampered with or the key is wrong");
  }
  plaintext.resize(static_cast<std::size_t>(len + final_len));
  return plaintext;
}

std::string StateEncryption::SealToBase64(std::string_view plaintext) const {
  return Base64Encode(Seal(plaintext));
}

std::string StateEncryption::OpenFromBase64(std::string_view text) const {
  auto sealed = Base64Decode(text);
  if (!sealed) {
    throw util::EncryptionError("ciphertext is not valid base64");
  }
  return Open(*sealed);
}

} // namespace flowstate::codec
