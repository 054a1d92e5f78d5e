#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.pb.h"
#include "internal/codec/state_encryption.hpp"
#include "internal/state/flow_state.hpp"

namespace flowstate::codec {

using flowstate::runtime::config::SerializationFormat;

inline constexpr std::string_view kMetadataKey     = "__serialization__";
inline constexpr std::string_view kEncryptedKey    = "__encrypted__";
inline constexpr std::string_view kAlgorithmKey    = "__algorithm__";
inline constexpr std::string_view kCiphertextKey   = "__ciphertext__";
inline constexpr std::string_view kTimestampKey    = "__timestamp__";
inline constexpr std::string_view kCodecVersion    = "1.0";
inline constexpr std::uint64_t    kDefaultMaxBytes = 10ULL * 1024 * 1024;
// Decompressed payloads may be at most this many times max_state_bytes.
inline constexpr std::uint64_t    kMaxInflateRatio = 32;

struct EncodeOptions {
  SerializationFormat format            = flowstate::runtime::config::SERIALIZATION_FORMAT_JSON;
  bool                compress          = true;
  bool                include_metadata  = true;
  bool                encrypt_sensitive = true;
};

struct CodecOptions {
  EncodeOptions            encode;
  std::uint64_t            max_state_bytes = kDefaultMaxBytes;
  std::vector<std::string> sensitive_fields;

  static CodecOptions FromConfig(const flowstate::runtime::config::RuntimeConfig& config);

  std::uint64_t MaxInflatedBytes() const {
    return max_state_bytes > UINT64_MAX / kMaxInflateRatio ? UINT64_MAX : max_state_bytes * kMaxInflateRatio;
  }
};

/*
  Flow state <-> bytes.

  Encode: encrypt sensitive top-level fields into envelopes, stamp the
  __serialization__ metadata, serialize (JSON or protobuf binary), gzip,
  then enforce max_state_bytes on the final size.

  Decode reverses it. Input that is not gzip is taken as uncompressed and
  the serialization format is detected from the payload.

  Thread-safe; holds no mutable state.
*/
class StateCodec {
 public:
  // encryption may be null, in which case sensitive fields are stored in
  // plaintext and decoding an envelope fails with EncryptionError.
  StateCodec(CodecOptions options, std::shared_ptr<const StateEncryption> encryption);

  std::string Encode(const state::State& state) const;
  std::string Encode(const state::State& state, const EncodeOptions& options) const;

  // Throws SerializationError or EncryptionError; never returns a partial state.
  state::State Decode(std::string_view bytes) const;

  state::State EncryptSensitiveFields(const state::State& state) const;
  state::State DecryptSensitiveFields(const state::State& state) const;

  static bool IsEnvelope(const google::protobuf::Value& value);

  const CodecOptions& Options() const {
    return options_;
  }

  const std::shared_ptr<const StateEncryption>& Encryption() const {
    return encryption_;
  }

 private:
  google::protobuf::Value MakeEnvelope(const google::protobuf::Value& plain) const;
  google::protobuf::Value OpenEnvelope(const google::protobuf::Value& envelope) const;

  CodecOptions                           options_;
  std::shared_ptr<const StateEncryption> encryption_;
};

std::string_view ToString(SerializationFormat format);

} // namespace flowstate::codec
