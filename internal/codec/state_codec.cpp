#include "internal/codec/state_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>

#include "internal/codec/compression.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace flowstate::codec {

using google::protobuf::Value;
using flowstate::runtime::config::SERIALIZATION_FORMAT_BINARY;
using flowstate::runtime::config::SERIALIZATION_FORMAT_JSON;

std::string_view ToString(SerializationFormat format) {
  return format == SERIALIZATION_FORMAT_BINARY ? "binary" : "json";
}

CodecOptions CodecOptions::FromConfig(const flowstate::runtime::config::RuntimeConfig& config) {
  const auto& serialization = config.serialization();
  const auto& encryption    = config.encryption();

  CodecOptions options;
  options.encode.format            = serialization.format() == SERIALIZATION_FORMAT_BINARY ? SERIALIZATION_FORMAT_BINARY : SERIALIZATION_FORMAT_JSON;
  options.encode.compress          = serialization.compress();
  options.encode.include_metadata  = serialization.include_metadata();
  options.encode.encrypt_sensitive = encryption.enabled();
  options.max_state_bytes          = serialization.max_state_bytes() == 0 ? kDefaultMaxBytes : serialization.max_state_bytes();
  options.sensitive_fields.assign(encryption.sensitive_fields().begin(), encryption.sensitive_fields().end());
  return options;
}

StateCodec::StateCodec(CodecOptions options, std::shared_ptr<const StateEncryption> encryption)
    : options_(std::move(options)), encryption_(std::move(encryption)) {
}

bool StateCodec::IsEnvelope(const Value& value) {
  if (value.kind_case() != Value::kStructValue) {
    return false;
  }
  const auto& fields = value.struct_value().fields();
  const auto  flag   = fields.find(std::string(kEncryptedKey));
  return flag != fields.end() && flag->second.kind_case() == Value::kBoolValue && flag->second.bool_value() &&
         fields.count(std::string(kCiphertextKey)) > 0;
}

Value StateCodec::MakeEnvelope(const Value& plain) const {
  if (!encryption_) {
    throw util::EncryptionError("sensitive field encryption requested but no key is configured");
  }

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(plain, &json);
  if (!status.ok()) {
    throw util::SerializationError("sensitive field to json failed: " + std::string(status.message()));
  }

  Value envelope = state::MakeEmptyStruct();
  auto* fields   = envelope.mutable_struct_value()->mutable_fields();
  (*fields)[std::string(kEncryptedKey)]  = state::MakeBool(true);
  (*fields)[std::string(kAlgorithmKey)]  = state::MakeString(StateEncryption::kAlgorithm);
  (*fields)[std::string(kCiphertextKey)] = state::MakeString(encryption_->SealToBase64(json));
  (*fields)[std::string(kTimestampKey)]  = state::MakeString(util::NowRfc3339());
  return envelope;
}

Value StateCodec::OpenEnvelope(const Value& envelope) const {
  if (!encryption_) {
    throw util::EncryptionError("state holds encrypted fields but no key is configured");
  }
  const auto& fields     = envelope.struct_value().fields();
  const auto& ciphertext = fields.at(std::string(kCiphertextKey));
  if (ciphertext.kind_case() != Value::kStringValue) {
    throw util::EncryptionError("malformed encryption envelope");
  }

  const auto json = encryption_->OpenFromBase64(ciphertext.string_value());
  Value      plain;
  const auto status = google::protobuf::util::JsonStringToMessage(json, &plain);
  if (!status.ok()) {
    throw util::EncryptionError("decrypted field is not valid json: " + std::string(status.message()));
  }
  return plain;
}

state::State StateCodec::EncryptSensitiveFields(const state::State& input) const {
  state::State out = input;
  for (const auto& name : options_.sensitive_fields) {
    auto* value = state::FindMutable(&out, name);
    if (!value || value->kind_case() == Value::kNullValue || IsEnvelope(*value)) {
      continue;
    }
    *value = MakeEnvelope(*value);
  }
  return out;
}

state::State StateCodec::DecryptSensitiveFields(const state::State& input) const {
  state::State out = input;
  for (auto& [name, value] : *out.mutable_fields()) {
    if (IsEnvelope(value)) {
      value = OpenEnvelope(value);
    }
  }
  return out;
}

std::string StateCodec::Encode(const state::State& state) const {
  return Encode(state, options_.encode);
}

std::string StateCodec::Encode(const state::State& input, const EncodeOptions& options) const {
  state::State doc = options.encrypt_sensitive ? EncryptSensitiveFields(input) : DecryptSensitiveFields(input);

  if (options.include_metadata) {
    Value meta = state::MakeEmptyStruct();
    auto* m    = meta.mutable_struct_value()->mutable_fields();
    (*m)["format"]     = state::MakeString(ToString(options.format));
    (*m)["compressed"] = state::MakeBool(options.compress);
    (*m)["encrypted"]  = state::MakeBool(options.encrypt_sensitive && !options_.sensitive_fields.empty());
    (*m)["timestamp"]  = state::MakeString(util::NowRfc3339());
    (*m)["version"]    = state::MakeString(kCodecVersion);
    state::Set(&doc, kMetadataKey, std::move(meta));
  } else {
    state::Erase(&doc, kMetadataKey);
  }

  std::string bytes;
  if (options.format == SERIALIZATION_FORMAT_BINARY) {
    if (!doc.SerializeToString(&bytes)) {
      throw util::SerializationError("binary state serialization failed");
    }
  } else {
    bytes = state::ToJson(doc);
  }

  if (bytes.size() > options_.MaxInflatedBytes()) {
    throw util::SerializationError("serialized state is " + std::to_string(bytes.size()) + " bytes, inflate limit is " +
                                   std::to_string(options_.MaxInflatedBytes()));
  }

  if (options.compress) {
    bytes = GzipCompress(bytes);
  }

  if (bytes.size() > options_.max_state_bytes) {
    FLOWSTATE_LOG_WARN("Encoded state exceeds size limit",
                       {observability::StringField("flow_id", state::GetString(input, state::keys::kFlowId)),
                        observability::IntField("size_bytes", static_cast<std::int64_t>(bytes.size())),
                        observability::IntField("max_state_bytes", static_cast<std::int64_t>(options_.max_state_bytes))});
    throw util::SerializationError("encoded state is " + std::to_string(bytes.size()) + " bytes, limit is " +
                                   std::to_string(options_.max_state_bytes));
  }

  observability::Metrics::Instance().ObserveStateSizeBytes(bytes.size());
  return bytes;
}

state::State StateCodec::Decode(std::string_view bytes) const {
  std::string plain;
  if (LooksLikeGzip(bytes)) {
    auto inflated = GzipDecompress(bytes, options_.MaxInflatedBytes());
    if (!inflated) {
      throw util::SerializationError("state blob has a gzip header but does not decompress");
    }
    plain = std::move(*inflated);
  } else {
    plain.assign(bytes.data(), bytes.size());
  }

  const auto first = std::find_if(plain.begin(), plain.end(), [](char c) { return c != ' ' && c != '\n' && c != '\r' && c != '\t'; });

  // A binary blob can also start with whitespace then '{' (tag 0x0a, length
  // 0x7b), so a failed JSON parse still gets the binary attempt.
  state::State doc;
  bool         parsed = false;
  if (first != plain.end() && *first == '{') {
    try {
      doc    = state::FromJson(plain);
      parsed = true;
    } catch (const util::SerializationError&) {
      doc.Clear();
    }
  }
  if (!parsed && (plain.empty() || !doc.ParseFromString(plain))) {
    throw util::SerializationError("state blob is neither json nor protobuf binary");
  }

  state::Erase(&doc, kMetadataKey);
  return DecryptSensitiveFields(doc);
}

} // namespace flowstate::codec
