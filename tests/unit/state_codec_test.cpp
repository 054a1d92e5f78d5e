#include "internal/codec/state_codec.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/codec/compression.hpp"
#include "internal/codec/state_encryption.hpp"
#include "internal/util/errors.hpp"

namespace {

using flowstate::codec::CodecOptions;
using flowstate::codec::EncodeOptions;
using flowstate::codec::StateCodec;
using flowstate::codec::StateEncryption;
using flowstate::runtime::config::SERIALIZATION_FORMAT_BINARY;
using flowstate::runtime::config::SERIALIZATION_FORMAT_JSON;

namespace state = flowstate::state;
namespace codec = flowstate::codec;
namespace util  = flowstate::util;

std::shared_ptr<const StateEncryption> MakeKey(char fill) {
  return std::make_shared<StateEncryption>(std::string(StateEncryption::kKeySize, fill));
}

CodecOptions Options() {
  CodecOptions options;
  options.sensitive_fields = {"api_keys", "credentials"};
  return options;
}

state::State SampleState() {
  auto doc = state::NewInitialState("flow-1", "tenant-a", state::MakeEmptyList());

  google::protobuf::Value keys = state::MakeEmptyStruct();
  (*keys.mutable_struct_value()->mutable_fields())["crm"] = state::MakeString("sk-live-0123456789");
  state::Set(&doc, "api_keys", keys);
  state::Set(&doc, "credentials", state::MakeNull());
  state::SetString(&doc, "notes", "public");
  return doc;
}

void TestJsonRoundTripKeepsSecretsOutOfTheBlob() {
  StateCodec c(Options(), MakeKey('k'));
  const auto doc = SampleState();

  const auto bytes = c.Encode(doc);
  assert(codec::LooksLikeGzip(bytes));

  const auto plain = codec::GzipDecompress(bytes, codec::kDefaultMaxBytes);
  assert(plain.has_value());
  assert(plain->find("sk-live-0123456789") == std::string::npos);
  assert(plain->find("__encrypted__") != std::string::npos);
  assert(plain->find("__serialization__") != std::string::npos);
  assert(plain->find("public") != std::string::npos);

  const auto decoded = c.Decode(bytes);
  assert(state::Equal(decoded, doc));
  assert(!state::Has(decoded, codec::kMetadataKey));
}

void TestNullSensitiveFieldsStayNull() {
  StateCodec c(Options(), MakeKey('k'));
  const auto sealed = c.EncryptSensitiveFields(SampleState());

  assert(StateCodec::IsEnvelope(*state::Find(sealed, "api_keys")));
  assert(state::Find(sealed, "credentials")->kind_case() == google::protobuf::Value::kNullValue);

  // already sealed values are not sealed twice
  const auto twice = c.EncryptSensitiveFields(sealed);
  assert(state::Equal(twice, sealed));
}

void TestBinaryFormatRoundTrip() {
  StateCodec    c(Options(), MakeKey('k'));
  EncodeOptions options;
  options.format   = SERIALIZATION_FORMAT_BINARY;
  options.compress = false;

  const auto doc   = SampleState();
  const auto bytes = c.Encode(doc, options);
  assert(!bytes.empty() && bytes[0] != '{');
  assert(state::Equal(c.Decode(bytes), doc));
}

void TestUncompressedJsonIsReadable() {
  StateCodec    c(Options(), MakeKey('k'));
  EncodeOptions options;
  options.compress         = false;
  options.include_metadata = false;

  const auto bytes = c.Encode(SampleState(), options);
  assert(bytes.front() == '{');
  assert(bytes.find("__serialization__") == std::string::npos);
}

void TestTamperedCiphertextFailsAuthentication() {
  StateCodec c(Options(), MakeKey('k'));
  auto       sealed = c.EncryptSensitiveFields(SampleState());

  auto* envelope   = state::FindMutable(&sealed, "api_keys")->mutable_struct_value()->mutable_fields();
  auto  ciphertext = (*envelope)[std::string(codec::kCiphertextKey)].string_value();
  auto& ch         = ciphertext[ciphertext.size() / 2];
  ch               = ch == 'A' ? 'B' : 'A';
  (*envelope)[std::string(codec::kCiphertextKey)] = state::MakeString(ciphertext);

  bool threw = false;
  try {
    (void)c.DecryptSensitiveFields(sealed);
  } catch (const util::EncryptionError&) {
    threw = true;
  }
  assert(threw);
}

void TestWrongOrMissingKeyCannotDecode() {
  StateCodec writer(Options(), MakeKey('k'));
  const auto bytes = writer.Encode(SampleState());

  bool wrong_key = false;
  try {
    StateCodec reader(Options(), MakeKey('x'));
    (void)reader.Decode(bytes);
  } catch (const util::EncryptionError&) {
    wrong_key = true;
  }
  assert(wrong_key);

  bool no_key = false;
  try {
    StateCodec reader(Options(), nullptr);
    (void)reader.Decode(bytes);
  } catch (const util::EncryptionError&) {
    no_key = true;
  }
  assert(no_key);
}

void TestSizeLimitAppliesAfterCompression() {
  auto options            = Options();
  options.max_state_bytes = 256;
  StateCodec c(options, MakeKey('k'));

  auto doc = SampleState();
  state::SetString(&doc, "blob", std::string(4096, 'a'));

  // highly compressible: fits once gzipped
  (void)c.Encode(doc);

  EncodeOptions raw;
  raw.compress = false;
  bool threw   = false;
  try {
    (void)c.Encode(doc, raw);
  } catch (const util::SerializationError&) {
    threw = true;
  }
  assert(threw);
}

void TestInflateIsBounded() {
  const std::string zeros(100000, '\0');
  const auto        packed = codec::GzipCompress(zeros);
  assert(packed.size() < 1000);

  auto exact = codec::GzipDecompress(packed, zeros.size());
  assert(exact.has_value() && *exact == zeros);

  bool capped = false;
  try {
    (void)codec::GzipDecompress(packed, zeros.size() - 1);
  } catch (const util::SerializationError&) {
    capped = true;
  }
  assert(capped);

  // 256 * 32 = 8 KiB inflate budget; a small gzip of 1 MiB must not be expanded
  auto options            = Options();
  options.max_state_bytes = 256;
  StateCodec c(options, MakeKey('k'));
  assert(c.Options().MaxInflatedBytes() == 256 * codec::kMaxInflateRatio);

  std::string bomb = "{\"flow_id\":\"";
  bomb.append(1024 * 1024, 'a');
  bomb.append("\"}");
  bool rejected = false;
  try {
    (void)c.Decode(codec::GzipCompress(bomb));
  } catch (const util::SerializationError&) {
    rejected = true;
  }
  assert(rejected);

  // and Encode refuses what Decode could not read back
  auto doc = SampleState();
  state::SetString(&doc, "blob", std::string(16 * 1024, 'a'));
  bool oversized = false;
  try {
    (void)c.Encode(doc);
  } catch (const util::SerializationError&) {
    oversized = true;
  }
  assert(oversized);
}

void TestGarbageIsASerializationError() {
  StateCodec c(Options(), MakeKey('k'));

  bool garbage = false;
  try {
    (void)c.Decode("not a state blob");
  } catch (const util::SerializationError&) {
    garbage = true;
  }
  assert(garbage);

  std::string broken_gzip = codec::GzipCompress("{\"flow_id\":\"x\"}");
  broken_gzip.resize(broken_gzip.size() - 6);
  bool truncated = false;
  try {
    (void)c.Decode(broken_gzip);
  } catch (const util::SerializationError&) {
    truncated = true;
  }
  assert(truncated);
}

void TestEncodeWithoutEncryptionOpensEnvelopes() {
  StateCodec    c(Options(), MakeKey('k'));
  EncodeOptions options;
  options.compress          = false;
  options.encrypt_sensitive = false;

  const auto bytes = c.Encode(c.EncryptSensitiveFields(SampleState()), options);
  assert(bytes.find("sk-live-0123456789") != std::string::npos);
  assert(bytes.find("__encrypted__") == std::string::npos);
}

void TestDerivedKeysAreDeterministic() {
  const auto a = StateEncryption::DeriveKey("hunter2", "flowstate_salt_v1", 1000);
  const auto b = StateEncryption::DeriveKey("hunter2", "flowstate_salt_v1", 1000);
  const auto c = StateEncryption::DeriveKey("hunter3", "flowstate_salt_v1", 1000);
  assert(a.size() == StateEncryption::kKeySize);
  assert(a == b);
  assert(a != c);

  const auto encoded = codec::Base64Encode(a);
  assert(codec::Base64Decode(encoded) == a);
  assert(!codec::Base64Decode("***").has_value());
}

} // namespace

int main() {
  TestJsonRoundTripKeepsSecretsOutOfTheBlob();
  TestNullSensitiveFieldsStayNull();
  TestBinaryFormatRoundTrip();
  TestUncompressedJsonIsReadable();
  TestTamperedCiphertextFailsAuthentication();
  TestWrongOrMissingKeyCannotDecode();
  TestSizeLimitAppliesAfterCompression();
  TestInflateIsBounded();
  TestGarbageIsASerializationError();
  TestEncodeWithoutEncryptionOpensEnvelopes();
  TestDerivedKeysAreDeterministic();

  std::cout << "flowstate_unit_state_codec: pass\n";
  return 0;
}
