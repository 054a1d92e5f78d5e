#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace flowstate::config {

namespace rc = flowstate::runtime::config;

namespace {

constexpr uint32_t kDefaultLiveStateTtlSeconds  = 3600;
constexpr uint32_t kDefaultCheckpointTtlSeconds = 86400;
constexpr uint64_t kDefaultCacheMaxEntries      = 10000;
constexpr uint32_t kDefaultCheckpointLimit      = 10;
constexpr uint32_t kDefaultArchiveLimit         = 5;
constexpr uint32_t kDefaultKeepVersions         = 20;
constexpr uint64_t kDefaultMaxStateBytes        = 10ull * 1024 * 1024;
constexpr uint32_t kDefaultKdfIterations        = 100000;
constexpr uint32_t kDefaultSqliteBusyTimeoutMs  = 5000;
constexpr uint32_t kDefaultPgMaxConnections     = 16;

constexpr const char* kDefaultKeyEnv      = "FLOWSTATE_ENCRYPTION_KEY";
constexpr const char* kDefaultPasswordEnv = "FLOWSTATE_PASSWORD";
constexpr const char* kDefaultSalt        = "flowstate_salt_v1";

constexpr const char* kDefaultSensitiveFields[] = {"api_keys",           "passwords", "tokens",   "credentials", "personal_data",
                                                   "sensitive_metadata", "user_data", "private_keys"};

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings ("123" is a salt, not a number)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

rc::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  rc::RuntimeConfig config;

  // an empty document means "all defaults"
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(&config);
  Validate(config);
  return config;
}

rc::RuntimeConfig ConfigLoader::Defaults() {
  rc::RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(rc::RuntimeConfig* config) {
  auto* database = config->mutable_database();
  if (database->backend_case() == rc::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }
  if (database->has_sqlite() && database->sqlite().busy_timeout_ms() == 0) {
    database->mutable_sqlite()->set_busy_timeout_ms(kDefaultSqliteBusyTimeoutMs);
  }
  if (database->has_postgres() && database->postgres().max_connections() == 0) {
    database->mutable_postgres()->set_max_connections(kDefaultPgMaxConnections);
  }

  auto* cache = config->mutable_cache();
  if (!cache->has_enabled()) cache->set_enabled(true);
  if (cache->live_state_ttl_seconds() == 0) cache->set_live_state_ttl_seconds(kDefaultLiveStateTtlSeconds);
  if (cache->checkpoint_ttl_seconds() == 0) cache->set_checkpoint_ttl_seconds(kDefaultCheckpointTtlSeconds);
  if (cache->max_entries() == 0) cache->set_max_entries(kDefaultCacheMaxEntries);

  auto* retention = config->mutable_retention();
  if (retention->checkpoint_limit() == 0) retention->set_checkpoint_limit(kDefaultCheckpointLimit);
  if (retention->archive_limit() == 0) retention->set_archive_limit(kDefaultArchiveLimit);
  if (retention->keep_versions() == 0) retention->set_keep_versions(kDefaultKeepVersions);

  auto* serialization = config->mutable_serialization();
  if (serialization->format() == rc::SERIALIZATION_FORMAT_UNSPECIFIED) serialization->set_format(rc::SERIALIZATION_FORMAT_JSON);
  if (!serialization->has_compress()) serialization->set_compress(true);
  if (!serialization->has_include_metadata()) serialization->set_include_metadata(true);
  if (serialization->max_state_bytes() == 0) serialization->set_max_state_bytes(kDefaultMaxStateBytes);

  auto* encryption = config->mutable_encryption();
  if (!encryption->has_enabled()) encryption->set_enabled(true);
  if (encryption->key_env().empty()) encryption->set_key_env(kDefaultKeyEnv);
  if (encryption->password_env().empty()) encryption->set_password_env(kDefaultPasswordEnv);
  if (encryption->salt().empty()) encryption->set_salt(kDefaultSalt);
  if (encryption->kdf_iterations() == 0) encryption->set_kdf_iterations(kDefaultKdfIterations);
  if (encryption->sensitive_fields().empty()) {
    for (const char* field : kDefaultSensitiveFields) {
      encryption->add_sensitive_fields(field);
    }
  }

  auto* recovery = config->mutable_recovery();
  if (recovery->unrepairable_policy() == rc::UNREPAIRABLE_POLICY_UNSPECIFIED) {
    recovery->set_unrepairable_policy(rc::UNREPAIRABLE_POLICY_RESET_TO_INITIAL);
  }
}

void ConfigLoader::Validate(const rc::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw std::invalid_argument("database.sqlite.path must not be empty");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw std::invalid_argument("database.postgres.connection_uri must not be empty");
  }
  if (config.cache().checkpoint_ttl_seconds() < config.cache().live_state_ttl_seconds()) {
    throw std::invalid_argument("cache.checkpoint_ttl_seconds must be >= cache.live_state_ttl_seconds");
  }
  if (config.encryption().kdf_iterations() < 1000) {
    throw std::invalid_argument("encryption.kdf_iterations must be at least 1000");
  }
}

} // namespace flowstate::config
