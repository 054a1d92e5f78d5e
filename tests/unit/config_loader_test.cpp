#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

namespace rc = flowstate::runtime::config;
using flowstate::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "flowstate_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\flowstate\\\"quoted\"\\db.sqlite"
encryption:
  salt: "123"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\flowstate\\\"quoted\"\\db.sqlite");
  // quoted numbers stay strings
  assert(config.encryption().salt() == "123");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(logging:
  pattern: "line1\nline2☃"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().pattern() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
cache:
  live_state_ttl_seconds: 60
  unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestEmptyFileGetsEveryDefault() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(config.cache().enabled());
  assert(config.cache().live_state_ttl_seconds() == 3600);
  assert(config.cache().checkpoint_ttl_seconds() == 86400);
  assert(config.cache().max_entries() == 10000);
  assert(config.retention().checkpoint_limit() == 10);
  assert(config.retention().archive_limit() == 5);
  assert(config.retention().keep_versions() == 20);
  assert(config.serialization().format() == rc::SERIALIZATION_FORMAT_JSON);
  assert(config.serialization().compress());
  assert(config.serialization().include_metadata());
  assert(config.serialization().max_state_bytes() == 10u * 1024 * 1024);
  assert(config.encryption().enabled());
  assert(config.encryption().key_env() == "FLOWSTATE_ENCRYPTION_KEY");
  assert(config.encryption().password_env() == "FLOWSTATE_PASSWORD");
  assert(config.encryption().salt() == "flowstate_salt_v1");
  assert(config.encryption().kdf_iterations() == 100000);
  assert(config.encryption().sensitive_fields_size() == 8);
  assert(config.recovery().unrepairable_policy() == rc::UNREPAIRABLE_POLICY_RESET_TO_INITIAL);
}

void TestExplicitValuesSurviveDefaults() {
  const auto yaml_path = WriteYaml("explicit",
                                   R"(database:
  sqlite:
    path: "/tmp/flowstate.sqlite"
cache:
  enabled: false
  live_state_ttl_seconds: 10
  checkpoint_ttl_seconds: 20
retention:
  keep_versions: 3
serialization:
  format: SERIALIZATION_FORMAT_BINARY
  compress: false
encryption:
  enabled: false
  sensitive_fields: [secrets]
recovery:
  unrepairable_policy: UNREPAIRABLE_POLICY_ESCALATE
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().busy_timeout_ms() == 5000);
  assert(!config.cache().enabled());
  assert(config.cache().live_state_ttl_seconds() == 10);
  assert(config.cache().checkpoint_ttl_seconds() == 20);
  assert(config.retention().keep_versions() == 3);
  assert(config.retention().checkpoint_limit() == 10);
  assert(config.serialization().format() == rc::SERIALIZATION_FORMAT_BINARY);
  assert(!config.serialization().compress());
  assert(!config.encryption().enabled());
  assert(config.encryption().sensitive_fields_size() == 1);
  assert(config.encryption().sensitive_fields(0) == "secrets");
  assert(config.recovery().unrepairable_policy() == rc::UNREPAIRABLE_POLICY_ESCALATE);
}

void TestConflictingSettingsAreRejected() {
  const auto ttl_path = WriteYaml("ttl_order",
                                  R"(cache:
  live_state_ttl_seconds: 600
  checkpoint_ttl_seconds: 60
)");
  bool ttl_threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(ttl_path.string());
  } catch (const std::invalid_argument&) {
    ttl_threw = true;
  }
  assert(ttl_threw);

  const auto kdf_path = WriteYaml("weak_kdf",
                                  R"(encryption:
  kdf_iterations: 500
)");
  bool kdf_threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(kdf_path.string());
  } catch (const std::invalid_argument&) {
    kdf_threw = true;
  }
  assert(kdf_threw);

  auto config = ConfigLoader::Defaults();
  config.mutable_database()->mutable_sqlite();
  bool path_threw = false;
  try {
    ConfigLoader::Validate(config);
  } catch (const std::invalid_argument&) {
    path_threw = true;
  }
  assert(path_threw);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml((std::filesystem::temp_directory_path() / "flowstate_no_such_config.yaml").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestEmptyFileGetsEveryDefault();
  TestExplicitValuesSurviveDefaults();
  TestConflictingSettingsAreRejected();
  TestMissingFileIsReported();

  std::cout << "flowstate_unit_config_loader: pass\n";
  return 0;
}
