#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "fmd_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool ThrowsConfigError(Fn&& fn) {
  try {
    fn();
  } catch (const fmd::util::Error& e) {
    return e.kind() == fmd::util::ErrorKind::Config;
  }
  return false;
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: "debug"
database:
  backend: "sqlite"
  lock_timeout_ms: 2500
  sqlite:
    path: "/var/lib/fmd/fmd.db"
    busy_timeout_ms: 1000
  postgres:
    connection_uri: "postgresql://fmd@localhost/fmd"
    max_connections: 4
hawk:
  override_port: true
  show_hash: false
registry:
  max_devices_per_user: 3
gc:
  position_expiry_sec: 3600
  interval_sec: 60
)");

  auto config = fmd::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().sqlite().path() == "/var/lib/fmd/fmd.db");
  assert(config.database().sqlite().busy_timeout_ms() == 1000);
  assert(config.database().postgres().max_connections() == 4);
  assert(config.hawk().override_port());
  assert(!config.hawk().show_hash());

  assert(fmd::config::DatabaseBackend(config) == "sqlite");
  assert(fmd::config::LockTimeoutMs(config) == 2500);
  assert(fmd::config::MaxDevicesPerUser(config) == 3);
  assert(fmd::config::PositionExpirySec(config) == 3600);
  assert(fmd::config::GcIntervalSec(config) == 60);
}

void TestDefaultsForOmittedFields() {
  const auto yaml_path = WriteYaml("minimal",
                                   R"(logging:
  level: "info"
)");

  auto config = fmd::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(fmd::config::DatabaseBackend(config) == "memory");
  assert(fmd::config::LockTimeoutMs(config) == 5000);
  assert(fmd::config::MaxDevicesPerUser(config) == 1);
  assert(fmd::config::PositionExpirySec(config) == 432000);
  assert(fmd::config::GcIntervalSec(config) == 300);
  assert(!config.hawk().override_port());
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\fmd\\\"quoted\"\\db.sqlite"
)");

  auto config = fmd::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\fmd\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  backend: "memory"
unknown_field: 123
)");

  assert(ThrowsConfigError([&] { (void)fmd::config::ConfigLoader::LoadFromYaml(yaml_path.string()); }) &&
         "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsConfigError() {
  const auto missing = std::filesystem::temp_directory_path() / "fmd_config_loader_tests" / "does_not_exist.yaml";
  assert(ThrowsConfigError([&] { (void)fmd::config::ConfigLoader::LoadFromYaml(missing.string()); }));
}

} // namespace

int main() {
  TestFullConfig();
  TestDefaultsForOmittedFields();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsConfigError();

  std::cout << "fmd_unit_config_loader: pass\n";
  return 0;
}
