#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "archive_vault_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "C:\\vault\\\"quoted\"\\catalog.sqlite"
    wal_mode: true
)");

  auto config = vault::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\vault\\\"quoted\"\\catalog.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestServerDefaultsAreApplied() {
  const auto yaml_path = WriteYaml("server_defaults", "storage:\n  memory: {}\n");

  auto        config  = vault::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  const auto& uploads = config.uploads();
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(uploads.small_object_threshold_bytes() == 25ull * 1024 * 1024);
  assert(uploads.default_chunk_size_bytes() == 5ull * 1024 * 1024);
  assert(uploads.capability_ttl().seconds() == 900);
  assert(uploads.session_max_age().seconds() == 86400);
  assert(uploads.reaper_interval().seconds() == 300);
  assert(uploads.capability_base_url() == "vault://uploads");
  assert(uploads.catalog_retry().max_attempts() == 5);
  assert(uploads.catalog_retry().initial_backoff().nanos() == 100'000'000);
  assert(config.storage().has_memory());
}

void TestExplicitValuesAndDurationsAreKept() {
  const auto yaml_path = WriteYaml("explicit_values",
                                   R"(uploads:
  small_object_threshold_bytes: 1048576
  default_chunk_size_bytes: 8388608
  capability_ttl: "30s"
  session_max_age: "3600s"
  reaper_interval: "1.500s"
  capability_secret: "s3cr3t"
storage:
  object:
    root_path: "/var/lib/vault"
    filesystem: FILE_SYSTEM_LOCAL
)");

  auto config = vault::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.uploads().small_object_threshold_bytes() == 1048576);
  assert(config.uploads().default_chunk_size_bytes() == 8388608);
  assert(config.uploads().capability_ttl().seconds() == 30);
  assert(config.uploads().reaper_interval().seconds() == 1);
  assert(config.uploads().reaper_interval().nanos() == 500'000'000);
  assert(config.uploads().capability_secret() == "s3cr3t");
  assert(config.storage().object().filesystem() == vault::runtime::config::FILE_SYSTEM_LOCAL);
}

void TestClientDefaultsKeepExplicitZeroRestarts() {
  const auto yaml_path = WriteYaml("client_zero_restarts",
                                   R"(endpoint: "vault.internal:50061"
transfer:
  parallelism: 8
  max_session_restarts: 0
)");

  auto config = vault::config::ConfigLoader::LoadClientFromYaml(yaml_path.string());
  assert(config.endpoint() == "vault.internal:50061");
  assert(config.transfer().parallelism() == 8);
  assert(config.transfer().max_session_restarts() == 0);
  assert(config.transfer().chunk_size_bytes() == 5ull * 1024 * 1024);
  assert(config.transfer().part_retry().max_attempts() == 3);
  assert(config.transfer().part_retry().max_backoff().seconds() == 5);
  assert(config.transfer().part_retry().multiplier() == 2.0);

  vault::runtime::config::ClientConfig empty;
  vault::config::ConfigLoader::ApplyDefaults(empty);
  assert(empty.endpoint() == "localhost:50061");
  assert(empty.transfer().max_session_restarts() == 1);
}

void TestClientRejectsChunkBelowMinimumPart() {
  const auto yaml_path = WriteYaml("client_small_chunk",
                                   R"(transfer:
  chunk_size_bytes: 1024
  min_part_size_bytes: 5242880
)");

  bool threw = false;
  try {
    (void)vault::config::ConfigLoader::LoadClientFromYaml(yaml_path.string());
  } catch (const vault::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw && "chunk size below the minimum part size must be rejected");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_fields",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
  unexpected_field: true
)");

  bool threw = false;
  try {
    (void)vault::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestServerDefaultsAreApplied();
  TestExplicitValuesAndDurationsAreKept();
  TestClientDefaultsKeepExplicitZeroRestarts();
  TestClientRejectsChunkBelowMinimumPart();
  TestUnknownFieldsAreRejected();

  std::cout << "vault_unit_config_loader: pass\n";
  return 0;
}
