#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "streamledger_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "/tmp/streamledger/ledger.db"
    wal_mode: false
ledger:
  owner: "admin"
  min_stream_duration_sec: 300
logging:
  level: "debug"
  pattern: "[%l] %v"
)");

  auto config = streamledger::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/streamledger/ledger.db");
  assert(config.database().sqlite().has_wal_mode());
  assert(!config.database().sqlite().wal_mode());
  assert(config.ledger().owner() == "admin");
  assert(config.ledger().min_stream_duration_sec() == 300);
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
}

void TestMemoryBackendAndDefaults() {
  auto config = streamledger::config::ConfigLoader::LoadFromString(R"(database:
  memory: {}
)");
  assert(config.database().has_memory());
  assert(config.ledger().owner().empty());
  assert(config.ledger().min_stream_duration_sec() == 0);
  assert(config.server().bind_address().empty());
}

void TestEmptyDocumentIsDefaults() {
  auto config = streamledger::config::ConfigLoader::LoadFromString("");
  assert(!config.has_server());
  assert(!config.database().has_sqlite());
}

void TestQuotedNumericOwnerStaysString() {
  auto config = streamledger::config::ConfigLoader::LoadFromString(R"(ledger:
  owner: "1234"
)");
  assert(config.ledger().owner() == "1234");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\ledger\\\"quoted\"\\db.sqlite"
)");

  auto config = streamledger::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\ledger\\\"quoted\"\\db.sqlite");
  assert(!config.database().sqlite().has_wal_mode());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)streamledger::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)streamledger::config::ConfigLoader::LoadFromYaml("/nonexistent/streamledger.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigLoads();
  TestMemoryBackendAndDefaults();
  TestEmptyDocumentIsDefaults();
  TestQuotedNumericOwnerStaysString();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "streamledger_unit_config_loader: pass\n";
  return 0;
}
