#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using scanhub::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "scanhub_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Exception>
bool Throws(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromString(yaml);
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "C:\\scanhub\\\"quoted\"\\scans.db"
    wal_mode: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\scanhub\\\"quoted\"\\scans.db");
  assert(config.database().sqlite().wal_mode());
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "line1\nline2☃"
database:
  memory: {}
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestFullDocumentParses() {
  auto config = ConfigLoader::LoadFromString(R"(server:
  bind_address: "0.0.0.0:50061"
database:
  postgres:
    connection_uri: "postgresql://scanhub@localhost/scanhub"
    max_connections: 4
identity:
  token_secret: "s3cret"
  accept_unknown_logins: true
  users:
    - login: "alice"
      id: 7
      display_name: "Alice"
    - login: "0042"
legacy_sink:
  min_latency_ms: 5
  max_latency_ms: 10
  failure_probability: 0.25
logging:
  level: "debug"
observability:
  tracing_enabled: false
  transport: "OTLP_TRANSPORT_HTTP"
)");

  assert(config.database().backend_case() == scanhub::runtime::config::DatabaseConfig::kPostgres);
  assert(config.database().postgres().max_connections() == 4);
  assert(config.identity().token_secret() == "s3cret");
  assert(config.identity().accept_unknown_logins());
  assert(config.identity().users_size() == 2);
  assert(config.identity().users(0).id() == 7);
  // quoted numeric logins keep their leading zeros
  assert(config.identity().users(1).login() == "0042");
  assert(config.legacy_sink().failure_probability() == 0.25);
  assert(config.logging().level() == "debug");
  assert(config.observability().transport() == scanhub::runtime::config::OTLP_TRANSPORT_HTTP);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
database:
  memory: {}
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/scanhub/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestValidationFailures() {
  assert(Throws<std::invalid_argument>(R"(database:
  memory: {}
)"));

  assert(Throws<std::invalid_argument>(R"(server:
  bind_address: "0.0.0.0:1"
)"));

  assert(Throws<std::invalid_argument>(R"(server:
  bind_address: "0.0.0.0:1"
database:
  sqlite:
    wal_mode: true
)"));

  assert(Throws<std::invalid_argument>(R"(server:
  bind_address: "0.0.0.0:1"
database:
  postgres:
    max_connections: 2
)"));

  assert(Throws<std::invalid_argument>(R"(server:
  bind_address: "0.0.0.0:1"
database:
  memory: {}
identity:
  users:
    - login: "alice"
    - login: "alice"
)"));

  assert(Throws<std::invalid_argument>(R"(server:
  bind_address: "0.0.0.0:1"
database:
  memory: {}
legacy_sink:
  min_latency_ms: 20
  max_latency_ms: 10
)"));

  assert(Throws<std::invalid_argument>(R"(server:
  bind_address: "0.0.0.0:1"
database:
  memory: {}
legacy_sink:
  failure_probability: 1.5
)"));
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestFullDocumentParses();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestValidationFailures();

  std::cout << "scanhub_unit_config_loader: pass\n";
  return 0;
}
