#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "affiliate_market_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestSqliteBackendAndBootstrapAreParsed() {
  const auto yaml_path = WriteYaml("sqlite_bootstrap",
                                   R"(database:
  sqlite:
    path: "/tmp/market.sqlite"
    wal_mode: true
logging:
  level: "debug"
bootstrap:
  admin: "ST2ADMIN"
  fee_destination: "ST2FEES"
)");

  auto config = market::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/market.sqlite");
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");
  assert(config.bootstrap().admin() == "ST2ADMIN");
  assert(config.bootstrap().fee_destination() == "ST2FEES");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\market\\\"quoted\"\\db.sqlite"
    wal_mode: false
)");

  auto config = market::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\market\\\"quoted\"\\db.sqlite");
}

void TestMissingSectionsFallBackToDefaults() {
  const auto yaml_path = WriteYaml("defaults",
                                   R"(logging:
  level: "warn"
)");

  auto config = market::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(config.bootstrap().admin() == market::config::kDefaultBootstrapPrincipal);
  assert(config.bootstrap().fee_destination() == market::config::kDefaultBootstrapPrincipal);

  auto defaults = market::config::ConfigLoader::Defaults();
  assert(defaults.database().has_memory());
  assert(defaults.bootstrap().admin() == market::config::kDefaultBootstrapPrincipal);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)market::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestSqliteWithoutPathIsRejected() {
  const auto yaml_path = WriteYaml("sqlite_no_path",
                                   R"(database:
  sqlite:
    wal_mode: true
)");

  bool threw = false;
  try {
    (void)market::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw);
}

void TestObservabilityAndLogFileAreParsed() {
  const auto yaml_path = WriteYaml("observability",
                                   R"(logging:
  level: "info"
  file:
    path: "/tmp/affiliate-market.log"
    max_size_mb: 5
observability:
  tracing_enabled: true
  transport: "OTLP_TRANSPORT_HTTP"
  service_name: "market-staging"
  trace_sample_ratio: 0.25
)");

  auto config = market::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().file().path() == "/tmp/affiliate-market.log");
  assert(config.logging().file().max_size_mb() == 5);
  assert(config.logging().file().max_files() == 0);
  assert(config.observability().tracing_enabled());
  assert(config.observability().transport() == market::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.observability().service_name() == "market-staging");
  assert(config.observability().trace_sample_ratio() == 0.25);
}

void TestQuotedScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted_scalars",
                                   R"(bootstrap:
  admin: "12345"
  fee_destination: 'true'
)");

  auto config = market::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.bootstrap().admin() == "12345");
  assert(config.bootstrap().fee_destination() == "true");
}

void TestEmptyFileYieldsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = market::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(config.bootstrap().admin() == market::config::kDefaultBootstrapPrincipal);
}

void TestSampleRatioOutOfRangeIsRejected() {
  const auto yaml_path = WriteYaml("bad_ratio",
                                   R"(observability:
  trace_sample_ratio: 1.5
)");

  bool threw = false;
  try {
    (void)market::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw);
}

} // namespace

int main() {
  TestSqliteBackendAndBootstrapAreParsed();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestMissingSectionsFallBackToDefaults();
  TestUnknownFieldsAreRejected();
  TestSqliteWithoutPathIsRejected();
  TestObservabilityAndLogFileAreParsed();
  TestQuotedScalarsStayStrings();
  TestEmptyFileYieldsDefaults();
  TestSampleRatioOutOfRangeIsRejected();

  std::cout << "affiliate_market_unit_config_loader: pass\n";
  return 0;
}
