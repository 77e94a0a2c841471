#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/runtime_settings.hpp"

namespace {

using creditgate::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "creditgate_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml, const std::string& fragment) {
  try {
    ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error& e) {
    return std::string(e.what()).find(fragment) != std::string::npos;
  }
  return false;
}

void TestLoadsFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full", R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "/var/lib/creditgate/state.db"
    busy_timeout_ms: 2500
logging:
  level: debug
wallet:
  capacity: 20
  refill_seconds_per_credit: 120
  initial_balance: 0
unlock:
  min_cost: 0.1
  max_cost: 2
  reservation_seconds: 90
circuit:
  fail_fast_enabled: true
  failure_threshold: 3
sweep:
  enabled: false
  min_interval_ms: 5000
worker:
  enabled: true
  worker_id: "42"
  provider_key: renderer
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/creditgate/state.db");
  assert(config.database().sqlite().busy_timeout_ms() == 2500);
  assert(config.logging().level() == "debug");
  assert(config.wallet().has_initial_balance());
  assert(config.wallet().initial_balance() == 0.0);
  assert(config.sweep().has_enabled());
  assert(!config.sweep().enabled());
  assert(!config.sweep().has_item_logs());
  assert(config.worker().worker_id() == "42");

  const auto settings = creditgate::config::ResolveRuntimeSettings(config);
  assert(settings.wallet.capacity == 20.0);
  assert(settings.wallet.initial_balance == 0.0);
  assert(settings.unlock.min_cost == 0.1);
  assert(settings.unlock.max_cost == 2.0);
  assert(settings.unlock.reservation_seconds == 90);
  assert(settings.circuit.fail_fast_enabled);
  assert(settings.circuit.failure_threshold == 3);
  assert(settings.circuit.cooldown_seconds == 60);
  assert(!settings.sweep.enabled);
  assert(settings.sweep.item_logs);
  assert(settings.sweep.min_interval_ms == 5000);
  assert(settings.worker.enabled);
  assert(settings.worker.worker_id == "42");
  assert(settings.worker.provider_key == "renderer");

  std::filesystem::remove(yaml_path);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "C:\\creditgate\\\"quoted\"\\db.sqlite"
logging:
  pattern: "line1\nline2 \u2713"
)");

  assert(config.database().sqlite().path() == "C:\\creditgate\\\"quoted\"\\db.sqlite");
  assert(config.logging().pattern() == "line1\nline2 \xE2\x9C\x93");
}

void TestEmptyDocumentUsesDefaults() {
  const auto config   = ConfigLoader::LoadFromYamlString("");
  const auto settings = creditgate::config::ResolveRuntimeSettings(config);
  assert(!config.has_database());
  assert(settings.wallet.capacity == 10.0);
  assert(settings.wallet.initial_balance == 10.0);
  assert(settings.wallet.refill_seconds_per_credit == 360.0);
  assert(settings.unlock.reservation_seconds == 120);
  assert(settings.retry.max_attempts == 2);
  assert(settings.retry.jitter_ms == 200);
  assert(settings.sweep.enabled);
  assert(settings.worker.retry_delay_seconds == 30);
  assert(!settings.worker.enabled);
}

void TestSettingsAreClamped() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(unlock:
  min_cost: 0.5
  max_cost: 0.5
  reservation_seconds: 5
retry:
  max_attempts: 50
  timeout_ms: 10
  jitter_ms: 0
sweep:
  batch_size: 1
  processing_stale_ms: 1
worker:
  max_jobs: 1000
  lease_seconds: 1
)");
  const auto settings = creditgate::config::ResolveRuntimeSettings(config);
  assert(settings.unlock.reservation_seconds == 30);
  assert(settings.retry.max_attempts == 6);
  assert(settings.retry.timeout_ms == 1000);
  assert(settings.retry.jitter_ms == 0);
  assert(settings.sweep.batch_size == 10);
  assert(settings.sweep.processing_stale_ms == 60 * 1000);
  assert(settings.worker.max_jobs == 200);
  assert(settings.worker.lease_seconds == 5);
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("wallet:\n  capacity: 5\n  overdraft: true\n", "Invalid configuration"));
  assert(Rejects("storage:\n  ram: {}\n", "Invalid configuration"));
  assert(Rejects("- a\n- b\n", "top level must be a mapping"));
}

void TestValidation() {
  assert(Rejects("database:\n  sqlite:\n    path: \"\"\n", "database.sqlite.path"));
  assert(Rejects("database:\n  postgres:\n    max_connections: 4\n", "database.postgres.connection_uri"));
  assert(Rejects("logging:\n  level: verbose\n", "logging.level"));
  assert(Rejects("wallet:\n  initial_balance: -1\n", "wallet values"));
  assert(Rejects("unlock:\n  min_cost: 2\n  max_cost: 1\n", "unlock.min_cost"));

  try {
    ConfigLoader::LoadFromYaml("/nonexistent/creditgate.yaml");
    assert(false);
  } catch (const std::runtime_error& e) {
    assert(std::string(e.what()).find("Failed to load YAML config") != std::string::npos);
  }
}

} // namespace

int main() {
  TestLoadsFullConfigFromFile();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestEmptyDocumentUsesDefaults();
  TestSettingsAreClamped();
  TestUnknownFieldsAreRejected();
  TestValidation();

  std::cout << "creditgate_unit_config_loader: pass\n";
  return 0;
}
