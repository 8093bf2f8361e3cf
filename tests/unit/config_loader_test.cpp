#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using namespace std::chrono_literals;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "casetrack_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)casetrack::config::ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
database:
  sqlite:
    path: "/var/lib/casetrack/casetrack.db"
    wal_mode: false
idempotency:
  retention: "3600s"
  pending_lease: "120s"
locks:
  inactivity_timeout: "7200s"
breakers:
  default_failure_threshold: 4
  default_cooldown: "15s"
  dependencies:
    - name: document-store
      failure_threshold: 2
      cooldown: "60s"
    - name: notification-gateway
lifecycle:
  resume_sweep_interval: "30s"
observability:
  metrics_enabled: false
)");

  auto config = casetrack::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/casetrack/casetrack.db");
  assert(config.database().sqlite().has_wal_mode() && !config.database().sqlite().wal_mode());
  assert(config.idempotency().retention().seconds() == 3600);
  assert(config.idempotency().pending_lease().seconds() == 120);
  assert(config.locks().inactivity_timeout().seconds() == 7200);
  assert(config.breakers().default_failure_threshold() == 4);
  assert(config.breakers().dependencies_size() == 2);
  assert(config.breakers().dependencies(0).name() == "document-store");
  assert(config.breakers().dependencies(0).failure_threshold() == 2);
  assert(config.breakers().dependencies(1).failure_threshold() == 0);
  assert(config.lifecycle().resume_sweep_interval().seconds() == 30);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto config = casetrack::config::ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "C:\\casetrack\\\"quoted\"\\db.sqlite"
)");
  assert(config.database().sqlite().path() == "C:\\casetrack\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumbersStayStrings() {
  auto config = casetrack::config::ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    conninfo: "12345"
    max_connections: 4
)");
  assert(config.database().has_postgres());
  assert(config.database().postgres().conninfo() == "12345");
  assert(config.database().postgres().max_connections() == 4);
}

void TestMemoryBackend() {
  auto config = casetrack::config::ConfigLoader::LoadFromYamlString(R"(database:
  memory: {}
)");
  assert(config.database().has_memory());
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects(R"(database:
  memory: {}
unknown_field: 123
)") && "ConfigLoader must reject unknown fields.");

  assert(Rejects(R"(locks:
  inactivity_timout: "7200s"
)"));
}

void TestValidationRules() {
  assert(Rejects(R"(database:
  sqlite:
    wal_mode: true
)"));

  assert(Rejects(R"(database:
  postgres:
    max_connections: 4
)"));

  assert(Rejects(R"(locks:
  inactivity_timeout: "-5s"
)"));

  assert(Rejects(R"(breakers:
  dependencies:
    - name: document-store
    - name: document-store
)"));

  assert(Rejects(R"(breakers:
  dependencies:
    - failure_threshold: 2
)"));

  assert(Rejects(R"(idempotency:
  retention: "soon"
)"));
}

void TestDurationFallback() {
  google::protobuf::Duration unset;
  assert(casetrack::config::DurationOr(unset, 2h) == 2h);

  google::protobuf::Duration set;
  set.set_seconds(90);
  set.set_nanos(500'000'000);
  assert(casetrack::config::DurationOr(set, 2h) == 90'500ms);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestMemoryBackend();
  TestUnknownFieldsAreRejected();
  TestValidationRules();
  TestDurationFallback();

  std::cout << "casetrack_unit_config_loader: pass\n";
  return 0;
}
