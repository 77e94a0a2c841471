#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/sweep/reliability_sweep.hpp"
#if CREDITGATE_WITH_GRPC
#include "internal/runtime/server.hpp"
#endif

using creditgate::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

void ShutdownObservability() {
  creditgate::observability::ShutdownLogging();
  creditgate::observability::ShutdownMetrics();
  creditgate::observability::ShutdownTracing();
}

int SweepOnce(creditgate::factory::Application& app) {
  creditgate::sweep::SweepOptions options;
  options.force = true;
  options.mode  = "cli";

  const auto summary = app.context.sweep->Run(options);

  std::string                             json;
  google::protobuf::util::JsonPrintOptions print;
  print.add_whitespace                = true;
  print.always_print_primitive_fields = true;
  print.preserve_proto_field_names    = true;
  const auto status                   = google::protobuf::util::MessageToJsonString(summary, &json, print);
  if (!status.ok()) {
    throw std::runtime_error("sweep summary encode: " + status.ToString());
  }
  std::cout << json << std::endl;
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  bool        sweep_once = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--sweep-once") {
      sweep_once = true;
    } else if (config_path.empty() && arg.rfind("--", 0) != 0) {
      config_path = arg;
    } else {
      config_path.clear();
      break;
    }
  }
  if (config_path.empty()) {
    std::cerr << "Usage: creditgate --config <config.yaml> [--sweep-once]" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = creditgate::config::ConfigLoader::LoadFromYaml(config_path);

    creditgate::observability::InitializeTracing(config);
    creditgate::observability::InitializeMetrics(config);
    creditgate::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = creditgate::factory::Build(config);

    if (sweep_once) {
      const int rc = SweepOnce(app);
      ShutdownObservability();
      return rc;
    }

    // Register signal handlers before starting anything to avoid a race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

#if CREDITGATE_WITH_GRPC
    creditgate::runtime::Server server(config.server().bind_address().empty() ? "0.0.0.0:50061" : config.server().bind_address(),
                                       std::move(app.grpc_services));
    server.Start();
#else
    CREDITGATE_LOG_WARN("built without gRPC; running background loops only");
#endif
    app.StartBackground();
    CREDITGATE_LOG_INFO("creditgate started", {StringField("config", config_path)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    CREDITGATE_LOG_INFO("Shutting down creditgate");

    app.StopBackground();
#if CREDITGATE_WITH_GRPC
    server.Stop();
#endif
    ShutdownObservability();
  } catch (const std::exception& e) {
    CREDITGATE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
