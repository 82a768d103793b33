#include "genflow/app/application.hpp"
#include "genflow/provider/generation.hpp"
#include "genflow/util/log.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <string_view>

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
}

void print_usage(const char* prog) {
  std::println("genflow - resilient task orchestration for generation providers");
  std::println("Usage: {} [OPTIONS]", prog);
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>     Config file (YAML)");
  std::println("  -p, --provider <id>     Provider to submit the request to");
  std::println("  -r, --request <file>    Generation request (JSON)");
  std::println("  --check                 Validate the config, print it and exit");
  std::println("  --log-level <level>     trace, debug, info, warn or error");
  std::println("  -v, --version           Show version and exit");
  std::println("  -h, --help              Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} -c genflow.yaml --check", prog);
  std::println("  {} -c genflow.yaml -p luma -r request.json", prog);
}

void print_version() {
  std::println("genflow v0.1.0");
}

struct Options {
  std::string config_file;
  std::string provider;
  std::string request_file;
  std::string log_level;
  bool check = false;
};

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  auto value_of = [&](int& i, std::string_view flag) -> std::string {
    if (++i >= argc) {
      std::println(stderr, "Error: {} requires an argument", flag);
      std::exit(1);
    }
    return argv[i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = value_of(i, arg);
    } else if (arg == "-p" || arg == "--provider") {
      opts.provider = value_of(i, arg);
    } else if (arg == "-r" || arg == "--request") {
      opts.request_file = value_of(i, arg);
    } else if (arg == "--log-level") {
      opts.log_level = value_of(i, arg);
    } else if (arg == "--check") {
      opts.check = true;
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

auto print_snapshot(const genflow::TaskSnapshot& snapshot) -> void {
  const auto& last = snapshot.history.back();
  std::println("[{}] {} attempt={} {}", snapshot.id, snapshot.status,
               snapshot.attempt, last.note);
}

// Submits one request and follows it to a terminal state. SIGINT cancels
// the task instead of abandoning it.
auto run_request(genflow::Application& app, const Options& opts) -> int {
  auto request = genflow::load_generation_request(opts.request_file);
  if (!request) {
    std::println(stderr, "Error: Failed to load request {}: {}",
                 opts.request_file, request.error().message());
    return 1;
  }

  auto& orchestrator = app.orchestrator();
  auto id = orchestrator.submit(genflow::ProviderId{opts.provider},
                                std::move(*request));
  if (!id) {
    std::println(stderr, "Error: Submit to {} rejected: {}", opts.provider,
                 id.error().message());
    return 1;
  }

  auto updates = orchestrator.subscribe(*id);
  if (!updates) {
    std::println(stderr, "Error: Cannot follow task {}: {}", *id,
                 updates.error().message());
    return 1;
  }

  bool cancel_sent = false;
  std::optional<genflow::TaskSnapshot> last;
  while (!updates->done()) {
    if (!cancel_sent && g_shutdown_requested.load(std::memory_order_acquire)) {
      genflow::log::info("Received shutdown signal, cancelling {}", *id);
      if (auto r = orchestrator.cancel(*id); !r) {
        genflow::log::warn("Cancel of {} failed: {}", *id, r.error().message());
      }
      cancel_sent = true;
    }
    if (auto snapshot = updates->next_for(std::chrono::milliseconds(100))) {
      print_snapshot(*snapshot);
      last = std::move(snapshot);
    }
  }

  if (!last || !last->terminal()) {
    std::println(stderr, "Error: Task {} ended without a final state", *id);
    return 1;
  }
  if (last->status == genflow::TaskStatus::Succeeded && last->result) {
    std::println("{}", last->result->uri);
    return 0;
  }
  if (last->last_error) {
    std::println(stderr, "Task {} {}: {}: {}", *id, last->status,
                 last->last_error->kind, last->last_error->message);
  }
  return last->status == genflow::TaskStatus::Cancelled ? 130 : 1;
}

auto run(const Options& opts) -> int {
  if (opts.config_file.empty()) {
    std::println(stderr, "Error: Config file required. Use -c <file>");
    return 1;
  }
  if (!std::filesystem::exists(opts.config_file)) {
    std::println(stderr, "Error: Config file not found: {}", opts.config_file);
    return 1;
  }

  genflow::Application app;
  if (auto r = app.load_config(opts.config_file); !r) {
    std::println(stderr, "Error: Failed to load config: {}",
                 r.error().message());
    return 1;
  }

  auto level = opts.log_level.empty() ? app.config().logging.level
                                      : opts.log_level;
  if (!genflow::log::set_level(level)) {
    std::println(stderr, "Error: Unknown log level: {}", level);
    return 1;
  }

  if (opts.check) {
    app.print_providers();
    std::print("{}", genflow::ConfigLoader::to_string(app.config()));
    return 0;
  }

  if (opts.provider.empty() || opts.request_file.empty()) {
    std::println(stderr, "Error: --provider and --request are required");
    return 1;
  }

  genflow::log::start();
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  int rc = 1;
  if (auto r = app.start(); !r) {
    std::println(stderr, "Error: Failed to start: {}", r.error().message());
  } else {
    rc = run_request(app, opts);
  }

  app.stop();
  genflow::log::stop();
  return rc;
}

}  // namespace

int main(int argc, char* argv[]) {
  return run(parse_args(argc, argv));
}
