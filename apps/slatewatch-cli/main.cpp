/**
 * slatewatch: watch a live video feed for a slate image and call out on changes.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/slatewatch --config watcher.json
 *        ./build/slatewatch slate.jpg http://host/ad-break [--ingest-port 5000]
 */

#include <slatewatch/app/action_dispatcher.hpp>
#include <slatewatch/app/config.hpp>
#include <slatewatch/app/metrics_server.hpp>
#include <slatewatch/app/reference_loader.hpp>
#include <slatewatch/app/watcher.hpp>
#include <slatewatch/core/error.hpp>
#include <slatewatch/core/metrics_registry.hpp>
#include <slatewatch/vision/gst_frame_source.hpp>
#include <slatewatch/vision/reference_matcher.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitSource = 2;

std::atomic<bool> g_shutdown{false};

void signal_handler(int /*signum*/) { g_shutdown.store(true); }

void print_usage(std::ostream &out) {
  out << "Usage: slatewatch --config <file> [options]\n"
      << "       slatewatch <reference_image> <callback_url> [options]\n"
      << "  --config <file>        Watcher configuration (JSON)\n"
      << "  --ingest-port <port>   UDP port for the video feed (single-action mode, default 5000)\n"
      << "  --http-method <m>      Callback method (single-action mode, default POST)\n"
      << "  --payload <body>       Callback body template (single-action mode)\n"
      << "  --metrics-port <port>  Port for GET /metrics, 0 disables (default from config, 3030)\n"
      << "  --log-level <level>    trace | debug | info | warn | error (default info,\n"
      << "                         or SLATEWATCH_LOG_LEVEL)\n"
      << "  --help                 Show this help\n";
}

std::optional<std::uint32_t> parse_port(const std::string &text) {
  try {
    std::size_t used = 0;
    const unsigned long value = std::stoul(text, &used);
    if (used != text.size() || value > 65535) return std::nullopt;
    return static_cast<std::uint32_t>(value);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

void configure_logging(const std::string &level_name) {
  spdlog::set_pattern("%Y-%m-%dT%H:%M:%S.%e %^%-5l%$ [%t] %v");
  const auto level = spdlog::level::from_str(level_name);
  if (level == spdlog::level::off && level_name != "off") {
    spdlog::warn("Unknown log level '{}', using info", level_name);
    spdlog::set_level(spdlog::level::info);
    return;
  }
  spdlog::set_level(level);
}

} // namespace

int main(int argc, char *argv[]) {
  std::string config_path;
  std::vector<std::string> positional;
  std::optional<std::uint32_t> ingest_port;
  std::optional<std::uint32_t> metrics_port;
  std::string http_method = "POST";
  std::string payload;
  std::string log_level = "info";
  if (const char *env = std::getenv("SLATEWATCH_LOG_LEVEL")) log_level = env;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--config" && has_value) {
      config_path = argv[++i];
    } else if ((arg == "--ingest-port" || arg == "-i") && has_value) {
      ingest_port = parse_port(argv[++i]);
      if (!ingest_port) {
        std::cerr << "Invalid --ingest-port value: " << argv[i] << "\n";
        return kExitUsage;
      }
    } else if ((arg == "--http-method" || arg == "-m") && has_value) {
      http_method = argv[++i];
    } else if ((arg == "--payload" || arg == "-p") && has_value) {
      payload = argv[++i];
    } else if (arg == "--metrics-port" && has_value) {
      metrics_port = parse_port(argv[++i]);
      if (!metrics_port) {
        std::cerr << "Invalid --metrics-port value: " << argv[i] << "\n";
        return kExitUsage;
      }
    } else if (arg == "--log-level" && has_value) {
      log_level = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage(std::cout);
      return kExitOk;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown or incomplete option: " << arg << "\n";
      print_usage(std::cerr);
      return kExitUsage;
    } else {
      positional.push_back(arg);
    }
  }

  configure_logging(log_level);

  slatewatch::app::WatcherConfig config;
  if (!config_path.empty()) {
    if (!positional.empty()) {
      std::cerr << "--config cannot be combined with positional arguments\n";
      return kExitUsage;
    }
    auto loaded = slatewatch::app::load_config(config_path);
    if (!loaded) {
      std::cerr << "Invalid configuration " << config_path << ":\n";
      for (const auto &violation : loaded.error().violations) {
        std::cerr << "  - " << violation << "\n";
      }
      return kExitUsage;
    }
    config = std::move(*loaded);
    if (ingest_port) config.source.port = *ingest_port;
  } else if (positional.size() == 2) {
    config = slatewatch::app::single_action_config(positional[0], positional[1],
                                                   ingest_port.value_or(5000), http_method, payload);
  } else {
    print_usage(std::cerr);
    return kExitUsage;
  }
  if (metrics_port) config.metrics_port = *metrics_port;

  // Overrides and single-action mode are validated like a file.
  if (const auto violations = slatewatch::app::validate(config); !violations.empty()) {
    std::cerr << "Invalid configuration:\n";
    for (const auto &violation : violations) {
      std::cerr << "  - " << violation << "\n";
    }
    return kExitUsage;
  }

  auto references = slatewatch::app::load_references(config.references);
  if (!references) {
    std::cerr << "Could not load reference images ("
              << slatewatch::core::to_string(references.error()) << ")\n";
    return kExitUsage;
  }

  slatewatch::core::MetricsRegistry registry;
  slatewatch::vision::GstFrameSource source;
  slatewatch::app::HttpActionTransport transport;

  std::optional<slatewatch::app::Watcher> watcher;
  try {
    watcher.emplace(config, source,
                    slatewatch::vision::ReferenceMatcher(std::move(*references)), transport,
                    registry);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitUsage;
  }

  slatewatch::app::MetricsServer metrics_server(registry);
  if (config.metrics_port != 0 &&
      !metrics_server.start("0.0.0.0", static_cast<std::uint16_t>(config.metrics_port))) {
    std::cerr << "Could not serve metrics on port " << config.metrics_port << "\n";
    return kExitUsage;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  std::atomic<bool> finished{false};
  std::thread signal_watcher([&] {
    while (!finished.load()) {
      if (g_shutdown.load()) {
        spdlog::info("Shutdown requested");
        watcher->stop();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  const auto result = watcher->run();
  finished.store(true);
  signal_watcher.join();
  metrics_server.stop();

  if (!result) {
    std::cerr << "Watcher " << config.id << " failed: "
              << slatewatch::core::to_string(result.error()) << "\n";
    return result.error() == slatewatch::core::WatchError::SourceUnavailable ? kExitSource
                                                                               : kExitUsage;
  }
  return kExitOk;
}
