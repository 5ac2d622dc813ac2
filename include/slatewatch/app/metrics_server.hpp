#pragma once

#include <slatewatch/core/metrics_registry.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace slatewatch::app {

/// Serves GET /metrics in the Prometheus text format on a background thread.
class MetricsServer {
 public:
  explicit MetricsServer(const slatewatch::core::MetricsRegistry& registry);
  ~MetricsServer();

  MetricsServer(const MetricsServer&) = delete;
  MetricsServer& operator=(const MetricsServer&) = delete;

  /// Binds \p host:\p port (port 0 picks a free port) and starts serving.
  /// False if the address cannot be bound.
  [[nodiscard]] bool start(const std::string& host, std::uint16_t port);

  /// Stops serving and joins the thread. Safe to call more than once.
  void stop();

  /// Bound port, 0 when not running.
  [[nodiscard]] std::uint16_t port() const noexcept;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace slatewatch::app
