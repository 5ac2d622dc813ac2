#include <slatewatch/app/metrics_server.hpp>
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <thread>

namespace slatewatch::app {

struct MetricsServer::Impl {
  explicit Impl(const slatewatch::core::MetricsRegistry& r) : registry(r) {}

  const slatewatch::core::MetricsRegistry& registry;
  httplib::Server server;
  std::thread thread;
  std::uint16_t port{0};
};

MetricsServer::MetricsServer(const slatewatch::core::MetricsRegistry& registry)
    : impl_(std::make_unique<Impl>(registry)) {
  impl_->server.Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
    res.set_content(impl_->registry.render_text(), "text/plain; version=0.0.4");
  });
}

MetricsServer::~MetricsServer() { stop(); }

bool MetricsServer::start(const std::string& host, std::uint16_t port) {
  if (impl_->thread.joinable()) return true;

  int bound = port;
  if (port == 0) {
    bound = impl_->server.bind_to_any_port(host);
  } else if (!impl_->server.bind_to_port(host, port)) {
    bound = -1;
  }
  if (bound <= 0) {
    spdlog::error("Metrics endpoint could not bind {}:{}", host, port);
    return false;
  }
  impl_->port = static_cast<std::uint16_t>(bound);
  impl_->thread = std::thread([this] { impl_->server.listen_after_bind(); });
  spdlog::info("Serving metrics on http://{}:{}/metrics", host, impl_->port);
  return true;
}

void MetricsServer::stop() {
  if (!impl_->thread.joinable()) return;
  impl_->server.stop();
  impl_->thread.join();
  impl_->port = 0;
}

std::uint16_t MetricsServer::port() const noexcept { return impl_->port; }

}  // namespace slatewatch::app
