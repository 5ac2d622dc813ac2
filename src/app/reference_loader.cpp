#include <slatewatch/app/reference_loader.hpp>
#include <slatewatch/vision/load_image.hpp>
#include "url_utils.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <cstddef>
#include <span>

namespace slatewatch::app {

namespace sc = slatewatch::core;

namespace {

std::expected<sc::Frame, sc::WatchError> download(const std::string& url,
                                                  std::chrono::milliseconds timeout) {
  const auto parts = detail::split_http_url(url);
  if (!parts) return std::unexpected(sc::WatchError::LoadFailed);

  httplib::Client client(parts->origin);
  if (!client.is_valid()) {
    spdlog::error("Cannot create HTTP client for {}", parts->origin);
    return std::unexpected(sc::WatchError::LoadFailed);
  }
  client.set_connection_timeout(timeout);
  client.set_read_timeout(timeout);
  client.set_follow_location(true);

  auto res = client.Get(parts->target);
  if (!res) {
    spdlog::error("Downloading reference {} failed: {}", url, httplib::to_string(res.error()));
    return std::unexpected(sc::WatchError::LoadFailed);
  }
  if (res->status < 200 || res->status >= 300) {
    spdlog::error("Downloading reference {} failed with HTTP {}", url, res->status);
    return std::unexpected(sc::WatchError::LoadFailed);
  }
  const auto bytes = std::as_bytes(std::span(res->body.data(), res->body.size()));
  return slatewatch::vision::decode_frame_from_bytes(bytes);
}

}  // namespace

std::expected<sc::Frame, sc::WatchError> load_reference(const std::string& location,
                                                        std::chrono::milliseconds timeout) {
  if (detail::is_http_url(location)) return download(location, timeout);
  return slatewatch::vision::load_frame_from_image(detail::local_path(location));
}

std::expected<std::vector<slatewatch::vision::ReferenceImage>, sc::WatchError> load_references(
    const std::vector<ReferenceDescriptor>& references) {
  std::vector<slatewatch::vision::ReferenceImage> images;
  images.reserve(references.size());
  for (const auto& r : references) {
    auto frame = load_reference(r.path);
    if (!frame) {
      spdlog::error("Could not load reference '{}' from {}", r.label, r.path);
      return std::unexpected(frame.error());
    }
    spdlog::info("Loaded reference '{}' ({}x{}) from {}", r.label, frame->width(), frame->height(),
                 r.path);
    images.push_back(slatewatch::vision::ReferenceImage{r.label, std::move(*frame)});
  }
  return images;
}

}  // namespace slatewatch::app
