#include "url_utils.hpp"

namespace slatewatch::app::detail {

namespace {

constexpr std::string_view kFileScheme = "file://";

bool starts_with(std::string_view s, std::string_view prefix) {
  return s.substr(0, prefix.size()) == prefix;
}

}  // namespace

bool is_http_url(std::string_view url) {
  return starts_with(url, "http://") || starts_with(url, "https://");
}

std::optional<UrlParts> split_http_url(std::string_view url) {
  if (!is_http_url(url)) return std::nullopt;
  const auto scheme_end = url.find("://") + 3;
  const auto path_start = url.find_first_of("/?", scheme_end);
  const std::string_view origin = url.substr(0, path_start);
  if (origin.size() <= scheme_end) return std::nullopt;

  UrlParts parts;
  parts.origin = std::string(origin);
  if (path_start == std::string_view::npos) {
    parts.target = "/";
  } else if (url[path_start] == '?') {
    parts.target = "/" + std::string(url.substr(path_start));
  } else {
    parts.target = std::string(url.substr(path_start));
  }
  return parts;
}

std::string local_path(std::string_view location) {
  if (starts_with(location, kFileScheme)) location.remove_prefix(kFileScheme.size());
  return std::string(location);
}

}  // namespace slatewatch::app::detail
