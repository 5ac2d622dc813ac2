#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace slatewatch::app::detail {

/// An http(s) URL split the way httplib::Client wants it.
struct UrlParts {
  std::string origin;  // scheme://host[:port]
  std::string target;  // path and query, at least "/"
};

/// Nullopt unless \p url is http:// or https:// with a host.
[[nodiscard]] std::optional<UrlParts> split_http_url(std::string_view url);

/// Strips a leading file:// from a reference location.
[[nodiscard]] std::string local_path(std::string_view location);

[[nodiscard]] bool is_http_url(std::string_view url);

}  // namespace slatewatch::app::detail
