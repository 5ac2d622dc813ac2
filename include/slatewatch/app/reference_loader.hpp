#pragma once

#include <slatewatch/app/config.hpp>
#include <slatewatch/core/error.hpp>
#include <slatewatch/core/frame.hpp>
#include <slatewatch/vision/reference_matcher.hpp>
#include <chrono>
#include <expected>
#include <string>
#include <vector>

namespace slatewatch::app {

/// Loads one reference image from a plain path, a file:// URL or an http(s):// URL.
/// Remote images are downloaded and decoded in memory. LoadFailed on any failure.
[[nodiscard]] std::expected<slatewatch::core::Frame, slatewatch::core::WatchError> load_reference(
    const std::string& location,
    std::chrono::milliseconds timeout = std::chrono::seconds{10});

/// Loads every configured reference, in order. Fails on the first reference that cannot be loaded.
[[nodiscard]] std::expected<std::vector<slatewatch::vision::ReferenceImage>,
                            slatewatch::core::WatchError>
load_references(const std::vector<ReferenceDescriptor>& references);

}  // namespace slatewatch::app
