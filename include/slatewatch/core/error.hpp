#pragma once

#include <string_view>

namespace slatewatch::core {

/// Watcher error codes; used with std::expected for recoverable failures.
enum class WatchError {
  None = 0,
  ConfigInvalid,
  SourceUnavailable,
  StreamStalled,
  EndOfStream,
  ScoreComputeError,
  ActionDeliveryError,
  InvalidFrame,
  LoadFailed,
};

/// Stable name for logs and diagnostics.
[[nodiscard]] constexpr std::string_view to_string(WatchError e) noexcept {
  switch (e) {
    case WatchError::None: return "None";
    case WatchError::ConfigInvalid: return "ConfigInvalid";
    case WatchError::SourceUnavailable: return "SourceUnavailable";
    case WatchError::StreamStalled: return "StreamStalled";
    case WatchError::EndOfStream: return "EndOfStream";
    case WatchError::ScoreComputeError: return "ScoreComputeError";
    case WatchError::ActionDeliveryError: return "ActionDeliveryError";
    case WatchError::InvalidFrame: return "InvalidFrame";
    case WatchError::LoadFailed: return "LoadFailed";
  }
  return "Unknown";
}

}  // namespace slatewatch::core
