#pragma once

#include <slatewatch/core/frame.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace slatewatch::core {

/// Debounced presence of the reference image in the stream.
enum class PresenceState : std::int8_t {
  Unknown = -1,
  Absent = 0,
  Present = 1,
};

[[nodiscard]] constexpr std::string_view to_string(PresenceState s) noexcept {
  switch (s) {
    case PresenceState::Absent: return "absent";
    case PresenceState::Present: return "present";
    case PresenceState::Unknown:
    default: return "unknown";
  }
}

/// Similarity of one frame to one reference, in [0, 1].
struct SimilarityScore {
  Timestamp timestamp{};
  std::string label;
  double value{0.0};
};

enum class TransitionKind : std::uint8_t {
  AbsentToPresent,
  PresentToAbsent,
};

/// A confirmed presence change, created at most once per real transition.
struct ActionEvent {
  TransitionKind kind{TransitionKind::AbsentToPresent};
  std::string watcher_id;
  Timestamp timestamp{};

  [[nodiscard]] PresenceState new_state() const noexcept {
    return kind == TransitionKind::AbsentToPresent ? PresenceState::Present
                                                   : PresenceState::Absent;
  }
  [[nodiscard]] PresenceState previous_state() const noexcept {
    return kind == TransitionKind::AbsentToPresent ? PresenceState::Absent
                                                   : PresenceState::Present;
  }
};

}  // namespace slatewatch::core
