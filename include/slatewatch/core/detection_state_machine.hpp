#pragma once

#include <slatewatch/core/detection.hpp>
#include <slatewatch/core/frame.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace slatewatch::core {

/// Side of the threshold a score falls on. A score equal to the threshold is Above.
enum class ScoreSide : std::uint8_t { None, Above, Below };

/// Consecutive same-side scores seen for one reference.
struct ReferenceRun {
  std::string label;
  ScoreSide side{ScoreSide::None};
  std::uint64_t length{0};
};

/// Owned by DetectionStateMachine; read-only to everyone else.
struct DetectionState {
  PresenceState presence{PresenceState::Unknown};
  std::vector<ReferenceRun> runs;
  std::optional<Timestamp> last_transition;
};

/// Converts a noisy score stream into debounced presence transitions.
///
/// Hysteresis: a score on the opposite side of the current run restarts that
/// run at 1. Present is confirmed once any reference's above-run reaches
/// debounce_frames; Absent once every reference's below-run has. The first
/// confirmation out of Unknown sets the state without an event; every later
/// change yields exactly one ActionEvent.
/// Thread-safety: single writer; not synchronized.
class DetectionStateMachine {
 public:
  DetectionStateMachine(std::string watcher_id,
                        double threshold,
                        std::uint32_t debounce_frames,
                        std::vector<std::string> labels);

  /// Feeds the scores of one frame. Scores for unknown labels are ignored.
  [[nodiscard]] std::optional<ActionEvent> observe(
      std::span<const SimilarityScore> scores);

  /// Single-score convenience for one-reference watchers.
  [[nodiscard]] std::optional<ActionEvent> observe(const SimilarityScore& score);

  /// Forces a presence state and clears all runs (startup and tests).
  void reset(PresenceState presence = PresenceState::Unknown);

  [[nodiscard]] const DetectionState& state() const noexcept { return state_; }
  [[nodiscard]] PresenceState presence() const noexcept { return state_.presence; }
  [[nodiscard]] double threshold() const noexcept { return threshold_; }
  [[nodiscard]] std::uint32_t debounce_frames() const noexcept { return debounce_frames_; }

  /// Run length for \p label, 0 if unknown.
  [[nodiscard]] std::uint64_t run_length(const std::string& label) const;

 private:
  [[nodiscard]] bool present_confirmed() const;
  [[nodiscard]] bool absent_confirmed() const;
  [[nodiscard]] std::optional<ActionEvent> transition_to(PresenceState next, Timestamp at);

  std::string watcher_id_;
  double threshold_;
  std::uint32_t debounce_frames_;
  DetectionState state_;
};

}  // namespace slatewatch::core
