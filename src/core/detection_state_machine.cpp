#include <slatewatch/core/detection_state_machine.hpp>
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace slatewatch::core {

DetectionStateMachine::DetectionStateMachine(std::string watcher_id,
                                             double threshold,
                                             std::uint32_t debounce_frames,
                                             std::vector<std::string> labels)
    : watcher_id_(std::move(watcher_id)),
      threshold_(threshold),
      debounce_frames_(debounce_frames) {
  if (labels.empty()) {
    throw std::invalid_argument("DetectionStateMachine requires at least one reference label");
  }
  if (debounce_frames_ == 0) {
    throw std::invalid_argument("debounce_frames must be >= 1");
  }
  state_.runs.reserve(labels.size());
  for (auto& label : labels) {
    state_.runs.push_back(ReferenceRun{std::move(label), ScoreSide::None, 0});
  }
}

std::optional<ActionEvent> DetectionStateMachine::observe(
    std::span<const SimilarityScore> scores) {
  if (scores.empty()) return std::nullopt;

  Timestamp latest = scores.front().timestamp;
  for (const auto& score : scores) {
    auto it = std::find_if(state_.runs.begin(), state_.runs.end(),
                           [&](const ReferenceRun& r) { return r.label == score.label; });
    if (it == state_.runs.end()) continue;

    const ScoreSide side = score.value >= threshold_ ? ScoreSide::Above : ScoreSide::Below;
    if (it->side == side) {
      ++it->length;
    } else {
      it->side = side;
      it->length = 1;
    }
    latest = std::max(latest, score.timestamp);
  }

  if (state_.presence != PresenceState::Present && present_confirmed()) {
    return transition_to(PresenceState::Present, latest);
  }
  if (state_.presence != PresenceState::Absent && absent_confirmed()) {
    return transition_to(PresenceState::Absent, latest);
  }
  return std::nullopt;
}

std::optional<ActionEvent> DetectionStateMachine::observe(const SimilarityScore& score) {
  return observe(std::span<const SimilarityScore>(&score, 1));
}

void DetectionStateMachine::reset(PresenceState presence) {
  state_.presence = presence;
  state_.last_transition.reset();
  for (auto& run : state_.runs) {
    run.side = ScoreSide::None;
    run.length = 0;
  }
}

std::uint64_t DetectionStateMachine::run_length(const std::string& label) const {
  for (const auto& run : state_.runs) {
    if (run.label == label) return run.length;
  }
  return 0;
}

bool DetectionStateMachine::present_confirmed() const {
  return std::any_of(state_.runs.begin(), state_.runs.end(), [this](const ReferenceRun& r) {
    return r.side == ScoreSide::Above && r.length >= debounce_frames_;
  });
}

bool DetectionStateMachine::absent_confirmed() const {
  return std::all_of(state_.runs.begin(), state_.runs.end(), [this](const ReferenceRun& r) {
    return r.side == ScoreSide::Below && r.length >= debounce_frames_;
  });
}

std::optional<ActionEvent> DetectionStateMachine::transition_to(PresenceState next,
                                                                Timestamp at) {
  const PresenceState previous = state_.presence;
  state_.presence = next;
  state_.last_transition = at;
  // Startup is not a change.
  if (previous == PresenceState::Unknown) return std::nullopt;

  ActionEvent event;
  event.kind = next == PresenceState::Present ? TransitionKind::AbsentToPresent
                                              : TransitionKind::PresentToAbsent;
  event.watcher_id = watcher_id_;
  event.timestamp = at;
  return event;
}

}  // namespace slatewatch::core
