#include <slatewatch/app/watcher.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace slatewatch::app {

namespace sc = slatewatch::core;

namespace {

constexpr std::chrono::milliseconds kMaxReconnectBackoff{30000};

}  // namespace

Watcher::Watcher(WatcherConfig config,
                 sc::IFrameSource& source,
                 slatewatch::vision::ReferenceMatcher matcher,
                 IActionTransport& transport,
                 sc::MetricsRegistry& registry)
    : config_(std::move(config)),
      source_(source),
      matcher_(std::move(matcher)),
      registry_(registry),
      metrics_(registry, matcher_.labels()),
      state_machine_(config_.id, config_.threshold, config_.debounce_frames, matcher_.labels()),
      dispatcher_(config_.actions, transport, metrics_, config_.dispatch) {}

Watcher::~Watcher() {
  stop();
  dispatcher_.shutdown(std::chrono::milliseconds{0});
}

void Watcher::stop() {
  {
    std::lock_guard lock(stop_mu_);
    stop_requested_.store(true);
  }
  stop_cv_.notify_all();
  source_.close();
}

bool Watcher::sleep_unless_stopped(std::chrono::milliseconds wait) {
  std::unique_lock lock(stop_mu_);
  return !stop_cv_.wait_for(lock, wait, [this] { return stop_requested_.load(); });
}

std::expected<void, sc::WatchError> Watcher::open_source() {
  const auto& s = config_.source;
  auto backoff = std::chrono::milliseconds(s.reconnect_backoff_ms);
  for (std::uint32_t attempt = 0;; ++attempt) {
    if (stop_requested_.load()) return std::unexpected(sc::WatchError::EndOfStream);
    auto opened = source_.open(s);
    if (opened) {
      // A stop() racing with open() must still wake the first next_frame().
      if (stop_requested_.load()) source_.close();
      if (attempt > 0) spdlog::info("Reconnected to {} after {} attempt(s)", source_.describe(), attempt);
      return {};
    }
    if (attempt >= s.max_reconnect_attempts) {
      spdlog::error("Source {} unavailable after {} attempt(s)", source_.describe(), attempt + 1);
      return std::unexpected(sc::WatchError::SourceUnavailable);
    }
    spdlog::warn("Source {} unavailable; retrying in {} ms ({}/{})", source_.describe(),
                 backoff.count(), attempt + 1, s.max_reconnect_attempts);
    if (!sleep_unless_stopped(backoff)) return std::unexpected(sc::WatchError::EndOfStream);
    backoff = std::min(backoff * 2, kMaxReconnectBackoff);
  }
}

std::expected<void, sc::WatchError> Watcher::run() {
  spdlog::info("Watcher {} ({}) starting: {} reference(s), threshold {}, debounce {}", config_.id,
               config_.description, matcher_.size(), config_.threshold, config_.debounce_frames);

  auto opened = open_source();
  if (!opened) {
    finish();
    if (opened.error() == sc::WatchError::EndOfStream) return {};
    return std::unexpected(opened.error());
  }

  const auto stall_timeout = std::chrono::milliseconds(config_.source.stall_timeout_ms);
  bool stalled = false;
  std::expected<void, sc::WatchError> outcome;

  while (!stop_requested_.load()) {
    auto frame = source_.next_frame(stall_timeout);
    if (frame) {
      if (stalled) {
        spdlog::info("Stream {} resumed", source_.describe());
        stalled = false;
      }
      process(*frame);
      continue;
    }

    const sc::WatchError error = frame.error();
    if (error == sc::WatchError::StreamStalled) {
      if (!stalled) {
        metrics_.stream_stalls.inc();
        spdlog::warn("No frame from {} within {} ms", source_.describe(), stall_timeout.count());
        stalled = true;
      }
      continue;
    }
    if (error == sc::WatchError::EndOfStream) {
      if (!stop_requested_.load()) spdlog::info("Stream {} ended", source_.describe());
      break;
    }

    spdlog::warn("Source {} failed: {}", source_.describe(), sc::to_string(error));
    last_sequence_.reset();
    auto reopened = open_source();
    if (!reopened) {
      if (reopened.error() != sc::WatchError::EndOfStream) outcome = std::unexpected(reopened.error());
      break;
    }
  }

  finish();
  return outcome;
}

void Watcher::process(const sc::Frame& frame) {
  if (last_sequence_ && frame.sequence() > *last_sequence_ + 1) {
    metrics_.frames_dropped.inc(frame.sequence() - *last_sequence_ - 1);
  }
  last_sequence_ = frame.sequence();

  const auto interval = std::chrono::milliseconds(config_.sampling_interval_ms);
  if (interval.count() > 0 && last_scored_) {
    const auto since = frame.timestamp() - *last_scored_;
    // A wall clock stepped backwards restarts the cadence.
    if (since >= sc::Timestamp::duration::zero() && since < interval) return;
  }

  const auto started = std::chrono::steady_clock::now();
  auto scores = matcher_.score(frame);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  metrics_.scoring_latency.observe(std::chrono::duration<double>(elapsed).count());

  if (!scores) {
    metrics_.frames_dropped.inc();
    spdlog::debug("Frame {} skipped: {}", frame.sequence(), sc::to_string(scores.error()));
    return;
  }
  last_scored_ = frame.timestamp();
  if (interval.count() > 0 && elapsed > interval) {
    metrics_.scoring_overruns.inc();
    metrics_.frames_dropped.inc();
    spdlog::debug("Frame {} scored late ({} us)", frame.sequence(),
                  std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
    return;
  }

  metrics_.frames_processed.inc();
  bool matched = false;
  for (const auto& s : *scores) {
    if (auto* gauge = metrics_.last_score(s.label)) gauge->set(s.value);
    matched = matched || s.value >= config_.threshold;
    spdlog::trace("Frame {} vs '{}': {:.4f}", frame.sequence(), s.label, s.value);
  }
  (matched ? metrics_.slate_found : metrics_.content_found).inc();

  const sc::PresenceState before = state_machine_.presence();
  auto event = state_machine_.observe(*scores);
  metrics_.set_state(state_machine_.presence());

  if (event) {
    spdlog::info("Watcher {}: {} -> {}", config_.id, sc::to_string(event->previous_state()),
                 sc::to_string(event->new_state()));
    dispatcher_.submit(*event);
  } else if (before != state_machine_.presence()) {
    spdlog::info("Watcher {}: initial state {}", config_.id, sc::to_string(state_machine_.presence()));
  }
}

void Watcher::finish() {
  source_.close();
  dispatcher_.shutdown(std::chrono::milliseconds(config_.shutdown_grace_ms));
  spdlog::info(
      "Watcher {} stopped: state={} frames_processed={} frames_dropped={} stream_stalls={} "
      "actions_sent={} actions_failed={}",
      config_.id, sc::to_string(state_machine_.presence()), metrics_.frames_processed.value(),
      metrics_.frames_dropped.value(), metrics_.stream_stalls.value(), metrics_.actions_sent.value(),
      metrics_.actions_failed.value());
  spdlog::debug("Final metrics:\n{}", registry_.render_text());
}

}  // namespace slatewatch::app
