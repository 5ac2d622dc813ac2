#include <slatewatch/app/action_dispatcher.hpp>
#include "url_utils.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <string_view>
#include <utility>

namespace slatewatch::app {

namespace sc = slatewatch::core;

namespace {

bool iequals(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::tolower(x) == std::tolower(y);
         });
}

void replace_all(std::string& text, std::string_view token, std::string_view value) {
  std::size_t pos = 0;
  while ((pos = text.find(token, pos)) != std::string::npos) {
    text.replace(pos, token.size(), value);
    pos += value.size();
  }
}

// Value as the inside of a JSON string literal.
std::string json_escaped(std::string_view value) {
  const std::string quoted = nlohmann::json(std::string(value))
                                 .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return quoted.substr(1, quoted.size() - 2);
}

}  // namespace

std::expected<void, sc::WatchError> HttpActionTransport::deliver(const ActionTarget& target,
                                                                 const std::string& body,
                                                                 std::chrono::milliseconds timeout) {
  const auto parts = detail::split_http_url(target.url);
  if (!parts) return std::unexpected(sc::WatchError::ActionDeliveryError);

  httplib::Client client(parts->origin);
  if (!client.is_valid()) {
    spdlog::warn("No HTTP client available for {}", parts->origin);
    return std::unexpected(sc::WatchError::ActionDeliveryError);
  }
  client.set_connection_timeout(timeout);
  client.set_read_timeout(timeout);
  client.set_write_timeout(timeout);
  if (target.auth) client.set_basic_auth(target.auth->username, target.auth->password);

  std::string content_type = "application/json";
  httplib::Headers headers;
  for (const auto& [name, value] : target.headers) {
    if (iequals(name, "Content-Type")) {
      content_type = value;
    } else {
      headers.emplace(name, value);
    }
  }

  const std::string& method = target.method;
  auto res = [&]() {
    if (method == "GET") return client.Get(parts->target, headers);
    if (method == "PUT") return client.Put(parts->target, headers, body, content_type);
    if (method == "PATCH") return client.Patch(parts->target, headers, body, content_type);
    if (method == "DELETE") return client.Delete(parts->target, headers, body, content_type);
    return client.Post(parts->target, headers, body, content_type);
  }();

  if (!res) {
    spdlog::debug("{} {} failed: {}", method, target.url, httplib::to_string(res.error()));
    return std::unexpected(sc::WatchError::ActionDeliveryError);
  }
  if (res->status < 200 || res->status >= 300) {
    spdlog::debug("{} {} returned HTTP {}", method, target.url, res->status);
    return std::unexpected(sc::WatchError::ActionDeliveryError);
  }
  return {};
}

std::string format_timestamp(sc::Timestamp ts) {
  const auto since_epoch = ts.time_since_epoch();
  const auto secs = std::chrono::floor<std::chrono::seconds>(since_epoch);
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - secs);
  const std::time_t t = static_cast<std::time_t>(secs.count());
  std::tm utc{};
  gmtime_r(&t, &utc);
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", utc.tm_year + 1900, utc.tm_mon + 1,
                     utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec, millis.count());
}

std::string render_payload(const ActionTarget& target, const sc::ActionEvent& event) {
  const std::string state(sc::to_string(event.new_state()));
  const std::string timestamp = format_timestamp(event.timestamp);
  if (target.payload_template.empty()) {
    const nlohmann::json body = {
        {"watcher_id", event.watcher_id},
        {"state", state},
        {"timestamp", timestamp},
    };
    return body.dump();
  }
  std::string body = target.payload_template;
  replace_all(body, "{{watcher_id}}", json_escaped(event.watcher_id));
  replace_all(body, "{{state}}", json_escaped(state));
  replace_all(body, "{{previous_state}}", json_escaped(sc::to_string(event.previous_state())));
  replace_all(body, "{{timestamp}}", json_escaped(timestamp));
  return body;
}

bool triggers_on(ActionTrigger on, sc::TransitionKind kind) noexcept {
  switch (on) {
    case ActionTrigger::Any: return true;
    case ActionTrigger::Present: return kind == sc::TransitionKind::AbsentToPresent;
    case ActionTrigger::Absent: return kind == sc::TransitionKind::PresentToAbsent;
  }
  return false;
}

ActionDispatcher::ActionDispatcher(std::vector<ActionTarget> targets,
                                   IActionTransport& transport,
                                   sc::WatcherMetrics& metrics,
                                   DispatchSettings settings)
    : targets_(std::move(targets)),
      transport_(transport),
      metrics_(metrics),
      last_success_(targets_.size()) {
  const std::uint32_t workers = std::max<std::uint32_t>(settings.workers, 1);
  queue_.set_capacity(static_cast<std::ptrdiff_t>(std::max<std::uint32_t>(settings.queue_capacity, 1)));
  workers_.reserve(workers);
  for (std::uint32_t i = 0; i < workers; ++i) {
    workers_.emplace_back([this] { worker_loop(); });
  }
  spdlog::debug("Action dispatcher started: {} target(s), {} worker(s), queue capacity {}",
                targets_.size(), workers, settings.queue_capacity);
}

ActionDispatcher::~ActionDispatcher() { shutdown(std::chrono::milliseconds{0}); }

std::size_t ActionDispatcher::submit(const sc::ActionEvent& event) {
  if (!accepting_.load()) {
    spdlog::warn("Dispatcher is shutting down; dropping {} event",
                 sc::to_string(event.new_state()));
    return 0;
  }
  std::size_t queued = 0;
  for (std::size_t i = 0; i < targets_.size(); ++i) {
    if (!triggers_on(targets_[i].on, event.kind)) continue;
    bool queued_job = false;
    {
      // Tickets stay contiguous: one is consumed only by a job that made it into the queue.
      std::lock_guard lock(mu_);
      queued_job = queue_.try_push(Job{i, event, false, next_ticket_});
      if (queued_job) {
        ++next_ticket_;
        ++pending_;
      }
    }
    if (!queued_job) {
      metrics_.actions_failed.inc();
      spdlog::error("Action queue full; dropping '{}' for {}", targets_[i].description,
                    targets_[i].url);
      continue;
    }
    ++queued;
  }
  return queued;
}

void ActionDispatcher::worker_loop() {
  for (;;) {
    Job job;
    queue_.pop(job);
    if (job.stop) return;
    run(job);
    finish_job();
  }
}

void ActionDispatcher::run(const Job& job) {
  const ActionTarget& target = targets_[job.target];
  if (!wait_turn(job.ticket)) {
    metrics_.actions_failed.inc();
    spdlog::warn("Action '{}' aborted by shutdown before delivery", target.description);
    return;
  }

  if (target.cooldown_ms > 0) {
    std::lock_guard lock(mu_);
    const auto& last = last_success_[job.target];
    if (last && std::chrono::steady_clock::now() - *last <
                    std::chrono::milliseconds(target.cooldown_ms)) {
      spdlog::info("Action '{}' skipped: last call was less than {} ms ago", target.description,
                   target.cooldown_ms);
      ++next_start_;
      cv_.notify_all();
      return;
    }
  }

  const std::string body = render_payload(target, job.event);
  const auto timeout = std::chrono::milliseconds(target.retry.timeout_ms);
  const std::uint32_t attempts = target.retry.max_retries + 1;

  for (std::uint32_t attempt = 0; attempt < attempts; ++attempt) {
    if (attempt > 0) {
      metrics_.action_retries.inc();
      const auto wait = target.retry.backoff(attempt - 1);
      spdlog::debug("Retrying '{}' in {} ms (attempt {}/{})", target.description, wait.count(),
                    attempt + 1, attempts);
      if (!wait_backoff(wait)) {
        metrics_.actions_failed.inc();
        spdlog::warn("Action '{}' to {} aborted by shutdown after {} attempt(s)",
                     target.description, target.url, attempt);
        return;
      }
    }

    if (attempt == 0) pass_turn();
    const auto started = std::chrono::steady_clock::now();
    auto result = transport_.deliver(target, body, timeout);
    metrics_.action_duration.observe(
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());

    if (result) {
      metrics_.actions_sent.inc();
      {
        std::lock_guard lock(mu_);
        last_success_[job.target] = std::chrono::steady_clock::now();
      }
      spdlog::info("Action '{}' delivered to {} ({} {})", target.description, target.url,
                   job.event.watcher_id, sc::to_string(job.event.new_state()));
      return;
    }
    spdlog::debug("Attempt {}/{} for '{}' failed: {}", attempt + 1, attempts, target.description,
                  sc::to_string(result.error()));
  }

  metrics_.actions_failed.inc();
  spdlog::error("Action '{}' to {} failed after {} attempt(s): {}", target.description, target.url,
                attempts, sc::to_string(sc::WatchError::ActionDeliveryError));
}

bool ActionDispatcher::wait_backoff(std::chrono::milliseconds wait) {
  std::unique_lock lock(mu_);
  return !cv_.wait_for(lock, wait, [this] { return aborting_.load(); });
}

bool ActionDispatcher::wait_turn(std::uint64_t ticket) {
  std::unique_lock lock(mu_);
  cv_.wait(lock, [&] { return next_start_ == ticket || aborting_.load(); });
  return !aborting_.load();
}

void ActionDispatcher::pass_turn() {
  {
    std::lock_guard lock(mu_);
    ++next_start_;
  }
  cv_.notify_all();
}

void ActionDispatcher::finish_job() {
  {
    std::lock_guard lock(mu_);
    --pending_;
  }
  cv_.notify_all();
}

std::size_t ActionDispatcher::pending() const {
  std::lock_guard lock(mu_);
  return pending_;
}

void ActionDispatcher::shutdown(std::chrono::milliseconds grace) {
  if (joined_) return;
  accepting_.store(false);

  {
    std::unique_lock lock(mu_);
    if (!cv_.wait_for(lock, grace, [this] { return pending_ == 0; })) {
      spdlog::warn("Shutdown grace period expired with {} action job(s) pending", pending_);
    }
  }

  {
    std::lock_guard lock(mu_);
    aborting_.store(true);
  }
  cv_.notify_all();

  Job leftover;
  while (queue_.try_pop(leftover)) {
    if (leftover.stop) continue;
    metrics_.actions_failed.inc();
    spdlog::warn("Action '{}' dropped at shutdown", targets_[leftover.target].description);
    finish_job();
  }

  // Workers exit on the sentinel; capacity is freed as they consume them.
  for (std::size_t i = 0; i < workers_.size(); ++i) {
    queue_.push(Job{0, {}, true});
  }
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  joined_ = true;
  spdlog::debug("Action dispatcher stopped");
}

}  // namespace slatewatch::app
