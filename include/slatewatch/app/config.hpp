#pragma once

#include <slatewatch/core/error.hpp>
#include <slatewatch/core/source_descriptor.hpp>
#include <nlohmann/json_fwd.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace slatewatch::app {

/// Which confirmed transitions an action target reacts to.
enum class ActionTrigger : std::uint8_t {
  Present,  // absent -> present
  Absent,   // present -> absent
  Any,
};

[[nodiscard]] std::string_view to_string(ActionTrigger trigger) noexcept;

/// Bounded retry with exponential backoff for one action target.
/// max_retries counts re-attempts after the first try.
struct RetryPolicy {
  std::uint32_t max_retries{3};
  std::uint32_t timeout_ms{2000};
  std::uint32_t initial_backoff_ms{200};
  std::uint32_t max_backoff_ms{5000};

  /// Wait before re-attempt \p retry (0-based): min(initial * 2^retry, max).
  [[nodiscard]] std::chrono::milliseconds backoff(std::uint32_t retry) const noexcept;

  bool operator==(const RetryPolicy&) const = default;
};

struct BasicAuth {
  std::string username;
  std::string password;

  bool operator==(const BasicAuth&) const = default;
};

/// One external endpoint notified on presence changes.
struct ActionTarget {
  std::string description;
  std::string url;
  std::string method{"POST"};
  ActionTrigger on{ActionTrigger::Present};
  std::map<std::string, std::string> headers;
  std::optional<BasicAuth> auth;
  /// Request body; empty means the default JSON {watcher_id, state, timestamp}.
  std::string payload_template;
  /// Minimum interval between successful calls, 0 disables.
  std::uint32_t cooldown_ms{0};
  RetryPolicy retry;

  bool operator==(const ActionTarget&) const = default;
};

struct ReferenceDescriptor {
  std::string path;  // local path, file://, http:// or https://
  std::string label;

  bool operator==(const ReferenceDescriptor&) const = default;
};

struct DispatchSettings {
  std::uint32_t workers{4};
  std::uint32_t queue_capacity{32};

  bool operator==(const DispatchSettings&) const = default;
};

/// Validated, immutable description of one watcher.
struct WatcherConfig {
  std::string id;
  std::string description;
  slatewatch::core::SourceDescriptor source;
  std::vector<ReferenceDescriptor> references;
  double threshold{0.9};
  std::uint32_t debounce_frames{3};
  std::uint32_t sampling_interval_ms{0};  // 0 scores every frame
  std::uint32_t metrics_port{3030};
  std::uint32_t shutdown_grace_ms{5000};
  DispatchSettings dispatch;
  std::vector<ActionTarget> actions;

  bool operator==(const WatcherConfig&) const = default;
};

/// Configuration failure with every violation found, not just the first.
struct ConfigError {
  slatewatch::core::WatchError code{slatewatch::core::WatchError::ConfigInvalid};
  std::vector<std::string> violations;

  /// Violations joined one per line.
  [[nodiscard]] std::string message() const;
};

/// Builds a config from a parsed JSON document and validates it.
[[nodiscard]] std::expected<WatcherConfig, ConfigError> parse_config(const nlohmann::json& document);

/// Parses JSON text. Syntax errors are reported as a single violation.
[[nodiscard]] std::expected<WatcherConfig, ConfigError> parse_config_text(std::string_view text);

/// Reads and parses the JSON file at \p path.
[[nodiscard]] std::expected<WatcherConfig, ConfigError> load_config(const std::string& path);

/// Constraint violations of an already built config; empty when valid.
[[nodiscard]] std::vector<std::string> validate(const WatcherConfig& config);

/// Serializes \p config; parse_config(to_json(c)) yields c again.
[[nodiscard]] nlohmann::json to_json(const WatcherConfig& config);

/// Config for the positional CLI form: one reference and one callback on "present".
[[nodiscard]] WatcherConfig single_action_config(const std::string& reference_path,
                                                 const std::string& callback_url,
                                                 std::uint32_t ingest_port = 5000,
                                                 const std::string& http_method = "POST",
                                                 const std::string& payload = {});

}  // namespace slatewatch::app
