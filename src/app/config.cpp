#include <slatewatch/app/config.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace slatewatch::app {

namespace {

using nlohmann::json;
namespace sc = slatewatch::core;
using Violations = std::vector<std::string>;

template <typename E>
using EnumTable = std::initializer_list<std::pair<std::string_view, E>>;

const EnumTable<sc::Transport> kTransports = {
    {"udp", sc::Transport::Udp}, {"file", sc::Transport::File}, {"test", sc::Transport::Test}};
const EnumTable<sc::Container> kContainers = {
    {"mpeg-ts", sc::Container::MpegTs}, {"raw-video", sc::Container::RawVideo}};
const EnumTable<sc::Codec> kCodecs = {{"h264", sc::Codec::H264}, {"h265", sc::Codec::H265}};
const EnumTable<ActionTrigger> kTriggers = {
    {"present", ActionTrigger::Present}, {"absent", ActionTrigger::Absent}, {"any", ActionTrigger::Any}};

constexpr std::string_view kMethods[] = {"GET", "POST", "PUT", "PATCH", "DELETE"};

template <typename E>
std::string enum_name(EnumTable<E> table, E value) {
  for (const auto& [name, v] : table) {
    if (v == value) return std::string(name);
  }
  return "unknown";
}

std::string join_path(std::string_view prefix, std::string_view key) {
  if (prefix.empty()) return std::string(key);
  return fmt::format("{}.{}", prefix, key);
}

/// Returns the member or nullptr when absent or null.
const json* member(const json& obj, const char* key) {
  const auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return nullptr;
  return &*it;
}

void read_string(const json& obj, std::string_view prefix, const char* key, std::string& out,
                 Violations& v) {
  const json* value = member(obj, key);
  if (!value) return;
  if (!value->is_string()) {
    v.push_back(fmt::format("{}: expected a string", join_path(prefix, key)));
    return;
  }
  out = value->get<std::string>();
}

void read_uint(const json& obj, std::string_view prefix, const char* key, std::uint32_t& out,
               Violations& v) {
  const json* value = member(obj, key);
  if (!value) return;
  if (!value->is_number_integer()) {
    v.push_back(fmt::format("{}: expected an integer", join_path(prefix, key)));
    return;
  }
  if (value->is_number_unsigned()) {
    const auto n = value->get<std::uint64_t>();
    if (n > std::numeric_limits<std::uint32_t>::max()) {
      v.push_back(fmt::format("{}: value {} is too large", join_path(prefix, key), n));
      return;
    }
    out = static_cast<std::uint32_t>(n);
    return;
  }
  const auto n = value->get<std::int64_t>();
  if (n < 0) {
    v.push_back(fmt::format("{}: must be non-negative, got {}", join_path(prefix, key), n));
    return;
  }
  if (n > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
    v.push_back(fmt::format("{}: value {} is too large", join_path(prefix, key), n));
    return;
  }
  out = static_cast<std::uint32_t>(n);
}

void read_double(const json& obj, std::string_view prefix, const char* key, double& out,
                 Violations& v) {
  const json* value = member(obj, key);
  if (!value) return;
  if (!value->is_number()) {
    v.push_back(fmt::format("{}: expected a number", join_path(prefix, key)));
    return;
  }
  out = value->get<double>();
}

template <typename E>
void read_enum(const json& obj, std::string_view prefix, const char* key, EnumTable<E> table,
               E& out, Violations& v) {
  std::string text;
  const std::size_t before = v.size();
  read_string(obj, prefix, key, text, v);
  if (v.size() != before || !member(obj, key)) return;
  for (const auto& [name, value] : table) {
    if (name == text) {
      out = value;
      return;
    }
  }
  std::vector<std::string_view> names;
  for (const auto& entry : table) names.push_back(entry.first);
  v.push_back(fmt::format("{}: unknown value \"{}\" (expected one of: {})", join_path(prefix, key),
                          text, fmt::join(names, ", ")));
}

/// Null for absent members; a violation when present but not an object.
const json* read_object(const json& obj, std::string_view prefix, const char* key, Violations& v) {
  const json* value = member(obj, key);
  if (!value) return nullptr;
  if (!value->is_object()) {
    v.push_back(fmt::format("{}: expected an object", join_path(prefix, key)));
    return nullptr;
  }
  return value;
}

const json* read_array(const json& obj, const char* key, Violations& v) {
  const json* value = member(obj, key);
  if (!value) return nullptr;
  if (!value->is_array()) {
    v.push_back(fmt::format("{}: expected an array", key));
    return nullptr;
  }
  return value;
}

void parse_source(const json& obj, sc::SourceDescriptor& s, Violations& v) {
  constexpr std::string_view p = "source";
  read_enum(obj, p, "transport", kTransports, s.transport, v);
  read_string(obj, p, "address", s.address, v);
  read_uint(obj, p, "port", s.port, v);
  read_enum(obj, p, "container", kContainers, s.container, v);
  read_enum(obj, p, "codec", kCodecs, s.codec, v);
  read_uint(obj, p, "stall_timeout_ms", s.stall_timeout_ms, v);
  read_uint(obj, p, "max_reconnect_attempts", s.max_reconnect_attempts, v);
  read_uint(obj, p, "reconnect_backoff_ms", s.reconnect_backoff_ms, v);
}

void parse_retry(const json& obj, std::string_view prefix, RetryPolicy& r, Violations& v) {
  read_uint(obj, prefix, "max_retries", r.max_retries, v);
  read_uint(obj, prefix, "timeout_ms", r.timeout_ms, v);
  read_uint(obj, prefix, "initial_backoff_ms", r.initial_backoff_ms, v);
  read_uint(obj, prefix, "max_backoff_ms", r.max_backoff_ms, v);
}

ActionTarget parse_action(const json& obj, const std::string& p, Violations& v) {
  ActionTarget a;
  read_string(obj, p, "description", a.description, v);
  read_string(obj, p, "url", a.url, v);
  read_string(obj, p, "method", a.method, v);
  std::transform(a.method.begin(), a.method.end(), a.method.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  read_enum(obj, p, "on", kTriggers, a.on, v);

  if (const json* headers = read_object(obj, p, "headers", v)) {
    for (const auto& [name, value] : headers->items()) {
      if (!value.is_string()) {
        v.push_back(fmt::format("{}.headers.{}: expected a string", p, name));
        continue;
      }
      a.headers[name] = value.get<std::string>();
    }
  }
  if (const json* auth = read_object(obj, p, "auth", v)) {
    BasicAuth basic;
    read_string(*auth, p + ".auth", "username", basic.username, v);
    read_string(*auth, p + ".auth", "password", basic.password, v);
    a.auth = std::move(basic);
  }
  if (const json* payload = member(obj, "payload_template")) {
    // Structured payloads are accepted and kept in serialized form.
    a.payload_template = payload->is_string() ? payload->get<std::string>() : payload->dump();
  }
  read_uint(obj, p, "cooldown_ms", a.cooldown_ms, v);
  if (const json* retry = read_object(obj, p, "retry", v)) {
    parse_retry(*retry, p + ".retry", a.retry, v);
  }
  return a;
}

bool has_scheme(std::string_view s, std::string_view scheme) {
  return s.size() > scheme.size() && s.substr(0, scheme.size()) == scheme;
}

bool is_http_url(std::string_view url) {
  return has_scheme(url, "http://") || has_scheme(url, "https://");
}

}  // namespace

std::string_view to_string(ActionTrigger trigger) noexcept {
  switch (trigger) {
    case ActionTrigger::Present: return "present";
    case ActionTrigger::Absent: return "absent";
    case ActionTrigger::Any: return "any";
  }
  return "unknown";
}

std::chrono::milliseconds RetryPolicy::backoff(std::uint32_t retry) const noexcept {
  const std::uint32_t shift = std::min<std::uint32_t>(retry, 32);
  const std::uint64_t scaled = static_cast<std::uint64_t>(initial_backoff_ms) << shift;
  return std::chrono::milliseconds(std::min<std::uint64_t>(scaled, max_backoff_ms));
}

std::string ConfigError::message() const {
  return fmt::format("{}", fmt::join(violations, "\n"));
}

std::vector<std::string> validate(const WatcherConfig& c) {
  Violations v;
  if (c.id.empty()) v.emplace_back("id: must not be empty");

  if (c.references.empty()) {
    v.emplace_back("references: at least one reference image is required");
  }
  std::set<std::string> labels;
  for (std::size_t i = 0; i < c.references.size(); ++i) {
    const auto& r = c.references[i];
    if (r.path.empty()) {
      v.push_back(fmt::format("references[{}].path: must not be empty", i));
    } else if (r.path.find("://") != std::string::npos && !has_scheme(r.path, "file://") &&
               !is_http_url(r.path)) {
      v.push_back(fmt::format("references[{}].path: unsupported scheme in \"{}\"", i, r.path));
    }
    if (r.label.empty()) {
      v.push_back(fmt::format("references[{}].label: must not be empty", i));
    } else if (!labels.insert(r.label).second) {
      v.push_back(fmt::format("references[{}].label: duplicate label \"{}\"", i, r.label));
    }
  }

  if (!(c.threshold > 0.0 && c.threshold <= 1.0)) {
    v.push_back(fmt::format("threshold: must be in (0, 1], got {}", c.threshold));
  }
  if (c.debounce_frames < 1) v.emplace_back("debounce_frames: must be at least 1");
  if (c.metrics_port > 65535) {
    v.push_back(fmt::format("metrics_port: {} is not a valid TCP port", c.metrics_port));
  }

  const auto& s = c.source;
  if (s.transport == sc::Transport::Udp) {
    if (s.port <= 1024 || s.port >= 60000) {
      v.push_back(fmt::format("source.port: {} is not within the valid range (1024-60000)", s.port));
    }
  } else if (s.transport == sc::Transport::File && s.address.empty()) {
    v.emplace_back("source.address: file transport requires a path");
  }
  if (s.stall_timeout_ms == 0) v.emplace_back("source.stall_timeout_ms: must be greater than 0");

  if (c.dispatch.workers < 1) v.emplace_back("dispatch.workers: must be at least 1");
  if (c.dispatch.queue_capacity < 1) v.emplace_back("dispatch.queue_capacity: must be at least 1");

  for (std::size_t i = 0; i < c.actions.size(); ++i) {
    const auto& a = c.actions[i];
    const std::string p = fmt::format("actions[{}]", i);
    if (!is_http_url(a.url)) {
      v.push_back(fmt::format("{}.url: \"{}\" must start with http:// or https://", p, a.url));
    }
    if (std::find(std::begin(kMethods), std::end(kMethods), a.method) == std::end(kMethods)) {
      v.push_back(fmt::format("{}.method: unsupported HTTP method \"{}\"", p, a.method));
    }
    if (a.retry.timeout_ms == 0) v.push_back(fmt::format("{}.retry.timeout_ms: must be greater than 0", p));
    if (a.retry.max_backoff_ms < a.retry.initial_backoff_ms) {
      v.push_back(fmt::format("{}.retry.max_backoff_ms: must not be less than initial_backoff_ms", p));
    }
  }
  return v;
}

std::expected<WatcherConfig, ConfigError> parse_config(const json& document) {
  Violations v;
  if (!document.is_object()) {
    return std::unexpected(ConfigError{sc::WatchError::ConfigInvalid,
                                       {"configuration must be a JSON object"}});
  }

  WatcherConfig c;
  read_string(document, "", "id", c.id, v);
  read_string(document, "", "description", c.description, v);
  if (const json* source = read_object(document, "", "source", v)) {
    parse_source(*source, c.source, v);
  }

  if (const json* refs = read_array(document, "references", v)) {
    for (std::size_t i = 0; i < refs->size(); ++i) {
      const json& entry = (*refs)[i];
      const std::string p = fmt::format("references[{}]", i);
      if (!entry.is_object()) {
        v.push_back(fmt::format("{}: expected an object", p));
        continue;
      }
      ReferenceDescriptor r;
      read_string(entry, p, "path", r.path, v);
      read_string(entry, p, "label", r.label, v);
      c.references.push_back(std::move(r));
    }
  }

  read_double(document, "", "threshold", c.threshold, v);
  read_uint(document, "", "debounce_frames", c.debounce_frames, v);
  read_uint(document, "", "sampling_interval_ms", c.sampling_interval_ms, v);
  read_uint(document, "", "metrics_port", c.metrics_port, v);
  read_uint(document, "", "shutdown_grace_ms", c.shutdown_grace_ms, v);
  if (const json* dispatch = read_object(document, "", "dispatch", v)) {
    read_uint(*dispatch, "dispatch", "workers", c.dispatch.workers, v);
    read_uint(*dispatch, "dispatch", "queue_capacity", c.dispatch.queue_capacity, v);
  }

  if (const json* actions = read_array(document, "actions", v)) {
    for (std::size_t i = 0; i < actions->size(); ++i) {
      const json& entry = (*actions)[i];
      const std::string p = fmt::format("actions[{}]", i);
      if (!entry.is_object()) {
        v.push_back(fmt::format("{}: expected an object", p));
        continue;
      }
      c.actions.push_back(parse_action(entry, p, v));
    }
  }

  auto semantic = validate(c);
  v.insert(v.end(), std::make_move_iterator(semantic.begin()),
           std::make_move_iterator(semantic.end()));
  if (!v.empty()) {
    return std::unexpected(ConfigError{sc::WatchError::ConfigInvalid, std::move(v)});
  }
  return c;
}

std::expected<WatcherConfig, ConfigError> parse_config_text(std::string_view text) {
  json document;
  try {
    document = json::parse(text);
  } catch (const json::parse_error& e) {
    return std::unexpected(ConfigError{sc::WatchError::ConfigInvalid,
                                       {fmt::format("invalid JSON: {}", e.what())}});
  }
  return parse_config(document);
}

std::expected<WatcherConfig, ConfigError> load_config(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    return std::unexpected(ConfigError{sc::WatchError::ConfigInvalid,
                                       {fmt::format("cannot open configuration file \"{}\"", path)}});
  }
  json document;
  try {
    document = json::parse(f);
  } catch (const json::parse_error& e) {
    return std::unexpected(ConfigError{sc::WatchError::ConfigInvalid,
                                       {fmt::format("{}: invalid JSON: {}", path, e.what())}});
  }
  return parse_config(document);
}

json to_json(const WatcherConfig& c) {
  json source = {
      {"transport", enum_name(kTransports, c.source.transport)},
      {"address", c.source.address},
      {"port", c.source.port},
      {"container", enum_name(kContainers, c.source.container)},
      {"codec", enum_name(kCodecs, c.source.codec)},
      {"stall_timeout_ms", c.source.stall_timeout_ms},
      {"max_reconnect_attempts", c.source.max_reconnect_attempts},
      {"reconnect_backoff_ms", c.source.reconnect_backoff_ms},
  };

  json references = json::array();
  for (const auto& r : c.references) {
    references.push_back({{"path", r.path}, {"label", r.label}});
  }

  json actions = json::array();
  for (const auto& a : c.actions) {
    json action = {
        {"description", a.description},
        {"url", a.url},
        {"method", a.method},
        {"on", std::string(to_string(a.on))},
        {"headers", a.headers},
        {"payload_template", a.payload_template},
        {"cooldown_ms", a.cooldown_ms},
        {"retry",
         {{"max_retries", a.retry.max_retries},
          {"timeout_ms", a.retry.timeout_ms},
          {"initial_backoff_ms", a.retry.initial_backoff_ms},
          {"max_backoff_ms", a.retry.max_backoff_ms}}},
    };
    if (a.auth) {
      action["auth"] = {{"username", a.auth->username}, {"password", a.auth->password}};
    }
    actions.push_back(std::move(action));
  }

  return json{
      {"id", c.id},
      {"description", c.description},
      {"source", std::move(source)},
      {"references", std::move(references)},
      {"threshold", c.threshold},
      {"debounce_frames", c.debounce_frames},
      {"sampling_interval_ms", c.sampling_interval_ms},
      {"metrics_port", c.metrics_port},
      {"shutdown_grace_ms", c.shutdown_grace_ms},
      {"dispatch", {{"workers", c.dispatch.workers}, {"queue_capacity", c.dispatch.queue_capacity}}},
      {"actions", std::move(actions)},
  };
}

WatcherConfig single_action_config(const std::string& reference_path,
                                   const std::string& callback_url,
                                   std::uint32_t ingest_port,
                                   const std::string& http_method,
                                   const std::string& payload) {
  WatcherConfig c;
  c.id = "slatewatch";
  c.description = "single action";
  c.source.port = ingest_port;
  c.references.push_back(ReferenceDescriptor{reference_path, "slate"});

  ActionTarget action;
  action.description = "callback";
  action.url = callback_url;
  action.method = http_method;
  std::transform(action.method.begin(), action.method.end(), action.method.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
  action.on = ActionTrigger::Present;
  action.payload_template = payload;
  if (!payload.empty()) action.headers["Content-Type"] = "application/json";
  c.actions.push_back(std::move(action));
  return c;
}

}  // namespace slatewatch::app
