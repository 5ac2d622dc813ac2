#include <slatewatch/core/metrics_registry.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace slatewatch::core {

namespace {

std::string escape_label_value(const std::string& v) {
  std::string out;
  out.reserve(v.size());
  for (char c : v) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"': out += "\\\""; break;
      case '\n': out += "\\n"; break;
      default: out += c;
    }
  }
  return out;
}

std::string format_labels(const MetricLabels& labels,
                          const std::pair<std::string, std::string>* extra = nullptr) {
  if (labels.empty() && !extra) return {};
  std::string out = "{";
  bool first = true;
  for (const auto& [k, v] : labels) {
    if (!first) out += ',';
    first = false;
    out += k + "=\"" + escape_label_value(v) + "\"";
  }
  if (extra) {
    if (!first) out += ',';
    out += extra->first + "=\"" + extra->second + "\"";
  }
  out += '}';
  return out;
}

std::string format_value(double v) {
  if (std::isinf(v)) return v > 0 ? "+Inf" : "-Inf";
  if (std::isnan(v)) return "NaN";
  return fmt::format("{}", v);
}

const char* type_name(MetricType t) {
  switch (t) {
    case MetricType::Counter: return "counter";
    case MetricType::Gauge: return "gauge";
    case MetricType::Histogram:
    default: return "histogram";
  }
}

}  // namespace

Histogram::Histogram(std::vector<double> bounds)
    : bounds_(std::move(bounds)),
      buckets_(std::make_unique<std::atomic<std::uint64_t>[]>(bounds_.size())) {
  if (!std::is_sorted(bounds_.begin(), bounds_.end())) {
    throw std::invalid_argument("histogram bounds must be ascending");
  }
  for (std::size_t i = 0; i < bounds_.size(); ++i) {
    buckets_[i].store(0, std::memory_order_relaxed);
  }
}

void Histogram::observe(double v) noexcept {
  const auto it = std::lower_bound(bounds_.begin(), bounds_.end(), v);
  if (it != bounds_.end()) {
    buckets_[static_cast<std::size_t>(it - bounds_.begin())].fetch_add(1, std::memory_order_relaxed);
  }
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_.fetch_add(v, std::memory_order_relaxed);
}

std::uint64_t Histogram::bucket_count(std::size_t i) const noexcept {
  if (i >= bounds_.size()) return 0;
  return buckets_[i].load(std::memory_order_relaxed);
}

std::vector<double> Histogram::default_latency_bounds() {
  return {0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0};
}

MetricsRegistry::Series* MetricsRegistry::find(const std::string& name,
                                               const MetricLabels& labels,
                                               MetricType type) {
  for (auto& s : series_) {
    if (s->name == name && s->labels == labels) {
      if (s->type != type) {
        throw std::invalid_argument("metric " + name + " already registered with another type");
      }
      return s.get();
    }
  }
  return nullptr;
}

Counter& MetricsRegistry::counter(const std::string& name,
                                  const std::string& help,
                                  MetricLabels labels) {
  std::lock_guard lock(mu_);
  if (auto* s = find(name, labels, MetricType::Counter)) return *s->counter;
  auto s = std::make_unique<Series>(Series{name, help, MetricType::Counter, std::move(labels),
                                           std::make_unique<Counter>(), nullptr, nullptr});
  Counter& ref = *s->counter;
  series_.push_back(std::move(s));
  return ref;
}

Gauge& MetricsRegistry::gauge(const std::string& name,
                              const std::string& help,
                              MetricLabels labels) {
  std::lock_guard lock(mu_);
  if (auto* s = find(name, labels, MetricType::Gauge)) return *s->gauge;
  auto s = std::make_unique<Series>(Series{name, help, MetricType::Gauge, std::move(labels),
                                           nullptr, std::make_unique<Gauge>(), nullptr});
  Gauge& ref = *s->gauge;
  series_.push_back(std::move(s));
  return ref;
}

Histogram& MetricsRegistry::histogram(const std::string& name,
                                      const std::string& help,
                                      std::vector<double> bounds,
                                      MetricLabels labels) {
  std::lock_guard lock(mu_);
  if (auto* s = find(name, labels, MetricType::Histogram)) return *s->histogram;
  auto s = std::make_unique<Series>(Series{name, help, MetricType::Histogram, std::move(labels),
                                           nullptr, nullptr,
                                           std::make_unique<Histogram>(std::move(bounds))});
  Histogram& ref = *s->histogram;
  series_.push_back(std::move(s));
  return ref;
}

std::vector<MetricSample> MetricsRegistry::snapshot() const {
  std::lock_guard lock(mu_);
  std::vector<MetricSample> out;
  out.reserve(series_.size());
  for (const auto& s : series_) {
    double v = 0.0;
    switch (s->type) {
      case MetricType::Counter: v = static_cast<double>(s->counter->value()); break;
      case MetricType::Gauge: v = s->gauge->value(); break;
      case MetricType::Histogram: v = static_cast<double>(s->histogram->count()); break;
    }
    out.push_back(MetricSample{s->name, s->labels, v});
  }
  return out;
}

std::string MetricsRegistry::render_text() const {
  std::lock_guard lock(mu_);
  std::ostringstream out;
  std::vector<std::string> described;
  for (const auto& s : series_) {
    // HELP/TYPE once per family, even when several label sets exist.
    if (std::find(described.begin(), described.end(), s->name) == described.end()) {
      described.push_back(s->name);
      out << "# HELP " << s->name << ' ' << s->help << '\n';
      out << "# TYPE " << s->name << ' ' << type_name(s->type) << '\n';
    }
    switch (s->type) {
      case MetricType::Counter:
        out << s->name << format_labels(s->labels) << ' ' << s->counter->value() << '\n';
        break;
      case MetricType::Gauge:
        out << s->name << format_labels(s->labels) << ' ' << format_value(s->gauge->value())
            << '\n';
        break;
      case MetricType::Histogram: {
        const Histogram& h = *s->histogram;
        std::uint64_t cumulative = 0;
        for (std::size_t i = 0; i < h.bounds().size(); ++i) {
          cumulative += h.bucket_count(i);
          const std::pair<std::string, std::string> le{"le", format_value(h.bounds()[i])};
          out << s->name << "_bucket" << format_labels(s->labels, &le) << ' ' << cumulative
              << '\n';
        }
        const std::pair<std::string, std::string> inf{"le", "+Inf"};
        out << s->name << "_bucket" << format_labels(s->labels, &inf) << ' ' << h.count() << '\n';
        out << s->name << "_sum" << format_labels(s->labels) << ' ' << format_value(h.sum())
            << '\n';
        out << s->name << "_count" << format_labels(s->labels) << ' ' << h.count() << '\n';
        break;
      }
    }
  }
  return out.str();
}

}  // namespace slatewatch::core
