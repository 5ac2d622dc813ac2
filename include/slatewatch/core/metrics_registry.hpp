#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace slatewatch::core {

/// Label set of one series, kept in registration order.
using MetricLabels = std::vector<std::pair<std::string, std::string>>;

/// Monotonic counter. Lock-free.
class Counter {
 public:
  void inc(std::uint64_t n = 1) noexcept { value_.fetch_add(n, std::memory_order_relaxed); }
  [[nodiscard]] std::uint64_t value() const noexcept {
    return value_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> value_{0};
};

/// Last-written value. Lock-free.
class Gauge {
 public:
  void set(double v) noexcept { value_.store(v, std::memory_order_relaxed); }
  [[nodiscard]] double value() const noexcept { return value_.load(std::memory_order_relaxed); }

 private:
  std::atomic<double> value_{0.0};
};

/// Fixed-bucket histogram. Buckets are upper bounds in ascending order;
/// observations above the last bound land only in +Inf (count).
class Histogram {
 public:
  explicit Histogram(std::vector<double> bounds);

  void observe(double v) noexcept;

  [[nodiscard]] const std::vector<double>& bounds() const noexcept { return bounds_; }
  /// Non-cumulative count of bucket \p i.
  [[nodiscard]] std::uint64_t bucket_count(std::size_t i) const noexcept;
  [[nodiscard]] std::uint64_t count() const noexcept {
    return count_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] double sum() const noexcept { return sum_.load(std::memory_order_relaxed); }

  /// Default latency buckets in seconds (5 ms .. 10 s).
  [[nodiscard]] static std::vector<double> default_latency_bounds();

 private:
  std::vector<double> bounds_;
  std::unique_ptr<std::atomic<std::uint64_t>[]> buckets_;
  std::atomic<std::uint64_t> count_{0};
  std::atomic<double> sum_{0.0};
};

enum class MetricType : std::uint8_t { Counter, Gauge, Histogram };

/// Point-in-time value of one series (histograms report their count).
struct MetricSample {
  std::string name;
  MetricLabels labels;
  double value{0.0};
};

/// Process-scoped registry. Create at startup and pass by reference to every
/// component; expose read-only to the scrape endpoint.
///
/// Registration takes a lock and returns a stable reference; writes through
/// that reference are atomic and never lock. Registering the same name and
/// labels twice returns the existing series.
class MetricsRegistry {
 public:
  MetricsRegistry() = default;
  MetricsRegistry(const MetricsRegistry&) = delete;
  MetricsRegistry& operator=(const MetricsRegistry&) = delete;

  Counter& counter(const std::string& name, const std::string& help, MetricLabels labels = {});
  Gauge& gauge(const std::string& name, const std::string& help, MetricLabels labels = {});
  Histogram& histogram(const std::string& name,
                       const std::string& help,
                       std::vector<double> bounds = Histogram::default_latency_bounds(),
                       MetricLabels labels = {});

  [[nodiscard]] std::vector<MetricSample> snapshot() const;

  /// Prometheus text exposition format (version 0.0.4).
  [[nodiscard]] std::string render_text() const;

 private:
  struct Series {
    std::string name;
    std::string help;
    MetricType type;
    MetricLabels labels;
    std::unique_ptr<Counter> counter;
    std::unique_ptr<Gauge> gauge;
    std::unique_ptr<Histogram> histogram;
  };

  Series* find(const std::string& name, const MetricLabels& labels, MetricType type);

  mutable std::mutex mu_;
  std::vector<std::unique_ptr<Series>> series_;
};

}  // namespace slatewatch::core
