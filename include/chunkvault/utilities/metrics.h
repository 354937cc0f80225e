#pragma once
#include <map>
#include <mutex>
#include <string>

namespace chunkvault {

/**
 * @brief Process-wide metrics registry exported in Prometheus text format.
 *
 * Storage components record chunk, compression and replication activity
 * here; callers decide whether and where to publish toPrometheus().
 */
class MetricsRegistry {
public:
  using Labels = std::map<std::string, std::string>;

  /** Get singleton instance. */
  static MetricsRegistry &instance();

  /** Set gauge value with optional labels. */
  void setGauge(const std::string &name, double value,
                const Labels &labels = {});

  /** Increment counter by value (default 1). */
  void incrementCounter(const std::string &name, double value = 1.0,
                        const Labels &labels = {});

  /** Record observation for a histogram. */
  void observe(const std::string &name, double value,
               const Labels &labels = {});

  /** Current counter value, 0 when never incremented. */
  double counterValue(const std::string &name, const Labels &labels = {}) const;

  /** Current gauge value, 0 when never set. */
  double gaugeValue(const std::string &name, const Labels &labels = {}) const;

  /** Serialize all metrics in Prometheus text format, sorted by series. */
  std::string toPrometheus() const;

  /** Clear all stored metrics. Used by tests for a clean registry. */
  void reset();

  /** Convert labels map to Prometheus label string. */
  static std::string labelsToString(const Labels &labels);

private:
  MetricsRegistry() = default;
  struct Histogram {
    double sum{0};
    unsigned long count{0};
  };

  mutable std::mutex mtx_;
  std::map<std::string, double> gauges_;
  std::map<std::string, double> counters_;
  std::map<std::string, Histogram> histograms_;
};

} // namespace chunkvault
