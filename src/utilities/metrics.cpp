#include "chunkvault/utilities/metrics.h"

#include <sstream>

namespace chunkvault {

namespace {

std::string makeKey(const std::string &name,
                    const MetricsRegistry::Labels &labels) {
  return name + MetricsRegistry::labelsToString(labels);
}

// Splits "name{labels}" back into its two halves.
std::pair<std::string, std::string> splitKey(const std::string &key) {
  auto nameEnd = key.find('{');
  if (nameEnd == std::string::npos) {
    return {key, ""};
  }
  return {key.substr(0, nameEnd), key.substr(nameEnd)};
}

} // namespace

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry inst;
  return inst;
}

void MetricsRegistry::setGauge(const std::string &name, double value,
                               const Labels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_[makeKey(name, labels)] = value;
}

void MetricsRegistry::incrementCounter(const std::string &name, double value,
                                       const Labels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  counters_[makeKey(name, labels)] += value;
}

void MetricsRegistry::observe(const std::string &name, double value,
                              const Labels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  auto &h = histograms_[makeKey(name, labels)];
  h.sum += value;
  h.count += 1;
}

double MetricsRegistry::counterValue(const std::string &name,
                                     const Labels &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = counters_.find(makeKey(name, labels));
  return it == counters_.end() ? 0.0 : it->second;
}

double MetricsRegistry::gaugeValue(const std::string &name,
                                   const Labels &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = gauges_.find(makeKey(name, labels));
  return it == gauges_.end() ? 0.0 : it->second;
}

std::string MetricsRegistry::labelsToString(const Labels &labels) {
  if (labels.empty())
    return "";
  std::ostringstream oss;
  oss << '{';
  bool first = true;
  for (const auto &kv : labels) {
    if (!first)
      oss << ',';
    first = false;
    oss << kv.first << "=\"" << kv.second << "\"";
  }
  oss << '}';
  return oss.str();
}

std::string MetricsRegistry::toPrometheus() const {
  std::lock_guard<std::mutex> lg(mtx_);
  std::ostringstream oss;
  for (const auto &kv : gauges_) {
    oss << kv.first << ' ' << kv.second << '\n';
  }
  for (const auto &kv : counters_) {
    oss << kv.first << ' ' << kv.second << '\n';
  }
  for (const auto &kv : histograms_) {
    auto [name, labels] = splitKey(kv.first);
    oss << name << "_sum" << labels << ' ' << kv.second.sum << '\n';
    oss << name << "_count" << labels << ' ' << kv.second.count << '\n';
  }
  return oss.str();
}

void MetricsRegistry::reset() {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_.clear();
  counters_.clear();
  histograms_.clear();
}

} // namespace chunkvault
