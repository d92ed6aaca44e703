#include "utilities/metrics.h"
#include <map>
#include <sstream>

namespace chunkvault {

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry inst;
  return inst;
}

namespace {

std::string makeKey(const std::string &name,
                    const std::map<std::string, std::string> &labels) {
  return name + MetricsRegistry::labelsToString(labels);
}

std::string escapeLabelValue(const std::string &v) {
  std::string out;
  for (char c : v) {
    if (c == '\\' || c == '"')
      out += '\\';
    if (c == '\n') {
      out += "\\n";
      continue;
    }
    out += c;
  }
  return out;
}

} // namespace

void MetricsRegistry::setGauge(const std::string &name, double value,
                               const std::map<std::string, std::string> &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_[makeKey(name, labels)] = value;
}

void MetricsRegistry::incrementCounter(
    const std::string &name, double value,
    const std::map<std::string, std::string> &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  counters_[makeKey(name, labels)] += value;
}

double MetricsRegistry::counterValue(
    const std::string &name,
    const std::map<std::string, std::string> &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = counters_.find(makeKey(name, labels));
  return it == counters_.end() ? 0.0 : it->second;
}

std::string MetricsRegistry::labelsToString(
    const std::map<std::string, std::string> &labels) {
  if (labels.empty())
    return "";
  std::ostringstream oss;
  oss << '{';
  bool first = true;
  for (const auto &kv : labels) {
    if (!first)
      oss << ',';
    first = false;
    oss << kv.first << "=\"" << escapeLabelValue(kv.second) << "\"";
  }
  oss << '}';
  return oss.str();
}

std::string MetricsRegistry::toPrometheus() const {
  std::lock_guard<std::mutex> lg(mtx_);
  std::map<std::string, std::string> lines;
  for (const auto &kv : gauges_) {
    std::ostringstream oss;
    oss << kv.first << ' ' << kv.second << '\n';
    lines[kv.first] = oss.str();
  }
  for (const auto &kv : counters_) {
    std::ostringstream oss;
    oss << kv.first << ' ' << kv.second << '\n';
    lines[kv.first] = oss.str();
  }
  std::string out;
  for (const auto &kv : lines)
    out += kv.second;
  return out;
}

void MetricsRegistry::reset() {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_.clear();
  counters_.clear();
}

} // namespace chunkvault
