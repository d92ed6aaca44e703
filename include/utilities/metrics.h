#pragma once
#ifndef CHUNKVAULT_METRICS_H
#define CHUNKVAULT_METRICS_H

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chunkvault {

/**
 * @brief Process-wide metrics registry exporting Prometheus text format.
 *
 * Series are identified by name plus an optional label set. Output is
 * sorted by series so repeated scrapes are stable.
 */
class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  void setGauge(const std::string &name, double value,
                const std::map<std::string, std::string> &labels = {});

  void incrementCounter(const std::string &name, double value = 1.0,
                        const std::map<std::string, std::string> &labels = {});

  /** Current counter value, 0 for unknown series. */
  double counterValue(const std::string &name,
                      const std::map<std::string, std::string> &labels = {}) const;

  std::string toPrometheus() const;

  /**
   * @brief Clear all stored metrics.
   *
   * Primarily used by unit tests to ensure a clean registry state.
   */
  void reset();

  static std::string
  labelsToString(const std::map<std::string, std::string> &labels);

private:
  MetricsRegistry() = default;

  mutable std::mutex mtx_;
  std::unordered_map<std::string, double> gauges_;
  std::unordered_map<std::string, double> counters_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_METRICS_H
