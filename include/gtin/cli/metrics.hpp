#pragma once

#include <gtin/validator.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace gtin::cli {

/**
 * In-process metrics sink.
 *
 * Collects counters and histograms and exports them in Prometheus text
 * exposition format ('.' in metric names becomes '_').
 */
class CounterMetrics : public gtin::MetricsSink {
 public:
  CounterMetrics() = default;

  // MetricsSink interface
  void Counter(std::string_view name, uint64_t delta) override;
  void Histogram(std::string_view name, uint64_t value) override;

  /** Current value of a counter, 0 if never incremented. */
  uint64_t CounterValue(std::string_view name) const;

  /** Number of observations recorded for a histogram. */
  uint64_t HistogramCount(std::string_view name) const;

  /**
   * Generate Prometheus text format output.
   */
  std::string Export() const;

 private:
  mutable std::mutex mu_;

  // Ordered so exports are stable.
  std::map<std::string, uint64_t, std::less<>> counters_;

  struct HistogramData {
    std::vector<uint64_t> buckets;
    uint64_t count = 0;
    uint64_t sum = 0;
  };
  std::map<std::string, HistogramData, std::less<>> histograms_;
};

}  // namespace gtin::cli
