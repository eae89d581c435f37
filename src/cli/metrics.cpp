#include <gtin/cli/metrics.hpp>

#include <sstream>

namespace gtin::cli {

namespace {

// Histogram buckets for latency (in microseconds)
const std::vector<uint64_t> kLatencyBuckets = {
    1, 2, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 10000};

size_t FindBucket(uint64_t value, const std::vector<uint64_t>& buckets) {
  for (size_t i = 0; i < buckets.size(); ++i) {
    if (value <= buckets[i]) {
      return i;
    }
  }
  return buckets.size();  // +Inf bucket
}

std::string PrometheusName(const std::string& name) {
  std::string out = name;
  for (char& c : out) {
    if (c == '.' || c == '-') c = '_';
  }
  return out;
}

}  // namespace

void CounterMetrics::Counter(std::string_view name, uint64_t delta) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = counters_.find(name);
  if (it == counters_.end()) {
    counters_.emplace(std::string(name), delta);
  } else {
    it->second += delta;
  }
}

void CounterMetrics::Histogram(std::string_view name, uint64_t value) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = histograms_.find(name);
  if (it == histograms_.end()) {
    it = histograms_.emplace(std::string(name), HistogramData{}).first;
  }
  auto& h = it->second;
  if (h.buckets.empty()) {
    h.buckets.resize(kLatencyBuckets.size() + 1, 0);
  }
  size_t bucket = FindBucket(value, kLatencyBuckets);
  for (size_t i = bucket; i < h.buckets.size(); ++i) {
    h.buckets[i]++;
  }
  h.count++;
  h.sum += value;
}

uint64_t CounterMetrics::CounterValue(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0 : it->second;
}

uint64_t CounterMetrics::HistogramCount(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = histograms_.find(name);
  return it == histograms_.end() ? 0 : it->second.count;
}

std::string CounterMetrics::Export() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::ostringstream out;

  // Export counters
  for (const auto& [raw_name, value] : counters_) {
    const std::string name = PrometheusName(raw_name);
    out << "# TYPE " << name << " counter\n";
    out << name << " " << value << "\n";
  }

  // Export histograms
  for (const auto& [raw_name, data] : histograms_) {
    const std::string name = PrometheusName(raw_name);
    out << "# TYPE " << name << " histogram\n";
    for (size_t i = 0; i < kLatencyBuckets.size(); ++i) {
      out << name << "_bucket{le=\"" << kLatencyBuckets[i] << "\"} "
          << data.buckets[i] << "\n";
    }
    out << name << "_bucket{le=\"+Inf\"} " << data.buckets.back() << "\n";
    out << name << "_sum " << data.sum << "\n";
    out << name << "_count " << data.count << "\n";
  }

  return out.str();
}

}  // namespace gtin::cli
