// Performance benchmarks for gtin validation
// Uses Google Benchmark for accurate measurement and CI regression tracking
//
// Benchmark hygiene:
// - Pre-generate all test data outside timing loops
// - Use fixed dataset sizes for reproducible results

#include <benchmark/benchmark.h>

#include <gtin/checksum.hpp>
#include <gtin/normalize.hpp>
#include <gtin/prefix.hpp>
#include <gtin/validator.hpp>

#include <random>
#include <string>
#include <vector>

namespace {

constexpr int kNumCodes = 4096;

// Random 12-digit payloads completed with their check digit (GTIN-13).
std::vector<std::string> MakeCodes() {
  std::mt19937_64 gen(42);
  std::uniform_int_distribution<int> digit(0, 9);
  std::vector<std::string> codes;
  codes.reserve(kNumCodes);
  for (int i = 0; i < kNumCodes; ++i) {
    std::string payload;
    for (int j = 0; j < 12; ++j) {
      payload += static_cast<char>('0' + digit(gen));
    }
    codes.push_back(gtin::AddCheckDigit(payload).substr(1));
  }
  return codes;
}

// =============================================================================
// Component Benchmarks
// =============================================================================

static void BM_Checksum(benchmark::State& state) {
  const std::string payload = "0400638133393";
  for (auto _ : state) {
    int digit = gtin::Checksum(payload);
    benchmark::DoNotOptimize(digit);
  }
}
BENCHMARK(BM_Checksum);

static void BM_Normalize_Hyphenated(benchmark::State& state) {
  const gtin::CodeInput code = gtin::CodeInput::Text(" 400-6381-33393-1 ");
  for (auto _ : state) {
    auto canonical = gtin::Normalize(code);
    benchmark::DoNotOptimize(canonical);
  }
}
BENCHMARK(BM_Normalize_Hyphenated);

static void BM_PrefixAllowed(benchmark::State& state) {
  const auto codes = MakeCodes();
  size_t idx = 0;
  for (auto _ : state) {
    bool allowed = gtin::IsPrefixAllowed(codes[idx]);
    benchmark::DoNotOptimize(allowed);
    idx = (idx + 1) % codes.size();
  }
}
BENCHMARK(BM_PrefixAllowed);

// =============================================================================
// End-to-end Benchmarks
// =============================================================================

static void BM_IsValidGtin(benchmark::State& state) {
  const auto codes = MakeCodes();
  size_t idx = 0;
  for (auto _ : state) {
    bool valid = gtin::IsValidGtin(codes[idx]);
    benchmark::DoNotOptimize(valid);
    idx = (idx + 1) % codes.size();
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_IsValidGtin);

static void BM_IsValidGtin_Integer(benchmark::State& state) {
  const uint64_t code = 4006381333931ull;
  for (auto _ : state) {
    bool valid = gtin::IsValidGtin(code);
    benchmark::DoNotOptimize(valid);
  }
}
BENCHMARK(BM_IsValidGtin_Integer);

static void BM_AddCheckDigit(benchmark::State& state) {
  const std::string payload = "400638133393";
  for (auto _ : state) {
    auto completed = gtin::AddCheckDigit(payload);
    benchmark::DoNotOptimize(completed);
  }
}
BENCHMARK(BM_AddCheckDigit);

}  // namespace

BENCHMARK_MAIN();
