/**
 * @file parser_benchmarks.cpp
 * @brief Throughput of the row state machine, the detectors and the adapter.
 */

#include "datapilot.h"

#include <algorithm>
#include <benchmark/benchmark.h>
#include <iomanip>
#include <map>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace {

// ============================================================================
// CSV Generation Utilities
// ============================================================================

/**
 * @brief Generate CSV data with alternating int, double and string columns.
 *
 * @param rows Number of data rows
 * @param cols Number of columns
 * @param quote_ratio Share of string fields written quoted with an embedded delimiter
 * @param delimiter Field separator
 */
std::string generate_csv(size_t rows, size_t cols, double quote_ratio = 0.0,
                         char delimiter = ',') {
  std::mt19937 rng(42);
  std::uniform_int_distribution<int> int_dist(0, 99999);
  std::uniform_real_distribution<double> dbl_dist(-1000.0, 1000.0);
  std::uniform_real_distribution<double> prob_dist(0.0, 1.0);

  std::ostringstream oss;
  for (size_t c = 0; c < cols; ++c) {
    if (c > 0)
      oss << delimiter;
    oss << "col" << c;
  }
  oss << '\n';

  for (size_t r = 0; r < rows; ++r) {
    for (size_t c = 0; c < cols; ++c) {
      if (c > 0)
        oss << delimiter;
      switch (c % 3) {
      case 0:
        oss << int_dist(rng);
        break;
      case 1:
        oss << std::fixed << std::setprecision(4) << dbl_dist(rng);
        break;
      default:
        if (prob_dist(rng) < quote_ratio) {
          oss << "\"v" << r << delimiter << " \"\"q\"\"\"";
        } else {
          oss << "str" << (rng() % 100) << "_value";
        }
        break;
      }
    }
    oss << '\n';
  }
  return oss.str();
}

const std::string& cached_csv(size_t rows, size_t cols, double quote_ratio = 0.0) {
  static std::map<std::string, std::string> cache;
  std::string key = std::to_string(rows) + "x" + std::to_string(cols) + "q" +
                    std::to_string(quote_ratio);
  auto it = cache.find(key);
  if (it == cache.end()) {
    it = cache.emplace(key, generate_csv(rows, cols, quote_ratio)).first;
  }
  return it->second;
}

} // namespace

// ============================================================================
// ROW STATE MACHINE
// ============================================================================

// Chunk size sweep over a fixed 10k x 10 input
static void BM_StateMachine_ChunkSize(benchmark::State& state) {
  const std::string& csv = cached_csv(10000, 10);
  const size_t chunk = static_cast<size_t>(state.range(0));

  size_t rows = 0;
  for (auto _ : state) {
    datapilot::RowStateMachine machine;
    rows = 0;
    for (size_t pos = 0; pos < csv.size(); pos += chunk) {
      size_t n = std::min(chunk, csv.size() - pos);
      rows += machine.process_chunk(csv.data() + pos, n).size();
    }
    if (machine.finalize())
      ++rows;
    benchmark::DoNotOptimize(rows);
  }

  state.SetBytesProcessed(static_cast<int64_t>(csv.size() * state.iterations()));
  state.counters["Rows"] = static_cast<double>(rows);
  state.counters["ChunkSize"] = static_cast<double>(chunk);
}
BENCHMARK(BM_StateMachine_ChunkSize)
    ->RangeMultiplier(8)
    ->Range(64, 256 * 1024)
    ->Unit(benchmark::kMillisecond);

// Quoted fields exercise the quote and doubled-quote states
static void BM_StateMachine_QuoteDensity(benchmark::State& state) {
  const double ratio = static_cast<double>(state.range(0)) / 100.0;
  const std::string& csv = cached_csv(10000, 9, ratio);

  for (auto _ : state) {
    datapilot::RowStateMachine machine;
    auto rows = machine.process_chunk(csv);
    auto last = machine.finalize();
    benchmark::DoNotOptimize(rows);
    benchmark::DoNotOptimize(last);
  }

  state.SetBytesProcessed(static_cast<int64_t>(csv.size() * state.iterations()));
  state.counters["QuotePct"] = static_cast<double>(state.range(0));
}
BENCHMARK(BM_StateMachine_QuoteDensity)->Arg(0)->Arg(10)->Arg(50)->Arg(100)->Unit(
    benchmark::kMillisecond);

static void BM_StateMachine_Trim(benchmark::State& state) {
  const std::string& csv = cached_csv(10000, 10);
  datapilot::DialectConfig config;
  config.trim_fields = true;

  for (auto _ : state) {
    datapilot::RowStateMachine machine(config);
    auto rows = machine.process_chunk(csv);
    benchmark::DoNotOptimize(rows);
  }

  state.SetBytesProcessed(static_cast<int64_t>(csv.size() * state.iterations()));
}
BENCHMARK(BM_StateMachine_Trim)->Unit(benchmark::kMillisecond);

// ============================================================================
// DETECTION
// ============================================================================

static void BM_DialectDetection(benchmark::State& state) {
  const std::string csv = generate_csv(2000, static_cast<size_t>(state.range(0)), 0.1, ';');
  datapilot::DialectDetector detector;

  for (auto _ : state) {
    auto result = detector.detect(csv);
    benchmark::DoNotOptimize(result);
  }

  state.SetBytesProcessed(static_cast<int64_t>(csv.size() * state.iterations()));
  state.counters["Columns"] = static_cast<double>(state.range(0));
}
BENCHMARK(BM_DialectDetection)->Arg(3)->Arg(10)->Arg(50)->Unit(benchmark::kMicrosecond);

static void BM_EncodingDetection(benchmark::State& state) {
  const std::string& csv = cached_csv(2000, 10);
  const size_t sample = std::min(csv.size(), static_cast<size_t>(64 * 1024));

  for (auto _ : state) {
    auto result =
        datapilot::detect_encoding(reinterpret_cast<const uint8_t*>(csv.data()), sample);
    benchmark::DoNotOptimize(result);
  }

  state.SetBytesProcessed(static_cast<int64_t>(sample * state.iterations()));
}
BENCHMARK(BM_EncodingDetection)->Unit(benchmark::kMicrosecond);

static void BM_Utf16Transcode(benchmark::State& state) {
  const std::string& csv = cached_csv(2000, 10);
  std::vector<uint8_t> utf16;
  utf16.reserve(csv.size() * 2);
  for (char c : csv) {
    utf16.push_back(static_cast<uint8_t>(c));
    utf16.push_back(0);
  }

  for (auto _ : state) {
    datapilot::Utf8Transcoder transcoder(datapilot::CharEncoding::UTF16_LE);
    std::string out = transcoder.convert(utf16.data(), utf16.size());
    out += transcoder.finish();
    benchmark::DoNotOptimize(out);
  }

  state.SetBytesProcessed(static_cast<int64_t>(utf16.size() * state.iterations()));
}
BENCHMARK(BM_Utf16Transcode)->Unit(benchmark::kMicrosecond);

// ============================================================================
// END TO END
// ============================================================================

// Registry selection plus a full adapter parse of an in-memory source
static void BM_RegistryParse(benchmark::State& state) {
  const std::string& csv = cached_csv(static_cast<size_t>(state.range(0)), 10, 0.05);
  datapilot::FormatRegistry registry;
  datapilot::register_builtin_formats(registry);
  const auto* bytes = reinterpret_cast<const uint8_t*>(csv.data());

  size_t rows = 0;
  for (auto _ : state) {
    auto selection = registry.get_parser(bytes, csv.size());
    rows = 0;
    for (const auto& row : selection.parser->parse(
             std::make_unique<datapilot::MemorySource>(std::string_view(csv)))) {
      rows += row.field_count() > 0;
    }
    benchmark::DoNotOptimize(rows);
  }

  state.SetBytesProcessed(static_cast<int64_t>(csv.size() * state.iterations()));
  state.counters["Rows"] = static_cast<double>(rows);
}
BENCHMARK(BM_RegistryParse)->Arg(1000)->Arg(100000)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
