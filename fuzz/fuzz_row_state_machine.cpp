/**
 * @file fuzz_row_state_machine.cpp
 * @brief LibFuzzer target checking that chunk boundaries never change the rows produced.
 */

#include "datapilot/streaming.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <vector>

namespace {

struct Outcome {
  std::vector<datapilot::Row> rows;
  size_t errors = 0;
};

Outcome run(const datapilot::DialectConfig& config, const uint8_t* data, size_t size,
            size_t step) {
  datapilot::RowStateMachine machine(config);
  Outcome outcome;
  for (size_t pos = 0; pos < size; pos += step) {
    size_t n = size - pos < step ? size - pos : step;
    for (auto& row : machine.process_chunk(data + pos, n)) {
      outcome.rows.push_back(std::move(row));
    }
  }
  if (auto last = machine.finalize()) {
    outcome.rows.push_back(std::move(*last));
  }
  outcome.errors = machine.stats().errors.size();
  return outcome;
}

bool same(const Outcome& a, const Outcome& b) {
  if (a.rows.size() != b.rows.size() || a.errors != b.errors)
    return false;
  for (size_t i = 0; i < a.rows.size(); ++i) {
    const auto& x = a.rows[i];
    const auto& y = b.rows[i];
    if (x.index != y.index || x.fields != y.fields || x.raw_line != y.raw_line ||
        x.metadata.byte_offset != y.metadata.byte_offset ||
        x.metadata.line_number != y.metadata.line_number ||
        x.metadata.has_quoted_field != y.metadata.has_quoted_field)
      return false;
  }
  return true;
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  if (size < 2)
    return 0;
  constexpr size_t MAX_INPUT_SIZE = 16 * 1024;
  if (size > MAX_INPUT_SIZE)
    size = MAX_INPUT_SIZE;

  // First byte picks the dialect variant and the chunk step
  const uint8_t selector = data[0];
  data += 1;
  size -= 1;

  datapilot::DialectConfig config;
  if (selector & 0x01)
    config.escape = '\\';
  if (selector & 0x02)
    config.trim_fields = true;
  if (selector & 0x04)
    config.max_field_size = 8;
  if (selector & 0x08) {
    config.delimiter = ';';
    config.quote = '\'';
    config.escape = (selector & 0x01) ? '\\' : '\'';
  }
  const size_t step = 1 + (selector >> 4);

  Outcome whole = run(config, data, size, size);
  Outcome chunked = run(config, data, size, step);
  if (!same(whole, chunked))
    std::abort();

  return 0;
}
