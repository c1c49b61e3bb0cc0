/**
 * @file fuzz_detection.cpp
 * @brief LibFuzzer target for the encoding and dialect detectors and registry selection.
 */

#include "datapilot.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  constexpr size_t MAX_INPUT_SIZE = 64 * 1024;
  if (size > MAX_INPUT_SIZE)
    size = MAX_INPUT_SIZE;

  auto encoding = datapilot::detect_encoding(data, size);
  if (encoding.confidence < 0.0 || encoding.confidence > 1.0)
    std::abort();

  datapilot::DialectDetector detector;
  auto dialect = detector.detect(data, size);
  if (dialect.delimiter_confidence < 0.0 || dialect.delimiter_confidence > 1.0)
    std::abort();

  static datapilot::FormatRegistry* registry = [] {
    auto* r = new datapilot::FormatRegistry();
    datapilot::register_builtin_formats(*r);
    return r;
  }();

  try {
    auto selection = registry->get_parser(data, size);
    if (selection.detection.confidence < datapilot::ACCEPTANCE_FLOOR)
      std::abort();
  } catch (const datapilot::FormatException&) {
    // Rejected inputs are expected
  }

  return 0;
}
