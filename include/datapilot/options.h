/**
 * @file options.h
 * @brief Caller-facing parse options for format adapters and the registry.
 */

#ifndef DATAPILOT_OPTIONS_H
#define DATAPILOT_OPTIONS_H

#include "datapilot/error.h"

#include <cstddef>
#include <optional>
#include <string>

namespace datapilot {

/**
 * @brief Options accepted by FormatParser implementations and FormatRegistry.
 *
 * Every dialect value is optional; an absent value is auto-detected from a
 * bounded prefix of the input. Explicit values always win over detection.
 */
struct ParseOptions {
  std::optional<char> delimiter;        ///< Field separator
  std::optional<char> quote;            ///< Quote character
  std::optional<char> escape;           ///< Escape character (defaults to the quote)
  std::optional<std::string> encoding;  ///< Encoding name, e.g. "utf-8", "utf16le", "latin1"
  std::optional<bool> has_header;       ///< Treat the first row as column names
  std::optional<std::string> format;    ///< Registered format name; bypasses detection

  size_t max_rows = 0;                  ///< Stop after this many data rows (0 = unlimited)
  size_t chunk_size = 64 * 1024;        ///< Bytes read from the source per step
  bool trim_fields = true;              ///< Strip whitespace around unquoted fields
  bool skip_empty_lines = true;         ///< Drop blank lines instead of yielding [""]
  size_t max_field_size = DEFAULT_MAX_FIELD_SIZE;
  size_t sample_size = 64 * 1024;       ///< Prefix examined by detection
};

} // namespace datapilot

#endif // DATAPILOT_OPTIONS_H
