/**
 * @file types.h
 * @brief Plain data records shared by the parser, the adapters and their callers.
 */

#ifndef DATAPILOT_TYPES_H
#define DATAPILOT_TYPES_H

#include "datapilot/error.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace datapilot {

using Clock = std::chrono::system_clock;

/// Where a row came from in the original stream.
struct RowMetadata {
  size_t byte_offset = 0;        ///< Offset of the first byte of the row
  size_t line_number = 1;        ///< Physical line the row starts on (1-based)
  bool has_quoted_field = false; ///< At least one field was quoted
};

/**
 * @brief A single parsed record.
 *
 * Fields are in column order. Field count is not enforced here and may vary
 * from row to row.
 */
struct Row {
  uint64_t index = 0;              ///< 0-based, monotonically increasing per session
  std::vector<std::string> fields; ///< Unescaped field values
  std::string raw_line;            ///< Source text of the row without its terminator
  RowMetadata metadata;

  size_t field_count() const { return fields.size(); }
  bool empty() const { return fields.empty(); }

  const std::string& operator[](size_t i) const { return fields[i]; }

  /// True for a row that consists of a single empty field (a blank line)
  bool is_blank() const { return fields.size() == 1 && fields[0].empty(); }
};

/**
 * @brief Cumulative statistics of one parse session.
 *
 * Accumulates across repeated process_chunk() calls on the same instance.
 */
struct ParseStats {
  size_t bytes_processed = 0;
  uint64_t rows_processed = 0;
  std::vector<ParseError> errors;
  size_t suppressed_errors = 0; ///< Errors dropped once the error limit was reached
  Clock::time_point start_time{};
  std::optional<Clock::time_point> end_time;

  /// Elapsed time in seconds, measured up to now if the session is still open
  double elapsed_seconds() const {
    auto end = end_time ? *end_time : Clock::now();
    return std::chrono::duration<double>(end - start_time).count();
  }
};

} // namespace datapilot

#endif // DATAPILOT_TYPES_H
