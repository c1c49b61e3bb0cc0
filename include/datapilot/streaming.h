/**
 * @file streaming.h
 * @brief Chunk-resumable row state machine for delimited text.
 *
 * RowStateMachine consumes a byte stream delivered in arbitrary chunks and
 * emits complete rows as soon as their terminator is seen. Partial fields and
 * rows are buffered between calls, so splitting the stream at any byte
 * offset (inside a quoted field, between the two quotes of an escaped quote,
 * between CR and LF) produces exactly the same rows as a single call.
 *
 * @example
 * @code
 * datapilot::RowStateMachine parser(datapilot::DialectConfig::csv());
 *
 * char buffer[65536];
 * while (size_t n = fread(buffer, 1, sizeof(buffer), fp)) {
 *     for (auto& row : parser.process_chunk(buffer, n)) {
 *         handle(row);
 *     }
 * }
 * if (auto last = parser.finalize()) {
 *     handle(*last);
 * }
 * @endcode
 *
 * @see dialect.h for dialect configuration
 * @see error.h for the recorded error types
 */

#ifndef DATAPILOT_STREAMING_H
#define DATAPILOT_STREAMING_H

#include "datapilot/dialect.h"
#include "datapilot/error.h"
#include "datapilot/types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace datapilot {

/**
 * @brief Parser state machine states.
 */
enum class ParserState {
  FIELD_START,            ///< At the beginning of a field (start of row or after a delimiter)
  IN_FIELD,               ///< Inside an unquoted field
  IN_QUOTED_FIELD,        ///< Inside a quoted field
  QUOTE_IN_QUOTED_FIELD,  ///< Saw a quote inside a quoted field: closing or escaped quote
  ESCAPE_IN_QUOTED_FIELD, ///< Saw a non-quote escape character inside a quoted field
  AFTER_CR                ///< Row ended on CR; a following LF belongs to the same terminator
};

/// Get the name of a parser state (e.g., "IN_QUOTED_FIELD").
const char* parser_state_to_string(ParserState state);

/**
 * @brief Streaming row state machine.
 *
 * Transitions are character-at-a-time:
 * - a quote at the start of a field opens a quoted field; anywhere else it is data
 * - inside a quoted field the delimiter, CR and LF are data
 * - a doubled quote inside a quoted field is one literal quote
 * - a character after a closing quote other than delimiter/terminator starts a
 *   new field (recorded as INVALID_QUOTE_ESCAPE, parsing continues)
 * - LF, CRLF and bare CR each terminate a row
 *
 * Recoverable problems (FIELD_TOO_LARGE, INVALID_QUOTE_ESCAPE, UNCLOSED_QUOTE)
 * are recorded in stats().errors and never thrown.
 *
 * @note Not thread-safe, except for abort() which may be called from any
 *       thread. Use one instance per stream.
 */
class RowStateMachine {
public:
  /**
   * @brief Construct a state machine for a fixed dialect.
   * @throws std::invalid_argument if the dialect is invalid
   */
  explicit RowStateMachine(const DialectConfig& config = DialectConfig());

  ~RowStateMachine();

  // Non-copyable, moveable
  RowStateMachine(const RowStateMachine&) = delete;
  RowStateMachine& operator=(const RowStateMachine&) = delete;
  RowStateMachine(RowStateMachine&&) noexcept;
  RowStateMachine& operator=(RowStateMachine&&) noexcept;

  const DialectConfig& config() const;

  /**
   * @brief Consume a chunk and return the rows it completes.
   *
   * State for an in-progress field or row carries over to the next call.
   * Returns an empty vector without buffering anything once abort() was called.
   */
  std::vector<Row> process_chunk(const uint8_t* data, size_t size);

  /// Convenience overload for char* data
  std::vector<Row> process_chunk(const char* data, size_t size) {
    return process_chunk(reinterpret_cast<const uint8_t*>(data), size);
  }

  /// Convenience overload for string_view
  std::vector<Row> process_chunk(std::string_view data) {
    return process_chunk(reinterpret_cast<const uint8_t*>(data.data()), data.size());
  }

  /**
   * @brief Flush the pending row after the last chunk.
   *
   * Returns the row that was still open when the stream ended without a
   * terminator, or std::nullopt if nothing is pending. An unclosed quoted
   * field is returned as buffered and recorded as UNCLOSED_QUOTE.
   */
  std::optional<Row> finalize();

  /// Cumulative statistics for this session
  ParseStats stats() const;

  /// Recoverable errors recorded so far
  const ErrorCollector& error_collector() const;

  /**
   * @brief Return to the initial state, keeping the configuration.
   *
   * Clears pending buffers, counters, errors and the abort flag.
   */
  void reset();

  /// Stop processing; later process_chunk() calls return immediately
  void abort();

  bool is_aborted() const;

  /// Current state of the machine
  ParserState state() const;

  /// True if a partial field or row is buffered
  bool has_pending_data() const;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace datapilot

#endif // DATAPILOT_STREAMING_H
