#ifndef DATAPILOT_ERROR_H
#define DATAPILOT_ERROR_H

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @file error.h
 * @brief Error handling framework for datapilot.
 *
 * Two families of failures exist:
 * - Structural problems attributable to a single row or field (oversized
 *   field, unclosed quote, ragged row). These are recorded as ParseError
 *   values in an ErrorCollector and parsing continues.
 * - Source and configuration problems that prevent establishing a dialect or
 *   encoding at all. These are thrown as FormatException (or
 *   std::invalid_argument for a bad dialect) before any row is produced.
 *
 * @see ErrorCollector for collecting recoverable errors
 * @see FormatException for fatal source errors
 */

namespace datapilot {

/**
 * @brief Error codes for parse, detection and source failures.
 *
 * Error codes are grouped by category:
 * - Quote-related errors (UNCLOSED_QUOTE, INVALID_QUOTE_ESCAPE)
 * - Field structure errors (INCONSISTENT_FIELD_COUNT, FIELD_TOO_LARGE, EMPTY_HEADER)
 * - Character encoding errors (INVALID_UTF8, NULL_BYTE, UNSUPPORTED_ENCODING)
 * - Source errors (FILE_NOT_FOUND, PERMISSION_DENIED, EMPTY_FILE, IO_ERROR)
 * - Detection errors (UNSUPPORTED_FORMAT, DETECTION_FAILED, INVALID_DIALECT)
 */
enum class ErrorCode {
  NONE = 0, ///< No error

  // Quote-related errors
  UNCLOSED_QUOTE,       ///< Quoted field not closed before end of stream
  INVALID_QUOTE_ESCAPE, ///< Character after a closing quote (e.g., "abc"def)

  // Field structure errors
  INCONSISTENT_FIELD_COUNT, ///< Row has a different number of fields than the header
  FIELD_TOO_LARGE,          ///< Field exceeds the configured maximum size
  EMPTY_HEADER,             ///< Header row has no usable column names

  // Character encoding errors
  INVALID_UTF8,         ///< Invalid UTF-8 byte sequence detected
  NULL_BYTE,            ///< Unexpected null byte in data
  UNSUPPORTED_ENCODING, ///< Encoding name not recognised

  // Source errors
  FILE_NOT_FOUND,    ///< Input path does not exist
  PERMISSION_DENIED, ///< Input path cannot be opened for reading
  EMPTY_FILE,        ///< Input contains no bytes
  IO_ERROR,          ///< Read failure

  // Detection and configuration errors
  UNSUPPORTED_FORMAT, ///< No registered format accepts the input
  DETECTION_FAILED,   ///< A detector failed while examining a sample
  INVALID_DIALECT,    ///< Dialect configuration rejected

  INTERNAL_ERROR ///< Internal error
};

/**
 * @brief Default limit for individual field size (1 MiB).
 *
 * Fields larger than this are flagged with FIELD_TOO_LARGE and truncated so
 * that a single malformed quote cannot make the parser buffer an entire file.
 */
constexpr size_t DEFAULT_MAX_FIELD_SIZE = 1024 * 1024; // 1 MiB

/**
 * @brief Severity levels for parse errors.
 *
 * @note The enum values use a naming pattern that avoids conflicts with
 * Windows macros (e.g., ERROR is defined in WinGDI.h).
 */
enum class ErrorSeverity {
  WARNING,     ///< Non-fatal issue, parser continues
  RECOVERABLE, ///< Row-level problem, recorded and parsing continues
  FATAL        ///< Parsing cannot continue
};

/**
 * @brief Detailed information about a single parse error.
 *
 * @example
 * @code
 * ParseError error(ErrorCode::FIELD_TOO_LARGE, ErrorSeverity::RECOVERABLE,
 *                  10, 2, 1024, "Field exceeds 1048576 bytes");
 * std::cout << error.to_string() << std::endl;
 * // [ERROR] FIELD_TOO_LARGE at row 10, column 2 (byte 1024): Field exceeds 1048576 bytes
 * @endcode
 */
struct ParseError {
  ErrorCode code;         ///< The type of error that occurred
  ErrorSeverity severity; ///< Severity level of the error

  // Location information
  uint64_t row;       ///< Row index the error belongs to (0-based)
  size_t column;      ///< Column number (1-indexed, 0 if not attributable)
  size_t byte_offset; ///< Byte offset from start of stream

  // Context
  std::string message; ///< Human-readable error description
  std::string context; ///< Snippet of data around the error location

  ParseError(ErrorCode c, ErrorSeverity s, uint64_t r, size_t col, size_t offset,
             const std::string& msg, const std::string& ctx = "")
      : code(c), severity(s), row(r), column(col), byte_offset(offset), message(msg),
        context(ctx) {}

  /**
   * @brief Convert the error to a human-readable string.
   * @return Formatted string with severity, location, and message.
   */
  std::string to_string() const;
};

/**
 * @brief Collects recoverable errors during parsing.
 *
 * The collector is bounded: once max_errors() entries are stored, further
 * errors are only counted (see suppressed_count()). This keeps memory flat on
 * severely malformed inputs where every row is ragged.
 *
 * @note Not thread-safe. One collector belongs to one parse session.
 */
class ErrorCollector {
public:
  /** @brief Default maximum number of errors to keep */
  static constexpr size_t DEFAULT_MAX_ERRORS = 10000;

  explicit ErrorCollector(size_t max_errors = DEFAULT_MAX_ERRORS)
      : max_errors_(max_errors), has_fatal_(false), suppressed_count_(0) {}

  /**
   * @brief Add an error to the collection.
   *
   * If the limit is reached the error is not stored but suppressed_count()
   * is incremented. A FATAL error always sets has_fatal_errors().
   */
  void add_error(const ParseError& error) {
    if (error.severity == ErrorSeverity::FATAL) {
      has_fatal_ = true;
    }
    if (errors_.size() >= max_errors_) {
      ++suppressed_count_;
      return;
    }
    errors_.push_back(error);
  }

  /// Convenience overload building the ParseError in place
  void add_error(ErrorCode code, ErrorSeverity severity, uint64_t row, size_t column,
                 size_t offset, const std::string& message, const std::string& context = "") {
    add_error(ParseError(code, severity, row, column, offset, message, context));
  }

  bool has_errors() const { return !errors_.empty(); }
  bool has_fatal_errors() const { return has_fatal_; }
  size_t error_count() const { return errors_.size(); }
  bool at_error_limit() const { return errors_.size() >= max_errors_; }

  /// Number of errors dropped because the limit was reached
  size_t suppressed_count() const { return suppressed_count_; }

  size_t max_errors() const { return max_errors_; }
  void set_max_errors(size_t max_errors) { max_errors_ = max_errors; }

  const std::vector<ParseError>& errors() const { return errors_; }

  /// Number of stored errors with the given code
  size_t count(ErrorCode code) const {
    return static_cast<size_t>(std::count_if(errors_.begin(), errors_.end(),
                                             [code](const ParseError& e) { return e.code == code; }));
  }

  /**
   * @brief Get a summary string of all errors.
   * @return Human-readable summary of error counts by severity
   */
  std::string summary() const;

  void clear() {
    errors_.clear();
    has_fatal_ = false;
    suppressed_count_ = 0;
  }

  /**
   * @brief Merge errors from another collector.
   *
   * Respects max_errors() when merging. Errors that do not fit are added to
   * the suppressed count.
   */
  void merge_from(const ErrorCollector& other) {
    suppressed_count_ += other.suppressed_count_;
    if (other.has_fatal_) {
      has_fatal_ = true;
    }

    size_t available = max_errors_ > errors_.size() ? max_errors_ - errors_.size() : 0;
    size_t to_copy = std::min(available, other.errors_.size());
    if (to_copy < other.errors_.size()) {
      suppressed_count_ += other.errors_.size() - to_copy;
    }

    errors_.insert(errors_.end(), other.errors_.begin(),
                   other.errors_.begin() + static_cast<std::ptrdiff_t>(to_copy));
  }

private:
  std::vector<ParseError> errors_;
  size_t max_errors_;
  bool has_fatal_;
  size_t suppressed_count_;
};

/**
 * @brief Exception thrown for fatal source, encoding and format errors.
 *
 * Carries the ErrorCode and a list of suggested remedies that a caller can
 * show to a user (e.g. "Specify the delimiter explicitly").
 */
class FormatException : public std::runtime_error {
public:
  FormatException(ErrorCode code, const std::string& message,
                  std::vector<std::string> suggested_fixes = {})
      : std::runtime_error(message), code_(code), suggested_fixes_(std::move(suggested_fixes)) {}

  ErrorCode code() const { return code_; }
  const std::vector<std::string>& suggested_fixes() const { return suggested_fixes_; }

private:
  ErrorCode code_;
  std::vector<std::string> suggested_fixes_;
};

/// Convert an ErrorCode to its string representation
const char* error_code_to_string(ErrorCode code);

/// Convert an ErrorSeverity to its string representation
const char* error_severity_to_string(ErrorSeverity severity);

} // namespace datapilot

#endif // DATAPILOT_ERROR_H
