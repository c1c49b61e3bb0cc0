/**
 * @file dialect.h
 * @brief Delimited-text dialect configuration and detection.
 *
 * DialectConfig is the fixed input of the row state machine. DialectDetector
 * infers the delimiter, quote character, header presence and line-ending
 * style from a leading sample, each with an independent confidence score.
 *
 * @see RowStateMachine for parsing with a DialectConfig
 * @see DialectDetector for automatic detection
 */

#ifndef DATAPILOT_DIALECT_H
#define DATAPILOT_DIALECT_H

#include "datapilot/error.h"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace datapilot {

/// Row terminator style observed in a sample.
enum class LineEnding { LF, CRLF, CR };

/// Get the display name of a line ending ("LF", "CRLF", "CR").
const char* line_ending_to_string(LineEnding ending);

/**
 * @brief Dialect configuration for the row state machine.
 *
 * - delimiter: field separator (default: comma)
 * - quote: character that opens and closes quoted fields (default: double-quote)
 * - escape: character escaping the next byte inside a quoted field. When it
 *   equals quote, quotes are escaped by doubling (RFC 4180 style).
 * - trim_fields: strip leading/trailing whitespace from unquoted fields
 * - max_field_size: per-field byte ceiling; longer fields are truncated and
 *   reported as FIELD_TOO_LARGE
 */
struct DialectConfig {
  char delimiter = ',';
  char quote = '"';
  char escape = '"';
  bool trim_fields = false;
  size_t max_field_size = DEFAULT_MAX_FIELD_SIZE;

  /// Factory for standard CSV (comma-separated, double-quoted)
  static DialectConfig csv() { return DialectConfig{}; }

  /// Factory for TSV (tab-separated)
  static DialectConfig tsv() { return with_delimiter('\t'); }

  /// Factory for semicolon-separated (European style)
  static DialectConfig semicolon() { return with_delimiter(';'); }

  /// Factory for pipe-separated
  static DialectConfig pipe() { return with_delimiter('|'); }

  /// True when quotes are escaped by doubling them
  bool double_quote() const { return escape == quote; }

  bool operator==(const DialectConfig& other) const {
    return delimiter == other.delimiter && quote == other.quote && escape == other.escape &&
           trim_fields == other.trim_fields && max_field_size == other.max_field_size;
  }

  bool operator!=(const DialectConfig& other) const { return !(*this == other); }

  /// Validate the dialect configuration
  /// @return true if valid, false otherwise
  bool is_valid() const {
    if (delimiter == '\0' || delimiter == '\n' || delimiter == '\r')
      return false;
    if (quote == '\0' || quote == '\n' || quote == '\r')
      return false;
    if (escape == '\0' || escape == '\n' || escape == '\r')
      return false;
    if (delimiter == quote || delimiter == escape)
      return false;
    return max_field_size > 0;
  }

  /// Validate and throw if invalid
  /// @throws std::invalid_argument if dialect is invalid
  void validate() const {
    if (delimiter == '\0') {
      throw std::invalid_argument("Delimiter cannot be empty");
    }
    if (delimiter == '\n' || delimiter == '\r') {
      throw std::invalid_argument("Delimiter cannot be a newline character");
    }
    if (quote == '\0' || quote == '\n' || quote == '\r') {
      throw std::invalid_argument("Quote character must be a printable character");
    }
    if (escape == '\0' || escape == '\n' || escape == '\r') {
      throw std::invalid_argument("Escape character must be a printable character");
    }
    if (delimiter == quote) {
      throw std::invalid_argument("Delimiter and quote character cannot be the same");
    }
    if (delimiter == escape) {
      throw std::invalid_argument("Delimiter and escape character cannot be the same");
    }
    if (max_field_size == 0) {
      throw std::invalid_argument("Maximum field size must be greater than zero");
    }
  }

  /// Returns a human-readable description of the dialect
  std::string to_string() const;

private:
  static DialectConfig with_delimiter(char d) {
    DialectConfig config;
    config.delimiter = d;
    return config;
  }
};

/**
 * @brief Configuration options for dialect detection.
 */
struct DetectionOptions {
  size_t sample_size = 64 * 1024; ///< Bytes read by detect_file()
  size_t max_lines = 100;         ///< Maximum non-blank lines to analyze
  size_t quote_sample_lines = 10; ///< Lines examined for quote evidence

  /// Candidate delimiter characters, in tie-break priority order
  std::vector<char> delimiters = {',', ';', '\t', '|'};

  /// Candidate quote characters, in tie-break priority order
  std::vector<char> quote_chars = {'"', '\''};
};

/**
 * @brief Score of a single delimiter candidate.
 */
struct DelimiterCandidate {
  char delimiter = ',';
  double confidence = 0.0;      ///< Combined score [0, 1]
  double consistency = 0.0;     ///< Fraction of lines with the modal field count
  size_t modal_field_count = 0; ///< Most common field count (ties go to the larger count)
  size_t priority = 0;          ///< Position in DetectionOptions::delimiters

  /// Ranking order: confidence, then field count, then candidate priority.
  bool operator<(const DelimiterCandidate& other) const {
    if (confidence != other.confidence) {
      return confidence > other.confidence;
    }
    if (modal_field_count != other.modal_field_count) {
      return modal_field_count > other.modal_field_count;
    }
    return priority < other.priority;
  }
};

/**
 * @brief Result of dialect detection.
 *
 * Each detected property carries its own confidence; they are not combined
 * into a single score.
 */
struct DetectionResult {
  char delimiter = ',';
  double delimiter_confidence = 0.0;

  char quote = '"';
  double quote_confidence = 0.0;

  bool has_header = false;
  double header_confidence = 0.0;

  LineEnding line_ending = LineEnding::LF;
  double line_ending_confidence = 0.0;

  size_t detected_columns = 0; ///< Modal field count under the chosen delimiter
  size_t rows_analyzed = 0;    ///< Non-blank lines examined

  /// All delimiter candidates, best first
  std::vector<DelimiterCandidate> candidates;

  // Raw line-ending counts (a CR immediately followed by LF counts once, as CRLF)
  size_t crlf_count = 0;
  size_t lf_count = 0;
  size_t cr_count = 0;

  /// Build a state-machine configuration from the detected values
  DialectConfig dialect() const {
    DialectConfig config;
    config.delimiter = delimiter;
    config.quote = quote;
    config.escape = quote;
    return config;
  }

  /// Returns true if the delimiter was established with reasonable confidence
  bool success() const { return delimiter_confidence >= 0.6; }
};

/**
 * @brief Statistical dialect detector.
 *
 * Stateless: detect() is a pure function of the sample. The algorithm:
 * 1. Split the sample into non-blank lines (LF, CRLF or bare CR)
 * 2. Score each delimiter by field-count consistency across lines
 * 3. Score each quote character by how many tokens it fully wraps
 * 4. Compare row 0 with the data rows for header evidence
 * 5. Count line terminators
 *
 * @example
 * @code
 * datapilot::DialectDetector detector;
 * auto result = detector.detect("name;age\nJohn;25\n");
 * if (result.success()) {
 *     auto config = result.dialect();
 * }
 * @endcode
 */
class DialectDetector {
public:
  explicit DialectDetector(const DetectionOptions& options = DetectionOptions());

  /**
   * @brief Detect the dialect of a memory buffer.
   * @param buf Pointer to the sample
   * @param len Length of the sample in bytes
   */
  DetectionResult detect(const uint8_t* buf, size_t len) const;

  DetectionResult detect(std::string_view sample) const {
    return detect(reinterpret_cast<const uint8_t*>(sample.data()), sample.size());
  }

  /**
   * @brief Detect the dialect of a file from its first sample_size bytes.
   * @throws FormatException if the file cannot be read
   */
  DetectionResult detect_file(const std::string& filename) const;

  const DetectionOptions& options() const { return options_; }

  /// Score every delimiter candidate over the given lines, best first
  std::vector<DelimiterCandidate>
  score_delimiters(const std::vector<std::string_view>& lines) const;

  /// Pick the quote character; returns its confidence through @p confidence
  char detect_quote(const std::vector<std::string_view>& lines, char delimiter,
                    double& confidence) const;

  /// Decide header presence; returns its confidence through @p confidence
  bool detect_header(const std::vector<std::string_view>& lines, char delimiter, char quote,
                     double& confidence) const;

  /// Split a sample into non-blank lines, skipping a leading UTF-8 BOM
  static std::vector<std::string_view> split_lines(const uint8_t* buf, size_t len,
                                                   size_t max_lines);

  /// Split one line into unescaped fields, honoring the quote character
  static std::vector<std::string> split_fields(std::string_view line, char delimiter, char quote);

  /// True if the cell parses completely as a number (integer, decimal or exponent)
  static bool is_numeric(std::string_view cell);

  /// True if the cell looks like a column name (snake_case, camelCase, short word, ...)
  static bool looks_like_header(std::string_view cell);

private:
  DetectionOptions options_;

  static void count_line_endings(const uint8_t* buf, size_t len, DetectionResult& result);
};

} // namespace datapilot

#endif // DATAPILOT_DIALECT_H
