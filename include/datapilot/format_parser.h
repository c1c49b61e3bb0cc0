/**
 * @file format_parser.h
 * @brief Uniform contract between format handlers and their callers.
 *
 * A FormatParser turns one input into a lazy, one-shot sequence of rows and
 * can report how confident it is that an input is in its format. The
 * FormatRegistry selects between FormatParser implementations using their
 * FormatDetector.
 *
 * @example
 * @code
 * datapilot::DelimitedParser parser;
 * for (const auto& row : parser.parse_file("data.csv")) {
 *     consume(row.fields);
 * }
 * auto stats = parser.stats();
 * @endcode
 */

#ifndef DATAPILOT_FORMAT_PARSER_H
#define DATAPILOT_FORMAT_PARSER_H

#include "datapilot/options.h"
#include "datapilot/source.h"
#include "datapilot/types.h"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace datapilot {

/**
 * @brief What a detector concluded about an input.
 *
 * `metadata` carries the supporting evidence as display strings (detected
 * delimiter, per-candidate scores, line ending, ...).
 */
struct FormatDetectionResult {
  std::string format;
  double confidence = 0.0;
  std::string encoding = "utf8";
  size_t estimated_rows = 0;
  size_t estimated_columns = 0;
  std::map<std::string, std::string> metadata;
};

/**
 * @brief Verdict of FormatParser::validate().
 */
struct ValidationResult {
  bool valid = false;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
  std::vector<std::string> suggested_fixes;
  bool can_proceed = false;
};

/// Confidence at or above which detection is accepted without warnings
constexpr double HIGH_CONFIDENCE = 0.8;

/// Confidence below which an input is rejected
constexpr double ACCEPTANCE_FLOOR = 0.5;

/**
 * @brief Apply the validation policy to a detection result.
 *
 * - confidence >= 0.8: valid
 * - 0.5 <= confidence < 0.8: valid with a confidence warning
 * - confidence < 0.5: invalid, cannot proceed, with suggested fixes
 */
ValidationResult validate_detection(const FormatDetectionResult& detection);

/**
 * @brief A bounded prefix of an input handed to detectors.
 */
struct DetectionSample {
  const uint8_t* data = nullptr;
  size_t size = 0;
  std::string path;                  ///< Empty for in-memory input
  std::optional<size_t> total_size;  ///< Size of the whole input, if known

  /// True if the sample is known to stop before the end of the input
  bool truncated() const { return total_size && *total_size > size; }
};

/**
 * @brief Confidence scorer for one format.
 *
 * Implementations must be stateless and safe to call concurrently.
 */
class FormatDetector {
public:
  virtual ~FormatDetector() = default;

  virtual FormatDetectionResult detect(const DetectionSample& sample) const = 0;
};

class FormatParser;

/**
 * @brief Input iterator over the rows of a FormatParser.
 */
class RowIterator {
public:
  using iterator_category = std::input_iterator_tag;
  using value_type = Row;
  using difference_type = std::ptrdiff_t;
  using pointer = const Row*;
  using reference = const Row&;

  /// Create end iterator
  RowIterator() = default;

  /// Create iterator positioned on the parser's next row
  explicit RowIterator(FormatParser* parser);

  reference operator*() const { return *current_; }
  pointer operator->() const { return &*current_; }

  RowIterator& operator++();

  bool operator==(const RowIterator& other) const {
    return at_end() == other.at_end() && (at_end() || parser_ == other.parser_);
  }
  bool operator!=(const RowIterator& other) const { return !(*this == other); }

private:
  FormatParser* parser_ = nullptr;
  std::optional<Row> current_;

  bool at_end() const { return !current_.has_value(); }
};

/**
 * @brief One-shot range of rows for range-based for.
 *
 * Iterating consumes the parser; a second begin() continues where the first
 * loop stopped rather than rewinding.
 */
class RowRange {
public:
  explicit RowRange(FormatParser* parser) : parser_(parser) {}

  RowIterator begin() { return RowIterator(parser_); }
  RowIterator end() { return RowIterator(); }

private:
  FormatParser* parser_;
};

/**
 * @brief Format adapter: detect, validate and parse one input.
 *
 * Options are fixed at construction. parse() may be called once per
 * instance; create a new adapter to parse again.
 */
class FormatParser {
public:
  virtual ~FormatParser() = default;

  /// Detect from the first sample_size bytes of a file
  /// @throws FormatException if the file cannot be read
  virtual FormatDetectionResult detect(const std::string& path) const = 0;

  /// Detect from an in-memory sample
  virtual FormatDetectionResult detect(const uint8_t* data, size_t size) const = 0;

  /// Check whether a file can be parsed; source errors are reported, not thrown
  virtual ValidationResult validate(const std::string& path) const = 0;

  /**
   * @brief Start parsing a source.
   * @throws std::logic_error if a parse was already started on this instance
   * @throws FormatException for empty or unreadable sources
   */
  virtual void open(std::unique_ptr<ByteSource> source) = 0;

  /// Next data row, or std::nullopt at end of input, after max_rows, or after abort()
  virtual std::optional<Row> next_row() = 0;

  /// Column names (empty when the input has no header row)
  virtual const std::vector<std::string>& header() const = 0;

  virtual ParseStats stats() const = 0;

  /// Cooperative cancellation; next_row() returns std::nullopt afterwards
  virtual void abort() = 0;

  /// Declared file extensions, lowercase with leading dot
  virtual std::vector<std::string> extensions() const = 0;

  virtual std::string format_name() const = 0;

  /// open() the source and return a lazy range over its rows
  RowRange parse(std::unique_ptr<ByteSource> source) {
    open(std::move(source));
    return RowRange(this);
  }

  /// parse() a file by path
  RowRange parse_file(const std::string& path) {
    return parse(std::make_unique<FileSource>(path));
  }
};

} // namespace datapilot

#endif // DATAPILOT_FORMAT_PARSER_H
