/**
 * @file delimited_parser.h
 * @brief Format adapter for delimited text (CSV, TSV).
 *
 * Orchestrates "detect, then parse": the first sample_size bytes of the
 * source go through encoding detection, are transcoded to UTF-8, and feed
 * the dialect detector. Explicit ParseOptions override every detected value.
 * The decoded stream is then pushed through a RowStateMachine chunk by chunk.
 */

#ifndef DATAPILOT_DELIMITED_PARSER_H
#define DATAPILOT_DELIMITED_PARSER_H

#include "datapilot/dialect.h"
#include "datapilot/encoding.h"
#include "datapilot/format_parser.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace datapilot {

/**
 * @brief Static description of a delimited format flavour.
 */
struct DelimitedFormat {
  std::string name;                    ///< Registry name ("csv", "tsv")
  std::vector<std::string> extensions; ///< Lowercase, with leading dot
  std::optional<char> forced_delimiter; ///< Delimiter implied by the format, if any

  /// Comma-separated values (.csv), delimiter detected
  static DelimitedFormat csv() { return DelimitedFormat{"csv", {".csv"}, std::nullopt}; }

  /// Tab-separated values (.tsv, .tab), delimiter fixed to tab
  static DelimitedFormat tsv() { return DelimitedFormat{"tsv", {".tsv", ".tab"}, '\t'}; }

  bool matches_extension(const std::string& path) const;
};

/**
 * @brief Everything learned from a detection sample.
 */
struct SampleAnalysis {
  EncodingResult encoding;
  DetectionResult dialect;
  size_t decoded_lines = 0; ///< Row terminators (plus an unterminated tail) in the decoded sample
};

/**
 * @brief Detector for one delimited format.
 *
 * Confidence is the delimiter confidence, scaled down when the encoding is
 * uncertain (below 0.6). A format with a forced delimiter only counts the
 * delimiter evidence when that delimiter wins, and adds 0.4 when the path
 * has one of its extensions (capped at 0.95).
 */
class DelimitedDetector : public FormatDetector {
public:
  explicit DelimitedDetector(DelimitedFormat format = DelimitedFormat::csv(),
                             DetectionOptions options = DetectionOptions());

  FormatDetectionResult detect(const DetectionSample& sample) const override;

  /// Decode the sample and run encoding and dialect detection on it
  SampleAnalysis analyze(const DetectionSample& sample) const;

  const DelimitedFormat& format() const { return format_; }

private:
  DelimitedFormat format_;
  DialectDetector dialect_detector_;
};

/**
 * @brief FormatParser for CSV-like input.
 *
 * - The first row is consumed as the header when detected or requested
 * - Data rows are numbered from 0
 * - Rows whose width differs from the header (or the first data row) are
 *   yielded and recorded as INCONSISTENT_FIELD_COUNT
 * - Blank lines are dropped when skip_empty_lines is set
 *
 * @example
 * @code
 * datapilot::ParseOptions options;
 * options.delimiter = ';';
 * datapilot::DelimitedParser parser(options);
 * for (const auto& row : parser.parse_file("export.csv")) {
 *     ...
 * }
 * @endcode
 */
class DelimitedParser : public FormatParser {
public:
  /**
   * @throws std::invalid_argument if explicit dialect options are inconsistent
   * @throws FormatException with UNSUPPORTED_ENCODING for an unknown encoding name
   */
  explicit DelimitedParser(const ParseOptions& options = ParseOptions(),
                           DelimitedFormat format = DelimitedFormat::csv());
  ~DelimitedParser() override;

  DelimitedParser(const DelimitedParser&) = delete;
  DelimitedParser& operator=(const DelimitedParser&) = delete;

  FormatDetectionResult detect(const std::string& path) const override;
  FormatDetectionResult detect(const uint8_t* data, size_t size) const override;
  ValidationResult validate(const std::string& path) const override;

  void open(std::unique_ptr<ByteSource> source) override;
  std::optional<Row> next_row() override;
  const std::vector<std::string>& header() const override;
  ParseStats stats() const override;
  void abort() override;

  std::vector<std::string> extensions() const override;
  std::string format_name() const override;

  const ParseOptions& options() const;

  /// Dialect in effect (valid after open())
  const DialectConfig& dialect() const;

  /// Encoding in effect (valid after open())
  const EncodingResult& encoding() const;

  /// Raw dialect detection on the opening sample (valid after open())
  const DetectionResult& dialect_detection() const;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace datapilot

#endif // DATAPILOT_DELIMITED_PARSER_H
