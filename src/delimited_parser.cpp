/**
 * @file delimited_parser.cpp
 * @brief CSV/TSV format adapter: detection, validation and row production.
 */

#include "datapilot/delimited_parser.h"

#include "datapilot/error.h"
#include "datapilot/logging.h"
#include "datapilot/streaming.h"

#include <algorithm>
#include <atomic>
#include <deque>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace datapilot {

namespace {

std::string format_confidence(double value) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(2) << value;
  return ss.str();
}

std::string printable_char(char c) {
  switch (c) {
  case '\t':
    return "\\t";
  case '\n':
    return "\\n";
  case '\r':
    return "\\r";
  default:
    return std::string(1, c);
  }
}

// Label for an encoding the caller named explicitly
std::string encoding_label(CharEncoding enc) {
  switch (enc) {
  case CharEncoding::UTF8:
    return "utf8";
  case CharEncoding::UTF16_LE:
    return "utf16le";
  case CharEncoding::UTF16_BE:
    return "utf16be";
  case CharEncoding::LATIN1:
    return "latin1";
  case CharEncoding::UNKNOWN:
    break;
  }
  return "unknown";
}

// A sample that stops before the end of the input usually ends mid-row; drop
// the incomplete last line so it does not distort field counts.
std::string_view complete_lines(std::string_view text, bool truncated) {
  if (!truncated) {
    return text;
  }
  size_t last = text.find_last_of("\r\n");
  if (last == std::string_view::npos) {
    return text;
  }
  return text.substr(0, last + 1);
}

size_t count_rows(const DetectionResult& dialect, std::string_view text) {
  size_t rows = dialect.crlf_count + dialect.lf_count + dialect.cr_count;
  if (!text.empty() && text.back() != '\n' && text.back() != '\r') {
    ++rows;
  }
  return rows;
}

// Bytes of the sample that remain after a BOM whose encoding matches @p enc
size_t matching_bom_length(const EncodingResult& detected, CharEncoding enc) {
  if (!detected.has_bom) {
    return 0;
  }
  return detected.detected == enc ? detected.bom_length : 0;
}

} // anonymous namespace

//-----------------------------------------------------------------------------
// DelimitedFormat
//-----------------------------------------------------------------------------

bool DelimitedFormat::matches_extension(const std::string& path) const {
  std::string ext = file_extension(path);
  if (ext.empty()) {
    return false;
  }
  return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

//-----------------------------------------------------------------------------
// DelimitedDetector
//-----------------------------------------------------------------------------

DelimitedDetector::DelimitedDetector(DelimitedFormat format, DetectionOptions options)
    : format_(std::move(format)), dialect_detector_(options) {}

SampleAnalysis DelimitedDetector::analyze(const DetectionSample& sample) const {
  SampleAnalysis analysis;
  analysis.encoding = detect_encoding(sample.data, sample.size);

  std::string decoded;
  if (analysis.encoding.detected == CharEncoding::UTF8) {
    size_t skip = std::min(analysis.encoding.bom_length, sample.size);
    decoded.assign(reinterpret_cast<const char*>(sample.data) + skip, sample.size - skip);
  } else {
    Utf8Transcoder transcoder(analysis.encoding.detected, analysis.encoding.bom_length);
    decoded = transcoder.convert(sample.data, sample.size);
    if (!sample.truncated()) {
      decoded += transcoder.finish();
    }
  }

  std::string_view text = complete_lines(decoded, sample.truncated());
  analysis.dialect = dialect_detector_.detect(text);
  analysis.decoded_lines = count_rows(analysis.dialect, text);
  return analysis;
}

FormatDetectionResult DelimitedDetector::detect(const DetectionSample& sample) const {
  FormatDetectionResult result;
  result.format = format_.name;

  SampleAnalysis analysis = analyze(sample);
  const DetectionResult& dialect = analysis.dialect;
  result.encoding = analysis.encoding.encoding;

  // Uncertain encoding means the decoded text may not be what the file holds
  double encoding_factor = std::min(1.0, analysis.encoding.confidence / 0.6);

  double confidence = 0.0;
  if (format_.forced_delimiter) {
    if (!sample.path.empty() && format_.matches_extension(sample.path)) {
      confidence += 0.4;
    }
    if (dialect.delimiter == *format_.forced_delimiter) {
      confidence += dialect.delimiter_confidence;
    }
    confidence = std::min(0.95, confidence);
  } else {
    confidence = dialect.delimiter_confidence;
  }
  result.confidence = confidence * encoding_factor;

  result.estimated_columns = dialect.detected_columns;
  size_t rows = analysis.decoded_lines;
  if (sample.truncated() && sample.size > 0) {
    double scale = static_cast<double>(*sample.total_size) / static_cast<double>(sample.size);
    rows = static_cast<size_t>(static_cast<double>(rows) * scale);
  }
  if (dialect.has_header && rows > 0) {
    --rows;
  }
  result.estimated_rows = rows;

  result.metadata["delimiter"] = printable_char(dialect.delimiter);
  result.metadata["delimiter_confidence"] = format_confidence(dialect.delimiter_confidence);
  result.metadata["quote"] = printable_char(dialect.quote);
  result.metadata["quote_confidence"] = format_confidence(dialect.quote_confidence);
  result.metadata["has_header"] = dialect.has_header ? "true" : "false";
  result.metadata["header_confidence"] = format_confidence(dialect.header_confidence);
  result.metadata["line_ending"] = line_ending_to_string(dialect.line_ending);
  result.metadata["line_ending_confidence"] = format_confidence(dialect.line_ending_confidence);
  result.metadata["encoding_confidence"] = format_confidence(analysis.encoding.confidence);
  result.metadata["has_bom"] = analysis.encoding.has_bom ? "true" : "false";

  std::ostringstream candidates;
  for (size_t i = 0; i < dialect.candidates.size(); ++i) {
    const auto& c = dialect.candidates[i];
    if (i > 0) {
      candidates << ", ";
    }
    candidates << "'" << printable_char(c.delimiter) << "'=" << format_confidence(c.confidence);
  }
  result.metadata["candidates"] = candidates.str();

  logger()->debug("{} detection on {}: delimiter '{}' ({:.2f}), encoding {} ({:.2f}) -> {:.2f}",
                  format_.name, sample.path.empty() ? "<memory>" : sample.path,
                  printable_char(dialect.delimiter), dialect.delimiter_confidence,
                  result.encoding, analysis.encoding.confidence, result.confidence);
  return result;
}

//-----------------------------------------------------------------------------
// DelimitedParser implementation
//-----------------------------------------------------------------------------

struct DelimitedParser::Impl {
  ParseOptions options;
  DelimitedFormat format;
  DetectionOptions detection_options;
  std::optional<CharEncoding> explicit_encoding;

  // Parse session
  std::unique_ptr<ByteSource> source;
  bool opened = false;
  bool exhausted = false;
  bool finished = false;
  std::atomic<bool> aborted{false};

  EncodingResult encoding;
  DetectionResult detection;
  DialectConfig dialect;
  std::optional<Utf8Transcoder> transcoder;
  std::optional<RowStateMachine> machine;

  std::deque<Row> pending;
  std::vector<uint8_t> buffer;
  std::vector<std::string> header;
  bool expect_header = false;
  size_t expected_width = 0;
  uint64_t next_index = 0;

  ErrorCollector errors;
  size_t machine_error_cursor = 0;

  size_t bytes_read = 0;
  Clock::time_point start_time = Clock::now();
  std::optional<Clock::time_point> end_time;

  Impl(const ParseOptions& opts, DelimitedFormat fmt) : options(opts), format(std::move(fmt)) {
    detection_options.sample_size = options.sample_size;

    if (options.encoding) {
      CharEncoding enc = parse_encoding_name(*options.encoding);
      if (enc == CharEncoding::UNKNOWN) {
        throw FormatException(ErrorCode::UNSUPPORTED_ENCODING,
                              "Unsupported encoding: " + *options.encoding,
                              {"Use one of: utf-8, utf-16le, utf-16be, latin1"});
      }
      explicit_encoding = enc;
    }

    if (options.chunk_size == 0) {
      throw std::invalid_argument("Chunk size must be greater than zero");
    }
    if (options.sample_size == 0) {
      throw std::invalid_argument("Sample size must be greater than zero");
    }

    // An explicit quote or escape character is never a delimiter candidate
    auto& candidates = detection_options.delimiters;
    for (const auto& reserved : {options.quote, options.escape}) {
      if (reserved) {
        candidates.erase(std::remove(candidates.begin(), candidates.end(), *reserved),
                         candidates.end());
      }
    }

    // Reject contradictory explicit dialect values before any bytes are read
    DialectConfig check;
    if (!candidates.empty()) {
      check.delimiter = candidates.front();
    }
    check.max_field_size = options.max_field_size;
    apply_overrides(check);
    check.validate();
  }

  void apply_overrides(DialectConfig& config) const {
    if (format.forced_delimiter) {
      config.delimiter = *format.forced_delimiter;
    }
    if (options.delimiter) {
      config.delimiter = *options.delimiter;
    }
    if (options.quote) {
      config.quote = *options.quote;
    } else if (config.quote == config.delimiter) {
      config.quote = config.delimiter == '"' ? '\'' : '"';
    }
    config.escape = options.escape.value_or(config.quote);
    config.trim_fields = options.trim_fields;
    config.max_field_size = options.max_field_size;
  }

  void open(std::unique_ptr<ByteSource> src) {
    if (opened) {
      throw std::logic_error("A DelimitedParser can only parse one source; create a new instance");
    }
    if (!src) {
      throw std::invalid_argument("Source cannot be null");
    }
    opened = true;
    source = std::move(src);
    start_time = Clock::now();

    std::vector<uint8_t> prefix;
    read_fully(*source, prefix, options.sample_size);
    bytes_read = prefix.size();
    if (prefix.empty()) {
      throw FormatException(ErrorCode::EMPTY_FILE, "File is empty: " + source->name(),
                            {"Check that the file contains data"});
    }
    bool truncated = prefix.size() == options.sample_size;

    EncodingResult detected = detect_encoding(prefix.data(), prefix.size());
    if (explicit_encoding) {
      encoding = EncodingResult();
      encoding.encoding = encoding_label(*explicit_encoding);
      encoding.detected = *explicit_encoding;
      encoding.confidence = 1.0;
      encoding.bom_length = matching_bom_length(detected, *explicit_encoding);
      encoding.has_bom = encoding.bom_length > 0;
      encoding.needs_transcoding = *explicit_encoding != CharEncoding::UTF8;
    } else {
      encoding = detected;
    }
    transcoder.emplace(encoding.detected, encoding.bom_length);

    std::string decoded = transcoder->convert(prefix.data(), prefix.size());
    std::string_view sample_text = complete_lines(decoded, truncated);
    DialectDetector detector(detection_options);
    detection = detector.detect(sample_text);

    dialect = detection.dialect();
    apply_overrides(dialect);

    // Quote and header evidence depend on how the rows split
    auto lines = DialectDetector::split_lines(reinterpret_cast<const uint8_t*>(sample_text.data()),
                                              sample_text.size(), detection_options.max_lines);
    if (!options.quote && dialect.delimiter != detection.delimiter) {
      double confidence = 0.0;
      char quote = detector.detect_quote(lines, dialect.delimiter, confidence);
      if (quote != dialect.delimiter) {
        dialect.quote = quote;
        dialect.escape = options.escape.value_or(quote);
      }
    }
    bool detected_header = detection.has_header;
    if (!options.has_header &&
        (dialect.delimiter != detection.delimiter || dialect.quote != detection.quote)) {
      double confidence = 0.0;
      detected_header = detector.detect_header(lines, dialect.delimiter, dialect.quote, confidence);
    }
    expect_header = options.has_header.value_or(detected_header);

    machine.emplace(dialect);
    enqueue(machine->process_chunk(decoded));

    // Make header() available right after open() when the sample holds it
    while (expect_header && !pending.empty()) {
      Row row = std::move(pending.front());
      pending.pop_front();
      accept(std::move(row));
    }

    logger()->debug("Parsing {} as {}: {}, encoding {}, header {}", source->name(), format.name,
                    dialect.to_string(), encoding.encoding, expect_header ? "yes" : "no");
  }

  void enqueue(std::vector<Row>&& rows) {
    for (auto& row : rows) {
      pending.push_back(std::move(row));
    }
  }

  // Pull state-machine errors up to machine row @p machine_row into the
  // adapter's collector, attributed to data row @p data_row.
  void absorb_machine_errors(uint64_t machine_row, uint64_t data_row) {
    const auto& machine_errors = machine->error_collector().errors();
    while (machine_error_cursor < machine_errors.size() &&
           machine_errors[machine_error_cursor].row <= machine_row) {
      ParseError error = machine_errors[machine_error_cursor++];
      error.row = data_row;
      errors.add_error(error);
    }
  }

  // Read the next chunk into the queue; false once the source is exhausted
  bool fill() {
    if (exhausted) {
      return false;
    }
    buffer.resize(options.chunk_size);
    size_t n = source->read(buffer.data(), buffer.size());
    if (n > 0) {
      bytes_read += n;
      enqueue(machine->process_chunk(transcoder->convert(buffer.data(), n)));
      return true;
    }

    exhausted = true;
    enqueue(machine->process_chunk(transcoder->finish()));
    if (auto last = machine->finalize()) {
      pending.push_back(std::move(*last));
    }
    return true;
  }

  std::optional<Row> accept(Row&& row) {
    bool is_header = expect_header;
    absorb_machine_errors(row.index, next_index);

    if (options.skip_empty_lines && row.is_blank()) {
      return std::nullopt;
    }

    if (is_header) {
      expect_header = false;
      header = std::move(row.fields);
      expected_width = header.size();
      for (size_t i = 0; i < header.size(); ++i) {
        if (header[i].empty()) {
          errors.add_error(ErrorCode::EMPTY_HEADER, ErrorSeverity::WARNING, 0, i + 1,
                           row.metadata.byte_offset, "Header column " + std::to_string(i + 1) +
                                                         " has an empty name");
        }
      }
      return std::nullopt;
    }

    if (!row.is_blank()) {
      if (expected_width == 0) {
        expected_width = row.field_count();
      } else if (row.field_count() != expected_width) {
        errors.add_error(ErrorCode::INCONSISTENT_FIELD_COUNT, ErrorSeverity::RECOVERABLE,
                         next_index, 0, row.metadata.byte_offset,
                         "Expected " + std::to_string(expected_width) + " fields but found " +
                             std::to_string(row.field_count()),
                         row.raw_line.substr(0, 80));
      }
    }

    row.index = next_index++;
    return std::move(row);
  }

  void finish() {
    if (finished) {
      return;
    }
    finished = true;
    end_time = Clock::now();
    if (machine) {
      absorb_machine_errors(std::numeric_limits<uint64_t>::max(), next_index);
    }
    if (errors.has_errors()) {
      logger()->debug("Finished {}: {} rows, {}", source ? source->name() : "<none>", next_index,
                      errors.summary());
    } else {
      logger()->debug("Finished {}: {} rows, no errors", source ? source->name() : "<none>",
                      next_index);
    }
  }

  std::optional<Row> next_row() {
    if (!opened) {
      throw std::logic_error("open() must be called before reading rows");
    }
    while (true) {
      if (aborted.load(std::memory_order_relaxed)) {
        pending.clear();
        finish();
        return std::nullopt;
      }
      if (options.max_rows > 0 && next_index >= options.max_rows) {
        finish();
        return std::nullopt;
      }
      while (!pending.empty()) {
        Row row = std::move(pending.front());
        pending.pop_front();
        if (auto accepted = accept(std::move(row))) {
          if (options.max_rows > 0 && next_index >= options.max_rows) {
            finish();
          }
          return accepted;
        }
      }
      if (!fill()) {
        finish();
        return std::nullopt;
      }
    }
  }

  ParseStats stats() const {
    ParseStats stats;
    stats.bytes_processed = bytes_read;
    stats.rows_processed = next_index;
    stats.errors = errors.errors();
    stats.suppressed_errors = errors.suppressed_count();
    stats.start_time = start_time;
    stats.end_time = end_time;
    return stats;
  }
};

DelimitedParser::DelimitedParser(const ParseOptions& options, DelimitedFormat format)
    : impl_(std::make_unique<Impl>(options, std::move(format))) {}

DelimitedParser::~DelimitedParser() = default;

FormatDetectionResult DelimitedParser::detect(const std::string& path) const {
  FileSource source(path);
  std::vector<uint8_t> sample;
  read_fully(source, sample, impl_->options.sample_size);

  DetectionSample input;
  input.data = sample.data();
  input.size = sample.size();
  input.path = path;
  input.total_size = source.size_hint();
  return DelimitedDetector(impl_->format, impl_->detection_options).detect(input);
}

FormatDetectionResult DelimitedParser::detect(const uint8_t* data, size_t size) const {
  DetectionSample input;
  input.data = data;
  input.size = std::min(size, impl_->options.sample_size);
  input.total_size = size;
  return DelimitedDetector(impl_->format, impl_->detection_options).detect(input);
}

ValidationResult DelimitedParser::validate(const std::string& path) const {
  std::vector<uint8_t> sample;
  DetectionSample input;
  try {
    FileSource source(path);
    if (source.size_hint() == std::optional<size_t>(0)) {
      ValidationResult result;
      result.errors.push_back("File is empty: " + path);
      result.suggested_fixes.push_back("Check that the file contains data");
      return result;
    }
    read_fully(source, sample, impl_->options.sample_size);
    input.total_size = source.size_hint();
  } catch (const FormatException& e) {
    ValidationResult result;
    result.errors.push_back(e.what());
    result.suggested_fixes = e.suggested_fixes();
    return result;
  }
  input.data = sample.data();
  input.size = sample.size();
  input.path = path;

  DelimitedDetector detector(impl_->format, impl_->detection_options);
  ValidationResult result = validate_detection(detector.detect(input));
  if (detect_encoding(sample.data(), sample.size()).confidence < 0.6) {
    result.warnings.push_back("Encoding could not be determined reliably");
    result.suggested_fixes.push_back("Specify the encoding explicitly (e.g. --encoding latin1)");
  }
  return result;
}

void DelimitedParser::open(std::unique_ptr<ByteSource> source) {
  impl_->open(std::move(source));
}

std::optional<Row> DelimitedParser::next_row() {
  return impl_->next_row();
}

const std::vector<std::string>& DelimitedParser::header() const {
  return impl_->header;
}

ParseStats DelimitedParser::stats() const {
  return impl_->stats();
}

void DelimitedParser::abort() {
  impl_->aborted.store(true);
  if (impl_->machine) {
    impl_->machine->abort();
  }
}

std::vector<std::string> DelimitedParser::extensions() const {
  return impl_->format.extensions;
}

std::string DelimitedParser::format_name() const {
  return impl_->format.name;
}

const ParseOptions& DelimitedParser::options() const {
  return impl_->options;
}

const DialectConfig& DelimitedParser::dialect() const {
  return impl_->dialect;
}

const EncodingResult& DelimitedParser::encoding() const {
  return impl_->encoding;
}

const DetectionResult& DelimitedParser::dialect_detection() const {
  return impl_->detection;
}

} // namespace datapilot
