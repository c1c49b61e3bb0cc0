/**
 * @file dialect.cpp
 * @brief Dialect configuration helpers and statistical dialect detection.
 */

#include "datapilot/dialect.h"

#include "datapilot/logging.h"
#include "datapilot/source.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fast_float/fast_float.h>
#include <map>
#include <sstream>
#include <system_error>
#include <unordered_set>

namespace datapilot {

namespace {

std::string format_char(char c) {
  switch (c) {
  case '\t':
    return "'\\t'";
  case '\0':
    return "none";
  case '\'':
    return "\"'\"";
  default:
    return std::string("'") + c + "'";
  }
}

std::string_view trim(std::string_view s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && (s[begin] == ' ' || s[begin] == '\t')) {
    ++begin;
  }
  while (end > begin && (s[end - 1] == ' ' || s[end - 1] == '\t')) {
    --end;
  }
  return s.substr(begin, end - begin);
}

// Words that commonly appear as column names.
const std::unordered_set<std::string>& known_header_words() {
  static const std::unordered_set<std::string> words = {
      "id",      "name",     "date",    "time",     "type",   "value",  "amount",
      "price",   "count",    "total",   "email",    "phone",  "address", "city",
      "state",   "country",  "status",  "description", "code", "category", "age",
      "year",    "month",    "day",     "first",    "last",   "title",  "score",
      "quantity", "created", "updated", "timestamp", "key",   "label",  "zip",
      "gender",  "department", "salary", "company", "region", "product", "number"};
  return words;
}

// Splits an identifier into lowercase words at '_', ' ', '-' and camelCase humps.
std::vector<std::string> identifier_words(std::string_view cell) {
  std::vector<std::string> words;
  std::string current;
  for (size_t i = 0; i < cell.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(cell[i]);
    if (c == '_' || c == ' ' || c == '-') {
      if (!current.empty()) {
        words.push_back(current);
        current.clear();
      }
      continue;
    }
    if (std::isupper(c) && !current.empty() &&
        std::islower(static_cast<unsigned char>(current.back()))) {
      words.push_back(current);
      current.clear();
    }
    current += static_cast<char>(std::tolower(c));
  }
  if (!current.empty()) {
    words.push_back(current);
  }
  return words;
}

bool has_known_header_word(std::string_view cell) {
  const auto& known = known_header_words();
  for (const auto& word : identifier_words(cell)) {
    if (known.count(word) > 0) {
      return true;
    }
  }
  return false;
}

} // namespace

const char* line_ending_to_string(LineEnding ending) {
  switch (ending) {
  case LineEnding::LF:
    return "LF";
  case LineEnding::CRLF:
    return "CRLF";
  case LineEnding::CR:
    return "CR";
  }
  return "LF";
}

std::string DialectConfig::to_string() const {
  std::ostringstream ss;
  ss << "DialectConfig{delimiter=" << format_char(delimiter) << ", quote=" << format_char(quote)
     << ", escape=";
  if (double_quote()) {
    ss << "double";
  } else {
    ss << format_char(escape);
  }
  ss << ", trim=" << (trim_fields ? "true" : "false") << ", max_field_size=" << max_field_size
     << "}";
  return ss.str();
}

//-----------------------------------------------------------------------------
// DialectDetector
//-----------------------------------------------------------------------------

DialectDetector::DialectDetector(const DetectionOptions& options) : options_(options) {}

DetectionResult DialectDetector::detect_file(const std::string& filename) const {
  auto sample = read_prefix(filename, options_.sample_size);
  return detect(sample.data(), sample.size());
}

DetectionResult DialectDetector::detect(const uint8_t* buf, size_t len) const {
  DetectionResult result;
  count_line_endings(buf, len, result);

  auto lines = split_lines(buf, len, options_.max_lines);
  result.rows_analyzed = lines.size();
  result.candidates = score_delimiters(lines);

  if (lines.size() < 2) {
    // Not enough rows to judge consistency: fall back to the first candidate
    result.delimiter = options_.delimiters.empty() ? ',' : options_.delimiters.front();
    result.delimiter_confidence = 0.5;
    for (const auto& candidate : result.candidates) {
      if (candidate.delimiter == result.delimiter) {
        result.detected_columns = candidate.modal_field_count;
      }
    }
  } else if (!result.candidates.empty()) {
    const auto& best = result.candidates.front();
    result.delimiter = best.delimiter;
    result.delimiter_confidence = best.confidence;
    result.detected_columns = best.modal_field_count;
  }

  result.quote = detect_quote(lines, result.delimiter, result.quote_confidence);
  result.has_header =
      detect_header(lines, result.delimiter, result.quote, result.header_confidence);

  logger()->debug("dialect: delimiter={} ({:.2f}) quote={} ({:.2f}) header={} ({:.2f}) eol={}",
                  format_char(result.delimiter), result.delimiter_confidence,
                  format_char(result.quote), result.quote_confidence, result.has_header,
                  result.header_confidence, line_ending_to_string(result.line_ending));
  return result;
}

std::vector<std::string_view> DialectDetector::split_lines(const uint8_t* buf, size_t len,
                                                           size_t max_lines) {
  std::vector<std::string_view> lines;
  const char* data = reinterpret_cast<const char*>(buf);
  size_t pos = 0;
  if (len >= 3 && buf[0] == 0xEF && buf[1] == 0xBB && buf[2] == 0xBF) {
    pos = 3;
  }

  size_t start = pos;
  while (pos < len && lines.size() < max_lines) {
    char c = data[pos];
    if (c == '\n' || c == '\r') {
      if (pos > start) {
        lines.emplace_back(data + start, pos - start);
      }
      if (c == '\r' && pos + 1 < len && data[pos + 1] == '\n') {
        ++pos;
      }
      start = pos + 1;
    }
    ++pos;
  }
  if (start < len && pos >= len && lines.size() < max_lines) {
    lines.emplace_back(data + start, len - start);
  }
  return lines;
}

void DialectDetector::count_line_endings(const uint8_t* buf, size_t len,
                                         DetectionResult& result) {
  for (size_t i = 0; i < len; ++i) {
    if (buf[i] == '\r') {
      if (i + 1 < len && buf[i + 1] == '\n') {
        ++result.crlf_count;
        ++i;
      } else {
        ++result.cr_count;
      }
    } else if (buf[i] == '\n') {
      ++result.lf_count;
    }
  }

  size_t total = result.crlf_count + result.lf_count + result.cr_count;
  if (total == 0) {
    result.line_ending = LineEnding::LF;
    result.line_ending_confidence = 0.5;
    return;
  }

  // Any CRLF marks a Windows file, even if it was partially normalized to LF
  size_t chosen;
  if (result.crlf_count > 0) {
    result.line_ending = LineEnding::CRLF;
    chosen = result.crlf_count;
  } else if (result.lf_count >= result.cr_count) {
    result.line_ending = LineEnding::LF;
    chosen = result.lf_count;
  } else {
    result.line_ending = LineEnding::CR;
    chosen = result.cr_count;
  }
  result.line_ending_confidence = static_cast<double>(chosen) / static_cast<double>(total);
}

std::vector<DelimiterCandidate>
DialectDetector::score_delimiters(const std::vector<std::string_view>& lines) const {
  std::vector<DelimiterCandidate> candidates;
  candidates.reserve(options_.delimiters.size());

  for (size_t p = 0; p < options_.delimiters.size(); ++p) {
    DelimiterCandidate candidate;
    candidate.delimiter = options_.delimiters[p];
    candidate.priority = p;

    if (!lines.empty()) {
      std::map<size_t, size_t> histogram;
      for (auto line : lines) {
        size_t fields = 1 + static_cast<size_t>(
                                std::count(line.begin(), line.end(), candidate.delimiter));
        ++histogram[fields];
      }

      // Modal field count; a tie goes to the larger count
      size_t modal = 0;
      size_t modal_freq = 0;
      for (const auto& [fields, freq] : histogram) {
        if (freq >= modal_freq) {
          modal = fields;
          modal_freq = freq;
        }
      }

      candidate.modal_field_count = modal;
      candidate.consistency = static_cast<double>(modal_freq) / static_cast<double>(lines.size());
      if (modal >= 2) {
        double width_bonus = std::min(1.0, static_cast<double>(modal - 1) / 4.0);
        candidate.confidence = 0.9 * candidate.consistency + 0.1 * width_bonus;
      } else {
        // Delimiter absent from most lines
        candidate.confidence = 0.5 * candidate.consistency;
      }
    }
    candidates.push_back(candidate);
  }

  std::stable_sort(candidates.begin(), candidates.end());
  return candidates;
}

char DialectDetector::detect_quote(const std::vector<std::string_view>& lines, char delimiter,
                                   double& confidence) const {
  char best_quote = options_.quote_chars.empty() ? '"' : options_.quote_chars.front();
  double best_score = 0.0;
  size_t n_lines = std::min(lines.size(), options_.quote_sample_lines);

  for (char quote : options_.quote_chars) {
    if (quote == delimiter) {
      continue;
    }
    size_t tokens = 0;
    size_t wrapped = 0;
    size_t doubled = 0;

    for (size_t i = 0; i < n_lines; ++i) {
      std::string_view line = lines[i];
      size_t start = 0;
      while (start <= line.size()) {
        size_t end = line.find(delimiter, start);
        if (end == std::string_view::npos) {
          end = line.size();
        }
        std::string_view token = trim(line.substr(start, end - start));
        ++tokens;
        if (token.size() >= 2 && token.front() == quote && token.back() == quote) {
          ++wrapped;
          std::string_view inner = token.substr(1, token.size() - 2);
          for (size_t k = 0; k + 1 < inner.size(); ++k) {
            if (inner[k] == quote && inner[k + 1] == quote) {
              ++doubled;
              ++k;
            }
          }
        }
        start = end + 1;
      }
    }

    if (tokens == 0 || (wrapped == 0 && doubled == 0)) {
      continue;
    }
    double ratio = static_cast<double>(wrapped) / static_cast<double>(tokens);
    double score =
        std::min(1.0, 0.5 + 0.4 * std::min(1.0, ratio / 0.3) + (doubled > 0 ? 0.1 : 0.0));
    if (score > best_score) {
      best_score = score;
      best_quote = quote;
    }
  }

  if (best_score == 0.0) {
    confidence = 0.1;
    return '"';
  }
  confidence = best_score;
  return best_quote;
}

std::vector<std::string> DialectDetector::split_fields(std::string_view line, char delimiter,
                                                       char quote) {
  std::vector<std::string> fields;
  std::string current;
  bool in_quotes = false;
  bool field_quoted = false;

  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (in_quotes) {
      if (c == quote) {
        if (i + 1 < line.size() && line[i + 1] == quote) {
          current += quote;
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        current += c;
      }
    } else if (c == delimiter) {
      fields.push_back(field_quoted ? current : std::string(trim(current)));
      current.clear();
      field_quoted = false;
    } else if (c == quote && trim(current).empty()) {
      in_quotes = true;
      field_quoted = true;
      current.clear();
    } else {
      current += c;
    }
  }
  fields.push_back(field_quoted ? current : std::string(trim(current)));
  return fields;
}

bool DialectDetector::is_numeric(std::string_view cell) {
  cell = trim(cell);
  if (cell.empty()) {
    return false;
  }
  if (cell.front() == '+') {
    cell.remove_prefix(1);
  }
  if (cell.empty()) {
    return false;
  }
  char first = cell.front();
  if (!(std::isdigit(static_cast<unsigned char>(first)) || first == '-' || first == '.')) {
    return false;
  }
  double value = 0.0;
  auto answer = fast_float::from_chars(cell.data(), cell.data() + cell.size(), value);
  return answer.ec == std::errc() && answer.ptr == cell.data() + cell.size();
}

bool DialectDetector::looks_like_header(std::string_view cell) {
  cell = trim(cell);
  if (cell.empty() || cell.size() > 40 || is_numeric(cell)) {
    return false;
  }
  if (!std::isalpha(static_cast<unsigned char>(cell.front())) && cell.front() != '_') {
    return false;
  }
  if (has_known_header_word(cell)) {
    return true;
  }

  bool has_underscore = false;
  bool has_upper_after_lower = false;
  bool all_identifier = true;
  size_t spaces = 0;
  for (size_t i = 0; i < cell.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(cell[i]);
    if (c == '_') {
      has_underscore = true;
    } else if (c == ' ') {
      ++spaces;
    } else if (!std::isalnum(c)) {
      all_identifier = false;
    }
    if (i > 0 && std::isupper(c) && std::islower(static_cast<unsigned char>(cell[i - 1]))) {
      has_upper_after_lower = true;
    }
  }
  if (!all_identifier) {
    return false;
  }
  // snake_case and camelCase identifiers
  if ((has_underscore || has_upper_after_lower) && spaces == 0) {
    return true;
  }
  // Short alphabetic tokens, optionally two or three words ("Unit Price")
  return cell.size() <= 24 && spaces <= 2;
}

bool DialectDetector::detect_header(const std::vector<std::string_view>& lines, char delimiter,
                                    char quote, double& confidence) const {
  if (lines.size() < 2) {
    confidence = 0.5;
    return false;
  }

  std::vector<std::vector<std::string>> rows;
  rows.reserve(lines.size());
  for (auto line : lines) {
    rows.push_back(split_fields(line, delimiter, quote));
  }

  // Modal field count of the data rows
  std::map<size_t, size_t> histogram;
  for (size_t r = 1; r < rows.size(); ++r) {
    ++histogram[rows[r].size()];
  }
  size_t modal = 0;
  size_t modal_freq = 0;
  for (const auto& [fields, freq] : histogram) {
    if (freq >= modal_freq) {
      modal = fields;
      modal_freq = freq;
    }
  }

  const auto& first = rows.front();
  if (first.size() != modal) {
    // Mismatched structure: no reliable verdict either way
    confidence = 0.3;
    return false;
  }

  bool all_numeric = true;
  for (const auto& cell : first) {
    if (!is_numeric(cell)) {
      all_numeric = false;
      break;
    }
  }
  if (all_numeric) {
    confidence = 0.9;
    return false;
  }

  size_t numeric_columns = 0;
  size_t typed_header_columns = 0;
  size_t shaped = 0;
  size_t known = 0;
  double data_shape_total = 0.0;
  size_t data_shape_columns = 0;

  for (size_t col = 0; col < first.size(); ++col) {
    const std::string& head = first[col];
    bool head_shaped = looks_like_header(head);
    if (head_shaped) {
      ++shaped;
    }
    if (has_known_header_word(head)) {
      ++known;
    }

    size_t non_empty = 0;
    size_t numeric = 0;
    size_t data_shaped = 0;
    bool repeats_in_data = false;
    for (size_t r = 1; r < rows.size(); ++r) {
      if (col >= rows[r].size() || rows[r][col].empty()) {
        continue;
      }
      const std::string& cell = rows[r][col];
      ++non_empty;
      if (is_numeric(cell)) {
        ++numeric;
      }
      if (looks_like_header(cell)) {
        ++data_shaped;
      }
      if (cell == head) {
        repeats_in_data = true;
      }
    }
    if (non_empty == 0) {
      continue;
    }

    if (static_cast<double>(numeric) / static_cast<double>(non_empty) >= 0.8) {
      ++numeric_columns;
      if (!head.empty() && !is_numeric(head)) {
        ++typed_header_columns;
      }
    } else {
      double ratio = static_cast<double>(data_shaped) / static_cast<double>(non_empty);
      if (repeats_in_data) {
        ratio = 1.0;
      }
      data_shape_total += ratio;
      ++data_shape_columns;
    }
  }

  double n_cols = static_cast<double>(first.size());
  double shape = static_cast<double>(shaped) / n_cols;
  double score;
  if (numeric_columns > 0) {
    double type = static_cast<double>(typed_header_columns) / static_cast<double>(numeric_columns);
    score = 0.6 * type + 0.4 * shape;
  } else {
    double data_shape =
        data_shape_columns > 0 ? data_shape_total / static_cast<double>(data_shape_columns) : 0.0;
    double known_ratio = static_cast<double>(known) / n_cols;
    score = 0.4 * shape + 0.4 * std::max(0.0, shape - data_shape) + 0.2 * known_ratio;
  }

  confidence = std::min(0.95, 0.5 + std::abs(score - 0.5));
  return score >= 0.5;
}

} // namespace datapilot
