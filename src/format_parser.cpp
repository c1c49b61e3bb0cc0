#include "datapilot/format_parser.h"

#include <cstdio>

namespace datapilot {

RowIterator::RowIterator(FormatParser* parser) : parser_(parser) {
  if (parser_) {
    current_ = parser_->next_row();
  }
}

RowIterator& RowIterator::operator++() {
  if (parser_ && current_) {
    current_ = parser_->next_row();
  }
  return *this;
}

ValidationResult validate_detection(const FormatDetectionResult& detection) {
  ValidationResult result;
  char pct[16];
  std::snprintf(pct, sizeof(pct), "%.1f%%", detection.confidence * 100.0);

  if (detection.confidence >= HIGH_CONFIDENCE) {
    result.valid = true;
    result.can_proceed = true;
    return result;
  }

  if (detection.confidence >= ACCEPTANCE_FLOOR) {
    result.valid = true;
    result.can_proceed = true;
    result.warnings.push_back("Format detection confidence is moderate (" + std::string(pct) +
                              ")");
    result.suggested_fixes.push_back("Verify the detected delimiter and header settings");
    return result;
  }

  result.valid = false;
  result.can_proceed = false;
  result.errors.push_back("Format detection confidence is too low (" + std::string(pct) + ")");
  result.suggested_fixes.push_back("Specify the delimiter explicitly (e.g. --delimiter ';')");
  result.suggested_fixes.push_back("Check that rows have a consistent number of fields");
  result.suggested_fixes.push_back("Specify the encoding explicitly if the file is not UTF-8");
  return result;
}

} // namespace datapilot
