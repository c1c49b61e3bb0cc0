#include "datapilot/error.h"

#include <sstream>

namespace datapilot {

const char* error_code_to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::NONE:
    return "NONE";
  case ErrorCode::UNCLOSED_QUOTE:
    return "UNCLOSED_QUOTE";
  case ErrorCode::INVALID_QUOTE_ESCAPE:
    return "INVALID_QUOTE_ESCAPE";
  case ErrorCode::INCONSISTENT_FIELD_COUNT:
    return "INCONSISTENT_FIELD_COUNT";
  case ErrorCode::FIELD_TOO_LARGE:
    return "FIELD_TOO_LARGE";
  case ErrorCode::EMPTY_HEADER:
    return "EMPTY_HEADER";
  case ErrorCode::INVALID_UTF8:
    return "INVALID_UTF8";
  case ErrorCode::NULL_BYTE:
    return "NULL_BYTE";
  case ErrorCode::UNSUPPORTED_ENCODING:
    return "UNSUPPORTED_ENCODING";
  case ErrorCode::FILE_NOT_FOUND:
    return "FILE_NOT_FOUND";
  case ErrorCode::PERMISSION_DENIED:
    return "PERMISSION_DENIED";
  case ErrorCode::EMPTY_FILE:
    return "EMPTY_FILE";
  case ErrorCode::IO_ERROR:
    return "IO_ERROR";
  case ErrorCode::UNSUPPORTED_FORMAT:
    return "UNSUPPORTED_FORMAT";
  case ErrorCode::DETECTION_FAILED:
    return "DETECTION_FAILED";
  case ErrorCode::INVALID_DIALECT:
    return "INVALID_DIALECT";
  case ErrorCode::INTERNAL_ERROR:
    return "INTERNAL_ERROR";
  default:
    return "UNKNOWN";
  }
}

const char* error_severity_to_string(ErrorSeverity severity) {
  switch (severity) {
  case ErrorSeverity::WARNING:
    return "WARNING";
  case ErrorSeverity::RECOVERABLE:
    return "ERROR";
  case ErrorSeverity::FATAL:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

std::string ParseError::to_string() const {
  std::ostringstream ss;
  ss << "[" << error_severity_to_string(severity) << "] " << error_code_to_string(code)
     << " at row " << row << ", column " << column << " (byte " << byte_offset
     << "): " << message;

  if (!context.empty()) {
    ss << "\n  Context: " << context;
  }

  return ss.str();
}

std::string ErrorCollector::summary() const {
  if (errors_.empty() && suppressed_count_ == 0) {
    return "No errors";
  }

  size_t warnings = 0, recoverable = 0, fatal = 0;
  for (const auto& err : errors_) {
    switch (err.severity) {
    case ErrorSeverity::WARNING:
      warnings++;
      break;
    case ErrorSeverity::RECOVERABLE:
      recoverable++;
      break;
    case ErrorSeverity::FATAL:
      fatal++;
      break;
    }
  }

  std::ostringstream ss;
  ss << "Total errors: " << errors_.size() << " (Warnings: " << warnings
     << ", Errors: " << recoverable << ", Fatal: " << fatal << ")";
  if (suppressed_count_ > 0) {
    ss << ", " << suppressed_count_ << " more suppressed";
  }

  ss << "\n\nDetails:\n";
  for (const auto& err : errors_) {
    ss << err.to_string() << "\n";
  }

  return ss.str();
}

} // namespace datapilot
