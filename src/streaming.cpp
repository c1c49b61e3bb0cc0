/**
 * @file streaming.cpp
 * @brief Implementation of the chunk-resumable row state machine.
 */

#include "datapilot/streaming.h"

#include <atomic>
#include <string>

namespace datapilot {

const char* parser_state_to_string(ParserState state) {
  switch (state) {
  case ParserState::FIELD_START:
    return "FIELD_START";
  case ParserState::IN_FIELD:
    return "IN_FIELD";
  case ParserState::IN_QUOTED_FIELD:
    return "IN_QUOTED_FIELD";
  case ParserState::QUOTE_IN_QUOTED_FIELD:
    return "QUOTE_IN_QUOTED_FIELD";
  case ParserState::ESCAPE_IN_QUOTED_FIELD:
    return "ESCAPE_IN_QUOTED_FIELD";
  case ParserState::AFTER_CR:
    return "AFTER_CR";
  }
  return "UNKNOWN";
}

//-----------------------------------------------------------------------------
// RowStateMachine implementation
//-----------------------------------------------------------------------------

struct RowStateMachine::Impl {
  DialectConfig config;
  ErrorCollector errors;
  std::atomic<bool> aborted{false};

  ParserState state = ParserState::FIELD_START;

  // Field being built
  std::string field;
  bool field_is_quoted = false;
  bool field_truncated = false;
  size_t field_start_offset = 0;

  // Row being built
  std::vector<std::string> row_fields;
  std::string raw;
  bool row_has_quoted = false;
  bool row_open = false;
  size_t row_start_offset = 0;
  size_t row_start_line = 1;

  // Position tracking
  size_t offset = 0; // Absolute offset of the next byte
  size_t line = 1;   // Physical line of the next byte
  bool prev_cr = false;

  uint64_t rows_emitted = 0;
  Clock::time_point start_time = Clock::now();
  std::optional<Clock::time_point> end_time;

  explicit Impl(const DialectConfig& cfg) : config(cfg) {}

  void reset() {
    errors.clear();
    aborted.store(false);
    state = ParserState::FIELD_START;
    field.clear();
    field_is_quoted = false;
    field_truncated = false;
    field_start_offset = 0;
    row_fields.clear();
    raw.clear();
    row_has_quoted = false;
    row_open = false;
    row_start_offset = 0;
    row_start_line = 1;
    offset = 0;
    line = 1;
    prev_cr = false;
    rows_emitted = 0;
    start_time = Clock::now();
    end_time.reset();
  }

  void clear_pending() {
    field.clear();
    row_fields.clear();
    raw.clear();
    row_open = false;
  }

  // Append a data byte to the current field. Bytes past max_field_size are
  // dropped from both the field and raw_line; the first drop is recorded.
  void append(char c, size_t pos) {
    if (field.size() >= config.max_field_size) {
      if (!field_truncated) {
        field_truncated = true;
        errors.add_error(ErrorCode::FIELD_TOO_LARGE, ErrorSeverity::RECOVERABLE, rows_emitted,
                         row_fields.size() + 1, pos,
                         "Field exceeds maximum size of " + std::to_string(config.max_field_size) +
                             " bytes and was truncated");
      }
      return;
    }
    field += c;
    raw += c;
  }

  void emit_field() {
    if (config.trim_fields && !field_is_quoted) {
      size_t begin = field.find_first_not_of(" \t\v\f");
      if (begin == std::string::npos) {
        field.clear();
      } else {
        size_t end = field.find_last_not_of(" \t\v\f");
        field = field.substr(begin, end - begin + 1);
      }
    }
    row_fields.push_back(std::move(field));
    field.clear();
    field_is_quoted = false;
    field_truncated = false;
  }

  void emit_row(std::vector<Row>& out) {
    Row row;
    row.index = rows_emitted++;
    row.fields = std::move(row_fields);
    row.raw_line = std::move(raw);
    row.metadata.byte_offset = row_start_offset;
    row.metadata.line_number = row_start_line;
    row.metadata.has_quoted_field = row_has_quoted;
    out.push_back(std::move(row));

    row_fields.clear();
    raw.clear();
    row_has_quoted = false;
    row_open = false;
  }

  void end_row(char terminator, std::vector<Row>& out) {
    emit_field();
    emit_row(out);
    state = terminator == '\r' ? ParserState::AFTER_CR : ParserState::FIELD_START;
  }

  void step(char c, std::vector<Row>& out) {
    const size_t pos = offset++;
    const char delim = config.delimiter;
    const char quote = config.quote;
    const char escape = config.escape;

    if (state == ParserState::AFTER_CR) {
      state = ParserState::FIELD_START;
      if (c == '\n') {
        // Second half of CRLF; the row was already emitted at CR
        prev_cr = false;
        return;
      }
    }

    if (!row_open) {
      row_open = true;
      row_start_offset = pos;
      row_start_line = line;
    }

    const bool terminator = c == '\n' || c == '\r';

    switch (state) {
    case ParserState::FIELD_START:
      if (c == quote) {
        state = ParserState::IN_QUOTED_FIELD;
        field_is_quoted = true;
        row_has_quoted = true;
        field_start_offset = pos;
        raw += c;
      } else if (c == delim) {
        raw += c;
        emit_field();
      } else if (terminator) {
        end_row(c, out);
      } else {
        append(c, pos);
        state = ParserState::IN_FIELD;
      }
      break;

    case ParserState::IN_FIELD:
      if (c == delim) {
        raw += c;
        emit_field();
        state = ParserState::FIELD_START;
      } else if (terminator) {
        end_row(c, out);
      } else {
        append(c, pos);
      }
      break;

    case ParserState::IN_QUOTED_FIELD:
      if (c == quote) {
        raw += c;
        state = ParserState::QUOTE_IN_QUOTED_FIELD;
      } else if (c == escape) {
        raw += c;
        state = ParserState::ESCAPE_IN_QUOTED_FIELD;
      } else {
        append(c, pos);
      }
      break;

    case ParserState::ESCAPE_IN_QUOTED_FIELD:
      append(c, pos);
      state = ParserState::IN_QUOTED_FIELD;
      break;

    case ParserState::QUOTE_IN_QUOTED_FIELD:
      if (c == quote) {
        // Doubled quote: one literal quote
        append(c, pos);
        state = ParserState::IN_QUOTED_FIELD;
      } else if (c == delim) {
        raw += c;
        emit_field();
        state = ParserState::FIELD_START;
      } else if (terminator) {
        end_row(c, out);
      } else {
        // Stray character after a closing quote: close the quoted field and
        // start a new unquoted one with this character
        errors.add_error(ErrorCode::INVALID_QUOTE_ESCAPE, ErrorSeverity::RECOVERABLE,
                         rows_emitted, row_fields.size() + 1, pos,
                         "Unexpected character after closing quote");
        emit_field();
        append(c, pos);
        state = ParserState::IN_FIELD;
      }
      break;

    case ParserState::AFTER_CR:
      // Handled above
      break;
    }

    if (c == '\n') {
      if (!prev_cr) {
        ++line;
      }
      prev_cr = false;
    } else if (c == '\r') {
      ++line;
      prev_cr = true;
    } else {
      prev_cr = false;
    }
  }

  std::vector<Row> process_chunk(const uint8_t* data, size_t len) {
    std::vector<Row> out;
    if (aborted.load(std::memory_order_relaxed)) {
      clear_pending();
      return out;
    }
    for (size_t i = 0; i < len; ++i) {
      step(static_cast<char>(data[i]), out);
    }
    return out;
  }

  std::optional<Row> finalize() {
    end_time = Clock::now();
    if (aborted.load(std::memory_order_relaxed)) {
      clear_pending();
      return std::nullopt;
    }

    std::vector<Row> out;
    switch (state) {
    case ParserState::FIELD_START:
      // A trailing delimiter leaves an open row with one more (empty) field
      if (!row_fields.empty()) {
        emit_field();
        emit_row(out);
      }
      break;
    case ParserState::IN_FIELD:
    case ParserState::QUOTE_IN_QUOTED_FIELD:
      emit_field();
      emit_row(out);
      break;
    case ParserState::IN_QUOTED_FIELD:
    case ParserState::ESCAPE_IN_QUOTED_FIELD:
      errors.add_error(ErrorCode::UNCLOSED_QUOTE, ErrorSeverity::RECOVERABLE, rows_emitted,
                       row_fields.size() + 1, field_start_offset,
                       "Quoted field not closed before end of input");
      emit_field();
      emit_row(out);
      break;
    case ParserState::AFTER_CR:
      break;
    }
    state = ParserState::FIELD_START;

    if (out.empty()) {
      return std::nullopt;
    }
    return std::move(out.front());
  }
};

RowStateMachine::RowStateMachine(const DialectConfig& config) {
  config.validate();
  impl_ = std::make_unique<Impl>(config);
}

RowStateMachine::~RowStateMachine() = default;

RowStateMachine::RowStateMachine(RowStateMachine&&) noexcept = default;
RowStateMachine& RowStateMachine::operator=(RowStateMachine&&) noexcept = default;

const DialectConfig& RowStateMachine::config() const {
  return impl_->config;
}

std::vector<Row> RowStateMachine::process_chunk(const uint8_t* data, size_t size) {
  return impl_->process_chunk(data, size);
}

std::optional<Row> RowStateMachine::finalize() {
  return impl_->finalize();
}

ParseStats RowStateMachine::stats() const {
  ParseStats stats;
  stats.bytes_processed = impl_->offset;
  stats.rows_processed = impl_->rows_emitted;
  stats.errors = impl_->errors.errors();
  stats.suppressed_errors = impl_->errors.suppressed_count();
  stats.start_time = impl_->start_time;
  stats.end_time = impl_->end_time;
  return stats;
}

const ErrorCollector& RowStateMachine::error_collector() const {
  return impl_->errors;
}

void RowStateMachine::reset() {
  impl_->reset();
}

void RowStateMachine::abort() {
  impl_->aborted.store(true);
}

bool RowStateMachine::is_aborted() const {
  return impl_->aborted.load();
}

ParserState RowStateMachine::state() const {
  return impl_->state;
}

bool RowStateMachine::has_pending_data() const {
  return impl_->row_open;
}

} // namespace datapilot
