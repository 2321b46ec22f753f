/**
 * @file tokenizer.cpp
 * @brief Implementation of the resumable CSV state machine.
 */

#include "csvstream/tokenizer.h"

#include "csvstream/error.h"

namespace csvstream {

const char* tokenizer_state_to_string(TokenizerState state) {
  switch (state) {
  case TokenizerState::RECORD_START:
    return "RECORD_START";
  case TokenizerState::FIELD_START:
    return "FIELD_START";
  case TokenizerState::AFTER_FIELD:
    return "AFTER_FIELD";
  case TokenizerState::IN_FIELD:
    return "IN_FIELD";
  case TokenizerState::ESCAPE_IN_FIELD:
    return "ESCAPE_IN_FIELD";
  case TokenizerState::IN_QUOTED_FIELD:
    return "IN_QUOTED_FIELD";
  case TokenizerState::ESCAPE_IN_QUOTED_FIELD:
    return "ESCAPE_IN_QUOTED_FIELD";
  case TokenizerState::QUOTE_IN_QUOTED_FIELD:
    return "QUOTE_IN_QUOTED_FIELD";
  case TokenizerState::RECORD_END:
    return "RECORD_END";
  case TokenizerState::SKIP_LINE:
    return "SKIP_LINE";
  case TokenizerState::FINISHED:
    return "FINISHED";
  default:
    return "UNKNOWN";
  }
}

Tokenizer::Tokenizer(const Dialect& dialect, size_t field_size_limit)
    : dialect_(dialect), field_size_limit_(field_size_limit) {}

bool Tokenizer::next_record(BufferManager& buffer, Record& out) {
  out.clear();
  if (state_ == TokenizerState::FINISHED) {
    return false;
  }
  while (true) {
    if (buffer.available() == 0 && buffer.ensure(1) == 0) {
      return finish(out, buffer.consumed());
    }
    size_t offset = buffer.consumed();
    char c = buffer.next();
    track_line(c);
    if (process(c, offset) == Step::RECORD) {
      take_record(out);
      return true;
    }
  }
}

void Tokenizer::track_line(char c) {
  if (c == '\r') {
    ++line_num_;
    line_open_ = false;
  } else if (c == '\n') {
    if (!prev_cr_) {
      ++line_num_;
    }
    line_open_ = false;
  } else {
    line_open_ = true;
  }
  prev_cr_ = (c == '\r');
}

// Process a single byte, updating state.
// LCOV_EXCL_BR_START - state machine branches covered by tokenizer tests
Tokenizer::Step Tokenizer::process(char c, size_t offset) {
  switch (state_) {
  case TokenizerState::RECORD_END:
    state_ = TokenizerState::RECORD_START;
    if (c == '\n') {
      // CRLF: the LF belongs to the record that ended on CR
      return Step::CONTINUE;
    }
    return process(c, offset);

  case TokenizerState::RECORD_START:
    if (is_terminator(c)) {
      // Blank line
      return Step::CONTINUE;
    }
    return process_field_start(c, offset);

  case TokenizerState::FIELD_START:
    return process_field_start(c, offset);

  case TokenizerState::AFTER_FIELD:
    if (c == ' ' && dialect_.skip_initial_space) {
      return Step::CONTINUE;
    }
    return process_field_start(c, offset);

  case TokenizerState::IN_FIELD:
    if (is_terminator(c)) {
      save_field();
      state_ = (c == '\r') ? TokenizerState::RECORD_END : TokenizerState::RECORD_START;
      return Step::RECORD;
    }
    if (is_escape(c)) {
      state_ = TokenizerState::ESCAPE_IN_FIELD;
    } else if (c == dialect_.delimiter) {
      save_field();
      state_ = TokenizerState::AFTER_FIELD;
    } else {
      add_char(c, offset);
    }
    return Step::CONTINUE;

  case TokenizerState::ESCAPE_IN_FIELD:
    add_char(c, offset);
    state_ = TokenizerState::IN_FIELD;
    return Step::CONTINUE;

  case TokenizerState::IN_QUOTED_FIELD:
    if (is_escape(c)) {
      state_ = TokenizerState::ESCAPE_IN_QUOTED_FIELD;
    } else if (is_quote(c)) {
      state_ = TokenizerState::QUOTE_IN_QUOTED_FIELD;
    } else {
      add_char(c, offset);
    }
    return Step::CONTINUE;

  case TokenizerState::ESCAPE_IN_QUOTED_FIELD:
    add_char(c, offset);
    state_ = TokenizerState::IN_QUOTED_FIELD;
    return Step::CONTINUE;

  case TokenizerState::QUOTE_IN_QUOTED_FIELD:
    if (is_quote(c) && dialect_.double_quote) {
      // Doubled quote: literal quote, still inside the quoted field
      add_char(c, offset);
      state_ = TokenizerState::IN_QUOTED_FIELD;
      return Step::CONTINUE;
    }
    if (c == dialect_.delimiter) {
      save_field();
      state_ = TokenizerState::AFTER_FIELD;
      return Step::CONTINUE;
    }
    if (is_terminator(c)) {
      save_field();
      state_ = (c == '\r') ? TokenizerState::RECORD_END : TokenizerState::RECORD_START;
      return Step::RECORD;
    }
    if (dialect_.strict) {
      fail(ErrorCode::INVALID_QUOTE_ESCAPE,
           std::string("'") + dialect_.delimiter + "' expected after '" + dialect_.quote_char +
               "'",
           offset);
    }
    // Lenient: the stray byte continues the field unquoted, e.g. "ab"c -> abc
    add_char(c, offset);
    state_ = TokenizerState::IN_FIELD;
    return Step::CONTINUE;

  case TokenizerState::SKIP_LINE:
    if (is_terminator(c)) {
      state_ = (c == '\r') ? TokenizerState::RECORD_END : TokenizerState::RECORD_START;
    }
    return Step::CONTINUE;

  case TokenizerState::FINISHED:
    break;
  }
  fail(ErrorCode::INTERNAL_ERROR,
       std::string("byte processed in state ") + tokenizer_state_to_string(state_), offset);
}

Tokenizer::Step Tokenizer::process_field_start(char c, size_t offset) {
  if (is_terminator(c)) {
    // Record ends right after a delimiter: trailing empty field
    save_field();
    state_ = (c == '\r') ? TokenizerState::RECORD_END : TokenizerState::RECORD_START;
    return Step::RECORD;
  }
  if (is_quote(c)) {
    state_ = TokenizerState::IN_QUOTED_FIELD;
  } else if (is_escape(c)) {
    state_ = TokenizerState::ESCAPE_IN_FIELD;
  } else if (c == dialect_.delimiter) {
    save_field();
    state_ = TokenizerState::AFTER_FIELD;
  } else {
    add_char(c, offset);
    state_ = TokenizerState::IN_FIELD;
  }
  return Step::CONTINUE;
}
// LCOV_EXCL_BR_STOP

bool Tokenizer::finish(Record& out, size_t offset) {
  TokenizerState last = state_;
  state_ = TokenizerState::FINISHED;
  if (line_open_) {
    // Final line without terminator
    ++line_num_;
    line_open_ = false;
  }

  switch (last) {
  case TokenizerState::RECORD_START:
  case TokenizerState::RECORD_END:
  case TokenizerState::SKIP_LINE:
  case TokenizerState::FINISHED:
    return false;

  case TokenizerState::IN_QUOTED_FIELD:
    if (dialect_.strict) {
      fail(ErrorCode::UNCLOSED_QUOTE, "unexpected end of data inside quoted field", offset);
    }
    break;

  case TokenizerState::ESCAPE_IN_FIELD:
  case TokenizerState::ESCAPE_IN_QUOTED_FIELD:
    if (dialect_.strict) {
      fail(ErrorCode::UNTERMINATED_ESCAPE, "unexpected end of data after escape character",
           offset);
    }
    break;

  case TokenizerState::FIELD_START:
  case TokenizerState::AFTER_FIELD:
  case TokenizerState::IN_FIELD:
  case TokenizerState::QUOTE_IN_QUOTED_FIELD:
    break;
  }

  save_field();
  take_record(out);
  return true;
}

void Tokenizer::add_char(char c, size_t offset) {
  if (field_size_limit_ > 0 && field_.size() >= field_size_limit_) {
    fail(ErrorCode::FIELD_TOO_LARGE,
         "field larger than field limit (" + std::to_string(field_size_limit_) + ")", offset);
  }
  field_.push_back(c);
}

void Tokenizer::save_field() {
  fields_.push_back(std::move(field_));
  field_.clear();
}

void Tokenizer::take_record(Record& out) {
  out = std::move(fields_);
  fields_.clear();
  ++records_;
}

void Tokenizer::fail(ErrorCode code, const std::string& message, size_t offset) {
  // Current line is 1-indexed; a line break just consumed already counts
  size_t line = line_num_ + (line_open_ ? 1 : 0);
  field_.clear();
  fields_.clear();
  if (state_ != TokenizerState::FINISHED) {
    state_ = TokenizerState::SKIP_LINE;
  }
  throw FormatError(code, message, ErrorLocation::at(line == 0 ? 1 : line, offset));
}

} // namespace csvstream
