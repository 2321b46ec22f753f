/**
 * @file dialect.cpp
 * @brief Dialect validation and formatting.
 */

#include "csvstream/dialect.h"

#include "csvstream/error.h"

#include <sstream>

namespace csvstream {

namespace {

bool is_line_break(char c) {
  return c == '\n' || c == '\r';
}

bool is_known_quoting(QuotingMode mode) {
  switch (mode) {
  case QuotingMode::MINIMAL:
  case QuotingMode::ALL:
  case QuotingMode::NONNUMERIC:
  case QuotingMode::NONE:
  case QuotingMode::STRINGS:
  case QuotingMode::NOTNULL:
    return true;
  }
  return false;
}

// Returns an empty string when the dialect is valid, otherwise the first violated rule.
std::string first_violation(const Dialect& d) {
  if (d.delimiter == '\0') {
    return "delimiter must be a single non-NUL character";
  }
  if (is_line_break(d.delimiter)) {
    return "delimiter cannot be a newline character";
  }
  if (d.quote_char == '\0') {
    return "quote character must be a single non-NUL character";
  }
  if (is_line_break(d.quote_char)) {
    return "quote character cannot be a newline character";
  }
  if (d.delimiter == d.quote_char) {
    return "delimiter and quote character cannot be the same";
  }
  if (d.has_escape()) {
    if (is_line_break(d.escape_char)) {
      return "escape character cannot be a newline character";
    }
    if (d.escape_char == d.delimiter) {
      return "escape character and delimiter cannot be the same";
    }
    if (d.escape_char == d.quote_char) {
      return "escape character and quote character cannot be the same";
    }
  }
  if (d.skip_initial_space && d.delimiter == ' ') {
    return "space delimiter cannot be combined with skip_initial_space";
  }
  if (!is_known_quoting(d.quoting)) {
    return "quoting mode must be one of MINIMAL, ALL, NONNUMERIC, NONE, STRINGS, NOTNULL";
  }
  switch (d.line_terminator) {
  case LineTerminator::LF:
  case LineTerminator::CR:
  case LineTerminator::CRLF:
    break;
  default:
    return "line terminator must be LF, CR or CRLF";
  }
  return {};
}

void format_char(std::ostream& ss, char c) {
  switch (c) {
  case '\t':
    ss << "'\\t'";
    break;
  case '\0':
    ss << "none";
    break;
  case '\n':
    ss << "'\\n'";
    break;
  case '\r':
    ss << "'\\r'";
    break;
  default:
    if (c >= 32 && c < 127) {
      ss << '\'' << c << '\'';
    } else {
      ss << "0x" << std::hex << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
    }
  }
}

} // namespace

std::string_view Dialect::terminator() const {
  switch (line_terminator) {
  case LineTerminator::LF:
    return "\n";
  case LineTerminator::CR:
    return "\r";
  case LineTerminator::CRLF:
  default:
    return "\r\n";
  }
}

bool Dialect::is_valid() const {
  return first_violation(*this).empty();
}

void Dialect::validate() const {
  std::string violation = first_violation(*this);
  if (!violation.empty()) {
    throw ConfigError(violation);
  }
}

std::string Dialect::to_string() const {
  std::ostringstream ss;
  ss << "Dialect{delimiter=";
  format_char(ss, delimiter);
  ss << ", quote=";
  format_char(ss, quote_char);
  ss << ", escape=";
  format_char(ss, escape_char);
  ss << ", quoting=" << quoting_mode_to_string(quoting) << ", terminator=";
  switch (line_terminator) {
  case LineTerminator::LF:
    ss << "LF";
    break;
  case LineTerminator::CR:
    ss << "CR";
    break;
  case LineTerminator::CRLF:
    ss << "CRLF";
    break;
  }
  ss << ", double_quote=" << (double_quote ? "true" : "false")
     << ", skip_initial_space=" << (skip_initial_space ? "true" : "false")
     << ", strict=" << (strict ? "true" : "false") << "}";
  return ss.str();
}

char Dialect::parse_char(std::string_view value, const char* name) {
  if (value.size() != 1) {
    throw ConfigError(std::string(name) + " must be a 1-character string, got " +
                      std::to_string(value.size()) + " characters");
  }
  return value[0];
}

QuotingMode quoting_mode_from_int(int value) {
  if (value < 0 || value > static_cast<int>(QuotingMode::NOTNULL)) {
    throw ConfigError("bad quoting value " + std::to_string(value));
  }
  return static_cast<QuotingMode>(value);
}

LineTerminator line_terminator_from_string(std::string_view value) {
  if (value == "\n") {
    return LineTerminator::LF;
  }
  if (value == "\r") {
    return LineTerminator::CR;
  }
  if (value == "\r\n") {
    return LineTerminator::CRLF;
  }
  throw ConfigError("line terminator must be \"\\n\", \"\\r\" or \"\\r\\n\"");
}

const char* quoting_mode_to_string(QuotingMode mode) {
  switch (mode) {
  case QuotingMode::MINIMAL:
    return "MINIMAL";
  case QuotingMode::ALL:
    return "ALL";
  case QuotingMode::NONNUMERIC:
    return "NONNUMERIC";
  case QuotingMode::NONE:
    return "NONE";
  case QuotingMode::STRINGS:
    return "STRINGS";
  case QuotingMode::NOTNULL:
    return "NOTNULL";
  default:
    return "UNKNOWN";
  }
}

} // namespace csvstream
