/**
 * @file serializer.cpp
 * @brief Quoting and escaping of records on the write side.
 */

#include "csvstream/serializer.h"

#include "csvstream/error.h"

#include <fast_float/fast_float.h>
#include <system_error>

namespace csvstream {

namespace {

std::string_view field_text(const std::string& field) {
  return field;
}

std::string_view field_text(const std::optional<std::string>& field) {
  return field ? std::string_view(*field) : std::string_view();
}

bool field_is_null(const std::string&) {
  return false;
}

bool field_is_null(const std::optional<std::string>& field) {
  return !field.has_value();
}

bool is_digit(char c) {
  return c >= '0' && c <= '9';
}

} // namespace

Serializer::Serializer(const Dialect& dialect) : dialect_(dialect) {}

bool Serializer::is_numeric(std::string_view field) {
  if (field.empty()) {
    return false;
  }
  size_t i = (field[0] == '-') ? 1 : 0;
  // Excludes inf/nan spellings, which fast_float would accept
  if (i >= field.size() || !(is_digit(field[i]) || field[i] == '.')) {
    return false;
  }

  double value = 0.0;
  const char* begin = field.data();
  const char* end = field.data() + field.size();
  auto result = fast_float::from_chars(begin, end, value);
  // Out-of-range literals such as 1e400 are still numeric text
  return result.ptr == end &&
         (result.ec == std::errc() || result.ec == std::errc::result_out_of_range);
}

bool Serializer::is_special(char c) const {
  return c == dialect_.delimiter || c == dialect_.quote_char ||
         (dialect_.has_escape() && c == dialect_.escape_char) || c == '\r' || c == '\n';
}

bool Serializer::needs_quotes(std::string_view field) const {
  for (char c : field) {
    if (is_special(c)) {
      return true;
    }
  }
  if (dialect_.skip_initial_space && !field.empty() && field.front() == ' ') {
    return true;
  }
  return false;
}

bool Serializer::should_quote(std::string_view field, bool is_null, bool only_field) const {
  switch (dialect_.quoting) {
  case QuotingMode::ALL:
    return true;
  case QuotingMode::NONE:
    return false;
  case QuotingMode::NONNUMERIC:
    return is_null || !is_numeric(field) || needs_quotes(field);
  case QuotingMode::NOTNULL:
    if (!is_null) {
      return true;
    }
    break;
  case QuotingMode::STRINGS:
    if (!is_null && !is_numeric(field)) {
      return true;
    }
    break;
  case QuotingMode::MINIMAL:
    break;
  }
  // A lone empty field must not render as a blank line
  return needs_quotes(field) || (only_field && field.empty());
}

void Serializer::append_field(std::string_view field, bool is_null, bool only_field,
                              std::string& out) const {
  const char quote = dialect_.quote_char;
  const char escape = dialect_.escape_char;

  if (!should_quote(field, is_null, only_field)) {
    if (only_field && field.empty()) {
      throw FormatError(ErrorCode::UNESCAPABLE_FIELD,
                        "single empty field record must be quoted");
    }
    for (char c : field) {
      if (is_special(c)) {
        if (!dialect_.has_escape()) {
          throw FormatError(ErrorCode::UNESCAPABLE_FIELD,
                            "need to escape, but no escape character set");
        }
        out.push_back(escape);
      }
      out.push_back(c);
    }
    return;
  }

  out.push_back(quote);
  for (char c : field) {
    if (c == quote) {
      if (dialect_.double_quote) {
        out.push_back(quote);
      } else if (dialect_.has_escape()) {
        out.push_back(escape);
      } else {
        throw FormatError(ErrorCode::UNESCAPABLE_FIELD,
                          "need to escape quote character, but no escape character set");
      }
    } else if (dialect_.has_escape() && c == escape) {
      out.push_back(escape);
    }
    out.push_back(c);
  }
  out.push_back(quote);
}

template <typename Row> void Serializer::append_row(const Row& record, std::string& out) const {
  const size_t mark = out.size();
  const bool only_field = record.size() == 1;
  try {
    for (size_t i = 0; i < record.size(); ++i) {
      if (i > 0) {
        out.push_back(dialect_.delimiter);
      }
      append_field(field_text(record[i]), field_is_null(record[i]), only_field, out);
    }
  } catch (const FormatError&) {
    out.resize(mark);
    throw;
  }
  out.append(dialect_.terminator());
}

void Serializer::append(const Record& record, std::string& out) const {
  append_row(record, out);
}

void Serializer::append(const NullableRecord& record, std::string& out) const {
  append_row(record, out);
}

std::string Serializer::serialize(const Record& record) const {
  std::string out;
  append_row(record, out);
  return out;
}

std::string Serializer::serialize(const NullableRecord& record) const {
  std::string out;
  append_row(record, out);
  return out;
}

} // namespace csvstream
