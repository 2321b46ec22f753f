/**
 * @file dialect.h
 * @brief CSV dialect configuration shared by the tokenizer and the serializer.
 *
 * A Dialect bundles the delimiter, quote and escape characters, the quoting
 * mode used when writing, the line terminator, and the strict/skip-space
 * flags. Readers and writers copy the dialect and validate it in their
 * constructors, so an invalid combination fails before any I/O happens.
 *
 * @see tokenizer.h for the read-side state machine
 * @see serializer.h for the write-side quoting policy
 */

#ifndef CSVSTREAM_DIALECT_H
#define CSVSTREAM_DIALECT_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace csvstream {

/**
 * @brief Policy deciding which fields are quote-wrapped on write.
 *
 * Numeric values match the quoting constants of common CSV libraries so that
 * integer configuration can be mapped with quoting_mode_from_int().
 */
enum class QuotingMode {
  MINIMAL = 0,    ///< Quote only fields containing delimiter, quote, escape or CR/LF
  ALL = 1,        ///< Quote every field
  NONNUMERIC = 2, ///< Quote every field that is not a numeric literal
  NONE = 3,       ///< Never quote; escape specials with escape_char
  STRINGS = 4,    ///< Quote non-null, non-numeric fields
  NOTNULL = 5     ///< Quote every non-null field
};

/// Record terminator written after each row.
enum class LineTerminator { LF, CR, CRLF };

/**
 * @brief CSV dialect configuration.
 *
 * Defaults describe RFC 4180 CSV as written by spreadsheet software:
 * comma, double-quote, no escape character, minimal quoting, CRLF.
 */
struct Dialect {
  char delimiter = ',';
  char quote_char = '"';
  char escape_char = '\0'; ///< '\0' means no escape character
  QuotingMode quoting = QuotingMode::MINIMAL;
  LineTerminator line_terminator = LineTerminator::CRLF;
  bool double_quote = true;       ///< If true, "" inside a quoted field is a literal "
  bool skip_initial_space = false; ///< Drop spaces right after a delimiter
  bool strict = false;             ///< Fail on malformed quoting instead of recovering

  /// Factory for standard CSV (comma-separated, double-quoted, CRLF)
  static Dialect csv() { return Dialect{}; }

  /// Factory for TSV (tab-separated)
  static Dialect tsv() {
    Dialect d;
    d.delimiter = '\t';
    return d;
  }

  /// Factory for pipe-separated
  static Dialect pipe() {
    Dialect d;
    d.delimiter = '|';
    return d;
  }

  /// Factory for Unix-style CSV: LF terminator, every field quoted
  static Dialect unix_dialect() {
    Dialect d;
    d.quoting = QuotingMode::ALL;
    d.line_terminator = LineTerminator::LF;
    return d;
  }

  bool has_escape() const { return escape_char != '\0'; }

  /// Whether the quote character has any effect (it has none under QuotingMode::NONE)
  bool quoting_enabled() const { return quoting != QuotingMode::NONE; }

  /// Bytes written after each record
  std::string_view terminator() const;

  bool operator==(const Dialect& other) const {
    return delimiter == other.delimiter && quote_char == other.quote_char &&
           escape_char == other.escape_char && quoting == other.quoting &&
           line_terminator == other.line_terminator && double_quote == other.double_quote &&
           skip_initial_space == other.skip_initial_space && strict == other.strict;
  }

  bool operator!=(const Dialect& other) const { return !(*this == other); }

  /// Validate the dialect configuration
  /// @return true if valid, false otherwise
  bool is_valid() const;

  /// Validate and throw if invalid
  /// @throws ConfigError describing the first violated rule
  void validate() const;

  /// Returns a human-readable description of the dialect
  std::string to_string() const;

  /**
   * @brief Extract a dialect character from string configuration.
   *
   * @param value Configuration value; must be exactly one byte
   * @param name Parameter name used in the error message
   * @throws ConfigError if value is not exactly one byte
   */
  static char parse_char(std::string_view value, const char* name);
};

/// @throws ConfigError if value is not one of the enumerated modes
QuotingMode quoting_mode_from_int(int value);

/// Accepts "\n", "\r" and "\r\n". @throws ConfigError otherwise
LineTerminator line_terminator_from_string(std::string_view value);

const char* quoting_mode_to_string(QuotingMode mode);

} // namespace csvstream

#endif // CSVSTREAM_DIALECT_H
