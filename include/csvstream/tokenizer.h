/**
 * @file tokenizer.h
 * @brief Resumable byte-level CSV state machine.
 *
 * The tokenizer pulls bytes from a BufferManager one at a time and emits one
 * Record per call to next_record(). All of its state (current state id, the
 * partially accumulated field, the fields of the partial record, line
 * bookkeeping) lives in the object, so a call interrupted at a fetch point
 * (cancellation, I/O error) can be repeated later and continues exactly at
 * the next unconsumed byte. No consumed byte is ever parsed twice.
 *
 * Accepted record terminators are LF, CR and CRLF regardless of the dialect's
 * configured line terminator, which only governs writing.
 */

#ifndef CSVSTREAM_TOKENIZER_H
#define CSVSTREAM_TOKENIZER_H

#include "buffer.h"
#include "dialect.h"
#include "error.h"
#include "types.h"

#include <cstddef>
#include <string>

namespace csvstream {

/**
 * @brief Tokenizer state machine states.
 */
enum class TokenizerState {
  RECORD_START,           ///< Between records; blank lines are skipped here
  FIELD_START,            ///< At the beginning of a field
  AFTER_FIELD,            ///< Just consumed a delimiter; initial spaces may be skipped
  IN_FIELD,               ///< Inside an unquoted field
  ESCAPE_IN_FIELD,        ///< Escape character seen in an unquoted field
  IN_QUOTED_FIELD,        ///< Inside a quoted field
  ESCAPE_IN_QUOTED_FIELD, ///< Escape character seen in a quoted field
  QUOTE_IN_QUOTED_FIELD,  ///< Quote seen inside a quoted field: closing or doubled
  RECORD_END,             ///< Record ended on CR; a following LF belongs to it
  SKIP_LINE,              ///< Discarding the rest of a line after a format error
  FINISHED                ///< End of stream reached
};

const char* tokenizer_state_to_string(TokenizerState state);

class Tokenizer {
public:
  /**
   * @param dialect Validated dialect; copied
   * @param field_size_limit Maximum field length in bytes (0 = unlimited)
   */
  explicit Tokenizer(const Dialect& dialect,
                     size_t field_size_limit = DEFAULT_FIELD_SIZE_LIMIT);

  /**
   * @brief Produce the next record.
   *
   * Fetches through buffer.ensure() whenever the buffer runs dry; that is the
   * only point where the call may block or throw I/O and cancellation errors.
   * Returns as soon as a terminator is consumed, never reading ahead.
   *
   * @param buffer Buffer over the reader's source
   * @param out Receives the record (cleared first)
   * @return true if a record was produced, false at end of stream
   * @throws FormatError for malformed input; the partial record is discarded
   *         and tokenizing resumes at the next line
   */
  bool next_record(BufferManager& buffer, Record& out);

  /// Physical lines consumed so far
  size_t line_num() const { return line_num_; }

  /// Records produced so far
  size_t records() const { return records_; }

  TokenizerState state() const { return state_; }

  /// Bytes of the field currently being accumulated
  size_t pending_field_size() const { return field_.size(); }

  /// Fields of the record currently being accumulated
  size_t pending_field_count() const { return fields_.size(); }

  bool finished() const { return state_ == TokenizerState::FINISHED; }

  const Dialect& dialect() const { return dialect_; }

private:
  enum class Step { CONTINUE, RECORD };

  Step process(char c, size_t offset);
  Step process_field_start(char c, size_t offset);
  bool finish(Record& out, size_t offset);

  void add_char(char c, size_t offset);
  void save_field();
  void take_record(Record& out);
  void track_line(char c);
  [[noreturn]] void fail(ErrorCode code, const std::string& message, size_t offset);

  bool is_terminator(char c) const { return c == '\n' || c == '\r'; }
  bool is_quote(char c) const { return dialect_.quoting_enabled() && c == dialect_.quote_char; }
  bool is_escape(char c) const { return dialect_.has_escape() && c == dialect_.escape_char; }

  Dialect dialect_;
  size_t field_size_limit_;

  TokenizerState state_ = TokenizerState::RECORD_START;
  std::string field_;
  Record fields_;

  size_t line_num_ = 0;
  size_t records_ = 0;
  bool prev_cr_ = false;
  bool line_open_ = false; // bytes consumed since the last line break
};

} // namespace csvstream

#endif // CSVSTREAM_TOKENIZER_H
