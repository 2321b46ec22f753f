#ifndef CSVSTREAM_ERROR_H
#define CSVSTREAM_ERROR_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

/**
 * @file error.h
 * @brief Error taxonomy for the csvstream reader and writer.
 *
 * Every failure is reported as an exception derived from CsvError. Failures that
 * happen inside an asynchronous operation are stored in the operation's future and
 * rethrown by future::get().
 *
 * - ConfigError: invalid dialect or construction option (thrown synchronously)
 * - IoError: the byte source or sink failed
 * - FormatError: malformed input, field-count mismatch, or an unwritable field
 * - ClosedResourceError: operation on a closed reader or writer
 * - CancelledError: the operation was cancelled at a suspension point
 */

namespace csvstream {

/**
 * @brief Error codes carried by every CsvError.
 */
enum class ErrorCode {
  NONE = 0, ///< No error

  // Construction errors
  INVALID_DIALECT, ///< Dialect violates a character or combination rule
  INVALID_OPTION,  ///< Non-dialect option out of range (chunk size, path, fieldnames)

  // I/O
  IO_ERROR, ///< Byte source or sink failure

  // Malformed input
  UNCLOSED_QUOTE,       ///< Quoted field still open at end of stream (strict)
  INVALID_QUOTE_ESCAPE, ///< Byte other than delimiter/terminator after a closing quote (strict)
  UNTERMINATED_ESCAPE,  ///< Escape character as the last byte of the stream (strict)
  FIELD_TOO_LARGE,      ///< Field exceeds field_size_limit

  // Record shape
  FIELD_COUNT_MISMATCH, ///< Row width does not match fieldnames and cannot be absorbed

  // Write side
  UNESCAPABLE_FIELD, ///< Field needs escaping but no escape character is configured

  // Lifecycle
  RESOURCE_CLOSED,     ///< Operation after close()
  OPERATION_CANCELLED, ///< Operation cancelled before completion

  INTERNAL_ERROR ///< Broken invariant inside the library
};

/**
 * @brief Where in the stream an error was detected.
 *
 * Both members are optional; construction and lifecycle errors have no location.
 */
struct ErrorLocation {
  std::optional<size_t> line;        ///< Line number (1-indexed)
  std::optional<size_t> byte_offset; ///< Byte offset from the start of the stream

  static ErrorLocation none() { return {}; }
  static ErrorLocation at(size_t line_no, size_t offset) { return {line_no, offset}; }

  bool known() const { return line.has_value() || byte_offset.has_value(); }
};

/**
 * @brief Convert an ErrorCode to its string representation.
 *
 * @param code The ErrorCode to convert
 * @return C-string name of the error code (e.g., "UNCLOSED_QUOTE")
 */
const char* error_code_to_string(ErrorCode code);

/**
 * @brief Format an error message with code and location.
 *
 * Output: `UNCLOSED_QUOTE at line 3 (byte 41): unexpected end of data`
 */
std::string format_error(ErrorCode code, const ErrorLocation& location,
                         const std::string& message);

/**
 * @brief Base class for every csvstream exception.
 */
class CsvError : public std::runtime_error {
public:
  CsvError(ErrorCode code, const std::string& message,
           const ErrorLocation& location = ErrorLocation::none())
      : std::runtime_error(format_error(code, location, message)), code_(code),
        location_(location), message_(message) {}

  ErrorCode code() const { return code_; }
  const ErrorLocation& location() const { return location_; }

  /// Message without the code/location prefix
  const std::string& message() const { return message_; }

private:
  ErrorCode code_;
  ErrorLocation location_;
  std::string message_;
};

/// Invalid dialect or construction parameter. Always thrown synchronously.
class ConfigError : public CsvError {
public:
  explicit ConfigError(const std::string& message,
                       ErrorCode code = ErrorCode::INVALID_DIALECT)
      : CsvError(code, message) {}
};

/**
 * @brief Byte source or sink failure.
 *
 * Keeps the OS error number when the failure came from a system call, and for
 * batch writes the number of rows the sink accepted before the failure.
 */
class IoError : public CsvError {
public:
  explicit IoError(const std::string& message, int os_error = 0,
                   const ErrorLocation& location = ErrorLocation::none())
      : CsvError(ErrorCode::IO_ERROR, message, location), os_error_(os_error) {}

  IoError(const IoError& cause, size_t rows_written)
      : CsvError(ErrorCode::IO_ERROR, cause.message(), cause.location()),
        os_error_(cause.os_error_), rows_written_(rows_written) {}

  /// errno value of the failing system call, 0 if not applicable
  int os_error() const { return os_error_; }

  /// Rows durably written before the failure (batch writes only)
  size_t rows_written() const { return rows_written_; }

private:
  int os_error_;
  size_t rows_written_ = 0;
};

enum class FormatErrorKind {
  MALFORMED,  ///< Input violates the dialect, or a field cannot be rendered
  FIELD_COUNT ///< Row width mismatch against fieldnames
};

/**
 * @brief Malformed input or an unrepresentable record.
 */
class FormatError : public CsvError {
public:
  FormatError(ErrorCode code, const std::string& message,
              const ErrorLocation& location = ErrorLocation::none())
      : CsvError(code, message, location) {}

  FormatErrorKind kind() const {
    return code() == ErrorCode::FIELD_COUNT_MISMATCH ? FormatErrorKind::FIELD_COUNT
                                                     : FormatErrorKind::MALFORMED;
  }
};

/// Operation attempted after close().
class ClosedResourceError : public CsvError {
public:
  explicit ClosedResourceError(const std::string& what_closed)
      : CsvError(ErrorCode::RESOURCE_CLOSED, "I/O operation on closed " + what_closed) {}
};

/// Operation cancelled at a suspension point.
class CancelledError : public CsvError {
public:
  explicit CancelledError(const std::string& operation)
      : CsvError(ErrorCode::OPERATION_CANCELLED, operation + " was cancelled") {}
};

} // namespace csvstream

#endif // CSVSTREAM_ERROR_H
