#include "csvstream/error.h"

#include <sstream>

namespace csvstream {

const char* error_code_to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::NONE:
    return "NONE";
  case ErrorCode::INVALID_DIALECT:
    return "INVALID_DIALECT";
  case ErrorCode::INVALID_OPTION:
    return "INVALID_OPTION";
  case ErrorCode::IO_ERROR:
    return "IO_ERROR";
  case ErrorCode::UNCLOSED_QUOTE:
    return "UNCLOSED_QUOTE";
  case ErrorCode::INVALID_QUOTE_ESCAPE:
    return "INVALID_QUOTE_ESCAPE";
  case ErrorCode::UNTERMINATED_ESCAPE:
    return "UNTERMINATED_ESCAPE";
  case ErrorCode::FIELD_TOO_LARGE:
    return "FIELD_TOO_LARGE";
  case ErrorCode::FIELD_COUNT_MISMATCH:
    return "FIELD_COUNT_MISMATCH";
  case ErrorCode::UNESCAPABLE_FIELD:
    return "UNESCAPABLE_FIELD";
  case ErrorCode::RESOURCE_CLOSED:
    return "RESOURCE_CLOSED";
  case ErrorCode::OPERATION_CANCELLED:
    return "OPERATION_CANCELLED";
  case ErrorCode::INTERNAL_ERROR:
    return "INTERNAL_ERROR";
  default:
    return "UNKNOWN";
  }
}

std::string format_error(ErrorCode code, const ErrorLocation& location,
                         const std::string& message) {
  std::ostringstream ss;
  ss << error_code_to_string(code);
  if (location.line) {
    ss << " at line " << *location.line;
  }
  if (location.byte_offset) {
    ss << (location.line ? " (byte " : " at byte ") << *location.byte_offset
       << (location.line ? ")" : "");
  }
  ss << ": " << message;
  return ss.str();
}

} // namespace csvstream
