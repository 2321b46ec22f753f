/**
 * @file types.h
 * @brief Row types and default sizes shared by readers and writers.
 */

#ifndef CSVSTREAM_TYPES_H
#define CSVSTREAM_TYPES_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace csvstream {

// One logical row. A Record with zero fields marks the end of a stream;
// a row holding one empty field is {""}.
using Record = std::vector<std::string>;

// Write-side row whose fields may be null (std::nullopt). Nulls are written
// as empty fields; NOTNULL and STRINGS quoting treat them specially.
using NullableRecord = std::vector<std::optional<std::string>>;

constexpr size_t DEFAULT_CHUNK_SIZE = 64 * 1024;       // bytes per source fetch
constexpr size_t DEFAULT_WRITE_SIZE = 64 * 1024;       // pending bytes before a flush
constexpr size_t DEFAULT_FIELD_SIZE_LIMIT = 128 * 1024; // 131072 bytes, 0 = unlimited

inline bool is_end_of_stream(const Record& record) {
  return record.empty();
}

} // namespace csvstream

#endif // CSVSTREAM_TYPES_H
