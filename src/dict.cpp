/**
 * @file dict.cpp
 * @brief DictRow projection and the keyed reader/writer adapters.
 */

#include "csvstream/dict.h"

#include "csvstream/error.h"

#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace csvstream {

//-----------------------------------------------------------------------------
// DictRow
//-----------------------------------------------------------------------------

void DictRow::add(std::string name, std::string value) {
  entries_.emplace_back(std::move(name), std::move(value));
}

void DictRow::set_rest(std::string rest_key, std::vector<std::string> values) {
  rest_key_ = std::move(rest_key);
  rest_values_ = std::move(values);
}

const std::string* DictRow::find(const std::string& name) const {
  // Last entry wins for duplicate fieldnames
  for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
    if (it->first == name) {
      return &it->second;
    }
  }
  return nullptr;
}

const std::string& DictRow::at(const std::string& name) const {
  const std::string* value = find(name);
  if (!value) {
    throw std::out_of_range("no field named '" + name + "'");
  }
  return *value;
}

std::map<std::string, std::string> DictRow::to_map() const {
  std::map<std::string, std::string> map;
  for (const auto& entry : entries_) {
    map[entry.first] = entry.second;
  }
  return map;
}

bool DictRow::operator==(const DictRow& other) const {
  return entries_ == other.entries_ && rest_key_ == other.rest_key_ &&
         rest_values_ == other.rest_values_;
}

//-----------------------------------------------------------------------------
// Projection
//-----------------------------------------------------------------------------

DictRow make_dict_row(const Record& record, const std::vector<std::string>& fieldnames,
                      const std::optional<std::string>& restkey, const std::string& restval,
                      size_t line_num) {
  if (record.size() > fieldnames.size() && !restkey) {
    ErrorLocation location;
    if (line_num > 0) {
      location.line = line_num;
    }
    throw FormatError(ErrorCode::FIELD_COUNT_MISMATCH,
                      "record has " + std::to_string(record.size()) + " fields, expected " +
                          std::to_string(fieldnames.size()) + " and no restkey is set",
                      location);
  }

  DictRow row;
  for (size_t i = 0; i < fieldnames.size(); ++i) {
    row.add(fieldnames[i], i < record.size() ? record[i] : restval);
  }
  if (record.size() > fieldnames.size()) {
    row.set_rest(*restkey, std::vector<std::string>(record.begin() + fieldnames.size(),
                                                    record.end()));
  }
  return row;
}

Record make_record(const std::map<std::string, std::string>& row,
                   const std::vector<std::string>& fieldnames, ExtrasAction extras,
                   const std::string& restval) {
  if (extras == ExtrasAction::RAISE) {
    std::string unknown;
    for (const auto& entry : row) {
      if (std::find(fieldnames.begin(), fieldnames.end(), entry.first) == fieldnames.end()) {
        unknown += unknown.empty() ? "" : ", ";
        unknown += "'" + entry.first + "'";
      }
    }
    if (!unknown.empty()) {
      throw FormatError(ErrorCode::FIELD_COUNT_MISMATCH,
                        "dict contains fields not in fieldnames: " + unknown);
    }
  }

  Record record;
  record.reserve(fieldnames.size());
  for (const auto& name : fieldnames) {
    auto it = row.find(name);
    record.push_back(it != row.end() ? it->second : restval);
  }
  return record;
}

//-----------------------------------------------------------------------------
// DictReader
//-----------------------------------------------------------------------------

struct DictReader::State {
  std::optional<std::string> restkey;
  std::string restval;

  // Written on the reader's worker, read by fieldnames() on any thread
  mutable std::mutex mutex;
  std::optional<std::vector<std::string>> fieldnames;

  explicit State(const DictReaderOptions& options)
      : restkey(options.restkey), restval(options.restval), fieldnames(options.fieldnames) {}

  std::optional<std::vector<std::string>> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return fieldnames;
  }

  // Worker side: consume the header record unless fieldnames are known.
  // An empty stream leaves them unset.
  std::optional<std::vector<std::string>> ensure_fieldnames(RecordReader::Cursor& cursor) {
    auto known = snapshot();
    if (known) {
      return known;
    }
    Record header;
    if (!cursor.next(header)) {
      return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mutex);
    fieldnames = std::move(header);
    return fieldnames;
  }

  std::optional<DictRow> next(RecordReader::Cursor& cursor) {
    auto names = ensure_fieldnames(cursor);
    Record record;
    if (!names || !cursor.next(record)) {
      return std::nullopt;
    }
    return make_dict_row(record, *names, restkey, restval, cursor.line_num());
  }
};

DictReader::DictReader(std::shared_ptr<ByteSource> source, const DictReaderOptions& options,
                       HandleOwnership ownership)
    : reader_(std::move(source), options.reader, ownership),
      state_(std::make_shared<State>(options)) {}

DictReader::DictReader(const std::string& path, const DictReaderOptions& options,
                       const SourceOpener& opener)
    : reader_(path, options.reader, opener), state_(std::make_shared<State>(options)) {}

DictReader::~DictReader() = default;

DictReader::DictReader(DictReader&&) noexcept = default;
DictReader& DictReader::operator=(DictReader&&) noexcept = default;

std::optional<std::vector<std::string>> DictReader::fieldnames() const {
  return state_->snapshot();
}

std::future<std::vector<std::string>> DictReader::get_fieldnames() {
  auto state = state_;
  return reader_.run("get_fieldnames", [state](RecordReader::Cursor& cursor) {
    return state->ensure_fieldnames(cursor).value_or(std::vector<std::string>());
  });
}

std::future<DictRow> DictReader::read_row() {
  auto state = state_;
  return reader_.run("read_dict_row", [state](RecordReader::Cursor& cursor) {
    return state->next(cursor).value_or(DictRow());
  });
}

std::future<std::optional<DictRow>> DictReader::next_row() {
  auto state = state_;
  return reader_.run("next_dict_row",
                     [state](RecordReader::Cursor& cursor) { return state->next(cursor); });
}

std::future<std::vector<DictRow>> DictReader::read_rows(size_t n) {
  auto state = state_;
  return reader_.run("read_dict_rows", [state, n](RecordReader::Cursor& cursor) {
    std::vector<DictRow> rows;
    auto names = state->ensure_fieldnames(cursor);
    if (!names) {
      return rows;
    }
    // Records already projected, handed back if the batch fails
    std::vector<Record> consumed;
    try {
      Record record;
      while (rows.size() < n && cursor.next(record)) {
        rows.push_back(
            make_dict_row(record, *names, state->restkey, state->restval, cursor.line_num()));
        consumed.push_back(std::move(record));
      }
    } catch (const CsvError&) {
      cursor.unread(std::move(consumed));
      throw;
    }
    return rows;
  });
}

std::future<void> DictReader::close() {
  return reader_.close();
}

void DictReader::cancel() {
  reader_.cancel();
}

size_t DictReader::line_num() const {
  return reader_.line_num();
}

bool DictReader::closed() const {
  return reader_.closed();
}

//-----------------------------------------------------------------------------
// DictWriter
//-----------------------------------------------------------------------------

void DictWriterOptions::validate() const {
  writer.validate();
  if (fieldnames.empty()) {
    throw ConfigError("fieldnames must not be empty", ErrorCode::INVALID_OPTION);
  }
}

namespace {

const DictWriterOptions& validated(const DictWriterOptions& options) {
  options.validate();
  return options;
}

} // namespace

DictWriter::DictWriter(std::shared_ptr<ByteSink> sink, const DictWriterOptions& options,
                       HandleOwnership ownership)
    : options_(std::make_shared<const DictWriterOptions>(validated(options))),
      writer_(std::move(sink), options.writer, ownership) {}

DictWriter::DictWriter(const std::string& path, const DictWriterOptions& options,
                       const SinkOpener& opener)
    : options_(std::make_shared<const DictWriterOptions>(validated(options))),
      writer_(path, options.writer, opener) {}

DictWriter::~DictWriter() = default;

DictWriter::DictWriter(DictWriter&&) noexcept = default;
DictWriter& DictWriter::operator=(DictWriter&&) noexcept = default;

std::future<void> DictWriter::write_header() {
  return writer_.write_row(options_->fieldnames);
}

std::future<void> DictWriter::write_row(std::map<std::string, std::string> row) {
  auto options = options_;
  auto keyed = std::make_shared<const std::map<std::string, std::string>>(std::move(row));
  return writer_.run("write_dict_row", [options, keyed](RecordWriter::Session& session) {
    session.write(
        make_record(*keyed, options->fieldnames, options->extrasaction, options->restval));
  });
}

std::future<void> DictWriter::write_row(const DictRow& row) {
  auto options = options_;
  auto keyed = std::make_shared<std::map<std::string, std::string>>(row.to_map());
  size_t overflow = 0;
  if (row.rest_key()) {
    // Overflow values have no column; the rest key counts as an unknown field
    keyed->emplace(*row.rest_key(), std::string());
    overflow = row.rest_values().size();
  }
  return writer_.run("write_dict_row", [options, keyed, overflow](RecordWriter::Session& session) {
    Record record =
        make_record(*keyed, options->fieldnames, options->extrasaction, options->restval);
    if (overflow > 0) {
      session.trace().log("write_dict_row: dropped %zu rest values", overflow);
    }
    session.write(record);
  });
}

std::future<void> DictWriter::write_rows(std::vector<std::map<std::string, std::string>> rows) {
  auto options = options_;
  auto keyed = std::make_shared<const std::vector<std::map<std::string, std::string>>>(
      std::move(rows));
  return writer_.run("write_dict_rows", [options, keyed](RecordWriter::Session& session) {
    // Every row is laid out before any is written
    std::vector<Record> records;
    records.reserve(keyed->size());
    for (const auto& row : *keyed) {
      records.push_back(
          make_record(row, options->fieldnames, options->extrasaction, options->restval));
    }
    session.write_all(records);
  });
}

std::future<void> DictWriter::flush() {
  return writer_.flush();
}

std::future<void> DictWriter::close() {
  return writer_.close();
}

void DictWriter::cancel() {
  writer_.cancel();
}

bool DictWriter::closed() const {
  return writer_.closed();
}

} // namespace csvstream
