/**
 * @file dict.h
 * @brief Field-name keyed view over records.
 *
 * DictReader and DictWriter wrap a RecordReader/RecordWriter and translate
 * between positional records and (fieldname, value) rows. The translation is
 * a pair of stateless functions, make_dict_row() and make_record(), so the
 * tokenizer and serializer are shared with the positional API.
 */

#ifndef CSVSTREAM_DICT_H
#define CSVSTREAM_DICT_H

#include "reader.h"
#include "types.h"
#include "writer.h"

#include <cstddef>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace csvstream {

/**
 * @brief One record keyed by field name.
 *
 * Entries keep the column order of the record, duplicates included. Lookups
 * by name return the last entry with that name. Fields beyond the fieldnames
 * are kept separately under the rest key.
 */
class DictRow {
public:
  using Entry = std::pair<std::string, std::string>;

  DictRow() = default;

  void add(std::string name, std::string value);
  void set_rest(std::string rest_key, std::vector<std::string> values);

  const std::vector<Entry>& entries() const { return entries_; }

  /// Value for name; the rest key is not looked up here
  const std::string* find(const std::string& name) const;

  /// @throws std::out_of_range if name is not a field
  const std::string& at(const std::string& name) const;

  bool contains(const std::string& name) const { return find(name) != nullptr; }

  /// Number of entries, duplicates included, rest excluded
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty() && !rest_key_; }

  const std::optional<std::string>& rest_key() const { return rest_key_; }
  const std::vector<std::string>& rest_values() const { return rest_values_; }

  /// Last-wins map of the entries
  std::map<std::string, std::string> to_map() const;

  bool operator==(const DictRow& other) const;
  bool operator!=(const DictRow& other) const { return !(*this == other); }

private:
  std::vector<Entry> entries_;
  std::optional<std::string> rest_key_;
  std::vector<std::string> rest_values_;
};

/**
 * @brief Project a record onto fieldnames.
 *
 * Missing trailing fields get restval. Extra fields go to restkey.
 *
 * @throws FormatError (FIELD_COUNT_MISMATCH) for extra fields without a restkey
 */
DictRow make_dict_row(const Record& record, const std::vector<std::string>& fieldnames,
                      const std::optional<std::string>& restkey, const std::string& restval,
                      size_t line_num = 0);

/// What DictWriter does with keys that are not fieldnames.
enum class ExtrasAction {
  RAISE, ///< Fail the row with FormatError (FIELD_COUNT_MISMATCH)
  IGNORE ///< Drop the extra keys
};

/**
 * @brief Lay out a keyed row in fieldname order.
 *
 * @throws FormatError (FIELD_COUNT_MISMATCH) naming unknown keys under RAISE
 */
Record make_record(const std::map<std::string, std::string>& row,
                   const std::vector<std::string>& fieldnames, ExtrasAction extras,
                   const std::string& restval);

struct DictReaderOptions {
  ReaderOptions reader;
  std::optional<std::vector<std::string>> fieldnames; ///< Read from the first record if unset
  std::optional<std::string> restkey;
  std::string restval;
};

struct DictWriterOptions {
  WriterOptions writer;
  std::vector<std::string> fieldnames; ///< Required, non-empty
  ExtrasAction extrasaction = ExtrasAction::RAISE;
  std::string restval;

  /// @throws ConfigError if the writer options or the fieldnames are invalid
  void validate() const;
};

class DictReader {
public:
  explicit DictReader(std::shared_ptr<ByteSource> source,
                      const DictReaderOptions& options = DictReaderOptions(),
                      HandleOwnership ownership = HandleOwnership::OWNED);
  explicit DictReader(const std::string& path,
                      const DictReaderOptions& options = DictReaderOptions(),
                      const SourceOpener& opener = open_file_source);

  ~DictReader();

  DictReader(const DictReader&) = delete;
  DictReader& operator=(const DictReader&) = delete;
  DictReader(DictReader&&) noexcept;
  DictReader& operator=(DictReader&&) noexcept;

  /// Fieldnames if supplied or already read, std::nullopt before the header is consumed
  std::optional<std::vector<std::string>> fieldnames() const;

  /// Read the header record if needed; an empty stream yields no fieldnames
  std::future<std::vector<std::string>> get_fieldnames();

  /// Next row; an empty DictRow at end of stream
  std::future<DictRow> read_row();

  /// Next row, or std::nullopt at end of stream
  std::future<std::optional<DictRow>> next_row();

  /// Up to n rows; fewer only at end of stream
  std::future<std::vector<DictRow>> read_rows(size_t n);

  std::future<void> close();
  void cancel();

  size_t line_num() const;
  bool closed() const;

  RecordReader& reader() { return reader_; }

private:
  struct State;

  RecordReader reader_;
  std::shared_ptr<State> state_;
};

class DictWriter {
public:
  /// @throws ConfigError if fieldnames are empty or options are invalid
  DictWriter(std::shared_ptr<ByteSink> sink, const DictWriterOptions& options,
             HandleOwnership ownership = HandleOwnership::OWNED);
  DictWriter(const std::string& path, const DictWriterOptions& options,
             const SinkOpener& opener = open_file_sink);

  ~DictWriter();

  DictWriter(const DictWriter&) = delete;
  DictWriter& operator=(const DictWriter&) = delete;
  DictWriter(DictWriter&&) noexcept;
  DictWriter& operator=(DictWriter&&) noexcept;

  /// Write the fieldnames as a record
  std::future<void> write_header();

  std::future<void> write_row(std::map<std::string, std::string> row);
  std::future<void> write_row(const DictRow& row);

  /// Write rows in order; same failure reporting as RecordWriter::write_rows
  std::future<void> write_rows(std::vector<std::map<std::string, std::string>> rows);

  std::future<void> flush();
  std::future<void> close();
  void cancel();

  const std::vector<std::string>& fieldnames() const { return options_->fieldnames; }
  bool closed() const;

  RecordWriter& writer() { return writer_; }

private:
  std::shared_ptr<const DictWriterOptions> options_; // shared with queued tasks
  RecordWriter writer_;
};

} // namespace csvstream

#endif // CSVSTREAM_DICT_H
