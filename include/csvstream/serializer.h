/**
 * @file serializer.h
 * @brief Renders records as dialect-conformant CSV bytes.
 *
 * The serializer is stateless apart from its dialect: the same record always
 * renders to the same bytes. Quoting decisions follow Dialect::quoting, see
 * QuotingMode for the per-mode policy.
 */

#ifndef CSVSTREAM_SERIALIZER_H
#define CSVSTREAM_SERIALIZER_H

#include "dialect.h"
#include "types.h"

#include <optional>
#include <string>
#include <string_view>

namespace csvstream {

class Serializer {
public:
  /// @param dialect Validated dialect; copied
  explicit Serializer(const Dialect& dialect);

  /**
   * @brief Append one rendered record, terminator included, to out.
   *
   * On failure out is left exactly as it was.
   *
   * @throws FormatError (UNESCAPABLE_FIELD) if a field contains a special byte
   *         that can be neither quoted nor escaped under the dialect
   */
  void append(const Record& record, std::string& out) const;
  void append(const NullableRecord& record, std::string& out) const;

  std::string serialize(const Record& record) const;
  std::string serialize(const NullableRecord& record) const;

  /**
   * @brief Whether a field is a finite decimal numeric literal.
   *
   * Accepts an optional leading '-', digits, an optional fraction and an
   * optional exponent. "inf", "nan", hex and leading '+' are not numeric.
   */
  static bool is_numeric(std::string_view field);

  /// Whether the field contains a byte that MINIMAL quoting must protect
  bool needs_quotes(std::string_view field) const;

  const Dialect& dialect() const { return dialect_; }

private:
  template <typename Row> void append_row(const Row& record, std::string& out) const;

  void append_field(std::string_view field, bool is_null, bool only_field,
                    std::string& out) const;
  bool should_quote(std::string_view field, bool is_null, bool only_field) const;
  bool is_special(char c) const;

  Dialect dialect_;
};

} // namespace csvstream

#endif // CSVSTREAM_SERIALIZER_H
