// =============================================================================
// idxz - Record Parser
// =============================================================================
// Parses decompressed frame content into key/value records.
//
// Each line has the form `key<TAB>value`:
// - Lines without a tab are skipped.
// - Keys are decoded permissively: invalid UTF-8 is replaced with U+FFFD.
// - Values are unsigned integers after trimming surrounding whitespace. One
//   leading '+' is accepted. A value that does not parse is logged and
//   stored as 0.
// - Duplicate keys are kept as separate records in line order.
// =============================================================================

#ifndef IDXZ_IO_RECORD_PARSER_H
#define IDXZ_IO_RECORD_PARSER_H

#include <string>
#include <string_view>

#include "idxz/common/error.h"
#include "idxz/common/types.h"

namespace idxz::io {

/// @brief Parse a record value field.
/// @param field Raw bytes after the separator.
/// @return The value, or kInvalidArgument if the trimmed field is not a
///         non-negative integer representable in 64 bits. A single
///         leading '+' is allowed.
[[nodiscard]] Result<RecordValue> parseValue(std::string_view field);

/// @brief Replace invalid UTF-8 with U+FFFD.
/// @note Each maximal prefix of a broken sequence becomes one U+FFFD, and
///       every stray continuation byte becomes its own U+FFFD.
[[nodiscard]] std::string sanitizeUtf8(std::string_view bytes);

/// @brief Parse every record line in a block of decompressed content.
/// @param content Decompressed frame bytes.
/// @return Records in line order.
[[nodiscard]] RecordList parseRecords(std::string_view content);

}  // namespace idxz::io

#endif  // IDXZ_IO_RECORD_PARSER_H
