// =============================================================================
// idxz - Human-Readable Byte Sizes
// =============================================================================
// Parsing and formatting of byte sizes such as "64KiB", "1.5 MB" or "4096".
//
// Accepted units (case-insensitive):
// - B                     bytes
// - K, KB, M, MB, G, GB, T, TB    powers of 1000
// - KiB, MiB, GiB, TiB            powers of 1024
// A bare number is a byte count.
// =============================================================================

#ifndef IDXZ_COMMON_BYTE_SIZE_H
#define IDXZ_COMMON_BYTE_SIZE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace idxz {

/// @brief Parse a byte size string.
/// @param str Size string (e.g., "64KiB", "2MB", "512").
/// @return Size in bytes, or nullopt if the string is malformed or overflows.
[[nodiscard]] std::optional<std::uint64_t> parseByteSize(std::string_view str);

/// @brief Parse a block size for the indexed writer.
/// @param str Size string.
/// @return A positive block size in bytes.
/// @throws UsageError if the string is malformed, zero or too large for size_t.
[[nodiscard]] std::size_t parseBlockSize(std::string_view str);

/// @brief Format a byte count using binary units.
/// @return Formatted string (e.g., "64.00 KiB", "1.50 GiB", "17 B").
[[nodiscard]] std::string formatByteSize(std::uint64_t bytes);

}  // namespace idxz

#endif  // IDXZ_COMMON_BYTE_SIZE_H
