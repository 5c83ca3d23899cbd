// =============================================================================
// idxz - Common Type Definitions
// =============================================================================
// Core type definitions for the idxz library.
//
// This module defines:
// - Record: One parsed `key<TAB>value` line
// - AggregationStrategy: How per-frame records are merged into one table
// - FrameOrder, FileOffset: Type aliases
// - Default block size, compression level and field separator
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef IDXZ_COMMON_TYPES_H
#define IDXZ_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace idxz {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Zero-based sequence number of a frame inside one compressed file.
using FrameOrder = std::uint64_t;

/// @brief Absolute byte offset inside a file.
using FileOffset = std::uint64_t;

/// @brief Value type stored for every key (a taxonomy identifier).
using RecordValue = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Default block size in bytes (64 KiB).
inline constexpr std::size_t kDefaultBlockSize = 64 * 1024;

/// @brief Default block size as accepted on the command line.
inline constexpr std::string_view kDefaultBlockSizeString = "64KiB";

/// @brief Default zstd compression level.
inline constexpr int kDefaultCompressionLevel = 3;

/// @brief Separator between key and value inside a record line.
inline constexpr char kFieldSeparator = '\t';

/// @brief Record line terminator.
inline constexpr char kLineTerminator = '\n';

/// @brief Default suffix of the index file written next to the compressed file.
inline constexpr std::string_view kIndexSuffix = ".idx";

// =============================================================================
// Record
// =============================================================================

/// @brief One parsed record line.
struct Record {
    std::string key;
    RecordValue value = 0;

    friend bool operator==(const Record&, const Record&) = default;
};

/// @brief Records decoded from one frame, in line order.
using RecordList = std::vector<Record>;

// =============================================================================
// Aggregation Strategy
// =============================================================================

/// @brief Strategy used to merge per-frame record lists into one table.
enum class AggregationStrategy : std::uint8_t {
    /// @brief Every worker inserts directly into one concurrent hash map.
    kConcurrentMap = 0,

    /// @brief Workers keep their frame's records; one thread combines after the pass.
    kLocalCombine = 1,

    /// @brief Parallel reduction of local maps, merging the smaller into the larger.
    kParallelReduce = 2
};

/// @brief Parse a strategy name (canonical name or legacy alias).
/// @return The strategy, or std::nullopt for unknown names.
[[nodiscard]] std::optional<AggregationStrategy> parseAggregationStrategy(std::string_view str);

/// @brief Canonical command-line name of a strategy.
[[nodiscard]] std::string_view aggregationStrategyToString(AggregationStrategy strategy) noexcept;

/// @brief All accepted strategy names, for CLI validation.
[[nodiscard]] std::vector<std::string> aggregationStrategyNames();

}  // namespace idxz

#endif  // IDXZ_COMMON_TYPES_H
