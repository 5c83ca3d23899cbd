// =============================================================================
// idxz - Decompress Command
// =============================================================================
// Command handler for reading an indexed zstd file back into a key/value
// table using parallel frame decoding.
//
// This module provides:
// - DecompressOptions: Input paths, aggregation strategy and thread count
// - DecompressionStats: Frame and record counters of one run
// - DecompressCommand: Validates options and drives the indexed reader
// =============================================================================

#ifndef IDXZ_COMMANDS_DECOMPRESS_COMMAND_H
#define IDXZ_COMMANDS_DECOMPRESS_COMMAND_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "idxz/common/error.h"
#include "idxz/common/types.h"

namespace idxz::commands {

// =============================================================================
// Decompression Options
// =============================================================================

/// @brief Configuration options for decompression.
struct DecompressOptions {
    /// @brief Compressed input path.
    std::filesystem::path inputPath;

    /// @brief Index path (empty = <input>.idx).
    std::filesystem::path indexPath;

    /// @brief How per-frame records are merged.
    AggregationStrategy strategy = AggregationStrategy::kConcurrentMap;

    /// @brief Number of threads (0 = auto).
    std::size_t threads = 0;

    /// @brief Print a summary when done.
    bool showSummary = true;
};

// =============================================================================
// Decompression Statistics
// =============================================================================

/// @brief Statistics from decompression operation.
struct DecompressionStats {
    std::uint64_t framesTotal = 0;
    std::uint64_t framesDecoded = 0;
    std::uint64_t framesFailed = 0;

    /// @brief Records parsed from all decoded frames.
    std::uint64_t recordsProcessed = 0;

    /// @brief Distinct keys in the final table.
    std::uint64_t distinctKeys = 0;

    double elapsedSeconds = 0.0;
};

// =============================================================================
// DecompressCommand Class
// =============================================================================

/// @brief Command handler for parallel table decompression.
class DecompressCommand {
public:
    explicit DecompressCommand(DecompressOptions options);

    ~DecompressCommand();

    // Non-copyable, movable
    DecompressCommand(const DecompressCommand&) = delete;
    DecompressCommand& operator=(const DecompressCommand&) = delete;
    DecompressCommand(DecompressCommand&&) noexcept;
    DecompressCommand& operator=(DecompressCommand&&) noexcept;

    /// @brief Execute the decompression.
    /// @return Exit code (0 = success, also when individual frames were skipped).
    [[nodiscard]] int execute();

    [[nodiscard]] const DecompressionStats& stats() const noexcept { return stats_; }

    [[nodiscard]] const DecompressOptions& options() const noexcept { return options_; }

private:
    void validateOptions();

    void runDecompression();

    void printSummary() const;

    DecompressOptions options_;
    DecompressionStats stats_;
};

}  // namespace idxz::commands

#endif  // IDXZ_COMMANDS_DECOMPRESS_COMMAND_H
