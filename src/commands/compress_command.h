// =============================================================================
// idxz - Compress Command
// =============================================================================
// Command handler for compressing a tab-delimited table into an indexed,
// frame-per-block zstd file.
//
// This module provides:
// - CompressOptions: Configuration options for compression
// - CompressionStats: Sizes, frame count and timing of one run
// - CompressCommand: Validates options and drives the indexed writer
// =============================================================================

#ifndef IDXZ_COMMANDS_COMPRESS_COMMAND_H
#define IDXZ_COMMANDS_COMPRESS_COMMAND_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "idxz/common/error.h"
#include "idxz/common/types.h"

namespace idxz::commands {

// =============================================================================
// Compression Options
// =============================================================================

/// @brief Configuration options for compression.
struct CompressOptions {
    /// @brief Input table path.
    std::filesystem::path inputPath;

    /// @brief Compressed output path.
    std::filesystem::path outputPath;

    /// @brief Index output path (empty = <output>.idx).
    std::filesystem::path indexPath;

    /// @brief Target uncompressed bytes per frame.
    std::size_t blockSize = kDefaultBlockSize;

    /// @brief zstd compression level.
    int compressionLevel = kDefaultCompressionLevel;

    /// @brief Overwrite existing output and index files.
    bool forceOverwrite = false;

    /// @brief Print a summary when done.
    bool showSummary = true;
};

// =============================================================================
// Compression Statistics
// =============================================================================

/// @brief Statistics from compression operation.
struct CompressionStats {
    std::uint64_t inputBytes = 0;
    std::uint64_t outputBytes = 0;
    std::uint64_t lines = 0;
    std::uint64_t framesWritten = 0;

    /// @brief Elapsed time in seconds.
    double elapsedSeconds = 0.0;

    /// @brief Compression ratio (input/output).
    [[nodiscard]] double compressionRatio() const noexcept {
        return outputBytes > 0 ? static_cast<double>(inputBytes) / static_cast<double>(outputBytes)
                               : 0.0;
    }

    /// @brief Throughput in MB/s.
    [[nodiscard]] double throughputMbps() const noexcept {
        return elapsedSeconds > 0
                   ? (static_cast<double>(inputBytes) / (1024 * 1024)) / elapsedSeconds
                   : 0.0;
    }
};

// =============================================================================
// CompressCommand Class
// =============================================================================

/// @brief Command handler for table compression.
class CompressCommand {
public:
    explicit CompressCommand(CompressOptions options);

    ~CompressCommand();

    // Non-copyable, movable
    CompressCommand(const CompressCommand&) = delete;
    CompressCommand& operator=(const CompressCommand&) = delete;
    CompressCommand(CompressCommand&&) noexcept;
    CompressCommand& operator=(CompressCommand&&) noexcept;

    /// @brief Execute the compression.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const CompressionStats& stats() const noexcept { return stats_; }

    [[nodiscard]] const CompressOptions& options() const noexcept { return options_; }

private:
    /// @brief Validate options before execution.
    void validateOptions();

    /// @brief Run the indexed writer.
    void runCompression();

    /// @brief Print summary statistics.
    void printSummary() const;

    CompressOptions options_;
    CompressionStats stats_;
};

}  // namespace idxz::commands

#endif  // IDXZ_COMMANDS_COMPRESS_COMMAND_H
