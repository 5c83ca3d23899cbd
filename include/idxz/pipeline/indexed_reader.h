// =============================================================================
// idxz - Indexed Reader
// =============================================================================
// Decompression entry point: loads a frame index, opens the compressed file
// and runs one parallel decode pass with the selected aggregation strategy.
//
// Usage:
//   IndexedReader reader("table.zst", "table.zst.idx");
//   reader.open();
//   auto result = reader.read({.strategy = AggregationStrategy::kLocalCombine, .threads = 8});
//   IDXZ_LOG_INFO("{} keys", result.table->size());
//
// Setup failures (missing file, malformed index) throw. Frame failures only
// show up in ReadResult::stats.
// =============================================================================

#ifndef IDXZ_PIPELINE_INDEXED_READER_H
#define IDXZ_PIPELINE_INDEXED_READER_H

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>

#include "idxz/common/types.h"
#include "idxz/format/frame_index.h"
#include "idxz/format/frame_reader.h"
#include "idxz/pipeline/decode_scheduler.h"
#include "idxz/pipeline/record_table.h"

namespace idxz::pipeline {

/// @brief Options of one decode pass.
struct ReadOptions {
    AggregationStrategy strategy = AggregationStrategy::kConcurrentMap;

    /// @brief Worker threads (0 = hardware concurrency).
    std::size_t threads = 0;
};

/// @brief Outcome of one decode pass.
struct ReadResult {
    std::unique_ptr<RecordTable> table;
    DecodeStats stats;
};

/// @brief Reads a compressed file through its frame index.
class IndexedReader {
public:
    IndexedReader(std::filesystem::path compressedPath, std::filesystem::path indexPath);

    /// @brief Load the whole index and open the compressed file.
    /// @throws IOError, FormatError.
    void open();

    [[nodiscard]] bool isOpen() const noexcept { return frames_.has_value(); }

    /// @brief Decode every frame and aggregate the records.
    /// @throws UsageError if not opened.
    [[nodiscard]] ReadResult read(const ReadOptions& options);

    /// @pre isOpen()
    [[nodiscard]] const format::FrameIndex& index() const noexcept { return index_; }

    /// @pre isOpen()
    [[nodiscard]] const format::FrameReader& frames() const noexcept { return *frames_; }

    [[nodiscard]] const std::filesystem::path& compressedPath() const noexcept {
        return compressedPath_;
    }

    [[nodiscard]] const std::filesystem::path& indexPath() const noexcept { return indexPath_; }

private:
    std::filesystem::path compressedPath_;
    std::filesystem::path indexPath_;
    format::FrameIndex index_;
    std::optional<format::FrameReader> frames_;
};

/// @brief Open, read and aggregate in one call.
[[nodiscard]] ReadResult decompressFile(const std::filesystem::path& compressedPath,
                                        const std::filesystem::path& indexPath,
                                        const ReadOptions& options);

}  // namespace idxz::pipeline

#endif  // IDXZ_PIPELINE_INDEXED_READER_H
