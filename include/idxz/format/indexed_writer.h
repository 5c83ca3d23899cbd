// =============================================================================
// idxz - Indexed Writer
// =============================================================================
// Drives one compression pass: line-aligned chunks are encoded as independent
// zstd frames and a descriptor is recorded for each.
//
// Usage:
//   WriterConfig config{.blockSize = parseBlockSize("64KiB"), .level = 3};
//   auto summary = compressFile("table.tsv", "table.zst", "table.zst.idx", config);
//
// The index is written only after every frame was encoded; a failing frame
// aborts the pass before any index is produced.
// =============================================================================

#ifndef IDXZ_FORMAT_INDEXED_WRITER_H
#define IDXZ_FORMAT_INDEXED_WRITER_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <ostream>

#include "idxz/common/types.h"
#include "idxz/format/frame_index.h"

namespace idxz::format {

/// @brief Parameters of one compression pass.
struct WriterConfig {
    /// @brief Target uncompressed bytes per frame (must be > 0).
    std::size_t blockSize = kDefaultBlockSize;

    /// @brief zstd compression level.
    int level = kDefaultCompressionLevel;
};

/// @brief Outcome of one compression pass.
struct WriteSummary {
    /// @brief Descriptors of every frame written, in order.
    FrameIndex index;

    /// @brief Uncompressed bytes consumed.
    std::uint64_t inputBytes = 0;

    /// @brief Compressed bytes written.
    std::uint64_t outputBytes = 0;

    /// @brief Lines consumed.
    std::uint64_t lineCount = 0;

    [[nodiscard]] std::size_t frameCount() const noexcept { return index.size(); }

    [[nodiscard]] double compressionRatio() const noexcept {
        return outputBytes > 0 ? static_cast<double>(inputBytes) / static_cast<double>(outputBytes)
                               : 0.0;
    }
};

/// @brief Writes a compressed file and its frame index.
class IndexedWriter {
public:
    /// @throws UsageError if blockSize is zero or the level is invalid.
    explicit IndexedWriter(WriterConfig config);

    /// @brief Compress `input` into `output` and write the index to `index`.
    /// @param input Line-delimited input.
    /// @param output Compressed byte stream; frames are appended at its current position.
    /// @param index Destination of the JSON index.
    /// @return Summary including every descriptor written.
    /// @throws CompressionError, IOError on failure (no index is written).
    WriteSummary write(std::istream& input, std::ostream& output, std::ostream& index);

    [[nodiscard]] const WriterConfig& config() const noexcept { return config_; }

private:
    WriterConfig config_;
};

/// @brief Compression entry point working on file paths.
/// @throws IOError if the input cannot be read or an output cannot be created.
/// @throws UsageError, CompressionError as IndexedWriter.
WriteSummary compressFile(const std::filesystem::path& inputPath,
                          const std::filesystem::path& outputPath,
                          const std::filesystem::path& indexPath,
                          const WriterConfig& config);

}  // namespace idxz::format

#endif  // IDXZ_FORMAT_INDEXED_WRITER_H
