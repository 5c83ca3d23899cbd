// =============================================================================
// idxz - Line-Aligned Chunker
// =============================================================================
// Splits a byte stream into chunks that end on line boundaries.
//
// A chunk is built from whole lines until it reaches or exceeds the target
// block size, or the input is exhausted. Lines are never split, so a line
// longer than the block size becomes a chunk of its own.
//
// Usage:
//   LineChunker chunker(input, 64 * 1024);
//   while (auto chunk = chunker.next()) {
//       encoder.encode(output, chunk->data);
//   }
// =============================================================================

#ifndef IDXZ_IO_LINE_CHUNKER_H
#define IDXZ_IO_LINE_CHUNKER_H

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>

namespace idxz::io {

/// @brief One line-aligned block of input.
struct Chunk {
    /// @brief Raw bytes, always ending with '\n' unless the input ended without one.
    std::string data;

    /// @brief Number of input bytes consumed for this chunk.
    std::uint64_t bytesRead = 0;

    /// @brief Number of lines in this chunk.
    std::uint64_t lineCount = 0;
};

/// @brief Reads line-aligned chunks from an input stream.
///
/// Thread Safety: not thread-safe; owns no data but reads from the stream.
class LineChunker {
public:
    /// @brief Construct a chunker over an input stream.
    /// @param input Stream to read; must outlive the chunker.
    /// @param blockSize Target chunk size in bytes.
    /// @throws UsageError if blockSize is zero.
    LineChunker(std::istream& input, std::size_t blockSize);

    /// @brief Read the next chunk.
    /// @return The chunk, or std::nullopt when the input is exhausted.
    /// @throws IOError if the stream fails for a reason other than end of input.
    [[nodiscard]] std::optional<Chunk> next();

    [[nodiscard]] std::size_t blockSize() const noexcept { return blockSize_; }

    /// @brief Total bytes consumed so far.
    [[nodiscard]] std::uint64_t totalBytes() const noexcept { return totalBytes_; }

    /// @brief Total lines consumed so far.
    [[nodiscard]] std::uint64_t totalLines() const noexcept { return totalLines_; }

private:
    std::istream& input_;
    std::size_t blockSize_;
    std::string line_;
    std::uint64_t totalBytes_ = 0;
    std::uint64_t totalLines_ = 0;
};

}  // namespace idxz::io

#endif  // IDXZ_IO_LINE_CHUNKER_H
