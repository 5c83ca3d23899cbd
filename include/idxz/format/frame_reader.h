// =============================================================================
// idxz - Positional Frame Reader
// =============================================================================
// Reads and decodes single frames by descriptor.
//
// The compressed file is opened once, read-only, and accessed exclusively with
// pread(2). No shared cursor is moved, so any number of decode workers may
// call readFrame() on the same reader concurrently.
//
// Failures (short reads, corrupted frames, checksum mismatches) are returned
// as Result errors scoped to the frame; they never throw.
// =============================================================================

#ifndef IDXZ_FORMAT_FRAME_READER_H
#define IDXZ_FORMAT_FRAME_READER_H

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "idxz/common/error.h"
#include "idxz/format/frame_index.h"

namespace idxz::format {

/// @brief Decompress a buffer holding exactly one complete zstd frame.
/// @param frame Compressed frame bytes.
/// @return Decompressed content, kChecksumError on checksum mismatch,
///         kCorruptedData if the buffer is not exactly one frame,
///         kDecompressionFailed for any other codec failure.
[[nodiscard]] Result<std::string> decodeFrame(std::string_view frame);

/// @brief Shared, read-only positional access to a compressed file.
///
/// Thread Safety: readRaw(), readFrame() and size() are safe to call concurrently.
class FrameReader {
public:
    /// @brief Open a compressed file for positional reads.
    /// @throws IOError if the file cannot be opened or inspected.
    explicit FrameReader(std::filesystem::path path);

    ~FrameReader();

    FrameReader(const FrameReader&) = delete;
    FrameReader& operator=(const FrameReader&) = delete;
    FrameReader(FrameReader&& other) noexcept;
    FrameReader& operator=(FrameReader&& other) noexcept;

    /// @brief Read the compressed bytes of one frame.
    /// @return Exactly descriptor.length bytes read at descriptor.position.
    [[nodiscard]] Result<std::string> readRaw(const FrameDescriptor& descriptor) const;

    /// @brief Read and decompress one frame.
    /// @return The frame's original content.
    [[nodiscard]] Result<std::string> readFrame(const FrameDescriptor& descriptor) const;

    /// @brief Size of the compressed file in bytes, as observed when opened.
    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    void close() noexcept;

    std::filesystem::path path_;
    int fd_ = -1;
    std::uint64_t size_ = 0;
};

}  // namespace idxz::format

#endif  // IDXZ_FORMAT_FRAME_READER_H
