// =============================================================================
// idxz - Frame Encoder
// =============================================================================
// Compresses one chunk into one self-contained zstd frame.
//
// Every frame carries the zstd content checksum and its decompressed size, so
// a reader holding only the frame's bytes can decode and verify it without
// any neighbouring frame.
// =============================================================================

#ifndef IDXZ_FORMAT_FRAME_ENCODER_H
#define IDXZ_FORMAT_FRAME_ENCODER_H

#include <memory>
#include <ostream>
#include <string_view>
#include <vector>

#include "idxz/common/types.h"

struct ZSTD_CCtx_s;

namespace idxz::format {

/// @brief Byte range of one frame in the output stream.
struct FrameSpan {
    /// @brief Stream position before the frame's first byte.
    FileOffset start = 0;

    /// @brief Stream position after the frame's last byte.
    FileOffset end = 0;

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start; }
};

/// @brief Check a compression level against the range libzstd supports.
[[nodiscard]] bool isValidCompressionLevel(int level) noexcept;

/// @brief Encoder producing one checksummed zstd frame per call.
///
/// Thread Safety: not thread-safe; the compression context is reused between calls.
class FrameEncoder {
public:
    /// @brief Construct an encoder.
    /// @param level zstd compression level.
    /// @throws UsageError if the level is outside the supported range.
    /// @throws CompressionError if the compression context cannot be created.
    explicit FrameEncoder(int level = kDefaultCompressionLevel);

    ~FrameEncoder();

    FrameEncoder(const FrameEncoder&) = delete;
    FrameEncoder& operator=(const FrameEncoder&) = delete;
    FrameEncoder(FrameEncoder&&) noexcept;
    FrameEncoder& operator=(FrameEncoder&&) noexcept;

    /// @brief Append one frame holding `content` to `out`.
    /// @return Stream positions before and after the frame.
    /// @throws CompressionError if zstd fails.
    /// @throws IOError if the stream position cannot be read or the write fails.
    FrameSpan encode(std::ostream& out, std::string_view content);

    [[nodiscard]] int level() const noexcept { return level_; }

private:
    struct ContextDeleter {
        void operator()(ZSTD_CCtx_s* ctx) const noexcept;
    };

    int level_;
    std::unique_ptr<ZSTD_CCtx_s, ContextDeleter> context_;
    std::vector<char> buffer_;
};

}  // namespace idxz::format

#endif  // IDXZ_FORMAT_FRAME_ENCODER_H
