// =============================================================================
// idxz - Frame Encoder Implementation
// =============================================================================

#include "idxz/format/frame_encoder.h"

#include <string>

#include <zstd.h>

#include "idxz/common/error.h"
#include "idxz/common/logger.h"

namespace idxz::format {

bool isValidCompressionLevel(int level) noexcept {
    return level >= ZSTD_minCLevel() && level <= ZSTD_maxCLevel();
}

void FrameEncoder::ContextDeleter::operator()(ZSTD_CCtx_s* ctx) const noexcept {
    ZSTD_freeCCtx(ctx);
}

FrameEncoder::FrameEncoder(int level) : level_(level) {
    if (!isValidCompressionLevel(level_)) {
        throw UsageError("Compression level " + std::to_string(level_) + " is outside " +
                         std::to_string(ZSTD_minCLevel()) + ".." +
                         std::to_string(ZSTD_maxCLevel()));
    }

    context_.reset(ZSTD_createCCtx());
    if (!context_) {
        throw CompressionError("Failed to create zstd compression context");
    }

    std::size_t rc = ZSTD_CCtx_setParameter(context_.get(), ZSTD_c_compressionLevel, level_);
    if (!ZSTD_isError(rc)) {
        rc = ZSTD_CCtx_setParameter(context_.get(), ZSTD_c_checksumFlag, 1);
    }
    if (!ZSTD_isError(rc)) {
        rc = ZSTD_CCtx_setParameter(context_.get(), ZSTD_c_contentSizeFlag, 1);
    }
    if (ZSTD_isError(rc)) {
        throw CompressionError("Failed to configure zstd compression context: " +
                               std::string(ZSTD_getErrorName(rc)));
    }
}

FrameEncoder::~FrameEncoder() = default;

FrameEncoder::FrameEncoder(FrameEncoder&&) noexcept = default;
FrameEncoder& FrameEncoder::operator=(FrameEncoder&&) noexcept = default;

FrameSpan FrameEncoder::encode(std::ostream& out, std::string_view content) {
    FrameSpan span;

    const auto start = out.tellp();
    if (start == std::ostream::pos_type(-1)) {
        throw IOError("Unable to find current location of the compressed stream");
    }
    span.start = static_cast<FileOffset>(start);

    buffer_.resize(ZSTD_compressBound(content.size()));

    const std::size_t compressedSize = ZSTD_compress2(context_.get(), buffer_.data(),
                                                      buffer_.size(), content.data(),
                                                      content.size());
    if (ZSTD_isError(compressedSize)) {
        throw CompressionError("Zstd compression failed: " +
                                   std::string(ZSTD_getErrorName(compressedSize)),
                               ErrorContext{}.withOffset(span.start));
    }

    out.write(buffer_.data(), static_cast<std::streamsize>(compressedSize));
    out.flush();
    if (!out) {
        throw IOError("Unable to write to the compressed stream",
                      ErrorContext{}.withOffset(span.start));
    }

    const auto end = out.tellp();
    if (end == std::ostream::pos_type(-1)) {
        throw IOError("Unable to find current location of the compressed stream");
    }
    span.end = static_cast<FileOffset>(end);

    IDXZ_LOG_TRACE("Frame encoded: offset={}, {} -> {} bytes", span.start, content.size(),
                   span.length());
    return span;
}

}  // namespace idxz::format
