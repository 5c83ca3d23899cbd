// =============================================================================
// idxz - Positional Frame Reader Implementation
// =============================================================================

#include "idxz/format/frame_reader.h"

#include <cerrno>
#include <cstdint>
#include <memory>
#include <new>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <fmt/format.h>
#include <zstd.h>
#include <zstd_errors.h>

#include "idxz/common/logger.h"

namespace idxz::format {

namespace {

/// @brief Largest content a single zstd block can carry.
constexpr std::uint64_t kMaxBlockContent = 128 * 1024;

/// @brief Smallest block that produces output: a 3-byte header plus one RLE byte.
constexpr std::uint64_t kMinProducingBlock = 4;

struct DecompressionContextDeleter {
    void operator()(ZSTD_DCtx* ctx) const noexcept { ZSTD_freeDCtx(ctx); }
};

using DecompressionContext = std::unique_ptr<ZSTD_DCtx, DecompressionContextDeleter>;

/// @brief Map a zstd error onto a frame-scoped error.
Error codecError(std::size_t rc, std::string_view what) {
    if (ZSTD_getErrorCode(rc) == ZSTD_error_checksum_wrong) {
        return Error{ErrorCode::kChecksumError,
                     fmt::format("{}: frame checksum mismatch", what)};
    }
    return Error{ErrorCode::kDecompressionFailed,
                 fmt::format("{}: {}", what, ZSTD_getErrorName(rc))};
}

/// @brief Decode a frame whose header does not record the content size.
Result<std::string> decodeStreaming(ZSTD_DCtx* ctx, std::string_view frame) {
    std::string content;
    std::string chunk(ZSTD_DStreamOutSize(), '\0');

    ZSTD_inBuffer input{frame.data(), frame.size(), 0};
    std::size_t rc = 1;
    bool progress = true;
    while (rc != 0 && progress) {
        ZSTD_outBuffer output{chunk.data(), chunk.size(), 0};
        rc = ZSTD_decompressStream(ctx, &output, &input);
        if (ZSTD_isError(rc)) {
            return std::unexpected(codecError(rc, "Zstd decompression failed"));
        }
        content.append(chunk.data(), output.pos);
        // A full output buffer may leave data buffered inside the context
        progress = input.pos < input.size || output.pos == output.size;
    }

    if (rc != 0) {
        return makeError<std::string>(ErrorCode::kCorruptedData, "Zstd frame is truncated");
    }
    return content;
}

}  // namespace

// =============================================================================
// Frame Decoding
// =============================================================================

Result<std::string> decodeFrame(std::string_view frame) {
    const std::size_t frameSize = ZSTD_findFrameCompressedSize(frame.data(), frame.size());
    if (ZSTD_isError(frameSize)) {
        return makeError<std::string>(
            ErrorCode::kCorruptedData,
            fmt::format("Not a complete zstd frame: {}", ZSTD_getErrorName(frameSize)));
    }
    if (frameSize != frame.size()) {
        return makeError<std::string>(
            ErrorCode::kCorruptedData,
            fmt::format("Frame length mismatch: descriptor has {} bytes, frame has {}",
                        frame.size(), frameSize));
    }

    const unsigned long long contentSize = ZSTD_getFrameContentSize(frame.data(), frame.size());
    if (contentSize == ZSTD_CONTENTSIZE_ERROR) {
        return makeError<std::string>(ErrorCode::kCorruptedData, "Invalid zstd frame header");
    }

    DecompressionContext ctx(ZSTD_createDCtx());
    if (!ctx) {
        return makeError<std::string>(ErrorCode::kDecompressionFailed,
                                      "Failed to create zstd decompression context");
    }

    if (contentSize == ZSTD_CONTENTSIZE_UNKNOWN) {
        return decodeStreaming(ctx.get(), frame);
    }

    // The header is untrusted until the checksum passes
    const std::uint64_t contentBound = (frame.size() / kMinProducingBlock) * kMaxBlockContent;
    if (contentSize > contentBound) {
        return makeError<std::string>(
            ErrorCode::kCorruptedData,
            fmt::format("Frame header announces {} bytes, a {}-byte frame holds at most {}",
                        contentSize, frame.size(), contentBound));
    }

    std::string content;
    try {
        content.resize(static_cast<std::size_t>(contentSize));
    } catch (const std::bad_alloc&) {
        return makeError<std::string>(
            ErrorCode::kDecompressionFailed,
            fmt::format("Cannot allocate {} bytes for frame content", contentSize));
    }

    const std::size_t decodedSize =
        ZSTD_decompressDCtx(ctx.get(), content.data(), content.size(), frame.data(), frame.size());
    if (ZSTD_isError(decodedSize)) {
        return std::unexpected(codecError(decodedSize, "Zstd decompression failed"));
    }
    if (decodedSize != content.size()) {
        return makeError<std::string>(
            ErrorCode::kCorruptedData,
            fmt::format("Frame decoded to {} bytes, header announced {}", decodedSize,
                        content.size()));
    }

    return content;
}

// =============================================================================
// FrameReader Implementation
// =============================================================================

FrameReader::FrameReader(std::filesystem::path path) : path_(std::move(path)) {
    fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw IOError("Failed to open compressed file",
                      std::error_code(errno, std::generic_category()),
                      ErrorContext(path_.string()));
    }

    struct stat st {};
    if (::fstat(fd_, &st) != 0) {
        const int err = errno;
        close();
        throw IOError("Failed to stat compressed file", std::error_code(err, std::generic_category()),
                      ErrorContext(path_.string()));
    }
    size_ = static_cast<std::uint64_t>(st.st_size);

    IDXZ_LOG_DEBUG("FrameReader opened: {} ({} bytes)", path_.string(), size_);
}

FrameReader::~FrameReader() {
    close();
}

FrameReader::FrameReader(FrameReader&& other) noexcept
    : path_(std::move(other.path_)), fd_(std::exchange(other.fd_, -1)), size_(other.size_) {}

FrameReader& FrameReader::operator=(FrameReader&& other) noexcept {
    if (this != &other) {
        close();
        path_ = std::move(other.path_);
        fd_ = std::exchange(other.fd_, -1);
        size_ = other.size_;
    }
    return *this;
}

void FrameReader::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Result<std::string> FrameReader::readRaw(const FrameDescriptor& descriptor) const {
    auto length = descriptor.payloadSize();
    if (!length) {
        return std::unexpected(length.error());
    }

    if (descriptor.position > size_ || descriptor.length > size_ - descriptor.position) {
        return makeError<std::string>(
            ErrorCode::kCorruptedData,
            fmt::format("Frame at position {} with length {} extends past the end of {} ({} bytes)",
                        descriptor.position, descriptor.length, path_.string(), size_));
    }

    std::string buffer;
    try {
        buffer.resize(*length);
    } catch (const std::bad_alloc&) {
        return makeError<std::string>(
            ErrorCode::kIOError,
            fmt::format("Cannot allocate {} bytes for the frame at position {}", *length,
                        descriptor.position));
    }

    std::size_t done = 0;
    while (done < buffer.size()) {
        const ssize_t n = ::pread(fd_, buffer.data() + done, buffer.size() - done,
                                  static_cast<off_t>(descriptor.position + done));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return makeError<std::string>(
                ErrorCode::kIOError,
                fmt::format("Read of the frame at position {} failed: {}", descriptor.position,
                            std::error_code(errno, std::generic_category()).message()));
        }
        if (n == 0) {
            return makeError<std::string>(
                ErrorCode::kCorruptedData,
                fmt::format("Unexpected end of file reading {} bytes at position {}",
                            buffer.size(), descriptor.position));
        }
        done += static_cast<std::size_t>(n);
    }

    return buffer;
}

Result<std::string> FrameReader::readFrame(const FrameDescriptor& descriptor) const {
    auto raw = readRaw(descriptor);
    if (!raw) {
        return raw;
    }

    auto content = decodeFrame(*raw);
    if (!content) {
        return makeError<std::string>(
            content.error().code(),
            fmt::format("{} (frame {} at position {})", content.error().message(),
                        descriptor.order, descriptor.position));
    }
    return content;
}

}  // namespace idxz::format
