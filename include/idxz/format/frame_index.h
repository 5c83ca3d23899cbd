// =============================================================================
// idxz - Frame Index
// =============================================================================
// Descriptors locating each compressed frame and their JSON persistence.
//
// The index file is a pretty-printed JSON array, one object per frame:
//
//   [
//     { "length": 151, "order": 0, "position": 0 },
//     { "length": 163, "order": 1, "position": 151 }
//   ]
//
// Frames written in one pass are contiguous: position[i] + length[i] equals
// position[i + 1], and the last frame ends at the compressed file size.
// =============================================================================

#ifndef IDXZ_FORMAT_FRAME_INDEX_H
#define IDXZ_FORMAT_FRAME_INDEX_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
#include <vector>

#include <nlohmann/json.hpp>

#include "idxz/common/error.h"
#include "idxz/common/types.h"

namespace idxz::format {

// =============================================================================
// Frame Descriptor
// =============================================================================

/// @brief Location of one compressed frame inside the compressed file.
struct FrameDescriptor {
    /// @brief Absolute byte offset of the frame's first byte.
    FileOffset position = 0;

    /// @brief Exact compressed length of the frame in bytes.
    std::uint64_t length = 0;

    /// @brief Zero-based sequence number assigned at write time.
    FrameOrder order = 0;

    FrameDescriptor() = default;
    FrameDescriptor(FileOffset position, std::uint64_t length, FrameOrder order)
        : position(position), length(length), order(order) {}

    /// @brief Offset one past the frame's last byte.
    [[nodiscard]] FileOffset end() const noexcept { return position + length; }

    /// @brief Frame length as an in-memory buffer size.
    /// @return The length, or kCorruptedData naming the frame position if it
    ///         does not fit in size_t.
    [[nodiscard]] Result<std::size_t> payloadSize() const;

    friend bool operator==(const FrameDescriptor&, const FrameDescriptor&) = default;
};

/// @brief Ordered sequence of frame descriptors.
using FrameIndex = std::vector<FrameDescriptor>;

void to_json(nlohmann::json& j, const FrameDescriptor& descriptor);
void from_json(const nlohmann::json& j, FrameDescriptor& descriptor);

// =============================================================================
// Persistence
// =============================================================================

/// @brief Serialize an index as pretty-printed JSON and flush the stream.
/// @throws IOError if the stream fails.
void writeFrameIndex(std::ostream& out, const FrameIndex& index);

/// @brief Load a complete index from a stream.
/// @throws FormatError if the document is malformed. No partial recovery.
[[nodiscard]] FrameIndex loadFrameIndex(std::istream& in);

/// @brief Load a complete index from a file.
/// @throws IOError if the file cannot be opened.
/// @throws FormatError if the document is malformed.
[[nodiscard]] FrameIndex loadFrameIndex(const std::filesystem::path& path);

// =============================================================================
// Validation
// =============================================================================

/// @brief Check that an index describes one complete write pass.
/// @param index The descriptors.
/// @param fileSize Compressed file size, if known.
/// @return Success, or kCorruptedData describing the first inconsistency
///         (non-sequential order, gap/overlap between frames, or a last frame
///         that does not end at fileSize).
[[nodiscard]] VoidResult checkContiguity(const FrameIndex& index,
                                         std::optional<std::uint64_t> fileSize = std::nullopt);

/// @brief Total compressed bytes described by an index.
[[nodiscard]] std::uint64_t compressedBytes(const FrameIndex& index) noexcept;

}  // namespace idxz::format

#endif  // IDXZ_FORMAT_FRAME_INDEX_H
