// =============================================================================
// idxz - Frame Index Implementation
// =============================================================================

#include "idxz/format/frame_index.h"

#include <fstream>
#include <limits>

#include <fmt/format.h>

#include "idxz/common/logger.h"

namespace idxz::format {

namespace {

/// @brief Read one unsigned 64-bit field from a descriptor object.
std::uint64_t readField(const nlohmann::json& j, const char* name) {
    const auto it = j.find(name);
    if (it == j.end()) {
        throw FormatError(fmt::format("frame descriptor is missing field '{}'", name));
    }
    if (!it->is_number_unsigned()) {
        throw FormatError(
            fmt::format("frame descriptor field '{}' must be a non-negative integer, got {}",
                        name, it->dump()));
    }
    return it->get<std::uint64_t>();
}

}  // namespace

// =============================================================================
// FrameDescriptor Implementation
// =============================================================================

Result<std::size_t> FrameDescriptor::payloadSize() const {
    if (length > std::numeric_limits<std::size_t>::max()) {
        return makeError<std::size_t>(
            ErrorCode::kCorruptedData,
            fmt::format("The frame at position {} could not be parsed correctly", position));
    }
    return static_cast<std::size_t>(length);
}

void to_json(nlohmann::json& j, const FrameDescriptor& descriptor) {
    j = nlohmann::json{{"position", descriptor.position},
                       {"length", descriptor.length},
                       {"order", descriptor.order}};
}

void from_json(const nlohmann::json& j, FrameDescriptor& descriptor) {
    if (!j.is_object()) {
        throw FormatError("frame descriptor must be an object, got " + j.dump());
    }
    descriptor.position = readField(j, "position");
    descriptor.length = readField(j, "length");
    descriptor.order = readField(j, "order");
}

// =============================================================================
// Persistence
// =============================================================================

void writeFrameIndex(std::ostream& out, const FrameIndex& index) {
    const nlohmann::json document = index;
    out << document.dump(2);
    out.flush();
    if (!out) {
        throw IOError("Failed to write frame index");
    }
    IDXZ_LOG_DEBUG("Frame index written: {} frames", index.size());
}

FrameIndex loadFrameIndex(std::istream& in) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw FormatError(fmt::format("Unable to load the frame index: {}", e.what()));
    }

    if (!document.is_array()) {
        throw FormatError("Unable to load the frame index: document is not an array");
    }

    FrameIndex index;
    index.reserve(document.size());
    for (const auto& entry : document) {
        try {
            index.push_back(entry.get<FrameDescriptor>());
        } catch (const FormatError& e) {
            throw FormatError(fmt::format("Unable to load the frame index: {} (entry {})",
                                          e.message(), index.size()));
        }
    }

    IDXZ_LOG_DEBUG("Frame index loaded: {} frames", index.size());
    return index;
}

FrameIndex loadFrameIndex(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw IOError(ErrorCode::kFileOpenFailed, "Failed to open index file: " + path.string());
    }

    try {
        return loadFrameIndex(in);
    } catch (const FormatError& e) {
        throw FormatError(e.message(), ErrorContext(path.string()));
    }
}

// =============================================================================
// Validation
// =============================================================================

VoidResult checkContiguity(const FrameIndex& index, std::optional<std::uint64_t> fileSize) {
    FileOffset expectedPosition = 0;

    for (std::size_t i = 0; i < index.size(); ++i) {
        const auto& descriptor = index[i];

        if (descriptor.order != i) {
            return makeVoidError(ErrorCode::kCorruptedData,
                                 fmt::format("frame {} has order {}, expected {}", i,
                                             descriptor.order, i));
        }
        if (descriptor.position != expectedPosition) {
            return makeVoidError(
                ErrorCode::kCorruptedData,
                fmt::format("frame {} starts at offset {}, expected {}", descriptor.order,
                            descriptor.position, expectedPosition));
        }
        if (descriptor.length == 0) {
            return makeVoidError(ErrorCode::kCorruptedData,
                                 fmt::format("frame {} has zero length", descriptor.order));
        }
        if (descriptor.length > std::numeric_limits<std::uint64_t>::max() - descriptor.position) {
            return makeVoidError(ErrorCode::kCorruptedData,
                                 fmt::format("frame {} length {} overflows the file offset range",
                                             descriptor.order, descriptor.length));
        }
        expectedPosition = descriptor.end();
    }

    if (fileSize.has_value() && *fileSize != expectedPosition) {
        return makeVoidError(ErrorCode::kCorruptedData,
                             fmt::format("frames end at offset {} but the file is {} bytes",
                                         expectedPosition, *fileSize));
    }

    return makeVoidSuccess();
}

std::uint64_t compressedBytes(const FrameIndex& index) noexcept {
    return index.empty() ? 0 : index.back().end();
}

}  // namespace idxz::format
