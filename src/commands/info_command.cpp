// =============================================================================
// idxz - Info Command Implementation
// =============================================================================

#include "info_command.h"

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <utility>

#include <nlohmann/json.hpp>

#include "idxz/common/byte_size.h"
#include "idxz/common/logger.h"

namespace idxz::commands {

IndexInfo describeIndex(const format::FrameIndex& index, std::optional<std::uint64_t> fileSize) {
    IndexInfo info;
    info.frameCount = index.size();
    info.compressedBytes = format::compressedBytes(index);
    info.fileSize = fileSize;

    if (!index.empty()) {
        const auto [smallest, largest] = std::minmax_element(
            index.begin(), index.end(),
            [](const auto& a, const auto& b) { return a.length < b.length; });
        info.smallestFrame = smallest->length;
        info.largestFrame = largest->length;
    }

    if (auto layout = format::checkContiguity(index, fileSize); !layout) {
        info.layoutError = layout.error().message();
    }
    return info;
}

// =============================================================================
// InfoCommand Implementation
// =============================================================================

InfoCommand::InfoCommand(InfoOptions options) : options_(std::move(options)) {}

InfoCommand::~InfoCommand() = default;

InfoCommand::InfoCommand(InfoCommand&&) noexcept = default;
InfoCommand& InfoCommand::operator=(InfoCommand&&) noexcept = default;

int InfoCommand::execute() {
    try {
        if (!std::filesystem::exists(options_.indexPath)) {
            throw IOError(ErrorCode::kFileNotFound,
                          "Index file not found: " + options_.indexPath.string());
        }

        std::optional<std::uint64_t> fileSize;
        if (!options_.inputPath.empty()) {
            std::error_code ec;
            fileSize = std::filesystem::file_size(options_.inputPath, ec);
            if (ec) {
                throw IOError("Cannot determine compressed file size", ec,
                              ErrorContext(options_.inputPath.string()));
            }
        }

        const auto index = format::loadFrameIndex(options_.indexPath);
        const auto info = describeIndex(index, fileSize);

        if (options_.jsonOutput) {
            printJsonInfo(index, info);
        } else {
            printTextInfo(index, info);
        }

        return 0;

    } catch (const IDXZException& e) {
        IDXZ_LOG_ERROR("Info command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        IDXZ_LOG_ERROR("Unexpected error: {}", e.what());
        return EXIT_FAILURE;
    }
}

void InfoCommand::printTextInfo(const format::FrameIndex& index, const IndexInfo& info) const {
    std::cout << "=== Frame Index Information ===" << std::endl;
    std::cout << std::endl;
    std::cout << "Index:            " << options_.indexPath.string() << std::endl;
    if (info.fileSize) {
        std::cout << "Compressed file:  " << options_.inputPath.string() << std::endl;
        std::cout << "File size:        " << formatByteSize(*info.fileSize) << std::endl;
    }
    std::cout << "Frames:           " << info.frameCount << std::endl;
    std::cout << "Compressed bytes: " << info.compressedBytes << std::endl;
    if (info.frameCount > 0) {
        std::cout << "Frame length:     min " << info.smallestFrame << ", max "
                  << info.largestFrame << ", avg " << std::fixed << std::setprecision(1)
                  << info.averageFrame() << std::endl;
    }
    std::cout << "Layout:           "
              << (info.layoutError.empty() ? "contiguous" : "INCONSISTENT") << std::endl;

    if (!info.layoutError.empty()) {
        std::cout << std::endl;
        std::cout << "WARNING: " << info.layoutError << std::endl;
    }

    if (options_.detailed) {
        printFrameDetails(index);
    }

    std::cout << std::endl;
    std::cout << "===============================" << std::endl;
}

void InfoCommand::printJsonInfo(const format::FrameIndex& index, const IndexInfo& info) const {
    nlohmann::json doc;
    doc["index"] = options_.indexPath.string();
    doc["frames"] = info.frameCount;
    doc["compressed_bytes"] = info.compressedBytes;
    doc["smallest_frame"] = info.smallestFrame;
    doc["largest_frame"] = info.largestFrame;
    doc["contiguous"] = info.layoutError.empty();
    if (!info.layoutError.empty()) {
        doc["layout_error"] = info.layoutError;
    }
    if (info.fileSize) {
        doc["file"] = options_.inputPath.string();
        doc["file_size"] = *info.fileSize;
    }
    if (options_.detailed) {
        doc["frame_list"] = index;
    }

    std::cout << doc.dump(2) << std::endl;
}

void InfoCommand::printFrameDetails(const format::FrameIndex& index) const {
    std::cout << std::endl;
    std::cout << "--- Frames ---" << std::endl;
    std::cout << std::setw(10) << "order" << std::setw(16) << "position" << std::setw(12)
              << "length" << std::endl;
    for (const auto& descriptor : index) {
        std::cout << std::setw(10) << descriptor.order << std::setw(16) << descriptor.position
                  << std::setw(12) << descriptor.length << std::endl;
    }
}

}  // namespace idxz::commands
