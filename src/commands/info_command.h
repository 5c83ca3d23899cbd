// =============================================================================
// idxz - Info Command
// =============================================================================
// Command handler for describing a frame index.
//
// This module provides:
// - InfoCommand: Frame count, compressed size and layout of an index
// - Support for JSON output format
// - Per-frame listing
// =============================================================================

#ifndef IDXZ_COMMANDS_INFO_COMMAND_H
#define IDXZ_COMMANDS_INFO_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "idxz/common/error.h"
#include "idxz/format/frame_index.h"

namespace idxz::commands {

// =============================================================================
// Info Options
// =============================================================================

/// @brief Configuration options for info command.
struct InfoOptions {
    /// @brief Index file path.
    std::filesystem::path indexPath;

    /// @brief Compressed file, checked against the index when set.
    std::filesystem::path inputPath;

    /// @brief Output as JSON.
    bool jsonOutput = false;

    /// @brief List every frame.
    bool detailed = false;
};

// =============================================================================
// Index Statistics
// =============================================================================

/// @brief Aggregate figures of one index.
struct IndexInfo {
    std::uint64_t frameCount = 0;
    std::uint64_t compressedBytes = 0;
    std::uint64_t smallestFrame = 0;
    std::uint64_t largestFrame = 0;

    /// @brief Size of the compressed file, if one was given.
    std::optional<std::uint64_t> fileSize;

    /// @brief Empty when the layout is consistent.
    std::string layoutError;

    [[nodiscard]] double averageFrame() const noexcept {
        return frameCount > 0
                   ? static_cast<double>(compressedBytes) / static_cast<double>(frameCount)
                   : 0.0;
    }
};

/// @brief Compute the figures of an index.
[[nodiscard]] IndexInfo describeIndex(const format::FrameIndex& index,
                                      std::optional<std::uint64_t> fileSize);

// =============================================================================
// InfoCommand Class
// =============================================================================

/// @brief Command handler for displaying index information.
class InfoCommand {
public:
    explicit InfoCommand(InfoOptions options);

    ~InfoCommand();

    // Non-copyable, movable
    InfoCommand(const InfoCommand&) = delete;
    InfoCommand& operator=(const InfoCommand&) = delete;
    InfoCommand(InfoCommand&&) noexcept;
    InfoCommand& operator=(InfoCommand&&) noexcept;

    /// @brief Execute the info command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const InfoOptions& options() const noexcept { return options_; }

private:
    void printTextInfo(const format::FrameIndex& index, const IndexInfo& info) const;

    void printJsonInfo(const format::FrameIndex& index, const IndexInfo& info) const;

    void printFrameDetails(const format::FrameIndex& index) const;

    InfoOptions options_;
};

}  // namespace idxz::commands

#endif  // IDXZ_COMMANDS_INFO_COMMAND_H
