// =============================================================================
// idxz - Verify Command
// =============================================================================
// Command handler for checking an indexed zstd file against its index.
//
// Checks performed:
// 1. Index document loads
// 2. Frames are ordered, contiguous and end at the compressed file size
// 3. Every frame decodes, passes its content checksum and parses
// =============================================================================

#ifndef IDXZ_COMMANDS_VERIFY_COMMAND_H
#define IDXZ_COMMANDS_VERIFY_COMMAND_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "idxz/common/error.h"
#include "idxz/common/types.h"
#include "idxz/format/frame_index.h"

namespace idxz::commands {

// =============================================================================
// Verification Result
// =============================================================================

/// @brief Result of a single verification check.
struct VerificationResult {
    std::string checkName;
    bool passed = false;

    /// @brief Category of the failure (kSuccess when passed).
    ErrorCode code = ErrorCode::kSuccess;

    std::string errorMessage;
    std::string details;
};

/// @brief Overall verification summary.
struct VerificationSummary {
    std::uint32_t totalChecks = 0;
    std::uint32_t passedChecks = 0;
    std::uint32_t failedChecks = 0;
    std::vector<VerificationResult> results;

    [[nodiscard]] bool passed() const noexcept { return failedChecks == 0; }

    /// @brief Error code of the first failed check, or kSuccess.
    [[nodiscard]] ErrorCode firstFailure() const noexcept {
        for (const auto& result : results) {
            if (!result.passed) {
                return result.code;
            }
        }
        return ErrorCode::kSuccess;
    }

    void addResult(VerificationResult result) {
        ++totalChecks;
        if (result.passed) {
            ++passedChecks;
        } else {
            ++failedChecks;
        }
        results.push_back(std::move(result));
    }
};

// =============================================================================
// Verify Options
// =============================================================================

/// @brief Configuration options for verify command.
struct VerifyOptions {
    /// @brief Compressed input path.
    std::filesystem::path inputPath;

    /// @brief Index path (empty = <input>.idx).
    std::filesystem::path indexPath;

    /// @brief Stop on first error (frames are then checked sequentially).
    bool failFast = false;

    /// @brief Number of threads (0 = auto).
    std::size_t threads = 0;

    /// @brief Print every check, not only failures.
    bool verbose = false;
};

// =============================================================================
// VerifyCommand Class
// =============================================================================

/// @brief Command handler for verifying file integrity.
class VerifyCommand {
public:
    explicit VerifyCommand(VerifyOptions options);

    ~VerifyCommand();

    // Non-copyable, movable
    VerifyCommand(const VerifyCommand&) = delete;
    VerifyCommand& operator=(const VerifyCommand&) = delete;
    VerifyCommand(VerifyCommand&&) noexcept;
    VerifyCommand& operator=(VerifyCommand&&) noexcept;

    /// @brief Execute the verify command.
    /// @return Exit code (0 = success, else the code of the first failed check).
    [[nodiscard]] int execute();

    [[nodiscard]] const VerificationSummary& summary() const noexcept { return summary_; }

    [[nodiscard]] const VerifyOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] VerificationResult verifyIndexDocument();

    [[nodiscard]] VerificationResult verifyContiguity();

    /// @brief Decode every frame; one result per failing frame plus a total.
    [[nodiscard]] std::vector<VerificationResult> verifyFrames();

    void record(VerificationResult result);

    void printSummary() const;

    VerifyOptions options_;
    VerificationSummary summary_;
    format::FrameIndex index_;
};

}  // namespace idxz::commands

#endif  // IDXZ_COMMANDS_VERIFY_COMMAND_H
