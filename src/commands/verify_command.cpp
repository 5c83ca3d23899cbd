// =============================================================================
// idxz - Verify Command Implementation
// =============================================================================

#include "verify_command.h"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <utility>

#include <fmt/format.h>

#include "idxz/common/logger.h"
#include "idxz/format/frame_reader.h"
#include "idxz/pipeline/decode_scheduler.h"

namespace idxz::commands {

namespace {

VerificationResult frameFailure(const format::FrameDescriptor& descriptor, const Error& error) {
    VerificationResult result;
    result.checkName = fmt::format("Frame {}", descriptor.order);
    result.passed = false;
    result.code = error.code();
    result.errorMessage = error.message();
    result.details = fmt::format("position {}, length {}", descriptor.position, descriptor.length);
    return result;
}

}  // namespace

// =============================================================================
// VerifyCommand Implementation
// =============================================================================

VerifyCommand::VerifyCommand(VerifyOptions options) : options_(std::move(options)) {}

VerifyCommand::~VerifyCommand() = default;

VerifyCommand::VerifyCommand(VerifyCommand&&) noexcept = default;
VerifyCommand& VerifyCommand::operator=(VerifyCommand&&) noexcept = default;

int VerifyCommand::execute() {
    try {
        if (!std::filesystem::exists(options_.inputPath)) {
            throw IOError(ErrorCode::kFileNotFound,
                          "Input file not found: " + options_.inputPath.string());
        }
        if (options_.indexPath.empty()) {
            options_.indexPath = options_.inputPath;
            options_.indexPath += std::string(kIndexSuffix);
        }

        if (options_.verbose) {
            std::cout << "Verifying: " << options_.inputPath.string() << std::endl;
            std::cout << "Index:     " << options_.indexPath.string() << std::endl;
            std::cout << std::endl;
        }

        // 1. The index document; nothing else can be checked without it
        auto indexResult = verifyIndexDocument();
        const bool indexLoaded = indexResult.passed;
        record(std::move(indexResult));

        // 2. Frame layout
        bool shouldContinue = indexLoaded;
        if (shouldContinue) {
            auto layoutResult = verifyContiguity();
            if (!layoutResult.passed && options_.failFast) {
                shouldContinue = false;
            }
            record(std::move(layoutResult));
        }

        // 3. Frame contents
        if (shouldContinue) {
            for (auto& result : verifyFrames()) {
                record(std::move(result));
            }
        }

        printSummary();

        return summary_.passed() ? 0 : toExitCode(summary_.firstFailure());

    } catch (const IDXZException& e) {
        IDXZ_LOG_ERROR("Verification failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        IDXZ_LOG_ERROR("Unexpected error: {}", e.what());
        return EXIT_FAILURE;
    }
}

void VerifyCommand::record(VerificationResult result) {
    if (options_.verbose || !result.passed) {
        std::cout << "[" << (result.passed ? "PASS" : "FAIL") << "] " << result.checkName;
        if (!result.passed) {
            std::cout << ": " << result.errorMessage;
        }
        if (!result.details.empty()) {
            std::cout << " (" << result.details << ")";
        }
        std::cout << std::endl;
    }
    summary_.addResult(std::move(result));
}

VerificationResult VerifyCommand::verifyIndexDocument() {
    VerificationResult result;
    result.checkName = "Index Document";

    try {
        index_ = format::loadFrameIndex(options_.indexPath);
    } catch (const IDXZException& e) {
        result.passed = false;
        result.code = e.code();
        result.errorMessage = e.message();
        return result;
    }

    result.passed = true;
    result.details = fmt::format("{} frame(s)", index_.size());
    return result;
}

VerificationResult VerifyCommand::verifyContiguity() {
    VerificationResult result;
    result.checkName = "Frame Layout";

    std::error_code ec;
    const auto fileSize = std::filesystem::file_size(options_.inputPath, ec);
    if (ec) {
        result.passed = false;
        result.code = ErrorCode::kIOError;
        result.errorMessage = "Cannot determine compressed file size: " + ec.message();
        return result;
    }

    auto layout = format::checkContiguity(index_, fileSize);
    if (!layout) {
        result.passed = false;
        result.code = layout.error().code();
        result.errorMessage = layout.error().message();
        return result;
    }

    result.passed = true;
    result.details = fmt::format("{} compressed bytes", fileSize);
    return result;
}

std::vector<VerificationResult> VerifyCommand::verifyFrames() {
    std::vector<VerificationResult> failures;
    format::FrameReader reader(options_.inputPath);

    std::uint64_t framesChecked = 0;
    std::uint64_t records = 0;

    if (options_.failFast) {
        pipeline::DecodeScheduler scheduler(pipeline::SchedulerConfig{.threads = 1});
        for (const auto& descriptor : index_) {
            ++framesChecked;
            auto decoded = scheduler.decodeFrame(reader, descriptor);
            if (!decoded) {
                failures.push_back(frameFailure(descriptor, decoded.error()));
                break;
            }
            records += decoded->size();
        }
    } else {
        pipeline::DecodeScheduler scheduler(
            pipeline::SchedulerConfig{.threads = pipeline::resolveThreadCount(options_.threads)});

        std::mutex failureMutex;
        std::vector<std::pair<std::size_t, VerificationResult>> slotted;

        const auto stats = scheduler.forEachFrame(
            index_, reader, [](std::size_t, const format::FrameDescriptor&, RecordList&&) {},
            [&](std::size_t slot, const format::FrameDescriptor& descriptor, const Error& error) {
                std::lock_guard<std::mutex> lock(failureMutex);
                slotted.emplace_back(slot, frameFailure(descriptor, error));
            });

        std::sort(slotted.begin(), slotted.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });
        for (auto& entry : slotted) {
            failures.push_back(std::move(entry.second));
        }

        framesChecked = stats.framesTotal;
        records = stats.recordsParsed;
    }

    VerificationResult total;
    total.checkName = "Frame Contents";
    total.passed = failures.empty();
    if (!total.passed) {
        total.code = failures.front().code;
        total.errorMessage = fmt::format("{} frame(s) failed", failures.size());
    }
    total.details = fmt::format("{} frame(s) checked, {} record(s)", framesChecked, records);

    failures.push_back(std::move(total));
    return failures;
}

void VerifyCommand::printSummary() const {
    std::cout << std::endl;
    std::cout << "=== Verification Summary ===" << std::endl;
    std::cout << "  Total checks:  " << summary_.totalChecks << std::endl;
    std::cout << "  Passed:        " << summary_.passedChecks << std::endl;
    std::cout << "  Failed:        " << summary_.failedChecks << std::endl;
    std::cout << "  Status:        " << (summary_.passed() ? "OK" : "FAILED") << std::endl;
    std::cout << "============================" << std::endl;
}

}  // namespace idxz::commands
