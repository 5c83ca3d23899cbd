// =============================================================================
// idxz - Decompress Command Implementation
// =============================================================================

#include "decompress_command.h"

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <utility>

#include "idxz/common/logger.h"
#include "idxz/pipeline/decode_scheduler.h"
#include "idxz/pipeline/indexed_reader.h"

namespace idxz::commands {

DecompressCommand::DecompressCommand(DecompressOptions options) : options_(std::move(options)) {}

DecompressCommand::~DecompressCommand() = default;

DecompressCommand::DecompressCommand(DecompressCommand&&) noexcept = default;
DecompressCommand& DecompressCommand::operator=(DecompressCommand&&) noexcept = default;

int DecompressCommand::execute() {
    auto startTime = std::chrono::steady_clock::now();

    try {
        validateOptions();
        runDecompression();

        auto endTime = std::chrono::steady_clock::now();
        stats_.elapsedSeconds = std::chrono::duration<double>(endTime - startTime).count();

        if (options_.showSummary) {
            printSummary();
        }

        return 0;

    } catch (const IDXZException& e) {
        IDXZ_LOG_ERROR("Decompression failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        IDXZ_LOG_ERROR("Unexpected error: {}", e.what());
        return EXIT_FAILURE;
    }
}

void DecompressCommand::validateOptions() {
    if (!std::filesystem::exists(options_.inputPath)) {
        throw IOError(ErrorCode::kFileNotFound,
                      "Input file not found: " + options_.inputPath.string());
    }

    if (options_.indexPath.empty()) {
        options_.indexPath = options_.inputPath;
        options_.indexPath += std::string(kIndexSuffix);
    }

    if (!std::filesystem::exists(options_.indexPath)) {
        throw IOError(ErrorCode::kFileNotFound,
                      "Index file not found: " + options_.indexPath.string());
    }

    options_.threads = pipeline::resolveThreadCount(options_.threads);

    IDXZ_LOG_DEBUG("Decompression options validated");
    IDXZ_LOG_DEBUG("  Input: {}", options_.inputPath.string());
    IDXZ_LOG_DEBUG("  Index: {}", options_.indexPath.string());
    IDXZ_LOG_DEBUG("  Strategy: {}", aggregationStrategyToString(options_.strategy));
    IDXZ_LOG_DEBUG("  Threads: {}", options_.threads);
}

void DecompressCommand::runDecompression() {
    IDXZ_LOG_INFO("Starting decompression...");

    pipeline::ReadOptions readOptions;
    readOptions.strategy = options_.strategy;
    readOptions.threads = options_.threads;

    const auto result =
        pipeline::decompressFile(options_.inputPath, options_.indexPath, readOptions);

    stats_.framesTotal = result.stats.framesTotal;
    stats_.framesDecoded = result.stats.framesDecoded;
    stats_.framesFailed = result.stats.framesFailed;
    stats_.recordsProcessed = result.stats.recordsParsed;
    stats_.distinctKeys = result.table->size();

    if (result.stats.hasFailures()) {
        IDXZ_LOG_WARNING("{} of {} frame(s) could not be decoded and were skipped",
                         stats_.framesFailed, stats_.framesTotal);
    }
}

void DecompressCommand::printSummary() const {
    std::cout << "\n=== Decompression Summary ===" << std::endl;
    std::cout << "  Strategy:                " << aggregationStrategyToString(options_.strategy)
              << std::endl;
    std::cout << "  Threads:                 " << options_.threads << std::endl;
    std::cout << "  Frames decoded:          " << stats_.framesDecoded << " / "
              << stats_.framesTotal << std::endl;
    if (stats_.framesFailed > 0) {
        std::cout << "  Frames skipped:          " << stats_.framesFailed << std::endl;
    }
    std::cout << "  Total records processed: " << stats_.recordsProcessed << std::endl;
    std::cout << "  Distinct keys:           " << stats_.distinctKeys << std::endl;
    std::cout << "  Elapsed time:            " << std::fixed << std::setprecision(2)
              << stats_.elapsedSeconds << " s" << std::endl;
    std::cout << "=============================" << std::endl;
}

}  // namespace idxz::commands
