// =============================================================================
// idxz - Compress Command Implementation
// =============================================================================

#include "compress_command.h"

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <utility>

#include "idxz/common/byte_size.h"
#include "idxz/common/logger.h"
#include "idxz/format/frame_encoder.h"
#include "idxz/format/indexed_writer.h"

namespace idxz::commands {

CompressCommand::CompressCommand(CompressOptions options) : options_(std::move(options)) {}

CompressCommand::~CompressCommand() = default;

CompressCommand::CompressCommand(CompressCommand&&) noexcept = default;
CompressCommand& CompressCommand::operator=(CompressCommand&&) noexcept = default;

int CompressCommand::execute() {
    auto startTime = std::chrono::steady_clock::now();

    try {
        validateOptions();
        runCompression();

        auto endTime = std::chrono::steady_clock::now();
        stats_.elapsedSeconds = std::chrono::duration<double>(endTime - startTime).count();

        if (options_.showSummary) {
            printSummary();
        }

        return 0;

    } catch (const IDXZException& e) {
        IDXZ_LOG_ERROR("Compression failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        IDXZ_LOG_ERROR("Unexpected error: {}", e.what());
        return EXIT_FAILURE;
    }
}

void CompressCommand::validateOptions() {
    if (!std::filesystem::exists(options_.inputPath)) {
        throw IOError(ErrorCode::kFileNotFound,
                      "Input file not found: " + options_.inputPath.string());
    }

    if (options_.indexPath.empty()) {
        options_.indexPath = options_.outputPath;
        options_.indexPath += std::string(kIndexSuffix);
    }

    std::error_code ec;
    if (std::filesystem::equivalent(options_.inputPath, options_.outputPath, ec)) {
        throw UsageError("Output file must differ from the input file");
    }
    if (options_.outputPath == options_.indexPath) {
        throw UsageError("Index file must differ from the output file");
    }

    if (!options_.forceOverwrite) {
        for (const auto& path : {options_.outputPath, options_.indexPath}) {
            if (std::filesystem::exists(path)) {
                throw IOError(ErrorCode::kFileExists,
                              "Output file already exists: " + path.string() +
                                  " (use -f to overwrite)");
            }
        }
    }

    if (options_.blockSize == 0) {
        throw UsageError("Block size must be greater than zero");
    }

    if (!format::isValidCompressionLevel(options_.compressionLevel)) {
        throw UsageError("Invalid compression level: " +
                         std::to_string(options_.compressionLevel));
    }

    IDXZ_LOG_DEBUG("Compression options validated");
    IDXZ_LOG_DEBUG("  Input: {}", options_.inputPath.string());
    IDXZ_LOG_DEBUG("  Output: {}", options_.outputPath.string());
    IDXZ_LOG_DEBUG("  Index: {}", options_.indexPath.string());
    IDXZ_LOG_DEBUG("  Block size: {}", formatByteSize(options_.blockSize));
    IDXZ_LOG_DEBUG("  Level: {}", options_.compressionLevel);
}

void CompressCommand::runCompression() {
    IDXZ_LOG_INFO("Starting compression...");

    format::WriterConfig config;
    config.blockSize = options_.blockSize;
    config.level = options_.compressionLevel;

    const auto summary =
        format::compressFile(options_.inputPath, options_.outputPath, options_.indexPath, config);

    stats_.inputBytes = summary.inputBytes;
    stats_.outputBytes = summary.outputBytes;
    stats_.lines = summary.lineCount;
    stats_.framesWritten = summary.frameCount();
}

void CompressCommand::printSummary() const {
    std::cout << "\n=== Compression Summary ===" << std::endl;
    std::cout << "  Input file:        " << options_.inputPath.string() << std::endl;
    std::cout << "  Output file:       " << options_.outputPath.string() << std::endl;
    std::cout << "  Index file:        " << options_.indexPath.string() << std::endl;
    std::cout << "  Lines:             " << stats_.lines << std::endl;
    std::cout << "  Frames written:    " << stats_.framesWritten << std::endl;
    std::cout << "  Input size:        " << formatByteSize(stats_.inputBytes) << std::endl;
    std::cout << "  Output size:       " << formatByteSize(stats_.outputBytes) << std::endl;
    std::cout << "  Compression ratio: " << std::fixed << std::setprecision(2)
              << stats_.compressionRatio() << "x" << std::endl;
    std::cout << "  Elapsed time:      " << std::fixed << std::setprecision(2)
              << stats_.elapsedSeconds << " s" << std::endl;
    std::cout << "  Throughput:        " << std::fixed << std::setprecision(2)
              << stats_.throughputMbps() << " MB/s" << std::endl;
    std::cout << "===========================" << std::endl;
}

}  // namespace idxz::commands
