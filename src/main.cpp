// =============================================================================
// idxz - Indexed Zstandard Tables
// =============================================================================
// Main entry point for the idxz command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: compress, decompress, info, verify
// - Global options: threads, verbose, quiet, log file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "idxz/common/byte_size.h"
#include "idxz/common/error.h"
#include "idxz/common/logger.h"
#include "idxz/common/types.h"

// Command implementations
#include "commands/compress_command.h"
#include "commands/decompress_command.h"
#include "commands/info_command.h"
#include "commands/verify_command.h"

namespace idxz::commands {
int runCompress(CLI::App* app);
int runDecompress(CLI::App* app);
int runInfo(CLI::App* app);
int runVerify(CLI::App* app);
}  // namespace idxz::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "idxz: Indexed Zstandard compression for tab-delimited key/value tables\n"
    "Input is cut into line-aligned blocks, each stored as an independent zstd frame.\n"
    "A JSON index of frame positions lets every frame be decoded in parallel.\n\n"
    "The compressed file stays a valid multi-frame zstd stream: 'zstd -d' restores\n"
    "the original table.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::size_t threads = 0;  // 0 = auto-detect
    int verbosity = 0;        // 0 = normal, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Compress Command Options
// =============================================================================

struct CliCompressOptions {
    std::string input;
    std::string output;
    std::string index;  // Empty = <output>.idx
    std::string blockSize{idxz::kDefaultBlockSizeString};
    int level = idxz::kDefaultCompressionLevel;
    bool force = false;
};

CliCompressOptions gCompressOpts;

// =============================================================================
// Decompress Command Options
// =============================================================================

struct CliDecompressOptions {
    std::string input;
    std::string index;  // Empty = <input>.idx
    std::string strategy = "concurrent-map";
};

CliDecompressOptions gDecompressOpts;

// =============================================================================
// Info Command Options
// =============================================================================

struct CliInfoOptions {
    std::string index;
    std::string input;      // Optional compressed file
    bool json = false;      // Output as JSON
    bool detailed = false;  // List every frame
};

CliInfoOptions gInfoOpts;

// =============================================================================
// Verify Command Options
// =============================================================================

struct CliVerifyOptions {
    std::string input;
    std::string index;
    bool failFast = false;  // Stop on first error
};

CliVerifyOptions gVerifyOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupCompressCommand(CLI::App& app) {
    auto* compress =
        app.add_subcommand("compress", "Compress a tab-delimited table into indexed zstd frames");
    compress->alias("c");

    compress->add_option("-i,--input", gCompressOpts.input, "Input table")
        ->required()
        ->check(CLI::ExistingFile);

    compress->add_option("-o,--output", gCompressOpts.output, "Output zstd file")->required();

    compress->add_option("-x,--index", gCompressOpts.index,
                         "Output index file (default: <output>.idx)");

    compress->add_option("-b,--block-size", gCompressOpts.blockSize,
                         "Uncompressed bytes per frame, e.g. 64KiB, 1MB, 500000")
        ->default_val(std::string(idxz::kDefaultBlockSizeString));

    compress->add_option("-l,--level", gCompressOpts.level, "zstd compression level")
        ->default_val(idxz::kDefaultCompressionLevel);

    compress->add_flag("-f,--force", gCompressOpts.force, "Overwrite existing output files");
}

void setupDecompressCommand(CLI::App& app) {
    auto* decompress = app.add_subcommand(
        "decompress", "Decode every frame in parallel and build the key/value table");
    decompress->alias("d");

    decompress->add_option("-i,--input", gDecompressOpts.input, "Input zstd file")
        ->required()
        ->check(CLI::ExistingFile);

    decompress->add_option("-x,--index", gDecompressOpts.index,
                           "Index file (default: <input>.idx)");

    decompress->add_option("-s,--strategy", gDecompressOpts.strategy,
                           "Aggregation strategy: concurrent-map, local-combine, parallel-reduce")
        ->default_val("concurrent-map")
        ->check(CLI::IsMember(idxz::aggregationStrategyNames(), CLI::ignore_case));
}

void setupInfoCommand(CLI::App& app) {
    auto* info = app.add_subcommand("info", "Display frame index information");
    info->alias("i");

    info->add_option("-x,--index", gInfoOpts.index, "Index file")
        ->required()
        ->check(CLI::ExistingFile);

    info->add_option("-i,--input", gInfoOpts.input,
                     "Compressed file to check the index against")
        ->check(CLI::ExistingFile);

    info->add_flag("--json", gInfoOpts.json, "Output as JSON");

    info->add_flag("--detailed", gInfoOpts.detailed, "List every frame");
}

void setupVerifyCommand(CLI::App& app) {
    auto* verify = app.add_subcommand("verify", "Verify a compressed file against its index");
    verify->alias("v");

    verify->add_option("-i,--input", gVerifyOpts.input, "Input zstd file")
        ->required()
        ->check(CLI::ExistingFile);

    verify->add_option("-x,--index", gVerifyOpts.index, "Index file (default: <input>.idx)");

    verify->add_flag("--fail-fast", gVerifyOpts.failFast, "Stop on first error");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_option("-t,--threads", gOptions.threads, "Number of threads (0 = auto-detect)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v, -vv for trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    // Setup subcommands
    setupCompressCommand(app);
    setupDecompressCommand(app);
    setupInfoCommand(app);
    setupVerifyCommand(app);

    // Require a subcommand
    app.require_subcommand(1);

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    // Initialize logger
    try {
        idxz::log::Config config;
        config.logFile = gOptions.logFile;
        config.level = idxz::log::Level::kInfo;
        if (gOptions.quiet) {
            config.level = idxz::log::Level::kError;
        } else if (gOptions.verbosity >= 2) {
            config.level = idxz::log::Level::kTrace;
        } else if (gOptions.verbosity >= 1) {
            config.level = idxz::log::Level::kDebug;
        }
        idxz::log::init(config);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    // Dispatch to subcommand handlers
    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("compress")) {
            exitCode = idxz::commands::runCompress(app.get_subcommand("compress"));
        } else if (app.got_subcommand("decompress")) {
            exitCode = idxz::commands::runDecompress(app.get_subcommand("decompress"));
        } else if (app.got_subcommand("info")) {
            exitCode = idxz::commands::runInfo(app.get_subcommand("info"));
        } else if (app.got_subcommand("verify")) {
            exitCode = idxz::commands::runVerify(app.get_subcommand("verify"));
        }
    } catch (const idxz::IDXZException& ex) {
        IDXZ_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        IDXZ_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    idxz::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace idxz::commands {

int runCompress([[maybe_unused]] CLI::App* app) {
    try {
        CompressOptions opts;
        opts.inputPath = gCompressOpts.input;
        opts.outputPath = gCompressOpts.output;
        opts.indexPath = gCompressOpts.index;
        opts.blockSize = parseBlockSize(gCompressOpts.blockSize);
        opts.compressionLevel = gCompressOpts.level;
        opts.forceOverwrite = gCompressOpts.force;
        opts.showSummary = !gOptions.quiet;

        auto cmd = std::make_unique<CompressCommand>(std::move(opts));
        return cmd->execute();
    } catch (const IDXZException& e) {
        IDXZ_LOG_ERROR("Compression failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        IDXZ_LOG_ERROR("Unexpected error: {}", e.what());
        return EXIT_FAILURE;
    }
}

int runDecompress([[maybe_unused]] CLI::App* app) {
    try {
        const auto strategy = parseAggregationStrategy(gDecompressOpts.strategy);
        if (!strategy) {
            throw UsageError("Unknown aggregation strategy: " + gDecompressOpts.strategy);
        }

        DecompressOptions opts;
        opts.inputPath = gDecompressOpts.input;
        opts.indexPath = gDecompressOpts.index;
        opts.strategy = *strategy;
        opts.threads = gOptions.threads;
        opts.showSummary = !gOptions.quiet;

        auto cmd = std::make_unique<DecompressCommand>(std::move(opts));
        return cmd->execute();
    } catch (const IDXZException& e) {
        IDXZ_LOG_ERROR("Decompression failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        IDXZ_LOG_ERROR("Unexpected error: {}", e.what());
        return EXIT_FAILURE;
    }
}

int runInfo([[maybe_unused]] CLI::App* app) {
    try {
        InfoOptions opts;
        opts.indexPath = gInfoOpts.index;
        opts.inputPath = gInfoOpts.input;
        opts.jsonOutput = gInfoOpts.json;
        opts.detailed = gInfoOpts.detailed;

        auto cmd = std::make_unique<InfoCommand>(std::move(opts));
        return cmd->execute();
    } catch (const IDXZException& e) {
        IDXZ_LOG_ERROR("Info command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        IDXZ_LOG_ERROR("Unexpected error: {}", e.what());
        return EXIT_FAILURE;
    }
}

int runVerify([[maybe_unused]] CLI::App* app) {
    try {
        VerifyOptions opts;
        opts.inputPath = gVerifyOpts.input;
        opts.indexPath = gVerifyOpts.index;
        opts.failFast = gVerifyOpts.failFast;
        opts.threads = gOptions.threads;
        opts.verbose = gOptions.verbosity > 0;

        auto cmd = std::make_unique<VerifyCommand>(std::move(opts));
        return cmd->execute();
    } catch (const IDXZException& e) {
        IDXZ_LOG_ERROR("Verification failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        IDXZ_LOG_ERROR("Unexpected error: {}", e.what());
        return EXIT_FAILURE;
    }
}

}  // namespace idxz::commands
