// =============================================================================
// idxz - Indexed Writer Implementation
// =============================================================================

#include "idxz/format/indexed_writer.h"

#include <fstream>
#include <sstream>

#include "idxz/common/error.h"
#include "idxz/common/logger.h"
#include "idxz/format/frame_encoder.h"
#include "idxz/io/line_chunker.h"

namespace idxz::format {

IndexedWriter::IndexedWriter(WriterConfig config) : config_(config) {
    if (config_.blockSize == 0) {
        throw UsageError("Block size must be greater than zero");
    }
    if (!isValidCompressionLevel(config_.level)) {
        throw UsageError("Invalid compression level: " + std::to_string(config_.level));
    }
}

WriteSummary IndexedWriter::write(std::istream& input, std::ostream& output,
                                  std::ostream& index) {
    WriteSummary summary;
    io::LineChunker chunker(input, config_.blockSize);
    FrameEncoder encoder(config_.level);

    FrameOrder order = 0;
    while (auto chunk = chunker.next()) {
        const FrameSpan span = encoder.encode(output, chunk->data);
        summary.index.emplace_back(span.start, span.length(), order);
        summary.outputBytes += span.length();
        ++order;
    }

    summary.inputBytes = chunker.totalBytes();
    summary.lineCount = chunker.totalLines();

    writeFrameIndex(index, summary.index);

    IDXZ_LOG_DEBUG("Compression pass complete: {} frames, {} -> {} bytes",
                   summary.frameCount(), summary.inputBytes, summary.outputBytes);
    return summary;
}

WriteSummary compressFile(const std::filesystem::path& inputPath,
                          const std::filesystem::path& outputPath,
                          const std::filesystem::path& indexPath,
                          const WriterConfig& config) {
    IndexedWriter writer(config);

    std::ifstream input(inputPath, std::ios::binary);
    if (!input.is_open()) {
        throw IOError(ErrorCode::kFileOpenFailed,
                      "Failed to open input file: " + inputPath.string());
    }

    std::ofstream output(outputPath, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw IOError(ErrorCode::kFileOpenFailed,
                      "Failed to create output file: " + outputPath.string());
    }

    // The index is assembled in memory so a failed pass leaves no index behind
    std::ostringstream indexBuffer;
    WriteSummary summary = writer.write(input, output, indexBuffer);

    output.close();
    if (output.fail()) {
        throw IOError("Failed to close output file", ErrorContext(outputPath.string()));
    }

    std::ofstream indexFile(indexPath, std::ios::binary | std::ios::trunc);
    if (!indexFile.is_open()) {
        throw IOError(ErrorCode::kFileOpenFailed,
                      "Failed to create index file: " + indexPath.string());
    }
    indexFile << indexBuffer.str();
    indexFile.flush();
    if (!indexFile) {
        throw IOError("Failed to write index file", ErrorContext(indexPath.string()));
    }

    IDXZ_LOG_INFO("Compressed {} into {} frames ({} -> {} bytes)", inputPath.string(),
                  summary.frameCount(), summary.inputBytes, summary.outputBytes);
    return summary;
}

}  // namespace idxz::format
