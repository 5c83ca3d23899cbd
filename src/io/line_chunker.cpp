// =============================================================================
// idxz - Line-Aligned Chunker Implementation
// =============================================================================

#include "idxz/io/line_chunker.h"

#include "idxz/common/error.h"
#include "idxz/common/logger.h"
#include "idxz/common/types.h"

namespace idxz::io {

LineChunker::LineChunker(std::istream& input, std::size_t blockSize)
    : input_(input), blockSize_(blockSize) {
    if (blockSize_ == 0) {
        throw UsageError("Block size must be greater than zero");
    }
}

std::optional<Chunk> LineChunker::next() {
    Chunk chunk;

    while (chunk.data.size() < blockSize_) {
        if (!std::getline(input_, line_, kLineTerminator)) {
            if (input_.bad()) {
                throw IOError("Failed to read input stream",
                              ErrorContext{}.withLine(totalLines_ + chunk.lineCount + 1));
            }
            break;
        }

        chunk.data += line_;
        // eof() after a successful getline means the last line had no terminator
        if (!input_.eof()) {
            chunk.data.push_back(kLineTerminator);
        }
        ++chunk.lineCount;
    }

    if (chunk.data.empty()) {
        return std::nullopt;
    }

    chunk.bytesRead = chunk.data.size();
    totalBytes_ += chunk.bytesRead;
    totalLines_ += chunk.lineCount;

    IDXZ_LOG_TRACE("Chunk read: {} bytes, {} lines", chunk.bytesRead, chunk.lineCount);
    return chunk;
}

}  // namespace idxz::io
