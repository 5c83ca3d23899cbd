// =============================================================================
// idxz - Indexed Reader Implementation
// =============================================================================

#include "idxz/pipeline/indexed_reader.h"

#include <utility>

#include "idxz/common/error.h"
#include "idxz/common/logger.h"
#include "idxz/pipeline/aggregator.h"

namespace idxz::pipeline {

IndexedReader::IndexedReader(std::filesystem::path compressedPath, std::filesystem::path indexPath)
    : compressedPath_(std::move(compressedPath)), indexPath_(std::move(indexPath)) {}

void IndexedReader::open() {
    // The index is read completely before any frame is touched
    index_ = format::loadFrameIndex(indexPath_);
    frames_.emplace(compressedPath_);

    if (auto contiguous = format::checkContiguity(index_, frames_->size()); !contiguous) {
        IDXZ_LOG_WARNING("Index {} does not describe {} exactly: {}", indexPath_.string(),
                         compressedPath_.string(), contiguous.error().message());
    }

    IDXZ_LOG_DEBUG("Opened {} with {} frame(s)", compressedPath_.string(), index_.size());
}

ReadResult IndexedReader::read(const ReadOptions& options) {
    if (!isOpen()) {
        throw UsageError("IndexedReader::read() called before open()");
    }

    DecodeScheduler scheduler(SchedulerConfig{.threads = resolveThreadCount(options.threads)});
    auto aggregator = makeAggregator(options.strategy);

    IDXZ_LOG_DEBUG("Decoding {} frame(s) with {} thread(s), strategy {}", index_.size(),
                   scheduler.threads(), aggregationStrategyToString(options.strategy));

    ReadResult result;
    result.table = aggregator->aggregate(scheduler, *frames_, index_);
    result.stats = scheduler.lastStats();
    return result;
}

ReadResult decompressFile(const std::filesystem::path& compressedPath,
                          const std::filesystem::path& indexPath, const ReadOptions& options) {
    IndexedReader reader(compressedPath, indexPath);
    reader.open();
    return reader.read(options);
}

}  // namespace idxz::pipeline
