// =============================================================================
// idxz - Parallel Decode Scheduler Implementation
// =============================================================================

#include "idxz/pipeline/decode_scheduler.h"

#include <algorithm>
#include <limits>
#include <string>
#include <thread>

#include <tbb/parallel_for.h>

#include "idxz/common/logger.h"
#include "idxz/io/record_parser.h"

namespace idxz::pipeline {

namespace {

int arenaConcurrency(const SchedulerConfig& config) {
    if (config.threads == 0) {
        throw UsageError("Thread count must be at least 1");
    }
    if (config.threads > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw UsageError("Thread count is too large: " + std::to_string(config.threads));
    }
    return static_cast<int>(config.threads);
}

}  // namespace

std::size_t resolveThreadCount(std::size_t requested) noexcept {
    if (requested > 0) {
        return requested;
    }
    return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

DecodeScheduler::DecodeScheduler(SchedulerConfig config)
    : config_(config), arena_(arenaConcurrency(config)) {
    IDXZ_LOG_DEBUG("DecodeScheduler created with {} worker(s)", config_.threads);
}

DecodeScheduler::~DecodeScheduler() = default;

Result<RecordList> DecodeScheduler::decodeFrame(const format::FrameReader& reader,
                                                const format::FrameDescriptor& descriptor) const {
    // Nothing thrown while handling one frame may reach its siblings
    auto records = tryExecute([&]() -> Result<RecordList> {
        auto content = reader.readFrame(descriptor);
        if (!content) {
            return std::unexpected(std::move(content.error()));
        }
        return io::parseRecords(*content);
    });
    if (!records) {
        return std::unexpected(std::move(records.error()));
    }
    return std::move(*records);
}

Result<RecordList> DecodeScheduler::runFrame(const format::FrameReader& reader,
                                             const format::FrameDescriptor& descriptor,
                                             PassCounters& counters) const {
    auto records = decodeFrame(reader, descriptor);
    if (!records) {
        counters.framesFailed.fetch_add(1, std::memory_order_relaxed);
        IDXZ_LOG_ERROR("Skipping frame {} at offset {}: {} ({})", descriptor.order,
                       descriptor.position, records.error().message(),
                       errorCodeToString(records.error().code()));
        return records;
    }

    counters.framesDecoded.fetch_add(1, std::memory_order_relaxed);
    counters.recordsParsed.fetch_add(records->size(), std::memory_order_relaxed);
    return records;
}

DecodeStats DecodeScheduler::forEachFrame(const format::FrameIndex& index,
                                          const format::FrameReader& reader,
                                          const FrameSink& sink,
                                          const FailureSink& onFailure) {
    PassCounters counters;

    arena_.execute([&] {
        tbb::parallel_for(tbb::blocked_range<std::size_t>(0, index.size(), 1),
                          [&](const tbb::blocked_range<std::size_t>& range) {
                              for (std::size_t i = range.begin(); i != range.end(); ++i) {
                                  auto records = runFrame(reader, index[i], counters);
                                  if (records) {
                                      sink(i, index[i], std::move(*records));
                                  } else if (onFailure) {
                                      onFailure(i, index[i], records.error());
                                  }
                              }
                          });
    });

    finishPass(index.size(), counters);
    return lastStats_;
}

void DecodeScheduler::finishPass(std::size_t framesTotal, const PassCounters& counters) {
    lastStats_.framesTotal = framesTotal;
    lastStats_.framesDecoded = counters.framesDecoded.load();
    lastStats_.framesFailed = counters.framesFailed.load();
    lastStats_.recordsParsed = counters.recordsParsed.load();

    if (lastStats_.hasFailures()) {
        IDXZ_LOG_WARNING("Decode pass finished with {} of {} frame(s) skipped",
                         lastStats_.framesFailed, lastStats_.framesTotal);
    } else {
        IDXZ_LOG_DEBUG("Decode pass finished: {} frame(s), {} record(s)", lastStats_.framesDecoded,
                       lastStats_.recordsParsed);
    }
}

}  // namespace idxz::pipeline
