// =============================================================================
// idxz - Parallel Decode Scheduler
// =============================================================================
// Fans frame descriptors out to a bounded pool of TBB workers.
//
// The unit of work for one frame is:
//   positional read -> zstd decode -> record parse
//
// Frames have no ordering constraints between them. A frame that fails to
// read, decode or parse is logged with its order and offset, counted, and
// excluded from the pass; sibling frames keep running.
//
// The worker pool is a tbb::task_arena owned by the scheduler, so the pool's
// lifetime is the scheduler's lifetime.
// =============================================================================

#ifndef IDXZ_PIPELINE_DECODE_SCHEDULER_H
#define IDXZ_PIPELINE_DECODE_SCHEDULER_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>

#include <tbb/blocked_range.h>
#include <tbb/parallel_reduce.h>
#include <tbb/task_arena.h>

#include "idxz/common/error.h"
#include "idxz/common/types.h"
#include "idxz/format/frame_index.h"
#include "idxz/format/frame_reader.h"

namespace idxz::pipeline {

/// @brief Worker pool configuration.
struct SchedulerConfig {
    /// @brief Number of worker threads (must be >= 1).
    std::size_t threads = 1;
};

/// @brief Outcome counters of one decode pass.
struct DecodeStats {
    std::uint64_t framesTotal = 0;
    std::uint64_t framesDecoded = 0;
    std::uint64_t framesFailed = 0;
    std::uint64_t recordsParsed = 0;

    [[nodiscard]] bool hasFailures() const noexcept { return framesFailed > 0; }
};

/// @brief Resolve a requested thread count, mapping 0 to the hardware concurrency.
[[nodiscard]] std::size_t resolveThreadCount(std::size_t requested) noexcept;

/// @brief Runs decode passes over a frame index on a bounded worker arena.
class DecodeScheduler {
public:
    /// @brief Receives the records of one successfully decoded frame.
    /// @param slot Position of the descriptor inside the index.
    /// @note Invoked concurrently from worker threads.
    using FrameSink =
        std::function<void(std::size_t slot, const format::FrameDescriptor&, RecordList&&)>;

    /// @brief Receives the error of a frame that was skipped.
    using FailureSink =
        std::function<void(std::size_t slot, const format::FrameDescriptor&, const Error&)>;

    /// @throws UsageError if config.threads is zero.
    explicit DecodeScheduler(SchedulerConfig config);

    ~DecodeScheduler();

    DecodeScheduler(const DecodeScheduler&) = delete;
    DecodeScheduler& operator=(const DecodeScheduler&) = delete;

    /// @brief Read, decode and parse one frame.
    [[nodiscard]] Result<RecordList> decodeFrame(const format::FrameReader& reader,
                                                 const format::FrameDescriptor& descriptor) const;

    /// @brief Decode every frame of the index and hand each record list to `sink`.
    /// @param onFailure Optional observer of skipped frames.
    /// @return Counters of the pass (also available via lastStats()).
    DecodeStats forEachFrame(const format::FrameIndex& index, const format::FrameReader& reader,
                             const FrameSink& sink, const FailureSink& onFailure = {});

    /// @brief Decode every frame and reduce the record lists into one value.
    /// @param identity Initial value of every partial result.
    /// @param fold Called as fold(T& partial, RecordList&& records).
    /// @param join Called as join(T& left, T&& right).
    template <typename T, typename Fold, typename Join>
    T reduceFrames(const format::FrameIndex& index, const format::FrameReader& reader,
                   const T& identity, Fold fold, Join join);

    [[nodiscard]] std::size_t threads() const noexcept { return config_.threads; }

    /// @brief Counters of the most recent pass.
    [[nodiscard]] const DecodeStats& lastStats() const noexcept { return lastStats_; }

private:
    struct PassCounters {
        std::atomic<std::uint64_t> framesDecoded{0};
        std::atomic<std::uint64_t> framesFailed{0};
        std::atomic<std::uint64_t> recordsParsed{0};
    };

    template <typename T, typename Fold, typename Join>
    class ReduceBody;

    /// @brief Decode one frame, recording the outcome; failures are logged.
    Result<RecordList> runFrame(const format::FrameReader& reader,
                                const format::FrameDescriptor& descriptor,
                                PassCounters& counters) const;

    void finishPass(std::size_t framesTotal, const PassCounters& counters);

    SchedulerConfig config_;
    tbb::task_arena arena_;
    DecodeStats lastStats_;
};

// =============================================================================
// Template Implementation
// =============================================================================

template <typename T, typename Fold, typename Join>
class DecodeScheduler::ReduceBody {
public:
    ReduceBody(const DecodeScheduler& scheduler, const format::FrameIndex& index,
               const format::FrameReader& reader, PassCounters& counters, const T& identity,
               Fold& fold, Join& join)
        : scheduler_(scheduler),
          index_(index),
          reader_(reader),
          counters_(counters),
          identity_(identity),
          fold_(fold),
          join_(join),
          value_(identity) {}

    ReduceBody(ReduceBody& other, tbb::split)
        : scheduler_(other.scheduler_),
          index_(other.index_),
          reader_(other.reader_),
          counters_(other.counters_),
          identity_(other.identity_),
          fold_(other.fold_),
          join_(other.join_),
          value_(other.identity_) {}

    void operator()(const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
            if (auto records = scheduler_.runFrame(reader_, index_[i], counters_)) {
                fold_(value_, std::move(*records));
            }
        }
    }

    void join(ReduceBody& rhs) { join_(value_, std::move(rhs.value_)); }

    T& value() noexcept { return value_; }

private:
    const DecodeScheduler& scheduler_;
    const format::FrameIndex& index_;
    const format::FrameReader& reader_;
    PassCounters& counters_;
    const T& identity_;
    Fold& fold_;
    Join& join_;
    T value_;
};

template <typename T, typename Fold, typename Join>
T DecodeScheduler::reduceFrames(const format::FrameIndex& index, const format::FrameReader& reader,
                                const T& identity, Fold fold, Join join) {
    PassCounters counters;
    ReduceBody<T, Fold, Join> body(*this, index, reader, counters, identity, fold, join);

    arena_.execute([&] {
        tbb::parallel_reduce(tbb::blocked_range<std::size_t>(0, index.size(), 1), body);
    });

    finishPass(index.size(), counters);
    return std::move(body.value());
}

}  // namespace idxz::pipeline

#endif  // IDXZ_PIPELINE_DECODE_SCHEDULER_H
