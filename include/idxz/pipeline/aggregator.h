// =============================================================================
// idxz - Aggregators
// =============================================================================
// Merge the per-frame record lists of a decode pass into one RecordTable.
//
// Three interchangeable strategies produce the same key set:
// - ConcurrentMapAggregator: workers insert straight into one concurrent map.
// - LocalCombineAggregator: workers park their records in a per-frame slot;
//   a single thread combines the slots in index order afterwards.
// - ParallelReduceAggregator: workers fold frames into local hash maps that
//   are joined pairwise, always merging the smaller map into the larger.
//
// Duplicate keys resolve last-write-wins. Only LocalCombineAggregator fixes
// which write is last (the highest frame order); the other two leave it to
// scheduling.
// =============================================================================

#ifndef IDXZ_PIPELINE_AGGREGATOR_H
#define IDXZ_PIPELINE_AGGREGATOR_H

#include <memory>

#include "idxz/common/types.h"
#include "idxz/format/frame_index.h"
#include "idxz/format/frame_reader.h"
#include "idxz/pipeline/decode_scheduler.h"
#include "idxz/pipeline/record_table.h"

namespace idxz::pipeline {

/// @brief Interface of an aggregation strategy.
class IAggregator {
public:
    virtual ~IAggregator() = default;

    /// @brief Run one decode pass over `index` and merge the results.
    /// @note Per-pass counters are available from scheduler.lastStats() afterwards.
    [[nodiscard]] virtual std::unique_ptr<RecordTable> aggregate(
        DecodeScheduler& scheduler, const format::FrameReader& reader,
        const format::FrameIndex& index) = 0;

    [[nodiscard]] virtual AggregationStrategy strategy() const noexcept = 0;
};

class ConcurrentMapAggregator final : public IAggregator {
public:
    [[nodiscard]] std::unique_ptr<RecordTable> aggregate(
        DecodeScheduler& scheduler, const format::FrameReader& reader,
        const format::FrameIndex& index) override;

    [[nodiscard]] AggregationStrategy strategy() const noexcept override {
        return AggregationStrategy::kConcurrentMap;
    }
};

class LocalCombineAggregator final : public IAggregator {
public:
    [[nodiscard]] std::unique_ptr<RecordTable> aggregate(
        DecodeScheduler& scheduler, const format::FrameReader& reader,
        const format::FrameIndex& index) override;

    [[nodiscard]] AggregationStrategy strategy() const noexcept override {
        return AggregationStrategy::kLocalCombine;
    }
};

class ParallelReduceAggregator final : public IAggregator {
public:
    [[nodiscard]] std::unique_ptr<RecordTable> aggregate(
        DecodeScheduler& scheduler, const format::FrameReader& reader,
        const format::FrameIndex& index) override;

    [[nodiscard]] AggregationStrategy strategy() const noexcept override {
        return AggregationStrategy::kParallelReduce;
    }
};

/// @brief Merge two partial maps into `left`.
///
/// Capacity for both is reserved in the larger map, then the smaller one is
/// inserted into it; if `right` was larger the result is moved into `left`.
/// Entries of the map inserted last overwrite duplicates.
void mergeSmallerIntoLarger(HashRecordMap& left, HashRecordMap&& right);

/// @brief Create the aggregator for a strategy.
[[nodiscard]] std::unique_ptr<IAggregator> makeAggregator(AggregationStrategy strategy);

}  // namespace idxz::pipeline

#endif  // IDXZ_PIPELINE_AGGREGATOR_H
