// =============================================================================
// idxz - Aggregators Implementation
// =============================================================================

#include "idxz/pipeline/aggregator.h"

#include <string>
#include <utility>
#include <vector>

#include "idxz/common/error.h"
#include "idxz/common/logger.h"

namespace idxz::pipeline {

// =============================================================================
// Strategy 1: shared concurrent map
// =============================================================================

std::unique_ptr<RecordTable> ConcurrentMapAggregator::aggregate(
    DecodeScheduler& scheduler, const format::FrameReader& reader,
    const format::FrameIndex& index) {
    auto table = std::make_unique<ConcurrentRecordTable>();

    scheduler.forEachFrame(index, reader,
                           [&](std::size_t, const format::FrameDescriptor&, RecordList&& records) {
                               for (auto& record : records) {
                                   table->insertOrAssign(std::move(record.key), record.value);
                               }
                           });

    return table;
}

// =============================================================================
// Strategy 2: per-frame slots, serial combine
// =============================================================================

std::unique_ptr<RecordTable> LocalCombineAggregator::aggregate(
    DecodeScheduler& scheduler, const format::FrameReader& reader,
    const format::FrameIndex& index) {
    // Each worker writes only its own slot
    std::vector<RecordList> slots(index.size());

    const DecodeStats stats = scheduler.forEachFrame(
        index, reader, [&](std::size_t slot, const format::FrameDescriptor&, RecordList&& records) {
            slots[slot] = std::move(records);
        });

    HashRecordMap map;
    map.reserve(stats.recordsParsed);
    for (auto& slot : slots) {
        for (auto& record : slot) {
            map.insert_or_assign(std::move(record.key), record.value);
        }
        RecordList().swap(slot);
    }

    IDXZ_LOG_DEBUG("Combined {} record(s) into {} key(s)", stats.recordsParsed, map.size());
    return std::make_unique<HashRecordTable>(std::move(map));
}

// =============================================================================
// Strategy 3: parallel reduction of local maps
// =============================================================================

void mergeSmallerIntoLarger(HashRecordMap& left, HashRecordMap&& right) {
    if (right.empty()) {
        return;
    }
    if (left.empty()) {
        left = std::move(right);
        return;
    }

    HashRecordMap* larger = &left;
    HashRecordMap* smaller = &right;
    if (right.size() > left.size()) {
        std::swap(larger, smaller);
    }

    larger->reserve(larger->size() + smaller->size());
    for (auto& [key, value] : *smaller) {
        larger->insert_or_assign(key, value);
    }

    if (larger != &left) {
        left = std::move(right);
    }
    right = HashRecordMap();
}

std::unique_ptr<RecordTable> ParallelReduceAggregator::aggregate(
    DecodeScheduler& scheduler, const format::FrameReader& reader,
    const format::FrameIndex& index) {
    HashRecordMap map = scheduler.reduceFrames(
        index, reader, HashRecordMap(),
        [](HashRecordMap& partial, RecordList&& records) {
            partial.reserve(partial.size() + records.size());
            for (auto& record : records) {
                partial.insert_or_assign(std::move(record.key), record.value);
            }
        },
        [](HashRecordMap& left, HashRecordMap&& right) {
            mergeSmallerIntoLarger(left, std::move(right));
        });

    return std::make_unique<HashRecordTable>(std::move(map));
}

// =============================================================================
// Factory
// =============================================================================

std::unique_ptr<IAggregator> makeAggregator(AggregationStrategy strategy) {
    switch (strategy) {
        case AggregationStrategy::kConcurrentMap:
            return std::make_unique<ConcurrentMapAggregator>();
        case AggregationStrategy::kLocalCombine:
            return std::make_unique<LocalCombineAggregator>();
        case AggregationStrategy::kParallelReduce:
            return std::make_unique<ParallelReduceAggregator>();
    }
    throw UsageError("Unknown aggregation strategy: " +
                     std::to_string(static_cast<int>(strategy)));
}

}  // namespace idxz::pipeline
