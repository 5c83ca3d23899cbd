// =============================================================================
// idxz - Common Type Definitions Implementation
// =============================================================================

#include "idxz/common/types.h"

#include <algorithm>
#include <cctype>

namespace idxz {

namespace {

std::string toLower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

}  // namespace

std::optional<AggregationStrategy> parseAggregationStrategy(std::string_view str) {
    const std::string lower = toLower(str);

    // "dashmap", "vector" and "merge" are the names used by older index tooling
    if (lower == "concurrent-map" || lower == "dashmap") {
        return AggregationStrategy::kConcurrentMap;
    }
    if (lower == "local-combine" || lower == "vector") {
        return AggregationStrategy::kLocalCombine;
    }
    if (lower == "parallel-reduce" || lower == "merge") {
        return AggregationStrategy::kParallelReduce;
    }
    return std::nullopt;
}

std::string_view aggregationStrategyToString(AggregationStrategy strategy) noexcept {
    switch (strategy) {
        case AggregationStrategy::kConcurrentMap:
            return "concurrent-map";
        case AggregationStrategy::kLocalCombine:
            return "local-combine";
        case AggregationStrategy::kParallelReduce:
            return "parallel-reduce";
    }
    return "unknown";
}

std::vector<std::string> aggregationStrategyNames() {
    return {"concurrent-map", "local-combine", "parallel-reduce", "dashmap", "vector", "merge"};
}

}  // namespace idxz
