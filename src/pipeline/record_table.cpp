// =============================================================================
// idxz - Record Table Implementation
// =============================================================================

#include "idxz/pipeline/record_table.h"

#include <algorithm>

namespace idxz::pipeline {

std::vector<std::pair<std::string, RecordValue>> RecordTable::toSortedVector() const {
    std::vector<std::pair<std::string, RecordValue>> entries;
    entries.reserve(size());
    forEach([&](const std::string& key, RecordValue value) { entries.emplace_back(key, value); });
    std::sort(entries.begin(), entries.end());
    return entries;
}

// =============================================================================
// ConcurrentRecordTable
// =============================================================================

void ConcurrentRecordTable::insertOrAssign(std::string key, RecordValue value) {
    ConcurrentRecordMap::accessor accessor;
    map_.insert(accessor, std::move(key));
    accessor->second = value;
}

std::optional<RecordValue> ConcurrentRecordTable::find(std::string_view key) const {
    ConcurrentRecordMap::const_accessor accessor;
    if (map_.find(accessor, std::string(key))) {
        return accessor->second;
    }
    return std::nullopt;
}

void ConcurrentRecordTable::forEach(const Visitor& visitor) const {
    for (const auto& [key, value] : map_) {
        visitor(key, value);
    }
}

// =============================================================================
// HashRecordTable
// =============================================================================

std::optional<RecordValue> HashRecordTable::find(std::string_view key) const {
    if (auto it = map_.find(std::string(key)); it != map_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void HashRecordTable::forEach(const Visitor& visitor) const {
    for (const auto& [key, value] : map_) {
        visitor(key, value);
    }
}

}  // namespace idxz::pipeline
