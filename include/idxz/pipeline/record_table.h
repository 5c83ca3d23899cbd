// =============================================================================
// idxz - Record Table
// =============================================================================
// Uniform read-only view over the key -> value table produced by a decode
// pass. The concrete backing map depends on the aggregation strategy:
//
//   kConcurrentMap             -> ConcurrentRecordTable (tbb::concurrent_hash_map)
//   kLocalCombine, kParallelReduce -> HashRecordTable (std::unordered_map)
//
// Callers that need the backing map itself use asConcurrentMap() or
// asHashMap(), which return nullptr when the table is of the other kind.
// =============================================================================

#ifndef IDXZ_PIPELINE_RECORD_TABLE_H
#define IDXZ_PIPELINE_RECORD_TABLE_H

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <tbb/concurrent_hash_map.h>

#include "idxz/common/types.h"

namespace idxz::pipeline {

/// @brief Concurrent backing map written by every worker.
using ConcurrentRecordMap = tbb::concurrent_hash_map<std::string, RecordValue>;

/// @brief Backing map built by a single thread or a reduction.
using HashRecordMap = std::unordered_map<std::string, RecordValue>;

/// @brief Abstract result of a decode pass.
class RecordTable {
public:
    using Visitor = std::function<void(const std::string& key, RecordValue value)>;

    virtual ~RecordTable() = default;

    /// @brief Number of distinct keys.
    [[nodiscard]] virtual std::size_t size() const = 0;

    [[nodiscard]] bool empty() const { return size() == 0; }

    /// @brief Value stored for a key.
    [[nodiscard]] virtual std::optional<RecordValue> find(std::string_view key) const = 0;

    /// @brief Visit every entry in unspecified order.
    /// @note Must not run concurrently with writers of the backing map.
    virtual void forEach(const Visitor& visitor) const = 0;

    /// @brief All entries sorted by key.
    [[nodiscard]] std::vector<std::pair<std::string, RecordValue>> toSortedVector() const;

    [[nodiscard]] virtual const ConcurrentRecordMap* asConcurrentMap() const noexcept {
        return nullptr;
    }

    [[nodiscard]] virtual const HashRecordMap* asHashMap() const noexcept { return nullptr; }
};

/// @brief Table backed by tbb::concurrent_hash_map.
class ConcurrentRecordTable final : public RecordTable {
public:
    ConcurrentRecordTable() = default;
    explicit ConcurrentRecordTable(std::size_t expectedSize) : map_(expectedSize) {}

    /// @brief Insert or overwrite a key. Safe to call concurrently.
    void insertOrAssign(std::string key, RecordValue value);

    [[nodiscard]] std::size_t size() const override { return map_.size(); }
    [[nodiscard]] std::optional<RecordValue> find(std::string_view key) const override;
    void forEach(const Visitor& visitor) const override;

    [[nodiscard]] const ConcurrentRecordMap* asConcurrentMap() const noexcept override {
        return &map_;
    }

private:
    ConcurrentRecordMap map_;
};

/// @brief Table backed by std::unordered_map.
class HashRecordTable final : public RecordTable {
public:
    HashRecordTable() = default;
    explicit HashRecordTable(HashRecordMap map) : map_(std::move(map)) {}

    [[nodiscard]] std::size_t size() const override { return map_.size(); }
    [[nodiscard]] std::optional<RecordValue> find(std::string_view key) const override;
    void forEach(const Visitor& visitor) const override;

    [[nodiscard]] const HashRecordMap* asHashMap() const noexcept override { return &map_; }

private:
    HashRecordMap map_;
};

}  // namespace idxz::pipeline

#endif  // IDXZ_PIPELINE_RECORD_TABLE_H
