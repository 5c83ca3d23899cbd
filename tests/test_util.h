// =============================================================================
// idxz - Shared Test Utilities
// =============================================================================
// Temporary files, fixture data and RapidCheck generators used by several
// test executables.
// =============================================================================

#ifndef IDXZ_TESTS_TEST_UTIL_H
#define IDXZ_TESTS_TEST_UTIL_H

#include <rapidcheck.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "idxz/common/types.h"
#include "idxz/format/indexed_writer.h"

namespace idxz::test {

// =============================================================================
// Temporary Files
// =============================================================================

/// @brief Generate a unique temporary file path.
[[nodiscard]] inline std::filesystem::path tempFilePath(std::string_view suffix = ".zst") {
    static std::atomic<int> counter{0};
    return std::filesystem::temp_directory_path() /
           ("idxz_test_" + std::to_string(counter++) + "_" +
            std::to_string(std::random_device{}()) + std::string(suffix));
}

/// @brief RAII cleanup for temporary files.
class TempFileGuard {
public:
    explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

/// @brief A compressed file and its index, removed on destruction.
struct CompressedFixture {
    TempFileGuard compressed{tempFilePath(".zst")};
    TempFileGuard index{tempFilePath(".zst.idx")};
    format::WriteSummary summary;

    CompressedFixture(const std::string& content, std::size_t blockSize, int level = 3) {
        std::istringstream input(content);
        std::ofstream output(compressed.path(), std::ios::binary | std::ios::trunc);
        std::ofstream indexOut(index.path(), std::ios::binary | std::ios::trunc);
        format::IndexedWriter writer(format::WriterConfig{blockSize, level});
        summary = writer.write(input, output, indexOut);
    }
};

// =============================================================================
// File Helpers
// =============================================================================

[[nodiscard]] inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

inline void writeFile(const std::filesystem::path& path, std::string_view content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

/// @brief Path of a file in the checked-in test data directory.
[[nodiscard]] inline std::filesystem::path testDataPath(std::string_view name) {
    return std::filesystem::path(IDXZ_TEST_DATA_DIR) / std::string(name);
}

/// @brief Build table content from records, one `key<TAB>value` line each.
[[nodiscard]] inline std::string toTable(
    const std::vector<std::pair<std::string, std::uint64_t>>& rows) {
    std::string content;
    for (const auto& [key, value] : rows) {
        content += key;
        content += kFieldSeparator;
        content += std::to_string(value);
        content += kLineTerminator;
    }
    return content;
}

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

/// @brief Character allowed in an accession.
[[nodiscard]] inline rc::Gen<char> accessionChar() {
    return rc::gen::oneOf(rc::gen::inRange('A', static_cast<char>('Z' + 1)),
                          rc::gen::inRange('0', static_cast<char>('9' + 1)),
                          rc::gen::element('_', '.'));
}

/// @brief Accession-like key; never contains a tab or newline.
[[nodiscard]] inline rc::Gen<std::string> accession() {
    return rc::gen::mapcat(rc::gen::inRange<std::size_t>(1, 16), [](std::size_t length) {
        return rc::gen::container<std::string>(length, accessionChar());
    });
}

/// @brief Up to `maxRows` rows with distinct keys.
[[nodiscard]] inline rc::Gen<std::vector<std::pair<std::string, std::uint64_t>>> uniqueRows(
    std::size_t maxRows) {
    using Rows = std::vector<std::pair<std::string, std::uint64_t>>;
    return rc::gen::map(
        rc::gen::mapcat(rc::gen::inRange<std::size_t>(0, maxRows + 1),
                        [](std::size_t count) {
                            return rc::gen::container<Rows>(
                                count, rc::gen::pair(accession(), rc::gen::inRange<std::uint64_t>(
                                                                      0, 5'000'000)));
                        }),
        [](Rows rows) {
            Rows unique;
            std::set<std::string> seen;
            for (auto& row : rows) {
                if (seen.insert(row.first).second) {
                    unique.push_back(std::move(row));
                }
            }
            return unique;
        });
}

}  // namespace gen

}  // namespace idxz::test

#endif  // IDXZ_TESTS_TEST_UTIL_H
