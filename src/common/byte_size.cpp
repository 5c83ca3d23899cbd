// =============================================================================
// idxz - Human-Readable Byte Sizes Implementation
// =============================================================================

#include "idxz/common/byte_size.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <sstream>

#include "idxz/common/error.h"

namespace idxz {

namespace {

std::string toLower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

/// @brief Multiplier for a (lowercased) unit suffix, nullopt if unknown.
std::optional<double> unitMultiplier(std::string_view unit) {
    if (unit.empty() || unit == "b") {
        return 1.0;
    }
    if (unit == "k" || unit == "kb") {
        return 1e3;
    }
    if (unit == "m" || unit == "mb") {
        return 1e6;
    }
    if (unit == "g" || unit == "gb") {
        return 1e9;
    }
    if (unit == "t" || unit == "tb") {
        return 1e12;
    }
    if (unit == "kib") {
        return 1024.0;
    }
    if (unit == "mib") {
        return 1024.0 * 1024.0;
    }
    if (unit == "gib") {
        return 1024.0 * 1024.0 * 1024.0;
    }
    if (unit == "tib") {
        return 1024.0 * 1024.0 * 1024.0 * 1024.0;
    }
    return std::nullopt;
}

}  // namespace

std::optional<std::uint64_t> parseByteSize(std::string_view str) {
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front()))) {
        str.remove_prefix(1);
    }
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) {
        str.remove_suffix(1);
    }

    if (str.empty()) {
        return std::nullopt;
    }

    std::size_t numEnd = 0;
    bool seenDot = false;
    while (numEnd < str.size()) {
        const char c = str[numEnd];
        if (c == '.' && !seenDot) {
            seenDot = true;
        } else if (!std::isdigit(static_cast<unsigned char>(c))) {
            break;
        }
        ++numEnd;
    }

    if (numEnd == 0) {
        return std::nullopt;
    }

    auto numStr = str.substr(0, numEnd);
    auto suffix = str.substr(numEnd);
    while (!suffix.empty() && std::isspace(static_cast<unsigned char>(suffix.front()))) {
        suffix.remove_prefix(1);
    }

    const auto multiplier = unitMultiplier(toLower(suffix));
    if (!multiplier.has_value()) {
        return std::nullopt;
    }

    if (!seenDot) {
        // Integral byte counts stay exact
        std::uint64_t intValue = 0;
        auto [ptr, ec] = std::from_chars(numStr.data(), numStr.data() + numStr.size(), intValue);
        if (ec != std::errc{} || ptr != numStr.data() + numStr.size()) {
            return std::nullopt;
        }
        const auto factor = static_cast<std::uint64_t>(*multiplier);
        if (factor != 0 && intValue > std::numeric_limits<std::uint64_t>::max() / factor) {
            return std::nullopt;
        }
        return intValue * factor;
    }

    double value = 0;
    auto [ptr, ec] = std::from_chars(numStr.data(), numStr.data() + numStr.size(), value);
    if (ec != std::errc{} || ptr != numStr.data() + numStr.size()) {
        return std::nullopt;
    }

    const double bytes = std::floor(value * *multiplier);
    if (!std::isfinite(bytes) ||
        bytes >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(bytes);
}

std::size_t parseBlockSize(std::string_view str) {
    const auto bytes = parseByteSize(str);
    if (!bytes.has_value()) {
        throw UsageError("Unable to parse block size '" + std::string(str) +
                         "' to a numeric value");
    }
    if (*bytes == 0) {
        throw UsageError("Block size must be greater than zero");
    }
    if (*bytes > std::numeric_limits<std::size_t>::max()) {
        throw UsageError("Block size '" + std::string(str) + "' is too large");
    }
    return static_cast<std::size_t>(*bytes);
}

std::string formatByteSize(std::uint64_t bytes) {
    constexpr std::uint64_t kKiB = 1024;
    constexpr std::uint64_t kMiB = kKiB * 1024;
    constexpr std::uint64_t kGiB = kMiB * 1024;
    constexpr std::uint64_t kTiB = kGiB * 1024;

    std::ostringstream oss;
    oss.precision(2);
    oss << std::fixed;

    if (bytes >= kTiB) {
        oss << static_cast<double>(bytes) / static_cast<double>(kTiB) << " TiB";
    } else if (bytes >= kGiB) {
        oss << static_cast<double>(bytes) / static_cast<double>(kGiB) << " GiB";
    } else if (bytes >= kMiB) {
        oss << static_cast<double>(bytes) / static_cast<double>(kMiB) << " MiB";
    } else if (bytes >= kKiB) {
        oss << static_cast<double>(bytes) / static_cast<double>(kKiB) << " KiB";
    } else {
        oss << bytes << " B";
    }

    return oss.str();
}

}  // namespace idxz
