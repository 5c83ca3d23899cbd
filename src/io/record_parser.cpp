// =============================================================================
// idxz - Record Parser Implementation
// =============================================================================

#include "idxz/io/record_parser.h"

#include <cctype>
#include <charconv>
#include <utility>

#include "idxz/common/logger.h"

namespace idxz::io {

namespace {

/// @brief UTF-8 replacement character U+FFFD.
constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

std::string_view trim(std::string_view str) {
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front()))) {
        str.remove_prefix(1);
    }
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) {
        str.remove_suffix(1);
    }
    return str;
}

bool isContinuation(unsigned char byte) noexcept {
    return (byte & 0xC0) == 0x80;
}

/// @brief Scan the UTF-8 sequence starting at `pos`.
/// @return Bytes consumed and whether they form a complete valid sequence.
///         An invalid sequence consumes its maximal valid prefix, at least 1.
std::pair<std::size_t, bool> scanSequence(std::string_view bytes, std::size_t pos) noexcept {
    const auto lead = static_cast<unsigned char>(bytes[pos]);
    if (lead < 0x80) {
        return {1, true};
    }

    std::size_t length = 0;
    unsigned char minSecond = 0x80;
    unsigned char maxSecond = 0xBF;

    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) {
            minSecond = 0xA0;  // overlong
        } else if (lead == 0xED) {
            maxSecond = 0x9F;  // surrogates
        }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) {
            minSecond = 0x90;
        } else if (lead == 0xF4) {
            maxSecond = 0x8F;
        }
    } else {
        return {1, false};
    }

    std::size_t consumed = 1;
    while (consumed < length && pos + consumed < bytes.size()) {
        const auto byte = static_cast<unsigned char>(bytes[pos + consumed]);
        const bool ok = consumed == 1 ? (byte >= minSecond && byte <= maxSecond)
                                      : isContinuation(byte);
        if (!ok) {
            break;
        }
        ++consumed;
    }
    return {consumed, consumed == length};
}

}  // namespace

Result<RecordValue> parseValue(std::string_view field) {
    std::string_view trimmed = trim(field);
    if (trimmed.size() > 1 && trimmed.front() == '+') {
        trimmed.remove_prefix(1);
    }
    if (trimmed.empty()) {
        return makeError<RecordValue>(ErrorCode::kInvalidArgument, "empty value");
    }

    RecordValue value = 0;
    auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return makeError<RecordValue>(ErrorCode::kInvalidArgument,
                                      "value '" + std::string(trimmed) + "' is out of range");
    }
    if (ec != std::errc{} || ptr != trimmed.data() + trimmed.size()) {
        return makeError<RecordValue>(ErrorCode::kInvalidArgument,
                                      "value '" + sanitizeUtf8(trimmed) + "' is not numeric");
    }
    return value;
}

std::string sanitizeUtf8(std::string_view bytes) {
    std::string result;
    result.reserve(bytes.size());

    std::size_t pos = 0;
    while (pos < bytes.size()) {
        const auto [length, valid] = scanSequence(bytes, pos);
        if (valid) {
            result.append(bytes.substr(pos, length));
        } else {
            result.append(kReplacementChar);
        }
        pos += length;
    }

    return result;
}

RecordList parseRecords(std::string_view content) {
    RecordList records;

    std::size_t lineStart = 0;
    while (lineStart < content.size()) {
        std::size_t lineEnd = content.find(kLineTerminator, lineStart);
        if (lineEnd == std::string_view::npos) {
            lineEnd = content.size();
        }
        const std::string_view line = content.substr(lineStart, lineEnd - lineStart);
        lineStart = lineEnd + 1;

        const std::size_t separator = line.find(kFieldSeparator);
        if (separator == std::string_view::npos) {
            continue;
        }

        Record record;
        record.key = sanitizeUtf8(line.substr(0, separator));

        auto value = parseValue(line.substr(separator + 1));
        if (value.has_value()) {
            record.value = *value;
        } else {
            IDXZ_LOG_WARNING("Error parsing record '{}': {}. Value will be reported as '0'",
                             record.key, value.error().message());
            record.value = 0;
        }

        records.push_back(std::move(record));
    }

    return records;
}

}  // namespace idxz::io
