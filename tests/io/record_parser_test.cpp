// =============================================================================
// idxz - Record Parser Tests
// =============================================================================
// Unit tests for turning decompressed frame content into records.
// =============================================================================

#include "idxz/io/record_parser.h"

#include <gtest/gtest.h>

#include <string>

#include "idxz/common/logger.h"
#include "test_util.h"

namespace idxz::io {
namespace {

using idxz::test::readFile;
using idxz::test::TempFileGuard;
using idxz::test::tempFilePath;

// =============================================================================
// parseValue Tests
// =============================================================================

TEST(ParseValueTest, PlainIntegers) {
    EXPECT_EQ(parseValue("584").value_or(1), 584u);
    EXPECT_EQ(parseValue("0").value_or(1), 0u);
    EXPECT_EQ(parseValue("18446744073709551615").value_or(0), 18446744073709551615ull);
}

TEST(ParseValueTest, SurroundingWhitespaceIsIgnored) {
    EXPECT_EQ(parseValue(" 42 ").value_or(0), 42u);
    EXPECT_EQ(parseValue("42\r").value_or(0), 42u);
    EXPECT_EQ(parseValue("\t7").value_or(0), 7u);
}

TEST(ParseValueTest, RejectsNonNumeric) {
    for (const char* field : {"", "   ", "+", "++3", "+-1", "NaN", "-1", "12abc", "1.5"}) {
        auto result = parseValue(field);
        ASSERT_FALSE(result.has_value()) << "field: '" << field << "'";
        EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
    }
}

TEST(ParseValueTest, LeadingPlusIsAccepted) {
    EXPECT_EQ(parseValue("+3").value_or(0), 3u);
    EXPECT_EQ(parseValue(" +584\r").value_or(0), 584u);
}

TEST(ParseValueTest, RejectsOverflow) {
    auto result = parseValue("18446744073709551616");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message().find("out of range"), std::string::npos);
}

// =============================================================================
// sanitizeUtf8 Tests
// =============================================================================

TEST(SanitizeUtf8Test, ValidInputIsUnchanged) {
    EXPECT_EQ(sanitizeUtf8("WP_413685322.1"), "WP_413685322.1");
    EXPECT_EQ(sanitizeUtf8("caf\xC3\xA9"), "caf\xC3\xA9");
    EXPECT_EQ(sanitizeUtf8("\xF0\x9F\xA7\xAC"), "\xF0\x9F\xA7\xAC");
}

TEST(SanitizeUtf8Test, InvalidBytesAreReplaced) {
    EXPECT_EQ(sanitizeUtf8("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
    // Truncated three-byte sequence at the end
    EXPECT_EQ(sanitizeUtf8("x\xE2\x82"), "x\xEF\xBF\xBD");
    // Broken prefix followed by a valid character
    EXPECT_EQ(sanitizeUtf8("\xE2\x82" "a"), "\xEF\xBF\xBD" "a");
}

TEST(SanitizeUtf8Test, EachStrayByteIsReplaced) {
    EXPECT_EQ(sanitizeUtf8("\x80\x80"), "\xEF\xBF\xBD\xEF\xBF\xBD");
    // Overlong lead, then its continuation byte
    EXPECT_EQ(sanitizeUtf8("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD");
    // Encoded surrogate: the lead is a prefix of nothing valid
    EXPECT_EQ(sanitizeUtf8("\xED\xA0\x80"), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}

// =============================================================================
// parseRecords Tests
// =============================================================================

TEST(ParseRecordsTest, ParsesLinesInOrder) {
    const auto records = parseRecords("WP_413685322.1\t584\nKLA26572.1\t1396\n");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0], (Record{"WP_413685322.1", 584}));
    EXPECT_EQ(records[1], (Record{"KLA26572.1", 1396}));
}

TEST(ParseRecordsTest, LastLineWithoutTerminator) {
    const auto records = parseRecords("a\t1\nb\t2");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1], (Record{"b", 2}));
}

TEST(ParseRecordsTest, UnparsableValueBecomesZero) {
    const auto records = parseRecords("foo\tNaN\n");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0], (Record{"foo", 0}));
}

TEST(ParseRecordsTest, UnparsableValueIsLoggedWithKey) {
    TempFileGuard logFile(tempFilePath(".log"));
    log::Config config;
    config.logFile = logFile.path().string();
    config.level = log::Level::kWarning;
    config.enableConsole = false;
    config.loggerName = "record_parser_test";
    log::init(config);

    const auto records = parseRecords("WP_000000042.1\tNaN\nWP_000000043.1\t7\n");
    log::flush();
    log::init(log::Config{});

    ASSERT_EQ(records.size(), 2u);
    const std::string logged = readFile(logFile.path());
    EXPECT_NE(logged.find("WP_000000042.1"), std::string::npos);
    EXPECT_NE(logged.find("NaN"), std::string::npos);
    EXPECT_EQ(logged.find("WP_000000043.1"), std::string::npos);
}

TEST(ParseRecordsTest, LinesWithoutSeparatorAreSkipped) {
    const auto records = parseRecords("header line\n\na\t1\nno-tab-here\n");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0], (Record{"a", 1}));
}

TEST(ParseRecordsTest, CarriageReturnIsTrimmedFromValue) {
    const auto records = parseRecords("a\t10\r\nb\t 20 \r\n");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].value, 10u);
    EXPECT_EQ(records[1].value, 20u);
}

TEST(ParseRecordsTest, OnlyFirstTabSplits) {
    const auto records = parseRecords("a\t1\t2\n");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].key, "a");
    EXPECT_EQ(records[0].value, 0u);
}

TEST(ParseRecordsTest, DuplicateKeysAreKept) {
    const auto records = parseRecords("k\t1\nk\t2\n");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0], (Record{"k", 1}));
    EXPECT_EQ(records[1], (Record{"k", 2}));
}

TEST(ParseRecordsTest, InvalidUtf8KeyIsReplaced) {
    const auto records = parseRecords("ab\xFE\t5\n");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].key, "ab\xEF\xBF\xBD");
    EXPECT_EQ(records[0].value, 5u);
}

TEST(ParseRecordsTest, EmptyKeyIsAccepted) {
    const auto records = parseRecords("\t9\n");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0], (Record{"", 9}));
}

TEST(ParseRecordsTest, EmptyContent) {
    EXPECT_TRUE(parseRecords("").empty());
    EXPECT_TRUE(parseRecords("\n\n").empty());
}

}  // namespace
}  // namespace idxz::io
