// =============================================================================
// idxz - Byte Size Parsing Tests
// =============================================================================
// Unit tests for human-readable block size strings.
// =============================================================================

#include "idxz/common/byte_size.h"

#include <gtest/gtest.h>

#include "idxz/common/error.h"
#include "idxz/common/types.h"

namespace idxz {
namespace {

// =============================================================================
// parseByteSize Tests
// =============================================================================

TEST(ByteSizeTest, PlainNumber) {
    EXPECT_EQ(parseByteSize("200"), 200u);
    EXPECT_EQ(parseByteSize("5"), 5u);
    EXPECT_EQ(parseByteSize("  70  "), 70u);
}

TEST(ByteSizeTest, ExplicitBytes) {
    EXPECT_EQ(parseByteSize("17B"), 17u);
    EXPECT_EQ(parseByteSize("17 b"), 17u);
}

TEST(ByteSizeTest, DecimalUnits) {
    EXPECT_EQ(parseByteSize("1K"), 1000u);
    EXPECT_EQ(parseByteSize("64KB"), 64'000u);
    EXPECT_EQ(parseByteSize("2MB"), 2'000'000u);
    EXPECT_EQ(parseByteSize("1GB"), 1'000'000'000u);
    EXPECT_EQ(parseByteSize("1TB"), 1'000'000'000'000u);
}

TEST(ByteSizeTest, BinaryUnits) {
    EXPECT_EQ(parseByteSize("64KiB"), 64u * 1024);
    EXPECT_EQ(parseByteSize("1MiB"), 1024u * 1024);
    EXPECT_EQ(parseByteSize("2GiB"), 2ull * 1024 * 1024 * 1024);
    EXPECT_EQ(parseByteSize("1TiB"), 1024ull * 1024 * 1024 * 1024);
}

TEST(ByteSizeTest, UnitsAreCaseInsensitive) {
    EXPECT_EQ(parseByteSize("64kib"), 64u * 1024);
    EXPECT_EQ(parseByteSize("64KIB"), 64u * 1024);
    EXPECT_EQ(parseByteSize("3mb"), 3'000'000u);
}

TEST(ByteSizeTest, DecimalValues) {
    EXPECT_EQ(parseByteSize("1.5KiB"), 1536u);
    EXPECT_EQ(parseByteSize("0.5MB"), 500'000u);
    EXPECT_EQ(parseByteSize("2.5 K"), 2500u);
}

TEST(ByteSizeTest, RejectsMalformedStrings) {
    EXPECT_FALSE(parseByteSize("").has_value());
    EXPECT_FALSE(parseByteSize("   ").has_value());
    EXPECT_FALSE(parseByteSize("KiB").has_value());
    EXPECT_FALSE(parseByteSize("12XB").has_value());
    EXPECT_FALSE(parseByteSize("-5").has_value());
    EXPECT_FALSE(parseByteSize("1.2.3").has_value());
    EXPECT_FALSE(parseByteSize("abc").has_value());
}

TEST(ByteSizeTest, RejectsOverflow) {
    EXPECT_FALSE(parseByteSize("18446744073709551616").has_value());
    EXPECT_FALSE(parseByteSize("99999999999TiB").has_value());
}

// =============================================================================
// parseBlockSize Tests
// =============================================================================

TEST(BlockSizeTest, AcceptsPositiveSizes) {
    EXPECT_EQ(parseBlockSize("64KiB"), kDefaultBlockSize);
    EXPECT_EQ(parseBlockSize(kDefaultBlockSizeString), kDefaultBlockSize);
    EXPECT_EQ(parseBlockSize("1"), 1u);
}

TEST(BlockSizeTest, RejectsZero) {
    EXPECT_THROW((void)parseBlockSize("0"), UsageError);
    EXPECT_THROW((void)parseBlockSize("0KiB"), UsageError);
    EXPECT_THROW((void)parseBlockSize("0.0001B"), UsageError);
}

TEST(BlockSizeTest, RejectsGarbageWithUsageExitCode) {
    try {
        (void)parseBlockSize("lots");
        FAIL() << "Expected UsageError";
    } catch (const UsageError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kUsageError);
        EXPECT_EQ(e.exitCode(), 1);
        EXPECT_NE(std::string(e.what()).find("lots"), std::string::npos);
    }
}

// =============================================================================
// formatByteSize Tests
// =============================================================================

TEST(FormatByteSizeTest, Formatting) {
    EXPECT_EQ(formatByteSize(17), "17 B");
    EXPECT_EQ(formatByteSize(64 * 1024), "64.00 KiB");
    EXPECT_EQ(formatByteSize(1536ull * 1024 * 1024), "1.50 GiB");
}

}  // namespace
}  // namespace idxz
