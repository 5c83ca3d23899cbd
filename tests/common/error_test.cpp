// =============================================================================
// idxz - Error Handling Tests
// =============================================================================
// Unit tests for error codes, exceptions, Result helpers and strategy names.
// =============================================================================

#include "idxz/common/error.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "idxz/common/types.h"

namespace idxz {
namespace {

// =============================================================================
// ErrorCode Tests
// =============================================================================

TEST(ErrorCodeTest, ExitCodes) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kUsageError), 1);
    EXPECT_EQ(toExitCode(ErrorCode::kIOError), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kFormatError), 3);
    EXPECT_EQ(toExitCode(ErrorCode::kChecksumError), 4);
    EXPECT_EQ(toExitCode(ErrorCode::kCompressionError), 5);
}

TEST(ErrorCodeTest, Names) {
    EXPECT_EQ(errorCodeToString(ErrorCode::kChecksumError), "checksum error");
    EXPECT_EQ(errorCodeToString(ErrorCode::kCorruptedData), "corrupted data");
}

// =============================================================================
// Exception Tests
// =============================================================================

TEST(ExceptionTest, WhatIncludesCategoryAndContext) {
    FormatError error("bad index", ErrorContext("table.zst.idx").withLine(3).withOffset(120));

    const std::string what = error.what();
    EXPECT_NE(what.find("[format error]"), std::string::npos);
    EXPECT_NE(what.find("bad index"), std::string::npos);
    EXPECT_NE(what.find("file: table.zst.idx"), std::string::npos);
    EXPECT_NE(what.find("line: 3"), std::string::npos);
    EXPECT_NE(what.find("offset: 120"), std::string::npos);
    EXPECT_EQ(error.message(), "bad index");
    EXPECT_TRUE(error.hasContext());
}

TEST(ExceptionTest, IOErrorCarriesSystemError) {
    IOError error("open failed", std::make_error_code(std::errc::no_such_file_or_directory));

    EXPECT_EQ(error.code(), ErrorCode::kIOError);
    ASSERT_TRUE(error.systemError().has_value());
    EXPECT_EQ(*error.systemError(), std::make_error_code(std::errc::no_such_file_or_directory));
}

TEST(ExceptionTest, IOErrorWithSpecificCode) {
    IOError error(ErrorCode::kFileExists, "exists");
    EXPECT_EQ(error.code(), ErrorCode::kFileExists);
    EXPECT_EQ(error.exitCode(), 8);
}

// =============================================================================
// Result Tests
// =============================================================================

TEST(ResultTest, MakeErrorCarriesCodeAndMessage) {
    auto failed = makeError<int>(ErrorCode::kFormatError, "x");
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code(), ErrorCode::kFormatError);
    EXPECT_EQ(failed.error().message(), "x");

    EXPECT_TRUE(makeVoidSuccess().has_value());
    EXPECT_EQ(makeVoidError(ErrorCode::kIOError, "y").error().code(), ErrorCode::kIOError);
}

TEST(ResultTest, TryExecuteCapturesExceptions) {
    auto ok = tryExecute([] { return 42; });
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, 42);

    auto failed = tryExecute([]() -> int { throw FormatError("mismatch"); });
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code(), ErrorCode::kFormatError);
    EXPECT_EQ(failed.error().message(), "mismatch");

    auto foreign = tryExecute([] { throw std::runtime_error("boom"); });
    ASSERT_FALSE(foreign.has_value());
    EXPECT_EQ(foreign.error().code(), ErrorCode::kIOError);
}

// =============================================================================
// Aggregation Strategy Names
// =============================================================================

TEST(AggregationStrategyTest, CanonicalNames) {
    EXPECT_EQ(parseAggregationStrategy("concurrent-map"), AggregationStrategy::kConcurrentMap);
    EXPECT_EQ(parseAggregationStrategy("local-combine"), AggregationStrategy::kLocalCombine);
    EXPECT_EQ(parseAggregationStrategy("parallel-reduce"), AggregationStrategy::kParallelReduce);
}

TEST(AggregationStrategyTest, LegacyAliases) {
    EXPECT_EQ(parseAggregationStrategy("dashmap"), AggregationStrategy::kConcurrentMap);
    EXPECT_EQ(parseAggregationStrategy("Vector"), AggregationStrategy::kLocalCombine);
    EXPECT_EQ(parseAggregationStrategy("MERGE"), AggregationStrategy::kParallelReduce);
    EXPECT_FALSE(parseAggregationStrategy("fastest").has_value());
}

TEST(AggregationStrategyTest, NamesRoundTrip) {
    for (auto strategy : {AggregationStrategy::kConcurrentMap, AggregationStrategy::kLocalCombine,
                          AggregationStrategy::kParallelReduce}) {
        EXPECT_EQ(parseAggregationStrategy(aggregationStrategyToString(strategy)), strategy);
    }
}

}  // namespace
}  // namespace idxz
