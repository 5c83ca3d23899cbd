// =============================================================================
// idxz - Frame Reader Tests
// =============================================================================
// Unit tests for single-frame decoding and positional reads.
// =============================================================================

#include "idxz/format/frame_reader.h"

#include <gtest/gtest.h>
#include <zstd.h>

#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "idxz/format/frame_encoder.h"
#include "test_util.h"

namespace idxz::format {
namespace {

using idxz::test::CompressedFixture;
using idxz::test::tempFilePath;
using idxz::test::writeFile;

const std::string kTable =
    "WP_413685322.1\t584\n"
    "KLA26572.1\t1396\n"
    "WP_000000001.1\t42\n"
    "XP_123456789.2\t7\n";

std::string encodeOne(std::string_view content) {
    std::ostringstream out;
    FrameEncoder encoder(3);
    (void)encoder.encode(out, content);
    return out.str();
}

/// @brief Frame without a content size in its header.
std::string encodeWithoutContentSize(std::string_view content) {
    ZSTD_CCtx* ctx = ZSTD_createCCtx();
    EXPECT_NE(ctx, nullptr);
    ZSTD_CCtx_setParameter(ctx, ZSTD_c_checksumFlag, 1);
    ZSTD_CCtx_setParameter(ctx, ZSTD_c_contentSizeFlag, 0);

    std::string frame(ZSTD_compressBound(content.size()), '\0');
    const std::size_t size =
        ZSTD_compress2(ctx, frame.data(), frame.size(), content.data(), content.size());
    ZSTD_freeCCtx(ctx);
    EXPECT_FALSE(ZSTD_isError(size));
    frame.resize(size);
    return frame;
}

/// @brief Offset and width of the frame content size field in a frame header.
std::pair<std::size_t, std::size_t> contentSizeField(const std::string& frame) {
    const auto descriptor = static_cast<unsigned char>(frame[4]);
    const bool singleSegment = (descriptor >> 5) & 1;
    const std::size_t dictIdBytes[] = {0, 1, 2, 4};
    const std::size_t sizeBytes[] = {singleSegment ? 1u : 0u, 2, 4, 8};

    const std::size_t offset = 5 + (singleSegment ? 0 : 1) + dictIdBytes[descriptor & 3];
    return {offset, sizeBytes[descriptor >> 6]};
}

// =============================================================================
// decodeFrame Tests
// =============================================================================

TEST(DecodeFrameTest, DecodesEncodedFrame) {
    auto content = decodeFrame(encodeOne(kTable));
    ASSERT_TRUE(content.has_value()) << content.error().message();
    EXPECT_EQ(*content, kTable);
}

TEST(DecodeFrameTest, FrameHeaderCarriesContentSize) {
    const std::string frame = encodeOne(kTable);
    EXPECT_EQ(ZSTD_getFrameContentSize(frame.data(), frame.size()), kTable.size());
}

TEST(DecodeFrameTest, DecodesFrameWithoutContentSize) {
    const std::string frame = encodeWithoutContentSize(kTable);
    ASSERT_EQ(ZSTD_getFrameContentSize(frame.data(), frame.size()), ZSTD_CONTENTSIZE_UNKNOWN);

    auto content = decodeFrame(frame);
    ASSERT_TRUE(content.has_value()) << content.error().message();
    EXPECT_EQ(*content, kTable);
}

TEST(DecodeFrameTest, LargeFrameWithoutContentSize) {
    std::string big;
    for (int i = 0; i < 50'000; ++i) {
        big += "ACC_" + std::to_string(i) + "\t" + std::to_string(i * 7) + "\n";
    }

    auto content = decodeFrame(encodeWithoutContentSize(big));
    ASSERT_TRUE(content.has_value()) << content.error().message();
    EXPECT_EQ(*content, big);
}

TEST(DecodeFrameTest, GarbageIsCorruptedData) {
    auto content = decodeFrame("this is not a zstd frame");
    ASSERT_FALSE(content.has_value());
    EXPECT_EQ(content.error().code(), ErrorCode::kCorruptedData);
}

TEST(DecodeFrameTest, TruncatedFrameIsCorruptedData) {
    std::string frame = encodeOne(kTable);
    frame.resize(frame.size() - 3);

    auto content = decodeFrame(frame);
    ASSERT_FALSE(content.has_value());
    EXPECT_EQ(content.error().code(), ErrorCode::kCorruptedData);
}

TEST(DecodeFrameTest, TrailingBytesAreCorruptedData) {
    const std::string frame = encodeOne(kTable) + encodeOne(kTable);

    auto content = decodeFrame(frame);
    ASSERT_FALSE(content.has_value());
    EXPECT_EQ(content.error().code(), ErrorCode::kCorruptedData);
}

TEST(DecodeFrameTest, DamagedChecksumIsDetected) {
    std::string frame = encodeOne(kTable);
    frame.back() = static_cast<char>(frame.back() ^ 0x5A);

    auto content = decodeFrame(frame);
    ASSERT_FALSE(content.has_value());
    EXPECT_EQ(content.error().code(), ErrorCode::kChecksumError);
}

TEST(DecodeFrameTest, InflatedContentSizeIsRejectedBeforeDecoding) {
    std::string repetitive;
    for (int i = 0; i < 20'000; ++i) {
        repetitive += "WP_413685322.1\t584\n";
    }
    std::string frame = encodeOne(repetitive);
    const auto [offset, width] = contentSizeField(frame);
    ASSERT_GE(width, 4u);

    // Claim close to 4 GiB of content
    for (std::size_t i = 0; i < width; ++i) {
        frame[offset + i] = static_cast<char>(i < 4 ? 0xF0 : 0x00);
    }
    ASSERT_GT(ZSTD_getFrameContentSize(frame.data(), frame.size()), 0xF0000000ull);

    auto content = decodeFrame(frame);
    ASSERT_FALSE(content.has_value());
    EXPECT_EQ(content.error().code(), ErrorCode::kCorruptedData);
    EXPECT_NE(content.error().message().find("announces"), std::string::npos);
}

TEST(DecodeFrameTest, DamagedPayloadFails) {
    std::string frame = encodeOne(kTable);
    frame[frame.size() / 2] = static_cast<char>(frame[frame.size() / 2] ^ 0xFF);

    EXPECT_FALSE(decodeFrame(frame).has_value());
}

// =============================================================================
// FrameReader Tests
// =============================================================================

TEST(FrameReaderTest, ReadsEveryFrameByDescriptor) {
    CompressedFixture fixture(kTable, 20);
    ASSERT_GT(fixture.summary.frameCount(), 1u);

    FrameReader reader(fixture.compressed.path());
    EXPECT_EQ(reader.size(), compressedBytes(fixture.summary.index));

    std::string joined;
    // Reverse order: positional reads do not depend on previous ones
    for (auto it = fixture.summary.index.rbegin(); it != fixture.summary.index.rend(); ++it) {
        auto content = reader.readFrame(*it);
        ASSERT_TRUE(content.has_value()) << content.error().message();
        joined.insert(0, *content);
    }
    EXPECT_EQ(joined, kTable);
}

TEST(FrameReaderTest, ConcurrentReads) {
    CompressedFixture fixture(kTable, 1);
    FrameReader reader(fixture.compressed.path());
    const auto& index = fixture.summary.index;

    std::vector<std::string> contents(index.size());
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < index.size(); ++i) {
        threads.emplace_back([&, i] {
            auto content = reader.readFrame(index[i]);
            if (content) {
                contents[i] = std::move(*content);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::string joined;
    for (const auto& content : contents) {
        joined += content;
    }
    EXPECT_EQ(joined, kTable);
}

TEST(FrameReaderTest, ReadBeyondEndIsCorruptedData) {
    CompressedFixture fixture(kTable, 1000);
    FrameReader reader(fixture.compressed.path());

    FrameDescriptor beyond(reader.size() - 2, 10, 0);
    auto raw = reader.readRaw(beyond);
    ASSERT_FALSE(raw.has_value());
    EXPECT_EQ(raw.error().code(), ErrorCode::kCorruptedData);
}

TEST(FrameReaderTest, UnboundedLengthIsCorruptedData) {
    CompressedFixture fixture(kTable, 1000);
    FrameReader reader(fixture.compressed.path());

    for (const FrameDescriptor& descriptor :
         {FrameDescriptor(0, std::numeric_limits<std::uint64_t>::max(), 0),
          FrameDescriptor(0, std::uint64_t{1} << 35, 0),
          FrameDescriptor(std::numeric_limits<std::uint64_t>::max(), 1, 0)}) {
        auto content = reader.readFrame(descriptor);
        ASSERT_FALSE(content.has_value());
        EXPECT_EQ(content.error().code(), ErrorCode::kCorruptedData);
        EXPECT_NE(content.error().message().find("past the end"), std::string::npos);
    }
}

TEST(FrameReaderTest, WrongLengthIsCorruptedData) {
    CompressedFixture fixture(kTable, 1000);
    ASSERT_EQ(fixture.summary.frameCount(), 1u);
    FrameReader reader(fixture.compressed.path());

    FrameDescriptor shortened = fixture.summary.index[0];
    shortened.length -= 1;
    auto content = reader.readFrame(shortened);
    ASSERT_FALSE(content.has_value());
    EXPECT_EQ(content.error().code(), ErrorCode::kCorruptedData);
    EXPECT_NE(content.error().message().find("position 0"), std::string::npos);
}

TEST(FrameReaderTest, WrongPositionFails) {
    CompressedFixture fixture(kTable, 20);
    ASSERT_GT(fixture.summary.frameCount(), 1u);
    FrameReader reader(fixture.compressed.path());

    FrameDescriptor shifted = fixture.summary.index[1];
    shifted.position += 1;
    EXPECT_FALSE(reader.readFrame(shifted).has_value());
}

TEST(FrameReaderTest, CorruptedFileIsReportedPerFrame) {
    CompressedFixture fixture(kTable, 1);
    const auto& index = fixture.summary.index;
    ASSERT_GE(index.size(), 3u);

    std::string bytes = idxz::test::readFile(fixture.compressed.path());
    bytes[index[1].end() - 1] = static_cast<char>(bytes[index[1].end() - 1] ^ 0x01);
    writeFile(fixture.compressed.path(), bytes);

    FrameReader reader(fixture.compressed.path());
    EXPECT_TRUE(reader.readFrame(index[0]).has_value());
    auto damaged = reader.readFrame(index[1]);
    ASSERT_FALSE(damaged.has_value());
    EXPECT_EQ(damaged.error().code(), ErrorCode::kChecksumError);
    EXPECT_TRUE(reader.readFrame(index[2]).has_value());
}

TEST(FrameReaderTest, MissingFileThrows) {
    try {
        FrameReader reader(tempFilePath(".missing.zst"));
        FAIL() << "Expected IOError";
    } catch (const IOError& e) {
        EXPECT_TRUE(e.systemError().has_value());
    }
}

TEST(FrameReaderTest, MoveTransfersOwnership) {
    CompressedFixture fixture(kTable, 1000);
    FrameReader first(fixture.compressed.path());
    FrameReader second(std::move(first));

    auto content = second.readFrame(fixture.summary.index[0]);
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, kTable);
}

}  // namespace
}  // namespace idxz::format
