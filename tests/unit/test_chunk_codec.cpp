#include <cstdint>
#include <string>

#include <gtest/gtest.h>

#include "chunkvault/transfer/chunk_codec.h"

using chunkvault::core::ErrorCode;
using chunkvault::transfer::ChunkHeader;
using chunkvault::transfer::ComputeChecksum;
using chunkvault::transfer::DecodeChunk;
using chunkvault::transfer::EncodeChunk;
using chunkvault::transfer::EncodeHeader;
using chunkvault::transfer::VerifyChunk;
using chunkvault::transfer::kChunkHeaderSize;

namespace {

std::string Header(std::uint64_t start, std::uint64_t end, std::uint8_t checksum) {
    ChunkHeader header;
    header.start_byte = start;
    header.end_byte = end;
    header.checksum = checksum;
    return EncodeHeader(header);
}

}  // namespace

TEST(ChunkCodec, HeaderIsBigEndian) {
    const auto raw = Header(0x0102030405060708ULL, 0x1112131415161718ULL, 0xAB);
    ASSERT_EQ(raw.size(), kChunkHeaderSize);
    EXPECT_EQ(static_cast<std::uint8_t>(raw[0]), 0x01);
    EXPECT_EQ(static_cast<std::uint8_t>(raw[7]), 0x08);
    EXPECT_EQ(static_cast<std::uint8_t>(raw[8]), 0x11);
    EXPECT_EQ(static_cast<std::uint8_t>(raw[15]), 0x18);
    EXPECT_EQ(static_cast<std::uint8_t>(raw[16]), 0xAB);
}

TEST(ChunkCodec, DecodesValidChunk) {
    const std::string payload = "hello";
    auto decoded = DecodeChunk(EncodeChunk(10, payload));
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value().header.start_byte, 10u);
    EXPECT_EQ(decoded.value().header.end_byte, 14u);
    EXPECT_EQ(decoded.value().payload, payload);
    EXPECT_TRUE(VerifyChunk(decoded.value().header, decoded.value().payload).ok());
}

TEST(ChunkCodec, SingleByteChunk) {
    auto decoded = DecodeChunk(Header(7, 7, 'x') + "x");
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value().header.range().Length(), 1u);
}

TEST(ChunkCodec, ChecksumWrapsModulo256) {
    const std::string payload(3, static_cast<char>(0xFF));
    EXPECT_EQ(ComputeChecksum(payload), static_cast<std::uint8_t>((0xFF * 3) % 256));
    EXPECT_EQ(ComputeChecksum(std::string(256, '\x01')), 0);
}

TEST(ChunkCodec, RejectsShortHeader) {
    auto decoded = DecodeChunk(std::string(16, '\0'));
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.code(), ErrorCode::kMalformedHeader);
}

TEST(ChunkCodec, RejectsHeaderWithoutPayload) {
    auto decoded = DecodeChunk(Header(0, 0, 0));
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.code(), ErrorCode::kMalformedHeader);
}

TEST(ChunkCodec, RejectsInvertedRange) {
    auto decoded = DecodeChunk(Header(5, 4, 0) + "ab");
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.code(), ErrorCode::kMalformedHeader);
}

TEST(ChunkCodec, RejectsPayloadLengthMismatch) {
    auto too_long = DecodeChunk(Header(0, 1, ComputeChecksum("abc")) + "abc");
    ASSERT_FALSE(too_long.ok());
    EXPECT_EQ(too_long.code(), ErrorCode::kMalformedHeader);

    auto too_short = DecodeChunk(Header(0, 9, ComputeChecksum("abc")) + "abc");
    ASSERT_FALSE(too_short.ok());
    EXPECT_EQ(too_short.code(), ErrorCode::kMalformedHeader);
}

TEST(ChunkCodec, HugeRangeDoesNotOverflow) {
    auto decoded = DecodeChunk(Header(0, UINT64_MAX, 0) + "a");
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.code(), ErrorCode::kMalformedHeader);
}

TEST(ChunkCodec, DetectsChecksumMismatch) {
    auto body = EncodeChunk(0, "payload");
    body.back() = 'X';
    auto decoded = DecodeChunk(body);
    ASSERT_TRUE(decoded.ok());
    auto verified = VerifyChunk(decoded.value().header, decoded.value().payload);
    ASSERT_FALSE(verified.ok());
    EXPECT_EQ(verified.code(), ErrorCode::kChecksumMismatch);
}
