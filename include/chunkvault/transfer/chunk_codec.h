#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "chunkvault/core/result.h"

namespace chunkvault::transfer {

/// @brief Size of the fixed chunk header: start (u64 BE), end (u64 BE), checksum (u8).
constexpr std::size_t kChunkHeaderSize = 17;

/// @brief Inclusive byte interval [start, end] of the target file.
struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0};

    std::uint64_t Length() const { return end - start + 1; }
    bool Contains(const ByteRange& other) const {
        return start <= other.start && other.end <= end;
    }
};

inline bool operator==(const ByteRange& lhs, const ByteRange& rhs) {
    return lhs.start == rhs.start && lhs.end == rhs.end;
}
inline bool operator!=(const ByteRange& lhs, const ByteRange& rhs) { return !(lhs == rhs); }

struct ChunkHeader {
    std::uint64_t start_byte{0};
    std::uint64_t end_byte{0};
    std::uint8_t checksum{0};

    ByteRange range() const { return ByteRange{start_byte, end_byte}; }
};

struct DecodedChunk {
    ChunkHeader header;
    std::string payload;
};

/// @brief Parse header and payload from a raw upload body.
/// Fails with kMalformedHeader on a short body, start > end, or a payload whose
/// length disagrees with the header range.
core::Result<DecodedChunk> DecodeChunk(const std::string& raw);

/// @brief Recompute the payload checksum; kChecksumMismatch when it differs.
core::Result<void> VerifyChunk(const ChunkHeader& header, const std::string& payload);

/// @brief Sum of all bytes modulo 256.
std::uint8_t ComputeChecksum(const std::string& payload);

std::string EncodeHeader(const ChunkHeader& header);

/// @brief Build a complete upload body for payload placed at start_byte.
/// payload must not be empty.
std::string EncodeChunk(std::uint64_t start_byte, const std::string& payload);

}  // namespace chunkvault::transfer
