#include "chunkvault/transfer/chunk_codec.h"

namespace chunkvault::transfer {

namespace {

std::uint64_t ReadBigEndian64(const std::string& raw, std::size_t offset) {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        value = (value << 8) | static_cast<std::uint8_t>(raw[offset + i]);
    }
    return value;
}

void AppendBigEndian64(std::string& out, std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<char>((value >> shift) & 0xFF));
    }
}

}  // namespace

core::Result<DecodedChunk> DecodeChunk(const std::string& raw) {
    if (raw.size() < kChunkHeaderSize) {
        return core::MakeError(core::ErrorCode::kMalformedHeader, "chunk header too short");
    }

    DecodedChunk chunk;
    chunk.header.start_byte = ReadBigEndian64(raw, 0);
    chunk.header.end_byte = ReadBigEndian64(raw, 8);
    chunk.header.checksum = static_cast<std::uint8_t>(raw[16]);
    if (chunk.header.start_byte > chunk.header.end_byte) {
        return core::MakeError(core::ErrorCode::kMalformedHeader,
                               "invalid byte range (end_byte < start_byte)");
    }

    const auto payload_size = static_cast<std::uint64_t>(raw.size() - kChunkHeaderSize);
    // Compare via the length of the header range; end - start cannot overflow here.
    if (payload_size == 0 || payload_size - 1 != chunk.header.end_byte - chunk.header.start_byte) {
        return core::MakeError(core::ErrorCode::kMalformedHeader,
                               "payload length does not match header range");
    }
    chunk.payload = raw.substr(kChunkHeaderSize);
    return chunk;
}

core::Result<void> VerifyChunk(const ChunkHeader& header, const std::string& payload) {
    if (ComputeChecksum(payload) != header.checksum) {
        return core::MakeError(core::ErrorCode::kChecksumMismatch, "checksum validation failed");
    }
    return core::Ok();
}

std::uint8_t ComputeChecksum(const std::string& payload) {
    std::uint8_t sum = 0;
    for (char c : payload) {
        sum = static_cast<std::uint8_t>(sum + static_cast<std::uint8_t>(c));
    }
    return sum;
}

std::string EncodeHeader(const ChunkHeader& header) {
    std::string out;
    out.reserve(kChunkHeaderSize);
    AppendBigEndian64(out, header.start_byte);
    AppendBigEndian64(out, header.end_byte);
    out.push_back(static_cast<char>(header.checksum));
    return out;
}

std::string EncodeChunk(std::uint64_t start_byte, const std::string& payload) {
    ChunkHeader header;
    header.start_byte = start_byte;
    header.end_byte = start_byte + payload.size() - 1;
    header.checksum = ComputeChecksum(payload);
    return EncodeHeader(header) + payload;
}

}  // namespace chunkvault::transfer
