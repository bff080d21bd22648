#include "chunk.hpp"
#include "errors.hpp"
#include <algorithm>
#include <optional>
#include <sstream>
#include <zlib.h>

namespace pngme {

namespace {

// Payload bytes shown before the rendering is cut short.
constexpr size_t MAX_RENDERED_BYTES = 32;

/**
 * Returns the offset of the first byte that breaks UTF-8, or nullopt.
 * Rejects overlong forms, surrogates and code points above U+10FFFF.
 */
std::optional<size_t> find_invalid_utf8(std::span<const uint8_t> bytes)
{
    size_t i = 0;
    while (i < bytes.size()) {
        const uint8_t lead = bytes[i];
        size_t extra = 0;
        uint32_t codepoint = 0;
        uint32_t minimum = 0;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            codepoint = lead & 0x1F;
            minimum = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            codepoint = lead & 0x0F;
            minimum = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            codepoint = lead & 0x07;
            minimum = 0x10000;
        } else {
            return i;
        }

        if (i + extra >= bytes.size()) return i;

        for (size_t k = 1; k <= extra; ++k) {
            const uint8_t next = bytes[i + k];
            if ((next & 0xC0) != 0x80) return i;
            codepoint = (codepoint << 6) | (next & 0x3F);
        }

        if (codepoint < minimum || codepoint > 0x10FFFF ||
            (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
            return i;
        }
        i += extra + 1;
    }
    return std::nullopt;
}

bool is_printable_text(std::span<const uint8_t> bytes)
{
    if (find_invalid_utf8(bytes)) return false;
    for (uint8_t b : bytes) {
        if ((b < 0x20 && b != '\n' && b != '\t') || b == 0x7F) return false;
    }
    return true;
}

} // namespace

Chunk::Chunk(const ChunkType& type, std::vector<uint8_t> data)
    : length_(static_cast<uint32_t>(data.size())),
      type_(type),
      data_(std::move(data)),
      crc_(checksum(type_, data_))
{
}

Chunk Chunk::from_strings(std::string_view type, std::string_view text)
{
    return Chunk(ChunkType::from_string(type), std::vector<uint8_t>(text.begin(), text.end()));
}

uint32_t Chunk::checksum(const ChunkType& type, std::span<const uint8_t> data)
{
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, type.bytes().data(), static_cast<uInt>(type.bytes().size()));
    // crc32() treats a null buffer as a reset request
    if (!data.empty()) {
        crc = crc32(crc, data.data(), static_cast<uInt>(data.size()));
    }
    return static_cast<uint32_t>(crc);
}

Chunk Chunk::parse(std::span<const uint8_t> bytes)
{
    if (bytes.size() < png::CHUNK_OVERHEAD) {
        throw FormatError(FormatError::Kind::TooShort,
                          "chunk needs at least " + std::to_string(png::CHUNK_OVERHEAD) +
                          " bytes, got " + std::to_string(bytes.size()),
                          png::CHUNK_OVERHEAD, bytes.size());
    }

    const uint32_t length = png::read_u32_be(bytes.subspan(png::CHUNK_LENGTH_OFFSET, png::CHUNK_LENGTH_SIZE));

    ChunkType::Bytes typeBytes;
    const auto typeSpan = bytes.subspan(png::CHUNK_TYPE_OFFSET, png::CHUNK_TYPE_SIZE);
    std::copy(typeSpan.begin(), typeSpan.end(), typeBytes.begin());
    const ChunkType type = ChunkType::from_bytes(typeBytes);
    if (!type.is_valid()) {
        throw FormatError(FormatError::Kind::InvalidTag,
                          "chunk type " + type.to_string() + " has the reserved bit set");
    }

    const size_t dataSize = bytes.size() - png::CHUNK_OVERHEAD;
    const auto data = bytes.subspan(png::CHUNK_DATA_OFFSET, dataSize);
    const uint32_t storedCrc = png::read_u32_be(bytes.subspan(bytes.size() - png::CHUNK_CRC_SIZE));

    const uint32_t actualCrc = checksum(type, data);
    if (actualCrc != storedCrc) {
        throw FormatError(FormatError::Kind::ChecksumMismatch,
                          "chunk " + type.to_string() + " stores crc " + std::to_string(storedCrc) +
                          " but data hashes to " + std::to_string(actualCrc),
                          storedCrc, actualCrc);
    }

    if (length != dataSize) {
        throw FormatError(FormatError::Kind::LengthMismatch,
                          "chunk " + type.to_string() + " declares " + std::to_string(length) +
                          " data bytes but carries " + std::to_string(dataSize),
                          length, dataSize);
    }

    return Chunk(length, type, std::vector<uint8_t>(data.begin(), data.end()), storedCrc);
}

std::string Chunk::data_as_string() const
{
    if (auto offset = find_invalid_utf8(data_)) {
        throw TextEncodingError(*offset);
    }
    return std::string(data_.begin(), data_.end());
}

std::vector<uint8_t> Chunk::serialize() const
{
    std::vector<uint8_t> out;
    out.reserve(png::CHUNK_OVERHEAD + data_.size());
    png::write_u32_be(out, length_);
    out.insert(out.end(), type_.bytes().begin(), type_.bytes().end());
    out.insert(out.end(), data_.begin(), data_.end());
    png::write_u32_be(out, crc_);
    return out;
}

std::string Chunk::to_string() const
{
    std::ostringstream oss;
    oss << "Chunk { Length: " << length_ << ", Type: " << type_ << ", Data: ";
    if (is_printable_text(data_)) {
        oss << "\"" << std::string(data_.begin(), data_.end()) << "\"";
    } else {
        oss << "[";
        const size_t count = std::min(data_.size(), MAX_RENDERED_BYTES);
        for (size_t i = 0; i < count; ++i) {
            if (i > 0) oss << ", ";
            oss << static_cast<int>(data_[i]);
        }
        if (data_.size() > MAX_RENDERED_BYTES) {
            oss << ", ... (" << (data_.size() - MAX_RENDERED_BYTES) << " more bytes)";
        }
        oss << "]";
    }
    oss << ", Crc: " << crc_ << " }";
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Chunk& chunk)
{
    return os << chunk.to_string();
}

} // namespace pngme
