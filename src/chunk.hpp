#pragma once
#include "chunk_type.hpp"
#include <cstdint>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pngme {

/**
 * @brief One PNG chunk: length, type, payload and CRC
 *
 * A Chunk is either built fresh from a type and a payload (length and CRC
 * are derived) or parsed from exactly one serialized record (length and CRC
 * are read, the CRC is verified). It never changes afterwards.
 */
class Chunk
{
public:
    Chunk(const ChunkType& type, std::vector<uint8_t> data);

    /**
     * Build a chunk from a type code and a text payload.
     * @throws ValidationError if `type` is not a 4-letter code
     */
    static Chunk from_strings(std::string_view type, std::string_view text);

    /**
     * Parse exactly one serialized chunk.
     * @param bytes length ++ type ++ data ++ crc, nothing more
     * @throws ValidationError if the type bytes are not letters
     * @throws FormatError on truncation, reserved-bit violation, CRC mismatch
     *         or a length field that disagrees with the record size
     */
    static Chunk parse(std::span<const uint8_t> bytes);

    // CRC-32 over type ++ data, the value stored in the CRC field.
    static uint32_t checksum(const ChunkType& type, std::span<const uint8_t> data);

    uint32_t length() const { return length_; }
    const ChunkType& chunk_type() const { return type_; }
    const std::vector<uint8_t>& data() const { return data_; }
    uint32_t crc() const { return crc_; }

    /**
     * Payload as text.
     * @throws TextEncodingError if the payload is not valid UTF-8
     */
    std::string data_as_string() const;

    std::vector<uint8_t> serialize() const;

    std::string to_string() const;

    bool operator==(const Chunk& other) const = default;

private:
    Chunk(uint32_t length, const ChunkType& type, std::vector<uint8_t> data, uint32_t crc)
        : length_(length), type_(type), data_(std::move(data)), crc_(crc) {}

    uint32_t length_;
    ChunkType type_;
    std::vector<uint8_t> data_;
    uint32_t crc_;
};

std::ostream& operator<<(std::ostream& os, const Chunk& chunk);

} // namespace pngme
