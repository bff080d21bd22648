#pragma once
#include "png_format.hpp"
#include <array>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace pngme {

/**
 * @brief Four-letter chunk type code
 *
 * Every instance holds four ASCII letters; the factories throw
 * ValidationError otherwise. The reserved bit is NOT checked on
 * construction, use is_valid() for that.
 */
class ChunkType
{
public:
    using Bytes = std::array<uint8_t, png::CHUNK_TYPE_SIZE>;

    static ChunkType from_bytes(const Bytes& bytes);
    static ChunkType from_string(std::string_view text);

    const Bytes& bytes() const { return bytes_; }

    bool is_critical() const { return !png::property_bit(bytes_, png::PropertyByte::ANCILLARY); }
    bool is_public() const { return !png::property_bit(bytes_, png::PropertyByte::PRIVATE); }
    bool is_reserved_bit_valid() const { return !png::property_bit(bytes_, png::PropertyByte::RESERVED); }
    bool is_safe_to_copy() const { return png::property_bit(bytes_, png::PropertyByte::SAFE_TO_COPY); }

    // Letters only and reserved bit clear.
    bool is_valid() const;

    std::string to_string() const;

    bool operator==(const ChunkType& other) const = default;

private:
    explicit ChunkType(const Bytes& bytes) : bytes_(bytes) {}

    Bytes bytes_;
};

std::ostream& operator<<(std::ostream& os, const ChunkType& type);

} // namespace pngme
