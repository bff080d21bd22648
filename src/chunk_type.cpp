#include "chunk_type.hpp"
#include "errors.hpp"
#include <algorithm>
#include <vector>

namespace pngme {

ChunkType ChunkType::from_bytes(const Bytes& bytes)
{
    if (!std::all_of(bytes.begin(), bytes.end(), png::is_type_letter)) {
        throw ValidationError(ValidationError::Kind::InvalidTypeBytes,
                              std::vector<uint8_t>(bytes.begin(), bytes.end()));
    }
    return ChunkType(bytes);
}

ChunkType ChunkType::from_string(std::string_view text)
{
    // size() counts bytes, so a 4-character non-ASCII string is rejected here
    if (text.size() != png::CHUNK_TYPE_SIZE) {
        throw ValidationError(ValidationError::Kind::InvalidLength,
                              std::vector<uint8_t>(text.begin(), text.end()));
    }

    Bytes bytes;
    std::transform(text.begin(), text.end(), bytes.begin(),
                   [](char c) { return static_cast<uint8_t>(c); });
    return from_bytes(bytes);
}

bool ChunkType::is_valid() const
{
    return std::all_of(bytes_.begin(), bytes_.end(), png::is_type_letter) && is_reserved_bit_valid();
}

std::string ChunkType::to_string() const
{
    return std::string(bytes_.begin(), bytes_.end());
}

std::ostream& operator<<(std::ostream& os, const ChunkType& type)
{
    return os << type.to_string();
}

} // namespace pngme
