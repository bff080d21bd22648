#include "errors.hpp"
#include <iomanip>
#include <sstream>
#include <utility>

namespace pngme {

namespace {

std::string describe_bytes(const std::vector<uint8_t>& bytes)
{
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0) oss << " ";
        oss << "0x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    }
    oss << "]";
    return oss.str();
}

std::string validation_message(ValidationError::Kind kind, const std::vector<uint8_t>& bytes)
{
    switch (kind) {
        case ValidationError::Kind::InvalidTypeBytes:
            return "Invalid chunk type bytes " + describe_bytes(bytes) + ", expected ASCII letters";
        case ValidationError::Kind::InvalidLength:
            return "Invalid chunk type length " + std::to_string(bytes.size()) + ", expected 4 bytes";
    }
    return "Invalid chunk type";
}

} // namespace

const char* to_string(ValidationError::Kind kind)
{
    switch (kind) {
        case ValidationError::Kind::InvalidTypeBytes: return "InvalidTypeBytes";
        case ValidationError::Kind::InvalidLength:    return "InvalidLength";
    }
    return "Unknown";
}

const char* to_string(FormatError::Kind kind)
{
    switch (kind) {
        case FormatError::Kind::TooShort:         return "TooShort";
        case FormatError::Kind::BadSignature:     return "BadSignature";
        case FormatError::Kind::InvalidTag:       return "InvalidTag";
        case FormatError::Kind::ChecksumMismatch: return "ChecksumMismatch";
        case FormatError::Kind::LengthMismatch:   return "LengthMismatch";
    }
    return "Unknown";
}

ValidationError::ValidationError(Kind kind, std::vector<uint8_t> bytes)
    : Error(validation_message(kind, bytes)), kind_(kind), bytes_(std::move(bytes))
{
}

FormatError::FormatError(Kind kind, const std::string& detail, uint64_t expected, uint64_t actual)
    : Error(std::string(to_string(kind)) + ": " + detail), kind_(kind), expected_(expected), actual_(actual)
{
}

NotFoundError::NotFoundError(const std::string& chunkType)
    : Error("Chunk not found: " + chunkType), chunkType_(chunkType)
{
}

TextEncodingError::TextEncodingError(size_t offset)
    : Error("Chunk data is not valid UTF-8 (byte " + std::to_string(offset) + ")"), offset_(offset)
{
}

IOError::IOError(const std::string& what, const std::string& path)
    : Error(what + ": " + path), path_(path)
{
}

} // namespace pngme
