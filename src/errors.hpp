#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace pngme {

// Base for everything the library throws.
class Error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Raised when a chunk type cannot be built from the given bytes or text.
class ValidationError : public Error
{
public:
    enum class Kind
    {
        InvalidTypeBytes, // a byte outside A-Z / a-z
        InvalidLength,    // not exactly 4 bytes
    };

    ValidationError(Kind kind, std::vector<uint8_t> bytes);

    Kind kind() const { return kind_; }
    const std::vector<uint8_t>& bytes() const { return bytes_; }

private:
    Kind kind_;
    std::vector<uint8_t> bytes_;
};

// Raised while parsing a chunk or a whole file. Any FormatError rejects the
// entire buffer.
class FormatError : public Error
{
public:
    enum class Kind
    {
        TooShort,
        BadSignature,
        InvalidTag,
        ChecksumMismatch,
        LengthMismatch,
    };

    FormatError(Kind kind, const std::string& detail, uint64_t expected = 0, uint64_t actual = 0);

    Kind kind() const { return kind_; }

    /**
     * For ChecksumMismatch: the stored CRC and the recomputed one.
     * For LengthMismatch / TooShort: the declared and available byte counts.
     */
    uint64_t expected() const { return expected_; }
    uint64_t actual() const { return actual_; }

private:
    Kind kind_;
    uint64_t expected_;
    uint64_t actual_;
};

class NotFoundError : public Error
{
public:
    explicit NotFoundError(const std::string& chunkType);

    const std::string& chunk_type() const { return chunkType_; }

private:
    std::string chunkType_;
};

class TextEncodingError : public Error
{
public:
    explicit TextEncodingError(size_t offset);

    // Offset of the first byte that does not form valid UTF-8.
    size_t offset() const { return offset_; }

private:
    size_t offset_;
};

class IOError : public Error
{
public:
    IOError(const std::string& what, const std::string& path);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

const char* to_string(ValidationError::Kind kind);
const char* to_string(FormatError::Kind kind);

} // namespace pngme
