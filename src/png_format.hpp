/**
 * @file png_format.hpp
 * @brief Wire-level constants and helpers for the PNG chunk layer
 *
 * This header describes the PNG file as a sequence of chunks, as laid out in
 * the PNG specification (ISO/IEC 15948, sections 5.2 to 5.4). Only the
 * structural layer is covered here: the file signature, the chunk record
 * layout and the property bits carried by the chunk type code.
 *
 * Pixel data, chunk ordering rules and the meaning of individual chunk types
 * are out of scope.
 */

#ifndef PNGME_PNG_FORMAT_HPP
#define PNGME_PNG_FORMAT_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

// =============================================================================
// CRITICAL: BYTE ORDERING
// =============================================================================

/**
 * @brief BYTE ORDER: ALL MULTI-BYTE INTEGERS ARE BIG-ENDIAN
 *
 * This applies to the chunk length field and the CRC field.
 *
 * Example: a payload length of 42 is stored as bytes [0x00, 0x00, 0x00, 0x2A]
 */

namespace png {

// =============================================================================
// FILE SIGNATURE
// =============================================================================

/**
 * @brief Size of the PNG file signature in bytes
 */
constexpr size_t SIGNATURE_SIZE = 8;

/**
 * @brief The eight bytes every PNG datastream starts with
 *
 *   0x89        high bit set, catches 7-bit transports
 *   'P' 'N' 'G' human readable identification
 *   CR LF       catches CRLF to LF conversion
 *   0x1A        stops display under DOS `type`
 *   LF          catches LF to CRLF conversion
 */
constexpr std::array<uint8_t, SIGNATURE_SIZE> SIGNATURE = {
    0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
};

// =============================================================================
// CHUNK LAYOUT
// =============================================================================

/**
 * @brief Chunk record layout
 *
 * Format in file:
 *   .long length     // payload byte count, big-endian
 *   .byt  type[4]    // ASCII letters
 *   .byt  data[...]  // `length` payload bytes
 *   .long crc        // CRC-32 over type ++ data, big-endian
 */
constexpr size_t CHUNK_LENGTH_SIZE = 4;
constexpr size_t CHUNK_TYPE_SIZE = 4;
constexpr size_t CHUNK_CRC_SIZE = 4;

constexpr size_t CHUNK_LENGTH_OFFSET = 0;
constexpr size_t CHUNK_TYPE_OFFSET = CHUNK_LENGTH_OFFSET + CHUNK_LENGTH_SIZE;
constexpr size_t CHUNK_DATA_OFFSET = CHUNK_TYPE_OFFSET + CHUNK_TYPE_SIZE;

/**
 * @brief Fixed bytes around the payload (length + type + crc)
 *
 * This is also the size of the smallest legal chunk, one with an empty
 * payload such as IEND.
 */
constexpr size_t CHUNK_OVERHEAD = CHUNK_LENGTH_SIZE + CHUNK_TYPE_SIZE + CHUNK_CRC_SIZE;

// =============================================================================
// CHUNK TYPE PROPERTY BITS
// =============================================================================

/**
 * @brief Property bit inside each type byte
 *
 * Bit 5 of an ASCII letter is the lowercase bit: uppercase letters have it
 * clear, lowercase letters have it set. Each of the four type bytes uses it
 * for a different flag.
 */
constexpr uint8_t PROPERTY_BIT = 5;

/**
 * @brief Which type byte carries which property
 *
 *   ANCILLARY    byte 0, set   -> ancillary, clear -> critical
 *   PRIVATE      byte 1, set   -> private,   clear -> public
 *   RESERVED     byte 2, must be clear in conforming files
 *   SAFE_TO_COPY byte 3, set   -> safe to copy, clear -> unsafe
 */
enum class PropertyByte : size_t {
    ANCILLARY    = 0,
    PRIVATE      = 1,
    RESERVED     = 2,
    SAFE_TO_COPY = 3
};

/**
 * @brief Read the property bit of one type byte
 */
constexpr inline bool property_bit(const std::array<uint8_t, CHUNK_TYPE_SIZE>& type, PropertyByte which) noexcept {
    return ((type[static_cast<size_t>(which)] >> PROPERTY_BIT) & 1) == 1;
}

/**
 * @brief Type codes are restricted to A-Z and a-z
 */
constexpr inline bool is_type_letter(uint8_t byte) noexcept {
    return (byte >= 'A' && byte <= 'Z') || (byte >= 'a' && byte <= 'z');
}

// =============================================================================
// BIG-ENDIAN HELPERS
// =============================================================================

/**
 * @brief Decode a big-endian u32
 * PRECONDITION: bytes.size() >= 4
 */
constexpr inline uint32_t read_u32_be(std::span<const uint8_t> bytes) noexcept {
    return (static_cast<uint32_t>(bytes[0]) << 24) |
           (static_cast<uint32_t>(bytes[1]) << 16) |
           (static_cast<uint32_t>(bytes[2]) << 8) |
           static_cast<uint32_t>(bytes[3]);
}

inline void write_u32_be(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

} // namespace png

// =============================================================================
// STATIC ASSERTIONS FOR LAYOUT
// =============================================================================

static_assert(png::CHUNK_OVERHEAD == 12,
    "A chunk carries 12 bytes of framing (4 length + 4 type + 4 crc)");

static_assert(png::CHUNK_DATA_OFFSET == 8,
    "Chunk payload starts after the length and type fields");

#endif // PNGME_PNG_FORMAT_HPP
