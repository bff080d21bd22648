#pragma once
#include "chunk.hpp"
#include "png_format.hpp"
#include <cstdint>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pngme {

/**
 * @brief A PNG file seen as signature + ordered chunk list
 *
 * Chunk order is file order and is preserved by every operation. Nothing
 * about the meaning of individual chunk types is enforced.
 */
class Png
{
public:
    Png() = default;
    explicit Png(std::vector<Chunk> chunks) : chunks_(std::move(chunks)) {}

    /**
     * Parse a whole file.
     * @throws FormatError if the signature is wrong or any chunk is bad
     * @throws ValidationError if a chunk type contains non-letters
     */
    static Png parse(std::span<const uint8_t> bytes);

    void append_chunk(Chunk chunk);

    // First chunk whose type is `type`, or nullptr.
    const Chunk* find_chunk(std::string_view type) const;

    /**
     * Remove the first chunk whose type is `type`.
     * @throws NotFoundError if there is none
     */
    Chunk remove_chunk(std::string_view type);

    const std::vector<Chunk>& chunks() const { return chunks_; }

    std::vector<uint8_t> serialize() const;

    std::string to_string() const;

    bool operator==(const Png& other) const = default;

private:
    std::vector<Chunk> chunks_;
};

std::ostream& operator<<(std::ostream& os, const Png& png);

} // namespace pngme
