#include "png.hpp"
#include "errors.hpp"
#include <algorithm>
#include <sstream>

namespace pngme {

Png Png::parse(std::span<const uint8_t> bytes)
{
    if (bytes.size() < png::SIGNATURE_SIZE ||
        !std::equal(png::SIGNATURE.begin(), png::SIGNATURE.end(), bytes.begin())) {
        throw FormatError(FormatError::Kind::BadSignature, "not a PNG file (signature mismatch)");
    }

    std::vector<Chunk> chunks;
    size_t cursor = png::SIGNATURE_SIZE;

    while (cursor < bytes.size()) {
        const size_t remaining = bytes.size() - cursor;
        if (remaining < png::CHUNK_OVERHEAD) {
            throw FormatError(FormatError::Kind::TooShort,
                              "truncated chunk at offset " + std::to_string(cursor) + ", " +
                              std::to_string(remaining) + " bytes left",
                              png::CHUNK_OVERHEAD, remaining);
        }

        // Widen before adding the framing so a forged length cannot wrap
        const uint64_t recordSize = static_cast<uint64_t>(png::read_u32_be(bytes.subspan(cursor))) + png::CHUNK_OVERHEAD;
        if (recordSize > remaining) {
            throw FormatError(FormatError::Kind::TooShort,
                              "chunk at offset " + std::to_string(cursor) + " needs " +
                              std::to_string(recordSize) + " bytes, " + std::to_string(remaining) + " left",
                              recordSize, remaining);
        }

        chunks.push_back(Chunk::parse(bytes.subspan(cursor, static_cast<size_t>(recordSize))));
        cursor += static_cast<size_t>(recordSize);
    }

    return Png(std::move(chunks));
}

void Png::append_chunk(Chunk chunk)
{
    chunks_.push_back(std::move(chunk));
}

const Chunk* Png::find_chunk(std::string_view type) const
{
    auto it = std::find_if(chunks_.begin(), chunks_.end(), [&](const Chunk& c) {
        return c.chunk_type().to_string() == type;
    });
    return it == chunks_.end() ? nullptr : &*it;
}

Chunk Png::remove_chunk(std::string_view type)
{
    auto it = std::find_if(chunks_.begin(), chunks_.end(), [&](const Chunk& c) {
        return c.chunk_type().to_string() == type;
    });
    if (it == chunks_.end()) {
        throw NotFoundError(std::string(type));
    }

    Chunk removed = std::move(*it);
    chunks_.erase(it);
    return removed;
}

std::vector<uint8_t> Png::serialize() const
{
    std::vector<uint8_t> out(png::SIGNATURE.begin(), png::SIGNATURE.end());
    for (const auto& chunk : chunks_) {
        const auto bytes = chunk.serialize();
        out.insert(out.end(), bytes.begin(), bytes.end());
    }
    return out;
}

std::string Png::to_string() const
{
    std::ostringstream oss;
    oss << "Png { " << chunks_.size() << " chunks }\n";
    for (size_t i = 0; i < chunks_.size(); ++i) {
        oss << "  [" << i << "] " << chunks_[i] << "\n";
    }
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Png& png)
{
    return os << png.to_string();
}

} // namespace pngme
