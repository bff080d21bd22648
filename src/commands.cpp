#include "commands.hpp"
#include "errors.hpp"
#include "file_io.hpp"
#include "png.hpp"

namespace pngme {

namespace {

Png load(const std::string& path)
{
    const auto bytes = read_all(path);
    return Png::parse(bytes);
}

} // namespace

void encode(const std::string& src, const std::string& dst,
            const std::string& type, const std::string& message)
{
    Png png = load(src);
    png.append_chunk(Chunk::from_strings(type, message));
    write_all(dst, png.serialize());
}

std::string decode(const std::string& src, const std::string& type)
{
    const Png png = load(src);
    const Chunk* chunk = png.find_chunk(type);
    if (!chunk) {
        throw NotFoundError(type);
    }
    return chunk->data_as_string();
}

Chunk remove(const std::string& src, const std::string& type)
{
    Png png = load(src);
    Chunk removed = png.remove_chunk(type);
    write_all(src, png.serialize());
    return removed;
}

std::string print(const std::string& src)
{
    return load(src).to_string();
}

} // namespace pngme
