#pragma once
#include "chunk.hpp"
#include <string>

namespace pngme {

// Append a `type` chunk carrying `message` to `src` and write the result to `dst`.
void encode(const std::string& src, const std::string& dst,
            const std::string& type, const std::string& message);

// Text of the first `type` chunk in `src`. Throws NotFoundError if absent.
std::string decode(const std::string& src, const std::string& type);

// Drop the first `type` chunk from `src` and rewrite `src`. The file is left
// untouched when anything fails.
Chunk remove(const std::string& src, const std::string& type);

// Every chunk of `src`, rendered.
std::string print(const std::string& src);

} // namespace pngme
