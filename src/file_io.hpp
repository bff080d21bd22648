#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace pngme {

/**
 * Read a whole file as raw bytes.
 * @throws IOError if the file does not exist or cannot be read
 */
std::vector<uint8_t> read_all(const std::string& path);

/**
 * Create or truncate `path` and write `bytes` to it.
 * @throws IOError if the file cannot be opened or written
 */
void write_all(const std::string& path, const std::vector<uint8_t>& bytes);

} // namespace pngme
