#include "file_io.hpp"
#include "errors.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

namespace pngme {

std::vector<uint8_t> read_all(const std::string& path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw IOError("File not found", path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOError("Could not open file", path);
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw IOError("Could not read file", path);
    }
    return bytes;
}

void write_all(const std::string& path, const std::vector<uint8_t>& bytes)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw IOError("Could not open file for writing", path);
    }

    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    file.flush();
    if (!file) {
        throw IOError("Could not write file", path);
    }
}

} // namespace pngme
