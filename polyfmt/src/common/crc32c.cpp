#include "common/crc32c.hpp"

#include <fstream>
#include <iterator>

namespace polyfmt {

std::string crc32c_file(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        return {};
    }
    std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return {};
    }
    return crc32c_hex(bytes.data(), bytes.size());
}

} // namespace polyfmt
