/**
 * @file file_io.cpp
 * @brief Whole-file read and write helpers
 */

#include "reposlice/common.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace reposlice::common {

reposlice::Result<std::string> read_text_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(Error::make("IOError", "Failed to open file: " + path));
    }
    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        return std::unexpected(Error::make("IOError", "Failed to read file: " + path));
    }
    return content;
}

reposlice::VoidResult write_text_file(const std::string& path, std::string_view content)
{
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return std::unexpected(Error::make(
                "IOError", "Failed to create directory " + target.parent_path().string() + ": " + ec.message()));
        }
    }
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(Error::make("IOError", "Failed to open output file: " + path));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
        return std::unexpected(Error::make("IOError", "Failed to write output file: " + path));
    }
    return {};
}

}  // namespace reposlice::common
