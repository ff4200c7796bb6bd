/**
 * @file file_io.cpp
 * @brief Whole-file text reading and writing
 */

#include "docfmt/file_io.hpp"

#include <fstream>
#include <sstream>

namespace docfmt::common {

docfmt::Result<std::string> read_text_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(
            docfmt::Error::make("IOError", "Failed to open file: " + path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(
            docfmt::Error::make("IOError", "Failed to read file: " + path.string()));
    }
    return buffer.str();
}

docfmt::VoidResult write_text_file(const std::filesystem::path& path, std::string_view text)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(
            docfmt::Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!out) {
        return std::unexpected(
            docfmt::Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

}  // namespace docfmt::common
