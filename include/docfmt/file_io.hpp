#pragma once

/**
 * @file file_io.hpp
 * @brief Whole-file text reading and writing
 */

#include "docfmt/common.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace docfmt::common {

/**
 * Read an entire file as bytes (expected UTF-8).
 * @return File contents or IOError
 */
[[nodiscard]] docfmt::Result<std::string> read_text_file(const std::filesystem::path& path);

/**
 * Replace the contents of a file.
 * @return Empty on success, IOError on failure
 */
[[nodiscard]] docfmt::VoidResult write_text_file(const std::filesystem::path& path,
                                                 std::string_view text);

}  // namespace docfmt::common
