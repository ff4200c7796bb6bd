#pragma once

/**
 * @file config.hpp
 * @brief Formatting configuration loaded from a JSON file
 *
 * @code{.json}
 * {
 *   "json": { "indent": 2, "auto_repair": true, "quote_aware_comments": false },
 *   "markdown": { "blank_line_after_heading": true }
 * }
 * @endcode
 *
 * Every key is optional; unknown keys are rejected.
 */

#include "docfmt/common.hpp"
#include "docfmt/json_check.hpp"
#include "docfmt/markdown.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>

namespace docfmt::config {

constexpr int kMaxIndent = 16;

struct Config
{
    docfmt::json::FormatOptions json{};
    docfmt::markdown::FormatOptions markdown{};
};

/**
 * Build a Config from an already parsed document.
 * @return Config or ConfigInvalid
 */
[[nodiscard]] docfmt::Result<Config> parse_config(const nlohmann::json& j);

/**
 * Read and parse a configuration file.
 * @return Config, IOError, ConfigParseFailed or ConfigInvalid
 */
[[nodiscard]] docfmt::Result<Config> load_config(const std::filesystem::path& path);

}  // namespace docfmt::config
