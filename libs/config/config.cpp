/**
 * @file config.cpp
 * @brief Formatting configuration loaded from a JSON file
 */

#include "docfmt/config.hpp"

#include "docfmt/file_io.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace docfmt::config {

namespace {

[[nodiscard]] docfmt::Error invalid(std::string message)
{
    return docfmt::Error::make("ConfigInvalid", std::move(message));
}

template <std::size_t N>
[[nodiscard]] docfmt::VoidResult reject_unknown_keys(const nlohmann::json& section,
                                                     std::string_view path,
                                                     const std::array<std::string_view, N>& known)
{
    for (const auto& [key, _] : section.items()) {
        if (std::ranges::find(known, std::string_view(key)) == known.end()) {
            return std::unexpected(invalid(std::format("Unknown config key: {}.{}", path, key)));
        }
    }
    return {};
}

[[nodiscard]] docfmt::VoidResult read_bool(const nlohmann::json& section,
                                           std::string_view path,
                                           std::string_view key,
                                           bool& target)
{
    const auto it = section.find(std::string(key));
    if (it == section.end()) {
        return {};
    }
    if (!it->is_boolean()) {
        return std::unexpected(invalid(std::format("{}.{} must be a boolean", path, key)));
    }
    target = it->get<bool>();
    return {};
}

[[nodiscard]] docfmt::VoidResult apply_json_section(const nlohmann::json& section,
                                                    docfmt::json::FormatOptions& options)
{
    if (!section.is_object()) {
        return std::unexpected(invalid("json must be an object"));
    }
    constexpr std::array<std::string_view, 3> kKnown = {
        "indent", "auto_repair", "quote_aware_comments"};
    if (auto result = reject_unknown_keys(section, "json", kKnown); !result) {
        return result;
    }
    if (const auto it = section.find("indent"); it != section.end()) {
        if (!it->is_number_integer()) {
            return std::unexpected(invalid("json.indent must be an integer"));
        }
        const auto indent = it->get<std::int64_t>();
        if (indent < 0 || indent > kMaxIndent) {
            return std::unexpected(
                invalid(std::format("json.indent must be between 0 and {}", kMaxIndent)));
        }
        options.indent = static_cast<int>(indent);
    }
    if (auto result = read_bool(section, "json", "auto_repair", options.auto_repair); !result) {
        return result;
    }
    return read_bool(
        section, "json", "quote_aware_comments", options.repair.quote_aware_comments);
}

[[nodiscard]] docfmt::VoidResult apply_markdown_section(const nlohmann::json& section,
                                                        docfmt::markdown::FormatOptions& options)
{
    if (!section.is_object()) {
        return std::unexpected(invalid("markdown must be an object"));
    }
    constexpr std::array<std::string_view, 1> kKnown = {"blank_line_after_heading"};
    if (auto result = reject_unknown_keys(section, "markdown", kKnown); !result) {
        return result;
    }
    return read_bool(
        section, "markdown", "blank_line_after_heading", options.blank_line_after_heading);
}

}  // namespace

docfmt::Result<Config> parse_config(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(invalid("Config root must be an object"));
    }
    Config config;
    for (const auto& [key, value] : j.items()) {
        if (key == "json") {
            if (auto result = apply_json_section(value, config.json); !result) {
                return std::unexpected(result.error());
            }
        } else if (key == "markdown") {
            if (auto result = apply_markdown_section(value, config.markdown); !result) {
                return std::unexpected(result.error());
            }
        } else {
            return std::unexpected(invalid("Unknown config key: " + key));
        }
    }
    return config;
}

docfmt::Result<Config> load_config(const std::filesystem::path& path)
{
    auto text = docfmt::common::read_text_file(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(*text);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(docfmt::Error::make(
            "ConfigParseFailed",
            "Failed to parse config file: " + path.string() + ": " + ex.what()));
    }
    return parse_config(payload);
}

}  // namespace docfmt::config
