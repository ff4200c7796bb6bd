/**
 * @file text.cpp
 * @brief Line splitting, trimming and UTF-8 width helpers
 */

#include "docfmt/common.hpp"

#include <algorithm>
#include <ranges>
#include <string>
#include <vector>

namespace docfmt::common {

std::vector<std::string> split_lines(std::string_view text)
{
    std::vector<std::string> lines;
    std::size_t start = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const char c = text[pos];
        if (c == '\n' || c == '\r') {
            lines.emplace_back(text.substr(start, pos - start));
            if (c == '\r' && pos + 1 < text.size() && text[pos + 1] == '\n') {
                ++pos;
            }
            ++pos;
            start = pos;
            continue;
        }
        ++pos;
    }
    if (start < text.size()) {
        lines.emplace_back(text.substr(start));
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines)
{
    std::string out;
    for (auto [i, line] : std::views::enumerate(lines)) {
        if (i != 0) {
            out.push_back('\n');
        }
        out += line;
    }
    return out;
}

std::string_view trim_left(std::string_view text) noexcept
{
    const auto first = std::ranges::find_if_not(text, is_space);
    return text.substr(static_cast<std::size_t>(std::ranges::distance(text.begin(), first)));
}

std::string_view trim_right(std::string_view text) noexcept
{
    std::size_t end = text.size();
    while (end > 0 && is_space(text[end - 1])) {
        --end;
    }
    return text.substr(0, end);
}

std::string_view trim(std::string_view text) noexcept
{
    return trim_right(trim_left(text));
}

bool is_blank(std::string_view text) noexcept
{
    return std::ranges::all_of(text, is_space);
}

std::size_t utf8_length(std::string_view text) noexcept
{
    return static_cast<std::size_t>(std::ranges::count_if(text, [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0U) != 0x80U;
    }));
}

}  // namespace docfmt::common
