/**
 * @file heading.cpp
 * @brief ATX heading normalization
 */

#include "docfmt/common.hpp"
#include "docfmt/markdown.hpp"

#include <string>
#include <vector>

namespace docfmt::markdown {

namespace {

constexpr std::size_t kMaxHeadingLevel = 6;

[[nodiscard]] std::size_t leading_hashes(std::string_view line) noexcept
{
    const auto count = line.find_first_not_of('#');
    return count == std::string_view::npos ? line.size() : count;
}

}  // namespace

std::string normalize_heading(std::string_view line)
{
    const std::size_t level = leading_hashes(line);
    if (level == 0 || level > kMaxHeadingLevel) {
        return std::string(line);
    }
    std::string out(level, '#');
    out.push_back(' ');
    out += common::trim(line.substr(level));
    return out;
}

bool is_heading(std::string_view line) noexcept
{
    const std::size_t level = leading_hashes(line);
    return level >= 1 && level <= kMaxHeadingLevel && level < line.size()
           && common::is_space(line[level]);
}

std::vector<std::string> normalize_headings(const std::vector<std::string>& lines,
                                            const FormatOptions& options)
{
    std::vector<std::string> out;
    out.reserve(lines.size());
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::string line = normalize_heading(lines[i]);
        if (is_heading(line)) {
            out.emplace_back(common::trim(line));
            // Looks at the source line, not the normalized one.
            if (options.blank_line_after_heading && i + 1 < lines.size()
                && !common::is_blank(lines[i + 1])) {
                out.emplace_back();
            }
            continue;
        }
        out.emplace_back(common::trim_right(line));
    }
    return out;
}

}  // namespace docfmt::markdown
