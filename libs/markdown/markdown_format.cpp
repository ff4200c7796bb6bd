/**
 * @file markdown_format.cpp
 * @brief Whole-document Markdown validation and formatting
 */

#include "docfmt/common.hpp"
#include "docfmt/markdown.hpp"

#include <span>
#include <string>
#include <utility>
#include <vector>

namespace docfmt::markdown {

std::string format_markdown(std::string_view text, const FormatOptions& options)
{
    const auto lines = common::split_lines(text);
    const auto normalized = normalize_headings(lines, options);
    const auto formatted = format_tables(normalized);

    std::string out(common::trim_right(common::join_lines(formatted)));
    out.push_back('\n');
    return out;
}

std::vector<TableIssue> validate_markdown(std::string_view text)
{
    const auto lines = common::split_lines(text);
    const std::span<const std::string> all(lines);

    std::vector<TableIssue> issues;
    for (const auto& block : TableScanner(all)) {
        const auto table = parse_table_block(all.subspan(block.start, block.size()));
        auto check = validate_table(table.rows, table.separator);
        if (!check.valid) {
            issues.push_back(TableIssue{.start_line = block.start + 1,
                                        .end_line = block.end,
                                        .message = std::move(check.message)});
        }
    }
    return issues;
}

}  // namespace docfmt::markdown
