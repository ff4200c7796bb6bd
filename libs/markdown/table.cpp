/**
 * @file table.cpp
 * @brief Pipe-table scanning, validation and aligned formatting
 */

#include "docfmt/common.hpp"
#include "docfmt/markdown.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <ranges>
#include <string>
#include <vector>

namespace docfmt::markdown {

namespace {

constexpr std::size_t kMinDashes = 3;

[[nodiscard]] bool has_pipe(std::string_view line) noexcept
{
    return line.find('|') != std::string_view::npos;
}

[[nodiscard]] bool continues_table(std::string_view line) noexcept
{
    return has_pipe(line) && !common::is_blank(line);
}

[[nodiscard]] std::string render_row(const Row& row, const std::vector<std::size_t>& widths)
{
    std::string out = "|";
    for (auto [i, cell] : std::views::enumerate(row)) {
        const auto width = widths[static_cast<std::size_t>(i)];
        const auto length = common::utf8_length(cell);
        out.push_back(' ');
        out += cell;
        if (length < width) {
            out.append(width - length, ' ');
        }
        out += " |";
    }
    return out;
}

[[nodiscard]] std::string render_separator(const std::vector<std::size_t>& widths)
{
    std::string out = "|";
    for (const auto width : widths) {
        out.push_back(' ');
        out.append(std::max(kMinDashes, width), '-');
        out += " |";
    }
    return out;
}

}  // namespace

// ============================================================================
// Line predicates
// ============================================================================

bool is_separator_candidate(std::string_view line) noexcept
{
    return has_pipe(line) && line.find("---") != std::string_view::npos;
}

bool is_alignment_marker(std::string_view segment) noexcept
{
    std::size_t pos = 0;
    if (pos < segment.size() && segment[pos] == ':') {
        ++pos;
    }
    const std::size_t dashes_begin = pos;
    while (pos < segment.size() && segment[pos] == '-') {
        ++pos;
    }
    if (pos - dashes_begin < kMinDashes) {
        return false;
    }
    if (pos < segment.size() && segment[pos] == ':') {
        ++pos;
    }
    return pos == segment.size();
}

Row split_cells(std::string_view line)
{
    auto body = common::trim(line);
    if (body.starts_with('|')) {
        body.remove_prefix(1);
    }
    if (body.ends_with('|')) {
        body.remove_suffix(1);
    }
    Row cells;
    std::size_t start = 0;
    while (true) {
        const auto bar = body.find('|', start);
        cells.emplace_back(common::trim(body.substr(start, bar - start)));
        if (bar == std::string_view::npos) {
            break;
        }
        start = bar + 1;
    }
    return cells;
}

// ============================================================================
// Scanner
// ============================================================================

std::optional<TableBlock> TableScanner::next_block(std::size_t pos) const
{
    const std::size_t n = m_lines.size();
    for (std::size_t i = pos; i + 1 < n; ++i) {
        if (!has_pipe(m_lines[i]) || !is_separator_candidate(m_lines[i + 1])) {
            continue;
        }
        std::size_t end = i + 2;
        while (end < n && continues_table(m_lines[end])) {
            ++end;
        }
        return TableBlock{.start = i, .end = end};
    }
    return std::nullopt;
}

TableScanner::Iterator TableScanner::begin() const
{
    return Iterator(m_lines, next_block(0));
}

TableScanner::Iterator& TableScanner::Iterator::operator++()
{
    if (m_current) {
        m_current = TableScanner(m_lines).next_block(m_current->end);
    }
    return *this;
}

std::vector<TableBlock> find_tables(std::span<const std::string> lines)
{
    std::vector<TableBlock> blocks;
    for (const auto& block : TableScanner(lines)) {
        blocks.push_back(block);
    }
    return blocks;
}

// ============================================================================
// Parse / validate / format
// ============================================================================

TableRows parse_table_block(std::span<const std::string> block)
{
    TableRows table;
    if (block.size() < 2) {
        return table;
    }
    table.rows.push_back(split_cells(block[0]));
    table.separator = std::string(common::trim(block[1]));
    for (const auto& line : block.subspan(2)) {
        table.rows.push_back(split_cells(line));
    }
    return table;
}

TableCheck validate_table(const std::vector<Row>& rows, std::string_view separator)
{
    if (rows.empty()) {
        return TableCheck{.valid = false, .message = "Empty table"};
    }
    const std::size_t ncols = rows.front().size();
    for (auto [idx, row] : std::views::enumerate(rows)) {
        if (row.size() != ncols) {
            return TableCheck{
                .valid = false,
                .message = std::format(
                    "Row {} has {} columns; expected {}", idx + 1, row.size(), ncols)};
        }
    }
    const Row segments = split_cells(separator);
    if (segments.size() != ncols) {
        return TableCheck{
            .valid = false,
            .message =
                std::format("Separator has {} columns; expected {}", segments.size(), ncols)};
    }
    for (const auto& segment : segments) {
        if (!is_alignment_marker(segment)) {
            return TableCheck{
                .valid = false,
                .message = std::format(
                    "Separator segment '{}' is not a valid alignment marker (--- or :---:)",
                    segment)};
        }
    }
    return TableCheck{.valid = true, .message = "Table looks valid"};
}

std::vector<std::size_t> column_widths(const std::vector<Row>& rows)
{
    std::vector<std::size_t> widths;
    for (const auto& row : rows) {
        if (row.size() > widths.size()) {
            widths.resize(row.size(), 0);
        }
        for (auto [i, cell] : std::views::enumerate(row)) {
            auto& width = widths[static_cast<std::size_t>(i)];
            width = std::max(width, common::utf8_length(cell));
        }
    }
    return widths;
}

std::vector<std::string> format_table(const std::vector<Row>& rows)
{
    std::vector<std::string> lines;
    if (rows.empty()) {
        return lines;
    }
    const auto widths = column_widths(rows);
    // The separator follows the header's column count.
    const std::vector<std::size_t> header_widths(
        widths.begin(), widths.begin() + static_cast<std::ptrdiff_t>(rows.front().size()));

    lines.reserve(rows.size() + 1);
    lines.push_back(render_row(rows.front(), widths));
    lines.push_back(render_separator(header_widths));
    for (const auto& row : rows | std::views::drop(1)) {
        lines.push_back(render_row(row, widths));
    }
    return lines;
}

std::vector<std::string> format_tables(const std::vector<std::string>& lines)
{
    std::vector<std::string> out;
    out.reserve(lines.size());
    const std::span<const std::string> all(lines);
    std::size_t copied = 0;
    for (const auto& block : TableScanner(all)) {
        out.insert(out.end(), lines.begin() + static_cast<std::ptrdiff_t>(copied),
                   lines.begin() + static_cast<std::ptrdiff_t>(block.start));
        const auto source = all.subspan(block.start, block.size());
        const auto table = parse_table_block(source);
        if (validate_table(table.rows, table.separator).valid) {
            std::ranges::move(format_table(table.rows), std::back_inserter(out));
        } else {
            out.insert(out.end(), source.begin(), source.end());
        }
        copied = block.end;
    }
    out.insert(out.end(), lines.begin() + static_cast<std::ptrdiff_t>(copied), lines.end());
    return out;
}

}  // namespace docfmt::markdown
