#pragma once

/**
 * @file markdown.hpp
 * @brief Markdown heading normalization and pipe-table handling
 *
 * Only ATX headings and pipe tables are recognized; every other line passes
 * through untouched apart from trailing-whitespace trimming on format.
 */

#include <cstddef>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace docfmt::markdown {

using Row = std::vector<std::string>;

/**
 * @brief Half-open line range [start, end) holding a pipe table
 */
struct TableBlock
{
    std::size_t start;
    std::size_t end;

    [[nodiscard]] std::size_t size() const noexcept { return end - start; }

    bool operator==(const TableBlock&) const = default;
};

/**
 * @brief Table block split into cells
 *
 * rows[0] is the header; rows[1..] are the data rows. The separator line is
 * kept verbatim (trimmed) and checked separately.
 */
struct TableRows
{
    std::vector<Row> rows;
    std::string separator;
};

struct TableCheck
{
    bool valid;
    std::string message;
};

/**
 * @brief Invalid table found by validate_markdown()
 */
struct TableIssue
{
    std::size_t start_line;  ///< 1-based first line
    std::size_t end_line;    ///< 1-based last line (inclusive)
    std::string message;
};

struct FormatOptions
{
    bool blank_line_after_heading{true};
};

// ============================================================================
// Headings
// ============================================================================

/**
 * Rewrite "##Title" / "#   Title  " as "## Title" / "# Title".
 * Lines with no leading '#' or more than six pass through unchanged.
 */
[[nodiscard]] std::string normalize_heading(std::string_view line);

/**
 * True for 1-6 '#' followed by whitespace (a normalized heading).
 */
[[nodiscard]] bool is_heading(std::string_view line) noexcept;

/**
 * First pass of format_markdown(): normalize headings and trim trailing
 * whitespace. A blank line is inserted after a heading whose next source
 * line is not blank.
 */
[[nodiscard]] std::vector<std::string> normalize_headings(const std::vector<std::string>& lines,
                                                          const FormatOptions& options = {});

// ============================================================================
// Tables
// ============================================================================

/**
 * Line that may open a table body: contains '|' and a run of three dashes.
 * Marker syntax is checked by validate_table(), not here.
 */
[[nodiscard]] bool is_separator_candidate(std::string_view line) noexcept;

/**
 * Exact separator segment syntax: optional ':', 3+ '-', optional ':'.
 */
[[nodiscard]] bool is_alignment_marker(std::string_view segment) noexcept;

/**
 * Trim, strip one leading and one trailing '|', split on '|', trim cells.
 */
[[nodiscard]] Row split_cells(std::string_view line);

/**
 * @brief Lazy forward scan over the table blocks of a line sequence
 *
 * Blocks are greedy, never overlap and span at least two lines. Each
 * begin() restarts the scan from the first line.
 *
 * @code
 * for (const auto& block : TableScanner(lines)) { ... }
 * @endcode
 */
class TableScanner
{
public:
    class Iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = TableBlock;
        using difference_type = std::ptrdiff_t;
        using pointer = const TableBlock*;
        using reference = const TableBlock&;

        Iterator() = default;

        [[nodiscard]] reference operator*() const { return *m_current; }
        [[nodiscard]] pointer operator->() const { return &*m_current; }

        Iterator& operator++();
        void operator++(int) { ++*this; }

        [[nodiscard]] friend bool operator==(const Iterator& it, std::default_sentinel_t) noexcept
        {
            return !it.m_current.has_value();
        }

    private:
        friend class TableScanner;
        Iterator(std::span<const std::string> lines, std::optional<TableBlock> current)
            : m_lines(lines)
            , m_current(current)
        {}

        std::span<const std::string> m_lines{};
        std::optional<TableBlock> m_current{};
    };

    explicit TableScanner(std::span<const std::string> lines) noexcept
        : m_lines(lines)
    {}

    [[nodiscard]] Iterator begin() const;
    [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

    /**
     * First block starting at or after line pos, if any.
     */
    [[nodiscard]] std::optional<TableBlock> next_block(std::size_t pos) const;

private:
    std::span<const std::string> m_lines;
};

/**
 * All table blocks of a document, in order.
 */
[[nodiscard]] std::vector<TableBlock> find_tables(std::span<const std::string> lines);

/**
 * Split a block's lines into header, separator and data rows.
 * Blocks shorter than two lines yield no rows.
 */
[[nodiscard]] TableRows parse_table_block(std::span<const std::string> block);

/**
 * Check column counts and separator syntax.
 */
[[nodiscard]] TableCheck validate_table(const std::vector<Row>& rows, std::string_view separator);

/**
 * Widest cell per column in code points, header included.
 */
[[nodiscard]] std::vector<std::size_t> column_widths(const std::vector<Row>& rows);

/**
 * Re-emit rows as an aligned table: header, separator, data rows.
 */
[[nodiscard]] std::vector<std::string> format_table(const std::vector<Row>& rows);

/**
 * Second pass of format_markdown(): replace every valid table block with its
 * aligned rendering. Invalid blocks are kept verbatim.
 */
[[nodiscard]] std::vector<std::string> format_tables(const std::vector<std::string>& lines);

// ============================================================================
// Documents
// ============================================================================

/**
 * Heading pass, table pass, then join with exactly one trailing newline.
 */
[[nodiscard]] std::string format_markdown(std::string_view text, const FormatOptions& options = {});

/**
 * Every structurally invalid table in the document (no heading pass).
 */
[[nodiscard]] std::vector<TableIssue> validate_markdown(std::string_view text);

}  // namespace docfmt::markdown
