/**
 * @file json_repair.cpp
 * @brief Heuristic repair of informal JSON text
 */

#include "docfmt/json_repair.hpp"

#include "docfmt/common.hpp"

#include <optional>
#include <string>
#include <utility>

namespace docfmt::json {

namespace {

/**
 * @brief Index one past the closing quote of the literal starting at pos
 *
 * Returns text.size() for an unterminated literal.
 */
[[nodiscard]] std::size_t skip_string_literal(std::string_view text, std::size_t pos) noexcept
{
    std::size_t i = pos + 1;
    while (i < text.size()) {
        if (text[i] == '\\') {
            i += 2;
            continue;
        }
        if (text[i] == '"') {
            return i + 1;
        }
        ++i;
    }
    return text.size();
}

/**
 * @brief Closing quote of the single-quoted span starting at pos
 *
 * A backslash consumes the following character, except a line break,
 * which ends the attempt.
 */
[[nodiscard]] std::optional<std::size_t> find_single_quote_end(std::string_view text,
                                                               std::size_t pos) noexcept
{
    std::size_t i = pos + 1;
    while (i < text.size()) {
        const char c = text[i];
        if (c == '\'') {
            return i;
        }
        if (c == '\\') {
            if (i + 1 >= text.size() || text[i + 1] == '\n') {
                return std::nullopt;
            }
            i += 2;
            continue;
        }
        ++i;
    }
    return std::nullopt;
}

[[nodiscard]] std::string escape_double_quotes(std::string_view inner)
{
    std::string out;
    out.reserve(inner.size());
    for (char c : inner) {
        if (c == '"') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

// Applies a step and records whether it rewrote the text.
template <typename Step>
void apply_step(std::string& text, bool& changed, Step&& step)
{
    std::string next = std::forward<Step>(step)(text);
    if (next != text) {
        changed = true;
        text = std::move(next);
    }
}

}  // namespace

std::string strip_line_comments(std::string_view text, bool quote_aware)
{
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];
        if (quote_aware && c == '"') {
            const std::size_t end = skip_string_literal(text, i);
            out.append(text.substr(i, end - i));
            i = end;
            continue;
        }
        if (c == '/' && i + 1 < text.size() && text[i + 1] == '/') {
            const std::size_t newline = text.find('\n', i);
            i = newline == std::string_view::npos ? text.size() : newline;
            continue;
        }
        out.push_back(c);
        ++i;
    }
    return out;
}

std::string strip_block_comments(std::string_view text, bool quote_aware)
{
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];
        if (quote_aware && c == '"') {
            const std::size_t end = skip_string_literal(text, i);
            out.append(text.substr(i, end - i));
            i = end;
            continue;
        }
        if (c == '/' && i + 1 < text.size() && text[i + 1] == '*') {
            const std::size_t close = text.find("*/", i + 2);
            if (close == std::string_view::npos) {
                // Unterminated: nothing after this point can close either.
                out.append(text.substr(i));
                break;
            }
            i = close + 2;
            continue;
        }
        out.push_back(c);
        ++i;
    }
    return out;
}

std::string drop_trailing_commas(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == ',') {
            std::size_t j = i + 1;
            while (j < text.size() && common::is_space(text[j])) {
                ++j;
            }
            // Only the comma goes; the whitespace before the bracket stays.
            if (j < text.size() && (text[j] == '}' || text[j] == ']')) {
                ++i;
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

std::string convert_single_quotes(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '\'') {
            if (auto end = find_single_quote_end(text, i)) {
                out.push_back('"');
                out += escape_double_quotes(text.substr(i + 1, *end - i - 1));
                out.push_back('"');
                i = *end + 1;
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

RepairReport repair_json_ex(std::string_view text, const RepairOptions& options)
{
    RepairReport report;
    std::string work(text);

    apply_step(work, report.stripped_line_comments, [&options](const std::string& s) {
        return strip_line_comments(s, options.quote_aware_comments);
    });
    apply_step(work, report.stripped_block_comments, [&options](const std::string& s) {
        return strip_block_comments(s, options.quote_aware_comments);
    });
    apply_step(work, report.dropped_trailing_commas, [](const std::string& s) {
        return drop_trailing_commas(s);
    });
    apply_step(work, report.converted_single_quotes, [](const std::string& s) {
        return convert_single_quotes(s);
    });
    // Quote conversion can expose commas the first pass could not see.
    apply_step(work, report.dropped_trailing_commas, [](const std::string& s) {
        return drop_trailing_commas(s);
    });

    if (common::is_blank(work)) {
        report.text = std::string(text);
        report.reverted = true;
        return report;
    }
    report.text = std::move(work);
    return report;
}

std::string repair_json(std::string_view text, const RepairOptions& options)
{
    return repair_json_ex(text, options).text;
}

}  // namespace docfmt::json
