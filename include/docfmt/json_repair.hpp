#pragma once

/**
 * @file json_repair.hpp
 * @brief Heuristic repair of informal JSON text
 *
 * Repairs are text-level rewrites applied before the strict parser gets a
 * second look at a document. They never report positions and never throw;
 * success is not guaranteed and the caller must re-parse the result.
 *
 * Steps (in order):
 * - strip // line comments
 * - strip block comments
 * - drop trailing commas before } or ]
 * - convert 'single quoted' spans to "double quoted"
 * - drop trailing commas again
 *
 * Known limitations:
 * - Without quote_aware_comments, comment markers inside string literals
 *   are stripped as well ("http://x" loses its tail).
 * - Apostrophes outside quoted spans are taken as string delimiters.
 */

#include <string>
#include <string_view>

namespace docfmt::json {

struct RepairOptions
{
    /// Skip over "double quoted" literals when looking for comments
    bool quote_aware_comments{false};
};

struct RepairReport
{
    std::string text;  ///< Repaired text (original text if repair emptied it)
    bool stripped_line_comments{false};
    bool stripped_block_comments{false};
    bool dropped_trailing_commas{false};
    bool converted_single_quotes{false};
    bool reverted{false};  ///< Result was blank; original text returned

    [[nodiscard]] bool changed_steps() const noexcept
    {
        return stripped_line_comments || stripped_block_comments || dropped_trailing_commas
               || converted_single_quotes;
    }
};

/**
 * Repair text and return the rewritten document.
 */
[[nodiscard]] std::string repair_json(std::string_view text, const RepairOptions& options = {});

/**
 * Like repair_json(), but also reports which steps rewrote the text.
 */
[[nodiscard]] RepairReport repair_json_ex(std::string_view text,
                                          const RepairOptions& options = {});

// Individual steps

[[nodiscard]] std::string strip_line_comments(std::string_view text, bool quote_aware = false);
[[nodiscard]] std::string strip_block_comments(std::string_view text, bool quote_aware = false);
[[nodiscard]] std::string drop_trailing_commas(std::string_view text);
[[nodiscard]] std::string convert_single_quotes(std::string_view text);

}  // namespace docfmt::json
