#pragma once

/**
 * @file json_check.hpp
 * @brief Strict JSON diagnostics and canonical pretty-printing
 *
 * nlohmann::ordered_json is the ground truth for JSON syntax: this module
 * only turns its failures into position-tagged messages and decides when a
 * single heuristic repair attempt is made before giving up.
 */

#include "docfmt/common.hpp"
#include "docfmt/json_repair.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace docfmt::json {

using OrderedJson = nlohmann::ordered_json;

/**
 * @brief Strict parse failure reported by the oracle parser
 */
struct JsonError
{
    std::string message;  ///< Parser message without exception id or position preamble
    std::size_t line;     ///< 1-based
    std::size_t column;   ///< 1-based

    /// "JSONDecodeError: <message> (line L column C)"
    [[nodiscard]] std::string describe() const;
    /// "<message> (line L column C)"
    [[nodiscard]] std::string located_message() const;
};

template <typename T>
using ParseResult = std::expected<T, JsonError>;

struct JsonCheck
{
    bool valid;
    std::string message;  ///< "Valid JSON" or JsonError::describe()
    std::optional<JsonError> error;
};

struct FormatOptions
{
    int indent{2};
    bool auto_repair{true};
    RepairOptions repair{};
};

enum class FormatStatus {
    kFormatted,  ///< Input was strict JSON
    kRepaired,   ///< Input parsed after one repair attempt
    kFailed      ///< Neither input nor repaired text parsed
};

struct JsonFormatOutcome
{
    FormatStatus status;
    std::string text;                ///< Pretty-printed document, empty on kFailed
    std::optional<JsonError> error;  ///< Parse error of the original input
};

/**
 * 1-based line and column of a byte offset (0-based) within text.
 * The column counts code points, not bytes.
 */
[[nodiscard]] std::pair<std::size_t, std::size_t> line_column_at(std::string_view text,
                                                                 std::size_t offset) noexcept;

/**
 * Strict parse preserving key order. Never throws.
 *
 * Integer literals outside the 64-bit range are rejected: the parser could
 * only keep them as doubles, and re-emitting those would change the number.
 */
[[nodiscard]] ParseResult<OrderedJson> parse_strict(std::string_view text);

/**
 * Diagnose text without attempting repair.
 */
[[nodiscard]] JsonCheck check_json(std::string_view text);

/**
 * Serialize with the given indentation; key order and non-ASCII characters
 * are kept as they are.
 */
[[nodiscard]] std::string pretty_print(const OrderedJson& value, int indent = 2);

/**
 * Parse and pretty-print, making at most one repair attempt.
 */
[[nodiscard]] JsonFormatOutcome format_json(std::string_view text,
                                            const FormatOptions& options = {});

}  // namespace docfmt::json
