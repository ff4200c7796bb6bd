#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: result types, line splitting, trimming
 */

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace docfmt {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

}  // namespace docfmt

namespace docfmt::common {

// ============================================================================
// Line Handling
// ============================================================================

/**
 * Split text into lines.
 * Accepts "\n", "\r\n" and "\r" as terminators. A trailing terminator does
 * not produce an extra empty line; empty text yields no lines.
 */
[[nodiscard]] std::vector<std::string> split_lines(std::string_view text);

/**
 * Join lines with "\n" (no trailing terminator)
 */
[[nodiscard]] std::string join_lines(const std::vector<std::string>& lines);

// ============================================================================
// Whitespace
// ============================================================================

[[nodiscard]] constexpr bool is_space(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

[[nodiscard]] std::string_view trim(std::string_view text) noexcept;
[[nodiscard]] std::string_view trim_left(std::string_view text) noexcept;
[[nodiscard]] std::string_view trim_right(std::string_view text) noexcept;

/**
 * True if the text is empty or whitespace only
 */
[[nodiscard]] bool is_blank(std::string_view text) noexcept;

// ============================================================================
// UTF-8
// ============================================================================

/**
 * Number of code points in a UTF-8 string (continuation bytes are skipped).
 * Used as the display width of table cells.
 */
[[nodiscard]] std::size_t utf8_length(std::string_view text) noexcept;

}  // namespace docfmt::common
