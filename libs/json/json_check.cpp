/**
 * @file json_check.cpp
 * @brief Strict JSON diagnostics and canonical pretty-printing
 */

#include "docfmt/json_check.hpp"

#include <algorithm>
#include <cstddef>
#include <format>
#include <optional>
#include <string>

namespace docfmt::json {

namespace {

constexpr std::string_view kValidMessage = "Valid JSON";

/**
 * @brief SAX pass that stops at the first integer literal stored as a double
 *
 * nlohmann falls back to number_float for integers that overflow 64 bits;
 * such a lexeme has no fraction or exponent.
 */
class IntegerOverflowScan final : public nlohmann::json_sax<OrderedJson>
{
public:
    bool null() override { return true; }
    bool boolean(bool /*val*/) override { return true; }
    bool number_integer(number_integer_t /*val*/) override { return true; }
    bool number_unsigned(number_unsigned_t /*val*/) override { return true; }

    bool number_float(number_float_t /*val*/, const string_t& lexeme) override
    {
        if (lexeme.find_first_of(".eE") != string_t::npos) {
            return true;
        }
        m_overflow = lexeme;
        return false;
    }

    bool string(string_t& /*val*/) override { return true; }
    bool binary(binary_t& /*val*/) override { return true; }
    bool start_object(std::size_t /*elements*/) override { return true; }
    bool key(string_t& /*val*/) override { return true; }
    bool end_object() override { return true; }
    bool start_array(std::size_t /*elements*/) override { return true; }
    bool end_array() override { return true; }

    bool parse_error(std::size_t /*position*/,
                     const std::string& /*last_token*/,
                     const nlohmann::json::exception& /*ex*/) override
    {
        return false;
    }

    [[nodiscard]] const std::optional<std::string>& overflow() const noexcept
    {
        return m_overflow;
    }

private:
    std::optional<std::string> m_overflow;
};

[[nodiscard]] bool is_number_char(char c) noexcept
{
    return (c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E';
}

/**
 * @brief Byte offset of a number literal, skipping string literals
 */
[[nodiscard]] std::size_t find_number_literal(std::string_view text,
                                              std::string_view lexeme) noexcept
{
    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '"') {
            ++i;
            while (i < text.size() && text[i] != '"') {
                i += text[i] == '\\' ? 2 : 1;
            }
            ++i;
            continue;
        }
        if ((i == 0 || !is_number_char(text[i - 1])) && text.substr(i).starts_with(lexeme)) {
            return i;
        }
        ++i;
    }
    return 0;
}

[[nodiscard]] std::optional<JsonError> find_integer_overflow(std::string_view text)
{
    IntegerOverflowScan scan;
    if (OrderedJson::sax_parse(text.begin(), text.end(), &scan) || !scan.overflow()) {
        return std::nullopt;
    }
    const auto& lexeme = *scan.overflow();
    const auto [line, column] = line_column_at(text, find_number_literal(text, lexeme));
    return JsonError{.message = std::format("Integer {} does not fit in 64 bits", lexeme),
                     .line = line,
                     .column = column};
}

/**
 * @brief Drop the exception id and the position preamble from a parser message
 *
 * "[json.exception.parse_error.101] parse error at line 1, column 9: syntax error ..."
 * becomes "syntax error ...".
 */
[[nodiscard]] std::string native_message(std::string_view what)
{
    if (what.starts_with("[json.exception.")) {
        if (const auto close = what.find("] "); close != std::string_view::npos) {
            what.remove_prefix(close + 2);
        }
    }
    if (what.starts_with("parse error")) {
        if (const auto colon = what.find(": "); colon != std::string_view::npos) {
            what.remove_prefix(colon + 2);
        }
    }
    return std::string(what);
}

}  // namespace

std::string JsonError::located_message() const
{
    return std::format("{} (line {} column {})", message, line, column);
}

std::string JsonError::describe() const
{
    return "JSONDecodeError: " + located_message();
}

std::pair<std::size_t, std::size_t> line_column_at(std::string_view text,
                                                   std::size_t offset) noexcept
{
    offset = std::min(offset, text.size());
    const auto head = text.substr(0, offset);
    const auto line = static_cast<std::size_t>(std::ranges::count(head, '\n')) + 1;
    const auto newline = head.rfind('\n');
    const std::size_t line_start = newline == std::string_view::npos ? 0 : newline + 1;
    return {line, common::utf8_length(head.substr(line_start)) + 1};
}

ParseResult<OrderedJson> parse_strict(std::string_view text)
{
    try {
        auto value = OrderedJson::parse(text.begin(), text.end());
        if (auto overflow = find_integer_overflow(text)) {
            return std::unexpected(*std::move(overflow));
        }
        return value;
    } catch (const nlohmann::json::parse_error& ex) {
        // byte is the 1-based count of characters read, the failing one included.
        const std::size_t offset = ex.byte == 0 ? 0 : ex.byte - 1;
        const auto [line, column] = line_column_at(text, offset);
        return std::unexpected(
            JsonError{.message = native_message(ex.what()), .line = line, .column = column});
    } catch (const nlohmann::json::exception& ex) {
        // Number overflow and similar carry no position.
        return std::unexpected(
            JsonError{.message = native_message(ex.what()), .line = 1, .column = 1});
    }
}

JsonCheck check_json(std::string_view text)
{
    auto parsed = parse_strict(text);
    if (parsed) {
        return JsonCheck{
            .valid = true, .message = std::string(kValidMessage), .error = std::nullopt};
    }
    return JsonCheck{.valid = false, .message = parsed.error().describe(), .error = parsed.error()};
}

std::string pretty_print(const OrderedJson& value, int indent)
{
    return value.dump(indent, ' ', false, OrderedJson::error_handler_t::strict);
}

JsonFormatOutcome format_json(std::string_view text, const FormatOptions& options)
{
    auto parsed = parse_strict(text);
    if (parsed) {
        return JsonFormatOutcome{.status = FormatStatus::kFormatted,
                                 .text = pretty_print(*parsed, options.indent),
                                 .error = std::nullopt};
    }
    if (!options.auto_repair) {
        return JsonFormatOutcome{
            .status = FormatStatus::kFailed, .text = std::string{}, .error = parsed.error()};
    }

    // Exactly one repair attempt.
    auto repaired = parse_strict(repair_json(text, options.repair));
    if (!repaired) {
        return JsonFormatOutcome{
            .status = FormatStatus::kFailed, .text = std::string{}, .error = parsed.error()};
    }
    return JsonFormatOutcome{.status = FormatStatus::kRepaired,
                             .text = pretty_print(*repaired, options.indent),
                             .error = parsed.error()};
}

}  // namespace docfmt::json
