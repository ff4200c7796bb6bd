/**
 * @file report.cpp
 * @brief Validate/format orchestration and console reports
 */

#include "docfmt/report.hpp"

#include "docfmt/file_io.hpp"
#include "docfmt/json_repair.hpp"
#include "docfmt/schema_validate.hpp"

#include <format>
#include <print>
#include <string>
#include <utility>
#include <vector>

namespace docfmt::report {

namespace {

void append_repair_hint(ReportOutput& output,
                        std::string_view text,
                        const docfmt::json::FormatOptions& options)
{
    const auto repair = docfmt::json::repair_json_ex(text, options.repair);
    if (repair.text == text) {
        return;
    }
    output.lines.emplace_back();
    output.lines.emplace_back("[HINT] Suggested repaired JSON (preview):");
    output.lines.emplace_back();
    auto parsed = docfmt::json::parse_strict(repair.text);
    if (!parsed) {
        output.lines.emplace_back("  (auto-repair failed to produce valid JSON)");
        return;
    }
    output.lines.push_back(docfmt::json::pretty_print(*parsed, options.indent));
}

[[nodiscard]] docfmt::Result<bool> check_schema(ReportOutput& output,
                                                std::string_view label,
                                                const docfmt::json::OrderedJson& value,
                                                const std::filesystem::path& schema_path)
{
    const nlohmann::json plain(value);
    auto violations = docfmt::common::check_against_schema(plain, schema_path);
    if (!violations) {
        return std::unexpected(violations.error());
    }
    if (violations->empty()) {
        return true;
    }
    output.lines.push_back(std::format("[ERR] {}: schema validation failed:", label));
    for (const auto& violation : *violations) {
        output.lines.push_back("  - " + violation.to_string());
    }
    return false;
}

}  // namespace

docfmt::Result<ReportOutput> validate_json_report(std::string_view label,
                                                  std::string_view text,
                                                  const JsonValidateOptions& options)
{
    ReportOutput output;
    auto parsed = docfmt::json::parse_strict(text);
    if (!parsed) {
        output.exit_code = kExitFailure;
        output.lines.push_back(std::format("[ERR] {}: {}", label, parsed.error().describe()));
        append_repair_hint(output, text, options.format);
        return output;
    }

    if (options.schema_path) {
        auto schema_ok = check_schema(output, label, *parsed, *options.schema_path);
        if (!schema_ok) {
            return std::unexpected(schema_ok.error());
        }
        if (!*schema_ok) {
            output.exit_code = kExitFailure;
            return output;
        }
    }
    output.lines.push_back(std::format("[OK] {}: Valid JSON", label));
    return output;
}

ReportOutput format_json_report(std::string_view text, const docfmt::json::FormatOptions& options)
{
    ReportOutput output;
    output.document_kind = "JSON";

    auto outcome = docfmt::json::format_json(text, options);
    if (outcome.error) {
        output.lines.push_back("[ERR] Cannot format: JSON invalid - "
                               + outcome.error->located_message());
    }
    switch (outcome.status) {
        case docfmt::json::FormatStatus::kFormatted:
            output.document = std::move(outcome.text) + "\n";
            break;
        case docfmt::json::FormatStatus::kRepaired:
            output.lines.emplace_back("[INFO] Auto-repair succeeded; formatting repaired JSON.");
            output.document = std::move(outcome.text) + "\n";
            break;
        case docfmt::json::FormatStatus::kFailed:
            output.lines.emplace_back(options.auto_repair
                                          ? "[ERR] Auto-repair failed; aborting format."
                                          : "[ERR] Auto-repair disabled; aborting format.");
            output.exit_code = kExitFailure;
            break;
    }
    return output;
}

ReportOutput validate_markdown_report(std::string_view label, std::string_view text)
{
    ReportOutput output;
    const auto issues = docfmt::markdown::validate_markdown(text);
    if (issues.empty()) {
        output.lines.push_back(std::format("[OK] No table structure issues found in {}", label));
        return output;
    }
    output.exit_code = kExitFailure;
    output.lines.emplace_back("[ERR] Markdown validation found issues:");
    for (const auto& issue : issues) {
        output.lines.push_back(std::format(
            "  - Table at lines {}-{} : {}", issue.start_line, issue.end_line, issue.message));
    }
    return output;
}

ReportOutput format_markdown_report(std::string_view text,
                                    const docfmt::markdown::FormatOptions& options)
{
    ReportOutput output;
    output.document_kind = "Markdown";
    output.document = docfmt::markdown::format_markdown(text, options);
    return output;
}

docfmt::VoidResult write_report(const ReportOutput& output,
                                const std::optional<std::filesystem::path>& output_path)
{
    for (const auto& line : output.lines) {
        std::println("{}", line);
    }
    if (!output.document) {
        return {};
    }
    if (output_path) {
        if (auto result = docfmt::common::write_text_file(*output_path, *output.document);
            !result) {
            return result;
        }
        std::println("[OK] Formatted {} saved to {}", output.document_kind, output_path->string());
        return {};
    }
    std::print("{}", *output.document);
    return {};
}

}  // namespace docfmt::report
