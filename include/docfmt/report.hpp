#pragma once

/**
 * @file report.hpp
 * @brief Validate/format orchestration and console reports
 *
 * Each *_report() function is a pure function of the document text; the
 * printed diagnostics are collected in ReportOutput::lines and only
 * write_report() touches stdout or the filesystem.
 */

#include "docfmt/common.hpp"
#include "docfmt/json_check.hpp"
#include "docfmt/markdown.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docfmt::report {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;

struct ReportOutput
{
    int exit_code{kExitOk};
    std::vector<std::string> lines;       ///< Diagnostics, printed in order
    std::optional<std::string> document;  ///< Formatted text (format commands only)
    std::string document_kind;            ///< "JSON" or "Markdown"
};

struct JsonValidateOptions
{
    std::optional<std::filesystem::path> schema_path;
    docfmt::json::FormatOptions format{};
};

/**
 * Strict check of a JSON document, with a repaired preview on failure and
 * an optional JSON Schema check on success.
 *
 * Content problems are reported in the output; only schema file problems
 * are returned as errors.
 */
[[nodiscard]] docfmt::Result<ReportOutput> validate_json_report(std::string_view label,
                                                                std::string_view text,
                                                                const JsonValidateOptions& options);

/**
 * Pretty-print a JSON document, repairing it once if needed.
 */
[[nodiscard]] ReportOutput format_json_report(std::string_view text,
                                              const docfmt::json::FormatOptions& options);

/**
 * Report every structurally invalid table.
 */
[[nodiscard]] ReportOutput validate_markdown_report(std::string_view label, std::string_view text);

/**
 * Normalize headings and align valid tables.
 */
[[nodiscard]] ReportOutput format_markdown_report(std::string_view text,
                                                  const docfmt::markdown::FormatOptions& options);

/**
 * Print diagnostics, then save the document to output_path or print it.
 */
[[nodiscard]] docfmt::VoidResult
write_report(const ReportOutput& output, const std::optional<std::filesystem::path>& output_path);

}  // namespace docfmt::report
