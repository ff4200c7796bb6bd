/**
 * @file main.cpp
 * @brief docfmt CLI entry point
 *
 * Commands:
 *   validate-json  - Check JSON syntax (and optionally a JSON Schema)
 *   format-json    - Pretty-print JSON, repairing it once if needed
 *   validate-md    - Check Markdown pipe-table structure
 *   format-md      - Normalize headings and align Markdown tables
 *   version        - Show version information
 */

#include "docfmt/cli.hpp"
#include "docfmt/report.hpp"
#include "docfmt/require_cpp23.hpp"
#include "docfmt/version.hpp"

#include <exception>
#include <print>
#include <span>
#include <string_view>

namespace {

using docfmt::cli::Command;

void print_version()
{
    std::println("docfmt {} ({})", docfmt::kVersion, docfmt::kBuildId);
}

void print_help()
{
    std::print(R"(docfmt - JSON & Markdown validator / formatter

Usage: docfmt <command> [options] FILE...

Commands:
  validate-json   Check JSON syntax; suggest a repair on failure
  format-json     Pretty-print JSON (2-space indent, key order kept)
  validate-md     Check Markdown pipe-table structure
  format-md       Normalize headings and align Markdown tables
  version         Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'docfmt <command> --help' for command-specific options.
)");
}

void print_validate_json_help()
{
    std::print(R"(Usage: docfmt validate-json [options] FILE...

Check JSON syntax. On failure a repaired preview is printed when the
repair heuristics change the text.

Options:
  --schema FILE             Also validate against a JSON Schema
  --config FILE             Configuration file (JSON)
  --help, -h                Show this help

Exit status: 0 if every file is valid, 1 otherwise
)");
}

void print_format_json_help()
{
    std::print(R"(Usage: docfmt format-json [options] FILE

Pretty-print JSON. Invalid input gets one repair attempt (comments,
trailing commas, single quotes) before formatting is aborted.

Options:
  --out FILE, -o            Write the result to FILE instead of stdout
  --config FILE             Configuration file (JSON)
  --help, -h                Show this help
)");
}

void print_validate_md_help()
{
    std::print(R"(Usage: docfmt validate-md [options] FILE...

Check that every pipe table has consistent column counts and a valid
separator row.

Options:
  --help, -h                Show this help

Exit status: 0 if no issues were found, 1 otherwise
)");
}

void print_format_md_help()
{
    std::print(R"(Usage: docfmt format-md [options] FILE

Normalize heading markers and re-align valid pipe tables. Invalid tables
are left as they are.

Options:
  --out FILE, -o            Write the result to FILE instead of stdout
  --config FILE             Configuration file (JSON)
  --help, -h                Show this help
)");
}

void print_command_help(Command command)
{
    switch (command) {
        case Command::kValidateJson:
            print_validate_json_help();
            break;
        case Command::kFormatJson:
            print_format_json_help();
            break;
        case Command::kValidateMd:
            print_validate_md_help();
            break;
        case Command::kFormatMd:
            print_format_md_help();
            break;
    }
}

int cmd_run(Command command, int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = docfmt::cli::parse_command_args(command, args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        print_command_help(command);
        return docfmt::report::kExitFailure;
    }
    if (options->show_help) {
        print_command_help(command);
        return docfmt::report::kExitOk;
    }
    return docfmt::cli::run_command(command, *options);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return docfmt::report::kExitFailure;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return docfmt::report::kExitOk;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return docfmt::report::kExitOk;
        }

        if (auto command = docfmt::cli::command_of(cmd)) {
            return cmd_run(*command, argc - 2, argv + 2);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return docfmt::report::kExitFailure;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return docfmt::report::kExitFailure;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
        } catch (...) {
            std::terminate();
        }
        return docfmt::report::kExitFailure;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
