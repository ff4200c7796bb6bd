#pragma once

/**
 * @file cli.hpp
 * @brief Subcommand option parsing and execution for the docfmt tool
 *
 * main() keeps only dispatch and help text; everything that decides exit
 * codes lives here.
 */

#include "docfmt/common.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace docfmt::cli {

enum class Command { kValidateJson, kFormatJson, kValidateMd, kFormatMd };

struct CommandOptions
{
    std::vector<std::string> inputs;
    std::optional<std::string> output;
    std::optional<std::string> schema;
    std::optional<std::string> config;
    bool show_help;
};

[[nodiscard]] std::optional<Command> command_of(std::string_view name);

/// format-json and format-md write a document (--out/-o)
[[nodiscard]] bool accepts_output(Command command) noexcept;

/// Every command with a configurable behavior (all but validate-md)
[[nodiscard]] bool accepts_config(Command command) noexcept;

/**
 * Parse the arguments following the command name.
 *
 * Unless --help is given, validate commands need at least one input and
 * format commands exactly one.
 *
 * @return Options, MissingArgument or InvalidArgument
 */
[[nodiscard]] docfmt::Result<CommandOptions> parse_command_args(Command command,
                                                                std::span<char*> args);

/**
 * Run a parsed command, printing reports to stdout and errors to stderr.
 *
 * Validate commands report every input and fail if any input fails; a file
 * that cannot be read stops the batch.
 *
 * @return Process exit code
 */
[[nodiscard]] int run_command(Command command, const CommandOptions& options);

}  // namespace docfmt::cli
