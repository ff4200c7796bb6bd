/**
 * @file cli.cpp
 * @brief Subcommand option parsing and execution for the docfmt tool
 */

#include "docfmt/cli.hpp"

#include "docfmt/config.hpp"
#include "docfmt/file_io.hpp"
#include "docfmt/report.hpp"

#include <filesystem>
#include <print>
#include <ranges>
#include <string>

namespace docfmt::cli {

namespace {

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> docfmt::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            docfmt::Error::make("MissingArgument",
                                std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] auto set_command_option(Command command,
                                      std::string_view arg,
                                      // CLI parsing signature is stable.
                                      // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                      std::span<char*> args,
                                      std::size_t idx,
                                      CommandOptions& options,
                                      bool& skip_next) -> docfmt::Result<bool>
{
    std::optional<std::string>* target = nullptr;
    if ((arg == "--out" || arg == "-o") && accepts_output(command)) {
        target = &options.output;
    } else if (arg == "--schema" && command == Command::kValidateJson) {
        target = &options.schema;
    } else if (arg == "--config" && accepts_config(command)) {
        target = &options.config;
    }
    if (target == nullptr) {
        return docfmt::Result<bool>{false};
    }
    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    *target = *value;
    skip_next = true;
    return docfmt::Result<bool>{true};
}

[[nodiscard]] docfmt::VoidResult check_input_count(Command command, const CommandOptions& options)
{
    if (options.show_help) {
        return {};
    }
    if (options.inputs.empty()) {
        return std::unexpected(
            docfmt::Error::make("MissingArgument", "an input file is required"));
    }
    if (accepts_output(command) && options.inputs.size() != 1) {
        return std::unexpected(
            docfmt::Error::make("InvalidArgument", "exactly one input file is required"));
    }
    return {};
}

[[nodiscard]] docfmt::Result<docfmt::config::Config> resolve_config(const CommandOptions& options)
{
    if (!options.config) {
        return docfmt::config::Config{};
    }
    return docfmt::config::load_config(*options.config);
}

[[nodiscard]] std::optional<std::filesystem::path> output_path_of(const CommandOptions& options)
{
    if (!options.output) {
        return std::nullopt;
    }
    return std::filesystem::path(*options.output);
}

[[nodiscard]] int emit(const docfmt::report::ReportOutput& output, const CommandOptions& options)
{
    if (auto write = docfmt::report::write_report(output, output_path_of(options)); !write) {
        std::println(stderr, "Error: {}", write.error().message);
        return docfmt::report::kExitFailure;
    }
    return output.exit_code;
}

[[nodiscard]] int run_validate_json(const CommandOptions& options,
                                    const docfmt::config::Config& config)
{
    docfmt::report::JsonValidateOptions validate_options{
        .schema_path = options.schema ? std::optional<std::filesystem::path>(*options.schema)
                                      : std::nullopt,
        .format = config.json,
    };
    int exit_code = docfmt::report::kExitOk;
    for (const auto& input : options.inputs) {
        auto text = docfmt::common::read_text_file(input);
        if (!text) {
            std::println(stderr, "Error: {}", text.error().message);
            return docfmt::report::kExitFailure;
        }
        auto output = docfmt::report::validate_json_report(input, *text, validate_options);
        if (!output) {
            std::println(stderr, "Error: {}", output.error().message);
            return docfmt::report::kExitFailure;
        }
        if (emit(*output, options) != docfmt::report::kExitOk) {
            exit_code = docfmt::report::kExitFailure;
        }
    }
    return exit_code;
}

[[nodiscard]] int run_validate_md(const CommandOptions& options)
{
    int exit_code = docfmt::report::kExitOk;
    for (const auto& input : options.inputs) {
        auto text = docfmt::common::read_text_file(input);
        if (!text) {
            std::println(stderr, "Error: {}", text.error().message);
            return docfmt::report::kExitFailure;
        }
        if (emit(docfmt::report::validate_markdown_report(input, *text), options)
            != docfmt::report::kExitOk) {
            exit_code = docfmt::report::kExitFailure;
        }
    }
    return exit_code;
}

[[nodiscard]] int run_format(Command command,
                             const CommandOptions& options,
                             const docfmt::config::Config& config)
{
    auto text = docfmt::common::read_text_file(options.inputs.front());
    if (!text) {
        std::println(stderr, "Error: {}", text.error().message);
        return docfmt::report::kExitFailure;
    }
    if (command == Command::kFormatJson) {
        return emit(docfmt::report::format_json_report(*text, config.json), options);
    }
    return emit(docfmt::report::format_markdown_report(*text, config.markdown), options);
}

}  // namespace

std::optional<Command> command_of(std::string_view name)
{
    if (name == "validate-json") {
        return Command::kValidateJson;
    }
    if (name == "format-json") {
        return Command::kFormatJson;
    }
    if (name == "validate-md") {
        return Command::kValidateMd;
    }
    if (name == "format-md") {
        return Command::kFormatMd;
    }
    return std::nullopt;
}

bool accepts_output(Command command) noexcept
{
    return command == Command::kFormatJson || command == Command::kFormatMd;
}

bool accepts_config(Command command) noexcept
{
    return command != Command::kValidateMd;
}

docfmt::Result<CommandOptions> parse_command_args(Command command, std::span<char*> args)
{
    CommandOptions options{.inputs = {},
                           .output = std::nullopt,
                           .schema = std::nullopt,
                           .config = std::nullopt,
                           .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto handled = set_command_option(command, arg, args, idx, options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (*handled) {
            continue;
        }
        if (arg.starts_with('-') && arg.size() > 1) {
            return std::unexpected(docfmt::Error::make(
                "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
        }
        options.inputs.emplace_back(arg);
    }
    if (auto count = check_input_count(command, options); !count) {
        return std::unexpected(count.error());
    }
    return options;
}

int run_command(Command command, const CommandOptions& options)
{
    auto config = resolve_config(options);
    if (!config) {
        std::println(stderr, "Error: {}", config.error().message);
        return docfmt::report::kExitFailure;
    }

    switch (command) {
        case Command::kValidateJson:
            return run_validate_json(options, *config);
        case Command::kValidateMd:
            return run_validate_md(options);
        case Command::kFormatJson:
        case Command::kFormatMd:
            return run_format(command, options, *config);
    }
    return docfmt::report::kExitFailure;
}

}  // namespace docfmt::cli
