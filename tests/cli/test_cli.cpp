/**
 * @file test_cli.cpp
 * @brief Tests for command option parsing and batch exit codes
 */

#include "docfmt/cli.hpp"

#include "docfmt/file_io.hpp"

#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <span>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace docfmt::cli::test {

namespace {

std::filesystem::path ensure_temp_dir(const std::string& name)
{
    auto temp_dir = std::filesystem::temp_directory_path() / name;
    std::error_code ec;
    std::filesystem::remove_all(temp_dir, ec);
    std::filesystem::create_directories(temp_dir, ec);
    return temp_dir;
}

std::string write_text(const std::filesystem::path& path, const std::string& text)
{
    std::ofstream out(path, std::ios::binary);
    out << text;
    return path.string();
}

/// Owns argv storage for parse_command_args()
class Args
{
public:
    Args(std::initializer_list<std::string> args)
        : m_storage(args)
    {
        for (auto& arg : m_storage) {
            m_pointers.push_back(arg.data());
        }
    }

    [[nodiscard]] std::span<char*> span() { return m_pointers; }

private:
    std::vector<std::string> m_storage;
    std::vector<char*> m_pointers;
};

}  // namespace

TEST(CommandOf, KnownCommands)
{
    EXPECT_EQ(command_of("validate-json"), Command::kValidateJson);
    EXPECT_EQ(command_of("format-md"), Command::kFormatMd);
    EXPECT_FALSE(command_of("lint"));
}

TEST(ParseCommandArgs, CollectsInputsAndOptions)
{
    Args args{"a.json", "--schema", "s.json", "b.json", "--config", "c.json"};
    auto options = parse_command_args(Command::kValidateJson, args.span());
    ASSERT_TRUE(options) << options.error().message;
    EXPECT_EQ(options->inputs, (std::vector<std::string>{"a.json", "b.json"}));
    EXPECT_EQ(options->schema, "s.json");
    EXPECT_EQ(options->config, "c.json");
    EXPECT_FALSE(options->output);
}

TEST(ParseCommandArgs, FormatRequiresExactlyOneInput)
{
    Args two{"a.json", "b.json"};
    auto options = parse_command_args(Command::kFormatJson, two.span());
    ASSERT_FALSE(options);
    EXPECT_EQ(options.error().code, "InvalidArgument");

    Args none{"--out", "x.json"};
    auto missing = parse_command_args(Command::kFormatJson, none.span());
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, "MissingArgument");
}

TEST(ParseCommandArgs, HelpNeedsNoInput)
{
    Args args{"--help"};
    auto options = parse_command_args(Command::kFormatMd, args.span());
    ASSERT_TRUE(options);
    EXPECT_TRUE(options->show_help);
}

TEST(ParseCommandArgs, OptionValueIsRequired)
{
    Args args{"a.md", "-o"};
    auto options = parse_command_args(Command::kFormatMd, args.span());
    ASSERT_FALSE(options);
    EXPECT_EQ(options.error().code, "MissingArgument");
}

TEST(ParseCommandArgs, RejectsOptionsOfOtherCommands)
{
    Args config{"a.md", "--config", "c.json"};
    auto md = parse_command_args(Command::kValidateMd, config.span());
    ASSERT_FALSE(md);
    EXPECT_EQ(md.error().code, "InvalidArgument");

    Args schema{"a.json", "--schema", "s.json"};
    EXPECT_FALSE(parse_command_args(Command::kFormatJson, schema.span()));

    Args out{"a.json", "--out", "b.json"};
    EXPECT_FALSE(parse_command_args(Command::kValidateJson, out.span()));
}

TEST(RunCommand, ValidateBatchFailsIfAnyInputFails)
{
    auto dir = ensure_temp_dir("docfmt_cli_batch_json");
    auto good = write_text(dir / "good.json", R"({"a": 1})");
    auto bad = write_text(dir / "bad.json", "{'a': 1,}");

    Args both{good, bad};
    auto options = parse_command_args(Command::kValidateJson, both.span());
    ASSERT_TRUE(options);
    EXPECT_EQ(run_command(Command::kValidateJson, *options), 1);

    Args only_good{good, good};
    auto good_options = parse_command_args(Command::kValidateJson, only_good.span());
    ASSERT_TRUE(good_options);
    EXPECT_EQ(run_command(Command::kValidateJson, *good_options), 0);
}

TEST(RunCommand, ValidateMarkdownBatch)
{
    auto dir = ensure_temp_dir("docfmt_cli_batch_md");
    auto clean = write_text(dir / "clean.md", "| a |\n|---|\n| 1 |\n");
    auto broken = write_text(dir / "broken.md", "| a | b |\n|---|---|\n| 1 |\n");

    Args args{broken, clean};
    auto options = parse_command_args(Command::kValidateMd, args.span());
    ASSERT_TRUE(options);
    EXPECT_EQ(run_command(Command::kValidateMd, *options), 1);
}

TEST(RunCommand, UnreadableInputFails)
{
    auto dir = ensure_temp_dir("docfmt_cli_missing");
    Args args{(dir / "absent.json").string()};
    auto options = parse_command_args(Command::kValidateJson, args.span());
    ASSERT_TRUE(options);
    EXPECT_EQ(run_command(Command::kValidateJson, *options), 1);
}

TEST(RunCommand, FormatWritesOutputFile)
{
    auto dir = ensure_temp_dir("docfmt_cli_format");
    auto input = write_text(dir / "in.json", "{'a': [1, 2,],}");
    auto out = (dir / "out.json").string();

    Args args{input, "-o", out};
    auto options = parse_command_args(Command::kFormatJson, args.span());
    ASSERT_TRUE(options);
    EXPECT_EQ(run_command(Command::kFormatJson, *options), 0);

    auto saved = docfmt::common::read_text_file(out);
    ASSERT_TRUE(saved);
    EXPECT_EQ(*saved, "{\n  \"a\": [\n    1,\n    2\n  ]\n}\n");
}

TEST(RunCommand, ConfigIsApplied)
{
    auto dir = ensure_temp_dir("docfmt_cli_config");
    auto input = write_text(dir / "in.json", "[1]");
    auto config = write_text(dir / "docfmt.json", R"({"json": {"indent": 4}})");
    auto out = (dir / "out.json").string();

    Args args{input, "--config", config, "--out", out};
    auto options = parse_command_args(Command::kFormatJson, args.span());
    ASSERT_TRUE(options);
    EXPECT_EQ(run_command(Command::kFormatJson, *options), 0);

    auto saved = docfmt::common::read_text_file(out);
    ASSERT_TRUE(saved);
    EXPECT_EQ(*saved, "[\n    1\n]\n");
}

TEST(RunCommand, InvalidConfigFails)
{
    auto dir = ensure_temp_dir("docfmt_cli_bad_config");
    auto input = write_text(dir / "in.json", "[1]");
    auto config = write_text(dir / "docfmt.json", R"({"json": {"indent": 99}})");

    Args args{input, "--config", config};
    auto options = parse_command_args(Command::kFormatJson, args.span());
    ASSERT_TRUE(options);
    EXPECT_EQ(run_command(Command::kFormatJson, *options), 1);
}

}  // namespace docfmt::cli::test
