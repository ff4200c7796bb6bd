/**
 * @file test_json_repair.cpp
 * @brief Tests for heuristic JSON repair
 */

#include "docfmt/json_check.hpp"
#include "docfmt/json_repair.hpp"

#include <string>

#include <gtest/gtest.h>

using namespace docfmt::json;

TEST(JsonRepair, DropsTrailingCommaInObject)
{
    EXPECT_EQ(repair_json(R"({ "a": 1, })"), R"({ "a": 1 })");
}

TEST(JsonRepair, DropsTrailingCommaInArray)
{
    EXPECT_EQ(repair_json("[1, 2,\n]"), "[1, 2\n]");
}

TEST(JsonRepair, CommaBeforeNonAsciiSpaceIsKept)
{
    EXPECT_EQ(drop_trailing_commas("[1,\xC2\xA0]"), "[1,\xC2\xA0]");
    EXPECT_EQ(drop_trailing_commas("[1,\f\v]"), "[1\f\v]");
}

TEST(JsonRepair, ConvertsSingleQuotes)
{
    EXPECT_EQ(repair_json("{'a': 'b'}"), R"({"a": "b"})");
}

TEST(JsonRepair, EscapesDoubleQuotesInsideSingleQuotedSpan)
{
    EXPECT_EQ(convert_single_quotes(R"('say "hi"')"), R"("say \"hi\"")");
}

TEST(JsonRepair, EscapedSingleQuoteDoesNotEndSpan)
{
    EXPECT_EQ(convert_single_quotes(R"('it\'s')"), R"("it\'s")");
}

TEST(JsonRepair, UnterminatedSingleQuoteLeftAlone)
{
    EXPECT_EQ(convert_single_quotes("{'a: 1}"), "{'a: 1}");
}

TEST(JsonRepair, StripsLineComment)
{
    const std::string repaired = repair_json("// comment\n{\"a\":1}");
    EXPECT_EQ(repaired, "\n{\"a\":1}");
    EXPECT_TRUE(check_json(repaired).valid);
}

TEST(JsonRepair, StripsBlockComment)
{
    EXPECT_EQ(repair_json("{/* one\n two */\"a\": 1}"), R"({"a": 1})");
}

TEST(JsonRepair, BlockCommentsAreNotNested)
{
    EXPECT_EQ(strip_block_comments("/* a /* b */ c */"), " c */");
}

TEST(JsonRepair, UnterminatedBlockCommentLeftAlone)
{
    EXPECT_EQ(strip_block_comments("{\"a\": 1} /* open"), "{\"a\": 1} /* open");
}

TEST(JsonRepair, LineCommentInsideStringIsStrippedByDefault)
{
    // Known limitation of the heuristic pass.
    EXPECT_EQ(strip_line_comments(R"({"url": "http://x"})"), R"({"url": "http:)");
}

TEST(JsonRepair, QuoteAwareModeKeepsCommentMarkersInStrings)
{
    const RepairOptions options{.quote_aware_comments = true};
    EXPECT_EQ(repair_json("{\"url\": \"http://x\"} // note", options), R"({"url": "http://x"} )");
    EXPECT_EQ(repair_json(R"({"glob": "/*.md", /* c */ "n": 1})", options),
              R"({"glob": "/*.md",  "n": 1})");
}

TEST(JsonRepair, CombinesCommaAndQuoteRepairs)
{
    const std::string repaired = repair_json("{'a': 1,}");
    EXPECT_EQ(repaired, R"({"a": 1})");
}

TEST(JsonRepair, BlankResultReturnsOriginal)
{
    const std::string text = "// only a comment";
    const auto report = repair_json_ex(text);
    EXPECT_EQ(report.text, text);
    EXPECT_TRUE(report.reverted);
}

TEST(JsonRepair, ReportsChangedSteps)
{
    const auto report = repair_json_ex("{'a': 1, /* x */}");
    EXPECT_FALSE(report.stripped_line_comments);
    EXPECT_TRUE(report.stripped_block_comments);
    EXPECT_TRUE(report.dropped_trailing_commas);
    EXPECT_TRUE(report.converted_single_quotes);
    EXPECT_TRUE(report.changed_steps());
    EXPECT_EQ(report.text, R"({"a": 1 })");
}

TEST(JsonRepair, StrictJsonUnchanged)
{
    const std::string text = "{\n  \"a\": [1, 2],\n  \"b\": \"c\"\n}";
    const auto report = repair_json_ex(text);
    EXPECT_EQ(report.text, text);
    EXPECT_FALSE(report.changed_steps());
}
