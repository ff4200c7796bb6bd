/**
 * @file test_schema_validate.cpp
 * @brief Tests for JSON Schema validation of documents
 */

#include "docfmt/schema_validate.hpp"

#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace docfmt::common::test {

namespace {

std::filesystem::path ensure_temp_dir(const std::string& name)
{
    auto temp_dir = std::filesystem::temp_directory_path() / name;
    std::error_code ec;
    std::filesystem::remove_all(temp_dir, ec);
    std::filesystem::create_directories(temp_dir, ec);
    return temp_dir;
}

std::filesystem::path write_json(const std::filesystem::path& path, const nlohmann::json& payload)
{
    std::ofstream out(path);
    out << payload.dump(2);
    return path;
}

nlohmann::json make_person_schema()
{
    return nlohmann::json{
        {      "$schema", "http://json-schema.org/draft-07/schema#"},
        {         "type",                                  "object"},
        {     "required",         nlohmann::json::array({"name"})},
        {   "properties",
         {{"name", {{"type", "string"}}}, {"age", {{"type", "integer"}, {"minimum", 0}}}}}
    };
}

}  // namespace

TEST(SchemaValidateTest, AcceptsMatchingDocument)
{
    auto dir = ensure_temp_dir("docfmt_schema_ok");
    auto schema = write_json(dir / "person.schema.json", make_person_schema());

    nlohmann::json doc = {
        {"name", "Ada"},
        { "age",    36}
    };
    auto violations = check_against_schema(doc, schema);
    ASSERT_TRUE(violations) << violations.error().message;
    EXPECT_TRUE(violations->empty());
}

TEST(SchemaValidateTest, ReportsViolations)
{
    auto dir = ensure_temp_dir("docfmt_schema_violation");
    auto schema = write_json(dir / "person.schema.json", make_person_schema());

    nlohmann::json doc = {
        {"age", -1}
    };
    auto violations = check_against_schema(doc, schema);
    ASSERT_TRUE(violations);
    ASSERT_FALSE(violations->empty());
    for (const auto& violation : *violations) {
        EXPECT_TRUE(violation.pointer.starts_with("/")) << violation.pointer;
        EXPECT_FALSE(violation.description.empty());
    }
}

TEST(SchemaValidateTest, ViolationPointsAtOffendingMember)
{
    auto dir = ensure_temp_dir("docfmt_schema_pointer");
    auto schema = write_json(dir / "person.schema.json", make_person_schema());

    nlohmann::json doc = {
        {"name", 42}
    };
    auto violations = check_against_schema(doc, schema);
    ASSERT_TRUE(violations);
    ASSERT_FALSE(violations->empty());
    bool found = false;
    for (const auto& violation : *violations) {
        found = found || violation.pointer.find("name") != std::string::npos;
    }
    EXPECT_TRUE(found);
}

TEST(SchemaValidateTest, ResolvesDefsReferences)
{
    auto dir = ensure_temp_dir("docfmt_schema_defs");
    nlohmann::json schema_json = {
        { "$defs", {{"port", {{"type", "integer"}, {"maximum", 65535}}}}},
        {  "type",                                              "object"},
        {"properties",                  {{"port", {{"$ref", "#/$defs/port"}}}}}
    };
    auto schema = write_json(dir / "server.schema.json", schema_json);

    auto ok = check_against_schema(nlohmann::json{{"port", 8080}}, schema);
    ASSERT_TRUE(ok);
    EXPECT_TRUE(ok->empty());

    auto bad = check_against_schema(nlohmann::json{{"port", 70000}}, schema);
    ASSERT_TRUE(bad);
    EXPECT_FALSE(bad->empty());
}

TEST(SchemaValidateTest, MissingSchemaFile)
{
    auto dir = ensure_temp_dir("docfmt_schema_missing");
    auto result = check_against_schema(nlohmann::json::object(), dir / "absent.json");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaFileOpenFailed");
}

TEST(SchemaValidateTest, MalformedSchemaFile)
{
    auto dir = ensure_temp_dir("docfmt_schema_malformed");
    auto path = dir / "bad.schema.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    auto result = check_against_schema(nlohmann::json::object(), path);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaParseFailed");
}

TEST(SchemaValidateTest, ResolvesSiblingSchemaFiles)
{
    auto dir = ensure_temp_dir("docfmt_schema_sibling");
    write_json(dir / "port.schema.json", nlohmann::json{{"type", "integer"}, {"maximum", 65535}});
    nlohmann::json schema_json = {
        {      "type",                                                "object"},
        {"properties", {{"port", {{"$ref", "port.schema.json"}}}}}
    };
    auto schema = write_json(dir / "server.schema.json", schema_json);

    auto ok = check_against_schema(nlohmann::json{{"port", 80}}, schema);
    ASSERT_TRUE(ok);
    EXPECT_TRUE(ok->empty());

    auto bad = check_against_schema(nlohmann::json{{"port", "eighty"}}, schema);
    ASSERT_TRUE(bad);
    EXPECT_FALSE(bad->empty());
}

TEST(SchemaValidateTest, ViolationToString)
{
    SchemaViolation violation{.pointer = "/a", .description = "one"};
    EXPECT_EQ(violation.to_string(), "/a: one");
}

}  // namespace docfmt::common::test
