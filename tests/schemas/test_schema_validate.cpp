#include "jsonassert/schema_validate.hpp"

#include "jsonassert/diff.hpp"
#include "jsonassert/report.hpp"

#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace jsonassert::common::test {

namespace {

std::string schema_path(const std::string& name)
{
    return std::string(JSONASSERT_SCHEMA_DIR) + "/" + name;
}

nlohmann::json make_valid_cases_json()
{
    return nlohmann::json{
        {"schema_version", "cases.v1"},
        {         "cases",
         nlohmann::json::array({{{"name", "subset"},
         {"mode", "inclusive"},
         {"actual", {{"a", 1}, {"b", 2}}},
         {"expected", {{"a", 1}}}},
         {{"name", "arrays"},
         {"array_length", "summary"},
         {"actual", nlohmann::json::array({1, 2})},
         {"expected", nlohmann::json::array({1})}}})}
    };
}

}  // namespace

TEST(SchemaValidateTest, ReportWithEveryKindValidates)
{
    const diff::Config config{.mode = diff::Mode::kExact,
                              .array_length = diff::ArrayLengthPolicy::kSummary};
    const auto actual = nlohmann::json::parse(R"({"a": 1, "b": "x", "c": [1, 2, 3], "e": 0})");
    const auto expected = nlohmann::json::parse(R"({"a": 2, "b": 3, "c": [1], "d": null})");
    const auto differences = diff::diff(actual, expected, config);
    ASSERT_EQ(differences.size(), 5U);

    auto result = validate_json(report::build_report(differences, config),
                                schema_path("diff_report.v1.schema.json"));
    EXPECT_TRUE(result.has_value()) << result.error().message;
}

TEST(SchemaValidateTest, EmptyReportValidates)
{
    const auto doc = report::build_report({}, diff::Config{});
    auto result = validate_json(doc, schema_path("diff_report.v1.schema.json"));
    EXPECT_TRUE(result.has_value()) << result.error().message;
}

TEST(SchemaValidateTest, ReportRejectsUnknownKind)
{
    auto doc = report::build_report({}, diff::Config{});
    doc["differences"].push_back({
        {   "path",  ".a"},
        {"pointer",  "/a"},
        {   "kind", "moved"}
    });
    auto result = validate_json(doc, schema_path("diff_report.v1.schema.json"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaValidationFailed");
}

TEST(SchemaValidateTest, ValidCasesFile)
{
    auto result = validate_json(make_valid_cases_json(), schema_path("cases.v1.schema.json"));
    EXPECT_TRUE(result.has_value()) << result.error().message;
}

TEST(SchemaValidateTest, CasesRequireExpected)
{
    auto cases = make_valid_cases_json();
    cases["cases"][0].erase("expected");
    auto result = validate_json(cases, schema_path("cases.v1.schema.json"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaValidationFailed");
}

TEST(SchemaValidateTest, CasesRejectUnknownMode)
{
    auto cases = make_valid_cases_json();
    cases["cases"][0]["mode"] = "lenient";
    auto result = validate_json(cases, schema_path("cases.v1.schema.json"));
    EXPECT_FALSE(result.has_value());
}

TEST(SchemaValidateTest, CasesRejectWrongVersion)
{
    auto cases = make_valid_cases_json();
    cases["schema_version"] = "cases.v0";
    auto result = validate_json(cases, schema_path("cases.v1.schema.json"));
    EXPECT_FALSE(result.has_value());
}

TEST(SchemaValidateTest, MissingSchemaFile)
{
    auto result = validate_json(nlohmann::json::object(), schema_path("nope.schema.json"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaFileOpenFailed");
}

}  // namespace jsonassert::common::test
