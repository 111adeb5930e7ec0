/**
 * @file test_report.cpp
 * @brief Tests for text and JSON difference reports
 */

#include "jsonassert/report.hpp"

#include "jsonassert/version.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace {

using jsonassert::Path;
using jsonassert::diff::ArrayLengthPolicy;
using jsonassert::diff::Config;
using jsonassert::diff::Difference;
using jsonassert::diff::Mode;
using Json = nlohmann::json;

TEST(ReportIndent, PrefixesEveryLine)
{
    EXPECT_EQ(jsonassert::report::indent("a\nb", 4), "    a\n    b");
    EXPECT_EQ(jsonassert::report::indent("single", 2), "  single");
    EXPECT_EQ(jsonassert::report::indent("x\n\ny", 1), " x\n \n y");
}

TEST(ReportText, ValueMismatchAtNestedPath)
{
    const auto differences = jsonassert::diff::diff(Json::parse(R"({"a": {"b": 1}})"),
                                                    Json::parse(R"({"a": {"b": 2}})"),
                                                    Mode::kExact);
    ASSERT_EQ(differences.size(), 1U);
    EXPECT_EQ(jsonassert::report::format_difference(differences[0]),
              "json atoms at path \".a.b\" are not equal:\n"
              "    expected:\n"
              "        2\n"
              "    actual:\n"
              "        1");
}

TEST(ReportText, RootPathIsDot)
{
    const auto differences = jsonassert::diff::diff(Json(true), Json(false), Mode::kExact);
    ASSERT_EQ(differences.size(), 1U);
    EXPECT_EQ(jsonassert::report::format_difference(differences[0]),
              "json atoms at path \".\" are not equal:\n"
              "    expected:\n"
              "        false\n"
              "    actual:\n"
              "        true");
}

TEST(ReportText, StructuredValuesArePrettyPrinted)
{
    const auto differences = jsonassert::diff::diff(Json::parse(R"({"a": 1})"),
                                                    Json::parse(R"({"a": {"b": [1]}})"),
                                                    Mode::kInclusive);
    ASSERT_EQ(differences.size(), 1U);
    EXPECT_EQ(jsonassert::report::format_difference(differences[0]),
              "json values at path \".a\" have different types:\n"
              "    expected object:\n"
              "        {\n"
              "          \"b\": [\n"
              "            1\n"
              "          ]\n"
              "        }\n"
              "    actual number:\n"
              "        1");
}

TEST(ReportText, MissingAndExtraKeys)
{
    const auto differences = jsonassert::diff::diff(Json::parse(R"({"extra": 1})"),
                                                    Json::parse(R"({"needed": 2})"),
                                                    Mode::kExact);
    ASSERT_EQ(differences.size(), 2U);
    EXPECT_EQ(jsonassert::report::format_difference(differences[0]),
              "json atom at path \".needed\" is missing from actual");
    EXPECT_EQ(jsonassert::report::format_difference(differences[1]),
              "json atom at path \".extra\" is missing from expected");
    EXPECT_EQ(jsonassert::report::format_differences(differences),
              "json atom at path \".needed\" is missing from actual\n\n"
              "json atom at path \".extra\" is missing from expected");
}

TEST(ReportText, LengthMismatch)
{
    const Config config{.mode = Mode::kExact, .array_length = ArrayLengthPolicy::kSummary};
    const auto differences =
        jsonassert::diff::diff(Json::parse("[1, 2, 3]"), Json::parse("[1]"), config);
    ASSERT_EQ(differences.size(), 1U);
    EXPECT_EQ(jsonassert::report::format_difference(differences[0]),
              "json arrays at path \".\" have different lengths:\n"
              "    expected: 1\n"
              "    actual: 3");
}

TEST(ReportText, NoDifferencesIsEmpty)
{
    const std::vector<Difference> differences;
    EXPECT_EQ(jsonassert::report::format_differences(differences), "");
}

TEST(ReportText, InvalidUtf8IsReplaced)
{
    const Json actual = std::string("ok\xff");
    const auto differences = jsonassert::diff::diff(actual, Json("ok"), Mode::kExact);
    ASSERT_EQ(differences.size(), 1U);

    std::string text;
    EXPECT_NO_THROW(text = jsonassert::report::format_difference(differences[0]));
    EXPECT_NE(text.find("\"ok\xEF\xBF\xBD\""), std::string::npos);
    EXPECT_EQ(text.find('\xff'), std::string::npos);
}

TEST(ReportText, EmptyKeyDiffersFromRoot)
{
    const auto differences = jsonassert::diff::diff(
        Json::parse(R"({"": 1})"), Json::parse(R"({"": 2})"), Mode::kExact);
    ASSERT_EQ(differences.size(), 1U);
    EXPECT_EQ(jsonassert::report::format_difference(differences[0]).rfind(
                  "json atoms at path \"[\"\"]\" are not equal:", 0),
              0U);
}

TEST(ReportJson, DifferenceEntries)
{
    const auto differences = jsonassert::diff::diff(Json::parse(R"({"a": [1, "x"]})"),
                                                    Json::parse(R"({"a": [2, 5]})"),
                                                    Mode::kExact);
    ASSERT_EQ(differences.size(), 2U);

    const Json value = jsonassert::report::difference_to_json(differences[0]);
    EXPECT_EQ(value.at("path"), ".a[0]");
    EXPECT_EQ(value.at("pointer"), "/a/0");
    EXPECT_EQ(value.at("kind"), "value_mismatch");
    EXPECT_EQ(value.at("expected"), 2);
    EXPECT_EQ(value.at("actual"), 1);

    const Json type = jsonassert::report::difference_to_json(differences[1]);
    EXPECT_EQ(type.at("kind"), "type_mismatch");
    EXPECT_EQ(type.at("expected_type"), "number");
    EXPECT_EQ(type.at("actual_type"), "string");
}

TEST(ReportJson, BuildReport)
{
    const Config config{.mode = Mode::kInclusive};
    const auto differences = jsonassert::diff::diff(
        Json::parse(R"({"a": {}})"), Json::parse(R"({"a": {"b": null}})"), config);

    const Json report = jsonassert::report::build_report(differences, config);
    EXPECT_EQ(report.at("schema_version"), jsonassert::kReportSchemaVersion);
    EXPECT_EQ(report.at("tool").at("name"), "jsonassert");
    EXPECT_EQ(report.at("tool").at("version"), jsonassert::kVersion);
    EXPECT_EQ(report.at("mode"), "inclusive");
    EXPECT_EQ(report.at("array_length"), "per-element");
    EXPECT_EQ(report.at("difference_count"), 1);
    ASSERT_EQ(report.at("differences").size(), 1U);

    const Json& entry = report.at("differences").at(0);
    EXPECT_EQ(entry.at("kind"), "missing_in_actual");
    EXPECT_EQ(entry.at("path"), ".a.b");
    EXPECT_TRUE(entry.at("expected").is_null());
    EXPECT_FALSE(entry.contains("actual"));
}

TEST(ReportJson, EmptyReport)
{
    const std::vector<Difference> differences;
    const Json report = jsonassert::report::build_report(differences, Config{});
    EXPECT_EQ(report.at("difference_count"), 0);
    EXPECT_TRUE(report.at("differences").is_array());
    EXPECT_TRUE(report.at("differences").empty());
    EXPECT_EQ(report.at("mode"), "exact");
}

TEST(ReportJson, PathRootPointerIsEmpty)
{
    const Difference difference{.path = Path::root(),
                                .kind = jsonassert::diff::LengthMismatch{.actual_len = 3,
                                                                         .expected_len = 1}};
    const Json entry = jsonassert::report::difference_to_json(difference);
    EXPECT_EQ(entry.at("path"), ".");
    EXPECT_EQ(entry.at("pointer"), "");
    EXPECT_EQ(entry.at("expected_len"), 1);
    EXPECT_EQ(entry.at("actual_len"), 3);
}

}  // namespace
