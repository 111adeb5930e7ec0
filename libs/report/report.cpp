/**
 * @file report.cpp
 * @brief Text and JSON rendering of comparison results
 */

#include "jsonassert/report.hpp"

#include "jsonassert/version.hpp"

#include <format>
#include <ranges>
#include <string>
#include <utility>
#include <variant>

namespace jsonassert::report {

namespace {

constexpr std::size_t kBodyIndent = 8;

[[nodiscard]] std::string format_value_mismatch(const std::string& path,
                                                const diff::ValueMismatch& mismatch)
{
    return std::format("json atoms at path \"{}\" are not equal:\n"
                       "    expected:\n{}\n"
                       "    actual:\n{}",
                       path,
                       indent(pretty_json(mismatch.expected), kBodyIndent),
                       indent(pretty_json(mismatch.actual), kBodyIndent));
}

[[nodiscard]] std::string format_type_mismatch(const std::string& path,
                                               const diff::TypeMismatch& mismatch)
{
    return std::format("json values at path \"{}\" have different types:\n"
                       "    expected {}:\n{}\n"
                       "    actual {}:\n{}",
                       path,
                       diff::kind_name(mismatch.expected_type),
                       indent(pretty_json(mismatch.expected), kBodyIndent),
                       diff::kind_name(mismatch.actual_type),
                       indent(pretty_json(mismatch.actual), kBodyIndent));
}

[[nodiscard]] std::string format_length_mismatch(const std::string& path,
                                                 const diff::LengthMismatch& mismatch)
{
    return std::format("json arrays at path \"{}\" have different lengths:\n"
                       "    expected: {}\n"
                       "    actual: {}",
                       path,
                       mismatch.expected_len,
                       mismatch.actual_len);
}

void append_kind_fields(nlohmann::json& entry, const diff::DifferenceKind& kind)
{
    if (const auto* value = std::get_if<diff::ValueMismatch>(&kind)) {
        entry["expected"] = value->expected;
        entry["actual"] = value->actual;
    } else if (const auto* type = std::get_if<diff::TypeMismatch>(&kind)) {
        entry["expected_type"] = std::string(diff::kind_name(type->expected_type));
        entry["actual_type"] = std::string(diff::kind_name(type->actual_type));
        entry["expected"] = type->expected;
        entry["actual"] = type->actual;
    } else if (const auto* missing = std::get_if<diff::MissingKeyInActual>(&kind)) {
        entry["expected"] = missing->expected_value;
    } else if (const auto* extra = std::get_if<diff::ExtraKeyInActual>(&kind)) {
        entry["actual"] = extra->actual_value;
    } else if (const auto* length = std::get_if<diff::LengthMismatch>(&kind)) {
        entry["expected_len"] = length->expected_len;
        entry["actual_len"] = length->actual_len;
    }
}

}  // namespace

std::string indent(std::string_view text, std::size_t level)
{
    const std::string prefix(level, ' ');
    std::string out;
    out.reserve(text.size() + level);
    for (auto [i, line] : std::views::enumerate(text | std::views::split('\n'))) {
        if (i != 0) {
            out += '\n';
        }
        out += prefix;
        out.append(line.begin(), line.end());
    }
    return out;
}

std::string pretty_json(const nlohmann::json& value)
{
    return value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string format_difference(const diff::Difference& difference)
{
    const std::string path = difference.path.render();
    const auto& kind = difference.kind;

    if (const auto* value = std::get_if<diff::ValueMismatch>(&kind)) {
        return format_value_mismatch(path, *value);
    }
    if (const auto* type = std::get_if<diff::TypeMismatch>(&kind)) {
        return format_type_mismatch(path, *type);
    }
    if (std::holds_alternative<diff::MissingKeyInActual>(kind)) {
        return std::format("json atom at path \"{}\" is missing from actual", path);
    }
    if (std::holds_alternative<diff::ExtraKeyInActual>(kind)) {
        return std::format("json atom at path \"{}\" is missing from expected", path);
    }
    return format_length_mismatch(path, std::get<diff::LengthMismatch>(kind));
}

std::string format_differences(std::span<const diff::Difference> differences)
{
    std::string out;
    for (auto [i, difference] : std::views::enumerate(differences)) {
        if (i != 0) {
            out += "\n\n";
        }
        out += format_difference(difference);
    }
    return out;
}

nlohmann::json difference_to_json(const diff::Difference& difference)
{
    nlohmann::json entry = {
        {   "path",                          difference.path.render()},
        {"pointer",       difference.path.to_json_pointer().to_string()},
        {   "kind", std::string(diff::difference_label(difference.kind))}
    };
    append_kind_fields(entry, difference.kind);
    return entry;
}

nlohmann::json build_report(std::span<const diff::Difference> differences,
                            const diff::Config& config)
{
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& difference : differences) {
        entries.push_back(difference_to_json(difference));
    }

    return nlohmann::json{
        {  "schema_version",                                                 kReportSchemaVersion},
        {            "tool",                         {{"name", "jsonassert"}, {"version", kVersion}}},
        {            "mode",                               std::string(diff::mode_name(config.mode))},
        {    "array_length", std::string(diff::array_length_policy_name(config.array_length))},
        {"difference_count",                                                   differences.size()},
        {     "differences",                                                    std::move(entries)}
    };
}

}  // namespace jsonassert::report
