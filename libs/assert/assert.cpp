/**
 * @file assert.cpp
 * @brief Assertion entry points for comparing JSON in tests
 */

#include "jsonassert/assert.hpp"

#include "jsonassert/report.hpp"

#include <format>

namespace jsonassert {

VoidResult check_json(Actual actual, Expected expected, const diff::Config& config)
{
    const auto differences = diff::diff(actual.value, expected.value, config);
    if (differences.empty()) {
        return {};
    }
    return std::unexpected(
        Error::make(kJsonMismatchCode, report::format_differences(differences)));
}

VoidResult check_json_eq(Actual actual, Expected expected)
{
    return check_json(actual, expected, diff::Config{.mode = diff::Mode::kExact});
}

VoidResult check_json_eq(const nlohmann::json& actual, const nlohmann::json& expected)
{
    return check_json_eq(Actual{actual}, Expected{expected});
}

VoidResult check_json_include(Actual actual, Expected expected)
{
    return check_json(actual, expected, diff::Config{.mode = diff::Mode::kInclusive});
}

VoidResult check_json_include(const nlohmann::json& actual, const nlohmann::json& expected)
{
    return check_json_include(Actual{actual}, Expected{expected});
}

std::string failure_message(std::string_view report)
{
    return std::format("\n\n{}\n\n", report::indent(report, 4));
}

}  // namespace jsonassert
