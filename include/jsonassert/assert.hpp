#pragma once

/**
 * @file assert.hpp
 * @brief Assertion entry points for comparing JSON in tests
 *
 * The named wrappers make it explicit which side may carry additional data:
 *
 *   auto result = jsonassert::check_json_include(jsonassert::Actual{response},
 *                                                jsonassert::Expected{expected});
 *
 * Positional overloads take (actual, expected) in that order.
 */

#include "jsonassert/common.hpp"
#include "jsonassert/diff.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace jsonassert {

/// Error code carried by a failed check
constexpr const char* kJsonMismatchCode = "JsonMismatch";

struct Actual
{
    const nlohmann::json& value;
};

struct Expected
{
    const nlohmann::json& value;
};

/**
 * Compare under `config`
 * @return Empty on match; JsonMismatch error with the text report otherwise
 */
[[nodiscard]] VoidResult check_json(Actual actual, Expected expected, const diff::Config& config);

/**
 * Exact comparison: both values must match completely
 */
[[nodiscard]] VoidResult check_json_eq(Actual actual, Expected expected);

[[nodiscard]] VoidResult check_json_eq(const nlohmann::json& actual,
                                       const nlohmann::json& expected);

/**
 * Inclusive comparison: `actual` may contain data `expected` does not mention
 */
[[nodiscard]] VoidResult check_json_include(Actual actual, Expected expected);

[[nodiscard]] VoidResult check_json_include(const nlohmann::json& actual,
                                            const nlohmann::json& expected);

/**
 * Frame a report the way a failing assertion prints it
 */
[[nodiscard]] std::string failure_message(std::string_view report);

}  // namespace jsonassert
