#pragma once

/**
 * @file gtest.hpp
 * @brief GoogleTest assertions built on the jsonassert comparator
 *
 *   JSONASSERT_EXPECT_JSON_EQ(actual, expected);       // exact
 *   JSONASSERT_ASSERT_JSON_INCLUDE(actual, expected);  // actual may have extra data
 *
 * A failure prints the full difference report.
 */

#include "jsonassert/assert.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace jsonassert::testing {

namespace detail {

inline ::testing::AssertionResult to_assertion(const char* actual_expr,
                                               const char* expected_expr,
                                               const char* relation,
                                               const VoidResult& result)
{
    if (result) {
        return ::testing::AssertionSuccess();
    }
    return ::testing::AssertionFailure()
           << actual_expr << " " << relation << " " << expected_expr
           << failure_message(result.error().message);
}

}  // namespace detail

inline ::testing::AssertionResult json_eq_formatter(const char* actual_expr,
                                                    const char* expected_expr,
                                                    const nlohmann::json& actual,
                                                    const nlohmann::json& expected)
{
    return detail::to_assertion(
        actual_expr, expected_expr, "does not equal", check_json_eq(actual, expected));
}

inline ::testing::AssertionResult json_include_formatter(const char* actual_expr,
                                                         const char* expected_expr,
                                                         const nlohmann::json& actual,
                                                         const nlohmann::json& expected)
{
    return detail::to_assertion(
        actual_expr, expected_expr, "does not include", check_json_include(actual, expected));
}

}  // namespace jsonassert::testing

#define JSONASSERT_EXPECT_JSON_EQ(actual, expected) \
    EXPECT_PRED_FORMAT2(::jsonassert::testing::json_eq_formatter, actual, expected)

#define JSONASSERT_ASSERT_JSON_EQ(actual, expected) \
    ASSERT_PRED_FORMAT2(::jsonassert::testing::json_eq_formatter, actual, expected)

#define JSONASSERT_EXPECT_JSON_INCLUDE(actual, expected) \
    EXPECT_PRED_FORMAT2(::jsonassert::testing::json_include_formatter, actual, expected)

#define JSONASSERT_ASSERT_JSON_INCLUDE(actual, expected) \
    ASSERT_PRED_FORMAT2(::jsonassert::testing::json_include_formatter, actual, expected)
