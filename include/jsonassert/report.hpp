#pragma once

/**
 * @file report.hpp
 * @brief Text and JSON rendering of comparison results
 */

#include "jsonassert/diff.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace jsonassert::report {

enum class ReportFormat { kText, kJson };

/**
 * Prefix every line of `text` with `level` spaces
 */
[[nodiscard]] std::string indent(std::string_view text, std::size_t level);

/**
 * Two-space indented dump. Invalid UTF-8 is replaced rather than rejected.
 */
[[nodiscard]] std::string pretty_json(const nlohmann::json& value);

/**
 * Human-readable block for one difference, e.g.
 *
 *   json atoms at path ".data.users[0].country.name" are not equal:
 *       expected:
 *           "Sweden"
 *       actual:
 *           "Denmark"
 */
[[nodiscard]] std::string format_difference(const diff::Difference& difference);

/**
 * All blocks separated by a blank line; empty for no differences
 */
[[nodiscard]] std::string format_differences(std::span<const diff::Difference> differences);

[[nodiscard]] nlohmann::json difference_to_json(const diff::Difference& difference);

/**
 * Build a diff_report.v1 document
 * @param differences Comparator output
 * @param config Configuration the differences were produced with
 */
[[nodiscard]] nlohmann::json build_report(std::span<const diff::Difference> differences,
                                          const diff::Config& config);

}  // namespace jsonassert::report
