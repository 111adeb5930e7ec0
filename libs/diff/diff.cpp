/**
 * @file diff.cpp
 * @brief Recursive structural comparison of JSON values
 */

#include "jsonassert/diff.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace jsonassert::diff {

namespace {

using Json = nlohmann::json;

void compare_into(const Json& actual,
                  const Json& expected,
                  const Path& path,
                  const Config& config,
                  std::vector<Difference>& out);

[[nodiscard]] bool numbers_equal(const Json& actual, const Json& expected)
{
    if (actual.is_number_float() != expected.is_number_float()) {
        return false;
    }
    if (actual.is_number_float()) {
        const auto lhs = actual.get<Json::number_float_t>();
        const auto rhs = expected.get<Json::number_float_t>();
        return lhs == rhs || (std::isnan(lhs) && std::isnan(rhs));
    }
    if (actual.is_number_unsigned() && expected.is_number_unsigned()) {
        return actual.get<Json::number_unsigned_t>() == expected.get<Json::number_unsigned_t>();
    }
    if (actual.is_number_unsigned()) {
        return std::cmp_equal(actual.get<Json::number_unsigned_t>(),
                              expected.get<Json::number_integer_t>());
    }
    if (expected.is_number_unsigned()) {
        return std::cmp_equal(actual.get<Json::number_integer_t>(),
                              expected.get<Json::number_unsigned_t>());
    }
    return actual.get<Json::number_integer_t>() == expected.get<Json::number_integer_t>();
}

void compare_objects(const Json::object_t& actual,
                     const Json::object_t& expected,
                     const Path& path,
                     const Config& config,
                     std::vector<Difference>& out)
{
    for (const auto& [key, expected_value] : expected) {
        const Path child = path.append_key(key);
        const auto it = actual.find(key);
        if (it == actual.end()) {
            out.push_back(Difference{.path = child,
                                     .kind = MissingKeyInActual{.expected_value = expected_value}});
            continue;
        }
        compare_into(it->second, expected_value, child, config, out);
    }

    if (config.mode != Mode::kExact) {
        return;
    }
    for (const auto& [key, actual_value] : actual) {
        if (!expected.contains(key)) {
            out.push_back(Difference{.path = path.append_key(key),
                                     .kind = ExtraKeyInActual{.actual_value = actual_value}});
        }
    }
}

void compare_arrays(const Json::array_t& actual,
                    const Json::array_t& expected,
                    const Path& path,
                    const Config& config,
                    std::vector<Difference>& out)
{
    const std::size_t common = std::min(actual.size(), expected.size());
    for (std::size_t i = 0; i < common; ++i) {
        compare_into(actual[i], expected[i], path.append_index(i), config, out);
    }

    // Absent trailing elements are treated like absent object keys.
    for (std::size_t i = common; i < expected.size(); ++i) {
        out.push_back(Difference{.path = path.append_index(i),
                                 .kind = MissingKeyInActual{.expected_value = expected[i]}});
    }

    if (config.mode != Mode::kExact || actual.size() <= expected.size()) {
        return;
    }
    if (config.array_length == ArrayLengthPolicy::kSummary) {
        out.push_back(Difference{
            .path = path,
            .kind = LengthMismatch{.actual_len = actual.size(), .expected_len = expected.size()}});
        return;
    }
    for (std::size_t i = common; i < actual.size(); ++i) {
        out.push_back(Difference{.path = path.append_index(i),
                                 .kind = ExtraKeyInActual{.actual_value = actual[i]}});
    }
}

void compare_into(const Json& actual,
                  const Json& expected,
                  const Path& path,
                  const Config& config,
                  std::vector<Difference>& out)
{
    const JsonKind actual_kind = kind_of(actual);
    const JsonKind expected_kind = kind_of(expected);
    if (actual_kind != expected_kind) {
        out.push_back(Difference{.path = path,
                                 .kind = TypeMismatch{.actual_type = actual_kind,
                                                      .expected_type = expected_kind,
                                                      .actual = actual,
                                                      .expected = expected}});
        return;
    }

    switch (expected_kind) {
        case JsonKind::kObject:
            compare_objects(actual.get_ref<const Json::object_t&>(),
                            expected.get_ref<const Json::object_t&>(),
                            path,
                            config,
                            out);
            return;
        case JsonKind::kArray:
            compare_arrays(actual.get_ref<const Json::array_t&>(),
                           expected.get_ref<const Json::array_t&>(),
                           path,
                           config,
                           out);
            return;
        case JsonKind::kNull:
        case JsonKind::kBoolean:
        case JsonKind::kNumber:
        case JsonKind::kString:
        case JsonKind::kBinary:
            if (!atoms_equal(actual, expected)) {
                out.push_back(Difference{.path = path,
                                         .kind = ValueMismatch{.actual = actual,
                                                               .expected = expected}});
            }
            return;
    }
}

}  // namespace

std::vector<Difference> compare(const nlohmann::json& actual,
                                const nlohmann::json& expected,
                                const Path& path,
                                const Config& config)
{
    std::vector<Difference> out;
    compare_into(actual, expected, path, config, out);
    return out;
}

std::vector<Difference> compare(const nlohmann::json& actual,
                                const nlohmann::json& expected,
                                const Path& path,
                                Mode mode)
{
    return compare(actual, expected, path, Config{.mode = mode});
}

std::vector<Difference>
diff(const nlohmann::json& actual, const nlohmann::json& expected, const Config& config)
{
    return compare(actual, expected, Path::root(), config);
}

std::vector<Difference> diff(const nlohmann::json& actual, const nlohmann::json& expected, Mode mode)
{
    return compare(actual, expected, Path::root(), Config{.mode = mode});
}

bool atoms_equal(const nlohmann::json& actual, const nlohmann::json& expected)
{
    if (kind_of(actual) != kind_of(expected)) {
        return false;
    }
    switch (kind_of(expected)) {
        case JsonKind::kNull:
            return true;
        case JsonKind::kBoolean:
            return actual.get<bool>() == expected.get<bool>();
        case JsonKind::kNumber:
            return numbers_equal(actual, expected);
        case JsonKind::kString:
            return actual.get_ref<const Json::string_t&>()
                   == expected.get_ref<const Json::string_t&>();
        case JsonKind::kBinary:
            return actual.get_binary() == expected.get_binary();
        case JsonKind::kArray:
        case JsonKind::kObject:
            return compare(actual, expected, Path::root(), Config{}).empty();
    }
    return false;
}

JsonKind kind_of(const nlohmann::json& value) noexcept
{
    switch (value.type()) {
        case Json::value_t::boolean:
            return JsonKind::kBoolean;
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned:
        case Json::value_t::number_float:
            return JsonKind::kNumber;
        case Json::value_t::string:
            return JsonKind::kString;
        case Json::value_t::array:
            return JsonKind::kArray;
        case Json::value_t::object:
            return JsonKind::kObject;
        case Json::value_t::binary:
            return JsonKind::kBinary;
        case Json::value_t::null:
        case Json::value_t::discarded:
            return JsonKind::kNull;
    }
    return JsonKind::kNull;
}

std::string_view kind_name(JsonKind kind) noexcept
{
    switch (kind) {
        case JsonKind::kNull:
            return "null";
        case JsonKind::kBoolean:
            return "boolean";
        case JsonKind::kNumber:
            return "number";
        case JsonKind::kString:
            return "string";
        case JsonKind::kArray:
            return "array";
        case JsonKind::kObject:
            return "object";
        case JsonKind::kBinary:
            return "binary";
    }
    return "unknown";
}

std::string_view difference_label(const DifferenceKind& kind) noexcept
{
    if (std::holds_alternative<ValueMismatch>(kind)) {
        return "value_mismatch";
    }
    if (std::holds_alternative<TypeMismatch>(kind)) {
        return "type_mismatch";
    }
    if (std::holds_alternative<MissingKeyInActual>(kind)) {
        return "missing_in_actual";
    }
    if (std::holds_alternative<ExtraKeyInActual>(kind)) {
        return "extra_in_actual";
    }
    return "length_mismatch";
}

std::string_view mode_name(Mode mode) noexcept
{
    return mode == Mode::kExact ? "exact" : "inclusive";
}

std::string_view array_length_policy_name(ArrayLengthPolicy policy) noexcept
{
    return policy == ArrayLengthPolicy::kPerElement ? "per-element" : "summary";
}

}  // namespace jsonassert::diff
