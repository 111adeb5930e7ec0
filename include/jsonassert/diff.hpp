#pragma once

/**
 * @file diff.hpp
 * @brief Structural comparison of two JSON values
 *
 * The comparator walks `expected` and `actual` together and records every
 * location where they disagree under the selected mode:
 * - kExact: both sides must match completely
 * - kInclusive: `actual` may carry object keys and trailing array elements
 *   that `expected` does not mention
 *
 * Differences come out depth-first, object keys in iteration order of
 * `expected` (then extra `actual` keys in exact mode), array elements by index.
 * Comparison is total: it never throws and never mutates its inputs.
 */

#include "jsonassert/path.hpp"

#include <cstddef>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace jsonassert::diff {

/**
 * Comparison mode
 *
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class Mode {
    kExact,     ///< Extra keys/elements in actual are differences
    kInclusive  ///< Extra keys/elements in actual are ignored
};

/**
 * How exact mode reports array elements that only `actual` has
 */
enum class ArrayLengthPolicy {
    kPerElement,  ///< One ExtraKeyInActual per extra index
    kSummary      ///< One LengthMismatch at the array path
};

struct Config
{
    Mode mode = Mode::kExact;
    ArrayLengthPolicy array_length = ArrayLengthPolicy::kPerElement;
};

/**
 * JSON kind of a value. Values of different kinds never recurse.
 */
enum class JsonKind { kNull, kBoolean, kNumber, kString, kArray, kObject, kBinary };

struct ValueMismatch
{
    nlohmann::json actual;
    nlohmann::json expected;

    friend bool operator==(const ValueMismatch&, const ValueMismatch&) = default;
};

struct TypeMismatch
{
    JsonKind actual_type;
    JsonKind expected_type;
    nlohmann::json actual;
    nlohmann::json expected;

    friend bool operator==(const TypeMismatch&, const TypeMismatch&) = default;
};

struct MissingKeyInActual
{
    nlohmann::json expected_value;

    friend bool operator==(const MissingKeyInActual&, const MissingKeyInActual&) = default;
};

struct ExtraKeyInActual
{
    nlohmann::json actual_value;

    friend bool operator==(const ExtraKeyInActual&, const ExtraKeyInActual&) = default;
};

struct LengthMismatch
{
    std::size_t actual_len;
    std::size_t expected_len;

    friend bool operator==(const LengthMismatch&, const LengthMismatch&) = default;
};

using DifferenceKind =
    std::variant<ValueMismatch, TypeMismatch, MissingKeyInActual, ExtraKeyInActual, LengthMismatch>;

struct Difference
{
    Path path;
    DifferenceKind kind;

    friend bool operator==(const Difference&, const Difference&) = default;
};

/**
 * Compare `actual` against `expected` below `path`.
 *
 * @param actual Value under test
 * @param expected Value the caller specified
 * @param path Location of both values; Path::root() for a whole document
 * @param config Mode and array length policy, inherited by every recursive step
 * @return Differences in traversal order, empty when the values match
 */
[[nodiscard]] std::vector<Difference> compare(const nlohmann::json& actual,
                                              const nlohmann::json& expected,
                                              const Path& path,
                                              const Config& config);

[[nodiscard]] std::vector<Difference> compare(const nlohmann::json& actual,
                                              const nlohmann::json& expected,
                                              const Path& path,
                                              Mode mode);

/**
 * compare() at the root path
 */
[[nodiscard]] std::vector<Difference>
diff(const nlohmann::json& actual, const nlohmann::json& expected, const Config& config);

[[nodiscard]] std::vector<Difference>
diff(const nlohmann::json& actual, const nlohmann::json& expected, Mode mode);

/**
 * Equality of two values of the same atom kind.
 * Integers never equal floats; signed and unsigned integers compare by value.
 */
[[nodiscard]] bool atoms_equal(const nlohmann::json& actual, const nlohmann::json& expected);

[[nodiscard]] JsonKind kind_of(const nlohmann::json& value) noexcept;

[[nodiscard]] std::string_view kind_name(JsonKind kind) noexcept;

/// Stable snake_case label of a difference kind ("value_mismatch", ...)
[[nodiscard]] std::string_view difference_label(const DifferenceKind& kind) noexcept;

[[nodiscard]] std::string_view mode_name(Mode mode) noexcept;

[[nodiscard]] std::string_view array_length_policy_name(ArrayLengthPolicy policy) noexcept;

}  // namespace jsonassert::diff
