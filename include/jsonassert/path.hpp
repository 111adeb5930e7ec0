#pragma once

/**
 * @file path.hpp
 * @brief Location of a value inside a JSON tree
 *
 * A Path is an immutable sequence of segments. Appending returns a new Path
 * whose tail node points at the receiver's nodes, so sibling paths share their
 * common ancestors and a parent is never changed by a child.
 *
 * Rendering: keys as ".name", indices as "[n]", the root path as ".".
 * The empty key renders as `[""]` so no non-root path renders as ".".
 */

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace jsonassert {

struct KeySegment
{
    std::string name;

    friend bool operator==(const KeySegment&, const KeySegment&) = default;
};

struct IndexSegment
{
    std::size_t index;

    friend bool operator==(const IndexSegment&, const IndexSegment&) = default;
};

using Segment = std::variant<KeySegment, IndexSegment>;

/// Rendered form of the root path
constexpr std::string_view kRootPathText = ".";

class Path
{
public:
    /// Root path
    Path() = default;

    [[nodiscard]] static Path root() { return Path{}; }

    [[nodiscard]] Path append_key(std::string_view name) const;
    [[nodiscard]] Path append_index(std::size_t index) const;
    [[nodiscard]] Path append(Segment segment) const;

    [[nodiscard]] bool is_root() const noexcept { return m_tail == nullptr; }
    [[nodiscard]] std::size_t depth() const noexcept;

    /**
     * Segments from root to leaf
     */
    [[nodiscard]] std::vector<Segment> segments() const;

    /**
     * Canonical report form, e.g. ".data.users[0].country.name"
     */
    [[nodiscard]] std::string render() const;

    /**
     * RFC 6901 pointer addressing the same location, e.g. "/data/users/0"
     */
    [[nodiscard]] nlohmann::json::json_pointer to_json_pointer() const;

    friend bool operator==(const Path& lhs, const Path& rhs);

private:
    struct Node
    {
        Segment segment;
        std::shared_ptr<const Node> parent;
        std::size_t depth;
    };

    explicit Path(std::shared_ptr<const Node> tail)
        : m_tail(std::move(tail))
    {}

    std::shared_ptr<const Node> m_tail;
};

}  // namespace jsonassert
