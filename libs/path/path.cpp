/**
 * @file path.cpp
 * @brief Immutable JSON tree paths with shared ancestors
 */

#include "jsonassert/path.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <string>
#include <vector>

namespace jsonassert {

namespace {

void render_segment(std::string& out, const Segment& segment)
{
    if (const auto* key = std::get_if<KeySegment>(&segment)) {
        // ".<empty>" would read as the root path
        if (key->name.empty()) {
            out += R"([""])";
            return;
        }
        out += '.';
        out += key->name;
        return;
    }
    std::format_to(std::back_inserter(out), "[{}]", std::get<IndexSegment>(segment).index);
}

}  // namespace

Path Path::append_key(std::string_view name) const
{
    return append(KeySegment{.name = std::string(name)});
}

Path Path::append_index(std::size_t index) const
{
    return append(IndexSegment{.index = index});
}

Path Path::append(Segment segment) const
{
    return Path(std::make_shared<const Node>(
        Node{.segment = std::move(segment), .parent = m_tail, .depth = depth() + 1}));
}

std::size_t Path::depth() const noexcept
{
    return m_tail ? m_tail->depth : 0;
}

std::vector<Segment> Path::segments() const
{
    std::vector<Segment> result;
    result.reserve(depth());
    for (const Node* node = m_tail.get(); node != nullptr; node = node->parent.get()) {
        result.push_back(node->segment);
    }
    std::ranges::reverse(result);
    return result;
}

std::string Path::render() const
{
    if (is_root()) {
        return std::string(kRootPathText);
    }
    std::string out;
    for (const auto& segment : segments()) {
        render_segment(out, segment);
    }
    return out;
}

nlohmann::json::json_pointer Path::to_json_pointer() const
{
    nlohmann::json::json_pointer pointer;
    for (const auto& segment : segments()) {
        if (const auto* key = std::get_if<KeySegment>(&segment)) {
            pointer /= key->name;
        } else {
            pointer /= std::get<IndexSegment>(segment).index;
        }
    }
    return pointer;
}

bool operator==(const Path& lhs, const Path& rhs)
{
    if (lhs.depth() != rhs.depth()) {
        return false;
    }
    const Path::Node* a = lhs.m_tail.get();
    const Path::Node* b = rhs.m_tail.get();
    while (a != nullptr && a != b) {
        if (a->segment != b->segment) {
            return false;
        }
        a = a->parent.get();
        b = b->parent.get();
    }
    return true;
}

}  // namespace jsonassert
