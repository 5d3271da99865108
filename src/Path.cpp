/**
 * @file Path.cpp
 * @brief Implementation of path addressing
 */

#include "treemerge/Path.hpp"
#include "treemerge/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <sstream>

namespace treemerge {

namespace {
    /**
     * @brief Check if text is a valid index: digits only, no leading zeros
     *        except "0" itself
     */
    bool is_array_index(const std::string& text) {
        if (text.empty()) return false;
        if (text[0] == '0' && text.size() > 1) return false;
        return std::all_of(text.begin(), text.end(),
                           [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    /**
     * @brief Descend one segment, raising the traversal errors of get_at()
     * @return Child node, or nullptr if the key or index is missing
     */
    NodePtr step(const NodePtr& current, const PathSegment& seg, const Path& full) {
        if (const auto* key = std::get_if<std::string>(&seg)) {
            if (!current->is_mapping()) {
                throw PathTypeError(to_string(full), "mapping", kind_name(*current));
            }
            return current->find(*key);
        }
        if (!current->is_sequence()) {
            throw PathTypeError(to_string(full), "sequence", kind_name(*current));
        }
        return current->at(std::get<std::size_t>(seg));
    }

    using Rebuild = std::function<NodePtr(const NodePtr& parent, const PathSegment& last)>;

    /**
     * @brief Walk to the parent of the last segment and rebuild the spine
     *
     * `rebuild` produces the replacement for the parent node; every node
     * above it is copied with one child swapped.
     */
    NodePtr update_spine(const NodePtr& node, const Path& path, std::size_t depth,
                         const Rebuild& rebuild) {
        if (depth + 1 == path.size()) {
            return rebuild(node, path.back());
        }

        const auto& seg = path[depth];
        NodePtr child = step(node, seg, path);
        if (!child) {
            throw PathNotFound(to_string(path), to_string(seg));
        }
        NodePtr new_child = update_spine(child, path, depth + 1, rebuild);

        if (const auto* key = std::get_if<std::string>(&seg)) {
            Mapping m = node->as_mapping();
            m[*key] = std::move(new_child);
            return Node::mapping(std::move(m));
        }
        Sequence s = node->as_sequence();
        s[std::get<std::size_t>(seg)] = std::move(new_child);
        return Node::sequence(std::move(s));
    }
}

// ============================================================================
// Text and JSON forms
// ============================================================================

Path parse_path(const std::string& text) {
    Path path;
    std::string current;
    std::size_t i = 0;

    auto flush_key = [&]() {
        if (!current.empty()) {
            path.emplace_back(current);
            current.clear();
        }
    };

    while (i < text.size()) {
        char c = text[i];
        if (c == '.') {
            flush_key();
            ++i;
        } else if (c == '[') {
            flush_key();
            auto close = text.find(']', i);
            if (close == std::string::npos) {
                throw PatchFormatError("unbalanced '[' in path '" + text + "'");
            }
            std::string idx = text.substr(i + 1, close - i - 1);
            if (!is_array_index(idx)) {
                throw PatchFormatError("invalid index '" + idx + "' in path '" + text + "'");
            }
            path.emplace_back(static_cast<std::size_t>(std::stoull(idx)));
            i = close + 1;
        } else {
            current += c;
            ++i;
        }
    }
    flush_key();

    return path;
}

std::string to_string(const PathSegment& segment) {
    if (const auto* key = std::get_if<std::string>(&segment)) {
        return *key;
    }
    return "[" + std::to_string(std::get<std::size_t>(segment)) + "]";
}

std::string to_string(const Path& path) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (const auto* key = std::get_if<std::string>(&path[i])) {
            if (i > 0) oss << '.';
            oss << *key;
        } else {
            oss << '[' << std::get<std::size_t>(path[i]) << ']';
        }
    }
    return oss.str();
}

std::string path_pattern(const Path& path) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (const auto* key = std::get_if<std::string>(&path[i])) {
            if (i > 0) oss << '.';
            oss << *key;
        } else {
            oss << "[*]";
        }
    }
    return oss.str();
}

Path child_path(const Path& path, PathSegment segment) {
    Path out = path;
    out.push_back(std::move(segment));
    return out;
}

Value path_to_json(const Path& path) {
    Value arr = Value::array();
    for (const auto& seg : path) {
        if (const auto* key = std::get_if<std::string>(&seg)) {
            arr.push_back(*key);
        } else {
            arr.push_back(std::get<std::size_t>(seg));
        }
    }
    return arr;
}

Path path_from_json(const Value& v) {
    if (!v.is_array()) {
        throw PatchFormatError("path must be an array, got " + type_name(v));
    }
    Path path;
    for (const auto& seg : v) {
        if (seg.is_string()) {
            path.emplace_back(seg.get<std::string>());
        } else if (seg.is_number_unsigned()) {
            path.emplace_back(static_cast<std::size_t>(seg.get<std::uint64_t>()));
        } else if (seg.is_number_integer() && seg.get<std::int64_t>() >= 0) {
            path.emplace_back(static_cast<std::size_t>(seg.get<std::int64_t>()));
        } else {
            throw PatchFormatError("invalid path segment " + excerpt(seg));
        }
    }
    return path;
}

// ============================================================================
// Read access
// ============================================================================

NodePtr find_at(const NodePtr& root, const Path& path) {
    NodePtr current = root;
    for (const auto& seg : path) {
        current = step(current, seg, path);
        if (!current) return nullptr;
    }
    return current;
}

NodePtr get_at(const NodePtr& root, const Path& path) {
    NodePtr current = root;
    for (const auto& seg : path) {
        NodePtr next = step(current, seg, path);
        if (!next) {
            throw PathNotFound(to_string(path), to_string(seg));
        }
        current = std::move(next);
    }
    return current;
}

bool contains_at(const NodePtr& root, const Path& path) {
    return find_at(root, path) != nullptr;
}

// ============================================================================
// Immutable update
// ============================================================================

NodePtr set_at(const NodePtr& root, const Path& path, NodePtr value) {
    if (path.empty()) {
        return value;
    }

    return update_spine(root, path, 0,
        [&](const NodePtr& parent, const PathSegment& last) -> NodePtr {
            if (const auto* key = std::get_if<std::string>(&last)) {
                if (!parent->is_mapping()) {
                    throw PathTypeError(to_string(path), "mapping", kind_name(*parent));
                }
                Mapping m = parent->as_mapping();
                m[*key] = value;
                return Node::mapping(std::move(m));
            }

            if (!parent->is_sequence()) {
                throw PathTypeError(to_string(path), "sequence", kind_name(*parent));
            }
            const auto idx = std::get<std::size_t>(last);
            Sequence s = parent->as_sequence();
            if (idx < s.size()) {
                s[idx] = value;
            } else if (idx == s.size()) {
                s.push_back(value);
            } else {
                throw PathNotFound(to_string(path), to_string(last) + " (index out of range)");
            }
            return Node::sequence(std::move(s));
        });
}

NodePtr erase_at(const NodePtr& root, const Path& path) {
    if (path.empty()) {
        throw PathNotFound("", "<root>");
    }

    return update_spine(root, path, 0,
        [&](const NodePtr& parent, const PathSegment& last) -> NodePtr {
            if (const auto* key = std::get_if<std::string>(&last)) {
                if (!parent->is_mapping()) {
                    throw PathTypeError(to_string(path), "mapping", kind_name(*parent));
                }
                Mapping m = parent->as_mapping();
                if (m.erase(*key) == 0) {
                    throw PathNotFound(to_string(path), *key);
                }
                return Node::mapping(std::move(m));
            }

            if (!parent->is_sequence()) {
                throw PathTypeError(to_string(path), "sequence", kind_name(*parent));
            }
            const auto idx = std::get<std::size_t>(last);
            Sequence s = parent->as_sequence();
            if (idx >= s.size()) {
                throw PathNotFound(to_string(path), to_string(last) + " (index out of range)");
            }
            s.erase(s.begin() + static_cast<std::ptrdiff_t>(idx));
            return Node::sequence(std::move(s));
        });
}

} // namespace treemerge
