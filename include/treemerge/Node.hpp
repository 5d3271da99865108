/**
 * @file Node.hpp
 * @brief Immutable document tree nodes
 *
 * A Node is one of:
 * - Mapping: key -> Node, keys unique, iterated in key order
 * - Sequence: ordered list of Node
 * - Leaf: scalar (text, integer, float, boolean, null)
 *
 * Nodes are never modified after construction and are always held through
 * NodePtr (shared_ptr to const), so versions of a document share every
 * subtree they have in common.
 */

#ifndef TREEMERGE_NODE_HPP
#define TREEMERGE_NODE_HPP

#include "treemerge/Value.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace treemerge {

class Node;

using NodePtr = std::shared_ptr<const Node>;
using Mapping = std::map<std::string, NodePtr>;
using Sequence = std::vector<NodePtr>;
using Scalar = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string>;

enum class NodeKind {
    Mapping,
    Sequence,
    Leaf
};

/**
 * @brief One element of a document tree
 */
class Node {
public:
    explicit Node(Mapping m) : data_(std::move(m)) {}
    explicit Node(Sequence s) : data_(std::move(s)) {}
    explicit Node(Scalar v) : data_(std::move(v)) {}

    static NodePtr mapping(Mapping m = {});
    static NodePtr sequence(Sequence s = {});
    static NodePtr leaf(Scalar v);
    static NodePtr text(std::string s);
    static NodePtr null();

    /**
     * @brief Build a tree from a JSON value
     *
     * Unsigned integers that fit in int64 become integer leaves; larger
     * ones become float leaves.
     *
     * @throws SchemaMismatch for JSON values with no node counterpart
     *         (binary, discarded)
     */
    static NodePtr from_json(const Value& v);

    /// Convert back to the external JSON representation.
    Value to_json() const;

    NodeKind kind() const noexcept;
    bool is_mapping() const noexcept { return std::holds_alternative<Mapping>(data_); }
    bool is_sequence() const noexcept { return std::holds_alternative<Sequence>(data_); }
    bool is_leaf() const noexcept { return std::holds_alternative<Scalar>(data_); }
    bool is_text() const noexcept;

    /**
     * @brief Typed accessors
     * @throws PathTypeError if the node is of another kind
     */
    const Mapping& as_mapping() const;
    const Sequence& as_sequence() const;
    const Scalar& as_scalar() const;
    const std::string& as_text() const;

    /// Number of children; 0 for leaves.
    std::size_t size() const noexcept;

    /// Child under `key`, or nullptr if absent or not a mapping.
    NodePtr find(const std::string& key) const;

    /// Element at `index`, or nullptr if out of range or not a sequence.
    NodePtr at(std::size_t index) const;

private:
    std::variant<Mapping, Sequence, Scalar> data_;
};

/**
 * @brief Kind name used in diagnostics
 * @return "mapping", "sequence", "text", "integer", "float", "boolean" or "null"
 */
std::string kind_name(const Node& node);

/**
 * @brief True when two nodes have the same kind and, for leaves, the same
 *        scalar type
 */
bool same_shape(const Node& a, const Node& b);

/**
 * @brief Deep structural equality
 *
 * Identical pointers short-circuit. Integer and float leaves never compare
 * equal to each other.
 */
bool nodes_equal(const Node& a, const Node& b);
bool nodes_equal(const NodePtr& a, const NodePtr& b);

inline bool operator==(const Node& a, const Node& b) { return nodes_equal(a, b); }
inline bool operator!=(const Node& a, const Node& b) { return !nodes_equal(a, b); }

/// Copy of `node` that shares no subtree with it.
NodePtr deep_clone(const NodePtr& node);

/// Compact JSON text of the node, with keys in order.
std::string canonical_text(const Node& node);

/// Short excerpt of the node for error messages.
std::string describe(const Node& node);

} // namespace treemerge

#endif // TREEMERGE_NODE_HPP
