/**
 * @file Patch.hpp
 * @brief Patch and Op value types
 *
 * A Patch is the ordered list of Ops that transforms one node into another.
 * Ops nest: NestedPatch and Replace carry the Patch for a child, so a Patch
 * addresses paths implicitly.
 *
 * Mapping ops (ordered by key):
 * - AddKey(key, value): key must be absent
 * - RemoveKey(key): key must be present
 * - NestedPatch(key, patch): patch the value under key
 *
 * Sequence ops (ordered by index; indices refer to the base sequence;
 * at one index, Inserts come before the Delete or Replace of that element):
 * - Insert(index, value): insert before base element index (index == size
 *   appends)
 * - Delete(index): drop base element index
 * - Replace(index, patch): patch base element index
 *
 * Node ops (alone in their Patch):
 * - ReplaceLeaf(old, new): replace the whole node, also used when the node
 *   kind changes
 * - TextEdit(script): edit a text leaf
 *
 * JSON form: an array of objects tagged by "op":
 * ```json
 * [{"op": "addkey", "key": "k", "value": 1},
 *  {"op": "removekey", "key": "k"},
 *  {"op": "patch", "key": "k", "diff": [...]},
 *  {"op": "insert", "index": 0, "value": "x"},
 *  {"op": "delete", "index": 0},
 *  {"op": "replace", "index": 0, "diff": [...]},
 *  {"op": "replaceleaf", "old": 1, "new": 2},
 *  {"op": "textedit", "granularity": "char",
 *   "script": [{"copy": 2}, {"delete": "b"}, {"insert": "x"}]}]
 * ```
 */

#ifndef TREEMERGE_PATCH_HPP
#define TREEMERGE_PATCH_HPP

#include "treemerge/Node.hpp"
#include "treemerge/TextDiff.hpp"
#include "treemerge/Value.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace treemerge {

struct Op;
using Patch = std::vector<Op>;

struct AddKey {
    std::string key;
    NodePtr value;
};

struct RemoveKey {
    std::string key;
};

struct NestedPatch {
    std::string key;
    Patch patch;
};

struct Insert {
    std::size_t index = 0;
    NodePtr value;
};

struct Delete {
    std::size_t index = 0;
};

struct Replace {
    std::size_t index = 0;
    Patch patch;
};

struct ReplaceLeaf {
    NodePtr old_value;
    NodePtr new_value;
};

/// Order matches the alternatives of Op::Variant.
enum class OpKind {
    AddKey,
    RemoveKey,
    NestedPatch,
    Insert,
    Delete,
    Replace,
    ReplaceLeaf,
    TextEdit
};

/**
 * @brief One edit; a tagged union over the op structs above
 */
struct Op {
    using Variant = std::variant<AddKey, RemoveKey, NestedPatch, Insert,
                                 Delete, Replace, ReplaceLeaf, TextEdit>;

    Op(AddKey op) : value(std::move(op)) {}
    Op(RemoveKey op) : value(std::move(op)) {}
    Op(NestedPatch op) : value(std::move(op)) {}
    Op(Insert op) : value(std::move(op)) {}
    Op(Delete op) : value(std::move(op)) {}
    Op(Replace op) : value(std::move(op)) {}
    Op(ReplaceLeaf op) : value(std::move(op)) {}
    Op(TextEdit op) : value(std::move(op)) {}

    OpKind kind() const noexcept { return static_cast<OpKind>(value.index()); }

    template <typename T>
    const T* get_if() const noexcept { return std::get_if<T>(&value); }

    Variant value;
};

bool operator==(const AddKey& a, const AddKey& b);
bool operator==(const RemoveKey& a, const RemoveKey& b);
bool operator==(const NestedPatch& a, const NestedPatch& b);
bool operator==(const Insert& a, const Insert& b);
bool operator==(const Delete& a, const Delete& b);
bool operator==(const Replace& a, const Replace& b);
bool operator==(const ReplaceLeaf& a, const ReplaceLeaf& b);
bool operator==(const Op& a, const Op& b);
bool operator!=(const Op& a, const Op& b);

/// "addkey", "removekey", "patch", "insert", "delete", "replace", "replaceleaf" or "textedit".
std::string op_name(const Op& op);

/// ReplaceLeaf and TextEdit address the node itself.
bool is_node_op(const Op& op) noexcept;
bool is_mapping_op(const Op& op) noexcept;
bool is_sequence_op(const Op& op) noexcept;

/// Key of a mapping op, or nullptr.
const std::string* op_key(const Op& op) noexcept;

/// Index of a sequence op.
std::optional<std::size_t> op_index(const Op& op) noexcept;

Value op_to_json(const Op& op);
Value patch_to_json(const Patch& patch);

/**
 * @brief Decode the JSON form
 * @throws PatchFormatError on unknown tags, missing fields or wrong types
 */
Op op_from_json(const Value& v);
Patch patch_from_json(const Value& v);

} // namespace treemerge

#endif // TREEMERGE_PATCH_HPP
