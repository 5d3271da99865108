/**
 * @file Patch.cpp
 * @brief Op equality and JSON (de)serialization
 */

#include "treemerge/Patch.hpp"
#include "treemerge/Errors.hpp"

#include <type_traits>

namespace treemerge {

// ============================================================================
// Equality
// ============================================================================

bool operator==(const AddKey& a, const AddKey& b) {
    return a.key == b.key && nodes_equal(a.value, b.value);
}

bool operator==(const RemoveKey& a, const RemoveKey& b) {
    return a.key == b.key;
}

bool operator==(const NestedPatch& a, const NestedPatch& b) {
    return a.key == b.key && a.patch == b.patch;
}

bool operator==(const Insert& a, const Insert& b) {
    return a.index == b.index && nodes_equal(a.value, b.value);
}

bool operator==(const Delete& a, const Delete& b) {
    return a.index == b.index;
}

bool operator==(const Replace& a, const Replace& b) {
    return a.index == b.index && a.patch == b.patch;
}

bool operator==(const ReplaceLeaf& a, const ReplaceLeaf& b) {
    return nodes_equal(a.old_value, b.old_value) && nodes_equal(a.new_value, b.new_value);
}

bool operator==(const Op& a, const Op& b) {
    return a.value == b.value;
}

bool operator!=(const Op& a, const Op& b) {
    return !(a == b);
}

// ============================================================================
// Classification
// ============================================================================

std::string op_name(const Op& op) {
    switch (op.kind()) {
        case OpKind::AddKey: return "addkey";
        case OpKind::RemoveKey: return "removekey";
        case OpKind::NestedPatch: return "patch";
        case OpKind::Insert: return "insert";
        case OpKind::Delete: return "delete";
        case OpKind::Replace: return "replace";
        case OpKind::ReplaceLeaf: return "replaceleaf";
        case OpKind::TextEdit: return "textedit";
    }
    return "unknown";
}

bool is_node_op(const Op& op) noexcept {
    return op.kind() == OpKind::ReplaceLeaf || op.kind() == OpKind::TextEdit;
}

bool is_mapping_op(const Op& op) noexcept {
    return op.kind() == OpKind::AddKey || op.kind() == OpKind::RemoveKey ||
           op.kind() == OpKind::NestedPatch;
}

bool is_sequence_op(const Op& op) noexcept {
    return op.kind() == OpKind::Insert || op.kind() == OpKind::Delete ||
           op.kind() == OpKind::Replace;
}

const std::string* op_key(const Op& op) noexcept {
    if (const auto* o = op.get_if<AddKey>()) return &o->key;
    if (const auto* o = op.get_if<RemoveKey>()) return &o->key;
    if (const auto* o = op.get_if<NestedPatch>()) return &o->key;
    return nullptr;
}

std::optional<std::size_t> op_index(const Op& op) noexcept {
    if (const auto* o = op.get_if<Insert>()) return o->index;
    if (const auto* o = op.get_if<Delete>()) return o->index;
    if (const auto* o = op.get_if<Replace>()) return o->index;
    return std::nullopt;
}

// ============================================================================
// Serialization
// ============================================================================

Value op_to_json(const Op& op) {
    Value out = {{"op", op_name(op)}};

    std::visit([&](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, AddKey>) {
            out["key"] = o.key;
            out["value"] = o.value->to_json();
        } else if constexpr (std::is_same_v<T, RemoveKey>) {
            out["key"] = o.key;
        } else if constexpr (std::is_same_v<T, NestedPatch>) {
            out["key"] = o.key;
            out["diff"] = patch_to_json(o.patch);
        } else if constexpr (std::is_same_v<T, Insert>) {
            out["index"] = o.index;
            out["value"] = o.value->to_json();
        } else if constexpr (std::is_same_v<T, Delete>) {
            out["index"] = o.index;
        } else if constexpr (std::is_same_v<T, Replace>) {
            out["index"] = o.index;
            out["diff"] = patch_to_json(o.patch);
        } else if constexpr (std::is_same_v<T, ReplaceLeaf>) {
            out["old"] = o.old_value->to_json();
            out["new"] = o.new_value->to_json();
        } else {
            static_assert(std::is_same_v<T, TextEdit>, "unhandled op kind");
            out["granularity"] = to_string(o.granularity);
            Value script = Value::array();
            for (const auto& span : o.script) {
                switch (span.kind) {
                    case EditSpan::Kind::Copy: script.push_back(Value{{"copy", span.count}}); break;
                    case EditSpan::Kind::Delete: script.push_back(Value{{"delete", span.text}}); break;
                    case EditSpan::Kind::Insert: script.push_back(Value{{"insert", span.text}}); break;
                }
            }
            out["script"] = std::move(script);
        }
    }, op.value);

    return out;
}

Value patch_to_json(const Patch& patch) {
    Value arr = Value::array();
    for (const auto& op : patch) {
        arr.push_back(op_to_json(op));
    }
    return arr;
}

namespace {

const Value& field(const Value& v, const char* name) {
    if (!v.contains(name)) {
        throw PatchFormatError("op " + excerpt(v) + " lacks field '" + name + "'");
    }
    return v.at(name);
}

std::string string_field(const Value& v, const char* name) {
    const auto& f = field(v, name);
    if (!f.is_string()) {
        throw PatchFormatError(std::string("field '") + name + "' must be a string");
    }
    return f.get<std::string>();
}

std::size_t count_field(const Value& f, const std::string& name) {
    if (f.is_number_unsigned()) return static_cast<std::size_t>(f.get<std::uint64_t>());
    if (f.is_number_integer() && f.get<std::int64_t>() >= 0) {
        return static_cast<std::size_t>(f.get<std::int64_t>());
    }
    throw PatchFormatError("field '" + name + "' must be a non-negative integer");
}

TextEdit text_edit_from_json(const Value& v) {
    TextEdit edit;
    std::string g = string_field(v, "granularity");
    if (g == "line") edit.granularity = TextGranularity::Line;
    else if (g == "char") edit.granularity = TextGranularity::Char;
    else throw PatchFormatError("unknown text granularity '" + g + "'");

    const auto& script = field(v, "script");
    if (!script.is_array()) {
        throw PatchFormatError("field 'script' must be an array");
    }
    for (const auto& span : script) {
        if (!span.is_object() || span.size() != 1) {
            throw PatchFormatError("edit span must be a single-key object, got " + excerpt(span));
        }
        if (span.contains("copy")) {
            edit.script.push_back(EditSpan::copy(count_field(span.at("copy"), "copy")));
        } else if (span.contains("delete") && span.at("delete").is_string()) {
            edit.script.push_back(EditSpan::remove(span.at("delete").get<std::string>()));
        } else if (span.contains("insert") && span.at("insert").is_string()) {
            edit.script.push_back(EditSpan::insert(span.at("insert").get<std::string>()));
        } else {
            throw PatchFormatError("unknown edit span " + excerpt(span));
        }
    }
    return edit;
}

} // anonymous namespace

Op op_from_json(const Value& v) {
    if (!v.is_object()) {
        throw PatchFormatError("op must be an object, got " + type_name(v));
    }
    const std::string name = string_field(v, "op");

    if (name == "addkey") {
        return AddKey{string_field(v, "key"), Node::from_json(field(v, "value"))};
    }
    if (name == "removekey") {
        return RemoveKey{string_field(v, "key")};
    }
    if (name == "patch") {
        return NestedPatch{string_field(v, "key"), patch_from_json(field(v, "diff"))};
    }
    if (name == "insert") {
        return Insert{count_field(field(v, "index"), "index"), Node::from_json(field(v, "value"))};
    }
    if (name == "delete") {
        return Delete{count_field(field(v, "index"), "index")};
    }
    if (name == "replace") {
        return Replace{count_field(field(v, "index"), "index"), patch_from_json(field(v, "diff"))};
    }
    if (name == "replaceleaf") {
        return ReplaceLeaf{Node::from_json(field(v, "old")), Node::from_json(field(v, "new"))};
    }
    if (name == "textedit") {
        return text_edit_from_json(v);
    }
    throw PatchFormatError("unknown op '" + name + "'");
}

Patch patch_from_json(const Value& v) {
    if (!v.is_array()) {
        throw PatchFormatError("patch must be an array, got " + type_name(v));
    }
    Patch patch;
    patch.reserve(v.size());
    for (const auto& item : v) {
        patch.push_back(op_from_json(item));
    }
    return patch;
}

} // namespace treemerge
