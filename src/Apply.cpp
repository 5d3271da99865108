/**
 * @file Apply.cpp
 * @brief Validating patch application
 */

#include "treemerge/Apply.hpp"
#include "treemerge/Errors.hpp"

namespace treemerge {

namespace {

NodePtr apply_node_op(const NodePtr& node, const Patch& patch, const Path& path) {
    if (patch.size() != 1) {
        throw ApplyError(to_string(path), "a single replaceleaf or textedit op",
                         std::to_string(patch.size()) + " ops mixed with it");
    }
    const Op& op = patch.front();

    if (const auto* rep = op.get_if<ReplaceLeaf>()) {
        if (!rep->old_value || !rep->new_value) {
            throw ApplyError(to_string(path), "replaceleaf with old and new values",
                             "missing value");
        }
        if (!nodes_equal(node, rep->old_value)) {
            throw ApplyError(to_string(path), describe(*rep->old_value), describe(*node));
        }
        return rep->new_value;
    }

    const auto& edit = std::get<TextEdit>(op.value);
    if (!node->is_text()) {
        throw ApplyError(to_string(path), "text", describe(*node));
    }
    return Node::text(apply_text_edit(node->as_text(), edit, to_string(path)));
}

NodePtr apply_mapping(const NodePtr& node, const Patch& patch, const Path& path) {
    Mapping m = node->as_mapping();
    const std::string* previous = nullptr;

    for (const auto& op : patch) {
        if (!is_mapping_op(op)) {
            throw ApplyError(to_string(path), "mapping op", op_name(op) + " on a mapping");
        }
        const std::string& key = *op_key(op);
        const Path child = child_path(path, key);

        if (previous && key == *previous) {
            throw ApplyError(to_string(child), "one op per key", "another " + op_name(op));
        }
        if (previous && key < *previous) {
            throw ApplyError(to_string(child), "ops in key order",
                             op_name(op) + " after key \"" + *previous + "\"");
        }
        previous = &key;

        auto it = m.find(key);
        if (const auto* add = op.get_if<AddKey>()) {
            if (it != m.end()) {
                throw ApplyError(to_string(child), "absent key", describe(*it->second));
            }
            if (!add->value) {
                throw ApplyError(to_string(child), "a value to add", "missing value");
            }
            m.emplace(key, add->value);
            continue;
        }

        if (it == m.end()) {
            throw ApplyError(to_string(child), "existing key for " + op_name(op), "absent key");
        }
        if (op.kind() == OpKind::RemoveKey) {
            m.erase(it);
        } else {
            it->second = apply_patch(it->second, std::get<NestedPatch>(op.value).patch, child);
        }
    }

    return Node::mapping(std::move(m));
}

NodePtr apply_sequence(const NodePtr& node, const Patch& patch, const Path& path) {
    const auto& s = node->as_sequence();
    Sequence out;
    out.reserve(s.size() + patch.size());

    // Base elements before `next` are already copied, dropped or patched.
    std::size_t next = 0;
    auto copy_until = [&](std::size_t end) {
        for (; next < end; ++next) out.push_back(s[next]);
    };

    for (const auto& op : patch) {
        if (!is_sequence_op(op)) {
            throw ApplyError(to_string(path), "sequence op", op_name(op) + " on a sequence");
        }
        const std::size_t idx = *op_index(op);
        const Path child = child_path(path, idx);

        if (idx < next) {
            throw ApplyError(to_string(child), "ops in index order",
                             op_name(op) + " after element " + std::to_string(next - 1) +
                                 " was consumed");
        }

        if (const auto* ins = op.get_if<Insert>()) {
            if (idx > s.size()) {
                throw ApplyError(to_string(child),
                                 "insert position <= " + std::to_string(s.size()),
                                 "position " + std::to_string(idx));
            }
            if (!ins->value) {
                throw ApplyError(to_string(child), "a value to insert", "missing value");
            }
            copy_until(idx);
            out.push_back(ins->value);
            continue;
        }

        if (idx >= s.size()) {
            throw ApplyError(to_string(child),
                             "element index < " + std::to_string(s.size()),
                             "index " + std::to_string(idx));
        }
        copy_until(idx);
        if (const auto* rep = op.get_if<Replace>()) {
            out.push_back(apply_patch(s[idx], rep->patch, child));
        }
        next = idx + 1;
    }
    copy_until(s.size());

    return Node::sequence(std::move(out));
}

} // anonymous namespace

NodePtr apply_patch(const NodePtr& node, const Patch& patch, const Path& path) {
    if (!node) {
        throw ApplyError(to_string(path), "a node", "nothing");
    }
    if (patch.empty()) {
        return node;
    }

    for (const auto& op : patch) {
        if (is_node_op(op)) {
            return apply_node_op(node, patch, path);
        }
    }

    switch (node->kind()) {
        case NodeKind::Mapping:
            return apply_mapping(node, patch, path);
        case NodeKind::Sequence:
            return apply_sequence(node, patch, path);
        case NodeKind::Leaf:
            break;
    }
    throw ApplyError(to_string(path), op_name(patch.front()) + " target (mapping or sequence)",
                     describe(*node));
}

Document apply(const Document& doc, const Patch& patch) {
    return Document(apply_patch(doc.root(), patch));
}

} // namespace treemerge
