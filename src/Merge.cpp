/**
 * @file Merge.cpp
 * @brief Implementation of the three-way merge
 */

#include "treemerge/Merge.hpp"
#include "treemerge/Apply.hpp"
#include "treemerge/Diff.hpp"
#include "treemerge/Errors.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace treemerge {

namespace {

struct MergeContext {
    const MergeOptions& options;
    std::vector<Conflict> conflicts;
};

NodePtr merge_node(const NodePtr& base, const Patch& local, const Patch& remote,
                   Path& path, Path& merged_path, MergeContext& ctx);

bool has_node_op(const Patch& patch) {
    return std::any_of(patch.begin(), patch.end(), [](const Op& op) { return is_node_op(op); });
}

// Leaf-level view of a side's change, for reporting node conflicts.
Op as_node_op(const NodePtr& base, const Patch& patch, const NodePtr& realized) {
    if (patch.size() == 1 && is_node_op(patch.front())) {
        return patch.front();
    }
    return ReplaceLeaf{base, realized};
}

// ============================================================================
// Mappings
// ============================================================================

void apply_key_op(Mapping& m, const Op& op, const Path& path) {
    const std::string& key = *op_key(op);
    if (const auto* add = op.get_if<AddKey>()) {
        m[key] = add->value;
    } else if (op.kind() == OpKind::RemoveKey) {
        m.erase(key);
    } else {
        m[key] = apply_patch(m.at(key), std::get<NestedPatch>(op.value).patch,
                             child_path(path, key));
    }
}

std::map<std::string, const Op*> ops_by_key(const Patch& patch) {
    std::map<std::string, const Op*> out;
    for (const auto& op : patch) {
        out[*op_key(op)] = &op;
    }
    return out;
}

NodePtr merge_mapping(const NodePtr& base, const Patch& local, const Patch& remote,
                      Path& path, Path& merged_path, MergeContext& ctx) {
    const auto lops = ops_by_key(local);
    const auto rops = ops_by_key(remote);

    std::set<std::string> keys;
    for (const auto& kv : lops) keys.insert(kv.first);
    for (const auto& kv : rops) keys.insert(kv.first);

    Mapping m = base->as_mapping();
    for (const auto& key : keys) {
        auto li = lops.find(key);
        auto ri = rops.find(key);
        const Op* lo = li == lops.end() ? nullptr : li->second;
        const Op* ro = ri == rops.end() ? nullptr : ri->second;

        if (!ro || (lo && *lo == *ro)) {
            apply_key_op(m, *lo, path);
            continue;
        }
        if (!lo) {
            apply_key_op(m, *ro, path);
            continue;
        }

        path.emplace_back(key);
        merged_path.emplace_back(key);
        const auto* lsub = lo->get_if<NestedPatch>();
        const auto* rsub = ro->get_if<NestedPatch>();
        if (lsub && rsub) {
            m[key] = merge_node(m.at(key), lsub->patch, rsub->patch, path, merged_path, ctx);
        } else {
            ctx.conflicts.emplace_back(path, *lo, *ro, merged_path);
        }
        path.pop_back();
        merged_path.pop_back();
    }

    return Node::mapping(std::move(m));
}

// ============================================================================
// Sequences
// ============================================================================

struct SequenceOps {
    std::map<std::size_t, Sequence> inserts;
    std::map<std::size_t, const Op*> edits;
};

SequenceOps ops_by_index(const Patch& patch) {
    SequenceOps out;
    for (const auto& op : patch) {
        if (const auto* ins = op.get_if<Insert>()) {
            out.inserts[ins->index].push_back(ins->value);
        } else {
            out.edits[*op_index(op)] = &op;
        }
    }
    return out;
}

template <typename Map>
const typename Map::mapped_type* lookup(const Map& m, std::size_t index) {
    auto it = m.find(index);
    return it == m.end() ? nullptr : &it->second;
}

bool same_run(const Sequence& a, const Sequence& b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                      [](const NodePtr& x, const NodePtr& y) { return nodes_equal(x, y); });
}

bool canonical_before(const Sequence& a, const Sequence& b) {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](const NodePtr& x, const NodePtr& y) { return canonical_text(*x) < canonical_text(*y); });
}

void emit_inserts(Sequence& out, const Sequence* local, const Sequence* remote,
                  InsertOrder order) {
    const Sequence* first = local;
    const Sequence* second = remote;
    if (local && remote) {
        if (same_run(*local, *remote)) {
            second = nullptr;
        } else if (order == InsertOrder::Canonical && canonical_before(*remote, *local)) {
            std::swap(first, second);
        }
    }
    for (const Sequence* run : {first, second}) {
        if (run) out.insert(out.end(), run->begin(), run->end());
    }
}

void apply_element_op(Sequence& out, const NodePtr& element, const Op& op, const Path& path) {
    if (const auto* rep = op.get_if<Replace>()) {
        out.push_back(apply_patch(element, rep->patch, path));
    }
}

NodePtr merge_sequence(const NodePtr& base, const Patch& local, const Patch& remote,
                       Path& path, Path& merged_path, MergeContext& ctx) {
    const auto& s = base->as_sequence();
    const auto lops = ops_by_index(local);
    const auto rops = ops_by_index(remote);

    Sequence out;
    out.reserve(s.size());
    for (std::size_t i = 0;; ++i) {
        emit_inserts(out, lookup(lops.inserts, i), lookup(rops.inserts, i), ctx.options.insert_order);
        if (i == s.size()) {
            break;
        }

        const Op* const* le = lookup(lops.edits, i);
        const Op* const* re = lookup(rops.edits, i);
        const Op* lo = le ? *le : nullptr;
        const Op* ro = re ? *re : nullptr;

        if (!lo && !ro) {
            out.push_back(s[i]);
            continue;
        }
        if (!ro || (lo && *lo == *ro)) {
            apply_element_op(out, s[i], *lo, child_path(path, i));
            continue;
        }
        if (!lo) {
            apply_element_op(out, s[i], *ro, child_path(path, i));
            continue;
        }

        path.emplace_back(i);
        merged_path.emplace_back(out.size());
        const auto* lrep = lo->get_if<Replace>();
        const auto* rrep = ro->get_if<Replace>();
        if (lrep && rrep) {
            out.push_back(merge_node(s[i], lrep->patch, rrep->patch, path, merged_path, ctx));
        } else {
            ctx.conflicts.emplace_back(path, *lo, *ro, merged_path);
            out.push_back(s[i]);
        }
        path.pop_back();
        merged_path.pop_back();
    }

    return Node::sequence(std::move(out));
}

NodePtr merge_node(const NodePtr& base, const Patch& local, const Patch& remote,
                   Path& path, Path& merged_path, MergeContext& ctx) {
    if (local.empty()) return apply_patch(base, remote, path);
    if (remote.empty() || local == remote) return apply_patch(base, local, path);

    if (has_node_op(local) || has_node_op(remote)) {
        NodePtr lv = apply_patch(base, local, path);
        NodePtr rv = apply_patch(base, remote, path);
        if (nodes_equal(lv, rv)) {
            return lv;
        }
        ctx.conflicts.emplace_back(path, as_node_op(base, local, lv),
                                   as_node_op(base, remote, rv), merged_path);
        return base;
    }

    if (base->is_mapping()) {
        return merge_mapping(base, local, remote, path, merged_path, ctx);
    }
    return merge_sequence(base, local, remote, path, merged_path, ctx);
}

// ============================================================================
// Resolutions
// ============================================================================

NodePtr patch_at(const NodePtr& root, const Path& at, const Patch& patch) {
    return set_at(root, at, apply_patch(get_at(root, at), patch, at));
}

NodePtr apply_resolution(const NodePtr& root, const Conflict& c) {
    const Path& at = c.merged_path;

    if (c.resolution.state == ResolutionState::ResolvedCustom) {
        if (c.resolution.custom) {
            return set_at(root, at, c.resolution.custom);
        }
        return contains_at(root, at) ? erase_at(root, at) : root;
    }

    const Op& op = c.resolution.state == ResolutionState::ResolvedLocal ? c.local_op : c.remote_op;
    switch (op.kind()) {
        case OpKind::ReplaceLeaf:
        case OpKind::TextEdit:
            return patch_at(root, at, {op});
        case OpKind::AddKey:
            return set_at(root, at, std::get<AddKey>(op.value).value);
        case OpKind::RemoveKey:
        case OpKind::Delete:
            return erase_at(root, at);
        case OpKind::NestedPatch:
            return patch_at(root, at, std::get<NestedPatch>(op.value).patch);
        case OpKind::Replace:
            return patch_at(root, at, std::get<Replace>(op.value).patch);
        case OpKind::Insert:
            break;
    }
    throw ApplyError(to_string(at), "a resolvable conflict op", op_name(op));
}

} // anonymous namespace

MergeResult merge(const Document& base, const Patch& local, const Patch& remote,
                  const MergeOptions& options) {
    Document local_result = treemerge::apply(base, local);
    Document remote_result = treemerge::apply(base, remote);
    if (remote.empty()) return {std::move(local_result), {}};
    if (local.empty()) return {std::move(remote_result), {}};

    MergeContext ctx{options, {}};
    Path path;
    Path merged_path;
    NodePtr root = merge_node(base.root(), local, remote, path, merged_path, ctx);
    return {Document(std::move(root)), std::move(ctx.conflicts)};
}

MergeResult merge_documents(const Document& base, const Document& local, const Document& remote,
                            const DiffOptions& diff_options, const MergeOptions& merge_options) {
    return merge(base, diff(base, local, diff_options), diff(base, remote, diff_options),
                 merge_options);
}

Document finalize(const MergeResult& result) {
    std::vector<const Conflict*> order;
    for (const auto& c : result.conflicts) {
        if (c.resolved()) order.push_back(&c);
    }
    std::stable_sort(order.begin(), order.end(), [](const Conflict* a, const Conflict* b) {
        return a->merged_path > b->merged_path;
    });

    NodePtr root = result.merged.root();
    for (const Conflict* c : order) {
        try {
            root = apply_resolution(root, *c);
        } catch (const PathNotFound& e) {
            throw ApplyError(to_string(c->merged_path), "conflict placeholder", e.what());
        } catch (const PathTypeError& e) {
            throw ApplyError(to_string(c->merged_path), "conflict placeholder", e.what());
        }
    }
    return Document(std::move(root));
}

Value merge_result_to_json(const MergeResult& result) {
    return {
        {"merged", result.merged.to_json()},
        {"conflicts", conflicts_to_json(result.conflicts)}
    };
}

MergeResult merge_result_from_json(const Value& v) {
    if (!v.is_object() || !v.contains("merged")) {
        throw PatchFormatError("merge result must be an object with 'merged', got " + excerpt(v));
    }
    MergeResult result{Document::from_json(v.at("merged")), {}};
    if (v.contains("conflicts")) {
        result.conflicts = conflicts_from_json(v.at("conflicts"));
    }
    return result;
}

} // namespace treemerge
