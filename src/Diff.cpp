/**
 * @file Diff.cpp
 * @brief Recursive structural diff
 */

#include "treemerge/Diff.hpp"
#include "treemerge/Align.hpp"
#include "treemerge/Errors.hpp"
#include "treemerge/Similarity.hpp"

namespace treemerge {

namespace {

/**
 * @brief State of one diff call
 *
 * The budget clock starts when the context is built; the similarity cache
 * lives exactly as long as the call.
 */
struct DiffContext {
    explicit DiffContext(const DiffOptions& o)
        : options(o)
        , budget(o.make_budget())
    {}

    const DiffOptions& options;
    Budget budget;
    SimilarityCache cache;
};

Patch diff_node(const NodePtr& a, const NodePtr& b, Path& path, DiffContext& ctx);

Patch diff_mapping(const Node& a, const Node& b, Path& path, DiffContext& ctx) {
    Patch out;
    const auto& ma = a.as_mapping();
    const auto& mb = b.as_mapping();

    auto ia = ma.begin();
    auto ib = mb.begin();
    while (ia != ma.end() || ib != mb.end()) {
        if (ib == mb.end() || (ia != ma.end() && ia->first < ib->first)) {
            out.push_back(RemoveKey{ia->first});
            ++ia;
        } else if (ia == ma.end() || ib->first < ia->first) {
            out.push_back(AddKey{ib->first, ib->second});
            ++ib;
        } else {
            if (!nodes_equal(ia->second, ib->second)) {
                path.emplace_back(ia->first);
                Patch sub = diff_node(ia->second, ib->second, path, ctx);
                path.pop_back();
                if (!sub.empty()) {
                    out.push_back(NestedPatch{ia->first, std::move(sub)});
                }
            }
            ++ia;
            ++ib;
        }
    }
    return out;
}

std::vector<IndexPredicate> sequence_levels(const Sequence& sa, const Sequence& sb,
                                            const Path& path, DiffContext& ctx) {
    std::vector<IndexPredicate> levels;

    auto custom = ctx.options.sequence_predicates.find(path_pattern(path));
    if (custom != ctx.options.sequence_predicates.end()) {
        for (const auto& pred : custom->second) {
            levels.push_back([&sa, &sb, &ctx, pred](std::size_t i, std::size_t j) {
                return pred(*sa[i], *sb[j], ctx.budget);
            });
        }
        return levels;
    }

    levels.push_back([&sa, &sb](std::size_t i, std::size_t j) {
        return nodes_equal(sa[i], sb[j]);
    });

    levels.push_back([&sa, &sb, &ctx](std::size_t i, std::size_t j) {
        const Node& x = *sa[i];
        const Node& y = *sb[j];
        if (!same_shape(x, y)) return false;
        return strings_are_similar(ctx.cache.text_of(x), ctx.cache.text_of(y),
                                   ctx.options.similarity_threshold, ctx.budget);
    });

    if (ctx.options.pair_same_kind) {
        levels.push_back([&sa, &sb](std::size_t i, std::size_t j) {
            return same_shape(*sa[i], *sb[j]);
        });
    }
    return levels;
}

Patch diff_sequence(const Node& a, const Node& b, Path& path, DiffContext& ctx) {
    ctx.budget.check();

    const auto& sa = a.as_sequence();
    const auto& sb = b.as_sequence();

    const auto levels = sequence_levels(sa, sb, path, ctx);
    auto runs = align_multilevel(sa.size(), sb.size(), levels, ctx.budget);
    runs.push_back(MatchRun{sa.size(), sb.size(), 0});

    Patch out;
    std::size_t ci = 0;
    std::size_t cj = 0;
    for (const auto& r : runs) {
        for (std::size_t i = ci; i < r.base; ++i) {
            out.push_back(Delete{i});
        }
        for (std::size_t j = cj; j < r.target; ++j) {
            out.push_back(Insert{r.base, sb[j]});
        }
        for (std::size_t k = 0; k < r.length; ++k) {
            const std::size_t i = r.base + k;
            const std::size_t j = r.target + k;
            if (nodes_equal(sa[i], sb[j])) continue;

            path.emplace_back(i);
            Patch sub = diff_node(sa[i], sb[j], path, ctx);
            path.pop_back();
            if (!sub.empty()) {
                out.push_back(Replace{i, std::move(sub)});
            }
        }
        ci = r.base + r.length;
        cj = r.target + r.length;
    }
    return out;
}

Patch diff_node(const NodePtr& a, const NodePtr& b, Path& path, DiffContext& ctx) {
    if (!a || !b) {
        throw SchemaMismatch(to_string(path),
                             a ? kind_name(*a) : "missing node",
                             b ? kind_name(*b) : "missing node");
    }
    if (nodes_equal(a, b)) {
        return {};
    }
    if (a->kind() != b->kind()) {
        return {ReplaceLeaf{a, b}};
    }

    switch (a->kind()) {
        case NodeKind::Mapping:
            return diff_mapping(*a, *b, path, ctx);
        case NodeKind::Sequence:
            return diff_sequence(*a, *b, path, ctx);
        case NodeKind::Leaf:
            break;
    }

    if (a->is_text() && b->is_text()) {
        const auto& ta = a->as_text();
        const auto& tb = b->as_text();
        return {diff_text(ta, tb, choose_granularity(ta, tb, ctx.options.text_mode), ctx.budget)};
    }
    return {ReplaceLeaf{a, b}};
}

} // anonymous namespace

Patch diff_nodes(const NodePtr& base, const NodePtr& target, const DiffOptions& options) {
    DiffContext ctx(options);
    Path path;
    return diff_node(base, target, path, ctx);
}

Patch diff(const Document& base, const Document& target, const DiffOptions& options) {
    return diff_nodes(base.root(), target.root(), options);
}

} // namespace treemerge
