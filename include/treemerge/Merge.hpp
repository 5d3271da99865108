/**
 * @file Merge.hpp
 * @brief Three-way merge of two patches against a common base
 *
 * Merging rules, applied recursively from the root:
 * - a location changed by one side only takes that side's change
 * - identical changes from both sides are applied once
 * - both sides patching the same key or element recurse into it, so
 *   conflicts land on the smallest divergent subtree
 * - AddKey/AddKey with different values, RemoveKey against NestedPatch,
 *   Delete against Replace, and a leaf-level op against any different
 *   change are conflicts; the merged document keeps the base value there
 * - inserts from both sides into the same gap never conflict: identical
 *   runs are kept once, otherwise both runs are kept in InsertOrder
 *
 * Example:
 * ```cpp
 * auto base = Document::from_json({{"cells", {"a", "b"}}});
 * auto result = merge_documents(base,
 *     Document::from_json({{"cells", {"a", "x"}}}),
 *     Document::from_json({{"cells", {"a", "y"}}}));
 * // result.merged == base, one conflict at cells[1]
 * result.conflicts[0].resolve_remote();
 * Document done = finalize(result);   // {"cells": ["a", "y"]}
 * ```
 */

#ifndef TREEMERGE_MERGE_HPP
#define TREEMERGE_MERGE_HPP

#include "treemerge/Conflict.hpp"
#include "treemerge/Document.hpp"
#include "treemerge/Options.hpp"
#include "treemerge/Patch.hpp"

#include <vector>

namespace treemerge {

struct MergeResult {
    Document merged;
    std::vector<Conflict> conflicts;

    bool clean() const noexcept { return conflicts.empty(); }
};

/**
 * @brief Merge `local` and `remote`, both diffs of `base`
 * @throws ApplyError if either patch does not apply to `base`
 */
MergeResult merge(const Document& base, const Patch& local, const Patch& remote,
                  const MergeOptions& options = {});

/**
 * @brief Diff both branches against `base`, then merge
 * @throws AlignmentCancelled if a diff is cancelled
 */
MergeResult merge_documents(const Document& base, const Document& local, const Document& remote,
                            const DiffOptions& diff_options = {},
                            const MergeOptions& merge_options = {});

/**
 * @brief Merged document with every resolved conflict applied
 *
 * Conflicts are applied deepest and rightmost first so that removals do
 * not shift the merged paths of conflicts still pending. Unresolved
 * conflicts keep their base placeholder.
 *
 * @throws ApplyError if a resolution no longer fits the merged document
 */
Document finalize(const MergeResult& result);

Value merge_result_to_json(const MergeResult& result);

/**
 * @brief Parse {"merged": ..., "conflicts": [...]}
 * @throws PatchFormatError on malformed input
 */
MergeResult merge_result_from_json(const Value& v);

} // namespace treemerge

#endif // TREEMERGE_MERGE_HPP
