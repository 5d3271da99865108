/**
 * @file Diff.hpp
 * @brief Structural diff of two documents
 *
 * Rules, applied recursively:
 * - equal nodes produce no ops
 * - nodes of different kinds produce ReplaceLeaf(old, new)
 * - mappings: RemoveKey for keys only in base, AddKey for keys only in
 *   target, NestedPatch for keys whose values differ
 * - sequences: aligned with the comparison levels (see Align.hpp); matched
 *   but unequal elements become Replace(index, nested diff), the rest
 *   Delete and Insert
 * - text leaves: TextEdit (line script for multi-line text, else char script)
 * - other leaves: ReplaceLeaf
 *
 * Default comparison levels for sequences, strictest first:
 * 1. structural equality
 * 2. same kind and text similarity >= similarity_threshold
 * 3. same kind (when pair_same_kind is set)
 *
 * Example:
 * ```cpp
 * auto a = Document::from_json({{"cells", {"a", "b", "c"}}});
 * auto b = Document::from_json({{"cells", {"a", "x", "c"}}});
 * Patch p = diff(a, b);
 * // [NestedPatch("cells", [Replace(1, [TextEdit(delete "b", insert "x")])])]
 * ```
 */

#ifndef TREEMERGE_DIFF_HPP
#define TREEMERGE_DIFF_HPP

#include "treemerge/Document.hpp"
#include "treemerge/Options.hpp"
#include "treemerge/Patch.hpp"

namespace treemerge {

/**
 * @brief Patch that turns `base` into `target`
 *
 * Deterministic for identical inputs; apply(base, diff(base, target)) == target.
 *
 * @throws AlignmentCancelled on cancellation, deadline or table limit
 * @throws SchemaMismatch for incomparable roots (not raised for well-formed
 *         documents)
 */
Patch diff(const Document& base, const Document& target, const DiffOptions& options = {});

/// Same as diff() for bare nodes.
Patch diff_nodes(const NodePtr& base, const NodePtr& target, const DiffOptions& options = {});

} // namespace treemerge

#endif // TREEMERGE_DIFF_HPP
