/**
 * @file Notebook.hpp
 * @brief Cell-aware diffing for notebook documents
 *
 * Notebooks are mappings whose "cells" sequence holds mappings with
 * "cell_type", "source" and (for code cells) "outputs". Cells are aligned
 * on these fields instead of on whole-cell similarity, so that a cell whose
 * outputs changed still pairs with its old self.
 */

#ifndef TREEMERGE_NOTEBOOK_HPP
#define TREEMERGE_NOTEBOOK_HPP

#include "treemerge/Document.hpp"
#include "treemerge/Merge.hpp"
#include "treemerge/Options.hpp"
#include "treemerge/Patch.hpp"

#include <string>
#include <vector>

namespace treemerge {

/**
 * @brief Cell source as one string
 *
 * List-form sources are joined with "\n"; a missing or non-text source is
 * empty.
 */
std::string cell_source(const Node& cell);

/**
 * @brief Cell alignment levels, strictest first
 *
 * 1. same cell_type, equal source, equal outputs for code cells
 * 2. same cell_type, equal source
 * 3. same cell_type, source similarity ratio > threshold
 *
 * Level 3 checks the diff's budget while computing the ratio.
 */
std::vector<ElementPredicate> cell_predicates(double threshold);

/// `base` with cell_predicates() installed for the "cells" sequence.
DiffOptions notebook_diff_options(DiffOptions base = {});

Patch diff_notebooks(const Document& a, const Document& b, const DiffOptions& options = {});

MergeResult merge_notebooks(const Document& base, const Document& local, const Document& remote,
                            const DiffOptions& diff_options = {},
                            const MergeOptions& merge_options = {});

} // namespace treemerge

#endif // TREEMERGE_NOTEBOOK_HPP
