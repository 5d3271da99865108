/**
 * @file Align.hpp
 * @brief Sequence alignment by longest common subsequence
 *
 * Elements are addressed by index only; callers supply a predicate over
 * (base index, target index). Two entry points:
 *
 * - align_range(): one predicate over a rectangle of the two sequences.
 *   Maximizes the number of matched pairs; among equally long alignments it
 *   maximizes the number of adjacent matched pairs (longer runs), then
 *   prefers matching earlier base elements to earlier target elements.
 *
 * - align_multilevel(): a list of predicates, strictest first. The
 *   strictest predicate aligns the whole range, then every unmatched gap
 *   between its matches is aligned with the next predicate, and so on.
 *
 * - align_myers(): a longest common subsequence without the run
 *   preference, found by Myers' middle-snake bisection in O((n + m) * D)
 *   time and linear space, D being the edit distance. Used for text, where
 *   n * m tables do not fit.
 *
 * The dynamic programming tables are flat vectors indexed by
 * row * (width + 1) + column. The Budget is checked inside the loops.
 */

#ifndef TREEMERGE_ALIGN_HPP
#define TREEMERGE_ALIGN_HPP

#include "treemerge/Cancel.hpp"

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace treemerge {

/**
 * @brief A run of `length` matched pairs starting at (base, target)
 */
struct MatchRun {
    std::size_t base = 0;
    std::size_t target = 0;
    std::size_t length = 0;
};

inline bool operator==(const MatchRun& a, const MatchRun& b) {
    return a.base == b.base && a.target == b.target && a.length == b.length;
}

using IndexPredicate = std::function<bool(std::size_t base, std::size_t target)>;

/**
 * @brief Align base[i0, i1) against target[j0, j1) under one predicate
 *
 * @return Runs in increasing base and target order
 * @throws AlignmentCancelled when the budget runs out
 */
std::vector<MatchRun> align_range(std::size_t i0, std::size_t i1,
                                  std::size_t j0, std::size_t j1,
                                  const IndexPredicate& pred,
                                  const Budget& budget);

/**
 * @brief Align base[0, n) against target[0, m) with predicate levels
 *
 * @param levels Predicates, strictest first; empty means no matches
 * @return Runs in increasing base and target order
 * @throws AlignmentCancelled when the budget runs out
 */
std::vector<MatchRun> align_multilevel(std::size_t n, std::size_t m,
                                       const std::vector<IndexPredicate>& levels,
                                       const Budget& budget);

/**
 * @brief Minimal-edit alignment of base[0, n) against target[0, m)
 *
 * Needs no table, so the budget's cell limit does not apply; cancellation
 * and the deadline are checked once per edit-distance step.
 *
 * @return Runs in increasing base and target order
 * @throws AlignmentCancelled when cancelled or past the deadline
 */
std::vector<MatchRun> align_myers(std::size_t n, std::size_t m,
                                  const IndexPredicate& pred,
                                  const Budget& budget);

/// Expand runs into the individual matched (base, target) pairs.
std::vector<std::pair<std::size_t, std::size_t>> matched_pairs(const std::vector<MatchRun>& runs);

} // namespace treemerge

#endif // TREEMERGE_ALIGN_HPP
