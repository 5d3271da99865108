/**
 * @file Similarity.hpp
 * @brief Normalized text similarity between nodes
 *
 * The ratio of two texts is 2*M/T where M is the length of their longest
 * common subsequence and T the sum of their lengths: 1.0 for equal texts,
 * 0.0 for texts with nothing in common. Two cheaper upper bounds are tried
 * first as cutoffs:
 *
 * - real_quick_ratio(): from the lengths alone
 * - quick_ratio(): from the character multisets, ignoring order
 */

#ifndef TREEMERGE_SIMILARITY_HPP
#define TREEMERGE_SIMILARITY_HPP

#include "treemerge/Cancel.hpp"
#include "treemerge/Node.hpp"

#include <string>
#include <string_view>
#include <unordered_map>

namespace treemerge {

double real_quick_ratio(std::string_view a, std::string_view b) noexcept;
double quick_ratio(std::string_view a, std::string_view b);

/**
 * @brief Exact similarity ratio
 *
 * Compares bytes; texts whose comparison table would exceed a few million
 * cells are compared line by line instead.
 *
 * @throws AlignmentCancelled when the budget runs out
 */
double text_ratio(std::string_view a, std::string_view b, const Budget& budget);

/**
 * @brief ratio(a, b) >= threshold, using the cheap bounds as cutoffs
 */
bool strings_are_similar(std::string_view a, std::string_view b,
                         double threshold, const Budget& budget);

/**
 * @brief Text used to compare two nodes, memoized for one diff call
 *
 * A text leaf compares by its value; any other node by its canonical JSON.
 * One cache belongs to one call and is dropped with it.
 */
class SimilarityCache {
public:
    const std::string& text_of(const Node& node);

private:
    std::unordered_map<const Node*, std::string> texts_;
};

} // namespace treemerge

#endif // TREEMERGE_SIMILARITY_HPP
