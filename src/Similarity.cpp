#include "treemerge/Similarity.hpp"
#include "treemerge/Errors.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <vector>

namespace treemerge {

namespace {

constexpr std::size_t kMaxCharCells = 4u * 1024u * 1024u;

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        auto nl = text.find('\n', start);
        std::size_t end = (nl == std::string_view::npos) ? text.size() : nl + 1;
        lines.push_back(text.substr(start, end - start));
        start = end;
    }
    return lines;
}

// Length of the longest common subsequence, two rolling rows.
template <typename Seq>
std::size_t lcs_length(const Seq& a, const Seq& b, const Budget& budget) {
    std::vector<std::size_t> prev(b.size() + 1, 0);
    std::vector<std::size_t> cur(b.size() + 1, 0);
    for (std::size_t i = 1; i <= a.size(); ++i) {
        budget.check();
        for (std::size_t j = 1; j <= b.size(); ++j) {
            if (a[i - 1] == b[j - 1]) {
                cur[j] = prev[j - 1] + 1;
            } else {
                cur[j] = std::max(prev[j], cur[j - 1]);
            }
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

} // anonymous namespace

double real_quick_ratio(std::string_view a, std::string_view b) noexcept {
    const std::size_t total = a.size() + b.size();
    if (total == 0) return 1.0;
    return 2.0 * static_cast<double>(std::min(a.size(), b.size())) / static_cast<double>(total);
}

double quick_ratio(std::string_view a, std::string_view b) {
    const std::size_t total = a.size() + b.size();
    if (total == 0) return 1.0;

    std::array<std::size_t, 256> counts{};
    for (unsigned char c : b) ++counts[c];
    std::size_t matches = 0;
    for (unsigned char c : a) {
        if (counts[c] > 0) {
            --counts[c];
            ++matches;
        }
    }
    return 2.0 * static_cast<double>(matches) / static_cast<double>(total);
}

double text_ratio(std::string_view a, std::string_view b, const Budget& budget) {
    const std::size_t total = a.size() + b.size();
    if (total == 0) return 1.0;
    if (a == b) return 1.0;

    if (a.size() * b.size() <= kMaxCharCells) {
        const std::size_t m = lcs_length(a, b, budget);
        return 2.0 * static_cast<double>(m) / static_cast<double>(total);
    }

    // Long texts: weight matched lines by their length.
    const auto la = split_lines(a);
    const auto lb = split_lines(b);
    budget.check_cells(la.size() * lb.size());

    std::vector<std::size_t> prev(lb.size() + 1, 0);
    std::vector<std::size_t> cur(lb.size() + 1, 0);
    for (std::size_t i = 1; i <= la.size(); ++i) {
        budget.check();
        for (std::size_t j = 1; j <= lb.size(); ++j) {
            if (la[i - 1] == lb[j - 1]) {
                cur[j] = prev[j - 1] + la[i - 1].size();
            } else {
                cur[j] = std::max(prev[j], cur[j - 1]);
            }
        }
        std::swap(prev, cur);
    }
    return 2.0 * static_cast<double>(prev[lb.size()]) / static_cast<double>(total);
}

bool strings_are_similar(std::string_view a, std::string_view b,
                         double threshold, const Budget& budget) {
    if (a == b) return true;
    if (real_quick_ratio(a, b) < threshold) return false;
    if (quick_ratio(a, b) < threshold) return false;
    return text_ratio(a, b, budget) >= threshold;
}

const std::string& SimilarityCache::text_of(const Node& node) {
    if (node.is_text()) {
        return node.as_text();
    }
    auto it = texts_.find(&node);
    if (it == texts_.end()) {
        it = texts_.emplace(&node, canonical_text(node)).first;
    }
    return it->second;
}

} // namespace treemerge
