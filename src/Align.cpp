/**
 * @file Align.cpp
 * @brief LCS alignment with run-length and left-bias tie-breaking
 */

#include "treemerge/Align.hpp"
#include "treemerge/Errors.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace treemerge {

namespace {

// Scores pack (matches, adjacent pairs) so that plain integer comparison is
// lexicographic: match count in the high half, adjacency in the low half.
constexpr std::uint64_t kMatch = std::uint64_t{1} << 32;

void append_run(std::vector<MatchRun>& runs, const MatchRun& run) {
    if (run.length == 0) return;
    if (!runs.empty()) {
        auto& last = runs.back();
        if (last.base + last.length == run.base &&
            last.target + last.length == run.target) {
            last.length += run.length;
            return;
        }
    }
    runs.push_back(run);
}

void append_pair(std::vector<MatchRun>& runs, std::size_t i, std::size_t j) {
    append_run(runs, MatchRun{i, j, 1});
}

void align_level(std::size_t i0, std::size_t i1, std::size_t j0, std::size_t j1,
                 std::size_t level, const std::vector<IndexPredicate>& levels,
                 const Budget& budget, std::vector<MatchRun>& out) {
    auto runs = align_range(i0, i1, j0, j1, levels[level], budget);

    if (level + 1 == levels.size()) {
        for (const auto& r : runs) append_run(out, r);
        return;
    }

    std::size_t ci = i0;
    std::size_t cj = j0;
    runs.push_back(MatchRun{i1, j1, 0});
    for (const auto& r : runs) {
        if (r.base > ci && r.target > cj) {
            align_level(ci, r.base, cj, r.target, level + 1, levels, budget, out);
        }
        append_run(out, r);
        ci = r.base + r.length;
        cj = r.target + r.length;
    }
}

/**
 * @brief Myers' O(ND) alignment with linear-space bisection
 *
 * Each range is trimmed of its common prefix and suffix, then split at the
 * middle snake of an optimal edit path and both halves are aligned again.
 * See E. Myers, "An O(ND) Difference Algorithm and Its Variations" (1986).
 */
class MyersAligner {
public:
    MyersAligner(const IndexPredicate& pred, const Budget& budget, std::vector<MatchRun>& out)
        : pred_(pred)
        , budget_(budget)
        , out_(out)
    {}

    void align(std::size_t i0, std::size_t i1, std::size_t j0, std::size_t j1) {
        std::size_t k = 0;
        while (i0 + k < i1 && j0 + k < j1 && pred_(i0 + k, j0 + k)) {
            ++k;
        }
        append_run(out_, MatchRun{i0, j0, k});
        i0 += k;
        j0 += k;

        k = 0;
        while (i1 - k > i0 && j1 - k > j0 && pred_(i1 - k - 1, j1 - k - 1)) {
            ++k;
        }
        const MatchRun suffix{i1 - k, j1 - k, k};
        i1 -= k;
        j1 -= k;

        if (i0 < i1 && j0 < j1) {
            bisect(i0, i1, j0, j1);
        }
        append_run(out_, suffix);
    }

private:
    using Index = std::ptrdiff_t;

    // Ranges here share no prefix or suffix and are both non-empty.
    void bisect(std::size_t i0, std::size_t i1, std::size_t j0, std::size_t j1) {
        const Index n = static_cast<Index>(i1 - i0);
        const Index m = static_cast<Index>(j1 - j0);
        const Index max_d = (n + m + 1) / 2;
        const Index offset = max_d;
        const Index length = 2 * max_d + 2;
        std::vector<Index> v1(static_cast<std::size_t>(length), -1);
        std::vector<Index> v2(static_cast<std::size_t>(length), -1);
        v1[offset + 1] = 0;
        v2[offset + 1] = 0;

        // With an odd difference in length the forward path meets the
        // reverse one; with an even difference the reverse path does.
        const Index delta = n - m;
        const bool front = (delta % 2 != 0);

        auto forward_eq = [&](Index x, Index y) {
            return pred_(i0 + static_cast<std::size_t>(x), j0 + static_cast<std::size_t>(y));
        };
        auto reverse_eq = [&](Index x, Index y) {
            return pred_(i1 - static_cast<std::size_t>(x) - 1, j1 - static_cast<std::size_t>(y) - 1);
        };

        Index k1start = 0;
        Index k1end = 0;
        Index k2start = 0;
        Index k2end = 0;

        for (Index d = 0; d < max_d; ++d) {
            budget_.check();

            for (Index k1 = -d + k1start; k1 <= d - k1end; k1 += 2) {
                const Index k1_offset = offset + k1;
                Index x1 = (k1 == -d || (k1 != d && v1[k1_offset - 1] < v1[k1_offset + 1]))
                    ? v1[k1_offset + 1]
                    : v1[k1_offset - 1] + 1;
                Index y1 = x1 - k1;
                while (x1 < n && y1 < m && forward_eq(x1, y1)) {
                    ++x1;
                    ++y1;
                }
                v1[k1_offset] = x1;
                if (x1 > n) {
                    k1end += 2;
                } else if (y1 > m) {
                    k1start += 2;
                } else if (front) {
                    const Index k2_offset = offset + delta - k1;
                    if (k2_offset >= 0 && k2_offset < length && v2[k2_offset] != -1) {
                        if (x1 >= n - v2[k2_offset]) {
                            split(i0, i1, j0, j1, x1, y1);
                            return;
                        }
                    }
                }
            }

            for (Index k2 = -d + k2start; k2 <= d - k2end; k2 += 2) {
                const Index k2_offset = offset + k2;
                Index x2 = (k2 == -d || (k2 != d && v2[k2_offset - 1] < v2[k2_offset + 1]))
                    ? v2[k2_offset + 1]
                    : v2[k2_offset - 1] + 1;
                Index y2 = x2 - k2;
                while (x2 < n && y2 < m && reverse_eq(x2, y2)) {
                    ++x2;
                    ++y2;
                }
                v2[k2_offset] = x2;
                if (x2 > n) {
                    k2end += 2;
                } else if (y2 > m) {
                    k2start += 2;
                } else if (!front) {
                    const Index k1_offset = offset + delta - k2;
                    if (k1_offset >= 0 && k1_offset < length && v1[k1_offset] != -1) {
                        const Index x1 = v1[k1_offset];
                        const Index y1 = offset + x1 - k1_offset;
                        if (x1 >= n - x2) {
                            split(i0, i1, j0, j1, x1, y1);
                            return;
                        }
                    }
                }
            }
        }
        // No common element at all: everything is deleted and inserted.
    }

    void split(std::size_t i0, std::size_t i1, std::size_t j0, std::size_t j1, Index x, Index y) {
        const std::size_t si = i0 + static_cast<std::size_t>(x);
        const std::size_t sj = j0 + static_cast<std::size_t>(y);
        if ((si == i0 && sj == j0) || (si == i1 && sj == j1)) {
            return;
        }
        align(i0, si, j0, sj);
        align(si, i1, sj, j1);
    }

    const IndexPredicate& pred_;
    const Budget& budget_;
    std::vector<MatchRun>& out_;
};

} // anonymous namespace

std::vector<MatchRun> align_range(std::size_t i0, std::size_t i1,
                                  std::size_t j0, std::size_t j1,
                                  const IndexPredicate& pred,
                                  const Budget& budget) {
    std::vector<MatchRun> runs;
    if (i0 >= i1 || j0 >= j1) {
        return runs;
    }

    // Common prefix and suffix never need the table.
    std::size_t lo_i = i0;
    std::size_t lo_j = j0;
    while (lo_i < i1 && lo_j < j1 && pred(lo_i, lo_j)) {
        ++lo_i;
        ++lo_j;
    }
    append_run(runs, MatchRun{i0, j0, lo_i - i0});

    std::size_t hi_i = i1;
    std::size_t hi_j = j1;
    while (hi_i > lo_i && hi_j > lo_j && pred(hi_i - 1, hi_j - 1)) {
        --hi_i;
        --hi_j;
    }
    const MatchRun suffix{hi_i, hi_j, i1 - hi_i};

    const std::size_t h = hi_i - lo_i;
    const std::size_t w = hi_j - lo_j;

    if (h > 0 && w > 0) {
        const std::size_t stride = w + 1;
        if (h + 1 > std::numeric_limits<std::size_t>::max() / stride) {
            throw AlignmentCancelled("alignment table size overflows");
        }
        budget.check_cells((h + 1) * stride);
        budget.check();

        // Predicate results are evaluated once per cell; similarity
        // predicates are far more expensive than the table walk.
        std::vector<std::uint8_t> match(h * w, 0);
        for (std::size_t r = 0; r < h; ++r) {
            budget.check();
            for (std::size_t c = 0; c < w; ++c) {
                match[r * w + c] = pred(lo_i + r, lo_j + c) ? 1 : 0;
            }
        }

        auto at = [stride](std::size_t r, std::size_t c) { return r * stride + c; };
        auto is_match = [&](std::size_t r, std::size_t c) {
            return r < h && c < w && match[r * w + c] != 0;
        };

        // best[r][c]: best score of the suffix problem starting at (r, c).
        // run[r][c]:  best score of that suffix when (r, c) itself is matched.
        std::vector<std::uint64_t> best((h + 1) * stride, 0);
        std::vector<std::uint64_t> run((h + 1) * stride, 0);

        for (std::size_t r = h; r-- > 0;) {
            budget.check();
            for (std::size_t c = w; c-- > 0;) {
                std::uint64_t d = 0;
                if (match[r * w + c]) {
                    std::uint64_t cont = best[at(r + 1, c + 1)];
                    if (is_match(r + 1, c + 1)) {
                        cont = std::max(cont, run[at(r + 1, c + 1)] + 1);
                    }
                    d = cont + kMatch;
                }
                run[at(r, c)] = d;
                best[at(r, c)] = std::max({d, best[at(r + 1, c)], best[at(r, c + 1)]});
            }
        }

        std::size_t r = 0;
        std::size_t c = 0;
        bool forced = false;
        while (r < h && c < w) {
            const std::uint64_t cur = run[at(r, c)];
            if (forced || (match[r * w + c] && cur == best[at(r, c)])) {
                append_pair(runs, lo_i + r, lo_j + c);
                const std::uint64_t rest = cur - kMatch;
                forced = is_match(r + 1, c + 1) && run[at(r + 1, c + 1)] + 1 == rest;
                ++r;
                ++c;
                continue;
            }
            // Skip the base element first when both skips are optimal.
            if (best[at(r + 1, c)] == best[at(r, c)]) {
                ++r;
            } else {
                ++c;
            }
        }
    }

    append_run(runs, suffix);
    return runs;
}

std::vector<MatchRun> align_multilevel(std::size_t n, std::size_t m,
                                       const std::vector<IndexPredicate>& levels,
                                       const Budget& budget) {
    std::vector<MatchRun> out;
    if (levels.empty() || n == 0 || m == 0) {
        return out;
    }
    align_level(0, n, 0, m, 0, levels, budget, out);
    return out;
}

std::vector<MatchRun> align_myers(std::size_t n, std::size_t m,
                                  const IndexPredicate& pred,
                                  const Budget& budget) {
    std::vector<MatchRun> out;
    if (n == 0 || m == 0) {
        return out;
    }
    MyersAligner(pred, budget, out).align(0, n, 0, m);
    return out;
}

std::vector<std::pair<std::size_t, std::size_t>> matched_pairs(const std::vector<MatchRun>& runs) {
    std::vector<std::pair<std::size_t, std::size_t>> pairs;
    for (const auto& r : runs) {
        for (std::size_t k = 0; k < r.length; ++k) {
            pairs.emplace_back(r.base + k, r.target + k);
        }
    }
    return pairs;
}

} // namespace treemerge
