/**
 * @file Notebook.cpp
 * @brief Notebook cell predicates
 */

#include "treemerge/Notebook.hpp"
#include "treemerge/Diff.hpp"
#include "treemerge/Similarity.hpp"

namespace treemerge {

namespace {

bool field_equal(const Node& x, const Node& y, const std::string& key) {
    return nodes_equal(x.find(key), y.find(key));
}

bool same_cell_type(const Node& x, const Node& y) {
    if (!x.is_mapping() || !y.is_mapping()) return false;
    return field_equal(x, y, "cell_type");
}

bool is_code_cell(const Node& cell) {
    auto type = cell.find("cell_type");
    return type && type->is_text() && type->as_text() == "code";
}

} // anonymous namespace

std::string cell_source(const Node& cell) {
    auto source = cell.find("source");
    if (!source) return {};
    if (source->is_text()) return source->as_text();
    if (!source->is_sequence()) return {};

    std::string out;
    bool first = true;
    for (const auto& line : source->as_sequence()) {
        if (!first) out += '\n';
        first = false;
        if (line->is_text()) out += line->as_text();
    }
    return out;
}

std::vector<ElementPredicate> cell_predicates(double threshold) {
    auto source_and_outputs = [](const Node& x, const Node& y, const Budget&) {
        if (!same_cell_type(x, y) || !field_equal(x, y, "source")) return false;
        return !is_code_cell(x) || field_equal(x, y, "outputs");
    };

    auto exact_source = [](const Node& x, const Node& y, const Budget&) {
        return same_cell_type(x, y) && field_equal(x, y, "source");
    };

    auto approximate_source = [threshold](const Node& x, const Node& y, const Budget& budget) {
        if (!same_cell_type(x, y)) return false;

        const std::string xs = cell_source(x);
        const std::string ys = cell_source(y);
        if (xs == ys) return true;

        // Cheap upper bounds first; the full ratio only for close calls.
        if (real_quick_ratio(xs, ys) < threshold) return false;
        if (quick_ratio(xs, ys) < threshold) return false;
        budget.check();
        return text_ratio(xs, ys, budget) > threshold;
    };

    return {source_and_outputs, exact_source, approximate_source};
}

DiffOptions notebook_diff_options(DiffOptions base) {
    base.sequence_predicates["cells"] = cell_predicates(base.similarity_threshold);
    return base;
}

Patch diff_notebooks(const Document& a, const Document& b, const DiffOptions& options) {
    return diff(a, b, notebook_diff_options(options));
}

MergeResult merge_notebooks(const Document& base, const Document& local, const Document& remote,
                            const DiffOptions& diff_options, const MergeOptions& merge_options) {
    return merge_documents(base, local, remote, notebook_diff_options(diff_options),
                           merge_options);
}

} // namespace treemerge
