/**
 * @file Options.hpp
 * @brief Tuning knobs for diff and merge
 *
 * Defaults live in the member initializers. An options document (JSON, or
 * TOML converted to JSON by the loader) overrides them section by section:
 *
 * ```toml
 * [diff]
 * similarity_threshold = 0.9
 * pair_same_kind = true
 * text_granularity = "auto"   # auto | line | char
 * deadline_ms = 0
 * max_alignment_cells = 67108864
 *
 * [merge]
 * insert_order = "local-first" # local-first | canonical
 * ```
 */

#ifndef TREEMERGE_OPTIONS_HPP
#define TREEMERGE_OPTIONS_HPP

#include "treemerge/Cancel.hpp"
#include "treemerge/Node.hpp"
#include "treemerge/Value.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace treemerge {

/**
 * @brief Decides whether two sequence elements may be aligned with each other
 *
 * Receives the budget of the running diff; expensive predicates check it.
 */
using ElementPredicate = std::function<bool(const Node&, const Node&, const Budget&)>;

enum class TextMode {
    Auto,   ///< line script if either text has a newline, else char script
    Line,
    Char
};

struct DiffOptions {
    /// Minimum similarity ratio for the fuzzy alignment level.
    double similarity_threshold = 0.9;

    /// Pair leftover elements of the same kind as Replace instead of Delete+Insert.
    bool pair_same_kind = true;

    TextMode text_mode = TextMode::Auto;

    /// 0 disables the deadline.
    std::chrono::milliseconds deadline{0};

    /// Largest single alignment table; 0 disables the limit.
    std::size_t max_alignment_cells = std::size_t{64} * 1024 * 1024;

    std::shared_ptr<const CancelToken> cancel;

    /**
     * Alignment levels (strictest first) for particular sequences, keyed by
     * path_pattern() of the sequence, e.g. "cells" or "cells[*].outputs".
     * Sequences without an entry use the default levels.
     */
    std::map<std::string, std::vector<ElementPredicate>> sequence_predicates;

    /// Budget for one call, started now.
    Budget make_budget() const {
        return Budget(cancel, deadline, max_alignment_cells);
    }
};

enum class InsertOrder {
    LocalFirst, ///< concurrent inserts in one gap: local run, then remote run
    Canonical   ///< ordered by content, independent of which side inserted
};

struct MergeOptions {
    InsertOrder insert_order = InsertOrder::LocalFirst;
};

struct Options {
    DiffOptions diff;
    MergeOptions merge;
};

/**
 * @brief Apply the "diff" and "merge" sections of an options document
 *
 * Unknown keys are ignored.
 *
 * @param v Options document (object)
 * @param base Values for keys the document does not mention
 * @param source Name used in error messages (usually the file path)
 * @throws ConfigParseError if a known key has the wrong type or value
 */
Options options_from_json(const Value& v, Options base = {},
                          const std::string& source = "<options>");

/// JSON form of the serializable subset of `opts`.
Value options_to_json(const Options& opts);

std::string to_string(TextMode mode);
std::string to_string(InsertOrder order);

} // namespace treemerge

#endif // TREEMERGE_OPTIONS_HPP
