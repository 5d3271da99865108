/**
 * @file TextDiff.hpp
 * @brief Edit scripts for text leaves
 *
 * Text is cut into units, either lines (each keeping its trailing "\n") or
 * UTF-8 code points. A script walks the whole base text:
 *
 * - copy(n): keep the next n units
 * - delete(text): drop the next units, whose concatenation must be `text`
 * - insert(text): emit `text`
 *
 * Scripts produced by diff_text() have the minimal number of inserted plus
 * deleted units.
 */

#ifndef TREEMERGE_TEXTDIFF_HPP
#define TREEMERGE_TEXTDIFF_HPP

#include "treemerge/Cancel.hpp"
#include "treemerge/Options.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace treemerge {

enum class TextGranularity {
    Line,
    Char
};

struct EditSpan {
    enum class Kind {
        Copy,
        Delete,
        Insert
    };

    Kind kind = Kind::Copy;
    std::size_t count = 0;  ///< units, for Copy
    std::string text;       ///< for Delete and Insert

    static EditSpan copy(std::size_t n) { return EditSpan{Kind::Copy, n, {}}; }
    static EditSpan remove(std::string t) { return EditSpan{Kind::Delete, 0, std::move(t)}; }
    static EditSpan insert(std::string t) { return EditSpan{Kind::Insert, 0, std::move(t)}; }
};

bool operator==(const EditSpan& a, const EditSpan& b);
bool operator!=(const EditSpan& a, const EditSpan& b);

/**
 * @brief Edit script for one text leaf
 */
struct TextEdit {
    TextGranularity granularity = TextGranularity::Char;
    std::vector<EditSpan> script;
};

bool operator==(const TextEdit& a, const TextEdit& b);
bool operator!=(const TextEdit& a, const TextEdit& b);

std::string to_string(TextGranularity g);

/// Cut `text` into units; the views point into `text`.
std::vector<std::string_view> split_units(std::string_view text, TextGranularity g);

/// Line granularity if either text holds a newline (Auto), else the forced mode.
TextGranularity choose_granularity(const std::string& a, const std::string& b, TextMode mode);

/**
 * @brief Minimal edit script turning `a` into `b`
 *
 * Runs in space linear in the text length; the budget's table limit does
 * not apply.
 *
 * @throws AlignmentCancelled when cancelled or past the deadline
 */
TextEdit diff_text(const std::string& a, const std::string& b,
                   TextGranularity g, const Budget& budget);

/**
 * @brief Run an edit script over `text`
 *
 * @param where Path text used in error messages
 * @throws ApplyError if a copy or delete span does not match `text`, or
 *         the script does not consume `text` exactly
 */
std::string apply_text_edit(const std::string& text, const TextEdit& edit,
                            const std::string& where);

} // namespace treemerge

#endif // TREEMERGE_TEXTDIFF_HPP
