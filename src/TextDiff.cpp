/**
 * @file TextDiff.cpp
 * @brief Line and character edit scripts
 */

#include "treemerge/TextDiff.hpp"
#include "treemerge/Align.hpp"
#include "treemerge/Errors.hpp"

namespace treemerge {

namespace {

// Byte length of the UTF-8 sequence starting with `lead`; stray
// continuation bytes and invalid leads count as one unit.
std::size_t utf8_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead >> 5) == 0x6) return 2;
    if ((lead >> 4) == 0xE) return 3;
    if ((lead >> 3) == 0x1E) return 4;
    return 1;
}

void push_span(std::vector<EditSpan>& script, EditSpan span) {
    if (!script.empty() && script.back().kind == span.kind) {
        auto& last = script.back();
        if (span.kind == EditSpan::Kind::Copy) {
            last.count += span.count;
        } else {
            last.text += span.text;
        }
        return;
    }
    script.push_back(std::move(span));
}

std::string join(const std::vector<std::string_view>& units, std::size_t from, std::size_t to) {
    std::string out;
    for (std::size_t k = from; k < to; ++k) {
        out.append(units[k].data(), units[k].size());
    }
    return out;
}

} // anonymous namespace

bool operator==(const EditSpan& a, const EditSpan& b) {
    return a.kind == b.kind && a.count == b.count && a.text == b.text;
}

bool operator!=(const EditSpan& a, const EditSpan& b) {
    return !(a == b);
}

bool operator==(const TextEdit& a, const TextEdit& b) {
    return a.granularity == b.granularity && a.script == b.script;
}

bool operator!=(const TextEdit& a, const TextEdit& b) {
    return !(a == b);
}

std::string to_string(TextGranularity g) {
    return g == TextGranularity::Line ? "line" : "char";
}

std::vector<std::string_view> split_units(std::string_view text, TextGranularity g) {
    std::vector<std::string_view> units;
    std::size_t pos = 0;

    if (g == TextGranularity::Line) {
        while (pos < text.size()) {
            auto nl = text.find('\n', pos);
            std::size_t end = (nl == std::string_view::npos) ? text.size() : nl + 1;
            units.push_back(text.substr(pos, end - pos));
            pos = end;
        }
        return units;
    }

    units.reserve(text.size());
    while (pos < text.size()) {
        std::size_t len = utf8_length(static_cast<unsigned char>(text[pos]));
        if (pos + len > text.size()) len = 1;
        units.push_back(text.substr(pos, len));
        pos += len;
    }
    return units;
}

TextGranularity choose_granularity(const std::string& a, const std::string& b, TextMode mode) {
    switch (mode) {
        case TextMode::Line: return TextGranularity::Line;
        case TextMode::Char: return TextGranularity::Char;
        case TextMode::Auto: break;
    }
    bool multiline = a.find('\n') != std::string::npos || b.find('\n') != std::string::npos;
    return multiline ? TextGranularity::Line : TextGranularity::Char;
}

TextEdit diff_text(const std::string& a, const std::string& b,
                   TextGranularity g, const Budget& budget) {
    const auto ua = split_units(a, g);
    const auto ub = split_units(b, g);

    // Text leaves can be long single lines (encoded images); the linear
    // space aligner keeps them out of the table limit.
    auto runs = align_myers(ua.size(), ub.size(),
        [&](std::size_t i, std::size_t j) { return ua[i] == ub[j]; },
        budget);
    runs.push_back(MatchRun{ua.size(), ub.size(), 0});

    TextEdit edit;
    edit.granularity = g;

    std::size_t ci = 0;
    std::size_t cj = 0;
    for (const auto& r : runs) {
        if (r.base > ci) {
            push_span(edit.script, EditSpan::remove(join(ua, ci, r.base)));
        }
        if (r.target > cj) {
            push_span(edit.script, EditSpan::insert(join(ub, cj, r.target)));
        }
        if (r.length > 0) {
            push_span(edit.script, EditSpan::copy(r.length));
        }
        ci = r.base + r.length;
        cj = r.target + r.length;
    }
    return edit;
}

std::string apply_text_edit(const std::string& text, const TextEdit& edit,
                            const std::string& where) {
    const auto units = split_units(text, edit.granularity);
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;

    for (const auto& span : edit.script) {
        switch (span.kind) {
            case EditSpan::Kind::Copy: {
                if (pos + span.count > units.size()) {
                    throw ApplyError(where,
                        std::to_string(span.count) + " " + to_string(edit.granularity) +
                            " unit(s) to copy",
                        std::to_string(units.size() - pos) + " remaining");
                }
                out += join(units, pos, pos + span.count);
                pos += span.count;
                break;
            }

            case EditSpan::Kind::Delete: {
                std::size_t end = pos;
                std::size_t len = 0;
                while (end < units.size() && len < span.text.size()) {
                    len += units[end].size();
                    ++end;
                }
                std::string found = join(units, pos, end);
                if (found != span.text) {
                    throw ApplyError(where,
                        "text to delete " + excerpt(Value(span.text)),
                        excerpt(Value(found)));
                }
                pos = end;
                break;
            }

            case EditSpan::Kind::Insert:
                out += span.text;
                break;
        }
    }

    if (pos != units.size()) {
        throw ApplyError(where, "end of text after edit script",
                         std::to_string(units.size() - pos) + " unconsumed " +
                             to_string(edit.granularity) + " unit(s)");
    }
    return out;
}

} // namespace treemerge
