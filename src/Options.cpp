/**
 * @file Options.cpp
 * @brief Options document parsing
 */

#include "treemerge/Options.hpp"
#include "treemerge/Errors.hpp"

namespace treemerge {

namespace {

[[noreturn]] void bad_option(const std::string& source, const std::string& key,
                             const std::string& expected, const Value& found) {
    throw ConfigParseError(source, 0, 0,
        "option '" + key + "' must be " + expected + ", got " + excerpt(found));
}

double read_ratio(const Value& v, const std::string& key, const std::string& source) {
    if (!v.is_number()) bad_option(source, key, "a number", v);
    double d = v.get<double>();
    if (d < 0.0 || d > 1.0) bad_option(source, key, "between 0 and 1", v);
    return d;
}

bool read_bool(const Value& v, const std::string& key, const std::string& source) {
    if (!v.is_boolean()) bad_option(source, key, "a boolean", v);
    return v.get<bool>();
}

std::size_t read_count(const Value& v, const std::string& key, const std::string& source) {
    if (v.is_number_unsigned()) return static_cast<std::size_t>(v.get<std::uint64_t>());
    if (v.is_number_integer() && v.get<std::int64_t>() >= 0) {
        return static_cast<std::size_t>(v.get<std::int64_t>());
    }
    bad_option(source, key, "a non-negative integer", v);
}

} // anonymous namespace

std::string to_string(TextMode mode) {
    switch (mode) {
        case TextMode::Auto: return "auto";
        case TextMode::Line: return "line";
        case TextMode::Char: return "char";
    }
    return "auto";
}

std::string to_string(InsertOrder order) {
    switch (order) {
        case InsertOrder::LocalFirst: return "local-first";
        case InsertOrder::Canonical: return "canonical";
    }
    return "local-first";
}

Options options_from_json(const Value& v, Options base, const std::string& source) {
    if (v.is_null()) {
        return base;
    }
    if (!v.is_object()) {
        bad_option(source, "<root>", "an object", v);
    }

    if (v.contains("diff")) {
        const auto& d = v.at("diff");
        if (!d.is_object()) bad_option(source, "diff", "a table", d);

        if (d.contains("similarity_threshold")) {
            base.diff.similarity_threshold =
                read_ratio(d.at("similarity_threshold"), "diff.similarity_threshold", source);
        }
        if (d.contains("pair_same_kind")) {
            base.diff.pair_same_kind =
                read_bool(d.at("pair_same_kind"), "diff.pair_same_kind", source);
        }
        if (d.contains("text_granularity")) {
            const auto& g = d.at("text_granularity");
            std::string s = g.is_string() ? g.get<std::string>() : std::string();
            if (s == "auto") base.diff.text_mode = TextMode::Auto;
            else if (s == "line") base.diff.text_mode = TextMode::Line;
            else if (s == "char") base.diff.text_mode = TextMode::Char;
            else bad_option(source, "diff.text_granularity", "one of auto, line, char", g);
        }
        if (d.contains("deadline_ms")) {
            base.diff.deadline = std::chrono::milliseconds(
                read_count(d.at("deadline_ms"), "diff.deadline_ms", source));
        }
        if (d.contains("max_alignment_cells")) {
            base.diff.max_alignment_cells =
                read_count(d.at("max_alignment_cells"), "diff.max_alignment_cells", source);
        }
    }

    if (v.contains("merge")) {
        const auto& m = v.at("merge");
        if (!m.is_object()) bad_option(source, "merge", "a table", m);

        if (m.contains("insert_order")) {
            const auto& o = m.at("insert_order");
            std::string s = o.is_string() ? o.get<std::string>() : std::string();
            if (s == "local-first") base.merge.insert_order = InsertOrder::LocalFirst;
            else if (s == "canonical") base.merge.insert_order = InsertOrder::Canonical;
            else bad_option(source, "merge.insert_order", "local-first or canonical", o);
        }
    }

    return base;
}

Value options_to_json(const Options& opts) {
    return {
        {"diff", {
            {"similarity_threshold", opts.diff.similarity_threshold},
            {"pair_same_kind", opts.diff.pair_same_kind},
            {"text_granularity", to_string(opts.diff.text_mode)},
            {"deadline_ms", opts.diff.deadline.count()},
            {"max_alignment_cells", opts.diff.max_alignment_cells}
        }},
        {"merge", {
            {"insert_order", to_string(opts.merge.insert_order)}
        }}
    };
}

} // namespace treemerge
