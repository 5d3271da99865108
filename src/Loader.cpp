/**
 * @file Loader.cpp
 * @brief File loading implementation
 *
 * JSON through nlohmann::json, TOML through toml++.
 */

#include "treemerge/Loader.hpp"
#include "treemerge/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace treemerge {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * @brief Line and column (1-based) of a byte offset reported by the JSON parser
 */
std::pair<int, int> line_and_column(const std::string& content, std::size_t byte) {
    int line = 1;
    int column = 1;
    const std::size_t end = std::min(byte == 0 ? 0 : byte - 1, content.size());
    for (std::size_t i = 0; i < end; ++i) {
        if (content[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
    return {line, column};
}

template <typename T>
std::string streamed(const T& value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());
        case toml::node_type::integer:
            return Value(node.as_integer()->get());
        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());
        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());
        case toml::node_type::date:
            return Value(streamed(node.as_date()->get()));
        case toml::node_type::time:
            return Value(streamed(node.as_time()->get()));
        case toml::node_type::date_time:
            return Value(streamed(node.as_date_time()->get()));

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

} // anonymous namespace

// ============================================================================
// Raw file loading
// ============================================================================

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string content = read_file(path);
    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        const auto [line, column] = line_and_column(content, e.byte);
        throw ConfigParseError(path, line, column, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw ConfigParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }

    return toml_value_to_json(table);
}

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

Value load_config_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json" || ext == ".ipynb") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw ConfigParseError(path, 0, 0,
                           "unsupported file type '" + ext + "' (expected .json, .ipynb or .toml)");
}

// ============================================================================
// Typed loading
// ============================================================================

Document load_document(const std::string& path) {
    return Document::from_json(load_config_file(path));
}

Patch load_patch(const std::string& path) {
    return patch_from_json(load_json_file(path));
}

Options load_options_file(const std::string& path, Options base) {
    return options_from_json(load_config_file(path), std::move(base), path);
}

void write_json_file(const std::string& path, const Value& value, int indent) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw TreeMergeError("Cannot open '" + path + "' for writing");
    }
    file << value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    if (!file) {
        throw TreeMergeError("Failed writing '" + path + "'");
    }
}

} // namespace treemerge
