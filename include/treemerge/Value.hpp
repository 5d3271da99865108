/**
 * @file Value.hpp
 * @brief External value representation for documents and patches
 *
 * Documents arrive from (and are handed back to) the surrounding tooling as
 * nlohmann::json values. The diff engine converts them into immutable
 * Node trees (see Node.hpp); patches and conflicts serialize back to Value.
 */

#ifndef TREEMERGE_VALUE_HPP
#define TREEMERGE_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace treemerge {

/**
 * @brief JSON value type used at the library boundary
 *
 * This is an alias for nlohmann::json. See the nlohmann::json
 * documentation for the complete API.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Compact excerpt of a value for error messages
 * @param val The value to describe
 * @param max_len Maximum length before the dump is cut with "..."
 */
inline std::string excerpt(const Value& val, std::size_t max_len = 60) {
    std::string s = val.dump(-1, ' ', false, Value::error_handler_t::replace);
    if (s.size() > max_len) {
        s.resize(max_len);
        s += "...";
    }
    return s;
}

} // namespace treemerge

#endif // TREEMERGE_VALUE_HPP
