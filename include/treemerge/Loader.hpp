/**
 * @file Loader.hpp
 * @brief File loading for documents, patches and options
 *
 * Formats are picked by extension:
 * - .json and .ipynb: parsed with nlohmann::json
 * - .toml: parsed with toml++ and converted to JSON
 *
 * The core library never touches files; only the CLI and callers that want
 * file input use this module.
 */

#ifndef TREEMERGE_LOADER_HPP
#define TREEMERGE_LOADER_HPP

#include "treemerge/Document.hpp"
#include "treemerge/Options.hpp"
#include "treemerge/Patch.hpp"
#include "treemerge/Value.hpp"

#include <string>

namespace treemerge {

// ============================================================================
// Raw file loading
// ============================================================================

/**
 * @brief Load and parse a JSON file
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError on invalid JSON (line/column from the parser)
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML file and convert it to JSON
 *
 * Dates and times become strings in their TOML text form.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError on invalid TOML
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a JSON, notebook or TOML file by extension
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError for unsupported extensions or parse errors
 */
Value load_config_file(const std::string& path);

/// Lowercased extension including the dot (".json"), or "".
std::string get_file_extension(const std::string& path);

// ============================================================================
// Typed loading
// ============================================================================

Document load_document(const std::string& path);

/**
 * @brief Load patch JSON
 * @throws PatchFormatError if the file is not a valid patch
 */
Patch load_patch(const std::string& path);

/**
 * @brief Load [diff] / [merge] option sections over `base`
 * @throws ConfigParseError on wrongly typed values
 */
Options load_options_file(const std::string& path, Options base = {});

/**
 * @brief Write `value` as JSON
 * @param indent Pretty-print indent; negative for compact output
 * @throws TreeMergeError if the file cannot be written
 */
void write_json_file(const std::string& path, const Value& value, int indent = 1);

} // namespace treemerge

#endif // TREEMERGE_LOADER_HPP
