/**
 * @file Path.hpp
 * @brief Path addressing into document trees
 *
 * A path is a list of segments from the root: a string segment selects a
 * mapping key, an index segment selects a sequence element. Text form joins
 * keys with dots and writes indices in brackets:
 *
 * - [] -> ""
 * - ["cells", 1, "source"] -> "cells[1].source"
 * - [0, "id"] -> "[0].id"
 *
 * Updates never modify the input tree: they return a new root that shares
 * every subtree off the updated path.
 */

#ifndef TREEMERGE_PATH_HPP
#define TREEMERGE_PATH_HPP

#include "treemerge/Node.hpp"
#include "treemerge/Value.hpp"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace treemerge {

using PathSegment = std::variant<std::string, std::size_t>;
using Path = std::vector<PathSegment>;

/**
 * @brief Parse the text form of a path
 *
 * @param text Path like "cells[1].source"
 * @return Segments ["cells", 1, "source"]
 * @throws PatchFormatError on unbalanced brackets or non-numeric indices
 */
Path parse_path(const std::string& text);

/// Text form of a path ("" for the root).
std::string to_string(const Path& path);

/// Text form of a single segment: "key" or "[3]".
std::string to_string(const PathSegment& segment);

/**
 * @brief Path with every index replaced by "[*]"
 *
 * Used as the lookup key for per-path alignment predicates, so that
 * "cells[3].outputs" and "cells[7].outputs" share one entry.
 */
std::string path_pattern(const Path& path);

/// `path` extended by one segment.
Path child_path(const Path& path, PathSegment segment);

/// JSON array form: keys as strings, indices as numbers.
Value path_to_json(const Path& path);

/**
 * @brief Parse the JSON array form of a path
 * @throws PatchFormatError if `v` is not an array of strings and
 *         non-negative integers
 */
Path path_from_json(const Value& v);

/**
 * @brief Get node at path (strict)
 *
 * @return The node at `path`
 * @throws PathNotFound if a key or index is missing
 * @throws PathTypeError if a key meets a non-mapping or an index meets a
 *         non-sequence
 */
NodePtr get_at(const NodePtr& root, const Path& path);

/**
 * @brief Get node at path, or nullptr when a segment is missing
 * @throws PathTypeError for invalid traversal, as get_at()
 */
NodePtr find_at(const NodePtr& root, const Path& path);

/**
 * @brief Check whether the path resolves
 * @throws PathTypeError for invalid traversal
 */
bool contains_at(const NodePtr& root, const Path& path);

/**
 * @brief Immutable update: place `value` at `path`
 *
 * The last segment may name a missing mapping key (the key is added) or the
 * index one past the end of a sequence (the value is appended). Every
 * intermediate segment must exist.
 *
 * @return New root; subtrees off the path are shared with `root`
 * @throws PathNotFound / PathTypeError as get_at()
 */
NodePtr set_at(const NodePtr& root, const Path& path, NodePtr value);

/**
 * @brief Immutable removal of the key or element at `path`
 *
 * @return New root; sequence elements after a removed one shift down
 * @throws PathNotFound if the target is missing or `path` is empty
 */
NodePtr erase_at(const NodePtr& root, const Path& path);

} // namespace treemerge

#endif // TREEMERGE_PATH_HPP
