/**
 * @file Apply.hpp
 * @brief Patch application
 *
 * Every op is checked against the node it addresses before it takes
 * effect:
 * - AddKey: key absent; RemoveKey / NestedPatch: key present; ops in key
 *   order with one op per key
 * - Insert: index <= size; Delete / Replace: index < size; ops in index
 *   order with Inserts before the Delete or Replace of the same index, and
 *   at most one Delete or Replace per element
 * - ReplaceLeaf: node equals `old`
 * - TextEdit: node is text and the script matches it exactly
 * - ReplaceLeaf / TextEdit stand alone in their patch
 *
 * The input is never modified; unchanged subtrees of the result are the
 * input's own nodes.
 */

#ifndef TREEMERGE_APPLY_HPP
#define TREEMERGE_APPLY_HPP

#include "treemerge/Document.hpp"
#include "treemerge/Patch.hpp"
#include "treemerge/Path.hpp"

namespace treemerge {

/**
 * @brief Apply `patch` to `doc`
 *
 * Call it qualified, as treemerge::apply(). Patch is a std::vector, so an
 * unqualified call also finds std::apply by argument-dependent lookup.
 *
 * @throws ApplyError if the patch does not fit `doc`
 */
Document apply(const Document& doc, const Patch& patch);

/**
 * @brief Apply `patch` to a subtree
 * @param path Location of `node`, used in error messages
 * @throws ApplyError if the patch does not fit `node`
 */
NodePtr apply_patch(const NodePtr& node, const Patch& patch, const Path& path = {});

} // namespace treemerge

#endif // TREEMERGE_APPLY_HPP
