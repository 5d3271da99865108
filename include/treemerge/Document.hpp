/**
 * @file Document.hpp
 * @brief One immutable version of a tree document
 */

#ifndef TREEMERGE_DOCUMENT_HPP
#define TREEMERGE_DOCUMENT_HPP

#include "treemerge/Node.hpp"
#include "treemerge/Path.hpp"
#include "treemerge/Value.hpp"

namespace treemerge {

/**
 * @brief Root node of a document version
 *
 * A Document is a value object: every "update" returns a new Document that
 * shares untouched subtrees with the original.
 *
 * ```cpp
 * auto doc = Document::from_json({{"cells", {"a", "b"}}});
 * auto next = doc.with(parse_path("cells[1]"), Node::text("x"));
 * // doc still holds "b"; next holds "x" and shares every other node with doc
 * ```
 */
class Document {
public:
    /// Empty mapping document.
    Document();
    explicit Document(NodePtr root);

    static Document from_json(const Value& v);
    Value to_json() const;

    const NodePtr& root() const noexcept { return root_; }

    /// Copy sharing no nodes with this document.
    Document clone() const;

    NodePtr get(const Path& path) const { return get_at(root_, path); }
    NodePtr find(const Path& path) const { return find_at(root_, path); }
    bool contains(const Path& path) const { return contains_at(root_, path); }

    Document with(const Path& path, NodePtr value) const;
    Document without(const Path& path) const;

private:
    NodePtr root_;
};

bool operator==(const Document& a, const Document& b);
bool operator!=(const Document& a, const Document& b);

} // namespace treemerge

#endif // TREEMERGE_DOCUMENT_HPP
