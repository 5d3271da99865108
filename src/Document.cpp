#include "treemerge/Document.hpp"
#include "treemerge/Errors.hpp"

namespace treemerge {

Document::Document() : root_(Node::mapping()) {}

Document::Document(NodePtr root) : root_(std::move(root)) {
    if (!root_) {
        throw SchemaMismatch("", "document root", "null pointer");
    }
}

Document Document::from_json(const Value& v) {
    return Document(Node::from_json(v));
}

Value Document::to_json() const {
    return root_->to_json();
}

Document Document::clone() const {
    return Document(deep_clone(root_));
}

Document Document::with(const Path& path, NodePtr value) const {
    return Document(set_at(root_, path, std::move(value)));
}

Document Document::without(const Path& path) const {
    return Document(erase_at(root_, path));
}

bool operator==(const Document& a, const Document& b) {
    return nodes_equal(a.root(), b.root());
}

bool operator!=(const Document& a, const Document& b) {
    return !(a == b);
}

} // namespace treemerge
