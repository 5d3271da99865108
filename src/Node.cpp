/**
 * @file Node.cpp
 * @brief Implementation of the immutable document tree
 */

#include "treemerge/Node.hpp"
#include "treemerge/Errors.hpp"

#include <limits>
#include <type_traits>

namespace treemerge {

// ============================================================================
// Construction
// ============================================================================

NodePtr Node::mapping(Mapping m) {
    return std::make_shared<const Node>(std::move(m));
}

NodePtr Node::sequence(Sequence s) {
    return std::make_shared<const Node>(std::move(s));
}

NodePtr Node::leaf(Scalar v) {
    return std::make_shared<const Node>(std::move(v));
}

NodePtr Node::text(std::string s) {
    return leaf(Scalar(std::move(s)));
}

NodePtr Node::null() {
    return leaf(Scalar(nullptr));
}

NodePtr Node::from_json(const Value& v) {
    switch (v.type()) {
        case Value::value_t::object: {
            Mapping m;
            for (auto it = v.begin(); it != v.end(); ++it) {
                m.emplace(it.key(), from_json(it.value()));
            }
            return mapping(std::move(m));
        }

        case Value::value_t::array: {
            Sequence s;
            s.reserve(v.size());
            for (const auto& elem : v) {
                s.push_back(from_json(elem));
            }
            return sequence(std::move(s));
        }

        case Value::value_t::string:
            return text(v.get<std::string>());

        case Value::value_t::boolean:
            return leaf(Scalar(v.get<bool>()));

        case Value::value_t::number_integer:
            return leaf(Scalar(v.get<std::int64_t>()));

        case Value::value_t::number_unsigned: {
            const auto u = v.get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return leaf(Scalar(static_cast<std::int64_t>(u)));
            }
            return leaf(Scalar(static_cast<double>(u)));
        }

        case Value::value_t::number_float:
            return leaf(Scalar(v.get<double>()));

        case Value::value_t::null:
            return null();

        default:
            throw SchemaMismatch("", "document value", type_name(v));
    }
}

Value Node::to_json() const {
    if (const auto* m = std::get_if<Mapping>(&data_)) {
        Value obj = Value::object();
        for (const auto& [key, child] : *m) {
            obj[key] = child->to_json();
        }
        return obj;
    }

    if (const auto* s = std::get_if<Sequence>(&data_)) {
        Value arr = Value::array();
        for (const auto& child : *s) {
            arr.push_back(child->to_json());
        }
        return arr;
    }

    return std::visit([](const auto& v) -> Value {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return Value(nullptr);
        } else {
            return Value(v);
        }
    }, std::get<Scalar>(data_));
}

// ============================================================================
// Accessors
// ============================================================================

NodeKind Node::kind() const noexcept {
    if (is_mapping()) return NodeKind::Mapping;
    if (is_sequence()) return NodeKind::Sequence;
    return NodeKind::Leaf;
}

bool Node::is_text() const noexcept {
    const auto* s = std::get_if<Scalar>(&data_);
    return s != nullptr && std::holds_alternative<std::string>(*s);
}

const Mapping& Node::as_mapping() const {
    if (const auto* m = std::get_if<Mapping>(&data_)) return *m;
    throw PathTypeError("", "mapping", kind_name(*this));
}

const Sequence& Node::as_sequence() const {
    if (const auto* s = std::get_if<Sequence>(&data_)) return *s;
    throw PathTypeError("", "sequence", kind_name(*this));
}

const Scalar& Node::as_scalar() const {
    if (const auto* s = std::get_if<Scalar>(&data_)) return *s;
    throw PathTypeError("", "leaf", kind_name(*this));
}

const std::string& Node::as_text() const {
    const auto& s = as_scalar();
    if (const auto* str = std::get_if<std::string>(&s)) return *str;
    throw PathTypeError("", "text", kind_name(*this));
}

std::size_t Node::size() const noexcept {
    if (const auto* m = std::get_if<Mapping>(&data_)) return m->size();
    if (const auto* s = std::get_if<Sequence>(&data_)) return s->size();
    return 0;
}

NodePtr Node::find(const std::string& key) const {
    const auto* m = std::get_if<Mapping>(&data_);
    if (!m) return nullptr;
    auto it = m->find(key);
    return it == m->end() ? nullptr : it->second;
}

NodePtr Node::at(std::size_t index) const {
    const auto* s = std::get_if<Sequence>(&data_);
    if (!s || index >= s->size()) return nullptr;
    return (*s)[index];
}

// ============================================================================
// Free functions
// ============================================================================

std::string kind_name(const Node& node) {
    switch (node.kind()) {
        case NodeKind::Mapping: return "mapping";
        case NodeKind::Sequence: return "sequence";
        case NodeKind::Leaf: break;
    }
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) return "null";
        else if constexpr (std::is_same_v<T, bool>) return "boolean";
        else if constexpr (std::is_same_v<T, std::int64_t>) return "integer";
        else if constexpr (std::is_same_v<T, double>) return "float";
        else return "text";
    }, node.as_scalar());
}

bool same_shape(const Node& a, const Node& b) {
    if (a.kind() != b.kind()) return false;
    if (!a.is_leaf()) return true;
    return a.as_scalar().index() == b.as_scalar().index();
}

bool nodes_equal(const Node& a, const Node& b) {
    if (&a == &b) return true;
    if (a.kind() != b.kind()) return false;

    switch (a.kind()) {
        case NodeKind::Mapping: {
            const auto& ma = a.as_mapping();
            const auto& mb = b.as_mapping();
            if (ma.size() != mb.size()) return false;
            auto ia = ma.begin();
            auto ib = mb.begin();
            for (; ia != ma.end(); ++ia, ++ib) {
                if (ia->first != ib->first) return false;
                if (!nodes_equal(ia->second, ib->second)) return false;
            }
            return true;
        }
        case NodeKind::Sequence: {
            const auto& sa = a.as_sequence();
            const auto& sb = b.as_sequence();
            if (sa.size() != sb.size()) return false;
            for (std::size_t i = 0; i < sa.size(); ++i) {
                if (!nodes_equal(sa[i], sb[i])) return false;
            }
            return true;
        }
        case NodeKind::Leaf:
            return a.as_scalar() == b.as_scalar();
    }
    return false;
}

bool nodes_equal(const NodePtr& a, const NodePtr& b) {
    if (a == b) return true;
    if (!a || !b) return false;
    return nodes_equal(*a, *b);
}

NodePtr deep_clone(const NodePtr& node) {
    if (!node) return nullptr;
    switch (node->kind()) {
        case NodeKind::Mapping: {
            Mapping m;
            for (const auto& [key, child] : node->as_mapping()) {
                m.emplace(key, deep_clone(child));
            }
            return Node::mapping(std::move(m));
        }
        case NodeKind::Sequence: {
            Sequence s;
            s.reserve(node->size());
            for (const auto& child : node->as_sequence()) {
                s.push_back(deep_clone(child));
            }
            return Node::sequence(std::move(s));
        }
        case NodeKind::Leaf:
            break;
    }
    return Node::leaf(node->as_scalar());
}

std::string canonical_text(const Node& node) {
    return node.to_json().dump(-1, ' ', false, Value::error_handler_t::replace);
}

std::string describe(const Node& node) {
    return kind_name(node) + " " + excerpt(node.to_json());
}

} // namespace treemerge
