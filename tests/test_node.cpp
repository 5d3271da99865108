/**
 * @file test_node.cpp
 * @brief Unit tests for the immutable node model and documents (GoogleTest)
 *
 * Tests cover:
 * - JSON conversion in both directions
 * - Structural equality and shape comparison
 * - Document construction, cloning and immutable updates
 */

#include <gtest/gtest.h>
#include "treemerge/Document.hpp"
#include "treemerge/Errors.hpp"
#include "treemerge/Node.hpp"

using namespace treemerge;

// ============================================================================
// JSON conversion
// ============================================================================

TEST(NodeJsonTest, ConvertsEveryKind) {
    Value v = Value::parse(R"({"m": {"k": 1}, "s": [true, null, 2.5], "t": "text"})");
    NodePtr n = Node::from_json(v);

    ASSERT_TRUE(n->is_mapping());
    EXPECT_TRUE(n->find("m")->is_mapping());
    EXPECT_TRUE(n->find("s")->is_sequence());
    EXPECT_TRUE(n->find("t")->is_text());
    EXPECT_EQ(n->find("t")->as_text(), "text");
    EXPECT_EQ(n->find("s")->size(), 3u);
    EXPECT_EQ(n->to_json(), v);
}

TEST(NodeJsonTest, KindNames) {
    EXPECT_EQ(kind_name(*Node::from_json(Value::object())), "mapping");
    EXPECT_EQ(kind_name(*Node::from_json(Value::array())), "sequence");
    EXPECT_EQ(kind_name(*Node::from_json("x")), "text");
    EXPECT_EQ(kind_name(*Node::from_json(3)), "integer");
    EXPECT_EQ(kind_name(*Node::from_json(3.5)), "float");
    EXPECT_EQ(kind_name(*Node::from_json(false)), "boolean");
    EXPECT_EQ(kind_name(*Node::from_json(nullptr)), "null");
}

TEST(NodeJsonTest, LargeUnsignedBecomesFloat) {
    Value big = std::uint64_t{18446744073709551615ULL};
    NodePtr n = Node::from_json(big);
    EXPECT_EQ(kind_name(*n), "float");
}

TEST(NodeJsonTest, BinaryValuesAreRejected) {
    Value bin = Value::binary({1, 2, 3});
    EXPECT_THROW(Node::from_json(bin), SchemaMismatch);
}

TEST(NodeJsonTest, TypedAccessorThrowsOnWrongKind) {
    NodePtr n = Node::from_json(42);
    EXPECT_THROW(n->as_mapping(), PathTypeError);
    EXPECT_THROW(n->as_text(), PathTypeError);
    EXPECT_EQ(n->find("x"), nullptr);
    EXPECT_EQ(n->at(0), nullptr);
}

// ============================================================================
// Equality
// ============================================================================

TEST(NodeEqualityTest, StructuralNotIdentity) {
    NodePtr a = Node::from_json(Value::parse(R"({"a": [1, 2, {"b": "c"}]})"));
    NodePtr b = Node::from_json(Value::parse(R"({"a": [1, 2, {"b": "c"}]})"));
    EXPECT_NE(a.get(), b.get());
    EXPECT_TRUE(nodes_equal(a, b));
    EXPECT_EQ(*a, *b);
}

TEST(NodeEqualityTest, IntegerAndFloatDiffer) {
    EXPECT_FALSE(nodes_equal(Node::from_json(1), Node::from_json(1.0)));
}

TEST(NodeEqualityTest, SequenceOrderMatters) {
    EXPECT_FALSE(nodes_equal(Node::from_json(Value::parse("[1, 2]")),
                             Node::from_json(Value::parse("[2, 1]"))));
}

TEST(NodeEqualityTest, SameShape) {
    EXPECT_TRUE(same_shape(*Node::text("a"), *Node::text("b")));
    EXPECT_FALSE(same_shape(*Node::text("1"), *Node::from_json(1)));
    EXPECT_TRUE(same_shape(*Node::mapping(), *Node::from_json(Value::parse(R"({"x": 1})"))));
    EXPECT_FALSE(same_shape(*Node::mapping(), *Node::sequence()));
}

TEST(NodeEqualityTest, DeepCloneSharesNothing) {
    NodePtr a = Node::from_json(Value::parse(R"({"a": {"b": [1]}})"));
    NodePtr c = deep_clone(a);
    EXPECT_TRUE(nodes_equal(a, c));
    EXPECT_NE(a->find("a").get(), c->find("a").get());
}

TEST(NodeEqualityTest, CanonicalTextOrdersKeys) {
    NodePtr n = Node::from_json(Value::parse(R"({"b": 1, "a": 2})"));
    EXPECT_EQ(canonical_text(*n), R"({"a":2,"b":1})");
}

// ============================================================================
// Documents
// ============================================================================

TEST(DocumentTest, DefaultIsEmptyMapping) {
    Document d;
    EXPECT_TRUE(d.root()->is_mapping());
    EXPECT_EQ(d.root()->size(), 0u);
}

TEST(DocumentTest, NullRootRejected) {
    EXPECT_THROW(Document{NodePtr{}}, SchemaMismatch);
}

TEST(DocumentTest, WithLeavesOriginalUntouched) {
    Document d = Document::from_json(Value::parse(R"({"cells": ["a", "b"], "meta": {"k": 1}})"));
    Document e = d.with(parse_path("cells[1]"), Node::text("x"));

    EXPECT_EQ(d.get(parse_path("cells[1]"))->as_text(), "b");
    EXPECT_EQ(e.get(parse_path("cells[1]"))->as_text(), "x");
    // Untouched subtrees are shared.
    EXPECT_EQ(d.get(parse_path("meta")).get(), e.get(parse_path("meta")).get());
}

TEST(DocumentTest, WithoutRemovesKey) {
    Document d = Document::from_json(Value::parse(R"({"a": 1, "b": 2})"));
    Document e = d.without(parse_path("a"));
    EXPECT_FALSE(e.contains(parse_path("a")));
    EXPECT_TRUE(d.contains(parse_path("a")));
}

TEST(DocumentTest, CloneIsEqual) {
    Document d = Document::from_json(Value::parse(R"({"a": [1, {"b": null}]})"));
    Document c = d.clone();
    EXPECT_EQ(d, c);
    EXPECT_NE(d.root().get(), c.root().get());
}
