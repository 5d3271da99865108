/**
 * @file test_merge.cpp
 * @brief Unit tests for three-way merge and conflict finalization (GoogleTest)
 *
 * Tests cover:
 * - One-sided and identical changes
 * - Non-overlapping edits from both sides
 * - Concurrent inserts into one gap under both insert orders
 * - Each conflict kind, its paths and its placeholder
 * - Swapping local and remote swaps each conflict's ops
 * - finalize() with local, remote and custom resolutions
 */

#include <gtest/gtest.h>
#include "treemerge/Apply.hpp"
#include "treemerge/Diff.hpp"
#include "treemerge/Errors.hpp"
#include "treemerge/Merge.hpp"

#include <algorithm>

using namespace treemerge;

namespace {

Document doc(const char* json) {
    return Document::from_json(Value::parse(json));
}

MergeResult merge3(const char* base, const char* local, const char* remote,
                   InsertOrder order = InsertOrder::LocalFirst) {
    MergeOptions options;
    options.insert_order = order;
    return merge_documents(doc(base), doc(local), doc(remote), {}, options);
}

} // anonymous namespace

// ============================================================================
// Clean merges
// ============================================================================

TEST(MergeTest, NoChangesIsIdentity) {
    Document base = doc(R"({"cells": ["a", "b"], "meta": {"k": 1}})");
    MergeResult result = merge(base, {}, {});
    EXPECT_TRUE(result.clean());
    EXPECT_EQ(result.merged, base);
}

TEST(MergeTest, OneSidedChangeEqualsApply) {
    Document base = doc(R"({"cells": ["a", "b"], "meta": {"k": 1}})");
    Patch p = diff(base, doc(R"({"cells": ["a", "b", "c"], "meta": {}})"));

    MergeResult left = merge(base, p, {});
    MergeResult right = merge(base, {}, p);
    EXPECT_TRUE(left.clean());
    EXPECT_TRUE(right.clean());
    EXPECT_EQ(left.merged, treemerge::apply(base, p));
    EXPECT_EQ(right.merged, treemerge::apply(base, p));
}

TEST(MergeTest, IdenticalChangesAppliedOnce) {
    MergeResult result = merge3(R"({"s": ["a", "b"], "t": "x"})",
                                R"({"s": ["a", "L", "b"], "t": "y"})",
                                R"({"s": ["a", "L", "b"], "t": "y"})");
    EXPECT_TRUE(result.clean());
    EXPECT_EQ(result.merged, doc(R"({"s": ["a", "L", "b"], "t": "y"})"));
}

TEST(MergeTest, NonOverlappingEditsCombine) {
    MergeResult result = merge3(R"({"a": 1, "b": [1, 2, 3], "c": "x"})",
                                R"({"a": 2, "b": [1, 2, 3, 4], "c": "x"})",
                                R"({"a": 1, "b": [2, 3], "c": "y"})");
    EXPECT_TRUE(result.clean());
    EXPECT_EQ(result.merged, doc(R"({"a": 2, "b": [2, 3, 4], "c": "y"})"));
}

TEST(MergeTest, ReplacementsAtDifferentIndices) {
    const Document base = doc(R"(["a", "b", "c"])");
    const Patch local = {Replace{std::size_t{0}, {ReplaceLeaf{Node::text("a"), Node::text("A")}}}};
    const Patch remote = {Replace{std::size_t{2}, {ReplaceLeaf{Node::text("c"), Node::text("C")}}}};

    MergeResult result = merge(base, local, remote);
    EXPECT_TRUE(result.clean());
    EXPECT_EQ(result.merged, doc(R"(["A", "b", "C"])"));
}

TEST(MergeTest, EditsInsideSameElementRecurse) {
    MergeResult result = merge3(R"({"cells": [{"source": "a", "n": 1}]})",
                                R"({"cells": [{"source": "a", "n": 2}]})",
                                R"({"cells": [{"source": "b", "n": 1}]})");
    EXPECT_TRUE(result.clean());
    EXPECT_EQ(result.merged, doc(R"({"cells": [{"source": "b", "n": 2}]})"));
}

TEST(MergeTest, InvalidPatchIsRejected) {
    Document base = doc(R"({"a": 1})");
    EXPECT_THROW(merge(base, {RemoveKey{"zz"}}, {}), ApplyError);
    EXPECT_THROW(merge(base, {}, {AddKey{"a", Node::null()}}), ApplyError);
}

// ============================================================================
// Concurrent inserts
// ============================================================================

TEST(MergeInsertTest, LocalRunFirst) {
    const char* base = R"({"s": ["a", "b"]})";
    const char* with_l = R"({"s": ["a", "L", "b"]})";
    const char* with_r = R"({"s": ["a", "R", "b"]})";

    MergeResult result = merge3(base, with_l, with_r);
    EXPECT_TRUE(result.clean());
    EXPECT_EQ(result.merged, doc(R"({"s": ["a", "L", "R", "b"]})"));

    MergeResult swapped = merge3(base, with_r, with_l);
    EXPECT_EQ(swapped.merged, doc(R"({"s": ["a", "R", "L", "b"]})"));
}

TEST(MergeInsertTest, CanonicalOrderIsSymmetric) {
    const char* base = R"({"s": ["a", "b"]})";
    const char* with_l = R"({"s": ["a", "L", "b"]})";
    const char* with_r = R"({"s": ["a", "R", "b"]})";

    MergeResult one = merge3(base, with_r, with_l, InsertOrder::Canonical);
    MergeResult two = merge3(base, with_l, with_r, InsertOrder::Canonical);
    EXPECT_EQ(one.merged, two.merged);
    EXPECT_EQ(one.merged, doc(R"({"s": ["a", "L", "R", "b"]})"));
}

TEST(MergeInsertTest, CanonicalCleanMergeCommutes) {
    const char* base = R"({"a": 1, "s": [1, 2, 3], "t": "one\ntwo\n"})";
    const char* local = R"({"a": 2, "s": [0, 1, 2, 3], "t": "one\ntwo\n"})";
    const char* remote = R"({"a": 1, "s": [1, 2, 3, 9], "t": "one\ntwo\nthree\n", "z": null})";

    MergeResult lr = merge3(base, local, remote, InsertOrder::Canonical);
    MergeResult rl = merge3(base, remote, local, InsertOrder::Canonical);
    ASSERT_TRUE(lr.clean());
    ASSERT_TRUE(rl.clean());
    EXPECT_EQ(lr.merged, rl.merged);
    EXPECT_EQ(lr.merged,
              doc(R"({"a": 2, "s": [0, 1, 2, 3, 9], "t": "one\ntwo\nthree\n", "z": null})"));
}

// ============================================================================
// Conflicts
// ============================================================================

TEST(MergeConflictTest, SameElementChangedDifferently) {
    MergeResult result = merge3(R"({"cells": ["a", "b", "c"]})",
                                R"({"cells": ["a", "x", "c"]})",
                                R"({"cells": ["a", "y", "c"]})");
    ASSERT_EQ(result.conflicts.size(), 1u);
    const Conflict& c = result.conflicts[0];
    EXPECT_EQ(to_string(c.path), "cells[1]");
    EXPECT_EQ(to_string(c.merged_path), "cells[1]");
    EXPECT_FALSE(c.resolved());

    // Merged document keeps the base value as placeholder.
    EXPECT_EQ(result.merged, doc(R"({"cells": ["a", "b", "c"]})"));

    // The recorded ops reproduce each side's value.
    NodePtr b = Node::text("b");
    EXPECT_EQ(*apply_patch(b, {c.local_op}), *Node::text("x"));
    EXPECT_EQ(*apply_patch(b, {c.remote_op}), *Node::text("y"));

    result.conflicts[0].resolve_remote();
    EXPECT_EQ(finalize(result), doc(R"({"cells": ["a", "y", "c"]})"));
    result.conflicts[0].resolve_local();
    EXPECT_EQ(finalize(result), doc(R"({"cells": ["a", "x", "c"]})"));
}

TEST(MergeConflictTest, SwappingSidesSwapsConflictOps) {
    const char* base = R"({"cells": ["a", "b", "c"], "meta": {"k": 1, "v": 1}, "t": "x"})";
    const char* local = R"({"cells": ["a", "x", "c"], "meta": {"k": 2, "v": 1}, "t": "y", "n": 1})";
    const char* remote = R"({"cells": ["a", "y", "c"], "meta": {"k": 3, "v": 5}, "t": "x"})";

    MergeResult lr = merge3(base, local, remote);
    MergeResult rl = merge3(base, remote, local);
    ASSERT_EQ(lr.conflicts.size(), 2u);
    ASSERT_EQ(rl.conflicts.size(), 2u);

    for (const Conflict& c : lr.conflicts) {
        auto mirror = std::find_if(rl.conflicts.begin(), rl.conflicts.end(),
                                   [&](const Conflict& o) { return o.path == c.path; });
        ASSERT_NE(mirror, rl.conflicts.end()) << to_string(c.path);
        EXPECT_EQ(mirror->merged_path, c.merged_path);
        EXPECT_EQ(mirror->local_op, c.remote_op);
        EXPECT_EQ(mirror->remote_op, c.local_op);
    }

    const Document expected =
        doc(R"({"cells": ["a", "b", "c"], "meta": {"k": 1, "v": 5}, "t": "y", "n": 1})");
    EXPECT_EQ(lr.merged, expected);
    EXPECT_EQ(rl.merged, expected);
}

TEST(MergeConflictTest, UnresolvedFinalizeKeepsPlaceholder) {
    MergeResult result = merge3(R"({"v": "b"})", R"({"v": "x"})", R"({"v": "y"})");
    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(finalize(result), doc(R"({"v": "b"})"));
}

TEST(MergeConflictTest, AddKeyWithDifferentValues) {
    MergeResult result = merge3(R"({})", R"({"k": 1})", R"({"k": 2})");
    ASSERT_EQ(result.conflicts.size(), 1u);
    const Conflict& c = result.conflicts[0];
    EXPECT_EQ(to_string(c.path), "k");
    EXPECT_EQ(c.local_op.kind(), OpKind::AddKey);
    EXPECT_EQ(c.remote_op.kind(), OpKind::AddKey);
    EXPECT_EQ(result.merged, doc(R"({})"));

    result.conflicts[0].resolve_local();
    EXPECT_EQ(finalize(result), doc(R"({"k": 1})"));
}

TEST(MergeConflictTest, RemoveKeyAgainstPatch) {
    MergeResult result = merge3(R"({"m": {"x": 1}, "o": 0})",
                                R"({"o": 0})",
                                R"({"m": {"x": 2}, "o": 0})");
    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].local_op.kind(), OpKind::RemoveKey);
    EXPECT_EQ(result.conflicts[0].remote_op.kind(), OpKind::NestedPatch);
    EXPECT_EQ(result.merged, doc(R"({"m": {"x": 1}, "o": 0})"));

    result.conflicts[0].resolve_local();
    EXPECT_EQ(finalize(result), doc(R"({"o": 0})"));
    result.conflicts[0].resolve_remote();
    EXPECT_EQ(finalize(result), doc(R"({"m": {"x": 2}, "o": 0})"));
}

TEST(MergeConflictTest, DeleteAgainstReplaceTracksMergedIndex) {
    MergeResult result = merge3(R"({"cells": ["a", "b", "c"]})",
                                R"({"cells": ["b"]})",
                                R"({"cells": ["a", "b", "z"]})");
    ASSERT_EQ(result.conflicts.size(), 1u);
    const Conflict& c = result.conflicts[0];
    EXPECT_EQ(to_string(c.path), "cells[2]");
    EXPECT_EQ(to_string(c.merged_path), "cells[1]");
    EXPECT_EQ(c.local_op.kind(), OpKind::Delete);
    EXPECT_EQ(c.remote_op.kind(), OpKind::Replace);

    // The non-conflicting delete of "a" went through.
    EXPECT_EQ(result.merged, doc(R"({"cells": ["b", "c"]})"));

    result.conflicts[0].resolve_remote();
    EXPECT_EQ(finalize(result), doc(R"({"cells": ["b", "z"]})"));
    result.conflicts[0].resolve_local();
    EXPECT_EQ(finalize(result), doc(R"({"cells": ["b"]})"));
}

TEST(MergeConflictTest, StructuralSideReportedAsReplaceLeaf) {
    MergeResult result = merge3(R"({"v": [1, 2]})", R"({"v": "text"})", R"({"v": [1, 2, 3]})");
    ASSERT_EQ(result.conflicts.size(), 1u);
    const Conflict& c = result.conflicts[0];
    EXPECT_EQ(to_string(c.path), "v");
    ASSERT_EQ(c.remote_op.kind(), OpKind::ReplaceLeaf);
    EXPECT_EQ(*std::get<ReplaceLeaf>(c.remote_op.value).new_value,
              *Node::from_json(Value::parse("[1, 2, 3]")));

    result.conflicts[0].resolve_remote();
    EXPECT_EQ(finalize(result), doc(R"({"v": [1, 2, 3]})"));
}

// ============================================================================
// Finalize
// ============================================================================

TEST(MergeFinalizeTest, CustomValueAndRemoval) {
    MergeResult result = merge3(R"({"cells": ["a", "b", "c"]})",
                                R"({"cells": ["a", "x", "c"]})",
                                R"({"cells": ["a", "y", "c"]})");
    ASSERT_EQ(result.conflicts.size(), 1u);

    result.conflicts[0].resolve_custom(Node::text("xy"));
    EXPECT_EQ(finalize(result), doc(R"({"cells": ["a", "xy", "c"]})"));

    result.conflicts[0].resolve_custom(nullptr);
    EXPECT_EQ(finalize(result), doc(R"({"cells": ["a", "c"]})"));

    result.conflicts[0].reset();
    EXPECT_EQ(finalize(result), result.merged);
}

TEST(MergeFinalizeTest, RemovalDoesNotShiftLaterConflicts) {
    MergeResult result = merge3(R"({"s": ["a", "b", "c"]})",
                                R"({"s": ["p", "b", "q"]})",
                                R"({"s": ["r", "b", "t"]})");
    ASSERT_EQ(result.conflicts.size(), 2u);
    EXPECT_EQ(to_string(result.conflicts[0].merged_path), "s[0]");
    EXPECT_EQ(to_string(result.conflicts[1].merged_path), "s[2]");

    result.conflicts[0].resolve_custom(nullptr);
    result.conflicts[1].resolve_remote();
    EXPECT_EQ(finalize(result), doc(R"({"s": ["b", "t"]})"));
}

TEST(MergeFinalizeTest, StaleResolutionIsApplyError) {
    MergeResult result = merge3(R"({"v": "b"})", R"({"v": "x"})", R"({"v": "y"})");
    ASSERT_EQ(result.conflicts.size(), 1u);
    result.merged = doc(R"({"w": 1})");
    result.conflicts[0].resolve_local();
    EXPECT_THROW(finalize(result), ApplyError);
}
