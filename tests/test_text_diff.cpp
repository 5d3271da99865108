/**
 * @file test_text_diff.cpp
 * @brief Unit tests for text edit scripts (GoogleTest)
 *
 * Tests cover:
 * - Unit splitting for lines and UTF-8 characters
 * - Granularity selection
 * - Minimal scripts and their application
 * - Strict validation of scripts against the text they are applied to
 */

#include <gtest/gtest.h>
#include "treemerge/Errors.hpp"
#include "treemerge/TextDiff.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace treemerge;

// ============================================================================
// Units
// ============================================================================

TEST(SplitUnitsTest, LinesKeepTerminators) {
    auto units = split_units("a\nbb\nc", TextGranularity::Line);
    ASSERT_EQ(units.size(), 3u);
    EXPECT_EQ(units[0], "a\n");
    EXPECT_EQ(units[1], "bb\n");
    EXPECT_EQ(units[2], "c");
}

TEST(SplitUnitsTest, CharsAreCodePoints) {
    // "é" is two bytes, "€" three.
    auto units = split_units("a\xC3\xA9\xE2\x82\xAC", TextGranularity::Char);
    ASSERT_EQ(units.size(), 3u);
    EXPECT_EQ(units[1], "\xC3\xA9");
    EXPECT_EQ(units[2], "\xE2\x82\xAC");
}

TEST(SplitUnitsTest, TruncatedSequenceFallsBackToBytes) {
    auto units = split_units("a\xE2\x82", TextGranularity::Char);
    EXPECT_EQ(units.size(), 3u);
}

TEST(SplitUnitsTest, GranularitySelection) {
    EXPECT_EQ(choose_granularity("a", "b", TextMode::Auto), TextGranularity::Char);
    EXPECT_EQ(choose_granularity("a\nb", "b", TextMode::Auto), TextGranularity::Line);
    EXPECT_EQ(choose_granularity("a", "b\n", TextMode::Auto), TextGranularity::Line);
    EXPECT_EQ(choose_granularity("a\nb", "b", TextMode::Char), TextGranularity::Char);
    EXPECT_EQ(choose_granularity("a", "b", TextMode::Line), TextGranularity::Line);
}

// ============================================================================
// Scripts
// ============================================================================

TEST(DiffTextTest, SingleCharReplace) {
    TextEdit edit = diff_text("b", "x", TextGranularity::Char, Budget());
    std::vector<EditSpan> expected = {EditSpan::remove("b"), EditSpan::insert("x")};
    EXPECT_EQ(edit.granularity, TextGranularity::Char);
    EXPECT_EQ(edit.script, expected);
}

TEST(DiffTextTest, ChangedMiddleLine) {
    TextEdit edit = diff_text("one\ntwo\nthree\n", "one\nTWO\nthree\n",
                              TextGranularity::Line, Budget());
    std::vector<EditSpan> expected = {
        EditSpan::copy(1), EditSpan::remove("two\n"), EditSpan::insert("TWO\n"), EditSpan::copy(1)
    };
    EXPECT_EQ(edit.script, expected);
}

TEST(DiffTextTest, PureInsertion) {
    TextEdit edit = diff_text("ac", "abc", TextGranularity::Char, Budget());
    std::vector<EditSpan> expected = {EditSpan::copy(1), EditSpan::insert("b"), EditSpan::copy(1)};
    EXPECT_EQ(edit.script, expected);
}

TEST(DiffTextTest, EmptyToText) {
    TextEdit edit = diff_text("", "new", TextGranularity::Char, Budget());
    std::vector<EditSpan> expected = {EditSpan::insert("new")};
    EXPECT_EQ(edit.script, expected);
    EXPECT_EQ(apply_text_edit("", edit, "t"), "new");
}

TEST(DiffTextTest, AppliesBackToTarget) {
    const std::vector<std::pair<std::string, std::string>> cases = {
        {"kitten", "sitting"},
        {"import os\nimport sys\n", "import sys\nimport os\nprint(1)\n"},
        {"caf\xC3\xA9", "cafe"},
        {"same", "same"},
        {"x\ny", ""},
    };
    for (const auto& [a, b] : cases) {
        const auto g = choose_granularity(a, b, TextMode::Auto);
        TextEdit edit = diff_text(a, b, g, Budget());
        EXPECT_EQ(apply_text_edit(a, edit, "t"), b) << a << " -> " << b;
    }
}

TEST(DiffTextTest, LongLineIgnoresTableLimit) {
    const std::string a(10000, 'a');
    std::string b = a;
    b[10] = 'b';
    b[9000] = 'b';

    Budget budget(nullptr, std::chrono::milliseconds{0}, 1);
    TextEdit edit = diff_text(a, b, TextGranularity::Char, budget);
    std::size_t copied = 0;
    std::string deleted;
    std::string inserted;
    for (const auto& span : edit.script) {
        if (span.kind == EditSpan::Kind::Copy) copied += span.count;
        if (span.kind == EditSpan::Kind::Delete) deleted += span.text;
        if (span.kind == EditSpan::Kind::Insert) inserted += span.text;
    }
    EXPECT_EQ(copied, 9998u);
    EXPECT_EQ(deleted, "aa");
    EXPECT_EQ(inserted, "bb");
    EXPECT_EQ(apply_text_edit(a, edit, "t"), b);
}

// ============================================================================
// Validation
// ============================================================================

TEST(ApplyTextEditTest, CopyPastEndThrows) {
    TextEdit edit{TextGranularity::Char, {EditSpan::copy(4)}};
    EXPECT_THROW(apply_text_edit("abc", edit, "t"), ApplyError);
}

TEST(ApplyTextEditTest, DeletedTextMustMatch) {
    TextEdit edit{TextGranularity::Char, {EditSpan::remove("x"), EditSpan::copy(2)}};
    try {
        apply_text_edit("abc", edit, "cells[1]");
        FAIL() << "expected ApplyError";
    } catch (const ApplyError& e) {
        EXPECT_EQ(e.path(), "cells[1]");
    }
}

TEST(ApplyTextEditTest, ScriptMustConsumeWholeText) {
    TextEdit edit{TextGranularity::Char, {EditSpan::copy(2)}};
    EXPECT_THROW(apply_text_edit("abc", edit, "t"), ApplyError);
}

TEST(ApplyTextEditTest, LineDeleteMustEndOnUnitBoundary) {
    TextEdit edit{TextGranularity::Line, {EditSpan::remove("on"), EditSpan::copy(1)}};
    EXPECT_THROW(apply_text_edit("one\ntwo\n", edit, "t"), ApplyError);
}
