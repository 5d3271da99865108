/**
 * @file test_cli.cpp
 * @brief Tests for the file workflows behind the CLI commands (GoogleTest)
 *
 * Commands covered through the functions they call:
 * - diff: documents from files to patch JSON
 * - apply: patch file applied to a document file
 * - merge: notebook files merged, result written as JSON
 * - resolve: saved merge result plus decisions file finalized
 *
 * Note: These tests verify the underlying functions used by the CLI,
 * not the full CLI binary.
 */

#include <gtest/gtest.h>

#include "treemerge/Apply.hpp"
#include "treemerge/Diff.hpp"
#include "treemerge/Errors.hpp"
#include "treemerge/Loader.hpp"
#include "treemerge/Merge.hpp"
#include "treemerge/Notebook.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace treemerge;

// ============================================================================
// Test Utilities
// ============================================================================

/**
 * @brief RAII wrapper for temporary files
 */
class TempFile {
public:
    explicit TempFile(const std::string& filename, const std::string& content = "")
        : path_(fs::temp_directory_path() / filename) {
        std::ofstream f(path_);
        f << content;
        f.close();
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

// ============================================================================
// diff / apply
// ============================================================================

TEST(CliDiffApply, PatchFileRoundTrip) {
    TempFile base("treemerge_cli_base.json", R"({"cells": ["a", "b"], "meta": {"v": 1}})");
    TempFile target("treemerge_cli_target.json", R"({"cells": ["a", "c", "b"], "meta": {}})");
    TempFile patch_file("treemerge_cli_patch.json");

    Patch patch = diff(load_document(base.path()), load_document(target.path()));
    write_json_file(patch_file.path(), patch_to_json(patch), 2);

    Document applied = treemerge::apply(load_document(base.path()), load_patch(patch_file.path()));
    EXPECT_EQ(applied, load_document(target.path()));
}

TEST(CliDiffApply, PatchForOtherDocumentFails) {
    TempFile doc("treemerge_cli_doc.json", R"({"cells": []})");
    TempFile patch_file("treemerge_cli_bad_patch.json",
                        R"([{"op": "patch", "key": "cells", "diff": [{"op": "delete", "index": 0}]}])");
    EXPECT_THROW(treemerge::apply(load_document(doc.path()), load_patch(patch_file.path())), ApplyError);
}

// ============================================================================
// merge / resolve
// ============================================================================

TEST(CliMergeResolve, NotebookConflictResolvedFromDecisionsFile) {
    TempFile base("treemerge_cli_base.ipynb",
        R"({"cells": [{"cell_type": "markdown", "source": "# Notebook title"}], "nbformat": 4})");
    TempFile local("treemerge_cli_local.ipynb",
        R"({"cells": [{"cell_type": "markdown", "source": "# Notebook title A"}], "nbformat": 4})");
    TempFile remote("treemerge_cli_remote.ipynb",
        R"({"cells": [{"cell_type": "markdown", "source": "# Notebook title B"}], "nbformat": 4})");
    TempFile saved("treemerge_cli_merge.json");
    TempFile decisions("treemerge_cli_decisions.json", R"([
        {"path": ["cells", 0, "source"], "resolution": {"state": "local"}}
    ])");

    MergeResult merged = merge_notebooks(load_document(base.path()), load_document(local.path()),
                                         load_document(remote.path()));
    ASSERT_EQ(merged.conflicts.size(), 1u);
    write_json_file(saved.path(), merge_result_to_json(merged), 2);

    MergeResult reloaded = merge_result_from_json(load_json_file(saved.path()));
    EXPECT_EQ(apply_resolutions(reloaded.conflicts, load_json_file(decisions.path())), 1u);
    EXPECT_EQ(finalize(reloaded), load_document(local.path()));
}

TEST(CliMergeResolve, OptionsFileAppliesToMerge) {
    TempFile config("treemerge_cli_options.toml", "[merge]\ninsert_order = \"canonical\"\n");
    Options opts = load_options_file(config.path());

    const Document base = Document::from_json(Value::parse(R"({"s": []})"));
    const Document local = Document::from_json(Value::parse(R"({"s": ["z"]})"));
    const Document remote = Document::from_json(Value::parse(R"({"s": ["a"]})"));

    MergeResult merged = merge_documents(base, local, remote, opts.diff, opts.merge);
    EXPECT_TRUE(merged.clean());
    EXPECT_EQ(merged.merged.to_json(), Value::parse(R"({"s": ["a", "z"]})"));
}
