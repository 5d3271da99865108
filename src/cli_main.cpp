#include <cxxopts.hpp>
#include <iostream>
#include <nlohmann/json.hpp>
#include "treemerge/Apply.hpp"
#include "treemerge/Diff.hpp"
#include "treemerge/Errors.hpp"
#include "treemerge/Loader.hpp"
#include "treemerge/Merge.hpp"
#include "treemerge/Notebook.hpp"

using nlohmann::json;
using namespace treemerge;

namespace {

void emit(const json& value, const std::string& out) {
    if (out.empty()) {
        std::cout << value.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    } else {
        write_json_file(out, value, 2);
        std::cerr << "Wrote " << out << "\n";
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("treemerge", "Structural diff, patch and three-way merge of JSON/TOML documents and notebooks");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("c,config", "Path to JSON/TOML options file", cxxopts::value<std::string>())
            ("notebook", "Align notebook cells by type, source and outputs")
            ("threshold", "Similarity threshold for fuzzy alignment", cxxopts::value<double>())
            ("deadline-ms", "Abort alignment after N milliseconds (0 disables)", cxxopts::value<long>())
            ("canonical-inserts", "Order concurrent inserts by content instead of local-first")
            ("o,out", "Write the result to FILE instead of stdout", cxxopts::value<std::string>()->default_value(""))
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: diff BASE TARGET | apply DOC PATCH | merge BASE LOCAL REMOTE | resolve RESULT [DECISIONS]\n";
            return 0;
        }

        // Defaults, then options file, then flags
        Options opts;
        if (result.count("config")) {
            opts = load_options_file(result["config"].as<std::string>(), opts);
        }
        if (result.count("threshold")) {
            opts.diff.similarity_threshold = result["threshold"].as<double>();
        }
        if (result.count("deadline-ms")) {
            opts.diff.deadline = std::chrono::milliseconds(result["deadline-ms"].as<long>());
        }
        if (result.count("canonical-inserts")) {
            opts.merge.insert_order = InsertOrder::Canonical;
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];
        const std::string out = result["out"].as<std::string>();

        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                throw TreeMergeError("insufficient arguments for command '" + cmd + "'");
            }
        };

        bool notebook = result.count("notebook") > 0;
        for (size_t i = 1; i < cmdv.size() && cmd != "apply" && cmd != "resolve"; ++i) {
            notebook = notebook || get_file_extension(cmdv[i]) == ".ipynb";
        }
        if (notebook) {
            opts.diff = notebook_diff_options(opts.diff);
        }

        // DIFF
        if (cmd == "diff") {
            expect_args(3);
            Patch patch = diff(load_document(cmdv[1]), load_document(cmdv[2]), opts.diff);
            emit(patch_to_json(patch), out);
            return 0;
        }

        // APPLY
        if (cmd == "apply") {
            expect_args(3);
            Document doc = treemerge::apply(load_document(cmdv[1]), load_patch(cmdv[2]));
            emit(doc.to_json(), out);
            return 0;
        }

        // MERGE
        if (cmd == "merge") {
            expect_args(4);
            MergeResult merged = merge_documents(load_document(cmdv[1]), load_document(cmdv[2]),
                                                 load_document(cmdv[3]), opts.diff, opts.merge);
            emit(merge_result_to_json(merged), out);
            if (!merged.clean()) {
                std::cerr << merged.conflicts.size() << " conflict(s) left unresolved\n";
                return 1;
            }
            return 0;
        }

        // RESOLVE
        if (cmd == "resolve") {
            expect_args(2);
            MergeResult merged = merge_result_from_json(load_json_file(cmdv[1]));
            if (cmdv.size() > 2) {
                apply_resolutions(merged.conflicts, load_json_file(cmdv[2]));
            }
            size_t pending = 0;
            for (const auto& c : merged.conflicts) {
                if (!c.resolved()) ++pending;
            }
            emit(finalize(merged).to_json(), out);
            if (pending > 0) {
                std::cerr << pending << " conflict(s) left at their base value\n";
                return 1;
            }
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
