/**
 * @file Conflict.cpp
 * @brief Conflict and resolution JSON forms
 */

#include "treemerge/Conflict.hpp"
#include "treemerge/Errors.hpp"

namespace treemerge {

std::string to_string(ResolutionState state) {
    switch (state) {
        case ResolutionState::Unresolved: return "unresolved";
        case ResolutionState::ResolvedLocal: return "local";
        case ResolutionState::ResolvedRemote: return "remote";
        case ResolutionState::ResolvedCustom: return "custom";
    }
    return "unresolved";
}

Value resolution_to_json(const Resolution& resolution) {
    Value out = {{"state", to_string(resolution.state)}};
    if (resolution.state == ResolutionState::ResolvedCustom) {
        out["value"] = resolution.custom ? resolution.custom->to_json() : Value();
        out["remove"] = resolution.custom == nullptr;
    }
    return out;
}

Resolution resolution_from_json(const Value& v) {
    if (!v.is_object() || !v.contains("state") || !v.at("state").is_string()) {
        throw PatchFormatError("resolution must be an object with a 'state' string, got " +
                               excerpt(v));
    }

    const auto state = v.at("state").get<std::string>();
    if (state == "unresolved") return {};
    if (state == "local") return {ResolutionState::ResolvedLocal, nullptr};
    if (state == "remote") return {ResolutionState::ResolvedRemote, nullptr};
    if (state != "custom") {
        throw PatchFormatError("unknown resolution state '" + state + "'");
    }

    const bool remove = v.contains("remove") && v.at("remove").is_boolean() &&
                        v.at("remove").get<bool>();
    if (remove) {
        return {ResolutionState::ResolvedCustom, nullptr};
    }
    if (!v.contains("value")) {
        throw PatchFormatError("custom resolution lacks field 'value'");
    }
    return {ResolutionState::ResolvedCustom, Node::from_json(v.at("value"))};
}

Value conflict_to_json(const Conflict& conflict) {
    return {
        {"path", path_to_json(conflict.path)},
        {"path_text", to_string(conflict.path)},
        {"merged_path", path_to_json(conflict.merged_path)},
        {"local", op_to_json(conflict.local_op)},
        {"remote", op_to_json(conflict.remote_op)},
        {"resolution", resolution_to_json(conflict.resolution)}
    };
}

Value conflicts_to_json(const std::vector<Conflict>& conflicts) {
    Value arr = Value::array();
    for (const auto& c : conflicts) {
        arr.push_back(conflict_to_json(c));
    }
    return arr;
}

Conflict conflict_from_json(const Value& v) {
    if (!v.is_object()) {
        throw PatchFormatError("conflict must be an object, got " + type_name(v));
    }
    for (const char* name : {"path", "merged_path", "local", "remote"}) {
        if (!v.contains(name)) {
            throw PatchFormatError(std::string("conflict lacks field '") + name + "'");
        }
    }

    Conflict c(path_from_json(v.at("path")),
               op_from_json(v.at("local")),
               op_from_json(v.at("remote")),
               path_from_json(v.at("merged_path")));
    if (v.contains("resolution")) {
        c.resolution = resolution_from_json(v.at("resolution"));
    }
    return c;
}

std::vector<Conflict> conflicts_from_json(const Value& v) {
    if (!v.is_array()) {
        throw PatchFormatError("conflict list must be an array, got " + type_name(v));
    }
    std::vector<Conflict> out;
    out.reserve(v.size());
    for (const auto& item : v) {
        out.push_back(conflict_from_json(item));
    }
    return out;
}

std::size_t apply_resolutions(std::vector<Conflict>& conflicts, const Value& decisions) {
    if (!decisions.is_array()) {
        throw PatchFormatError("decisions must be an array, got " + type_name(decisions));
    }

    std::size_t updated = 0;
    for (const auto& d : decisions) {
        if (!d.is_object() || !d.contains("path") || !d.contains("resolution")) {
            throw PatchFormatError("decision needs 'path' and 'resolution', got " + excerpt(d));
        }
        const Path path = path_from_json(d.at("path"));
        const Resolution resolution = resolution_from_json(d.at("resolution"));

        bool matched = false;
        for (auto& c : conflicts) {
            if (c.path == path) {
                c.resolution = resolution;
                matched = true;
                ++updated;
            }
        }
        if (!matched) {
            throw PatchFormatError("no conflict at '" + to_string(path) + "'");
        }
    }
    return updated;
}

} // namespace treemerge
