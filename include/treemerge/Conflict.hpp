/**
 * @file Conflict.hpp
 * @brief Merge conflicts and their resolutions
 *
 * A conflict records the two incompatible ops found at one location.
 * What the ops address depends on their kind:
 * - ReplaceLeaf / TextEdit apply to the node at the conflict path
 * - AddKey, RemoveKey, NestedPatch, Delete and Replace are the container ops
 *   that produced the collision; they act on the child the path names
 *
 * Node-level conflicts where one side made a structural change report that
 * side as ReplaceLeaf(base value, value it would have produced).
 */

#ifndef TREEMERGE_CONFLICT_HPP
#define TREEMERGE_CONFLICT_HPP

#include "treemerge/Node.hpp"
#include "treemerge/Patch.hpp"
#include "treemerge/Path.hpp"
#include "treemerge/Value.hpp"

#include <string>
#include <vector>

namespace treemerge {

enum class ResolutionState {
    Unresolved,
    ResolvedLocal,
    ResolvedRemote,
    ResolvedCustom
};

struct Resolution {
    ResolutionState state = ResolutionState::Unresolved;

    /// Replacement value for ResolvedCustom; nullptr removes the location.
    NodePtr custom;
};

struct Conflict {
    Conflict(Path path_, Op local, Op remote, Path merged_path_)
        : path(std::move(path_))
        , local_op(std::move(local))
        , remote_op(std::move(remote))
        , merged_path(std::move(merged_path_))
    {}

    /// Location in base.
    Path path;
    Op local_op;
    Op remote_op;
    /// Location of the placeholder in the merged document.
    Path merged_path;
    Resolution resolution;

    void resolve_local() { resolution = {ResolutionState::ResolvedLocal, nullptr}; }
    void resolve_remote() { resolution = {ResolutionState::ResolvedRemote, nullptr}; }
    void resolve_custom(NodePtr value) {
        resolution = {ResolutionState::ResolvedCustom, std::move(value)};
    }
    void reset() { resolution = {}; }

    bool resolved() const noexcept { return resolution.state != ResolutionState::Unresolved; }
};

/// "unresolved", "local", "remote" or "custom".
std::string to_string(ResolutionState state);

Value resolution_to_json(const Resolution& resolution);

/**
 * @brief Parse {"state": ..., "value": ...}
 * @throws PatchFormatError on unknown states or a custom state without value
 */
Resolution resolution_from_json(const Value& v);

Value conflict_to_json(const Conflict& conflict);
Value conflicts_to_json(const std::vector<Conflict>& conflicts);

/**
 * @brief Parse the JSON form written by conflict_to_json()
 *
 * "path_text" is informational and ignored; "resolution" is optional.
 *
 * @throws PatchFormatError on malformed input
 */
Conflict conflict_from_json(const Value& v);
std::vector<Conflict> conflicts_from_json(const Value& v);

/**
 * @brief Record resolver decisions on matching conflicts
 *
 * `decisions` is an array of {"path": [...], "resolution": {...}} objects,
 * matched against Conflict::path.
 *
 * @return Number of conflicts updated
 * @throws PatchFormatError if a decision matches no conflict
 */
std::size_t apply_resolutions(std::vector<Conflict>& conflicts, const Value& decisions);

} // namespace treemerge

#endif // TREEMERGE_CONFLICT_HPP
