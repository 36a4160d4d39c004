/// @file json.hpp
/// @brief nlohmann/json interoperability for docdelta-cpp.
///
/// Provides ADL serialization (to_json/from_json) for trees, edit
/// operations, patches (RFC 6902 subset: add, remove, replace) and
/// conflict reports.
///
/// Patches and reports use nlohmann::ordered_json so that members come out
/// as {"op", "path", "value"} and object values keep their key order.

#pragma once

#include <docdelta-cpp/conflict.hpp>
#include <docdelta-cpp/patch.hpp>
#include <docdelta-cpp/path.hpp>
#include <docdelta-cpp/tree.hpp>

#include <nlohmann/json.hpp>

namespace docdelta_cpp {

// =============================================================================
// Trees
// =============================================================================

/// Mappings become objects, sequences arrays. Numbers keep their
/// representation: int64, uint64 (only above the int64 range), or double.
void to_json(nlohmann::json& j, const Tree& tree);
void from_json(const nlohmann::json& j, Tree& tree);

/// Same as above; object members keep their order in both directions.
void to_json(nlohmann::ordered_json& j, const Tree& tree);
void from_json(const nlohmann::ordered_json& j, Tree& tree);

// =============================================================================
// Patches (RFC 6902 subset)
// =============================================================================

/// {"op": "add"|"remove"|"replace", "path": "/a/0", "value"?: ...}
void to_json(nlohmann::ordered_json& j, const EditOp& op);

/// @throws PatchFormatError for unknown or unsupported ops ("move", "copy",
///   "test"), missing members, or a malformed path.
void from_json(const nlohmann::ordered_json& j, EditOp& op);

/// Serialize a patch as a JSON array.
auto patch_to_json(const Patch& patch) -> nlohmann::ordered_json;

/// Parse a JSON array of operations.
/// @throws PatchFormatError if `j` is not an array or an element is invalid.
auto patch_from_json(const nlohmann::ordered_json& j) -> Patch;

// =============================================================================
// Conflict reports
// =============================================================================

void to_json(nlohmann::ordered_json& j, const Conflict& c);
void to_json(nlohmann::ordered_json& j, const ConflictReport& report);
void to_json(nlohmann::ordered_json& j, const BranchConflict& c);
void to_json(nlohmann::ordered_json& j, const MergeReport& report);

}  // namespace docdelta_cpp
