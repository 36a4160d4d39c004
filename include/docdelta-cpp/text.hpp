/// @file text.hpp
/// @brief Fail-soft string entry points.
///
/// These functions never throw for bad input. Each failure is logged and
/// answered with a neutral default, so callers test for an empty patch or
/// an unchanged document instead of catching exceptions.

#pragma once

#include <docdelta-cpp/diff.hpp>

#include <string>
#include <string_view>

namespace docdelta_cpp::text {

/// Diff two YAML documents.
/// @return A JSON Patch array, or "[]" if either document fails to decode.
auto diff(std::string_view base_text, std::string_view target_text,
          const DiffOptions& options = {}) -> std::string;

/// Apply a JSON Patch array to a YAML document.
/// @return The patched document re-encoded as YAML, or `doc_text`
///   unchanged if decoding, patch parsing, or any operation fails.
auto apply_patch(std::string_view doc_text, std::string_view patch_text) -> std::string;

/// Single-source conflict detection (ConflictMode::single_source).
/// @return {"has_conflict": bool, "conflicts": [{"path", "value"}]};
///   the empty report if either document fails to decode.
auto detect_conflicts(std::string_view base_text, std::string_view edited_text) -> std::string;

/// Three-way conflict detection (ConflictMode::three_way).
/// @return {"has_conflict": bool, "conflicts": [{"path", "left", "right"}]};
///   the empty report if any document fails to decode.
auto detect_conflicts(std::string_view base_text, std::string_view left_text,
                      std::string_view right_text) -> std::string;

/// Convert a YAML document to compact JSON.
/// @return The JSON text, or {"success":false,"errors":[{"line","message","path"}]}.
auto yaml_to_json(std::string_view yaml_text) -> std::string;

/// Convert a JSON document to YAML.
/// @return The YAML text, or the same error object as yaml_to_json().
auto json_to_yaml(std::string_view json_text) -> std::string;

/// The library version ("major.minor.patch").
auto version() -> std::string;

}  // namespace docdelta_cpp::text
