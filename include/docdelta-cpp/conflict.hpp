/// @file conflict.hpp
/// @brief Conflict detection between edits of a document.

#pragma once

#include <docdelta-cpp/diff.hpp>
#include <docdelta-cpp/patch.hpp>
#include <docdelta-cpp/path.hpp>
#include <docdelta-cpp/tree.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace docdelta_cpp {

/// Which detector a caller relies on.
enum class ConflictMode : std::uint8_t {
    single_source,  ///< Every replacement in base -> edited is flagged.
    three_way,      ///< Divergent edits of two branches against a base.
};

/// Convert a ConflictMode to its string representation.
constexpr auto to_string_view(ConflictMode mode) noexcept -> std::string_view {
    switch (mode) {
        case ConflictMode::single_source: return "single_source";
        case ConflictMode::three_way:     return "three_way";
    }
    return "unknown";
}

/// A replaced value found by the single-source detector.
struct Conflict {
    Path path;   ///< The replaced node.
    Tree value;  ///< Its value in the edited tree.
    auto operator==(const Conflict&) const -> bool = default;
};

/// Result of single-source detection.
struct ConflictReport {
    bool has_conflict{false};
    std::vector<Conflict> conflicts;
    auto operator==(const ConflictReport&) const -> bool = default;
};

/// Two branches disagree about a node.
///
/// `path` is the shallower of the two edited paths; `left` and `right` are
/// the clashing operations from each branch's diff against the base.
struct BranchConflict {
    Path path;
    EditOp left;
    EditOp right;
    auto operator==(const BranchConflict&) const -> bool = default;
};

/// Result of three-way detection.
struct MergeReport {
    bool has_conflict{false};
    std::vector<BranchConflict> conflicts;
    auto operator==(const MergeReport&) const -> bool = default;
};

/// Flag every replacement in diff(base, edited).
///
/// This is a conservative single-branch check: it reports each replaced
/// value, whether or not another writer touched it.
auto detect_conflicts(const Tree& base, const Tree& edited,
                      const DiffOptions& options = {}) -> ConflictReport;

/// Compare two branches edited from a common base.
///
/// A conflict is reported when both branches edit the same path with a
/// different outcome, or when one branch removes or replaces a node that
/// the other edits below. Identical edits on both sides do not conflict.
auto detect_conflicts(const Tree& base, const Tree& left, const Tree& right,
                      const DiffOptions& options = {}) -> MergeReport;

}  // namespace docdelta_cpp
