/// @file patch.hpp
/// @brief Edit operations and patches.

#pragma once

#include <docdelta-cpp/path.hpp>
#include <docdelta-cpp/tree.hpp>

#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

namespace docdelta_cpp {

/// Insert a value, creating missing intermediate mappings.
struct AddOp {
    Path path;   ///< Where the value goes.
    Tree value;  ///< The value to insert.
    auto operator==(const AddOp&) const -> bool = default;
};

/// Remove the node at an existing path.
struct RemoveOp {
    Path path;  ///< The node to remove.
    auto operator==(const RemoveOp&) const -> bool = default;
};

/// Overwrite the node at an existing path.
struct ReplaceOp {
    Path path;   ///< The node to overwrite.
    Tree value;  ///< Its new value.
    auto operator==(const ReplaceOp&) const -> bool = default;
};

/// The set of possible edit operations.
using EditOp = std::variant<
    AddOp,
    RemoveOp,
    ReplaceOp
>;

/// An ordered sequence of edit operations, applied front to back.
using Patch = std::vector<EditOp>;

/// The three operation kinds, in wire order.
enum class OpKind : std::uint8_t {
    add,
    remove,
    replace,
};

/// Convert an OpKind to its wire name ("add", "remove", "replace").
constexpr auto to_string_view(OpKind kind) noexcept -> std::string_view {
    switch (kind) {
        case OpKind::add:     return "add";
        case OpKind::remove:  return "remove";
        case OpKind::replace: return "replace";
    }
    return "unknown";
}

/// The kind of an operation.
inline auto op_kind(const EditOp& op) noexcept -> OpKind {
    return static_cast<OpKind>(op.index());
}

/// The path an operation targets.
inline auto op_path(const EditOp& op) noexcept -> const Path& {
    return std::visit([](const auto& o) -> const Path& { return o.path; }, op);
}

/// The value an add or replace carries, or nullptr for a remove.
inline auto op_value(const EditOp& op) noexcept -> const Tree* {
    return std::visit(overload{
        [](const RemoveOp&) -> const Tree* { return nullptr; },
        [](const auto& o) -> const Tree* { return &o.value; },
    }, op);
}

}  // namespace docdelta_cpp
