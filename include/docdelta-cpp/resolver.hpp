/// @file resolver.hpp
/// @brief Path resolution and path-addressed mutation of trees.
///
/// Every mutator either succeeds completely or throws PathError with the
/// tree left exactly as it was.

#pragma once

#include <docdelta-cpp/path.hpp>
#include <docdelta-cpp/tree.hpp>

#include <cstddef>
#include <optional>

namespace docdelta_cpp {

/// What insert() did, in enough detail to undo it.
struct InsertResult {
    /// Concrete path of the topmost node that was created or overwritten.
    /// Append markers are resolved to indices; for an auto-vivified chain
    /// this is the first mapping that was created.
    Path location;
    /// The value a mapping key held before it was overwritten.
    std::optional<Tree> displaced;
};

/// What erase() removed.
struct EraseResult {
    Tree value;            ///< The removed subtree.
    std::size_t position;  ///< Its index in the parent sequence or mapping.
};

/// Locate the node at a path.
/// @throws PathError (path_not_found, index_out_of_bounds, invalid_path,
///   type_mismatch).
auto resolve(const Tree& tree, const Path& path) -> const Tree&;
auto resolve(Tree& tree, const Path& path) -> Tree&;

/// Locate the node at a path, or nullptr if it does not resolve.
auto find(const Tree& tree, const Path& path) noexcept -> const Tree*;

/// Insert a value.
///
/// On a mapping the final key is created or overwritten; missing
/// intermediate mapping keys are created as empty mappings. On a sequence
/// the value is inserted before index i (0 <= i <= len) or appended for
/// the append marker. The empty path replaces the root.
/// @throws PathError
auto insert(Tree& tree, const Path& path, Tree value) -> InsertResult;

/// Remove the node at a path. The root cannot be removed.
/// @throws PathError
auto erase(Tree& tree, const Path& path) -> EraseResult;

/// Overwrite the node at a path. A missing final mapping key is created;
/// every other token must resolve. The empty path replaces the root.
/// @return The previous value, or nullopt if the key was created.
/// @throws PathError
auto set(Tree& tree, const Path& path, Tree value) -> std::optional<Tree>;

}  // namespace docdelta_cpp
