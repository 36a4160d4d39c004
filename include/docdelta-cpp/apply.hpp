/// @file apply.hpp
/// @brief Atomic application of patches.

#pragma once

#include <docdelta-cpp/patch.hpp>
#include <docdelta-cpp/tree.hpp>

namespace docdelta_cpp {

/// Apply a patch to a copy of `tree` and return the result.
///
/// Operations run in order; each sees the effects of the ones before it.
/// `tree` is never modified.
///
/// Call it qualified, as `docdelta_cpp::apply(tree, patch)`. `Patch` is a
/// `std::vector`, so an unqualified call also finds `std::apply` by
/// argument-dependent lookup and fails to compile.
/// @throws ApplyError at the first operation that fails.
auto apply(const Tree& tree, const Patch& patch) -> Tree;

/// Apply a patch to `tree` in place.
///
/// If an operation fails, the operations already applied are undone in
/// reverse order and `tree` compares equal to its state before the call,
/// with mapping keys in their original order.
/// @throws ApplyError at the first operation that fails.
void apply_in_place(Tree& tree, const Patch& patch);

}  // namespace docdelta_cpp
