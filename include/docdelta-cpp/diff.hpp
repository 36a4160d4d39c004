/// @file diff.hpp
/// @brief Structural diff between two trees.

#pragma once

#include <docdelta-cpp/patch.hpp>
#include <docdelta-cpp/tree.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>

namespace docdelta_cpp {

/// How trailing elements added to a sequence are addressed.
enum class TailAdds : std::uint8_t {
    indices,        ///< "/items/2", "/items/3", ...
    append_marker,  ///< "/items/-" for each element.
};

/// Options for diff().
struct DiffOptions {
    TailAdds tail_adds{TailAdds::indices};
    /// Unequal containers at this depth or deeper are replaced wholesale
    /// instead of being diffed. The root is depth 0.
    std::size_t max_depth{std::numeric_limits<std::size_t>::max()};
};

/// Compute the operations that turn `base` into `target`.
///
/// The diff is position-wise for sequences (no move detection) and
/// deterministic: mapping keys are visited in target order, then removed
/// keys in base order; surplus sequence elements are removed from the back.
/// Applying the result to `base` always yields `target`.
auto diff(const Tree& base, const Tree& target, const DiffOptions& options = {}) -> Patch;

}  // namespace docdelta_cpp
