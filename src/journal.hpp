#pragma once

// Internal header -- not part of the public API.

#include <docdelta-cpp/path.hpp>
#include <docdelta-cpp/resolver.hpp>
#include <docdelta-cpp/tree.hpp>

#include <cstddef>
#include <optional>
#include <variant>
#include <vector>

namespace docdelta_cpp::detail {

/// Undo for an insert: restore the displaced value, or remove the node.
struct UndoInsert {
    Path location;
    std::optional<Tree> displaced;
};

/// Undo for an erase: put the value back at its old position.
struct UndoErase {
    Path path;
    Tree value;
    std::size_t position;
};

/// Undo for a set: restore the previous value, or remove a created key.
struct UndoSet {
    Path path;
    std::optional<Tree> previous;
};

using UndoStep = std::variant<UndoInsert, UndoErase, UndoSet>;

/// Resolver mutations on one tree, recorded so they can be undone.
///
/// Each mutator forwards to the resolver and, on success, records the
/// inverse step. A failed mutation records nothing because the resolver
/// leaves the tree untouched. rollback() undoes recorded steps newest
/// first; commit() forgets them.
class Journal {
public:
    explicit Journal(Tree& tree) : tree_{tree} {}

    Journal(const Journal&) = delete;
    auto operator=(const Journal&) -> Journal& = delete;

    void insert(const Path& path, Tree value);
    void erase(const Path& path);
    void set(const Path& path, Tree value);

    /// Number of recorded steps.
    auto size() const noexcept -> std::size_t { return steps_.size(); }

    void commit() noexcept { steps_.clear(); }
    void rollback();

private:
    void undo(UndoStep& step);

    Tree& tree_;
    std::vector<UndoStep> steps_;
};

}  // namespace docdelta_cpp::detail
