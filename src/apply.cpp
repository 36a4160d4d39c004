#include <docdelta-cpp/apply.hpp>

#include <docdelta-cpp/error.hpp>
#include <docdelta-cpp/resolver.hpp>

#include "journal.hpp"
#include "log.hpp"

#include <cstddef>
#include <utility>

namespace docdelta_cpp {

namespace {

void apply_op(detail::Journal& journal, const Tree& tree, const EditOp& op) {
    std::visit(overload{
        [&](const AddOp& o) {
            journal.insert(o.path, o.value);
        },
        [&](const RemoveOp& o) {
            journal.erase(o.path);
        },
        [&](const ReplaceOp& o) {
            // set() would create a missing final key; replace must not.
            (void)resolve(tree, o.path);
            journal.set(o.path, o.value);
        },
    }, op);
}

}  // anonymous namespace

void apply_in_place(Tree& tree, const Patch& patch) {
    auto journal = detail::Journal{tree};
    for (std::size_t i = 0; i < patch.size(); ++i) {
        try {
            apply_op(journal, tree, patch[i]);
        } catch (const PathError& e) {
            detail::logger()->debug("operation {} ({} {}) failed: {}; rolling back {} step(s)",
                                    i, to_string_view(op_kind(patch[i])),
                                    to_pointer(op_path(patch[i])), e.what(), journal.size());
            journal.rollback();
            throw ApplyError{i, e};
        }
    }
    journal.commit();
}

auto apply(const Tree& tree, const Patch& patch) -> Tree {
    auto working = tree;
    apply_in_place(working, patch);
    return working;
}

}  // namespace docdelta_cpp
