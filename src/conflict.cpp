#include <docdelta-cpp/conflict.hpp>

#include <docdelta-cpp/diff.hpp>

#include <utility>

namespace docdelta_cpp {

auto detect_conflicts(const Tree& base, const Tree& edited,
                      const DiffOptions& options) -> ConflictReport {
    auto report = ConflictReport{};
    for (auto& op : diff(base, edited, options)) {
        if (auto* replace = std::get_if<ReplaceOp>(&op)) {
            report.conflicts.push_back(Conflict{std::move(replace->path),
                                                std::move(replace->value)});
        }
    }
    report.has_conflict = !report.conflicts.empty();
    return report;
}

namespace {

/// A remove or replace overrides everything below its path.
auto overrides_subtree(const EditOp& op) -> bool {
    return op_kind(op) != OpKind::add;
}

}  // anonymous namespace

auto detect_conflicts(const Tree& base, const Tree& left, const Tree& right,
                      const DiffOptions& options) -> MergeReport {
    const auto left_ops = diff(base, left, options);
    const auto right_ops = diff(base, right, options);

    auto report = MergeReport{};
    for (const auto& l : left_ops) {
        const auto& lpath = op_path(l);
        for (const auto& r : right_ops) {
            const auto& rpath = op_path(r);
            if (lpath == rpath) {
                // Both branches made the same edit: nothing to reconcile.
                if (l != r) report.conflicts.push_back(BranchConflict{lpath, l, r});
            } else if (is_proper_prefix(lpath, rpath) && overrides_subtree(l)) {
                report.conflicts.push_back(BranchConflict{lpath, l, r});
            } else if (is_proper_prefix(rpath, lpath) && overrides_subtree(r)) {
                report.conflicts.push_back(BranchConflict{rpath, l, r});
            }
        }
    }
    report.has_conflict = !report.conflicts.empty();
    return report;
}

}  // namespace docdelta_cpp
