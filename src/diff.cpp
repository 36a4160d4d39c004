#include <docdelta-cpp/diff.hpp>

#include <algorithm>
#include <utility>

namespace docdelta_cpp {

namespace {

/// Collects operations while walking both trees. `path` is pushed and
/// popped as the walk descends so no per-node path copies are made until
/// an operation is emitted.
class DiffBuilder {
public:
    explicit DiffBuilder(const DiffOptions& options) : options_{options} {}

    void diff_value(const Tree& base, const Tree& target, Path& path);

    auto take() -> Patch { return std::move(ops_); }

private:
    void diff_mapping(const Mapping& base, const Mapping& target, Path& path);
    void diff_sequence(const Sequence& base, const Sequence& target, Path& path);

    const DiffOptions& options_;
    Patch ops_;
};

void DiffBuilder::diff_value(const Tree& base, const Tree& target, Path& path) {
    if (base == target) return;

    if (base.kind() != target.kind() || base.is_scalar() ||
        path.size() >= options_.max_depth) {
        ops_.emplace_back(ReplaceOp{path, target});
        return;
    }

    if (base.is_mapping()) {
        diff_mapping(base.as_mapping(), target.as_mapping(), path);
    } else {
        diff_sequence(base.as_sequence(), target.as_sequence(), path);
    }
}

void DiffBuilder::diff_mapping(const Mapping& base, const Mapping& target, Path& path) {
    // Added and changed keys, in target order
    for (const auto& [key, value] : target) {
        path.emplace_back(key);
        if (const auto* old = base.find(key)) {
            diff_value(*old, value, path);
        } else {
            ops_.emplace_back(AddOp{path, value});
        }
        path.pop_back();
    }

    // Removed keys, in base order
    for (const auto& [key, value] : base) {
        if (!target.contains(key)) {
            ops_.emplace_back(RemoveOp{child_path(path, key)});
        }
    }
}

void DiffBuilder::diff_sequence(const Sequence& base, const Sequence& target, Path& path) {
    const auto common = std::min(base.size(), target.size());

    for (std::size_t i = 0; i < common; ++i) {
        path.emplace_back(i);
        diff_value(base[i], target[i], path);
        path.pop_back();
    }

    // Added tail elements
    for (auto i = common; i < target.size(); ++i) {
        if (options_.tail_adds == TailAdds::append_marker) {
            path.emplace_back(Append{});
        } else {
            path.emplace_back(i);
        }
        ops_.emplace_back(AddOp{path, target[i]});
        path.pop_back();
    }

    // Removed tail elements, last first so earlier indices stay valid
    for (auto i = base.size(); i-- > common;) {
        ops_.emplace_back(RemoveOp{child_path(path, i)});
    }
}

}  // anonymous namespace

auto diff(const Tree& base, const Tree& target, const DiffOptions& options) -> Patch {
    auto builder = DiffBuilder{options};
    auto path = Path{};
    builder.diff_value(base, target, path);
    return builder.take();
}

}  // namespace docdelta_cpp
