#include <docdelta-cpp/resolver.hpp>

#include <docdelta-cpp/error.hpp>

#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace docdelta_cpp {

namespace {

/// Why a walk stopped.
struct Failure {
    ErrorKind kind{ErrorKind::path_not_found};
    std::string_view reason;
};

[[noreturn]] void raise(const Failure& failure, const Path& path) {
    throw PathError{failure.kind, to_pointer(path), failure.reason};
}

/// The key a token denotes when it lands on a mapping. Index tokens use
/// their decimal text and the append marker is the key "-".
class KeyText {
public:
    explicit KeyText(const PathToken& token) noexcept {
        if (const auto* key = std::get_if<std::string>(&token)) {
            view_ = *key;
        } else if (const auto* index = std::get_if<std::size_t>(&token)) {
            auto result = std::to_chars(buf_, buf_ + sizeof(buf_), *index);
            view_ = std::string_view{buf_, static_cast<std::size_t>(result.ptr - buf_)};
        } else {
            view_ = "-";
        }
    }

    KeyText(const KeyText&) = delete;
    auto operator=(const KeyText&) -> KeyText& = delete;

    auto view() const noexcept -> std::string_view { return view_; }
    auto str() const -> std::string { return std::string{view_}; }

private:
    char buf_[24]{};
    std::string_view view_;
};

enum class Access { existing, insertion };

/// Interpret a token against a sequence.
///
/// `existing` requires an element (i < len); `insertion` also allows
/// i == len and resolves the append marker to len.
auto element_index(const Sequence& seq, const PathToken& token, bool final,
                   Access access, Failure& failure) noexcept -> std::optional<std::size_t> {
    auto index = std::size_t{0};
    if (const auto* key = std::get_if<std::string>(&token)) {
        auto parsed = try_parse_index(*key);
        if (!parsed) {
            failure = {ErrorKind::invalid_path, "sequence index expected"};
            return std::nullopt;
        }
        index = *parsed;
    } else if (const auto* i = std::get_if<std::size_t>(&token)) {
        index = *i;
    } else {
        if (!final) {
            failure = {ErrorKind::invalid_path, "append marker must be the last token"};
            return std::nullopt;
        }
        if (access == Access::insertion) return seq.size();
        failure = {ErrorKind::index_out_of_bounds, "append marker addresses no element"};
        return std::nullopt;
    }

    const auto in_range = access == Access::insertion ? index <= seq.size()
                                                      : index < seq.size();
    if (!in_range) {
        failure = {ErrorKind::index_out_of_bounds, "sequence index out of bounds"};
        return std::nullopt;
    }
    return index;
}

/// Step from `node` to the child a token names. T is Tree or const Tree.
template <typename T>
auto descend(T& node, const PathToken& token, bool final, Failure& failure) noexcept -> T* {
    if (auto* map = node.template get_if<Mapping>()) {
        auto key = KeyText{token};
        auto* child = map->find(key.view());
        if (!child) failure = {ErrorKind::path_not_found, "no such key"};
        return child;
    }
    if (auto* seq = node.template get_if<Sequence>()) {
        auto index = element_index(*seq, token, final, Access::existing, failure);
        if (!index) return nullptr;
        return &(*seq)[*index];
    }
    failure = {ErrorKind::type_mismatch, "cannot descend into a scalar"};
    return nullptr;
}

/// Follow the first `count` tokens of `path`; every node must exist.
template <typename T>
auto walk(T& root, const Path& path, std::size_t count, Failure& failure) noexcept -> T* {
    auto* node = &root;
    for (std::size_t i = 0; i < count && node; ++i) {
        node = descend(*node, path[i], i + 1 == path.size(), failure);
    }
    return node;
}

template <typename T>
auto walk_or_throw(T& root, const Path& path, std::size_t count) -> T& {
    auto failure = Failure{};
    auto* node = walk(root, path, count, failure);
    if (!node) raise(failure, path);
    return *node;
}

/// Wrap `value` in one single-key mapping per token, innermost last.
auto vivify(const Path& path, std::size_t first, Tree value) -> Tree {
    for (auto i = path.size(); i-- > first;) {
        auto map = Mapping{};
        map.put(KeyText{path[i]}.str(), std::move(value));
        value = Tree{std::move(map)};
    }
    return value;
}

}  // anonymous namespace

auto resolve(const Tree& tree, const Path& path) -> const Tree& {
    return walk_or_throw(tree, path, path.size());
}

auto resolve(Tree& tree, const Path& path) -> Tree& {
    return walk_or_throw(tree, path, path.size());
}

auto find(const Tree& tree, const Path& path) noexcept -> const Tree* {
    auto failure = Failure{};
    return walk(tree, path, path.size(), failure);
}

auto insert(Tree& tree, const Path& path, Tree value) -> InsertResult {
    if (path.empty()) {
        auto displaced = std::exchange(tree, std::move(value));
        return InsertResult{{}, std::move(displaced)};
    }

    auto location = Path{};
    location.reserve(path.size());
    auto* node = &tree;

    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        if (auto* map = node->get_if<Mapping>()) {
            auto key = KeyText{path[i]};
            location.emplace_back(key.str());
            if (auto* child = map->find(key.view())) {
                node = child;
                continue;
            }
            // Build the missing chain off-tree, then attach it in one step.
            map->put(key.str(), vivify(path, i + 1, std::move(value)));
            return InsertResult{std::move(location), std::nullopt};
        }
        if (auto* seq = node->get_if<Sequence>()) {
            auto failure = Failure{};
            auto index = element_index(*seq, path[i], false, Access::existing, failure);
            if (!index) raise(failure, path);
            location.emplace_back(*index);
            node = &(*seq)[*index];
            continue;
        }
        raise({ErrorKind::type_mismatch, "cannot descend into a scalar"}, path);
    }

    const auto& last = path.back();
    if (auto* map = node->get_if<Mapping>()) {
        auto key = KeyText{last};
        location.emplace_back(key.str());
        auto displaced = map->put(key.str(), std::move(value));
        return InsertResult{std::move(location), std::move(displaced)};
    }
    if (auto* seq = node->get_if<Sequence>()) {
        auto failure = Failure{};
        auto index = element_index(*seq, last, true, Access::insertion, failure);
        if (!index) raise(failure, path);
        seq->insert(seq->begin() + static_cast<std::ptrdiff_t>(*index), std::move(value));
        location.emplace_back(*index);
        return InsertResult{std::move(location), std::nullopt};
    }
    raise({ErrorKind::type_mismatch, "cannot insert into a scalar"}, path);
}

auto erase(Tree& tree, const Path& path) -> EraseResult {
    if (path.empty()) {
        raise({ErrorKind::invalid_path, "the root cannot be removed"}, path);
    }
    auto& parent = walk_or_throw(tree, path, path.size() - 1);
    const auto& last = path.back();

    if (auto* map = parent.get_if<Mapping>()) {
        auto removed = map->erase(KeyText{last}.view());
        if (!removed) raise({ErrorKind::path_not_found, "no such key"}, path);
        return EraseResult{std::move(removed->second), removed->first};
    }
    if (auto* seq = parent.get_if<Sequence>()) {
        auto failure = Failure{};
        auto index = element_index(*seq, last, true, Access::existing, failure);
        if (!index) raise(failure, path);
        auto it = seq->begin() + static_cast<std::ptrdiff_t>(*index);
        auto removed = std::move(*it);
        seq->erase(it);
        return EraseResult{std::move(removed), *index};
    }
    raise({ErrorKind::type_mismatch, "cannot remove from a scalar"}, path);
}

auto set(Tree& tree, const Path& path, Tree value) -> std::optional<Tree> {
    if (path.empty()) {
        return std::exchange(tree, std::move(value));
    }
    auto& parent = walk_or_throw(tree, path, path.size() - 1);
    const auto& last = path.back();

    if (auto* map = parent.get_if<Mapping>()) {
        return map->put(KeyText{last}.str(), std::move(value));
    }
    if (auto* seq = parent.get_if<Sequence>()) {
        auto failure = Failure{};
        auto index = element_index(*seq, last, true, Access::existing, failure);
        if (!index) raise(failure, path);
        return std::exchange((*seq)[*index], std::move(value));
    }
    raise({ErrorKind::type_mismatch, "cannot set inside a scalar"}, path);
}

}  // namespace docdelta_cpp
