#include <docdelta-cpp/tree.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace docdelta_cpp {

// -- Mapping ------------------------------------------------------------------

Mapping::Mapping(std::initializer_list<Entry> entries) {
    entries_.reserve(entries.size());
    for (const auto& [key, value] : entries) {
        put(key, value);
    }
}

auto Mapping::contains(std::string_view key) const -> bool {
    return find(key) != nullptr;
}

auto Mapping::find(std::string_view key) -> Tree* {
    auto it = std::ranges::find_if(entries_, [&](const Entry& e) { return e.first == key; });
    return it == entries_.end() ? nullptr : &it->second;
}

auto Mapping::find(std::string_view key) const -> const Tree* {
    auto it = std::ranges::find_if(entries_, [&](const Entry& e) { return e.first == key; });
    return it == entries_.end() ? nullptr : &it->second;
}

auto Mapping::position(std::string_view key) const -> std::optional<std::size_t> {
    auto it = std::ranges::find_if(entries_, [&](const Entry& e) { return e.first == key; });
    if (it == entries_.end()) return std::nullopt;
    return static_cast<std::size_t>(it - entries_.begin());
}

auto Mapping::at(std::string_view key) -> Tree& {
    if (auto* value = find(key)) return *value;
    throw std::out_of_range{"mapping has no key '" + std::string{key} + "'"};
}

auto Mapping::at(std::string_view key) const -> const Tree& {
    if (const auto* value = find(key)) return *value;
    throw std::out_of_range{"mapping has no key '" + std::string{key} + "'"};
}

auto Mapping::put(std::string key, Tree value) -> std::optional<Tree> {
    if (auto* existing = find(key)) {
        auto displaced = std::move(*existing);
        *existing = std::move(value);
        return displaced;
    }
    entries_.emplace_back(std::move(key), std::move(value));
    return std::nullopt;
}

void Mapping::insert_at(std::size_t position, std::string key, Tree value) {
    if (contains(key)) {
        throw std::invalid_argument{"mapping already has key '" + key + "'"};
    }
    position = std::min(position, entries_.size());
    entries_.emplace(entries_.begin() + static_cast<std::ptrdiff_t>(position),
                     std::move(key), std::move(value));
}

auto Mapping::erase(std::string_view key) -> std::optional<std::pair<std::size_t, Tree>> {
    auto pos = position(key);
    if (!pos) return std::nullopt;
    auto it = entries_.begin() + static_cast<std::ptrdiff_t>(*pos);
    auto removed = std::move(it->second);
    entries_.erase(it);
    return std::pair<std::size_t, Tree>{*pos, std::move(removed)};
}

auto operator==(const Mapping& a, const Mapping& b) -> bool {
    if (a.size() != b.size()) return false;
    // Keys are unique, so equal sizes plus a match for every key of `a`
    // means the key sets are equal.
    return std::ranges::all_of(a.entries_, [&](const Mapping::Entry& e) {
        const auto* other = b.find(e.first);
        return other != nullptr && *other == e.second;
    });
}

// -- Tree ---------------------------------------------------------------------

auto node_count(const Tree& tree) -> std::size_t {
    return std::visit(overload{
        [](const Sequence& seq) {
            auto n = std::size_t{1};
            for (const auto& child : seq) n += node_count(child);
            return n;
        },
        [](const Mapping& map) {
            auto n = std::size_t{1};
            for (const auto& [key, child] : map) n += node_count(child);
            return n;
        },
        [](const auto&) { return std::size_t{1}; },
    }, tree.storage());
}

}  // namespace docdelta_cpp
