/// @file tree.hpp
/// @brief The document tree: Null, Sequence, Mapping, Tree, and NodeKind.

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace docdelta_cpp {

class Tree;

/// Represents a YAML/JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// An ordered list of child trees.
using Sequence = std::vector<Tree>;

/// The alternatives a tree node can hold.
enum class NodeKind : std::uint8_t {
    null,
    boolean,
    integer,           ///< Signed 64-bit integer.
    unsigned_integer,  ///< Unsigned 64-bit integer above the int64 range.
    real,
    string,
    sequence,
    mapping,
};

/// Convert a NodeKind to its string representation.
constexpr auto to_string_view(NodeKind kind) noexcept -> std::string_view {
    switch (kind) {
        case NodeKind::null:             return "null";
        case NodeKind::boolean:          return "boolean";
        case NodeKind::integer:          return "integer";
        case NodeKind::unsigned_integer: return "unsigned_integer";
        case NodeKind::real:             return "real";
        case NodeKind::string:           return "string";
        case NodeKind::sequence:         return "sequence";
        case NodeKind::mapping:          return "mapping";
    }
    return "unknown";
}

/// True for the kinds that hold children.
constexpr auto is_container(NodeKind kind) noexcept -> bool {
    return kind == NodeKind::sequence || kind == NodeKind::mapping;
}

/// An ordered string-keyed map with unique keys.
///
/// Keys keep the order in which they were first inserted; overwriting an
/// existing key keeps its position. Equality ignores key order.
class Mapping {
public:
    using Entry = std::pair<std::string, Tree>;
    using iterator = std::vector<Entry>::iterator;
    using const_iterator = std::vector<Entry>::const_iterator;

    Mapping() = default;

    /// Construct from entries. A repeated key keeps its first position and
    /// its last value.
    Mapping(std::initializer_list<Entry> entries);

    auto size() const noexcept -> std::size_t { return entries_.size(); }
    auto empty() const noexcept -> bool { return entries_.empty(); }

    auto begin() noexcept -> iterator { return entries_.begin(); }
    auto end() noexcept -> iterator { return entries_.end(); }
    auto begin() const noexcept -> const_iterator { return entries_.begin(); }
    auto end() const noexcept -> const_iterator { return entries_.end(); }

    auto contains(std::string_view key) const -> bool;

    /// The value at a key, or nullptr.
    auto find(std::string_view key) -> Tree*;
    auto find(std::string_view key) const -> const Tree*;

    /// The position of a key in iteration order.
    auto position(std::string_view key) const -> std::optional<std::size_t>;

    /// The value at a key.
    /// @throws std::out_of_range if the key is absent.
    auto at(std::string_view key) -> Tree&;
    auto at(std::string_view key) const -> const Tree&;

    /// Set a key, appending it when new.
    /// @return The value previously stored at the key, if any.
    auto put(std::string key, Tree value) -> std::optional<Tree>;

    /// Insert a new key at a given position (clamped to size()).
    /// @throws std::invalid_argument if the key already exists.
    void insert_at(std::size_t position, std::string key, Tree value);

    /// Remove a key.
    /// @return The removed value and the position it occupied.
    auto erase(std::string_view key) -> std::optional<std::pair<std::size_t, Tree>>;

    friend auto operator==(const Mapping& a, const Mapping& b) -> bool;

private:
    std::vector<Entry> entries_;
};

/// A document tree node: a scalar, a Sequence, or a Mapping.
///
/// Trees are plain values. Copying a tree copies all of its descendants,
/// so two trees never share a mutable node.
///
/// @code
/// auto doc = Tree{Mapping{
///     {"title", "Note"},
///     {"tags", Sequence{"yaml", "draft"}},
///     {"rev", 3},
/// }};
/// @endcode
class Tree {
public:
    using Storage = std::variant<
        Null,
        bool,
        std::int64_t,
        std::uint64_t,
        double,
        std::string,
        Sequence,
        Mapping
    >;

    Tree() = default;
    Tree(Null) {}
    Tree(bool b) : storage_{b} {}
    Tree(double d) : storage_{d} {}
    Tree(std::string s) : storage_{std::move(s)} {}
    Tree(std::string_view s) : storage_{std::string{s}} {}
    Tree(const char* s) : storage_{std::string{s}} {}
    Tree(Sequence seq) : storage_{std::move(seq)} {}
    Tree(Mapping map) : storage_{std::move(map)} {}

    /// Integers are stored as int64 unless they only fit in uint64.
    template <std::integral I>
        requires (!std::same_as<I, bool> && !std::same_as<I, char>)
    Tree(I value) {
        if constexpr (std::is_signed_v<I>) {
            storage_ = static_cast<std::int64_t>(value);
        } else if (static_cast<std::uint64_t>(value) >
                   static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            storage_ = static_cast<std::uint64_t>(value);
        } else {
            storage_ = static_cast<std::int64_t>(value);
        }
    }

    auto kind() const noexcept -> NodeKind { return static_cast<NodeKind>(storage_.index()); }

    auto is_null() const noexcept -> bool { return kind() == NodeKind::null; }
    auto is_sequence() const noexcept -> bool { return kind() == NodeKind::sequence; }
    auto is_mapping() const noexcept -> bool { return kind() == NodeKind::mapping; }
    auto is_container() const noexcept -> bool { return docdelta_cpp::is_container(kind()); }
    auto is_scalar() const noexcept -> bool { return !is_container(); }

    auto storage() const noexcept -> const Storage& { return storage_; }
    auto storage() noexcept -> Storage& { return storage_; }

    /// Pointer to the held alternative, or nullptr.
    template <typename T>
    auto get_if() noexcept -> T* { return std::get_if<T>(&storage_); }
    template <typename T>
    auto get_if() const noexcept -> const T* { return std::get_if<T>(&storage_); }

    /// @throws std::bad_variant_access if the tree is not a Sequence.
    auto as_sequence() -> Sequence& { return std::get<Sequence>(storage_); }
    auto as_sequence() const -> const Sequence& { return std::get<Sequence>(storage_); }

    /// @throws std::bad_variant_access if the tree is not a Mapping.
    auto as_mapping() -> Mapping& { return std::get<Mapping>(storage_); }
    auto as_mapping() const -> const Mapping& { return std::get<Mapping>(storage_); }

    /// Structural equality. Mappings ignore key order.
    friend auto operator==(const Tree& a, const Tree& b) -> bool {
        return a.storage_ == b.storage_;
    }

private:
    Storage storage_;
};

/// Number of nodes in a tree, the root included.
auto node_count(const Tree& tree) -> std::size_t;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const Mapping& m) { ... },
///     [](const Sequence& s) { ... },
///     [](const auto&) { ... },
/// }, tree.storage());
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace docdelta_cpp
