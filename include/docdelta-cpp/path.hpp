/// @file path.hpp
/// @brief Path tokens and JSON Pointer (RFC 6901) conversion.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace docdelta_cpp {

/// The append marker: "one past the last element" of a sequence.
struct Append {
    auto operator<=>(const Append&) const = default;
    auto operator==(const Append&) const -> bool = default;
};

/// A path element: a mapping key, a sequence index, or the append marker.
using PathToken = std::variant<std::string, std::size_t, Append>;

/// A path into the document tree. The empty path addresses the root.
using Path = std::vector<PathToken>;

/// Create a mapping key token.
inline auto map_key(std::string key) -> PathToken { return PathToken{std::move(key)}; }

/// Create a sequence index token.
inline auto list_index(std::size_t idx) -> PathToken { return PathToken{idx}; }

/// Parse an RFC 6901 JSON Pointer into tokens.
///
/// "" is the root, "/a/b/0" is {"a", "b", 0}, "/items/-" ends in Append.
/// Decimal segments without leading zeros become index tokens; the resolver
/// uses them as key text when they land on a mapping.
/// @throws PathError (invalid_path) if a non-empty pointer lacks the
///   leading '/' or contains a bad '~' escape.
auto parse_pointer(std::string_view pointer) -> Path;

/// Render tokens as an RFC 6901 JSON Pointer, escaping '~' and '/'.
auto to_pointer(const Path& path) -> std::string;

/// Render a single token as a pointer segment (unescaped).
auto token_text(const PathToken& token) -> std::string;

/// Escape a segment for RFC 6901: ~ -> ~0, / -> ~1.
auto escape_pointer_segment(std::string_view segment) -> std::string;

/// Parse a canonical sequence index ("0", "17"; no sign, no leading zeros).
auto try_parse_index(std::string_view segment) -> std::optional<std::size_t>;

/// Return `path` extended by one token.
auto child_path(const Path& path, PathToken token) -> Path;

/// True if `prefix` is a proper prefix of `path`.
auto is_proper_prefix(const Path& prefix, const Path& path) -> bool;

}  // namespace docdelta_cpp
