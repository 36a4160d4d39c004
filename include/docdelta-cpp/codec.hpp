/// @file codec.hpp
/// @brief YAML text <-> Tree, built on yaml-cpp.

#pragma once

#include <docdelta-cpp/tree.hpp>

#include <string>
#include <string_view>

namespace docdelta_cpp {

/// Decode a YAML (or JSON) document.
///
/// Plain scalars resolve by the YAML 1.2 core schema: null, booleans,
/// integers (decimal, 0x, 0o), floats (including .inf and .nan), else
/// strings. Quoted scalars are always strings. Empty text is Null.
/// @throws DecodeError with a 1-based line number when one is known,
///   including for duplicate or non-scalar mapping keys.
auto decode_document(std::string_view text) -> Tree;

/// Encode a tree as block-style YAML.
///
/// Strings that would decode as another type are double-quoted and reals
/// always carry a '.' or exponent, so decode_document(encode_document(t))
/// compares equal to t (NaN aside, which never compares equal).
/// @throws EncodeError if the emitter rejects the tree.
auto encode_document(const Tree& tree) -> std::string;

}  // namespace docdelta_cpp
