#include <docdelta-cpp/codec.hpp>

#include <docdelta-cpp/error.hpp>

#include "log.hpp"

#include <yaml-cpp/yaml.h>

#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace docdelta_cpp {

namespace {

constexpr auto str_tag = std::string_view{"tag:yaml.org,2002:str"};

// =============================================================================
// Core schema scalar resolution
// =============================================================================

auto is_digit(char c) noexcept -> bool { return c >= '0' && c <= '9'; }

auto all_digits(std::string_view s) -> bool {
    if (s.empty()) return false;
    for (char c : s) {
        if (!is_digit(c)) return false;
    }
    return true;
}

auto strip_sign(std::string_view s) -> std::pair<bool, std::string_view> {
    if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
        return {s.front() == '-', s.substr(1)};
    }
    return {false, s};
}

auto resolve_null(std::string_view s) -> bool {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

auto resolve_bool(std::string_view s) -> std::optional<bool> {
    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;
    return std::nullopt;
}

auto parse_real(std::string_view s) -> std::optional<double> {
    auto [negative, digits] = strip_sign(s);
    auto value = 0.0;
    auto result = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (result.ec != std::errc{} || result.ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return negative ? -value : value;
}

/// [-+]? ( \.[0-9]+ | [0-9]+ ( \.[0-9]* )? ) ( [eE] [-+]? [0-9]+ )?
auto is_core_float(std::string_view s) -> bool {
    auto rest = strip_sign(s).second;

    auto pos = std::size_t{0};
    auto int_digits = std::size_t{0};
    while (pos < rest.size() && is_digit(rest[pos])) { ++pos; ++int_digits; }

    auto frac_digits = std::size_t{0};
    auto has_dot = false;
    if (pos < rest.size() && rest[pos] == '.') {
        has_dot = true;
        ++pos;
        while (pos < rest.size() && is_digit(rest[pos])) { ++pos; ++frac_digits; }
    }
    if (int_digits == 0 && (!has_dot || frac_digits == 0)) return false;

    if (pos < rest.size() && (rest[pos] == 'e' || rest[pos] == 'E')) {
        ++pos;
        if (pos < rest.size() && (rest[pos] == '-' || rest[pos] == '+')) ++pos;
        auto exp_digits = std::size_t{0};
        while (pos < rest.size() && is_digit(rest[pos])) { ++pos; ++exp_digits; }
        if (exp_digits == 0) return false;
    }
    return pos == rest.size();
}

auto resolve_special_real(std::string_view s) -> std::optional<double> {
    if (s == ".nan" || s == ".NaN" || s == ".NAN") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    auto [negative, rest] = strip_sign(s);
    if (rest == ".inf" || rest == ".Inf" || rest == ".INF") {
        auto inf = std::numeric_limits<double>::infinity();
        return negative ? -inf : inf;
    }
    return std::nullopt;
}

auto resolve_based_int(std::string_view digits, int base) -> std::optional<Tree> {
    auto value = std::uint64_t{0};
    auto result = std::from_chars(digits.data(), digits.data() + digits.size(), value, base);
    if (result.ec != std::errc{} || result.ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return Tree{value};
}

auto resolve_int(std::string_view s) -> std::optional<Tree> {
    if (s.size() > 2 && s[0] == '0' && s[1] == 'o') {
        return resolve_based_int(s.substr(2), 8);
    }
    if (s.size() > 2 && s[0] == '0' && s[1] == 'x') {
        return resolve_based_int(s.substr(2), 16);
    }

    auto [negative, digits] = strip_sign(s);
    if (!all_digits(digits)) return std::nullopt;

    // Parse with the sign attached so INT64_MIN stays in range
    auto signed_text = std::string{negative ? "-" : ""}.append(digits);
    auto value = std::int64_t{0};
    auto result = std::from_chars(signed_text.data(), signed_text.data() + signed_text.size(), value);
    if (result.ec == std::errc{}) return Tree{value};

    if (!negative) {
        auto big = std::uint64_t{0};
        result = std::from_chars(digits.data(), digits.data() + digits.size(), big);
        if (result.ec == std::errc{}) return Tree{big};
    }
    // Too large for any integer type: keep the magnitude as a real
    if (auto real = parse_real(s)) return Tree{*real};
    return std::nullopt;
}

/// Resolve an untagged plain scalar.
auto resolve_plain(std::string_view s) -> Tree {
    if (resolve_null(s)) return Tree{};
    if (auto b = resolve_bool(s)) return Tree{*b};
    if (auto i = resolve_int(s)) return std::move(*i);
    if (auto special = resolve_special_real(s)) return Tree{*special};
    if (is_core_float(s)) {
        if (auto real = parse_real(s)) return Tree{*real};
    }
    return Tree{std::string{s}};
}

// =============================================================================
// Decoding
// =============================================================================

auto mark_line(const YAML::Mark& mark) -> std::size_t {
    return mark.is_null() ? 0 : static_cast<std::size_t>(mark.line) + 1;
}

auto decode_key(const YAML::Node& key) -> std::string {
    if (key.IsNull()) return "null";
    if (!key.IsScalar()) {
        throw DecodeError{"mapping keys must be scalars", mark_line(key.Mark())};
    }
    return key.Scalar();
}

auto decode_node(const YAML::Node& node) -> Tree {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return Tree{};

        case YAML::NodeType::Scalar: {
            const auto& tag = node.Tag();
            if (tag == "!" || tag == str_tag) return Tree{node.Scalar()};
            return resolve_plain(node.Scalar());
        }

        case YAML::NodeType::Sequence: {
            auto seq = Sequence{};
            seq.reserve(node.size());
            for (const auto& child : node) seq.push_back(decode_node(child));
            return Tree{std::move(seq)};
        }

        case YAML::NodeType::Map: {
            auto map = Mapping{};
            for (auto it = node.begin(); it != node.end(); ++it) {
                auto key = decode_key(it->first);
                if (map.contains(key)) {
                    throw DecodeError{"duplicate mapping key '" + key + "'",
                                      mark_line(it->first.Mark())};
                }
                map.put(std::move(key), decode_node(it->second));
            }
            return Tree{std::move(map)};
        }
    }
    return Tree{};
}

// =============================================================================
// Encoding
// =============================================================================

/// Shortest text that reads back as the same double and as a real.
auto format_real(double d) -> std::string {
    if (std::isnan(d)) return ".nan";
    if (std::isinf(d)) return d < 0 ? "-.inf" : ".inf";

    auto buf = std::array<char, 32>{};
    auto result = std::to_chars(buf.data(), buf.data() + buf.size(), d);
    auto text = std::string{buf.data(), result.ptr};
    if (text.find_first_of(".e") == std::string::npos) text += ".0";
    return text;
}

/// True if a plain rendering of `s` would not read back as this string.
auto needs_quotes(std::string_view s) -> bool {
    return !std::holds_alternative<std::string>(resolve_plain(s).storage());
}

void emit_string(YAML::Emitter& out, const std::string& s) {
    if (needs_quotes(s)) out << YAML::DoubleQuoted;
    out << s;
}

void emit_node(YAML::Emitter& out, const Tree& tree) {
    std::visit(overload{
        [&](Null) { out << YAML::Null; },
        [&](bool b) { out << b; },
        [&](std::int64_t i) { out << i; },
        [&](std::uint64_t u) { out << u; },
        [&](double d) { out << format_real(d); },
        [&](const std::string& s) { emit_string(out, s); },
        [&](const Sequence& seq) {
            out << YAML::BeginSeq;
            for (const auto& child : seq) emit_node(out, child);
            out << YAML::EndSeq;
        },
        [&](const Mapping& map) {
            out << YAML::BeginMap;
            for (const auto& [key, child] : map) {
                out << YAML::Key;
                emit_string(out, key);
                out << YAML::Value;
                emit_node(out, child);
            }
            out << YAML::EndMap;
        },
    }, tree.storage());
}

}  // anonymous namespace

auto decode_document(std::string_view text) -> Tree {
    try {
        return decode_node(YAML::Load(std::string{text}));
    } catch (const YAML::Exception& e) {
        detail::logger()->debug("YAML decode failed: {}", e.what());
        throw DecodeError{e.msg, mark_line(e.mark)};
    }
}

auto encode_document(const Tree& tree) -> std::string {
    auto out = YAML::Emitter{};
    emit_node(out, tree);
    if (!out.good()) {
        throw EncodeError{out.GetLastError()};
    }
    auto text = std::string{out.c_str(), out.size()};
    text.push_back('\n');
    return text;
}

}  // namespace docdelta_cpp
