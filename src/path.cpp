#include <docdelta-cpp/path.hpp>

#include <docdelta-cpp/error.hpp>
#include <docdelta-cpp/tree.hpp>

#include <algorithm>
#include <charconv>
#include <string>
#include <system_error>

namespace docdelta_cpp {

namespace {

/// Unescape one pointer segment: ~1 -> /, ~0 -> ~. Any other use of '~'
/// is an error.
auto unescape_segment(std::string_view segment, std::string_view pointer) -> std::string {
    auto result = std::string{};
    result.reserve(segment.size());
    for (std::size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] != '~') {
            result.push_back(segment[i]);
            continue;
        }
        if (i + 1 < segment.size() && segment[i + 1] == '1') {
            result.push_back('/');
        } else if (i + 1 < segment.size() && segment[i + 1] == '0') {
            result.push_back('~');
        } else {
            throw PathError{ErrorKind::invalid_path, std::string{pointer},
                            "bad '~' escape in pointer"};
        }
        ++i;
    }
    return result;
}

}  // anonymous namespace

auto try_parse_index(std::string_view segment) -> std::optional<std::size_t> {
    if (segment.empty()) return std::nullopt;
    // Leading zeros are not allowed per RFC 6901 (except "0" itself)
    if (segment.size() > 1 && segment[0] == '0') return std::nullopt;
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), result);
    if (ec == std::errc{} && ptr == segment.data() + segment.size()) return result;
    return std::nullopt;
}

auto parse_pointer(std::string_view pointer) -> Path {
    if (pointer.empty()) return {};
    if (pointer[0] != '/') {
        throw PathError{ErrorKind::invalid_path, std::string{pointer},
                        "JSON Pointer must start with '/' or be empty"};
    }
    auto path = Path{};
    auto pos = std::size_t{1};
    while (pos <= pointer.size()) {
        auto next = pointer.find('/', pos);
        auto raw = pointer.substr(pos, next == std::string_view::npos ? std::string_view::npos
                                                                      : next - pos);
        if (raw == "-") {
            path.emplace_back(Append{});
        } else if (auto idx = try_parse_index(raw)) {
            path.emplace_back(*idx);
        } else {
            path.emplace_back(unescape_segment(raw, pointer));
        }
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return path;
}

auto escape_pointer_segment(std::string_view segment) -> std::string {
    auto result = std::string{};
    result.reserve(segment.size());
    for (char c : segment) {
        if (c == '~') { result += "~0"; }
        else if (c == '/') { result += "~1"; }
        else { result += c; }
    }
    return result;
}

auto token_text(const PathToken& token) -> std::string {
    return std::visit(overload{
        [](const std::string& key) { return key; },
        [](std::size_t index) { return std::to_string(index); },
        [](Append) { return std::string{"-"}; },
    }, token);
}

auto to_pointer(const Path& path) -> std::string {
    auto result = std::string{};
    for (const auto& token : path) {
        result.push_back('/');
        result += escape_pointer_segment(token_text(token));
    }
    return result;
}

auto child_path(const Path& path, PathToken token) -> Path {
    auto result = Path{};
    result.reserve(path.size() + 1);
    result.insert(result.end(), path.begin(), path.end());
    result.push_back(std::move(token));
    return result;
}

auto is_proper_prefix(const Path& prefix, const Path& path) -> bool {
    return prefix.size() < path.size() &&
           std::equal(prefix.begin(), prefix.end(), path.begin());
}

}  // namespace docdelta_cpp
