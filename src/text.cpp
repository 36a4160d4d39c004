#include <docdelta-cpp/text.hpp>

#include <docdelta-cpp/apply.hpp>
#include <docdelta-cpp/codec.hpp>
#include <docdelta-cpp/conflict.hpp>
#include <docdelta-cpp/error.hpp>
#include <docdelta-cpp/json.hpp>

#include "log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>

namespace docdelta_cpp::text {

namespace {

using ordered_json = nlohmann::ordered_json;

constexpr auto empty_report = "{\"has_conflict\":false,\"conflicts\":[]}";

/// Run `body`, answering `fallback` if it throws a library or JSON error.
template <typename Body>
auto fail_soft(std::string_view operation, std::string fallback, Body&& body) -> std::string {
    try {
        return std::forward<Body>(body)();
    } catch (const Exception& e) {
        detail::logger()->warn("{}: {}: {}", operation, to_string_view(e.kind()), e.what());
    } catch (const nlohmann::json::exception& e) {
        detail::logger()->warn("{}: invalid JSON: {}", operation, e.what());
    }
    return fallback;
}

auto error_object(std::size_t line, std::string_view message) -> std::string {
    auto error = ordered_json::object();
    error["line"] = line;
    error["message"] = message;
    error["path"] = "";

    auto result = ordered_json::object();
    result["success"] = false;
    result["errors"] = ordered_json::array({std::move(error)});
    return result.dump();
}

/// 1-based line holding byte offset `byte` (nlohmann counts from 1, past the
/// offending character).
auto line_of(std::string_view text, std::size_t byte) -> std::size_t {
    auto end = std::min(byte > 0 ? byte - 1 : 0, text.size());
    return static_cast<std::size_t>(std::count(text.begin(), text.begin() + end, '\n')) + 1;
}

auto parse_json(std::string_view text) -> ordered_json {
    return ordered_json::parse(text.begin(), text.end());
}

}  // anonymous namespace

auto diff(std::string_view base_text, std::string_view target_text,
          const DiffOptions& options) -> std::string {
    return fail_soft("diff", "[]", [&] {
        auto base = decode_document(base_text);
        auto target = decode_document(target_text);
        return patch_to_json(docdelta_cpp::diff(base, target, options)).dump();
    });
}

auto apply_patch(std::string_view doc_text, std::string_view patch_text) -> std::string {
    return fail_soft("apply_patch", std::string{doc_text}, [&] {
        auto doc = decode_document(doc_text);
        auto patch = patch_from_json(parse_json(patch_text));
        apply_in_place(doc, patch);
        return encode_document(doc);
    });
}

auto detect_conflicts(std::string_view base_text, std::string_view edited_text) -> std::string {
    return fail_soft("detect_conflicts", empty_report, [&] {
        auto base = decode_document(base_text);
        auto edited = decode_document(edited_text);
        auto j = ordered_json{};
        to_json(j, docdelta_cpp::detect_conflicts(base, edited));
        return j.dump();
    });
}

auto detect_conflicts(std::string_view base_text, std::string_view left_text,
                      std::string_view right_text) -> std::string {
    return fail_soft("detect_conflicts", empty_report, [&] {
        auto base = decode_document(base_text);
        auto left = decode_document(left_text);
        auto right = decode_document(right_text);
        auto j = ordered_json{};
        to_json(j, docdelta_cpp::detect_conflicts(base, left, right));
        return j.dump();
    });
}

auto yaml_to_json(std::string_view yaml_text) -> std::string {
    try {
        auto j = ordered_json{};
        to_json(j, decode_document(yaml_text));
        return j.dump();
    } catch (const DecodeError& e) {
        detail::logger()->warn("yaml_to_json: {} (line {})", e.what(), e.line());
        return error_object(e.line(), e.what());
    } catch (const nlohmann::json::exception& e) {
        // yaml-cpp passes invalid UTF-8 through; dump() rejects it
        detail::logger()->warn("yaml_to_json: {}", e.what());
        return error_object(0, e.what());
    }
}

auto json_to_yaml(std::string_view json_text) -> std::string {
    try {
        auto tree = Tree{};
        from_json(parse_json(json_text), tree);
        return encode_document(tree);
    } catch (const nlohmann::json::parse_error& e) {
        detail::logger()->warn("json_to_yaml: {}", e.what());
        return error_object(line_of(json_text, e.byte), e.what());
    } catch (const EncodeError& e) {
        detail::logger()->warn("json_to_yaml: {}", e.what());
        return error_object(0, e.what());
    }
}

auto version() -> std::string {
    return "0.1.0";
}

}  // namespace docdelta_cpp::text
