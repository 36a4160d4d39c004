#include <docdelta-cpp/json.hpp>

#include <docdelta-cpp/error.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace docdelta_cpp {

// =============================================================================
// Shared helpers
// =============================================================================

namespace {

template <typename Json>
auto tree_to_json(const Tree& tree) -> Json {
    return std::visit(overload{
        [](Null) -> Json { return nullptr; },
        [](bool b) -> Json { return b; },
        [](std::int64_t i) -> Json { return i; },
        [](std::uint64_t u) -> Json { return u; },
        [](double d) -> Json { return d; },
        [](const std::string& s) -> Json { return s; },
        [](const Sequence& seq) -> Json {
            auto arr = Json::array();
            for (const auto& child : seq) arr.push_back(tree_to_json<Json>(child));
            return arr;
        },
        [](const Mapping& map) -> Json {
            auto obj = Json::object();
            for (const auto& [key, child] : map) obj[key] = tree_to_json<Json>(child);
            return obj;
        },
    }, tree.storage());
}

template <typename Json>
auto tree_from_json(const Json& j) -> Tree {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return Tree{};
        case nlohmann::json::value_t::boolean:
            return Tree{j.template get<bool>()};
        case nlohmann::json::value_t::number_unsigned: {
            auto val = j.template get<std::uint64_t>();
            // If it fits in int64, prefer int64 for consistency
            if (val <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return Tree{static_cast<std::int64_t>(val)};
            }
            return Tree{val};
        }
        case nlohmann::json::value_t::number_integer:
            return Tree{j.template get<std::int64_t>()};
        case nlohmann::json::value_t::number_float:
            return Tree{j.template get<double>()};
        case nlohmann::json::value_t::string:
            return Tree{j.template get<std::string>()};
        case nlohmann::json::value_t::array: {
            auto seq = Sequence{};
            seq.reserve(j.size());
            for (const auto& child : j) seq.push_back(tree_from_json(child));
            return Tree{std::move(seq)};
        }
        case nlohmann::json::value_t::object: {
            auto map = Mapping{};
            for (auto it = j.begin(); it != j.end(); ++it) {
                map.put(it.key(), tree_from_json(it.value()));
            }
            return Tree{std::move(map)};
        }
        case nlohmann::json::value_t::binary:
            break;
    }
    throw std::invalid_argument{"cannot convert binary JSON value to a tree"};
}

auto parse_op_kind(std::string_view name) -> OpKind {
    if (name == "add") return OpKind::add;
    if (name == "remove") return OpKind::remove;
    if (name == "replace") return OpKind::replace;
    if (name == "move" || name == "copy" || name == "test") {
        throw PatchFormatError{"unsupported op '" + std::string{name} + "'"};
    }
    throw PatchFormatError{"unknown op '" + std::string{name} + "'"};
}

auto required_path(const nlohmann::ordered_json& j) -> Path {
    auto it = j.find("path");
    if (it == j.end()) throw PatchFormatError{"operation is missing 'path'"};
    if (!it->is_string()) throw PatchFormatError{"'path' must be a string"};
    try {
        return parse_pointer(it->get_ref<const std::string&>());
    } catch (const PathError& e) {
        throw PatchFormatError{e.what()};
    }
}

auto required_value(const nlohmann::ordered_json& j, OpKind kind) -> Tree {
    auto it = j.find("value");
    if (it == j.end()) {
        throw PatchFormatError{std::string{to_string_view(kind)} + " operation is missing 'value'"};
    }
    return tree_from_json(*it);
}

}  // anonymous namespace

// =============================================================================
// Trees
// =============================================================================

void to_json(nlohmann::json& j, const Tree& tree) {
    j = tree_to_json<nlohmann::json>(tree);
}

void from_json(const nlohmann::json& j, Tree& tree) {
    tree = tree_from_json(j);
}

void to_json(nlohmann::ordered_json& j, const Tree& tree) {
    j = tree_to_json<nlohmann::ordered_json>(tree);
}

void from_json(const nlohmann::ordered_json& j, Tree& tree) {
    tree = tree_from_json(j);
}

// =============================================================================
// Patches
// =============================================================================

void to_json(nlohmann::ordered_json& j, const EditOp& op) {
    j = nlohmann::ordered_json::object();
    j["op"] = to_string_view(op_kind(op));
    j["path"] = to_pointer(op_path(op));
    if (const auto* value = op_value(op)) {
        j["value"] = tree_to_json<nlohmann::ordered_json>(*value);
    }
}

void from_json(const nlohmann::ordered_json& j, EditOp& op) {
    if (!j.is_object()) throw PatchFormatError{"operation must be an object"};

    auto it = j.find("op");
    if (it == j.end()) throw PatchFormatError{"operation is missing 'op'"};
    if (!it->is_string()) throw PatchFormatError{"'op' must be a string"};

    const auto kind = parse_op_kind(it->get_ref<const std::string&>());
    auto path = required_path(j);
    switch (kind) {
        case OpKind::add:
            op = AddOp{std::move(path), required_value(j, kind)};
            return;
        case OpKind::remove:
            op = RemoveOp{std::move(path)};
            return;
        case OpKind::replace:
            op = ReplaceOp{std::move(path), required_value(j, kind)};
            return;
    }
}

auto patch_to_json(const Patch& patch) -> nlohmann::ordered_json {
    auto arr = nlohmann::ordered_json::array();
    for (const auto& op : patch) {
        auto entry = nlohmann::ordered_json{};
        to_json(entry, op);
        arr.push_back(std::move(entry));
    }
    return arr;
}

auto patch_from_json(const nlohmann::ordered_json& j) -> Patch {
    if (!j.is_array()) throw PatchFormatError{"patch must be a JSON array"};

    auto patch = Patch{};
    patch.reserve(j.size());
    for (std::size_t i = 0; i < j.size(); ++i) {
        try {
            auto op = EditOp{};
            from_json(j[i], op);
            patch.push_back(std::move(op));
        } catch (const PatchFormatError& e) {
            throw PatchFormatError{"operation " + std::to_string(i) + ": " + e.what()};
        } catch (const std::invalid_argument& e) {
            throw PatchFormatError{"operation " + std::to_string(i) + ": " + e.what()};
        }
    }
    return patch;
}

// =============================================================================
// Conflict reports
// =============================================================================

void to_json(nlohmann::ordered_json& j, const Conflict& c) {
    j = nlohmann::ordered_json::object();
    j["path"] = to_pointer(c.path);
    j["value"] = tree_to_json<nlohmann::ordered_json>(c.value);
}

void to_json(nlohmann::ordered_json& j, const ConflictReport& report) {
    j = nlohmann::ordered_json::object();
    j["has_conflict"] = report.has_conflict;
    auto& conflicts = j["conflicts"] = nlohmann::ordered_json::array();
    for (const auto& c : report.conflicts) {
        auto entry = nlohmann::ordered_json{};
        to_json(entry, c);
        conflicts.push_back(std::move(entry));
    }
}

void to_json(nlohmann::ordered_json& j, const BranchConflict& c) {
    j = nlohmann::ordered_json::object();
    j["path"] = to_pointer(c.path);
    to_json(j["left"], c.left);
    to_json(j["right"], c.right);
}

void to_json(nlohmann::ordered_json& j, const MergeReport& report) {
    j = nlohmann::ordered_json::object();
    j["has_conflict"] = report.has_conflict;
    auto& conflicts = j["conflicts"] = nlohmann::ordered_json::array();
    for (const auto& c : report.conflicts) {
        auto entry = nlohmann::ordered_json{};
        to_json(entry, c);
        conflicts.push_back(std::move(entry));
    }
}

}  // namespace docdelta_cpp
