#include <docdelta-cpp/error.hpp>
#include <docdelta-cpp/resolver.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace docdelta_cpp;

namespace {

auto sample() -> Tree {
    return Tree{Mapping{
        {"name", "svc"},
        {"ports", Sequence{80, 443}},
        {"meta", Mapping{{"owner", "ops"}}},
    }};
}

auto keys_of(const Tree& tree) -> std::vector<std::string> {
    auto keys = std::vector<std::string>{};
    for (const auto& [key, value] : tree.as_mapping()) keys.push_back(key);
    return keys;
}

/// Run `fn` and return the kind of the PathError it throws.
template <typename Fn>
auto path_error_kind(Fn&& fn) -> std::string_view {
    try {
        fn();
    } catch (const PathError& e) {
        return to_string_view(e.kind());
    }
    return "no error";
}

}  // namespace

// -- resolve ------------------------------------------------------------------

TEST(Resolve, root) {
    const auto doc = sample();
    EXPECT_EQ(&resolve(doc, Path{}), &doc);
}

TEST(Resolve, nested_key_and_index) {
    const auto doc = sample();
    EXPECT_EQ(resolve(doc, parse_pointer("/ports/1")), Tree{443});
    EXPECT_EQ(resolve(doc, parse_pointer("/meta/owner")), Tree{"ops"});
}

TEST(Resolve, string_index_token_on_sequence) {
    const auto doc = sample();
    const auto path = Path{map_key("ports"), map_key("0")};
    EXPECT_EQ(resolve(doc, path), Tree{80});
}

TEST(Resolve, index_token_on_mapping_is_key_text) {
    const auto doc = Tree{Mapping{{"2024", "year"}}};
    EXPECT_EQ(resolve(doc, parse_pointer("/2024")), Tree{"year"});
}

TEST(Resolve, failures_by_kind) {
    const auto doc = sample();
    EXPECT_EQ(path_error_kind([&] { (void)resolve(doc, parse_pointer("/missing")); }),
              "path_not_found");
    EXPECT_EQ(path_error_kind([&] { (void)resolve(doc, parse_pointer("/ports/2")); }),
              "index_out_of_bounds");
    EXPECT_EQ(path_error_kind([&] { (void)resolve(doc, parse_pointer("/ports/x")); }),
              "invalid_path");
    EXPECT_EQ(path_error_kind([&] { (void)resolve(doc, parse_pointer("/name/x")); }),
              "type_mismatch");
    EXPECT_EQ(path_error_kind([&] { (void)resolve(doc, parse_pointer("/ports/-")); }),
              "index_out_of_bounds");
    EXPECT_EQ(path_error_kind([&] { (void)resolve(doc, parse_pointer("/ports/-/x")); }),
              "invalid_path");
}

TEST(Resolve, error_carries_pointer) {
    const auto doc = sample();
    try {
        (void)resolve(doc, parse_pointer("/meta/nope"));
        FAIL() << "expected PathError";
    } catch (const PathError& e) {
        EXPECT_EQ(e.pointer(), "/meta/nope");
    }
}

TEST(Find, returns_nullptr_instead_of_throwing) {
    const auto doc = sample();
    EXPECT_NE(find(doc, parse_pointer("/ports/0")), nullptr);
    EXPECT_EQ(find(doc, parse_pointer("/ports/9")), nullptr);
    EXPECT_EQ(find(doc, parse_pointer("/name/deeper")), nullptr);
}

// -- insert -------------------------------------------------------------------

TEST(Insert, new_mapping_key_is_appended) {
    auto doc = sample();
    auto result = insert(doc, parse_pointer("/replicas"), 3);

    EXPECT_EQ(resolve(doc, parse_pointer("/replicas")), Tree{3});
    EXPECT_EQ(keys_of(doc), (std::vector<std::string>{"name", "ports", "meta", "replicas"}));
    EXPECT_EQ(result.location, parse_pointer("/replicas"));
    EXPECT_FALSE(result.displaced.has_value());
}

TEST(Insert, existing_mapping_key_is_overwritten) {
    auto doc = sample();
    auto result = insert(doc, parse_pointer("/name"), "api");

    EXPECT_EQ(resolve(doc, parse_pointer("/name")), Tree{"api"});
    ASSERT_TRUE(result.displaced.has_value());
    EXPECT_EQ(*result.displaced, Tree{"svc"});
    EXPECT_EQ(keys_of(doc).front(), "name");
}

TEST(Insert, sequence_index_shifts_elements) {
    auto doc = sample();
    insert(doc, parse_pointer("/ports/0"), 22);
    EXPECT_EQ(resolve(doc, parse_pointer("/ports")), (Tree{Sequence{22, 80, 443}}));
}

TEST(Insert, sequence_index_equal_to_length_appends) {
    auto doc = sample();
    insert(doc, parse_pointer("/ports/2"), 8080);
    EXPECT_EQ(resolve(doc, parse_pointer("/ports")), (Tree{Sequence{80, 443, 8080}}));
}

TEST(Insert, append_marker_resolves_location_to_index) {
    auto doc = sample();
    auto result = insert(doc, parse_pointer("/ports/-"), 8443);

    EXPECT_EQ(resolve(doc, parse_pointer("/ports/2")), Tree{8443});
    EXPECT_EQ(result.location, parse_pointer("/ports/2"));
}

TEST(Insert, index_past_end_fails) {
    auto doc = sample();
    const auto before = doc;
    EXPECT_EQ(path_error_kind([&] { insert(doc, parse_pointer("/ports/5"), 1); }),
              "index_out_of_bounds");
    EXPECT_EQ(doc, before);
}

TEST(Insert, auto_vivifies_missing_mappings) {
    auto doc = sample();
    auto result = insert(doc, parse_pointer("/spec/template/replicas"), 2);

    EXPECT_EQ(resolve(doc, parse_pointer("/spec")),
              (Tree{Mapping{{"template", Mapping{{"replicas", 2}}}}}));
    EXPECT_EQ(result.location, parse_pointer("/spec"));
    EXPECT_FALSE(result.displaced.has_value());
}

TEST(Insert, does_not_vivify_through_a_scalar) {
    auto doc = sample();
    const auto before = doc;
    EXPECT_EQ(path_error_kind([&] { insert(doc, parse_pointer("/name/first"), "x"); }),
              "type_mismatch");
    EXPECT_EQ(doc, before);
}

TEST(Insert, does_not_vivify_sequence_elements) {
    auto doc = sample();
    EXPECT_EQ(path_error_kind([&] { insert(doc, parse_pointer("/ports/7/name"), "x"); }),
              "index_out_of_bounds");
}

TEST(Insert, empty_path_replaces_root) {
    auto doc = sample();
    auto result = insert(doc, Path{}, "scalar");

    EXPECT_EQ(doc, Tree{"scalar"});
    ASSERT_TRUE(result.displaced.has_value());
    EXPECT_EQ(*result.displaced, sample());
}

// -- erase --------------------------------------------------------------------

TEST(Erase, mapping_key) {
    auto doc = sample();
    auto removed = erase(doc, parse_pointer("/ports"));

    EXPECT_EQ(removed.value, (Tree{Sequence{80, 443}}));
    EXPECT_EQ(removed.position, 1u);
    EXPECT_EQ(keys_of(doc), (std::vector<std::string>{"name", "meta"}));
}

TEST(Erase, sequence_element_shifts_left) {
    auto doc = sample();
    auto removed = erase(doc, parse_pointer("/ports/0"));

    EXPECT_EQ(removed.value, Tree{80});
    EXPECT_EQ(removed.position, 0u);
    EXPECT_EQ(resolve(doc, parse_pointer("/ports")), (Tree{Sequence{443}}));
}

TEST(Erase, failures_leave_tree_unchanged) {
    auto doc = sample();
    const auto before = doc;

    EXPECT_EQ(path_error_kind([&] { erase(doc, parse_pointer("/missing")); }),
              "path_not_found");
    EXPECT_EQ(path_error_kind([&] { erase(doc, parse_pointer("/missing/child")); }),
              "path_not_found");
    EXPECT_EQ(path_error_kind([&] { erase(doc, parse_pointer("/ports/2")); }),
              "index_out_of_bounds");
    EXPECT_EQ(path_error_kind([&] { erase(doc, parse_pointer("/ports/-")); }),
              "index_out_of_bounds");
    EXPECT_EQ(path_error_kind([&] { erase(doc, parse_pointer("/name/x")); }),
              "type_mismatch");
    EXPECT_EQ(doc, before);
}

TEST(Erase, root_is_invalid) {
    auto doc = sample();
    EXPECT_EQ(path_error_kind([&] { erase(doc, Path{}); }), "invalid_path");
}

// -- set ----------------------------------------------------------------------

TEST(Set, existing_node_returns_previous_value) {
    auto doc = sample();
    auto previous = set(doc, parse_pointer("/ports/1"), 8443);

    ASSERT_TRUE(previous.has_value());
    EXPECT_EQ(*previous, Tree{443});
    EXPECT_EQ(resolve(doc, parse_pointer("/ports/1")), Tree{8443});
}

TEST(Set, creates_missing_final_key) {
    auto doc = sample();
    auto previous = set(doc, parse_pointer("/meta/team"), "core");

    EXPECT_FALSE(previous.has_value());
    EXPECT_EQ(resolve(doc, parse_pointer("/meta/team")), Tree{"core"});
}

TEST(Set, does_not_vivify_intermediate_keys) {
    auto doc = sample();
    const auto before = doc;
    EXPECT_EQ(path_error_kind([&] { (void)set(doc, parse_pointer("/spec/replicas"), 1); }),
              "path_not_found");
    EXPECT_EQ(doc, before);
}

TEST(Set, sequence_bounds) {
    auto doc = sample();
    EXPECT_EQ(path_error_kind([&] { (void)set(doc, parse_pointer("/ports/2"), 1); }),
              "index_out_of_bounds");
    EXPECT_EQ(path_error_kind([&] { (void)set(doc, parse_pointer("/ports/-"), 1); }),
              "index_out_of_bounds");
}

TEST(Set, empty_path_replaces_root) {
    auto doc = sample();
    auto previous = set(doc, Path{}, Sequence{});

    EXPECT_EQ(doc, Tree{Sequence{}});
    ASSERT_TRUE(previous.has_value());
    EXPECT_EQ(*previous, sample());
}
