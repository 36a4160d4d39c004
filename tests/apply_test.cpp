#include <docdelta-cpp/apply.hpp>
#include <docdelta-cpp/error.hpp>
#include <docdelta-cpp/resolver.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace docdelta_cpp;

namespace {

auto ptr(std::string_view pointer) -> Path { return parse_pointer(pointer); }

auto sample() -> Tree {
    return Tree{Mapping{
        {"name", "svc"},
        {"ports", Sequence{80, 443}},
        {"meta", Mapping{{"owner", "ops"}, {"team", "core"}}},
    }};
}

auto keys_of(const Tree& tree) -> std::vector<std::string> {
    auto keys = std::vector<std::string>{};
    for (const auto& [key, value] : tree.as_mapping()) keys.push_back(key);
    return keys;
}

}  // namespace

// -- Single operations --------------------------------------------------------

TEST(Apply, empty_patch_is_identity) {
    EXPECT_EQ(docdelta_cpp::apply(sample(), Patch{}), sample());
}

TEST(Apply, add_remove_replace) {
    const auto patch = Patch{
        AddOp{ptr("/replicas"), 2},
        RemoveOp{ptr("/meta/team")},
        ReplaceOp{ptr("/ports/0"), 8080},
    };
    const auto expected = Tree{Mapping{
        {"name", "svc"},
        {"ports", Sequence{8080, 443}},
        {"meta", Mapping{{"owner", "ops"}}},
        {"replicas", 2},
    }};
    EXPECT_EQ(docdelta_cpp::apply(sample(), patch), expected);
}

TEST(Apply, does_not_modify_the_input) {
    const auto doc = sample();
    const auto result = docdelta_cpp::apply(doc, Patch{RemoveOp{ptr("/ports")}});
    EXPECT_EQ(doc, sample());
    EXPECT_NE(result, doc);
}

TEST(Apply, operations_see_earlier_effects) {
    const auto patch = Patch{
        AddOp{ptr("/ports/-"), 8443},
        ReplaceOp{ptr("/ports/2"), 9443},
    };
    const auto result = docdelta_cpp::apply(sample(), patch);
    EXPECT_EQ(resolve(result, ptr("/ports")), (Tree{Sequence{80, 443, 9443}}));
}

TEST(Apply, add_vivifies_intermediate_mappings) {
    const auto result = docdelta_cpp::apply(sample(), Patch{AddOp{ptr("/spec/template/image"), "nginx"}});
    EXPECT_EQ(resolve(result, ptr("/spec/template/image")), Tree{"nginx"});
}

TEST(Apply, replace_of_missing_key_fails) {
    try {
        (void)docdelta_cpp::apply(sample(), Patch{ReplaceOp{ptr("/meta/missing"), 1}});
        FAIL() << "expected ApplyError";
    } catch (const ApplyError& e) {
        EXPECT_EQ(e.index(), 0u);
        EXPECT_EQ(e.cause().kind(), ErrorKind::path_not_found);
        EXPECT_EQ(e.kind(), ErrorKind::apply_failed);
    }
}

TEST(Apply, replace_root) {
    const auto result = docdelta_cpp::apply(sample(), Patch{ReplaceOp{Path{}, Sequence{1}}});
    EXPECT_EQ(result, Tree{Sequence{1}});
}

TEST(Apply, remove_root_fails) {
    EXPECT_THROW((void)docdelta_cpp::apply(sample(), Patch{RemoveOp{Path{}}}), ApplyError);
}

// -- Removal order ------------------------------------------------------------

TEST(Apply, descending_removals_remove_the_intended_elements) {
    const auto doc = Tree{Sequence{"a", "b", "c"}};
    const auto patch = Patch{RemoveOp{ptr("/2")}, RemoveOp{ptr("/1")}};
    EXPECT_EQ(docdelta_cpp::apply(doc, patch), Tree{Sequence{"a"}});
}

TEST(Apply, ascending_removals_run_past_the_end) {
    const auto doc = Tree{Sequence{"a", "b", "c"}};
    const auto patch = Patch{RemoveOp{ptr("/1")}, RemoveOp{ptr("/2")}};
    try {
        (void)docdelta_cpp::apply(doc, patch);
        FAIL() << "expected ApplyError";
    } catch (const ApplyError& e) {
        EXPECT_EQ(e.index(), 1u);
        EXPECT_EQ(e.cause().kind(), ErrorKind::index_out_of_bounds);
        EXPECT_EQ(e.cause().pointer(), "/2");
    }
}

// -- Atomicity ----------------------------------------------------------------

TEST(ApplyInPlace, success_modifies_tree) {
    auto doc = sample();
    apply_in_place(doc, Patch{ReplaceOp{ptr("/name"), "api"}});
    EXPECT_EQ(resolve(doc, ptr("/name")), Tree{"api"});
}

TEST(ApplyInPlace, failure_restores_tree_and_key_order) {
    auto doc = sample();
    const auto patch = Patch{
        RemoveOp{ptr("/name")},
        ReplaceOp{ptr("/meta/owner"), "dev"},
        AddOp{ptr("/meta/owner"), "overwritten"},
        AddOp{ptr("/extra/deep/key"), 1},
        AddOp{ptr("/ports/0"), 22},
        RemoveOp{ptr("/meta/team")},
        RemoveOp{ptr("/does/not/exist")},
    };

    EXPECT_THROW(apply_in_place(doc, patch), ApplyError);
    EXPECT_EQ(doc, sample());
    EXPECT_EQ(keys_of(doc), (std::vector<std::string>{"name", "ports", "meta"}));
    EXPECT_EQ(keys_of(resolve(doc, ptr("/meta"))),
              (std::vector<std::string>{"owner", "team"}));
}

TEST(ApplyInPlace, failure_reports_failing_operation) {
    auto doc = sample();
    const auto patch = Patch{
        AddOp{ptr("/a"), 1},
        AddOp{ptr("/b"), 2},
        RemoveOp{ptr("/name/x")},
    };
    try {
        apply_in_place(doc, patch);
        FAIL() << "expected ApplyError";
    } catch (const ApplyError& e) {
        EXPECT_EQ(e.index(), 2u);
        EXPECT_EQ(e.cause().kind(), ErrorKind::type_mismatch);
        EXPECT_NE(std::string{e.what()}.find("operation 2"), std::string::npos);
    }
    EXPECT_EQ(doc, sample());
}

TEST(ApplyInPlace, rollback_of_root_replacement) {
    auto doc = sample();
    const auto patch = Patch{
        ReplaceOp{Path{}, "scalar"},
        AddOp{ptr("/x"), 1},
    };
    EXPECT_THROW(apply_in_place(doc, patch), ApplyError);
    EXPECT_EQ(doc, sample());
}

TEST(ApplyInPlace, rollback_of_append_and_nested_edits) {
    auto doc = Tree{Mapping{{"list", Sequence{}}}};
    const auto patch = Patch{
        AddOp{ptr("/list/-"), Mapping{{"id", 1}}},
        ReplaceOp{ptr("/list/0/id"), 2},
        AddOp{ptr("/list/0/extra"), true},
        ReplaceOp{ptr("/list/1"), 3},
    };
    EXPECT_THROW(apply_in_place(doc, patch), ApplyError);
    EXPECT_EQ(doc, (Tree{Mapping{{"list", Sequence{}}}}));
}
