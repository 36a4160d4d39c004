#include <docdelta-cpp/conflict.hpp>

#include <gtest/gtest.h>

using namespace docdelta_cpp;

namespace {

auto ptr(std::string_view pointer) -> Path { return parse_pointer(pointer); }

auto base_doc() -> Tree {
    return Tree{Mapping{
        {"name", "svc"},
        {"replicas", 1},
        {"container", Mapping{{"image", "v1"}, {"port", 80}}},
        {"tags", Sequence{"a", "b"}},
    }};
}

}  // namespace

TEST(ConflictMode, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ConflictMode::single_source), "single_source");
    EXPECT_EQ(to_string_view(ConflictMode::three_way),     "three_way");
}

// =============================================================================
// Single-source detection
// =============================================================================

TEST(DetectConflicts, identical_documents_have_no_conflict) {
    const auto report = detect_conflicts(base_doc(), base_doc());
    EXPECT_FALSE(report.has_conflict);
    EXPECT_TRUE(report.conflicts.empty());
}

TEST(DetectConflicts, replaced_value_is_reported) {
    auto edited = base_doc();
    edited.as_mapping().at("container").as_mapping().put("image", "v2");

    const auto report = detect_conflicts(base_doc(), edited);
    ASSERT_TRUE(report.has_conflict);
    ASSERT_EQ(report.conflicts.size(), 1u);
    EXPECT_EQ(report.conflicts[0].path, ptr("/container/image"));
    EXPECT_EQ(report.conflicts[0].value, Tree{"v2"});
}

TEST(DetectConflicts, additions_and_removals_are_not_conflicts) {
    auto edited = base_doc();
    edited.as_mapping().put("extra", true);
    edited.as_mapping().erase("replicas");
    edited.as_mapping().at("tags").as_sequence().push_back("c");

    const auto report = detect_conflicts(base_doc(), edited);
    EXPECT_FALSE(report.has_conflict);
    EXPECT_TRUE(report.conflicts.empty());
}

TEST(DetectConflicts, every_replacement_is_reported_in_diff_order) {
    auto edited = base_doc();
    edited.as_mapping().put("name", "api");
    edited.as_mapping().put("replicas", 3);

    const auto report = detect_conflicts(base_doc(), edited);
    ASSERT_EQ(report.conflicts.size(), 2u);
    EXPECT_EQ(report.conflicts[0].path, ptr("/name"));
    EXPECT_EQ(report.conflicts[1].path, ptr("/replicas"));
    EXPECT_EQ(report.conflicts[1].value, Tree{3});
}

TEST(DetectConflicts, has_conflict_matches_conflict_list) {
    auto edited = base_doc();
    edited.as_mapping().put("tags", "none");

    const auto report = detect_conflicts(base_doc(), edited);
    EXPECT_EQ(report.has_conflict, !report.conflicts.empty());
    EXPECT_TRUE(report.has_conflict);
}

// =============================================================================
// Three-way detection
// =============================================================================

TEST(DetectConflictsThreeWay, disjoint_edits_do_not_conflict) {
    auto left = base_doc();
    left.as_mapping().put("name", "api");
    auto right = base_doc();
    right.as_mapping().put("replicas", 5);

    const auto report = detect_conflicts(base_doc(), left, right);
    EXPECT_FALSE(report.has_conflict);
    EXPECT_TRUE(report.conflicts.empty());
}

TEST(DetectConflictsThreeWay, identical_edits_do_not_conflict) {
    auto left = base_doc();
    left.as_mapping().put("replicas", 3);
    left.as_mapping().put("added", "same");
    auto right = left;

    const auto report = detect_conflicts(base_doc(), left, right);
    EXPECT_FALSE(report.has_conflict);
}

TEST(DetectConflictsThreeWay, divergent_edits_of_same_node) {
    auto left = base_doc();
    left.as_mapping().put("replicas", 3);
    auto right = base_doc();
    right.as_mapping().put("replicas", 4);

    const auto report = detect_conflicts(base_doc(), left, right);
    ASSERT_TRUE(report.has_conflict);
    ASSERT_EQ(report.conflicts.size(), 1u);
    const auto& c = report.conflicts[0];
    EXPECT_EQ(c.path, ptr("/replicas"));
    EXPECT_EQ(c.left, (EditOp{ReplaceOp{ptr("/replicas"), Tree{3}}}));
    EXPECT_EQ(c.right, (EditOp{ReplaceOp{ptr("/replicas"), Tree{4}}}));
}

TEST(DetectConflictsThreeWay, remove_versus_replace) {
    auto left = base_doc();
    left.as_mapping().erase("name");
    auto right = base_doc();
    right.as_mapping().put("name", "api");

    const auto report = detect_conflicts(base_doc(), left, right);
    ASSERT_EQ(report.conflicts.size(), 1u);
    EXPECT_EQ(op_kind(report.conflicts[0].left), OpKind::remove);
    EXPECT_EQ(op_kind(report.conflicts[0].right), OpKind::replace);
}

TEST(DetectConflictsThreeWay, both_add_same_key_with_different_values) {
    auto left = base_doc();
    left.as_mapping().put("owner", "alice");
    auto right = base_doc();
    right.as_mapping().put("owner", "bob");

    const auto report = detect_conflicts(base_doc(), left, right);
    ASSERT_EQ(report.conflicts.size(), 1u);
    EXPECT_EQ(report.conflicts[0].path, ptr("/owner"));
}

TEST(DetectConflictsThreeWay, removed_subtree_edited_on_other_side) {
    auto left = base_doc();
    left.as_mapping().erase("container");
    auto right = base_doc();
    right.as_mapping().at("container").as_mapping().put("port", 8080);

    const auto report = detect_conflicts(base_doc(), left, right);
    ASSERT_EQ(report.conflicts.size(), 1u);
    const auto& c = report.conflicts[0];
    EXPECT_EQ(c.path, ptr("/container"));
    EXPECT_EQ(c.left, (EditOp{RemoveOp{ptr("/container")}}));
    EXPECT_EQ(c.right, (EditOp{ReplaceOp{ptr("/container/port"), Tree{8080}}}));
}

TEST(DetectConflictsThreeWay, replaced_subtree_edited_on_other_side) {
    auto left = base_doc();
    left.as_mapping().at("tags").as_sequence()[1] = "z";
    auto right = base_doc();
    right.as_mapping().put("tags", Mapping{{"kind", "none"}});

    const auto report = detect_conflicts(base_doc(), left, right);
    ASSERT_EQ(report.conflicts.size(), 1u);
    EXPECT_EQ(report.conflicts[0].path, ptr("/tags"));
    EXPECT_EQ(op_kind(report.conflicts[0].right), OpKind::replace);
}

TEST(DetectConflictsThreeWay, max_depth_coarsens_both_sides) {
    auto left = base_doc();
    left.as_mapping().at("container").as_mapping().put("image", "v2");
    auto right = base_doc();
    right.as_mapping().at("container").as_mapping().put("port", 81);

    EXPECT_FALSE(detect_conflicts(base_doc(), left, right).has_conflict);
    EXPECT_TRUE(detect_conflicts(base_doc(), left, right, DiffOptions{.max_depth = 1}).has_conflict);
}
