// diff_patch_demo: docdelta-cpp diff / patch walkthrough
//
// Demonstrates:
//   - Decoding two YAML documents into trees
//   - Computing a JSON Patch between them
//   - Applying the patch, and what happens when a patch fails
//   - The fail-soft text entry points
//
// Build: cmake -B build -DDOCDELTA_CPP_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/diff_patch_demo

#include <docdelta-cpp/docdelta.hpp>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

namespace dd = docdelta_cpp;

int main() {
    const auto base_text = std::string{
        "name: web\n"
        "replicas: 2\n"
        "image: nginx:1.25\n"
        "ports:\n"
        "  - 80\n"
        "  - 443\n"};
    const auto target_text = std::string{
        "name: web\n"
        "replicas: 4\n"
        "image: nginx:1.27\n"
        "ports:\n"
        "  - 80\n"
        "env:\n"
        "  LOG_LEVEL: debug\n"};

    // =========================================================================
    // 1. Diff two documents
    // =========================================================================
    std::printf("=== 1. Diff ===\n");

    const auto base = dd::decode_document(base_text);
    const auto target = dd::decode_document(target_text);
    const auto patch = dd::diff(base, target);

    std::printf("%zu operation(s):\n%s\n", patch.size(), dd::patch_to_json(patch).dump(2).c_str());

    // =========================================================================
    // 2. Apply the patch
    // =========================================================================
    std::printf("\n=== 2. Apply ===\n");

    const auto patched = dd::apply(base, patch);
    std::printf("%s", dd::encode_document(patched).c_str());
    std::printf("matches target: %s\n", patched == target ? "yes" : "no");

    // =========================================================================
    // 3. A failing patch leaves the document untouched
    // =========================================================================
    std::printf("\n=== 3. Atomic failure ===\n");

    auto doc = base;
    const auto bad = dd::Patch{
        dd::ReplaceOp{dd::parse_pointer("/replicas"), 10},
        dd::RemoveOp{dd::parse_pointer("/ports/5")},
    };
    try {
        dd::apply_in_place(doc, bad);
    } catch (const dd::ApplyError& e) {
        std::printf("rejected: %s\n", e.what());
        std::printf("operation index: %zu, cause: %s\n", e.index(),
                    std::string{dd::to_string_view(e.cause().kind())}.c_str());
    }
    std::printf("document unchanged: %s\n", doc == base ? "yes" : "no");

    // =========================================================================
    // 4. Text entry points
    // =========================================================================
    std::printf("\n=== 4. Text entry points ===\n");

    const auto patch_text = dd::text::diff(base_text, target_text);
    std::printf("diff:      %s\n", patch_text.c_str());
    std::printf("conflicts: %s\n", dd::text::detect_conflicts(base_text, target_text).c_str());
    std::printf("as JSON:   %s\n", dd::text::yaml_to_json(target_text).c_str());
    std::printf("patched:\n%s", dd::text::apply_patch(base_text, patch_text).c_str());

    std::printf("\nDone (docdelta-cpp %s).\n", dd::text::version().c_str());
    return 0;
}
