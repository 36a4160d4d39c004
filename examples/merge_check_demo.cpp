// merge_check_demo: three-way conflict detection between two edits
//
// Two people edit the same configuration. Before merging their changes,
// check which edits overlap.
//
// Build: cmake -B build -DDOCDELTA_CPP_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/merge_check_demo

#include <docdelta-cpp/docdelta.hpp>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

namespace dd = docdelta_cpp;

static void print_report(const char* title, const dd::MergeReport& report) {
    auto j = nlohmann::ordered_json{};
    dd::to_json(j, report);
    std::printf("%s\n%s\n\n", title, j.dump(2).c_str());
}

int main() {
    const auto base = dd::decode_document(
        "service: api\n"
        "resources:\n"
        "  cpu: 500m\n"
        "  memory: 256Mi\n"
        "features: [auth, cache]\n");

    // Alice bumps memory and adds a feature
    auto alice = base;
    dd::set(alice, dd::parse_pointer("/resources/memory"), "512Mi");
    dd::insert(alice, dd::parse_pointer("/features/-"), "metrics");

    // Bob bumps cpu
    auto bob = base;
    dd::set(bob, dd::parse_pointer("/resources/cpu"), "1");

    print_report("Alice vs Bob (disjoint):", dd::detect_conflicts(base, alice, bob));

    // Carol drops the resources block entirely
    auto carol = base;
    dd::erase(carol, dd::parse_pointer("/resources"));

    print_report("Alice vs Carol (overlapping):", dd::detect_conflicts(base, alice, carol));

    // Single-source view: every replaced value in Alice's edit
    auto single = nlohmann::ordered_json{};
    dd::to_json(single, dd::detect_conflicts(base, alice));
    std::printf("Alice, single-source:\n%s\n", single.dump(2).c_str());

    return 0;
}
