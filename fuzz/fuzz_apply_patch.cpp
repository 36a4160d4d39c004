// Fuzz target for patch parsing and application.
// The input is a JSON patch applied to a fixed document. A patch that fails
// must leave the document exactly as it was.

#include <docdelta-cpp/docdelta.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace dd = docdelta_cpp;

    static const auto base = dd::Tree{dd::Mapping{
        {"name", "svc"},
        {"list", dd::Sequence{1, 2, dd::Mapping{{"k", "v"}}}},
        {"nested", dd::Mapping{{"a", dd::Mapping{{"b", true}}}}},
    }};

    auto j = nlohmann::ordered_json::parse(data, data + size, nullptr, false);
    if (j.is_discarded()) return 0;

    auto patch = dd::Patch{};
    try {
        patch = dd::patch_from_json(j);
    } catch (const dd::PatchFormatError&) {
        return 0;
    }

    auto doc = base;
    try {
        dd::apply_in_place(doc, patch);
    } catch (const dd::ApplyError&) {
        if (doc != base) std::abort();
        return 0;
    }

    // A successful patch must be reproducible by diffing
    if (dd::apply(base, dd::diff(base, doc)) != doc) std::abort();
    return 0;
}
