// Fuzz target for decode_document(): exercises the YAML scalar resolver.
// Any document that decodes must survive encode/decode unchanged.

#include <docdelta-cpp/codec.hpp>
#include <docdelta-cpp/error.hpp>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

namespace {

auto contains_nan(const docdelta_cpp::Tree& tree) -> bool {
    using namespace docdelta_cpp;
    return std::visit(overload{
        [](double d) { return std::isnan(d); },
        [](const Sequence& seq) {
            for (const auto& child : seq) {
                if (contains_nan(child)) return true;
            }
            return false;
        },
        [](const Mapping& map) {
            for (const auto& [key, child] : map) {
                if (contains_nan(child)) return true;
            }
            return false;
        },
        [](const auto&) { return false; },
    }, tree.storage());
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    auto tree = docdelta_cpp::Tree{};
    try {
        tree = docdelta_cpp::decode_document(text);
    } catch (const docdelta_cpp::DecodeError&) {
        return 0;
    }

    // Round-trip: a decoded tree must encode and decode back to itself
    const auto back = docdelta_cpp::decode_document(docdelta_cpp::encode_document(tree));
    if (!contains_nan(tree) && back != tree) std::abort();
    return 0;
}
