// Fuzz target for the patch interpreter. The input is a JSON object
// {"doc": ..., "patch": [...]}; well-formed inputs are applied, and a
// successful result must export back to JSON.

#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/patch.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace jp = jsonpatch_cpp;

    auto input = nlohmann::json::parse(data, data + size, nullptr, false);
    if (input.is_discarded() || !input.is_object()) return 0;
    if (!input.contains("doc") || !input.contains("patch")) return 0;

    const auto doc = jp::json::import_json(input["doc"]);
    auto ops = jp::parse_operations(jp::json::import_json(input["patch"]));
    if (!ops) return 0;

    auto out = jp::apply_patches(doc, std::span<const jp::Operation>{*ops});
    if (out) {
        auto exported = jp::json::export_json(*out);
        (void)exported;
    }

    // The in-place fold must agree with the copying one.
    auto in_place = doc;
    auto ok = jp::apply_all_in_place(in_place, *ops);
    if (ok.has_value() != out.has_value()) __builtin_trap();
    if (out && !jp::equals(*out, in_place)) __builtin_trap();
    return 0;
}
