// json_patch_demo — jsonpatch-cpp + nlohmann/json interoperability
//
// Demonstrates:
//   - Applying an RFC 6902 patch given as JSON text
//   - Query expressions in "path" and "from"
//   - Catching PatchError and reading the structured error
//   - Converting between nlohmann::ordered_json and Value
//
// Build: cmake --build build -DJSONPATCH_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/examples/json_patch_demo

#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/jsonpatch.hpp>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

namespace jp = jsonpatch_cpp;
using json = nlohmann::json;

int main() {
    const auto config = json::parse(R"({
        "service": "billing",
        "replicas": 2,
        "endpoints": [
            {"host": "a.internal", "tls": false},
            {"host": "b.internal", "tls": false}
        ]
    })");

    // -- Plain RFC 6902 patch -------------------------------------------------
    const auto patch = json::parse(R"([
        {"op": "test",    "path": "/service", "value": "billing"},
        {"op": "replace", "path": "/replicas", "value": 3},
        {"op": "add",     "path": "/endpoints/-", "value": {"host": "c.internal", "tls": false}},
        {"op": "replace", "path": "$/endpoints/*/tls", "value": true}
    ])");

    auto updated = jp::json::apply_json_patch(config, patch);
    std::printf("updated:\n%s\n\n", updated.dump(2).c_str());

    // -- Which locations does a query touch? ----------------------------------
    for (const auto& p : jp::json::query_json(updated, "$/endpoints/*/host")) {
        std::printf("host at %s\n", p.c_str());
    }

    // -- Structured errors ----------------------------------------------------
    try {
        jp::json::apply_json_patch(config, json::parse(R"([
            {"op": "test", "path": "/replicas", "value": 5}
        ])"));
    } catch (const jp::PatchError& e) {
        const json details = e.error();
        std::printf("\nrejected: %s\n", details.dump().c_str());
    }

    // -- Order-preserving round trip ------------------------------------------
    auto ordered = nlohmann::ordered_json::parse(R"({"z": 1, "a": {"y": 2, "b": 3}})");
    auto value = ordered.get<jp::Value>();
    auto moved = jp::apply_operation(value, jp::Operation::move("/a/y", "/a/x"));
    if (moved) {
        std::printf("ordered: %s\n", jp::json::export_ordered_json(*moved).dump().c_str());
    }

    return 0;
}
