// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself — just a corpus generator.

#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/jsonpatch.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

static void write_seed(const std::string& path, std::string_view data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

int main() {
    namespace fs = std::filesystem;
    namespace jp = jsonpatch_cpp;

    const auto path_dir = std::string{"fuzz/corpus/parse_path"};
    const auto patch_dir = std::string{"fuzz/corpus/apply_patch"};
    fs::create_directories(path_dir);
    fs::create_directories(patch_dir);

    // Path seeds: one of each segment kind, escapes, and the query forms.
    write_seed(path_dir + "/seed_root.txt", "");
    write_seed(path_dir + "/seed_pointer.txt", "/a/0/b");
    write_seed(path_dir + "/seed_append.txt", "/list/-");
    write_seed(path_dir + "/seed_escapes.txt", "/a~1b/c~0d/e%20f");
    write_seed(path_dir + "/seed_query_root.txt", "$");
    write_seed(path_dir + "/seed_query.txt", "$/items/*/price");

    // Patch seeds: every operation, once through a pointer and once through
    // a query. Each seed is checked against the library before writing.
    const auto doc = nlohmann::json::parse(R"({
        "items": [{"name": "pen", "price": 2}, {"name": "ink", "price": 9}],
        "tags": ["a", "b"],
        "meta": {"owner": "ada"}
    })");
    const auto patches = {
        R"([{"op": "add", "path": "/tags/-", "value": "c"}])",
        R"([{"op": "remove", "path": "/meta/owner"}])",
        R"([{"op": "replace", "path": "$/items/*/price", "value": 0}])",
        R"([{"op": "move", "from": "/tags/0", "path": "/meta/first"}])",
        R"([{"op": "copy", "from": "/meta", "path": "$/items/*/meta"}])",
        R"([{"op": "test", "path": "/items/1/name", "value": "ink"}])",
    };

    auto n = 0;
    for (const auto* patch_text : patches) {
        const auto patch = nlohmann::json::parse(patch_text);
        try {
            jp::json::apply_json_patch(doc, patch);
        } catch (const jp::PatchError& e) {
            std::fprintf(stderr, "skipping seed %d: %s\n", n, e.what());
            ++n;
            continue;
        }
        const auto seed = nlohmann::json{{"doc", doc}, {"patch", patch}};
        write_seed(patch_dir + "/seed_" + std::to_string(n++) + ".json", seed.dump());
    }
    return 0;
}
