// basic_usage — demonstrates the core jsonpatch-cpp API
//
// Shows building a Value tree with initializer lists, reading it through
// pointers, evaluating a query, and applying a patch with error handling.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <cstdint>
#include <cstdio>
#include <string>
#include <variant>
#include <vector>

namespace jp = jsonpatch_cpp;

namespace {

void print_value(const jp::Value& v, int indent = 0);

void print_indent(int indent) {
    for (int i = 0; i < indent; ++i) std::printf("  ");
}

void print_value(const jp::Value& v, int indent) {
    std::visit(jp::overload{
        [](const jp::Null&) { std::printf("null"); },
        [](bool b) { std::printf("%s", b ? "true" : "false"); },
        [](std::int64_t i) { std::printf("%lld", static_cast<long long>(i)); },
        [](std::uint64_t u) { std::printf("%llu", static_cast<unsigned long long>(u)); },
        [](double d) { std::printf("%g", d); },
        [](const std::string& s) { std::printf("\"%s\"", s.c_str()); },
        [&](const jp::Array& arr) {
            std::printf("[\n");
            for (std::size_t i = 0; i < arr.size(); ++i) {
                print_indent(indent + 1);
                print_value(arr[i], indent + 1);
                std::printf(i + 1 < arr.size() ? ",\n" : "\n");
            }
            print_indent(indent);
            std::printf("]");
        },
        [&](const jp::Object& obj) {
            std::printf("{\n");
            auto remaining = obj.size();
            for (const auto& [key, member] : obj) {
                print_indent(indent + 1);
                std::printf("\"%s\": ", key.c_str());
                print_value(member, indent + 1);
                std::printf(--remaining > 0 ? ",\n" : "\n");
            }
            print_indent(indent);
            std::printf("}");
        },
    }, v.storage());
}

}  // namespace

int main() {
    // -- Build a document with initializer lists ------------------------------
    auto doc = jp::Value{jp::Object{
        {"title", "Shopping List"},
        {"items", jp::Array{
            jp::Object{{"name", "Milk"}, {"qty", 1}},
            jp::Object{{"name", "Eggs"}, {"qty", 12}},
        }},
        {"done", false},
    }};

    // -- Read through a pointer -----------------------------------------------
    if (auto eggs = jp::pointer::get_pointer(doc, "/items/1/qty")) {
        std::printf("Eggs: %lld\n", static_cast<long long>(*eggs->as_int64()));
    }

    // -- Evaluate a query -----------------------------------------------------
    if (auto names = jp::query_pointers(doc, "$/items/*/name")) {
        for (const auto& p : *names) std::printf("match: %s\n", p.c_str());
    }

    // -- Apply a patch --------------------------------------------------------
    const auto patch = std::vector<jp::Operation>{
        jp::Operation::test("/done", false),
        jp::Operation::add("/items/-", jp::Object{{"name", "Bread"}, {"qty", 2}}),
        jp::Operation::replace("$/items/*/qty", 0),
        jp::Operation::copy("/title", "/subtitle"),
        jp::Operation::move("/done", "/archived"),
    };
    auto patched = jp::apply_patches(doc, patch);
    if (!patched) {
        std::printf("patch failed: %s\n", patched.error().describe().c_str());
        return 1;
    }
    print_value(*patched);
    std::printf("\n");

    // -- Errors carry a kind, the op and the path -----------------------------
    auto failed = jp::apply_operation(doc, jp::Operation::remove("/items/7"));
    if (!failed) {
        std::printf("expected failure: %s\n", failed.error().describe().c_str());
    }

    return 0;
}
