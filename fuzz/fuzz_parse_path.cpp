// Fuzz target for parse_path(): exercises both the pointer and the query
// parser. Any concrete parse result must survive canonicalize() and parse
// back to the same segments.

#include <jsonpatch-cpp/path.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    auto path = jsonpatch_cpp::parse_path(text);
    if (!path) return 0;

    auto display = path->to_string();
    (void)display;

    auto canonical = jsonpatch_cpp::canonicalize(*path);
    if (!path->is_concrete()) {
        if (canonical) __builtin_trap();
        return 0;
    }
    if (!canonical) __builtin_trap();

    auto reparsed = jsonpatch_cpp::parse_pointer(*canonical);
    if (!reparsed || *reparsed != *path) __builtin_trap();
    return 0;
}
