#include <jsonpatch-cpp/json.hpp>

#include <jsonpatch-cpp/patch.hpp>
#include <jsonpatch-cpp/query.hpp>

#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace jsonpatch_cpp {

// =============================================================================
// Shared helpers (anonymous namespace, visible to both jsonpatch_cpp and
// jsonpatch_cpp::json through normal name lookup)
// =============================================================================

namespace {

// Both nlohmann::json and nlohmann::ordered_json go through these; the
// document type decides whether member order survives.

template <typename Json>
auto value_from_json(const Json& j) -> Value {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            return Value{};
        case nlohmann::json::value_t::boolean:
            return Value{j.template get<bool>()};
        case nlohmann::json::value_t::number_unsigned: {
            auto val = j.template get<std::uint64_t>();
            // If it fits in int64, prefer int64 so equal numbers share a type
            if (val <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return Value{static_cast<std::int64_t>(val)};
            }
            return Value{val};
        }
        case nlohmann::json::value_t::number_integer:
            return Value{j.template get<std::int64_t>()};
        case nlohmann::json::value_t::number_float:
            return Value{j.template get<double>()};
        case nlohmann::json::value_t::string:
            return Value{j.template get<std::string>()};
        case nlohmann::json::value_t::array: {
            auto arr = Array{};
            arr.reserve(j.size());
            for (const auto& element : j) {
                arr.push_back(value_from_json(element));
            }
            return Value{std::move(arr)};
        }
        case nlohmann::json::value_t::object: {
            auto obj = Object{};
            for (const auto& [key, member] : j.items()) {
                obj.insert_or_assign(key, value_from_json(member));
            }
            return Value{std::move(obj)};
        }
        case nlohmann::json::value_t::binary:
        case nlohmann::json::value_t::discarded:
            break;
    }
    throw PatchError{Error{ErrorKind::invalid_patch,
                           std::string{"cannot convert JSON "} + j.type_name() + " to Value"}};
}

template <typename Json>
void value_to_json(Json& j, const Value& v) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](std::uint64_t u) { j = u; },
        [&](double d) { j = d; },
        [&](const std::string& s) { j = s; },
        [&](const Array& arr) {
            j = Json::array();
            for (const auto& element : arr) {
                auto element_j = Json{};
                value_to_json(element_j, element);
                j.push_back(std::move(element_j));
            }
        },
        [&](const Object& obj) {
            j = Json::object();
            for (const auto& [key, member] : obj) {
                value_to_json(j[key], member);
            }
        },
    }, v.storage());
}

}  // anonymous namespace

// =============================================================================
// ADL serialization: to_json / from_json  (in namespace jsonpatch_cpp)
// =============================================================================

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const Value& v) {
    value_to_json(j, v);
}

void from_json(const nlohmann::json& j, Value& v) {
    v = value_from_json(j);
}

void to_json(nlohmann::ordered_json& j, const Value& v) {
    value_to_json(j, v);
}

void from_json(const nlohmann::ordered_json& j, Value& v) {
    v = value_from_json(j);
}

// -- Operations ---------------------------------------------------------------

void to_json(nlohmann::json& j, const Operation& op) {
    j = nlohmann::json{{"op", op.op}};
    if (op.from) j["from"] = *op.from;
    if (op.path) j["path"] = *op.path;
    if (op.value) value_to_json(j["value"], *op.value);
}

void from_json(const nlohmann::json& j, Operation& op) {
    auto parsed = parse_operation(value_from_json(j));
    if (!parsed) throw PatchError{std::move(parsed.error())};
    op = std::move(*parsed);
}

// -- Errors -------------------------------------------------------------------

void to_json(nlohmann::json& j, ErrorKind kind) {
    j = std::string{to_string_view(kind)};
}

void to_json(nlohmann::json& j, const Error& error) {
    j = nlohmann::json{
        {"kind", std::string{to_string_view(error.kind)}},
        {"message", error.message},
    };
    if (!error.path.empty()) j["path"] = error.path;
    if (!error.op.empty()) j["op"] = error.op;
}

// =============================================================================
// Document-level helpers (namespace jsonpatch_cpp::json)
// =============================================================================

namespace json {

auto import_json(const nlohmann::json& j) -> Value {
    return value_from_json(j);
}

auto import_json(const nlohmann::ordered_json& j) -> Value {
    return value_from_json(j);
}

auto export_json(const Value& v) -> nlohmann::json {
    auto j = nlohmann::json{};
    value_to_json(j, v);
    return j;
}

auto export_ordered_json(const Value& v) -> nlohmann::ordered_json {
    auto j = nlohmann::ordered_json{};
    value_to_json(j, v);
    return j;
}

auto parse_patch(const nlohmann::json& patch) -> std::vector<Operation> {
    auto ops = parse_operations(value_from_json(patch));
    if (!ops) throw PatchError{std::move(ops.error())};
    return std::move(*ops);
}

auto apply_json_patch(const nlohmann::json& document, const nlohmann::json& patch)
    -> nlohmann::json {
    const auto ops = parse_patch(patch);
    auto result = apply_patches(value_from_json(document), std::span<const Operation>{ops});
    if (!result) throw PatchError{std::move(result.error())};
    return export_json(*result);
}

auto query_json(const nlohmann::json& document, std::string_view query)
    -> std::vector<std::string> {
    auto pointers = query_pointers(value_from_json(document), query);
    if (!pointers) throw PatchError{std::move(pointers.error())};
    return std::move(*pointers);
}

}  // namespace json

}  // namespace jsonpatch_cpp
