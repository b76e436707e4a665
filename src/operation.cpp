#include <jsonpatch-cpp/operation.hpp>

#include <string>
#include <utility>

namespace jsonpatch_cpp {

// =============================================================================
// Factories
// =============================================================================

auto Operation::add(std::string path, Value value) -> Operation {
    return Operation{"add", std::move(path), std::nullopt, std::move(value)};
}

auto Operation::remove(std::string path) -> Operation {
    return Operation{"remove", std::move(path), std::nullopt, std::nullopt};
}

auto Operation::replace(std::string path, Value value) -> Operation {
    return Operation{"replace", std::move(path), std::nullopt, std::move(value)};
}

auto Operation::move(std::string from, std::string path) -> Operation {
    return Operation{"move", std::move(path), std::move(from), std::nullopt};
}

auto Operation::copy(std::string from, std::string path) -> Operation {
    return Operation{"copy", std::move(path), std::move(from), std::nullopt};
}

auto Operation::test(std::string path, Value value) -> Operation {
    return Operation{"test", std::move(path), std::nullopt, std::move(value)};
}

// =============================================================================
// Value <-> Operation
// =============================================================================

namespace {

/// Read an optional string member. A present non-string member is an error.
auto string_member(const Object& obj, std::string_view name)
    -> Result<std::optional<std::string>> {
    const auto* member = obj.find(name);
    if (!member) return std::optional<std::string>{};
    if (const auto* s = member->as_string()) return std::optional<std::string>{*s};
    return make_error(ErrorKind::invalid_patch,
                      "member '" + std::string{name} + "' must be a string, not "
                          + std::string{to_string_view(member->kind())});
}

}  // anonymous namespace

auto parse_operation(const Value& operation) -> Result<Operation> {
    const auto* obj = operation.as_object();
    if (!obj) {
        return make_error(ErrorKind::invalid_patch,
                          "an operation must be an object, not "
                              + std::string{to_string_view(operation.kind())});
    }

    auto op = string_member(*obj, "op");
    if (!op) return std::unexpected(op.error());
    if (!*op) return make_error(ErrorKind::missing_required_field, "operation has no 'op' member");

    auto path = string_member(*obj, "path");
    if (!path) return std::unexpected(path.error());
    auto from = string_member(*obj, "from");
    if (!from) return std::unexpected(from.error());

    auto result = Operation{};
    result.op = std::move(**op);
    result.path = std::move(*path);
    result.from = std::move(*from);
    if (const auto* value = obj->find("value")) result.value = *value;
    return result;
}

auto parse_operations(const Value& patch) -> Result<std::vector<Operation>> {
    const auto* arr = patch.as_array();
    if (!arr) {
        return make_error(ErrorKind::invalid_patch,
                          "a patch must be an array, not " + std::string{to_string_view(patch.kind())});
    }
    auto ops = std::vector<Operation>{};
    ops.reserve(arr->size());
    for (std::size_t i = 0; i < arr->size(); ++i) {
        auto op = parse_operation((*arr)[i]);
        if (!op) {
            auto error = op.error();
            error.message = "operation " + std::to_string(i) + ": " + error.message;
            return std::unexpected(std::move(error));
        }
        ops.push_back(std::move(*op));
    }
    return ops;
}

auto to_value(const Operation& operation) -> Value {
    auto obj = Object{};
    obj.insert_or_assign("op", operation.op);
    if (operation.from) obj.insert_or_assign("from", *operation.from);
    if (operation.path) obj.insert_or_assign("path", *operation.path);
    if (operation.value) obj.insert_or_assign("value", *operation.value);
    return obj;
}

}  // namespace jsonpatch_cpp
