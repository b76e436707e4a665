/// @file operation.hpp
/// @brief Patch operation objects and the OpKind discriminator.

#pragma once

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsonpatch_cpp {

/// The six patch operations.
enum class OpKind : std::uint8_t {
    add,
    remove,
    replace,
    move,
    copy,
    test,
};

/// Convert an OpKind to its `op` string.
constexpr auto to_string_view(OpKind kind) noexcept -> std::string_view {
    switch (kind) {
        case OpKind::add:     return "add";
        case OpKind::remove:  return "remove";
        case OpKind::replace: return "replace";
        case OpKind::move:    return "move";
        case OpKind::copy:    return "copy";
        case OpKind::test:    return "test";
    }
    return "unknown";
}

/// Map an `op` string to its OpKind, or nullopt if it names no operation.
constexpr auto parse_op_kind(std::string_view op) noexcept -> std::optional<OpKind> {
    if (op == "add")     return OpKind::add;
    if (op == "remove")  return OpKind::remove;
    if (op == "replace") return OpKind::replace;
    if (op == "move")    return OpKind::move;
    if (op == "copy")    return OpKind::copy;
    if (op == "test")    return OpKind::test;
    return std::nullopt;
}

/// One patch operation, as it appears in a patch document.
///
/// The fields are loosely typed. An operation is validated when it is
/// applied, so an unknown `op` or a missing `path` surfaces as a structured
/// error from apply_operation(). An absent `value` (nullopt) is distinct
/// from a null value.
///
/// @code
/// auto ops = std::vector<Operation>{
///     Operation::add("/tags/-", "new"),
///     Operation::test("/version", 3),
///     Operation::move("/draft", "/published"),
/// };
/// @endcode
struct Operation {
    std::string op;                   ///< "add", "remove", ...
    std::optional<std::string> path;  ///< Target expression (pointer or query).
    std::optional<std::string> from;  ///< Source expression for move / copy.
    std::optional<Value> value;       ///< Operand for add / replace / test.

    static auto add(std::string path, Value value) -> Operation;
    static auto remove(std::string path) -> Operation;
    static auto replace(std::string path, Value value) -> Operation;
    static auto move(std::string from, std::string path) -> Operation;
    static auto copy(std::string from, std::string path) -> Operation;
    static auto test(std::string path, Value value) -> Operation;

    /// The parsed discriminator, or nullopt for an unknown `op`.
    auto kind() const -> std::optional<OpKind> { return parse_op_kind(op); }

    auto operator==(const Operation&) const -> bool = default;
};

/// Read one operation out of an object value with `op`, `path`, `from` and
/// `value` members.
///
/// Fails with invalid_patch if `operation` is not an object or if `op`,
/// `path` or `from` is present but not a string, and with
/// missing_required_field if `op` is absent. Whether `op` names a known
/// operation, and whether the fields it needs are present, is checked by
/// apply_operation().
auto parse_operation(const Value& operation) -> Result<Operation>;

/// Read every operation out of an array value.
auto parse_operations(const Value& patch) -> Result<std::vector<Operation>>;

/// The object form of an operation; absent fields are omitted.
auto to_value(const Operation& operation) -> Value;

}  // namespace jsonpatch_cpp
