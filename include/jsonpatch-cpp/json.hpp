/// @file json.hpp
/// @brief nlohmann/json interoperability for jsonpatch-cpp.
///
/// Provides ADL serialization (to_json/from_json) for Value, Operation and
/// Error, conversion between documents and Value trees, and throwing
/// convenience wrappers that apply a JSON Patch given as nlohmann::json.

#pragma once

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonpatch_cpp {

// =============================================================================
// Exceptions
// =============================================================================

/// Thrown by the nlohmann/json convenience layer when the core reports an
/// Error. what() is Error::describe().
class PatchError : public std::runtime_error {
public:
    explicit PatchError(Error error)
        : std::runtime_error{error.describe()}, error_{std::move(error)} {}

    /// The structured error reported by the core.
    auto error() const -> const Error& { return error_; }
    auto kind() const -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Value ----------------------------------------------------------------------

void to_json(nlohmann::json& j, Null);
void to_json(nlohmann::json& j, const Value& v);
void from_json(const nlohmann::json& j, Value& v);

/// ordered_json keeps object members in document order; nlohmann::json
/// sorts them by key.
void to_json(nlohmann::ordered_json& j, const Value& v);
void from_json(const nlohmann::ordered_json& j, Value& v);

// -- Operation ------------------------------------------------------------------

/// Absent fields are omitted.
void to_json(nlohmann::json& j, const Operation& op);

/// @throws PatchError (invalid_patch / missing_required_field) if `j` is
/// not an operation object.
void from_json(const nlohmann::json& j, Operation& op);

// -- Errors ---------------------------------------------------------------------

void to_json(nlohmann::json& j, ErrorKind kind);

/// `{"kind": ..., "message": ..., "path": ..., "op": ...}`; empty context
/// fields are omitted.
void to_json(nlohmann::json& j, const Error& error);

// =============================================================================
// namespace jsonpatch_cpp::json — document-level helpers
// =============================================================================

namespace json {

/// Convert a JSON document into a Value tree.
///
/// Non-negative integers that fit in int64_t become int64_t, larger ones
/// uint64_t. Binary values are rejected with PatchError(invalid_patch).
auto import_json(const nlohmann::json& j) -> Value;
auto import_json(const nlohmann::ordered_json& j) -> Value;

/// Convert a Value tree into a JSON document.
auto export_json(const Value& v) -> nlohmann::json;

/// Convert a Value tree into a JSON document, keeping member order.
auto export_ordered_json(const Value& v) -> nlohmann::ordered_json;

/// Read a JSON Patch (an array of operation objects).
/// @throws PatchError if `patch` is not an array of operation objects.
auto parse_patch(const nlohmann::json& patch) -> std::vector<Operation>;

/// Apply an RFC 6902 JSON Patch to a JSON document.
///
/// `path` and `from` may also be query expressions (`$/items/*/price`).
/// The input document is not modified.
///
/// @code
/// auto out = jsonpatch_cpp::json::apply_json_patch(
///     R"({"a": [1, 2], "b": []})"_json,
///     R"([{"op": "move", "from": "/a/0", "path": "/b/-"}])"_json);
/// // {"a": [2], "b": [1]}
/// @endcode
/// @throws PatchError on an invalid patch or the first failing operation.
auto apply_json_patch(const nlohmann::json& document, const nlohmann::json& patch)
    -> nlohmann::json;

/// Evaluate a query against a JSON document.
/// @return The matching locations as pointer strings.
/// @throws PatchError if the query is malformed or cannot be walked.
auto query_json(const nlohmann::json& document, std::string_view query)
    -> std::vector<std::string>;

}  // namespace json

}  // namespace jsonpatch_cpp
