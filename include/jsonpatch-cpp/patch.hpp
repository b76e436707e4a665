/// @file patch.hpp
/// @brief The patch interpreter: apply operations to a Value tree.

#pragma once

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <optional>
#include <span>
#include <vector>

namespace jsonpatch_cpp {

/// Apply one operation to a copy of `document`.
///
/// The `path` (and, for move / copy, `from`) expression may be a pointer or
/// a query; the operation runs once per concrete location the expression
/// resolves to, in query order. The first failing step aborts the call.
///
/// Targets and sources are expanded once, before anything changes, so
/// earlier steps can shift the indices later ones refer to. `remove
/// $/a/*` over `[1, 2, 3]` removes `1` and `3`, then fails with
/// target_not_found at `/a/2`; `move` from `$/a/*` behaves the same way.
///
/// @code
/// auto doc = Value{Object{{"a", Array{1, 2}}, {"b", Array{}}}};
/// auto moved = apply_operation(doc, Operation::move("/a/0", "/b/-"));
/// // *moved == {"a": [2], "b": [1]}, doc is unchanged
/// @endcode
/// @return The patched document, or the first error.
auto apply_operation(const Value& document, const Operation& operation) -> Result<Value>;

/// Apply `operations` in order to a copy of `document`, each one seeing the
/// result of the previous. An empty list yields an equal copy.
auto apply_patches(const Value& document, std::span<const Operation> operations) -> Result<Value>;

/// apply_patches() for callers that may hold no document or no patch.
/// @return nullopt if either argument is absent.
auto apply_patches(const std::optional<Value>& document,
                   const std::optional<std::vector<Operation>>& operations)
    -> Result<std::optional<Value>>;

/// Apply one operation directly to `document`.
///
/// Nothing is rolled back on failure: with a multi-target query the
/// targets handled before the failing one stay modified.
auto apply_in_place(Value& document, const Operation& operation) -> Result<void>;

/// Fold apply_in_place() over `operations`. On failure `document` holds
/// every operation that completed, plus whatever the failing operation had
/// already changed.
auto apply_all_in_place(Value& document, std::span<const Operation> operations) -> Result<void>;

}  // namespace jsonpatch_cpp
