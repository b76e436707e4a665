/// @file query.hpp
/// @brief The query evaluator: expand a query Path into concrete Paths.

#pragma once

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/path.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace jsonpatch_cpp {

/// Evaluate a query against the current state of `root`.
///
/// The segments are walked depth-first. A Wildcard fans out over every
/// member of an object (in stored order) or every index of an array
/// (ascending); on a scalar it yields no matches. Any other segment narrows
/// to a single child and fails like pointer::get() when that child is
/// missing, except for the last segment, which is emitted without an
/// existence check so the result can name a location to create. Its parent
/// is not checked either: `$/a/*/k` over `[1, {}]` yields `/a/0/k`, and an
/// add there fails later with target_not_found.
///
/// On an object, an Index or Append segment narrows to the member spelled
/// the same way (see member_name()).
///
/// A query with no wildcard yields exactly one path, the same one
/// parse_pointer() would have produced.
///
/// @code
/// auto doc = Value{Object{{"a", Array{10, 20, 30}}}};
/// auto paths = query_paths(*parse_query("$/a/*"), doc);
/// // /a/0, /a/1, /a/2
/// @endcode
/// @return Concrete pointer-form paths in depth-first, left-to-right order.
auto query_paths(const Path& query, const Value& root) -> Result<std::vector<Path>>;

/// Parse and evaluate a query, returning the canonical pointer strings.
auto query_pointers(const Value& root, std::string_view query) -> Result<std::vector<std::string>>;

/// Turn a path expression into the concrete paths it addresses.
///
/// A pointer expression yields itself. A query expression (leading `$`) is
/// evaluated against `root`.
auto expand_path(const Value& root, std::string_view expression) -> Result<std::vector<Path>>;

}  // namespace jsonpatch_cpp
