/// @file pointer.hpp
/// @brief The pointer resolver: get, exists, add, replace and remove on a
///        concrete Path.

#pragma once

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/path.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <string_view>

namespace jsonpatch_cpp::pointer {

/// Resolve a concrete path to the value it addresses.
///
/// On an object every segment names a member: an Index by its decimal
/// text, an Append as `"-"`. A Key applied to an array or scalar, or an
/// Index / Append applied to a scalar, fails with invalid_path_segment. A
/// missing member, an index
/// past the end, or an Append (which never addresses an existing element)
/// fails with target_not_found.
/// @return A pointer into `root`, valid until the tree is next mutated.
auto get(const Value& root, const Path& path) -> Result<const Value*>;
auto get(Value& root, const Path& path) -> Result<Value*>;

/// Same walk as get(), but never fails.
auto exists(const Value& root, const Path& path) -> bool;

/// Insert `value` at `path`.
///
/// The parent of the last segment must exist and be a container. In an
/// array the last segment is `-` (append) or an index in `[0, size]`
/// (insert, shifting later elements right); an index past `size` fails
/// with index_out_of_bounds and a key fails with invalid_index. In an
/// object the last segment names the member, as in get(); an existing
/// member is overwritten in place. The empty path replaces the whole document.
auto add(Value& root, const Path& path, Value value) -> Result<void>;

/// Overwrite the existing value at `path`; target_not_found if there is
/// none. The empty path replaces the whole document.
auto replace(Value& root, const Path& path, Value value) -> Result<void>;

/// Remove the existing value at `path`; target_not_found if there is none.
/// Array elements after it shift left. The root cannot be removed.
auto remove(Value& root, const Path& path) -> Result<void>;

// -- String conveniences --------------------------------------------------

/// Copy of the value at a pointer string.
/// @code
/// auto port = pointer::get_pointer(config, "/server/port");
/// @endcode
auto get_pointer(const Value& root, std::string_view pointer) -> Result<Value>;

/// add() at a pointer string.
auto put_pointer(Value& root, std::string_view pointer, Value value) -> Result<void>;

/// remove() at a pointer string.
auto delete_pointer(Value& root, std::string_view pointer) -> Result<void>;

}  // namespace jsonpatch_cpp::pointer
