/// @file error.hpp
/// @brief Error types and the Result alias for the jsonpatch-cpp library.

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace jsonpatch_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_path,            ///< A path or query string is malformed or empty.
    missing_required_field,  ///< `path`, `from` or `value` is absent but required.
    unsupported_operation,   ///< The `op` discriminator is not a known operation.
    target_not_found,        ///< The addressed location (or its parent) does not exist.
    invalid_path_segment,    ///< A key applied to a non-object, or an index to a non-array.
    index_out_of_bounds,     ///< A numeric array index is outside the valid range.
    invalid_index,           ///< A non-numeric segment used where an array index is required.
    test_failed,             ///< A `test` operation found a different value.
    invalid_patch,           ///< A patch document is not shaped like a list of operations.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_path:           return "invalid_path";
        case ErrorKind::missing_required_field: return "missing_required_field";
        case ErrorKind::unsupported_operation:  return "unsupported_operation";
        case ErrorKind::target_not_found:       return "target_not_found";
        case ErrorKind::invalid_path_segment:   return "invalid_path_segment";
        case ErrorKind::index_out_of_bounds:    return "index_out_of_bounds";
        case ErrorKind::invalid_index:          return "invalid_index";
        case ErrorKind::test_failed:            return "test_failed";
        case ErrorKind::invalid_patch:          return "invalid_patch";
    }
    return "unknown";
}

/// A structured error with a category, a human-readable message and
/// the context it was raised in.
struct Error {
    ErrorKind kind;       ///< The category of this error.
    std::string message;  ///< A human-readable description.
    std::string path;     ///< The offending path expression, if any.
    std::string op;       ///< The patch operation being applied, if any.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    /// Construct an Error that names the offending path.
    Error(ErrorKind k, std::string msg, std::string p)
        : kind{k}, message{std::move(msg)}, path{std::move(p)} {}

    auto operator==(const Error& other) const -> bool = default;

    /// Render the error as a single line, e.g.
    /// `target_not_found: no member 'x' (op 'remove', path '/x')`.
    auto describe() const -> std::string {
        auto out = std::string{to_string_view(kind)};
        out += ": ";
        out += message;
        if (!op.empty() || !path.empty()) {
            out += " (";
            if (!op.empty()) {
                out += "op '" + op + "'";
                if (!path.empty()) out += ", ";
            }
            if (!path.empty()) out += "path '" + path + "'";
            out += ")";
        }
        return out;
    }
};

/// The return type of every fallible operation in the library.
template <typename T>
using Result = std::expected<T, Error>;

/// Shorthand for building the error side of a Result.
inline auto make_error(ErrorKind kind, std::string message, std::string path = {})
    -> std::unexpected<Error> {
    return std::unexpected<Error>{Error{kind, std::move(message), std::move(path)}};
}

}  // namespace jsonpatch_cpp
