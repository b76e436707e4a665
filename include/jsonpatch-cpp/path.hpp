/// @file path.hpp
/// @brief Path segments, the Path type, and the pointer / query parsers.

#pragma once

#include <jsonpatch-cpp/error.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jsonpatch_cpp {

/// An object member name, stored decoded.
struct Key {
    std::string name;

    auto operator<=>(const Key&) const = default;
    auto operator==(const Key&) const -> bool = default;
};

/// A concrete array position.
struct Index {
    std::size_t value{0};

    auto operator<=>(const Index&) const = default;
    auto operator==(const Index&) const -> bool = default;
};

/// The array-append marker `-`. Only meaningful as the last segment of an
/// insertion target; it never resolves for reading.
struct Append {
    auto operator<=>(const Append&) const = default;
    auto operator==(const Append&) const -> bool = default;
};

/// The query wildcard `*`: every member of an object, every element of an
/// array. Never part of a concrete path.
struct Wildcard {
    auto operator<=>(const Wildcard&) const = default;
    auto operator==(const Wildcard&) const -> bool = default;
};

/// One step of a path.
using Segment = std::variant<Key, Index, Append, Wildcard>;

/// The object member a segment selects when the node it is applied to is an
/// object: the key itself, the decimal text of an Index, or `-` for Append.
/// std::nullopt for a Wildcard.
///
/// Pointer text cannot tell a member named `"0"` from array position 0, so
/// the resolver uses this to let both spellings reach the member.
auto member_name(const Segment& segment) -> std::optional<std::string>;

/// True if two segments take the same step: equal segments, or a Key whose
/// name is the member_name() of the other segment.
auto same_step(const Segment& a, const Segment& b) -> bool;

/// Which syntax a Path was parsed from.
enum class PathForm : std::uint8_t {
    pointer,  ///< `/a/0/b`: addresses at most one location.
    query,    ///< `$/a/*/b`: addresses zero or more locations.
};

/// Convert a PathForm to its string representation.
constexpr auto to_string_view(PathForm form) noexcept -> std::string_view {
    switch (form) {
        case PathForm::pointer: return "pointer";
        case PathForm::query:   return "query";
    }
    return "unknown";
}

/// An ordered sequence of segments, plus the syntax it came from.
///
/// An empty Path addresses the document root. A pointer-form Path never
/// contains a Wildcard.
class Path {
public:
    Path() = default;
    explicit Path(PathForm form) : form_{form} {}
    Path(std::initializer_list<Segment> segments, PathForm form = PathForm::pointer)
        : segments_{segments}, form_{form} {}

    auto form() const -> PathForm { return form_; }
    auto segments() const -> const std::vector<Segment>& { return segments_; }

    auto size() const -> std::size_t { return segments_.size(); }
    auto empty() const -> bool { return segments_.empty(); }
    auto is_root() const -> bool { return segments_.empty(); }

    auto operator[](std::size_t i) const -> const Segment& { return segments_[i]; }
    auto back() const -> const Segment& { return segments_.back(); }
    auto begin() const { return segments_.begin(); }
    auto end() const { return segments_.end(); }

    void push_back(Segment segment) { segments_.push_back(std::move(segment)); }
    void pop_back() { segments_.pop_back(); }

    /// True if no segment is a Wildcard.
    auto is_concrete() const -> bool;

    /// The path without its last segment. The parent of the root is the root.
    auto parent() const -> Path;

    /// True if `prefix` is a (not necessarily proper) prefix of this path,
    /// comparing segments with same_step().
    auto starts_with(const Path& prefix) const -> bool;

    /// A pointer-form copy of this path.
    auto as_pointer() const -> Path;

    /// Display form: `$/a/*` for queries, `/a/0` for pointers, `""` for the
    /// root pointer. Unlike canonicalize() this never fails.
    auto to_string() const -> std::string;

    /// Segment-wise equality under same_step(), so `Key{"0"}` equals
    /// `Index{0}`. The form is not compared.
    auto operator==(const Path& other) const -> bool;

private:
    std::vector<Segment> segments_;
    PathForm form_{PathForm::pointer};
};

/// Parse a pointer expression.
///
/// `""` is the root. Any other pointer starts with `/`; each segment is
/// tilde-decoded (`~1` -> `/`, `~0` -> `~`) and then percent-decoded. A
/// decoded `-` becomes Append, an all-digit segment becomes Index, anything
/// else a Key. Empty segments are rejected.
///
/// @code
/// auto p = parse_pointer("/users/0/first~1last");
/// // Key{"users"}, Index{0}, Key{"first/last"}
/// @endcode
auto parse_pointer(std::string_view pointer) -> Result<Path>;

/// Parse a query expression: `$`, or `$` followed by a pointer whose
/// segments may also be the wildcard `*`.
auto parse_query(std::string_view query) -> Result<Path>;

/// Parse either syntax, choosing the query parser when the expression
/// starts with `$`.
auto parse_path(std::string_view expression) -> Result<Path>;

/// True if the expression uses query syntax.
constexpr auto is_query_expression(std::string_view expression) noexcept -> bool {
    return !expression.empty() && expression.front() == '$';
}

/// Render a concrete Path as a pointer string that parse_pointer() maps
/// back to an equal Path. A Key spelled like an index (`"0"`, `"-"`) comes
/// back as Index or Append, which the resolver applies to an object as the
/// same member. Fails with invalid_path on a Wildcard.
auto canonicalize(const Path& path) -> Result<std::string>;

/// Escape one key for use inside a pointer (`~` -> `~0`, `/` -> `~1`,
/// `%` -> `%25`).
auto escape_key(std::string_view key) -> std::string;

}  // namespace jsonpatch_cpp
