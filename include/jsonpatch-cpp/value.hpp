/// @file value.hpp
/// @brief The Value tree: Null, Array, Object, Value and ValueKind.

#pragma once

#include <compare>
#include <concepts>
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

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

class Value;

/// An ordered sequence of values.
using Array = std::vector<Value>;

/// A string-keyed mapping that preserves insertion order.
///
/// Keys are unique. Assigning to an existing key overwrites the value in
/// place, so the key keeps its original position. Lookup is linear, which
/// suits the small objects found in typical documents.
class Object {
public:
    using Entry = std::pair<std::string, Value>;
    using iterator = std::vector<Entry>::iterator;
    using const_iterator = std::vector<Entry>::const_iterator;

    Object();
    Object(std::initializer_list<Entry> entries);
    ~Object();

    Object(const Object&);
    Object(Object&&) noexcept;
    auto operator=(const Object&) -> Object&;
    auto operator=(Object&&) noexcept -> Object&;

    auto size() const -> std::size_t;
    auto empty() const -> bool;

    /// Find the value stored under a key.
    /// @return A pointer to the value, or nullptr if the key is missing.
    auto find(std::string_view key) -> Value*;
    auto find(std::string_view key) const -> const Value*;

    auto contains(std::string_view key) const -> bool;

    /// Insert a new member, or overwrite the existing one in place.
    /// @return true if a new member was appended.
    auto insert_or_assign(std::string key, Value value) -> bool;

    /// Erase a member.
    /// @return true if the key was present.
    auto erase(std::string_view key) -> bool;

    /// The keys in insertion order.
    auto keys() const -> std::vector<std::string>;

    auto begin() -> iterator;
    auto end() -> iterator;
    auto begin() const -> const_iterator;
    auto end() const -> const_iterator;

    /// Deep, order-insensitive equality.
    friend auto operator==(const Object& a, const Object& b) -> bool;

private:
    std::vector<Entry> entries_;
};

/// The six kinds of value a tree node can hold.
enum class ValueKind : std::uint8_t {
    null,
    boolean,
    number,
    string,
    array,
    object,
};

/// Convert a ValueKind to its string representation.
constexpr auto to_string_view(ValueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ValueKind::null:    return "null";
        case ValueKind::boolean: return "boolean";
        case ValueKind::number:  return "number";
        case ValueKind::string:  return "string";
        case ValueKind::array:   return "array";
        case ValueKind::object:  return "object";
    }
    return "unknown";
}

/// A node of a JSON-like document tree.
///
/// Value is a tagged union over null, bool, the three number
/// representations (int64_t, uint64_t, double), string, Array and Object.
/// It has value semantics: copying a Value copies the whole subtree, so
/// two values never share children.
///
/// All accessors are total. Asking for the wrong alternative returns
/// nullptr (or nullopt) instead of throwing.
///
/// @code
/// auto doc = Value{Object{
///     {"name", "Alice"},
///     {"tags", Array{"admin", "ops"}},
/// }};
/// if (const auto* tags = doc.get_key("tags")) {
///     std::printf("%zu tags\n", tags->size());
/// }
/// @endcode
class Value {
public:
    using Storage = std::variant<
        Null,
        bool,
        std::int64_t,
        std::uint64_t,
        double,
        std::string,
        Array,
        Object
    >;

    /// Construct a null value.
    Value() = default;

    Value(std::nullptr_t) {}
    Value(Null) {}
    Value(bool b) : data_{b} {}

    template <std::signed_integral T>
        requires (!std::same_as<T, bool>)
    Value(T i) : data_{static_cast<std::int64_t>(i)} {}

    template <std::unsigned_integral T>
        requires (!std::same_as<T, bool>)
    Value(T u) : data_{static_cast<std::uint64_t>(u)} {}

    template <std::floating_point T>
    Value(T d) : data_{static_cast<double>(d)} {}

    Value(const char* s) : data_{std::string{s}} {}
    Value(std::string s) : data_{std::move(s)} {}
    Value(std::string_view s) : data_{std::string{s}} {}
    Value(Array a) : data_{std::move(a)} {}
    Value(Object o) : data_{std::move(o)} {}

    // -- Kind -----------------------------------------------------------------

    auto kind() const -> ValueKind;

    auto is_null() const -> bool { return std::holds_alternative<Null>(data_); }
    auto is_bool() const -> bool { return std::holds_alternative<bool>(data_); }
    auto is_number() const -> bool { return kind() == ValueKind::number; }
    auto is_string() const -> bool { return std::holds_alternative<std::string>(data_); }
    auto is_array() const -> bool { return std::holds_alternative<Array>(data_); }
    auto is_object() const -> bool { return std::holds_alternative<Object>(data_); }

    /// True for arrays and objects.
    auto is_container() const -> bool { return is_array() || is_object(); }

    // -- Typed access ---------------------------------------------------------

    /// Pointer to the alternative T, or nullptr on mismatch.
    template <typename T>
    auto get_if() -> T* { return std::get_if<T>(&data_); }

    template <typename T>
    auto get_if() const -> const T* { return std::get_if<T>(&data_); }

    auto as_bool() const -> std::optional<bool>;
    auto as_string() const -> const std::string* { return get_if<std::string>(); }
    auto as_array() -> Array* { return get_if<Array>(); }
    auto as_array() const -> const Array* { return get_if<Array>(); }
    auto as_object() -> Object* { return get_if<Object>(); }
    auto as_object() const -> const Object* { return get_if<Object>(); }

    /// Any of the three number representations widened to double.
    auto as_double() const -> std::optional<double>;

    /// The number as int64_t, if it is integral and in range.
    auto as_int64() const -> std::optional<std::int64_t>;

    // -- Children -------------------------------------------------------------

    /// The member stored under `key`, or nullptr if this is not an object
    /// or the key is missing.
    auto get_key(std::string_view key) -> Value*;
    auto get_key(std::string_view key) const -> const Value*;

    /// The element at `index`, or nullptr if this is not an array or the
    /// index is out of range.
    auto get_index(std::size_t index) -> Value*;
    auto get_index(std::size_t index) const -> const Value*;

    /// Number of children of a container, 0 for scalars.
    auto size() const -> std::size_t;

    auto storage() const -> const Storage& { return data_; }

    /// Deep structural equality, see equals().
    friend auto operator==(const Value& a, const Value& b) -> bool;

private:
    Storage data_;
};

/// Deep structural equality.
///
/// Objects compare member-wise regardless of key order. Numbers compare by
/// numeric value, so `Value{1} == Value{1u} == Value{1.0}`.
auto equals(const Value& a, const Value& b) -> bool;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { std::printf("%s\n", s.c_str()); },
///     [](const Array& a) { std::printf("[%zu]\n", a.size()); },
///     [](const auto&) { std::printf("other\n"); },
/// }, value.storage());
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace jsonpatch_cpp
