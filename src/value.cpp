#include <jsonpatch-cpp/value.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace jsonpatch_cpp {

// =============================================================================
// Object
// =============================================================================

Object::Object() = default;
Object::Object(std::initializer_list<Entry> entries) {
    entries_.reserve(entries.size());
    for (const auto& [k, v] : entries) insert_or_assign(k, v);
}
Object::~Object() = default;

Object::Object(const Object&) = default;
Object::Object(Object&&) noexcept = default;
auto Object::operator=(const Object&) -> Object& = default;
auto Object::operator=(Object&&) noexcept -> Object& = default;

auto Object::size() const -> std::size_t { return entries_.size(); }
auto Object::empty() const -> bool { return entries_.empty(); }

auto Object::find(std::string_view key) -> Value* {
    auto it = std::ranges::find_if(entries_, [&](const Entry& e) { return e.first == key; });
    return it == entries_.end() ? nullptr : &it->second;
}

auto Object::find(std::string_view key) const -> const Value* {
    auto it = std::ranges::find_if(entries_, [&](const Entry& e) { return e.first == key; });
    return it == entries_.end() ? nullptr : &it->second;
}

auto Object::contains(std::string_view key) const -> bool {
    return find(key) != nullptr;
}

auto Object::insert_or_assign(std::string key, Value value) -> bool {
    if (auto* existing = find(key)) {
        *existing = std::move(value);
        return false;
    }
    entries_.emplace_back(std::move(key), std::move(value));
    return true;
}

auto Object::erase(std::string_view key) -> bool {
    auto it = std::ranges::find_if(entries_, [&](const Entry& e) { return e.first == key; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

auto Object::keys() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(entries_.size());
    for (const auto& [k, _] : entries_) result.push_back(k);
    return result;
}

auto Object::begin() -> iterator { return entries_.begin(); }
auto Object::end() -> iterator { return entries_.end(); }
auto Object::begin() const -> const_iterator { return entries_.begin(); }
auto Object::end() const -> const_iterator { return entries_.end(); }

auto operator==(const Object& a, const Object& b) -> bool {
    if (a.size() != b.size()) return false;
    return std::ranges::all_of(a.entries_, [&](const Object::Entry& e) {
        const auto* other = b.find(e.first);
        return other != nullptr && equals(e.second, *other);
    });
}

// =============================================================================
// Value
// =============================================================================

auto Value::kind() const -> ValueKind {
    return std::visit(overload{
        [](const Null&) { return ValueKind::null; },
        [](bool) { return ValueKind::boolean; },
        [](std::int64_t) { return ValueKind::number; },
        [](std::uint64_t) { return ValueKind::number; },
        [](double) { return ValueKind::number; },
        [](const std::string&) { return ValueKind::string; },
        [](const Array&) { return ValueKind::array; },
        [](const Object&) { return ValueKind::object; },
    }, data_);
}

auto Value::as_bool() const -> std::optional<bool> {
    if (const auto* b = get_if<bool>()) return *b;
    return std::nullopt;
}

auto Value::as_double() const -> std::optional<double> {
    if (const auto* i = get_if<std::int64_t>()) return static_cast<double>(*i);
    if (const auto* u = get_if<std::uint64_t>()) return static_cast<double>(*u);
    if (const auto* d = get_if<double>()) return *d;
    return std::nullopt;
}

auto Value::as_int64() const -> std::optional<std::int64_t> {
    if (const auto* i = get_if<std::int64_t>()) return *i;
    if (const auto* u = get_if<std::uint64_t>()) {
        if (*u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(*u);
    }
    if (const auto* d = get_if<double>()) {
        if (std::trunc(*d) != *d) return std::nullopt;
        if (*d < -9.2233720368547758e18 || *d >= 9.2233720368547758e18) return std::nullopt;
        return static_cast<std::int64_t>(*d);
    }
    return std::nullopt;
}

auto Value::get_key(std::string_view key) -> Value* {
    auto* obj = as_object();
    return obj ? obj->find(key) : nullptr;
}

auto Value::get_key(std::string_view key) const -> const Value* {
    const auto* obj = as_object();
    return obj ? obj->find(key) : nullptr;
}

auto Value::get_index(std::size_t index) -> Value* {
    auto* arr = as_array();
    if (!arr || index >= arr->size()) return nullptr;
    return &(*arr)[index];
}

auto Value::get_index(std::size_t index) const -> const Value* {
    const auto* arr = as_array();
    if (!arr || index >= arr->size()) return nullptr;
    return &(*arr)[index];
}

auto Value::size() const -> std::size_t {
    if (const auto* arr = as_array()) return arr->size();
    if (const auto* obj = as_object()) return obj->size();
    return 0;
}

auto operator==(const Value& a, const Value& b) -> bool {
    return equals(a, b);
}

// =============================================================================
// Deep equality
// =============================================================================

namespace {

auto numbers_equal(const Value& a, const Value& b) -> bool {
    const auto& sa = a.storage();
    const auto& sb = b.storage();
    // Exact comparisons first so large integers are not rounded through double.
    if (const auto* ia = std::get_if<std::int64_t>(&sa)) {
        if (const auto* ib = std::get_if<std::int64_t>(&sb)) return *ia == *ib;
        if (const auto* ub = std::get_if<std::uint64_t>(&sb)) {
            return *ia >= 0 && static_cast<std::uint64_t>(*ia) == *ub;
        }
    }
    if (const auto* ua = std::get_if<std::uint64_t>(&sa)) {
        if (const auto* ub = std::get_if<std::uint64_t>(&sb)) return *ua == *ub;
        if (const auto* ib = std::get_if<std::int64_t>(&sb)) {
            return *ib >= 0 && static_cast<std::uint64_t>(*ib) == *ua;
        }
    }
    return *a.as_double() == *b.as_double();
}

}  // anonymous namespace

auto equals(const Value& a, const Value& b) -> bool {
    if (a.kind() != b.kind()) return false;

    switch (a.kind()) {
        case ValueKind::null:
            return true;
        case ValueKind::boolean:
            return *a.get_if<bool>() == *b.get_if<bool>();
        case ValueKind::number:
            return numbers_equal(a, b);
        case ValueKind::string:
            return *a.as_string() == *b.as_string();
        case ValueKind::array: {
            const auto& xa = *a.as_array();
            const auto& xb = *b.as_array();
            return std::ranges::equal(xa, xb, [](const Value& l, const Value& r) {
                return equals(l, r);
            });
        }
        case ValueKind::object:
            return *a.as_object() == *b.as_object();
    }
    return false;
}

}  // namespace jsonpatch_cpp
