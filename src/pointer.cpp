#include <jsonpatch-cpp/pointer.hpp>

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace jsonpatch_cpp::pointer {

namespace {

auto describe_kind(const Value& v) -> std::string {
    return std::string{to_string_view(v.kind())};
}

/// Step from `node` into the child named by `segment`. On an object, an
/// Index or Append selects the member spelled the same way.
/// V is Value or const Value.
template <typename V>
auto step(V& node, const Segment& segment, const Path& path) -> Result<V*> {
    if (auto* obj = node.as_object()) {
        if (auto name = member_name(segment)) {
            auto* child = obj->find(*name);
            if (!child) {
                return make_error(ErrorKind::target_not_found,
                                  "no member '" + *name + "'", path.to_string());
            }
            return child;
        }
    }

    return std::visit(overload{
        [&](const Key& k) -> Result<V*> {
            return make_error(ErrorKind::invalid_path_segment,
                              "cannot look up member '" + k.name + "' in " + describe_kind(node),
                              path.to_string());
        },
        [&](const Index& i) -> Result<V*> {
            auto* arr = node.as_array();
            if (!arr) {
                return make_error(ErrorKind::invalid_path_segment,
                                  "cannot index " + describe_kind(node) + " with " + std::to_string(i.value),
                                  path.to_string());
            }
            if (i.value >= arr->size()) {
                return make_error(ErrorKind::target_not_found,
                                  "index " + std::to_string(i.value) + " is past the end of an array of size "
                                      + std::to_string(arr->size()),
                                  path.to_string());
            }
            return &(*arr)[i.value];
        },
        [&](const Append&) -> Result<V*> {
            if (!node.is_array()) {
                return make_error(ErrorKind::invalid_path_segment,
                                  "cannot apply '-' to " + describe_kind(node), path.to_string());
            }
            return make_error(ErrorKind::target_not_found,
                              "'-' does not address an existing element", path.to_string());
        },
        [&](const Wildcard&) -> Result<V*> {
            return make_error(ErrorKind::invalid_path,
                              "'*' is only valid in a query", path.to_string());
        },
    }, segment);
}

/// Walk the first `count` segments of `path`.
template <typename V>
auto walk(V& root, const Path& path, std::size_t count) -> Result<V*> {
    auto* current = &root;
    for (std::size_t i = 0; i < count; ++i) {
        auto next = step(*current, path[i], path);
        if (!next) return std::unexpected(next.error());
        current = *next;
    }
    return current;
}

auto require_concrete(const Path& path) -> Result<void> {
    if (!path.is_concrete()) {
        return make_error(ErrorKind::invalid_path, "'*' is only valid in a query", path.to_string());
    }
    return {};
}

auto insert_into_array(Array& arr, const Segment& last, const Path& path, Value value) -> Result<void> {
    return std::visit(overload{
        [&](const Append&) -> Result<void> {
            arr.push_back(std::move(value));
            return {};
        },
        [&](const Index& i) -> Result<void> {
            if (i.value > arr.size()) {
                return make_error(ErrorKind::index_out_of_bounds,
                                  "index " + std::to_string(i.value) + " is outside [0, "
                                      + std::to_string(arr.size()) + "]",
                                  path.to_string());
            }
            arr.insert(arr.begin() + static_cast<std::ptrdiff_t>(i.value), std::move(value));
            return {};
        },
        [&](const Key& k) -> Result<void> {
            return make_error(ErrorKind::invalid_index,
                              "'" + k.name + "' is not an array index", path.to_string());
        },
        [&](const Wildcard&) -> Result<void> {
            return make_error(ErrorKind::invalid_path, "'*' is only valid in a query", path.to_string());
        },
    }, last);
}

auto insert_into_object(Object& obj, const Segment& last, const Path& path, Value value) -> Result<void> {
    auto name = member_name(last);
    if (!name) {
        return make_error(ErrorKind::invalid_path, "'*' is only valid in a query", path.to_string());
    }
    obj.insert_or_assign(std::move(*name), std::move(value));
    return {};
}

}  // anonymous namespace

auto get(const Value& root, const Path& path) -> Result<const Value*> {
    return walk(root, path, path.size());
}

auto get(Value& root, const Path& path) -> Result<Value*> {
    return walk(root, path, path.size());
}

auto exists(const Value& root, const Path& path) -> bool {
    return get(root, path).has_value();
}

auto add(Value& root, const Path& path, Value value) -> Result<void> {
    if (auto ok = require_concrete(path); !ok) return ok;
    if (path.is_root()) {
        root = std::move(value);
        return {};
    }

    auto parent = walk(root, path, path.size() - 1);
    if (!parent) return std::unexpected(parent.error());

    if (auto* arr = (*parent)->as_array()) {
        return insert_into_array(*arr, path.back(), path, std::move(value));
    }
    if (auto* obj = (*parent)->as_object()) {
        return insert_into_object(*obj, path.back(), path, std::move(value));
    }
    return make_error(ErrorKind::target_not_found,
                      "parent is " + describe_kind(**parent) + ", not a container",
                      path.to_string());
}

auto replace(Value& root, const Path& path, Value value) -> Result<void> {
    if (auto ok = require_concrete(path); !ok) return ok;
    auto target = get(root, path);
    if (!target) {
        return make_error(ErrorKind::target_not_found,
                          "nothing to replace: " + target.error().message, path.to_string());
    }
    **target = std::move(value);
    return {};
}

auto remove(Value& root, const Path& path) -> Result<void> {
    if (auto ok = require_concrete(path); !ok) return ok;
    if (path.is_root()) {
        return make_error(ErrorKind::invalid_path, "the document root cannot be removed", "");
    }
    if (auto target = get(root, path); !target) {
        return make_error(ErrorKind::target_not_found,
                          "nothing to remove: " + target.error().message, path.to_string());
    }

    // The target exists, so the parent is a container of the matching kind.
    auto parent = walk(root, path, path.size() - 1);
    if (!parent) return std::unexpected(parent.error());

    if (auto* arr = (*parent)->as_array()) {
        const auto index = std::get<Index>(path.back()).value;
        arr->erase(arr->begin() + static_cast<std::ptrdiff_t>(index));
    } else if (auto* obj = (*parent)->as_object()) {
        obj->erase(*member_name(path.back()));
    }
    return {};
}

// -- String conveniences ------------------------------------------------------

auto get_pointer(const Value& root, std::string_view pointer) -> Result<Value> {
    auto path = parse_pointer(pointer);
    if (!path) return std::unexpected(path.error());
    auto target = get(root, *path);
    if (!target) return std::unexpected(target.error());
    return **target;
}

auto put_pointer(Value& root, std::string_view pointer, Value value) -> Result<void> {
    auto path = parse_pointer(pointer);
    if (!path) return std::unexpected(path.error());
    return add(root, *path, std::move(value));
}

auto delete_pointer(Value& root, std::string_view pointer) -> Result<void> {
    auto path = parse_pointer(pointer);
    if (!path) return std::unexpected(path.error());
    return remove(root, *path);
}

}  // namespace jsonpatch_cpp::pointer
