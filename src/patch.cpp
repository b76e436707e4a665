#include <jsonpatch-cpp/patch.hpp>
#include <jsonpatch-cpp/pointer.hpp>
#include <jsonpatch-cpp/query.hpp>

#include <string>
#include <utility>

namespace jsonpatch_cpp {

namespace {

auto missing_field(std::string_view field, const Operation& operation) -> std::unexpected<Error> {
    return make_error(ErrorKind::missing_required_field,
                      "'" + operation.op + "' requires a '" + std::string{field} + "' member",
                      operation.path.value_or(""));
}

auto apply_add(Value& document, const std::vector<Path>& targets, const Value& value) -> Result<void> {
    for (const auto& target : targets) {
        if (auto ok = pointer::add(document, target, value); !ok) return ok;
    }
    return {};
}

auto apply_remove(Value& document, const std::vector<Path>& targets) -> Result<void> {
    for (const auto& target : targets) {
        if (auto ok = pointer::remove(document, target); !ok) return ok;
    }
    return {};
}

auto apply_replace(Value& document, const std::vector<Path>& targets, const Value& value) -> Result<void> {
    for (const auto& target : targets) {
        if (auto ok = pointer::replace(document, target, value); !ok) return ok;
    }
    return {};
}

auto apply_test(const Value& document, const std::vector<Path>& targets, const Value& expected)
    -> Result<void> {
    for (const auto& target : targets) {
        auto actual = pointer::get(document, target);
        if (!actual) {
            return make_error(ErrorKind::target_not_found,
                              "nothing to test: " + actual.error().message, target.to_string());
        }
        if (!equals(**actual, expected)) {
            return make_error(ErrorKind::test_failed,
                              "value differs from the expected value", target.to_string());
        }
    }
    return {};
}

/// move and copy. Every source feeds every target, sources in order.
auto apply_transfer(Value& document, const std::vector<Path>& sources,
                    const std::vector<Path>& targets, bool remove_source) -> Result<void> {
    for (const auto& source : sources) {
        auto found = pointer::get(document, source);
        if (!found) {
            return make_error(ErrorKind::target_not_found,
                              "nothing at source: " + found.error().message, source.to_string());
        }
        auto value = **found;

        if (remove_source) {
            for (const auto& target : targets) {
                if (target.size() > source.size() && target.starts_with(source)) {
                    return make_error(ErrorKind::invalid_path,
                                      "cannot move a value into one of its own children",
                                      target.to_string());
                }
            }
            if (auto ok = pointer::remove(document, source); !ok) return ok;
        }

        if (auto ok = apply_add(document, targets, value); !ok) return ok;
    }
    return {};
}

auto dispatch(Value& document, const Operation& operation) -> Result<void> {
    const auto kind = operation.kind();
    if (!kind) {
        return make_error(ErrorKind::unsupported_operation,
                          "unknown operation '" + operation.op + "'", operation.path.value_or(""));
    }
    if (!operation.path) return missing_field("path", operation);

    const auto needs_value = *kind == OpKind::add || *kind == OpKind::replace || *kind == OpKind::test;
    const auto needs_from = *kind == OpKind::move || *kind == OpKind::copy;
    if (needs_value && !operation.value) return missing_field("value", operation);
    if (needs_from && !operation.from) return missing_field("from", operation);

    // Sources are resolved before targets, both against the tree as it is
    // before this operation changes anything.
    auto sources = std::vector<Path>{};
    if (needs_from) {
        auto expanded = expand_path(document, *operation.from);
        if (!expanded) return std::unexpected(expanded.error());
        sources = std::move(*expanded);
    }
    auto targets = expand_path(document, *operation.path);
    if (!targets) return std::unexpected(targets.error());

    switch (*kind) {
        case OpKind::add:     return apply_add(document, *targets, *operation.value);
        case OpKind::remove:  return apply_remove(document, *targets);
        case OpKind::replace: return apply_replace(document, *targets, *operation.value);
        case OpKind::move:    return apply_transfer(document, sources, *targets, true);
        case OpKind::copy:    return apply_transfer(document, sources, *targets, false);
        case OpKind::test:    return apply_test(document, *targets, *operation.value);
    }
    return {};
}

}  // anonymous namespace

auto apply_in_place(Value& document, const Operation& operation) -> Result<void> {
    auto result = dispatch(document, operation);
    if (!result) {
        auto error = std::move(result.error());
        error.op = operation.op;
        return std::unexpected(std::move(error));
    }
    return {};
}

auto apply_all_in_place(Value& document, std::span<const Operation> operations) -> Result<void> {
    for (const auto& operation : operations) {
        if (auto ok = apply_in_place(document, operation); !ok) return ok;
    }
    return {};
}

auto apply_operation(const Value& document, const Operation& operation) -> Result<Value> {
    auto result = document;
    if (auto ok = apply_in_place(result, operation); !ok) return std::unexpected(ok.error());
    return result;
}

auto apply_patches(const Value& document, std::span<const Operation> operations) -> Result<Value> {
    auto result = document;
    if (auto ok = apply_all_in_place(result, operations); !ok) return std::unexpected(ok.error());
    return result;
}

auto apply_patches(const std::optional<Value>& document,
                   const std::optional<std::vector<Operation>>& operations)
    -> Result<std::optional<Value>> {
    if (!document || !operations) return std::optional<Value>{};
    auto result = apply_patches(*document, std::span<const Operation>{*operations});
    if (!result) return std::unexpected(result.error());
    return std::optional<Value>{std::move(*result)};
}

}  // namespace jsonpatch_cpp
