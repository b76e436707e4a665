#include <jsonpatch-cpp/query.hpp>

#include <string>
#include <utility>
#include <variant>

namespace jsonpatch_cpp {

namespace {

/// Depth-first evaluation state. `prefix` holds the concrete segments of
/// the branch being walked; matches are appended to `out`.
class QueryWalker {
public:
    QueryWalker(const Path& query, std::vector<Path>& out)
        : query_{query}, out_{out} {}

    auto run(const Value& root) -> Result<void> {
        return descend(root, 0);
    }

private:
    auto descend(const Value& node, std::size_t depth) -> Result<void> {
        if (depth == query_.size()) {
            out_.push_back(prefix_);
            return {};
        }

        const auto& segment = query_[depth];
        if (std::holds_alternative<Wildcard>(segment)) {
            return fan_out(node, depth);
        }

        // The last concrete segment names the target itself, which may not
        // exist yet (a new member, or '-').
        if (depth + 1 == query_.size()) {
            prefix_.push_back(segment);
            out_.push_back(prefix_);
            pop();
            return {};
        }

        auto child = narrow(node, segment);
        if (!child) return std::unexpected(child.error());
        prefix_.push_back(segment);
        auto result = descend(**child, depth + 1);
        pop();
        return result;
    }

    auto fan_out(const Value& node, std::size_t depth) -> Result<void> {
        if (const auto* obj = node.as_object()) {
            for (const auto& [key, child] : *obj) {
                prefix_.push_back(Key{key});
                auto result = descend(child, depth + 1);
                pop();
                if (!result) return result;
            }
        } else if (const auto* arr = node.as_array()) {
            for (std::size_t i = 0; i < arr->size(); ++i) {
                prefix_.push_back(Index{i});
                auto result = descend((*arr)[i], depth + 1);
                pop();
                if (!result) return result;
            }
        }
        // Scalars have no children: this branch contributes nothing.
        return {};
    }

    auto narrow(const Value& node, const Segment& segment) -> Result<const Value*> {
        auto here = prefix_;
        here.push_back(segment);
        const auto error_path = here.to_string();

        // Same rule as the resolver: on an object every concrete segment is
        // a member name.
        if (const auto* obj = node.as_object()) {
            if (auto name = member_name(segment)) {
                if (const auto* child = obj->find(*name)) return child;
                return make_error(ErrorKind::target_not_found, "no member '" + *name + "'", error_path);
            }
        }

        return std::visit(overload{
            [&](const Key& k) -> Result<const Value*> {
                return make_error(ErrorKind::invalid_path_segment,
                                  "cannot look up member '" + k.name + "' in "
                                      + std::string{to_string_view(node.kind())},
                                  error_path);
            },
            [&](const Index& i) -> Result<const Value*> {
                if (!node.is_array()) {
                    return make_error(ErrorKind::invalid_path_segment,
                                      "cannot index " + std::string{to_string_view(node.kind())},
                                      error_path);
                }
                if (const auto* child = node.get_index(i.value)) return child;
                return make_error(ErrorKind::target_not_found,
                                  "index " + std::to_string(i.value) + " is past the end of the array",
                                  error_path);
            },
            [&](const Append&) -> Result<const Value*> {
                if (!node.is_array()) {
                    return make_error(ErrorKind::invalid_path_segment,
                                      "cannot apply '-' to " + std::string{to_string_view(node.kind())},
                                      error_path);
                }
                return make_error(ErrorKind::target_not_found,
                                  "'-' does not address an existing element", error_path);
            },
            [&](const Wildcard&) -> Result<const Value*> {
                return make_error(ErrorKind::invalid_path, "unexpected wildcard", error_path);
            },
        }, segment);
    }

    void pop() { prefix_.pop_back(); }

    const Path& query_;
    std::vector<Path>& out_;
    Path prefix_{PathForm::pointer};
};

}  // anonymous namespace

auto query_paths(const Path& query, const Value& root) -> Result<std::vector<Path>> {
    auto out = std::vector<Path>{};
    auto walker = QueryWalker{query, out};
    if (auto ok = walker.run(root); !ok) return std::unexpected(ok.error());
    return out;
}

auto query_pointers(const Value& root, std::string_view query) -> Result<std::vector<std::string>> {
    auto parsed = parse_query(query);
    if (!parsed) return std::unexpected(parsed.error());
    auto paths = query_paths(*parsed, root);
    if (!paths) return std::unexpected(paths.error());

    auto out = std::vector<std::string>{};
    out.reserve(paths->size());
    for (const auto& p : *paths) {
        auto text = canonicalize(p);
        if (!text) return std::unexpected(text.error());
        out.push_back(std::move(*text));
    }
    return out;
}

auto expand_path(const Value& root, std::string_view expression) -> Result<std::vector<Path>> {
    if (is_query_expression(expression)) {
        auto parsed = parse_query(expression);
        if (!parsed) return std::unexpected(parsed.error());
        return query_paths(*parsed, root);
    }
    auto parsed = parse_pointer(expression);
    if (!parsed) return std::unexpected(parsed.error());
    return std::vector<Path>{std::move(*parsed)};
}

}  // namespace jsonpatch_cpp
