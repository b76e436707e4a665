#include <jsonpatch-cpp/path.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace jsonpatch_cpp {

// =============================================================================
// Segments
// =============================================================================

auto member_name(const Segment& segment) -> std::optional<std::string> {
    return std::visit(overload{
        [](const Key& k) -> std::optional<std::string> { return k.name; },
        [](const Index& i) -> std::optional<std::string> { return std::to_string(i.value); },
        [](const Append&) -> std::optional<std::string> { return std::string{"-"}; },
        [](const Wildcard&) -> std::optional<std::string> { return std::nullopt; },
    }, segment);
}

auto same_step(const Segment& a, const Segment& b) -> bool {
    if (a == b) return true;
    if (!std::holds_alternative<Key>(a) && !std::holds_alternative<Key>(b)) return false;
    auto lhs = member_name(a);
    auto rhs = member_name(b);
    return lhs && rhs && *lhs == *rhs;
}

// =============================================================================
// Path
// =============================================================================

auto Path::is_concrete() const -> bool {
    return std::ranges::none_of(segments_, [](const Segment& s) {
        return std::holds_alternative<Wildcard>(s);
    });
}

auto Path::parent() const -> Path {
    auto result = Path{form_};
    if (segments_.empty()) return result;
    result.segments_.assign(segments_.begin(), segments_.end() - 1);
    return result;
}

auto Path::starts_with(const Path& prefix) const -> bool {
    if (prefix.size() > size()) return false;
    return std::equal(prefix.segments_.begin(), prefix.segments_.end(), segments_.begin(), same_step);
}

auto Path::operator==(const Path& other) const -> bool {
    return std::ranges::equal(segments_, other.segments_, same_step);
}

auto Path::as_pointer() const -> Path {
    auto result = *this;
    result.form_ = PathForm::pointer;
    return result;
}

auto Path::to_string() const -> std::string {
    auto out = std::string{form_ == PathForm::query ? "$" : ""};
    for (const auto& segment : segments_) {
        out += '/';
        std::visit(overload{
            [&](const Key& k) { out += escape_key(k.name); },
            [&](const Index& i) { out += std::to_string(i.value); },
            [&](const Append&) { out += '-'; },
            [&](const Wildcard&) { out += '*'; },
        }, segment);
    }
    return out;
}

// =============================================================================
// Parsing
// =============================================================================

namespace {

auto hex_digit(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/// Undo `~1` and `~0`. Any other use of `~` is malformed.
auto decode_tildes(std::string_view raw, std::string_view expression) -> Result<std::string> {
    auto out = std::string{};
    out.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] != '~') {
            out += raw[i];
            continue;
        }
        if (i + 1 < raw.size() && raw[i + 1] == '1') {
            out += '/';
        } else if (i + 1 < raw.size() && raw[i + 1] == '0') {
            out += '~';
        } else {
            return make_error(ErrorKind::invalid_path,
                              "invalid escape sequence in segment '" + std::string{raw} + "'",
                              std::string{expression});
        }
        ++i;
    }
    return out;
}

auto decode_percents(std::string_view text, std::string_view expression) -> Result<std::string> {
    auto out = std::string{};
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            out += text[i];
            continue;
        }
        if (i + 2 >= text.size()) {
            return make_error(ErrorKind::invalid_path,
                              "truncated percent escape in segment '" + std::string{text} + "'",
                              std::string{expression});
        }
        auto hi = hex_digit(text[i + 1]);
        auto lo = hex_digit(text[i + 2]);
        if (hi < 0 || lo < 0) {
            return make_error(ErrorKind::invalid_path,
                              "invalid percent escape in segment '" + std::string{text} + "'",
                              std::string{expression});
        }
        out += static_cast<char>(hi * 16 + lo);
        i += 2;
    }
    return out;
}

auto is_all_digits(std::string_view s) -> bool {
    return !s.empty() && std::ranges::all_of(s, [](unsigned char c) { return std::isdigit(c) != 0; });
}

auto decode_segment(std::string_view raw, std::string_view expression) -> Result<Segment> {
    auto unescaped = decode_tildes(raw, expression);
    if (!unescaped) return std::unexpected(unescaped.error());
    auto decoded = decode_percents(*unescaped, expression);
    if (!decoded) return std::unexpected(decoded.error());

    if (*decoded == "-") return Segment{Append{}};
    if (is_all_digits(*decoded)) {
        auto value = std::size_t{0};
        const auto* first = decoded->data();
        const auto* last = decoded->data() + decoded->size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last) {
            return make_error(ErrorKind::invalid_path,
                              "array index '" + *decoded + "' is too large",
                              std::string{expression});
        }
        return Segment{Index{value}};
    }
    return Segment{Key{std::move(*decoded)}};
}

/// Split `expression` from `start` (just past a '/') into segments.
auto parse_segments(std::string_view expression, std::size_t start, PathForm form) -> Result<Path> {
    auto path = Path{form};
    auto pos = start;
    while (true) {
        auto next = expression.find('/', pos);
        auto raw = next == std::string_view::npos
                       ? expression.substr(pos)
                       : expression.substr(pos, next - pos);
        if (raw.empty()) {
            return make_error(ErrorKind::invalid_path, "empty path segment",
                              std::string{expression});
        }
        if (form == PathForm::query && raw == "*") {
            path.push_back(Wildcard{});
        } else {
            auto segment = decode_segment(raw, expression);
            if (!segment) return std::unexpected(segment.error());
            path.push_back(std::move(*segment));
        }
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return path;
}

}  // anonymous namespace

auto parse_pointer(std::string_view pointer) -> Result<Path> {
    if (pointer.empty()) return Path{PathForm::pointer};
    if (pointer.front() != '/') {
        return make_error(ErrorKind::invalid_path, "pointer must be empty or start with '/'",
                          std::string{pointer});
    }
    return parse_segments(pointer, 1, PathForm::pointer);
}

auto parse_query(std::string_view query) -> Result<Path> {
    if (!is_query_expression(query)) {
        return make_error(ErrorKind::invalid_path, "query must start with '$'",
                          std::string{query});
    }
    if (query.size() == 1) return Path{PathForm::query};
    if (query[1] != '/') {
        return make_error(ErrorKind::invalid_path, "expected '/' after '$'",
                          std::string{query});
    }
    return parse_segments(query, 2, PathForm::query);
}

auto parse_path(std::string_view expression) -> Result<Path> {
    if (is_query_expression(expression)) return parse_query(expression);
    return parse_pointer(expression);
}

// =============================================================================
// Canonical form
// =============================================================================

auto escape_key(std::string_view key) -> std::string {
    auto out = std::string{};
    out.reserve(key.size());
    for (char c : key) {
        switch (c) {
            case '~': out += "~0"; break;
            case '/': out += "~1"; break;
            case '%': out += "%25"; break;
            default:  out += c; break;
        }
    }
    return out;
}

auto canonicalize(const Path& path) -> Result<std::string> {
    if (!path.is_concrete()) {
        return make_error(ErrorKind::invalid_path,
                          "a path containing '*' has no pointer form", path.to_string());
    }
    return path.as_pointer().to_string();
}

}  // namespace jsonpatch_cpp
