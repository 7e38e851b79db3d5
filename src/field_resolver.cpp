#include <jsonpatch-cpp/field_resolver.hpp>

#include <algorithm>
#include <cctype>

namespace jsonpatch_cpp {

namespace {

// Split `tag` on ',' and call fn on each flag until it returns true.
template <typename Fn>
auto any_flag(std::string_view tag, Fn&& fn) -> bool {
    auto pos = std::size_t{0};
    while (pos <= tag.size()) {
        auto next = tag.find(',', pos);
        auto flag = tag.substr(pos, next == std::string_view::npos ? next : next - pos);
        if (fn(flag)) return true;
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return false;
}

}  // anonymous namespace

auto normalize_name(std::string_view name) -> std::string {
    auto result = std::string{};
    result.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == '_') continue;
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return result;
}

auto tag_matches(std::string_view tag, std::string_view segment) -> bool {
    if (tag.empty()) return false;
    return any_flag(tag, [&](std::string_view flag) { return flag == segment; });
}

auto resolve_field(std::string_view segment, std::span<const FieldInfo> fields,
                   FieldMatching matching) -> std::optional<std::size_t> {
    auto find = [&](auto&& pred) -> std::optional<std::size_t> {
        auto it = std::ranges::find_if(fields, pred);
        if (it == fields.end()) return std::nullopt;
        return static_cast<std::size_t>(it - fields.begin());
    };

    if (auto idx = find([&](const FieldInfo& f) { return f.name == segment; })) {
        return idx;
    }
    if (matching == FieldMatching::exact) return std::nullopt;

    if (auto idx = find([&](const FieldInfo& f) { return tag_matches(f.tag, segment); })) {
        return idx;
    }
    if (matching == FieldMatching::aliases) return std::nullopt;

    auto key = normalize_name(segment);
    return find([&](const FieldInfo& f) { return normalize_name(f.name) == key; });
}

auto json_name(const FieldInfo& field) -> std::string_view {
    auto first = field.tag.substr(0, field.tag.find(','));
    if (first.empty() || first == "-") return field.name;
    return first;
}

}  // namespace jsonpatch_cpp
