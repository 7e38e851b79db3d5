#include <jsonpatch-cpp/pointer.hpp>

#include <charconv>
#include <system_error>

namespace jsonpatch_cpp {

auto trim_path(std::string_view path) -> std::string_view {
    auto first = path.find_first_not_of('/');
    if (first == std::string_view::npos) return {};
    auto last = path.find_last_not_of('/');
    return path.substr(first, last - first + 1);
}

auto split_head(std::string_view path) -> PathHead {
    auto slash = path.find('/');
    if (slash == std::string_view::npos) {
        return PathHead{path, std::nullopt};
    }
    return PathHead{path.substr(0, slash), path.substr(slash + 1)};
}

auto unescape_token(std::string_view token) -> std::string {
    auto result = std::string{};
    result.reserve(token.size());
    for (auto i = std::size_t{0}; i < token.size(); ++i) {
        if (token[i] == '~' && i + 1 < token.size()) {
            if (token[i + 1] == '1') {
                result.push_back('/');
                ++i;
                continue;
            }
            if (token[i + 1] == '0') {
                result.push_back('~');
                ++i;
                continue;
            }
        }
        result.push_back(token[i]);
    }
    return result;
}

auto parse_index(std::string_view segment) -> std::optional<std::size_t> {
    if (segment.empty()) return std::nullopt;
    // Leading zeros are not allowed per RFC 6901 (except "0" itself)
    if (segment.size() > 1 && segment[0] == '0') return std::nullopt;
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), result);
    if (ec == std::errc{} && ptr == segment.data() + segment.size()) return result;
    return std::nullopt;
}

}  // namespace jsonpatch_cpp
