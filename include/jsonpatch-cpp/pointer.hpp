/// @file pointer.hpp
/// @brief Path handling: trimming, splitting, token unescaping and
/// sequence index parsing.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace jsonpatch_cpp {

/// The segment that appends to a sequence.
inline constexpr std::string_view append_segment = "-";

/// Strip every leading and trailing '/' from a path.
/// @code
/// trim_path("/phones/-/") == "phones/-"
/// @endcode
auto trim_path(std::string_view path) -> std::string_view;

/// A path split at its first '/'.
struct PathHead {
    std::string_view head;                 ///< First segment (still escaped).
    std::optional<std::string_view> rest;  ///< Remainder, absent for the last segment.

    auto operator==(const PathHead&) const -> bool = default;
};

/// Split a trimmed path into its first segment and the remainder.
/// @code
/// split_head("a/b/c") == PathHead{"a", "b/c"}
/// split_head("a")     == PathHead{"a", std::nullopt}
/// @endcode
auto split_head(std::string_view path) -> PathHead;

/// Unescape an RFC 6901 token: "~1" -> "/", "~0" -> "~".
auto unescape_token(std::string_view token) -> std::string;

/// Parse a segment as a sequence index.
/// Rejects empty strings, signs, leading zeros and trailing garbage.
auto parse_index(std::string_view segment) -> std::optional<std::size_t>;

}  // namespace jsonpatch_cpp
