/// @file options.hpp
/// @brief Configuration knobs for patch application.

#pragma once

#include <cstdint>
#include <string_view>

namespace jsonpatch_cpp {

/// How permissively path segments are matched against record fields.
enum class FieldMatching : std::uint8_t {
    exact,       ///< Declared field name only.
    aliases,     ///< Declared name, then alias tags.
    normalized,  ///< Declared name, alias tags, then case/separator-insensitive.
};

/// Convert a FieldMatching to its string representation.
constexpr auto to_string_view(FieldMatching matching) noexcept -> std::string_view {
    switch (matching) {
        case FieldMatching::exact:      return "exact";
        case FieldMatching::aliases:    return "aliases";
        case FieldMatching::normalized: return "normalized";
    }
    return "unknown";
}

/// Options controlling how a patch is applied.
///
/// @code
/// auto opts = jsonpatch_cpp::Options{};
/// opts.field_matching = jsonpatch_cpp::FieldMatching::aliases;
/// jsonpatch_cpp::apply(patch_text, user, opts);
/// @endcode
struct Options {
    /// Field matching policy used by navigation and by record decoding.
    FieldMatching field_matching{FieldMatching::normalized};

    /// Unescape RFC 6901 tokens (~1 -> '/', ~0 -> '~') in path segments.
    bool unescape_tokens{true};

    auto operator==(const Options&) const -> bool = default;
};

}  // namespace jsonpatch_cpp
