/// @file field_resolver.hpp
/// @brief Matching path segments and JSON keys to record fields.

#pragma once

#include <jsonpatch-cpp/options.hpp>
#include <jsonpatch-cpp/structure.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace jsonpatch_cpp {

/// Lowercase `name` and strip '-' and '_'.
/// @code
/// normalize_name("Phone_Numbers") == "phonenumbers"
/// @endcode
auto normalize_name(std::string_view name) -> std::string;

/// True when any comma-separated flag of `tag` equals `segment`.
auto tag_matches(std::string_view tag, std::string_view segment) -> bool;

/// Find the field a segment refers to.
///
/// Rules are tried in order over all fields; the first rule that matches
/// any field wins:
///   1. exact declared name,
///   2. exact alias flag from the tag,
///   3. normalized name (lowercase, without '-' and '_').
/// `matching` limits which rules are tried.
///
/// @return The index into `fields`, or nullopt when nothing matches.
auto resolve_field(std::string_view segment, std::span<const FieldInfo> fields,
                   FieldMatching matching = FieldMatching::normalized)
    -> std::optional<std::size_t>;

/// Resolve a segment against the registered fields of record type T.
template <Record T>
auto resolve_field(std::string_view segment,
                   FieldMatching matching = FieldMatching::normalized)
    -> std::optional<std::size_t> {
    return resolve_field(segment, field_infos<T>(), matching);
}

/// The key a field is encoded under: the first tag flag when it is
/// non-empty and not "-", otherwise the declared name.
auto json_name(const FieldInfo& field) -> std::string_view;

}  // namespace jsonpatch_cpp
