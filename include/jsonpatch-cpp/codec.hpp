/// @file codec.hpp
/// @brief nlohmann/json decoding into, and encoding from, structured values.
///
/// Decoding merges into the existing value: record fields and map keys that
/// do not appear in the JSON keep their current content. Sequences are
/// rebuilt from the JSON array. JSON null resets optional references and
/// clears growable sequences and maps; it leaves records and primitives
/// untouched.

#pragma once

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/field_resolver.hpp>
#include <jsonpatch-cpp/options.hpp>
#include <jsonpatch-cpp/structure.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>

namespace jsonpatch_cpp {

namespace detail {

inline auto type_mismatch(const char* expected, const nlohmann::json& j) -> PatchError {
    return PatchError{ErrorKind::invalid_value,
                      std::string{"expected "} + expected + ", got " + j.type_name()};
}

inline auto out_of_range(const nlohmann::json& j) -> PatchError {
    return PatchError{ErrorKind::invalid_value,
                      "value " + j.dump() + " is out of range for the target type"};
}

// Integer types accepted by std::in_range (bool and character types are not).
template <typename T>
concept CheckedInteger = std::integral<T> && !std::same_as<T, bool> &&
                         !std::same_as<T, char> && !std::same_as<T, wchar_t> &&
                         !std::same_as<T, char8_t> && !std::same_as<T, char16_t> &&
                         !std::same_as<T, char32_t>;

/// Convert a JSON leaf to T. Numbers T cannot represent are rejected;
/// everything else is left to nlohmann, which reports type errors.
template <typename T>
void decode_primitive(const nlohmann::json& j, T& out) {
    if constexpr (std::is_enum_v<T>) {
        auto raw = std::underlying_type_t<T>{};
        decode_primitive(j, raw);
        out = static_cast<T>(raw);
    } else if constexpr (CheckedInteger<T>) {
        if (j.is_number_unsigned()) {
            auto v = j.get<std::uint64_t>();
            if (!std::in_range<T>(v)) throw out_of_range(j);
            out = static_cast<T>(v);
        } else if (j.is_number_integer()) {
            auto v = j.get<std::int64_t>();
            if (!std::in_range<T>(v)) throw out_of_range(j);
            out = static_cast<T>(v);
        } else if (j.is_number_float()) {
            // Truncation toward zero is defined while the result fits in T.
            auto v = j.get<double>();
            const auto upper = std::ldexp(1.0, std::numeric_limits<T>::digits);
            const auto fits = std::is_signed_v<T> ? (v >= -upper && v < upper)
                                                  : (v > -1.0 && v < upper);
            if (!fits) throw out_of_range(j);
            out = static_cast<T>(v);
        } else {
            j.get_to(out);
        }
    } else if constexpr (std::floating_point<T>) {
        if (j.is_number()) {
            auto v = j.get<double>();
            if (std::isfinite(v) && std::abs(v) > static_cast<double>(std::numeric_limits<T>::max())) {
                throw out_of_range(j);
            }
            out = static_cast<T>(v);
        } else {
            j.get_to(out);
        }
    } else {
        j.get_to(out);
    }
}

template <typename T>
void decode_into(const nlohmann::json& j, T& out, const Options& opts) {
    if constexpr (OptionalRef<T>) {
        if (j.is_null()) {
            out.reset();
            return;
        }
        decode_into(j, materialize(out), opts);
    } else if constexpr (Sequence<T>) {
        using E = typename sequence_traits<T>::element_type;
        if (j.is_null()) {
            if constexpr (GrowableSequence<T>) out.clear();
            return;
        }
        if (!j.is_array()) throw type_mismatch("array", j);
        if constexpr (GrowableSequence<T>) {
            auto result = T{};
            for (const auto& item : j) {
                decode_into(item, result.emplace_back(), opts);
            }
            out = std::move(result);
        } else {
            // Extra JSON elements are ignored, missing ones are defaulted.
            for (auto i = std::size_t{0}; i < out.size(); ++i) {
                out[i] = E{};
                if (i < j.size()) decode_into(j[i], out[i], opts);
            }
        }
    } else if constexpr (KeyedMap<T>) {
        using V = typename map_traits<T>::mapped_type;
        if (j.is_null()) {
            out.clear();
            return;
        }
        if (!j.is_object()) throw type_mismatch("object", j);
        for (auto it = j.begin(); it != j.end(); ++it) {
            auto value = V{};
            decode_into(it.value(), value, opts);
            out.insert_or_assign(it.key(), std::move(value));
        }
    } else if constexpr (Record<T>) {
        if (j.is_null()) return;
        if (!j.is_object()) throw type_mismatch("object", j);
        for (auto it = j.begin(); it != j.end(); ++it) {
            auto idx = resolve_field<T>(it.key(), opts.field_matching);
            if (!idx) continue;  // unknown keys are ignored
            const auto& item = it.value();
            visit_field(out, *idx, [&](auto& member) { decode_into(item, member, opts); });
        }
    } else if constexpr (Primitive<T>) {
        if (j.is_null()) return;
        decode_primitive(j, out);
    } else {
        throw PatchError{ErrorKind::unsupported, "cannot decode into an unsupported type"};
    }
}

}  // namespace detail

/// Decode `j` into `out`, merging into its current content.
/// @throws PatchError with ErrorKind::invalid_value when the JSON does not
///         fit the target type, ErrorKind::unsupported for unsupported shapes.
template <typename T>
void decode(const nlohmann::json& j, T& out, const Options& opts = {}) {
    try {
        detail::decode_into(j, out, opts);
    } catch (const nlohmann::json::exception& e) {
        throw PatchError{ErrorKind::invalid_value, e.what()};
    }
}

/// Decode `j` into a default-constructed T.
template <typename T>
auto decode_as(const nlohmann::json& j, const Options& opts = {}) -> T {
    auto value = T{};
    decode(j, value, opts);
    return value;
}

/// Encode a structured value as JSON. Records are encoded under each
/// field's json_name(); null references become JSON null.
template <typename T>
auto encode(const T& value) -> nlohmann::json {
    if constexpr (OptionalRef<T>) {
        if (is_null(value)) return nullptr;
        return encode(*value);
    } else if constexpr (Sequence<T>) {
        auto result = nlohmann::json::array();
        for (const auto& item : value) result.push_back(encode(item));
        return result;
    } else if constexpr (KeyedMap<T>) {
        auto result = nlohmann::json::object();
        for (const auto& [key, item] : value) result[key] = encode(item);
        return result;
    } else if constexpr (Record<T>) {
        auto result = nlohmann::json::object();
        for_each_field(value, [&](const FieldInfo& info, const auto& member) {
            result[std::string{json_name(info)}] = encode(member);
        });
        return result;
    } else if constexpr (Primitive<T>) {
        return nlohmann::json(value);
    } else {
        throw PatchError{ErrorKind::unsupported, "cannot encode an unsupported type"};
    }
}

}  // namespace jsonpatch_cpp
