/// @file structure.hpp
/// @brief Structural views: compile-time classification of C++ types into
/// sequences, keyed maps, records, optional references and primitives.
///
/// Every other component dispatches on these concepts. A record is any type
/// with a `record_traits` specialisation listing its fields:
///
/// @code
/// struct User { std::string name; int age{}; };
///
/// template <>
/// struct jsonpatch_cpp::record_traits<User> {
///     static constexpr auto fields() {
///         return std::make_tuple(
///             jsonpatch_cpp::field("Name", &User::name),
///             jsonpatch_cpp::field("Age", &User::age, "age,omitempty"));
///     }
/// };
/// @endcode

#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace jsonpatch_cpp {

/// The structural capability of a value.
enum class Kind : std::uint8_t {
    sequence,      ///< Ordered, index-addressable.
    keyed_map,     ///< String-keyed, dynamically sized.
    record,        ///< Fixed named fields registered in record_traits.
    optional_ref,  ///< Zero or one nested value, materialisable on demand.
    primitive,     ///< Leaf value without children.
    unsupported,   ///< No navigation or copy rule exists.
};

/// Convert a Kind to its string representation.
constexpr auto to_string_view(Kind kind) noexcept -> std::string_view {
    switch (kind) {
        case Kind::sequence:     return "sequence";
        case Kind::keyed_map:    return "keyed_map";
        case Kind::record:       return "record";
        case Kind::optional_ref: return "optional_ref";
        case Kind::primitive:    return "primitive";
        case Kind::unsupported:  return "unsupported";
    }
    return "unknown";
}

// -- Record registration ------------------------------------------------------

/// Name and alias tag of a record field.
///
/// The tag holds comma-separated aliases, e.g. "phone_numbers,omitempty".
struct FieldInfo {
    std::string_view name;  ///< Declared field name.
    std::string_view tag;   ///< Comma-separated alias flags (may be empty).

    auto operator==(const FieldInfo&) const -> bool = default;
};

/// A registered record field: its FieldInfo plus the member pointer.
template <typename Class, typename Member>
struct Field {
    using class_type = Class;
    using member_type = Member;

    std::string_view name;
    Member Class::* member;
    std::string_view tag;

    constexpr auto info() const -> FieldInfo { return FieldInfo{name, tag}; }
};

/// Describe a record field for use in `record_traits<T>::fields()`.
template <typename Class, typename Member>
constexpr auto field(std::string_view name, Member Class::* member,
                     std::string_view tag = {}) -> Field<Class, Member> {
    return Field<Class, Member>{name, member, tag};
}

/// Specialise for every struct that should be patchable. The specialisation
/// provides a static `fields()` returning a tuple of `field(...)` entries.
/// Members not listed are invisible to navigation, decoding, encoding,
/// copying and equality.
template <typename T>
struct record_traits;

// -- Shape traits -------------------------------------------------------------

namespace detail {

template <typename T>
struct sequence_traits {};

// std::vector<bool> hands out proxies instead of element references, so it
// is classified as unsupported.
template <typename E, typename A>
    requires (!std::same_as<E, bool>)
struct sequence_traits<std::vector<E, A>> {
    using element_type = E;
    static constexpr bool growable = true;
};

template <typename E, typename A>
struct sequence_traits<std::deque<E, A>> {
    using element_type = E;
    static constexpr bool growable = true;
};

template <typename E, std::size_t N>
struct sequence_traits<std::array<E, N>> {
    using element_type = E;
    static constexpr bool growable = false;
};

template <typename T>
struct map_traits {};

template <typename V, typename C, typename A>
struct map_traits<std::map<std::string, V, C, A>> {
    using mapped_type = V;
};

template <typename V, typename H, typename E, typename A>
struct map_traits<std::unordered_map<std::string, V, H, E, A>> {
    using mapped_type = V;
};

template <typename T>
struct ref_traits {};

template <typename E>
struct ref_traits<std::unique_ptr<E>> {
    using element_type = E;
    static void allocate(std::unique_ptr<E>& ref) { ref = std::make_unique<E>(); }
};

template <typename E>
struct ref_traits<std::shared_ptr<E>> {
    using element_type = E;
    static void allocate(std::shared_ptr<E>& ref) { ref = std::make_shared<E>(); }
};

template <typename E>
struct ref_traits<std::optional<E>> {
    using element_type = E;
    static void allocate(std::optional<E>& ref) { ref.emplace(); }
};

}  // namespace detail

// -- Concepts -----------------------------------------------------------------

/// A std::unique_ptr, std::shared_ptr or std::optional.
template <typename T>
concept OptionalRef = requires { typename detail::ref_traits<T>::element_type; };

/// A std::vector (except std::vector<bool>), std::deque or std::array.
template <typename T>
concept Sequence = requires { typename detail::sequence_traits<T>::element_type; };

/// A sequence that supports insertion and erasure.
template <typename T>
concept GrowableSequence = Sequence<T> && detail::sequence_traits<T>::growable;

/// A std::map or std::unordered_map keyed by std::string.
template <typename T>
concept KeyedMap = requires { typename detail::map_traits<T>::mapped_type; };

/// A type with a record_traits specialisation.
template <typename T>
concept Record = requires { record_traits<T>::fields(); };

/// A leaf: arithmetic, enum or std::string.
template <typename T>
concept Primitive = std::is_arithmetic_v<T> || std::is_enum_v<T> ||
                    std::same_as<T, std::string>;

/// Classify a type into exactly one Kind.
template <typename T>
constexpr auto kind_of() noexcept -> Kind {
    using U = std::remove_cvref_t<T>;
    if constexpr (OptionalRef<U>) return Kind::optional_ref;
    else if constexpr (Sequence<U>) return Kind::sequence;
    else if constexpr (KeyedMap<U>) return Kind::keyed_map;
    else if constexpr (Record<U>) return Kind::record;
    else if constexpr (Primitive<U>) return Kind::primitive;
    else return Kind::unsupported;
}

/// True when no structural rule exists for T.
template <typename T>
concept Unsupported = (kind_of<T>() == Kind::unsupported);

// -- Optional references ------------------------------------------------------

template <OptionalRef R>
using pointee_t = typename detail::ref_traits<R>::element_type;

/// True when the reference holds no value.
template <OptionalRef R>
auto is_null(const R& ref) -> bool {
    return !static_cast<bool>(ref);
}

/// Return the referenced value, allocating a default-constructed one first
/// when the reference is null.
template <OptionalRef R>
auto materialize(R& ref) -> pointee_t<R>& {
    if (is_null(ref)) {
        detail::ref_traits<R>::allocate(ref);
    }
    return *ref;
}

// -- Record fields ------------------------------------------------------------

/// Number of registered fields of a record.
template <Record T>
constexpr auto field_count() -> std::size_t {
    return std::tuple_size_v<std::remove_cvref_t<decltype(record_traits<T>::fields())>>;
}

/// Names and tags of all registered fields, in declaration order.
template <Record T>
auto field_infos() -> std::span<const FieldInfo> {
    static const auto infos = std::apply([](const auto&... f) {
        return std::array<FieldInfo, sizeof...(f)>{f.info()...};
    }, record_traits<T>::fields());
    return infos;
}

/// Invoke `fn(info, member)` for every registered field of `record`.
/// Works for const and non-const records.
template <typename R, typename Fn>
    requires Record<std::remove_const_t<R>>
void for_each_field(R& record, Fn&& fn) {
    std::apply([&](const auto&... f) {
        (fn(f.info(), record.*(f.member)), ...);
    }, record_traits<std::remove_const_t<R>>::fields());
}

/// Invoke `fn(first_member, second_member)` for every registered field,
/// pairing the same field of two records of the same type.
template <typename A, typename B, typename Fn>
    requires Record<std::remove_const_t<A>> &&
             std::same_as<std::remove_const_t<A>, std::remove_const_t<B>>
void for_each_field_pair(A& first, B& second, Fn&& fn) {
    std::apply([&](const auto&... f) {
        (fn(first.*(f.member), second.*(f.member)), ...);
    }, record_traits<std::remove_const_t<A>>::fields());
}

/// Invoke `fn(member)` on the field at `index` (as ordered by field_infos).
/// Returns false when the index is out of range.
template <typename R, typename Fn>
    requires Record<std::remove_const_t<R>>
auto visit_field(R& record, std::size_t index, Fn&& fn) -> bool {
    auto i = std::size_t{0};
    return std::apply([&](const auto&... f) {
        return ((i++ == index ? (fn(record.*(f.member)), true) : false) || ...);
    }, record_traits<std::remove_const_t<R>>::fields());
}

}  // namespace jsonpatch_cpp
