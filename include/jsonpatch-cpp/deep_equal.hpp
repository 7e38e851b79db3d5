/// @file deep_equal.hpp
/// @brief Structural equality of structured values.

#pragma once

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/structure.hpp>

#include <cstddef>

namespace jsonpatch_cpp {

/// Compare two values structurally.
///
/// References compare by pointee (two null references are equal), maps by
/// key set and values, records by their registered fields only.
/// @throws PatchError with ErrorKind::unsupported for unsupported shapes.
template <typename T>
auto deep_equal(const T& lhs, const T& rhs) -> bool {
    if constexpr (OptionalRef<T>) {
        if (is_null(lhs) || is_null(rhs)) return is_null(lhs) == is_null(rhs);
        return deep_equal(*lhs, *rhs);
    } else if constexpr (Sequence<T>) {
        if (lhs.size() != rhs.size()) return false;
        for (auto i = std::size_t{0}; i < lhs.size(); ++i) {
            if (!deep_equal(lhs[i], rhs[i])) return false;
        }
        return true;
    } else if constexpr (KeyedMap<T>) {
        if (lhs.size() != rhs.size()) return false;
        for (const auto& [key, item] : lhs) {
            auto it = rhs.find(key);
            if (it == rhs.end() || !deep_equal(item, it->second)) return false;
        }
        return true;
    } else if constexpr (Record<T>) {
        auto equal = true;
        for_each_field_pair(lhs, rhs, [&](const auto& left, const auto& right) {
            if (equal) equal = deep_equal(left, right);
        });
        return equal;
    } else if constexpr (Primitive<T>) {
        return lhs == rhs;
    } else {
        throw PatchError{ErrorKind::unsupported, "cannot compare an unsupported type"};
    }
}

}  // namespace jsonpatch_cpp
