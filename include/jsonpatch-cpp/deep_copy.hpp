/// @file deep_copy.hpp
/// @brief Recursive deep copy of structured values.
///
/// The copy shares no mutable sub-structure with the source: every optional
/// reference, including std::shared_ptr, gets a fresh pointee. Only
/// registered record fields are copied. Cycles through std::shared_ptr are
/// not detected.

#pragma once

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/structure.hpp>

#include <cstddef>
#include <utility>

namespace jsonpatch_cpp {

/// Copy `source` into `destination`, recursively.
///
/// Sequences and maps in `destination` are rebuilt from scratch; record
/// fields that are not registered keep whatever `destination` held.
/// @throws PatchError with ErrorKind::unsupported when `source` contains an
///         unsupported shape.
template <typename T>
void deep_copy(const T& source, T& destination) {
    if constexpr (OptionalRef<T>) {
        if (is_null(source)) {
            destination.reset();
            return;
        }
        destination.reset();
        deep_copy(*source, materialize(destination));
    } else if constexpr (Sequence<T>) {
        if constexpr (GrowableSequence<T>) {
            auto result = T{};
            for (const auto& item : source) {
                deep_copy(item, result.emplace_back());
            }
            destination = std::move(result);
        } else {
            for (auto i = std::size_t{0}; i < source.size(); ++i) {
                deep_copy(source[i], destination[i]);
            }
        }
    } else if constexpr (KeyedMap<T>) {
        auto result = T{};
        for (const auto& [key, item] : source) {
            deep_copy(item, result[key]);
        }
        destination = std::move(result);
    } else if constexpr (Record<T>) {
        for_each_field_pair(source, destination, [](const auto& from, auto& to) {
            deep_copy(from, to);
        });
    } else if constexpr (Primitive<T>) {
        destination = source;
    } else {
        throw PatchError{ErrorKind::unsupported, "cannot copy an unsupported type"};
    }
}

/// Pointer form of deep_copy(). A null source leaves `destination` untouched.
/// @throws PatchError with ErrorKind::non_pointer when `destination` is null.
template <typename T>
void deep_copy(const T* source, T* destination) {
    if (destination == nullptr) {
        throw PatchError{ErrorKind::non_pointer, "copy destination is null"};
    }
    if (source == nullptr) return;
    deep_copy(*source, *destination);
}

/// Return an independent deep copy of `source`.
/// Unregistered record fields are default-constructed in the clone.
template <typename T>
auto clone(const T& source) -> T {
    auto result = T{};
    deep_copy(source, result);
    return result;
}

}  // namespace jsonpatch_cpp
