/// @file executor.hpp
/// @brief Executes one patch operation against a navigated location.

#pragma once

#include <jsonpatch-cpp/codec.hpp>
#include <jsonpatch-cpp/deep_copy.hpp>
#include <jsonpatch-cpp/deep_equal.hpp>
#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/field_resolver.hpp>
#include <jsonpatch-cpp/options.hpp>
#include <jsonpatch-cpp/patch.hpp>
#include <jsonpatch-cpp/pointer.hpp>
#include <jsonpatch-cpp/structure.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace jsonpatch_cpp {

/// Visitor used with navigate(): applies one Operation to the container
/// and segment the navigator reached.
///
/// @code
/// auto exec = OperationExecutor{op, opts};
/// navigate(user, op.path, exec, opts);
/// @endcode
class OperationExecutor {
public:
    OperationExecutor(const Operation& op, const Options& opts)
        : op_{op}, opts_{opts} {}

    template <typename C>
    void operator()(C& container, std::string_view segment) const {
        switch (op_.op) {
            case OpType::add:     add(container, segment); return;
            case OpType::replace: replace(container, segment); return;
            case OpType::remove:  remove(container, segment); return;
            case OpType::test:    test(container, segment); return;
            case OpType::copy:
            case OpType::move:
                throw PatchError{ErrorKind::not_implemented,
                                 std::string{to_string_view(op_.op)} + " is not implemented"};
        }
    }

private:
    auto value() const -> const nlohmann::json& {
        if (!op_.value) {
            throw PatchError{ErrorKind::invalid_value,
                             std::string{to_string_view(op_.op)} + " at \"" + op_.path +
                             "\" requires a value"};
        }
        return *op_.value;
    }

    static auto incorrect_index(std::string_view segment) -> PatchError {
        return PatchError{ErrorKind::incorrect_index,
                          "incorrect index \"" + std::string{segment} + "\""};
    }

    static auto map_element_not_found(std::string_view segment) -> PatchError {
        return PatchError{ErrorKind::element_not_found,
                          "map element not found: \"" + std::string{segment} + "\""};
    }

    static auto garbage_value(std::string_view segment) -> PatchError {
        return PatchError{ErrorKind::garbage_value,
                          "primitive types cannot have fields (at \"" + std::string{segment} + "\")"};
    }

    static auto not_implemented_for_reference() -> PatchError {
        return PatchError{ErrorKind::not_implemented,
                          "operation on a reference container is not implemented"};
    }

    // Parse `segment` as an index no greater than `limit`.
    static auto index_up_to(std::string_view segment, std::size_t limit) -> std::size_t {
        auto idx = parse_index(segment);
        if (!idx || *idx > limit) throw incorrect_index(segment);
        return *idx;
    }

    template <Record C>
    auto field_index(std::string_view segment) const -> std::size_t {
        auto idx = resolve_field<C>(segment, opts_.field_matching);
        if (!idx) throw incorrect_index(segment);
        return *idx;
    }

    // Decode the operation value into a fresh value of the given type.
    template <typename V>
    auto fresh(const V&) const -> V {
        return decode_as<V>(value(), opts_);
    }

    // -- add ------------------------------------------------------------------

    template <typename C>
    void add(C& container, std::string_view segment) const {
        if constexpr (OptionalRef<C>) {
            // Reference to a reference: merge into a copy of the pointee.
            auto& target = materialize(container);
            auto merged = clone(target);
            decode(value(), merged, opts_);
            target = std::move(merged);
        } else if constexpr (GrowableSequence<C>) {
            using E = typename detail::sequence_traits<C>::element_type;
            if (segment == append_segment) {
                auto element = decode_as<E>(value(), opts_);
                container.push_back(std::move(element));
                return;
            }
            auto idx = index_up_to(segment, container.size());
            auto element = decode_as<E>(value(), opts_);
            container.insert(std::next(container.begin(), static_cast<std::ptrdiff_t>(idx)),
                             std::move(element));
        } else if constexpr (Sequence<C>) {
            throw unsupported_error(segment);
        } else if constexpr (KeyedMap<C>) {
            using V = typename detail::map_traits<C>::mapped_type;
            container.insert_or_assign(std::string{segment}, decode_as<V>(value(), opts_));
        } else if constexpr (Record<C>) {
            visit_field(container, field_index<C>(segment), [&](auto& field) {
                field = fresh(field);
            });
        } else if constexpr (Primitive<C>) {
            throw garbage_value(segment);
        } else {
            throw unsupported_error(segment);
        }
    }

    // -- replace --------------------------------------------------------------

    template <typename C>
    void replace(C& container, std::string_view segment) const {
        if constexpr (OptionalRef<C>) {
            throw not_implemented_for_reference();
        } else if constexpr (Sequence<C>) {
            auto idx = index_up_to(segment, container.size());
            if (idx < container.size()) {
                decode(value(), container[idx], opts_);
                return;
            }
            // idx == size: accepted boundary, appends where possible.
            if constexpr (GrowableSequence<C>) {
                using E = typename detail::sequence_traits<C>::element_type;
                container.push_back(decode_as<E>(value(), opts_));
            } else {
                throw incorrect_index(segment);
            }
        } else if constexpr (KeyedMap<C>) {
            auto it = container.find(std::string{segment});
            if (it == container.end()) throw map_element_not_found(segment);
            auto updated = clone(it->second);
            decode(value(), updated, opts_);
            it->second = std::move(updated);
        } else if constexpr (Record<C>) {
            visit_field(container, field_index<C>(segment), [&](auto& field) {
                field = fresh(field);
            });
        } else if constexpr (Primitive<C>) {
            throw garbage_value(segment);
        } else {
            throw unsupported_error(segment);
        }
    }

    // -- remove ---------------------------------------------------------------

    template <typename C>
    void remove(C& container, std::string_view segment) const {
        if constexpr (OptionalRef<C>) {
            throw not_implemented_for_reference();
        } else if constexpr (GrowableSequence<C>) {
            auto idx = parse_index(segment);
            if (!idx || *idx >= container.size()) throw incorrect_index(segment);
            container.erase(std::next(container.begin(), static_cast<std::ptrdiff_t>(*idx)));
        } else if constexpr (Sequence<C>) {
            throw unsupported_error(segment);
        } else if constexpr (KeyedMap<C>) {
            // The key stays; only its value is reset.
            auto it = container.find(std::string{segment});
            if (it == container.end()) throw map_element_not_found(segment);
            it->second = typename detail::map_traits<C>::mapped_type{};
        } else if constexpr (Record<C>) {
            visit_field(container, field_index<C>(segment), [](auto& field) {
                field = std::remove_reference_t<decltype(field)>{};
            });
        } else if constexpr (Primitive<C>) {
            throw garbage_value(segment);
        } else {
            throw unsupported_error(segment);
        }
    }

    // -- test -----------------------------------------------------------------

    template <typename V>
    void expect_equal(const V& current) const {
        auto expected = decode_as<V>(value(), opts_);
        if (!deep_equal(expected, current)) {
            throw PatchError{ErrorKind::not_equal, "elements are not equal at \"" + op_.path + "\""};
        }
    }

    template <typename C>
    void test(C& container, std::string_view segment) const {
        if constexpr (OptionalRef<C>) {
            throw not_implemented_for_reference();
        } else if constexpr (Sequence<C>) {
            auto idx = parse_index(segment);
            if (!idx || *idx >= container.size()) throw incorrect_index(segment);
            const auto& element = container[*idx];
            if constexpr (OptionalRef<std::remove_cvref_t<decltype(element)>>) {
                // A null element is accepted without comparison.
                if (is_null(element)) return;
            }
            expect_equal(element);
        } else if constexpr (KeyedMap<C>) {
            auto it = container.find(std::string{segment});
            if (it == container.end()) throw map_element_not_found(segment);
            expect_equal(it->second);
        } else if constexpr (Record<C>) {
            visit_field(container, field_index<C>(segment), [&](const auto& field) {
                expect_equal(field);
            });
        } else if constexpr (Primitive<C>) {
            // A leaf is compared as a whole; the segment does not select anything.
            expect_equal(container);
        } else {
            throw unsupported_error(segment);
        }
    }

    const Operation& op_;
    const Options& opts_;
};

}  // namespace jsonpatch_cpp
