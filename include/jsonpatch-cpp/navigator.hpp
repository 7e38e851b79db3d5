/// @file navigator.hpp
/// @brief Path navigation through structured values.
///
/// navigate() walks a value one segment at a time and hands the container
/// holding the last segment to a visitor, together with that segment. The
/// container reference is only valid during the visitor call.
///
/// Walking mutates the value: null references on the way are replaced by
/// fresh default-constructed values and absent map keys are inserted with
/// default values. Callers that must not observe these side effects work
/// on a copy.

#pragma once

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/field_resolver.hpp>
#include <jsonpatch-cpp/log.hpp>
#include <jsonpatch-cpp/options.hpp>
#include <jsonpatch-cpp/pointer.hpp>
#include <jsonpatch-cpp/structure.hpp>

#include <string>
#include <string_view>

namespace jsonpatch_cpp {

namespace detail {

inline auto segment_text(std::string_view raw, const Options& opts) -> std::string {
    return opts.unescape_tokens ? unescape_token(raw) : std::string{raw};
}

template <OptionalRef R>
auto materialize_traced(R& ref, std::string_view segment) -> pointee_t<R>& {
    if (is_null(ref)) {
        logger().trace("materializing null reference at \"{}\"", segment);
    }
    return materialize(ref);
}

/// Step from `node` into the child named by `segment` and call next(child).
template <typename T, typename Next>
void descend(T& node, const std::string& segment, Next&& next, const Options& opts) {
    if constexpr (OptionalRef<T>) {
        descend(materialize_traced(node, segment), segment, next, opts);
    } else if constexpr (Sequence<T>) {
        auto idx = parse_index(segment);
        if (!idx || *idx >= node.size()) {
            throw PatchError{ErrorKind::incorrect_index, "incorrect index \"" + segment + "\""};
        }
        next(node[*idx]);
    } else if constexpr (KeyedMap<T>) {
        if (node.find(segment) == node.end()) {
            logger().trace("materializing absent map key \"{}\"", segment);
        }
        next(node[segment]);
    } else if constexpr (Record<T>) {
        auto idx = resolve_field<T>(segment, opts.field_matching);
        if (!idx) {
            throw PatchError{ErrorKind::incorrect_index, "no field matches \"" + segment + "\""};
        }
        visit_field(node, *idx, next);
    } else if constexpr (Primitive<T>) {
        throw PatchError{ErrorKind::garbage_value,
                         "primitive types cannot have fields (at \"" + segment + "\")"};
    } else {
        throw unsupported_error(segment);
    }
}

template <typename T, typename Visitor>
void navigate_trimmed(T& node, std::string_view path, Visitor& visit, const Options& opts) {
    auto split = split_head(path);
    auto segment = segment_text(split.head, opts);
    if (!split.rest) {
        if constexpr (OptionalRef<T>) {
            visit(materialize_traced(node, segment), std::string_view{segment});
        } else {
            visit(node, std::string_view{segment});
        }
        return;
    }
    auto rest = *split.rest;
    descend(node, segment, [&](auto& child) {
        navigate_trimmed(child, rest, visit, opts);
    }, opts);
}

}  // namespace detail

/// Walk `root` along `path` and call `visit(container, segment)` with the
/// container of the last segment.
///
/// Leading and trailing '/' are ignored, so "/a/b", "a/b" and "/a/b/" are
/// the same path. An empty path reaches `root` with an empty segment.
/// The visitor must accept every container type reachable from T.
///
/// @throws PatchError with ErrorKind::incorrect_index, garbage_value or
///         unsupported when a segment cannot be followed.
template <typename T, typename Visitor>
void navigate(T& root, std::string_view path, Visitor&& visit, const Options& opts = {}) {
    detail::navigate_trimmed(root, trim_path(path), visit, opts);
}

}  // namespace jsonpatch_cpp
