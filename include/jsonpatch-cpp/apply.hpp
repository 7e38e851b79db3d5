/// @file apply.hpp
/// @brief Atomic application of patch documents to structured values.

#pragma once

#include <jsonpatch-cpp/deep_copy.hpp>
#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/executor.hpp>
#include <jsonpatch-cpp/log.hpp>
#include <jsonpatch-cpp/navigator.hpp>
#include <jsonpatch-cpp/options.hpp>
#include <jsonpatch-cpp/patch.hpp>

#include <nlohmann/json.hpp>

#include <concepts>
#include <cstddef>
#include <string_view>
#include <type_traits>
#include <utility>

namespace jsonpatch_cpp {

/// Apply a single operation to `target` in place, without any copy.
///
/// On failure `target` may be partially modified (null references on the
/// path may have been materialised). Use apply() for atomic updates.
template <typename T>
void apply_operation(const Operation& op, T& target, const Options& opts = {}) {
    auto executor = OperationExecutor{op, opts};
    navigate(target, op.path, executor, opts);
}

/// Apply every operation of `patch` to `target`, atomically.
///
/// A deep copy of `target` is patched operation by operation, in order.
/// When all operations succeed the copy is moved into `target`; when any
/// fails the copy is dropped and `target` is left as it was.
///
/// @code
/// auto user = User{};
/// jsonpatch_cpp::apply(R"([{"op": "add", "path": "/name", "value": "Calvin"}])", user);
/// @endcode
///
/// @throws PatchError describing the first failure.
template <typename T>
void apply(const Patch& patch, T& target, const Options& opts = {}) {
    static_assert(std::is_default_constructible_v<T>,
                  "patch targets must be default-constructible");
    static_assert(std::is_move_assignable_v<T>,
                  "patch targets must be move-assignable");

    auto working = T{};
    try {
        deep_copy(target, working);
    } catch (const PatchError& e) {
        logger().debug("could not build working copy: {}", e.what());
        throw PatchError{ErrorKind::could_not_copy,
                         "could not make a copy: " + e.error().message};
    }

    logger().debug("applying {} operation(s) to working copy", patch.size());
    for (auto i = std::size_t{0}; i < patch.size(); ++i) {
        const auto& op = patch[i];
        logger().trace("operation {}: {} \"{}\"", i, to_string_view(op.op), op.path);
        try {
            apply_operation(op, working, opts);
        } catch (const PatchError& e) {
            logger().debug("operation {} ({} \"{}\") failed, discarding working copy: {}",
                           i, to_string_view(op.op), op.path, e.what());
            throw;
        }
    }

    target = std::move(working);
    logger().debug("committed {} operation(s)", patch.size());
}

/// Apply a patch document given as parsed JSON.
template <typename Document, typename T>
    requires std::same_as<Document, nlohmann::json>
void apply(const Document& document, T& target, const Options& opts = {}) {
    apply(parse_patch(document), target, opts);
}

/// Apply a patch document given as JSON text.
template <typename T>
void apply(std::string_view text, T& target, const Options& opts = {}) {
    apply(parse_patch(text), target, opts);
}

/// Apply a patch document given as JSON text to the value behind `target`.
/// @throws PatchError with ErrorKind::non_pointer when `target` is null.
template <typename T>
void apply(std::string_view text, T* target, const Options& opts = {}) {
    if (target == nullptr) {
        throw PatchError{ErrorKind::non_pointer, "patch target is null"};
    }
    apply(text, *target, opts);
}

}  // namespace jsonpatch_cpp
