/// @file patch.hpp
/// @brief Patch documents: operation kinds, operations and parsing.

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsonpatch_cpp {

/// The six RFC 6902 operation kinds. copy and move are accepted by the
/// parser but always fail when applied.
enum class OpType : std::uint8_t {
    add,
    remove,
    replace,
    move,
    copy,
    test,
};

/// Convert an OpType to its wire name.
constexpr auto to_string_view(OpType op) noexcept -> std::string_view {
    switch (op) {
        case OpType::add:     return "add";
        case OpType::remove:  return "remove";
        case OpType::replace: return "replace";
        case OpType::move:    return "move";
        case OpType::copy:    return "copy";
        case OpType::test:    return "test";
    }
    return "unknown";
}

/// Parse a wire name ("add", "remove", ...) into an OpType.
auto parse_op_type(std::string_view name) -> std::optional<OpType>;

/// A single patch operation.
///
/// `value` is kept as raw JSON and decoded only when the operation is
/// applied, into the type found at the target location.
struct Operation {
    OpType op{OpType::add};               ///< What to do.
    std::string path;                     ///< '/'-delimited target path.
    std::string from;                     ///< Source path (copy/move only).
    std::optional<nlohmann::json> value;  ///< Operation value, if given.

    auto operator==(const Operation&) const -> bool = default;
};

/// An ordered list of operations, applied front to back.
using Patch = std::vector<Operation>;

/// Serialize an operation to its wire object.
void to_json(nlohmann::json& j, const Operation& op);

/// Parse a wire object into an operation.
/// @throws PatchError with ErrorKind::unmarshal when `op` or `path` are
///         missing or not strings, `op` is unknown or `from` is not a string.
void from_json(const nlohmann::json& j, Operation& op);

/// Parse a patch document (a JSON array of operations).
/// @throws PatchError with ErrorKind::unmarshal on any malformed input.
auto parse_patch(const nlohmann::json& document) -> Patch;

/// Parse patch document text.
/// @throws PatchError with ErrorKind::unmarshal when the text is not valid
///         JSON or not a valid patch document.
auto parse_patch(std::string_view text) -> Patch;

}  // namespace jsonpatch_cpp
