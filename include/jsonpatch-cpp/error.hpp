/// @file error.hpp
/// @brief Error types for the jsonpatch-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace jsonpatch_cpp {

/// Categories of errors that can occur while applying a patch.
enum class ErrorKind : std::uint8_t {
    non_pointer,        ///< The target is not a mutable, non-null reference.
    could_not_copy,     ///< The working copy could not be built.
    unmarshal,          ///< The patch document is malformed.
    incorrect_index,    ///< A segment names no index, key or field.
    garbage_value,      ///< A path tried to descend past a leaf value.
    unsupported,        ///< The value's shape has no navigation or copy rule.
    not_implemented,    ///< The operation is recognised but not implemented.
    element_not_found,  ///< A map key required by the operation is absent.
    not_equal,          ///< A test operation found a different value.
    invalid_value,      ///< An operation value is missing or does not decode.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::non_pointer:       return "non_pointer";
        case ErrorKind::could_not_copy:    return "could_not_copy";
        case ErrorKind::unmarshal:         return "unmarshal";
        case ErrorKind::incorrect_index:   return "incorrect_index";
        case ErrorKind::garbage_value:     return "garbage_value";
        case ErrorKind::unsupported:       return "unsupported";
        case ErrorKind::not_implemented:   return "not_implemented";
        case ErrorKind::element_not_found: return "element_not_found";
        case ErrorKind::not_equal:         return "not_equal";
        case ErrorKind::invalid_value:     return "invalid_value";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception carrying an Error. Every failure of the library is reported
/// by throwing a PatchError.
class PatchError : public std::runtime_error {
public:
    explicit PatchError(Error error)
        : std::runtime_error{"jsonpatch: " + error.message}, error_{std::move(error)} {}

    PatchError(ErrorKind kind, std::string message)
        : PatchError{Error{kind, std::move(message)}} {}

    /// The structured error.
    auto error() const noexcept -> const Error& { return error_; }

    /// Shorthand for error().kind.
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

/// Build the error raised when a segment reaches an unsupported shape.
inline auto unsupported_error(std::string_view segment) -> PatchError {
    return PatchError{ErrorKind::unsupported,
                      "unsupported type for key " + std::string{segment}};
}

}  // namespace jsonpatch_cpp
