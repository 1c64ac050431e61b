/// @file error.hpp
/// @brief Error types for the outliner-cpp library.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace outliner_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    not_found,          ///< A referenced node id does not exist in the snapshot.
    invalid_operation,  ///< The edit would violate a structural invariant.
    no_op,              ///< The edit is legal but would change nothing.
    invalid_forest,     ///< A snapshot supplied from outside is malformed.
    storage_error,      ///< A storage backend could not read or write.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::not_found:         return "not_found";
        case ErrorKind::invalid_operation: return "invalid_operation";
        case ErrorKind::no_op:             return "no_op";
        case ErrorKind::invalid_forest:    return "invalid_forest";
        case ErrorKind::storage_error:     return "storage_error";
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

}  // namespace outliner_cpp
