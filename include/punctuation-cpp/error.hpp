/// @file error.hpp
/// @brief Error types for the punctuation-cpp library.

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace punctuation_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_configuration,  ///< The mark set is not a usable character sequence.
    decoding_error,         ///< A serialized value could not be decoded.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_configuration: return "invalid_configuration";
        case ErrorKind::decoding_error:        return "decoding_error";
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

/// Exception thrown by constructors and decoders that cannot return an Error.
///
/// Derives from std::runtime_error so callers that only catch standard
/// exceptions still see the message through what().
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    /// The structured error carried by this exception.
    auto error() const noexcept -> const Error& { return error_; }

    /// Shorthand for error().kind.
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

/// Check whether a mark set can configure a MarkMatcher.
///
/// A mark set is rejected when it is not well-formed UTF-8, or when it
/// contains one of the code points reserved for the digit guard
/// (U+FDD0..U+FDEF).
/// @return nullopt if the marks are usable, otherwise the reason.
auto validate_marks(std::string_view marks) -> std::optional<Error>;

}  // namespace punctuation_cpp
