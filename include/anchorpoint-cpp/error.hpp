/// @file error.hpp
/// @brief Error types for the anchorpoint-cpp library.

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace anchorpoint_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_selector,    ///< A selector violates its construction invariant.
    text_selection,      ///< A quote matched zero or several passages.
    range_underflow,     ///< A shift would move a start position below zero.
    out_of_bounds,       ///< A selector reaches past the end of a document.
    incompatible_range,  ///< Two disjoint selectors cannot form one interval.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_selector:   return "invalid_selector";
        case ErrorKind::text_selection:     return "text_selection";
        case ErrorKind::range_underflow:    return "range_underflow";
        case ErrorKind::out_of_bounds:      return "out_of_bounds";
        case ErrorKind::incompatible_range: return "incompatible_range";
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

/// Longest run of document or quote text copied into an error message.
inline constexpr std::size_t max_quoted_length = 100;

/// Shorten text for inclusion in an error message.
///
/// Text longer than max_quoted_length is cut and suffixed with "...".
auto truncate_for_message(std::string_view text) -> std::string;

/// Base class of every exception thrown by the library.
///
/// Carries the structured Error so callers can branch on the kind
/// without matching on the concrete exception type.
class SelectorError : public std::runtime_error {
public:
    explicit SelectorError(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    /// The structured error record.
    auto error() const noexcept -> const Error& { return error_; }

    /// Shorthand for error().kind.
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

/// A selector was constructed in violation of its invariant.
class InvalidSelectorError : public SelectorError {
public:
    explicit InvalidSelectorError(std::string message)
        : SelectorError{Error{ErrorKind::invalid_selector, std::move(message)}} {}
};

/// A quote selector could not be resolved to exactly one passage.
class TextSelectionError : public SelectorError {
public:
    explicit TextSelectionError(std::string message)
        : SelectorError{Error{ErrorKind::text_selection, std::move(message)}} {}
};

/// A shift would push a start position below zero.
class RangeUnderflowError : public SelectorError {
public:
    explicit RangeUnderflowError(std::string message)
        : SelectorError{Error{ErrorKind::range_underflow, std::move(message)}} {}
};

/// A selector extends beyond the document it is applied to.
class OutOfBoundsError : public SelectorError {
public:
    explicit OutOfBoundsError(std::string message)
        : SelectorError{Error{ErrorKind::out_of_bounds, std::move(message)}} {}
};

/// Two selectors that neither overlap nor touch were asked to form one
/// interval. Use PositionSelector::combine() to get a PositionSet instead.
class IncompatibleRangeError : public SelectorError {
public:
    explicit IncompatibleRangeError(std::string message)
        : SelectorError{Error{ErrorKind::incompatible_range, std::move(message)}} {}
};

}  // namespace anchorpoint_cpp
