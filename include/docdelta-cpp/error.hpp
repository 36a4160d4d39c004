/// @file error.hpp
/// @brief Error types for the docdelta-cpp library.

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace docdelta_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    path_not_found,       ///< A mapping key on the path does not exist.
    index_out_of_bounds,  ///< A sequence index is outside the valid range.
    invalid_path,         ///< The path is malformed for the node it addresses.
    type_mismatch,        ///< The path continues below a scalar.
    apply_failed,         ///< An operation of a patch could not be applied.
    decode_error,         ///< The document text could not be decoded.
    encode_error,         ///< The tree could not be encoded to text.
    invalid_patch,        ///< A patch document is malformed.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::path_not_found:      return "path_not_found";
        case ErrorKind::index_out_of_bounds: return "index_out_of_bounds";
        case ErrorKind::invalid_path:        return "invalid_path";
        case ErrorKind::type_mismatch:       return "type_mismatch";
        case ErrorKind::apply_failed:        return "apply_failed";
        case ErrorKind::decode_error:        return "decode_error";
        case ErrorKind::encode_error:        return "encode_error";
        case ErrorKind::invalid_patch:       return "invalid_patch";
    }
    return "unknown";
}

/// True for the four kinds a path resolver can report.
constexpr auto is_path_error(ErrorKind kind) noexcept -> bool {
    return kind == ErrorKind::path_not_found ||
           kind == ErrorKind::index_out_of_bounds ||
           kind == ErrorKind::invalid_path ||
           kind == ErrorKind::type_mismatch;
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

// -- Exceptions ---------------------------------------------------------------

/// Base class of every exception thrown by the library.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error err)
        : std::runtime_error{err.message}, error_{std::move(err)} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

/// A path could not be resolved or mutated.
///
/// Carries the offending path in JSON Pointer form.
class PathError : public Exception {
public:
    PathError(ErrorKind kind, std::string pointer, std::string_view reason)
        : Exception{Error{kind, std::string{reason} + " at '" + pointer + "'"}},
          pointer_{std::move(pointer)} {}

    auto pointer() const noexcept -> const std::string& { return pointer_; }

private:
    std::string pointer_;
};

/// An operation of a patch failed; no part of the patch was applied.
class ApplyError : public Exception {
public:
    ApplyError(std::size_t index, PathError cause)
        : Exception{Error{ErrorKind::apply_failed,
                          "operation " + std::to_string(index) + " failed: " + cause.what()}},
          index_{index}, cause_{std::move(cause)} {}

    /// Position of the failing operation within the patch.
    auto index() const noexcept -> std::size_t { return index_; }

    /// The resolver error that made the operation fail.
    auto cause() const noexcept -> const PathError& { return cause_; }

private:
    std::size_t index_;
    PathError cause_;
};

/// Malformed document text.
class DecodeError : public Exception {
public:
    /// @param line 1-based line of the failure, or 0 when unknown.
    DecodeError(std::string message, std::size_t line)
        : Exception{Error{ErrorKind::decode_error, std::move(message)}}, line_{line} {}

    auto line() const noexcept -> std::size_t { return line_; }

private:
    std::size_t line_;
};

/// The emitter could not produce text for a tree.
class EncodeError : public Exception {
public:
    explicit EncodeError(std::string message)
        : Exception{Error{ErrorKind::encode_error, std::move(message)}} {}
};

/// A patch document does not describe a valid patch.
class PatchFormatError : public Exception {
public:
    explicit PatchFormatError(std::string message)
        : Exception{Error{ErrorKind::invalid_patch, std::move(message)}} {}
};

}  // namespace docdelta_cpp
