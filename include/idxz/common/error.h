// =============================================================================
// idxz - Error Handling Framework
// =============================================================================
// Error handling for the idxz library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - IDXZException hierarchy for fatal (setup) errors
// - Result<T, E> type for frame-scoped and record-scoped errors (std::expected)
// - Error context (file, line, offset) support
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (file not found, read/write failure)
// - 3: Format error (malformed index document)
// - 4: Checksum verification failure
// - 5: Compression failure
// =============================================================================

#ifndef IDXZ_COMMON_ERROR_H
#define IDXZ_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace idxz {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    /// @note Invalid command-line arguments, bad block size, bad thread count.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note File not found, read/write failure, permission denied, etc.
    kIOError = 2,

    /// @brief Format error.
    /// @note Malformed or unreadable frame index document.
    kFormatError = 3,

    /// @brief Checksum verification failure.
    /// @note A frame's embedded content checksum did not match.
    kChecksumError = 4,

    /// @brief Compression failure reported by the frame codec.
    kCompressionError = 5,

    /// @brief Invalid argument value.
    kInvalidArgument = 6,

    /// @brief File not found.
    kFileNotFound = 7,

    /// @brief File already exists.
    kFileExists = 8,

    /// @brief Failed to open file.
    kFileOpenFailed = 9,

    /// @brief Decompression failed.
    kDecompressionFailed = 10,

    /// @brief Corrupted data detected.
    kCorruptedData = 11
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kChecksumError:
            return "checksum error";
        case ErrorCode::kCompressionError:
            return "compression error";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kFileNotFound:
            return "file not found";
        case ErrorCode::kFileExists:
            return "file exists";
        case ErrorCode::kFileOpenFailed:
            return "file open failed";
        case ErrorCode::kDecompressionFailed:
            return "decompression failed";
        case ErrorCode::kCorruptedData:
            return "corrupted data";
    }
    return "unknown error";
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
/// @note Identifies the file, input line and byte offset an error refers to.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Line number inside the input (if applicable).
    std::optional<std::uint64_t> lineNumber;

    /// @brief Byte offset in file where error occurred (if applicable).
    std::optional<std::uint64_t> byteOffset;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with file path.
    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    /// @brief Set the line number.
    ErrorContext& withLine(std::uint64_t line) {
        lineNumber = line;
        return *this;
    }

    /// @brief Set the byte offset.
    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all idxz errors.
/// @note Provides error code, message, and optional context.
class IDXZException : public std::exception {
public:
    /// @brief Construct with error code and message.
    IDXZException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    IDXZException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~IDXZException() override = default;

    IDXZException(const IDXZException&) = default;
    IDXZException(IDXZException&&) noexcept = default;
    IDXZException& operator=(const IDXZException&) = default;
    IDXZException& operator=(IDXZException&&) noexcept = default;

    /// @brief Get the formatted error message (with category and context).
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
/// @note Thrown for invalid block sizes, compression levels, thread counts,
///       strategy names, etc.
class UsageError : public IDXZException {
public:
    explicit UsageError(std::string message)
        : IDXZException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : IDXZException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
/// @note Thrown for missing files, read/write failures, permission denied.
class IOError : public IDXZException {
public:
    explicit IOError(std::string message)
        : IDXZException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : IDXZException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct with a more specific I/O error code.
    /// @param code One of kFileNotFound, kFileExists, kFileOpenFailed, kIOError.
    IOError(ErrorCode code, std::string message)
        : IDXZException(code, std::move(message)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : IDXZException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Construct from system error code with context.
    IOError(std::string message, std::error_code ec, ErrorContext context)
        : IDXZException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                        std::move(context)),
          systemError_(ec) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for format errors (exit code 3).
/// @note Thrown when the frame index document is malformed.
class FormatError : public IDXZException {
public:
    explicit FormatError(std::string message)
        : IDXZException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : IDXZException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief Exception for frame compression failures (exit code 5).
class CompressionError : public IDXZException {
public:
    explicit CompressionError(std::string message)
        : IDXZException(ErrorCode::kCompressionError, std::move(message)) {}

    CompressionError(std::string message, ErrorContext context)
        : IDXZException(ErrorCode::kCompressionError, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from an IDXZException.
    explicit Error(const IDXZException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail without unwinding.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Execute a function and convert exceptions to Result.
/// @note Used at frame boundaries so a single frame cannot unwind a whole pass.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) -> Result<std::conditional_t<
    std::is_void_v<decltype(func())>, std::monostate, decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const IDXZException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kIOError, ex.what()});
    }
}

}  // namespace idxz

#endif  // IDXZ_COMMON_ERROR_H
