// =============================================================================
// sgff - Error Handling Framework
// =============================================================================
// Structured error handling for the SnapGene container codec.
//
// This module provides:
// - ErrorCode enum, one value per failure kind of the codec
// - SGFFException hierarchy thrown by the individual codecs
// - Result<T, E> type returned by the public entry points (std::expected)
// - ErrorContext carrying the failing block type and byte offset
//
// Codecs throw; SgffReader::parse and SgffWriter::serialize convert the
// exception into a Result via tryExecute().
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef SGFF_COMMON_ERROR_H
#define SGFF_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace sgff {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes for every failure kind of the codec.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Invalid option value or API misuse.
    kInvalidArgument = 1,

    /// @brief I/O error.
    kIOError = 2,

    /// @brief Generic format error.
    kFormatError = 3,

    /// @brief The 19-byte file header does not match the fixed layout.
    kInvalidHeader = 4,

    /// @brief A declared length exceeds the remaining bytes.
    kTruncatedBlock = 5,

    /// @brief A sequence block is shorter than its declared lengths.
    kTruncatedSequence = 6,

    /// @brief A ZTR chunk uses a compression selector other than raw/zlib.
    kUnsupportedTraceCompression = 7,

    /// @brief The ZTR magic bytes are wrong.
    kInvalidMagic = 8,

    /// @brief A history entry carries an unknown sequence-type tag.
    kUnknownSequenceType = 9,

    /// @brief Nested containers or history nodes exceed the depth budget.
    kNestingTooDeep = 10,

    /// @brief The history markup declares a node identifier twice.
    kCyclicHistory = 11,

    /// @brief A trace container has no type-18 trace block.
    kMissingTrace = 12,

    /// @brief Embedded markup could not be parsed.
    kMarkupError = 13,

    /// @brief LZMA or zlib decompression failed.
    kDecompressionFailed = 14,

    /// @brief LZMA or zlib compression failed.
    kCompressionFailed = 15,

    /// @brief A decoded value violates an invariant and cannot be encoded.
    kSerializeError = 16
};

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kInvalidHeader:
            return "invalid header";
        case ErrorCode::kTruncatedBlock:
            return "truncated block";
        case ErrorCode::kTruncatedSequence:
            return "truncated sequence";
        case ErrorCode::kUnsupportedTraceCompression:
            return "unsupported trace compression";
        case ErrorCode::kInvalidMagic:
            return "invalid magic";
        case ErrorCode::kUnknownSequenceType:
            return "unknown sequence type";
        case ErrorCode::kNestingTooDeep:
            return "nesting too deep";
        case ErrorCode::kCyclicHistory:
            return "cyclic history";
        case ErrorCode::kMissingTrace:
            return "missing trace";
        case ErrorCode::kMarkupError:
            return "markup error";
        case ErrorCode::kDecompressionFailed:
            return "decompression failed";
        case ErrorCode::kCompressionFailed:
            return "compression failed";
        case ErrorCode::kSerializeError:
            return "serialize error";
    }
    return "unknown error";
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
/// @note Offsets are relative to the stream the failing block was read from;
///       nestingDepth tells how many containers deep that stream is.
struct ErrorContext {
    /// @brief TLV block type id where the error occurred (if applicable).
    std::optional<std::uint8_t> blockType;

    /// @brief Byte offset of the failing block or field (if applicable).
    std::optional<std::uint64_t> byteOffset;

    /// @brief Nesting depth of the stream (0 = top level).
    std::optional<std::uint32_t> nestingDepth;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Set the block type.
    /// @return Reference to this for method chaining.
    ErrorContext& withBlock(std::uint8_t type) {
        blockType = type;
        return *this;
    }

    /// @brief Set the byte offset.
    /// @return Reference to this for method chaining.
    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief Set the nesting depth.
    /// @return Reference to this for method chaining.
    ErrorContext& withDepth(std::uint32_t depth) {
        nestingDepth = depth;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all sgff errors.
class SGFFException : public std::exception {
public:
    /// @brief Construct with error code and message.
    SGFFException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    SGFFException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~SGFFException() override = default;

    SGFFException(const SGFFException&) = default;
    SGFFException(SGFFException&&) noexcept = default;
    SGFFException& operator=(const SGFFException&) = default;
    SGFFException& operator=(SGFFException&&) noexcept = default;

    /// @brief Get the formatted error message.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// @brief Attach context to an exception raised without one.
    /// @note Used by the block dispatcher while the exception propagates.
    void attachContext(ErrorContext context) {
        context_ = std::move(context);
        formatWhat();
    }

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

/// @brief Exception for invalid options or API misuse.
class UsageError : public SGFFException {
public:
    explicit UsageError(std::string message)
        : SGFFException(ErrorCode::kInvalidArgument, std::move(message)) {}
};

/// @brief Exception for I/O failures.
class IOError : public SGFFException {
public:
    explicit IOError(std::string message)
        : SGFFException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : SGFFException(ErrorCode::kIOError, std::move(message), std::move(context)) {}
};

/// @brief Base exception for malformed input.
/// @note Every decode failure of a recognized structure derives from this.
class FormatError : public SGFFException {
public:
    explicit FormatError(std::string message)
        : SGFFException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : SGFFException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}

protected:
    FormatError(ErrorCode code, std::string message) : SGFFException(code, std::move(message)) {}

    FormatError(ErrorCode code, std::string message, ErrorContext context)
        : SGFFException(code, std::move(message), std::move(context)) {}
};

/// @brief Exception for a file whose 19-byte header mismatches the fixed layout.
class InvalidHeaderError : public FormatError {
public:
    explicit InvalidHeaderError(std::string message)
        : FormatError(ErrorCode::kInvalidHeader, std::move(message)) {}

    InvalidHeaderError(std::string message, ErrorContext context)
        : FormatError(ErrorCode::kInvalidHeader, std::move(message), std::move(context)) {}
};

/// @brief Exception for a block or chunk whose declared length exceeds the input.
class TruncatedBlockError : public FormatError {
public:
    explicit TruncatedBlockError(std::string message)
        : FormatError(ErrorCode::kTruncatedBlock, std::move(message)) {}

    TruncatedBlockError(std::string message, ErrorContext context)
        : FormatError(ErrorCode::kTruncatedBlock, std::move(message), std::move(context)) {}
};

/// @brief Exception for sequence data shorter than its declared lengths.
class TruncatedSequenceError : public FormatError {
public:
    explicit TruncatedSequenceError(std::string message)
        : FormatError(ErrorCode::kTruncatedSequence, std::move(message)) {}

    TruncatedSequenceError(std::string message, ErrorContext context)
        : FormatError(ErrorCode::kTruncatedSequence, std::move(message), std::move(context)) {}
};

/// @brief Exception for a trace payload without the ZTR magic.
class InvalidMagicError : public FormatError {
public:
    explicit InvalidMagicError(std::string message)
        : FormatError(ErrorCode::kInvalidMagic, std::move(message)) {}

    InvalidMagicError(std::string message, ErrorContext context)
        : FormatError(ErrorCode::kInvalidMagic, std::move(message), std::move(context)) {}
};

/// @brief Exception for an unknown history-entry sequence tag.
class UnknownSequenceTypeError : public FormatError {
public:
    explicit UnknownSequenceTypeError(std::string message)
        : FormatError(ErrorCode::kUnknownSequenceType, std::move(message)) {}

    UnknownSequenceTypeError(std::string message, ErrorContext context)
        : FormatError(ErrorCode::kUnknownSequenceType, std::move(message), std::move(context)) {}
};

/// @brief Exception raised when the nesting depth budget is exhausted.
class NestingTooDeepError : public FormatError {
public:
    explicit NestingTooDeepError(std::string message)
        : FormatError(ErrorCode::kNestingTooDeep, std::move(message)) {}

    NestingTooDeepError(std::string message, ErrorContext context)
        : FormatError(ErrorCode::kNestingTooDeep, std::move(message), std::move(context)) {}
};

/// @brief Exception for history markup that reuses a node identifier.
class CyclicHistoryError : public FormatError {
public:
    explicit CyclicHistoryError(std::string message)
        : FormatError(ErrorCode::kCyclicHistory, std::move(message)) {}

    CyclicHistoryError(std::string message, ErrorContext context)
        : FormatError(ErrorCode::kCyclicHistory, std::move(message), std::move(context)) {}
};

/// @brief Exception for a trace container without a trace block.
class MissingTraceError : public FormatError {
public:
    explicit MissingTraceError(std::string message)
        : FormatError(ErrorCode::kMissingTrace, std::move(message)) {}

    MissingTraceError(std::string message, ErrorContext context)
        : FormatError(ErrorCode::kMissingTrace, std::move(message), std::move(context)) {}
};

/// @brief Exception for embedded markup that cannot be parsed.
class MarkupError : public FormatError {
public:
    explicit MarkupError(std::string message)
        : FormatError(ErrorCode::kMarkupError, std::move(message)) {}

    MarkupError(std::string message, ErrorContext context)
        : FormatError(ErrorCode::kMarkupError, std::move(message), std::move(context)) {}
};

/// @brief Exception for a ZTR chunk with an unknown compression selector.
class UnsupportedTraceCompressionError : public FormatError {
public:
    explicit UnsupportedTraceCompressionError(std::string message)
        : FormatError(ErrorCode::kUnsupportedTraceCompression, std::move(message)) {}

    /// @brief Construct with the offending selector byte.
    explicit UnsupportedTraceCompressionError(std::uint8_t selector)
        : FormatError(ErrorCode::kUnsupportedTraceCompression, formatSelector(selector)),
          selector_(selector) {}

    /// @brief Get the unsupported selector byte (if available).
    [[nodiscard]] std::optional<std::uint8_t> selector() const noexcept { return selector_; }

private:
    static std::string formatSelector(std::uint8_t selector);

    std::optional<std::uint8_t> selector_;
};

/// @brief Exception for LZMA/zlib decompression failures.
class DecompressionError : public SGFFException {
public:
    explicit DecompressionError(std::string message)
        : SGFFException(ErrorCode::kDecompressionFailed, std::move(message)) {}
};

/// @brief Exception for LZMA/zlib compression failures.
class CompressionError : public SGFFException {
public:
    explicit CompressionError(std::string message)
        : SGFFException(ErrorCode::kCompressionFailed, std::move(message)) {}
};

/// @brief Exception for values that cannot be re-encoded.
class SerializeError : public SGFFException {
public:
    explicit SerializeError(std::string message)
        : SGFFException(ErrorCode::kSerializeError, std::move(message)) {}

    SerializeError(std::string message, ErrorContext context)
        : SGFFException(ErrorCode::kSerializeError, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode, message and context.
class Error {
public:
    /// @brief Construct with error code and message.
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    /// @brief Construct from an SGFFException, keeping its context.
    explicit Error(const SGFFException& ex)
        : code_(ex.code()), message_(ex.message()), context_(ex.context()) {}

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the error message.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context, if the failure was attributed to a block.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Type id of the failing block, if known.
    [[nodiscard]] std::optional<std::uint8_t> blockType() const noexcept {
        return context_ ? context_->blockType : std::nullopt;
    }

    /// @brief Byte offset of the failing block, if known.
    [[nodiscard]] std::optional<std::uint64_t> byteOffset() const noexcept {
        return context_ ? context_->byteOffset : std::nullopt;
    }

    /// @brief Message with code and context, as SGFFException::what() formats it.
    [[nodiscard]] std::string describe() const;

    /// @brief Throw the matching exception type.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result from an exception.
template <typename T>
[[nodiscard]] Result<T> makeError(const SGFFException& ex) {
    return std::unexpected(Error{ex});
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

/// @brief Create a success void result.
[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

/// @brief Create an error void result.
[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to its value, throwing on error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Throw if a VoidResult contains an error.
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Execute a function and convert exceptions to Result.
/// @note std::bad_alloc and other non-sgff exceptions map to kFormatError
///       because they can only arise from sizes read out of the input.
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
    } catch (const SGFFException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kFormatError, ex.what()});
    }
}

}  // namespace sgff

#endif  // SGFF_COMMON_ERROR_H
