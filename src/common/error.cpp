// =============================================================================
// sgff - Error Handling Framework Implementation
// =============================================================================
// Implementation of error handling utilities and exception classes.
// =============================================================================

#include "sgff/common/error.h"

#include <fmt/format.h>
#include <sstream>

namespace sgff {

namespace {

/// @brief Throw an exception whose class has no context constructor.
template <typename E>
[[noreturn]] void throwWithContext(E ex, const std::optional<ErrorContext>& context) {
    if (context) {
        ex.attachContext(*context);
    }
    throw ex;
}

}  // namespace

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (blockType.has_value()) {
        oss << "block type: " << static_cast<int>(*blockType);
        hasContent = true;
    }

    if (byteOffset.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "offset: 0x" << std::hex << *byteOffset << std::dec;
        hasContent = true;
    }

    if (nestingDepth.has_value() && *nestingDepth > 0) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "depth: " << *nestingDepth;
        hasContent = true;
    }

    // Add source location in debug builds
#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// SGFFException Implementation
// =============================================================================

void SGFFException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// UnsupportedTraceCompressionError Implementation
// =============================================================================

std::string UnsupportedTraceCompressionError::formatSelector(std::uint8_t selector) {
    return fmt::format("unsupported trace chunk compression selector: 0x{:02x}", selector);
}

// =============================================================================
// Error Implementation
// =============================================================================

std::string Error::describe() const {
    std::string result = fmt::format("[{}] {}", errorCodeToString(code_), message_);
    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            result += " (" + contextStr + ")";
        }
    }
    return result;
}

[[noreturn]] void Error::throwException() const {
    const ErrorContext context = context_.value_or(ErrorContext{});
    switch (code_) {
        case ErrorCode::kInvalidArgument:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_, context);
        case ErrorCode::kFormatError:
            throw FormatError(message_, context);
        case ErrorCode::kInvalidHeader:
            throw InvalidHeaderError(message_, context);
        case ErrorCode::kTruncatedBlock:
            throw TruncatedBlockError(message_, context);
        case ErrorCode::kTruncatedSequence:
            throw TruncatedSequenceError(message_, context);
        case ErrorCode::kUnsupportedTraceCompression:
            throwWithContext(UnsupportedTraceCompressionError(message_), context_);
        case ErrorCode::kInvalidMagic:
            throw InvalidMagicError(message_, context);
        case ErrorCode::kUnknownSequenceType:
            throw UnknownSequenceTypeError(message_, context);
        case ErrorCode::kNestingTooDeep:
            throw NestingTooDeepError(message_, context);
        case ErrorCode::kCyclicHistory:
            throw CyclicHistoryError(message_, context);
        case ErrorCode::kMissingTrace:
            throw MissingTraceError(message_, context);
        case ErrorCode::kMarkupError:
            throw MarkupError(message_, context);
        case ErrorCode::kDecompressionFailed:
            throwWithContext(DecompressionError(message_), context_);
        case ErrorCode::kCompressionFailed:
            throwWithContext(CompressionError(message_), context_);
        case ErrorCode::kSerializeError:
            throw SerializeError(message_, context);
        case ErrorCode::kSuccess:
            // Should not happen, but throw base exception
            throw SGFFException(ErrorCode::kSuccess, message_);
    }
    // Fallback for unknown error codes
    throw SGFFException(code_, message_);
}

}  // namespace sgff
