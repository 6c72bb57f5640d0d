// File: src/core/errors.cpp
#include "core/errors.hpp"

namespace p3if {

const char* ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::DUPLICATE_ID: return "DuplicateId";
        case ErrorCode::DANGLING_REFERENCE: return "DanglingReference";
        case ErrorCode::OUT_OF_RANGE: return "OutOfRangeValue";
        case ErrorCode::NOT_FOUND: return "NotFound";
        case ErrorCode::TYPE_MISMATCH: return "TypeMismatch";
        case ErrorCode::PATTERN_IN_USE: return "PatternInUse";
        case ErrorCode::INVALID_ARGUMENT: return "InvalidArgument";
        case ErrorCode::PARSE_ERROR: return "ParseError";
        case ErrorCode::STORAGE_ERROR: return "StorageError";
        default: return "Unknown";
    }
}

FrameworkError::FrameworkError(ErrorCode code, const std::string& message)
    : std::runtime_error(message),
      code_(code) {
}

} // namespace p3if
