// File: src/core/errors.hpp
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace p3if {

/// Failure categories raised by framework operations
enum class ErrorCode : uint8_t {
    DUPLICATE_ID = 0,        // Id already present in the target store
    DANGLING_REFERENCE = 1,  // Relationship slot names an unknown pattern
    OUT_OF_RANGE = 2,        // Score outside [0.0, 1.0]
    NOT_FOUND = 3,           // Required pattern or relationship is absent
    TYPE_MISMATCH = 4,       // Pattern variant does not fit the slot or swap
    PATTERN_IN_USE = 5,      // Removal refused while relationships reference it
    INVALID_ARGUMENT = 6,    // Malformed field value (empty name, bad enum)
    PARSE_ERROR = 7,         // Malformed JSON document
    STORAGE_ERROR = 8,       // Persistence collaborator failed
};

const char* ToString(ErrorCode code);

/// Exception carrying an ErrorCode
///
/// All contract violations of the framework API are reported with this type.
/// Lookups and removals of absent items are not errors; they return
/// std::nullopt or false. what() is the bare message; ToString(code())
/// names the kind.
class FrameworkError : public std::runtime_error {
public:
    FrameworkError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace p3if
