// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <string>
#include <chrono>
#include <vector>

namespace p3if {

// PatternType: The three fixed dimensions of the framework
enum class PatternType : uint8_t {
    PROPERTY = 0,     // What something is
    PROCESS = 1,      // What something does
    PERSPECTIVE = 2,  // From where it is seen
};

// All pattern types in slot order (property, process, perspective)
inline constexpr PatternType kAllPatternTypes[] = {
    PatternType::PROPERTY,
    PatternType::PROCESS,
    PatternType::PERSPECTIVE,
};

// Convert PatternType to its lower-case dimension name
const char* ToString(PatternType type);

// Parse PatternType from a dimension name (case-insensitive)
// Throws std::invalid_argument for unknown names
PatternType ParsePatternType(const std::string& str);

// ValidationStatus: Editorial lifecycle of a pattern
enum class ValidationStatus : uint8_t {
    DRAFT = 0,
    VALIDATED = 1,
    DEPRECATED = 2,
};

const char* ToString(ValidationStatus status);
ValidationStatus ParseValidationStatus(const std::string& str);

// RemovalPolicy: What RemovePattern does with relationships that still
// reference the pattern
enum class RemovalPolicy : uint8_t {
    RESTRICT = 0,  // Refuse removal while references exist
    CASCADE = 1,   // Remove referencing relationships along with the pattern
};

const char* ToString(RemovalPolicy policy);
RemovalPolicy ParseRemovalPolicy(const std::string& str);

// Generate a random RFC 4122 version 4 identifier (thread-safe)
std::string GenerateId();

// Timestamp: Microsecond-precision wall-clock time point
class Timestamp {
public:
    using ClockType = std::chrono::system_clock;
    using TimePoint = ClockType::time_point;
    using Duration = std::chrono::microseconds;

    // Create timestamp for current time
    static Timestamp Now();

    // Create timestamp from microseconds since the Unix epoch
    static Timestamp FromMicros(int64_t micros);

    // Parse "YYYY-MM-DDTHH:MM:SS[.ffffff][Z|+00:00]" (UTC)
    // Throws std::invalid_argument on malformed input
    static Timestamp FromIso8601(const std::string& str);

    // Default constructor creates epoch timestamp
    Timestamp() : time_point_(TimePoint{}) {}

    // Get microseconds since epoch
    int64_t ToMicros() const;

    // Format as "YYYY-MM-DDTHH:MM:SS.ffffffZ"
    std::string ToIso8601() const;

    // Get duration since another timestamp
    Duration operator-(const Timestamp& other) const {
        return std::chrono::duration_cast<Duration>(time_point_ - other.time_point_);
    }

    // Comparison operators
    bool operator<(const Timestamp& other) const { return time_point_ < other.time_point_; }
    bool operator>(const Timestamp& other) const { return time_point_ > other.time_point_; }
    bool operator<=(const Timestamp& other) const { return time_point_ <= other.time_point_; }
    bool operator>=(const Timestamp& other) const { return time_point_ >= other.time_point_; }
    bool operator==(const Timestamp& other) const { return time_point_ == other.time_point_; }
    bool operator!=(const Timestamp& other) const { return time_point_ != other.time_point_; }

    // String conversion
    std::string ToString() const;

private:
    explicit Timestamp(TimePoint tp) : time_point_(tp) {}
    TimePoint time_point_;
};

// String helpers shared by the stores and the codec
std::string ToLower(const std::string& str);
std::string Trim(const std::string& str);

} // namespace p3if
