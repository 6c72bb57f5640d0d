// File: src/core/types.cpp
#include "core/types.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <random>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>

namespace p3if {

// Enum implementations

const char* ToString(PatternType type) {
    switch (type) {
        case PatternType::PROPERTY: return "property";
        case PatternType::PROCESS: return "process";
        case PatternType::PERSPECTIVE: return "perspective";
        default: return "unknown";
    }
}

PatternType ParsePatternType(const std::string& str) {
    std::string lower = ToLower(Trim(str));
    if (lower == "property") return PatternType::PROPERTY;
    if (lower == "process") return PatternType::PROCESS;
    if (lower == "perspective") return PatternType::PERSPECTIVE;
    throw std::invalid_argument("Unknown PatternType: " + str);
}

const char* ToString(ValidationStatus status) {
    switch (status) {
        case ValidationStatus::DRAFT: return "draft";
        case ValidationStatus::VALIDATED: return "validated";
        case ValidationStatus::DEPRECATED: return "deprecated";
        default: return "unknown";
    }
}

ValidationStatus ParseValidationStatus(const std::string& str) {
    std::string lower = ToLower(Trim(str));
    if (lower == "draft") return ValidationStatus::DRAFT;
    if (lower == "validated") return ValidationStatus::VALIDATED;
    if (lower == "deprecated") return ValidationStatus::DEPRECATED;
    throw std::invalid_argument("Unknown ValidationStatus: " + str);
}

const char* ToString(RemovalPolicy policy) {
    switch (policy) {
        case RemovalPolicy::RESTRICT: return "restrict";
        case RemovalPolicy::CASCADE: return "cascade";
        default: return "unknown";
    }
}

RemovalPolicy ParseRemovalPolicy(const std::string& str) {
    std::string lower = ToLower(Trim(str));
    if (lower == "restrict") return RemovalPolicy::RESTRICT;
    if (lower == "cascade") return RemovalPolicy::CASCADE;
    throw std::invalid_argument("Unknown RemovalPolicy: " + str);
}

// Identifier generation

std::string GenerateId() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t hi = dist(engine);
    uint64_t lo = dist(engine);

    // Version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << '-'
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (hi & 0xFFFF) << '-'
        << std::setw(4) << (lo >> 48) << '-'
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

// Timestamp implementations

Timestamp Timestamp::Now() {
    return Timestamp(std::chrono::time_point_cast<Duration>(ClockType::now()));
}

Timestamp Timestamp::FromMicros(int64_t micros) {
    TimePoint tp{std::chrono::duration_cast<ClockType::duration>(Duration(micros))};
    return Timestamp(tp);
}

Timestamp Timestamp::FromIso8601(const std::string& str) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;

    if (std::sscanf(str.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        throw std::invalid_argument("Malformed timestamp: " + str);
    }

    int64_t fraction_micros = 0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < str.size() && str[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
            if (digits < 6) {
                fraction_micros = fraction_micros * 10 + (str[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        for (; digits < 6; ++digits) {
            fraction_micros *= 10;
        }
    }

    std::string suffix = str.substr(pos);
    if (!suffix.empty() && suffix != "Z" && suffix != "+00:00") {
        throw std::invalid_argument("Only UTC timestamps are supported: " + str);
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    int64_t seconds = static_cast<int64_t>(timegm(&tm));
    return FromMicros(seconds * 1000000 + fraction_micros);
}

int64_t Timestamp::ToMicros() const {
    auto duration = time_point_.time_since_epoch();
    return std::chrono::duration_cast<Duration>(duration).count();
}

std::string Timestamp::ToIso8601() const {
    int64_t micros = ToMicros();
    int64_t seconds = micros / 1000000;
    int64_t remaining_micros = micros % 1000000;
    if (remaining_micros < 0) {
        remaining_micros += 1000000;
        --seconds;
    }

    std::time_t tt = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << remaining_micros << 'Z';
    return oss.str();
}

std::string Timestamp::ToString() const {
    return "Timestamp(" + ToIso8601() + ")";
}

// String helpers

std::string ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string Trim(const std::string& str) {
    const char* whitespace = " \t\n\r\f\v";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

} // namespace p3if
