// File: src/framework/metrics_cache.hpp
#pragma once

#include "framework/validator.hpp"
#include "storage/pattern_store.hpp"
#include "storage/relationship_store.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace p3if {

/// Aggregate statistics over both stores
struct Metrics {
    size_t total_patterns{0};
    size_t total_relationships{0};
    double average_relationship_strength{0.0};
    double average_confidence{0.0};
    size_t domain_count{0};
    size_t orphaned_patterns{0};
    size_t deprecated_patterns{0};
    size_t validation_issues{0};

    // Per-dimension breakdown
    size_t property_count{0};
    size_t process_count{0};
    size_t perspective_count{0};

    bool operator==(const Metrics& other) const;
    bool operator!=(const Metrics& other) const { return !(*this == other); }

    std::string ToString() const;
};

/// Cached Metrics with timeout and explicit invalidation
///
/// One instance per Framework. The cached value is served while it has not
/// been invalidated and is younger than the timeout. Cache fields are guarded
/// by an internal mutex; callers hold the framework lock (shared) around
/// GetOrCompute so the two stores cannot change mid-computation.
class MetricsCache {
public:
    /// Cache statistics
    struct Stats {
        uint64_t hits{0};
        uint64_t misses{0};
        uint64_t computations{0};
        uint64_t invalidations{0};
    };

    using Clock = std::chrono::steady_clock;

    /// @param timeout Maximum age of a cached value (default 300 s)
    explicit MetricsCache(std::chrono::milliseconds timeout = std::chrono::seconds(300));

    MetricsCache(const MetricsCache&) = delete;
    MetricsCache& operator=(const MetricsCache&) = delete;

    /// Return the cached metrics, recomputing when stale or invalidated
    Metrics GetOrCompute(const PatternStore& patterns,
                         const RelationshipStore& relationships,
                         const Validator& validator);

    /// Drop the cached value immediately
    void Invalidate();

    /// True if a fresh value is cached
    bool IsValid() const;

    std::chrono::milliseconds GetTimeout() const;
    /// Changing the timeout drops the cached value; zero disables caching
    void SetTimeout(std::chrono::milliseconds timeout);

    Stats GetStats() const;

    /// Uncached computation (also used directly by tests)
    static Metrics Compute(const PatternStore& patterns,
                           const RelationshipStore& relationships,
                           const Validator& validator);

private:
    bool IsFreshLocked(Clock::time_point now) const;

    mutable std::mutex mutex_;
    std::chrono::milliseconds timeout_;
    std::optional<Metrics> cached_;
    Clock::time_point computed_at_;
    Stats stats_;
};

} // namespace p3if
