// File: src/framework/metrics_cache.cpp
#include "framework/metrics_cache.hpp"
#include <sstream>

namespace p3if {

// ============================================================================
// Metrics
// ============================================================================

bool Metrics::operator==(const Metrics& other) const {
    return total_patterns == other.total_patterns &&
           total_relationships == other.total_relationships &&
           average_relationship_strength == other.average_relationship_strength &&
           average_confidence == other.average_confidence &&
           domain_count == other.domain_count &&
           orphaned_patterns == other.orphaned_patterns &&
           deprecated_patterns == other.deprecated_patterns &&
           validation_issues == other.validation_issues &&
           property_count == other.property_count &&
           process_count == other.process_count &&
           perspective_count == other.perspective_count;
}

std::string Metrics::ToString() const {
    std::ostringstream oss;
    oss << "Patterns:              " << total_patterns << "\n"
        << "  properties:          " << property_count << "\n"
        << "  processes:           " << process_count << "\n"
        << "  perspectives:        " << perspective_count << "\n"
        << "Relationships:         " << total_relationships << "\n"
        << "Average strength:      " << average_relationship_strength << "\n"
        << "Average confidence:    " << average_confidence << "\n"
        << "Domains:               " << domain_count << "\n"
        << "Orphaned patterns:     " << orphaned_patterns << "\n"
        << "Deprecated patterns:   " << deprecated_patterns << "\n"
        << "Validation issues:     " << validation_issues << "\n";
    return oss.str();
}

// ============================================================================
// MetricsCache
// ============================================================================

MetricsCache::MetricsCache(std::chrono::milliseconds timeout)
    : timeout_(timeout)
{
}

Metrics MetricsCache::Compute(const PatternStore& patterns,
                              const RelationshipStore& relationships,
                              const Validator& validator) {
    Metrics metrics;
    metrics.total_patterns = patterns.Size();
    metrics.total_relationships = relationships.Size();
    metrics.domain_count = patterns.DomainCount();
    metrics.property_count = patterns.CountByType(PatternType::PROPERTY);
    metrics.process_count = patterns.CountByType(PatternType::PROCESS);
    metrics.perspective_count = patterns.CountByType(PatternType::PERSPECTIVE);

    patterns.ForEach([&](const Pattern& pattern) {
        if (relationships.ReferenceCount(pattern.GetId()) == 0) {
            ++metrics.orphaned_patterns;
        }
        if (pattern.IsDeprecated()) {
            ++metrics.deprecated_patterns;
        }
    });

    if (!relationships.Empty()) {
        double strength_sum = 0.0;
        double confidence_sum = 0.0;
        relationships.ForEach([&](const Relationship& relationship) {
            strength_sum += relationship.GetStrength();
            confidence_sum += relationship.GetConfidence();
        });
        double count = static_cast<double>(relationships.Size());
        metrics.average_relationship_strength = strength_sum / count;
        metrics.average_confidence = confidence_sum / count;
    }

    metrics.validation_issues = validator.Validate(patterns, relationships).issues.size();
    return metrics;
}

bool MetricsCache::IsFreshLocked(Clock::time_point now) const {
    return cached_.has_value() && (now - computed_at_) < timeout_;
}

Metrics MetricsCache::GetOrCompute(const PatternStore& patterns,
                                   const RelationshipStore& relationships,
                                   const Validator& validator) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = Clock::now();
    if (IsFreshLocked(now)) {
        ++stats_.hits;
        return *cached_;
    }

    ++stats_.misses;
    ++stats_.computations;
    Metrics metrics = Compute(patterns, relationships, validator);
    // A non-positive timeout disables caching
    if (timeout_ > std::chrono::milliseconds::zero()) {
        cached_ = metrics;
        computed_at_ = now;
    }
    return metrics;
}

void MetricsCache::Invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    cached_.reset();
    ++stats_.invalidations;
}

bool MetricsCache::IsValid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return IsFreshLocked(Clock::now());
}

std::chrono::milliseconds MetricsCache::GetTimeout() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timeout_;
}

void MetricsCache::SetTimeout(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    timeout_ = timeout;
    cached_.reset();
}

MetricsCache::Stats MetricsCache::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace p3if
