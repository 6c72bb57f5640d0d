// File: src/framework/validator.hpp
#pragma once

#include "storage/pattern_store.hpp"
#include "storage/relationship_store.hpp"
#include <string>
#include <vector>

namespace p3if {

/// Severity of a validation issue
enum class IssueSeverity : uint8_t {
    INFO = 0,
    WARNING = 1,
    ERROR = 2,
};

const char* ToString(IssueSeverity severity);

/// A single finding of a validation pass
struct ValidationIssue {
    IssueSeverity severity{IssueSeverity::ERROR};
    std::string rule;        // dangling_reference, slot_type_mismatch, ...
    std::string subject_id;  // relationship or pattern the finding concerns
    std::string message;
};

/// Outcome of Validator::Validate
struct ValidationReport {
    /// False iff any issue has ERROR severity
    bool valid{true};

    std::vector<ValidationIssue> issues;

    size_t error_count{0};
    size_t warning_count{0};
    size_t info_count{0};

    /// Append an issue and keep the counters and valid flag in step
    void AddIssue(ValidationIssue issue);
};

/// Structural checker over both stores
///
/// Read-only and uncached. Rules:
///   dangling_reference            (error)   slot names a missing pattern
///   slot_type_mismatch            (error)   slot names a pattern of another type
///   index_consistency             (error)   secondary index drifted from primary map
///   under_connected_relationship  (warning) fewer than two populated slots
///
/// Dangling references cannot be created through RelationshipStore::Add; the
/// check exists for raw imports and any out-of-band mutation.
class Validator {
public:
    /// Configuration for Validator
    struct Config {
        /// Run PatternStore/RelationshipStore::CheckConsistency
        bool check_indices{true};

        /// Report relationships with fewer than two populated slots
        bool warn_under_connected{true};
    };

    Validator();
    explicit Validator(const Config& config);

    ValidationReport Validate(const PatternStore& patterns,
                              const RelationshipStore& relationships) const;

    const Config& GetConfig() const { return config_; }

private:
    void CheckRelationship(const Relationship& relationship,
                           const PatternStore& patterns,
                           ValidationReport& report) const;

    Config config_;
};

/// Multi-line human-readable rendering of a report
std::string FormatReport(const ValidationReport& report);

} // namespace p3if
