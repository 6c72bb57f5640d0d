// File: src/framework/validator.cpp
#include "framework/validator.hpp"
#include <sstream>

namespace p3if {

const char* ToString(IssueSeverity severity) {
    switch (severity) {
        case IssueSeverity::INFO: return "info";
        case IssueSeverity::WARNING: return "warning";
        case IssueSeverity::ERROR: return "error";
        default: return "unknown";
    }
}

void ValidationReport::AddIssue(ValidationIssue issue) {
    switch (issue.severity) {
        case IssueSeverity::ERROR:
            ++error_count;
            valid = false;
            break;
        case IssueSeverity::WARNING:
            ++warning_count;
            break;
        case IssueSeverity::INFO:
        default:
            ++info_count;
            break;
    }
    issues.push_back(std::move(issue));
}

// ============================================================================
// Validator
// ============================================================================

Validator::Validator()
    : Validator(Config())
{
}

Validator::Validator(const Config& config)
    : config_(config)
{
}

ValidationReport Validator::Validate(const PatternStore& patterns,
                                     const RelationshipStore& relationships) const {
    ValidationReport report;

    relationships.ForEach([&](const Relationship& relationship) {
        CheckRelationship(relationship, patterns, report);
    });

    if (config_.check_indices) {
        for (auto& problem : patterns.CheckConsistency()) {
            report.AddIssue({IssueSeverity::ERROR, "index_consistency", "", std::move(problem)});
        }
        for (auto& problem : relationships.CheckConsistency()) {
            report.AddIssue({IssueSeverity::ERROR, "index_consistency", "", std::move(problem)});
        }
    }

    return report;
}

void Validator::CheckRelationship(const Relationship& relationship,
                                  const PatternStore& patterns,
                                  ValidationReport& report) const {
    const std::string& id = relationship.GetId();

    for (PatternType slot : kAllPatternTypes) {
        const auto& pattern_id = relationship.GetSlot(slot);
        if (!pattern_id) {
            continue;
        }

        const Pattern* pattern = patterns.Find(*pattern_id);
        if (pattern == nullptr) {
            report.AddIssue({IssueSeverity::ERROR, "dangling_reference", id,
                             "Relationship " + id + " references missing " +
                             ToString(slot) + " " + *pattern_id});
        } else if (pattern->GetType() != slot) {
            report.AddIssue({IssueSeverity::ERROR, "slot_type_mismatch", id,
                             "Relationship " + id + " holds " + ToString(pattern->GetType()) +
                             " " + *pattern_id + " in its " + ToString(slot) + " slot"});
        }
    }

    if (config_.warn_under_connected && relationship.ConnectionCount() < 2) {
        report.AddIssue({IssueSeverity::WARNING, "under_connected_relationship", id,
                         "Relationship " + id + " connects " +
                         std::to_string(relationship.ConnectionCount()) + " pattern(s)"});
    }
}

std::string FormatReport(const ValidationReport& report) {
    std::ostringstream oss;
    oss << "Validation: " << (report.valid ? "VALID" : "INVALID")
        << " (" << report.error_count << " errors, "
        << report.warning_count << " warnings, "
        << report.info_count << " info)\n";

    for (const auto& issue : report.issues) {
        oss << "  [" << ToString(issue.severity) << "] " << issue.rule;
        if (!issue.subject_id.empty()) {
            oss << " (" << issue.subject_id << ")";
        }
        oss << ": " << issue.message << "\n";
    }
    return oss.str();
}

} // namespace p3if
