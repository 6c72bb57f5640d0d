// File: src/framework/multiplexer.hpp
#pragma once

#include "framework/validator.hpp"
#include "storage/pattern_store.hpp"
#include "storage/relationship_store.hpp"
#include <json/json.h>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace p3if {

/// Pattern record supplied by an external source
struct ExternalPatternData {
    std::optional<std::string> id;  // generated when absent
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> domain;
    std::vector<std::string> tags;
    Json::Value metadata{Json::objectValue};
    std::optional<double> quality_score;
};

/// Relationship record supplied by an external source
///
/// Slot ids refer to external ids; they are remapped onto existing patterns
/// when the external pattern was matched by identity.
struct ExternalRelationshipData {
    std::optional<std::string> id;
    std::optional<std::string> property_id;
    std::optional<std::string> process_id;
    std::optional<std::string> perspective_id;
    double strength{0.5};
    double confidence{1.0};
    bool bidirectional{true};
    std::string relationship_type{"general"};
    Json::Value metadata{Json::objectValue};
};

/// External pattern set keyed by dimension name plus its relationships
struct ExternalFramework {
    /// "property"/"properties", "process"/"processes", "perspective"/"perspectives"
    std::map<std::string, std::vector<ExternalPatternData>> patterns;
    std::vector<ExternalRelationshipData> relationships;

    size_t PatternCount() const;
};

/// Summary of a multiplex run
struct MultiplexResult {
    size_t integrated_patterns{0};
    size_t integrated_relationships{0};
    size_t skipped{0};    // unknown dimension, or identity already present
    size_t conflicts{0};  // id already present
    size_t dangling{0};   // relationship slot names no known or no integrated pattern
    size_t invalid{0};    // malformed item (empty name, score out of range, ...)

    /// Issues reported by the post-merge validation pass
    size_t validation_issues{0};

    /// Ids actually inserted, in insertion order
    std::vector<std::string> added_pattern_ids;
    std::vector<std::string> added_relationship_ids;

    size_t FailureCount() const { return conflicts + dangling + invalid; }

    /// Accumulate another batch's counts (ids are appended)
    MultiplexResult& operator+=(const MultiplexResult& other);

    std::string ToString() const;
};

/// Merge of an externally supplied pattern/relationship set
///
/// Every item goes through PatternStore::Add or RelationshipStore::Add; a
/// failing item is counted and never aborts the batch. Patterns are merged
/// before relationships so relationship slots can name patterns from the
/// same batch. Not synchronized; Framework invokes it under its exclusive
/// lock.
class Multiplexer {
public:
    /// Configuration for Multiplexer
    struct Config {
        /// Treat an external pattern with the same (type, name, domain) as an
        /// existing one as already present and remap its id
        bool match_by_name{true};

        /// Run the Validator after merging
        bool validate_after_merge{true};
    };

    Multiplexer(PatternStore& patterns,
                RelationshipStore& relationships,
                const Validator& validator);
    Multiplexer(PatternStore& patterns,
                RelationshipStore& relationships,
                const Validator& validator,
                const Config& config);

    MultiplexResult Multiplex(const ExternalFramework& external);

    /// Parse a dimension key (singular or plural, case-insensitive)
    static std::optional<PatternType> ParseDimensionKey(const std::string& key);

private:
    void MergePattern(PatternType type,
                      const ExternalPatternData& data,
                      MultiplexResult& result);
    void MergeRelationship(const ExternalRelationshipData& data, MultiplexResult& result);

    std::optional<std::string> Remap(const std::optional<std::string>& external_id) const;
    bool IsRejected(const std::optional<std::string>& external_id) const;

    PatternStore& patterns_;
    RelationshipStore& relationships_;
    const Validator& validator_;
    Config config_;

    // External pattern id -> id of the pattern it resolved to
    std::unordered_map<std::string, std::string> id_map_;

    // External ids of patterns that were not integrated; relationships naming
    // them must not bind to a local pattern that shares the id
    std::unordered_set<std::string> rejected_ids_;
};

} // namespace p3if
