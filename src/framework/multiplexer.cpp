// File: src/framework/multiplexer.cpp
#include "framework/multiplexer.hpp"
#include "core/errors.hpp"
#include <iostream>
#include <sstream>

namespace p3if {

// ============================================================================
// ExternalFramework / MultiplexResult
// ============================================================================

size_t ExternalFramework::PatternCount() const {
    size_t count = 0;
    for (const auto& [dimension, items] : patterns) {
        count += items.size();
    }
    return count;
}

MultiplexResult& MultiplexResult::operator+=(const MultiplexResult& other) {
    integrated_patterns += other.integrated_patterns;
    integrated_relationships += other.integrated_relationships;
    skipped += other.skipped;
    conflicts += other.conflicts;
    dangling += other.dangling;
    invalid += other.invalid;
    validation_issues += other.validation_issues;
    added_pattern_ids.insert(added_pattern_ids.end(),
                             other.added_pattern_ids.begin(), other.added_pattern_ids.end());
    added_relationship_ids.insert(added_relationship_ids.end(),
                                  other.added_relationship_ids.begin(),
                                  other.added_relationship_ids.end());
    return *this;
}

std::string MultiplexResult::ToString() const {
    std::ostringstream oss;
    oss << "MultiplexResult(patterns=" << integrated_patterns
        << ", relationships=" << integrated_relationships
        << ", skipped=" << skipped
        << ", conflicts=" << conflicts
        << ", dangling=" << dangling
        << ", invalid=" << invalid << ")";
    return oss.str();
}

// ============================================================================
// Multiplexer
// ============================================================================

Multiplexer::Multiplexer(PatternStore& patterns,
                         RelationshipStore& relationships,
                         const Validator& validator)
    : Multiplexer(patterns, relationships, validator, Config())
{
}

Multiplexer::Multiplexer(PatternStore& patterns,
                         RelationshipStore& relationships,
                         const Validator& validator,
                         const Config& config)
    : patterns_(patterns),
      relationships_(relationships),
      validator_(validator),
      config_(config)
{
}

std::optional<PatternType> Multiplexer::ParseDimensionKey(const std::string& key) {
    std::string lower = ToLower(Trim(key));
    if (lower == "property" || lower == "properties") return PatternType::PROPERTY;
    if (lower == "process" || lower == "processes") return PatternType::PROCESS;
    if (lower == "perspective" || lower == "perspectives") return PatternType::PERSPECTIVE;
    return std::nullopt;
}

MultiplexResult Multiplexer::Multiplex(const ExternalFramework& external) {
    MultiplexResult result;
    id_map_.clear();
    rejected_ids_.clear();

    // Patterns first so relationships can reference them
    for (const auto& [dimension, items] : external.patterns) {
        auto type = ParseDimensionKey(dimension);
        if (!type) {
            std::cerr << "Warning: Unknown dimension: " << dimension
                      << " (" << items.size() << " item(s) skipped)" << std::endl;
            result.skipped += items.size();
            for (const auto& data : items) {
                if (data.id) {
                    rejected_ids_.insert(*data.id);
                }
            }
            continue;
        }

        for (const auto& data : items) {
            MergePattern(*type, data, result);
        }
    }

    for (const auto& data : external.relationships) {
        MergeRelationship(data, result);
    }

    if (config_.validate_after_merge) {
        result.validation_issues = validator_.Validate(patterns_, relationships_).issues.size();
    }

    return result;
}

void Multiplexer::MergePattern(PatternType type,
                               const ExternalPatternData& data,
                               MultiplexResult& result) {
    try {
        Pattern pattern = data.id ? Pattern(*data.id, type, data.name) : Pattern(type, data.name);
        pattern.SetDescription(data.description);
        pattern.SetDomain(data.domain);
        pattern.SetTags(data.tags);
        pattern.SetMetadata(data.metadata);
        if (data.quality_score) {
            pattern.SetQualityScore(*data.quality_score);
        }

        if (config_.match_by_name) {
            auto existing = patterns_.FindByIdentity(type, pattern.GetName(), pattern.GetDomain());
            if (existing) {
                if (data.id) {
                    id_map_[*data.id] = *existing;
                }
                ++result.skipped;
                return;
            }
        }

        std::string id = patterns_.Add(pattern);
        id_map_[id] = id;
        result.added_pattern_ids.push_back(id);
        ++result.integrated_patterns;
    } catch (const FrameworkError& e) {
        if (data.id) {
            rejected_ids_.insert(*data.id);
        }
        if (e.code() == ErrorCode::DUPLICATE_ID) {
            ++result.conflicts;
        } else {
            ++result.invalid;
        }
    }
}

std::optional<std::string> Multiplexer::Remap(const std::optional<std::string>& external_id) const {
    if (!external_id) {
        return std::nullopt;
    }
    auto it = id_map_.find(*external_id);
    return it != id_map_.end() ? it->second : *external_id;
}

bool Multiplexer::IsRejected(const std::optional<std::string>& external_id) const {
    return external_id && id_map_.count(*external_id) == 0 && rejected_ids_.count(*external_id) > 0;
}

void Multiplexer::MergeRelationship(const ExternalRelationshipData& data, MultiplexResult& result) {
    try {
        Relationship relationship = data.id
            ? Relationship(*data.id, data.strength, data.confidence)
            : Relationship(data.strength, data.confidence);
        if (IsRejected(data.property_id) || IsRejected(data.process_id) ||
            IsRejected(data.perspective_id)) {
            ++result.dangling;
            return;
        }
        relationship.SetPropertyId(Remap(data.property_id));
        relationship.SetProcessId(Remap(data.process_id));
        relationship.SetPerspectiveId(Remap(data.perspective_id));
        relationship.SetBidirectional(data.bidirectional);
        relationship.SetRelationshipType(data.relationship_type);
        relationship.SetMetadata(data.metadata);

        std::string id = relationships_.Add(relationship, patterns_);
        result.added_relationship_ids.push_back(id);
        ++result.integrated_relationships;
    } catch (const FrameworkError& e) {
        switch (e.code()) {
            case ErrorCode::DUPLICATE_ID: ++result.conflicts; break;
            case ErrorCode::DANGLING_REFERENCE: ++result.dangling; break;
            default: ++result.invalid; break;
        }
    }
}

} // namespace p3if
