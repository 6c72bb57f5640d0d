// File: src/core/relationship.cpp
#include "core/relationship.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <sstream>

namespace p3if {

// ============================================================================
// Construction
// ============================================================================

const std::vector<std::string>& Relationship::ValidTypes() {
    static const std::vector<std::string> kTypes = {
        "general", "causal", "dependency", "composition", "aggregation", "specialization"
    };
    return kTypes;
}

Relationship::Relationship(double strength, double confidence)
    : Relationship(GenerateId(), strength, confidence) {
}

Relationship::Relationship(const std::string& id, double strength, double confidence)
    : id_(Trim(id)),
      strength_(CheckUnitRange(strength, "strength")),
      confidence_(CheckUnitRange(confidence, "confidence")),
      created_at_(Timestamp::Now()),
      updated_at_(created_at_) {
    if (id_.empty()) {
        throw FrameworkError(ErrorCode::INVALID_ARGUMENT, "Relationship id cannot be empty");
    }
}

Relationship Relationship::Connect(const std::optional<std::string>& property_id,
                                   const std::optional<std::string>& process_id,
                                   const std::optional<std::string>& perspective_id,
                                   double strength,
                                   double confidence) {
    Relationship relationship(strength, confidence);
    relationship.SetPropertyId(property_id);
    relationship.SetProcessId(process_id);
    relationship.SetPerspectiveId(perspective_id);
    return relationship;
}

double Relationship::CheckUnitRange(double value, const char* field) {
    // Written so that NaN fails as well
    if (!(value >= 0.0 && value <= 1.0)) {
        std::ostringstream oss;
        oss << field << " must be between 0.0 and 1.0, got " << value;
        throw FrameworkError(ErrorCode::OUT_OF_RANGE, oss.str());
    }
    return value;
}

// ============================================================================
// Slots
// ============================================================================

const std::optional<std::string>& Relationship::GetSlot(PatternType type) const {
    switch (type) {
        case PatternType::PROCESS: return process_id_;
        case PatternType::PERSPECTIVE: return perspective_id_;
        case PatternType::PROPERTY:
        default: return property_id_;
    }
}

void Relationship::SetSlot(PatternType type, const std::optional<std::string>& id) {
    std::optional<std::string> value;
    if (id && !id->empty()) {
        value = id;
    }

    switch (type) {
        case PatternType::PROCESS: process_id_ = value; break;
        case PatternType::PERSPECTIVE: perspective_id_ = value; break;
        case PatternType::PROPERTY:
        default: property_id_ = value; break;
    }
    Touch();
}

std::vector<std::string> Relationship::GetConnectedPatterns() const {
    std::vector<std::string> ids;
    for (PatternType type : kAllPatternTypes) {
        const auto& slot = GetSlot(type);
        if (slot) {
            ids.push_back(*slot);
        }
    }
    return ids;
}

size_t Relationship::ConnectionCount() const {
    return static_cast<size_t>(property_id_.has_value()) +
           static_cast<size_t>(process_id_.has_value()) +
           static_cast<size_t>(perspective_id_.has_value());
}

bool Relationship::References(const std::string& pattern_id) const {
    return property_id_ == pattern_id ||
           process_id_ == pattern_id ||
           perspective_id_ == pattern_id;
}

// ============================================================================
// Scores and Characteristics
// ============================================================================

void Relationship::SetStrength(double strength) {
    strength_ = CheckUnitRange(strength, "strength");
    Touch();
}

void Relationship::SetConfidence(double confidence) {
    confidence_ = CheckUnitRange(confidence, "confidence");
    Touch();
}

void Relationship::SetBidirectional(bool bidirectional) {
    bidirectional_ = bidirectional;
    Touch();
}

void Relationship::SetRelationshipType(const std::string& type) {
    std::string lower = ToLower(Trim(type));
    const auto& valid = ValidTypes();
    if (std::find(valid.begin(), valid.end(), lower) == valid.end()) {
        throw FrameworkError(ErrorCode::INVALID_ARGUMENT, "Unknown relationship type: " + type);
    }
    relationship_type_ = lower;
    Touch();
}

void Relationship::SetMetadata(const std::string& key, const Json::Value& value) {
    metadata_[key] = value;
    Touch();
}

void Relationship::SetMetadata(const Json::Value& metadata) {
    if (metadata.isNull()) {
        metadata_ = Json::Value(Json::objectValue);
    } else if (metadata.isObject()) {
        metadata_ = metadata;
    } else {
        throw FrameworkError(ErrorCode::INVALID_ARGUMENT, "Relationship metadata must be an object");
    }
    Touch();
}

void Relationship::RestoreTimestamps(Timestamp created_at, Timestamp updated_at) {
    created_at_ = created_at;
    updated_at_ = updated_at;
}

void Relationship::Touch() {
    updated_at_ = Timestamp::Now();
}

// ============================================================================
// Utility
// ============================================================================

std::string Relationship::ToString() const {
    std::ostringstream oss;
    oss << "Relationship(id=" << id_
        << ", property=" << property_id_.value_or("-")
        << ", process=" << process_id_.value_or("-")
        << ", perspective=" << perspective_id_.value_or("-")
        << ", strength=" << strength_
        << ", confidence=" << confidence_ << ")";
    return oss.str();
}

bool Relationship::operator==(const Relationship& other) const {
    return id_ == other.id_ &&
           property_id_ == other.property_id_ &&
           process_id_ == other.process_id_ &&
           perspective_id_ == other.perspective_id_ &&
           strength_ == other.strength_ &&
           confidence_ == other.confidence_ &&
           bidirectional_ == other.bidirectional_ &&
           relationship_type_ == other.relationship_type_ &&
           metadata_ == other.metadata_ &&
           created_at_ == other.created_at_ &&
           updated_at_ == other.updated_at_;
}

} // namespace p3if
