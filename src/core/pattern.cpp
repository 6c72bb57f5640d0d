// File: src/core/pattern.cpp
#include "core/pattern.hpp"
#include "core/errors.hpp"
#include <sstream>

namespace p3if {

// ============================================================================
// Attribute Comparison
// ============================================================================

bool PropertyAttributes::operator==(const PropertyAttributes& other) const {
    return data_type == other.data_type &&
           unit == other.unit &&
           category == other.category &&
           priority == other.priority;
}

bool ProcessAttributes::operator==(const ProcessAttributes& other) const {
    return inputs == other.inputs &&
           outputs == other.outputs &&
           duration == other.duration &&
           complexity == other.complexity &&
           automation_level == other.automation_level;
}

bool PerspectiveAttributes::operator==(const PerspectiveAttributes& other) const {
    return viewpoint == other.viewpoint &&
           concerns == other.concerns &&
           stakeholder_type == other.stakeholder_type &&
           scope == other.scope;
}

PatternAttributes DefaultAttributes(PatternType type) {
    switch (type) {
        case PatternType::PROCESS: return ProcessAttributes{};
        case PatternType::PERSPECTIVE: return PerspectiveAttributes{};
        case PatternType::PROPERTY:
        default: return PropertyAttributes{};
    }
}

PatternType AttributesType(const PatternAttributes& attributes) {
    return static_cast<PatternType>(attributes.index());
}

// ============================================================================
// Construction
// ============================================================================

Pattern::Pattern(PatternType type, const std::string& name)
    : Pattern(GenerateId(), type, name) {
}

Pattern::Pattern(const std::string& id, PatternType type, const std::string& name)
    : id_(Trim(id)),
      type_(type),
      attributes_(DefaultAttributes(type)),
      created_at_(Timestamp::Now()) {
    if (id_.empty()) {
        throw FrameworkError(ErrorCode::INVALID_ARGUMENT, "Pattern id cannot be empty");
    }
    SetName(name);
    updated_at_ = created_at_;
}

Pattern Pattern::Create(PatternType type,
                        const std::string& name,
                        const std::optional<std::string>& domain,
                        const std::optional<std::string>& description) {
    Pattern pattern(type, name);
    pattern.SetDomain(domain);
    pattern.SetDescription(description);
    return pattern;
}

// ============================================================================
// Common Fields
// ============================================================================

void Pattern::SetName(const std::string& name) {
    std::string trimmed = Trim(name);
    if (trimmed.empty()) {
        throw FrameworkError(ErrorCode::INVALID_ARGUMENT, "Pattern name cannot be empty");
    }
    name_ = trimmed;
    Touch();
}

void Pattern::SetDescription(const std::optional<std::string>& description) {
    description_ = description;
    Touch();
}

void Pattern::SetDomain(const std::optional<std::string>& domain) {
    if (domain && !Trim(*domain).empty()) {
        domain_ = Trim(*domain);
    } else {
        domain_.reset();
    }
    Touch();
}

std::string Pattern::NormalizeTag(const std::string& tag) {
    return ToLower(Trim(tag));
}

bool Pattern::AddTag(const std::string& tag) {
    std::string normalized = NormalizeTag(tag);
    if (normalized.empty()) {
        throw FrameworkError(ErrorCode::INVALID_ARGUMENT, "Tags must be non-empty strings");
    }
    bool inserted = tags_.insert(normalized).second;
    if (inserted) {
        Touch();
    }
    return inserted;
}

bool Pattern::RemoveTag(const std::string& tag) {
    bool erased = tags_.erase(NormalizeTag(tag)) > 0;
    if (erased) {
        Touch();
    }
    return erased;
}

bool Pattern::HasTag(const std::string& tag) const {
    return tags_.count(NormalizeTag(tag)) > 0;
}

void Pattern::SetTags(const std::vector<std::string>& tags) {
    std::set<std::string> normalized;
    for (const auto& tag : tags) {
        std::string value = NormalizeTag(tag);
        if (value.empty()) {
            throw FrameworkError(ErrorCode::INVALID_ARGUMENT, "Tags must be non-empty strings");
        }
        normalized.insert(value);
    }
    tags_ = std::move(normalized);
    Touch();
}

void Pattern::SetMetadata(const std::string& key, const Json::Value& value) {
    metadata_[key] = value;
    Touch();
}

void Pattern::SetMetadata(const Json::Value& metadata) {
    if (metadata.isNull()) {
        metadata_ = Json::Value(Json::objectValue);
    } else if (metadata.isObject()) {
        metadata_ = metadata;
    } else {
        throw FrameworkError(ErrorCode::INVALID_ARGUMENT, "Pattern metadata must be an object");
    }
    Touch();
}

bool Pattern::HasMetadata(const std::string& key) const {
    return metadata_.isMember(key);
}

void Pattern::SetQualityScore(double score) {
    if (!(score >= 0.0 && score <= 1.0)) {
        throw FrameworkError(ErrorCode::OUT_OF_RANGE,
                             "quality_score must be between 0.0 and 1.0");
    }
    quality_score_ = score;
    Touch();
}

void Pattern::SetValidationStatus(ValidationStatus status) {
    validation_status_ = status;
    Touch();
}

void Pattern::SetVersion(const std::string& version) {
    version_ = version;
    Touch();
}

void Pattern::SetAttributes(const PatternAttributes& attributes) {
    if (AttributesType(attributes) != type_) {
        throw FrameworkError(ErrorCode::TYPE_MISMATCH,
                             std::string("Attributes of a ") + p3if::ToString(AttributesType(attributes)) +
                             " cannot be attached to a " + p3if::ToString(type_));
    }
    attributes_ = attributes;
    Touch();
}

void Pattern::RestoreTimestamps(Timestamp created_at, Timestamp updated_at) {
    created_at_ = created_at;
    updated_at_ = updated_at;
}

// ============================================================================
// Utility
// ============================================================================

bool Pattern::MatchesText(const std::string& lowered_query) const {
    if (ToLower(name_).find(lowered_query) != std::string::npos) {
        return true;
    }
    return description_ && ToLower(*description_).find(lowered_query) != std::string::npos;
}

std::string Pattern::ToString() const {
    std::ostringstream oss;
    oss << "Pattern(" << p3if::ToString(type_) << ", id=" << id_
        << ", name=\"" << name_ << "\"";
    if (domain_) {
        oss << ", domain=" << *domain_;
    }
    oss << ", tags=" << tags_.size() << ")";
    return oss.str();
}

bool Pattern::operator==(const Pattern& other) const {
    return id_ == other.id_ &&
           type_ == other.type_ &&
           name_ == other.name_ &&
           description_ == other.description_ &&
           domain_ == other.domain_ &&
           tags_ == other.tags_ &&
           metadata_ == other.metadata_ &&
           quality_score_ == other.quality_score_ &&
           validation_status_ == other.validation_status_ &&
           version_ == other.version_ &&
           attributes_ == other.attributes_ &&
           created_at_ == other.created_at_ &&
           updated_at_ == other.updated_at_;
}

void Pattern::Touch() {
    updated_at_ = Timestamp::Now();
}

} // namespace p3if
