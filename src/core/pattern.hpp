// File: src/core/pattern.hpp
#pragma once

#include "core/types.hpp"
#include <json/json.h>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace p3if {

/// Attributes specific to PROPERTY patterns
struct PropertyAttributes {
    std::string data_type;           // string, number, boolean, ...
    std::string unit;                // measurement unit
    std::string category;            // security, performance, usability, ...
    std::string priority{"medium"};  // low, medium, high, critical

    bool operator==(const PropertyAttributes& other) const;
    bool operator!=(const PropertyAttributes& other) const { return !(*this == other); }
};

/// Attributes specific to PROCESS patterns
struct ProcessAttributes {
    std::vector<std::string> inputs;
    std::vector<std::string> outputs;
    std::string duration;
    std::string complexity{"medium"};        // low, medium, high
    std::string automation_level{"manual"};  // manual, semi-automated, fully-automated

    bool operator==(const ProcessAttributes& other) const;
    bool operator!=(const ProcessAttributes& other) const { return !(*this == other); }
};

/// Attributes specific to PERSPECTIVE patterns
struct PerspectiveAttributes {
    std::string viewpoint{"default"};
    std::vector<std::string> concerns;
    std::string stakeholder_type;
    std::string scope{"general"};  // general, specific, detailed

    bool operator==(const PerspectiveAttributes& other) const;
    bool operator!=(const PerspectiveAttributes& other) const { return !(*this == other); }
};

/// Variant-specific payload; the active alternative always matches the
/// pattern's PatternType (index == static_cast<size_t>(type))
using PatternAttributes = std::variant<PropertyAttributes, ProcessAttributes, PerspectiveAttributes>;

/// Pattern: A named, typed unit of domain knowledge
///
/// Closed tagged union over PROPERTY, PROCESS and PERSPECTIVE. The fields
/// every variant shares (domain included) live directly on the class; the
/// variant-specific ones live in PatternAttributes.
///
/// Patterns are plain values. Once registered, the store owns its copy and
/// callers only ever receive copies back.
class Pattern {
public:
    /// Construct with a freshly generated id
    /// @throws FrameworkError(INVALID_ARGUMENT) if name is empty after trimming
    Pattern(PatternType type, const std::string& name);

    /// Construct with an explicit id (imports, tests)
    /// @throws FrameworkError(INVALID_ARGUMENT) if id or name is empty
    Pattern(const std::string& id, PatternType type, const std::string& name);

    /// Convenience factory: typed pattern with optional domain
    static Pattern Create(PatternType type,
                          const std::string& name,
                          const std::optional<std::string>& domain = std::nullopt,
                          const std::optional<std::string>& description = std::nullopt);

    // ========================================================================
    // Identity
    // ========================================================================

    const std::string& GetId() const { return id_; }
    PatternType GetType() const { return type_; }

    // ========================================================================
    // Common Fields
    // ========================================================================

    const std::string& GetName() const { return name_; }
    void SetName(const std::string& name);

    const std::optional<std::string>& GetDescription() const { return description_; }
    void SetDescription(const std::optional<std::string>& description);

    /// Domain is normalized so that an empty string means "no domain"
    const std::optional<std::string>& GetDomain() const { return domain_; }
    void SetDomain(const std::optional<std::string>& domain);

    /// Tags are stored trimmed and lower-cased
    const std::set<std::string>& GetTags() const { return tags_; }
    bool AddTag(const std::string& tag);
    bool RemoveTag(const std::string& tag);
    bool HasTag(const std::string& tag) const;
    void SetTags(const std::vector<std::string>& tags);

    /// Normalize a tag the way AddTag stores it
    static std::string NormalizeTag(const std::string& tag);

    const Json::Value& GetMetadata() const { return metadata_; }
    void SetMetadata(const std::string& key, const Json::Value& value);
    /// Replace the whole metadata object (must be an object or null)
    void SetMetadata(const Json::Value& metadata);
    bool HasMetadata(const std::string& key) const;

    double GetQualityScore() const { return quality_score_; }
    /// @throws FrameworkError(OUT_OF_RANGE) outside [0,1]
    void SetQualityScore(double score);

    ValidationStatus GetValidationStatus() const { return validation_status_; }
    void SetValidationStatus(ValidationStatus status);
    bool IsDeprecated() const { return validation_status_ == ValidationStatus::DEPRECATED; }

    const std::string& GetVersion() const { return version_; }
    void SetVersion(const std::string& version);

    // ========================================================================
    // Variant Attributes
    // ========================================================================

    const PatternAttributes& GetAttributes() const { return attributes_; }

    /// @throws FrameworkError(TYPE_MISMATCH) if the alternative does not match GetType()
    void SetAttributes(const PatternAttributes& attributes);

    const PropertyAttributes* AsProperty() const { return std::get_if<PropertyAttributes>(&attributes_); }
    const ProcessAttributes* AsProcess() const { return std::get_if<ProcessAttributes>(&attributes_); }
    const PerspectiveAttributes* AsPerspective() const { return std::get_if<PerspectiveAttributes>(&attributes_); }

    // ========================================================================
    // Timestamps
    // ========================================================================

    Timestamp GetCreatedAt() const { return created_at_; }
    Timestamp GetUpdatedAt() const { return updated_at_; }

    /// Restore persisted timestamps (import only)
    void RestoreTimestamps(Timestamp created_at, Timestamp updated_at);

    // ========================================================================
    // Utility
    // ========================================================================

    /// Case-insensitive substring match over name and description
    bool MatchesText(const std::string& lowered_query) const;

    std::string ToString() const;

    bool operator==(const Pattern& other) const;
    bool operator!=(const Pattern& other) const { return !(*this == other); }

private:
    void Touch();

    std::string id_;
    PatternType type_;
    std::string name_;
    std::optional<std::string> description_;
    std::optional<std::string> domain_;
    std::set<std::string> tags_;
    Json::Value metadata_{Json::objectValue};
    double quality_score_{1.0};
    ValidationStatus validation_status_{ValidationStatus::DRAFT};
    std::string version_{"1.0.0"};
    PatternAttributes attributes_;
    Timestamp created_at_;
    Timestamp updated_at_;
};

/// Default attributes for a pattern type
PatternAttributes DefaultAttributes(PatternType type);

/// PatternType implied by an attributes alternative
PatternType AttributesType(const PatternAttributes& attributes);

} // namespace p3if
