// File: src/core/relationship.hpp
#pragma once

#include "core/types.hpp"
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

namespace p3if {

/// Relationship: Weighted link across up to three patterns
///
/// Holds exactly three optional slots, one per dimension. Any combination of
/// slots may be populated. Strength and confidence are validated at
/// construction and on every setter, so an out-of-range value never reaches
/// a store.
class Relationship {
public:
    /// Valid relationship_type values
    static const std::vector<std::string>& ValidTypes();

    /// Construct with a freshly generated id and no slots populated
    /// @throws FrameworkError(OUT_OF_RANGE) if strength or confidence is outside [0,1]
    explicit Relationship(double strength = 0.5, double confidence = 1.0);

    /// Construct with an explicit id
    /// @throws FrameworkError(INVALID_ARGUMENT) if id is empty
    /// @throws FrameworkError(OUT_OF_RANGE) if strength or confidence is outside [0,1]
    Relationship(const std::string& id, double strength, double confidence);

    /// Convenience factory linking the given slots
    static Relationship Connect(const std::optional<std::string>& property_id,
                                const std::optional<std::string>& process_id,
                                const std::optional<std::string>& perspective_id,
                                double strength = 0.5,
                                double confidence = 1.0);

    // ========================================================================
    // Identity and Slots
    // ========================================================================

    const std::string& GetId() const { return id_; }

    const std::optional<std::string>& GetPropertyId() const { return property_id_; }
    const std::optional<std::string>& GetProcessId() const { return process_id_; }
    const std::optional<std::string>& GetPerspectiveId() const { return perspective_id_; }

    void SetPropertyId(const std::optional<std::string>& id) { SetSlot(PatternType::PROPERTY, id); }
    void SetProcessId(const std::optional<std::string>& id) { SetSlot(PatternType::PROCESS, id); }
    void SetPerspectiveId(const std::optional<std::string>& id) { SetSlot(PatternType::PERSPECTIVE, id); }

    /// Slot matching a dimension
    const std::optional<std::string>& GetSlot(PatternType type) const;

    /// Set or clear the slot matching a dimension (empty string clears)
    void SetSlot(PatternType type, const std::optional<std::string>& id);

    /// Populated pattern ids in slot order (property, process, perspective)
    std::vector<std::string> GetConnectedPatterns() const;

    /// Number of populated slots
    size_t ConnectionCount() const;

    /// True if any slot names pattern_id
    bool References(const std::string& pattern_id) const;

    // ========================================================================
    // Scores
    // ========================================================================

    double GetStrength() const { return strength_; }
    void SetStrength(double strength);

    double GetConfidence() const { return confidence_; }
    void SetConfidence(double confidence);

    // ========================================================================
    // Characteristics
    // ========================================================================

    bool IsBidirectional() const { return bidirectional_; }
    void SetBidirectional(bool bidirectional);

    const std::string& GetRelationshipType() const { return relationship_type_; }
    /// @throws FrameworkError(INVALID_ARGUMENT) for a type not in ValidTypes()
    void SetRelationshipType(const std::string& type);

    const Json::Value& GetMetadata() const { return metadata_; }
    void SetMetadata(const std::string& key, const Json::Value& value);
    void SetMetadata(const Json::Value& metadata);

    Timestamp GetCreatedAt() const { return created_at_; }
    Timestamp GetUpdatedAt() const { return updated_at_; }
    void RestoreTimestamps(Timestamp created_at, Timestamp updated_at);

    /// Refresh updated_at
    void Touch();

    // ========================================================================
    // Utility
    // ========================================================================

    std::string ToString() const;

    bool operator==(const Relationship& other) const;
    bool operator!=(const Relationship& other) const { return !(*this == other); }

private:
    static double CheckUnitRange(double value, const char* field);

    std::string id_;
    std::optional<std::string> property_id_;
    std::optional<std::string> process_id_;
    std::optional<std::string> perspective_id_;
    double strength_;
    double confidence_;
    bool bidirectional_{true};
    std::string relationship_type_{"general"};
    Json::Value metadata_{Json::objectValue};
    Timestamp created_at_;
    Timestamp updated_at_;
};

} // namespace p3if
