// File: src/storage/relationship_store.hpp
#pragma once

#include "core/relationship.hpp"
#include "storage/pattern_store.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace p3if {

/// In-memory relationship storage with a pattern -> relationships index
///
/// Storage mirrors the association matrix layout:
/// - primary map: relationship id -> Relationship
/// - reverse index: pattern id -> ids of relationships naming it in any slot
///
/// Referential validation is done against a PatternStore passed in by the
/// caller. Not internally synchronized (see PatternStore).
class RelationshipStore {
public:
    /// Configuration for RelationshipStore
    struct Config {
        /// Initial capacity for the primary hash map
        size_t initial_capacity{1024};

        /// Reject slots that name a pattern of a different variant
        bool enforce_slot_types{true};
    };

    RelationshipStore();
    explicit RelationshipStore(const Config& config);

    // ========================================================================
    // Core Operations
    // ========================================================================

    /// Register a relationship after checking every populated slot
    ///
    /// All checks run before any write, so a rejected relationship leaves
    /// both the primary map and the index untouched.
    /// @return The relationship id
    /// @throws FrameworkError(DUPLICATE_ID) if the id already exists
    /// @throws FrameworkError(DANGLING_REFERENCE) if a slot names an unknown pattern
    /// @throws FrameworkError(TYPE_MISMATCH) if a slot names a pattern of another variant
    std::string Add(const Relationship& relationship, const PatternStore& patterns);

    /// Insert without referential checks (lenient raw imports only)
    /// @throws FrameworkError(DUPLICATE_ID) if the id already exists
    std::string InsertUnchecked(const Relationship& relationship);

    std::optional<Relationship> Get(const std::string& id) const;

    /// Borrowed pointer for composite operations (valid until the next mutation)
    const Relationship* Find(const std::string& id) const;

    /// @return false if the id was absent
    bool Remove(const std::string& id);

    bool Contains(const std::string& id) const;
    size_t Size() const { return relationships_.size(); }
    bool Empty() const { return relationships_.empty(); }

    // ========================================================================
    // Pattern Index
    // ========================================================================

    /// Every relationship whose property/process/perspective slot equals pattern_id
    std::vector<Relationship> GetByPattern(const std::string& pattern_id) const;

    /// Ids of relationships referencing pattern_id (sorted)
    std::vector<std::string> ReferencingIds(const std::string& pattern_id) const;

    /// Number of relationships referencing pattern_id
    size_t ReferenceCount(const std::string& pattern_id) const;

    /// Rewrite one slot of a stored relationship, keeping the index in step
    ///
    /// Scores, metadata and identity are untouched; updated_at is refreshed.
    /// @return false if the relationship does not exist
    bool RelinkSlot(const std::string& relationship_id,
                    PatternType slot,
                    const std::optional<std::string>& new_pattern_id);

    // ========================================================================
    // Iteration
    // ========================================================================

    std::vector<Relationship> All() const;

    template<typename Visitor>
    void ForEach(Visitor&& visitor) const {
        for (const auto& [id, relationship] : relationships_) {
            visitor(relationship);
        }
    }

    void Clear();

    /// Verify the pattern index against the primary map
    std::vector<std::string> CheckConsistency() const;

private:
    using IdSet = std::unordered_set<std::string>;

    void UpdateIndices(const Relationship& relationship, bool add);
    void Insert(const Relationship& relationship);
    std::vector<Relationship> Materialize(const std::vector<std::string>& ids) const;

    Config config_;

    // Main storage: relationship id -> Relationship
    std::unordered_map<std::string, Relationship> relationships_;

    // Reverse index: pattern id -> relationship ids
    std::unordered_map<std::string, IdSet> pattern_index_;
};

} // namespace p3if
