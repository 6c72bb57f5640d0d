// File: src/storage/pattern_store.hpp
#pragma once

#include "core/pattern.hpp"
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace p3if {

/// In-memory pattern storage with secondary indexes
///
/// Primary map from pattern id to Pattern plus three secondary indexes:
/// - type index:   PatternType -> ids
/// - domain index: domain      -> ids (patterns without a domain are not indexed)
/// - tag index:    tag         -> ids
///
/// Not internally synchronized. Framework serializes all access through its
/// single shared_mutex, which keeps this store and RelationshipStore
/// consistent with each other.
class PatternStore {
public:
    /// Configuration for PatternStore
    struct Config {
        /// Initial capacity for the primary hash map (pre-allocation)
        size_t initial_capacity{1024};
    };

    PatternStore();
    explicit PatternStore(const Config& config);

    // ========================================================================
    // Core Operations
    // ========================================================================

    /// Register a pattern
    /// @return The pattern id
    /// @throws FrameworkError(DUPLICATE_ID) if the id is already present
    std::string Add(const Pattern& pattern);

    /// O(1) lookup; returns a copy
    std::optional<Pattern> Get(const std::string& id) const;

    /// Borrowed pointer for internal composite operations (valid until the next mutation)
    const Pattern* Find(const std::string& id) const;

    /// Remove from the primary map and every index
    /// @return false if the id was absent
    bool Remove(const std::string& id);

    bool Contains(const std::string& id) const;
    size_t Size() const { return patterns_.size(); }
    bool Empty() const { return patterns_.empty(); }

    // ========================================================================
    // Index Queries
    // ========================================================================

    std::vector<Pattern> GetByType(PatternType type) const;
    std::vector<Pattern> GetByDomain(const std::string& domain) const;
    std::vector<Pattern> GetByTag(const std::string& tag) const;

    /// Number of patterns of a type (index size, no materialization)
    size_t CountByType(PatternType type) const;

    /// Distinct non-empty domains currently indexed
    size_t DomainCount() const { return domain_index_.size(); }

    /// Oldest pattern (created_at, then id) of the given type with the same
    /// trimmed name and domain
    std::optional<std::string> FindByIdentity(PatternType type,
                                              const std::string& name,
                                              const std::optional<std::string>& domain) const;

    // ========================================================================
    // Search and Iteration
    // ========================================================================

    /// Case-insensitive substring match over name and description
    std::vector<Pattern> Search(const std::string& query) const;

    std::vector<Pattern> All() const;
    std::vector<std::string> Ids() const;

    /// Visit every stored pattern without copying
    template<typename Visitor>
    void ForEach(Visitor&& visitor) const {
        for (const auto& [id, pattern] : patterns_) {
            visitor(pattern);
        }
    }

    void Clear();

    // ========================================================================
    // Consistency
    // ========================================================================

    /// Verify every index against the primary map
    /// @return Human-readable descriptions of each inconsistency (empty if consistent)
    std::vector<std::string> CheckConsistency() const;

private:
    using IdSet = std::unordered_set<std::string>;

    void UpdateIndices(const Pattern& pattern, bool add);
    std::vector<Pattern> Materialize(const IdSet* ids) const;

    static void EraseFromIndex(std::unordered_map<std::string, IdSet>& index,
                               const std::string& key,
                               const std::string& id);

    Config config_;

    // Main storage: pattern id -> Pattern
    std::unordered_map<std::string, Pattern> patterns_;

    // Secondary indexes
    std::map<PatternType, IdSet> type_index_;
    std::unordered_map<std::string, IdSet> domain_index_;
    std::unordered_map<std::string, IdSet> tag_index_;
};

} // namespace p3if
