// File: src/storage/relationship_store.cpp
#include "storage/relationship_store.hpp"
#include "core/errors.hpp"
#include <algorithm>

namespace p3if {

// ============================================================================
// Construction
// ============================================================================

RelationshipStore::RelationshipStore()
    : RelationshipStore(Config())
{
}

RelationshipStore::RelationshipStore(const Config& config)
    : config_(config)
{
    relationships_.reserve(config_.initial_capacity);
}

// ============================================================================
// Helper Methods
// ============================================================================

void RelationshipStore::UpdateIndices(const Relationship& relationship, bool add) {
    const std::string& id = relationship.GetId();

    for (const auto& pattern_id : relationship.GetConnectedPatterns()) {
        if (add) {
            pattern_index_[pattern_id].insert(id);
        } else {
            auto it = pattern_index_.find(pattern_id);
            if (it == pattern_index_.end()) {
                continue;
            }
            it->second.erase(id);
            if (it->second.empty()) {
                pattern_index_.erase(it);
            }
        }
    }
}

void RelationshipStore::Insert(const Relationship& relationship) {
    auto [it, inserted] = relationships_.emplace(relationship.GetId(), relationship);
    (void)inserted;
    UpdateIndices(it->second, true);
}

std::vector<Relationship> RelationshipStore::Materialize(const std::vector<std::string>& ids) const {
    std::vector<Relationship> results;
    results.reserve(ids.size());
    for (const auto& id : ids) {
        auto it = relationships_.find(id);
        if (it != relationships_.end()) {
            results.push_back(it->second);
        }
    }
    return results;
}

// ============================================================================
// Core Operations
// ============================================================================

std::string RelationshipStore::Add(const Relationship& relationship, const PatternStore& patterns) {
    const std::string& id = relationship.GetId();

    if (relationships_.find(id) != relationships_.end()) {
        throw FrameworkError(ErrorCode::DUPLICATE_ID, "Relationship with ID " + id + " already exists");
    }

    // Validate every slot before touching any state
    for (PatternType slot : kAllPatternTypes) {
        const auto& pattern_id = relationship.GetSlot(slot);
        if (!pattern_id) {
            continue;
        }

        const Pattern* pattern = patterns.Find(*pattern_id);
        if (pattern == nullptr) {
            throw FrameworkError(ErrorCode::DANGLING_REFERENCE,
                                 "Referenced pattern " + *pattern_id + " not found (" +
                                 ToString(slot) + " slot of relationship " + id + ")");
        }
        if (config_.enforce_slot_types && pattern->GetType() != slot) {
            throw FrameworkError(ErrorCode::TYPE_MISMATCH,
                                 "Pattern " + *pattern_id + " is a " + ToString(pattern->GetType()) +
                                 ", not a " + ToString(slot));
        }
    }

    Insert(relationship);
    return id;
}

std::string RelationshipStore::InsertUnchecked(const Relationship& relationship) {
    const std::string& id = relationship.GetId();
    if (relationships_.find(id) != relationships_.end()) {
        throw FrameworkError(ErrorCode::DUPLICATE_ID, "Relationship with ID " + id + " already exists");
    }
    Insert(relationship);
    return id;
}

std::optional<Relationship> RelationshipStore::Get(const std::string& id) const {
    auto it = relationships_.find(id);
    if (it != relationships_.end()) {
        return it->second;
    }
    return std::nullopt;
}

const Relationship* RelationshipStore::Find(const std::string& id) const {
    auto it = relationships_.find(id);
    return it != relationships_.end() ? &it->second : nullptr;
}

bool RelationshipStore::Remove(const std::string& id) {
    auto it = relationships_.find(id);
    if (it == relationships_.end()) {
        return false;
    }

    UpdateIndices(it->second, false);
    relationships_.erase(it);
    return true;
}

bool RelationshipStore::Contains(const std::string& id) const {
    return relationships_.find(id) != relationships_.end();
}

// ============================================================================
// Pattern Index
// ============================================================================

std::vector<Relationship> RelationshipStore::GetByPattern(const std::string& pattern_id) const {
    return Materialize(ReferencingIds(pattern_id));
}

std::vector<std::string> RelationshipStore::ReferencingIds(const std::string& pattern_id) const {
    std::vector<std::string> ids;
    auto it = pattern_index_.find(pattern_id);
    if (it != pattern_index_.end()) {
        ids.assign(it->second.begin(), it->second.end());
        std::sort(ids.begin(), ids.end());
    }
    return ids;
}

size_t RelationshipStore::ReferenceCount(const std::string& pattern_id) const {
    auto it = pattern_index_.find(pattern_id);
    return it != pattern_index_.end() ? it->second.size() : 0;
}

bool RelationshipStore::RelinkSlot(const std::string& relationship_id,
                                   PatternType slot,
                                   const std::optional<std::string>& new_pattern_id) {
    auto it = relationships_.find(relationship_id);
    if (it == relationships_.end()) {
        return false;
    }

    // Drop the old index entries, rewrite, then re-add. A relationship can
    // name the same pattern in two slots, so a per-slot erase is not enough.
    UpdateIndices(it->second, false);
    it->second.SetSlot(slot, new_pattern_id);
    UpdateIndices(it->second, true);
    return true;
}

// ============================================================================
// Iteration
// ============================================================================

std::vector<Relationship> RelationshipStore::All() const {
    std::vector<std::string> ids;
    ids.reserve(relationships_.size());
    for (const auto& [id, relationship] : relationships_) {
        ids.push_back(id);
    }

    std::vector<Relationship> results = Materialize(ids);
    std::sort(results.begin(), results.end(), [](const Relationship& a, const Relationship& b) {
        return a.GetCreatedAt() != b.GetCreatedAt() ? a.GetCreatedAt() < b.GetCreatedAt()
                                                    : a.GetId() < b.GetId();
    });
    return results;
}

void RelationshipStore::Clear() {
    relationships_.clear();
    pattern_index_.clear();
}

std::vector<std::string> RelationshipStore::CheckConsistency() const {
    std::vector<std::string> problems;

    for (const auto& [pattern_id, ids] : pattern_index_) {
        for (const auto& id : ids) {
            const Relationship* relationship = Find(id);
            if (relationship == nullptr || !relationship->References(pattern_id)) {
                problems.push_back("pattern index entry " + pattern_id + " -> " + id +
                                   " does not match the primary map");
            }
        }
    }

    for (const auto& [id, relationship] : relationships_) {
        for (const auto& pattern_id : relationship.GetConnectedPatterns()) {
            auto it = pattern_index_.find(pattern_id);
            if (it == pattern_index_.end() || it->second.count(id) == 0) {
                problems.push_back("relationship " + id + " missing from pattern index under " +
                                   pattern_id);
            }
        }
    }

    return problems;
}

} // namespace p3if
