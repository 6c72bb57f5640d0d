// File: src/storage/pattern_store.cpp
#include "storage/pattern_store.hpp"
#include "core/errors.hpp"
#include <algorithm>

namespace p3if {

// ============================================================================
// Construction
// ============================================================================

PatternStore::PatternStore()
    : PatternStore(Config())
{
}

PatternStore::PatternStore(const Config& config)
    : config_(config)
{
    patterns_.reserve(config_.initial_capacity);
}

// ============================================================================
// Helper Methods
// ============================================================================

void PatternStore::EraseFromIndex(std::unordered_map<std::string, IdSet>& index,
                                  const std::string& key,
                                  const std::string& id) {
    auto it = index.find(key);
    if (it == index.end()) {
        return;
    }
    it->second.erase(id);
    if (it->second.empty()) {
        index.erase(it);
    }
}

void PatternStore::UpdateIndices(const Pattern& pattern, bool add) {
    const std::string& id = pattern.GetId();

    if (add) {
        type_index_[pattern.GetType()].insert(id);

        if (pattern.GetDomain()) {
            domain_index_[*pattern.GetDomain()].insert(id);
        }

        for (const auto& tag : pattern.GetTags()) {
            tag_index_[tag].insert(id);
        }
    } else {
        auto type_it = type_index_.find(pattern.GetType());
        if (type_it != type_index_.end()) {
            type_it->second.erase(id);
            if (type_it->second.empty()) {
                type_index_.erase(type_it);
            }
        }

        if (pattern.GetDomain()) {
            EraseFromIndex(domain_index_, *pattern.GetDomain(), id);
        }

        for (const auto& tag : pattern.GetTags()) {
            EraseFromIndex(tag_index_, tag, id);
        }
    }
}

// Oldest first, id as tie-break
static bool CreatedBefore(const Pattern& a, const Pattern& b) {
    return a.GetCreatedAt() != b.GetCreatedAt() ? a.GetCreatedAt() < b.GetCreatedAt()
                                                : a.GetId() < b.GetId();
}

std::vector<Pattern> PatternStore::Materialize(const IdSet* ids) const {
    std::vector<Pattern> results;
    if (ids == nullptr) {
        return results;
    }

    results.reserve(ids->size());
    for (const auto& id : *ids) {
        auto it = patterns_.find(id);
        if (it != patterns_.end()) {
            results.push_back(it->second);
        }
    }

    // Stable output order for callers
    std::sort(results.begin(), results.end(), CreatedBefore);
    return results;
}

// ============================================================================
// Core Operations
// ============================================================================

std::string PatternStore::Add(const Pattern& pattern) {
    const std::string& id = pattern.GetId();

    if (patterns_.find(id) != patterns_.end()) {
        throw FrameworkError(ErrorCode::DUPLICATE_ID, "Pattern with ID " + id + " already exists");
    }

    auto [it, inserted] = patterns_.emplace(id, pattern);
    (void)inserted;
    UpdateIndices(it->second, true);

    return id;
}

std::optional<Pattern> PatternStore::Get(const std::string& id) const {
    auto it = patterns_.find(id);
    if (it != patterns_.end()) {
        return it->second;
    }
    return std::nullopt;
}

const Pattern* PatternStore::Find(const std::string& id) const {
    auto it = patterns_.find(id);
    return it != patterns_.end() ? &it->second : nullptr;
}

bool PatternStore::Remove(const std::string& id) {
    auto it = patterns_.find(id);
    if (it == patterns_.end()) {
        return false;
    }

    // Update indices before deletion
    UpdateIndices(it->second, false);
    patterns_.erase(it);
    return true;
}

bool PatternStore::Contains(const std::string& id) const {
    return patterns_.find(id) != patterns_.end();
}

// ============================================================================
// Index Queries
// ============================================================================

std::vector<Pattern> PatternStore::GetByType(PatternType type) const {
    auto it = type_index_.find(type);
    return Materialize(it != type_index_.end() ? &it->second : nullptr);
}

std::vector<Pattern> PatternStore::GetByDomain(const std::string& domain) const {
    auto it = domain_index_.find(domain);
    return Materialize(it != domain_index_.end() ? &it->second : nullptr);
}

std::vector<Pattern> PatternStore::GetByTag(const std::string& tag) const {
    auto it = tag_index_.find(Pattern::NormalizeTag(tag));
    return Materialize(it != tag_index_.end() ? &it->second : nullptr);
}

size_t PatternStore::CountByType(PatternType type) const {
    auto it = type_index_.find(type);
    return it != type_index_.end() ? it->second.size() : 0;
}

std::optional<std::string> PatternStore::FindByIdentity(
        PatternType type,
        const std::string& name,
        const std::optional<std::string>& domain) const {
    auto it = type_index_.find(type);
    if (it == type_index_.end()) {
        return std::nullopt;
    }

    // Several patterns may share an identity; the oldest one wins
    std::string trimmed_name = Trim(name);
    const Pattern* best = nullptr;
    for (const auto& id : it->second) {
        const Pattern& pattern = patterns_.at(id);
        if (pattern.GetName() == trimmed_name && pattern.GetDomain() == domain &&
            (best == nullptr || CreatedBefore(pattern, *best))) {
            best = &pattern;
        }
    }
    if (best == nullptr) {
        return std::nullopt;
    }
    return best->GetId();
}

// ============================================================================
// Search and Iteration
// ============================================================================

std::vector<Pattern> PatternStore::Search(const std::string& query) const {
    std::string lowered = ToLower(query);

    IdSet matches;
    for (const auto& [id, pattern] : patterns_) {
        if (pattern.MatchesText(lowered)) {
            matches.insert(id);
        }
    }
    return Materialize(&matches);
}

std::vector<Pattern> PatternStore::All() const {
    IdSet ids;
    ids.reserve(patterns_.size());
    for (const auto& [id, pattern] : patterns_) {
        ids.insert(id);
    }
    return Materialize(&ids);
}

std::vector<std::string> PatternStore::Ids() const {
    std::vector<std::string> ids;
    ids.reserve(patterns_.size());
    for (const auto& [id, pattern] : patterns_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

void PatternStore::Clear() {
    patterns_.clear();
    type_index_.clear();
    domain_index_.clear();
    tag_index_.clear();
}

// ============================================================================
// Consistency
// ============================================================================

std::vector<std::string> PatternStore::CheckConsistency() const {
    std::vector<std::string> problems;

    // Every indexed id must exist and satisfy the index predicate
    for (const auto& [type, ids] : type_index_) {
        for (const auto& id : ids) {
            const Pattern* pattern = Find(id);
            if (pattern == nullptr || pattern->GetType() != type) {
                problems.push_back("type index entry " + std::string(ToString(type)) + " -> " + id +
                                   " does not match the primary map");
            }
        }
    }
    for (const auto& [domain, ids] : domain_index_) {
        for (const auto& id : ids) {
            const Pattern* pattern = Find(id);
            if (pattern == nullptr || pattern->GetDomain() != domain) {
                problems.push_back("domain index entry " + domain + " -> " + id +
                                   " does not match the primary map");
            }
        }
    }
    for (const auto& [tag, ids] : tag_index_) {
        for (const auto& id : ids) {
            const Pattern* pattern = Find(id);
            if (pattern == nullptr || pattern->GetTags().count(tag) == 0) {
                problems.push_back("tag index entry " + tag + " -> " + id +
                                   " does not match the primary map");
            }
        }
    }

    // Every stored pattern must appear in each index it qualifies for
    for (const auto& [id, pattern] : patterns_) {
        auto type_it = type_index_.find(pattern.GetType());
        if (type_it == type_index_.end() || type_it->second.count(id) == 0) {
            problems.push_back("pattern " + id + " missing from type index");
        }
        if (pattern.GetDomain()) {
            auto domain_it = domain_index_.find(*pattern.GetDomain());
            if (domain_it == domain_index_.end() || domain_it->second.count(id) == 0) {
                problems.push_back("pattern " + id + " missing from domain index");
            }
        }
        for (const auto& tag : pattern.GetTags()) {
            auto tag_it = tag_index_.find(tag);
            if (tag_it == tag_index_.end() || tag_it->second.count(id) == 0) {
                problems.push_back("pattern " + id + " missing from tag index");
            }
        }
    }

    return problems;
}

} // namespace p3if
