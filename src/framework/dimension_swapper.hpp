// File: src/framework/dimension_swapper.hpp
#pragma once

#include "storage/pattern_store.hpp"
#include "storage/relationship_store.hpp"
#include <string>

namespace p3if {

/// Hot-swap of one pattern for another across existing relationships
///
/// Rewrites the slot matching the pattern's dimension in every relationship
/// that names the old pattern there. Relationship identity, scores and every
/// other field are preserved. Built only on RelationshipStore::RelinkSlot, so
/// the pattern -> relationships index stays consistent for both ids.
///
/// The old pattern is never removed; that is left to the caller.
/// Not synchronized; Framework invokes it under its exclusive lock.
class DimensionSwapper {
public:
    DimensionSwapper(const PatternStore& patterns, RelationshipStore& relationships);

    /// Swap old_pattern for new_pattern
    /// @return Number of relationships rewritten (may be 0)
    /// @throws FrameworkError(NOT_FOUND) if new_pattern is not registered
    /// @throws FrameworkError(TYPE_MISMATCH) if the two patterns differ in type
    size_t HotSwap(const Pattern& old_pattern, const Pattern& new_pattern);

    /// Swap by id; both ids must be registered
    /// @throws FrameworkError(NOT_FOUND) if either id is unknown
    /// @throws FrameworkError(TYPE_MISMATCH) if the two patterns differ in type
    size_t HotSwap(const std::string& old_id, const std::string& new_id);

private:
    const PatternStore& patterns_;
    RelationshipStore& relationships_;
};

} // namespace p3if
