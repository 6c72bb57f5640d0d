// File: src/framework/dimension_swapper.cpp
#include "framework/dimension_swapper.hpp"
#include "core/errors.hpp"

namespace p3if {

DimensionSwapper::DimensionSwapper(const PatternStore& patterns, RelationshipStore& relationships)
    : patterns_(patterns),
      relationships_(relationships)
{
}

size_t DimensionSwapper::HotSwap(const Pattern& old_pattern, const Pattern& new_pattern) {
    const Pattern* registered = patterns_.Find(new_pattern.GetId());
    if (registered == nullptr) {
        throw FrameworkError(ErrorCode::NOT_FOUND,
                             "Replacement pattern " + new_pattern.GetId() + " is not registered");
    }

    PatternType slot = old_pattern.GetType();
    if (registered->GetType() != slot) {
        throw FrameworkError(ErrorCode::TYPE_MISMATCH,
                             "Cannot swap " + std::string(ToString(slot)) + " " + old_pattern.GetId() +
                             " for " + ToString(registered->GetType()) + " " + new_pattern.GetId());
    }

    if (old_pattern.GetId() == new_pattern.GetId()) {
        return 0;
    }

    size_t updated = 0;
    for (const auto& relationship_id : relationships_.ReferencingIds(old_pattern.GetId())) {
        const Relationship* relationship = relationships_.Find(relationship_id);
        if (relationship == nullptr || relationship->GetSlot(slot) != old_pattern.GetId()) {
            // References old_pattern through a different slot only
            continue;
        }
        if (relationships_.RelinkSlot(relationship_id, slot, new_pattern.GetId())) {
            ++updated;
        }
    }
    return updated;
}

size_t DimensionSwapper::HotSwap(const std::string& old_id, const std::string& new_id) {
    const Pattern* old_pattern = patterns_.Find(old_id);
    if (old_pattern == nullptr) {
        throw FrameworkError(ErrorCode::NOT_FOUND, "Pattern " + old_id + " not found");
    }
    const Pattern* new_pattern = patterns_.Find(new_id);
    if (new_pattern == nullptr) {
        throw FrameworkError(ErrorCode::NOT_FOUND,
                             "Replacement pattern " + new_id + " is not registered");
    }
    return HotSwap(*old_pattern, *new_pattern);
}

} // namespace p3if
