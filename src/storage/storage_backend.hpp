// File: src/storage/storage_backend.hpp
#pragma once

#include "core/pattern.hpp"
#include "core/relationship.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace p3if {

/// Storage statistics for monitoring a persistence backend
struct StorageStats {
    /// Records currently persisted
    size_t pattern_count{0};
    size_t relationship_count{0};

    /// Operation counters since construction
    uint64_t total_reads{0};
    uint64_t total_writes{0};

    /// Size of the backing file in bytes (0 if unknown)
    size_t disk_usage_bytes{0};
};

/// Abstract interface for pattern/relationship persistence
///
/// The framework core is persistence-agnostic: when a backend is attached,
/// Framework mirrors every successful mutation to it and can reload its
/// contents at start-up. Save* are upserts.
///
/// Thread Safety: All methods must be thread-safe.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    // ========================================================================
    // Patterns
    // ========================================================================

    /// Insert or replace a pattern
    /// @return true if persisted successfully
    virtual bool SavePattern(const Pattern& pattern) = 0;

    /// @return The pattern if found, std::nullopt otherwise
    virtual std::optional<Pattern> GetPattern(const std::string& id) = 0;

    /// All persisted patterns of one type
    virtual std::vector<Pattern> GetPatternsByType(PatternType type) = 0;

    /// @return true if deleted, false if the pattern was not persisted
    virtual bool DeletePattern(const std::string& id) = 0;

    // ========================================================================
    // Relationships
    // ========================================================================

    /// Insert or replace a relationship
    virtual bool SaveRelationship(const Relationship& relationship) = 0;

    virtual std::optional<Relationship> GetRelationship(const std::string& id) = 0;

    virtual bool DeleteRelationship(const std::string& id) = 0;

    // ========================================================================
    // Bulk Access
    // ========================================================================

    /// Every persisted pattern
    virtual std::vector<Pattern> LoadPatterns() = 0;

    /// Every persisted relationship
    virtual std::vector<Relationship> LoadRelationships() = 0;

    /// Remove all persisted data
    /// @throws FrameworkError(STORAGE_ERROR) if the change cannot be persisted
    virtual void Clear() = 0;

    // ========================================================================
    // Maintenance
    // ========================================================================

    virtual StorageStats GetStats() const = 0;

    /// Force buffered data to durable storage
    /// @throws FrameworkError(STORAGE_ERROR) on write failure
    virtual void Flush() = 0;
};

/// Create a backend by name
/// @param type "memory" (returns nullptr), "json" or "sqlite"
/// @param path File path for json and sqlite backends
/// @throws FrameworkError(INVALID_ARGUMENT) for an unknown type
/// @throws FrameworkError(STORAGE_ERROR) if the backend cannot be opened
std::shared_ptr<StorageBackend> CreateStorageBackend(const std::string& type,
                                                     const std::string& path);

} // namespace p3if
