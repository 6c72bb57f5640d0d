// File: src/framework/framework.hpp
#pragma once

#include "config/framework_config.hpp"
#include "framework/metrics_cache.hpp"
#include "framework/multiplexer.hpp"
#include "framework/validator.hpp"
#include "framework/worker_pool.hpp"
#include "storage/pattern_store.hpp"
#include "storage/relationship_store.hpp"
#include "storage/storage_backend.hpp"
#include <atomic>
#include <chrono>
#include <json/json.h>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace p3if {

/// Patterns grouped by dimension
struct PatternCollection {
    std::vector<Pattern> properties;
    std::vector<Pattern> processes;
    std::vector<Pattern> perspectives;

    std::vector<Pattern> AllPatterns() const;
    size_t Size() const { return properties.size() + processes.size() + perspectives.size(); }
};

/// Outcome of ReplacePattern
struct SwapResult {
    size_t replaced_patterns{0};
    size_t updated_relationships{0};
};

/// Summary of an import or storage load
struct ImportResult {
    size_t patterns_imported{0};
    size_t relationships_imported{0};
    size_t duplicates{0};  // id already present, record ignored
    size_t rejected{0};    // relationship with dangling or mistyped slots
    std::vector<std::string> errors;

    std::string ToString() const;
};

/// Options for ImportFromJson
struct ImportOptions {
    /// Insert relationships whose slots do not resolve instead of rejecting
    /// them; ValidateFramework reports what was let through
    bool lenient{false};
};

/// One independent multiplex batch for MultiplexBatches
struct MultiplexJob {
    class Framework* target{nullptr};
    ExternalFramework external;
};

/// Framework: the in-memory pattern/relationship engine
///
/// Owns a PatternStore, a RelationshipStore, the MetricsCache and a single
/// std::shared_mutex. Every mutation takes the mutex exclusively and
/// invalidates the metrics cache on success; every read takes it shared and
/// returns copies. Composite operations (hot swap, multiplex, import) run
/// entirely inside one exclusive critical section, so index consistency is
/// never observed half-updated.
///
/// When a StorageBackend is attached, each successful mutation is mirrored to
/// it. Mirroring failures are logged and do not undo the in-memory change.
///
/// Example usage:
/// @code
///   Framework framework;
///   auto prop = Pattern::Create(PatternType::PROPERTY, "Encryption", "security");
///   auto proc = Pattern::Create(PatternType::PROCESS, "Key rotation", "ops");
///   framework.AddPattern(prop);
///   framework.AddPattern(proc);
///   framework.AddRelationship(Relationship::Connect(prop.GetId(), proc.GetId(), std::nullopt, 0.8, 0.9));
///   Metrics metrics = framework.GetMetrics();
/// @endcode
class Framework {
public:
    /// Configuration for Framework
    struct Config {
        /// Maximum age of cached metrics
        std::chrono::milliseconds metrics_cache_timeout{std::chrono::seconds(300)};

        /// What RemovePattern does with referencing relationships
        RemovalPolicy removal_policy{RemovalPolicy::RESTRICT};

        /// Log routine operations to stderr
        bool verbose{false};

        PatternStore::Config pattern_store;
        RelationshipStore::Config relationship_store;
        Validator::Config validation;
        Multiplexer::Config multiplex;

        /// Translate a loaded YAML configuration
        /// @throws std::invalid_argument for an unknown removal policy or an
        ///         out-of-range cache timeout
        static Config FromFrameworkConfig(const FrameworkConfig& config);
    };

    Framework();
    explicit Framework(const Config& config);
    Framework(const Config& config, std::shared_ptr<StorageBackend> storage);

    /// Build a framework from YAML settings, attaching and loading the
    /// configured storage backend
    /// @throws FrameworkError(STORAGE_ERROR) if the backend cannot be opened
    static std::unique_ptr<Framework> Create(const FrameworkConfig& config);

    Framework(const Framework&) = delete;
    Framework& operator=(const Framework&) = delete;

    // ========================================================================
    // Patterns
    // ========================================================================

    /// @throws FrameworkError(DUPLICATE_ID)
    std::string AddPattern(const Pattern& pattern);

    std::optional<Pattern> GetPattern(const std::string& id) const;

    /// Remove a pattern according to the removal policy
    /// @return false if the pattern does not exist
    /// @throws FrameworkError(PATTERN_IN_USE) under RESTRICT while referenced
    bool RemovePattern(const std::string& id);

    std::vector<Pattern> GetPatternsByType(PatternType type) const;
    std::vector<Pattern> GetPatternsByDomain(const std::string& domain) const;
    std::vector<Pattern> GetPatternsByTag(const std::string& tag) const;

    /// Case-insensitive substring search over name and description
    std::vector<Pattern> SearchPatterns(const std::string& query) const;

    std::vector<Pattern> GetAllPatterns() const;
    PatternCollection GetPatternCollection() const;

    bool Contains(const std::string& pattern_id) const;
    size_t PatternCount() const;

    // ========================================================================
    // Relationships
    // ========================================================================

    /// @throws FrameworkError(DUPLICATE_ID, DANGLING_REFERENCE, TYPE_MISMATCH)
    std::string AddRelationship(const Relationship& relationship);

    std::optional<Relationship> GetRelationship(const std::string& id) const;

    /// @return false if the relationship does not exist
    bool RemoveRelationship(const std::string& id);

    std::vector<Relationship> GetRelationshipsByPattern(const std::string& pattern_id) const;
    std::vector<Relationship> GetAllRelationships() const;
    size_t RelationshipCount() const;

    // ========================================================================
    // Validation and Metrics
    // ========================================================================

    ValidationReport ValidateFramework() const;

    /// Cached aggregate metrics (recomputed under the shared lock when stale)
    Metrics GetMetrics() const;

    void InvalidateMetricsCache();
    MetricsCache::Stats GetMetricsCacheStats() const;

    // ========================================================================
    // Composite Mutations
    // ========================================================================

    /// Rewrite relationships from old_pattern to new_pattern
    /// @return Number of relationships rewritten
    /// @throws FrameworkError(NOT_FOUND) if new_pattern is not registered
    /// @throws FrameworkError(TYPE_MISMATCH) if the types differ
    size_t HotSwapDimension(const Pattern& old_pattern, const Pattern& new_pattern);
    size_t HotSwapDimension(const std::string& old_id, const std::string& new_id);

    /// Register new_pattern if needed, swap old_id for it and remove old_id
    /// @throws FrameworkError(NOT_FOUND) if old_id is unknown
    /// @throws FrameworkError(TYPE_MISMATCH) if the types differ
    /// @throws FrameworkError(PATTERN_IN_USE) if old_id is also held in a slot
    ///         of another dimension
    SwapResult ReplacePattern(const std::string& old_id, const Pattern& new_pattern);

    /// Merge an external pattern/relationship set; item failures are counted
    MultiplexResult Multiplex(const ExternalFramework& external);

    /// Run independent batches on a worker pool, one task per job
    /// @return Results in job order
    static std::vector<MultiplexResult> MultiplexBatches(const std::vector<MultiplexJob>& jobs,
                                                         WorkerPool& pool);

    /// New framework holding the union of several frameworks; duplicate ids
    /// keep the first occurrence
    static std::unique_ptr<Framework> Combine(const std::vector<const Framework*>& frameworks);
    static std::unique_ptr<Framework> Combine(const std::vector<const Framework*>& frameworks,
                                              const Config& config);

    /// Remove every pattern and relationship
    void Clear();

    // ========================================================================
    // Import / Export
    // ========================================================================

    Json::Value ExportDocument() const;
    std::string ExportToJson(bool pretty = true) const;

    /// @throws FrameworkError(STORAGE_ERROR) if the file cannot be written
    void ExportToJsonFile(const std::string& path) const;

    /// Import an export document through the primary operations
    ///
    /// The whole document is decoded before any state changes, so a malformed
    /// document leaves the framework untouched.
    /// @throws FrameworkError(PARSE_ERROR) on malformed JSON or records
    ImportResult ImportFromJson(const std::string& json, const ImportOptions& options = {});
    ImportResult ImportFromJsonFile(const std::string& path, const ImportOptions& options = {});
    ImportResult ImportDocument(const Json::Value& root, const ImportOptions& options = {});

    // ========================================================================
    // Storage
    // ========================================================================

    void AttachStorage(std::shared_ptr<StorageBackend> storage);
    std::shared_ptr<StorageBackend> GetStorage() const;

    /// Load every persisted pattern and relationship (lenient, no mirroring)
    ImportResult LoadFromStorage();

    // ========================================================================
    // Settings
    // ========================================================================

    RemovalPolicy GetRemovalPolicy() const;
    void SetRemovalPolicy(RemovalPolicy policy);

    bool IsVerbose() const { return verbose_.load(std::memory_order_relaxed); }
    void SetVerbose(bool verbose) { verbose_.store(verbose, std::memory_order_relaxed); }

    /// Consistency check of both stores' indexes (test and debug aid)
    std::vector<std::string> CheckConsistency() const;

private:
    // Caller holds mutex_ exclusively
    void MirrorPattern(const Pattern& pattern);
    void MirrorRelationship(const std::string& relationship_id);
    void MirrorPatternDelete(const std::string& id);
    void MirrorRelationshipDelete(const std::string& id);
    ImportResult InsertLocked(const std::vector<Pattern>& patterns,
                              const std::vector<Relationship>& relationships,
                              bool lenient,
                              bool mirror);

    // Writer-preferring acquisition: readers wait while a writer is queued
    std::shared_lock<std::shared_mutex> ReadLock() const;
    std::unique_lock<std::shared_mutex> WriteLock();

    void Log(const std::string& message) const;

    Config config_;

    mutable std::shared_mutex mutex_;
    std::atomic<int> pending_writers_{0};
    PatternStore patterns_;
    RelationshipStore relationships_;
    Validator validator_;
    mutable MetricsCache metrics_cache_;
    std::shared_ptr<StorageBackend> storage_;

    std::atomic<bool> verbose_;
};

} // namespace p3if
