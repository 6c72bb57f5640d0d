// File: src/storage/sqlite_backend.hpp
#pragma once

#include "storage/storage_backend.hpp"
#include <atomic>
#include <json/json.h>
#include <mutex>
#include <string>
#include <sqlite3.h>

namespace p3if {

/// Persistent pattern/relationship backend using SQLite
///
/// Schema:
///   patterns(id TEXT PRIMARY KEY, name, description, type, tags, metadata,
///            domain, quality_score, validation_status, version, attributes,
///            created_at, updated_at)
///   relationships(id TEXT PRIMARY KEY, property_id, process_id,
///                 perspective_id, strength, confidence, bidirectional,
///                 relationship_type, metadata, created_at, updated_at)
///
/// tags, metadata and attributes are JSON text; timestamps are ISO-8601.
/// Saves are INSERT OR REPLACE upserts.
class SqliteBackend : public StorageBackend {
public:
    /// Configuration for SqliteBackend
    struct Config {
        /// Path to the SQLite database file (":memory:" for a private in-memory db)
        std::string db_path;

        /// Enable Write-Ahead Logging for better concurrency
        bool enable_wal{true};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};

        /// Busy timeout in milliseconds
        int busy_timeout_ms{5000};
    };

    /// @throws FrameworkError(STORAGE_ERROR) if the database cannot be opened
    explicit SqliteBackend(const Config& config);

    /// Closes the database connection
    ~SqliteBackend() override;

    // Prevent copying (SQLite connection is not copyable)
    SqliteBackend(const SqliteBackend&) = delete;
    SqliteBackend& operator=(const SqliteBackend&) = delete;

    // ========================================================================
    // StorageBackend Interface Implementation
    // ========================================================================

    bool SavePattern(const Pattern& pattern) override;
    std::optional<Pattern> GetPattern(const std::string& id) override;
    std::vector<Pattern> GetPatternsByType(PatternType type) override;
    bool DeletePattern(const std::string& id) override;

    bool SaveRelationship(const Relationship& relationship) override;
    std::optional<Relationship> GetRelationship(const std::string& id) override;
    bool DeleteRelationship(const std::string& id) override;

    std::vector<Pattern> LoadPatterns() override;
    std::vector<Relationship> LoadRelationships() override;
    void Clear() override;

    StorageStats GetStats() const override;
    void Flush() override;

private:
    Config config_;

    // SQLite database handle
    sqlite3* db_{nullptr};

    // Serializes access to the connection
    mutable std::mutex mutex_;

    mutable std::atomic<uint64_t> total_reads_{0};
    std::atomic<uint64_t> total_writes_{0};

    // ========================================================================
    // Helper Methods
    // ========================================================================

    void InitializeDatabase();
    void CreateTables();
    void CreateIndices();

    /// Execute a SQL statement
    /// @return true if successful, false otherwise
    bool ExecuteSQL(const std::string& sql);

    /// Run a SELECT over the patterns table; where_clause may bind one text value
    std::vector<Pattern> QueryPatterns(const std::string& where_clause,
                                       const std::optional<std::string>& bind_value) const;
    std::vector<Relationship> QueryRelationships(const std::string& where_clause,
                                                 const std::optional<std::string>& bind_value) const;

    bool DeleteById(const char* sql, const std::string& id);

    size_t CountRows(const char* table) const;
    size_t GetDatabaseSize() const;

    static Pattern RowToPattern(sqlite3_stmt* stmt);
    static Relationship RowToRelationship(sqlite3_stmt* stmt);
};

} // namespace p3if
