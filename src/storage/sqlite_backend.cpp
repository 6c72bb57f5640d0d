// File: src/storage/sqlite_backend.cpp
#include "storage/sqlite_backend.hpp"
#include "core/errors.hpp"
#include "io/json_codec.hpp"
#include <iostream>
#include <sys/stat.h>

namespace p3if {

namespace {

// Columns shared by every pattern SELECT, in RowToPattern order
constexpr const char* kPatternColumns =
    "id, name, description, type, tags, metadata, domain, quality_score, "
    "validation_status, version, attributes, created_at, updated_at";

constexpr const char* kRelationshipColumns =
    "id, property_id, process_id, perspective_id, strength, confidence, "
    "bidirectional, relationship_type, metadata, created_at, updated_at";

std::optional<std::string> ColumnText(sqlite3_stmt* stmt, int column) {
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, column)));
}

Json::Value ColumnJson(sqlite3_stmt* stmt, int column) {
    auto text = ColumnText(stmt, column);
    if (!text || text->empty()) {
        return Json::Value();
    }
    return json_codec::Parse(*text);
}

Json::Value TextOrNull(const std::optional<std::string>& value) {
    return value ? Json::Value(*value) : Json::Value();
}

void BindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
    if (value) {
        BindText(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

} // namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

SqliteBackend::SqliteBackend(const Config& config)
    : config_(config) {

    if (config_.db_path.empty()) {
        throw FrameworkError(ErrorCode::STORAGE_ERROR, "SQLite storage requires a database path");
    }

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw FrameworkError(ErrorCode::STORAGE_ERROR, "Failed to open database: " + error);
    }

    try {
        InitializeDatabase();
    } catch (const FrameworkError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteBackend::~SqliteBackend() {
    if (db_) {
        // sqlite3_close_v2 defers the close until outstanding statements finish
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void SqliteBackend::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    if (config_.enable_wal && config_.db_path != ":memory:") {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");

    CreateTables();
    CreateIndices();
}

void SqliteBackend::CreateTables() {
    std::string create_patterns = R"(
        CREATE TABLE IF NOT EXISTS patterns (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            description TEXT,
            type TEXT NOT NULL,
            tags TEXT,
            metadata TEXT,
            domain TEXT,
            quality_score REAL NOT NULL DEFAULT 1.0,
            validation_status TEXT NOT NULL DEFAULT 'draft',
            version TEXT NOT NULL DEFAULT '1.0.0',
            attributes TEXT,
            created_at TEXT,
            updated_at TEXT
        );
    )";

    if (!ExecuteSQL(create_patterns)) {
        throw FrameworkError(ErrorCode::STORAGE_ERROR, "Failed to create patterns table");
    }

    std::string create_relationships = R"(
        CREATE TABLE IF NOT EXISTS relationships (
            id TEXT PRIMARY KEY,
            property_id TEXT,
            process_id TEXT,
            perspective_id TEXT,
            strength REAL NOT NULL,
            confidence REAL NOT NULL,
            bidirectional INTEGER NOT NULL,
            relationship_type TEXT NOT NULL DEFAULT 'general',
            metadata TEXT,
            created_at TEXT,
            updated_at TEXT
        );
    )";

    if (!ExecuteSQL(create_relationships)) {
        throw FrameworkError(ErrorCode::STORAGE_ERROR, "Failed to create relationships table");
    }
}

void SqliteBackend::CreateIndices() {
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_patterns_type ON patterns(type);");
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_patterns_domain ON patterns(domain);");
}

bool SqliteBackend::ExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        if (error_msg) {
            std::cerr << "SQLite error: " << error_msg << std::endl;
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

// ============================================================================
// Row Conversion
// ============================================================================

Pattern SqliteBackend::RowToPattern(sqlite3_stmt* stmt) {
    // Rebuild the JSON record and reuse the codec's validation
    Json::Value record(Json::objectValue);
    record["id"] = TextOrNull(ColumnText(stmt, 0));
    record["name"] = TextOrNull(ColumnText(stmt, 1));
    record["description"] = TextOrNull(ColumnText(stmt, 2));
    record["type"] = TextOrNull(ColumnText(stmt, 3));
    record["tags"] = ColumnJson(stmt, 4);
    record["metadata"] = ColumnJson(stmt, 5);
    record["domain"] = TextOrNull(ColumnText(stmt, 6));
    record["quality_score"] = sqlite3_column_double(stmt, 7);
    record["validation_status"] = TextOrNull(ColumnText(stmt, 8));
    record["version"] = TextOrNull(ColumnText(stmt, 9));
    record["attributes"] = ColumnJson(stmt, 10);
    record["created_at"] = TextOrNull(ColumnText(stmt, 11));
    record["updated_at"] = TextOrNull(ColumnText(stmt, 12));
    return json_codec::DecodePattern(record);
}

Relationship SqliteBackend::RowToRelationship(sqlite3_stmt* stmt) {
    Json::Value record(Json::objectValue);
    record["id"] = TextOrNull(ColumnText(stmt, 0));
    record["property_id"] = TextOrNull(ColumnText(stmt, 1));
    record["process_id"] = TextOrNull(ColumnText(stmt, 2));
    record["perspective_id"] = TextOrNull(ColumnText(stmt, 3));
    record["strength"] = sqlite3_column_double(stmt, 4);
    record["confidence"] = sqlite3_column_double(stmt, 5);
    record["bidirectional"] = sqlite3_column_int(stmt, 6) != 0;
    record["relationship_type"] = TextOrNull(ColumnText(stmt, 7));
    record["metadata"] = ColumnJson(stmt, 8);
    record["created_at"] = TextOrNull(ColumnText(stmt, 9));
    record["updated_at"] = TextOrNull(ColumnText(stmt, 10));
    return json_codec::DecodeRelationship(record);
}

// ============================================================================
// Patterns
// ============================================================================

bool SqliteBackend::SavePattern(const Pattern& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);

    total_writes_.fetch_add(1, std::memory_order_relaxed);

    const char* sql =
        "INSERT OR REPLACE INTO patterns "
        "(id, name, description, type, tags, metadata, domain, quality_score, "
        " validation_status, version, attributes, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    Json::Value tags(Json::arrayValue);
    for (const auto& tag : pattern.GetTags()) {
        tags.append(tag);
    }

    BindText(stmt, 1, pattern.GetId());
    BindText(stmt, 2, pattern.GetName());
    BindOptionalText(stmt, 3, pattern.GetDescription());
    BindText(stmt, 4, ToString(pattern.GetType()));
    BindText(stmt, 5, json_codec::Write(tags, false));
    BindText(stmt, 6, json_codec::Write(pattern.GetMetadata(), false));
    BindOptionalText(stmt, 7, pattern.GetDomain());
    sqlite3_bind_double(stmt, 8, pattern.GetQualityScore());
    BindText(stmt, 9, ToString(pattern.GetValidationStatus()));
    BindText(stmt, 10, pattern.GetVersion());
    BindText(stmt, 11, json_codec::Write(json_codec::EncodeAttributes(pattern.GetAttributes()), false));
    BindText(stmt, 12, pattern.GetCreatedAt().ToIso8601());
    BindText(stmt, 13, pattern.GetUpdatedAt().ToIso8601());

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE;
}

std::optional<Pattern> SqliteBackend::GetPattern(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto results = QueryPatterns("WHERE id = ?", id);
    if (results.empty()) {
        return std::nullopt;
    }
    return results.front();
}

std::vector<Pattern> SqliteBackend::GetPatternsByType(PatternType type) {
    std::lock_guard<std::mutex> lock(mutex_);
    return QueryPatterns("WHERE type = ?", std::string(ToString(type)));
}

bool SqliteBackend::DeletePattern(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return DeleteById("DELETE FROM patterns WHERE id = ?;", id);
}

std::vector<Pattern> SqliteBackend::QueryPatterns(const std::string& where_clause,
                                                  const std::optional<std::string>& bind_value) const {
    std::vector<Pattern> results;

    std::string sql = std::string("SELECT ") + kPatternColumns + " FROM patterns " +
                      where_clause + " ORDER BY created_at, id;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return results;
    }

    if (bind_value) {
        BindText(stmt, 1, *bind_value);
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        try {
            results.push_back(RowToPattern(stmt));
        } catch (const FrameworkError& e) {
            std::cerr << "Warning: Skipping unreadable pattern row: " << e.what() << std::endl;
        }
    }

    sqlite3_finalize(stmt);

    total_reads_.fetch_add(1, std::memory_order_relaxed);
    return results;
}

// ============================================================================
// Relationships
// ============================================================================

bool SqliteBackend::SaveRelationship(const Relationship& relationship) {
    std::lock_guard<std::mutex> lock(mutex_);

    total_writes_.fetch_add(1, std::memory_order_relaxed);

    const char* sql =
        "INSERT OR REPLACE INTO relationships "
        "(id, property_id, process_id, perspective_id, strength, confidence, "
        " bidirectional, relationship_type, metadata, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    BindText(stmt, 1, relationship.GetId());
    BindOptionalText(stmt, 2, relationship.GetPropertyId());
    BindOptionalText(stmt, 3, relationship.GetProcessId());
    BindOptionalText(stmt, 4, relationship.GetPerspectiveId());
    sqlite3_bind_double(stmt, 5, relationship.GetStrength());
    sqlite3_bind_double(stmt, 6, relationship.GetConfidence());
    sqlite3_bind_int(stmt, 7, relationship.IsBidirectional() ? 1 : 0);
    BindText(stmt, 8, relationship.GetRelationshipType());
    BindText(stmt, 9, json_codec::Write(relationship.GetMetadata(), false));
    BindText(stmt, 10, relationship.GetCreatedAt().ToIso8601());
    BindText(stmt, 11, relationship.GetUpdatedAt().ToIso8601());

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE;
}

std::optional<Relationship> SqliteBackend::GetRelationship(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto results = QueryRelationships("WHERE id = ?", id);
    if (results.empty()) {
        return std::nullopt;
    }
    return results.front();
}

bool SqliteBackend::DeleteRelationship(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return DeleteById("DELETE FROM relationships WHERE id = ?;", id);
}

std::vector<Relationship> SqliteBackend::QueryRelationships(
        const std::string& where_clause,
        const std::optional<std::string>& bind_value) const {
    std::vector<Relationship> results;

    std::string sql = std::string("SELECT ") + kRelationshipColumns + " FROM relationships " +
                      where_clause + " ORDER BY created_at, id;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return results;
    }

    if (bind_value) {
        BindText(stmt, 1, *bind_value);
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        try {
            results.push_back(RowToRelationship(stmt));
        } catch (const FrameworkError& e) {
            std::cerr << "Warning: Skipping unreadable relationship row: " << e.what() << std::endl;
        }
    }

    sqlite3_finalize(stmt);

    total_reads_.fetch_add(1, std::memory_order_relaxed);
    return results;
}

bool SqliteBackend::DeleteById(const char* sql, const std::string& id) {
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    BindText(stmt, 1, id);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return false;
    }

    total_writes_.fetch_add(1, std::memory_order_relaxed);

    // Check if any row was deleted
    return sqlite3_changes(db_) > 0;
}

// ============================================================================
// Bulk Access
// ============================================================================

std::vector<Pattern> SqliteBackend::LoadPatterns() {
    std::lock_guard<std::mutex> lock(mutex_);
    return QueryPatterns("", std::nullopt);
}

std::vector<Relationship> SqliteBackend::LoadRelationships() {
    std::lock_guard<std::mutex> lock(mutex_);
    return QueryRelationships("", std::nullopt);
}

void SqliteBackend::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!ExecuteSQL("DELETE FROM relationships;") || !ExecuteSQL("DELETE FROM patterns;")) {
        throw FrameworkError(ErrorCode::STORAGE_ERROR, "Failed to clear " + config_.db_path);
    }

    // Reset statistics
    total_reads_.store(0, std::memory_order_relaxed);
    total_writes_.store(0, std::memory_order_relaxed);
}

// ============================================================================
// Statistics and Maintenance
// ============================================================================

// Internal helper - assumes mutex is already locked
size_t SqliteBackend::CountRows(const char* table) const {
    std::string sql = std::string("SELECT COUNT(*) FROM ") + table + ";";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);

    return count;
}

size_t SqliteBackend::GetDatabaseSize() const {
    struct stat st;
    if (stat(config_.db_path.c_str(), &st) == 0) {
        return static_cast<size_t>(st.st_size);
    }
    return 0;
}

StorageStats SqliteBackend::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    StorageStats stats;
    stats.pattern_count = CountRows("patterns");
    stats.relationship_count = CountRows("relationships");
    stats.total_reads = total_reads_.load(std::memory_order_relaxed);
    stats.total_writes = total_writes_.load(std::memory_order_relaxed);
    stats.disk_usage_bytes = GetDatabaseSize();
    return stats;
}

void SqliteBackend::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);

    // WAL checkpoint
    if (config_.enable_wal && !ExecuteSQL("PRAGMA wal_checkpoint(FULL);")) {
        throw FrameworkError(ErrorCode::STORAGE_ERROR, "WAL checkpoint failed for " + config_.db_path);
    }
}

} // namespace p3if
