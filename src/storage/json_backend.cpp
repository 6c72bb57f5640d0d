// File: src/storage/json_backend.cpp
#include "storage/json_backend.hpp"
#include "core/errors.hpp"
#include "io/json_codec.hpp"
#include <fstream>
#include <iostream>
#include <sys/stat.h>

namespace p3if {

// ============================================================================
// Constructor and Destructor
// ============================================================================

JsonFileBackend::JsonFileBackend(const Config& config)
    : config_(config) {
    if (config_.file_path.empty()) {
        throw FrameworkError(ErrorCode::STORAGE_ERROR, "JSON storage requires a file path");
    }
    LoadFromFile();
}

JsonFileBackend::~JsonFileBackend() {
    if (!config_.auto_flush) {
        std::lock_guard<std::mutex> lock(mutex_);
        // Failures are already reported on stderr; destructors must not throw
        bool written = WriteFileLocked();
        (void)written;
    }
}

// ============================================================================
// File I/O
// ============================================================================

void JsonFileBackend::LoadFromFile() {
    std::ifstream existing(config_.file_path);
    if (!existing.is_open()) {
        // Nothing persisted yet
        return;
    }
    existing.close();

    std::map<std::string, Pattern> patterns;
    std::map<std::string, Relationship> relationships;

    try {
        Json::Value root = json_codec::ParseFile(config_.file_path);
        if (!root.isObject()) {
            throw FrameworkError(ErrorCode::PARSE_ERROR, "top-level value is not an object");
        }

        const Json::Value& pattern_records = root["patterns"];
        if (pattern_records.isObject()) {
            for (const auto& id : pattern_records.getMemberNames()) {
                Pattern pattern = json_codec::DecodePattern(pattern_records[id]);
                patterns.emplace(pattern.GetId(), pattern);
            }
        }

        const Json::Value& relationship_records = root["relationships"];
        if (relationship_records.isObject()) {
            for (const auto& id : relationship_records.getMemberNames()) {
                Relationship relationship = json_codec::DecodeRelationship(relationship_records[id]);
                relationships.emplace(relationship.GetId(), relationship);
            }
        }
    } catch (const FrameworkError& e) {
        std::cerr << "Warning: Ignoring unreadable storage file " << config_.file_path
                  << " (" << e.what() << "), starting empty" << std::endl;
        recovered_from_corruption_ = true;
        return;
    }

    patterns_ = std::move(patterns);
    relationships_ = std::move(relationships);
}

bool JsonFileBackend::WriteFileLocked() {
    Json::Value root(Json::objectValue);

    Json::Value pattern_records(Json::objectValue);
    for (const auto& [id, pattern] : patterns_) {
        pattern_records[id] = json_codec::EncodePattern(pattern);
    }
    root["patterns"] = pattern_records;

    Json::Value relationship_records(Json::objectValue);
    for (const auto& [id, relationship] : relationships_) {
        relationship_records[id] = json_codec::EncodeRelationship(relationship);
    }
    root["relationships"] = relationship_records;

    try {
        json_codec::WriteFile(config_.file_path, root);
    } catch (const FrameworkError& e) {
        std::cerr << "Warning: " << e.what() << std::endl;
        return false;
    }
    return true;
}

bool JsonFileBackend::PersistLocked() {
    total_writes_.fetch_add(1, std::memory_order_relaxed);
    if (!config_.auto_flush) {
        return true;
    }
    return WriteFileLocked();
}

// ============================================================================
// Patterns
// ============================================================================

bool JsonFileBackend::SavePattern(const Pattern& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    patterns_.insert_or_assign(pattern.GetId(), pattern);
    return PersistLocked();
}

std::optional<Pattern> JsonFileBackend::GetPattern(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_reads_.fetch_add(1, std::memory_order_relaxed);

    auto it = patterns_.find(id);
    if (it != patterns_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<Pattern> JsonFileBackend::GetPatternsByType(PatternType type) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_reads_.fetch_add(1, std::memory_order_relaxed);

    std::vector<Pattern> results;
    for (const auto& [id, pattern] : patterns_) {
        if (pattern.GetType() == type) {
            results.push_back(pattern);
        }
    }
    return results;
}

bool JsonFileBackend::DeletePattern(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (patterns_.erase(id) == 0) {
        return false;
    }
    return PersistLocked();
}

// ============================================================================
// Relationships
// ============================================================================

bool JsonFileBackend::SaveRelationship(const Relationship& relationship) {
    std::lock_guard<std::mutex> lock(mutex_);
    relationships_.insert_or_assign(relationship.GetId(), relationship);
    return PersistLocked();
}

std::optional<Relationship> JsonFileBackend::GetRelationship(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_reads_.fetch_add(1, std::memory_order_relaxed);

    auto it = relationships_.find(id);
    if (it != relationships_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool JsonFileBackend::DeleteRelationship(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (relationships_.erase(id) == 0) {
        return false;
    }
    return PersistLocked();
}

// ============================================================================
// Bulk Access
// ============================================================================

std::vector<Pattern> JsonFileBackend::LoadPatterns() {
    std::lock_guard<std::mutex> lock(mutex_);
    total_reads_.fetch_add(1, std::memory_order_relaxed);

    std::vector<Pattern> results;
    results.reserve(patterns_.size());
    for (const auto& [id, pattern] : patterns_) {
        results.push_back(pattern);
    }
    return results;
}

std::vector<Relationship> JsonFileBackend::LoadRelationships() {
    std::lock_guard<std::mutex> lock(mutex_);
    total_reads_.fetch_add(1, std::memory_order_relaxed);

    std::vector<Relationship> results;
    results.reserve(relationships_.size());
    for (const auto& [id, relationship] : relationships_) {
        results.push_back(relationship);
    }
    return results;
}

void JsonFileBackend::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    patterns_.clear();
    relationships_.clear();
    if (!PersistLocked()) {
        throw FrameworkError(ErrorCode::STORAGE_ERROR, "Failed to clear " + config_.file_path);
    }
}

// ============================================================================
// Maintenance
// ============================================================================

StorageStats JsonFileBackend::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    StorageStats stats;
    stats.pattern_count = patterns_.size();
    stats.relationship_count = relationships_.size();
    stats.total_reads = total_reads_.load(std::memory_order_relaxed);
    stats.total_writes = total_writes_.load(std::memory_order_relaxed);

    struct stat st;
    if (stat(config_.file_path.c_str(), &st) == 0) {
        stats.disk_usage_bytes = static_cast<size_t>(st.st_size);
    }
    return stats;
}

void JsonFileBackend::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!WriteFileLocked()) {
        throw FrameworkError(ErrorCode::STORAGE_ERROR, "Failed to flush " + config_.file_path);
    }
}

} // namespace p3if
