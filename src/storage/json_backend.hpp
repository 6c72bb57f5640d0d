// File: src/storage/json_backend.hpp
#pragma once

#include "storage/storage_backend.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace p3if {

/// Single-file JSON persistence backend (jsoncpp)
///
/// The whole data set is held in memory and rewritten to the file after each
/// change when auto_flush is enabled. File layout:
///   { "patterns": { "<id>": {record}, ... },
///     "relationships": { "<id>": {record}, ... } }
///
/// A missing file starts empty. An unreadable or corrupt file is reported
/// on stderr and the backend also starts empty; the file is overwritten on
/// the next write.
class JsonFileBackend : public StorageBackend {
public:
    /// Configuration for JsonFileBackend
    struct Config {
        /// Path to the JSON file
        std::string file_path;

        /// Rewrite the file after every mutation
        bool auto_flush{true};
    };

    explicit JsonFileBackend(const Config& config);
    ~JsonFileBackend() override;

    JsonFileBackend(const JsonFileBackend&) = delete;
    JsonFileBackend& operator=(const JsonFileBackend&) = delete;

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

    /// True if the file existed but could not be parsed at construction
    bool RecoveredFromCorruption() const { return recovered_from_corruption_; }

    const std::string& GetFilePath() const { return config_.file_path; }

private:
    void LoadFromFile();

    /// Write the file if auto_flush is on; caller holds mutex_
    bool PersistLocked();
    bool WriteFileLocked();

    Config config_;
    mutable std::mutex mutex_;

    std::map<std::string, Pattern> patterns_;
    std::map<std::string, Relationship> relationships_;

    bool recovered_from_corruption_{false};

    mutable std::atomic<uint64_t> total_reads_{0};
    std::atomic<uint64_t> total_writes_{0};
};

} // namespace p3if
