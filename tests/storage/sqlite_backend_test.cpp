// File: tests/storage/sqlite_backend_test.cpp
#include "storage/sqlite_backend.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <thread>
#include <vector>
#include <ctime>

namespace p3if {
namespace {

// ============================================================================
// Helper Functions
// ============================================================================

std::string GetTempDbPath() {
    static int counter = 0;
    return "/tmp/test_p3if_sqlite_" + std::to_string(std::time(nullptr)) +
           "_" + std::to_string(counter++) + ".db";
}

void RemoveDb(const std::string& path) {
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
}

SqliteBackend::Config MemoryConfig() {
    SqliteBackend::Config config;
    config.db_path = ":memory:";
    return config;
}

Pattern CreateDetailedPattern() {
    Pattern pattern = Pattern::Create(PatternType::PROCESS, "Incident response", "ops",
                                      std::string("Triage and resolve incidents"));
    pattern.SetTags({"oncall", "sre"});
    pattern.SetMetadata("owner", "platform");
    pattern.SetQualityScore(0.75);
    pattern.SetValidationStatus(ValidationStatus::VALIDATED);
    ProcessAttributes attributes;
    attributes.inputs = {"alert"};
    attributes.outputs = {"postmortem"};
    attributes.complexity = "high";
    pattern.SetAttributes(attributes);
    return pattern;
}

// ============================================================================
// Constructor Tests
// ============================================================================

TEST(SqliteBackendTest, ConstructorCreatesDatabase) {
    std::string db_path = GetTempDbPath();
    {
        SqliteBackend::Config config;
        config.db_path = db_path;
        SqliteBackend backend(config);
        EXPECT_EQ(0u, backend.GetStats().pattern_count);
    }
    EXPECT_TRUE(std::filesystem::exists(db_path));
    RemoveDb(db_path);
}

TEST(SqliteBackendTest, EmptyPathIsRejected) {
    SqliteBackend::Config config;
    try {
        SqliteBackend backend(config);
        FAIL() << "expected FrameworkError";
    } catch (const FrameworkError& e) {
        EXPECT_EQ(ErrorCode::STORAGE_ERROR, e.code());
    }
}

TEST(SqliteBackendTest, UnopenablePathIsRejected) {
    SqliteBackend::Config config;
    config.db_path = "/nonexistent-directory/for/p3if/test.db";
    EXPECT_THROW(SqliteBackend backend(config), FrameworkError);
}

// ============================================================================
// Pattern Tests
// ============================================================================

TEST(SqliteBackendTest, PatternRoundTripKeepsEveryField) {
    SqliteBackend backend(MemoryConfig());
    Pattern pattern = CreateDetailedPattern();

    ASSERT_TRUE(backend.SavePattern(pattern));
    auto loaded = backend.GetPattern(pattern.GetId());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(pattern, *loaded);
    EXPECT_EQ("platform", loaded->GetMetadata()["owner"].asString());
    EXPECT_EQ("high", loaded->AsProcess()->complexity);
}

TEST(SqliteBackendTest, SaveIsAnUpsert) {
    SqliteBackend backend(MemoryConfig());
    Pattern pattern = CreateDetailedPattern();
    backend.SavePattern(pattern);

    pattern.SetName("Major incident response");
    backend.SavePattern(pattern);

    EXPECT_EQ(1u, backend.GetStats().pattern_count);
    EXPECT_EQ("Major incident response", backend.GetPattern(pattern.GetId())->GetName());
}

TEST(SqliteBackendTest, GetPatternsByType) {
    SqliteBackend backend(MemoryConfig());
    backend.SavePattern(Pattern::Create(PatternType::PROPERTY, "A"));
    backend.SavePattern(Pattern::Create(PatternType::PROPERTY, "B"));
    backend.SavePattern(Pattern::Create(PatternType::PERSPECTIVE, "C"));

    EXPECT_EQ(2u, backend.GetPatternsByType(PatternType::PROPERTY).size());
    EXPECT_EQ(1u, backend.GetPatternsByType(PatternType::PERSPECTIVE).size());
    EXPECT_TRUE(backend.GetPatternsByType(PatternType::PROCESS).empty());
    EXPECT_EQ(3u, backend.LoadPatterns().size());
}

TEST(SqliteBackendTest, DeleteReportsWhetherRowExisted) {
    SqliteBackend backend(MemoryConfig());
    Pattern pattern = Pattern::Create(PatternType::PROPERTY, "Disposable");
    backend.SavePattern(pattern);

    EXPECT_TRUE(backend.DeletePattern(pattern.GetId()));
    EXPECT_FALSE(backend.DeletePattern(pattern.GetId()));
    EXPECT_FALSE(backend.GetPattern(pattern.GetId()).has_value());
}

// ============================================================================
// Relationship Tests
// ============================================================================

TEST(SqliteBackendTest, RelationshipRoundTrip) {
    SqliteBackend backend(MemoryConfig());
    Relationship relationship = Relationship::Connect(std::string("p1"), std::nullopt, std::string("v1"), 0.8, 0.9);
    relationship.SetRelationshipType("dependency");
    relationship.SetBidirectional(false);

    ASSERT_TRUE(backend.SaveRelationship(relationship));
    auto loaded = backend.GetRelationship(relationship.GetId());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(relationship, *loaded);
    EXPECT_FALSE(loaded->GetProcessId().has_value());

    EXPECT_EQ(1u, backend.LoadRelationships().size());
    EXPECT_TRUE(backend.DeleteRelationship(relationship.GetId()));
    EXPECT_FALSE(backend.GetRelationship(relationship.GetId()).has_value());
}

// ============================================================================
// Persistence and Maintenance
// ============================================================================

TEST(SqliteBackendTest, DataSurvivesReopen) {
    std::string db_path = GetTempDbPath();
    Pattern pattern = CreateDetailedPattern();
    {
        SqliteBackend::Config config;
        config.db_path = db_path;
        SqliteBackend backend(config);
        backend.SavePattern(pattern);
        backend.Flush();
    }
    {
        SqliteBackend::Config config;
        config.db_path = db_path;
        SqliteBackend backend(config);
        auto loaded = backend.GetPattern(pattern.GetId());
        ASSERT_TRUE(loaded.has_value());
        EXPECT_EQ(pattern, *loaded);
    }
    RemoveDb(db_path);
}

TEST(SqliteBackendTest, ClearResetsEverything) {
    SqliteBackend backend(MemoryConfig());
    backend.SavePattern(Pattern::Create(PatternType::PROPERTY, "A"));
    backend.SaveRelationship(Relationship::Connect(std::string("x"), std::nullopt, std::nullopt));
    backend.Clear();

    StorageStats stats = backend.GetStats();
    EXPECT_EQ(0u, stats.pattern_count);
    EXPECT_EQ(0u, stats.relationship_count);
    EXPECT_EQ(0u, stats.total_writes);
}

TEST(SqliteBackendTest, ConcurrentWritesAreSerialized) {
    std::string db_path = GetTempDbPath();
    {
        SqliteBackend::Config config;
        config.db_path = db_path;
        SqliteBackend backend(config);

        constexpr int kThreads = 4;
        constexpr int kPerThread = 25;
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&backend, t]() {
                for (int i = 0; i < kPerThread; ++i) {
                    backend.SavePattern(Pattern::Create(PatternType::PROPERTY,
                                                        "P" + std::to_string(t) + "_" + std::to_string(i)));
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        EXPECT_EQ(static_cast<size_t>(kThreads * kPerThread), backend.GetStats().pattern_count);
    }
    RemoveDb(db_path);
}

} // namespace
} // namespace p3if
