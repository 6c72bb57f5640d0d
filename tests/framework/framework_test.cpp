// File: tests/framework/framework_test.cpp
#include "framework/framework.hpp"
#include "core/errors.hpp"
#include "storage/json_backend.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <functional>
#include <thread>

namespace p3if {
namespace {

// ============================================================================
// Test Fixture
// ============================================================================

class FrameworkTest : public ::testing::Test {
protected:
    void SetUp() override {
        property_ = Pattern::Create(PatternType::PROPERTY, "Encryption", "security");
        process_ = Pattern::Create(PatternType::PROCESS, "Key rotation", "ops");
        perspective_ = Pattern::Create(PatternType::PERSPECTIVE, "Auditor", "compliance");
        framework_.AddPattern(property_);
        framework_.AddPattern(process_);
        framework_.AddPattern(perspective_);
    }

    std::string Link(double strength = 0.8, double confidence = 0.9) {
        return framework_.AddRelationship(
            Relationship::Connect(property_.GetId(), process_.GetId(), perspective_.GetId(),
                                  strength, confidence));
    }

    static ErrorCode CodeOf(const std::function<void()>& action) {
        try {
            action();
        } catch (const FrameworkError& e) {
            return e.code();
        }
        ADD_FAILURE() << "expected FrameworkError";
        return ErrorCode::INVALID_ARGUMENT;
    }

    Framework framework_;
    Pattern property_{PatternType::PROPERTY, "placeholder"};
    Pattern process_{PatternType::PROCESS, "placeholder"};
    Pattern perspective_{PatternType::PERSPECTIVE, "placeholder"};
};

// ============================================================================
// Patterns and Relationships
// ============================================================================

TEST_F(FrameworkTest, PatternCollectionGroupsByDimension) {
    PatternCollection collection = framework_.GetPatternCollection();
    ASSERT_EQ(1u, collection.properties.size());
    ASSERT_EQ(1u, collection.processes.size());
    ASSERT_EQ(1u, collection.perspectives.size());
    EXPECT_EQ(property_, collection.properties[0]);
    EXPECT_EQ(3u, collection.Size());
    EXPECT_EQ(3u, collection.AllPatterns().size());
}

TEST_F(FrameworkTest, ContainsAndCounts) {
    EXPECT_TRUE(framework_.Contains(property_.GetId()));
    EXPECT_FALSE(framework_.Contains("missing"));
    EXPECT_EQ(3u, framework_.PatternCount());
    EXPECT_EQ(0u, framework_.RelationshipCount());
}

TEST_F(FrameworkTest, QueriesReturnCopies) {
    auto fetched = framework_.GetPattern(property_.GetId());
    ASSERT_TRUE(fetched.has_value());
    fetched->SetName("Mutated copy");
    EXPECT_EQ("Encryption", framework_.GetPattern(property_.GetId())->GetName());

    EXPECT_EQ(1u, framework_.GetPatternsByDomain("security").size());
    EXPECT_EQ(1u, framework_.GetPatternsByType(PatternType::PERSPECTIVE).size());
    EXPECT_EQ(1u, framework_.SearchPatterns("ROTATION").size());
    EXPECT_EQ(3u, framework_.GetAllPatterns().size());
}

TEST_F(FrameworkTest, DuplicatePatternIsRejected) {
    EXPECT_EQ(ErrorCode::DUPLICATE_ID, CodeOf([this] { framework_.AddPattern(property_); }));
    EXPECT_EQ(3u, framework_.PatternCount());
}

TEST_F(FrameworkTest, RelationshipValidatesCleanly) {
    framework_.AddRelationship(Relationship::Connect(property_.GetId(), process_.GetId(), std::nullopt));

    ValidationReport report = framework_.ValidateFramework();
    EXPECT_TRUE(report.valid);
    EXPECT_EQ(0u, report.issues.size());
}

TEST_F(FrameworkTest, DanglingRelationshipIsRejected) {
    Relationship relationship = Relationship::Connect(property_.GetId(), std::string("ghost"), std::nullopt);
    EXPECT_EQ(ErrorCode::DANGLING_REFERENCE,
              CodeOf([&] { framework_.AddRelationship(relationship); }));
    EXPECT_EQ(0u, framework_.RelationshipCount());
}

TEST_F(FrameworkTest, RelationshipsByPattern) {
    std::string id = Link();
    auto found = framework_.GetRelationshipsByPattern(perspective_.GetId());
    ASSERT_EQ(1u, found.size());
    EXPECT_EQ(id, found[0].GetId());

    EXPECT_TRUE(framework_.RemoveRelationship(id));
    EXPECT_FALSE(framework_.RemoveRelationship(id));
    EXPECT_TRUE(framework_.GetRelationshipsByPattern(perspective_.GetId()).empty());
}

// ============================================================================
// Removal Policy
// ============================================================================

TEST_F(FrameworkTest, RestrictBlocksReferencedRemoval) {
    Link();
    EXPECT_EQ(RemovalPolicy::RESTRICT, framework_.GetRemovalPolicy());
    EXPECT_EQ(ErrorCode::PATTERN_IN_USE, CodeOf([this] { framework_.RemovePattern(process_.GetId()); }));
    EXPECT_TRUE(framework_.Contains(process_.GetId()));
    EXPECT_EQ(1u, framework_.RelationshipCount());
}

TEST_F(FrameworkTest, CascadeRemovesReferencingRelationships) {
    Link();
    Link();
    framework_.SetRemovalPolicy(RemovalPolicy::CASCADE);

    EXPECT_TRUE(framework_.RemovePattern(process_.GetId()));
    EXPECT_FALSE(framework_.Contains(process_.GetId()));
    EXPECT_EQ(0u, framework_.RelationshipCount());
    EXPECT_TRUE(framework_.GetRelationshipsByPattern(property_.GetId()).empty());
    EXPECT_TRUE(framework_.CheckConsistency().empty());
}

TEST_F(FrameworkTest, RemovePatternIsIdempotent) {
    EXPECT_TRUE(framework_.RemovePattern(perspective_.GetId()));
    EXPECT_FALSE(framework_.RemovePattern(perspective_.GetId()));
    EXPECT_FALSE(framework_.RemovePattern("never-existed"));
}

// ============================================================================
// Metrics
// ============================================================================

TEST_F(FrameworkTest, MetricsAreCachedUntilMutation) {
    Link();
    Metrics first = framework_.GetMetrics();
    Metrics second = framework_.GetMetrics();
    EXPECT_EQ(first, second);
    EXPECT_EQ(1u, framework_.GetMetricsCacheStats().hits);
    EXPECT_EQ(0u, first.orphaned_patterns);

    framework_.AddPattern(Pattern::Create(PatternType::PROPERTY, "Lonely"));
    Metrics third = framework_.GetMetrics();
    EXPECT_EQ(4u, third.total_patterns);
    EXPECT_EQ(1u, third.orphaned_patterns);
    EXPECT_EQ(2u, framework_.GetMetricsCacheStats().computations);
}

TEST_F(FrameworkTest, InvalidateClearsCache) {
    framework_.GetMetrics();
    framework_.InvalidateMetricsCache();
    framework_.GetMetrics();
    EXPECT_EQ(2u, framework_.GetMetricsCacheStats().computations);
}

TEST_F(FrameworkTest, FailedMutationKeepsCache) {
    framework_.GetMetrics();
    uint64_t invalidations = framework_.GetMetricsCacheStats().invalidations;

    EXPECT_THROW(framework_.AddPattern(property_), FrameworkError);
    EXPECT_FALSE(framework_.RemoveRelationship("missing"));
    EXPECT_EQ(invalidations, framework_.GetMetricsCacheStats().invalidations);
}

// ============================================================================
// Hot Swap and Replace
// ============================================================================

TEST_F(FrameworkTest, HotSwapKeepsOldPattern) {
    std::string relationship_id = Link();
    Pattern replacement = Pattern::Create(PatternType::PROCESS, "Automated key rotation", "ops");
    framework_.AddPattern(replacement);

    EXPECT_EQ(1u, framework_.HotSwapDimension(process_, replacement));
    EXPECT_TRUE(framework_.Contains(process_.GetId()));
    EXPECT_EQ(replacement.GetId(), framework_.GetRelationship(relationship_id)->GetProcessId().value());
    EXPECT_TRUE(framework_.GetRelationshipsByPattern(process_.GetId()).empty());
    EXPECT_TRUE(framework_.CheckConsistency().empty());
}

TEST_F(FrameworkTest, HotSwapByIdReportsMissing) {
    EXPECT_EQ(ErrorCode::NOT_FOUND,
              CodeOf([this] { framework_.HotSwapDimension("missing", process_.GetId()); }));
    EXPECT_EQ(ErrorCode::TYPE_MISMATCH,
              CodeOf([this] { framework_.HotSwapDimension(process_.GetId(), property_.GetId()); }));
}

TEST_F(FrameworkTest, ReplacePatternSwapsAndRemoves) {
    std::string relationship_id = Link(0.6, 0.7);
    Pattern replacement = Pattern::Create(PatternType::PROCESS, "Managed keys", "ops");

    SwapResult result = framework_.ReplacePattern(process_.GetId(), replacement);
    EXPECT_EQ(1u, result.replaced_patterns);
    EXPECT_EQ(1u, result.updated_relationships);
    EXPECT_FALSE(framework_.Contains(process_.GetId()));
    EXPECT_TRUE(framework_.Contains(replacement.GetId()));

    auto relationship = framework_.GetRelationship(relationship_id);
    ASSERT_TRUE(relationship.has_value());
    EXPECT_EQ(replacement.GetId(), relationship->GetProcessId().value());
    EXPECT_DOUBLE_EQ(0.6, relationship->GetStrength());
    EXPECT_TRUE(framework_.CheckConsistency().empty());
}

TEST_F(FrameworkTest, ReplacePatternRejectsBadInput) {
    Pattern wrong_type = Pattern::Create(PatternType::PERSPECTIVE, "Operator");
    EXPECT_EQ(ErrorCode::TYPE_MISMATCH,
              CodeOf([&] { framework_.ReplacePattern(process_.GetId(), wrong_type); }));
    EXPECT_EQ(ErrorCode::NOT_FOUND,
              CodeOf([&] { framework_.ReplacePattern("missing", wrong_type); }));
    EXPECT_FALSE(framework_.Contains(wrong_type.GetId()));

    SwapResult same = framework_.ReplacePattern(process_.GetId(), process_);
    EXPECT_EQ(0u, same.replaced_patterns);
    EXPECT_TRUE(framework_.Contains(process_.GetId()));
}

// ============================================================================
// Multiplex and Combine
// ============================================================================

TEST_F(FrameworkTest, MultiplexEmptyListsIntegratesNothing) {
    ExternalFramework external;
    external.patterns["properties"];
    external.patterns["processes"];
    external.patterns["perspectives"];

    MultiplexResult result = framework_.Multiplex(external);
    EXPECT_EQ(0u, result.integrated_patterns);
    EXPECT_EQ(3u, framework_.PatternCount());
}

TEST_F(FrameworkTest, MultiplexInvalidatesMetrics) {
    EXPECT_EQ(3u, framework_.GetMetrics().total_patterns);

    ExternalFramework external;
    ExternalPatternData data;
    data.name = "Tokenization";
    external.patterns["properties"].push_back(data);
    EXPECT_EQ(1u, framework_.Multiplex(external).integrated_patterns);
    EXPECT_EQ(4u, framework_.GetMetrics().total_patterns);
}

TEST(FrameworkBatchTest, MultiplexBatchesRunsEveryJob) {
    Framework first;
    Framework second;

    std::vector<MultiplexJob> jobs(2);
    jobs[0].target = &first;
    jobs[1].target = &second;
    for (int i = 0; i < 10; ++i) {
        ExternalPatternData data;
        data.name = "Pattern " + std::to_string(i);
        jobs[0].external.patterns["processes"].push_back(data);
        if (i < 4) {
            jobs[1].external.patterns["perspectives"].push_back(data);
        }
    }

    WorkerPool pool;
    std::vector<MultiplexResult> results = Framework::MultiplexBatches(jobs, pool);
    ASSERT_EQ(2u, results.size());
    EXPECT_EQ(10u, results[0].integrated_patterns);
    EXPECT_EQ(4u, results[1].integrated_patterns);
    EXPECT_EQ(10u, first.PatternCount());
    EXPECT_EQ(4u, second.PatternCount());

    jobs[1].target = nullptr;
    EXPECT_THROW(Framework::MultiplexBatches(jobs, pool), FrameworkError);
}

TEST_F(FrameworkTest, CombineUnionsFrameworks) {
    Link();

    Framework other;
    other.AddPattern(property_);  // same id, kept once
    other.AddPattern(Pattern::Create(PatternType::PROPERTY, "Redundancy"));

    auto combined = Framework::Combine({&framework_, &other, nullptr});
    EXPECT_EQ(4u, combined->PatternCount());
    EXPECT_EQ(1u, combined->RelationshipCount());
    EXPECT_TRUE(combined->CheckConsistency().empty());

    // Sources are untouched
    EXPECT_EQ(3u, framework_.PatternCount());
    EXPECT_EQ(2u, other.PatternCount());
}

// ============================================================================
// Import / Export
// ============================================================================

TEST_F(FrameworkTest, ExportImportRoundTrip) {
    Link();
    std::string json = framework_.ExportToJson();

    Framework restored;
    ImportResult result = restored.ImportFromJson(json);
    EXPECT_EQ(3u, result.patterns_imported);
    EXPECT_EQ(1u, result.relationships_imported);
    EXPECT_EQ(0u, result.rejected);

    EXPECT_EQ(framework_.GetAllPatterns(), restored.GetAllPatterns());
    EXPECT_EQ(framework_.GetAllRelationships(), restored.GetAllRelationships());
    EXPECT_EQ(framework_.GetMetrics(), restored.GetMetrics());
}

TEST_F(FrameworkTest, ImportCountsDuplicates) {
    std::string json = framework_.ExportToJson(false);
    ImportResult result = framework_.ImportFromJson(json);
    EXPECT_EQ(0u, result.patterns_imported);
    EXPECT_EQ(3u, result.duplicates);
    EXPECT_EQ(3u, framework_.PatternCount());
}

TEST_F(FrameworkTest, MalformedImportLeavesFrameworkUntouched) {
    std::string json = R"({"patterns": [
        {"name": "Fine", "type": "property"},
        {"name": "Broken", "type": "property", "quality_score": 7}
    ]})";

    EXPECT_EQ(ErrorCode::PARSE_ERROR, CodeOf([&] { framework_.ImportFromJson(json); }));
    EXPECT_EQ(ErrorCode::PARSE_ERROR, CodeOf([&] { framework_.ImportFromJson("not json"); }));
    EXPECT_EQ(3u, framework_.PatternCount());
}

TEST_F(FrameworkTest, DanglingImportRejectedUnlessLenient) {
    std::string json = R"({"relationships": [
        {"id": "r1", "property_id": "nowhere", "process_id": "nobody"}
    ]})";

    Framework strict;
    ImportResult rejected = strict.ImportFromJson(json);
    EXPECT_EQ(1u, rejected.rejected);
    EXPECT_EQ(1u, rejected.errors.size());
    EXPECT_EQ(0u, strict.RelationshipCount());

    Framework lenient;
    ImportOptions options;
    options.lenient = true;
    ImportResult accepted = lenient.ImportFromJson(json, options);
    EXPECT_EQ(1u, accepted.relationships_imported);
    EXPECT_FALSE(lenient.ValidateFramework().valid);
}

// ============================================================================
// Storage Mirroring
// ============================================================================

TEST(FrameworkStorageTest, MutationsAreMirroredAndReloaded) {
    std::string path = (std::filesystem::temp_directory_path() /
                        ("p3if_framework_" +
                         std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                         ".json")).string();
    JsonFileBackend::Config backend_config;
    backend_config.file_path = path;

    Pattern property = Pattern::Create(PatternType::PROPERTY, "Durability");
    Pattern process = Pattern::Create(PatternType::PROCESS, "Snapshotting");
    Pattern scratch = Pattern::Create(PatternType::PERSPECTIVE, "Scratch");
    std::string relationship_id;
    {
        Framework framework(Framework::Config(), std::make_shared<JsonFileBackend>(backend_config));
        framework.AddPattern(property);
        framework.AddPattern(process);
        framework.AddPattern(scratch);
        relationship_id = framework.AddRelationship(
            Relationship::Connect(property.GetId(), process.GetId(), std::nullopt));
        framework.RemovePattern(scratch.GetId());
    }

    Framework reloaded(Framework::Config(), std::make_shared<JsonFileBackend>(backend_config));
    ImportResult loaded = reloaded.LoadFromStorage();
    EXPECT_EQ(2u, loaded.patterns_imported);
    EXPECT_EQ(1u, loaded.relationships_imported);
    EXPECT_TRUE(reloaded.Contains(property.GetId()));
    EXPECT_FALSE(reloaded.Contains(scratch.GetId()));
    EXPECT_TRUE(reloaded.GetRelationship(relationship_id).has_value());

    reloaded.Clear();
    EXPECT_EQ(0u, reloaded.PatternCount());
    EXPECT_EQ(0u, reloaded.GetStorage()->GetStats().pattern_count);
    std::filesystem::remove(path);
}

TEST(FrameworkStorageTest, NoStorageLoadsNothing) {
    Framework framework;
    EXPECT_EQ(nullptr, framework.GetStorage());
    EXPECT_EQ(0u, framework.LoadFromStorage().patterns_imported);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST(FrameworkThreadTest, ConcurrentAddsAndReadsStayConsistent) {
    Framework framework;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&framework, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                framework.AddPattern(Pattern::Create(PatternType::PROPERTY,
                                                     "T" + std::to_string(t) + "-" + std::to_string(i)));
                framework.GetMetrics();
                framework.PatternCount();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<size_t>(kThreads * kPerThread), framework.PatternCount());
    EXPECT_EQ(static_cast<size_t>(kThreads * kPerThread), framework.GetMetrics().total_patterns);
    EXPECT_TRUE(framework.CheckConsistency().empty());
}

} // namespace
} // namespace p3if
