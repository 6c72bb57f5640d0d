// File: tests/integration/end_to_end_test.cpp
//
// Integration tests for the P3IF framework.
// Tests end-to-end workflows across configuration, storage, multiplexing and export.

#include "config/framework_config.hpp"
#include "framework/framework.hpp"
#include "io/json_codec.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

using namespace p3if;

// ============================================================================
// Test Utilities
// ============================================================================

/// Unique path in the temp directory
std::string TempPath(const std::string& extension) {
    static int counter = 0;
    return (std::filesystem::temp_directory_path() /
            ("p3if_e2e_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
             "_" + std::to_string(counter++) + extension)).string();
}

/// Small security framework: two properties, two processes, one perspective
struct SecurityFramework {
    std::vector<Pattern> patterns;
    std::vector<Relationship> relationships;

    SecurityFramework() {
        patterns.push_back(Pattern::Create(PatternType::PROPERTY, "Confidentiality", "security"));
        patterns.push_back(Pattern::Create(PatternType::PROPERTY, "Integrity", "security"));
        patterns.push_back(Pattern::Create(PatternType::PROCESS, "Access review", "governance"));
        patterns.push_back(Pattern::Create(PatternType::PROCESS, "Checksum audit", "ops"));
        patterns.push_back(Pattern::Create(PatternType::PERSPECTIVE, "CISO", "governance"));

        relationships.push_back(Relationship::Connect(patterns[0].GetId(), patterns[2].GetId(),
                                                      patterns[4].GetId(), 0.9, 0.8));
        relationships.push_back(Relationship::Connect(patterns[1].GetId(), patterns[3].GetId(),
                                                      std::nullopt, 0.6, 0.7));
    }

    void LoadInto(Framework& framework) const {
        for (const auto& pattern : patterns) {
            framework.AddPattern(pattern);
        }
        for (const auto& relationship : relationships) {
            framework.AddRelationship(relationship);
        }
    }
};

// ============================================================================
// Workflows
// ============================================================================

TEST(EndToEndTest, BuildValidateMeasure) {
    Framework framework;
    SecurityFramework data;
    data.LoadInto(framework);

    ValidationReport report = framework.ValidateFramework();
    EXPECT_TRUE(report.valid);
    EXPECT_EQ(0u, report.issues.size());

    Metrics metrics = framework.GetMetrics();
    EXPECT_EQ(5u, metrics.total_patterns);
    EXPECT_EQ(2u, metrics.total_relationships);
    EXPECT_EQ(3u, metrics.domain_count);
    EXPECT_EQ(0u, metrics.orphaned_patterns);
    EXPECT_NEAR(0.75, metrics.average_relationship_strength, 1e-9);
    EXPECT_NEAR(0.75, metrics.average_confidence, 1e-9);
}

TEST(EndToEndTest, JsonExportImportPreservesMetrics) {
    Framework original;
    SecurityFramework data;
    data.LoadInto(original);

    std::string path = TempPath(".json");
    original.ExportToJsonFile(path);

    Framework restored;
    ImportResult result = restored.ImportFromJsonFile(path);
    EXPECT_EQ(5u, result.patterns_imported);
    EXPECT_EQ(2u, result.relationships_imported);
    EXPECT_EQ(original.GetMetrics(), restored.GetMetrics());
    EXPECT_EQ(original.GetAllRelationships(), restored.GetAllRelationships());
    std::filesystem::remove(path);
}

TEST(EndToEndTest, SqliteStorageSurvivesRestart) {
    std::string db_path = TempPath(".db");
    FrameworkConfig config = FrameworkConfig::Default();
    config.storage.type = "sqlite";
    config.storage.path = db_path;

    SecurityFramework data;
    {
        auto framework = Framework::Create(config);
        data.LoadInto(*framework);
        framework->RemoveRelationship(data.relationships[1].GetId());
    }

    auto reopened = Framework::Create(config);
    EXPECT_EQ(5u, reopened->PatternCount());
    EXPECT_EQ(1u, reopened->RelationshipCount());
    EXPECT_EQ(data.relationships[0], *reopened->GetRelationship(data.relationships[0].GetId()));
    EXPECT_TRUE(reopened->CheckConsistency().empty());

    reopened.reset();
    std::filesystem::remove(db_path);
    std::filesystem::remove(db_path + "-wal");
    std::filesystem::remove(db_path + "-shm");
}

TEST(EndToEndTest, MultiplexExternalFrameworkAndSwap) {
    Framework framework;
    SecurityFramework data;
    data.LoadInto(framework);

    // Partner framework re-uses one process by name and brings a new one
    Json::Value external_json = json_codec::Parse(R"({
        "processes": [
            {"id": "partner-review", "name": "Access review", "domain": "governance"},
            {"id": "partner-pam", "name": "Privileged access management", "domain": "governance"}
        ],
        "relationships": [
            {"property_id": ")" + data.patterns[0].GetId() + R"(", "process_id": "partner-pam", "strength": 0.95}
        ]
    })");

    MultiplexResult result = framework.Multiplex(json_codec::DecodeExternalFramework(external_json));
    EXPECT_EQ(1u, result.integrated_patterns);
    EXPECT_EQ(1u, result.skipped);
    EXPECT_EQ(1u, result.integrated_relationships);
    EXPECT_EQ(6u, framework.PatternCount());

    // Replace the old access review with the partner's PAM process everywhere
    SwapResult swap = framework.ReplacePattern(data.patterns[2].GetId(), *framework.GetPattern("partner-pam"));
    EXPECT_EQ(1u, swap.updated_relationships);
    EXPECT_FALSE(framework.Contains(data.patterns[2].GetId()));
    EXPECT_EQ(2u, framework.GetRelationshipsByPattern("partner-pam").size());
    EXPECT_TRUE(framework.ValidateFramework().valid);
}

TEST(EndToEndTest, CombineAndCascade) {
    Framework first;
    SecurityFramework first_data;
    first_data.LoadInto(first);

    Framework second;
    SecurityFramework second_data;
    second_data.LoadInto(second);

    Framework::Config config;
    config.removal_policy = RemovalPolicy::CASCADE;
    auto combined = Framework::Combine({&first, &second}, config);
    EXPECT_EQ(10u, combined->PatternCount());
    EXPECT_EQ(4u, combined->RelationshipCount());

    EXPECT_TRUE(combined->RemovePattern(first_data.patterns[0].GetId()));
    EXPECT_EQ(3u, combined->RelationshipCount());
    EXPECT_EQ(2u, combined->GetMetrics().orphaned_patterns);
}
