// File: tests/io/json_codec_test.cpp
#include "io/json_codec.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <functional>
#include <filesystem>

namespace p3if {
namespace {

// ============================================================================
// Helper Functions
// ============================================================================

ErrorCode CodeOf(const std::function<void()>& action) {
    try {
        action();
    } catch (const FrameworkError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected FrameworkError";
    return ErrorCode::INVALID_ARGUMENT;
}

// ============================================================================
// Records
// ============================================================================

TEST(JsonCodecTest, PatternRoundTrip) {
    Pattern pattern = Pattern::Create(PatternType::PERSPECTIVE, "Regulator", "compliance",
                                      std::string("External oversight"));
    pattern.SetTags({"gdpr", "audit"});
    pattern.SetMetadata("region", "eu");
    pattern.SetQualityScore(0.1 + 0.2);
    PerspectiveAttributes attributes;
    attributes.viewpoint = "legal";
    attributes.concerns = {"privacy", "retention"};
    pattern.SetAttributes(attributes);

    std::string text = json_codec::Write(json_codec::EncodePattern(pattern));
    Pattern decoded = json_codec::DecodePattern(json_codec::Parse(text));

    EXPECT_EQ(pattern, decoded);
    EXPECT_LT(std::fabs(pattern.GetQualityScore() - decoded.GetQualityScore()), 1e-9);
    EXPECT_EQ(pattern.GetCreatedAt(), decoded.GetCreatedAt());
}

TEST(JsonCodecTest, RelationshipRoundTrip) {
    Relationship relationship = Relationship::Connect(std::string("a"), std::string("b"), std::nullopt, 0.8, 0.9);
    relationship.SetRelationshipType("causal");
    relationship.SetMetadata("note", "observed");

    Json::Value encoded = json_codec::EncodeRelationship(relationship);
    EXPECT_TRUE(encoded["perspective_id"].isNull());

    Relationship decoded = json_codec::DecodeRelationship(json_codec::Parse(json_codec::Write(encoded, false)));
    EXPECT_EQ(relationship, decoded);
}

TEST(JsonCodecTest, DecodeAppliesDefaults) {
    Json::Value record = json_codec::Parse(R"({"name": "Latency", "type": "property"})");
    Pattern pattern = json_codec::DecodePattern(record);

    EXPECT_FALSE(pattern.GetId().empty());
    EXPECT_DOUBLE_EQ(1.0, pattern.GetQualityScore());
    EXPECT_EQ(ValidationStatus::DRAFT, pattern.GetValidationStatus());
    EXPECT_EQ("1.0.0", pattern.GetVersion());
    EXPECT_TRUE(pattern.GetTags().empty());

    Relationship relationship = json_codec::DecodeRelationship(json_codec::Parse("{}"));
    EXPECT_DOUBLE_EQ(0.5, relationship.GetStrength());
    EXPECT_DOUBLE_EQ(1.0, relationship.GetConfidence());
    EXPECT_TRUE(relationship.IsBidirectional());
    EXPECT_EQ("general", relationship.GetRelationshipType());
}

// ============================================================================
// Malformed Input
// ============================================================================

TEST(JsonCodecTest, MalformedTextIsParseError) {
    EXPECT_EQ(ErrorCode::PARSE_ERROR, CodeOf([] { json_codec::Parse("{\"patterns\": ["); }));
}

TEST(JsonCodecTest, StructuralProblemsAreParseErrors) {
    EXPECT_EQ(ErrorCode::PARSE_ERROR,
              CodeOf([] { json_codec::DecodePattern(json_codec::Parse(R"({"name": "x"})")); }));
    EXPECT_EQ(ErrorCode::PARSE_ERROR,
              CodeOf([] { json_codec::DecodePattern(json_codec::Parse(R"({"type": "process"})")); }));
    EXPECT_EQ(ErrorCode::PARSE_ERROR,
              CodeOf([] { json_codec::DecodePattern(json_codec::Parse(R"({"name": "x", "type": "widget"})")); }));
    EXPECT_EQ(ErrorCode::PARSE_ERROR,
              CodeOf([] { json_codec::DecodePattern(json_codec::Parse(R"({"name": "x", "type": "process", "tags": "a"})")); }));
    EXPECT_EQ(ErrorCode::PARSE_ERROR,
              CodeOf([] { json_codec::DecodeRelationship(json_codec::Parse(R"({"strength": "high"})")); }));
    EXPECT_EQ(ErrorCode::PARSE_ERROR,
              CodeOf([] { json_codec::DecodeDocument(json_codec::Parse("[1, 2]")); }));
    EXPECT_EQ(ErrorCode::PARSE_ERROR,
              CodeOf([] { json_codec::DecodeDocument(json_codec::Parse(R"({"patterns": {}})")); }));
}

TEST(JsonCodecTest, ValueViolationsKeepTheirCode) {
    EXPECT_EQ(ErrorCode::OUT_OF_RANGE,
              CodeOf([] { json_codec::DecodeRelationship(json_codec::Parse(R"({"strength": 1.5})")); }));
    EXPECT_EQ(ErrorCode::OUT_OF_RANGE,
              CodeOf([] {
                  json_codec::DecodePattern(json_codec::Parse(
                      R"({"name": "x", "type": "property", "quality_score": -1})"));
              }));
}

// ============================================================================
// Documents
// ============================================================================

TEST(JsonCodecTest, DocumentCarriesMetadata) {
    Pattern property = Pattern::Create(PatternType::PROPERTY, "Durability");
    Pattern process = Pattern::Create(PatternType::PROCESS, "Replication");
    Relationship relationship = Relationship::Connect(property.GetId(), process.GetId(), std::nullopt);

    Json::Value root = json_codec::EncodeDocument({property, process}, {relationship});
    EXPECT_EQ(2u, root["framework_metadata"]["pattern_count"].asUInt64());
    EXPECT_EQ(1u, root["framework_metadata"]["relationship_count"].asUInt64());
    EXPECT_EQ(json_codec::kSchemaVersion, root["framework_metadata"]["schema_version"].asString());

    json_codec::Document document = json_codec::DecodeDocument(json_codec::Parse(json_codec::Write(root)));
    ASSERT_EQ(2u, document.patterns.size());
    ASSERT_EQ(1u, document.relationships.size());
    EXPECT_EQ(property, document.patterns[0]);
    EXPECT_EQ(relationship, document.relationships[0]);
    EXPECT_EQ(json_codec::kSchemaVersion, document.schema_version);
}

TEST(JsonCodecTest, EmptyDocumentDecodes) {
    json_codec::Document document = json_codec::DecodeDocument(json_codec::Parse("{}"));
    EXPECT_TRUE(document.patterns.empty());
    EXPECT_TRUE(document.relationships.empty());
    EXPECT_TRUE(document.schema_version.empty());
}

TEST(JsonCodecTest, ExternalFrameworkByDimension) {
    Json::Value root = json_codec::Parse(R"({
        "properties": [{"id": "ext-p", "name": "Cost"}],
        "processes": [{"id": "ext-q", "name": "Budgeting", "quality_score": 0.4}],
        "relationships": [{"property_id": "ext-p", "process_id": "ext-q", "strength": 0.6}]
    })");

    ExternalFramework external = json_codec::DecodeExternalFramework(root);
    EXPECT_EQ(2u, external.PatternCount());
    ASSERT_EQ(1u, external.patterns["processes"].size());
    EXPECT_DOUBLE_EQ(0.4, external.patterns["processes"][0].quality_score.value());
    EXPECT_FALSE(external.patterns["properties"][0].quality_score.has_value());
    ASSERT_EQ(1u, external.relationships.size());
    EXPECT_EQ("ext-p", external.relationships[0].property_id.value());
    EXPECT_DOUBLE_EQ(0.6, external.relationships[0].strength);
}

TEST(JsonCodecTest, ExternalFrameworkFromExportLayout) {
    Pattern perspective = Pattern::Create(PatternType::PERSPECTIVE, "Customer");
    Json::Value root = json_codec::EncodeDocument({perspective}, {});

    ExternalFramework external = json_codec::DecodeExternalFramework(root);
    ASSERT_EQ(1u, external.patterns["perspective"].size());
    EXPECT_EQ(perspective.GetId(), external.patterns["perspective"][0].id.value());
}

// ============================================================================
// Files
// ============================================================================

TEST(JsonCodecTest, FileRoundTripAndMissingFile) {
    std::string path = (std::filesystem::temp_directory_path() / "p3if_json_codec_test.json").string();
    Json::Value value(Json::objectValue);
    value["answer"] = 42;
    json_codec::WriteFile(path, value);
    EXPECT_EQ(42, json_codec::ParseFile(path)["answer"].asInt());
    std::filesystem::remove(path);

    EXPECT_EQ(ErrorCode::STORAGE_ERROR, CodeOf([] { json_codec::ParseFile("/nonexistent/p3if.json"); }));
}

} // namespace
} // namespace p3if
