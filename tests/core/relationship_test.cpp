// File: tests/core/relationship_test.cpp
#include "core/relationship.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

namespace p3if {
namespace {

TEST(RelationshipTest, DefaultsAndConnect) {
    Relationship relationship = Relationship::Connect(std::string("prop"), std::string("proc"),
                                                      std::nullopt, 0.8, 0.9);

    EXPECT_FALSE(relationship.GetId().empty());
    EXPECT_EQ("prop", relationship.GetPropertyId().value());
    EXPECT_EQ("proc", relationship.GetProcessId().value());
    EXPECT_FALSE(relationship.GetPerspectiveId().has_value());
    EXPECT_DOUBLE_EQ(0.8, relationship.GetStrength());
    EXPECT_DOUBLE_EQ(0.9, relationship.GetConfidence());
    EXPECT_TRUE(relationship.IsBidirectional());
    EXPECT_EQ("general", relationship.GetRelationshipType());

    Relationship plain;
    EXPECT_DOUBLE_EQ(0.5, plain.GetStrength());
    EXPECT_DOUBLE_EQ(1.0, plain.GetConfidence());
    EXPECT_EQ(0u, plain.ConnectionCount());
}

TEST(RelationshipTest, ScoresOutsideUnitRangeAreRejected) {
    try {
        Relationship relationship(1.2, 0.5);
        FAIL() << "expected FrameworkError";
    } catch (const FrameworkError& e) {
        EXPECT_EQ(ErrorCode::OUT_OF_RANGE, e.code());
    }
    EXPECT_THROW(Relationship(0.5, -0.01), FrameworkError);
    EXPECT_THROW(Relationship(std::numeric_limits<double>::quiet_NaN(), 0.5), FrameworkError);

    Relationship relationship(0.0, 1.0);
    EXPECT_THROW(relationship.SetStrength(2.0), FrameworkError);
    EXPECT_DOUBLE_EQ(0.0, relationship.GetStrength());
}

TEST(RelationshipTest, SlotAccessByType) {
    Relationship relationship;
    relationship.SetSlot(PatternType::PERSPECTIVE, std::string("view"));
    EXPECT_EQ("view", relationship.GetSlot(PatternType::PERSPECTIVE).value());
    EXPECT_EQ(relationship.GetPerspectiveId(), relationship.GetSlot(PatternType::PERSPECTIVE));

    // An empty id clears the slot
    relationship.SetSlot(PatternType::PERSPECTIVE, std::string(""));
    EXPECT_FALSE(relationship.GetPerspectiveId().has_value());
}

TEST(RelationshipTest, ConnectedPatternsInSlotOrder) {
    Relationship relationship = Relationship::Connect(std::string("a"), std::nullopt, std::string("c"));

    auto connected = relationship.GetConnectedPatterns();
    ASSERT_EQ(2u, connected.size());
    EXPECT_EQ("a", connected[0]);
    EXPECT_EQ("c", connected[1]);
    EXPECT_EQ(2u, relationship.ConnectionCount());
    EXPECT_TRUE(relationship.References("c"));
    EXPECT_FALSE(relationship.References("b"));
}

TEST(RelationshipTest, RelationshipTypeIsValidated) {
    Relationship relationship;
    relationship.SetRelationshipType("Causal");
    EXPECT_EQ("causal", relationship.GetRelationshipType());

    try {
        relationship.SetRelationshipType("friendship");
        FAIL() << "expected FrameworkError";
    } catch (const FrameworkError& e) {
        EXPECT_EQ(ErrorCode::INVALID_ARGUMENT, e.code());
    }
    EXPECT_EQ("causal", relationship.GetRelationshipType());
}

TEST(RelationshipTest, MetadataMustBeAnObject) {
    Relationship relationship;
    relationship.SetMetadata("source", "catalog");
    EXPECT_EQ("catalog", relationship.GetMetadata()["source"].asString());
    EXPECT_THROW(relationship.SetMetadata(Json::Value("text")), FrameworkError);
}

TEST(RelationshipTest, EqualityCoversAllFields) {
    Relationship relationship = Relationship::Connect(std::string("a"), std::string("b"), std::nullopt);
    Relationship copy = relationship;
    EXPECT_EQ(relationship, copy);

    copy.SetBidirectional(false);
    EXPECT_NE(relationship, copy);
}

} // namespace
} // namespace p3if
