// File: tests/framework/dimension_swapper_test.cpp
#include "framework/dimension_swapper.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>

namespace p3if {
namespace {

class DimensionSwapperTest : public ::testing::Test {
protected:
    void SetUp() override {
        property_id_ = patterns_.Add(Pattern::Create(PatternType::PROPERTY, "Throughput"));
        old_process_id_ = patterns_.Add(Pattern::Create(PatternType::PROCESS, "Manual deploy"));
        new_process_id_ = patterns_.Add(Pattern::Create(PatternType::PROCESS, "Automated deploy"));
        perspective_id_ = patterns_.Add(Pattern::Create(PatternType::PERSPECTIVE, "Developer"));
    }

    PatternStore patterns_;
    RelationshipStore relationships_;
    std::string property_id_;
    std::string old_process_id_;
    std::string new_process_id_;
    std::string perspective_id_;
};

TEST_F(DimensionSwapperTest, RewritesEveryMatchingSlot) {
    Relationship first = Relationship::Connect(property_id_, old_process_id_, std::nullopt, 0.9, 0.4);
    Relationship second = Relationship::Connect(std::nullopt, old_process_id_, perspective_id_);
    Relationship untouched = Relationship::Connect(property_id_, std::nullopt, perspective_id_);
    relationships_.Add(first, patterns_);
    relationships_.Add(second, patterns_);
    relationships_.Add(untouched, patterns_);

    DimensionSwapper swapper(patterns_, relationships_);
    EXPECT_EQ(2u, swapper.HotSwap(old_process_id_, new_process_id_));

    auto swapped = relationships_.Get(first.GetId());
    ASSERT_TRUE(swapped.has_value());
    EXPECT_EQ(new_process_id_, swapped->GetProcessId().value());
    EXPECT_EQ(property_id_, swapped->GetPropertyId().value());
    EXPECT_DOUBLE_EQ(0.9, swapped->GetStrength());
    EXPECT_DOUBLE_EQ(0.4, swapped->GetConfidence());

    EXPECT_EQ(0u, relationships_.ReferenceCount(old_process_id_));
    EXPECT_EQ(2u, relationships_.ReferenceCount(new_process_id_));
    EXPECT_EQ(untouched, *relationships_.Get(untouched.GetId()));
    EXPECT_TRUE(relationships_.CheckConsistency().empty());
}

TEST_F(DimensionSwapperTest, OldPatternStaysRegistered) {
    relationships_.Add(Relationship::Connect(property_id_, old_process_id_, std::nullopt), patterns_);

    DimensionSwapper swapper(patterns_, relationships_);
    swapper.HotSwap(old_process_id_, new_process_id_);
    EXPECT_TRUE(patterns_.Contains(old_process_id_));
}

TEST_F(DimensionSwapperTest, NoReferencesMeansNoUpdates) {
    DimensionSwapper swapper(patterns_, relationships_);
    EXPECT_EQ(0u, swapper.HotSwap(old_process_id_, new_process_id_));
    EXPECT_EQ(0u, swapper.HotSwap(old_process_id_, old_process_id_));
}

TEST_F(DimensionSwapperTest, TypeMismatchIsRejected) {
    relationships_.Add(Relationship::Connect(property_id_, old_process_id_, std::nullopt), patterns_);

    DimensionSwapper swapper(patterns_, relationships_);
    try {
        swapper.HotSwap(old_process_id_, perspective_id_);
        FAIL() << "expected FrameworkError";
    } catch (const FrameworkError& e) {
        EXPECT_EQ(ErrorCode::TYPE_MISMATCH, e.code());
    }
    EXPECT_EQ(1u, relationships_.ReferenceCount(old_process_id_));
}

TEST_F(DimensionSwapperTest, UnregisteredReplacementIsRejected) {
    DimensionSwapper swapper(patterns_, relationships_);
    Pattern stranger = Pattern::Create(PatternType::PROCESS, "Not stored");

    try {
        swapper.HotSwap(*patterns_.Find(old_process_id_), stranger);
        FAIL() << "expected FrameworkError";
    } catch (const FrameworkError& e) {
        EXPECT_EQ(ErrorCode::NOT_FOUND, e.code());
    }
    EXPECT_THROW(swapper.HotSwap("missing", new_process_id_), FrameworkError);
}

} // namespace
} // namespace p3if
