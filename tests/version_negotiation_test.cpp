#include <gtest/gtest.h>

#include "concord/version.hpp"

using namespace Concord;

TEST(VersionNegotiationTest, SuccessfulNegotiation) {
    const std::vector<Version> initiator_versions = {Versions::V1_0};
    const std::vector<Version> responder_versions = {Versions::V1_0};

    auto result = VersionNegotiator::negotiate(initiator_versions, responder_versions);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, Versions::V1_0);
}

TEST(VersionNegotiationTest, InitiatorPreferenceWins) {
    constexpr Version V1_1 = 0x0101;
    const std::vector<Version> initiator_versions = {V1_1, Versions::V1_0};
    const std::vector<Version> responder_versions = {Versions::V1_0, V1_1};

    auto result = VersionNegotiator::negotiate(initiator_versions, responder_versions);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, V1_1);
}

TEST(VersionNegotiationTest, NoCommonVersion) {
    constexpr Version V_UNKNOWN = 0xFFFF;
    const std::vector<Version> initiator_versions = {V_UNKNOWN};
    const std::vector<Version> responder_versions = {Versions::V1_0};

    auto result = VersionNegotiator::negotiate(initiator_versions, responder_versions);

    EXPECT_FALSE(result.has_value());
}

TEST(VersionNegotiationTest, EmptyInitiatorList) {
    const std::vector<Version> initiator_versions = {};
    const std::vector<Version> responder_versions = {Versions::V1_0};

    auto result = VersionNegotiator::negotiate(initiator_versions, responder_versions);

    EXPECT_FALSE(result.has_value());
}

TEST(VersionNegotiationTest, EmptyResponderList) {
    const std::vector<Version> initiator_versions = {Versions::V1_0};
    const std::vector<Version> responder_versions = {};

    auto result = VersionNegotiator::negotiate(initiator_versions, responder_versions);

    EXPECT_FALSE(result.has_value());
}

TEST(VersionNegotiationTest, VersionTag) {
    EXPECT_EQ(version_tag(Versions::V1_0), "CONCORD-1.0");
    EXPECT_EQ(version_tag(0x020A), "CONCORD-2.10");
}
