#include <string>

#include <gtest/gtest.h>

#include "farmledger/core/models.hpp"
#include "farmledger/core/types.hpp"

using namespace farmledger::core;

TEST(CoreTypes, PrincipalFromAcceptsPrintable) {
    Principal p{};
    ASSERT_TRUE(principal_from("ST1PQHQKV0RJXZFY1DGX8MNSNYVE3VGZJSRTPGZGM", &p));
    EXPECT_EQ(p.view(), "ST1PQHQKV0RJXZFY1DGX8MNSNYVE3VGZJSRTPGZGM");
    EXPECT_FALSE(p.empty());
}

TEST(CoreTypes, PrincipalFromRejectsBadInput) {
    Principal p{};
    EXPECT_FALSE(principal_from("", &p));
    EXPECT_FALSE(principal_from("has space", &p));
    EXPECT_FALSE(principal_from("tab\there", &p));
    EXPECT_FALSE(principal_from(std::string(kPrincipalMax + 1, 'a'), &p));
    EXPECT_TRUE(principal_from(std::string(kPrincipalMax, 'a'), &p));
    EXPECT_EQ(p.len, kPrincipalMax);
    EXPECT_FALSE(principal_from("x", nullptr));
}

TEST(CoreTypes, PrincipalEquality) {
    constexpr Principal a = principal("farmer1");
    constexpr Principal b = principal("farmer1");
    constexpr Principal c = principal("farmer2");
    static_assert(a == b);
    static_assert(!(a == c));
    EXPECT_TRUE(principal("bad name").empty());
}

TEST(CoreTypes, FarmerIdValidity) {
    EXPECT_TRUE(kFirstFarmerId.is_valid());
    EXPECT_EQ(kFirstFarmerId.v, 1u);
    EXPECT_FALSE(FarmerId::invalid().is_valid());
    EXPECT_LT(FarmerId{1}, FarmerId{2});
}

TEST(CoreModels, StatusNamesRoundTrip) {
    VerificationStatus v{};
    ASSERT_TRUE(verification_status_from_name("verified", &v));
    EXPECT_EQ(v, VerificationStatus::Verified);
    EXPECT_STREQ(verification_status_name(VerificationStatus::Rejected), "rejected");
    EXPECT_FALSE(verification_status_from_name("approved", &v));

    ModerationStatus m{};
    ASSERT_TRUE(moderation_status_from_name("approved", &m));
    EXPECT_EQ(m, ModerationStatus::Approved);
    EXPECT_STREQ(moderation_status_name(ModerationStatus::Pending), "pending");
    EXPECT_FALSE(moderation_status_from_name("verified", &m));
    EXPECT_FALSE(moderation_status_from_name(nullptr, &m));
}

TEST(CoreModels, PersistedStatusRange) {
    EXPECT_TRUE(verification_status_valid(0));
    EXPECT_TRUE(verification_status_valid(2));
    EXPECT_FALSE(verification_status_valid(3));
    EXPECT_TRUE(moderation_status_valid(2));
    EXPECT_FALSE(moderation_status_valid(7));
}

TEST(CoreModels, ProfileDefaults) {
    const FarmerProfile p{};
    EXPECT_FALSE(p.id.is_valid());
    EXPECT_EQ(p.verification_status, VerificationStatus::Pending);
    EXPECT_FALSE(p.verification_timestamp.has_value());
    EXPECT_TRUE(p.active);

    const PracticeEntry e{};
    EXPECT_EQ(e.moderation_status, ModerationStatus::Pending);
    EXPECT_FALSE(e.evidence_hash.has_value());
    EXPECT_FALSE(e.moderation_timestamp.has_value());
}
