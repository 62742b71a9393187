#include <gtest/gtest.h>

#include <algorithm>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "farmledger/claims/claim_log.hpp"
#include "farmledger/claims/verification.hpp"
#include "farmledger/db/db.hpp"
#include "farmledger/ledger/ledger.hpp"
#include "farmledger/registry/registry.hpp"

using namespace farmledger::core;
using namespace farmledger::claims;

namespace {

constexpr Principal kDeployer = principal("deployer");
constexpr Principal kFarmer1 = principal("farmer1");
constexpr Principal kFarmer2 = principal("farmer2");
constexpr Principal kStranger = principal("unauthorized");

// Verification answered from a fixed allow-list.
class FakeVerificationSource final : public VerificationSource {
public:
    void allow(const Principal& p) { allowed_.push_back(p); }

    farmledger::core::Status is_verified(const Principal& identity, bool* out) const noexcept override {
        *out = std::find(allowed_.begin(), allowed_.end(), identity) != allowed_.end();
        return ok_status();
    }

private:
    std::vector<Principal> allowed_;
};

// Always fails; the failure must surface unchanged.
class BrokenVerificationSource final : public VerificationSource {
public:
    farmledger::core::Status is_verified(const Principal&, bool*) const noexcept override {
        return make_status(StatusDomain::Registry, StatusCode::Unavailable);
    }
};

LogParams cover_crops() {
    LogParams p{};
    p.practice_type = "Cover Crops";
    p.category = "Soil Health";
    p.details = "Planted clover";
    p.evidence_hash = "hash123";
    return p;
}

} // namespace

class ClaimLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        farmledger::db::DbConfig cfg{};
        ASSERT_TRUE(is_ok(farmledger::db::db_open(cfg, &db_)));
        verification_.allow(kFarmer1);
        verification_.allow(kFarmer2);
    }

    void TearDown() override {
        (void)farmledger::db::db_close(db_);
    }

    LogSeq log_entry(const Principal& who, const LogParams& params = cover_crops()) {
        LogSeq seq = 0;
        EXPECT_TRUE(is_ok(claims_log(db_, verification_, who, params, &seq)));
        return seq;
    }

    std::optional<PracticeEntry> entry_of(const Principal& who, LogSeq seq) {
        std::optional<PracticeEntry> e;
        EXPECT_TRUE(is_ok(claims_get_entry(db_, who, seq, &e)));
        return e;
    }

    u64 count_of(const Principal& who) {
        u64 n = 0;
        EXPECT_TRUE(is_ok(claims_get_log_count(db_, who, &n)));
        return n;
    }

    farmledger::db::DbHandle db_{};
    FakeVerificationSource verification_;
};

// ============================================================================
// Logging
// ============================================================================

TEST_F(ClaimLogTest, LogAppendsPendingEntry) {
    EXPECT_EQ(log_entry(kFarmer1), 0u);

    const auto e = entry_of(kFarmer1, 0);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->practice_type, "Cover Crops");
    EXPECT_EQ(e->category, "Soil Health");
    EXPECT_EQ(e->details, "Planted clover");
    EXPECT_EQ(e->evidence_hash, std::optional<std::string>{"hash123"});
    EXPECT_EQ(e->timestamp, 0u);
    EXPECT_EQ(e->moderation_status, ModerationStatus::Pending);
    EXPECT_FALSE(e->moderation_notes.has_value());
    EXPECT_FALSE(e->moderation_timestamp.has_value());
    EXPECT_EQ(count_of(kFarmer1), 1u);
}

TEST_F(ClaimLogTest, SequenceNumbersAreDensePerFarmer) {
    EXPECT_EQ(log_entry(kFarmer1), 0u);
    EXPECT_EQ(log_entry(kFarmer1), 1u);
    EXPECT_EQ(log_entry(kFarmer2), 0u);
    EXPECT_EQ(log_entry(kFarmer1), 2u);

    EXPECT_EQ(count_of(kFarmer1), 3u);
    EXPECT_EQ(count_of(kFarmer2), 1u);
    EXPECT_EQ(count_of(kStranger), 0u);

    // Each log advanced the clock once.
    EXPECT_EQ(entry_of(kFarmer1, 2)->timestamp, 3u);
}

TEST_F(ClaimLogTest, EvidenceIsOptional) {
    LogParams p = cover_crops();
    p.evidence_hash = nullptr;
    const LogSeq seq = log_entry(kFarmer1, p);
    EXPECT_FALSE(entry_of(kFarmer1, seq)->evidence_hash.has_value());
}

TEST_F(ClaimLogTest, UnverifiedCallerCannotLog) {
    LogSeq seq = 99;
    const Status s = claims_log(db_, verification_, kStranger, cover_crops(), &seq);
    EXPECT_TRUE(is_error(s, ClaimLogError::NotVerified));
    EXPECT_EQ(error_code(s), 202u);
    EXPECT_EQ(seq, 99u);
    EXPECT_EQ(count_of(kStranger), 0u);
}

TEST_F(ClaimLogTest, NotVerifiedIsCheckedBeforeInput) {
    LogParams bad = cover_crops();
    bad.details = "";
    LogSeq seq = 0;
    EXPECT_TRUE(is_error(claims_log(db_, verification_, kStranger, bad, &seq), ClaimLogError::NotVerified));
}

TEST_F(ClaimLogTest, InvalidInputCreatesNoEntry) {
    const std::string long_hash(kMaxEvidenceHashLen + 1, 'a');
    const std::string long_type(kMaxPracticeTypeLen + 1, 't');

    std::vector<LogParams> bad(5, cover_crops());
    bad[0].practice_type = "";
    bad[1].category = "";
    bad[2].details = nullptr;
    bad[3].evidence_hash = long_hash.c_str();
    bad[4].practice_type = long_type.c_str();

    for (const LogParams& params : bad) {
        LogSeq seq = 0;
        EXPECT_TRUE(is_error(claims_log(db_, verification_, kFarmer1, params, &seq), ClaimLogError::InvalidInput));
    }
    EXPECT_EQ(count_of(kFarmer1), 0u);
    EXPECT_FALSE(entry_of(kFarmer1, 0).has_value());
}

TEST_F(ClaimLogTest, EmptyCallerIsInvalid) {
    verification_.allow(Principal{});
    LogSeq seq = 0;
    EXPECT_TRUE(is_error(claims_log(db_, verification_, Principal{}, cover_crops(), &seq),
                         ClaimLogError::InvalidInput));
}

TEST_F(ClaimLogTest, VerificationFailureSurfaces) {
    BrokenVerificationSource broken;
    LogSeq seq = 0;
    const Status s = claims_log(db_, broken, kFarmer1, cover_crops(), &seq);
    EXPECT_EQ(s.domain, StatusDomain::Registry);
    EXPECT_EQ(s.code, StatusCode::Unavailable);
    EXPECT_EQ(count_of(kFarmer1), 0u);
}

TEST_F(ClaimLogTest, ConcurrentLogsStayDense) {
    constexpr int kThreads = 4;
    constexpr int kPerThread = 25;

    std::vector<std::vector<LogSeq>> seen(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t, &seen] {
            for (int i = 0; i < kPerThread; ++i) {
                LogSeq seq = 0;
                if (is_ok(claims_log(db_, verification_, kFarmer1, cover_crops(), &seq))) {
                    seen[t].push_back(seq);
                }
            }
        });
    }
    for (std::thread& th : threads) {
        th.join();
    }

    std::set<LogSeq> all;
    for (const auto& v : seen) {
        all.insert(v.begin(), v.end());
    }
    ASSERT_EQ(all.size(), static_cast<std::size_t>(kThreads * kPerThread));
    EXPECT_EQ(*all.begin(), 0u);
    EXPECT_EQ(*all.rbegin(), static_cast<LogSeq>(kThreads * kPerThread - 1));
    EXPECT_EQ(count_of(kFarmer1), static_cast<u64>(kThreads * kPerThread));
}

// ============================================================================
// Moderation
// ============================================================================

TEST_F(ClaimLogTest, ModeratorApproves) {
    log_entry(kFarmer1);
    ASSERT_TRUE(is_ok(claims_moderate(db_, kDeployer, kFarmer1, 0, ModerationStatus::Approved, "Looks good")));

    const auto e = entry_of(kFarmer1, 0);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->moderation_status, ModerationStatus::Approved);
    EXPECT_EQ(e->moderation_notes, std::optional<std::string>{"Looks good"});
    EXPECT_EQ(e->moderation_timestamp, std::optional<Timestamp>{1});
}

TEST_F(ClaimLogTest, NotesAreOptional) {
    log_entry(kFarmer1);
    ASSERT_TRUE(is_ok(claims_moderate(db_, kDeployer, kFarmer1, 0, ModerationStatus::Rejected, nullptr)));
    const auto e = entry_of(kFarmer1, 0);
    EXPECT_EQ(e->moderation_status, ModerationStatus::Rejected);
    EXPECT_FALSE(e->moderation_notes.has_value());
}

TEST_F(ClaimLogTest, ModerateCheckOrder) {
    EXPECT_TRUE(is_error(claims_moderate(db_, kStranger, kFarmer1, 0, ModerationStatus::Pending, nullptr),
                         ClaimLogError::NotAuthorized));
    EXPECT_TRUE(is_error(claims_moderate(db_, kDeployer, kFarmer1, 0, ModerationStatus::Pending, nullptr),
                         ClaimLogError::LogNotFound));

    log_entry(kFarmer1);
    EXPECT_TRUE(is_error(claims_moderate(db_, kDeployer, kFarmer1, 0, ModerationStatus::Pending, nullptr),
                         ClaimLogError::InvalidInput));
    EXPECT_TRUE(is_error(claims_moderate(db_, kDeployer, kFarmer1, 0, static_cast<ModerationStatus>(7), nullptr),
                         ClaimLogError::InvalidInput));
    const std::string long_notes(kMaxModerationNotesLen + 1, 'n');
    EXPECT_TRUE(is_error(claims_moderate(db_, kDeployer, kFarmer1, 0, ModerationStatus::Approved,
                                         long_notes.c_str()),
                         ClaimLogError::InvalidInput));

    ASSERT_TRUE(is_ok(claims_moderate(db_, kDeployer, kFarmer1, 0, ModerationStatus::Approved, nullptr)));
    const Status again = claims_moderate(db_, kDeployer, kFarmer1, 0, ModerationStatus::Rejected, "changed");
    EXPECT_TRUE(is_error(again, ClaimLogError::AlreadyModerated));
    EXPECT_EQ(error_code(again), 205u);
    EXPECT_EQ(entry_of(kFarmer1, 0)->moderation_status, ModerationStatus::Approved);
}

TEST_F(ClaimLogTest, ModerateUnknownSequence) {
    log_entry(kFarmer1);
    EXPECT_TRUE(is_error(claims_moderate(db_, kDeployer, kFarmer1, 1, ModerationStatus::Approved, nullptr),
                         ClaimLogError::LogNotFound));
    EXPECT_TRUE(is_error(claims_moderate(db_, kDeployer, kFarmer2, 0, ModerationStatus::Approved, nullptr),
                         ClaimLogError::LogNotFound));
}

// ============================================================================
// Amendment
// ============================================================================

TEST_F(ClaimLogTest, UpdateRewritesPendingEntry) {
    log_entry(kFarmer1);
    ASSERT_TRUE(is_ok(claims_update(db_, kFarmer1, 0, "Planted clover and rye", "hash456")));

    const auto e = entry_of(kFarmer1, 0);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->details, "Planted clover and rye");
    EXPECT_EQ(e->evidence_hash, std::optional<std::string>{"hash456"});
    EXPECT_EQ(e->practice_type, "Cover Crops");
    EXPECT_EQ(e->timestamp, 0u);
}

TEST_F(ClaimLogTest, UpdateWithoutEvidenceClearsIt) {
    log_entry(kFarmer1);
    ASSERT_TRUE(is_ok(claims_update(db_, kFarmer1, 0, "No photo this time", nullptr)));
    EXPECT_FALSE(entry_of(kFarmer1, 0)->evidence_hash.has_value());
}

TEST_F(ClaimLogTest, UpdateCheckOrder) {
    EXPECT_TRUE(is_error(claims_update(db_, kFarmer1, 0, "x", nullptr), ClaimLogError::LogNotFound));

    log_entry(kFarmer1);
    // Only the caller's own log is reachable.
    EXPECT_TRUE(is_error(claims_update(db_, kFarmer2, 0, "x", nullptr), ClaimLogError::LogNotFound));

    const std::string long_details(kMaxDetailsLen + 1, 'd');
    EXPECT_TRUE(is_error(claims_update(db_, kFarmer1, 0, long_details.c_str(), nullptr),
                         ClaimLogError::InvalidInput));

    ASSERT_TRUE(is_ok(claims_moderate(db_, kDeployer, kFarmer1, 0, ModerationStatus::Rejected, nullptr)));
    // AlreadyModerated wins over InvalidInput.
    EXPECT_TRUE(is_error(claims_update(db_, kFarmer1, 0, long_details.c_str(), nullptr),
                         ClaimLogError::AlreadyModerated));
    EXPECT_EQ(entry_of(kFarmer1, 0)->details, "Planted clover");
}

// ============================================================================
// Owner administration
// ============================================================================

TEST_F(ClaimLogTest, SetModerator) {
    log_entry(kFarmer1);
    const Principal auditor = principal("auditor");

    EXPECT_TRUE(is_error(claims_set_moderator(db_, kStranger, auditor), ClaimLogError::NotAuthorized));
    EXPECT_TRUE(is_error(claims_set_moderator(db_, kDeployer, Principal{}), ClaimLogError::InvalidInput));
    ASSERT_TRUE(is_ok(claims_set_moderator(db_, kDeployer, auditor)));

    Principal moderator{};
    ASSERT_TRUE(is_ok(claims_get_moderator(db_, &moderator)));
    EXPECT_EQ(moderator, auditor);

    EXPECT_TRUE(is_error(claims_moderate(db_, kDeployer, kFarmer1, 0, ModerationStatus::Approved, nullptr),
                         ClaimLogError::NotAuthorized));
    EXPECT_TRUE(is_ok(claims_moderate(db_, auditor, kFarmer1, 0, ModerationStatus::Approved, nullptr)));
}

TEST_F(ClaimLogTest, TransferOwnership) {
    const Principal new_owner = principal("new-owner");
    EXPECT_TRUE(is_error(claims_transfer_ownership(db_, kStranger, new_owner), ClaimLogError::NotAuthorized));
    ASSERT_TRUE(is_ok(claims_transfer_ownership(db_, kDeployer, new_owner)));

    Principal owner{};
    ASSERT_TRUE(is_ok(claims_get_owner(db_, &owner)));
    EXPECT_EQ(owner, new_owner);
    EXPECT_TRUE(is_error(claims_set_moderator(db_, kDeployer, kStranger), ClaimLogError::NotAuthorized));
}

TEST_F(ClaimLogTest, ReadsRejectNullOut) {
    EXPECT_EQ(claims_get_entry(db_, kFarmer1, 0, nullptr).code, StatusCode::Invalid);
    EXPECT_EQ(claims_get_log_count(db_, kFarmer1, nullptr).code, StatusCode::Invalid);
    LogSeq seq = 0;
    EXPECT_EQ(claims_log(db_, verification_, kFarmer1, cover_crops(), nullptr).code, StatusCode::Invalid);
    EXPECT_EQ(claims_log(farmledger::db::DbHandle{}, verification_, kFarmer1, cover_crops(), &seq).code,
              StatusCode::Invalid);
}

// ============================================================================
// Registry-backed verification
// ============================================================================

TEST_F(ClaimLogTest, RegistryDecidesWhoMayLog) {
    RegistryVerificationSource registry_source(db_);

    ASSERT_TRUE(is_ok(farmledger::ledger::ledger_credit(db_, kFarmer1, farmledger::db::kDefaultRegistrationFee)));
    farmledger::registry::RegistrationParams reg{};
    reg.name = "John Doe";
    reg.location = "Rural Area";
    reg.farm_size = 100;
    FarmerId id{};
    ASSERT_TRUE(is_ok(farmledger::registry::registry_register(db_, kFarmer1, reg, &id)));

    LogSeq seq = 0;
    EXPECT_TRUE(is_error(claims_log(db_, registry_source, kFarmer1, cover_crops(), &seq),
                         ClaimLogError::NotVerified));

    ASSERT_TRUE(is_ok(farmledger::registry::registry_verify(db_, kDeployer, kFarmer1,
                                                            VerificationStatus::Verified)));
    ASSERT_TRUE(is_ok(claims_log(db_, registry_source, kFarmer1, cover_crops(), &seq)));
    EXPECT_EQ(seq, 0u);

    // Deactivation does not revoke logging rights.
    ASSERT_TRUE(is_ok(farmledger::registry::registry_deactivate(db_, kDeployer, kFarmer1)));
    ASSERT_TRUE(is_ok(claims_log(db_, registry_source, kFarmer1, cover_crops(), &seq)));
    EXPECT_EQ(seq, 1u);
}
