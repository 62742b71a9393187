#include "farmledger/claims/claim_log.hpp"
#include "db/db_internal.hpp"
#include "ledger/ledger_internal.hpp"

#include <sqlite3.h>

#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace farmledger::claims {

using namespace farmledger::core;
using farmledger::access::ClaimLogRoles;
using farmledger::db::detail::Session;
using farmledger::db::detail::Stmt;
using farmledger::db::detail::WriteTxn;
using farmledger::db::detail::db_error;
using farmledger::db::detail::kMaxStoredU64;

namespace {

    [[nodiscard]] constexpr Status claims_invalid() noexcept {
        return make_status(StatusDomain::ClaimLog, StatusCode::Invalid);
    }

    [[nodiscard]] std::size_t text_len(const char* s) noexcept {
        return s ? std::strlen(s) : 0;
    }

    [[nodiscard]] bool required_text_ok(const char* s, std::size_t max) noexcept {
        const std::size_t n = text_len(s);
        return n > 0 && n <= max;
    }

    [[nodiscard]] Status load_roles(sqlite3* conn, ClaimLogRoles* out) noexcept {
        Stmt stmt(conn, "SELECT owner, moderator FROM claim_log_config WHERE id = 1");
        if (!stmt.ok() || stmt.step() != SQLITE_ROW) {
            return db_error();
        }

        ClaimLogRoles roles{};
        if (!stmt.column_principal(0, &roles.owner) || !stmt.column_principal(1, &roles.moderator)) {
            return db_error(StatusCode::Corrupt);
        }
        *out = roles;
        return ok_status();
    }

    [[nodiscard]] Status load_log_count(sqlite3* conn, const Principal& farmer, u64* out) noexcept {
        Stmt stmt(conn, "SELECT count FROM log_counts WHERE farmer = ?");
        if (!stmt.ok()) {
            return db_error();
        }
        stmt.bind_principal(1, farmer);

        const int rc = stmt.step();
        if (rc == SQLITE_ROW) {
            *out = stmt.column_u64(0);
            return ok_status();
        }
        if (rc == SQLITE_DONE) {
            *out = 0;
            return ok_status();
        }
        return db_error();
    }

    [[nodiscard]] Status load_entry(sqlite3* conn, const Principal& farmer, LogSeq seq,
                                    std::optional<PracticeEntry>* out) noexcept {
        if (seq > kMaxStoredU64) {
            out->reset();
            return ok_status();
        }

        Stmt stmt(conn,
            "SELECT practice_type, category, ts, details, evidence_hash, moderation_status, "
            "moderation_notes, moderation_ts FROM practices WHERE farmer = ? AND seq = ?");
        if (!stmt.ok()) {
            return db_error();
        }
        stmt.bind_principal(1, farmer);
        stmt.bind_u64(2, seq);

        const int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            out->reset();
            return ok_status();
        }
        if (rc != SQLITE_ROW) {
            return db_error();
        }

        const u64 raw_status = stmt.column_u64(5);
        if (raw_status > 0xff || !moderation_status_valid(static_cast<u32>(raw_status))) {
            return db_error(StatusCode::Corrupt);
        }

        PracticeEntry e{};
        e.practice_type = stmt.column_string(0);
        e.category = stmt.column_string(1);
        e.timestamp = stmt.column_u64(2);
        e.details = stmt.column_string(3);
        e.evidence_hash = stmt.column_optional_string(4);
        e.moderation_status = static_cast<ModerationStatus>(raw_status);
        e.moderation_notes = stmt.column_optional_string(6);
        e.moderation_timestamp = stmt.column_optional_u64(7);
        *out = std::move(e);
        return ok_status();
    }

    template <typename Bind>
    [[nodiscard]] Status owner_update(DbHandle db, const Principal& caller, bool valid, const char* sql,
                                      Bind bind) noexcept {
        WriteTxn txn(db, StatusDomain::ClaimLog);
        if (!is_ok(txn.status())) {
            return txn.status();
        }

        ClaimLogRoles roles{};
        const Status s = load_roles(txn.conn(), &roles);
        if (!is_ok(s)) {
            return s;
        }
        if (!farmledger::access::is_owner(roles, caller)) {
            return make_error(ClaimLogError::NotAuthorized);
        }
        if (!valid) {
            return make_error(ClaimLogError::InvalidInput);
        }

        {
            Stmt stmt(txn.conn(), sql);
            if (!stmt.ok()) {
                return db_error();
            }
            bind(stmt);
            if (stmt.step() != SQLITE_DONE) {
                return db_error();
            }
        }
        return txn.commit();
    }

} // namespace

// ============================================================================
// Logging
// ============================================================================

Status claims_log(DbHandle db, const VerificationSource& verification, const Principal& caller,
                  const LogParams& params, LogSeq* out) noexcept {
    if (!out) {
        return claims_invalid();
    }

    WriteTxn txn(db, StatusDomain::ClaimLog);
    if (!is_ok(txn.status())) {
        return txn.status();
    }
    sqlite3* conn = txn.conn();

    bool verified = false;
    Status s = verification.is_verified(caller, &verified);
    if (!is_ok(s)) {
        return s;
    }
    if (!verified) {
        return make_error(ClaimLogError::NotVerified);
    }
    if (caller.empty() ||
        !required_text_ok(params.practice_type, kMaxPracticeTypeLen) ||
        !required_text_ok(params.category, kMaxCategoryLen) ||
        !required_text_ok(params.details, kMaxDetailsLen) ||
        text_len(params.evidence_hash) > kMaxEvidenceHashLen) {
        return make_error(ClaimLogError::InvalidInput);
    }

    u64 seq = 0;
    s = load_log_count(conn, caller, &seq);
    if (!is_ok(s)) {
        return s;
    }
    if (seq >= kMaxStoredU64) {
        return make_status(StatusDomain::ClaimLog, StatusCode::Conflict);
    }

    Timestamp now = 0;
    s = farmledger::ledger::detail::clock_now_in_txn(conn, &now);
    if (!is_ok(s)) {
        return s;
    }

    {
        Stmt stmt(conn,
            "INSERT INTO practices (farmer, seq, practice_type, category, ts, details, evidence_hash, "
            "moderation_status) VALUES (?, ?, ?, ?, ?, ?, ?, 0)");
        if (!stmt.ok()) {
            return db_error();
        }
        stmt.bind_principal(1, caller);
        stmt.bind_u64(2, seq);
        stmt.bind_text(3, params.practice_type);
        stmt.bind_text(4, params.category);
        stmt.bind_u64(5, now);
        stmt.bind_text(6, params.details);
        stmt.bind_optional_text(7, params.evidence_hash);
        if (stmt.step() != SQLITE_DONE) {
            return db_error();
        }
    }
    {
        Stmt stmt(conn,
            "INSERT INTO log_counts (farmer, count) VALUES (?, ?) "
            "ON CONFLICT(farmer) DO UPDATE SET count = excluded.count");
        if (!stmt.ok()) {
            return db_error();
        }
        stmt.bind_principal(1, caller);
        stmt.bind_u64(2, seq + 1);
        if (stmt.step() != SQLITE_DONE) {
            return db_error();
        }
    }

    s = farmledger::ledger::detail::clock_tick_in_txn(conn);
    if (!is_ok(s)) {
        return s;
    }

    s = txn.commit();
    if (!is_ok(s)) {
        return s;
    }
    *out = seq;
    return ok_status();
}

// ============================================================================
// Moderation & amendment
// ============================================================================

Status claims_moderate(DbHandle db, const Principal& caller, const Principal& farmer, LogSeq seq,
                       ModerationStatus status, const char* notes) noexcept {
    WriteTxn txn(db, StatusDomain::ClaimLog);
    if (!is_ok(txn.status())) {
        return txn.status();
    }
    sqlite3* conn = txn.conn();

    ClaimLogRoles roles{};
    Status s = load_roles(conn, &roles);
    if (!is_ok(s)) {
        return s;
    }
    if (!farmledger::access::is_moderator(roles, caller)) {
        return make_error(ClaimLogError::NotAuthorized);
    }

    std::optional<PracticeEntry> entry;
    s = load_entry(conn, farmer, seq, &entry);
    if (!is_ok(s)) {
        return s;
    }
    if (!entry) {
        return make_error(ClaimLogError::LogNotFound);
    }
    if ((status != ModerationStatus::Approved && status != ModerationStatus::Rejected) ||
        text_len(notes) > kMaxModerationNotesLen) {
        return make_error(ClaimLogError::InvalidInput);
    }
    if (entry->moderation_status != ModerationStatus::Pending) {
        return make_error(ClaimLogError::AlreadyModerated);
    }

    Timestamp now = 0;
    s = farmledger::ledger::detail::clock_now_in_txn(conn, &now);
    if (!is_ok(s)) {
        return s;
    }

    {
        Stmt stmt(conn,
            "UPDATE practices SET moderation_status = ?, moderation_notes = ?, moderation_ts = ? "
            "WHERE farmer = ? AND seq = ? AND moderation_status = 0");
        if (!stmt.ok()) {
            return db_error();
        }
        stmt.bind_u64(1, static_cast<u64>(status));
        stmt.bind_optional_text(2, notes);
        stmt.bind_u64(3, now);
        stmt.bind_principal(4, farmer);
        stmt.bind_u64(5, seq);
        if (stmt.step() != SQLITE_DONE || sqlite3_changes(conn) != 1) {
            return db_error();
        }
    }

    s = farmledger::ledger::detail::clock_tick_in_txn(conn);
    if (!is_ok(s)) {
        return s;
    }
    return txn.commit();
}

Status claims_update(DbHandle db, const Principal& caller, LogSeq seq, const char* details,
                     const char* evidence_hash) noexcept {
    WriteTxn txn(db, StatusDomain::ClaimLog);
    if (!is_ok(txn.status())) {
        return txn.status();
    }
    sqlite3* conn = txn.conn();

    std::optional<PracticeEntry> entry;
    Status s = load_entry(conn, caller, seq, &entry);
    if (!is_ok(s)) {
        return s;
    }
    if (!entry) {
        return make_error(ClaimLogError::LogNotFound);
    }
    if (entry->moderation_status != ModerationStatus::Pending) {
        return make_error(ClaimLogError::AlreadyModerated);
    }
    if (text_len(details) > kMaxDetailsLen || text_len(evidence_hash) > kMaxEvidenceHashLen) {
        return make_error(ClaimLogError::InvalidInput);
    }

    {
        Stmt stmt(conn,
            "UPDATE practices SET details = ?, evidence_hash = ? "
            "WHERE farmer = ? AND seq = ? AND moderation_status = 0");
        if (!stmt.ok()) {
            return db_error();
        }
        stmt.bind_text(1, details ? std::string_view{details} : std::string_view{});
        stmt.bind_optional_text(2, evidence_hash);
        stmt.bind_principal(3, caller);
        stmt.bind_u64(4, seq);
        if (stmt.step() != SQLITE_DONE || sqlite3_changes(conn) != 1) {
            return db_error();
        }
    }
    return txn.commit();
}

// ============================================================================
// Owner administration
// ============================================================================

Status claims_set_moderator(DbHandle db, const Principal& caller, const Principal& moderator) noexcept {
    return owner_update(db, caller, !moderator.empty(), "UPDATE claim_log_config SET moderator = ? WHERE id = 1",
                        [&moderator](Stmt& stmt) { stmt.bind_principal(1, moderator); });
}

Status claims_transfer_ownership(DbHandle db, const Principal& caller, const Principal& new_owner) noexcept {
    return owner_update(db, caller, !new_owner.empty(), "UPDATE claim_log_config SET owner = ? WHERE id = 1",
                        [&new_owner](Stmt& stmt) { stmt.bind_principal(1, new_owner); });
}

// ============================================================================
// Reads
// ============================================================================

Status claims_get_entry(DbHandle db, const Principal& farmer, LogSeq seq,
                        std::optional<PracticeEntry>* out) noexcept {
    if (!out) {
        return claims_invalid();
    }

    Session session(db);
    if (!session.conn()) {
        return claims_invalid();
    }
    return load_entry(session.conn(), farmer, seq, out);
}

Status claims_get_log_count(DbHandle db, const Principal& farmer, u64* out) noexcept {
    if (!out) {
        return claims_invalid();
    }

    Session session(db);
    if (!session.conn()) {
        return claims_invalid();
    }
    return load_log_count(session.conn(), farmer, out);
}

Status claims_get_roles(DbHandle db, ClaimLogRoles* out) noexcept {
    if (!out) {
        return claims_invalid();
    }

    Session session(db);
    if (!session.conn()) {
        return claims_invalid();
    }
    return load_roles(session.conn(), out);
}

Status claims_get_owner(DbHandle db, Principal* out) noexcept {
    if (!out) {
        return claims_invalid();
    }

    ClaimLogRoles roles{};
    const Status s = claims_get_roles(db, &roles);
    if (!is_ok(s)) {
        return s;
    }
    *out = roles.owner;
    return ok_status();
}

Status claims_get_moderator(DbHandle db, Principal* out) noexcept {
    if (!out) {
        return claims_invalid();
    }

    ClaimLogRoles roles{};
    const Status s = claims_get_roles(db, &roles);
    if (!is_ok(s)) {
        return s;
    }
    *out = roles.moderator;
    return ok_status();
}

} // namespace farmledger::claims
