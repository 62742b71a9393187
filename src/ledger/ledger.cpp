#include "farmledger/ledger/ledger.hpp"
#include "ledger/ledger_internal.hpp"
#include "db/db_internal.hpp"

#include <sqlite3.h>

namespace farmledger::ledger {

using namespace farmledger::core;
using farmledger::db::detail::Stmt;
using farmledger::db::detail::WriteTxn;
using farmledger::db::detail::Session;
using farmledger::db::detail::kMaxStoredU64;

namespace {
    [[nodiscard]] constexpr Status ledger_invalid() noexcept {
        return make_status(StatusDomain::Ledger, StatusCode::Invalid);
    }

    [[nodiscard]] constexpr Status ledger_db_error() noexcept {
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }

    [[nodiscard]] Status add_to_account(sqlite3* conn, const Principal& account, Amount amount) noexcept {
        Amount current = 0;
        Status s = detail::balance_in_txn(conn, account, &current);
        if (!is_ok(s)) {
            return s;
        }
        if (amount > kMaxStoredU64 - current) {
            return ledger_invalid();
        }

        Stmt stmt(conn,
            "INSERT INTO accounts (principal, balance) VALUES (?, ?) "
            "ON CONFLICT(principal) DO UPDATE SET balance = balance + excluded.balance");
        if (!stmt.ok()) {
            return ledger_db_error();
        }
        stmt.bind_principal(1, account);
        stmt.bind_u64(2, amount);
        if (stmt.step() != SQLITE_DONE) {
            return ledger_db_error();
        }
        return ok_status();
    }

    // The registry custodian holds registration fees and is only moved by
    // the registry itself.
    [[nodiscard]] Status reject_reserved(sqlite3* conn, const Principal& account) noexcept {
        Stmt stmt(conn, "SELECT custodian FROM registry_config WHERE id = 1");
        if (!stmt.ok() || stmt.step() != SQLITE_ROW) {
            return ledger_db_error();
        }
        Principal custodian{};
        if (!stmt.column_principal(0, &custodian)) {
            return make_status(StatusDomain::Db, StatusCode::Corrupt);
        }
        if (account == custodian) {
            return make_error(TransferError::ReservedAccount);
        }
        return ok_status();
    }
} // namespace

namespace detail {

Status balance_in_txn(sqlite3* conn, const Principal& account, Amount* out) noexcept {
    if (!conn || !out || account.empty()) {
        return ledger_invalid();
    }

    Stmt stmt(conn, "SELECT balance FROM accounts WHERE principal = ?");
    if (!stmt.ok()) {
        return ledger_db_error();
    }
    stmt.bind_principal(1, account);

    const int rc = stmt.step();
    if (rc == SQLITE_ROW) {
        *out = stmt.column_u64(0);
        return ok_status();
    }
    if (rc == SQLITE_DONE) {
        *out = 0;
        return ok_status();
    }
    return ledger_db_error();
}

Status credit_in_txn(sqlite3* conn, const Principal& account, Amount amount) noexcept {
    if (!conn || account.empty()) {
        return ledger_invalid();
    }
    if (amount == 0) {
        return make_error(TransferError::NonPositiveAmount);
    }
    return add_to_account(conn, account, amount);
}

Status transfer_in_txn(sqlite3* conn, const Principal& from, const Principal& to, Amount amount) noexcept {
    if (!conn || from.empty() || to.empty()) {
        return ledger_invalid();
    }
    if (amount == 0) {
        return make_error(TransferError::NonPositiveAmount);
    }
    if (from == to) {
        return make_error(TransferError::SameAccount);
    }

    Amount available = 0;
    Status s = balance_in_txn(conn, from, &available);
    if (!is_ok(s)) {
        return s;
    }
    if (available < amount) {
        return make_error(TransferError::InsufficientBalance);
    }

    Stmt debit(conn, "UPDATE accounts SET balance = balance - ? WHERE principal = ?");
    if (!debit.ok()) {
        return ledger_db_error();
    }
    debit.bind_u64(1, amount);
    debit.bind_principal(2, from);
    if (debit.step() != SQLITE_DONE || sqlite3_changes(conn) != 1) {
        return ledger_db_error();
    }

    return add_to_account(conn, to, amount);
}

Status clock_now_in_txn(sqlite3* conn, Timestamp* out) noexcept {
    if (!conn || !out) {
        return ledger_invalid();
    }

    Stmt stmt(conn, "SELECT height FROM ledger_clock WHERE id = 1");
    if (!stmt.ok() || stmt.step() != SQLITE_ROW) {
        return ledger_db_error();
    }
    *out = stmt.column_u64(0);
    return ok_status();
}

Status clock_tick_in_txn(sqlite3* conn) noexcept {
    if (!conn) {
        return ledger_invalid();
    }

    Stmt stmt(conn, "UPDATE ledger_clock SET height = height + 1 WHERE id = 1 AND height < ?");
    if (!stmt.ok()) {
        return ledger_db_error();
    }
    stmt.bind_u64(1, kMaxStoredU64);
    if (stmt.step() != SQLITE_DONE) {
        return ledger_db_error();
    }
    if (sqlite3_changes(conn) != 1) {
        return make_status(StatusDomain::Ledger, StatusCode::Conflict);
    }
    return ok_status();
}

} // namespace detail

// ========================================================================
// Public API
// ========================================================================

Status ledger_transfer(farmledger::db::DbHandle db, const Principal& from, const Principal& to, Amount amount) noexcept {
    WriteTxn txn(db, StatusDomain::Ledger);
    if (!is_ok(txn.status())) {
        return txn.status();
    }

    Status s = reject_reserved(txn.conn(), from);
    if (!is_ok(s)) {
        return s;
    }
    s = reject_reserved(txn.conn(), to);
    if (!is_ok(s)) {
        return s;
    }
    s = detail::transfer_in_txn(txn.conn(), from, to, amount);
    if (!is_ok(s)) {
        return s;
    }
    return txn.commit();
}

Status ledger_credit(farmledger::db::DbHandle db, const Principal& account, Amount amount) noexcept {
    WriteTxn txn(db, StatusDomain::Ledger);
    if (!is_ok(txn.status())) {
        return txn.status();
    }

    Status s = reject_reserved(txn.conn(), account);
    if (!is_ok(s)) {
        return s;
    }
    s = detail::credit_in_txn(txn.conn(), account, amount);
    if (!is_ok(s)) {
        return s;
    }
    return txn.commit();
}

Status ledger_balance(farmledger::db::DbHandle db, const Principal& account, Amount* out) noexcept {
    if (!out) {
        return ledger_invalid();
    }

    Session session(db);
    if (!session.conn()) {
        return ledger_invalid();
    }
    return detail::balance_in_txn(session.conn(), account, out);
}

Status ledger_clock_now(farmledger::db::DbHandle db, Timestamp* out) noexcept {
    if (!out) {
        return ledger_invalid();
    }

    Session session(db);
    if (!session.conn()) {
        return ledger_invalid();
    }
    return detail::clock_now_in_txn(session.conn(), out);
}

Status ledger_clock_advance(farmledger::db::DbHandle db, u64 blocks, Timestamp* out) noexcept {
    if (!out) {
        return ledger_invalid();
    }

    WriteTxn txn(db, StatusDomain::Ledger);
    if (!is_ok(txn.status())) {
        return txn.status();
    }

    Timestamp now = 0;
    Status s = detail::clock_now_in_txn(txn.conn(), &now);
    if (!is_ok(s)) {
        return s;
    }
    if (blocks > kMaxStoredU64 - now) {
        return make_status(StatusDomain::Ledger, StatusCode::Invalid);
    }

    Stmt stmt(txn.conn(), "UPDATE ledger_clock SET height = ? WHERE id = 1");
    if (!stmt.ok()) {
        return ledger_db_error();
    }
    stmt.bind_u64(1, now + blocks);
    if (stmt.step() != SQLITE_DONE) {
        return ledger_db_error();
    }

    s = txn.commit();
    if (!is_ok(s)) {
        return s;
    }
    *out = now + blocks;
    return ok_status();
}

} // namespace farmledger::ledger
