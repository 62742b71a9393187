#include "farmledger/db/db.hpp"
#include "db/db_internal.hpp"

#include <sqlite3.h>
#include <cstddef>
#include <cstdlib>
#include <string>
#include <mutex>

namespace farmledger::db {

using namespace farmledger::core;

// Global database state
namespace {
    struct DbState {
        sqlite3* db{nullptr};
        std::recursive_mutex mutex;
        u32 generation{0};
        u32 txn_depth{0};
    };

    DbState g_db_state;

    constexpr const char* kSchemaSQL = R"SQL(
        PRAGMA foreign_keys = ON;

        CREATE TABLE IF NOT EXISTS registry_config (
            id INTEGER PRIMARY KEY CHECK (id = 1),
            owner TEXT NOT NULL,
            verifier TEXT NOT NULL,
            registration_fee INTEGER NOT NULL CHECK (registration_fee >= 0),
            contract_balance INTEGER NOT NULL CHECK (contract_balance >= 0),
            next_farmer_id INTEGER NOT NULL CHECK (next_farmer_id >= 1),
            custodian TEXT NOT NULL
        );

        CREATE TABLE IF NOT EXISTS claim_log_config (
            id INTEGER PRIMARY KEY CHECK (id = 1),
            owner TEXT NOT NULL,
            moderator TEXT NOT NULL
        );

        CREATE TABLE IF NOT EXISTS ledger_clock (
            id INTEGER PRIMARY KEY CHECK (id = 1),
            height INTEGER NOT NULL CHECK (height >= 0)
        );

        CREATE TABLE IF NOT EXISTS accounts (
            principal TEXT PRIMARY KEY,
            balance INTEGER NOT NULL CHECK (balance >= 0)
        );

        CREATE TABLE IF NOT EXISTS farmers (
            principal TEXT PRIMARY KEY,
            id INTEGER NOT NULL UNIQUE,
            name TEXT NOT NULL,
            location TEXT NOT NULL,
            farm_size INTEGER NOT NULL CHECK (farm_size > 0),
            registration_ts INTEGER NOT NULL,
            verification_status INTEGER NOT NULL DEFAULT 0,
            verification_ts INTEGER,
            additional_info TEXT NOT NULL,
            active INTEGER NOT NULL DEFAULT 1
        );

        CREATE TABLE IF NOT EXISTS farmer_ids (
            id INTEGER PRIMARY KEY,
            principal TEXT NOT NULL UNIQUE REFERENCES farmers(principal)
        );

        CREATE TABLE IF NOT EXISTS practices (
            farmer TEXT NOT NULL,
            seq INTEGER NOT NULL,
            practice_type TEXT NOT NULL,
            category TEXT NOT NULL,
            ts INTEGER NOT NULL,
            details TEXT NOT NULL,
            evidence_hash TEXT,
            moderation_status INTEGER NOT NULL DEFAULT 0,
            moderation_notes TEXT,
            moderation_ts INTEGER,
            PRIMARY KEY (farmer, seq)
        );

        CREATE TABLE IF NOT EXISTS log_counts (
            farmer TEXT PRIMARY KEY,
            count INTEGER NOT NULL CHECK (count >= 0)
        );

        -- Records are append-only.
        CREATE TRIGGER IF NOT EXISTS farmers_no_delete BEFORE DELETE ON farmers BEGIN
            SELECT RAISE(ABORT, 'farmers is append-only');
        END;
        CREATE TRIGGER IF NOT EXISTS farmer_ids_no_delete BEFORE DELETE ON farmer_ids BEGIN
            SELECT RAISE(ABORT, 'farmer_ids is append-only');
        END;
        CREATE TRIGGER IF NOT EXISTS practices_no_delete BEFORE DELETE ON practices BEGIN
            SELECT RAISE(ABORT, 'practices is append-only');
        END;

        -- Status leaves pending at most once; decided states are terminal.
        CREATE TRIGGER IF NOT EXISTS farmers_status_terminal
        BEFORE UPDATE OF verification_status ON farmers
        WHEN OLD.verification_status <> 0 BEGIN
            SELECT RAISE(ABORT, 'verification status is terminal');
        END;
        CREATE TRIGGER IF NOT EXISTS practices_status_terminal
        BEFORE UPDATE OF moderation_status ON practices
        WHEN OLD.moderation_status <> 0 BEGIN
            SELECT RAISE(ABORT, 'moderation status is terminal');
        END;
        CREATE TRIGGER IF NOT EXISTS practices_content_frozen
        BEFORE UPDATE OF details, evidence_hash ON practices
        WHEN OLD.moderation_status <> 0 BEGIN
            SELECT RAISE(ABORT, 'moderated entries are frozen');
        END;
    )SQL";

    constexpr const char* kSeedRegistrySQL =
        "INSERT OR IGNORE INTO registry_config "
        "(id, owner, verifier, registration_fee, contract_balance, next_farmer_id, custodian) "
        "VALUES (1, ?, ?, ?, 0, 1, ?)";

    constexpr const char* kSeedClaimLogSQL =
        "INSERT OR IGNORE INTO claim_log_config (id, owner, moderator) VALUES (1, ?, ?)";

    constexpr const char* kSeedClockSQL =
        "INSERT OR IGNORE INTO ledger_clock (id, height) VALUES (1, ?)";

    [[nodiscard]] bool seed_config(sqlite3* db, const Principal& deployer, const Principal& custodian,
                                   Amount fee, Timestamp genesis) noexcept {
        {
            detail::Stmt stmt(db, kSeedRegistrySQL);
            if (!stmt.ok()) {
                return false;
            }
            stmt.bind_principal(1, deployer);
            stmt.bind_principal(2, deployer);
            stmt.bind_u64(3, fee);
            stmt.bind_principal(4, custodian);
            if (stmt.step() != SQLITE_DONE) {
                return false;
            }
        }
        {
            detail::Stmt stmt(db, kSeedClaimLogSQL);
            if (!stmt.ok()) {
                return false;
            }
            stmt.bind_principal(1, deployer);
            stmt.bind_principal(2, deployer);
            if (stmt.step() != SQLITE_DONE) {
                return false;
            }
        }
        detail::Stmt stmt(db, kSeedClockSQL);
        if (!stmt.ok()) {
            return false;
        }
        stmt.bind_u64(1, genesis);
        return stmt.step() == SQLITE_DONE;
    }
}

namespace detail {

bool exec_sql(sqlite3* db, const char* sql) noexcept {
    if (!db || !sql) return false;
    char* err_msg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
    if (err_msg) sqlite3_free(err_msg);
    return rc == SQLITE_OK;
}

// ============================================================================
// Session / WriteTxn
// ============================================================================

Session::Session(DbHandle db) noexcept : lock_(g_db_state.mutex) {
    if (db_handle_valid(db) && db.id == g_db_state.generation) {
        conn_ = g_db_state.db;
    }
}

WriteTxn::WriteTxn(DbHandle db, StatusDomain domain) noexcept : session_(db), domain_(domain) {
    sqlite3* conn = session_.conn();
    if (!conn) {
        begin_status_ = make_status(domain_, StatusCode::Invalid);
        return;
    }

    nested_ = g_db_state.txn_depth > 0;
    const char* sql = nested_ ? "SAVEPOINT farmledger_nested" : "BEGIN IMMEDIATE";
    const int rc = sqlite3_exec(conn, sql, nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        begin_status_ = db_error(rc == SQLITE_BUSY ? StatusCode::Busy : StatusCode::Unknown);
        return;
    }

    ++g_db_state.txn_depth;
    active_ = true;
}

WriteTxn::~WriteTxn() {
    if (active_) {
        rollback();
    }
}

Status WriteTxn::commit() noexcept {
    if (!active_) {
        return is_ok(begin_status_) ? db_error(StatusCode::Invalid) : begin_status_;
    }

    const char* sql = nested_ ? "RELEASE farmledger_nested" : "COMMIT";
    const int rc = sqlite3_exec(session_.conn(), sql, nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        rollback();
        return db_error(rc == SQLITE_BUSY ? StatusCode::Busy : StatusCode::Unknown);
    }

    active_ = false;
    --g_db_state.txn_depth;
    return ok_status();
}

void WriteTxn::rollback() noexcept {
    sqlite3* conn = session_.conn();
    if (nested_) {
        (void)exec_sql(conn, "ROLLBACK TO farmledger_nested");
        (void)exec_sql(conn, "RELEASE farmledger_nested");
    } else {
        (void)exec_sql(conn, "ROLLBACK");
    }
    active_ = false;
    --g_db_state.txn_depth;
}

// ============================================================================
// Stmt
// ============================================================================

Stmt::Stmt(sqlite3* db, const char* sql) noexcept {
    if (!db || !sql) {
        return;
    }
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = nullptr;
    }
}

Stmt::~Stmt() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

void Stmt::bind_principal(int idx, const Principal& p) noexcept {
    sqlite3_bind_text(stmt_, idx, p.b.data(), static_cast<int>(p.len), SQLITE_TRANSIENT);
}

void Stmt::bind_text(int idx, std::string_view v) noexcept {
    // An empty view may carry a null pointer, which SQLite would bind as NULL.
    sqlite3_bind_text(stmt_, idx, v.data() ? v.data() : "", static_cast<int>(v.size()), SQLITE_TRANSIENT);
}

void Stmt::bind_optional_text(int idx, const char* v) noexcept {
    if (v == nullptr) {
        sqlite3_bind_null(stmt_, idx);
        return;
    }
    sqlite3_bind_text(stmt_, idx, v, -1, SQLITE_TRANSIENT);
}

void Stmt::bind_i64(int idx, i64 v) noexcept {
    sqlite3_bind_int64(stmt_, idx, v);
}

void Stmt::bind_u64(int idx, u64 v) noexcept {
    sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v));
}

void Stmt::bind_optional_u64(int idx, const std::optional<u64>& v) noexcept {
    if (!v) {
        sqlite3_bind_null(stmt_, idx);
        return;
    }
    bind_u64(idx, *v);
}

bool Stmt::column_principal(int col, Principal* out) const noexcept {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
    const int len = sqlite3_column_bytes(stmt_, col);
    if (!text || len <= 0) {
        return false;
    }
    return principal_from(std::string_view{text, static_cast<std::size_t>(len)}, out);
}

std::string Stmt::column_string(int col) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
    const int len = sqlite3_column_bytes(stmt_, col);
    if (!text || len <= 0) {
        return std::string();
    }
    return std::string(text, static_cast<std::size_t>(len));
}

std::optional<std::string> Stmt::column_optional_string(int col) const {
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return column_string(col);
}

i64 Stmt::column_i64(int col) const noexcept {
    return sqlite3_column_int64(stmt_, col);
}

u64 Stmt::column_u64(int col) const noexcept {
    return static_cast<u64>(sqlite3_column_int64(stmt_, col));
}

std::optional<u64> Stmt::column_optional_u64(int col) const noexcept {
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return column_u64(col);
}

} // namespace detail

// ============================================================================
// Database Lifecycle
// ============================================================================

Status db_open(const DbConfig& cfg, DbHandle* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    Principal deployer{};
    Principal custodian{};
    if (!principal_from(cfg.deployer ? cfg.deployer : kDefaultDeployer, &deployer) ||
        !principal_from(cfg.registry_account ? cfg.registry_account : kDefaultRegistryAccount, &custodian)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (deployer == custodian) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (cfg.registration_fee > detail::kMaxStoredU64 || cfg.genesis_height > detail::kMaxStoredU64) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::recursive_mutex> lock(g_db_state.mutex);

    // Close existing connection if any
    if (g_db_state.db) {
        sqlite3_close(g_db_state.db);
        g_db_state.db = nullptr;
    }
    g_db_state.txn_depth = 0;

    const char* path = cfg.path ? cfg.path : ":memory:";
    int rc = sqlite3_open(path, &g_db_state.db);
    if (rc != SQLITE_OK) {
        sqlite3_close(g_db_state.db);
        g_db_state.db = nullptr;
        return make_status(StatusDomain::Db, StatusCode::Io);
    }

    // Journal mode is configurable; WAL unless overridden.
    const char* journal_mode = std::getenv("FARMLEDGER_DB_JOURNAL_MODE");
    if (!journal_mode || journal_mode[0] == '\0') {
        journal_mode = "WAL";
    }
    std::string journal_sql = "PRAGMA journal_mode=";
    journal_sql += journal_mode;
    // In-memory stores reject WAL; they keep their default mode.
    (void)detail::exec_sql(g_db_state.db, journal_sql.c_str());

    (void)detail::exec_sql(g_db_state.db, "PRAGMA synchronous=NORMAL");
    (void)detail::exec_sql(g_db_state.db, "PRAGMA temp_store=MEMORY");
    sqlite3_busy_timeout(g_db_state.db, 5000);

    if (!detail::exec_sql(g_db_state.db, kSchemaSQL) ||
        !seed_config(g_db_state.db, deployer, custodian, cfg.registration_fee, cfg.genesis_height)) {
        sqlite3_close(g_db_state.db);
        g_db_state.db = nullptr;
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }

    ++g_db_state.generation;
    if (g_db_state.generation == 0) {
        g_db_state.generation = 1;
    }
    out->id = g_db_state.generation;
    return ok_status();
}

Status db_close(DbHandle db) noexcept {
    if (!db_handle_valid(db)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::recursive_mutex> lock(g_db_state.mutex);

    if (db.id != g_db_state.generation || !g_db_state.db) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    sqlite3_close(g_db_state.db);
    g_db_state.db = nullptr;
    g_db_state.txn_depth = 0;
    return ok_status();
}

Status db_table_row_count(DbHandle db, TableId table, u64* out) noexcept {
    const char* name = table_name(table);
    if (!out || !name) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    detail::Session session(db);
    if (!session.conn()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "SELECT COUNT(*) FROM ";
    sql += name;

    detail::Stmt stmt(session.conn(), sql.c_str());
    if (!stmt.ok() || stmt.step() != SQLITE_ROW) {
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }

    *out = stmt.column_u64(0);
    return ok_status();
}

} // namespace farmledger::db
