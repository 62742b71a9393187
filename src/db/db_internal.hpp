#pragma once

// Shared-store plumbing for the component sources. Not installed.

#include <sqlite3.h>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "farmledger/core/errors.hpp"
#include "farmledger/core/types.hpp"
#include "farmledger/db/db.hpp"

namespace farmledger::db::detail {
    using farmledger::core::i64;
    using farmledger::core::u32;
    using farmledger::core::u64;

    // Largest value a ledger amount, fee or clock may take (SQLite INTEGER).
    inline constexpr u64 kMaxStoredU64 = static_cast<u64>(INT64_MAX);

    // Holds the store lock for its lifetime. conn() is nullptr when the
    // handle is stale or the store is closed.
    class Session {
    public:
        explicit Session(DbHandle db) noexcept;

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        [[nodiscard]] sqlite3* conn() const noexcept { return conn_; }

    private:
        std::unique_lock<std::recursive_mutex> lock_;
        sqlite3* conn_{nullptr};
    };

    // One atomic unit of work. The outermost scope runs BEGIN IMMEDIATE /
    // COMMIT; scopes opened while another is active use a savepoint.
    // Destroying an uncommitted scope rolls it back.
    class WriteTxn {
    public:
        WriteTxn(DbHandle db, farmledger::core::StatusDomain domain) noexcept;
        ~WriteTxn();

        WriteTxn(const WriteTxn&) = delete;
        WriteTxn& operator=(const WriteTxn&) = delete;

        [[nodiscard]] farmledger::core::Status status() const noexcept { return begin_status_; }
        [[nodiscard]] sqlite3* conn() const noexcept { return session_.conn(); }

        [[nodiscard]] farmledger::core::Status commit() noexcept;

    private:
        void rollback() noexcept;

        Session session_;
        farmledger::core::StatusDomain domain_;
        farmledger::core::Status begin_status_{};
        bool active_{false};
        bool nested_{false};
    };

    // Owns a prepared statement.
    class Stmt {
    public:
        Stmt(sqlite3* db, const char* sql) noexcept;
        ~Stmt();

        Stmt(const Stmt&) = delete;
        Stmt& operator=(const Stmt&) = delete;

        [[nodiscard]] bool ok() const noexcept { return stmt_ != nullptr; }
        [[nodiscard]] sqlite3_stmt* get() const noexcept { return stmt_; }

        // sqlite3_step result.
        int step() noexcept { return sqlite3_step(stmt_); }

        void bind_principal(int idx, const farmledger::core::Principal& p) noexcept;
        void bind_text(int idx, std::string_view v) noexcept;
        void bind_optional_text(int idx, const char* v) noexcept;
        void bind_i64(int idx, i64 v) noexcept;
        void bind_u64(int idx, u64 v) noexcept;
        void bind_optional_u64(int idx, const std::optional<u64>& v) noexcept;

        [[nodiscard]] bool column_principal(int col, farmledger::core::Principal* out) const noexcept;
        [[nodiscard]] std::string column_string(int col) const;
        [[nodiscard]] std::optional<std::string> column_optional_string(int col) const;
        [[nodiscard]] i64 column_i64(int col) const noexcept;
        [[nodiscard]] u64 column_u64(int col) const noexcept;
        [[nodiscard]] std::optional<u64> column_optional_u64(int col) const noexcept;

    private:
        sqlite3_stmt* stmt_{nullptr};
    };

    [[nodiscard]] bool exec_sql(sqlite3* db, const char* sql) noexcept;

    [[nodiscard]] constexpr farmledger::core::Status db_error(farmledger::core::StatusCode code =
                                                                  farmledger::core::StatusCode::Unknown) noexcept {
        return farmledger::core::make_status(farmledger::core::StatusDomain::Db, code);
    }

} // namespace farmledger::db::detail
