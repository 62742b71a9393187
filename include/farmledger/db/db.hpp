#pragma once

#include <type_traits>

#include "farmledger/core/errors.hpp"
#include "farmledger/core/types.hpp"
#include "farmledger/db/schema.hpp"

namespace farmledger::db {
    using u32 = farmledger::core::u32;
    using u64 = farmledger::core::u64;

    inline constexpr farmledger::core::Amount kDefaultRegistrationFee = 1000000;
    inline constexpr const char* kDefaultDeployer = "deployer";
    inline constexpr const char* kDefaultRegistryAccount = "farmer-registry";

    // Settings below `path` only seed a newly created store; an existing
    // store keeps its persisted roles, fee and balance.
    struct DbConfig {
        const char* path{nullptr};             // nullptr or ":memory:" for an in-memory store
        const char* deployer{nullptr};         // initial owner, verifier and moderator
        const char* registry_account{nullptr}; // ledger account holding registration fees
        farmledger::core::Amount registration_fee{kDefaultRegistrationFee};
        farmledger::core::Timestamp genesis_height{0};
    };

    struct DbHandle {
        u32 id{0};
    };

    [[nodiscard]] constexpr bool db_handle_valid(DbHandle db) noexcept {
        return db.id != 0;
    }

    // One store is open per process; opening again closes the previous one
    // and invalidates its handle.
    farmledger::core::Status db_open(const DbConfig& cfg, DbHandle* out) noexcept;
    farmledger::core::Status db_close(DbHandle db) noexcept;

    farmledger::core::Status db_table_row_count(DbHandle db, TableId table, u64* out) noexcept;

    static_assert(std::is_trivially_copyable_v<DbConfig>);
    static_assert(std::is_trivially_copyable_v<DbHandle>);
    static_assert(std::is_standard_layout_v<DbConfig>);
    static_assert(std::is_standard_layout_v<DbHandle>);

} // namespace farmledger::db
