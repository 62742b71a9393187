#pragma once

#include <type_traits>

#include "farmledger/core/types.hpp"

namespace farmledger::db {
    using u32 = farmledger::core::u32;

    enum class TableId : u32 {
        RegistryConfig = 1,
        ClaimLogConfig = 2,
        LedgerClock = 3,
        Accounts = 4,
        Farmers = 5,
        FarmerIds = 6,
        Practices = 7,
        LogCounts = 8,
    };

    // SQL table name, or nullptr for an unknown id.
    [[nodiscard]] constexpr const char* table_name(TableId t) noexcept {
        switch (t) {
            case TableId::RegistryConfig: return "registry_config";
            case TableId::ClaimLogConfig: return "claim_log_config";
            case TableId::LedgerClock: return "ledger_clock";
            case TableId::Accounts: return "accounts";
            case TableId::Farmers: return "farmers";
            case TableId::FarmerIds: return "farmer_ids";
            case TableId::Practices: return "practices";
            case TableId::LogCounts: return "log_counts";
        }
        return nullptr;
    }

    static_assert(std::is_trivially_copyable_v<TableId>);

} // namespace farmledger::db
