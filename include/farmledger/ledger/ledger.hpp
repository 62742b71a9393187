#pragma once

#include "farmledger/core/errors.hpp"
#include "farmledger/core/types.hpp"
#include "farmledger/db/db.hpp"

namespace farmledger::ledger {

using Amount = farmledger::core::Amount;
using Timestamp = farmledger::core::Timestamp;
using Principal = farmledger::core::Principal;

// ========================================================================
// Value transfer
// ========================================================================

// Move `amount` between two accounts atomically.
// Fails with a Ledger-domain status whose aux is a core::TransferError:
// - NonPositiveAmount for amount == 0
// - SameAccount when from == to
// - InsufficientBalance when `from` holds less than `amount`
// - ReservedAccount when either side is the registry custodian
[[nodiscard]] farmledger::core::Status ledger_transfer(farmledger::db::DbHandle db,
                                                       const Principal& from,
                                                       const Principal& to,
                                                       Amount amount) noexcept;

// Fund an account from outside the ledger (hosting environment mint).
// The registry custodian cannot be credited (ReservedAccount).
[[nodiscard]] farmledger::core::Status ledger_credit(farmledger::db::DbHandle db,
                                                     const Principal& account,
                                                     Amount amount) noexcept;

// Balance of an account; unknown accounts hold 0.
[[nodiscard]] farmledger::core::Status ledger_balance(farmledger::db::DbHandle db,
                                                      const Principal& account,
                                                      Amount* out) noexcept;

// ========================================================================
// Logical clock
// ========================================================================

[[nodiscard]] farmledger::core::Status ledger_clock_now(farmledger::db::DbHandle db, Timestamp* out) noexcept;

// Advance the clock by `blocks` and return the new height.
[[nodiscard]] farmledger::core::Status ledger_clock_advance(farmledger::db::DbHandle db,
                                                            farmledger::core::u64 blocks,
                                                            Timestamp* out) noexcept;

} // namespace farmledger::ledger
