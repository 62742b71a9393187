#pragma once

// Ledger primitives that run on a connection already inside a WriteTxn, so
// the registry can make a transfer part of its own atomic unit.

#include <sqlite3.h>

#include "farmledger/core/errors.hpp"
#include "farmledger/core/types.hpp"

namespace farmledger::ledger::detail {

[[nodiscard]] farmledger::core::Status transfer_in_txn(sqlite3* conn,
                                                       const farmledger::core::Principal& from,
                                                       const farmledger::core::Principal& to,
                                                       farmledger::core::Amount amount) noexcept;

[[nodiscard]] farmledger::core::Status credit_in_txn(sqlite3* conn,
                                                     const farmledger::core::Principal& account,
                                                     farmledger::core::Amount amount) noexcept;

[[nodiscard]] farmledger::core::Status balance_in_txn(sqlite3* conn,
                                                      const farmledger::core::Principal& account,
                                                      farmledger::core::Amount* out) noexcept;

[[nodiscard]] farmledger::core::Status clock_now_in_txn(sqlite3* conn, farmledger::core::Timestamp* out) noexcept;

// Advance the clock by one block.
[[nodiscard]] farmledger::core::Status clock_tick_in_txn(sqlite3* conn) noexcept;

} // namespace farmledger::ledger::detail
