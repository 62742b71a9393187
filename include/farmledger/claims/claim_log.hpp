#pragma once

#include <optional>

#include "farmledger/access/roles.hpp"
#include "farmledger/claims/verification.hpp"
#include "farmledger/core/errors.hpp"
#include "farmledger/core/models.hpp"
#include "farmledger/core/types.hpp"
#include "farmledger/db/db.hpp"

namespace farmledger::claims {

using u64 = farmledger::core::u64;
using LogSeq = farmledger::core::LogSeq;
using Principal = farmledger::core::Principal;
using farmledger::db::DbHandle;

struct LogParams {
    const char* practice_type{nullptr};
    const char* category{nullptr};
    const char* details{nullptr};
    const char* evidence_hash{nullptr}; // optional
};

// ========================================================================
// Mutating operations
// ========================================================================
//
// Failures are ClaimLog-domain statuses with the core::ClaimLogError code in
// aux. Nothing is written on failure.

// Append a pending entry to the caller's log and return its sequence number.
// - NotVerified unless `verification` reports the caller as verified
// - InvalidInput for empty type/category/details or over-limit text
[[nodiscard]] farmledger::core::Status claims_log(DbHandle db,
                                                  const VerificationSource& verification,
                                                  const Principal& caller,
                                                  const LogParams& params,
                                                  LogSeq* out) noexcept;

// Moderator-only. `notes` may be nullptr.
[[nodiscard]] farmledger::core::Status claims_moderate(DbHandle db,
                                                       const Principal& caller,
                                                       const Principal& farmer,
                                                       LogSeq seq,
                                                       farmledger::core::ModerationStatus status,
                                                       const char* notes) noexcept;

// Rewrite a pending entry of the caller's own log. Both fields are
// replaced; a nullptr evidence_hash clears the stored one.
[[nodiscard]] farmledger::core::Status claims_update(DbHandle db,
                                                     const Principal& caller,
                                                     LogSeq seq,
                                                     const char* details,
                                                     const char* evidence_hash) noexcept;

[[nodiscard]] farmledger::core::Status claims_set_moderator(DbHandle db,
                                                            const Principal& caller,
                                                            const Principal& moderator) noexcept;

[[nodiscard]] farmledger::core::Status claims_transfer_ownership(DbHandle db,
                                                                 const Principal& caller,
                                                                 const Principal& new_owner) noexcept;

// ========================================================================
// Reads
// ========================================================================

[[nodiscard]] farmledger::core::Status claims_get_entry(DbHandle db,
                                                        const Principal& farmer,
                                                        LogSeq seq,
                                                        std::optional<farmledger::core::PracticeEntry>* out) noexcept;

// Number of entries the farmer has logged; 0 when none.
[[nodiscard]] farmledger::core::Status claims_get_log_count(DbHandle db, const Principal& farmer, u64* out) noexcept;

[[nodiscard]] farmledger::core::Status claims_get_roles(DbHandle db, farmledger::access::ClaimLogRoles* out) noexcept;
[[nodiscard]] farmledger::core::Status claims_get_owner(DbHandle db, Principal* out) noexcept;
[[nodiscard]] farmledger::core::Status claims_get_moderator(DbHandle db, Principal* out) noexcept;

} // namespace farmledger::claims
