#pragma once

#include <optional>

#include "farmledger/access/roles.hpp"
#include "farmledger/core/errors.hpp"
#include "farmledger/core/models.hpp"
#include "farmledger/core/types.hpp"
#include "farmledger/db/db.hpp"

namespace farmledger::registry {

using u32 = farmledger::core::u32;
using u64 = farmledger::core::u64;
using i64 = farmledger::core::i64;
using Amount = farmledger::core::Amount;
using FarmerId = farmledger::core::FarmerId;
using Principal = farmledger::core::Principal;
using farmledger::db::DbHandle;

// Largest batch accepted by registry_register_batch_verified.
inline constexpr u32 kMaxBatchSize = 200;

struct RegistrationParams {
    const char* name{nullptr};
    const char* location{nullptr};
    i64 farm_size{0};
    const char* additional_info{nullptr}; // nullptr is stored as ""
};

// Fields left as nullptr / nullopt keep their current value.
// An empty string or a zero farm_size is also treated as "keep".
struct ProfilePatch {
    const char* name{nullptr};
    const char* location{nullptr};
    std::optional<i64> farm_size{};
    const char* additional_info{nullptr};
};

struct BatchRegistration {
    Principal farmer{};
    RegistrationParams params{};
};

// ========================================================================
// Mutating operations
// ========================================================================
//
// Each call is one atomic unit: on failure nothing is written. Contract
// failures are Registry-domain statuses with the core::RegistryError code in
// aux; a failed fee transfer surfaces unchanged as a Ledger-domain status.

// Register the caller and charge the current registration fee.
// - AlreadyRegistered if the caller has a profile
// - InvalidInput for empty name/location, farm_size <= 0, over-limit text,
//   or a caller that is the fee custodian account
[[nodiscard]] farmledger::core::Status registry_register(DbHandle db,
                                                         const Principal& caller,
                                                         const RegistrationParams& params,
                                                         FarmerId* out) noexcept;

// Owner-only bulk onboarding without fees. Profiles are created already
// verified, which bypasses the verifier; callers opt into that by name.
// Returns the id given to the first entry; the rest follow sequentially.
[[nodiscard]] farmledger::core::Status registry_register_batch_verified(DbHandle db,
                                                                       const Principal& caller,
                                                                       const BatchRegistration* entries,
                                                                       u32 count,
                                                                       FarmerId* first_id) noexcept;

// Verifier-only; status must be Verified or Rejected and the profile pending.
[[nodiscard]] farmledger::core::Status registry_verify(DbHandle db,
                                                       const Principal& caller,
                                                       const Principal& farmer,
                                                       farmledger::core::VerificationStatus status) noexcept;

// The caller's own profile, which must be verified.
[[nodiscard]] farmledger::core::Status registry_update_profile(DbHandle db,
                                                               const Principal& caller,
                                                               const ProfilePatch& patch) noexcept;

// Owner-only; there is no way back.
[[nodiscard]] farmledger::core::Status registry_deactivate(DbHandle db,
                                                           const Principal& caller,
                                                           const Principal& farmer) noexcept;

[[nodiscard]] farmledger::core::Status registry_set_registration_fee(DbHandle db,
                                                                     const Principal& caller,
                                                                     Amount fee) noexcept;

// Role setters reject an empty identity and the fee custodian (InvalidInput).
[[nodiscard]] farmledger::core::Status registry_set_verifier(DbHandle db,
                                                             const Principal& caller,
                                                             const Principal& verifier) noexcept;

[[nodiscard]] farmledger::core::Status registry_transfer_ownership(DbHandle db,
                                                                   const Principal& caller,
                                                                   const Principal& new_owner) noexcept;

// Owner-only; pays `amount` of the collected fees out to the caller.
[[nodiscard]] farmledger::core::Status registry_withdraw_fees(DbHandle db,
                                                              const Principal& caller,
                                                              Amount amount) noexcept;

// ========================================================================
// Reads
// ========================================================================
//
// Missing records are reported as std::nullopt / false, never as errors.

[[nodiscard]] farmledger::core::Status registry_get_profile(DbHandle db,
                                                            const Principal& farmer,
                                                            std::optional<farmledger::core::FarmerProfile>* out) noexcept;

[[nodiscard]] farmledger::core::Status registry_get_by_id(DbHandle db,
                                                          FarmerId id,
                                                          std::optional<farmledger::core::FarmerProfile>* out) noexcept;

[[nodiscard]] farmledger::core::Status registry_get_identity_by_id(DbHandle db,
                                                                   FarmerId id,
                                                                   std::optional<Principal>* out) noexcept;

[[nodiscard]] farmledger::core::Status registry_is_verified(DbHandle db,
                                                            const Principal& farmer,
                                                            bool* out) noexcept;

[[nodiscard]] farmledger::core::Status registry_get_roles(DbHandle db, farmledger::access::RegistryRoles* out) noexcept;
[[nodiscard]] farmledger::core::Status registry_get_owner(DbHandle db, Principal* out) noexcept;
[[nodiscard]] farmledger::core::Status registry_get_verifier(DbHandle db, Principal* out) noexcept;
[[nodiscard]] farmledger::core::Status registry_get_fee(DbHandle db, Amount* out) noexcept;
[[nodiscard]] farmledger::core::Status registry_get_balance(DbHandle db, Amount* out) noexcept;
[[nodiscard]] farmledger::core::Status registry_get_farmer_count(DbHandle db, u64* out) noexcept;

} // namespace farmledger::registry
