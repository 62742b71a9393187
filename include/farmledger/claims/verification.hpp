#pragma once

#include "farmledger/core/errors.hpp"
#include "farmledger/core/types.hpp"
#include "farmledger/db/db.hpp"

namespace farmledger::claims {

// Answers whether an identity may append to the claim log. Implementations
// are called with the store lock held and must not block on it from another
// thread.
class VerificationSource {
public:
    virtual ~VerificationSource() = default;

    [[nodiscard]] virtual farmledger::core::Status is_verified(const farmledger::core::Principal& identity,
                                                               bool* out) const noexcept = 0;
};

// Backed by the identity registry in the same store.
class RegistryVerificationSource final : public VerificationSource {
public:
    explicit RegistryVerificationSource(farmledger::db::DbHandle db) noexcept : db_(db) {}

    [[nodiscard]] farmledger::core::Status is_verified(const farmledger::core::Principal& identity,
                                                       bool* out) const noexcept override;

private:
    farmledger::db::DbHandle db_;
};

} // namespace farmledger::claims
