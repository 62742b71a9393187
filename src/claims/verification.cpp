#include "farmledger/claims/verification.hpp"
#include "farmledger/registry/registry.hpp"

namespace farmledger::claims {

farmledger::core::Status RegistryVerificationSource::is_verified(const farmledger::core::Principal& identity,
                                                                 bool* out) const noexcept {
    return farmledger::registry::registry_is_verified(db_, identity, out);
}

} // namespace farmledger::claims
