#pragma once

#include <type_traits>

#include "farmledger/core/types.hpp"

namespace farmledger::access {
    using u32 = farmledger::core::u32;
    using Principal = farmledger::core::Principal;

    enum class Role : u32 {
        None = 0,
        Owner = 1u << 0,
        Verifier = 1u << 1,
        Moderator = 1u << 2,
    };

    [[nodiscard]] constexpr u32 role_mask(Role r) noexcept {
        return static_cast<u32>(r);
    }

    [[nodiscard]] constexpr bool has_role(u32 mask, Role r) noexcept {
        return (mask & role_mask(r)) != 0;
    }

    // Role holders of the identity registry.
    struct RegistryRoles {
        Principal owner{};
        Principal verifier{};
    };

    // Role holders of the claim log.
    struct ClaimLogRoles {
        Principal owner{};
        Principal moderator{};
    };

    // An empty caller never matches, even against an empty role slot.
    [[nodiscard]] constexpr bool same_principal(const Principal& caller, const Principal& holder) noexcept {
        return !caller.empty() && caller == holder;
    }

    [[nodiscard]] constexpr u32 resolve_roles(const RegistryRoles& roles, const Principal& caller) noexcept {
        u32 mask = 0;
        if (same_principal(caller, roles.owner)) {
            mask |= role_mask(Role::Owner);
        }
        if (same_principal(caller, roles.verifier)) {
            mask |= role_mask(Role::Verifier);
        }
        return mask;
    }

    [[nodiscard]] constexpr u32 resolve_roles(const ClaimLogRoles& roles, const Principal& caller) noexcept {
        u32 mask = 0;
        if (same_principal(caller, roles.owner)) {
            mask |= role_mask(Role::Owner);
        }
        if (same_principal(caller, roles.moderator)) {
            mask |= role_mask(Role::Moderator);
        }
        return mask;
    }

    [[nodiscard]] constexpr bool is_owner(const RegistryRoles& roles, const Principal& caller) noexcept {
        return has_role(resolve_roles(roles, caller), Role::Owner);
    }

    [[nodiscard]] constexpr bool is_verifier(const RegistryRoles& roles, const Principal& caller) noexcept {
        return has_role(resolve_roles(roles, caller), Role::Verifier);
    }

    [[nodiscard]] constexpr bool is_owner(const ClaimLogRoles& roles, const Principal& caller) noexcept {
        return has_role(resolve_roles(roles, caller), Role::Owner);
    }

    [[nodiscard]] constexpr bool is_moderator(const ClaimLogRoles& roles, const Principal& caller) noexcept {
        return has_role(resolve_roles(roles, caller), Role::Moderator);
    }

    static_assert(std::is_trivially_copyable_v<RegistryRoles>);
    static_assert(std::is_trivially_copyable_v<ClaimLogRoles>);
    static_assert(std::is_standard_layout_v<RegistryRoles>);
    static_assert(std::is_standard_layout_v<ClaimLogRoles>);

} // namespace farmledger::access
