#pragma once
#include <cstdint>
#include <type_traits>

namespace farmledger::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        PermissionDenied,
        Conflict,
        Busy,
        Corrupt,
        Io,
        Unsupported,
        Unavailable,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Db,
        Ledger,
        Registry,
        ClaimLog,
        Storage,
        Cli,
    };

    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    // Contract error codes. The numeric values are part of the external
    // interface and travel in Status::aux.
    enum class RegistryError : u32 {
        NotAuthorized = 100,
        AlreadyRegistered = 101,
        InvalidInput = 102,
        NotRegistered = 103,
        NotVerified = 104,
        AlreadyVerified = 105,
        InvalidStatus = 106,
    };

    enum class ClaimLogError : u32 {
        NotAuthorized = 200,
        NotVerified = 202,
        InvalidInput = 203,
        LogNotFound = 204,
        AlreadyModerated = 205,
    };

    // Ledger transfer failures, in Status::aux of a Ledger-domain status.
    enum class TransferError : u32 {
        InsufficientBalance = 1,
        SameAccount = 2,
        NonPositiveAmount = 3,
        ReservedAccount = 4,
    };

    [[nodiscard]] constexpr StatusCode status_code_for(RegistryError e) noexcept {
        switch (e) {
            case RegistryError::NotAuthorized: return StatusCode::PermissionDenied;
            case RegistryError::AlreadyRegistered: return StatusCode::Conflict;
            case RegistryError::InvalidInput: return StatusCode::Invalid;
            case RegistryError::NotRegistered: return StatusCode::NotFound;
            case RegistryError::NotVerified: return StatusCode::Conflict;
            case RegistryError::AlreadyVerified: return StatusCode::Conflict;
            case RegistryError::InvalidStatus: return StatusCode::Invalid;
        }
        return StatusCode::Unknown;
    }

    [[nodiscard]] constexpr StatusCode status_code_for(ClaimLogError e) noexcept {
        switch (e) {
            case ClaimLogError::NotAuthorized: return StatusCode::PermissionDenied;
            case ClaimLogError::NotVerified: return StatusCode::PermissionDenied;
            case ClaimLogError::InvalidInput: return StatusCode::Invalid;
            case ClaimLogError::LogNotFound: return StatusCode::NotFound;
            case ClaimLogError::AlreadyModerated: return StatusCode::Conflict;
        }
        return StatusCode::Unknown;
    }

    [[nodiscard]] constexpr StatusCode status_code_for(TransferError e) noexcept {
        switch (e) {
            case TransferError::InsufficientBalance: return StatusCode::Conflict;
            case TransferError::SameAccount: return StatusCode::Invalid;
            case TransferError::NonPositiveAmount: return StatusCode::Invalid;
            case TransferError::ReservedAccount: return StatusCode::PermissionDenied;
        }
        return StatusCode::Unknown;
    }

    [[nodiscard]] constexpr Status make_error(RegistryError e) noexcept {
        return make_status(StatusDomain::Registry, status_code_for(e), static_cast<u32>(e));
    }

    [[nodiscard]] constexpr Status make_error(ClaimLogError e) noexcept {
        return make_status(StatusDomain::ClaimLog, status_code_for(e), static_cast<u32>(e));
    }

    [[nodiscard]] constexpr Status make_error(TransferError e) noexcept {
        return make_status(StatusDomain::Ledger, status_code_for(e), static_cast<u32>(e));
    }

    // Numeric contract code of a failed status (0 for Ok and for
    // infrastructure failures that carry no code).
    [[nodiscard]] constexpr u32 error_code(Status s) noexcept {
        return is_ok(s) ? 0u : s.aux;
    }

    [[nodiscard]] constexpr bool is_error(Status s, RegistryError e) noexcept {
        return s.domain == StatusDomain::Registry && s.aux == static_cast<u32>(e) && !is_ok(s);
    }

    [[nodiscard]] constexpr bool is_error(Status s, ClaimLogError e) noexcept {
        return s.domain == StatusDomain::ClaimLog && s.aux == static_cast<u32>(e) && !is_ok(s);
    }

    [[nodiscard]] constexpr bool is_error(Status s, TransferError e) noexcept {
        return s.domain == StatusDomain::Ledger && s.aux == static_cast<u32>(e) && !is_ok(s);
    }

    const char* status_code_name(StatusCode code) noexcept;
    const char* status_domain_name(StatusDomain domain) noexcept;

    // Symbolic name of the contract code in a Registry/ClaimLog/Ledger status,
    // or nullptr when the status carries none.
    const char* error_code_name(Status s) noexcept;

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace farmledger::core
