#include "farmledger/core/errors.hpp"

namespace farmledger::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::PermissionDenied: return "PermissionDenied";
            case StatusCode::Conflict: return "Conflict";
            case StatusCode::Busy: return "Busy";
            case StatusCode::Corrupt: return "Corrupt";
            case StatusCode::Io: return "Io";
            case StatusCode::Unsupported: return "Unsupported";
            case StatusCode::Unavailable: return "Unavailable";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Db: return "Db";
            case StatusDomain::Ledger: return "Ledger";
            case StatusDomain::Registry: return "Registry";
            case StatusDomain::ClaimLog: return "ClaimLog";
            case StatusDomain::Storage: return "Storage";
            case StatusDomain::Cli: return "Cli";
        }
        return "Unknown";
    }

    const char* error_code_name(Status s) noexcept {
        if (is_ok(s)) {
            return nullptr;
        }
        if (s.domain == StatusDomain::Registry) {
            switch (static_cast<RegistryError>(s.aux)) {
                case RegistryError::NotAuthorized: return "NotAuthorized";
                case RegistryError::AlreadyRegistered: return "AlreadyRegistered";
                case RegistryError::InvalidInput: return "InvalidInput";
                case RegistryError::NotRegistered: return "NotRegistered";
                case RegistryError::NotVerified: return "NotVerified";
                case RegistryError::AlreadyVerified: return "AlreadyVerified";
                case RegistryError::InvalidStatus: return "InvalidStatus";
            }
            return nullptr;
        }
        if (s.domain == StatusDomain::ClaimLog) {
            switch (static_cast<ClaimLogError>(s.aux)) {
                case ClaimLogError::NotAuthorized: return "NotAuthorized";
                case ClaimLogError::NotVerified: return "NotVerified";
                case ClaimLogError::InvalidInput: return "InvalidInput";
                case ClaimLogError::LogNotFound: return "LogNotFound";
                case ClaimLogError::AlreadyModerated: return "AlreadyModerated";
            }
            return nullptr;
        }
        if (s.domain == StatusDomain::Ledger) {
            switch (static_cast<TransferError>(s.aux)) {
                case TransferError::InsufficientBalance: return "InsufficientBalance";
                case TransferError::SameAccount: return "SameAccount";
                case TransferError::NonPositiveAmount: return "NonPositiveAmount";
                case TransferError::ReservedAccount: return "ReservedAccount";
            }
            return nullptr;
        }
        return nullptr;
    }
} // namespace farmledger::core
