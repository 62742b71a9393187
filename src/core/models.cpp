#include "farmledger/core/models.hpp"

#include <cstring>

namespace farmledger::core {
    bool verification_status_from_name(const char* name, VerificationStatus* out) noexcept {
        if (name == nullptr || out == nullptr) {
            return false;
        }
        if (std::strcmp(name, "pending") == 0) {
            *out = VerificationStatus::Pending;
            return true;
        }
        if (std::strcmp(name, "verified") == 0) {
            *out = VerificationStatus::Verified;
            return true;
        }
        if (std::strcmp(name, "rejected") == 0) {
            *out = VerificationStatus::Rejected;
            return true;
        }
        return false;
    }

    bool moderation_status_from_name(const char* name, ModerationStatus* out) noexcept {
        if (name == nullptr || out == nullptr) {
            return false;
        }
        if (std::strcmp(name, "pending") == 0) {
            *out = ModerationStatus::Pending;
            return true;
        }
        if (std::strcmp(name, "approved") == 0) {
            *out = ModerationStatus::Approved;
            return true;
        }
        if (std::strcmp(name, "rejected") == 0) {
            *out = ModerationStatus::Rejected;
            return true;
        }
        return false;
    }
} // namespace farmledger::core
