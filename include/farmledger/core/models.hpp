#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>

#include "farmledger/core/types.hpp"

namespace farmledger::core {

    enum class VerificationStatus : u8 {
        Pending = 0,
        Verified = 1,
        Rejected = 2,
    };

    enum class ModerationStatus : u8 {
        Pending = 0,
        Approved = 1,
        Rejected = 2,
    };

    // Text field limits, in bytes.
    inline constexpr std::size_t kMaxNameLen = 100;
    inline constexpr std::size_t kMaxLocationLen = 100;
    inline constexpr std::size_t kMaxAdditionalInfoLen = 500;
    inline constexpr std::size_t kMaxPracticeTypeLen = 50;
    inline constexpr std::size_t kMaxCategoryLen = 50;
    inline constexpr std::size_t kMaxDetailsLen = 500;
    inline constexpr std::size_t kMaxEvidenceHashLen = 64;
    inline constexpr std::size_t kMaxModerationNotesLen = 200;

    struct FarmerProfile {
        FarmerId id{FarmerId::invalid()};
        std::string name;
        std::string location;
        i64 farm_size{0};
        Timestamp registration_timestamp{0};
        VerificationStatus verification_status{VerificationStatus::Pending};
        std::optional<Timestamp> verification_timestamp;
        std::string additional_info;
        bool active{true};
    };

    struct PracticeEntry {
        std::string practice_type;
        std::string category;
        Timestamp timestamp{0};
        std::string details;
        std::optional<std::string> evidence_hash;
        ModerationStatus moderation_status{ModerationStatus::Pending};
        std::optional<std::string> moderation_notes;
        std::optional<Timestamp> moderation_timestamp;
    };

    [[nodiscard]] constexpr const char* verification_status_name(VerificationStatus s) noexcept {
        switch (s) {
            case VerificationStatus::Pending: return "pending";
            case VerificationStatus::Verified: return "verified";
            case VerificationStatus::Rejected: return "rejected";
        }
        return "unknown";
    }

    [[nodiscard]] constexpr const char* moderation_status_name(ModerationStatus s) noexcept {
        switch (s) {
            case ModerationStatus::Pending: return "pending";
            case ModerationStatus::Approved: return "approved";
            case ModerationStatus::Rejected: return "rejected";
        }
        return "unknown";
    }

    [[nodiscard]] bool verification_status_from_name(const char* name, VerificationStatus* out) noexcept;
    [[nodiscard]] bool moderation_status_from_name(const char* name, ModerationStatus* out) noexcept;

    // Statuses as persisted; anything outside the enum is a corrupt row.
    [[nodiscard]] constexpr bool verification_status_valid(u32 raw) noexcept {
        return raw <= static_cast<u32>(VerificationStatus::Rejected);
    }

    [[nodiscard]] constexpr bool moderation_status_valid(u32 raw) noexcept {
        return raw <= static_cast<u32>(ModerationStatus::Rejected);
    }

    static_assert(std::is_trivially_copyable_v<VerificationStatus>);
    static_assert(std::is_trivially_copyable_v<ModerationStatus>);

} // namespace farmledger::core
