#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string_view>
#include <type_traits>
#include <compare>

namespace farmledger::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Logical clock value (block height of the hosting environment).
    using Timestamp = u64;

    // Ledger amounts, in the smallest unit.
    using Amount = u64;

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(Hash256, Hash256) noexcept = default;
        friend constexpr auto operator<=>(Hash256, Hash256) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);


    template <typename Tag, typename Repr>
    struct Id {
        Repr v{};

        static constexpr Id invalid() noexcept { return Id{Repr(~Repr{0})}; }
        [[nodiscard]] constexpr bool is_valid() const noexcept { return v != invalid().v; }

        friend constexpr bool operator==(Id, Id) noexcept = default;
        friend constexpr auto operator<=>(Id, Id) noexcept = default;
    };

    // Farmer ids are issued sequentially from 1; 0 is never issued.
    struct FarmerIdTag {};
    using FarmerId = Id<FarmerIdTag, u64>;

    inline constexpr FarmerId kFirstFarmerId{1};

    // Per-farmer practice log sequence number, dense from 0.
    using LogSeq = u64;

    inline constexpr std::size_t kPrincipalMax = 160;

    // Caller identity. Fixed capacity so role records stay trivially copyable.
    struct Principal {
        std::array<char, kPrincipalMax> b{};
        u8 len{0};

        [[nodiscard]] constexpr bool empty() const noexcept { return len == 0; }
        [[nodiscard]] constexpr std::string_view view() const noexcept {
            return std::string_view{b.data(), len};
        }

        friend constexpr bool operator==(const Principal&, const Principal&) noexcept = default;
    };

    // Accepts 1..kPrincipalMax printable, non-space characters.
    [[nodiscard]] constexpr bool principal_from(std::string_view s, Principal* out) noexcept {
        if (out == nullptr || s.empty() || s.size() > kPrincipalMax) {
            return false;
        }
        for (char c : s) {
            const auto uc = static_cast<unsigned char>(c);
            if (uc <= 0x20 || uc == 0x7f) {
                return false;
            }
        }
        Principal p{};
        for (std::size_t i = 0; i < s.size(); ++i) {
            p.b[i] = s[i];
        }
        p.len = static_cast<u8>(s.size());
        *out = p;
        return true;
    }

    // Convenience for literals; yields an empty principal when s is rejected.
    [[nodiscard]] constexpr Principal principal(std::string_view s) noexcept {
        Principal p{};
        (void)principal_from(s, &p);
        return p;
    }

    static_assert(std::is_trivially_copyable_v<FarmerId>);
    static_assert(std::is_trivially_copyable_v<Principal>);
    static_assert(std::is_standard_layout_v<Principal>);

} // namespace farmledger::core
