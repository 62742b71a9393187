#pragma once

#include <array>
#include <cstddef>

#include "farmledger/core/errors.hpp"
#include "farmledger/core/types.hpp"

namespace farmledger::storage {
    using u8 = farmledger::core::u8;

    // Lowercase hex digest plus terminator; fits the evidence hash limit.
    inline constexpr farmledger::core::u32 kHashHexLen = 64;
    using HashHex = std::array<char, kHashHexLen + 1>;

    [[nodiscard]] constexpr bool hash_is_zero(const farmledger::core::Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] constexpr HashHex hash_to_hex(const farmledger::core::Hash256& h) noexcept {
        constexpr const char* kDigits = "0123456789abcdef";
        HashHex out{};
        for (std::size_t i = 0; i < h.b.size(); ++i) {
            out[i * 2] = kDigits[h.b[i] >> 4];
            out[i * 2 + 1] = kDigits[h.b[i] & 0x0f];
        }
        out[kHashHexLen] = '\0';
        return out;
    }

    // BLAKE3 of a file's contents, streamed.
    [[nodiscard]] farmledger::core::Status hash_file(const char* path, farmledger::core::Hash256* out) noexcept;

} // namespace farmledger::storage
