#include "farmledger/storage/hashing.hpp"

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdio>

#include <blake3.h>

namespace farmledger::storage {

    namespace {
        [[nodiscard]] constexpr farmledger::core::Status storage_status(farmledger::core::StatusCode code) noexcept {
            return farmledger::core::make_status(farmledger::core::StatusDomain::Storage, code);
        }
    } // namespace

    farmledger::core::Status hash_file(const char* path, farmledger::core::Hash256* out) noexcept {
        if (path == nullptr || path[0] == '\0' || out == nullptr) {
            return storage_status(farmledger::core::StatusCode::Invalid);
        }

        std::FILE* f = std::fopen(path, "rb");
        if (f == nullptr) {
            return storage_status(errno == ENOENT ? farmledger::core::StatusCode::NotFound
                                                  : farmledger::core::StatusCode::Io);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        std::array<u8, 64 * 1024> chunk{};
        for (;;) {
            const std::size_t n = std::fread(chunk.data(), 1, chunk.size(), f);
            if (n > 0) {
                blake3_hasher_update(&hasher, chunk.data(), n);
            }
            if (n < chunk.size()) {
                break;
            }
        }

        const bool failed = std::ferror(f) != 0;
        std::fclose(f);
        if (failed) {
            return storage_status(farmledger::core::StatusCode::Io);
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return farmledger::core::ok_status();
    }

} // namespace farmledger::storage
