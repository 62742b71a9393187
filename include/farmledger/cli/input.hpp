#pragma once

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

#include "farmledger/cli/options.hpp"
#include "farmledger/core/errors.hpp"
#include "farmledger/core/types.hpp"
#include "farmledger/registry/registry.hpp"
#include "farmledger/storage/hashing.hpp"

namespace farmledger::cli {

    // ========================================================================
    // Interactive input
    // ========================================================================

    inline constexpr std::size_t kMaxLineLen = 4096;

    // Reads one line without its terminator. A line longer than `max_len` is
    // consumed through its newline and reported as Invalid, so none of it is
    // run. End of input before any byte is NotFound; a final line without a
    // newline is returned as is.
    [[nodiscard]] farmledger::core::Status read_line(std::FILE* in, std::string* out,
                                                     std::size_t max_len = kMaxLineLen);

    // Splits on whitespace; double quotes group words and are dropped.
    void tokenize_line(const char* line, std::vector<std::string>* tokens);

    // ========================================================================
    // Command arguments
    // ========================================================================

    // One register-batch entry, written identity:name:location:size. The
    // strings back the pointers of the BatchRegistration built from it.
    struct BatchEntry {
        farmledger::core::Principal farmer{};
        std::string name;
        std::string location;
        i64 farm_size{0};
    };

    // Invalid for fewer than three separators, a bad identity or a
    // non-numeric size. Value checks are left to the registry.
    [[nodiscard]] farmledger::core::Status parse_batch_entry(const char* text, BatchEntry* out);

    [[nodiscard]] farmledger::registry::BatchRegistration batch_registration(const BatchEntry& e) noexcept;

    // Evidence reference from --evidence (passed through) or --evidence-file
    // (hex BLAKE3 digest written to `hex`). Both given is Invalid; neither
    // leaves *out null. Hashing failures keep their Storage status.
    [[nodiscard]] farmledger::core::Status resolve_evidence(const ParsedOptions& opts,
                                                            farmledger::storage::HashHex* hex,
                                                            const char** out) noexcept;

} // namespace farmledger::cli
