#pragma once

#include <type_traits>

#include "farmledger/core/errors.hpp"
#include "farmledger/core/types.hpp"

namespace farmledger::cli {
    using u8 = farmledger::core::u8;
    using u32 = farmledger::core::u32;
    using u64 = farmledger::core::u64;
    using i64 = farmledger::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
    };

    enum class OptionId : u32 {
        None = 0,
        Db = 1,
        As = 2,
        Evidence = 3,
        EvidenceFile = 4,
        Name = 5,
        Location = 6,
        Size = 7,
        Info = 8,
        Help = 9,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        i64 i64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Positional arguments collected by parse_arguments; they point into argv.
    struct Positionals {
        const char** data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Parses leading options and stops at the first positional argument or
    // after "--". `consumed` is the number of argv entries used.
    farmledger::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // Options and positionals in any order. Everything after "--" is
    // positional, as is a token like "-5".
    farmledger::core::Status parse_arguments(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* options,
        Positionals* positionals) noexcept;

    // Last occurrence of `id`, or nullptr.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& options, OptionId id) noexcept;

    // Strict decimal parsers: no sign on unsigned values, no trailing text.
    [[nodiscard]] bool parse_u64(const char* s, u64* out) noexcept;
    [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_trivially_copyable_v<Positionals>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace farmledger::cli
