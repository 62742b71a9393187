#pragma once

#include <type_traits>

#include "farmledger/cli/options.hpp"
#include "farmledger/core/errors.hpp"

namespace farmledger::cli {
    using u32 = farmledger::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Exit = 2,

        // Identity registry
        Register = 10,
        RegisterBatch = 11,
        Verify = 12,
        UpdateProfile = 13,
        Deactivate = 14,
        SetFee = 15,
        SetVerifier = 16,
        TransferOwnership = 17,
        Withdraw = 18,
        Profile = 19,
        Farmer = 20,
        Info = 21,

        // Claim log
        Log = 30,
        Moderate = 31,
        UpdateLog = 32,
        SetModerator = 33,
        ClaimsTransferOwnership = 34,
        Entry = 35,
        LogCount = 36,

        // Ledger
        Fund = 40,
        Balance = 41,
        Clock = 42,
        Advance = 43,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        const char* usage{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // Built-in command table, including the q/quit/exit aliases.
    [[nodiscard]] const CommandSpec* command_specs(u32* count) noexcept;

    farmledger::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace farmledger::cli
