#include "farmledger/cli/commands.hpp"

#include <cstring>

namespace farmledger::cli {
    namespace {
        constexpr CommandSpec kCommands[] = {
            {CommandId::Help, "help", "help"},
            {CommandId::Register, "register", "register <name> <location> <farm_size> [info]"},
            {CommandId::RegisterBatch, "register-batch", "register-batch <identity:name:location:size> ..."},
            {CommandId::Verify, "verify", "verify <farmer> <verified|rejected>"},
            {CommandId::UpdateProfile, "update-profile",
             "update-profile [--name N] [--location L] [--size S] [--info I]"},
            {CommandId::Deactivate, "deactivate", "deactivate <farmer>"},
            {CommandId::SetFee, "set-fee", "set-fee <amount>"},
            {CommandId::SetVerifier, "set-verifier", "set-verifier <identity>"},
            {CommandId::TransferOwnership, "transfer-ownership", "transfer-ownership <identity>"},
            {CommandId::Withdraw, "withdraw", "withdraw <amount>"},
            {CommandId::Profile, "profile", "profile <farmer>"},
            {CommandId::Farmer, "farmer", "farmer <id>"},
            {CommandId::Info, "info", "info"},
            {CommandId::Log, "log",
             "log <type> <category> <details> [--evidence HASH | --evidence-file PATH]"},
            {CommandId::Moderate, "moderate", "moderate <farmer> <seq> <approved|rejected> [notes]"},
            {CommandId::UpdateLog, "update-log",
             "update-log <seq> <details> [--evidence HASH | --evidence-file PATH]"},
            {CommandId::SetModerator, "set-moderator", "set-moderator <identity>"},
            {CommandId::ClaimsTransferOwnership, "claims-transfer-ownership", "claims-transfer-ownership <identity>"},
            {CommandId::Entry, "entry", "entry <farmer> <seq>"},
            {CommandId::LogCount, "log-count", "log-count <farmer>"},
            {CommandId::Fund, "fund", "fund <account> <amount>"},
            {CommandId::Balance, "balance", "balance <account>"},
            {CommandId::Clock, "clock", "clock"},
            {CommandId::Advance, "advance", "advance <blocks>"},
            {CommandId::Exit, "q", nullptr},
            {CommandId::Exit, "quit", nullptr},
            {CommandId::Exit, "exit", "q, quit, exit"},
        };
    } // namespace

    const CommandSpec* command_specs(u32* count) noexcept {
        if (count != nullptr) {
            *count = static_cast<u32>(sizeof(kCommands) / sizeof(kCommands[0]));
        }
        return kCommands;
    }

    farmledger::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return farmledger::core::make_status(farmledger::core::StatusDomain::Cli, farmledger::core::StatusCode::Invalid);
        }
        *consumed = 0;
        out->id = CommandId::None;
        out->args = CliArgs{};

        if (args.argc == 0) {
            return farmledger::core::make_status(farmledger::core::StatusDomain::Cli, farmledger::core::StatusCode::Invalid);
        }
        if (args.argv == nullptr || args.argv[0] == nullptr) {
            return farmledger::core::make_status(farmledger::core::StatusDomain::Cli, farmledger::core::StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return farmledger::core::make_status(farmledger::core::StatusDomain::Cli, farmledger::core::StatusCode::Invalid);
        }

        const char* cmd = args.argv[0];
        if (cmd[0] == '-') {
            return farmledger::core::make_status(farmledger::core::StatusDomain::Cli, farmledger::core::StatusCode::Invalid);
        }

        const CommandSpec* match = nullptr;
        for (u32 i = 0; i < spec_count; ++i) {
            const CommandSpec& s = specs[i];
            if (s.name != nullptr && std::strcmp(s.name, cmd) == 0) {
                match = &s;
                break;
            }
        }
        if (match == nullptr) {
            return farmledger::core::make_status(farmledger::core::StatusDomain::Cli, farmledger::core::StatusCode::NotFound);
        }

        out->id = match->id;
        out->args.argv = args.argv + 1;
        out->args.argc = args.argc - 1;
        *consumed = 1;
        return farmledger::core::ok_status();
    }
} // namespace farmledger::cli
