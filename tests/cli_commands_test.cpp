#include <array>
#include <cstring>
#include <set>
#include <string>

#include <gtest/gtest.h>

#include "farmledger/cli/commands.hpp"

namespace cli = farmledger::cli;

TEST(CliCommands, ParsesKnownCommandAndReturnsRemainingArgs) {
    const std::array<cli::CommandSpec, 3> specs = {{
        {cli::CommandId::Help, "help", "help"},
        {cli::CommandId::Log, "log", "log"},
        {cli::CommandId::Entry, "entry", "entry"},
    }};

    const char* argv[] = {"log", "Cover Crops", "Soil Health", "--evidence", "abc"};
    const cli::CliArgs args{argv, 5};

    cli::CommandInvocation out{};
    cli::u32 consumed = 0;
    const farmledger::core::Status s = cli::parse_command(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, farmledger::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 1u);
    EXPECT_EQ(out.id, cli::CommandId::Log);
    ASSERT_EQ(out.args.argc, 4u);
    EXPECT_STREQ(out.args.argv[0], "Cover Crops");
}

TEST(CliCommands, NotFoundOnUnknownCommand) {
    const std::array<cli::CommandSpec, 1> specs = {{{cli::CommandId::Help, "help", "help"}}};
    const char* argv[] = {"nope"};
    cli::CommandInvocation out{};
    cli::u32 consumed = 0;
    const farmledger::core::Status s = cli::parse_command({argv, 1}, specs.data(), specs.size(), &out, &consumed);
    EXPECT_EQ(s.code, farmledger::core::StatusCode::NotFound);
    EXPECT_EQ(s.domain, farmledger::core::StatusDomain::Cli);
    EXPECT_EQ(out.id, cli::CommandId::None);
    EXPECT_EQ(consumed, 0u);
}

TEST(CliCommands, InvalidOnEmptyOrOptionLikeInput) {
    const std::array<cli::CommandSpec, 1> specs = {{{cli::CommandId::Help, "help", "help"}}};
    cli::CommandInvocation out{};
    cli::u32 consumed = 0;

    EXPECT_EQ(cli::parse_command({nullptr, 0}, specs.data(), specs.size(), &out, &consumed).code,
              farmledger::core::StatusCode::Invalid);

    const char* argv[] = {"--help"};
    EXPECT_EQ(cli::parse_command({argv, 1}, specs.data(), specs.size(), &out, &consumed).code,
              farmledger::core::StatusCode::Invalid);

    const char* ok_argv[] = {"help"};
    EXPECT_EQ(cli::parse_command({ok_argv, 1}, specs.data(), specs.size(), nullptr, &consumed).code,
              farmledger::core::StatusCode::Invalid);
}

TEST(CliCommands, BuiltInTableResolvesEveryCommand) {
    cli::u32 count = 0;
    const cli::CommandSpec* specs = cli::command_specs(&count);
    ASSERT_NE(specs, nullptr);
    ASSERT_GT(count, 0u);

    std::set<std::string> names;
    for (cli::u32 i = 0; i < count; ++i) {
        ASSERT_NE(specs[i].name, nullptr);
        EXPECT_TRUE(names.insert(specs[i].name).second) << "duplicate command " << specs[i].name;

        const char* argv[] = {specs[i].name};
        cli::CommandInvocation out{};
        cli::u32 consumed = 0;
        ASSERT_EQ(cli::parse_command({argv, 1}, specs, count, &out, &consumed).code,
                  farmledger::core::StatusCode::Ok);
        EXPECT_EQ(out.id, specs[i].id);
        EXPECT_EQ(out.args.argc, 0u);
    }
}

TEST(CliCommands, ExitAliases) {
    cli::u32 count = 0;
    const cli::CommandSpec* specs = cli::command_specs(&count);

    for (const char* alias : {"q", "quit", "exit"}) {
        const char* argv[] = {alias};
        cli::CommandInvocation out{};
        cli::u32 consumed = 0;
        ASSERT_EQ(cli::parse_command({argv, 1}, specs, count, &out, &consumed).code,
                  farmledger::core::StatusCode::Ok);
        EXPECT_EQ(out.id, cli::CommandId::Exit);
    }
}

TEST(CliCommands, UsageLinesStartWithTheCommandName) {
    cli::u32 count = 0;
    const cli::CommandSpec* specs = cli::command_specs(&count);

    for (cli::u32 i = 0; i < count; ++i) {
        if (specs[i].usage == nullptr || specs[i].id == cli::CommandId::Exit) {
            continue;
        }
        EXPECT_EQ(std::strncmp(specs[i].usage, specs[i].name, std::strlen(specs[i].name)), 0)
            << specs[i].usage;
    }
}
