#include <unistd.h>

#include <array>
#include <cstdio>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "farmledger/cli/input.hpp"

namespace cli = farmledger::cli;
using farmledger::core::StatusCode;
using farmledger::core::StatusDomain;

namespace {

const std::array<cli::OptionSpec, 2> kEvidenceSpecs = {{
    {cli::OptionId::Evidence, cli::OptionType::String, "evidence", 'e'},
    {cli::OptionId::EvidenceFile, cli::OptionType::String, "evidence-file", 'f'},
}};

// Feeds `text` through a temporary stream.
class InputStream {
public:
    explicit InputStream(const std::string& text) : f_(std::tmpfile()) {
        if (f_ != nullptr) {
            std::fputs(text.c_str(), f_);
            std::rewind(f_);
        }
    }
    ~InputStream() {
        if (f_ != nullptr) {
            std::fclose(f_);
        }
    }
    InputStream(const InputStream&) = delete;
    InputStream& operator=(const InputStream&) = delete;

    std::FILE* get() const { return f_; }

private:
    std::FILE* f_;
};

} // namespace

// ============================================================================
// read_line
// ============================================================================

TEST(CliReadLine, OverlongLineIsDiscardedWhole) {
    const std::string longline(cli::kMaxLineLen + 100, 'x');
    InputStream in("help\n" + longline + " clock\n" + "info\n");
    ASSERT_NE(in.get(), nullptr);

    std::string line;
    ASSERT_EQ(cli::read_line(in.get(), &line).code, StatusCode::Ok);
    EXPECT_EQ(line, "help");

    const farmledger::core::Status s = cli::read_line(in.get(), &line);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.domain, StatusDomain::Cli);
    EXPECT_TRUE(line.empty());

    // The tail of the long line never surfaces as its own command.
    ASSERT_EQ(cli::read_line(in.get(), &line).code, StatusCode::Ok);
    EXPECT_EQ(line, "info");

    EXPECT_EQ(cli::read_line(in.get(), &line).code, StatusCode::NotFound);
}

TEST(CliReadLine, LimitIsInclusive) {
    InputStream in("12345678\n123456789\nok\n");
    ASSERT_NE(in.get(), nullptr);

    std::string line;
    ASSERT_EQ(cli::read_line(in.get(), &line, 8).code, StatusCode::Ok);
    EXPECT_EQ(line, "12345678");
    EXPECT_EQ(cli::read_line(in.get(), &line, 8).code, StatusCode::Invalid);
    ASSERT_EQ(cli::read_line(in.get(), &line, 8).code, StatusCode::Ok);
    EXPECT_EQ(line, "ok");
}

TEST(CliReadLine, LastLineWithoutNewline) {
    InputStream in("\nclock");
    ASSERT_NE(in.get(), nullptr);

    std::string line = "stale";
    ASSERT_EQ(cli::read_line(in.get(), &line).code, StatusCode::Ok);
    EXPECT_TRUE(line.empty());
    ASSERT_EQ(cli::read_line(in.get(), &line).code, StatusCode::Ok);
    EXPECT_EQ(line, "clock");
    EXPECT_EQ(cli::read_line(in.get(), &line).code, StatusCode::NotFound);
}

TEST(CliReadLine, NullArgumentsAreInvalid) {
    std::string line;
    EXPECT_EQ(cli::read_line(nullptr, &line).code, StatusCode::Invalid);
    InputStream in("x\n");
    EXPECT_EQ(cli::read_line(in.get(), nullptr).code, StatusCode::Invalid);
}

// ============================================================================
// tokenize_line
// ============================================================================

TEST(CliTokenize, QuotesGroupWords) {
    std::vector<std::string> tokens;
    cli::tokenize_line("log \"Cover Crops\" Soil\t\"\" x\r\n", &tokens);
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[0], "log");
    EXPECT_EQ(tokens[1], "Cover Crops");
    EXPECT_EQ(tokens[2], "Soil");
    EXPECT_EQ(tokens[3], "");
    EXPECT_EQ(tokens[4], "x");

    cli::tokenize_line("   ", &tokens);
    EXPECT_TRUE(tokens.empty());
    cli::tokenize_line(nullptr, &tokens);
    EXPECT_TRUE(tokens.empty());
}

// ============================================================================
// register-batch entries
// ============================================================================

TEST(CliBatchEntry, ParsesAllFields) {
    cli::BatchEntry e;
    ASSERT_EQ(cli::parse_batch_entry("farmer1:John Doe:Rural Area:100", &e).code, StatusCode::Ok);
    EXPECT_EQ(e.farmer, farmledger::core::principal("farmer1"));
    EXPECT_EQ(e.name, "John Doe");
    EXPECT_EQ(e.location, "Rural Area");
    EXPECT_EQ(e.farm_size, 100);

    const farmledger::registry::BatchRegistration r = cli::batch_registration(e);
    EXPECT_EQ(r.farmer, e.farmer);
    EXPECT_EQ(r.params.name, e.name.c_str());
    EXPECT_EQ(r.params.location, e.location.c_str());
    EXPECT_EQ(r.params.farm_size, 100);
    EXPECT_STREQ(r.params.additional_info, "");
}

TEST(CliBatchEntry, EmptyTextFieldsAreLeftToTheRegistry) {
    cli::BatchEntry e;
    ASSERT_EQ(cli::parse_batch_entry("a1:::-5", &e).code, StatusCode::Ok);
    EXPECT_TRUE(e.name.empty());
    EXPECT_TRUE(e.location.empty());
    EXPECT_EQ(e.farm_size, -5);
}

TEST(CliBatchEntry, MalformedEntries) {
    cli::BatchEntry e;
    for (const char* bad : {"", "farmer1", "a:b:c", ":name:loc:1", "a:name:loc:", "a:name:loc:12x", "a:n:l:5:extra"}) {
        const farmledger::core::Status s = cli::parse_batch_entry(bad, &e);
        EXPECT_EQ(s.code, StatusCode::Invalid) << bad;
        EXPECT_EQ(s.domain, StatusDomain::Cli) << bad;
    }
    EXPECT_EQ(cli::parse_batch_entry(nullptr, &e).code, StatusCode::Invalid);
    EXPECT_EQ(cli::parse_batch_entry("a:n:l:1", nullptr).code, StatusCode::Invalid);
}

// ============================================================================
// Evidence options
// ============================================================================

class CliEvidenceTest : public ::testing::Test {
protected:
    farmledger::core::Status resolve(std::vector<const char*> argv, const char** out) {
        options_ = {opt_buf_.data(), 0, static_cast<cli::u32>(opt_buf_.size())};
        positionals_ = {pos_buf_.data(), 0, static_cast<cli::u32>(pos_buf_.size())};
        const cli::CliArgs args{argv.data(), static_cast<cli::u32>(argv.size())};
        EXPECT_EQ(cli::parse_arguments(args, kEvidenceSpecs.data(), kEvidenceSpecs.size(), &options_,
                                       &positionals_).code,
                  StatusCode::Ok);
        return cli::resolve_evidence(options_, &hex_, out);
    }

    std::array<cli::ParsedOption, 4> opt_buf_{};
    std::array<const char*, 4> pos_buf_{};
    cli::ParsedOptions options_{};
    cli::Positionals positionals_{};
    farmledger::storage::HashHex hex_{};
};

TEST_F(CliEvidenceTest, AbsentLeavesNull) {
    const char* out = "stale";
    ASSERT_EQ(resolve({"details"}, &out).code, StatusCode::Ok);
    EXPECT_EQ(out, nullptr);
}

TEST_F(CliEvidenceTest, LiteralPassesThrough) {
    const char* out = nullptr;
    ASSERT_EQ(resolve({"--evidence", "QmPhoto", "details"}, &out).code, StatusCode::Ok);
    EXPECT_STREQ(out, "QmPhoto");
}

TEST_F(CliEvidenceTest, FileIsHashed) {
    const std::string path = "/tmp/farmledger_evidence_test_" + std::to_string(::getpid());
    std::FILE* f = std::fopen(path.c_str(), "wb");
    ASSERT_NE(f, nullptr);
    ASSERT_EQ(std::fclose(f), 0);

    const char* out = nullptr;
    ASSERT_EQ(resolve({"--evidence-file", path.c_str()}, &out).code, StatusCode::Ok);
    EXPECT_EQ(out, hex_.data());
    EXPECT_STREQ(out, "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");

    std::remove(path.c_str());
}

TEST_F(CliEvidenceTest, BothOptionsAreInvalid) {
    const char* out = nullptr;
    const farmledger::core::Status s = resolve({"-e", "abc", "-f", "/tmp/whatever"}, &out);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.domain, StatusDomain::Cli);
    EXPECT_EQ(out, nullptr);
}

TEST_F(CliEvidenceTest, MissingFileKeepsStorageStatus) {
    const char* out = nullptr;
    const farmledger::core::Status s = resolve({"--evidence-file", "/nonexistent/farmledger/photo.jpg"}, &out);
    EXPECT_EQ(s.code, StatusCode::NotFound);
    EXPECT_EQ(s.domain, StatusDomain::Storage);
    EXPECT_EQ(out, nullptr);
}
