#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <csignal>
#include <array>
#include <optional>
#include <string>
#include <vector>
#include <filesystem>
#include <system_error>

#include "farmledger/cli/commands.hpp"
#include "farmledger/cli/input.hpp"
#include "farmledger/cli/options.hpp"
#include "farmledger/claims/claim_log.hpp"
#include "farmledger/core/errors.hpp"
#include "farmledger/core/models.hpp"
#include "farmledger/db/db.hpp"
#include "farmledger/ledger/ledger.hpp"
#include "farmledger/registry/registry.hpp"
#include "farmledger/storage/hashing.hpp"

using farmledger::core::Principal;
using farmledger::core::Status;
using farmledger::core::is_ok;
using farmledger::core::u32;
using farmledger::core::u64;
using farmledger::core::i64;

// ========================================================================
// Global State
// ========================================================================

volatile sig_atomic_t g_running = 1;

// ========================================================================
// Configuration
// ========================================================================

struct CliConfig {
    std::string db_path;
    Principal caller{};
    farmledger::db::DbHandle db{};
};

constexpr farmledger::cli::OptionSpec kGlobalOptions[] = {
    {farmledger::cli::OptionId::Db, farmledger::cli::OptionType::String, "db", 'd'},
    {farmledger::cli::OptionId::As, farmledger::cli::OptionType::String, "as", 'a'},
    {farmledger::cli::OptionId::Help, farmledger::cli::OptionType::Flag, "help", 'h'},
};
constexpr u32 kGlobalOptionCount = sizeof(kGlobalOptions) / sizeof(kGlobalOptions[0]);

constexpr farmledger::cli::OptionSpec kCommandOptions[] = {
    {farmledger::cli::OptionId::Evidence, farmledger::cli::OptionType::String, "evidence", 'e'},
    {farmledger::cli::OptionId::EvidenceFile, farmledger::cli::OptionType::String, "evidence-file", 'f'},
    {farmledger::cli::OptionId::Name, farmledger::cli::OptionType::String, "name", '\0'},
    {farmledger::cli::OptionId::Location, farmledger::cli::OptionType::String, "location", '\0'},
    {farmledger::cli::OptionId::Size, farmledger::cli::OptionType::I64, "size", '\0'},
    {farmledger::cli::OptionId::Info, farmledger::cli::OptionType::String, "info", '\0'},
};
constexpr u32 kCommandOptionCount = sizeof(kCommandOptions) / sizeof(kCommandOptions[0]);

// ========================================================================
// Signal Handler
// ========================================================================

void sigint_handler(int sig) {
    (void)sig;
    g_running = 0;
}

// ========================================================================
// Error Handling
// ========================================================================

void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

void print_status_error_detailed(const char* context, Status s) {
    fprintf(stderr,
            "error: %s failed (code=%s/%u, domain=%s/%u, aux=%u)\n",
            context,
            farmledger::core::status_code_name(s.code),
            static_cast<unsigned>(s.code),
            farmledger::core::status_domain_name(s.domain),
            static_cast<unsigned>(s.domain),
            s.aux);
    if (const char* name = farmledger::core::error_code_name(s)) {
        fprintf(stderr, "error: %s: %s\n", context, name);
    }
}

// ========================================================================
// Argument Helpers
// ========================================================================

struct HandlerArgs {
    std::array<farmledger::cli::ParsedOption, 16> opt_buf{};
    std::array<const char*, 256> pos_buf{};
    farmledger::cli::ParsedOptions opts{};
    farmledger::cli::Positionals pos{};

    bool collect(const farmledger::cli::CliArgs& args, const char* context) {
        opts = {opt_buf.data(), 0, static_cast<u32>(opt_buf.size())};
        pos = {pos_buf.data(), 0, static_cast<u32>(pos_buf.size())};
        const Status s = farmledger::cli::parse_arguments(args, kCommandOptions, kCommandOptionCount, &opts, &pos);
        if (!is_ok(s)) {
            fprintf(stderr, "error: %s: invalid arguments\n", context);
            return false;
        }
        return true;
    }

    [[nodiscard]] const char* str(farmledger::cli::OptionId id) const {
        const farmledger::cli::ParsedOption* o = farmledger::cli::find_option(opts, id);
        return o ? o->value.str : nullptr;
    }
};

bool expect_args(const char* context, const farmledger::cli::Positionals& pos, u32 min, u32 max) {
    if (pos.len < min || pos.len > max) {
        fprintf(stderr, "error: %s: expected ", context);
        if (min == max) {
            fprintf(stderr, "%u argument(s), got %u\n", min, pos.len);
        } else {
            fprintf(stderr, "%u..%u arguments, got %u\n", min, max, pos.len);
        }
        return false;
    }
    return true;
}

bool parse_principal_arg(const char* context, const char* s, Principal* out) {
    if (!farmledger::core::principal_from(s ? s : "", out)) {
        fprintf(stderr, "error: %s: invalid identity '%s'\n", context, s ? s : "");
        return false;
    }
    return true;
}

bool parse_u64_arg(const char* context, const char* s, u64* out) {
    if (!farmledger::cli::parse_u64(s, out)) {
        fprintf(stderr, "error: %s: invalid number '%s'\n", context, s ? s : "");
        return false;
    }
    return true;
}

bool parse_i64_arg(const char* context, const char* s, i64* out) {
    if (!farmledger::cli::parse_i64(s, out)) {
        fprintf(stderr, "error: %s: invalid number '%s'\n", context, s ? s : "");
        return false;
    }
    return true;
}

bool evidence_arg(const char* context, const HandlerArgs& a, farmledger::storage::HashHex* hex,
                  const char** out) {
    const Status s = farmledger::cli::resolve_evidence(a.opts, hex, out);
    if (s.domain == farmledger::core::StatusDomain::Cli && s.code == farmledger::core::StatusCode::Invalid) {
        fprintf(stderr, "error: %s: --evidence and --evidence-file are exclusive\n", context);
        return false;
    }
    if (!is_ok(s)) {
        print_status_error_detailed("evidence file hashing", s);
        return false;
    }
    return true;
}

// ========================================================================
// Output
// ========================================================================

void print_optional_u64(const char* key, const std::optional<u64>& v) {
    if (v) {
        printf("%s=%llu\n", key, static_cast<unsigned long long>(*v));
    } else {
        printf("%s=-\n", key);
    }
}

void print_profile(const Principal& identity, const farmledger::core::FarmerProfile& p) {
    const std::string id_str(identity.view());
    printf("id=%llu\n", static_cast<unsigned long long>(p.id.v));
    printf("identity=%s\n", id_str.c_str());
    printf("name=%s\n", p.name.c_str());
    printf("location=%s\n", p.location.c_str());
    printf("farm_size=%lld\n", static_cast<long long>(p.farm_size));
    printf("registration_timestamp=%llu\n", static_cast<unsigned long long>(p.registration_timestamp));
    printf("verification_status=%s\n", farmledger::core::verification_status_name(p.verification_status));
    print_optional_u64("verification_timestamp", p.verification_timestamp);
    printf("additional_info=%s\n", p.additional_info.c_str());
    printf("active=%s\n", p.active ? "true" : "false");
}

void print_entry(const farmledger::core::PracticeEntry& e) {
    printf("practice_type=%s\n", e.practice_type.c_str());
    printf("category=%s\n", e.category.c_str());
    printf("timestamp=%llu\n", static_cast<unsigned long long>(e.timestamp));
    printf("details=%s\n", e.details.c_str());
    printf("evidence_hash=%s\n", e.evidence_hash ? e.evidence_hash->c_str() : "-");
    printf("moderation_status=%s\n", farmledger::core::moderation_status_name(e.moderation_status));
    printf("moderation_notes=%s\n", e.moderation_notes ? e.moderation_notes->c_str() : "-");
    print_optional_u64("moderation_timestamp", e.moderation_timestamp);
}

void print_principal(const char* key, const Principal& p) {
    const std::string s(p.view());
    printf("%s=%s\n", key, s.c_str());
}

// ========================================================================
// Command Handlers: identity registry
// ========================================================================

void handle_help() {
    u32 count = 0;
    const farmledger::cli::CommandSpec* specs = farmledger::cli::command_specs(&count);
    printf("Usage: farmledger [--db PATH] [--as IDENTITY] <command> [args]\n");
    printf("Commands:\n");
    for (u32 i = 0; i < count; ++i) {
        if (specs[i].usage != nullptr) {
            printf("  %s\n", specs[i].usage);
        }
    }
    printf("  as [identity]     Show or switch the caller (interactive only)\n");
    printf("\n");
    printf("Environment: FARMLEDGER_DB, FARMLEDGER_CALLER, FARMLEDGER_DB_JOURNAL_MODE\n");
}

bool handle_register(const CliConfig& cfg, const farmledger::cli::CliArgs& args) {
    HandlerArgs a;
    if (!a.collect(args, "register") || !expect_args("register", a.pos, 3, 4)) {
        return false;
    }

    farmledger::registry::RegistrationParams params{};
    params.name = a.pos.data[0];
    params.location = a.pos.data[1];
    if (!parse_i64_arg("register", a.pos.data[2], &params.farm_size)) {
        return false;
    }
    params.additional_info = a.pos.len > 3 ? a.pos.data[3] : "";

    farmledger::core::FarmerId id{};
    const Status s = farmledger::registry::registry_register(cfg.db, cfg.caller, params, &id);
    if (!is_ok(s)) {
        print_status_error_detailed("register", s);
        return false;
    }
    printf("id=%llu\n", static_cast<unsigned long long>(id.v));
    return true;
}

// Entries are identity:name:location:size.
bool handle_register_batch(const CliConfig& cfg, const farmledger::cli::CliArgs& args) {
    HandlerArgs a;
    if (!a.collect(args, "register-batch") ||
        !expect_args("register-batch", a.pos, 1, farmledger::registry::kMaxBatchSize)) {
        return false;
    }

    std::vector<farmledger::cli::BatchEntry> parsed(a.pos.len);
    std::vector<farmledger::registry::BatchRegistration> entries;
    entries.reserve(a.pos.len);
    for (u32 i = 0; i < a.pos.len; ++i) {
        if (!is_ok(farmledger::cli::parse_batch_entry(a.pos.data[i], &parsed[i]))) {
            fprintf(stderr, "error: register-batch: malformed entry '%s'\n", a.pos.data[i]);
            return false;
        }
        entries.push_back(farmledger::cli::batch_registration(parsed[i]));
    }

    farmledger::core::FarmerId first{};
    const Status s = farmledger::registry::registry_register_batch_verified(
        cfg.db, cfg.caller, entries.data(), static_cast<u32>(entries.size()), &first);
    if (!is_ok(s)) {
        print_status_error_detailed("register-batch", s);
        return false;
    }
    printf("first_id=%llu\n", static_cast<unsigned long long>(first.v));
    printf("count=%zu\n", entries.size());
    return true;
}

bool handle_verify(const CliConfig& cfg, const farmledger::cli::CliArgs& args) {
    HandlerArgs a;
    if (!a.collect(args, "verify") || !expect_args("verify", a.pos, 2, 2)) {
        return false;
    }

    Principal farmer{};
    if (!parse_principal_arg("verify", a.pos.data[0], &farmer)) {
        return false;
    }
    farmledger::core::VerificationStatus status{};
    if (!farmledger::core::verification_status_from_name(a.pos.data[1], &status)) {
        fprintf(stderr, "error: verify: unknown status '%s'\n", a.pos.data[1]);
        return false;
    }

    const Status s = farmledger::registry::registry_verify(cfg.db, cfg.caller, farmer, status);
    if (!is_ok(s)) {
        print_status_error_detailed("verify", s);
        return false;
    }
    printf("ok\n");
    return true;
}

bool handle_update_profile(const CliConfig& cfg, const farmledger::cli::CliArgs& args) {
    HandlerArgs a;
    if (!a.collect(args, "update-profile") || !expect_args("update-profile", a.pos, 0, 0)) {
        return false;
    }

    farmledger::registry::ProfilePatch patch{};
    patch.name = a.str(farmledger::cli::OptionId::Name);
    patch.location = a.str(farmledger::cli::OptionId::Location);
    patch.additional_info = a.str(farmledger::cli::OptionId::Info);
    if (const farmledger::cli::ParsedOption* size = farmledger::cli::find_option(a.opts, farmledger::cli::OptionId::Size)) {
        patch.farm_size = size->value.i64v;
    }

    const Status s = farmledger::registry::registry_update_profile(cfg.db, cfg.caller, patch);
    if (!is_ok(s)) {
        print_status_error_detailed("update-profile", s);
        return false;
    }
    printf("ok\n");
    return true;
}

bool handle_deactivate(const CliConfig& cfg, const farmledger::cli::CliArgs& args) {
    HandlerArgs a;
    Principal farmer{};
    if (!a.collect(args, "deactivate") || !expect_args("deactivate", a.pos, 1, 1) ||
        !parse_principal_arg("deactivate", a.pos.data[0], &farmer)) {
        return false;
    }

    const Status s = farmledger::registry::registry_deactivate(cfg.db, cfg.caller, farmer);
    if (!is_ok(s)) {
        print_status_error_detailed("deactivate", s);
        return false;
    }
    printf("ok\n");
    return true;
}

bool handle_set_fee(const CliConfig& cfg, const farmledger::cli::CliArgs& args) {
    HandlerArgs a;
    u64 fee = 0;
    if (!a.collect(args, "set-fee") || !expect_args("set-fee", a.pos, 1, 1) ||
        !parse_u64_arg("set-fee", a.pos.data[0], &fee)) {
        return false;
    }

    const Status s = farmledger::registry::registry_set_registration_fee(cfg.db, cfg.caller, fee);
    if (!is_ok(s)) {
        print_status_error_detailed("set-fee", s);
        return false;
    }
    printf("ok\n");
    return true;
}

// set-verifier, transfer-ownership, set-moderator, claims-transfer-ownership
template <typename Setter>
bool handle_role_setter(const CliConfig& cfg, const farmledger::cli::CliArgs& args, const char* context,
                        Setter setter) {
    HandlerArgs a;
    Principal target{};
    if (!a.collect(args, context) || !expect_args(context, a.pos, 1, 1) ||
        !parse_principal_arg(context, a.pos.data[0], &target)) {
        return false;
    }

    const Status s = setter(cfg.db, cfg.caller, target);
    if (!is_ok(s)) {
        print_status_error_detailed(context, s);
        return false;
    }
    printf("ok\n");
    return true;
}

bool handle_withdraw(const CliConfig& cfg, const farmledger::cli::CliArgs& args) {
    HandlerArgs a;
    u64 amount = 0;
    if (!a.collect(args, "withdraw") || !expect_args("withdraw", a.pos, 1, 1) ||
        !parse_u64_arg("withdraw", a.pos.data[0], &amount)) {
        return false;
    }

    const Status s = farmledger::registry::registry_withdraw_fees(cfg.db, cfg.caller, amount);
    if (!is_ok(s)) {
        print_status_error_detailed("withdraw", s);
        return false;
    }
    printf("ok\n");
    return true;
}

bool handle_profile(const CliConfig& cfg, const farmledger::cli::CliArgs& args) {
    HandlerArgs a;
    Principal farmer{};
    if (!a.collect(args, "profile") || !expect_args("profile", a.pos, 1, 1) ||
        !parse_principal_arg("profile", a.pos.data[0], &farmer)) {
        return false;
    }

    std::optional<farmledger::core::FarmerProfile> profile;
    const Status s = farmledger::registry::registry_get_profile(cfg.db, farmer, &profile);
    if (!is_ok(s)) {
        print_status_error_detailed("profile", s);
        return false;
    }
    if (!profile) {
        printf("not registered\n");
        return true;
    }
    print_profile(farmer, *profile);
    return true;
}

bool handle_farmer(const CliConfig& cfg, const farmledger::cli::CliArgs& args) {
    HandlerArgs a;
    u64 raw_id = 0;
    if (!a.collect(args, "farmer") || !expect_args("farmer", a.pos, 1, 1) ||
        !parse_u64_arg("farmer", a.pos.data[0], &raw_id)) {
        return false;
    }

    std::optional<Principal> identity;
    Status s = farmledger::registry::registry_get_identity_by_id(cfg.db, farmledger::core::FarmerId{raw_id}, &identity);
    if (!is_ok(s)) {
        print_status_error_detailed("farmer", s);
        return false;
    }
    if (!identity) {
        printf("not found\n");
        return true;
    }

    std::optional<farmledger::core::FarmerProfile> profile;
    s = farmledger::registry::registry_get_profile(cfg.db, *identity, &profile);
    if (!is_ok(s)) {
        print_status_error_detailed("farmer", s);
        return false;
    }
    if (!profile) {
        printf("not found\n");
        return true;
    }
    print_profile(*identity, *profile);
    return true;
}

bool handle_info(const CliConfig& cfg) {
    farmledger::access::RegistryRoles roles{};
    farmledger::access::ClaimLogRoles claim_roles{};
    farmledger::core::Amount fee = 0;
    farmledger::core::Amount balance = 0;
    u64 farmers = 0;
    farmledger::core::Timestamp now = 0;

    Status s = farmledger::registry::registry_get_roles(cfg.db, &roles);
    if (is_ok(s)) s = farmledger::registry::registry_get_fee(cfg.db, &fee);
    if (is_ok(s)) s = farmledger::registry::registry_get_balance(cfg.db, &balance);
    if (is_ok(s)) s = farmledger::registry::registry_get_farmer_count(cfg.db, &farmers);
    if (is_ok(s)) s = farmledger::claims::claims_get_roles(cfg.db, &claim_roles);
    if (is_ok(s)) s = farmledger::ledger::ledger_clock_now(cfg.db, &now);
    if (!is_ok(s)) {
        print_status_error_detailed("info", s);
        return false;
    }

    print_principal("registry_owner", roles.owner);
    print_principal("verifier", roles.verifier);
    printf("registration_fee=%llu\n", static_cast<unsigned long long>(fee));
    printf("contract_balance=%llu\n", static_cast<unsigned long long>(balance));
    printf("farmer_count=%llu\n", static_cast<unsigned long long>(farmers));
    print_principal("claims_owner", claim_roles.owner);
    print_principal("moderator", claim_roles.moderator);
    printf("clock=%llu\n", static_cast<unsigned long long>(now));
    print_principal("caller", cfg.caller);
    return true;
}

// ========================================================================
// Command Handlers: claim log
// ========================================================================

bool handle_log(const CliConfig& cfg, const farmledger::cli::CliArgs& args) {
    HandlerArgs a;
    if (!a.collect(args, "log") || !expect_args("log", a.pos, 3, 3)) {
        return false;
    }

    farmledger::storage::HashHex hex{};
    farmledger::claims::LogParams params{};
    params.practice_type = a.pos.data[0];
    params.category = a.pos.data[1];
    params.details = a.pos.data[2];
    if (!evidence_arg("log", a, &hex, &params.evidence_hash)) {
        return false;
    }

    const farmledger::claims::RegistryVerificationSource verification(cfg.db);
    farmledger::core::LogSeq seq = 0;
    const Status s = farmledger::claims::claims_log(cfg.db, verification, cfg.caller, params, &seq);
    if (!is_ok(s)) {
        print_status_error_detailed("log", s);
        return false;
    }
    printf("seq=%llu\n", static_cast<unsigned long long>(seq));
    if (params.evidence_hash) {
        printf("evidence_hash=%s\n", params.evidence_hash);
    }
    return true;
}

bool handle_moderate(const CliConfig& cfg, const farmledger::cli::CliArgs& args) {
    HandlerArgs a;
    if (!a.collect(args, "moderate") || !expect_args("moderate", a.pos, 3, 4)) {
        return false;
    }

    Principal farmer{};
    u64 seq = 0;
    if (!parse_principal_arg("moderate", a.pos.data[0], &farmer) ||
        !parse_u64_arg("moderate", a.pos.data[1], &seq)) {
        return false;
    }
    farmledger::core::ModerationStatus status{};
    if (!farmledger::core::moderation_status_from_name(a.pos.data[2], &status)) {
        fprintf(stderr, "error: moderate: unknown status '%s'\n", a.pos.data[2]);
        return false;
    }
    const char* notes = a.pos.len > 3 ? a.pos.data[3] : nullptr;

    const Status s = farmledger::claims::claims_moderate(cfg.db, cfg.caller, farmer, seq, status, notes);
    if (!is_ok(s)) {
        print_status_error_detailed("moderate", s);
        return false;
    }
    printf("ok\n");
    return true;
}

bool handle_update_log(const CliConfig& cfg, const farmledger::cli::CliArgs& args) {
    HandlerArgs a;
    u64 seq = 0;
    if (!a.collect(args, "update-log") || !expect_args("update-log", a.pos, 2, 2) ||
        !parse_u64_arg("update-log", a.pos.data[0], &seq)) {
        return false;
    }

    farmledger::storage::HashHex hex{};
    const char* evidence = nullptr;
    if (!evidence_arg("update-log", a, &hex, &evidence)) {
        return false;
    }

    const Status s = farmledger::claims::claims_update(cfg.db, cfg.caller, seq, a.pos.data[1], evidence);
    if (!is_ok(s)) {
        print_status_error_detailed("update-log", s);
        return false;
    }
    printf("ok\n");
    return true;
}

bool handle_entry(const CliConfig& cfg, const farmledger::cli::CliArgs& args) {
    HandlerArgs a;
    Principal farmer{};
    u64 seq = 0;
    if (!a.collect(args, "entry") || !expect_args("entry", a.pos, 2, 2) ||
        !parse_principal_arg("entry", a.pos.data[0], &farmer) ||
        !parse_u64_arg("entry", a.pos.data[1], &seq)) {
        return false;
    }

    std::optional<farmledger::core::PracticeEntry> entry;
    const Status s = farmledger::claims::claims_get_entry(cfg.db, farmer, seq, &entry);
    if (!is_ok(s)) {
        print_status_error_detailed("entry", s);
        return false;
    }
    if (!entry) {
        printf("not found\n");
        return true;
    }
    print_entry(*entry);
    return true;
}

bool handle_log_count(const CliConfig& cfg, const farmledger::cli::CliArgs& args) {
    HandlerArgs a;
    Principal farmer{};
    if (!a.collect(args, "log-count") || !expect_args("log-count", a.pos, 1, 1) ||
        !parse_principal_arg("log-count", a.pos.data[0], &farmer)) {
        return false;
    }

    u64 count = 0;
    const Status s = farmledger::claims::claims_get_log_count(cfg.db, farmer, &count);
    if (!is_ok(s)) {
        print_status_error_detailed("log-count", s);
        return false;
    }
    printf("count=%llu\n", static_cast<unsigned long long>(count));
    return true;
}

// ========================================================================
// Command Handlers: ledger
// ========================================================================

bool handle_fund(const CliConfig& cfg, const farmledger::cli::CliArgs& args) {
    HandlerArgs a;
    Principal account{};
    u64 amount = 0;
    if (!a.collect(args, "fund") || !expect_args("fund", a.pos, 2, 2) ||
        !parse_principal_arg("fund", a.pos.data[0], &account) ||
        !parse_u64_arg("fund", a.pos.data[1], &amount)) {
        return false;
    }

    Status s = farmledger::ledger::ledger_credit(cfg.db, account, amount);
    farmledger::core::Amount balance = 0;
    if (is_ok(s)) {
        s = farmledger::ledger::ledger_balance(cfg.db, account, &balance);
    }
    if (!is_ok(s)) {
        print_status_error_detailed("fund", s);
        return false;
    }
    printf("balance=%llu\n", static_cast<unsigned long long>(balance));
    return true;
}

bool handle_balance(const CliConfig& cfg, const farmledger::cli::CliArgs& args) {
    HandlerArgs a;
    Principal account{};
    if (!a.collect(args, "balance") || !expect_args("balance", a.pos, 1, 1) ||
        !parse_principal_arg("balance", a.pos.data[0], &account)) {
        return false;
    }

    farmledger::core::Amount balance = 0;
    const Status s = farmledger::ledger::ledger_balance(cfg.db, account, &balance);
    if (!is_ok(s)) {
        print_status_error_detailed("balance", s);
        return false;
    }
    printf("balance=%llu\n", static_cast<unsigned long long>(balance));
    return true;
}

bool handle_clock(const CliConfig& cfg) {
    farmledger::core::Timestamp now = 0;
    const Status s = farmledger::ledger::ledger_clock_now(cfg.db, &now);
    if (!is_ok(s)) {
        print_status_error_detailed("clock", s);
        return false;
    }
    printf("clock=%llu\n", static_cast<unsigned long long>(now));
    return true;
}

bool handle_advance(const CliConfig& cfg, const farmledger::cli::CliArgs& args) {
    HandlerArgs a;
    u64 blocks = 0;
    if (!a.collect(args, "advance") || !expect_args("advance", a.pos, 1, 1) ||
        !parse_u64_arg("advance", a.pos.data[0], &blocks)) {
        return false;
    }

    farmledger::core::Timestamp now = 0;
    const Status s = farmledger::ledger::ledger_clock_advance(cfg.db, blocks, &now);
    if (!is_ok(s)) {
        print_status_error_detailed("advance", s);
        return false;
    }
    printf("clock=%llu\n", static_cast<unsigned long long>(now));
    return true;
}

// ========================================================================
// Dispatch
// ========================================================================

bool run_command(const CliConfig& cfg, const farmledger::cli::CommandInvocation& cmd) {
    using farmledger::cli::CommandId;
    const farmledger::cli::CliArgs& args = cmd.args;

    switch (cmd.id) {
        case CommandId::Help:
            handle_help();
            return true;
        case CommandId::Register:
            return handle_register(cfg, args);
        case CommandId::RegisterBatch:
            return handle_register_batch(cfg, args);
        case CommandId::Verify:
            return handle_verify(cfg, args);
        case CommandId::UpdateProfile:
            return handle_update_profile(cfg, args);
        case CommandId::Deactivate:
            return handle_deactivate(cfg, args);
        case CommandId::SetFee:
            return handle_set_fee(cfg, args);
        case CommandId::SetVerifier:
            return handle_role_setter(cfg, args, "set-verifier", farmledger::registry::registry_set_verifier);
        case CommandId::TransferOwnership:
            return handle_role_setter(cfg, args, "transfer-ownership",
                                      farmledger::registry::registry_transfer_ownership);
        case CommandId::Withdraw:
            return handle_withdraw(cfg, args);
        case CommandId::Profile:
            return handle_profile(cfg, args);
        case CommandId::Farmer:
            return handle_farmer(cfg, args);
        case CommandId::Info:
            return handle_info(cfg);
        case CommandId::Log:
            return handle_log(cfg, args);
        case CommandId::Moderate:
            return handle_moderate(cfg, args);
        case CommandId::UpdateLog:
            return handle_update_log(cfg, args);
        case CommandId::SetModerator:
            return handle_role_setter(cfg, args, "set-moderator", farmledger::claims::claims_set_moderator);
        case CommandId::ClaimsTransferOwnership:
            return handle_role_setter(cfg, args, "claims-transfer-ownership",
                                      farmledger::claims::claims_transfer_ownership);
        case CommandId::Entry:
            return handle_entry(cfg, args);
        case CommandId::LogCount:
            return handle_log_count(cfg, args);
        case CommandId::Fund:
            return handle_fund(cfg, args);
        case CommandId::Balance:
            return handle_balance(cfg, args);
        case CommandId::Clock:
            return handle_clock(cfg);
        case CommandId::Advance:
            return handle_advance(cfg, args);
        case CommandId::Exit:
            g_running = 0;
            return true;
        case CommandId::None:
            break;
    }
    print_error("unknown command");
    return false;
}

void handle_as(CliConfig& cfg, const std::vector<std::string>& tokens) {
    if (tokens.size() < 2) {
        print_principal("caller", cfg.caller);
        return;
    }
    Principal p{};
    if (parse_principal_arg("as", tokens[1].c_str(), &p)) {
        cfg.caller = p;
        print_principal("caller", cfg.caller);
    }
}

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    signal(SIGINT, sigint_handler);

    CliConfig cfg;

    // Global options precede the command.
    std::array<farmledger::cli::ParsedOption, 8> opt_buf{};
    farmledger::cli::ParsedOptions opts{opt_buf.data(), 0, static_cast<u32>(opt_buf.size())};
    u32 consumed = 0;
    const farmledger::cli::CliArgs all_args{argv + 1, static_cast<u32>(argc > 0 ? argc - 1 : 0)};
    Status s = farmledger::cli::parse_options(all_args, kGlobalOptions, kGlobalOptionCount, &opts, &consumed);
    if (!is_ok(s)) {
        print_error("invalid options (try --help)");
        return EXIT_FAILURE;
    }
    if (farmledger::cli::find_option(opts, farmledger::cli::OptionId::Help)) {
        handle_help();
        return EXIT_SUCCESS;
    }

    // Database location: --db, then FARMLEDGER_DB, then under $HOME.
    if (const farmledger::cli::ParsedOption* db = farmledger::cli::find_option(opts, farmledger::cli::OptionId::Db)) {
        cfg.db_path = db->value.str;
    } else if (const char* env = std::getenv("FARMLEDGER_DB"); env && *env) {
        cfg.db_path = env;
    } else {
        const char* home = std::getenv("HOME");
        cfg.db_path = (home && *home) ? std::string(home) + "/farmledger/farmledger.db"
                                      : std::string("/tmp/farmledger/farmledger.db");
    }

    // Caller: --as, then FARMLEDGER_CALLER, then the deployer.
    const char* caller = farmledger::db::kDefaultDeployer;
    if (const farmledger::cli::ParsedOption* as = farmledger::cli::find_option(opts, farmledger::cli::OptionId::As)) {
        caller = as->value.str;
    } else if (const char* env = std::getenv("FARMLEDGER_CALLER"); env && *env) {
        caller = env;
    }
    if (!parse_principal_arg("caller", caller, &cfg.caller)) {
        return EXIT_FAILURE;
    }

    if (cfg.db_path != ":memory:") {
        std::error_code ec;
        const std::filesystem::path parent = std::filesystem::path(cfg.db_path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                fprintf(stderr, "error: cannot create %s: %s\n", parent.c_str(), ec.message().c_str());
                return EXIT_FAILURE;
            }
        }
    }

    farmledger::db::DbConfig db_cfg{};
    db_cfg.path = cfg.db_path.c_str();
    s = farmledger::db::db_open(db_cfg, &cfg.db);
    if (!is_ok(s)) {
        print_status_error_detailed("database open", s);
        return EXIT_FAILURE;
    }

    u32 command_count = 0;
    const farmledger::cli::CommandSpec* commands = farmledger::cli::command_specs(&command_count);

    // One-shot mode.
    if (consumed < all_args.argc) {
        const farmledger::cli::CliArgs rest{all_args.argv + consumed, all_args.argc - consumed};
        farmledger::cli::CommandInvocation cmd;
        u32 cmd_consumed = 0;
        s = farmledger::cli::parse_command(rest, commands, command_count, &cmd, &cmd_consumed);
        bool ok = false;
        if (!is_ok(s)) {
            fprintf(stderr, "error: unknown command '%s' (try help)\n", rest.argv[0]);
        } else {
            ok = run_command(cfg, cmd);
        }

        s = farmledger::db::db_close(cfg.db);
        if (!is_ok(s)) {
            print_status_error_detailed("database close", s);
            ok = false;
        }
        return ok ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    // Welcome banner
    printf("farmledger - Interactive Mode\n");
    printf("db_path=%s\n", cfg.db_path.c_str());
    print_principal("caller", cfg.caller);
    printf("Type 'help' for commands, 'q' to quit\n\n");

    // REPL loop
    std::string line;
    std::vector<std::string> tokens;
    std::vector<const char*> cmd_argv;
    while (g_running) {
        printf("farmledger> ");
        fflush(stdout);

        s = farmledger::cli::read_line(stdin, &line);
        if (s.code == farmledger::core::StatusCode::NotFound) {
            break;  // EOF (Ctrl-D)
        }
        if (s.code == farmledger::core::StatusCode::Invalid) {
            fprintf(stderr, "error: line longer than %zu bytes ignored\n", farmledger::cli::kMaxLineLen);
            continue;
        }
        if (!is_ok(s)) {
            print_status_error_detailed("read", s);
            break;
        }

        farmledger::cli::tokenize_line(line.c_str(), &tokens);
        if (tokens.empty()) {
            continue;
        }

        // as: local (not part of parse_command).
        if (tokens[0] == "as") {
            handle_as(cfg, tokens);
            continue;
        }

        cmd_argv.clear();
        for (const std::string& t : tokens) {
            cmd_argv.push_back(t.c_str());
        }

        farmledger::cli::CommandInvocation cmd;
        u32 cmd_consumed = 0;
        const farmledger::cli::CliArgs args{cmd_argv.data(), static_cast<u32>(cmd_argv.size())};
        s = farmledger::cli::parse_command(args, commands, command_count, &cmd, &cmd_consumed);
        if (!is_ok(s)) {
            printf("error: unknown command\n");
            continue;
        }

        (void)run_command(cfg, cmd);
    }

    printf("Goodbye!\n");
    s = farmledger::db::db_close(cfg.db);
    if (!is_ok(s)) {
        print_status_error_detailed("database close", s);
    }

    return EXIT_SUCCESS;
}
