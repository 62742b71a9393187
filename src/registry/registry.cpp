#include "farmledger/registry/registry.hpp"
#include "db/db_internal.hpp"
#include "ledger/ledger_internal.hpp"

#include <sqlite3.h>

#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace farmledger::registry {

using namespace farmledger::core;
using farmledger::access::RegistryRoles;
using farmledger::db::detail::Session;
using farmledger::db::detail::Stmt;
using farmledger::db::detail::WriteTxn;
using farmledger::db::detail::db_error;
using farmledger::db::detail::kMaxStoredU64;

namespace {

    struct RegistryConfigRow {
        RegistryRoles roles{};
        Amount registration_fee{0};
        Amount contract_balance{0};
        u64 next_farmer_id{1};
        Principal custodian{};
    };

    constexpr const char* kProfileColumns =
        "id, name, location, farm_size, registration_ts, verification_status, "
        "verification_ts, additional_info, active";

    [[nodiscard]] constexpr Status registry_invalid() noexcept {
        return make_status(StatusDomain::Registry, StatusCode::Invalid);
    }

    // nullptr counts as empty.
    [[nodiscard]] std::size_t text_len(const char* s) noexcept {
        return s ? std::strlen(s) : 0;
    }

    [[nodiscard]] bool required_text_ok(const char* s, std::size_t max) noexcept {
        const std::size_t n = text_len(s);
        return n > 0 && n <= max;
    }

    [[nodiscard]] bool optional_text_ok(const char* s, std::size_t max) noexcept {
        return text_len(s) <= max;
    }

    [[nodiscard]] bool registration_valid(const RegistrationParams& p) noexcept {
        return required_text_ok(p.name, kMaxNameLen) &&
               required_text_ok(p.location, kMaxLocationLen) &&
               p.farm_size > 0 &&
               optional_text_ok(p.additional_info, kMaxAdditionalInfoLen);
    }

    [[nodiscard]] Status load_config(sqlite3* conn, RegistryConfigRow* out) noexcept {
        Stmt stmt(conn,
            "SELECT owner, verifier, registration_fee, contract_balance, next_farmer_id, custodian "
            "FROM registry_config WHERE id = 1");
        if (!stmt.ok() || stmt.step() != SQLITE_ROW) {
            return db_error();
        }

        RegistryConfigRow row{};
        if (!stmt.column_principal(0, &row.roles.owner) ||
            !stmt.column_principal(1, &row.roles.verifier) ||
            !stmt.column_principal(5, &row.custodian)) {
            return db_error(StatusCode::Corrupt);
        }
        row.registration_fee = stmt.column_u64(2);
        row.contract_balance = stmt.column_u64(3);
        row.next_farmer_id = stmt.column_u64(4);
        *out = row;
        return ok_status();
    }

    // Reads the profile columns of the current row, in kProfileColumns order.
    [[nodiscard]] Status read_profile(const Stmt& stmt, FarmerProfile* out) {
        const u64 raw_status = stmt.column_u64(5);
        if (raw_status > 0xff || !verification_status_valid(static_cast<u32>(raw_status))) {
            return db_error(StatusCode::Corrupt);
        }

        FarmerProfile p{};
        p.id = FarmerId{stmt.column_u64(0)};
        p.name = stmt.column_string(1);
        p.location = stmt.column_string(2);
        p.farm_size = stmt.column_i64(3);
        p.registration_timestamp = stmt.column_u64(4);
        p.verification_status = static_cast<VerificationStatus>(raw_status);
        p.verification_timestamp = stmt.column_optional_u64(6);
        p.additional_info = stmt.column_string(7);
        p.active = stmt.column_i64(8) != 0;
        *out = std::move(p);
        return ok_status();
    }

    [[nodiscard]] Status load_profile(sqlite3* conn, const Principal& farmer,
                                      std::optional<FarmerProfile>* out) noexcept {
        std::string sql = "SELECT ";
        sql += kProfileColumns;
        sql += " FROM farmers WHERE principal = ?";

        Stmt stmt(conn, sql.c_str());
        if (!stmt.ok()) {
            return db_error();
        }
        stmt.bind_principal(1, farmer);

        const int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            out->reset();
            return ok_status();
        }
        if (rc != SQLITE_ROW) {
            return db_error();
        }

        FarmerProfile p{};
        const Status s = read_profile(stmt, &p);
        if (!is_ok(s)) {
            return s;
        }
        *out = std::move(p);
        return ok_status();
    }

    [[nodiscard]] Status profile_exists(sqlite3* conn, const Principal& farmer, bool* out) noexcept {
        Stmt stmt(conn, "SELECT 1 FROM farmers WHERE principal = ?");
        if (!stmt.ok()) {
            return db_error();
        }
        stmt.bind_principal(1, farmer);

        const int rc = stmt.step();
        if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
            return db_error();
        }
        *out = rc == SQLITE_ROW;
        return ok_status();
    }

    [[nodiscard]] Status insert_profile(sqlite3* conn, const Principal& farmer, u64 id,
                                        const RegistrationParams& params, Timestamp now,
                                        VerificationStatus status) noexcept {
        {
            Stmt stmt(conn,
                "INSERT INTO farmers (principal, id, name, location, farm_size, registration_ts, "
                "verification_status, verification_ts, additional_info, active) "
                "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, 1)");
            if (!stmt.ok()) {
                return db_error();
            }
            stmt.bind_principal(1, farmer);
            stmt.bind_u64(2, id);
            stmt.bind_text(3, params.name);
            stmt.bind_text(4, params.location);
            stmt.bind_i64(5, params.farm_size);
            stmt.bind_u64(6, now);
            stmt.bind_u64(7, static_cast<u64>(status));
            stmt.bind_optional_u64(8, status == VerificationStatus::Pending ? std::nullopt : std::optional<u64>{now});
            stmt.bind_text(9, params.additional_info ? std::string_view{params.additional_info} : std::string_view{});
            if (stmt.step() != SQLITE_DONE) {
                return db_error();
            }
        }

        Stmt index(conn, "INSERT INTO farmer_ids (id, principal) VALUES (?, ?)");
        if (!index.ok()) {
            return db_error();
        }
        index.bind_u64(1, id);
        index.bind_principal(2, farmer);
        if (index.step() != SQLITE_DONE) {
            return db_error();
        }
        return ok_status();
    }

    [[nodiscard]] Status store_counters(sqlite3* conn, u64 next_farmer_id, Amount contract_balance) noexcept {
        Stmt stmt(conn, "UPDATE registry_config SET next_farmer_id = ?, contract_balance = ? WHERE id = 1");
        if (!stmt.ok()) {
            return db_error();
        }
        stmt.bind_u64(1, next_farmer_id);
        stmt.bind_u64(2, contract_balance);
        if (stmt.step() != SQLITE_DONE) {
            return db_error();
        }
        return ok_status();
    }

    // Owner-gated update of one registry_config column. `valid` is checked
    // against the loaded config after authorization.
    template <typename Valid, typename Bind>
    [[nodiscard]] Status owner_update(DbHandle db, const Principal& caller, Valid valid, const char* sql,
                                      Bind bind) noexcept {
        WriteTxn txn(db, StatusDomain::Registry);
        if (!is_ok(txn.status())) {
            return txn.status();
        }

        RegistryConfigRow cfg{};
        Status s = load_config(txn.conn(), &cfg);
        if (!is_ok(s)) {
            return s;
        }
        if (!farmledger::access::is_owner(cfg.roles, caller)) {
            return make_error(RegistryError::NotAuthorized);
        }
        if (!valid(cfg)) {
            return make_error(RegistryError::InvalidInput);
        }

        {
            Stmt stmt(txn.conn(), sql);
            if (!stmt.ok()) {
                return db_error();
            }
            bind(stmt);
            if (stmt.step() != SQLITE_DONE) {
                return db_error();
            }
        }
        return txn.commit();
    }

} // namespace

// ============================================================================
// Registration
// ============================================================================

Status registry_register(DbHandle db, const Principal& caller, const RegistrationParams& params,
                         FarmerId* out) noexcept {
    if (!out) {
        return registry_invalid();
    }

    WriteTxn txn(db, StatusDomain::Registry);
    if (!is_ok(txn.status())) {
        return txn.status();
    }
    sqlite3* conn = txn.conn();

    bool exists = false;
    Status s = profile_exists(conn, caller, &exists);
    if (!is_ok(s)) {
        return s;
    }
    if (exists) {
        return make_error(RegistryError::AlreadyRegistered);
    }
    if (caller.empty() || !registration_valid(params)) {
        return make_error(RegistryError::InvalidInput);
    }

    RegistryConfigRow cfg{};
    s = load_config(conn, &cfg);
    if (!is_ok(s)) {
        return s;
    }
    if (caller == cfg.custodian) {
        return make_error(RegistryError::InvalidInput);
    }
    if (cfg.registration_fee > kMaxStoredU64 - cfg.contract_balance ||
        cfg.next_farmer_id >= kMaxStoredU64) {
        return make_status(StatusDomain::Registry, StatusCode::Conflict);
    }

    if (cfg.registration_fee > 0) {
        s = farmledger::ledger::detail::transfer_in_txn(conn, caller, cfg.custodian, cfg.registration_fee);
        if (!is_ok(s)) {
            return s;
        }
    }

    Timestamp now = 0;
    s = farmledger::ledger::detail::clock_now_in_txn(conn, &now);
    if (!is_ok(s)) {
        return s;
    }

    const u64 id = cfg.next_farmer_id;
    s = insert_profile(conn, caller, id, params, now, VerificationStatus::Pending);
    if (!is_ok(s)) {
        return s;
    }
    s = store_counters(conn, id + 1, cfg.contract_balance + cfg.registration_fee);
    if (!is_ok(s)) {
        return s;
    }
    s = farmledger::ledger::detail::clock_tick_in_txn(conn);
    if (!is_ok(s)) {
        return s;
    }

    s = txn.commit();
    if (!is_ok(s)) {
        return s;
    }
    *out = FarmerId{id};
    return ok_status();
}

Status registry_register_batch_verified(DbHandle db, const Principal& caller, const BatchRegistration* entries,
                                        u32 count, FarmerId* first_id) noexcept {
    if (!first_id) {
        return registry_invalid();
    }

    WriteTxn txn(db, StatusDomain::Registry);
    if (!is_ok(txn.status())) {
        return txn.status();
    }
    sqlite3* conn = txn.conn();

    RegistryConfigRow cfg{};
    Status s = load_config(conn, &cfg);
    if (!is_ok(s)) {
        return s;
    }
    if (!farmledger::access::is_owner(cfg.roles, caller)) {
        return make_error(RegistryError::NotAuthorized);
    }
    if (!entries || count == 0 || count > kMaxBatchSize) {
        return make_error(RegistryError::InvalidInput);
    }
    if (cfg.next_farmer_id > kMaxStoredU64 - count) {
        return make_status(StatusDomain::Registry, StatusCode::Conflict);
    }

    Timestamp now = 0;
    s = farmledger::ledger::detail::clock_now_in_txn(conn, &now);
    if (!is_ok(s)) {
        return s;
    }

    // Earlier entries are already inserted, so a repeat inside the batch is
    // caught by the same lookup as an existing profile.
    u64 next_id = cfg.next_farmer_id;
    for (u32 i = 0; i < count; ++i) {
        const BatchRegistration& e = entries[i];

        bool exists = false;
        s = profile_exists(conn, e.farmer, &exists);
        if (!is_ok(s)) {
            return s;
        }
        if (exists) {
            return make_error(RegistryError::AlreadyRegistered);
        }
        if (e.farmer.empty() || e.farmer == cfg.custodian || !registration_valid(e.params)) {
            return make_error(RegistryError::InvalidInput);
        }

        s = insert_profile(conn, e.farmer, next_id, e.params, now, VerificationStatus::Verified);
        if (!is_ok(s)) {
            return s;
        }
        ++next_id;
    }

    s = store_counters(conn, next_id, cfg.contract_balance);
    if (!is_ok(s)) {
        return s;
    }
    s = farmledger::ledger::detail::clock_tick_in_txn(conn);
    if (!is_ok(s)) {
        return s;
    }

    s = txn.commit();
    if (!is_ok(s)) {
        return s;
    }
    *first_id = FarmerId{cfg.next_farmer_id};
    return ok_status();
}

// ============================================================================
// Verification & profile maintenance
// ============================================================================

Status registry_verify(DbHandle db, const Principal& caller, const Principal& farmer,
                       VerificationStatus status) noexcept {
    WriteTxn txn(db, StatusDomain::Registry);
    if (!is_ok(txn.status())) {
        return txn.status();
    }
    sqlite3* conn = txn.conn();

    RegistryConfigRow cfg{};
    Status s = load_config(conn, &cfg);
    if (!is_ok(s)) {
        return s;
    }
    if (!farmledger::access::is_verifier(cfg.roles, caller)) {
        return make_error(RegistryError::NotAuthorized);
    }

    std::optional<FarmerProfile> profile;
    s = load_profile(conn, farmer, &profile);
    if (!is_ok(s)) {
        return s;
    }
    if (!profile) {
        return make_error(RegistryError::NotRegistered);
    }
    if (status != VerificationStatus::Verified && status != VerificationStatus::Rejected) {
        return make_error(RegistryError::InvalidStatus);
    }
    if (profile->verification_status != VerificationStatus::Pending) {
        return make_error(RegistryError::AlreadyVerified);
    }

    Timestamp now = 0;
    s = farmledger::ledger::detail::clock_now_in_txn(conn, &now);
    if (!is_ok(s)) {
        return s;
    }

    {
        Stmt stmt(conn,
            "UPDATE farmers SET verification_status = ?, verification_ts = ? "
            "WHERE principal = ? AND verification_status = 0");
        if (!stmt.ok()) {
            return db_error();
        }
        stmt.bind_u64(1, static_cast<u64>(status));
        stmt.bind_u64(2, now);
        stmt.bind_principal(3, farmer);
        if (stmt.step() != SQLITE_DONE || sqlite3_changes(conn) != 1) {
            return db_error();
        }
    }

    s = farmledger::ledger::detail::clock_tick_in_txn(conn);
    if (!is_ok(s)) {
        return s;
    }
    return txn.commit();
}

Status registry_update_profile(DbHandle db, const Principal& caller, const ProfilePatch& patch) noexcept {
    WriteTxn txn(db, StatusDomain::Registry);
    if (!is_ok(txn.status())) {
        return txn.status();
    }
    sqlite3* conn = txn.conn();

    std::optional<FarmerProfile> profile;
    Status s = load_profile(conn, caller, &profile);
    if (!is_ok(s)) {
        return s;
    }
    if (!profile) {
        return make_error(RegistryError::NotRegistered);
    }
    if (profile->verification_status != VerificationStatus::Verified) {
        return make_error(RegistryError::NotVerified);
    }
    if (!optional_text_ok(patch.name, kMaxNameLen) ||
        !optional_text_ok(patch.location, kMaxLocationLen) ||
        !optional_text_ok(patch.additional_info, kMaxAdditionalInfoLen) ||
        (patch.farm_size && *patch.farm_size < 0)) {
        return make_error(RegistryError::InvalidInput);
    }

    // Empty strings and a zero size leave the stored value in place.
    FarmerProfile& p = *profile;
    if (text_len(patch.name) > 0) {
        p.name = patch.name;
    }
    if (text_len(patch.location) > 0) {
        p.location = patch.location;
    }
    if (patch.farm_size && *patch.farm_size > 0) {
        p.farm_size = *patch.farm_size;
    }
    if (text_len(patch.additional_info) > 0) {
        p.additional_info = patch.additional_info;
    }

    {
        Stmt stmt(conn,
            "UPDATE farmers SET name = ?, location = ?, farm_size = ?, additional_info = ? "
            "WHERE principal = ?");
        if (!stmt.ok()) {
            return db_error();
        }
        stmt.bind_text(1, p.name);
        stmt.bind_text(2, p.location);
        stmt.bind_i64(3, p.farm_size);
        stmt.bind_text(4, p.additional_info);
        stmt.bind_principal(5, caller);
        if (stmt.step() != SQLITE_DONE) {
            return db_error();
        }
    }
    return txn.commit();
}

Status registry_deactivate(DbHandle db, const Principal& caller, const Principal& farmer) noexcept {
    WriteTxn txn(db, StatusDomain::Registry);
    if (!is_ok(txn.status())) {
        return txn.status();
    }
    sqlite3* conn = txn.conn();

    RegistryConfigRow cfg{};
    Status s = load_config(conn, &cfg);
    if (!is_ok(s)) {
        return s;
    }
    if (!farmledger::access::is_owner(cfg.roles, caller)) {
        return make_error(RegistryError::NotAuthorized);
    }

    {
        Stmt stmt(conn, "UPDATE farmers SET active = 0 WHERE principal = ?");
        if (!stmt.ok()) {
            return db_error();
        }
        stmt.bind_principal(1, farmer);
        if (stmt.step() != SQLITE_DONE) {
            return db_error();
        }
        if (sqlite3_changes(conn) == 0) {
            return make_error(RegistryError::NotRegistered);
        }
    }
    return txn.commit();
}

// ============================================================================
// Owner administration
// ============================================================================

Status registry_set_registration_fee(DbHandle db, const Principal& caller, Amount fee) noexcept {
    return owner_update(db, caller, [fee](const RegistryConfigRow&) { return fee <= kMaxStoredU64; },
                        "UPDATE registry_config SET registration_fee = ? WHERE id = 1",
                        [fee](Stmt& stmt) { stmt.bind_u64(1, fee); });
}

Status registry_set_verifier(DbHandle db, const Principal& caller, const Principal& verifier) noexcept {
    return owner_update(db, caller, [&verifier](const RegistryConfigRow& cfg) {
                            return !verifier.empty() && verifier != cfg.custodian;
                        },
                        "UPDATE registry_config SET verifier = ? WHERE id = 1",
                        [&verifier](Stmt& stmt) { stmt.bind_principal(1, verifier); });
}

Status registry_transfer_ownership(DbHandle db, const Principal& caller, const Principal& new_owner) noexcept {
    return owner_update(db, caller, [&new_owner](const RegistryConfigRow& cfg) {
                            return !new_owner.empty() && new_owner != cfg.custodian;
                        },
                        "UPDATE registry_config SET owner = ? WHERE id = 1",
                        [&new_owner](Stmt& stmt) { stmt.bind_principal(1, new_owner); });
}

Status registry_withdraw_fees(DbHandle db, const Principal& caller, Amount amount) noexcept {
    WriteTxn txn(db, StatusDomain::Registry);
    if (!is_ok(txn.status())) {
        return txn.status();
    }
    sqlite3* conn = txn.conn();

    RegistryConfigRow cfg{};
    Status s = load_config(conn, &cfg);
    if (!is_ok(s)) {
        return s;
    }
    if (!farmledger::access::is_owner(cfg.roles, caller)) {
        return make_error(RegistryError::NotAuthorized);
    }
    if (amount > cfg.contract_balance) {
        return make_error(RegistryError::InvalidInput);
    }
    if (amount == 0) {
        return txn.commit();
    }

    s = store_counters(conn, cfg.next_farmer_id, cfg.contract_balance - amount);
    if (!is_ok(s)) {
        return s;
    }
    s = farmledger::ledger::detail::transfer_in_txn(conn, cfg.custodian, caller, amount);
    if (!is_ok(s)) {
        return s;
    }
    return txn.commit();
}

// ============================================================================
// Reads
// ============================================================================

Status registry_get_profile(DbHandle db, const Principal& farmer, std::optional<FarmerProfile>* out) noexcept {
    if (!out) {
        return registry_invalid();
    }

    Session session(db);
    if (!session.conn()) {
        return registry_invalid();
    }
    return load_profile(session.conn(), farmer, out);
}

Status registry_get_by_id(DbHandle db, FarmerId id, std::optional<FarmerProfile>* out) noexcept {
    if (!out) {
        return registry_invalid();
    }

    Session session(db);
    if (!session.conn()) {
        return registry_invalid();
    }

    std::optional<Principal> identity;
    Status s = registry_get_identity_by_id(db, id, &identity);
    if (!is_ok(s)) {
        return s;
    }
    if (!identity) {
        out->reset();
        return ok_status();
    }
    return load_profile(session.conn(), *identity, out);
}

Status registry_get_identity_by_id(DbHandle db, FarmerId id, std::optional<Principal>* out) noexcept {
    if (!out) {
        return registry_invalid();
    }

    Session session(db);
    if (!session.conn()) {
        return registry_invalid();
    }
    if (!id.is_valid() || id.v > kMaxStoredU64) {
        out->reset();
        return ok_status();
    }

    Stmt stmt(session.conn(), "SELECT principal FROM farmer_ids WHERE id = ?");
    if (!stmt.ok()) {
        return db_error();
    }
    stmt.bind_u64(1, id.v);

    const int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        out->reset();
        return ok_status();
    }
    if (rc != SQLITE_ROW) {
        return db_error();
    }

    Principal p{};
    if (!stmt.column_principal(0, &p)) {
        return db_error(StatusCode::Corrupt);
    }
    *out = p;
    return ok_status();
}

Status registry_is_verified(DbHandle db, const Principal& farmer, bool* out) noexcept {
    if (!out) {
        return registry_invalid();
    }

    std::optional<FarmerProfile> profile;
    const Status s = registry_get_profile(db, farmer, &profile);
    if (!is_ok(s)) {
        return s;
    }
    *out = profile && profile->verification_status == VerificationStatus::Verified;
    return ok_status();
}

Status registry_get_roles(DbHandle db, RegistryRoles* out) noexcept {
    if (!out) {
        return registry_invalid();
    }

    Session session(db);
    if (!session.conn()) {
        return registry_invalid();
    }

    RegistryConfigRow cfg{};
    const Status s = load_config(session.conn(), &cfg);
    if (!is_ok(s)) {
        return s;
    }
    *out = cfg.roles;
    return ok_status();
}

Status registry_get_owner(DbHandle db, Principal* out) noexcept {
    if (!out) {
        return registry_invalid();
    }

    RegistryRoles roles{};
    const Status s = registry_get_roles(db, &roles);
    if (!is_ok(s)) {
        return s;
    }
    *out = roles.owner;
    return ok_status();
}

Status registry_get_verifier(DbHandle db, Principal* out) noexcept {
    if (!out) {
        return registry_invalid();
    }

    RegistryRoles roles{};
    const Status s = registry_get_roles(db, &roles);
    if (!is_ok(s)) {
        return s;
    }
    *out = roles.verifier;
    return ok_status();
}

Status registry_get_fee(DbHandle db, Amount* out) noexcept {
    if (!out) {
        return registry_invalid();
    }

    Session session(db);
    if (!session.conn()) {
        return registry_invalid();
    }

    RegistryConfigRow cfg{};
    const Status s = load_config(session.conn(), &cfg);
    if (!is_ok(s)) {
        return s;
    }
    *out = cfg.registration_fee;
    return ok_status();
}

Status registry_get_balance(DbHandle db, Amount* out) noexcept {
    if (!out) {
        return registry_invalid();
    }

    Session session(db);
    if (!session.conn()) {
        return registry_invalid();
    }

    RegistryConfigRow cfg{};
    const Status s = load_config(session.conn(), &cfg);
    if (!is_ok(s)) {
        return s;
    }
    *out = cfg.contract_balance;
    return ok_status();
}

Status registry_get_farmer_count(DbHandle db, u64* out) noexcept {
    if (!out) {
        return registry_invalid();
    }

    Session session(db);
    if (!session.conn()) {
        return registry_invalid();
    }

    RegistryConfigRow cfg{};
    const Status s = load_config(session.conn(), &cfg);
    if (!is_ok(s)) {
        return s;
    }
    *out = cfg.next_farmer_id - 1;
    return ok_status();
}

} // namespace farmledger::registry
