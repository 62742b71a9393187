#include "farmledger/cli/input.hpp"

#include <cstring>
#include <string_view>
#include <utility>

namespace farmledger::cli {
    namespace {
        [[nodiscard]] constexpr farmledger::core::Status cli_status(farmledger::core::StatusCode code) noexcept {
            return farmledger::core::make_status(farmledger::core::StatusDomain::Cli, code);
        }
    } // namespace

    farmledger::core::Status read_line(std::FILE* in, std::string* out, std::size_t max_len) {
        if (in == nullptr || out == nullptr) {
            return cli_status(farmledger::core::StatusCode::Invalid);
        }
        out->clear();

        bool any = false;
        bool too_long = false;
        char chunk[512];
        while (std::fgets(chunk, sizeof(chunk), in) != nullptr) {
            any = true;
            std::size_t n = std::strlen(chunk);
            const bool complete = n > 0 && chunk[n - 1] == '\n';
            if (complete) {
                --n;
            }
            if (!too_long) {
                if (out->size() + n > max_len) {
                    too_long = true;
                    out->clear();
                } else {
                    out->append(chunk, n);
                }
            }
            if (complete) {
                break;
            }
        }

        if (std::ferror(in) != 0) {
            out->clear();
            return cli_status(farmledger::core::StatusCode::Io);
        }
        if (!any) {
            return cli_status(farmledger::core::StatusCode::NotFound);
        }
        if (too_long) {
            return cli_status(farmledger::core::StatusCode::Invalid);
        }
        return farmledger::core::ok_status();
    }

    void tokenize_line(const char* line, std::vector<std::string>* tokens) {
        tokens->clear();
        if (line == nullptr) {
            return;
        }

        std::string cur;
        bool in_token = false;
        bool quoted = false;

        for (const char* p = line; *p; ++p) {
            const char c = *p;
            if (c == '"') {
                quoted = !quoted;
                in_token = true;
                continue;
            }
            if (!quoted && (c == ' ' || c == '\t' || c == '\n' || c == '\r')) {
                if (in_token) {
                    tokens->push_back(cur);
                    cur.clear();
                    in_token = false;
                }
                continue;
            }
            cur.push_back(c);
            in_token = true;
        }
        if (in_token) {
            tokens->push_back(cur);
        }
    }

    farmledger::core::Status parse_batch_entry(const char* text, BatchEntry* out) {
        if (text == nullptr || out == nullptr) {
            return cli_status(farmledger::core::StatusCode::Invalid);
        }

        const std::string_view raw(text);
        const std::size_t c1 = raw.find(':');
        const std::size_t c2 = c1 == std::string_view::npos ? c1 : raw.find(':', c1 + 1);
        const std::size_t c3 = c2 == std::string_view::npos ? c2 : raw.find(':', c2 + 1);
        if (c3 == std::string_view::npos) {
            return cli_status(farmledger::core::StatusCode::Invalid);
        }

        BatchEntry e;
        if (!farmledger::core::principal_from(raw.substr(0, c1), &e.farmer)) {
            return cli_status(farmledger::core::StatusCode::Invalid);
        }
        // The size runs to the end of text.
        if (!parse_i64(text + c3 + 1, &e.farm_size)) {
            return cli_status(farmledger::core::StatusCode::Invalid);
        }
        e.name.assign(raw.substr(c1 + 1, c2 - c1 - 1));
        e.location.assign(raw.substr(c2 + 1, c3 - c2 - 1));

        *out = std::move(e);
        return farmledger::core::ok_status();
    }

    farmledger::registry::BatchRegistration batch_registration(const BatchEntry& e) noexcept {
        farmledger::registry::BatchRegistration r{};
        r.farmer = e.farmer;
        r.params.name = e.name.c_str();
        r.params.location = e.location.c_str();
        r.params.farm_size = e.farm_size;
        r.params.additional_info = "";
        return r;
    }

    farmledger::core::Status resolve_evidence(const ParsedOptions& opts,
                                              farmledger::storage::HashHex* hex,
                                              const char** out) noexcept {
        if (hex == nullptr || out == nullptr) {
            return cli_status(farmledger::core::StatusCode::Invalid);
        }
        *out = nullptr;

        const ParsedOption* literal = find_option(opts, OptionId::Evidence);
        const ParsedOption* path = find_option(opts, OptionId::EvidenceFile);
        if (literal != nullptr && path != nullptr) {
            return cli_status(farmledger::core::StatusCode::Invalid);
        }
        if (path != nullptr) {
            farmledger::core::Hash256 digest{};
            const farmledger::core::Status s = farmledger::storage::hash_file(path->value.str, &digest);
            if (!farmledger::core::is_ok(s)) {
                return s;
            }
            *hex = farmledger::storage::hash_to_hex(digest);
            *out = hex->data();
            return farmledger::core::ok_status();
        }
        if (literal != nullptr) {
            *out = literal->value.str;
        }
        return farmledger::core::ok_status();
    }

} // namespace farmledger::cli
