#include "farmledger/cli/options.hpp"

#include <charconv>
#include <cstddef>
#include <cstring>
#include <system_error>

namespace farmledger::cli {
    namespace {
        [[nodiscard]] constexpr farmledger::core::Status cli_invalid() noexcept {
            return farmledger::core::make_status(farmledger::core::StatusDomain::Cli,
                                                 farmledger::core::StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name) noexcept {
            if (name == nullptr) {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strcmp(s.long_name, name) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.short_name == c) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] farmledger::core::Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out == nullptr || out->cap == 0 || out->data == nullptr) {
                return cli_invalid();
            }
            if (out->len >= out->cap) {
                return cli_invalid();
            }
            out->data[out->len++] = opt;
            return farmledger::core::ok_status();
        }

        [[nodiscard]] farmledger::core::Status push_positional(Positionals* out, const char* tok) noexcept {
            if (out == nullptr || out->cap == 0 || out->data == nullptr) {
                return cli_invalid();
            }
            if (out->len >= out->cap) {
                return cli_invalid();
            }
            out->data[out->len++] = tok;
            return farmledger::core::ok_status();
        }

        // "-" alone and negative numbers are values, not options.
        [[nodiscard]] bool is_option_token(const char* tok) noexcept {
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                return false;
            }
            return !(tok[1] >= '0' && tok[1] <= '9');
        }

        [[nodiscard]] farmledger::core::Status store_value(const OptionSpec& spec, const char* value,
                                                           ParsedOptions* out) noexcept {
            ParsedOption opt{};
            opt.id = spec.id;
            opt.type = spec.type;
            if (spec.type == OptionType::String) {
                opt.value.str = value;
            } else if (spec.type == OptionType::I64) {
                i64 v{};
                if (!parse_i64(value, &v)) {
                    return cli_invalid();
                }
                opt.value.i64v = v;
            } else {
                return cli_invalid();
            }
            return push_option(out, opt);
        }

        // Parses the single option at args.argv[i]; advances *i past it and
        // its value.
        [[nodiscard]] farmledger::core::Status parse_one(const CliArgs& args,
            const OptionSpec* specs,
            u32 spec_count,
            ParsedOptions* out,
            u32* i) noexcept {
            const char* tok = args.argv[*i];

            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* value = nullptr;
                char name_buf[128]{};
                const char* eq = std::strchr(name, '=');
                if (eq != nullptr) {
                    const std::size_t name_len = static_cast<std::size_t>(eq - name);
                    if (name_len == 0 || name_len >= sizeof(name_buf)) {
                        return cli_invalid();
                    }
                    std::memcpy(name_buf, name, name_len);
                    name_buf[name_len] = '\0';
                    name = name_buf;
                    value = eq + 1;
                }

                const OptionSpec* spec = find_long(specs, spec_count, name);
                if (spec == nullptr) {
                    return cli_invalid();
                }

                if (spec->type == OptionType::Flag) {
                    if (value != nullptr) {
                        return cli_invalid();
                    }
                    ParsedOption opt{};
                    opt.id = spec->id;
                    opt.type = spec->type;
                    opt.value.boolv = 1;
                    ++*i;
                    return push_option(out, opt);
                }

                if (value == nullptr) {
                    if (*i + 1 >= args.argc || args.argv[*i + 1] == nullptr) {
                        return cli_invalid();
                    }
                    value = args.argv[*i + 1];
                    *i += 2;
                } else {
                    ++*i;
                }
                return store_value(*spec, value, out);
            }

            const OptionSpec* spec = find_short(specs, spec_count, tok[1]);
            if (spec == nullptr) {
                return cli_invalid();
            }

            if (spec->type == OptionType::Flag) {
                if (tok[2] != '\0') {
                    return cli_invalid();
                }
                ParsedOption opt{};
                opt.id = spec->id;
                opt.type = spec->type;
                opt.value.boolv = 1;
                ++*i;
                return push_option(out, opt);
            }

            const char* value = nullptr;
            if (tok[2] != '\0') {
                value = tok + 2;
                ++*i;
            } else {
                if (*i + 1 >= args.argc || args.argv[*i + 1] == nullptr) {
                    return cli_invalid();
                }
                value = args.argv[*i + 1];
                *i += 2;
            }
            return store_value(*spec, value, out);
        }

        [[nodiscard]] farmledger::core::Status check_inputs(const CliArgs& args,
            const OptionSpec* specs,
            u32 spec_count) noexcept {
            if (args.argc > 0 && args.argv == nullptr) {
                return cli_invalid();
            }
            if (spec_count > 0 && specs == nullptr) {
                return cli_invalid();
            }
            return farmledger::core::ok_status();
        }
    } // namespace

    bool parse_u64(const char* s, u64* out) noexcept {
        if (out == nullptr || s == nullptr || *s == '\0') {
            return false;
        }
        const char* end = s + std::strlen(s);
        u64 v{};
        auto r = std::from_chars(s, end, v, 10);
        if (r.ec != std::errc() || r.ptr != end) {
            return false;
        }
        *out = v;
        return true;
    }

    bool parse_i64(const char* s, i64* out) noexcept {
        if (out == nullptr || s == nullptr || *s == '\0') {
            return false;
        }
        const char* end = s + std::strlen(s);
        i64 v{};
        auto r = std::from_chars(s, end, v, 10);
        if (r.ec != std::errc() || r.ptr != end) {
            return false;
        }
        *out = v;
        return true;
    }

    const ParsedOption* find_option(const ParsedOptions& options, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < options.len; ++i) {
            if (options.data[i].id == id) {
                found = &options.data[i];
            }
        }
        return found;
    }

    farmledger::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cli_invalid();
        }
        *consumed = 0;
        out->len = 0;

        farmledger::core::Status s = check_inputs(args, specs, spec_count);
        if (!farmledger::core::is_ok(s)) {
            return s;
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (!is_option_token(tok)) {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }
            s = parse_one(args, specs, spec_count, out, &i);
            if (!farmledger::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return farmledger::core::ok_status();
    }

    farmledger::core::Status parse_arguments(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* options,
        Positionals* positionals) noexcept {
        if (options == nullptr || positionals == nullptr) {
            return cli_invalid();
        }
        options->len = 0;
        positionals->len = 0;

        farmledger::core::Status s = check_inputs(args, specs, spec_count);
        if (!farmledger::core::is_ok(s)) {
            return s;
        }

        bool only_positionals = false;
        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr) {
                break;
            }
            if (!only_positionals && std::strcmp(tok, "--") == 0) {
                only_positionals = true;
                ++i;
                continue;
            }
            if (only_positionals || !is_option_token(tok)) {
                s = push_positional(positionals, tok);
                if (!farmledger::core::is_ok(s)) {
                    return s;
                }
                ++i;
                continue;
            }
            s = parse_one(args, specs, spec_count, options, &i);
            if (!farmledger::core::is_ok(s)) {
                return s;
            }
        }
        return farmledger::core::ok_status();
    }
} // namespace farmledger::cli
