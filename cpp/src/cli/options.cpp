#include "bundl/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace bundl::cli {
    using bundl::core::Status;
    using bundl::core::StatusCode;
    using bundl::core::StatusDomain;

    namespace {
        [[nodiscard]] Status invalid() noexcept {
            return bundl::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs,
            u32 spec_count,
            const char* name,
            std::size_t name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strlen(s.long_name) == name_len &&
                    std::strncmp(s.long_name, name, name_len) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name != '\0' && specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            const char* end = s + std::strlen(s);
            i64 v{};
            const auto r = std::from_chars(s, end, v, 10);
            if (s == end || r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        // Fills opt from its OptionSpec and value (nullptr for a flag).
        [[nodiscard]] Status make_option(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            opt->id = spec.id;
            opt->type = spec.type;
            switch (spec.type) {
            case OptionType::Flag:
                if (value != nullptr) {
                    return invalid();
                }
                opt->value.boolv = 1;
                return bundl::core::ok_status();
            case OptionType::String:
                opt->value.str = value;
                return bundl::core::ok_status();
            case OptionType::I64:
                if (!parse_i64(value, &opt->value.i64v)) {
                    return invalid();
                }
                return bundl::core::ok_status();
            }
            return invalid();
        }

        [[nodiscard]] Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->data == nullptr || out->len >= out->cap) {
                return invalid();
            }
            out->data[out->len++] = opt;
            return bundl::core::ok_status();
        }
    } // namespace

    Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return invalid();
        }
        *consumed = 0;
        out->len = 0;
        if ((args.argc > 0 && args.argv == nullptr) || (spec_count > 0 && specs == nullptr)) {
            return invalid();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* value = nullptr;  // inline value, if any
            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const std::size_t name_len = eq != nullptr ? static_cast<std::size_t>(eq - name) : std::strlen(name);
                if (name_len == 0) {
                    return invalid();
                }
                spec = find_long(specs, spec_count, name, name_len);
                if (eq != nullptr) {
                    value = eq + 1;
                }
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (tok[2] != '\0') {
                    value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return invalid();
            }
            ++i;

            if (spec->type != OptionType::Flag && value == nullptr) {
                if (i >= args.argc || args.argv[i] == nullptr) {
                    return invalid();
                }
                value = args.argv[i++];
            }

            ParsedOption opt{};
            Status s = make_option(*spec, value, &opt);
            if (bundl::core::is_ok(s)) {
                s = push_option(out, opt);
            }
            if (!bundl::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return bundl::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        for (u32 i = opts.len; i > 0; --i) {
            if (opts.data[i - 1].id == id) {
                return &opts.data[i - 1];
            }
        }
        return nullptr;
    }

    u32 count_options(const ParsedOptions& opts, OptionId id) noexcept {
        u32 n = 0;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                ++n;
            }
        }
        return n;
    }

} // namespace bundl::cli
