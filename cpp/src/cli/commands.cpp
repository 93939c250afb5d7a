#include "bundl/cli/commands.hpp"

#include <array>
#include <cstring>
#include <limits>

#include "bundl/core/log.hpp"

namespace bundl::cli {
    using bundl::core::Status;
    using bundl::core::StatusCode;
    using bundl::core::StatusDomain;

    namespace {
        constexpr std::array<CommandSpec, 7> kCommands = {{
            {CommandId::Help, "help"},
            {CommandId::Merge, "merge"},
            {CommandId::Stage, "stage"},
            {CommandId::Reconcile, "reconcile"},
            {CommandId::Name, "name"},
            {CommandId::Parse, "parse"},
            {CommandId::Embed, "embed"},
        }};

        constexpr std::array<OptionSpec, 12> kOptions = {{
            {OptionId::BuildRoot, OptionType::String, "build-root", 'b'},
            {OptionId::Staging, OptionType::String, "staging", 's'},
            {OptionId::Upload, OptionType::String, "upload", 'u'},
            {OptionId::Remote, OptionType::String, "remote", 'r'},
            {OptionId::Output, OptionType::String, "output", 'o'},
            {OptionId::Target, OptionType::String, "target", 't'},
            {OptionId::Retries, OptionType::I64, "retries", '\0'},
            {OptionId::DelayMs, OptionType::I64, "delay-ms", '\0'},
            {OptionId::Jobs, OptionType::I64, "jobs", 'j'},
            {OptionId::Verbose, OptionType::Flag, "verbose", 'v'},
            {OptionId::Pointer, OptionType::String, "pointer", 'p'},
            {OptionId::Embedded, OptionType::String, "embedded", 'e'},
        }};

        constexpr u32 kMaxOptions = 64;

        [[nodiscard]] Status invalid() noexcept {
            return bundl::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
    } // namespace

    Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return invalid();
        }
        *consumed = 0;
        out->id = CommandId::None;
        out->args = CliArgs{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid();
        }

        const char* cmd = args.argv[0];
        for (u32 i = 0; i < spec_count; ++i) {
            if (specs[i].name != nullptr && std::strcmp(specs[i].name, cmd) == 0) {
                out->id = specs[i].id;
                out->args.argv = args.argv + 1;
                out->args.argc = args.argc - 1;
                *consumed = 1;
                return bundl::core::ok_status();
            }
        }
        return bundl::core::make_status(StatusDomain::Cli, StatusCode::NotFound);
    }

    Status apply_options(const ParsedOptions& opts, CliContext* ctx) {
        if (ctx == nullptr) {
            return invalid();
        }

        for (u32 i = 0; i < opts.len; ++i) {
            const ParsedOption& o = opts.data[i];
            switch (o.id) {
            case OptionId::BuildRoot:
                ctx->paths.build_root = o.value.str;
                break;
            case OptionId::Staging:
                ctx->paths.staging_dir = o.value.str;
                break;
            case OptionId::Upload:
                ctx->paths.upload_dir = o.value.str;
                break;
            case OptionId::Remote:
                ctx->paths.remote_root = o.value.str;
                break;
            case OptionId::Embedded:
                ctx->paths.embedded_dir = o.value.str;
                break;
            case OptionId::Output:
                ctx->output = o.value.str;
                break;
            case OptionId::Target:
                ctx->targets.emplace_back(o.value.str);
                break;
            case OptionId::Pointer:
                ctx->pointer = o.value.str;
                break;
            case OptionId::Retries:
                if (o.value.i64v < 0 || o.value.i64v > std::numeric_limits<u32>::max()) {
                    bundl::core::log_error("--retries must be between 0 and %u", std::numeric_limits<u32>::max());
                    return invalid();
                }
                ctx->reconcile.max_retries = static_cast<u32>(o.value.i64v);
                break;
            case OptionId::DelayMs:
                if (o.value.i64v < 0 ||
                    std::chrono::milliseconds(o.value.i64v) > bundl::core::kMaxRetryDelay) {
                    bundl::core::log_error("--delay-ms must be between 0 and %lld",
                        static_cast<long long>(
                            std::chrono::duration_cast<std::chrono::milliseconds>(bundl::core::kMaxRetryDelay).count()));
                    return invalid();
                }
                ctx->reconcile.retry_delay = std::chrono::milliseconds(o.value.i64v);
                break;
            case OptionId::Jobs:
                if (o.value.i64v < 1 || o.value.i64v > std::numeric_limits<u32>::max()) {
                    bundl::core::log_error("--jobs must be at least 1");
                    return invalid();
                }
                ctx->reconcile.max_concurrency = static_cast<u32>(o.value.i64v);
                break;
            case OptionId::Verbose:
                ctx->verbose = true;
                break;
            case OptionId::None:
                break;
            }
        }

        // A moved build root drags the default output dirs along.
        if (find_option(opts, OptionId::BuildRoot) != nullptr) {
            if (find_option(opts, OptionId::Staging) == nullptr) {
                ctx->paths.staging_dir = ctx->paths.build_root / "Staging";
            }
            if (find_option(opts, OptionId::Upload) == nullptr) {
                ctx->paths.upload_dir = ctx->paths.build_root / "Upload";
            }
            if (find_option(opts, OptionId::Embedded) == nullptr) {
                ctx->paths.embedded_dir = ctx->paths.build_root / "Embedded";
            }
        }
        return bundl::core::ok_status();
    }

    void print_help(std::FILE* out) {
        std::fprintf(out,
            "usage: bundl <command> [options] [args]\n"
            "\n"
            "commands:\n"
            "  merge                  merge per-platform manifests into descriptions JSON\n"
            "  stage                  copy built artifacts into the staging dir under canonical names\n"
            "  reconcile              probe the remote dir and copy missing artifacts to the upload dir\n"
            "  name NAME TARGET HASH  print the canonical file name\n"
            "  parse ARG...           split artifact file names, or list the files of a descriptions .json\n"
            "  embed NAME...          copy one target's artifacts into the embedded dir (needs one --target)\n"
            "  help                   show this text\n"
            "\n"
            "options:\n"
            "  -b, --build-root DIR   build output root (default $%s or ./%s)\n"
            "  -s, --staging DIR      staging dir (default <root>/Staging)\n"
            "  -u, --upload DIR       upload dir (default <root>/Upload)\n"
            "  -e, --embedded DIR     embedded dir, reset by embed (default <root>/Embedded)\n"
            "  -r, --remote DIR       published artifacts, probed by file name\n"
            "  -o, --output FILE      merge output (default stdout)\n"
            "  -t, --target TARGET    build target, repeatable (default every platform)\n"
            "      --retries N        extra probe attempts when indeterminate (default 3)\n"
            "      --delay-ms N       delay between probe attempts (default 500)\n"
            "  -j, --jobs N           probes in flight at once (default 8)\n"
            "  -p, --pointer PTR      JSON Pointer to the records inside a .json for parse\n"
            "  -v, --verbose          debug logging\n",
            bundl::core::kRootEnvVar,
            bundl::core::kDefaultRoot);
    }

    int cli_main(const CliArgs& args) {
        if (args.argc == 0) {
            print_help(stderr);
            return 2;
        }

        CommandInvocation cmd{};
        u32 consumed = 0;
        Status s = parse_command(args, kCommands.data(), static_cast<u32>(kCommands.size()), &cmd, &consumed);
        if (!bundl::core::is_ok(s)) {
            bundl::core::log_error("unknown command %s", args.argv[0] != nullptr ? args.argv[0] : "");
            print_help(stderr);
            return 2;
        }
        if (cmd.id == CommandId::Help) {
            print_help(stdout);
            return 0;
        }

        ParsedOption buf[kMaxOptions]{};
        ParsedOptions opts{buf, 0, kMaxOptions};
        s = parse_options(cmd.args, kOptions.data(), static_cast<u32>(kOptions.size()), &opts, &consumed);
        if (!bundl::core::is_ok(s)) {
            bundl::core::log_error("invalid options for %s (see bundl help)", args.argv[0]);
            return 2;
        }

        CliContext ctx;
        bundl::core::config_defaults(&ctx.paths);
        if (!bundl::core::is_ok(apply_options(opts, &ctx))) {
            return 2;
        }
        bundl::core::log_set_level(ctx.verbose ? bundl::core::LogLevel::Debug : bundl::core::LogLevel::Info);

        const CliArgs positional{cmd.args.argv + consumed, cmd.args.argc - consumed};
        switch (cmd.id) {
        case CommandId::Merge:
            return cmd_merge(ctx);
        case CommandId::Stage:
            return cmd_stage(ctx);
        case CommandId::Reconcile:
            return cmd_reconcile(ctx);
        case CommandId::Name:
            return cmd_name(ctx, positional);
        case CommandId::Parse:
            return cmd_parse(ctx, positional);
        case CommandId::Embed:
            return cmd_embed(ctx, positional);
        case CommandId::Help:
        case CommandId::None:
            break;
        }
        print_help(stderr);
        return 2;
    }

} // namespace bundl::cli
