#pragma once

#include <cstdio>
#include <string>
#include <type_traits>
#include <vector>

#include "bundl/cli/options.hpp"
#include "bundl/core/config.hpp"
#include "bundl/core/errors.hpp"

namespace bundl::cli {
    using u32 = bundl::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Merge = 2,
        Stage = 3,
        Reconcile = 4,
        Name = 5,
        Parse = 6,
        Embed = 7,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // Matches argv[0] against specs; out->args is everything after it.
    [[nodiscard]] bundl::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    // Settings for one invocation, built from config_defaults() and then
    // overridden by the command line.
    struct CliContext {
        bundl::core::PipelineConfig paths;
        bundl::core::ReconcileConfig reconcile;
        std::vector<std::string> targets;  // raw targets; empty means every platform
        std::string output;                // empty means stdout
        std::string pointer;               // JSON Pointer for parse --pointer
        bool verbose{false};
    };

    // Invalid for negative or out of range numbers and a zero --jobs.
    [[nodiscard]] bundl::core::Status apply_options(const ParsedOptions& opts, CliContext* ctx);

    // Each returns the process exit code.
    int cmd_merge(const CliContext& ctx);
    int cmd_stage(const CliContext& ctx);
    int cmd_reconcile(const CliContext& ctx);
    int cmd_name(const CliContext& ctx, const CliArgs& positional);
    int cmd_parse(const CliContext& ctx, const CliArgs& positional);
    int cmd_embed(const CliContext& ctx, const CliArgs& positional);
    void print_help(std::FILE* out);

    // Whole tool behind main(); args excludes the program name.
    int cli_main(const CliArgs& args);

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace bundl::cli
