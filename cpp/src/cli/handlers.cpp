#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "bundl/cli/commands.hpp"
#include "bundl/codec/description_codec.hpp"
#include "bundl/core/diagnostics.hpp"
#include "bundl/core/log.hpp"
#include "bundl/core/platform.hpp"
#include "bundl/manifest/directory_compiler.hpp"
#include "bundl/manifest/merge.hpp"
#include "bundl/net/probe.hpp"
#include "bundl/net/reconcile.hpp"
#include "bundl/storage/hashing.hpp"
#include "bundl/storage/identity.hpp"
#include "bundl/storage/staging.hpp"

namespace bundl::cli {
    using bundl::core::ArtifactErrors;
    using bundl::core::Status;
    using bundl::core::StatusCode;

    namespace {
        // Unsupported targets and stray files in the staging dir are
        // reported but do not fail the run.
        [[nodiscard]] bool has_blocking_errors(const ArtifactErrors& errors) noexcept {
            for (const bundl::core::ArtifactError& e : errors) {
                if (e.status.code != StatusCode::UnsupportedPlatform &&
                    e.status.code != StatusCode::MalformedArtifactName) {
                    return true;
                }
            }
            return false;
        }

        void report(const ArtifactErrors& errors) {
            if (!errors.empty()) {
                std::fputs(bundl::core::format_error_summary(errors).c_str(), stderr);
            }
        }

        void print_status_error(const char* context, Status s) {
            bundl::core::log_error("%s failed (%s, %s)",
                context,
                bundl::core::status_code_name(s.code),
                bundl::core::status_domain_name(s.domain));
        }

        // Without --target, every platform that has a build dir.
        [[nodiscard]] std::vector<std::string> targets_or_present(const CliContext& ctx) {
            if (!ctx.targets.empty()) {
                return ctx.targets;
            }
            std::vector<std::string> present;
            for (bundl::core::PlatformKey p : bundl::core::kAllPlatforms) {
                std::error_code ec;
                if (std::filesystem::is_directory(ctx.paths.build_root / bundl::core::platform_name(p), ec)) {
                    present.emplace_back(bundl::core::platform_name(p));
                }
            }
            return present;
        }

        [[nodiscard]] Status load_outputs(const CliContext& ctx,
            bundl::manifest::DirectoryCompiler* compiler,
            bundl::manifest::BuildOutputs* outputs,
            ArtifactErrors* errors) {
            const Status s = compiler->build_many(targets_or_present(ctx), outputs);
            for (bundl::core::ArtifactError& e : outputs->errors) {
                errors->push_back(std::move(e));
            }
            errors->insert(errors->end(), compiler->load_errors().begin(), compiler->load_errors().end());
            if (!bundl::core::is_ok(s)) {
                bundl::core::log_error("no build output under %s", ctx.paths.build_root.c_str());
            }
            return s;
        }

        [[nodiscard]] bool ends_with(std::string_view s, std::string_view suffix) noexcept {
            return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
        }

        [[nodiscard]] int parse_document(const CliContext& ctx, const char* path) {
            bundl::codec::DecodeOptions options;
            options.path = ctx.pointer;
            options.mode = bundl::codec::DecodeMode::SkipInvalid;

            bundl::codec::DecodeResult decoded;
            const Status s = bundl::codec::codec_read_file(path, options, &decoded);
            if (!bundl::core::is_ok(s)) {
                print_status_error(path, s);
                return 1;
            }

            for (const bundl::manifest::ArtifactDescription& d : decoded.descriptions) {
                for (const auto& [platform, hash] : d.hashes()) {
                    std::string file_name;
                    if (bundl::core::is_ok(d.file_name_for(platform, &file_name))) {
                        std::printf("%s\n", file_name.c_str());
                    }
                }
            }
            report(decoded.errors);
            return decoded.errors.empty() ? 0 : 1;
        }
    } // namespace

    int cmd_merge(const CliContext& ctx) {
        bundl::manifest::DirectoryCompiler compiler(ctx.paths.build_root);
        bundl::manifest::BuildOutputs outputs;
        ArtifactErrors errors;
        if (!bundl::core::is_ok(load_outputs(ctx, &compiler, &outputs, &errors))) {
            report(errors);
            return 1;
        }

        bundl::manifest::MergeResult merged;
        Status s = bundl::manifest::manifest_merge(outputs.view(), &merged);
        if (!bundl::core::is_ok(s)) {
            print_status_error("merge", s);
            return 1;
        }
        errors.insert(errors.end(), merged.errors.begin(), merged.errors.end());

        if (ctx.output.empty()) {
            std::string text;
            s = bundl::codec::codec_encode_string(merged.descriptions, 2, &text);
            if (bundl::core::is_ok(s)) {
                std::printf("%s\n", text.c_str());
            }
        } else {
            s = bundl::codec::codec_write_file(ctx.output, merged.descriptions);
        }
        if (!bundl::core::is_ok(s)) {
            print_status_error("write descriptions", s);
            return 1;
        }

        bundl::core::log_info("merged %zu artifacts from %zu platforms",
            merged.descriptions.size(), outputs.manifests.size());
        report(errors);
        return has_blocking_errors(errors) ? 1 : 0;
    }

    int cmd_stage(const CliContext& ctx) {
        bundl::manifest::DirectoryCompiler compiler(ctx.paths.build_root);
        bundl::manifest::BuildOutputs outputs;
        ArtifactErrors errors;
        if (!bundl::core::is_ok(load_outputs(ctx, &compiler, &outputs, &errors))) {
            report(errors);
            return 1;
        }

        Status s = bundl::storage::staging_reset(ctx.paths.staging_dir);
        if (!bundl::core::is_ok(s)) {
            print_status_error("reset staging", s);
            return 1;
        }

        bundl::storage::StagedArtifacts staged;
        for (const auto& [platform, manifest] : outputs.manifests) {
            s = bundl::storage::stage_manifest(compiler.platform_dir(platform), platform, *manifest,
                ctx.paths.staging_dir, &staged, &errors);
            if (!bundl::core::is_ok(s)) {
                print_status_error("stage", s);
                return 1;
            }
        }

        bundl::core::log_info("staged %zu artifacts in %s", staged.size(), ctx.paths.staging_dir.c_str());
        report(errors);
        return has_blocking_errors(errors) ? 1 : 0;
    }

    int cmd_reconcile(const CliContext& ctx) {
        if (ctx.paths.remote_root.empty()) {
            bundl::core::log_error("reconcile needs --remote");
            return 2;
        }

        ArtifactErrors errors;
        bundl::storage::StagedArtifacts staged;
        Status s = bundl::storage::staging_scan(ctx.paths.staging_dir, &staged, &errors);
        if (!bundl::core::is_ok(s)) {
            print_status_error("scan staging", s);
            return 1;
        }

        bundl::net::DirectoryProbe probe(ctx.paths.remote_root);
        bundl::net::ReconcileResult result;
        s = bundl::net::reconcile(staged, probe, ctx.reconcile, &result);
        if (!bundl::core::is_ok(s)) {
            print_status_error("reconcile", s);
            return 1;
        }
        errors.insert(errors.end(), result.errors.begin(), result.errors.end());

        s = bundl::storage::upload_prepare(result.needs_upload, ctx.paths.upload_dir, &errors);
        if (!bundl::core::is_ok(s)) {
            print_status_error("prepare upload", s);
            return 1;
        }

        bundl::core::log_info("%zu published, %zu to upload, %zu unresolved (%llu probes)",
            result.published.size(),
            result.needs_upload.size(),
            result.errors.size(),
            static_cast<unsigned long long>(result.attempts));
        report(errors);
        return has_blocking_errors(errors) ? 1 : 0;
    }

    int cmd_embed(const CliContext& ctx, const CliArgs& positional) {
        if (ctx.targets.size() != 1 || positional.argc == 0) {
            bundl::core::log_error("usage: bundl embed --target TARGET NAME...");
            return 2;
        }

        bundl::manifest::DirectoryCompiler compiler(ctx.paths.build_root);
        bundl::core::PlatformKey platform{};
        std::unique_ptr<bundl::manifest::BuildManifest> manifest;
        Status s = compiler.build(ctx.targets[0], &platform, &manifest);
        if (!bundl::core::is_ok(s)) {
            print_status_error(ctx.targets[0].c_str(), s);
            return 1;
        }

        std::vector<std::string> names;
        for (u32 i = 0; i < positional.argc; ++i) {
            names.emplace_back(positional.argv[i]);
        }

        ArtifactErrors errors(compiler.load_errors());
        std::vector<std::string> embedded;
        s = bundl::storage::embed_copy(compiler.platform_dir(platform), platform, *manifest, names,
            ctx.paths.embedded_dir, &embedded, &errors);
        if (!bundl::core::is_ok(s)) {
            print_status_error("embed", s);
            return 1;
        }

        bundl::core::log_info("embedded %zu of %zu artifacts for %s in %s",
            embedded.size(), names.size(), bundl::core::platform_name(platform), ctx.paths.embedded_dir.c_str());
        report(errors);

        // Unknown and unbuilt names were skipped with a warning.
        for (const bundl::core::ArtifactError& e : errors) {
            if (e.status.code == StatusCode::Io) {
                return 1;
            }
        }
        return 0;
    }

    int cmd_name(const CliContext& ctx, const CliArgs& positional) {
        (void)ctx;
        if (positional.argc != 3) {
            bundl::core::log_error("usage: bundl name NAME TARGET HASH");
            return 2;
        }

        bundl::core::PlatformKey platform{};
        Status s = bundl::core::platform_normalize(positional.argv[1], &platform);
        if (!bundl::core::is_ok(s)) {
            bundl::core::log_error("unsupported build target %s", positional.argv[1]);
            return 1;
        }
        bundl::core::Hash128 hash{};
        s = bundl::storage::hash_parse_hex(positional.argv[2], &hash);
        if (!bundl::core::is_ok(s)) {
            bundl::core::log_error("invalid hash %s", positional.argv[2]);
            return 1;
        }

        std::string file_name;
        s = bundl::storage::identity_file_name(positional.argv[0], platform, hash, &file_name);
        if (!bundl::core::is_ok(s)) {
            print_status_error("name", s);
            return 1;
        }
        std::printf("%s\n", file_name.c_str());
        return 0;
    }

    int cmd_parse(const CliContext& ctx, const CliArgs& positional) {
        if (positional.argc == 0) {
            bundl::core::log_error("usage: bundl parse FILE_NAME... | DESCRIPTIONS.json");
            return 2;
        }

        int rc = 0;
        for (u32 i = 0; i < positional.argc; ++i) {
            const char* arg = positional.argv[i];
            if (ends_with(arg, ".json")) {
                if (parse_document(ctx, arg) != 0) {
                    rc = 1;
                }
                continue;
            }

            bundl::storage::ArtifactIdentity id;
            const Status s = bundl::storage::identity_parse_file_name(arg, &id);
            if (!bundl::core::is_ok(s)) {
                bundl::core::log_error("%s: not an artifact file name", arg);
                rc = 1;
                continue;
            }
            std::printf("%s %s %s\n",
                id.name.c_str(),
                bundl::core::platform_name(id.platform),
                bundl::storage::hash_to_hex(id.hash).c_str());
        }
        return rc;
    }

} // namespace bundl::cli
