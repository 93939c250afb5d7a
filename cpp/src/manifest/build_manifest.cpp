#include "bundl/manifest/build_manifest.hpp"

#include "bundl/core/log.hpp"

namespace bundl::manifest {
    using bundl::core::Status;
    using bundl::core::StatusCode;
    using bundl::core::StatusDomain;

    void MemoryManifest::add(std::string name, const bundl::core::Hash128& hash, std::vector<std::string> dependencies) {
        Entry e{};
        e.hash = hash;
        e.dependencies = std::move(dependencies);
        entries_[std::move(name)] = std::move(e);
    }

    std::vector<std::string> MemoryManifest::artifact_names() const {
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& [name, entry] : entries_) {
            out.push_back(name);
        }
        return out;
    }

    Status MemoryManifest::hash_of(const std::string& name, bundl::core::Hash128* out) const noexcept {
        if (out == nullptr) {
            return bundl::core::make_status(StatusDomain::Manifest, StatusCode::Invalid);
        }
        const auto it = entries_.find(name);
        if (it == entries_.end()) {
            return bundl::core::make_status(StatusDomain::Manifest, StatusCode::NotFound);
        }
        *out = it->second.hash;
        return bundl::core::ok_status();
    }

    std::vector<std::string> MemoryManifest::direct_dependencies_of(const std::string& name) const {
        const auto it = entries_.find(name);
        if (it == entries_.end()) {
            return {};
        }
        return it->second.dependencies;
    }

    ManifestSet BuildOutputs::view() const {
        ManifestSet out;
        out.reserve(manifests.size());
        for (const auto& [platform, manifest] : manifests) {
            out.push_back(PlatformManifest{platform, manifest.get()});
        }
        return out;
    }

    Status ArtifactCompiler::build_many(const std::vector<std::string>& raw_targets, BuildOutputs* out) {
        if (out == nullptr) {
            return bundl::core::make_status(StatusDomain::Manifest, StatusCode::Invalid);
        }
        out->manifests.clear();
        out->errors.clear();

        bundl::core::NormalizedTargets targets{};
        bundl::core::platform_normalize_many(raw_targets, &targets);
        for (const bundl::core::ArtifactError& e : targets.errors) {
            bundl::core::log_warn("skipping unsupported build target %s", e.artifact.c_str());
        }
        out->errors = std::move(targets.errors);

        for (bundl::core::PlatformKey platform : targets.platforms) {
            const char* name = bundl::core::platform_name(platform);
            bundl::core::PlatformKey built{};
            std::unique_ptr<BuildManifest> manifest;
            Status s = build(name, &built, &manifest);
            if (bundl::core::is_ok(s) && manifest == nullptr) {
                s = bundl::core::make_status(StatusDomain::Manifest, StatusCode::Unknown);
            }
            if (!bundl::core::is_ok(s)) {
                bundl::core::log_error("build for %s failed (%s)", name, bundl::core::status_code_name(s.code));
                out->errors.push_back(bundl::core::make_error(s, name, name, "build failed"));
                continue;
            }
            out->manifests.emplace_back(built, std::move(manifest));
        }

        if (out->manifests.empty()) {
            return bundl::core::make_status(StatusDomain::Manifest, StatusCode::Unavailable);
        }
        return bundl::core::ok_status();
    }

} // namespace bundl::manifest
