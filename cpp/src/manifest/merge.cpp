#include "bundl/manifest/merge.hpp"

#include <algorithm>
#include <exception>
#include <map>
#include <utility>

#include "bundl/core/log.hpp"
#include "bundl/storage/hashing.hpp"

namespace bundl::manifest {
    using bundl::core::PlatformKey;
    using bundl::core::Status;
    using bundl::core::StatusCode;
    using bundl::core::StatusDomain;

    namespace {
        struct Accumulator {
            PlatformHashes hashes;
            DependencySet dependencies;
            PlatformKey dependencies_from{PlatformKey::OSXPlayer};
        };

        std::string join(const DependencySet& deps) {
            std::string out = "[";
            for (const std::string& d : deps) {
                if (out.size() > 1) {
                    out += ", ";
                }
                out += d;
            }
            out += "]";
            return out;
        }

        void merge_platform(PlatformKey platform,
            const BuildManifest& manifest,
            std::map<std::string, Accumulator>* accs,
            MergeResult* out) {
            const char* platform_str = bundl::core::platform_name(platform);

            for (const std::string& name : manifest.artifact_names()) {
                const std::vector<std::string> direct = manifest.direct_dependencies_of(name);
                DependencySet deps(direct.begin(), direct.end());

                auto it = accs->find(name);
                if (it == accs->end()) {
                    Accumulator acc{};
                    acc.dependencies = std::move(deps);
                    acc.dependencies_from = platform;
                    it = accs->emplace(name, std::move(acc)).first;
                } else if (deps != it->second.dependencies) {
                    bundl::core::log_warn("%s: dependencies on %s %s differ from %s %s; keeping %s",
                        name.c_str(),
                        platform_str, join(deps).c_str(),
                        bundl::core::platform_name(it->second.dependencies_from),
                        join(it->second.dependencies).c_str(),
                        bundl::core::platform_name(it->second.dependencies_from));

                    DependencyDivergence d{};
                    d.artifact = name;
                    d.recorded_from = it->second.dependencies_from;
                    d.platform = platform;
                    d.recorded = it->second.dependencies;
                    d.reported = std::move(deps);
                    out->divergences.push_back(std::move(d));
                }

                bundl::core::Hash128 hash{};
                Status s = manifest.hash_of(name, &hash);
                if (bundl::core::is_ok(s) && bundl::storage::hash_is_zero(hash)) {
                    s = bundl::core::make_status(StatusDomain::Manifest, StatusCode::InvalidHash);
                }
                if (!bundl::core::is_ok(s)) {
                    out->errors.push_back(bundl::core::make_error(s, name, platform_str, "no usable content hash"));
                    continue;
                }
                it->second.hashes[platform] = hash;
            }
        }
    } // namespace

    Status manifest_merge(const ManifestSet& manifests, MergeResult* out) noexcept {
        if (out == nullptr) {
            return bundl::core::make_status(StatusDomain::Manifest, StatusCode::Invalid);
        }
        *out = MergeResult{};

        try {
            ManifestSet ordered = manifests;
            std::sort(ordered.begin(), ordered.end(),
                [](const PlatformManifest& a, const PlatformManifest& b) { return a.platform < b.platform; });
            for (std::size_t i = 0; i < ordered.size(); ++i) {
                if (ordered[i].manifest == nullptr) {
                    return bundl::core::make_status(StatusDomain::Manifest, StatusCode::Invalid);
                }
                if (i > 0 && ordered[i - 1].platform == ordered[i].platform) {
                    return bundl::core::make_status(StatusDomain::Manifest, StatusCode::Conflict,
                        static_cast<bundl::core::u32>(ordered[i].platform));
                }
            }

            // std::map keeps the output sorted by artifact name.
            std::map<std::string, Accumulator> accs;
            for (const PlatformManifest& pm : ordered) {
                merge_platform(pm.platform, *pm.manifest, &accs, out);
            }

            for (const auto& [name, acc] : accs) {
                for (const std::string& dep : acc.dependencies) {
                    if (accs.find(dep) == accs.end()) {
                        bundl::core::log_warn("%s depends on %s, which no platform built", name.c_str(), dep.c_str());
                        out->dangling.push_back(DanglingDependency{name, dep});
                    }
                }
            }

            out->descriptions.reserve(accs.size());
            for (auto& [name, acc] : accs) {
                if (acc.hashes.empty()) {
                    bundl::core::log_warn("%s has no supported platforms", name.c_str());
                }
                ArtifactDescription d;
                const Status s = ArtifactDescription::create(name, std::move(acc.hashes), std::move(acc.dependencies), &d);
                if (!bundl::core::is_ok(s)) {
                    out->errors.push_back(bundl::core::make_error(s, name, {}, "cannot describe artifact"));
                    continue;
                }
                out->descriptions.push_back(std::move(d));
            }
            return bundl::core::ok_status();
        } catch (const std::exception& e) {
            bundl::core::log_error("merge aborted: %s", e.what());
            *out = MergeResult{};
            return bundl::core::make_status(StatusDomain::Manifest, StatusCode::Unknown);
        }
    }

} // namespace bundl::manifest
