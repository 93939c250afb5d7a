#include "bundl/manifest/directory_compiler.hpp"

#include <fstream>
#include <new>
#include <utility>

#include <nlohmann/json.hpp>

#include "bundl/core/log.hpp"
#include "bundl/storage/hashing.hpp"
#include "bundl/storage/identity.hpp"

namespace bundl::manifest {
    using bundl::core::Status;
    using bundl::core::StatusCode;
    using bundl::core::StatusDomain;

    namespace {
        [[nodiscard]] Status invalid() noexcept {
            return bundl::core::make_status(StatusDomain::Manifest, StatusCode::Invalid);
        }

        // The name is also a file name inside the platform dir.
        [[nodiscard]] Status check_artifact_name(const std::string& name) noexcept {
            if (name == "." || name == "..") {
                return bundl::core::make_status(StatusDomain::Manifest, StatusCode::InvalidArtifactName);
            }
            return bundl::storage::artifact_name_validate(name);
        }
    } // namespace

    Status manifest_load_directory(const std::filesystem::path& platform_dir,
        MemoryManifest* out,
        bundl::core::ArtifactErrors* errors) noexcept {
        if (out == nullptr || errors == nullptr) {
            return invalid();
        }

        const std::filesystem::path manifest_path = platform_dir / kManifestFileName;
        std::ifstream in(manifest_path);
        if (!in) {
            return bundl::core::make_status(StatusDomain::Manifest, StatusCode::NotFound);
        }

        try {
            const nlohmann::json doc = nlohmann::json::parse(in);
            if (!doc.is_object() || !doc.contains("artifacts") || !doc["artifacts"].is_array()) {
                return invalid();
            }

            MemoryManifest manifest;
            for (const nlohmann::json& item : doc["artifacts"]) {
                if (!item.is_object() || !item.contains("name") || !item["name"].is_string()) {
                    return invalid();
                }
                std::string name = item["name"].get<std::string>();
                const Status ns = check_artifact_name(name);
                if (!bundl::core::is_ok(ns)) {
                    errors->push_back(bundl::core::make_error(ns, name, platform_dir.filename().string(),
                        "not a valid artifact name"));
                    continue;
                }

                std::vector<std::string> deps;
                if (item.contains("dependencies")) {
                    if (!item["dependencies"].is_array()) {
                        return invalid();
                    }
                    for (const nlohmann::json& dep : item["dependencies"]) {
                        if (!dep.is_string()) {
                            return invalid();
                        }
                        deps.push_back(dep.get<std::string>());
                    }
                }

                bundl::core::Hash128 hash{};
                Status s{};
                if (item.contains("hash")) {
                    s = item["hash"].is_string()
                        ? bundl::storage::hash_parse_hex(item["hash"].get<std::string>(), &hash)
                        : bundl::core::make_status(StatusDomain::Manifest, StatusCode::InvalidHash);
                } else {
                    s = bundl::storage::hash_file(platform_dir / name, &hash);
                }
                if (!bundl::core::is_ok(s)) {
                    errors->push_back(bundl::core::make_error(s, name, platform_dir.filename().string(),
                        "cannot determine content hash"));
                    continue;
                }

                manifest.add(std::move(name), hash, std::move(deps));
            }

            *out = std::move(manifest);
            return bundl::core::ok_status();
        } catch (const nlohmann::json::exception& e) {
            bundl::core::log_error("%s: %s", manifest_path.c_str(), e.what());
            return invalid();
        } catch (const std::bad_alloc&) {
            return bundl::core::make_status(StatusDomain::Manifest, StatusCode::Unavailable);
        }
    }

    DirectoryCompiler::DirectoryCompiler(std::filesystem::path build_root) : build_root_(std::move(build_root)) {
    }

    std::filesystem::path DirectoryCompiler::platform_dir(bundl::core::PlatformKey platform) const {
        return build_root_ / bundl::core::platform_name(platform);
    }

    Status DirectoryCompiler::build(std::string_view raw_target,
        bundl::core::PlatformKey* platform,
        std::unique_ptr<BuildManifest>* out) {
        if (platform == nullptr || out == nullptr) {
            return invalid();
        }

        bundl::core::PlatformKey key{};
        const Status ns = bundl::core::platform_normalize(raw_target, &key);
        if (!bundl::core::is_ok(ns)) {
            return ns;
        }

        auto manifest = std::make_unique<MemoryManifest>();
        const Status s = manifest_load_directory(platform_dir(key), manifest.get(), &load_errors_);
        if (!bundl::core::is_ok(s)) {
            return s;
        }

        bundl::core::log_debug("loaded %zu artifacts for %s", manifest->size(), bundl::core::platform_name(key));
        *platform = key;
        *out = std::move(manifest);
        return bundl::core::ok_status();
    }

} // namespace bundl::manifest
