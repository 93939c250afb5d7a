#include "bundl/storage/staging.hpp"

#include <algorithm>
#include <new>
#include <system_error>
#include <utility>

#include "bundl/core/log.hpp"
#include "bundl/manifest/build_manifest.hpp"

namespace bundl::storage {
    using bundl::core::Status;
    using bundl::core::StatusCode;
    using bundl::core::StatusDomain;
    namespace fs = std::filesystem;

    namespace {
        [[nodiscard]] Status io_status(const std::error_code& ec) noexcept {
            return bundl::core::make_status(StatusDomain::Storage, StatusCode::Io, static_cast<bundl::core::u32>(ec.value()));
        }

        [[nodiscard]] Status copy_artifact(const fs::path& from, const fs::path& to, std::error_code* ec) noexcept {
            fs::copy_file(from, to, fs::copy_options::overwrite_existing, *ec);
            if (*ec) {
                if (*ec == std::errc::no_such_file_or_directory) {
                    return bundl::core::make_status(StatusDomain::Storage, StatusCode::NotFound,
                        static_cast<bundl::core::u32>(ec->value()));
                }
                return io_status(*ec);
            }
            return bundl::core::ok_status();
        }
    } // namespace

    Status staged_file_name(const StagedArtifact& a, std::string* out) noexcept {
        return identity_file_name(a.identity, out);
    }

    Status staging_reset(const fs::path& dir) noexcept {
        std::error_code ec;
        fs::remove_all(dir, ec);
        if (ec) {
            bundl::core::log_error("cannot clear %s: %s", dir.c_str(), ec.message().c_str());
            return io_status(ec);
        }
        fs::create_directories(dir, ec);
        if (ec) {
            bundl::core::log_error("cannot create %s: %s", dir.c_str(), ec.message().c_str());
            return io_status(ec);
        }
        return bundl::core::ok_status();
    }

    Status stage_manifest(const fs::path& build_dir,
        bundl::core::PlatformKey platform,
        const bundl::manifest::BuildManifest& manifest,
        const fs::path& staging_dir,
        StagedArtifacts* staged,
        bundl::core::ArtifactErrors* errors) noexcept {
        if (staged == nullptr || errors == nullptr) {
            return bundl::core::make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        try {
            std::error_code ec;
            fs::create_directories(staging_dir, ec);
            if (ec) {
                return io_status(ec);
            }

            const char* platform_str = bundl::core::platform_name(platform);
            for (const std::string& name : manifest.artifact_names()) {
                StagedArtifact a{};
                a.identity.name = name;
                a.identity.platform = platform;

                Status s = manifest.hash_of(name, &a.identity.hash);
                std::string file_name;
                if (bundl::core::is_ok(s)) {
                    s = identity_file_name(a.identity, &file_name);
                }
                if (bundl::core::is_ok(s)) {
                    a.path = staging_dir / file_name;
                    s = copy_artifact(build_dir / name, a.path, &ec);
                }
                if (!bundl::core::is_ok(s)) {
                    errors->push_back(bundl::core::make_error(s, name, platform_str,
                        ec ? ec.message() : std::string("not staged")));
                    ec.clear();
                    continue;
                }

                bundl::core::log_debug("staged %s", file_name.c_str());
                staged->push_back(std::move(a));
            }
            return bundl::core::ok_status();
        } catch (const std::bad_alloc&) {
            return bundl::core::make_status(StatusDomain::Storage, StatusCode::Unavailable);
        }
    }

    Status staging_scan(const fs::path& dir, StagedArtifacts* staged, bundl::core::ArtifactErrors* errors) noexcept {
        if (staged == nullptr || errors == nullptr) {
            return bundl::core::make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        try {
            std::error_code ec;
            fs::directory_iterator it(dir, ec);
            if (ec) {
                if (ec == std::errc::no_such_file_or_directory) {
                    return bundl::core::make_status(StatusDomain::Storage, StatusCode::NotFound,
                        static_cast<bundl::core::u32>(ec.value()));
                }
                return io_status(ec);
            }

            StagedArtifacts found;
            for (; it != fs::directory_iterator(); it.increment(ec)) {
                if (ec) {
                    return io_status(ec);
                }
                std::error_code type_ec;
                if (!it->is_regular_file(type_ec)) {
                    continue;
                }

                const std::string file_name = it->path().filename().string();
                StagedArtifact a{};
                const Status s = identity_parse_file_name(file_name, &a.identity);
                if (!bundl::core::is_ok(s)) {
                    errors->push_back(bundl::core::make_error(s, file_name, {}, "not an artifact file name"));
                    continue;
                }
                a.path = it->path();
                found.push_back(std::move(a));
            }
            if (ec) {
                return io_status(ec);
            }

            std::sort(found.begin(), found.end(), [](const StagedArtifact& l, const StagedArtifact& r) {
                return l.path.filename() < r.path.filename();
            });
            for (StagedArtifact& a : found) {
                staged->push_back(std::move(a));
            }
            return bundl::core::ok_status();
        } catch (const std::bad_alloc&) {
            return bundl::core::make_status(StatusDomain::Storage, StatusCode::Unavailable);
        }
    }

    Status embed_copy(const fs::path& build_dir,
        bundl::core::PlatformKey platform,
        const bundl::manifest::BuildManifest& manifest,
        const std::vector<std::string>& names,
        const fs::path& embed_dir,
        std::vector<std::string>* embedded,
        bundl::core::ArtifactErrors* errors) noexcept {
        if (embedded == nullptr || errors == nullptr) {
            return bundl::core::make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        const Status rs = staging_reset(embed_dir);
        if (!bundl::core::is_ok(rs)) {
            return rs;
        }

        try {
            const char* platform_str = bundl::core::platform_name(platform);
            const std::vector<std::string> known = manifest.artifact_names();
            for (const std::string& name : names) {
                Status s = artifact_name_validate(name);
                if (bundl::core::is_ok(s) && std::find(known.begin(), known.end(), name) == known.end()) {
                    s = bundl::core::make_status(StatusDomain::Storage, StatusCode::NotFound);
                }
                if (!bundl::core::is_ok(s)) {
                    bundl::core::log_warn("cannot embed unknown artifact %s", name.c_str());
                    errors->push_back(bundl::core::make_error(s, name, platform_str, "unknown artifact"));
                    continue;
                }

                std::error_code ec;
                s = copy_artifact(build_dir / name, embed_dir / name, &ec);
                if (s.code == StatusCode::NotFound) {
                    bundl::core::log_warn("%s has not been built for %s, build before embedding",
                        name.c_str(), platform_str);
                    errors->push_back(bundl::core::make_error(s, name, platform_str, "not built"));
                    continue;
                }
                if (!bundl::core::is_ok(s)) {
                    errors->push_back(bundl::core::make_error(s, name, platform_str, ec.message()));
                    continue;
                }

                bundl::core::log_debug("embedded %s", name.c_str());
                embedded->push_back(name);
            }
            return bundl::core::ok_status();
        } catch (const std::bad_alloc&) {
            return bundl::core::make_status(StatusDomain::Storage, StatusCode::Unavailable);
        }
    }

    Status upload_prepare(const StagedArtifacts& needs_upload,
        const fs::path& upload_dir,
        bundl::core::ArtifactErrors* errors) noexcept {
        if (errors == nullptr) {
            return bundl::core::make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        const Status rs = staging_reset(upload_dir);
        if (!bundl::core::is_ok(rs)) {
            return rs;
        }

        try {
            for (const StagedArtifact& a : needs_upload) {
                std::string file_name;
                Status s = staged_file_name(a, &file_name);
                std::error_code ec;
                if (bundl::core::is_ok(s)) {
                    s = copy_artifact(a.path, upload_dir / file_name, &ec);
                }
                if (!bundl::core::is_ok(s)) {
                    errors->push_back(bundl::core::make_error(s, a.identity.name,
                        bundl::core::platform_name(a.identity.platform),
                        ec ? ec.message() : std::string("not copied")));
                    continue;
                }
                bundl::core::log_info("queued %s for upload", file_name.c_str());
            }
            return bundl::core::ok_status();
        } catch (const std::bad_alloc&) {
            return bundl::core::make_status(StatusDomain::Storage, StatusCode::Unavailable);
        }
    }

} // namespace bundl::storage
