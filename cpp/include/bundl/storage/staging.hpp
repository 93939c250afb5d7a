#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "bundl/core/diagnostics.hpp"
#include "bundl/core/errors.hpp"
#include "bundl/core/platform.hpp"
#include "bundl/storage/identity.hpp"

namespace bundl::manifest {
    class BuildManifest;
}

namespace bundl::storage {

    // A built artifact copied into the staging directory under its
    // canonical file name.
    struct StagedArtifact {
        ArtifactIdentity identity;
        std::filesystem::path path;
    };

    using StagedArtifacts = std::vector<StagedArtifact>;

    [[nodiscard]] bundl::core::Status staged_file_name(const StagedArtifact& a, std::string* out) noexcept;

    // Removes dir and everything below it, then recreates it empty.
    [[nodiscard]] bundl::core::Status staging_reset(const std::filesystem::path& dir) noexcept;

    // Copies {build_dir}/{name} to {staging_dir}/{name}_{platform}_{hash}.bundle
    // for every artifact of the manifest. Artifacts that fail (bad name,
    // missing file, copy error) are reported in errors and skipped.
    [[nodiscard]] bundl::core::Status stage_manifest(const std::filesystem::path& build_dir,
        bundl::core::PlatformKey platform,
        const bundl::manifest::BuildManifest& manifest,
        const std::filesystem::path& staging_dir,
        StagedArtifacts* staged,
        bundl::core::ArtifactErrors* errors) noexcept;

    // Every regular file whose name parses as an artifact identity, sorted by
    // file name. Other files are reported as MalformedArtifactName.
    [[nodiscard]] bundl::core::Status staging_scan(const std::filesystem::path& dir,
        StagedArtifacts* staged,
        bundl::core::ArtifactErrors* errors) noexcept;

    // Resets embed_dir and copies {build_dir}/{name} to {embed_dir}/{name}
    // for each requested name, so only one platform's artifacts are ever
    // embedded. A name the manifest does not list, or one with no built
    // file, is logged as a warning, reported in errors and skipped.
    // embedded receives the names that were copied.
    [[nodiscard]] bundl::core::Status embed_copy(const std::filesystem::path& build_dir,
        bundl::core::PlatformKey platform,
        const bundl::manifest::BuildManifest& manifest,
        const std::vector<std::string>& names,
        const std::filesystem::path& embed_dir,
        std::vector<std::string>* embedded,
        bundl::core::ArtifactErrors* errors) noexcept;

    // Resets upload_dir and copies each artifact into it under its file name.
    [[nodiscard]] bundl::core::Status upload_prepare(const StagedArtifacts& needs_upload,
        const std::filesystem::path& upload_dir,
        bundl::core::ArtifactErrors* errors) noexcept;

} // namespace bundl::storage
