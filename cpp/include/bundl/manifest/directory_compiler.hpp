#pragma once

#include <filesystem>
#include <memory>
#include <string_view>

#include "bundl/core/diagnostics.hpp"
#include "bundl/core/errors.hpp"
#include "bundl/manifest/build_manifest.hpp"

namespace bundl::manifest {

    inline constexpr const char* kManifestFileName = "manifest.json";

    // Loads {platform_dir}/manifest.json:
    //   {"artifacts": [{"name": "a", "dependencies": ["b"], "hash": "<32 hex>"}]}
    // "hash" is optional; when absent the artifact file {platform_dir}/{name}
    // is hashed with BLAKE3. Artifacts whose hash cannot be determined are
    // left out and reported in errors. A missing or unparsable manifest
    // fails the whole load.
    [[nodiscard]] bundl::core::Status manifest_load_directory(const std::filesystem::path& platform_dir,
        MemoryManifest* out,
        bundl::core::ArtifactErrors* errors) noexcept;

    // Reads build output that an external pipeline wrote to
    // {build_root}/{PlatformKey}/.
    class DirectoryCompiler final : public ArtifactCompiler {
    public:
        explicit DirectoryCompiler(std::filesystem::path build_root);

        [[nodiscard]] bundl::core::Status build(std::string_view raw_target,
            bundl::core::PlatformKey* platform,
            std::unique_ptr<BuildManifest>* out) override;

        [[nodiscard]] std::filesystem::path platform_dir(bundl::core::PlatformKey platform) const;

        // Per-artifact problems seen by the last build() calls.
        [[nodiscard]] const bundl::core::ArtifactErrors& load_errors() const noexcept { return load_errors_; }

    private:
        std::filesystem::path build_root_;
        bundl::core::ArtifactErrors load_errors_;
    };

} // namespace bundl::manifest
