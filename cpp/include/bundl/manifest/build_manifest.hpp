#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "bundl/core/diagnostics.hpp"
#include "bundl/core/errors.hpp"
#include "bundl/core/platform.hpp"
#include "bundl/core/types.hpp"

namespace bundl::manifest {

    // Output of one platform build, as reported by the external compiler.
    class BuildManifest {
    public:
        virtual ~BuildManifest() = default;

        [[nodiscard]] virtual std::vector<std::string> artifact_names() const = 0;

        // NotFound for a name the manifest does not list.
        [[nodiscard]] virtual bundl::core::Status hash_of(const std::string& name,
            bundl::core::Hash128* out) const noexcept = 0;

        [[nodiscard]] virtual std::vector<std::string> direct_dependencies_of(const std::string& name) const = 0;
    };

    // Manifest held in memory; what the directory compiler loads into.
    class MemoryManifest final : public BuildManifest {
    public:
        struct Entry {
            bundl::core::Hash128 hash{};
            std::vector<std::string> dependencies;
        };

        // Later adds of the same name replace the earlier entry.
        void add(std::string name, const bundl::core::Hash128& hash, std::vector<std::string> dependencies = {});

        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

        [[nodiscard]] std::vector<std::string> artifact_names() const override;
        [[nodiscard]] bundl::core::Status hash_of(const std::string& name,
            bundl::core::Hash128* out) const noexcept override;
        [[nodiscard]] std::vector<std::string> direct_dependencies_of(const std::string& name) const override;

    private:
        std::map<std::string, Entry> entries_;
    };

    struct PlatformManifest {
        bundl::core::PlatformKey platform{bundl::core::PlatformKey::OSXPlayer};
        const BuildManifest* manifest{nullptr};
    };

    using ManifestSet = std::vector<PlatformManifest>;

    struct BuildOutputs {
        std::vector<std::pair<bundl::core::PlatformKey, std::unique_ptr<BuildManifest>>> manifests;
        bundl::core::ArtifactErrors errors;  // unsupported or failed targets

        // Non-owning view for the merge engine.
        [[nodiscard]] ManifestSet view() const;
    };

    // Stand-in for the engine specific build pipeline.
    class ArtifactCompiler {
    public:
        virtual ~ArtifactCompiler() = default;

        // Normalizes raw_target and produces the manifest for its platform.
        [[nodiscard]] virtual bundl::core::Status build(std::string_view raw_target,
            bundl::core::PlatformKey* platform,
            std::unique_ptr<BuildManifest>* out) = 0;

        // Normalizes and dedupes the raw targets, then builds each platform
        // once. Unsupported or failing targets land in out->errors; the rest
        // still build. Returns Unavailable only when nothing was built.
        [[nodiscard]] bundl::core::Status build_many(const std::vector<std::string>& raw_targets, BuildOutputs* out);
    };

} // namespace bundl::manifest
