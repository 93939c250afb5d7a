#pragma once

#include <string>
#include <vector>

#include "bundl/core/diagnostics.hpp"
#include "bundl/core/errors.hpp"
#include "bundl/core/platform.hpp"
#include "bundl/manifest/build_manifest.hpp"
#include "bundl/manifest/description.hpp"

namespace bundl::manifest {

    // Two platforms computed different direct dependencies for one artifact.
    // The merged description keeps `recorded`.
    struct DependencyDivergence {
        std::string artifact;
        bundl::core::PlatformKey recorded_from{bundl::core::PlatformKey::OSXPlayer};
        bundl::core::PlatformKey platform{bundl::core::PlatformKey::OSXPlayer};
        DependencySet recorded;
        DependencySet reported;
    };

    // A dependency naming an artifact that no manifest built.
    struct DanglingDependency {
        std::string artifact;
        std::string dependency;
    };

    struct MergeResult {
        DescriptionList descriptions;  // sorted by name
        std::vector<DependencyDivergence> divergences;
        std::vector<DanglingDependency> dangling;
        bundl::core::ArtifactErrors errors;
    };

    // Folds per-platform manifests into one description per artifact.
    //
    // Manifests are visited in canonical platform order whatever order the
    // set lists them in. hashes[platform] comes from every manifest; the
    // dependency set comes from the first manifest that lists the artifact
    // and later disagreements are reported as divergences, never merged.
    // A hash that cannot be read (or is zero) is an InvalidHash error for
    // that artifact and platform only; such an artifact may end up with no
    // platforms at all, which is kept.
    //
    // Fails with Conflict when a platform appears twice and Invalid for a
    // null manifest; per-artifact problems never fail the call.
    [[nodiscard]] bundl::core::Status manifest_merge(const ManifestSet& manifests, MergeResult* out) noexcept;

} // namespace bundl::manifest
