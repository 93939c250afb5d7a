#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "bundl/core/errors.hpp"
#include "bundl/core/platform.hpp"
#include "bundl/core/types.hpp"

namespace bundl::manifest {

    // Only platforms the artifact was built for are present.
    using PlatformHashes = std::map<bundl::core::PlatformKey, bundl::core::Hash128>;
    using DependencySet = std::set<std::string>;

    // Cross-platform record of one artifact. Immutable: a rebuild produces a
    // new description (see superseded_by) instead of editing this one.
    class ArtifactDescription {
    public:
        // Placeholder for out-parameters and containers. It has no name and
        // is rejected by the list helpers and the codec; use create() for
        // real descriptions.
        ArtifactDescription() = default;

        // Fails with Invalid for an empty name and InvalidHash for a zero hash.
        // An empty hash map is allowed.
        [[nodiscard]] static bundl::core::Status create(std::string name,
            PlatformHashes hashes,
            DependencySet dependencies,
            ArtifactDescription* out) noexcept;

        [[nodiscard]] bool is_placeholder() const noexcept { return name_.empty(); }

        [[nodiscard]] const std::string& name() const noexcept { return name_; }
        [[nodiscard]] const PlatformHashes& hashes() const noexcept { return hashes_; }
        [[nodiscard]] const DependencySet& dependencies() const noexcept { return dependencies_; }

        [[nodiscard]] bool supports(bundl::core::PlatformKey platform) const noexcept;
        [[nodiscard]] bool hash_for(bundl::core::PlatformKey platform, bundl::core::Hash128* out) const noexcept;

        // NotFound when the artifact is not built for the platform.
        [[nodiscard]] bundl::core::Status file_name_for(bundl::core::PlatformKey platform, std::string* out) const noexcept;

        // Copy of this description with hashes[platform] replaced.
        [[nodiscard]] bundl::core::Status superseded_by(bundl::core::PlatformKey platform,
            const bundl::core::Hash128& hash,
            ArtifactDescription* out) const noexcept;

        // BLAKE3 over name, hashes in canonical platform order and sorted
        // dependencies. Equal descriptions always give equal digests.
        [[nodiscard]] bundl::core::Hash256 digest() const noexcept;

        friend bool operator==(const ArtifactDescription&, const ArtifactDescription&) = default;

    private:
        std::string name_;
        PlatformHashes hashes_;
        DependencySet dependencies_;
    };

    using DescriptionList = std::vector<ArtifactDescription>;

    // Replaces the entry with the same name (or inserts one), keeping the
    // list sorted by name. Returns true when an entry was replaced. A
    // placeholder leaves the list unchanged.
    bool description_list_upsert(DescriptionList* list, ArtifactDescription description);

    [[nodiscard]] const ArtifactDescription* description_list_find(const DescriptionList& list,
        const std::string& name) noexcept;

} // namespace bundl::manifest

template <>
struct std::hash<bundl::manifest::ArtifactDescription> {
    std::size_t operator()(const bundl::manifest::ArtifactDescription& d) const noexcept;
};
