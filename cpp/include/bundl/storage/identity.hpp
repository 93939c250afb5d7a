#pragma once

#include <string>
#include <string_view>

#include "bundl/core/errors.hpp"
#include "bundl/core/platform.hpp"
#include "bundl/core/types.hpp"

namespace bundl::storage {

    // Staged and published artifacts are named
    //   {name}_{platform}_{hash}.bundle
    // so every platform variant and every historical build of one logical
    // artifact can live side by side in a flat directory.
    inline constexpr char kNameSeparator = '_';
    inline constexpr std::string_view kArtifactExtension = ".bundle";

    struct ArtifactIdentity {
        std::string name;
        bundl::core::PlatformKey platform{bundl::core::PlatformKey::OSXPlayer};
        bundl::core::Hash128 hash{};

        friend bool operator==(const ArtifactIdentity&, const ArtifactIdentity&) = default;
    };

    // Non-empty, and free of the separator, path separators and NUL.
    // Fails with InvalidArtifactName.
    [[nodiscard]] bundl::core::Status artifact_name_validate(std::string_view name) noexcept;

    // Fails with InvalidArtifactName for a bad name and InvalidHash for the zero hash.
    [[nodiscard]] bundl::core::Status identity_file_name(std::string_view name,
        bundl::core::PlatformKey platform,
        const bundl::core::Hash128& hash,
        std::string* out) noexcept;

    [[nodiscard]] bundl::core::Status identity_file_name(const ArtifactIdentity& id, std::string* out) noexcept;

    // Exact left inverse of identity_file_name. Anything it could not have
    // produced fails with MalformedArtifactName.
    [[nodiscard]] bundl::core::Status identity_parse_file_name(std::string_view file_name,
        ArtifactIdentity* out) noexcept;

} // namespace bundl::storage
