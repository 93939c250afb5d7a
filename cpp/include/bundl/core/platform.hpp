#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include "bundl/core/diagnostics.hpp"
#include "bundl/core/errors.hpp"
#include "bundl/core/types.hpp"

namespace bundl::core {

    // Canonical runtime platform an artifact is built for. The enumerator
    // order is the canonical order used for hashing, merging and encoding.
    enum class PlatformKey : u8 {
        OSXPlayer = 0,
        WindowsPlayer = 1,
        LinuxPlayer = 2,
        IPhonePlayer = 3,
        Android = 4,
        WebGLPlayer = 5,
    };

    inline constexpr std::array<PlatformKey, 6> kAllPlatforms = {
        PlatformKey::OSXPlayer,
        PlatformKey::WindowsPlayer,
        PlatformKey::LinuxPlayer,
        PlatformKey::IPhonePlayer,
        PlatformKey::Android,
        PlatformKey::WebGLPlayer,
    };

    [[nodiscard]] const char* platform_name(PlatformKey key) noexcept;

    // Canonical names only ("WindowsPlayer", not "StandaloneWindows64").
    // Fails with UnknownPlatform.
    [[nodiscard]] Status platform_parse(std::string_view name, PlatformKey* out) noexcept;

    // Collapses a raw build target (architecture and editor variants
    // included) to its canonical key. Canonical names map to themselves,
    // so normalizing twice is the same as normalizing once.
    // Fails with UnsupportedPlatform for anything outside the table.
    [[nodiscard]] Status platform_normalize(std::string_view raw_target, PlatformKey* out) noexcept;

    struct NormalizedTargets {
        std::vector<PlatformKey> platforms;  // canonical order, no duplicates
        ArtifactErrors errors;               // one per unsupported raw target
    };

    // Normalizes every raw target; unsupported ones are reported and skipped.
    void platform_normalize_many(const std::vector<std::string>& raw_targets, NormalizedTargets* out);

} // namespace bundl::core
