#include "bundl/core/platform.hpp"

#include <algorithm>

namespace bundl::core {
    namespace {
        struct RawTargetMapping {
            std::string_view raw;
            PlatformKey key;
        };

        // 32/64-bit, universal and editor variants share the player's bundles.
        constexpr RawTargetMapping kRawTargets[] = {
            {"StandaloneOSX", PlatformKey::OSXPlayer},
            {"StandaloneOSXIntel", PlatformKey::OSXPlayer},
            {"StandaloneOSXIntel64", PlatformKey::OSXPlayer},
            {"StandaloneOSXUniversal", PlatformKey::OSXPlayer},
            {"OSXEditor", PlatformKey::OSXPlayer},
            {"OSXPlayer", PlatformKey::OSXPlayer},

            {"StandaloneWindows", PlatformKey::WindowsPlayer},
            {"StandaloneWindows64", PlatformKey::WindowsPlayer},
            {"WindowsEditor", PlatformKey::WindowsPlayer},
            {"WindowsPlayer", PlatformKey::WindowsPlayer},

            {"StandaloneLinux", PlatformKey::LinuxPlayer},
            {"StandaloneLinux64", PlatformKey::LinuxPlayer},
            {"StandaloneLinuxUniversal", PlatformKey::LinuxPlayer},
            {"LinuxEditor", PlatformKey::LinuxPlayer},
            {"LinuxPlayer", PlatformKey::LinuxPlayer},

            {"iOS", PlatformKey::IPhonePlayer},
            {"IPhonePlayer", PlatformKey::IPhonePlayer},

            {"Android", PlatformKey::Android},

            {"WebGL", PlatformKey::WebGLPlayer},
            {"WebGLPlayer", PlatformKey::WebGLPlayer},
        };
    } // namespace

    const char* platform_name(PlatformKey key) noexcept {
        switch (key) {
            case PlatformKey::OSXPlayer: return "OSXPlayer";
            case PlatformKey::WindowsPlayer: return "WindowsPlayer";
            case PlatformKey::LinuxPlayer: return "LinuxPlayer";
            case PlatformKey::IPhonePlayer: return "IPhonePlayer";
            case PlatformKey::Android: return "Android";
            case PlatformKey::WebGLPlayer: return "WebGLPlayer";
        }
        return "Unknown";
    }

    Status platform_parse(std::string_view name, PlatformKey* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Platform, StatusCode::Invalid);
        }
        for (PlatformKey key : kAllPlatforms) {
            if (name == platform_name(key)) {
                *out = key;
                return ok_status();
            }
        }
        return make_status(StatusDomain::Platform, StatusCode::UnknownPlatform);
    }

    Status platform_normalize(std::string_view raw_target, PlatformKey* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Platform, StatusCode::Invalid);
        }
        for (const RawTargetMapping& m : kRawTargets) {
            if (m.raw == raw_target) {
                *out = m.key;
                return ok_status();
            }
        }
        return make_status(StatusDomain::Platform, StatusCode::UnsupportedPlatform);
    }

    void platform_normalize_many(const std::vector<std::string>& raw_targets, NormalizedTargets* out) {
        if (out == nullptr) {
            return;
        }
        out->platforms.clear();
        out->errors.clear();

        for (const std::string& raw : raw_targets) {
            PlatformKey key{};
            const Status s = platform_normalize(raw, &key);
            if (!is_ok(s)) {
                out->errors.push_back(make_error(s, raw, {}, "no canonical platform for build target"));
                continue;
            }
            if (std::find(out->platforms.begin(), out->platforms.end(), key) == out->platforms.end()) {
                out->platforms.push_back(key);
            }
        }
        std::sort(out->platforms.begin(), out->platforms.end());
    }

} // namespace bundl::core
