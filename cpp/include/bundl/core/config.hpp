#pragma once

#include <chrono>
#include <filesystem>

#include "bundl/core/errors.hpp"
#include "bundl/core/types.hpp"

namespace bundl::core {

    // Directories used by one pipeline run. Passed explicitly to every
    // operation that touches the filesystem.
    struct PipelineConfig {
        std::filesystem::path build_root;   // {build_root}/{PlatformKey}/manifest.json
        std::filesystem::path staging_dir;  // canonically named artifacts
        std::filesystem::path upload_dir;   // artifacts that still need publishing
        std::filesystem::path remote_root;  // mirror of the remote store (directory probe)
        std::filesystem::path embedded_dir; // one platform's artifacts shipped inside the player
    };

    struct ReconcileConfig {
        u32 max_retries{3};                              // extra attempts after an indeterminate probe
        std::chrono::milliseconds retry_delay{500};
        u32 max_concurrency{8};                          // probes in flight at once
    };

    // Longest accepted retry_delay. Retry deadlines are steady_clock time
    // points, so the delay must stay far below its range.
    inline constexpr std::chrono::hours kMaxRetryDelay{24};

    inline constexpr const char* kRootEnvVar = "BUNDL_ROOT";
    inline constexpr const char* kDefaultRoot = "AssetBundles";

    // Fills paths from $BUNDL_ROOT (or ./AssetBundles):
    //   build_root = root, staging_dir = root/Staging, upload_dir = root/Upload,
    //   embedded_dir = root/Embedded.
    // remote_root is left empty.
    void config_defaults(PipelineConfig* out) noexcept;

    // Invalid for a zero max_concurrency and a retry_delay outside
    // [0, kMaxRetryDelay].
    [[nodiscard]] Status config_validate(const ReconcileConfig& cfg) noexcept;

} // namespace bundl::core
