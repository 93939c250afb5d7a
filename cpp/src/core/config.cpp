#include "bundl/core/config.hpp"

#include <cstdlib>

namespace bundl::core {
    void config_defaults(PipelineConfig* out) noexcept {
        if (out == nullptr) {
            return;
        }

        const char* env = std::getenv(kRootEnvVar);
        const std::filesystem::path root = (env != nullptr && *env != '\0') ? std::filesystem::path(env)
                                                                             : std::filesystem::path(kDefaultRoot);
        out->build_root = root;
        out->staging_dir = root / "Staging";
        out->upload_dir = root / "Upload";
        out->embedded_dir = root / "Embedded";
        out->remote_root.clear();
    }

    Status config_validate(const ReconcileConfig& cfg) noexcept {
        if (cfg.max_concurrency == 0) {
            return make_status(StatusDomain::Reconcile, StatusCode::Invalid);
        }
        if (cfg.retry_delay.count() < 0 || cfg.retry_delay > kMaxRetryDelay) {
            return make_status(StatusDomain::Reconcile, StatusCode::Invalid);
        }
        return ok_status();
    }

} // namespace bundl::core
