#include <chrono>
#include <cstdlib>
#include <string>

#include <gtest/gtest.h>

#include "bundl/core/config.hpp"
#include "bundl/core/log.hpp"

TEST(Config, ReconcileDefaults) {
    const bundl::core::ReconcileConfig cfg;
    EXPECT_EQ(cfg.max_retries, 3u);
    EXPECT_EQ(cfg.retry_delay, std::chrono::milliseconds(500));
    EXPECT_EQ(cfg.max_concurrency, 8u);
    EXPECT_EQ(bundl::core::config_validate(cfg).code, bundl::core::StatusCode::Ok);
}

TEST(Config, ValidateRejectsZeroConcurrencyAndNegativeDelay) {
    bundl::core::ReconcileConfig cfg;
    cfg.max_concurrency = 0;
    EXPECT_EQ(bundl::core::config_validate(cfg).code, bundl::core::StatusCode::Invalid);

    cfg.max_concurrency = 1;
    cfg.retry_delay = std::chrono::milliseconds(-1);
    EXPECT_EQ(bundl::core::config_validate(cfg).code, bundl::core::StatusCode::Invalid);

    cfg.retry_delay = std::chrono::milliseconds(0);
    cfg.max_retries = 0;
    EXPECT_EQ(bundl::core::config_validate(cfg).code, bundl::core::StatusCode::Ok);
}

TEST(Config, ValidateBoundsRetryDelay) {
    bundl::core::ReconcileConfig cfg;
    cfg.retry_delay = bundl::core::kMaxRetryDelay;
    EXPECT_EQ(bundl::core::config_validate(cfg).code, bundl::core::StatusCode::Ok);

    cfg.retry_delay = std::chrono::duration_cast<std::chrono::milliseconds>(bundl::core::kMaxRetryDelay) +
        std::chrono::milliseconds(1);
    EXPECT_EQ(bundl::core::config_validate(cfg).code, bundl::core::StatusCode::Invalid);

    cfg.retry_delay = std::chrono::milliseconds::max();
    EXPECT_EQ(bundl::core::config_validate(cfg).code, bundl::core::StatusCode::Invalid);
}

TEST(Config, PathsFromEnvironment) {
    ::setenv(bundl::core::kRootEnvVar, "/srv/bundles", 1);
    bundl::core::PipelineConfig cfg;
    cfg.remote_root = "/stale";
    bundl::core::config_defaults(&cfg);
    EXPECT_EQ(cfg.build_root.string(), "/srv/bundles");
    EXPECT_EQ(cfg.staging_dir.string(), "/srv/bundles/Staging");
    EXPECT_EQ(cfg.upload_dir.string(), "/srv/bundles/Upload");
    EXPECT_EQ(cfg.embedded_dir.string(), "/srv/bundles/Embedded");
    EXPECT_TRUE(cfg.remote_root.empty());

    ::unsetenv(bundl::core::kRootEnvVar);
    bundl::core::config_defaults(&cfg);
    EXPECT_EQ(cfg.build_root.string(), "AssetBundles");
    EXPECT_EQ(cfg.staging_dir.string(), "AssetBundles/Staging");
}

TEST(Log, LevelThreshold) {
    const bundl::core::LogLevel before = bundl::core::log_level();
    bundl::core::log_set_level(bundl::core::LogLevel::Warn);
    EXPECT_EQ(bundl::core::log_level(), bundl::core::LogLevel::Warn);

    testing::internal::CaptureStderr();
    bundl::core::log_info("hidden %d", 1);
    bundl::core::log_warn("shown %s", "warn");
    bundl::core::log_error("shown %d", 2);
    const std::string out = testing::internal::GetCapturedStderr();
    EXPECT_EQ(out, "warn: shown warn\nerror: shown 2\n");

    bundl::core::log_set_level(before);
}
