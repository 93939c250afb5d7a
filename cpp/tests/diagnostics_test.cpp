#include <string>

#include <gtest/gtest.h>

#include "bundl/core/diagnostics.hpp"
#include "bundl/core/errors.hpp"

using bundl::core::StatusCode;
using bundl::core::StatusDomain;

TEST(Diagnostics, FormatError) {
    const bundl::core::ArtifactError e = bundl::core::make_error(
        bundl::core::make_status(StatusDomain::Reconcile, StatusCode::ProbeIndeterminate, 4),
        "ui", "Android", "still indeterminate after 4 attempts");
    EXPECT_EQ(bundl::core::format_error(e),
        "ui [Android]: ProbeIndeterminate (Reconcile) still indeterminate after 4 attempts");

    const bundl::core::ArtifactError bare =
        bundl::core::make_error(bundl::core::make_status(StatusDomain::Codec, StatusCode::Invalid), "");
    EXPECT_EQ(bundl::core::format_error(bare), "<unnamed>: Invalid (Codec)");
}

TEST(Diagnostics, IoErrorsCarryStrerror) {
    const bundl::core::ArtifactError e =
        bundl::core::make_error(bundl::core::make_status(StatusDomain::Storage, StatusCode::Io, 2), "ui");
    const std::string text = bundl::core::format_error(e);
    EXPECT_EQ(text.rfind("ui: Io (Storage) ", 0), 0u) << text;
    EXPECT_GT(text.size(), std::string("ui: Io (Storage) ").size());
}

TEST(Diagnostics, SummaryGroupsByCode) {
    bundl::core::ArtifactErrors errors;
    errors.push_back(bundl::core::make_error(
        bundl::core::make_status(StatusDomain::Reconcile, StatusCode::ProbeIndeterminate), "a", "Android"));
    errors.push_back(bundl::core::make_error(
        bundl::core::make_status(StatusDomain::Platform, StatusCode::UnsupportedPlatform), "PS4"));
    errors.push_back(bundl::core::make_error(
        bundl::core::make_status(StatusDomain::Reconcile, StatusCode::ProbeIndeterminate), "b", "iOS"));

    const std::string summary = bundl::core::format_error_summary(errors);
    EXPECT_EQ(summary,
        "3 failures\n"
        "  UnsupportedPlatform: 1\n"
        "    PS4: UnsupportedPlatform (Platform)\n"
        "  ProbeIndeterminate: 2\n"
        "    a [Android]: ProbeIndeterminate (Reconcile)\n"
        "    b [iOS]: ProbeIndeterminate (Reconcile)\n");

    EXPECT_EQ(bundl::core::count_errors(errors, StatusCode::ProbeIndeterminate), 2u);
    EXPECT_EQ(bundl::core::count_errors(errors, StatusCode::InvalidHash), 0u);
}

TEST(Diagnostics, EmptySummary) {
    EXPECT_EQ(bundl::core::format_error_summary({}), "no failures\n");
}

TEST(Diagnostics, CodeAndDomainNames) {
    EXPECT_STREQ(bundl::core::status_code_name(StatusCode::MalformedArtifactName), "MalformedArtifactName");
    EXPECT_STREQ(bundl::core::status_code_name(StatusCode::Cancelled), "Cancelled");
    EXPECT_STREQ(bundl::core::status_domain_name(StatusDomain::Identity), "Identity");
}
