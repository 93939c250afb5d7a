#pragma once

#include <string>
#include <vector>

#include "bundl/core/errors.hpp"

namespace bundl::core {

    // One failure local to a single artifact (or raw target, or file).
    // Operations return these next to their partial results.
    struct ArtifactError {
        Status status{};
        std::string artifact;  // artifact name, file name or raw target
        std::string platform;  // empty when not platform specific
        std::string detail;
    };

    using ArtifactErrors = std::vector<ArtifactError>;

    [[nodiscard]] ArtifactError make_error(Status status,
        std::string artifact,
        std::string platform = {},
        std::string detail = {});

    // "<artifact> [<platform>]: <Code> (<Domain>) <detail>"
    [[nodiscard]] std::string format_error(const ArtifactError& e);

    // Multi-line summary grouped by status code, e.g.
    //   3 failures
    //     ProbeIndeterminate: 2
    //       a_Android_....bundle: ...
    [[nodiscard]] std::string format_error_summary(const ArtifactErrors& errors);

    [[nodiscard]] std::size_t count_errors(const ArtifactErrors& errors, StatusCode code) noexcept;

} // namespace bundl::core
