#include "bundl/core/diagnostics.hpp"

#include <cstdio>
#include <cstring>
#include <map>
#include <utility>

namespace bundl::core {
    ArtifactError make_error(Status status, std::string artifact, std::string platform, std::string detail) {
        ArtifactError e{};
        e.status = status;
        e.artifact = std::move(artifact);
        e.platform = std::move(platform);
        e.detail = std::move(detail);
        return e;
    }

    std::string format_error(const ArtifactError& e) {
        std::string out = e.artifact.empty() ? std::string("<unnamed>") : e.artifact;
        if (!e.platform.empty()) {
            out += " [";
            out += e.platform;
            out += "]";
        }
        out += ": ";
        out += status_code_name(e.status.code);
        out += " (";
        out += status_domain_name(e.status.domain);
        out += ")";
        if (e.status.code == StatusCode::Io && e.status.aux != 0) {
            out += " ";
            out += std::strerror(static_cast<int>(e.status.aux));
        }
        if (!e.detail.empty()) {
            out += " ";
            out += e.detail;
        }
        return out;
    }

    std::string format_error_summary(const ArtifactErrors& errors) {
        if (errors.empty()) {
            return "no failures\n";
        }

        // Group by code; std::map keeps the enum order stable between runs.
        std::map<StatusCode, std::vector<const ArtifactError*>> groups;
        for (const ArtifactError& e : errors) {
            groups[e.status.code].push_back(&e);
        }

        char line[64];
        std::snprintf(line, sizeof(line), "%zu failure%s\n", errors.size(), errors.size() == 1 ? "" : "s");
        std::string out = line;
        for (const auto& [code, items] : groups) {
            std::snprintf(line, sizeof(line), "  %s: %zu\n", status_code_name(code), items.size());
            out += line;
            for (const ArtifactError* e : items) {
                out += "    ";
                out += format_error(*e);
                out += "\n";
            }
        }
        return out;
    }

    std::size_t count_errors(const ArtifactErrors& errors, StatusCode code) noexcept {
        std::size_t n = 0;
        for (const ArtifactError& e : errors) {
            if (e.status.code == code) {
                ++n;
            }
        }
        return n;
    }

} // namespace bundl::core
