#include "bundl/core/errors.hpp"

namespace bundl::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::Conflict: return "Conflict";
            case StatusCode::Io: return "Io";
            case StatusCode::Network: return "Network";
            case StatusCode::Unsupported: return "Unsupported";
            case StatusCode::Unavailable: return "Unavailable";
            case StatusCode::Cancelled: return "Cancelled";
            case StatusCode::UnsupportedPlatform: return "UnsupportedPlatform";
            case StatusCode::InvalidArtifactName: return "InvalidArtifactName";
            case StatusCode::MalformedArtifactName: return "MalformedArtifactName";
            case StatusCode::InvalidHash: return "InvalidHash";
            case StatusCode::UnknownPlatform: return "UnknownPlatform";
            case StatusCode::ProbeIndeterminate: return "ProbeIndeterminate";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Platform: return "Platform";
            case StatusDomain::Identity: return "Identity";
            case StatusDomain::Manifest: return "Manifest";
            case StatusDomain::Codec: return "Codec";
            case StatusDomain::Reconcile: return "Reconcile";
            case StatusDomain::Storage: return "Storage";
            case StatusDomain::Cli: return "Cli";
            case StatusDomain::External: return "External";
        }
        return "Unknown";
    }
} // namespace bundl::core
