#include "bundl/storage/identity.hpp"

#include <utility>

#include "bundl/storage/hashing.hpp"

namespace bundl::storage {
    using bundl::core::Status;
    using bundl::core::StatusCode;
    using bundl::core::StatusDomain;

    namespace {
        [[nodiscard]] Status malformed() noexcept {
            return bundl::core::make_status(StatusDomain::Identity, StatusCode::MalformedArtifactName);
        }

        [[nodiscard]] bool is_lower_hex(std::string_view s) noexcept {
            for (char c : s) {
                const bool digit = c >= '0' && c <= '9';
                const bool lower = c >= 'a' && c <= 'f';
                if (!digit && !lower) {
                    return false;
                }
            }
            return true;
        }
    } // namespace

    Status artifact_name_validate(std::string_view name) noexcept {
        if (name.empty()) {
            return bundl::core::make_status(StatusDomain::Identity, StatusCode::InvalidArtifactName);
        }
        for (char c : name) {
            if (c == kNameSeparator || c == '/' || c == '\\' || c == '\0') {
                return bundl::core::make_status(StatusDomain::Identity, StatusCode::InvalidArtifactName);
            }
        }
        return bundl::core::ok_status();
    }

    Status identity_file_name(std::string_view name,
        bundl::core::PlatformKey platform,
        const bundl::core::Hash128& hash,
        std::string* out) noexcept {
        if (out == nullptr) {
            return bundl::core::make_status(StatusDomain::Identity, StatusCode::Invalid);
        }
        const Status s = artifact_name_validate(name);
        if (!bundl::core::is_ok(s)) {
            return s;
        }
        if (hash_is_zero(hash)) {
            return bundl::core::make_status(StatusDomain::Identity, StatusCode::InvalidHash);
        }

        char hex[bundl::core::kHash128HexChars + 1];
        hash_to_hex(hash, hex, sizeof(hex));

        std::string file_name;
        file_name.reserve(name.size() + 48);
        file_name.append(name);
        file_name.push_back(kNameSeparator);
        file_name.append(bundl::core::platform_name(platform));
        file_name.push_back(kNameSeparator);
        file_name.append(hex);
        file_name.append(kArtifactExtension);
        *out = std::move(file_name);
        return bundl::core::ok_status();
    }

    Status identity_file_name(const ArtifactIdentity& id, std::string* out) noexcept {
        return identity_file_name(id.name, id.platform, id.hash, out);
    }

    Status identity_parse_file_name(std::string_view file_name, ArtifactIdentity* out) noexcept {
        if (out == nullptr) {
            return bundl::core::make_status(StatusDomain::Identity, StatusCode::Invalid);
        }
        if (file_name.size() <= kArtifactExtension.size() ||
            file_name.substr(file_name.size() - kArtifactExtension.size()) != kArtifactExtension) {
            return malformed();
        }
        const std::string_view stem = file_name.substr(0, file_name.size() - kArtifactExtension.size());

        // Names never contain the separator, so a valid stem has exactly two.
        const size_t first = stem.find(kNameSeparator);
        if (first == std::string_view::npos) {
            return malformed();
        }
        const size_t second = stem.find(kNameSeparator, first + 1);
        if (second == std::string_view::npos || stem.find(kNameSeparator, second + 1) != std::string_view::npos) {
            return malformed();
        }

        const std::string_view name = stem.substr(0, first);
        const std::string_view platform_str = stem.substr(first + 1, second - first - 1);
        const std::string_view hash_str = stem.substr(second + 1);

        if (!bundl::core::is_ok(artifact_name_validate(name))) {
            return malformed();
        }

        bundl::core::PlatformKey platform{};
        if (!bundl::core::is_ok(bundl::core::platform_parse(platform_str, &platform))) {
            return malformed();
        }

        // identity_file_name only ever emits lowercase digits.
        if (hash_str.size() != bundl::core::kHash128HexChars || !is_lower_hex(hash_str)) {
            return malformed();
        }
        bundl::core::Hash128 hash{};
        if (!bundl::core::is_ok(hash_parse_hex(hash_str, &hash)) || hash_is_zero(hash)) {
            return malformed();
        }

        out->name.assign(name);
        out->platform = platform;
        out->hash = hash;
        return bundl::core::ok_status();
    }

} // namespace bundl::storage
