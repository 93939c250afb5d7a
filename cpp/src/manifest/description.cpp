#include "bundl/manifest/description.hpp"

#include <algorithm>
#include <utility>

#include "bundl/storage/hashing.hpp"
#include "bundl/storage/identity.hpp"

namespace bundl::manifest {
    using bundl::core::Hash128;
    using bundl::core::Hash256;
    using bundl::core::PlatformKey;
    using bundl::core::Status;
    using bundl::core::StatusCode;
    using bundl::core::StatusDomain;

    namespace {
        void put_u64_be(std::string* out, bundl::core::u64 v) {
            for (int shift = 56; shift >= 0; shift -= 8) {
                out->push_back(static_cast<char>((v >> shift) & 0xffu));
            }
        }

        void put_string(std::string* out, const std::string& s) {
            put_u64_be(out, static_cast<bundl::core::u64>(s.size()));
            out->append(s);
        }
    } // namespace

    Status ArtifactDescription::create(std::string name,
        PlatformHashes hashes,
        DependencySet dependencies,
        ArtifactDescription* out) noexcept {
        if (out == nullptr) {
            return bundl::core::make_status(StatusDomain::Manifest, StatusCode::Invalid);
        }
        if (name.empty()) {
            return bundl::core::make_status(StatusDomain::Manifest, StatusCode::Invalid);
        }
        for (const auto& [platform, hash] : hashes) {
            if (bundl::storage::hash_is_zero(hash)) {
                return bundl::core::make_status(StatusDomain::Manifest, StatusCode::InvalidHash,
                    static_cast<bundl::core::u32>(platform));
            }
        }

        out->name_ = std::move(name);
        out->hashes_ = std::move(hashes);
        out->dependencies_ = std::move(dependencies);
        return bundl::core::ok_status();
    }

    bool ArtifactDescription::supports(PlatformKey platform) const noexcept {
        return hashes_.find(platform) != hashes_.end();
    }

    bool ArtifactDescription::hash_for(PlatformKey platform, Hash128* out) const noexcept {
        const auto it = hashes_.find(platform);
        if (it == hashes_.end()) {
            return false;
        }
        if (out != nullptr) {
            *out = it->second;
        }
        return true;
    }

    Status ArtifactDescription::file_name_for(PlatformKey platform, std::string* out) const noexcept {
        if (is_placeholder()) {
            return bundl::core::make_status(StatusDomain::Manifest, StatusCode::Invalid);
        }
        const auto it = hashes_.find(platform);
        if (it == hashes_.end()) {
            return bundl::core::make_status(StatusDomain::Manifest, StatusCode::NotFound);
        }
        return bundl::storage::identity_file_name(name_, platform, it->second, out);
    }

    Status ArtifactDescription::superseded_by(PlatformKey platform,
        const Hash128& hash,
        ArtifactDescription* out) const noexcept {
        if (out == nullptr) {
            return bundl::core::make_status(StatusDomain::Manifest, StatusCode::Invalid);
        }
        PlatformHashes hashes = hashes_;
        hashes[platform] = hash;
        return create(name_, std::move(hashes), dependencies_, out);
    }

    Hash256 ArtifactDescription::digest() const noexcept {
        std::string buf;
        put_string(&buf, name_);

        // Walk the enum, not the map, so the byte stream never depends on
        // the container.
        for (PlatformKey platform : bundl::core::kAllPlatforms) {
            const auto it = hashes_.find(platform);
            if (it == hashes_.end()) {
                continue;
            }
            buf.push_back(static_cast<char>(platform));
            buf.append(reinterpret_cast<const char*>(it->second.b.data()), it->second.b.size());
        }
        buf.push_back('\xff');

        put_u64_be(&buf, static_cast<bundl::core::u64>(dependencies_.size()));
        for (const std::string& dep : dependencies_) {
            put_string(&buf, dep);
        }

        Hash256 out{};
        const bundl::core::BufferView view{reinterpret_cast<const bundl::core::u8*>(buf.data()),
            static_cast<bundl::core::u64>(buf.size())};
        if (!bundl::core::is_ok(bundl::storage::hash_compute(view, &out))) {
            return Hash256{};
        }
        return out;
    }

    bool description_list_upsert(DescriptionList* list, ArtifactDescription description) {
        if (list == nullptr || description.is_placeholder()) {
            return false;
        }
        const auto it = std::lower_bound(list->begin(), list->end(), description.name(),
            [](const ArtifactDescription& d, const std::string& name) { return d.name() < name; });
        if (it != list->end() && it->name() == description.name()) {
            *it = std::move(description);
            return true;
        }
        list->insert(it, std::move(description));
        return false;
    }

    const ArtifactDescription* description_list_find(const DescriptionList& list, const std::string& name) noexcept {
        for (const ArtifactDescription& d : list) {
            if (d.name() == name) {
                return &d;
            }
        }
        return nullptr;
    }

} // namespace bundl::manifest

std::size_t std::hash<bundl::manifest::ArtifactDescription>::operator()(
    const bundl::manifest::ArtifactDescription& d) const noexcept {
    const bundl::core::Hash256 h = d.digest();
    std::size_t out = 0;
    for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
        out = (out << 8) | h.b[i];
    }
    return out;
}
