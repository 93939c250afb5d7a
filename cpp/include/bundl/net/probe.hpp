#pragma once

#include <filesystem>
#include <string>
#include <utility>

#include "bundl/core/types.hpp"

namespace bundl::net {

    enum class ProbeResult : bundl::core::u8 {
        Found = 0,
        NotFound = 1,
        Indeterminate = 2,  // transport failure or timeout; may be retried
    };

    [[nodiscard]] const char* probe_result_name(ProbeResult r) noexcept;

    // Asks the remote store whether an artifact with this canonical file
    // name is already published. Called from several worker threads at once.
    class ExistenceProbe {
    public:
        virtual ~ExistenceProbe() = default;

        // May throw; a throwing probe is treated as Indeterminate.
        virtual ProbeResult probe(const std::string& file_name) = 0;
    };

    // Remote store mirrored as a flat directory (a mounted bucket, an rsync
    // target, a test fixture).
    class DirectoryProbe final : public ExistenceProbe {
    public:
        explicit DirectoryProbe(std::filesystem::path root) : root_(std::move(root)) {}

        // Indeterminate when the root itself is missing or unreadable, so an
        // unmounted store never makes everything look unpublished.
        ProbeResult probe(const std::string& file_name) override;

        [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    private:
        std::filesystem::path root_;
    };

} // namespace bundl::net
