#include "bundl/net/probe.hpp"

#include <system_error>

#include "bundl/core/log.hpp"

namespace bundl::net {

    const char* probe_result_name(ProbeResult r) noexcept {
        switch (r) {
        case ProbeResult::Found:
            return "Found";
        case ProbeResult::NotFound:
            return "NotFound";
        case ProbeResult::Indeterminate:
            return "Indeterminate";
        }
        return "?";
    }

    ProbeResult DirectoryProbe::probe(const std::string& file_name) {
        std::error_code ec;
        if (!std::filesystem::is_directory(root_, ec)) {
            bundl::core::log_debug("probe root %s unavailable", root_.string().c_str());
            return ProbeResult::Indeterminate;
        }

        const std::filesystem::file_status st = std::filesystem::status(root_ / file_name, ec);
        if (st.type() == std::filesystem::file_type::not_found) {
            return ProbeResult::NotFound;
        }
        if (ec) {
            bundl::core::log_debug("probe %s: %s", file_name.c_str(), ec.message().c_str());
            return ProbeResult::Indeterminate;
        }
        return std::filesystem::is_regular_file(st) ? ProbeResult::Found : ProbeResult::Indeterminate;
    }

} // namespace bundl::net
