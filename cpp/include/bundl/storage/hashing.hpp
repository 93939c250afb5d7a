#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include "bundl/core/errors.hpp"
#include "bundl/core/types.hpp"

namespace bundl::storage {
    using u8 = bundl::core::u8;
    using u32 = bundl::core::u32;
    using u64 = bundl::core::u64;

    [[nodiscard]] constexpr bool hash_is_zero(const bundl::core::Hash128& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    // BLAKE3, truncated to 128 bits.
    bundl::core::Status hash_compute(bundl::core::BufferView data, bundl::core::Hash128* out) noexcept;

    // BLAKE3, full 256-bit output.
    bundl::core::Status hash_compute(bundl::core::BufferView data, bundl::core::Hash256* out) noexcept;

    // Streams the file through BLAKE3. Io status (aux = errno) when unreadable.
    bundl::core::Status hash_file(const std::filesystem::path& path, bundl::core::Hash128* out) noexcept;

    // Lowercase hex, NUL terminated. out_size must be at least 33.
    void hash_to_hex(const bundl::core::Hash128& hash, char* out, std::size_t out_size) noexcept;
    [[nodiscard]] std::string hash_to_hex(const bundl::core::Hash128& hash);
    [[nodiscard]] std::string hash_to_hex(const bundl::core::Hash256& hash);

    // Exactly 32 hex digits, either case. Fails with InvalidHash.
    bundl::core::Status hash_parse_hex(std::string_view text, bundl::core::Hash128* out) noexcept;

} // namespace bundl::storage
