#include "bundl/storage/hashing.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdio>

#include <blake3.h>

namespace bundl::storage {
    using bundl::core::Hash128;
    using bundl::core::Hash256;
    using bundl::core::Status;
    using bundl::core::StatusCode;
    using bundl::core::StatusDomain;

    namespace {
        constexpr char kHexDigits[] = "0123456789abcdef";

        [[nodiscard]] int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        template <std::size_t N>
        Status hash_buffer(bundl::core::BufferView data, std::array<u8, N>* out) noexcept {
            if (out == nullptr) {
                return bundl::core::make_status(StatusDomain::Storage, StatusCode::Invalid);
            }
            if (data.len > 0 && data.data == nullptr) {
                return bundl::core::make_status(StatusDomain::Storage, StatusCode::Invalid);
            }

            blake3_hasher hasher;
            blake3_hasher_init(&hasher);
            if (data.len > 0) {
                blake3_hasher_update(&hasher, data.data, static_cast<size_t>(data.len));
            }
            blake3_hasher_finalize(&hasher, out->data(), out->size());
            return bundl::core::ok_status();
        }

        template <std::size_t N>
        std::string to_hex(const std::array<u8, N>& bytes) {
            std::string out;
            out.resize(N * 2);
            for (std::size_t i = 0; i < N; ++i) {
                out[i * 2] = kHexDigits[(bytes[i] >> 4) & 0xF];
                out[i * 2 + 1] = kHexDigits[bytes[i] & 0xF];
            }
            return out;
        }
    } // namespace

    Status hash_compute(bundl::core::BufferView data, Hash128* out) noexcept {
        return hash_buffer(data, out == nullptr ? nullptr : &out->b);
    }

    Status hash_compute(bundl::core::BufferView data, Hash256* out) noexcept {
        return hash_buffer(data, out == nullptr ? nullptr : &out->b);
    }

    Status hash_file(const std::filesystem::path& path, Hash128* out) noexcept {
        if (out == nullptr) {
            return bundl::core::make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        FILE* f = std::fopen(path.c_str(), "rb");
        if (f == nullptr) {
            const int err = errno;
            return bundl::core::make_status(StatusDomain::Storage,
                err == ENOENT ? StatusCode::NotFound : StatusCode::Io,
                static_cast<bundl::core::u32>(err));
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        u8 buf[64 * 1024];
        for (;;) {
            const size_t n = std::fread(buf, 1, sizeof(buf), f);
            if (n > 0) {
                blake3_hasher_update(&hasher, buf, n);
            }
            if (n < sizeof(buf)) {
                break;
            }
        }
        const bool failed = std::ferror(f) != 0;
        std::fclose(f);
        if (failed) {
            return bundl::core::make_status(StatusDomain::Storage, StatusCode::Io, EIO);
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return bundl::core::ok_status();
    }

    void hash_to_hex(const Hash128& hash, char* out, std::size_t out_size) noexcept {
        if (out == nullptr || out_size == 0) {
            return;
        }
        std::size_t pos = 0;
        for (std::size_t i = 0; i < hash.b.size() && pos + 2 < out_size; ++i) {
            out[pos++] = kHexDigits[(hash.b[i] >> 4) & 0xF];
            out[pos++] = kHexDigits[hash.b[i] & 0xF];
        }
        out[pos] = '\0';
    }

    std::string hash_to_hex(const Hash128& hash) {
        return to_hex(hash.b);
    }

    std::string hash_to_hex(const Hash256& hash) {
        return to_hex(hash.b);
    }

    Status hash_parse_hex(std::string_view text, Hash128* out) noexcept {
        if (out == nullptr) {
            return bundl::core::make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        if (text.size() != bundl::core::kHash128HexChars) {
            return bundl::core::make_status(StatusDomain::Storage, StatusCode::InvalidHash);
        }

        Hash128 h{};
        for (std::size_t i = 0; i < h.b.size(); ++i) {
            const int hi = hex_value(text[i * 2]);
            const int lo = hex_value(text[i * 2 + 1]);
            if (hi < 0 || lo < 0) {
                return bundl::core::make_status(StatusDomain::Storage, StatusCode::InvalidHash);
            }
            h.b[i] = static_cast<u8>((hi << 4) | lo);
        }
        *out = h;
        return bundl::core::ok_status();
    }

} // namespace bundl::storage
