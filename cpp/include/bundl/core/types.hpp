#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <compare>

namespace bundl::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Content hash of one artifact build. All-zero is the invalid value.
    struct Hash128 {
        std::array<u8, 16> b{};
        friend constexpr bool operator==(Hash128, Hash128) noexcept = default;
        friend constexpr auto operator<=>(Hash128, Hash128) noexcept = default;
    };
    static_assert(sizeof(Hash128) == 16);

    // Digest of a whole artifact description.
    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(Hash256, Hash256) noexcept = default;
        friend constexpr auto operator<=>(Hash256, Hash256) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);

    inline constexpr std::size_t kHash128HexChars = 32;

    struct BufferView {
        const u8* data{nullptr};
        u64 len{0};
    };

    static_assert(std::is_trivially_copyable_v<Hash128>);
    static_assert(std::is_trivially_copyable_v<Hash256>);
    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<Hash128>);
    static_assert(std::is_standard_layout_v<BufferView>);

} // namespace bundl::core
