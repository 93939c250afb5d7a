#pragma once

#include <type_traits>

#include "bundl/core/errors.hpp"
#include "bundl/core/types.hpp"

namespace bundl::cli {
    using u8 = bundl::core::u8;
    using u32 = bundl::core::u32;
    using i64 = bundl::core::i64;

    // Borrowed view of argv; nothing is copied.
    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
    };

    enum class OptionId : u32 {
        None = 0,
        BuildRoot = 1,
        Staging = 2,
        Upload = 3,
        Remote = 4,
        Output = 5,
        Target = 6,
        Retries = 7,
        DelayMs = 8,
        Jobs = 9,
        Verbose = 10,
        Pointer = 11,
        Embedded = 12,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        i64 i64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    // Caller-owned buffer of cap entries; parse_options fills len of them.
    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Parses leading options and stops at the first positional argument or
    // after "--". Accepts "--name value", "--name=value", "-n value" and
    // "-nvalue". Unknown options, missing or malformed values and a full
    // buffer are Invalid. *consumed is the number of argv entries used.
    [[nodiscard]] bundl::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // Last occurrence wins, so a later flag overrides an earlier one.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    [[nodiscard]] u32 count_options(const ParsedOptions& opts, OptionId id) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<ParsedOption>);

} // namespace bundl::cli
