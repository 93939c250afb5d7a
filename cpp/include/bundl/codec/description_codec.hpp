#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "bundl/core/diagnostics.hpp"
#include "bundl/core/errors.hpp"
#include "bundl/core/types.hpp"
#include "bundl/manifest/description.hpp"
#include "bundl/storage/hashing.hpp"

namespace bundl::codec {

    // Key order is kept so that encoded output is stable and reads
    // name, hashes, dependencies.
    using Document = nlohmann::ordered_json;

    using HashParser = bundl::core::Status (*)(std::string_view text, bundl::core::Hash128* out) noexcept;

    enum class DecodeMode : bundl::core::u8 {
        FailFast = 0,     // stop at the first bad record, return its status
        SkipInvalid = 1,  // report bad records in errors, keep the good ones
    };

    struct DecodeOptions {
        // JSON Pointer to the record (object) or record list (array).
        // Empty means the document root.
        std::string path;
        HashParser parse_hash{&bundl::storage::hash_parse_hex};
        DecodeMode mode{DecodeMode::FailFast};
    };

    struct DecodeResult {
        bundl::manifest::DescriptionList descriptions;
        bundl::core::ArtifactErrors errors;
    };

    // Writes "name", "hashes" and "dependencies" into *out. A null document
    // becomes an object; fields the caller already put in an object are left
    // alone, so a record can share an object with caller metadata.
    [[nodiscard]] bundl::core::Status codec_encode_record(const bundl::manifest::ArtifactDescription& description,
        Document* out) noexcept;

    [[nodiscard]] bundl::core::Status codec_encode(const bundl::manifest::DescriptionList& descriptions,
        Document* out) noexcept;

    // indent < 0 gives the compact form.
    [[nodiscard]] bundl::core::Status codec_encode_string(const bundl::manifest::DescriptionList& descriptions,
        int indent,
        std::string* out) noexcept;

    // Reads one record; unknown sibling fields are ignored. On failure *error
    // names the artifact (and platform where relevant).
    //   UnknownPlatform  hashes key is not a canonical platform
    //   InvalidHash      parse_hash rejected the value, or it is zero
    //   Invalid          missing or mistyped field, duplicate dependency
    [[nodiscard]] bundl::core::Status codec_decode_record(const Document& record,
        HashParser parse_hash,
        bundl::manifest::ArtifactDescription* out,
        bundl::core::ArtifactError* error) noexcept;

    // NotFound when options.path does not resolve.
    [[nodiscard]] bundl::core::Status codec_decode(const Document& document,
        const DecodeOptions& options,
        DecodeResult* out) noexcept;

    [[nodiscard]] bundl::core::Status codec_decode_string(std::string_view text,
        const DecodeOptions& options,
        DecodeResult* out) noexcept;

    [[nodiscard]] bundl::core::Status codec_read_file(const std::filesystem::path& path,
        const DecodeOptions& options,
        DecodeResult* out) noexcept;

    [[nodiscard]] bundl::core::Status codec_write_file(const std::filesystem::path& path,
        const bundl::manifest::DescriptionList& descriptions,
        int indent = 2) noexcept;

} // namespace bundl::codec
