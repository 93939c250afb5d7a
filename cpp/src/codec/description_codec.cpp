#include "bundl/codec/description_codec.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <new>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "bundl/core/log.hpp"

namespace bundl::codec {
    using bundl::core::ArtifactError;
    using bundl::core::PlatformKey;
    using bundl::core::Status;
    using bundl::core::StatusCode;
    using bundl::core::StatusDomain;
    using bundl::manifest::ArtifactDescription;

    namespace {
        [[nodiscard]] Status codec_status(StatusCode code, bundl::core::u32 aux = 0) noexcept {
            return bundl::core::make_status(StatusDomain::Codec, code, aux);
        }

        [[nodiscard]] Status fail(ArtifactError* error,
            Status s,
            std::string artifact,
            std::string platform,
            std::string detail) {
            if (error != nullptr) {
                *error = bundl::core::make_error(s, std::move(artifact), std::move(platform), std::move(detail));
            }
            return s;
        }

        [[nodiscard]] Status decode_one(const Document& record,
            HashParser parse_hash,
            ArtifactDescription* out,
            ArtifactError* error) {
            if (!record.is_object()) {
                return fail(error, codec_status(StatusCode::Invalid), {}, {}, "record is not an object");
            }

            const auto name_it = record.find("name");
            if (name_it == record.end() || !name_it->is_string()) {
                return fail(error, codec_status(StatusCode::Invalid), {}, {}, "missing string field \"name\"");
            }
            std::string name = name_it->get<std::string>();
            if (name.empty()) {
                return fail(error, codec_status(StatusCode::Invalid), {}, {}, "empty \"name\"");
            }

            const auto hashes_it = record.find("hashes");
            if (hashes_it == record.end() || !hashes_it->is_object()) {
                return fail(error, codec_status(StatusCode::Invalid), name, {}, "missing object field \"hashes\"");
            }

            bundl::manifest::PlatformHashes hashes;
            for (auto it = hashes_it->begin(); it != hashes_it->end(); ++it) {
                PlatformKey platform{};
                if (!bundl::core::is_ok(bundl::core::platform_parse(it.key(), &platform))) {
                    return fail(error, codec_status(StatusCode::UnknownPlatform), name, it.key(),
                        "unknown platform key");
                }
                if (!it.value().is_string()) {
                    return fail(error, codec_status(StatusCode::InvalidHash), name, it.key(), "hash is not a string");
                }
                const std::string text = it.value().get<std::string>();
                bundl::core::Hash128 hash{};
                if (!bundl::core::is_ok(parse_hash(text, &hash)) || bundl::storage::hash_is_zero(hash)) {
                    return fail(error, codec_status(StatusCode::InvalidHash), name, it.key(),
                        "invalid hash \"" + text + "\"");
                }
                hashes[platform] = hash;
            }

            const auto deps_it = record.find("dependencies");
            if (deps_it == record.end() || !deps_it->is_array()) {
                return fail(error, codec_status(StatusCode::Invalid), name, {}, "missing array field \"dependencies\"");
            }
            bundl::manifest::DependencySet deps;
            for (const Document& dep : *deps_it) {
                if (!dep.is_string()) {
                    return fail(error, codec_status(StatusCode::Invalid), name, {}, "dependency is not a string");
                }
                if (!deps.insert(dep.get<std::string>()).second) {
                    return fail(error, codec_status(StatusCode::Invalid), name, {},
                        "duplicate dependency \"" + dep.get<std::string>() + "\"");
                }
            }

            std::string artifact = name;
            const Status s = ArtifactDescription::create(std::move(name), std::move(hashes), std::move(deps), out);
            if (!bundl::core::is_ok(s)) {
                return fail(error, s, std::move(artifact), {}, "rejected by description");
            }
            return bundl::core::ok_status();
        }
    } // namespace

    Status codec_encode_record(const ArtifactDescription& description, Document* out) noexcept {
        if (out == nullptr) {
            return codec_status(StatusCode::Invalid);
        }
        if ((!out->is_null() && !out->is_object()) || description.is_placeholder()) {
            return codec_status(StatusCode::Invalid);
        }

        try {
            Document hashes = Document::object();
            for (PlatformKey platform : bundl::core::kAllPlatforms) {
                bundl::core::Hash128 hash{};
                if (description.hash_for(platform, &hash)) {
                    hashes[bundl::core::platform_name(platform)] = bundl::storage::hash_to_hex(hash);
                }
            }

            Document deps = Document::array();
            for (const std::string& dep : description.dependencies()) {
                deps.push_back(dep);
            }

            (*out)["name"] = description.name();
            (*out)["hashes"] = std::move(hashes);
            (*out)["dependencies"] = std::move(deps);
            return bundl::core::ok_status();
        } catch (const std::bad_alloc&) {
            return codec_status(StatusCode::Unavailable);
        }
    }

    Status codec_encode(const bundl::manifest::DescriptionList& descriptions, Document* out) noexcept {
        if (out == nullptr) {
            return codec_status(StatusCode::Invalid);
        }

        try {
            Document list = Document::array();
            for (const ArtifactDescription& d : descriptions) {
                Document record;
                const Status s = codec_encode_record(d, &record);
                if (!bundl::core::is_ok(s)) {
                    return s;
                }
                list.push_back(std::move(record));
            }
            *out = std::move(list);
            return bundl::core::ok_status();
        } catch (const std::bad_alloc&) {
            return codec_status(StatusCode::Unavailable);
        }
    }

    Status codec_encode_string(const bundl::manifest::DescriptionList& descriptions, int indent, std::string* out) noexcept {
        if (out == nullptr) {
            return codec_status(StatusCode::Invalid);
        }

        Document doc;
        const Status s = codec_encode(descriptions, &doc);
        if (!bundl::core::is_ok(s)) {
            return s;
        }
        try {
            *out = doc.dump(indent);
            return bundl::core::ok_status();
        } catch (const nlohmann::json::exception& e) {
            bundl::core::log_error("encode: %s", e.what());
            return codec_status(StatusCode::Invalid);
        } catch (const std::bad_alloc&) {
            return codec_status(StatusCode::Unavailable);
        }
    }

    Status codec_decode_record(const Document& record,
        HashParser parse_hash,
        ArtifactDescription* out,
        ArtifactError* error) noexcept {
        if (out == nullptr || parse_hash == nullptr) {
            return codec_status(StatusCode::Invalid);
        }
        try {
            return decode_one(record, parse_hash, out, error);
        } catch (const nlohmann::json::exception& e) {
            return fail(error, codec_status(StatusCode::Invalid), {}, {}, e.what());
        } catch (const std::bad_alloc&) {
            return codec_status(StatusCode::Unavailable);
        }
    }

    Status codec_decode(const Document& document, const DecodeOptions& options, DecodeResult* out) noexcept {
        if (out == nullptr || options.parse_hash == nullptr) {
            return codec_status(StatusCode::Invalid);
        }
        out->descriptions.clear();
        out->errors.clear();

        try {
            const Document* target = &document;
            if (!options.path.empty()) {
                const Document::json_pointer ptr(options.path);
                if (!document.contains(ptr)) {
                    return codec_status(StatusCode::NotFound);
                }
                target = &document.at(ptr);
            }

            auto take = [&](const Document& record) -> Status {
                ArtifactDescription d;
                ArtifactError err{};
                const Status s = codec_decode_record(record, options.parse_hash, &d, &err);
                if (bundl::core::is_ok(s)) {
                    out->descriptions.push_back(std::move(d));
                    return s;
                }
                out->errors.push_back(std::move(err));
                return s;
            };

            if (target->is_object()) {
                const Status s = take(*target);
                if (!bundl::core::is_ok(s) && options.mode == DecodeMode::FailFast) {
                    return s;
                }
                return bundl::core::ok_status();
            }
            if (!target->is_array()) {
                return codec_status(StatusCode::Invalid);
            }

            for (const Document& record : *target) {
                const Status s = take(record);
                if (!bundl::core::is_ok(s) && options.mode == DecodeMode::FailFast) {
                    out->descriptions.clear();
                    return s;
                }
            }
            return bundl::core::ok_status();
        } catch (const nlohmann::json::exception& e) {
            bundl::core::log_error("decode: %s", e.what());
            return codec_status(StatusCode::Invalid);
        } catch (const std::bad_alloc&) {
            return codec_status(StatusCode::Unavailable);
        }
    }

    Status codec_decode_string(std::string_view text, const DecodeOptions& options, DecodeResult* out) noexcept {
        if (out == nullptr) {
            return codec_status(StatusCode::Invalid);
        }
        try {
            const Document doc = Document::parse(text);
            return codec_decode(doc, options, out);
        } catch (const nlohmann::json::exception& e) {
            bundl::core::log_error("decode: %s", e.what());
            return codec_status(StatusCode::Invalid);
        } catch (const std::bad_alloc&) {
            return codec_status(StatusCode::Unavailable);
        }
    }

    Status codec_read_file(const std::filesystem::path& path, const DecodeOptions& options, DecodeResult* out) noexcept {
        if (out == nullptr) {
            return codec_status(StatusCode::Invalid);
        }
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            if (ec && ec != std::errc::no_such_file_or_directory) {
                return codec_status(StatusCode::Io, static_cast<bundl::core::u32>(ec.value()));
            }
            return codec_status(StatusCode::NotFound);
        }
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return codec_status(StatusCode::Io, static_cast<bundl::core::u32>(errno));
        }
        try {
            const std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
            return codec_decode_string(text, options, out);
        } catch (const std::bad_alloc&) {
            return codec_status(StatusCode::Unavailable);
        }
    }

    Status codec_write_file(const std::filesystem::path& path,
        const bundl::manifest::DescriptionList& descriptions,
        int indent) noexcept {
        std::string text;
        const Status s = codec_encode_string(descriptions, indent, &text);
        if (!bundl::core::is_ok(s)) {
            return s;
        }

        std::ofstream f(path, std::ios::binary | std::ios::trunc);
        if (!f) {
            return codec_status(StatusCode::Io, static_cast<bundl::core::u32>(errno));
        }
        f << text << '\n';
        f.flush();
        if (!f) {
            return codec_status(StatusCode::Io, EIO);
        }
        return bundl::core::ok_status();
    }

} // namespace bundl::codec
