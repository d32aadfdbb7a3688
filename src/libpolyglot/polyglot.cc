//
// Created by igor on 09/09/2025.
//

#include <polyglot/polyglot.hh>
#include <polyglot/offset_reconciler.hh>
#include <polyglot/png_stream.hh>
#include <polyglot/wav_file.hh>
#include <polyglot/zip_archive.hh>

#include <algorithm>

namespace polyglot {

    namespace {
        bool same_entries(const std::vector<zip::entry>& a, const std::vector<zip::entry>& b) {
            return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                              [](const zip::entry& x, const zip::entry& y) {
                                  return x.filename == y.filename && x.crc32 == y.crc32 && x.data == y.data;
                              });
        }

        void check_artifact(const composite_artifact& artifact, const byte_buffer& host,
                            const byte_buffer& guest, const parse_options& po) {
            switch (artifact.method) {
                case strategy::text_embed: {
                    auto s = png::parse(artifact.bytes, po);
                    auto payload = png::find_text_payload(s, payload_keyword);
                    if (!payload || *payload != guest) {
                        THROW_COMPOSITION("tEXt chunk of the composed PNG does not hold the guest payload");
                    }
                    break;
                }
                case strategy::container_append: {
                    auto archive = zip::parse(artifact.bytes, 0, po);
                    if (!verify_offsets(archive)) {
                        THROW_COMPOSITION("Central directory offsets do not match the composed layout");
                    }
                    if (!same_entries(zip::entries(archive), zip::entries(zip::parse(host, 0, po)))) {
                        THROW_COMPOSITION("Composed archive entries differ from the host archive");
                    }
                    // The guest leads the artifact and must still parse as itself
                    switch (sniff_format(guest)) {
                        case container_format::png:
                            png::parse(artifact.bytes, po);
                            break;
                        case container_format::wav:
                            wav::parse(artifact.bytes, po);
                            break;
                        case container_format::zip:
                        case container_format::unknown:
                        case container_format::any:
                            break;
                    }
                    break;
                }
                case strategy::riff_chunk_embed: {
                    auto f = wav::parse(artifact.bytes, po);
                    auto idx = wav::find_chunk(f, wav::pnG);
                    if (!idx || f.chunks[*idx].data != guest) {
                        THROW_COMPOSITION("'pnG ' chunk of the composed WAV does not hold the guest payload");
                    }
                    if (wav::samples(f) != wav::samples(wav::parse(host, po))) {
                        THROW_COMPOSITION("Composed WAV audio differs from the host audio");
                    }
                    break;
                }
                case strategy::bidirectional:
                case strategy::idat_embed:
                    THROW_COMPOSITION("Strategy ", to_string(artifact.method), " produced an artifact");
            }
        }
    }

    composite_artifact compose(strategy method, const byte_buffer& host, const byte_buffer& guest,
                               const compose_options& options) {
        auto artifact = apply_strategy(method, host, guest, options);

        // Lenient inputs are allowed, a lenient artifact is not
        parse_options po = options.to_parse_options();
        po.strict = true;
        po.on_warning = nullptr;
        po.max_input_size = std::max<std::uint64_t>(po.max_input_size, artifact.bytes.size());
        try {
            check_artifact(artifact, host, guest, po);
        } catch (const parse_error& e) {
            THROW_COMPOSITION("Composed ", to_string(method), " artifact does not parse: ", e.what());
        } catch (const integrity_error& e) {
            THROW_COMPOSITION("Composed ", to_string(method), " artifact fails integrity checks: ", e.what());
        }
        return artifact;
    }

    composite_artifact compose(std::string_view method, const byte_buffer& host, const byte_buffer& guest,
                               const compose_options& options) {
        return compose(strategy_from_name(method), host, guest, options);
    }

    validation_result validate(const byte_buffer& artifact, const parse_options& options) {
        return inspect(artifact, options);
    }

    byte_buffer extract(const byte_buffer& artifact, container_format target, const parse_options& options) {
        auto result = inspect(artifact, options);
        for (auto& payload : result.payloads) {
            if (target == container_format::any || payload.format == target) {
                return std::move(payload.bytes);
            }
        }
        THROW_NOT_FOUND(error_code::no_embedded_payload_found,
                        "No embedded ", to_string(target), " payload found in ", artifact.size(), "-byte input");
    }
}
