//
// Created by igor on 08/09/2025.
//

#include <polyglot/validation.hh>
#include <polyglot/offset_reconciler.hh>
#include <polyglot/png_stream.hh>
#include <polyglot/wav_file.hh>
#include <polyglot/zip_archive.hh>


namespace polyglot {

    namespace {
        error_code code_of(std::string_view category) {
            if (category == "chunk_crc") {
                return error_code::chunk_crc_mismatch;
            }
            if (category == "entry_crc") {
                return error_code::entry_crc_mismatch;
            }
            if (category == "missing_trailer") {
                return error_code::missing_trailer_chunk;
            }
            if (category == "unreconciled_offsets") {
                return error_code::unreconciled_offsets;
            }
            // size_mismatch, header_mismatch, riff_size
            return error_code::size_mismatch;
        }

        // Lenient options whose warnings land in @p sink
        parse_options collecting(const parse_options& options, container_format format,
                                 std::vector<finding>& sink) {
            parse_options po = options;
            po.strict = false;
            po.on_warning = [format, &sink](std::uint64_t offset, std::string_view category,
                                            std::string_view message) {
                sink.push_back({format, code_of(category), std::string(category), offset,
                                std::string(message)});
            };
            return po;
        }

        finding structural(container_format format, const polyglot_error& e) {
            return {format, e.code(), "structure", 0, e.what()};
        }

        void probe_png(const byte_buffer& bytes, const parse_options& options, validation_result& result) {
            if (!png::has_signature(bytes)) {
                return;
            }
            std::vector<finding> local;
            try {
                auto s = png::parse(bytes, collecting(options, container_format::png, local));
                result.png_valid = local.empty();
                if (auto payload = png::find_text_payload(s, payload_keyword)) {
                    auto format = sniff_format(*payload);
                    result.payloads.push_back({format, strategy::text_embed, std::move(*payload)});
                    result.detected = strategy::text_embed;
                }
            } catch (const polyglot_error& e) {
                local.push_back(structural(container_format::png, e));
            }
            result.findings.insert(result.findings.end(), local.begin(), local.end());
        }

        void probe_zip(const byte_buffer& bytes, const parse_options& options, validation_result& result) {
            std::vector<finding> local;
            try {
                zip::archive archive;
                std::uint64_t origin = 0;
                try {
                    archive = zip::parse(bytes, 0, collecting(options, container_format::zip, local));
                } catch (const parse_error& e) {
                    if (e.code() == error_code::eocd_not_found || e.code() == error_code::zip64_unsupported) {
                        throw;
                    }
                    // Offsets may still be measured from where the archive used to start
                    auto inferred = zip::infer_origin(bytes, options);
                    if (!inferred || *inferred == 0) {
                        throw;
                    }
                    local.clear();
                    archive = zip::parse(bytes, *inferred, collecting(options, container_format::zip, local));
                    origin = *inferred;
                    local.push_back({container_format::zip, error_code::unreconciled_offsets,
                                     "unreconciled_offsets", origin,
                                     build_error_msg("Archive offsets are measured from offset ", origin,
                                                     ", not from the start of the file")});
                }

                std::uint64_t region_start = origin + archive.start_offset;
                if (region_start > 0) {
                    auto prefix = slice(bytes, 0, static_cast<std::size_t>(region_start));
                    auto format = sniff_format(prefix);
                    result.payloads.push_back({format, strategy::container_append, std::move(prefix)});

                    // The prefix is reported on its own; the recovered archive starts at its first record
                    archive.leading.clear();
                    auto restored = reconcile_offsets(archive, -static_cast<std::int64_t>(archive.start_offset));
                    result.payloads.push_back({container_format::zip, strategy::container_append,
                                               zip::serialize(restored)});
                    if (origin == 0 && !result.detected) {
                        result.detected = strategy::container_append;
                    }
                }
                result.zip_valid = local.empty();
            } catch (const parse_error& e) {
                if (e.code() != error_code::eocd_not_found) {
                    local.push_back(structural(container_format::zip, e));
                }
            } catch (const polyglot_error& e) {
                local.push_back(structural(container_format::zip, e));
            }
            result.findings.insert(result.findings.end(), local.begin(), local.end());
        }

        void probe_wav(const byte_buffer& bytes, const parse_options& options, validation_result& result) {
            if (!starts_with_at(bytes, 0, "RIFF")) {
                return;
            }
            std::vector<finding> local;
            try {
                auto f = wav::parse(bytes, collecting(options, container_format::wav, local));
                result.wav_valid = local.empty();
                if (auto idx = wav::find_chunk(f, wav::pnG)) {
                    auto& payload = f.chunks[*idx].data;
                    auto format = sniff_format(payload);
                    result.payloads.push_back({format, strategy::riff_chunk_embed, std::move(payload)});
                    if (!result.detected) {
                        result.detected = strategy::riff_chunk_embed;
                    }
                }
            } catch (const polyglot_error& e) {
                local.push_back(structural(container_format::wav, e));
            }
            result.findings.insert(result.findings.end(), local.begin(), local.end());
        }
    }

    bool validation_result::is_valid(container_format format) const {
        switch (format) {
            case container_format::png: return png_valid;
            case container_format::zip: return zip_valid;
            case container_format::wav: return wav_valid;
            case container_format::any: return valid_count() > 0;
            case container_format::unknown: return false;
        }
        return false;
    }

    validation_result inspect(const byte_buffer& bytes, const parse_options& options) {
        THROW_POLICY_IF(bytes.size() > options.max_input_size, error_code::payload_too_large,
                        "Input of ", bytes.size(), " bytes exceeds the limit of ",
                        options.max_input_size, " bytes");

        validation_result result;
        result.host = sniff_format(bytes);

        probe_png(bytes, options, result);
        probe_zip(bytes, options, result);
        probe_wav(bytes, options, result);
        return result;
    }
}
