//
// Created by igor on 07/09/2025.
//

#include <polyglot/strategy.hh>
#include <polyglot/exceptions.hh>
#include <polyglot/offset_reconciler.hh>
#include <polyglot/wav_file.hh>
#include <polyglot/zip_archive.hh>

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>
#include <utility>

namespace polyglot {

    namespace {
        // Bytes a format requires at fixed offsets from the start of the file
        using fixed_field = std::pair<std::size_t, std::string_view>;

        std::vector<fixed_field> fixed_fields(container_format format) {
            switch (format) {
                case container_format::png:
                    return {{0, std::string_view("\x89PNG\r\n\x1a\n", 8)}, {12, "IHDR"}};
                case container_format::wav:
                    return {{0, "RIFF"}, {8, "WAVE"}, {12, "fmt "}};
                case container_format::zip:
                    // Located from the end; nothing is pinned at the start
                    return {};
                case container_format::unknown:
                case container_format::any:
                    return {};
            }
            return {};
        }

        void check_input_size(const byte_buffer& data, std::string_view what, const compose_options& options) {
            THROW_POLICY_IF(data.size() > options.max_input_size, error_code::payload_too_large,
                            what, " of ", data.size(), " bytes exceeds the limit of ",
                            options.max_input_size, " bytes");
        }

        composite_artifact text_embed(const byte_buffer& host, const byte_buffer& guest,
                                      const compose_options& options) {
            auto s = png::parse(host, options.to_parse_options());

            png::insert_ancillary(s, png::tEXt, png::make_text_data(payload_keyword, guest),
                                  options.max_chunk_length);
            return {png::serialize(s), strategy::text_embed, container_format::png};
        }

        composite_artifact container_append(const byte_buffer& host, const byte_buffer& guest,
                                            const compose_options& options) {
            auto archive = zip::parse(host, 0, options.to_parse_options());
            auto shifted = reconcile_offsets(archive, static_cast<std::int64_t>(guest.size()));

            composite_artifact result;
            result.method = strategy::container_append;
            result.host = guest.empty() ? container_format::zip : sniff_format(guest);
            result.bytes.reserve(guest.size() + shifted.leading.size() + static_cast<std::size_t>(shifted.byte_size()));
            append(result.bytes, guest);
            append(result.bytes, zip::serialize(shifted));
            return result;
        }

        composite_artifact riff_chunk_embed(const byte_buffer& host, const byte_buffer& guest,
                                            const compose_options& options) {
            auto f = wav::parse(host, options.to_parse_options());
            wav::embed_chunk(f, wav::pnG, guest);
            return {wav::serialize(f), strategy::riff_chunk_embed, container_format::wav};
        }

        composite_artifact bidirectional(const byte_buffer& host, const byte_buffer& guest,
                                         const compose_options& options) {
            auto host_format = sniff_format(host);
            auto guest_format = sniff_format(guest);
            bool png_wav = (host_format == container_format::png && guest_format == container_format::wav) ||
                           (host_format == container_format::wav && guest_format == container_format::png);
            THROW_POLICY_IF(!png_wav, error_code::bidirectional_infeasible,
                            "Shared header needs one PNG and one WAV input, got ",
                            to_string(host_format), " and ", to_string(guest_format));

            // Both inputs must be well formed before any layout is attempted
            auto po = options.to_parse_options();
            if (host_format == container_format::png) {
                png::parse(host, po);
                wav::parse(guest, po);
            } else {
                wav::parse(host, po);
                png::parse(guest, po);
            }

            THROW_POLICY_IF(!fixed_headers_compatible(host_format, guest_format),
                            error_code::bidirectional_infeasible,
                            "PNG and WAV both pin bytes 0-3 of the file ('\\x89PNG' vs 'RIFF'); "
                            "no shared header exists");
            THROW_POLICY(error_code::bidirectional_infeasible,
                         "No shared PNG+WAV header layout is known for these inputs");
        }
    }

    std::string_view to_string(strategy method) {
        switch (method) {
            case strategy::text_embed:       return "text_embed";
            case strategy::container_append: return "container_append";
            case strategy::riff_chunk_embed: return "riff_chunk_embed";
            case strategy::bidirectional:    return "bidirectional";
            case strategy::idat_embed:       return "idat_embed";
        }
        return "unknown";
    }

    strategy strategy_from_name(std::string_view name) {
        std::string lower(name);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "text" || lower == "text_embed") {
            return strategy::text_embed;
        }
        if (lower == "zip" || lower == "append" || lower == "container_append") {
            return strategy::container_append;
        }
        if (lower == "riff" || lower == "wav" || lower == "riff_chunk_embed") {
            return strategy::riff_chunk_embed;
        }
        if (lower == "bidirectional") {
            return strategy::bidirectional;
        }
        if (lower == "idat" || lower == "idat_embed") {
            return strategy::idat_embed;
        }
        THROW_POLICY(error_code::unsupported_strategy, "Unknown embedding method '", name, "'");
    }

    bool fixed_headers_compatible(container_format a, container_format b) {
        for (const auto& [off_a, magic_a] : fixed_fields(a)) {
            for (const auto& [off_b, magic_b] : fixed_fields(b)) {
                std::size_t first = std::max(off_a, off_b);
                std::size_t last = std::min(off_a + magic_a.size(), off_b + magic_b.size());
                for (std::size_t i = first; i < last; ++i) {
                    if (magic_a[i - off_a] != magic_b[i - off_b]) {
                        return false;
                    }
                }
            }
        }
        return true;
    }

    composite_artifact apply_strategy(strategy method, const byte_buffer& host, const byte_buffer& guest,
                                      const compose_options& options) {
        check_input_size(host, "Host", options);
        check_input_size(guest, "Guest", options);

        switch (method) {
            case strategy::text_embed:
                return text_embed(host, guest, options);
            case strategy::container_append:
                return container_append(host, guest, options);
            case strategy::riff_chunk_embed:
                return riff_chunk_embed(host, guest, options);
            case strategy::bidirectional:
                return bidirectional(host, guest, options);
            case strategy::idat_embed:
                THROW_POLICY(error_code::unsupported_strategy,
                             "IDAT embedding would alter pixel data and is not supported");
        }
        THROW_POLICY(error_code::unsupported_strategy, "Unknown embedding method");
    }
}
