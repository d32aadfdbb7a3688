//
// Created by igor on 06/09/2025.
//

#include <polyglot/wav_file.hh>
#include <polyglot/endian.hh>
#include <polyglot/exceptions.hh>
#include "input.hh"

#include <array>

namespace polyglot::wav {

    namespace {
        constexpr auto le = byte_order::little;

        void append_fourcc(byte_buffer& out, fourcc id) {
            std::array<std::byte, 4> tag{};
            id.to_bytes(tag.data());
            out.insert(out.end(), tag.begin(), tag.end());
        }

        std::uint64_t chunks_size(const file& f) {
            std::uint64_t total = 0;
            for (const auto& c : f.chunks) {
                total += c.total_size();
            }
            return total;
        }
    }

    file parse(const byte_buffer& bytes, const parse_options& options) {
        THROW_POLICY_IF(bytes.size() > options.max_input_size, error_code::payload_too_large,
                        "Input of ", bytes.size(), " bytes exceeds the limit of ",
                        options.max_input_size, " bytes");
        THROW_PARSE_UNLESS(starts_with_at(bytes, 0, "RIFF"), error_code::not_riff,
                           "Missing 'RIFF' tag at offset 0");
        THROW_PARSE_IF(bytes.size() < header_size, error_code::truncated_chunk,
                       "RIFF header needs ", header_size, " bytes, buffer holds ", bytes.size());
        THROW_PARSE_UNLESS(starts_with_at(bytes, 8, "WAVE"), error_code::not_wave,
                           "RIFF form type at offset 8 is ", fourcc::from_bytes(bytes.data() + 8),
                           ", expected 'WAVE'");

        file result;
        result.riff_size = read_u32le(bytes, 4);

        std::uint64_t extent = std::uint64_t(result.riff_size) + 8;
        if (extent > bytes.size()) {
            auto msg = build_error_msg("RIFF size ", result.riff_size, " describes ", extent,
                                       " bytes, buffer holds ", bytes.size());
            if (options.strict) {
                throw integrity_error(error_code::size_mismatch, msg);
            }
            options.warn(4, "riff_size", msg);
            extent = bytes.size();
        }
        THROW_PARSE_IF(extent < header_size, error_code::truncated_chunk,
                       "RIFF size ", result.riff_size, " is smaller than the form type");

        memory_reader rd(bytes, header_size, extent - header_size);
        while (rd.remaining() > 0) {
            std::uint64_t start = rd.absolute();
            THROW_PARSE_IF(rd.remaining() < chunk_header_size, error_code::truncated_chunk,
                           "Chunk header at offset ", start, " needs ", chunk_header_size,
                           " bytes, only ", rd.remaining(), " left in the RIFF form");
            chunk c;
            c.file_offset = start;
            c.id = rd.read_fourcc();
            c.size = rd.read<std::uint32_t>(le);
            THROW_PARSE_IF(c.size > rd.remaining(), error_code::truncated_chunk,
                           "Chunk ", c.id, " at offset ", start, " declares ", c.size,
                           " bytes, only ", rd.remaining(), " left in the RIFF form");
            c.data = rd.read_exact(c.size);

            // A missing pad byte on the last chunk is common enough to accept
            if ((c.size & 1) != 0 && rd.remaining() > 0) {
                c.has_pad = true;
                c.pad = rd.read_exact(1)[0];
            }
            result.chunks.push_back(std::move(c));
        }

        auto format_idx = find_chunk(result, fmt);
        THROW_PARSE_UNLESS(format_idx, error_code::missing_fmt_chunk, "WAVE form has no 'fmt ' chunk");
        const auto& fc = result.chunks[*format_idx];
        THROW_PARSE_IF(fc.data.size() < min_format_size, error_code::truncated_chunk,
                       "'fmt ' chunk at offset ", fc.file_offset, " holds ", fc.data.size(),
                       " bytes, needs at least ", min_format_size);
        THROW_PARSE_UNLESS(find_chunk(result, data), error_code::missing_data_chunk,
                           "WAVE form has no 'data' chunk");

        result.trailing = slice(bytes, static_cast<std::size_t>(extent),
                                static_cast<std::size_t>(bytes.size() - extent));
        return result;
    }

    byte_buffer serialize(const file& f) {
        byte_buffer out;
        out.reserve(static_cast<std::size_t>(header_size + chunks_size(f) + f.trailing.size()));
        append_fourcc(out, RIFF);
        append_field(out, f.riff_size, le);
        append_fourcc(out, WAVE);
        for (const auto& c : f.chunks) {
            append_fourcc(out, c.id);
            append_field(out, c.size, le);
            append(out, c.data);
            if (c.has_pad) {
                out.push_back(c.pad);
            }
        }
        append(out, f.trailing);
        return out;
    }

    format format_of(const file& f) {
        auto idx = find_chunk(f, fmt);
        THROW_PARSE_UNLESS(idx, error_code::missing_fmt_chunk, "WAVE form has no 'fmt ' chunk");
        const auto& d = f.chunks[*idx].data;
        format result;
        result.format_tag = read_u16le(d, 0);
        result.channels = read_u16le(d, 2);
        result.sample_rate = read_u32le(d, 4);
        result.byte_rate = read_u32le(d, 8);
        result.block_align = read_u16le(d, 12);
        result.bits_per_sample = read_u16le(d, 14);
        return result;
    }

    const byte_buffer& samples(const file& f) {
        auto idx = find_chunk(f, data);
        THROW_PARSE_UNLESS(idx, error_code::missing_data_chunk, "WAVE form has no 'data' chunk");
        return f.chunks[*idx].data;
    }

    std::optional<std::size_t> find_chunk(const file& f, fourcc id) {
        for (std::size_t i = 0; i < f.chunks.size(); ++i) {
            if (f.chunks[i].id == id) {
                return i;
            }
        }
        return std::nullopt;
    }

    void embed_chunk(file& f, fourcc id, byte_buffer payload) {
        THROW_POLICY_IF(id == fmt || id == data, error_code::critical_chunk_rejected,
                        "Refusing to add a second ", id, " chunk");

        // The new chunk must start on an even offset
        bool pad_last = !f.chunks.empty() && (f.chunks.back().data.size() & 1) != 0 &&
                        !f.chunks.back().has_pad;

        std::uint64_t used = 4 + chunks_size(f) + (pad_last ? 1 : 0);
        std::uint64_t added = chunk_header_size + payload.size() + (payload.size() & 1);
        THROW_POLICY_IF(used + added > 0xFFFFFFFFu, error_code::payload_too_large,
                        "Chunk ", id, " of ", payload.size(), " bytes would push the RIFF size to ",
                        used + added, ", beyond 32 bits");

        if (pad_last) {
            f.chunks.back().has_pad = true;
            f.chunks.back().pad = std::byte{0};
        }

        chunk c;
        c.id = id;
        c.size = static_cast<std::uint32_t>(payload.size());
        c.has_pad = (payload.size() & 1) != 0;
        c.file_offset = header_size + chunks_size(f);
        c.data = std::move(payload);
        f.chunks.push_back(std::move(c));
        f.riff_size = static_cast<std::uint32_t>(used + added);
    }
}
