//
// Created by igor on 04/09/2025.
//

#include <polyglot/png_stream.hh>
#include <polyglot/crc32.hh>
#include <polyglot/endian.hh>
#include <polyglot/exceptions.hh>
#include "input.hh"

#include <algorithm>
#include <array>

namespace polyglot::png {

    static constexpr std::array<std::byte, signature_size> SIGNATURE = {
        std::byte(0x89), std::byte('P'), std::byte('N'), std::byte('G'),
        std::byte(0x0D), std::byte(0x0A), std::byte(0x1A), std::byte(0x0A)
    };

    std::uint64_t stream::end_offset() const {
        if (chunks.empty()) {
            return signature_size;
        }
        const auto& last = chunks.back();
        return last.file_offset + last.total_size();
    }

    bool has_signature(const byte_buffer& data) {
        return data.size() >= signature_size &&
               std::equal(SIGNATURE.begin(), SIGNATURE.end(), data.begin());
    }

    stream parse(const byte_buffer& data, const parse_options& options) {
        THROW_POLICY_IF(data.size() > options.max_input_size, error_code::payload_too_large,
                        "Input of ", data.size(), " bytes exceeds the limit of ",
                        options.max_input_size, " bytes");
        THROW_PARSE_UNLESS(has_signature(data), error_code::malformed_signature,
                           "Missing PNG signature at offset 0");

        stream result;
        memory_reader rd(data);
        rd.seek(signature_size, memory_reader::set);

        bool seen_end = false;
        while (rd.remaining() > 0) {
            std::uint64_t start = rd.absolute();
            THROW_PARSE_IF(rd.remaining() < chunk_overhead, error_code::truncated_chunk,
                           "Chunk header at offset ", start, " needs ", chunk_overhead,
                           " bytes, only ", rd.remaining(), " left");

            chunk c;
            c.file_offset = start;
            c.length = rd.read<std::uint32_t>(byte_order::big);
            c.type = rd.read_fourcc();

            THROW_PARSE_IF(c.length > max_chunk_length, error_code::truncated_chunk,
                           "Chunk ", c.type, " at offset ", start, " declares length ",
                           c.length, " beyond the PNG limit of ", max_chunk_length);
            THROW_PARSE_IF(std::uint64_t(c.length) + 4 > rd.remaining(), error_code::truncated_chunk,
                           "Chunk ", c.type, " at offset ", start, " declares length ",
                           c.length, " but only ", rd.remaining(), " bytes remain");

            THROW_PARSE_IF(result.chunks.empty() && c.type != IHDR, error_code::missing_header_chunk,
                           "First chunk is ", c.type, ", expected 'IHDR'");

            c.data = rd.read_exact(c.length);
            c.crc = rd.read<std::uint32_t>(byte_order::big);

            std::uint32_t computed = chunk_crc32(c.type, c.data);
            if (computed != c.crc) {
                auto msg = build_error_msg("Chunk ", c.type, " at offset ", start,
                                           " stores CRC 0x", std::hex, c.crc,
                                           ", computed 0x", computed);
                if (options.strict) {
                    throw integrity_error(error_code::chunk_crc_mismatch, msg);
                }
                options.warn(start, "chunk_crc", msg);
            }

            result.chunks.push_back(std::move(c));
            if (result.chunks.back().type == IEND) {
                seen_end = true;
                break;
            }
        }

        THROW_PARSE_IF(result.chunks.empty(), error_code::missing_header_chunk,
                       "PNG signature is not followed by any chunk");

        if (!seen_end) {
            auto msg = build_error_msg("Chunk stream ends at offset ", rd.absolute(),
                                       " without an 'IEND' chunk");
            THROW_PARSE_IF(options.strict, error_code::missing_trailer_chunk, msg);
            options.warn(rd.absolute(), "missing_trailer", msg);
        }

        result.trailing = rd.read_exact(static_cast<std::size_t>(rd.remaining()));
        return result;
    }

    byte_buffer serialize(const stream& s) {
        std::uint64_t total = signature_size + s.trailing.size();
        for (const auto& c : s.chunks) {
            total += c.total_size();
        }

        byte_buffer out;
        out.reserve(static_cast<std::size_t>(total));
        out.insert(out.end(), SIGNATURE.begin(), SIGNATURE.end());

        for (const auto& c : s.chunks) {
            append_field(out, c.length, byte_order::big);
            std::array<std::byte, 4> tag{};
            c.type.to_bytes(tag.data());
            out.insert(out.end(), tag.begin(), tag.end());
            append(out, c.data);
            append_field(out, c.crc, byte_order::big);
        }

        append(out, s.trailing);
        return out;
    }

    chunk make_chunk(fourcc type, byte_buffer data) {
        THROW_POLICY_IF(data.size() > max_chunk_length, error_code::payload_too_large,
                        "Chunk ", type, " payload of ", data.size(),
                        " bytes exceeds the PNG limit of ", max_chunk_length);
        chunk c;
        c.length = static_cast<std::uint32_t>(data.size());
        c.type = type;
        c.crc = chunk_crc32(type, data);
        c.data = std::move(data);
        return c;
    }

    void insert_ancillary(stream& s, fourcc type, byte_buffer data, std::uint64_t max_length) {
        THROW_PARSE_UNLESS(type.is_letters() && type.reserved_bit_clear(), error_code::invalid_chunk_type,
                           "Chunk type ", type, " is not a valid PNG chunk type");
        THROW_POLICY_IF(type.is_critical(), error_code::critical_chunk_rejected,
                        "Refusing to insert critical chunk ", type,
                        ": decoders must understand it to render the image");

        std::uint64_t limit = std::min<std::uint64_t>(max_length, max_chunk_length);
        THROW_POLICY_IF(data.size() > limit, error_code::payload_too_large,
                        "Payload of ", data.size(), " bytes does not fit in a chunk (limit ",
                        limit, " bytes)");

        auto end_it = std::find_if(s.chunks.rbegin(), s.chunks.rend(),
                                   [](const chunk& c) { return c.type == IEND; });
        THROW_PARSE_IF(end_it == s.chunks.rend(), error_code::missing_trailer_chunk,
                       "Cannot insert ", type, ": stream has no 'IEND' chunk");

        auto pos = std::prev(end_it.base());
        chunk inserted = make_chunk(type, std::move(data));
        inserted.file_offset = pos->file_offset;
        std::uint64_t shift = inserted.total_size();

        pos = s.chunks.insert(pos, std::move(inserted));
        for (auto it = std::next(pos); it != s.chunks.end(); ++it) {
            it->file_offset += shift;
        }
    }

    std::optional<std::size_t> find_chunk(const stream& s, fourcc type) {
        for (std::size_t i = 0; i < s.chunks.size(); ++i) {
            if (s.chunks[i].type == type) {
                return i;
            }
        }
        return std::nullopt;
    }

    byte_buffer make_text_data(std::string_view keyword, const byte_buffer& payload) {
        byte_buffer out;
        out.reserve(keyword.size() + 1 + payload.size());
        append(out, keyword);
        out.push_back(std::byte{0});
        append(out, payload);
        return out;
    }

    std::optional<byte_buffer> find_text_payload(const stream& s, std::string_view keyword) {
        for (const auto& c : s.chunks) {
            if (c.type != tEXt || c.data.size() <= keyword.size()) {
                continue;
            }
            if (starts_with_at(c.data, 0, keyword) && c.data[keyword.size()] == std::byte{0}) {
                std::size_t start = keyword.size() + 1;
                return slice(c.data, start, c.data.size() - start);
            }
        }
        return std::nullopt;
    }
}
