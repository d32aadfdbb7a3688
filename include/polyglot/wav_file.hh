/**
 * @file wav_file.hh
 * @brief RIFF WAVE container model
 * @author Igor
 * @date 06/09/2025
 *
 * A WAV file is a RIFF form: "RIFF", a little-endian size covering the form
 * type and every chunk, "WAVE", then chunks. Each chunk is a four character
 * id, a little-endian size and the data, padded to an even length.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <polyglot/export_polyglot.h>
#include <polyglot/bytes.hh>
#include <polyglot/fourcc.hh>
#include <polyglot/parse_options.hh>

namespace polyglot::wav {

    inline constexpr auto RIFF = "RIFF"_4cc;
    inline constexpr auto WAVE = "WAVE"_4cc;
    inline constexpr auto fmt = "fmt "_4cc;
    inline constexpr auto data = "data"_4cc;

    /// Custom chunk that carries an embedded PNG
    inline constexpr auto pnG = "pnG "_4cc;

    /// "RIFF", size, "WAVE"
    inline constexpr std::size_t header_size = 12;

    /// Chunk id and size fields
    inline constexpr std::size_t chunk_header_size = 8;

    /// Smallest valid 'fmt ' body (PCM WAVEFORMAT)
    inline constexpr std::size_t min_format_size = 16;

    struct chunk {
        fourcc id;
        std::uint32_t size = 0;          ///< Stored size field
        byte_buffer data;
        bool has_pad = false;            ///< A pad byte follows the odd-sized data
        std::byte pad{0};                ///< Its value, kept for exact serialization
        std::uint64_t file_offset = 0;   ///< Offset of the chunk id in the parsed buffer

        [[nodiscard]] std::uint64_t total_size() const {
            return chunk_header_size + data.size() + (has_pad ? 1 : 0);
        }
    };

    /**
     * @struct file
     * @brief Parsed WAV: RIFF size field, chunks in order, bytes past the RIFF extent
     */
    struct file {
        std::uint32_t riff_size = 0;
        std::vector<chunk> chunks;
        byte_buffer trailing;
    };

    struct format {
        std::uint16_t format_tag = 0;
        std::uint16_t channels = 0;
        std::uint32_t sample_rate = 0;
        std::uint32_t byte_rate = 0;
        std::uint16_t block_align = 0;
        std::uint16_t bits_per_sample = 0;
    };

    /**
     * @brief Parse a RIFF WAVE file starting at offset 0
     * @throws parse_error NotRiff, NotWave, TruncatedChunk, MissingFmtChunk, MissingDataChunk
     * @throws integrity_error SizeMismatch when the RIFF size exceeds the buffer (strict mode only)
     */
    POLYGLOT_EXPORT file parse(const byte_buffer& bytes, const parse_options& options = {});

    POLYGLOT_EXPORT byte_buffer serialize(const file& f);

    /// Decoded 'fmt ' chunk
    POLYGLOT_EXPORT format format_of(const file& f);

    /// Contents of the 'data' chunk
    POLYGLOT_EXPORT const byte_buffer& samples(const file& f);

    POLYGLOT_EXPORT std::optional<std::size_t> find_chunk(const file& f, fourcc id);

    /**
     * @brief Append a chunk after the existing ones and update the RIFF size
     * @throws policy_error CriticalChunkRejected for 'fmt ' and 'data',
     *         PayloadTooLarge if the RIFF size would overflow 32 bits
     */
    POLYGLOT_EXPORT void embed_chunk(file& f, fourcc id, byte_buffer payload);
}
