/**
 * @file png_stream.hh
 * @brief PNG signature + chunk sequence model
 * @author Igor
 * @date 04/09/2025
 *
 * The model keeps every field exactly as stored so that serialize(parse(p))
 * reproduces p byte for byte. Nothing is normalized: reordering chunks or
 * recomputing a stored CRC would break a polyglot built around them.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <polyglot/export_polyglot.h>
#include <polyglot/bytes.hh>
#include <polyglot/fourcc.hh>
#include <polyglot/parse_options.hh>

namespace polyglot::png {

    inline constexpr auto IHDR = "IHDR"_4cc;
    inline constexpr auto IDAT = "IDAT"_4cc;
    inline constexpr auto IEND = "IEND"_4cc;
    inline constexpr auto tEXt = "tEXt"_4cc;

    /// Size of the fixed 8-byte signature
    inline constexpr std::size_t signature_size = 8;

    /// Length, type and CRC fields around the chunk data
    inline constexpr std::size_t chunk_overhead = 12;

    /// The PNG grammar limits chunk lengths to 2^31-1
    inline constexpr std::uint32_t max_chunk_length = 0x7FFFFFFFu;

    /**
     * @struct chunk
     * @brief One length-prefixed, typed, checksummed record
     */
    struct chunk {
        std::uint32_t length = 0;        ///< Stored length field
        fourcc type;                     ///< Chunk type code
        byte_buffer data;                ///< Chunk payload
        std::uint32_t crc = 0;           ///< Stored CRC field
        std::uint64_t file_offset = 0;   ///< Offset of the length field in the parsed buffer

        /// Bytes this chunk occupies when serialized
        [[nodiscard]] std::uint64_t total_size() const { return chunk_overhead + data.size(); }
    };

    /**
     * @struct stream
     * @brief Parsed PNG: ordered chunks plus any bytes that follow IEND
     */
    struct stream {
        std::vector<chunk> chunks;
        byte_buffer trailing;          ///< Bytes after IEND (ignored by decoders)

        /// Offset one past the IEND chunk
        [[nodiscard]] std::uint64_t end_offset() const;
    };

    /**
     * @brief True if the buffer starts with the 8-byte PNG signature
     */
    POLYGLOT_EXPORT bool has_signature(const byte_buffer& data);

    /**
     * @brief Parse a PNG chunk stream starting at offset 0
     * @throws parse_error MalformedSignature, TruncatedChunk, MissingHeaderChunk,
     *         MissingTrailerChunk
     * @throws integrity_error ChunkCrcMismatch (strict mode only)
     */
    POLYGLOT_EXPORT stream parse(const byte_buffer& data, const parse_options& options = {});

    /**
     * @brief Serialize a stream exactly as its fields say
     */
    POLYGLOT_EXPORT byte_buffer serialize(const stream& s);

    /**
     * @brief Build a chunk with a correct length and CRC
     * @throws policy_error PayloadTooLarge if data exceeds max_chunk_length
     */
    POLYGLOT_EXPORT chunk make_chunk(fourcc type, byte_buffer data);

    /**
     * @brief Insert an ancillary chunk immediately before IEND
     * @param s Stream to modify
     * @param type Chunk type; must be four letters with a lowercase first letter
     * @param data Chunk payload
     * @param max_length Largest accepted payload (clamped to max_chunk_length)
     * @throws parse_error InvalidChunkType, MissingTrailerChunk
     * @throws policy_error CriticalChunkRejected, PayloadTooLarge
     *
     * Offsets of IEND and of the trailing bytes move; file_offset fields of
     * the following chunks are updated.
     */
    POLYGLOT_EXPORT void insert_ancillary(stream& s, fourcc type, byte_buffer data,
                                          std::uint64_t max_length = max_chunk_length);

    /**
     * @brief Index of the first chunk of the given type
     */
    POLYGLOT_EXPORT std::optional<std::size_t> find_chunk(const stream& s, fourcc type);

    /**
     * @brief Build tEXt chunk data: keyword, NUL separator, payload
     */
    POLYGLOT_EXPORT byte_buffer make_text_data(std::string_view keyword, const byte_buffer& payload);

    /**
     * @brief Payload of the first tEXt chunk carrying the given keyword
     */
    POLYGLOT_EXPORT std::optional<byte_buffer> find_text_payload(const stream& s, std::string_view keyword);
}
