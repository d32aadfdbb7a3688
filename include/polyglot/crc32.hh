/**
 * @file crc32.hh
 * @brief CRC-32 shared by PNG chunks and ZIP entries
 * @author Igor
 * @date 03/09/2025
 *
 * Both formats use the reflected polynomial 0xEDB88320 with an initial value
 * and final xor of 0xFFFFFFFF, so a single implementation serves both.
 */

#pragma once

#include <cstdint>
#include <cstddef>

#include <polyglot/export_polyglot.h>
#include <polyglot/bytes.hh>
#include <polyglot/fourcc.hh>

namespace polyglot {

    /**
     * @brief CRC-32 of a whole buffer
     */
    POLYGLOT_EXPORT std::uint32_t crc32(const byte_buffer& data);

    /**
     * @brief Continue a running CRC-32 over more bytes
     * @param crc Value returned by a previous call (0 to start)
     * @param data First byte of the block
     * @param size Number of bytes in the block
     */
    POLYGLOT_EXPORT std::uint32_t crc32(std::uint32_t crc, const std::byte* data, std::size_t size);

    /**
     * @brief CRC-32 of a PNG chunk: computed over the type tag followed by the data
     */
    POLYGLOT_EXPORT std::uint32_t chunk_crc32(fourcc type, const byte_buffer& data);
}
