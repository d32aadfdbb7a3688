/**
 * @file zip_archive.hh
 * @brief ZIP local headers, central directory and EOCD model
 * @author Igor
 * @date 05/09/2025
 *
 * ZIP readers locate an archive from its end: the EOCD record names the
 * central directory, and the central directory names every local header by
 * absolute offset. Those offsets are measured from an "origin" that is
 * normally the first byte of the file. The model records where each record
 * sits relative to that origin so offsets can be reconciled when other bytes
 * are placed in front of the archive.
 *
 * Only stored (uncompressed) entry data is interpreted; compressed entries
 * are carried opaquely. ZIP64 and multi-disk archives are rejected.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <utility>

#include <polyglot/export_polyglot.h>
#include <polyglot/bytes.hh>
#include <polyglot/parse_options.hh>

namespace polyglot::zip {

    inline constexpr std::uint32_t local_signature = 0x04034B50;
    inline constexpr std::uint32_t central_signature = 0x02014B50;
    inline constexpr std::uint32_t eocd_signature = 0x06054B50;

    inline constexpr std::size_t local_header_size = 30;
    inline constexpr std::size_t central_header_size = 46;
    inline constexpr std::size_t eocd_size = 22;

    /// General purpose flag: sizes and CRC follow the data in a descriptor
    inline constexpr std::uint16_t flag_data_descriptor = 0x0008;

    /// Compression method 0: data stored as is
    inline constexpr std::uint16_t method_stored = 0;

    /// ZIP64 marks fields it overrides with all-ones
    inline constexpr std::uint32_t zip64_sentinel = 0xFFFFFFFFu;

    struct local_header {
        std::uint16_t version_needed = 0;
        std::uint16_t flags = 0;
        std::uint16_t compression = 0;
        std::uint16_t mod_time = 0;
        std::uint16_t mod_date = 0;
        std::uint32_t crc32 = 0;
        std::uint32_t compressed_size = 0;
        std::uint32_t uncompressed_size = 0;
        std::string filename;
        byte_buffer extra;

        [[nodiscard]] std::uint64_t byte_size() const {
            return local_header_size + filename.size() + extra.size();
        }
    };

    /**
     * @struct local_record
     * @brief A local header, its entry data, and the bytes up to the next record
     *
     * The trailer holds whatever sits between the end of the data and the
     * next record: usually nothing, sometimes a data descriptor.
     */
    struct local_record {
        local_header header;
        byte_buffer data;
        byte_buffer trailer;
        std::uint64_t position = 0;   ///< Offset from the start of the archive region

        [[nodiscard]] std::uint64_t byte_size() const {
            return header.byte_size() + data.size() + trailer.size();
        }
    };

    struct central_record {
        std::uint16_t version_made_by = 0;
        std::uint16_t version_needed = 0;
        std::uint16_t flags = 0;
        std::uint16_t compression = 0;
        std::uint16_t mod_time = 0;
        std::uint16_t mod_date = 0;
        std::uint32_t crc32 = 0;
        std::uint32_t compressed_size = 0;
        std::uint32_t uncompressed_size = 0;
        std::uint16_t disk_start = 0;
        std::uint16_t internal_attributes = 0;
        std::uint32_t external_attributes = 0;
        std::uint32_t local_header_offset = 0;  ///< Absolute, measured from the origin
        std::string filename;
        byte_buffer extra;
        std::string comment;

        [[nodiscard]] std::uint64_t byte_size() const {
            return central_header_size + filename.size() + extra.size() + comment.size();
        }
    };

    struct eocd_record {
        std::uint16_t disk_number = 0;
        std::uint16_t cd_disk = 0;
        std::uint16_t entries_on_disk = 0;
        std::uint16_t entries_total = 0;
        std::uint32_t cd_size = 0;
        std::uint32_t cd_offset = 0;            ///< Absolute, measured from the origin
        byte_buffer comment;
    };

    /**
     * @struct archive
     * @brief One archive region: local records, central directory, EOCD
     */
    struct archive {
        /// Where the first byte of the region sits, measured from the offset origin
        std::uint64_t start_offset = 0;
        /// Bytes between the offset origin and the first local record (an SFX stub).
        /// They end where the region starts, so leading.size() <= start_offset.
        byte_buffer leading;
        std::vector<local_record> records;      ///< In byte order
        std::vector<central_record> directory;  ///< In central directory order
        byte_buffer directory_gap;              ///< Bytes between the central directory and the EOCD
        eocd_record eocd;

        /// Size of the region, leading bytes excluded
        [[nodiscard]] std::uint64_t byte_size() const;

        /// Offset of the central directory from the start of the region
        [[nodiscard]] std::uint64_t directory_position() const;
    };

    /**
     * @struct entry
     * @brief Flattened view of one archived file
     */
    struct entry {
        std::string filename;
        std::uint32_t local_header_offset = 0;
        std::uint32_t compressed_size = 0;
        std::uint32_t uncompressed_size = 0;
        std::uint32_t crc32 = 0;
        std::uint16_t compression = 0;
        byte_buffer data;
    };

    /**
     * @brief Locate the EOCD by scanning backward from the end of the buffer
     * @return Offset of the EOCD signature
     * @throws parse_error EocdNotFound
     *
     * The EOCD and its comment must end exactly at the end of the buffer.
     */
    POLYGLOT_EXPORT std::uint64_t find_eocd(const byte_buffer& data, const parse_options& options = {});

    /**
     * @brief Origin implied by the EOCD alone: eocd position - cd_size - cd_offset
     *
     * For an archive whose offsets were never reconciled after bytes were
     * prepended, this is where the archive really starts.
     */
    POLYGLOT_EXPORT std::optional<std::uint64_t> infer_origin(const byte_buffer& data,
                                                             const parse_options& options = {});

    /**
     * @brief Parse the archive that ends at the end of the buffer
     * @param data Buffer holding the archive, possibly after other bytes
     * @param origin Buffer position the stored offsets are measured from
     * @throws parse_error EocdNotFound, CentralDirectoryCorrupt, Zip64Unsupported, TruncatedChunk
     * @throws integrity_error EntryCrcMismatch, SizeMismatch (strict mode only)
     */
    POLYGLOT_EXPORT archive parse(const byte_buffer& data, std::uint64_t origin = 0,
                                  const parse_options& options = {});

    /**
     * @brief Serialize the leading bytes and the archive region exactly as their fields say
     *
     * The output belongs at start_offset - leading.size() from the offset origin.
     */
    POLYGLOT_EXPORT byte_buffer serialize(const archive& a);

    /**
     * @brief Flatten the central directory together with the entry data
     */
    POLYGLOT_EXPORT std::vector<entry> entries(const archive& a);

    /**
     * @brief Build a stored (uncompressed) archive starting at origin 0
     * @throws policy_error PayloadTooLarge, OffsetOverflow
     */
    POLYGLOT_EXPORT archive build_stored(const std::vector<std::pair<std::string, byte_buffer>>& files);
}
