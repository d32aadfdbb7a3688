//
// Created by igor on 05/09/2025.
//

#include <polyglot/zip_archive.hh>
#include <polyglot/crc32.hh>
#include <polyglot/endian.hh>
#include <polyglot/exceptions.hh>
#include "input.hh"

#include <algorithm>
#include <map>

namespace polyglot::zip {

    namespace {
        constexpr auto le = byte_order::little;

        constexpr std::uint16_t version_stored = 10;   // 1.0: stored entries only
        constexpr std::uint16_t version_made_by = 20;  // 2.0, MS-DOS attributes
        constexpr std::uint16_t dos_date_1980 = 0x0021; // 1980-01-01

        std::string read_string(memory_reader& rd, std::size_t size) {
            auto raw = rd.read_exact(size);
            return std::string(reinterpret_cast<const char*>(raw.data()), raw.size());
        }

        void report(const parse_options& options, error_code code, std::string_view category,
                    std::uint64_t offset, const std::string& msg) {
            if (options.strict) {
                throw integrity_error(code, msg);
            }
            options.warn(offset, category, msg);
        }

        central_record read_central(memory_reader& rd, std::size_t index) {
            std::uint64_t at = rd.absolute();
            THROW_PARSE_IF(rd.remaining() < central_header_size, error_code::central_directory_corrupt,
                           "Central directory entry ", index, " at offset ", at,
                           " is cut short by the EOCD");
            auto sig = rd.read<std::uint32_t>(le);
            THROW_PARSE_IF(sig != central_signature, error_code::central_directory_corrupt,
                           "Central directory entry ", index, " at offset ", at,
                           " has signature 0x", std::hex, sig);

            central_record r;
            r.version_made_by = rd.read<std::uint16_t>(le);
            r.version_needed = rd.read<std::uint16_t>(le);
            r.flags = rd.read<std::uint16_t>(le);
            r.compression = rd.read<std::uint16_t>(le);
            r.mod_time = rd.read<std::uint16_t>(le);
            r.mod_date = rd.read<std::uint16_t>(le);
            r.crc32 = rd.read<std::uint32_t>(le);
            r.compressed_size = rd.read<std::uint32_t>(le);
            r.uncompressed_size = rd.read<std::uint32_t>(le);
            auto name_len = rd.read<std::uint16_t>(le);
            auto extra_len = rd.read<std::uint16_t>(le);
            auto comment_len = rd.read<std::uint16_t>(le);
            r.disk_start = rd.read<std::uint16_t>(le);
            r.internal_attributes = rd.read<std::uint16_t>(le);
            r.external_attributes = rd.read<std::uint32_t>(le);
            r.local_header_offset = rd.read<std::uint32_t>(le);

            THROW_PARSE_IF(std::uint64_t(name_len) + extra_len + comment_len > rd.remaining(),
                           error_code::central_directory_corrupt,
                           "Central directory entry ", index, " at offset ", at,
                           " has variable fields running into the EOCD");
            r.filename = read_string(rd, name_len);
            r.extra = rd.read_exact(extra_len);
            r.comment = read_string(rd, comment_len);

            THROW_PARSE_IF(r.compressed_size == zip64_sentinel || r.uncompressed_size == zip64_sentinel ||
                           r.local_header_offset == zip64_sentinel,
                           error_code::zip64_unsupported,
                           "Entry '", r.filename, "' stores its sizes or offset in a ZIP64 extra field");
            return r;
        }

        void write_local(byte_buffer& out, const local_header& h) {
            append_field(out, local_signature, le);
            append_field(out, h.version_needed, le);
            append_field(out, h.flags, le);
            append_field(out, h.compression, le);
            append_field(out, h.mod_time, le);
            append_field(out, h.mod_date, le);
            append_field(out, h.crc32, le);
            append_field(out, h.compressed_size, le);
            append_field(out, h.uncompressed_size, le);
            append_field(out, static_cast<std::uint16_t>(h.filename.size()), le);
            append_field(out, static_cast<std::uint16_t>(h.extra.size()), le);
            append(out, h.filename);
            append(out, h.extra);
        }

        void write_central(byte_buffer& out, const central_record& r) {
            append_field(out, central_signature, le);
            append_field(out, r.version_made_by, le);
            append_field(out, r.version_needed, le);
            append_field(out, r.flags, le);
            append_field(out, r.compression, le);
            append_field(out, r.mod_time, le);
            append_field(out, r.mod_date, le);
            append_field(out, r.crc32, le);
            append_field(out, r.compressed_size, le);
            append_field(out, r.uncompressed_size, le);
            append_field(out, static_cast<std::uint16_t>(r.filename.size()), le);
            append_field(out, static_cast<std::uint16_t>(r.extra.size()), le);
            append_field(out, static_cast<std::uint16_t>(r.comment.size()), le);
            append_field(out, r.disk_start, le);
            append_field(out, r.internal_attributes, le);
            append_field(out, r.external_attributes, le);
            append_field(out, r.local_header_offset, le);
            append(out, r.filename);
            append(out, r.extra);
            append(out, r.comment);
        }

        void write_eocd(byte_buffer& out, const eocd_record& e) {
            append_field(out, eocd_signature, le);
            append_field(out, e.disk_number, le);
            append_field(out, e.cd_disk, le);
            append_field(out, e.entries_on_disk, le);
            append_field(out, e.entries_total, le);
            append_field(out, e.cd_size, le);
            append_field(out, e.cd_offset, le);
            append_field(out, static_cast<std::uint16_t>(e.comment.size()), le);
            append(out, e.comment);
        }

        // Position (relative to the region start) -> index into a.records
        std::map<std::uint64_t, std::size_t> index_records(const archive& a) {
            std::map<std::uint64_t, std::size_t> index;
            for (std::size_t i = 0; i < a.records.size(); ++i) {
                index.emplace(a.records[i].position, i);
            }
            return index;
        }

        void check_integrity(const archive& a, std::uint64_t origin, const parse_options& options) {
            auto index = index_records(a);
            for (const auto& c : a.directory) {
                auto it = index.find(std::uint64_t(c.local_header_offset) - a.start_offset);
                if (it == index.end()) {
                    continue;
                }
                const auto& rec = a.records[it->second];
                std::uint64_t at = origin + c.local_header_offset;

                if (rec.header.filename != c.filename) {
                    report(options, error_code::size_mismatch, "header_mismatch", at,
                           build_error_msg("Local header at offset ", at, " names '", rec.header.filename,
                                           "', central directory names '", c.filename, "'"));
                }
                if ((rec.header.flags & flag_data_descriptor) == 0 &&
                    (rec.header.compressed_size != c.compressed_size ||
                     rec.header.uncompressed_size != c.uncompressed_size ||
                     rec.header.crc32 != c.crc32)) {
                    report(options, error_code::size_mismatch, "header_mismatch", at,
                           build_error_msg("Local header of '", c.filename, "' at offset ", at,
                                           " disagrees with the central directory on size or CRC"));
                }
                if (c.compression == method_stored) {
                    if (c.compressed_size != c.uncompressed_size) {
                        report(options, error_code::size_mismatch, "size_mismatch", at,
                               build_error_msg("Stored entry '", c.filename, "' declares ", c.compressed_size,
                                               " stored bytes but ", c.uncompressed_size, " uncompressed"));
                    }
                    std::uint32_t computed = crc32(rec.data);
                    if (computed != c.crc32) {
                        report(options, error_code::entry_crc_mismatch, "entry_crc", at,
                               build_error_msg("Entry '", c.filename, "' at offset ", at,
                                               " stores CRC 0x", std::hex, c.crc32,
                                               ", computed 0x", computed));
                    }
                }
            }
        }
    }

    std::uint64_t archive::byte_size() const {
        std::uint64_t total = directory_position() + directory_gap.size() + eocd_size + eocd.comment.size();
        for (const auto& c : directory) {
            total += c.byte_size();
        }
        return total;
    }

    std::uint64_t archive::directory_position() const {
        std::uint64_t total = 0;
        for (const auto& r : records) {
            total += r.byte_size();
        }
        return total;
    }

    std::uint64_t find_eocd(const byte_buffer& data, const parse_options& options) {
        THROW_PARSE_IF(data.size() < eocd_size, error_code::eocd_not_found,
                       "Buffer of ", data.size(), " bytes is too small to hold an EOCD record");

        std::uint64_t window = std::max<std::uint64_t>(options.eocd_search_window, eocd_size);
        std::uint64_t first = data.size() > window ? data.size() - window : 0;
        std::uint64_t last = data.size() - eocd_size;

        for (std::uint64_t pos = last + 1; pos-- > first;) {
            if (load<std::uint32_t>(data.data() + pos, le) != eocd_signature) {
                continue;
            }
            auto comment_len = load<std::uint16_t>(data.data() + pos + 20, le);
            if (pos + eocd_size + comment_len == data.size()) {
                return pos;
            }
        }
        THROW_PARSE(error_code::eocd_not_found,
                    "No end of central directory record in the last ", data.size() - first, " bytes");
    }

    std::optional<std::uint64_t> infer_origin(const byte_buffer& data, const parse_options& options) {
        auto eocd_pos = find_eocd(data, options);
        auto cd_size = load<std::uint32_t>(data.data() + eocd_pos + 12, le);
        auto cd_offset = load<std::uint32_t>(data.data() + eocd_pos + 16, le);
        std::uint64_t span = std::uint64_t(cd_size) + cd_offset;
        if (span > eocd_pos) {
            return std::nullopt;
        }
        return eocd_pos - span;
    }

    archive parse(const byte_buffer& data, std::uint64_t origin, const parse_options& options) {
        THROW_POLICY_IF(data.size() > options.max_input_size, error_code::payload_too_large,
                        "Input of ", data.size(), " bytes exceeds the limit of ",
                        options.max_input_size, " bytes");

        std::uint64_t eocd_pos = find_eocd(data, options);
        memory_reader rd(data, eocd_pos);
        rd.seek(4, memory_reader::set);

        archive a;
        auto& e = a.eocd;
        e.disk_number = rd.read<std::uint16_t>(le);
        e.cd_disk = rd.read<std::uint16_t>(le);
        e.entries_on_disk = rd.read<std::uint16_t>(le);
        e.entries_total = rd.read<std::uint16_t>(le);
        e.cd_size = rd.read<std::uint32_t>(le);
        e.cd_offset = rd.read<std::uint32_t>(le);
        auto comment_len = rd.read<std::uint16_t>(le);
        e.comment = rd.read_exact(comment_len);

        THROW_PARSE_IF(e.entries_total == 0xFFFF || e.entries_on_disk == 0xFFFF ||
                       e.cd_size == zip64_sentinel || e.cd_offset == zip64_sentinel,
                       error_code::zip64_unsupported,
                       "EOCD at offset ", eocd_pos, " defers to a ZIP64 record");
        THROW_PARSE_IF(e.disk_number != 0 || e.cd_disk != 0 || e.entries_on_disk != e.entries_total,
                       error_code::central_directory_corrupt,
                       "EOCD at offset ", eocd_pos, " describes a multi-disk archive");

        std::uint64_t cd_start = origin + e.cd_offset;
        THROW_PARSE_IF(cd_start > eocd_pos, error_code::central_directory_corrupt,
                       "Central directory offset ", e.cd_offset, " from origin ", origin,
                       " points past the EOCD at offset ", eocd_pos);

        memory_reader cd(data, cd_start, eocd_pos - cd_start);
        a.directory.reserve(e.entries_total);
        for (std::size_t i = 0; i < e.entries_total; ++i) {
            a.directory.push_back(read_central(cd, i));
        }

        std::uint64_t cd_end = cd.absolute();
        if (cd_end - cd_start != e.cd_size) {
            report(options, error_code::size_mismatch, "size_mismatch", cd_start,
                   build_error_msg("Central directory at offset ", cd_start, " spans ", cd_end - cd_start,
                                   " bytes, EOCD declares ", e.cd_size));
        }
        a.directory_gap = slice(data, static_cast<std::size_t>(cd_end),
                                static_cast<std::size_t>(eocd_pos - cd_end));

        // One local record per distinct offset; several directory entries may share one
        std::map<std::uint32_t, std::size_t> first_ref;
        for (std::size_t i = 0; i < a.directory.size(); ++i) {
            first_ref.emplace(a.directory[i].local_header_offset, i);
        }
        a.start_offset = first_ref.empty() ? e.cd_offset : first_ref.begin()->first;

        std::uint64_t region_start = origin + a.start_offset;
        THROW_PARSE_IF(region_start > cd_start, error_code::central_directory_corrupt,
                       "Local header offset ", a.start_offset, " from origin ", origin,
                       " points past the central directory at offset ", cd_start);
        a.leading = slice(data, static_cast<std::size_t>(origin), static_cast<std::size_t>(a.start_offset));
        std::uint64_t prev_end = region_start;
        for (const auto& [offset, index] : first_ref) {
            const auto& central = a.directory[index];
            std::uint64_t at = origin + offset;

            THROW_PARSE_IF(at < prev_end, error_code::central_directory_corrupt,
                           "Local header of '", central.filename, "' at offset ", at,
                           " overlaps the previous entry");
            THROW_PARSE_IF(at + local_header_size > cd_start, error_code::central_directory_corrupt,
                           "Local header of '", central.filename, "' at offset ", at,
                           " runs into the central directory at offset ", cd_start);

            if (!a.records.empty()) {
                a.records.back().trailer = slice(data, static_cast<std::size_t>(prev_end),
                                                 static_cast<std::size_t>(at - prev_end));
            }

            memory_reader lr(data, at, cd_start - at);
            auto sig = lr.read<std::uint32_t>(le);
            THROW_PARSE_IF(sig != local_signature, error_code::central_directory_corrupt,
                           "Local header of '", central.filename, "' at offset ", at,
                           " has signature 0x", std::hex, sig);

            local_record rec;
            rec.position = at - region_start;
            auto& h = rec.header;
            h.version_needed = lr.read<std::uint16_t>(le);
            h.flags = lr.read<std::uint16_t>(le);
            h.compression = lr.read<std::uint16_t>(le);
            h.mod_time = lr.read<std::uint16_t>(le);
            h.mod_date = lr.read<std::uint16_t>(le);
            h.crc32 = lr.read<std::uint32_t>(le);
            h.compressed_size = lr.read<std::uint32_t>(le);
            h.uncompressed_size = lr.read<std::uint32_t>(le);
            auto name_len = lr.read<std::uint16_t>(le);
            auto extra_len = lr.read<std::uint16_t>(le);
            h.filename = read_string(lr, name_len);
            h.extra = lr.read_exact(extra_len);

            THROW_PARSE_IF(central.compressed_size > lr.remaining(), error_code::truncated_chunk,
                           "Data of '", central.filename, "' (", central.compressed_size,
                           " bytes at offset ", lr.absolute(), ") runs into the central directory");
            rec.data = lr.read_exact(central.compressed_size);

            prev_end = lr.absolute();
            a.records.push_back(std::move(rec));
        }
        if (!a.records.empty()) {
            a.records.back().trailer = slice(data, static_cast<std::size_t>(prev_end),
                                             static_cast<std::size_t>(cd_start - prev_end));
        }

        check_integrity(a, origin, options);
        return a;
    }

    byte_buffer serialize(const archive& a) {
        byte_buffer out;
        out.reserve(static_cast<std::size_t>(a.leading.size() + a.byte_size()));
        append(out, a.leading);
        for (const auto& r : a.records) {
            write_local(out, r.header);
            append(out, r.data);
            append(out, r.trailer);
        }
        for (const auto& c : a.directory) {
            write_central(out, c);
        }
        append(out, a.directory_gap);
        write_eocd(out, a.eocd);
        return out;
    }

    std::vector<entry> entries(const archive& a) {
        auto index = index_records(a);
        std::vector<entry> result;
        result.reserve(a.directory.size());
        for (const auto& c : a.directory) {
            entry e;
            e.filename = c.filename;
            e.local_header_offset = c.local_header_offset;
            e.compressed_size = c.compressed_size;
            e.uncompressed_size = c.uncompressed_size;
            e.crc32 = c.crc32;
            e.compression = c.compression;
            if (c.local_header_offset >= a.start_offset) {
                auto it = index.find(std::uint64_t(c.local_header_offset) - a.start_offset);
                if (it != index.end()) {
                    e.data = a.records[it->second].data;
                }
            }
            result.push_back(std::move(e));
        }
        return result;
    }

    archive build_stored(const std::vector<std::pair<std::string, byte_buffer>>& files) {
        THROW_POLICY_IF(files.size() >= 0xFFFF, error_code::payload_too_large,
                        files.size(), " entries do not fit in an archive without ZIP64");

        archive a;
        std::uint64_t position = 0;
        for (const auto& [name, data] : files) {
            THROW_POLICY_IF(name.size() > 0xFFFF, error_code::payload_too_large,
                            "File name of ", name.size(), " bytes is too long");
            THROW_POLICY_IF(data.size() >= zip64_sentinel, error_code::payload_too_large,
                            "Entry '", name, "' of ", data.size(), " bytes needs ZIP64");
            THROW_POLICY_IF(position >= zip64_sentinel, error_code::offset_overflow,
                            "Entry '", name, "' would start at offset ", position,
                            ", beyond the 32-bit range");

            std::uint32_t crc = crc32(data);
            auto size = static_cast<std::uint32_t>(data.size());

            local_record rec;
            rec.position = position;
            rec.header.version_needed = version_stored;
            rec.header.compression = method_stored;
            rec.header.mod_date = dos_date_1980;
            rec.header.crc32 = crc;
            rec.header.compressed_size = size;
            rec.header.uncompressed_size = size;
            rec.header.filename = name;
            rec.data = data;

            central_record c;
            c.version_made_by = version_made_by;
            c.version_needed = version_stored;
            c.compression = method_stored;
            c.mod_date = dos_date_1980;
            c.crc32 = crc;
            c.compressed_size = size;
            c.uncompressed_size = size;
            c.local_header_offset = static_cast<std::uint32_t>(position);
            c.filename = name;

            position += rec.byte_size();
            a.records.push_back(std::move(rec));
            a.directory.push_back(std::move(c));
        }

        std::uint64_t cd_size = 0;
        for (const auto& c : a.directory) {
            cd_size += c.byte_size();
        }
        THROW_POLICY_IF(position + cd_size + eocd_size > zip64_sentinel, error_code::offset_overflow,
                        "Archive of ", position + cd_size + eocd_size, " bytes exceeds the 32-bit offset range");

        a.start_offset = 0;
        a.eocd.entries_on_disk = static_cast<std::uint16_t>(files.size());
        a.eocd.entries_total = static_cast<std::uint16_t>(files.size());
        a.eocd.cd_size = static_cast<std::uint32_t>(cd_size);
        a.eocd.cd_offset = static_cast<std::uint32_t>(position);
        return a;
    }
}
