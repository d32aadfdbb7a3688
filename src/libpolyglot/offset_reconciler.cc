//
// Created by igor on 06/09/2025.
//

#include <polyglot/offset_reconciler.hh>
#include <polyglot/exceptions.hh>

namespace polyglot {

    namespace {
        std::uint32_t shifted(std::uint64_t value, std::int64_t shift, std::string_view what) {
            std::int64_t result = static_cast<std::int64_t>(value) + shift;
            THROW_POLICY_IF(result < 0, error_code::offset_overflow,
                            what, " ", value, " shifted by ", shift, " becomes negative");
            THROW_POLICY_IF(result >= static_cast<std::int64_t>(zip::zip64_sentinel),
                            error_code::offset_overflow,
                            what, " ", value, " shifted by ", shift,
                            " does not fit a 32-bit ZIP offset");
            return static_cast<std::uint32_t>(result);
        }
    }

    zip::archive reconcile_offsets(const zip::archive& a, std::int64_t base_shift) {
        zip::archive result = a;

        std::int64_t start = static_cast<std::int64_t>(a.start_offset) + base_shift;
        THROW_POLICY_IF(start < static_cast<std::int64_t>(a.leading.size()), error_code::offset_overflow,
                        "Archive start ", a.start_offset, " shifted by ", base_shift,
                        " leaves no room for ", a.leading.size(), " leading bytes");
        std::uint64_t end = static_cast<std::uint64_t>(start) + a.byte_size();
        THROW_POLICY_IF(end > zip::zip64_sentinel, error_code::offset_overflow,
                        "Shifted archive would end at offset ", end, ", beyond the 32-bit range");

        result.start_offset = static_cast<std::uint64_t>(start);
        for (auto& c : result.directory) {
            c.local_header_offset = shifted(c.local_header_offset, base_shift, "Local header offset");
        }
        result.eocd.cd_offset = shifted(a.eocd.cd_offset, base_shift, "Central directory offset");
        return result;
    }

    bool verify_offsets(const zip::archive& a) {
        if (a.leading.size() > a.start_offset) {
            return false;
        }
        if (a.start_offset + a.directory_position() != a.eocd.cd_offset) {
            return false;
        }
        for (const auto& c : a.directory) {
            bool found = false;
            for (const auto& r : a.records) {
                if (a.start_offset + r.position == c.local_header_offset) {
                    found = r.header.filename == c.filename;
                    break;
                }
            }
            if (!found) {
                return false;
            }
        }
        // Record positions must also agree with the serialized layout
        std::uint64_t position = 0;
        for (const auto& r : a.records) {
            if (r.position != position) {
                return false;
            }
            position += r.byte_size();
        }
        return true;
    }
}
