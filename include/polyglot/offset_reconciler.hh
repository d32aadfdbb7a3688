/**
 * @file offset_reconciler.hh
 * @brief Shift the absolute offsets stored in a ZIP archive
 * @author Igor
 * @date 06/09/2025
 *
 * Placing N bytes in front of an archive moves every local header and the
 * central directory by N, while the offsets stored in the central directory
 * and in the EOCD stay the same. Readers that trust those offsets then look
 * in the wrong place. Reconciliation rewrites them.
 */

#pragma once

#include <cstdint>

#include <polyglot/export_polyglot.h>
#include <polyglot/zip_archive.hh>

namespace polyglot {

    /**
     * @brief Return a copy of the archive with all stored offsets moved by base_shift
     *
     * Every central directory local_header_offset and the EOCD cd_offset are
     * shifted; start_offset follows. Sizes, CRCs and names are untouched.
     * Leading bytes stay attached in front of the region.
     * A negative shift moves the archive back towards the origin.
     *
     * @throws policy_error OffsetOverflow if a shifted offset is negative,
     *         the leading bytes would start before the origin,
     *         an offset reaches the ZIP64 sentinel, or the archive would end beyond 4 GiB
     */
    POLYGLOT_EXPORT zip::archive reconcile_offsets(const zip::archive& a, std::int64_t base_shift);

    /**
     * @brief True if every stored offset names the record actually found there
     */
    POLYGLOT_EXPORT bool verify_offsets(const zip::archive& a);
}
