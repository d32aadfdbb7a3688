/**
 * @file byte_order.hh
 * @brief Byte order of the integer fields in PNG, ZIP and RIFF records
 * @author Igor
 * @date 02/09/2025
 */

#pragma once

#include <polyglot/polyglot_config.h>

namespace polyglot {

#if LIBPOLYGLOT_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    /**
     * @enum byte_order
     * @brief Byte order for reading/writing multi-byte fields
     */
    enum class byte_order {
        little, ///< ZIP headers and RIFF chunk sizes
        big     ///< PNG chunk lengths and CRCs
    };

    /**
     * @brief Check if given byte order matches the host byte order
     *
     * Used to decide whether a field needs swapping after a memcpy.
     */
    constexpr bool byte_order_native(byte_order bo) {
        switch (bo) {
            case byte_order::little:
                return is_little_endian;
            case byte_order::big:
                return is_big_endian;
        }
        // make compiler happy
        return false;
    }
}
