/**
 * @file parse_options.hh
 * @brief Parsing options shared by the PNG, ZIP and WAV models
 * @author Igor
 * @date 03/09/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <string>
#include <cstdint>

namespace polyglot {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing container formats
     *
     * Controls strictness, size limits and warning handling. Options are
     * passed explicitly to every call; the library reads no global settings.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, integrity problems (CRC mismatches, size fields that
         * disagree with the data) throw integrity_error.
         * When false, they are reported through on_warning and parsing
         * continues. Structural errors always throw.
         */
        bool strict = true;

        /**
         * @brief Maximum accepted input buffer size in bytes
         *
         * Default is 4GB, the reach of 32-bit ZIP and RIFF offsets.
         */
        std::uint64_t max_input_size = std::uint64_t(1) << 32;

        /**
         * @brief How far back from the end of the buffer to look for the EOCD
         *
         * The EOCD is 22 bytes followed by a comment of at most 65535 bytes.
         */
        std::uint64_t eocd_search_window = 22 + 0xFFFF;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Buffer offset where the problem was found
         * @param category Warning category (e.g., "chunk_crc", "entry_crc")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;

        /**
         * @brief Report a non-fatal problem
         */
        void warn(std::uint64_t offset, std::string_view category, const std::string& message) const {
            if (on_warning) {
                on_warning(offset, category, message);
            }
        }
    };

} // namespace polyglot
