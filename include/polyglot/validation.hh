/**
 * @file validation.hh
 * @brief Detect which formats a buffer satisfies and recover embedded payloads
 * @author Igor
 * @date 08/09/2025
 *
 * Every format is probed on its own: a PNG parse at offset 0, a ZIP parse
 * located from the end of the buffer and a WAV parse at offset 0. A buffer
 * may be valid as several formats at once; that is the point of a polyglot.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <polyglot/export_polyglot.h>
#include <polyglot/bytes.hh>
#include <polyglot/container_format.hh>
#include <polyglot/exceptions.hh>
#include <polyglot/parse_options.hh>
#include <polyglot/strategy.hh>

namespace polyglot {

    /**
     * @struct finding
     * @brief A problem noticed while probing one format
     */
    struct finding {
        container_format format = container_format::unknown;
        error_code code = error_code::truncated_chunk;
        std::string category;     ///< Warning category, or "structure" for a failed parse
        std::uint64_t offset = 0;
        std::string message;
    };

    /**
     * @struct recovered_payload
     * @brief Bytes recovered from a polyglot, with the format they look like
     */
    struct recovered_payload {
        container_format format = container_format::unknown;
        strategy source = strategy::text_embed;  ///< Embedding the payload was found in
        byte_buffer bytes;
    };

    struct validation_result {
        bool png_valid = false;
        bool zip_valid = false;
        bool wav_valid = false;
        container_format host = container_format::unknown;
        std::optional<strategy> detected;
        std::vector<recovered_payload> payloads;
        std::vector<finding> findings;

        [[nodiscard]] bool is_valid(container_format format) const;

        /// Number of formats the buffer is valid as
        [[nodiscard]] int valid_count() const {
            return int(png_valid) + int(zip_valid) + int(wav_valid);
        }
    };

    /**
     * @brief Probe every format and collect payloads and findings
     *
     * Parsing is always lenient here: checksum and size problems become
     * findings instead of exceptions. The strict flag of @p options is ignored,
     * the size limits are honoured.
     *
     * @throws policy_error PayloadTooLarge if the buffer exceeds max_input_size
     */
    POLYGLOT_EXPORT validation_result inspect(const byte_buffer& bytes, const parse_options& options = {});
}
