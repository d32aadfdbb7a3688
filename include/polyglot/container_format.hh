/**
 * @file container_format.hh
 * @brief The container formats the engine understands
 * @author Igor
 * @date 04/09/2025
 */

#pragma once

#include <string_view>
#include <optional>

#include <polyglot/export_polyglot.h>
#include <polyglot/bytes.hh>

namespace polyglot {

    /**
     * @enum container_format
     * @brief Format of a byte buffer or of a recovered payload
     */
    enum class container_format {
        png,     ///< PNG chunk stream
        zip,     ///< ZIP archive
        wav,     ///< RIFF WAVE audio
        unknown, ///< None of the above
        any      ///< Extraction target only: the first payload found, whatever its format
    };

    POLYGLOT_EXPORT std::string_view to_string(container_format format);

    /**
     * @brief Parse a format name ("png", "zip", "wav", "any"), case-insensitive
     */
    POLYGLOT_EXPORT std::optional<container_format> format_from_name(std::string_view name);

    /**
     * @brief Guess the format of a buffer from the magic at offset 0
     *
     * Only looks at signatures: a ZIP is recognised by a local file header or
     * an empty-archive EOCD at offset 0. Never throws.
     */
    POLYGLOT_EXPORT container_format sniff_format(const byte_buffer& data);
}
