/**
 * @file strategy.hh
 * @brief Embedding strategies: how a guest payload is placed inside a host file
 * @author Igor
 * @date 07/09/2025
 */

#pragma once

#include <cstdint>
#include <string_view>

#include <polyglot/export_polyglot.h>
#include <polyglot/bytes.hh>
#include <polyglot/container_format.hh>
#include <polyglot/parse_options.hh>
#include <polyglot/png_stream.hh>

namespace polyglot {

    /**
     * @enum strategy
     * @brief Closed set of composition methods
     */
    enum class strategy {
        text_embed,        ///< PNG host, guest in a tEXt chunk before IEND (default)
        container_append,  ///< Guest file followed by a ZIP host with reconciled offsets
        riff_chunk_embed,  ///< WAV host, guest in a 'pnG ' chunk after the existing chunks
        bidirectional,     ///< Experimental shared PNG+WAV header
        idat_embed         ///< Pixel-data embedding, always rejected
    };

    /// tEXt keyword that marks an embedded payload
    inline constexpr std::string_view payload_keyword = "polyglot-payload";

    POLYGLOT_EXPORT std::string_view to_string(strategy method);

    /**
     * @brief Map a command line name to a strategy
     *
     * Accepted names: text, zip, append, riff, wav, bidirectional, idat.
     * @throws policy_error UnsupportedStrategy for anything else
     */
    POLYGLOT_EXPORT strategy strategy_from_name(std::string_view name);

    /**
     * @struct compose_options
     * @brief Limits applied while composing
     */
    struct compose_options {
        /// Largest accepted host or guest, in bytes
        std::uint64_t max_input_size = std::uint64_t(1) << 32;

        /// Largest tEXt payload; clamped to the PNG limit of 2^31-1
        std::uint64_t max_chunk_length = png::max_chunk_length;

        /// Reject hosts whose checksums or size fields are already wrong
        bool strict = true;

        /// Receives integrity warnings about the inputs when strict is false
        parse_options::warning_handler on_warning;

        [[nodiscard]] parse_options to_parse_options() const {
            parse_options po;
            po.strict = strict;
            po.max_input_size = max_input_size;
            po.on_warning = on_warning;
            return po;
        }
    };

    /**
     * @struct composite_artifact
     * @brief Bytes of a composed polyglot and how they were made
     */
    struct composite_artifact {
        byte_buffer bytes;
        strategy method = strategy::text_embed;
        container_format host = container_format::unknown;  ///< Format at byte 0
    };

    /**
     * @brief Run one strategy without self-validation
     * @throws parse_error if host or guest is not of the format the strategy needs
     * @throws policy_error PayloadTooLarge, OffsetOverflow, UnsupportedStrategy,
     *         BidirectionalInfeasible
     */
    POLYGLOT_EXPORT composite_artifact apply_strategy(strategy method, const byte_buffer& host,
                                                      const byte_buffer& guest,
                                                      const compose_options& options = {});

    /**
     * @brief Decide whether one buffer can begin as both formats at once
     *
     * Compares the bytes each format pins to fixed offsets. Returns false as
     * soon as both formats pin the same offset to different values.
     */
    POLYGLOT_EXPORT bool fixed_headers_compatible(container_format a, container_format b);
}
