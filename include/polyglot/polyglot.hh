/**
 * @file polyglot.hh
 * @brief Entry points: compose, validate, extract
 * @author Igor
 * @date 09/09/2025
 *
 * All three calls work on complete in-memory buffers. Reading and writing
 * files is left to the caller.
 */

#pragma once

#include <string_view>

#include <polyglot/export_polyglot.h>
#include <polyglot/bytes.hh>
#include <polyglot/container_format.hh>
#include <polyglot/exceptions.hh>
#include <polyglot/parse_options.hh>
#include <polyglot/strategy.hh>
#include <polyglot/validation.hh>

namespace polyglot {

    /**
     * @brief Build a polyglot from a host file and a guest payload
     *
     * The artifact is parsed again, strictly, before it is returned; if it does
     * not satisfy the formats the strategy promises, composition_error is thrown
     * and nothing is returned. compose_options::strict governs the inputs only.
     *
     * @throws parse_error, integrity_error if an input is not what the strategy needs
     * @throws policy_error PayloadTooLarge, OffsetOverflow, UnsupportedStrategy,
     *         BidirectionalInfeasible
     * @throws composition_error CompositionInvariantViolated
     */
    POLYGLOT_EXPORT composite_artifact compose(strategy method, const byte_buffer& host,
                                               const byte_buffer& guest,
                                               const compose_options& options = {});

    POLYGLOT_EXPORT composite_artifact compose(std::string_view method, const byte_buffer& host,
                                               const byte_buffer& guest,
                                               const compose_options& options = {});

    /**
     * @brief Report which formats the buffer is valid as, with findings and payloads
     */
    POLYGLOT_EXPORT validation_result validate(const byte_buffer& artifact, const parse_options& options = {});

    /**
     * @brief Recover the embedded payload of the requested format
     * @param target png, zip or wav; any returns the first payload found
     * @throws not_found_error NoEmbeddedPayloadFound
     */
    POLYGLOT_EXPORT byte_buffer extract(const byte_buffer& artifact, container_format target,
                                        const parse_options& options = {});
}
