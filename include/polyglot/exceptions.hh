/**
 * @file exceptions.hh
 * @brief Exception classes, error codes and throwing macros for libpolyglot
 * @author Igor
 * @date 02/09/2025
 *
 * Every fallible operation of the library reports failure by throwing one of
 * the exceptions below. Each exception carries an error_code so callers can
 * render a precise message without parsing what().
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>
#include <string_view>

#include <polyglot/export_polyglot.h>

namespace polyglot {

    /**
     * @enum error_code
     * @brief Typed outcome of a failed operation
     */
    enum class error_code {
        // structural parse errors
        malformed_signature,
        truncated_chunk,
        missing_header_chunk,
        missing_trailer_chunk,
        invalid_chunk_type,
        eocd_not_found,
        central_directory_corrupt,
        zip64_unsupported,
        not_riff,
        not_wave,
        missing_fmt_chunk,
        missing_data_chunk,
        // integrity errors
        chunk_crc_mismatch,
        entry_crc_mismatch,
        size_mismatch,
        unreconciled_offsets,
        // policy / capacity errors
        payload_too_large,
        offset_overflow,
        unsupported_strategy,
        bidirectional_infeasible,
        critical_chunk_rejected,
        // not found
        no_embedded_payload_found,
        // internal
        composition_invariant_violated
    };

    /**
     * @brief Stable CamelCase name of an error code (e.g. "EocdNotFound")
     */
    POLYGLOT_EXPORT std::string_view to_string(error_code code);

    /**
     * @class polyglot_error
     * @brief Base exception class for all libpolyglot errors
     */
    class polyglot_error : public std::runtime_error {
    public:
        polyglot_error(error_code code, const std::string& msg)
            : std::runtime_error(msg), m_code(code) {}

        [[nodiscard]] error_code code() const noexcept { return m_code; }

    private:
        error_code m_code;
    };

    /**
     * @class parse_error
     * @brief The input does not conform to the claimed format
     *
     * Retrying is pointless: parsing the same bytes again fails the same way.
     */
    class parse_error : public polyglot_error {
    public:
        parse_error(error_code code, const std::string& msg)
            : polyglot_error(code, msg) {}
    };

    /**
     * @class integrity_error
     * @brief A checksum or size field disagrees with the data it describes
     *
     * Only thrown by strict parsing. Lenient parsing reports the same
     * conditions through parse_options::on_warning instead.
     */
    class integrity_error : public polyglot_error {
    public:
        integrity_error(error_code code, const std::string& msg)
            : polyglot_error(code, msg) {}
    };

    /**
     * @class policy_error
     * @brief The requested composition cannot be satisfied under current limits
     */
    class policy_error : public polyglot_error {
    public:
        policy_error(error_code code, const std::string& msg)
            : polyglot_error(code, msg) {}
    };

    /**
     * @class not_found_error
     * @brief Extraction targeted a payload that is not present
     */
    class not_found_error : public polyglot_error {
    public:
        not_found_error(error_code code, const std::string& msg)
            : polyglot_error(code, msg) {}
    };

    /**
     * @class composition_error
     * @brief A freshly composed artifact failed its own validation
     */
    class composition_error : public polyglot_error {
    public:
        composition_error(error_code code, const std::string& msg)
            : polyglot_error(code, msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    #define THROW_PARSE(code, ...) \
        throw ::polyglot::parse_error(code, ::polyglot::build_error_msg(__VA_ARGS__))

    #define THROW_INTEGRITY(code, ...) \
        throw ::polyglot::integrity_error(code, ::polyglot::build_error_msg(__VA_ARGS__))

    #define THROW_POLICY(code, ...) \
        throw ::polyglot::policy_error(code, ::polyglot::build_error_msg(__VA_ARGS__))

    #define THROW_NOT_FOUND(code, ...) \
        throw ::polyglot::not_found_error(code, ::polyglot::build_error_msg(__VA_ARGS__))

    #define THROW_COMPOSITION(...) \
        throw ::polyglot::composition_error(::polyglot::error_code::composition_invariant_violated, \
                                            ::polyglot::build_error_msg(__VA_ARGS__))

    #define THROW_PARSE_IF(condition, code, ...) \
        do { if (condition) THROW_PARSE(code, __VA_ARGS__); } while(0)

    #define THROW_PARSE_UNLESS(condition, code, ...) \
        do { if (!(condition)) THROW_PARSE(code, __VA_ARGS__); } while(0)

    #define THROW_POLICY_IF(condition, code, ...) \
        do { if (condition) THROW_POLICY(code, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace polyglot
