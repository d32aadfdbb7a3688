//
// Created by igor on 02/09/2025.
//
// Fixed-width integer codecs over raw byte storage. PNG stores its fields
// big-endian, ZIP and RIFF little-endian.

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <type_traits>

#include <polyglot/byte_order.hh>
#include <polyglot/bytes.hh>
#include <polyglot/exceptions.hh>

namespace polyglot {

    inline std::uint16_t swap16(std::uint16_t x) {
        return static_cast<std::uint16_t>((x << 8) | (x >> 8));
    }

    inline std::uint32_t swap32(std::uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    template<typename T>
    inline constexpr bool is_field_type_v =
        std::is_integral_v<T> && std::is_unsigned_v<T> &&
        (sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4);

    template<typename T>
    T swap_byte_order(T x) noexcept {
        static_assert(is_field_type_v<T>, "swap_byte_order only supports unsigned 1/2/4 byte integers");
        if constexpr (sizeof(T) == 1) {
            return x;
        } else if constexpr (sizeof(T) == 2) {
            return swap16(x);
        } else {
            return swap32(x);
        }
    }

    /**
     * @brief Decode a field stored in the given byte order
     * @param src Pointer to at least sizeof(T) readable bytes
     */
    template<typename T>
    T load(const std::byte* src, byte_order bo) noexcept {
        T value;
        std::memcpy(&value, src, sizeof(T));
        if (!byte_order_native(bo)) {
            value = swap_byte_order(value);
        }
        return value;
    }

    /**
     * @brief Encode a field in the given byte order
     * @param dst Pointer to at least sizeof(T) writable bytes
     */
    template<typename T>
    void store(std::byte* dst, T value, byte_order bo) noexcept {
        if (!byte_order_native(bo)) {
            value = swap_byte_order(value);
        }
        std::memcpy(dst, &value, sizeof(T));
    }

    /**
     * @brief Bounds-checked field read from a buffer
     * @throws parse_error (TruncatedChunk) if the field does not fit
     */
    template<typename T>
    T read_field(const byte_buffer& buf, std::size_t offset, byte_order bo) {
        THROW_PARSE_IF(offset > buf.size() || buf.size() - offset < sizeof(T),
                       error_code::truncated_chunk,
                       "Cannot read ", sizeof(T), "-byte field at offset ", offset,
                       " - buffer holds only ", buf.size(), " bytes");
        return load<T>(buf.data() + offset, bo);
    }

    /**
     * @brief Bounds-checked in-place field write
     * @throws parse_error (TruncatedChunk) if the field does not fit
     */
    template<typename T>
    void write_field(byte_buffer& buf, std::size_t offset, T value, byte_order bo) {
        THROW_PARSE_IF(offset > buf.size() || buf.size() - offset < sizeof(T),
                       error_code::truncated_chunk,
                       "Cannot write ", sizeof(T), "-byte field at offset ", offset,
                       " - buffer holds only ", buf.size(), " bytes");
        store<T>(buf.data() + offset, value, bo);
    }

    /**
     * @brief Append a field to the end of a buffer
     */
    template<typename T>
    void append_field(byte_buffer& buf, T value, byte_order bo) {
        std::size_t pos = buf.size();
        buf.resize(pos + sizeof(T));
        store<T>(buf.data() + pos, value, bo);
    }

    inline std::uint16_t read_u16le(const byte_buffer& buf, std::size_t offset) {
        return read_field<std::uint16_t>(buf, offset, byte_order::little);
    }

    inline std::uint32_t read_u32le(const byte_buffer& buf, std::size_t offset) {
        return read_field<std::uint32_t>(buf, offset, byte_order::little);
    }

    inline std::uint32_t read_u32be(const byte_buffer& buf, std::size_t offset) {
        return read_field<std::uint32_t>(buf, offset, byte_order::big);
    }

    inline void write_u16le(byte_buffer& buf, std::size_t offset, std::uint16_t value) {
        write_field(buf, offset, value, byte_order::little);
    }

    inline void write_u32le(byte_buffer& buf, std::size_t offset, std::uint32_t value) {
        write_field(buf, offset, value, byte_order::little);
    }

    inline void write_u32be(byte_buffer& buf, std::size_t offset, std::uint32_t value) {
        write_field(buf, offset, value, byte_order::big);
    }
}
