/**
 * @file bytes.hh
 * @brief Byte buffer vocabulary shared by every format model
 * @author Igor
 * @date 02/09/2025
 */

#pragma once

#include <vector>
#include <string>
#include <string_view>
#include <cstddef>
#include <algorithm>

namespace polyglot {

    /**
     * @typedef byte_buffer
     * @brief Fully materialized, exclusively owned sequence of bytes
     */
    using byte_buffer = std::vector<std::byte>;

    /**
     * @brief Copy the characters of a string into a byte buffer
     */
    inline byte_buffer to_bytes(std::string_view text) {
        byte_buffer out(text.size());
        std::transform(text.begin(), text.end(), out.begin(),
                       [](char c) { return static_cast<std::byte>(c); });
        return out;
    }

    /**
     * @brief Append a range of bytes to a buffer
     */
    inline void append(byte_buffer& dst, const byte_buffer& src) {
        dst.insert(dst.end(), src.begin(), src.end());
    }

    inline void append(byte_buffer& dst, std::string_view text) {
        for (char c : text) {
            dst.push_back(static_cast<std::byte>(c));
        }
    }

    /**
     * @brief Copy [offset, offset + size) out of a buffer
     *
     * The caller guarantees the range is inside the buffer.
     */
    inline byte_buffer slice(const byte_buffer& src, std::size_t offset, std::size_t size) {
        auto first = src.begin() + static_cast<std::ptrdiff_t>(offset);
        return byte_buffer(first, first + static_cast<std::ptrdiff_t>(size));
    }

    /**
     * @brief True if the buffer holds @p magic at @p offset
     */
    inline bool starts_with_at(const byte_buffer& buf, std::size_t offset, std::string_view magic) {
        if (offset > buf.size() || buf.size() - offset < magic.size()) {
            return false;
        }
        for (std::size_t i = 0; i < magic.size(); ++i) {
            if (buf[offset + i] != static_cast<std::byte>(magic[i])) {
                return false;
            }
        }
        return true;
    }
}
