//
// Created by igor on 03/09/2025.
//

#include <polyglot/crc32.hh>

#include <algorithm>
#include <array>
#include <limits>
#include <zlib.h>

namespace polyglot {

    std::uint32_t crc32(std::uint32_t crc, const std::byte* data, std::size_t size) {
        uLong value = crc;
        // zlib takes the block length as uInt
        constexpr std::size_t max_block = std::numeric_limits<uInt>::max();
        while (size > 0) {
            auto block = std::min(size, max_block);
            value = ::crc32(value, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(block));
            data += block;
            size -= block;
        }
        return static_cast<std::uint32_t>(value);
    }

    std::uint32_t crc32(const byte_buffer& data) {
        return crc32(0u, data.data(), data.size());
    }

    std::uint32_t chunk_crc32(fourcc type, const byte_buffer& data) {
        std::array<std::byte, 4> tag{};
        type.to_bytes(tag.data());
        std::uint32_t crc = crc32(0u, tag.data(), tag.size());
        return crc32(crc, data.data(), data.size());
    }
}
