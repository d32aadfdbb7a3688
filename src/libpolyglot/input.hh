//
// Created by igor on 03/09/2025.
//

#pragma once

#include <cstdint>
#include <array>
#include <limits>

#include <polyglot/exceptions.hh>
#include <polyglot/byte_order.hh>
#include <polyglot/endian.hh>
#include <polyglot/bytes.hh>
#include <polyglot/fourcc.hh>

namespace polyglot {

    // Cursor over a region of a caller-owned buffer. The reader never
    // outlives the call that created it, so holding a reference is safe.
    class memory_reader {
        public:
            enum whence_t {
                set,
                cur
            };

            static constexpr std::uint64_t npos = std::numeric_limits<std::uint64_t>::max();

        public:
            explicit memory_reader(const byte_buffer& buffer, std::uint64_t start = 0, std::uint64_t size = npos);

            memory_reader(const memory_reader&) = delete;
            memory_reader& operator = (const memory_reader&) = delete;

            // Copies up to size bytes, returns the number copied
            std::size_t read(void* dst, std::size_t size);
            void seek(std::uint64_t offset, whence_t whence);

            // Position in the underlying buffer
            [[nodiscard]] std::uint64_t absolute() const { return m_start + m_position; }
            [[nodiscard]] std::uint64_t size() const { return m_size; }
            [[nodiscard]] std::uint64_t remaining() const { return m_size - m_position; }

            byte_buffer read_exact(std::size_t size) {
                THROW_PARSE_IF(size > remaining(), error_code::truncated_chunk,
                               "Unexpected end of data at offset ", absolute(),
                               ": requested ", size, " bytes, ", remaining(), " available");
                byte_buffer buffer(size);
                read(buffer.data(), size);
                return buffer;
            }

            template<typename T>
            T read(byte_order bo) {
                std::array<std::byte, sizeof(T)> buff;
                std::size_t actual = read(buff.data(), sizeof(T));
                THROW_PARSE_IF(actual != sizeof(T), error_code::truncated_chunk,
                               "Failed to read ", sizeof(T), "-byte field at offset ",
                               absolute() - actual);
                return load<T>(buff.data(), bo);
            }

            fourcc read_fourcc();

        private:
            const byte_buffer& m_buffer;
            std::uint64_t m_start;    // Absolute start position in the buffer
            std::uint64_t m_size;     // Size of this region
            std::uint64_t m_position; // Current position relative to m_start
    };
}
