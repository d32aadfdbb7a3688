//
// Created by igor on 03/09/2025.
//

#include <algorithm>
#include <cstring>

#include "input.hh"

namespace polyglot {

    memory_reader::memory_reader(const byte_buffer& buffer, std::uint64_t start, std::uint64_t size)
        : m_buffer(buffer), m_start(start), m_size(0), m_position(0) {
        THROW_PARSE_IF(start > buffer.size(), error_code::truncated_chunk,
                       "Region start ", start, " is beyond end of ", buffer.size(), "-byte buffer");
        std::uint64_t available = buffer.size() - start;
        m_size = (size == npos) ? available : size;
        THROW_PARSE_IF(m_size > available, error_code::truncated_chunk,
                       "Region [", start, ", ", start + m_size, ") exceeds ",
                       buffer.size(), "-byte buffer");
    }

    std::size_t memory_reader::read(void* dst, std::size_t size) {
        if (size == 0 || remaining() == 0) {
            return 0;
        }
        auto to_read = static_cast<std::size_t>(std::min<std::uint64_t>(size, remaining()));
        std::memcpy(dst, m_buffer.data() + absolute(), to_read);
        m_position += to_read;
        return to_read;
    }

    void memory_reader::seek(std::uint64_t offset, whence_t whence) {
        std::uint64_t new_pos = 0;

        switch (whence) {
            case set:
                new_pos = offset;
                break;
            case cur:
                new_pos = m_position + offset;
                break;
        }

        THROW_PARSE_IF(new_pos > m_size, error_code::truncated_chunk,
                       "Cannot seek to offset ", m_start + new_pos,
                       " - region ends at ", m_start + m_size);
        m_position = new_pos;
    }

    fourcc memory_reader::read_fourcc() {
        std::array<char, 4> data{};
        std::size_t actual = read(data.data(), 4);
        THROW_PARSE_IF(actual != 4, error_code::truncated_chunk,
                       "Failed to read type tag at offset ", absolute() - actual);
        return fourcc(data[0], data[1], data[2], data[3]);
    }
}
