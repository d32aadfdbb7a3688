//
// Created by igor on 02/09/2025.
//
// Four-character type tags. PNG chunk types and RIFF chunk ids share the same
// shape: four bytes compared byte-wise, usually printable ASCII.

#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>
#include <iomanip>
#include <stdexcept>

namespace polyglot {
    struct fourcc {
        std::array<char, 4> b{' ', ' ', ' ', ' '};

        // Default constructor - creates "    " (four spaces)
        constexpr fourcc() = default;

        constexpr fourcc(char c0, char c1, char c2, char c3)
            : b{ c0, c1, c2, c3 } {}

        // From string_view, padded with spaces (RIFF ids like "fmt ")
        explicit fourcc(std::string_view sv) : b{' ', ' ', ' ', ' '} {
            std::copy_n(sv.begin(), std::min(sv.size(), std::size_t(4)), b.begin());
        }

        fourcc(const char* str) : fourcc(std::string_view(str)) {}

        // Read four raw bytes (no padding)
        static fourcc from_bytes(const void* data) {
            fourcc result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        [[nodiscard]] std::string to_string() const {
            return {b.data(), 4};
        }

        void to_bytes(void* dest) const {
            std::memcpy(dest, b.data(), 4);
        }

        constexpr char operator[](std::size_t i) const { return b[i]; }

        bool operator==(const fourcc& o) const { return b == o.b; }
        bool operator!=(const fourcc& o) const { return !(*this == o); }
        bool operator<(const fourcc& o) const { return b < o.b; }

        [[nodiscard]] bool is_printable() const {
            return std::all_of(b.begin(), b.end(), [](char c) {
                return c >= 32 && c <= 126;
            });
        }

        // PNG requires every byte of a chunk type to be an ASCII letter
        [[nodiscard]] bool is_letters() const {
            return std::all_of(b.begin(), b.end(), [](char c) {
                return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
            });
        }

        // PNG property bits live in bit 5 (the case bit) of each byte.
        // Lowercase first letter: ancillary, decoders may skip the chunk.
        [[nodiscard]] bool is_ancillary() const { return (b[0] & 0x20) != 0; }
        [[nodiscard]] bool is_critical() const { return !is_ancillary(); }
        [[nodiscard]] bool is_private() const { return (b[1] & 0x20) != 0; }
        // Third letter must be uppercase in the current PNG standard
        [[nodiscard]] bool reserved_bit_clear() const { return (b[2] & 0x20) == 0; }
        [[nodiscard]] bool is_safe_to_copy() const { return (b[3] & 0x20) != 0; }

        friend std::ostream& operator<<(std::ostream& os, const fourcc& f) {
            os << '\'';
            for (char c : f.b) {
                if (c >= 32 && c <= 126) {
                    os << c;
                } else {
                    auto flags = os.flags();
                    auto fill = os.fill();
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(static_cast<unsigned char>(c));
                    os.flags(flags);
                    os.fill(fill);
                }
            }
            os << '\'';
            return os;
        }
    };

    // User-defined literal for compile-time fourcc creation
    constexpr fourcc operator""_4cc(const char* str, std::size_t len) {
        if (len > 4) {
            throw std::invalid_argument("FourCC literal must be 4 characters or less");
        }
        return {
            len > 0 ? str[0] : ' ',
            len > 1 ? str[1] : ' ',
            len > 2 ? str[2] : ' ',
            len > 3 ? str[3] : ' '
        };
    }
}
