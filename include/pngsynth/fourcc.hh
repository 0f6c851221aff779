//
// Created by igor on 10/08/2025.
//
#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <stdexcept>
#include <algorithm>
#include <ostream>
#include <iomanip>

namespace pngsynth {
    // Four-byte chunk type tag, e.g. 'IHDR'. Stored in file order.
    struct fourcc {
        std::array<char, 4> b{' ', ' ', ' ', ' '};

        // Default constructor - creates "    " (four spaces)
        constexpr fourcc() = default;

        constexpr fourcc(char c0, char c1, char c2, char c3)
            : b{ c0, c1, c2, c3 } {}

        // Constructor from string_view with padding (runtime)
        explicit fourcc(std::string_view sv) : b{' ', ' ', ' ', ' '} {
            std::copy_n(sv.begin(), std::min(sv.size(), size_t(4)), b.begin());
        }

        fourcc(const char* str) : fourcc(std::string_view(str)) {}

        explicit fourcc(const std::string& str) : fourcc(std::string_view(str)) {}

        // Constructor from raw bytes (no padding)
        static fourcc from_bytes(const void* data) {
            fourcc result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        [[nodiscard]] std::string to_string() const {
            return {b.data(), 4};
        }

        [[nodiscard]] std::string_view to_string_view() const {
            return {b.data(), 4};
        }

        void to_bytes(void* dest) const {
            std::memcpy(dest, b.data(), 4);
        }

        [[nodiscard]] const char* data() const { return b.data(); }

        constexpr char operator[](std::size_t i) const { return b[i]; }
        constexpr char& operator[](std::size_t i) { return b[i]; }

        [[nodiscard]] constexpr auto begin() const { return b.begin(); }
        [[nodiscard]] constexpr auto end() const { return b.end(); }

        bool operator==(const fourcc& o) const { return b == o.b; }
        bool operator!=(const fourcc& o) const { return !(*this == o); }
        bool operator<(const fourcc& o) const { return b < o.b; }

        // Chunk naming conventions: bit 5 (0x20, lowercase) of each byte
        // carries a property of the chunk.
        [[nodiscard]] constexpr bool is_ancillary() const { return (b[0] & 0x20) != 0; }
        [[nodiscard]] constexpr bool is_critical() const { return !is_ancillary(); }
        [[nodiscard]] constexpr bool is_private() const { return (b[1] & 0x20) != 0; }
        [[nodiscard]] constexpr bool is_reserved_set() const { return (b[2] & 0x20) != 0; }
        [[nodiscard]] constexpr bool is_safe_to_copy() const { return (b[3] & 0x20) != 0; }

        // All four bytes must be ASCII letters
        [[nodiscard]] bool is_valid_chunk_type() const {
            return std::all_of(b.begin(), b.end(), [](char c) {
                return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
            });
        }

        [[nodiscard]] bool is_printable() const {
            return std::all_of(b.begin(), b.end(), [](char c) {
                return c >= 32 && c <= 126;
            });
        }

        friend std::ostream& operator<<(std::ostream& os, const fourcc& f) {
            if (os.flags() & std::ios::hex) {
                auto flags = os.flags();
                auto fill = os.fill();
                os << "0x";
                for (char c : f.b) {
                    os << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(static_cast<unsigned char>(c));
                }
                os.flags(flags);
                os.fill(fill);
            } else {
                // Default: output as quoted string
                os << '\'';
                for (char c : f.b) {
                    if (c >= 32 && c <= 126) {
                        os << c;
                    } else {
                        // Escape non-printable characters
                        os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                           << static_cast<unsigned>(static_cast<unsigned char>(c))
                           << std::dec;
                    }
                }
                os << '\'';
            }
            return os;
        }
    };

    struct fourcc_hash {
        std::size_t operator()(const fourcc& f) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, f.b.data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
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

namespace std {
    template<>
    struct hash<pngsynth::fourcc> {
        std::size_t operator()(const pngsynth::fourcc& f) const noexcept {
            return pngsynth::fourcc_hash{}(f);
        }
    };
}
