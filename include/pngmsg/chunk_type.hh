//
// Created by igor on 02/09/2025.
//
#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <string>
#include <string_view>
#include <algorithm>
#include <iosfwd>
#include <stdexcept>
#include <pngmsg/export_pngmsg.h>

namespace pngmsg {
    /**
     * @struct chunk_type
     * @brief Four byte PNG chunk type code
     *
     * Bit 5 (0x20, the ASCII case bit) of each byte carries a property:
     * byte 0 ancillary, byte 1 private, byte 2 reserved, byte 3 safe-to-copy.
     * The bytes are stored verbatim; comparison is case sensitive.
     */
    struct PNGMSG_EXPORT chunk_type {
        std::array<char, 4> b{'\0', '\0', '\0', '\0'};

        static constexpr std::uint8_t property_bit = 0x20;

        constexpr chunk_type() = default;

        // Constructor from 4 individual chars (no validation)
        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : b{ c0, c1, c2, c3 } {}

        constexpr explicit chunk_type(const std::array<std::uint8_t, 4>& bytes)
            : b{ static_cast<char>(bytes[0]), static_cast<char>(bytes[1]),
                 static_cast<char>(bytes[2]), static_cast<char>(bytes[3]) } {}

        // Constructor from raw bytes (no validation)
        static chunk_type from_bytes(const void* data) {
            chunk_type result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        /**
         * @brief Create a chunk type from its textual form
         * @param text Exactly four ASCII letters
         * @return Chunk type holding the characters verbatim
         * @throws parse_error (invalid_type_code) for any other input
         */
        static chunk_type from_string(std::string_view text);

        // Values need to be in range A-Z (65-90) or a-z (97-122)
        static constexpr bool is_valid_byte(std::uint8_t c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        [[nodiscard]] std::array<std::uint8_t, 4> bytes() const {
            return { byte(0), byte(1), byte(2), byte(3) };
        }

        [[nodiscard]] std::string to_string() const {
            return {b.data(), 4};
        }

        [[nodiscard]] std::string_view to_string_view() const {
            return {b.data(), 4};
        }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, b.data(), 4);
        }

        [[nodiscard]] const char* data() const { return b.data(); }

        constexpr char operator[](std::size_t i) const { return b[i]; }

        [[nodiscard]] constexpr auto begin() const { return b.begin(); }
        [[nodiscard]] constexpr auto end() const { return b.end(); }

        [[nodiscard]] bool has_valid_bytes() const {
            return std::all_of(b.begin(), b.end(), [](char c) {
                return is_valid_byte(static_cast<std::uint8_t>(c));
            });
        }

        // Ancillary bit: 0 (uppercase) = critical, 1 (lowercase) = ancillary
        [[nodiscard]] constexpr bool is_critical() const {
            return (byte(0) & property_bit) == 0;
        }

        // Private bit: 0 (uppercase) = public, 1 (lowercase) = private
        [[nodiscard]] constexpr bool is_public() const {
            return (byte(1) & property_bit) == 0;
        }

        // Reserved bit: must be 0 (uppercase) in conforming files
        [[nodiscard]] constexpr bool is_reserved_bit_valid() const {
            return (byte(2) & property_bit) == 0;
        }

        // Safe-to-copy bit: 0 (uppercase) = unsafe, 1 (lowercase) = safe
        [[nodiscard]] constexpr bool is_safe_to_copy() const {
            return (byte(3) & property_bit) != 0;
        }

        /**
         * @brief Check the type code against PNG conformance rules
         * @return True when every byte is an ASCII letter and the
         *         reserved bit is clear
         */
        [[nodiscard]] bool is_valid() const {
            return has_valid_bytes() && is_reserved_bit_valid();
        }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return b == o.b; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return b < o.b; }
        bool operator<=(const chunk_type& o) const { return b <= o.b; }
        bool operator>(const chunk_type& o) const { return b > o.b; }
        bool operator>=(const chunk_type& o) const { return b >= o.b; }

    private:
        [[nodiscard]] constexpr std::uint8_t byte(std::size_t i) const {
            return static_cast<std::uint8_t>(b[i]);
        }
    };

    // Quoted form, non-printable bytes escaped as \xNN
    PNGMSG_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& t);

    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.b.data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal for compile-time chunk type creation
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        if (len != 4) {
            throw std::invalid_argument("Chunk type literal must be exactly 4 characters");
        }
        return { str[0], str[1], str[2], str[3] };
    }

    namespace chunk_types {
        inline constexpr chunk_type IHDR('I', 'H', 'D', 'R');
        inline constexpr chunk_type PLTE('P', 'L', 'T', 'E');
        inline constexpr chunk_type IDAT('I', 'D', 'A', 'T');
        inline constexpr chunk_type IEND('I', 'E', 'N', 'D');
    }

}

namespace std {
    template<>
    struct hash<pngmsg::chunk_type> {
        std::size_t operator()(const pngmsg::chunk_type& t) const noexcept {
            return pngmsg::chunk_type_hash{}(t);
        }
    };
}
