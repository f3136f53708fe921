/**
 * @file chunk.hh
 * @brief Single PNG chunk: type, data and CRC
 * @author Igor
 * @date 03/09/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>
#include <pngmsg/export_pngmsg.h>
#include <pngmsg/chunk_type.hh>
#include <pngmsg/parse_options.hh>

namespace pngmsg {

    class reader_base;
    class writer_base;

    /**
     * @class chunk
     * @brief One length-prefixed, type-tagged, CRC-checked unit of a PNG stream
     *
     * A chunk always holds a CRC that matches its type and data: it is
     * computed on construction and verified when parsing.
     */
    class PNGMSG_EXPORT chunk {
    public:
        /**
         * @brief Size of the length, type and CRC fields around the data
         */
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Largest data size the 32-bit length field can describe
         */
        static constexpr std::uint32_t max_length = 0xFFFFFFFFu;

        /**
         * @brief Create a chunk and compute its CRC
         *
         * Data longer than max_length is accepted here but cannot be
         * serialized.
         *
         * @param type Chunk type
         * @param data Chunk data
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Read one chunk from a reader
         *
         * Reads the big-endian length, type, data and stored CRC.
         * Checks run in this order, the first failure wins: truncated
         * header (unexpected_eof), length above options.max_chunk_size
         * (chunk_too_large), truncated data or CRC (unexpected_eof),
         * stored CRC (crc_mismatch), type code letters and reserved bit
         * (invalid_type_code).
         *
         * @param in Reader positioned at the length field
         * @param options Size limit and reserved bit policy
         * @return Parsed chunk
         * @throws parse_error unexpected_eof, invalid_type_code,
         *         chunk_too_large or crc_mismatch
         */
        static chunk parse(reader_base& in, const parse_options& options = {});

        /**
         * @brief Parse the chunk at the start of a buffer
         *
         * Bytes following the chunk are not examined.
         */
        static chunk parse(const std::vector<std::byte>& bytes, const parse_options& options = {});

        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        // Number of data bytes
        [[nodiscard]] std::uint32_t length() const { return static_cast<std::uint32_t>(m_data.size()); }

        // Size on the wire
        [[nodiscard]] std::size_t total_size() const { return m_data.size() + overhead; }

        /**
         * @brief Interpret the data as text
         * @return Data bytes as a UTF-8 string
         * @throws encoding_error if the bytes are not well formed UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /**
         * @brief Encode the chunk as length ++ type ++ data ++ crc
         * @throws parse_error chunk_too_large if the data exceeds max_length
         */
        [[nodiscard]] std::vector<std::byte> serialize() const;

        void write(writer_base& out) const;

        bool operator==(const chunk& o) const {
            return m_type == o.m_type && m_crc == o.m_crc && m_data == o.m_data;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(chunk_type type, std::vector<std::byte> data, std::uint32_t crc);

        void check_length() const;

        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

    PNGMSG_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngmsg
