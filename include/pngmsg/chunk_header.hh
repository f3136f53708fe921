/**
 * @file chunk_header.hh
 * @brief Chunk header structure for PNG streams
 * @author Igor
 * @date 03/09/2025
 */

#pragma once

#include <cstdint>
#include <pngmsg/chunk_type.hh>

namespace pngmsg {

    /**
     * @struct chunk_header
     * @brief Framing information for a chunk in a PNG stream
     *
     * Contains everything around the chunk payload: its type, declared
     * length, position in the stream and the CRC stored after the data.
     */
    struct chunk_header {
        chunk_type type;                  ///< Chunk type code
        std::uint32_t length = 0;         ///< Payload size in bytes
        std::uint64_t file_offset = 0;    ///< Absolute offset of the length field
        std::uint32_t crc = 0;            ///< CRC stored in the stream

        /**
         * @brief Size of the chunk on the wire
         * @return Length plus 12 bytes of length, type and CRC fields
         */
        [[nodiscard]] std::uint64_t total_size() const {
            return std::uint64_t(length) + 12;
        }
    };

} // namespace pngmsg
