//
// Created by igor on 03/09/2025.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include <pngmsg/export_pngmsg.h>
#include <pngmsg/chunk_type.hh>

namespace pngmsg {

    /**
     * @brief Compute the PNG CRC-32 of a chunk
     *
     * The checksum covers the four type bytes followed by the data bytes;
     * the length field is not included.
     *
     * @param type Chunk type
     * @param data Chunk data (may be null when size is 0)
     * @param size Number of data bytes
     * @return CRC-32 (IEEE 802.3 polynomial, pre and post inverted)
     */
    PNGMSG_EXPORT std::uint32_t compute_crc(const chunk_type& type, const std::byte* data, std::size_t size);

    inline std::uint32_t compute_crc(const chunk_type& type, const std::vector<std::byte>& data) {
        return compute_crc(type, data.data(), data.size());
    }

} // namespace pngmsg
