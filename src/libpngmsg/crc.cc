//
// Created by igor on 03/09/2025.
//

#include <pngmsg/crc.hh>
#include <zlib.h>
#include <algorithm>
#include <limits>

namespace pngmsg {

    std::uint32_t compute_crc(const chunk_type& type, const std::byte* data, std::size_t size) {
        uLong crc = ::crc32(0L, Z_NULL, 0);
        crc = ::crc32(crc, reinterpret_cast<const Bytef*>(type.data()), 4);

        // zlib takes uInt lengths
        constexpr std::size_t max_block = std::numeric_limits<uInt>::max();
        const auto* p = reinterpret_cast<const Bytef*>(data);
        while (size > 0) {
            auto block = static_cast<uInt>(std::min(size, max_block));
            crc = ::crc32(crc, p, block);
            p += block;
            size -= block;
        }
        return static_cast<std::uint32_t>(crc);
    }

} // namespace pngmsg
