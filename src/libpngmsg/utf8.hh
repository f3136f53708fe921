//
// Created by igor on 04/09/2025.
//

#pragma once

#include <cstddef>

namespace pngmsg {

    // Offset of the first byte that breaks UTF-8 well-formedness, or size if none
    std::size_t find_invalid_utf8(const std::byte* data, std::size_t size);
}
