//
// Created by igor on 04/09/2025.
//

#include <ostream>

#include "output.hh"

namespace pngmsg {
    void memory_writer::write(const void* src, std::size_t size) {
        if (size == 0) {
            return;
        }
        THROW_IO_UNLESS(src, "Null buffer in write");

        const auto* first = static_cast<const std::byte*>(src);
        m_out.insert(m_out.end(), first, first + size);
    }

    void stream_writer::write(const void* src, std::size_t size) {
        if (size == 0) {
            return;
        }
        THROW_IO_UNLESS(src, "Null buffer in write");
        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state");

        m_stream.write(static_cast<const char*>(src), static_cast<std::streamsize>(size));
        THROW_IO_IF(m_stream.fail(), "Stream write failed after ", m_position, " bytes");
        m_position += size;
    }
}
