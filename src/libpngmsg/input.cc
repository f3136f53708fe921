//
// Created by igor on 03/09/2025.
//

#include <istream>
#include <algorithm>

#include "input.hh"

namespace pngmsg {
    static constexpr std::size_t read_block_size = 64 * 1024;

    std::vector<std::byte> reader_base::read_exact(std::size_t size) {
        std::vector<std::byte> buffer;
        buffer.reserve(std::min(size, read_block_size));
        while (buffer.size() < size) {
            std::size_t have = buffer.size();
            std::size_t want = std::min(read_block_size, size - have);
            buffer.resize(have + want);
            std::size_t actual = read(buffer.data() + have, want);
            THROW_PARSE_IF(actual != want, unexpected_eof,
                           "Unexpected EOF: requested ", size, " bytes, got ", have + actual);
        }
        return buffer;
    }

    chunk_type reader_base::read_chunk_type() {
        std::array<char, 4> data;
        std::size_t actual = read(data.data(), 4);
        THROW_PARSE_IF(actual != 4, unexpected_eof, "Unexpected EOF: failed to read chunk type");
        return chunk_type(data[0], data[1], data[2], data[3]);
    }

    // memory_reader implementation
    memory_reader::memory_reader(const std::byte* data, std::size_t size)
        : m_data(data), m_size(size), m_position(0) {
        THROW_IO_IF(!data && size > 0, "Null buffer with non-zero size in memory_reader");
    }

    memory_reader::memory_reader(const std::vector<std::byte>& data)
        : memory_reader(data.data(), data.size()) {}

    std::size_t memory_reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        std::size_t actual = std::min(size, remaining());
        if (actual == 0) {
            return 0;
        }
        std::memcpy(dst, m_data + m_position, actual);
        m_position += actual;
        return actual;
    }

    // stream_reader implementation
    stream_reader::stream_reader(std::istream& is) : m_stream(is), m_position(0) {}

    std::size_t stream_reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        THROW_IO_IF(m_stream.bad(), "Stream in bad state");
        if (m_stream.eof()) {
            return 0;
        }

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed");
        m_position += bytes_read;
        return bytes_read;
    }

    bool stream_reader::at_end() {
        THROW_IO_IF(m_stream.bad(), "Stream in bad state");
        if (m_stream.eof()) {
            return true;
        }
        return m_stream.peek() == std::istream::traits_type::eof();
    }
}
