//
// Created by igor on 05/09/2025.
//

#include <pngmsg/chunk_iterator.hh>
#include <pngmsg/png.hh>
#include <pngmsg/exceptions.hh>
#include "input.hh"

#include <algorithm>
#include <array>

namespace pngmsg {

    chunk_iterator::chunk_iterator(std::istream& stream, const parse_options& options)
        : chunk_iterator(std::make_unique<stream_reader>(stream), options) {
    }

    chunk_iterator::chunk_iterator(const std::byte* data, std::size_t size, const parse_options& options)
        : chunk_iterator(std::make_unique<memory_reader>(data, size), options) {
    }

    chunk_iterator::chunk_iterator(const std::vector<std::byte>& bytes, const parse_options& options)
        : chunk_iterator(bytes.data(), bytes.size(), options) {
    }

    chunk_iterator::chunk_iterator(std::unique_ptr<reader_base> reader, const parse_options& options)
        : m_reader(std::move(reader))
        , m_options(options)
        , m_current{}
        , m_ended(false)
        , m_end_seen(false) {
        read_signature();

        THROW_PARSE_IF(m_reader->at_end(), missing_end_chunk, "PNG stream contains no chunks");
        read_next_chunk();
    }

    chunk_iterator::~chunk_iterator() = default;

    void chunk_iterator::read_signature() {
        std::array<std::byte, 8> magic{};
        std::size_t actual = m_reader->read(magic.data(), magic.size());
        THROW_PARSE_IF(actual != magic.size(), invalid_signature,
                       "Stream too short for PNG signature: ", actual, " bytes");
        THROW_PARSE_UNLESS(std::equal(magic.begin(), magic.end(), png::standard_header.begin()),
                           invalid_signature, "Stream does not start with the PNG signature");
    }

    void chunk_iterator::next() {
        if (m_ended) {
            return;
        }

        if (m_reader->at_end()) {
            const chunk_type last = m_current.header.type;
            m_ended = true;
            m_current.value.reset();
            THROW_PARSE_UNLESS(last == chunk_types::IEND, missing_end_chunk,
                               "PNG stream ends with chunk ", last, " at offset ",
                               m_current.header.file_offset, " instead of IEND");
            return;
        }

        ++m_current.index;
        read_next_chunk();
    }

    void chunk_iterator::read_next_chunk() {
        std::uint64_t start_pos = m_reader->tell();

        chunk c = chunk::parse(*m_reader, m_options);

        m_current.header = {
            .type = c.type(),
            .length = c.length(),
            .file_offset = start_pos,
            .crc = c.crc()
        };

        if (m_options.on_warning) {
            if (m_current.index == 0 && c.type() != chunk_types::IHDR) {
                m_options.on_warning(start_pos, "header_position",
                    "First chunk is '" + c.type().to_string() + "', expected 'IHDR'");
            }
            if (m_end_seen) {
                m_options.on_warning(start_pos, "after_end",
                    "Chunk '" + c.type().to_string() + "' follows an IEND chunk");
            }
        }
        if (c.type() == chunk_types::IEND) {
            m_end_seen = true;
        }

        m_current.value.emplace(std::move(c));
    }

} // namespace pngmsg
