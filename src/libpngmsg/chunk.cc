//
// Created by igor on 03/09/2025.
//

#include <pngmsg/chunk.hh>
#include <pngmsg/crc.hh>
#include <pngmsg/exceptions.hh>
#include "input.hh"
#include "output.hh"
#include "utf8.hh"

#include <ostream>
#include <iomanip>

namespace pngmsg {

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_type(type)
        , m_data(std::move(data))
        , m_crc(compute_crc(m_type, m_data)) {
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data, std::uint32_t crc)
        : m_type(type)
        , m_data(std::move(data))
        , m_crc(crc) {
    }

    chunk chunk::parse(reader_base& in, const parse_options& options) {
        std::uint64_t start_pos = in.tell();

        std::uint32_t length = 0;
        chunk_type type;
        try {
            length = in.read<std::uint32_t>(byte_order::big);
            type = in.read_chunk_type();
        } catch (const parse_error& e) {
            THROW_PARSE(unexpected_eof, "Truncated chunk header at offset ", start_pos, ": ", e.what());
        }

        THROW_PARSE_IF(length > options.max_chunk_size, chunk_too_large,
                       "Chunk ", type, " at offset ", start_pos, " has size ", length,
                       " bytes, which exceeds maximum allowed size of ", options.max_chunk_size, " bytes");

        std::vector<std::byte> data;
        std::uint32_t stored_crc = 0;
        try {
            data = in.read_exact(length);
            stored_crc = in.read<std::uint32_t>(byte_order::big);
        } catch (const parse_error& e) {
            THROW_PARSE(unexpected_eof, "Chunk ", type, " at offset ", start_pos,
                        " declares ", length, " data bytes but the input ends early: ", e.what());
        }

        // The CRC covers the type bytes, so a corrupted type is a CRC failure
        std::uint32_t actual_crc = compute_crc(type, data);
        THROW_PARSE_IF(stored_crc != actual_crc, crc_mismatch,
                       "Chunk ", type, " at offset ", start_pos, " has CRC 0x", std::hex, std::setfill('0'),
                       std::setw(8), stored_crc, ", computed 0x", std::setw(8), actual_crc);

        THROW_PARSE_UNLESS(type.has_valid_bytes(), invalid_type_code,
                           "Chunk at offset ", start_pos, " has invalid type code ", type);

        if (!type.is_reserved_bit_valid()) {
            THROW_PARSE_UNLESS(options.allow_reserved_bit, invalid_type_code,
                               "Chunk ", type, " at offset ", start_pos, " has the reserved bit set");
            if (options.on_warning) {
                options.on_warning(start_pos, "reserved_bit",
                    "Chunk '" + type.to_string() + "' has the reserved bit set");
            }
        }

        return chunk(type, std::move(data), stored_crc);
    }

    chunk chunk::parse(const std::vector<std::byte>& bytes, const parse_options& options) {
        memory_reader in(bytes);
        return parse(in, options);
    }

    std::string chunk::data_as_string() const {
        std::size_t bad = find_invalid_utf8(m_data.data(), m_data.size());
        if (bad != m_data.size()) {
            THROW_ENCODING("Chunk ", m_type, " data is not valid UTF-8 at byte ", bad);
        }
        return { reinterpret_cast<const char*>(m_data.data()), m_data.size() };
    }

    std::vector<std::byte> chunk::serialize() const {
        check_length();
        std::vector<std::byte> out;
        out.reserve(total_size());
        memory_writer w(out);
        write(w);
        return out;
    }

    void chunk::write(writer_base& out) const {
        check_length();
        out.write(length(), byte_order::big);
        out.write_chunk_type(m_type);
        out.write_bytes(m_data);
        out.write(m_crc, byte_order::big);
    }

    void chunk::check_length() const {
        THROW_PARSE_IF(m_data.size() > max_length, chunk_too_large,
                       "Chunk ", m_type, " has ", m_data.size(),
                       " data bytes, which does not fit the 32-bit length field");
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        auto flags = os.flags();
        auto fill = os.fill();
        os << "Chunk " << c.type() << " length " << std::dec << c.length()
           << " crc 0x" << std::hex << std::setfill('0') << std::setw(8) << c.crc();
        os.flags(flags);
        os.fill(fill);
        return os;
    }

} // namespace pngmsg
