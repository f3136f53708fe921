//
// Created by igor on 03/09/2025.
//

#pragma once

#include <iosfwd>
#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <cstring>

#include <pngmsg/exceptions.hh>
#include <pngmsg/byte_order.hh>
#include <pngmsg/chunk_type.hh>

namespace pngmsg {

    // Base reader interface
    class PNGMSG_EXPORT reader_base {
        public:
            virtual ~reader_base() = default;

            // Returns the number of bytes read, short only at end of input
            virtual std::size_t read(void* dst, std::size_t size) = 0;

            // Bytes consumed so far
            virtual std::uint64_t tell() const = 0;

            virtual bool at_end() = 0;

            // Convenience methods - throw parse_error(unexpected_eof) on short reads
            // Grows the buffer as data arrives so a bogus size cannot force a huge allocation
            std::vector<std::byte> read_exact(std::size_t size);

            template<typename T>
            T read(byte_order bo) {
                std::array<std::byte, sizeof(T)> buff;
                std::size_t actual = read(buff.data(), sizeof(T));
                THROW_PARSE_IF(actual != sizeof(T), unexpected_eof,
                               "Unexpected EOF: failed to read ", sizeof(T), " bytes");

                T value;
                std::memcpy(&value, buff.data(), sizeof(T));
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                return value;
            }

            chunk_type read_chunk_type();
    };

    // Reads from a caller-owned byte buffer
    class PNGMSG_EXPORT memory_reader : public reader_base {
        public:
            memory_reader(const std::byte* data, std::size_t size);
            explicit memory_reader(const std::vector<std::byte>& data);
            ~memory_reader() override = default;

            using reader_base::read;
            std::size_t read(void* dst, std::size_t size) override;
            std::uint64_t tell() const override { return m_position; }
            bool at_end() override { return m_position >= m_size; }

            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };

    // Reads from a stream; does not require the stream to be seekable
    class PNGMSG_EXPORT stream_reader : public reader_base {
        public:
            explicit stream_reader(std::istream& is);
            ~stream_reader() override = default;

            using reader_base::read;
            std::size_t read(void* dst, std::size_t size) override;
            std::uint64_t tell() const override { return m_position; }
            bool at_end() override;

        private:
            std::istream& m_stream;
            std::uint64_t m_position;
    };
}
