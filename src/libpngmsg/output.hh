//
// Created by igor on 04/09/2025.
//

#pragma once

#include <iosfwd>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>

#include <pngmsg/exceptions.hh>
#include <pngmsg/byte_order.hh>
#include <pngmsg/chunk_type.hh>

namespace pngmsg {

    // Base writer interface - throws io_error on failure
    class PNGMSG_EXPORT writer_base {
        public:
            virtual ~writer_base() = default;

            virtual void write(const void* src, std::size_t size) = 0;

            // Bytes written so far
            virtual std::uint64_t tell() const = 0;

            template<typename T>
            void write(T value, byte_order bo) {
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                write(&value, sizeof(T));
            }

            void write_chunk_type(const chunk_type& type) {
                write(type.data(), 4);
            }

            void write_bytes(const std::vector<std::byte>& bytes) {
                if (!bytes.empty()) {
                    write(bytes.data(), bytes.size());
                }
            }
    };

    // Appends to a caller-owned byte vector
    class PNGMSG_EXPORT memory_writer : public writer_base {
        public:
            explicit memory_writer(std::vector<std::byte>& out) : m_out(out), m_start(out.size()) {}
            ~memory_writer() override = default;

            using writer_base::write;
            void write(const void* src, std::size_t size) override;
            std::uint64_t tell() const override { return m_out.size() - m_start; }

        private:
            std::vector<std::byte>& m_out;
            std::size_t m_start;
    };

    class PNGMSG_EXPORT stream_writer : public writer_base {
        public:
            explicit stream_writer(std::ostream& os) : m_stream(os), m_position(0) {}
            ~stream_writer() override = default;

            using writer_base::write;
            void write(const void* src, std::size_t size) override;
            std::uint64_t tell() const override { return m_position; }

        private:
            std::ostream& m_stream;
            std::uint64_t m_position;
    };
}
