/**
 * @file png.hh
 * @brief PNG container: signature plus ordered chunk list
 * @author Igor
 * @date 05/09/2025
 */

#pragma once

#include <array>
#include <cstddef>
#include <iosfwd>
#include <string_view>
#include <vector>
#include <pngmsg/export_pngmsg.h>
#include <pngmsg/chunk.hh>
#include <pngmsg/chunk_type.hh>
#include <pngmsg/parse_options.hh>

namespace pngmsg {

    /**
     * @class png
     * @brief Ordered chunk sequence of a PNG file
     *
     * Chunks keep their stream order. New chunks go in front of the IEND
     * chunk so it stays last, and IEND itself cannot be removed. Pixel
     * data is never interpreted.
     */
    class PNGMSG_EXPORT png {
    public:
        /**
         * @brief The 8 byte signature every PNG stream starts with
         */
        static constexpr std::array<std::byte, 8> standard_header{
            std::byte{0x89}, std::byte{0x50}, std::byte{0x4E}, std::byte{0x47},
            std::byte{0x0D}, std::byte{0x0A}, std::byte{0x1A}, std::byte{0x0A}
        };

        /**
         * @brief Compose a container from chunks
         *
         * No ordering is enforced; a list without IEND is accepted but
         * append_chunk() will refuse to work on it.
         */
        static png from_chunks(std::vector<chunk> chunks);

        /**
         * @brief Parse a complete PNG byte buffer
         * @param bytes Signature followed by chunks
         * @param options Parse options for controlling parsing behavior
         * @return Container with all chunks in stream order
         * @throws parse_error invalid_signature, any chunk parse failure, or
         *         missing_end_chunk if the last chunk is not IEND
         */
        static png parse(const std::vector<std::byte>& bytes, const parse_options& options = {});

        /**
         * @brief Parse a PNG from a stream, reading until end of input
         */
        static png parse(std::istream& stream, const parse_options& options = {});

        [[nodiscard]] const std::array<std::byte, 8>& header() const { return standard_header; }

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }

        /**
         * @brief Insert a chunk immediately before the IEND chunk
         * @throws parse_error missing_end_chunk if there is no IEND chunk
         */
        void append_chunk(chunk c);

        /**
         * @brief Remove the first chunk of the given type
         * @param type Four letter type code
         * @return The removed chunk
         * @throws parse_error invalid_type_code if type is not a valid code
         * @throws lookup_error protected_chunk for IEND, chunk_not_found if absent
         */
        chunk remove_chunk_by_type(std::string_view type);
        chunk remove_chunk_by_type(const chunk_type& type);

        /**
         * @brief Find the first chunk of the given type
         * @return Pointer into chunks(), or nullptr if absent. Invalidated
         *         by append_chunk() and remove_chunk_by_type().
         * @throws parse_error invalid_type_code if type is not a valid code
         */
        [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const;
        [[nodiscard]] const chunk* chunk_by_type(const chunk_type& type) const;

        /**
         * @brief Encode as signature followed by every chunk
         */
        [[nodiscard]] std::vector<std::byte> serialize() const;

        /**
         * @brief Write the encoded container to a stream
         * @throws io_error if the stream fails
         */
        void write(std::ostream& os) const;

        bool operator==(const png& o) const { return m_chunks == o.m_chunks; }
        bool operator!=(const png& o) const { return !(*this == o); }

    private:
        explicit png(std::vector<chunk> chunks);

        std::vector<chunk> m_chunks;
    };

    // One line per chunk
    PNGMSG_EXPORT std::ostream& operator<<(std::ostream& os, const png& p);

} // namespace pngmsg
