/**
 * @file chunk_iterator.hh
 * @brief Forward iterator over the chunks of a PNG stream
 * @author Igor
 * @date 05/09/2025
 */

#pragma once

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <vector>
#include <pngmsg/export_pngmsg.h>
#include <pngmsg/chunk.hh>
#include <pngmsg/chunk_header.hh>
#include <pngmsg/parse_options.hh>

namespace pngmsg {

    class reader_base;

    /**
     * @class chunk_iterator
     * @brief Reads a PNG stream one chunk at a time
     *
     * The signature is checked on construction and each chunk is parsed
     * and CRC-checked as the iterator reaches it, so a stream can be
     * listed or searched without holding every chunk in memory. Running
     * out of input after a chunk other than IEND is an error.
     */
    class PNGMSG_EXPORT chunk_iterator {
    public:
        /**
         * @struct chunk_info
         * @brief Information about the current chunk being iterated
         */
        struct chunk_info {
            chunk_header header;          ///< Framing of the current chunk
            std::optional<chunk> value;   ///< Parsed chunk (empty once the iterator has ended)
            std::size_t index = 0;        ///< Position in the stream, 0 for the first chunk
        };

        /**
         * @brief Iterate a stream positioned at the PNG signature
         * @throws parse_error invalid_signature if the stream does not start with it
         */
        explicit chunk_iterator(std::istream& stream, const parse_options& options = {});

        /**
         * @brief Iterate a byte buffer; the buffer must outlive the iterator
         * @throws parse_error invalid_signature if the buffer does not start with it
         */
        chunk_iterator(const std::byte* data, std::size_t size, const parse_options& options = {});

        explicit chunk_iterator(const std::vector<std::byte>& bytes, const parse_options& options = {});

        ~chunk_iterator();

        chunk_iterator(const chunk_iterator&) = delete;
        chunk_iterator& operator = (const chunk_iterator&) = delete;

        const chunk_info& current() const { return m_current; }
        chunk_info& current() { return m_current; }

        /**
         * @brief Advance to the next chunk
         * @throws parse_error for a malformed chunk, or missing_end_chunk
         *         when the input ends after a chunk other than IEND
         */
        void next();

        bool has_next() const { return !m_ended; }
        bool at_end() const { return m_ended; }

    private:
        chunk_iterator(std::unique_ptr<reader_base> reader, const parse_options& options);

        void read_signature();
        void read_next_chunk();

        std::unique_ptr<reader_base> m_reader;
        parse_options m_options;
        chunk_info m_current;
        bool m_ended;
        bool m_end_seen;
    };

} // namespace pngmsg
