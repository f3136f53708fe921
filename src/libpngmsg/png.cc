//
// Created by igor on 05/09/2025.
//

#include <pngmsg/png.hh>
#include <pngmsg/chunk_iterator.hh>
#include <pngmsg/exceptions.hh>
#include "output.hh"

#include <algorithm>
#include <iterator>
#include <ostream>

namespace pngmsg {

    namespace {
        template<typename Chunks>
        auto find_type(Chunks& chunks, const chunk_type& type) {
            return std::find_if(chunks.begin(), chunks.end(),
                                [&type](const chunk& c) { return c.type() == type; });
        }

        std::vector<chunk> collect(chunk_iterator& it) {
            std::vector<chunk> chunks;
            while (it.has_next()) {
                chunks.push_back(std::move(*it.current().value));
                it.next();
            }
            return chunks;
        }
    }

    png::png(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png png::from_chunks(std::vector<chunk> chunks) {
        return png(std::move(chunks));
    }

    png png::parse(const std::vector<std::byte>& bytes, const parse_options& options) {
        chunk_iterator it(bytes, options);
        return png(collect(it));
    }

    png png::parse(std::istream& stream, const parse_options& options) {
        chunk_iterator it(stream, options);
        return png(collect(it));
    }

    void png::append_chunk(chunk c) {
        // IEND is expected last, so search from the back
        auto end_it = std::find_if(m_chunks.rbegin(), m_chunks.rend(),
                                   [](const chunk& x) { return x.type() == chunk_types::IEND; });
        THROW_PARSE_IF(end_it == m_chunks.rend(), missing_end_chunk,
                       "Cannot append chunk ", c.type(), ": container has no IEND chunk");

        m_chunks.insert(std::prev(end_it.base()), std::move(c));
    }

    chunk png::remove_chunk_by_type(std::string_view type) {
        return remove_chunk_by_type(chunk_type::from_string(type));
    }

    chunk png::remove_chunk_by_type(const chunk_type& type) {
        if (type == chunk_types::IEND) {
            THROW_LOOKUP(protected_chunk, "Chunk ", type, " cannot be removed");
        }

        auto it = find_type(m_chunks, type);
        if (it == m_chunks.end()) {
            THROW_LOOKUP(chunk_not_found, "No chunk of type ", type);
        }

        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    const chunk* png::chunk_by_type(std::string_view type) const {
        return chunk_by_type(chunk_type::from_string(type));
    }

    const chunk* png::chunk_by_type(const chunk_type& type) const {
        auto it = find_type(m_chunks, type);
        return it == m_chunks.end() ? nullptr : &*it;
    }

    std::vector<std::byte> png::serialize() const {
        std::size_t total = standard_header.size();
        for (const auto& c : m_chunks) {
            total += c.total_size();
        }

        std::vector<std::byte> out;
        out.reserve(total);
        memory_writer w(out);
        w.write(standard_header.data(), standard_header.size());
        for (const auto& c : m_chunks) {
            c.write(w);
        }
        return out;
    }

    void png::write(std::ostream& os) const {
        stream_writer w(os);
        w.write(standard_header.data(), standard_header.size());
        for (const auto& c : m_chunks) {
            c.write(w);
        }
    }

    std::ostream& operator<<(std::ostream& os, const png& p) {
        os << "PNG with " << p.chunks().size() << " chunk(s)\n";
        for (const auto& c : p.chunks()) {
            os << "  " << c << "\n";
        }
        return os;
    }

} // namespace pngmsg
