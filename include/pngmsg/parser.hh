/**
 * @file parser.hh
 * @brief Functional helpers for walking PNG chunk streams
 * @author Igor
 * @date 05/09/2025
 */

#pragma once

#include <iosfwd>
#include <vector>
#include <pngmsg/chunk_iterator.hh>
#include <pngmsg/parse_options.hh>

namespace pngmsg {

    /**
     * @brief Call a function for each chunk in a stream
     *
     * The signature and every chunk are validated as they are reached.
     *
     * @tparam Func Callable type accepting chunk_iterator::chunk_info&
     * @param stream Input stream positioned at the PNG signature
     * @param func Function to call for each chunk
     * @param options Parse options for controlling parsing behavior
     */
    template<typename Func>
    void for_each_chunk(std::istream& stream, Func func, const parse_options& options) {
        chunk_iterator it(stream, options);

        while (it.has_next()) {
            func(it.current());
            it.next();
        }
    }

    template<typename Func>
    void for_each_chunk(std::istream& stream, Func func) {
        for_each_chunk(stream, func, parse_options{});
    }

    /**
     * @brief Call a function for each chunk in a byte buffer
     */
    template<typename Func>
    void for_each_chunk(const std::vector<std::byte>& bytes, Func func, const parse_options& options) {
        chunk_iterator it(bytes, options);

        while (it.has_next()) {
            func(it.current());
            it.next();
        }
    }

    template<typename Func>
    void for_each_chunk(const std::vector<std::byte>& bytes, Func func) {
        for_each_chunk(bytes, func, parse_options{});
    }

} // namespace pngmsg
