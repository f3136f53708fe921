/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG chunk streams
 * @author Igor
 * @date 03/09/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngmsg {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing PNG chunk streams
     *
     * Controls size limits, conformance checks and warning handling.
     */
    struct parse_options {
        /**
         * @brief Maximum allowed chunk length in bytes
         *
         * Chunks declaring a larger length fail with chunk_too_large
         * before their data is read. The default admits every length,
         * so a length running past the input is reported as
         * unexpected_eof.
         */
        std::uint64_t max_chunk_size = 0xFFFFFFFFu;

        /**
         * @brief Accept chunk types with the reserved bit set
         *
         * When true such chunks are kept and reported through on_warning.
         * When false they fail with invalid_type_code.
         */
        bool allow_reserved_bit = true;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Stream offset of the chunk the warning is about
         * @param category Warning category ("reserved_bit", "header_position", "after_end")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngmsg
