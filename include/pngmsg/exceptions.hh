/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngmsg library
 * @author Igor
 * @date 02/09/2025
 *
 * This file defines the exception hierarchy, the error kinds carried by
 * every exception, and convenience macros for error handling throughout
 * the library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <sstream>
#include <pngmsg/export_pngmsg.h>

namespace pngmsg {

    /**
     * @enum error_kind
     * @brief Classification of every failure the library reports
     */
    enum class error_kind {
        invalid_signature,  ///< Stream does not start with the PNG signature
        invalid_type_code,  ///< Chunk type is not 4 ASCII letters
        unexpected_eof,     ///< Input ended inside a chunk
        crc_mismatch,       ///< Stored CRC differs from the computed one
        missing_end_chunk,  ///< No IEND chunk where one is required
        chunk_too_large,    ///< Declared length exceeds the configured limit
        chunk_not_found,    ///< No chunk of the requested type
        protected_chunk,    ///< Request would remove the IEND chunk
        invalid_utf8,       ///< Chunk data is not well formed UTF-8
        io_failure          ///< Underlying stream failed
    };

    /**
     * @brief Get the symbolic name of an error kind
     * @param kind Error kind
     * @return Name such as "crc_mismatch"
     */
    PNGMSG_EXPORT std::string_view to_string(error_kind kind);

    /**
     * @class pngmsg_error
     * @brief Base exception class for all pngmsg errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch all pngmsg-specific errors with a single catch block.
     * The kind() tells which of the documented failures occurred.
     */
    class PNGMSG_EXPORT pngmsg_error : public std::runtime_error {
    public:
        pngmsg_error(error_kind kind, const std::string& msg)
            : std::runtime_error(msg), m_kind(kind) {}

        [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    private:
        error_kind m_kind;
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when reading from or writing to a stream fails.
     */
    class PNGMSG_EXPORT io_error : public pngmsg_error {
    public:
        explicit io_error(const std::string& msg)
            : pngmsg_error(error_kind::io_failure, msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for malformed input
     *
     * Thrown when the byte stream or a type code violates the PNG
     * chunk layout: bad signature, bad type code, truncated chunk,
     * CRC mismatch, oversized chunk or missing IEND.
     */
    class PNGMSG_EXPORT parse_error : public pngmsg_error {
    public:
        parse_error(error_kind kind, const std::string& msg)
            : pngmsg_error(kind, msg) {}
    };

    /**
     * @class lookup_error
     * @brief Exception for failed chunk removal
     */
    class PNGMSG_EXPORT lookup_error : public pngmsg_error {
    public:
        lookup_error(error_kind kind, const std::string& msg)
            : pngmsg_error(kind, msg) {}
    };

    /**
     * @class encoding_error
     * @brief Exception for chunk data that cannot be decoded as text
     */
    class PNGMSG_EXPORT encoding_error : public pngmsg_error {
    public:
        explicit encoding_error(const std::string& msg)
            : pngmsg_error(error_kind::invalid_utf8, msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) \
        throw ::pngmsg::io_error(::pngmsg::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error of the given kind with formatted message
     * @param kind Enumerator of ::pngmsg::error_kind (without qualification)
     */
    #define THROW_PARSE(kind, ...) \
        throw ::pngmsg::parse_error(::pngmsg::error_kind::kind, ::pngmsg::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_LOOKUP
     * @brief Throw a lookup_error of the given kind with formatted message
     */
    #define THROW_LOOKUP(kind, ...) \
        throw ::pngmsg::lookup_error(::pngmsg::error_kind::kind, ::pngmsg::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_ENCODING
     * @brief Throw an encoding_error with formatted message
     */
    #define THROW_ENCODING(...) \
        throw ::pngmsg::encoding_error(::pngmsg::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_PARSE_IF(condition, kind, ...) \
        do { if (condition) THROW_PARSE(kind, __VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_PARSE_UNLESS(condition, kind, ...) \
        do { if (!(condition)) THROW_PARSE(kind, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngmsg
