//
// Created by igor on 02/09/2025.
//

#include <pngmsg/exceptions.hh>

namespace pngmsg {

    std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::invalid_signature:
                return "invalid_signature";
            case error_kind::invalid_type_code:
                return "invalid_type_code";
            case error_kind::unexpected_eof:
                return "unexpected_eof";
            case error_kind::crc_mismatch:
                return "crc_mismatch";
            case error_kind::missing_end_chunk:
                return "missing_end_chunk";
            case error_kind::chunk_too_large:
                return "chunk_too_large";
            case error_kind::chunk_not_found:
                return "chunk_not_found";
            case error_kind::protected_chunk:
                return "protected_chunk";
            case error_kind::invalid_utf8:
                return "invalid_utf8";
            case error_kind::io_failure:
                return "io_failure";
        }
        // make compiler happy
        return "unknown";
    }

} // namespace pngmsg
