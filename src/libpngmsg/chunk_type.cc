//
// Created by igor on 02/09/2025.
//

#include <pngmsg/chunk_type.hh>
#include <pngmsg/exceptions.hh>
#include <ostream>
#include <iomanip>

namespace pngmsg {

    chunk_type chunk_type::from_string(std::string_view text) {
        THROW_PARSE_IF(text.size() != 4, invalid_type_code,
                       "Chunk type must be 4 characters, got ", text.size());
        for (char c : text) {
            THROW_PARSE_UNLESS(is_valid_byte(static_cast<std::uint8_t>(c)), invalid_type_code,
                               "Invalid character in chunk type: 0x", std::hex,
                               static_cast<unsigned>(static_cast<unsigned char>(c)));
        }
        return { text[0], text[1], text[2], text[3] };
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
        auto flags = os.flags();
        auto fill = os.fill();
        os << '\'';
        for (char c : t.b) {
            if (c >= 32 && c <= 126) {
                os << c;
            } else {
                // Escape non-printable characters
                os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                   << static_cast<unsigned>(static_cast<unsigned char>(c));
            }
        }
        os << '\'';
        os.flags(flags);
        os.fill(fill);
        return os;
    }

} // namespace pngmsg
