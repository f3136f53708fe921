#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <pngmsg/chunk.hh>
#include <pngmsg/chunk_type.hh>
#include <pngmsg/png.hh>

// Raw bytes of a string, no terminator
inline std::vector<std::byte> to_bytes(std::string_view s) {
    std::vector<std::byte> out;
    out.reserve(s.size());
    for (char c : s) {
        out.push_back(static_cast<std::byte>(c));
    }
    return out;
}

// String literal overload; keeps embedded NULs
template<std::size_t N>
std::vector<std::byte> to_bytes(const char (&s)[N]) {
    return to_bytes(std::string_view(s, N - 1));
}

inline void append_be32(std::vector<std::byte>& out, std::uint32_t v) {
    out.push_back(static_cast<std::byte>(v >> 24));
    out.push_back(static_cast<std::byte>(v >> 16));
    out.push_back(static_cast<std::byte>(v >> 8));
    out.push_back(static_cast<std::byte>(v));
}

// Hand-built chunk encoding with an explicit CRC
inline std::vector<std::byte> raw_chunk(std::string_view type, std::string_view data, std::uint32_t crc) {
    std::vector<std::byte> out;
    append_be32(out, static_cast<std::uint32_t>(data.size()));
    auto t = to_bytes(type);
    out.insert(out.end(), t.begin(), t.end());
    auto d = to_bytes(data);
    out.insert(out.end(), d.begin(), d.end());
    append_be32(out, crc);
    return out;
}

inline pngmsg::chunk make_chunk(std::string_view type, std::string_view data) {
    return pngmsg::chunk(pngmsg::chunk_type::from_string(type), to_bytes(data));
}

inline std::vector<std::byte> signature_bytes() {
    return std::vector<std::byte>(pngmsg::png::standard_header.begin(), pngmsg::png::standard_header.end());
}

// Signature followed by the encoding of each chunk
inline std::vector<std::byte> make_png_bytes(const std::vector<pngmsg::chunk>& chunks) {
    auto out = signature_bytes();
    for (const auto& c : chunks) {
        auto bytes = c.serialize();
        out.insert(out.end(), bytes.begin(), bytes.end());
    }
    return out;
}

// [IHDR, IDAT, IEND] with placeholder payloads
inline std::vector<pngmsg::chunk> minimal_chunks() {
    return {
        make_chunk("IHDR", std::string("\x00\x00\x00\x01\x00\x00\x00\x01\x08\x02\x00\x00\x00", 13)),
        make_chunk("IDAT", "compressed pixels"),
        make_chunk("IEND", "")
    };
}

inline std::vector<std::string> type_names(const pngmsg::png& p) {
    std::vector<std::string> names;
    for (const auto& c : p.chunks()) {
        names.push_back(c.type().to_string());
    }
    return names;
}
