#include <doctest/doctest.h>
#include <pngmsg/chunk.hh>
#include <pngmsg/crc.hh>
#include <pngmsg/exceptions.hh>
#include "test_utils.hh"

#include <sstream>

using namespace pngmsg;

namespace {
    const std::string_view message = "This is where your secret message will be!";
    constexpr std::uint32_t message_crc = 2882656334u;
}

TEST_SUITE("CHUNK") {
    TEST_CASE("chunk construction") {
        SUBCASE("computes CRC") {
            chunk c(chunk_type::from_string("RuSt"), to_bytes(message));
            CHECK(c.length() == 42);
            CHECK(c.crc() == message_crc);
            CHECK(c.type().to_string() == "RuSt");
            CHECK(c.total_size() == 54);
        }

        SUBCASE("empty data") {
            chunk c(chunk_types::IEND, {});
            CHECK(c.length() == 0);
            CHECK(c.crc() == 0xAE426082u);
            CHECK(c.total_size() == 12);
        }
    }

    TEST_CASE("chunk parsing") {
        SUBCASE("valid chunk") {
            auto bytes = raw_chunk("RuSt", message, message_crc);
            auto c = chunk::parse(bytes);
            CHECK(c.length() == 42);
            CHECK(c.type() == chunk_type::from_string("RuSt"));
            CHECK(c.crc() == message_crc);
            CHECK(c.data_as_string() == message);
        }

        SUBCASE("trailing bytes are left alone") {
            auto bytes = raw_chunk("RuSt", message, message_crc);
            bytes.push_back(std::byte{0xFF});
            CHECK(chunk::parse(bytes).data_as_string() == message);
        }

        SUBCASE("wrong CRC") {
            auto bytes = raw_chunk("RuSt", message, message_crc + 1);
            try {
                (void)chunk::parse(bytes);
                FAIL("Should have thrown exception");
            } catch (const parse_error& e) {
                CHECK(e.kind() == error_kind::crc_mismatch);
            }
        }

        SUBCASE("invalid type code") {
            auto crc = compute_crc(chunk_type::from_bytes("Ru1t"), to_bytes(message));
            auto bytes = raw_chunk("Ru1t", message, crc);
            try {
                (void)chunk::parse(bytes);
                FAIL("Should have thrown exception");
            } catch (const parse_error& e) {
                CHECK(e.kind() == error_kind::invalid_type_code);
            }
        }

        SUBCASE("invalid type code in a truncated chunk") {
            auto bytes = raw_chunk("Ru1t", message, message_crc);
            bytes.resize(bytes.size() - 10);
            try {
                (void)chunk::parse(bytes);
                FAIL("Should have thrown exception");
            } catch (const parse_error& e) {
                CHECK(e.kind() == error_kind::unexpected_eof);
            }
        }

        SUBCASE("declared length beyond input") {
            auto bytes = raw_chunk("RuSt", message, message_crc);
            bytes.resize(bytes.size() - 5);
            try {
                (void)chunk::parse(bytes);
                FAIL("Should have thrown exception");
            } catch (const parse_error& e) {
                CHECK(e.kind() == error_kind::unexpected_eof);
            }
        }

        SUBCASE("truncated header") {
            std::vector<std::byte> bytes = {std::byte{0}, std::byte{0}, std::byte{0}, std::byte{0}, std::byte{'I'}};
            try {
                (void)chunk::parse(bytes);
                FAIL("Should have thrown exception");
            } catch (const parse_error& e) {
                CHECK(e.kind() == error_kind::unexpected_eof);
            }
        }

        SUBCASE("huge declared length fails without allocating it") {
            std::vector<std::byte> bytes;
            append_be32(bytes, 0x7FFFFFFFu);
            auto t = to_bytes("IDAT");
            bytes.insert(bytes.end(), t.begin(), t.end());
            bytes.resize(bytes.size() + 16);
            try {
                (void)chunk::parse(bytes);
                FAIL("Should have thrown exception");
            } catch (const parse_error& e) {
                CHECK(e.kind() == error_kind::unexpected_eof);
            }
        }

        SUBCASE("length above the configured limit") {
            auto bytes = raw_chunk("RuSt", message, message_crc);
            parse_options opts;
            opts.max_chunk_size = 16;
            try {
                (void)chunk::parse(bytes, opts);
                FAIL("Should have thrown exception");
            } catch (const parse_error& e) {
                CHECK(e.kind() == error_kind::chunk_too_large);
            }
        }

        SUBCASE("length above the PNG limit in a truncated chunk") {
            std::vector<std::byte> bytes;
            append_be32(bytes, 0x80000000u);
            auto t = to_bytes("IHDR");
            bytes.insert(bytes.end(), t.begin(), t.end());
            auto d = to_bytes("abc");
            bytes.insert(bytes.end(), d.begin(), d.end());
            try {
                (void)chunk::parse(bytes);
                FAIL("Should have thrown exception");
            } catch (const parse_error& e) {
                CHECK(e.kind() == error_kind::unexpected_eof);
            }
        }

        SUBCASE("maximum length by default") {
            std::vector<std::byte> bytes;
            append_be32(bytes, 0xFFFFFFFFu);
            auto t = to_bytes("IDAT");
            bytes.insert(bytes.end(), t.begin(), t.end());
            bytes.resize(bytes.size() + 100);
            try {
                (void)chunk::parse(bytes);
                FAIL("Should have thrown exception");
            } catch (const parse_error& e) {
                CHECK(e.kind() == error_kind::unexpected_eof);
            }
            CHECK(parse_options{}.max_chunk_size == chunk::max_length);
        }

        SUBCASE("reserved bit") {
            chunk original(chunk_type::from_string("Rust"), to_bytes("x"));
            auto bytes = original.serialize();

            CHECK(chunk::parse(bytes) == original);

            parse_options opts;
            opts.allow_reserved_bit = false;
            try {
                (void)chunk::parse(bytes, opts);
                FAIL("Should have thrown exception");
            } catch (const parse_error& e) {
                CHECK(e.kind() == error_kind::invalid_type_code);
            }
        }
    }

    TEST_CASE("serialization") {
        SUBCASE("layout") {
            chunk c(chunk_type::from_string("RuSt"), to_bytes(message));
            CHECK(c.serialize() == raw_chunk("RuSt", message, message_crc));
        }

        SUBCASE("round trip") {
            for (auto data : {std::string_view(""), std::string_view("hi"), message}) {
                chunk c(chunk_type::from_string("teSt"), to_bytes(data));
                auto parsed = chunk::parse(c.serialize());
                CHECK(parsed == c);
                CHECK(parsed.type() == c.type());
                CHECK(parsed.data() == c.data());
                CHECK(parsed.crc() == c.crc());
            }
        }

        SUBCASE("binary data") {
            std::vector<std::byte> data;
            for (int i = 0; i < 256; ++i) {
                data.push_back(static_cast<std::byte>(i));
            }
            chunk c(chunk_types::IDAT, data);
            CHECK(chunk::parse(c.serialize()) == c);
        }
    }

    TEST_CASE("single bit flips are detected") {
        chunk c(chunk_type::from_string("RuSt"), to_bytes("hidden"));
        const auto original = c.serialize();

        // Flip every bit of the type and data; keep the original CRC
        for (std::size_t byte = 4; byte < original.size() - 4; ++byte) {
            for (int bit = 0; bit < 8; ++bit) {
                auto bytes = original;
                bytes[byte] ^= static_cast<std::byte>(1 << bit);
                CAPTURE(byte);
                CAPTURE(bit);
                try {
                    (void)chunk::parse(bytes);
                    FAIL("Corruption went unnoticed");
                } catch (const parse_error& e) {
                    CHECK(e.kind() == error_kind::crc_mismatch);
                }
            }
        }
    }

    TEST_CASE("data as string") {
        SUBCASE("ASCII") {
            CHECK(make_chunk("teSt", "hi").data_as_string() == "hi");
        }

        SUBCASE("multi-byte UTF-8") {
            CHECK(make_chunk("teSt", "gr\xC3\xBC\xC3\x9F dich \xE2\x82\xAC \xF0\x9F\x98\x80").data_as_string()
                  == "gr\xC3\xBC\xC3\x9F dich \xE2\x82\xAC \xF0\x9F\x98\x80");
        }

        SUBCASE("empty") {
            CHECK(make_chunk("IEND", "").data_as_string().empty());
        }

        SUBCASE("invalid sequences") {
            for (auto bad : {std::string_view("\xFF"),
                             std::string_view("ab\xC3"),           // truncated
                             std::string_view("\xC0\xAF"),         // overlong
                             std::string_view("\xE0\x80\xAF"),     // overlong
                             std::string_view("\xED\xA0\x80"),     // surrogate
                             std::string_view("\xF4\x90\x80\x80"), // above U+10FFFF
                             std::string_view("\x80")}) {
                auto c = make_chunk("teSt", bad);
                try {
                    (void)c.data_as_string();
                    FAIL("Should have thrown exception");
                } catch (const encoding_error& e) {
                    CHECK(e.kind() == error_kind::invalid_utf8);
                }
            }
        }
    }

    TEST_CASE("stream output") {
        std::ostringstream oss;
        oss << chunk(chunk_types::IEND, {}) << ' ' << 42;
        CHECK(oss.str() == "Chunk 'IEND' length 0 crc 0xae426082 42");
    }
}
