#include <doctest/doctest.h>
#include <pngmsg/chunk_iterator.hh>
#include <pngmsg/parser.hh>
#include <pngmsg/exceptions.hh>
#include "test_utils.hh"

#include <sstream>

using namespace pngmsg;

TEST_CASE("chunk iterator") {
    auto bytes = make_png_bytes(minimal_chunks());

    SUBCASE("walks every chunk in order") {
        chunk_iterator it(bytes);

        std::vector<std::string> names;
        std::vector<std::uint64_t> offsets;
        while (it.has_next()) {
            const auto& info = it.current();
            REQUIRE(info.value.has_value());
            CHECK(info.header.type == info.value->type());
            CHECK(info.header.length == info.value->length());
            CHECK(info.header.crc == info.value->crc());
            CHECK(info.index == names.size());
            names.push_back(info.header.type.to_string());
            offsets.push_back(info.header.file_offset);
            it.next();
        }

        CHECK(it.at_end());
        CHECK(names == std::vector<std::string>{"IHDR", "IDAT", "IEND"});
        CHECK(offsets == std::vector<std::uint64_t>{8, 8 + 25, 8 + 25 + 29});
        CHECK_FALSE(it.current().value.has_value());
    }

    SUBCASE("next after the end is a no-op") {
        chunk_iterator it(bytes);
        while (it.has_next()) {
            it.next();
        }
        CHECK_NOTHROW(it.next());
        CHECK(it.at_end());
    }

    SUBCASE("stream and buffer agree") {
        std::istringstream stream(std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
        chunk_iterator from_stream(stream);
        chunk_iterator from_buffer(bytes);
        while (from_buffer.has_next()) {
            REQUIRE(from_stream.has_next());
            CHECK(*from_stream.current().value == *from_buffer.current().value);
            CHECK(from_stream.current().header.file_offset == from_buffer.current().header.file_offset);
            from_stream.next();
            from_buffer.next();
        }
        CHECK(from_stream.at_end());
    }

    SUBCASE("signature checked on construction") {
        auto bad = bytes;
        bad[0] = std::byte{0x88};
        CHECK_THROWS_AS((void)chunk_iterator(bad), parse_error);
    }

    SUBCASE("missing IEND is reported when input runs out") {
        auto chunks = minimal_chunks();
        chunks.pop_back();
        auto truncated = make_png_bytes(chunks);

        chunk_iterator it(truncated);
        CHECK(it.current().header.type == chunk_types::IHDR);
        it.next();
        CHECK(it.current().header.type == chunk_types::IDAT);
        try {
            it.next();
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.kind() == error_kind::missing_end_chunk);
        }
        CHECK(it.at_end());
    }
}

TEST_CASE("for_each_chunk") {
    auto chunks = minimal_chunks();
    chunks.insert(chunks.end() - 1, make_chunk("ruSt", "secret"));
    auto bytes = make_png_bytes(chunks);

    SUBCASE("buffer") {
        std::uint64_t total = 0;
        int count = 0;
        for_each_chunk(bytes, [&](const chunk_iterator::chunk_info& info) {
            total += info.header.total_size();
            count++;
        });
        CHECK(count == 4);
        CHECK(total + 8 == bytes.size());
    }

    SUBCASE("stream with options") {
        std::istringstream stream(std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
        parse_options opts;
        opts.max_chunk_size = 4;

        // IHDR has 13 data bytes
        CHECK_THROWS_AS(for_each_chunk(stream, [](const auto&) {}, opts), parse_error);
    }

    SUBCASE("find a message without building a png") {
        std::string found;
        for_each_chunk(bytes, [&](const auto& info) {
            if (info.header.type == "ruSt"_ct) {
                found = info.value->data_as_string();
            }
        });
        CHECK(found == "secret");
    }
}
