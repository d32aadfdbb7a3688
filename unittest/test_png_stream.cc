#include <doctest/doctest.h>
#include <polyglot/png_stream.hh>
#include <polyglot/crc32.hh>
#include <polyglot/endian.hh>
#include <polyglot/exceptions.hh>

#include <functional>

#include "test_utils.hh"

using namespace polyglot;
using namespace test_utils;

TEST_CASE("PNG parse") {
    auto data = make_png(500);
    REQUIRE(data.size() == 500);

    auto s = png::parse(data);

    SUBCASE("chunk sequence") {
        REQUIRE(s.chunks.size() == 4);
        CHECK(s.chunks[0].type == png::IHDR);
        CHECK(s.chunks[1].type == png::IDAT);
        CHECK(s.chunks[2].type == png::tEXt);
        CHECK(s.chunks[3].type == png::IEND);
        CHECK(s.trailing.empty());
    }

    SUBCASE("offsets and lengths") {
        CHECK(s.chunks[0].file_offset == 8);
        CHECK(s.chunks[0].length == 13);
        CHECK(s.chunks[1].file_offset == 33);
        CHECK(s.chunks[3].file_offset == 488);
        CHECK(s.end_offset() == 500);
    }

    SUBCASE("stored CRCs match") {
        for (const auto& c : s.chunks) {
            CHECK(c.crc == chunk_crc32(c.type, c.data));
        }
    }

    SUBCASE("round trip is byte exact") {
        CHECK(png::serialize(s) == data);
    }
}

TEST_CASE("PNG bytes after IEND") {
    auto data = make_png();
    append(data, "appended archive bytes");

    auto s = png::parse(data);
    CHECK(s.chunks.back().type == png::IEND);
    CHECK(to_string(s.trailing) == "appended archive bytes");
    CHECK(png::serialize(s) == data);
}

TEST_CASE("PNG structural errors") {
    SUBCASE("bad signature") {
        auto data = make_png();
        data[1] = std::byte('X');
        try {
            png::parse(data);
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::malformed_signature);
        }
    }

    SUBCASE("declared length past the end") {
        auto data = make_png();
        write_u32be(data, 33, 5000);  // IDAT length
        try {
            png::parse(data);
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::truncated_chunk);
        }
    }

    SUBCASE("length beyond the PNG limit") {
        auto data = make_png();
        write_u32be(data, 33, 0x80000000u);
        CHECK_THROWS_AS(png::parse(data), parse_error);
    }

    SUBCASE("cut inside a chunk header") {
        auto data = make_png();
        data.resize(8 + 25 + 5);
        try {
            png::parse(data);
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::truncated_chunk);
        }
    }

    SUBCASE("first chunk is not IHDR") {
        png::stream s;
        s.chunks.push_back(png::make_chunk(png::IDAT, idat_data()));
        s.chunks.push_back(png::make_chunk(png::IEND, {}));
        try {
            png::parse(png::serialize(s));
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::missing_header_chunk);
        }
    }

    SUBCASE("signature only") {
        auto data = make_png();
        data.resize(8);
        try {
            png::parse(data);
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::missing_header_chunk);
        }
    }
}

TEST_CASE("PNG without IEND") {
    auto data = make_png();
    data.resize(data.size() - 12);

    SUBCASE("strict") {
        try {
            png::parse(data);
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::missing_trailer_chunk);
        }
    }

    SUBCASE("lenient") {
        warning_tracker tracker;
        parse_options opts;
        opts.strict = false;
        opts.on_warning = std::ref(tracker);

        auto s = png::parse(data, opts);
        CHECK(s.chunks.size() == 2);
        CHECK(tracker.has_warning("missing_trailer"));
    }
}

TEST_CASE("PNG CRC mismatch") {
    auto data = make_png();
    data[8 + 25 - 1] ^= std::byte{0xFF};  // last byte of the IHDR CRC

    SUBCASE("strict throws") {
        try {
            png::parse(data);
            FAIL("Should have thrown");
        } catch (const integrity_error& e) {
            CHECK(e.code() == error_code::chunk_crc_mismatch);
            CHECK(std::string(e.what()).find("'IHDR'") != std::string::npos);
        }
    }

    SUBCASE("lenient warns and keeps the stored value") {
        warning_tracker tracker;
        parse_options opts;
        opts.strict = false;
        opts.on_warning = std::ref(tracker);

        auto s = png::parse(data, opts);
        REQUIRE(tracker.warnings.size() == 1);
        CHECK(tracker.warnings[0].category == "chunk_crc");
        CHECK(tracker.warnings[0].offset == 8);
        CHECK(png::serialize(s) == data);
    }
}

TEST_CASE("PNG input size limit") {
    parse_options opts;
    opts.max_input_size = 16;
    try {
        png::parse(make_png(), opts);
        FAIL("Should have thrown");
    } catch (const policy_error& e) {
        CHECK(e.code() == error_code::payload_too_large);
    }
}

TEST_CASE("insert_ancillary") {
    auto s = png::parse(make_png());
    auto payload = to_bytes("guest payload");

    SUBCASE("inserted right before IEND with a valid CRC") {
        png::insert_ancillary(s, png::tEXt, payload);
        REQUIRE(s.chunks.size() == 4);
        const auto& c = s.chunks[2];
        CHECK(c.type == png::tEXt);
        CHECK(c.length == payload.size());
        CHECK(c.crc == chunk_crc32(png::tEXt, payload));
        CHECK(c.file_offset == 55);
        CHECK(s.chunks[3].type == png::IEND);
        CHECK(s.chunks[3].file_offset == 55 + 12 + payload.size());

        // Re-parsing the serialized stream gives the same layout
        auto again = png::parse(png::serialize(s));
        REQUIRE(again.chunks.size() == 4);
        CHECK(again.chunks[2].data == payload);
        CHECK(again.chunks[3].file_offset == s.chunks[3].file_offset);
    }

    SUBCASE("critical type rejected") {
        try {
            png::insert_ancillary(s, "ABCD"_4cc, payload);
            FAIL("Should have thrown");
        } catch (const policy_error& e) {
            CHECK(e.code() == error_code::critical_chunk_rejected);
        }
    }

    SUBCASE("non-letter type rejected") {
        try {
            png::insert_ancillary(s, "pnG "_4cc, payload);
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::invalid_chunk_type);
        }
    }

    SUBCASE("reserved bit set rejected") {
        CHECK_THROWS_AS(png::insert_ancillary(s, "text"_4cc, payload), parse_error);
    }

    SUBCASE("payload over the limit") {
        try {
            png::insert_ancillary(s, png::tEXt, payload, 4);
            FAIL("Should have thrown");
        } catch (const policy_error& e) {
            CHECK(e.code() == error_code::payload_too_large);
        }
        CHECK(s.chunks.size() == 3);
    }
}

TEST_CASE("tEXt payload lookup") {
    auto s = png::parse(make_png());
    png::insert_ancillary(s, png::tEXt, png::make_text_data("first", to_bytes("one")));
    png::insert_ancillary(s, png::tEXt, png::make_text_data("second", to_bytes("two")));

    CHECK(png::find_chunk(s, png::tEXt) == std::optional<std::size_t>(2));
    CHECK(to_string(*png::find_text_payload(s, "second")) == "two");
    CHECK(to_string(*png::find_text_payload(s, "first")) == "one");
    CHECK_FALSE(png::find_text_payload(s, "third").has_value());
    CHECK_FALSE(png::find_text_payload(s, "sec").has_value());
}
