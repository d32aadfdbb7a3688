#include <doctest/doctest.h>
#include <polyglot/zip_archive.hh>
#include <polyglot/crc32.hh>
#include <polyglot/endian.hh>
#include <polyglot/exceptions.hh>
#include <polyglot/offset_reconciler.hh>

#include <functional>

#include "test_utils.hh"

using namespace polyglot;
using namespace test_utils;

namespace {
    // Layout of make_zip(): two stored entries, then the central directory
    constexpr std::size_t hello_size = 17;                                 // "Hello, polyglot!\n"
    constexpr std::size_t first_record = 30 + 9 + hello_size;              // 56
    constexpr std::size_t second_record = 30 + 11 + 9;                     // 50
    constexpr std::size_t cd_offset = first_record + second_record;       // 106
    constexpr std::size_t cd_size = (46 + 9) + (46 + 11);                 // 112
    constexpr std::size_t eocd_offset = cd_offset + cd_size;              // 218
}

TEST_CASE("Stored archive layout") {
    auto data = make_zip();
    REQUIRE(data.size() == eocd_offset + 22);

    SUBCASE("signatures where the format puts them") {
        CHECK(read_u32le(data, 0) == zip::local_signature);
        CHECK(read_u32le(data, first_record) == zip::local_signature);
        CHECK(read_u32le(data, cd_offset) == zip::central_signature);
        CHECK(read_u32le(data, eocd_offset) == zip::eocd_signature);
    }

    SUBCASE("EOCD fields") {
        CHECK(read_u16le(data, eocd_offset + 10) == 2);
        CHECK(read_u32le(data, eocd_offset + 12) == cd_size);
        CHECK(read_u32le(data, eocd_offset + 16) == cd_offset);
    }

    SUBCASE("central directory offsets and CRC") {
        CHECK(read_u32le(data, cd_offset + 42) == 0);
        CHECK(read_u32le(data, cd_offset + 46 + 9 + 42) == first_record);
        CHECK(read_u32le(data, cd_offset + 46 + 9 + 16) == 0xCBF43926u);  // crc of "123456789"
        CHECK(read_u16le(data, cd_offset + 46 + 9 + 10) == zip::method_stored);
    }
}

TEST_CASE("ZIP parse") {
    auto data = make_zip();
    auto a = zip::parse(data);

    SUBCASE("model") {
        CHECK(a.start_offset == 0);
        REQUIRE(a.records.size() == 2);
        REQUIRE(a.directory.size() == 2);
        CHECK(a.records[1].position == first_record);
        CHECK(a.directory[1].local_header_offset == first_record);
        CHECK(a.eocd.cd_offset == cd_offset);
        CHECK(a.eocd.cd_size == cd_size);
        CHECK(a.directory_gap.empty());
        CHECK(a.directory_position() == cd_offset);
        CHECK(a.byte_size() == data.size());
    }

    SUBCASE("entries") {
        auto list = zip::entries(a);
        REQUIRE(list.size() == 2);
        CHECK(list[0].filename == "hello.txt");
        CHECK(to_string(list[0].data) == "Hello, polyglot!\n");
        CHECK(list[1].filename == "numbers.txt");
        CHECK(list[1].crc32 == 0xCBF43926u);
        CHECK(list[1].uncompressed_size == 9);
    }

    SUBCASE("round trip is byte exact") {
        CHECK(zip::serialize(a) == data);
    }
}

TEST_CASE("EOCD search") {
    SUBCASE("archive comment") {
        auto a = zip::build_stored(sample_files());
        a.eocd.comment = to_bytes("comment with PK\x05\x06 inside");
        auto data = zip::serialize(a);
        CHECK(zip::find_eocd(data) == eocd_offset);
        CHECK(zip::serialize(zip::parse(data)) == data);
    }

    SUBCASE("no EOCD") {
        try {
            zip::parse(make_png());
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::eocd_not_found);
        }
    }

    SUBCASE("too small") {
        CHECK_THROWS_AS(zip::find_eocd(to_bytes("PK")), parse_error);
    }

    SUBCASE("garbage after the EOCD") {
        auto data = make_zip();
        append(data, "junk");
        try {
            zip::parse(data);
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::eocd_not_found);
        }
    }

    SUBCASE("empty archive") {
        auto a = zip::build_stored({});
        auto data = zip::serialize(a);
        CHECK(data.size() == 22);
        auto parsed = zip::parse(data);
        CHECK(parsed.records.empty());
        CHECK(parsed.directory.empty());
        CHECK(zip::serialize(parsed) == data);
    }
}

TEST_CASE("ZIP structural errors") {
    SUBCASE("bad central directory signature") {
        auto data = make_zip();
        data[cd_offset] = std::byte('X');
        try {
            zip::parse(data);
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::central_directory_corrupt);
        }
    }

    SUBCASE("bad local header signature") {
        auto data = make_zip();
        data[first_record + 1] = std::byte('X');
        try {
            zip::parse(data);
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::central_directory_corrupt);
            CHECK(std::string(e.what()).find("numbers.txt") != std::string::npos);
        }
    }

    SUBCASE("central directory offset past the EOCD") {
        auto data = make_zip();
        write_u32le(data, eocd_offset + 16, 5000);
        CHECK_THROWS_AS(zip::parse(data), parse_error);
    }

    SUBCASE("ZIP64 sentinel") {
        auto data = make_zip();
        write_u32le(data, eocd_offset + 16, 0xFFFFFFFFu);
        try {
            zip::parse(data);
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::zip64_unsupported);
        }
    }

    SUBCASE("multi-disk") {
        auto data = make_zip();
        write_u16le(data, eocd_offset + 4, 1);
        try {
            zip::parse(data);
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::central_directory_corrupt);
        }
    }

    SUBCASE("entry data runs into the central directory") {
        auto data = make_zip();
        // compressed size of numbers.txt in the central directory
        write_u32le(data, cd_offset + 46 + 9 + 20, 500);
        try {
            zip::parse(data);
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::truncated_chunk);
        }
    }
}

TEST_CASE("ZIP integrity findings") {
    auto data = make_zip();
    // Flip one byte of "Hello, polyglot!\n"
    data[30 + 9] = std::byte('J');

    SUBCASE("strict") {
        try {
            zip::parse(data);
            FAIL("Should have thrown");
        } catch (const integrity_error& e) {
            CHECK(e.code() == error_code::entry_crc_mismatch);
            CHECK(std::string(e.what()).find("hello.txt") != std::string::npos);
        }
    }

    SUBCASE("lenient") {
        warning_tracker tracker;
        parse_options opts;
        opts.strict = false;
        opts.on_warning = std::ref(tracker);

        auto a = zip::parse(data, 0, opts);
        REQUIRE(tracker.warnings.size() == 1);
        CHECK(tracker.warnings[0].category == "entry_crc");
        CHECK(tracker.warnings[0].offset == 0);
        CHECK(zip::serialize(a) == data);
    }

    SUBCASE("local header disagrees with the central directory") {
        auto clean = make_zip();
        write_u32le(clean, 14, 0x12345678);  // local CRC of hello.txt
        warning_tracker tracker;
        parse_options opts;
        opts.strict = false;
        opts.on_warning = std::ref(tracker);

        zip::parse(clean, 0, opts);
        CHECK(tracker.has_warning("header_mismatch"));
        CHECK_FALSE(tracker.has_warning("entry_crc"));
        CHECK_THROWS_AS(zip::parse(clean), integrity_error);
    }

    SUBCASE("central directory size disagrees with the EOCD") {
        auto clean = make_zip();
        write_u32le(clean, eocd_offset + 12, cd_size - 1);
        warning_tracker tracker;
        parse_options opts;
        opts.strict = false;
        opts.on_warning = std::ref(tracker);

        zip::parse(clean, 0, opts);
        CHECK(tracker.has_warning("size_mismatch"));
    }
}

TEST_CASE("Archive after leading bytes") {
    auto prefix = to_bytes("0123456789");

    SUBCASE("unreconciled offsets need the inferred origin") {
        auto data = prefix;
        append(data, make_zip());

        CHECK_THROWS_AS(zip::parse(data), parse_error);
        auto origin = zip::infer_origin(data);
        REQUIRE(origin.has_value());
        CHECK(*origin == prefix.size());

        auto a = zip::parse(data, *origin);
        CHECK(a.start_offset == 0);
        CHECK(zip::entries(a)[1].filename == "numbers.txt");
    }

    SUBCASE("origin of a plain archive is zero") {
        CHECK(zip::infer_origin(make_zip()) == std::optional<std::uint64_t>(0));
    }
}

TEST_CASE("Archive behind a stub") {
    auto data = make_sfx_zip();
    auto a = zip::parse(data);

    SUBCASE("stub is kept as leading bytes") {
        CHECK(a.start_offset == sfx_stub_size);
        REQUIRE(a.leading.size() == sfx_stub_size);
        CHECK(to_string(a.leading) == std::string(sfx_stub_size, 'S'));
        CHECK(a.eocd.cd_offset == sfx_stub_size + cd_offset);
        CHECK(verify_offsets(a));

        auto list = zip::entries(a);
        REQUIRE(list.size() == 2);
        CHECK(list[0].local_header_offset == sfx_stub_size);
        CHECK(to_string(list[1].data) == "123456789");
    }

    SUBCASE("round trip is byte exact") {
        CHECK(zip::serialize(a) == data);
    }

    SUBCASE("stub travels with a shift") {
        auto moved = reconcile_offsets(a, 100);
        CHECK(moved.start_offset == 100 + sfx_stub_size);
        CHECK(moved.leading == a.leading);
        CHECK(verify_offsets(moved));

        byte_buffer combined(100, std::byte{0});
        append(combined, zip::serialize(moved));
        auto reparsed = zip::parse(combined);
        CHECK(reparsed.start_offset == 100 + sfx_stub_size);
        CHECK(to_string(zip::entries(reparsed)[0].data) == "Hello, polyglot!\n");
    }

    SUBCASE("stub cannot move before the origin") {
        try {
            reconcile_offsets(a, -1);
            FAIL("Should have thrown");
        } catch (const policy_error& e) {
            CHECK(e.code() == error_code::offset_overflow);
        }
    }
}

TEST_CASE("build_stored") {
    SUBCASE("same name for the same content") {
        auto a = zip::build_stored({{"image.png", make_png()}});
        auto data = zip::serialize(a);
        auto list = zip::entries(zip::parse(data));
        REQUIRE(list.size() == 1);
        CHECK(list[0].filename == "image.png");
        CHECK(list[0].data == make_png());
        CHECK(list[0].crc32 == crc32(make_png()));
    }

    SUBCASE("file name too long") {
        std::string name(0x10000, 'a');
        try {
            zip::build_stored({{name, to_bytes("x")}});
            FAIL("Should have thrown");
        } catch (const policy_error& e) {
            CHECK(e.code() == error_code::payload_too_large);
        }
    }
}
