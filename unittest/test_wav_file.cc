#include <doctest/doctest.h>
#include <polyglot/wav_file.hh>
#include <polyglot/endian.hh>
#include <polyglot/exceptions.hh>

#include <functional>

#include "test_utils.hh"

using namespace polyglot;
using namespace test_utils;

TEST_CASE("WAV parse") {
    auto data = make_wav();
    REQUIRE(data.size() == 50);
    auto f = wav::parse(data);

    SUBCASE("chunks") {
        CHECK(f.riff_size == 42);
        REQUIRE(f.chunks.size() == 2);
        CHECK(f.chunks[0].id == wav::fmt);
        CHECK(f.chunks[0].file_offset == 12);
        CHECK(f.chunks[1].id == wav::data);
        CHECK(f.chunks[1].file_offset == 36);
        CHECK(f.chunks[1].size == 5);
        CHECK(f.chunks[1].has_pad);
        CHECK(f.trailing.empty());
    }

    SUBCASE("format") {
        auto fmt = wav::format_of(f);
        CHECK(fmt.format_tag == 1);
        CHECK(fmt.channels == 1);
        CHECK(fmt.sample_rate == 8000);
        CHECK(fmt.byte_rate == 8000);
        CHECK(fmt.block_align == 1);
        CHECK(fmt.bits_per_sample == 8);
    }

    SUBCASE("samples") {
        const auto& s = wav::samples(f);
        REQUIRE(s.size() == 5);
        CHECK(s[0] == std::byte{0x80});
        CHECK(s[4] == std::byte{0x84});
    }

    SUBCASE("round trip is byte exact") {
        CHECK(wav::serialize(f) == data);
    }
}

TEST_CASE("WAV pad byte and trailing bytes") {
    SUBCASE("non-zero pad byte survives") {
        auto data = make_wav();
        data.back() = std::byte{0x7F};
        auto f = wav::parse(data);
        CHECK(f.chunks[1].pad == std::byte{0x7F});
        CHECK(wav::serialize(f) == data);
    }

    SUBCASE("missing pad on the last chunk") {
        auto data = make_wav();
        data.pop_back();
        write_u32le(data, 4, static_cast<std::uint32_t>(data.size() - 8));
        auto f = wav::parse(data);
        CHECK_FALSE(f.chunks[1].has_pad);
        CHECK(wav::serialize(f) == data);
    }

    SUBCASE("bytes past the RIFF extent") {
        auto data = make_wav(4);
        append(data, "tail");
        auto f = wav::parse(data);
        CHECK(to_string(f.trailing) == "tail");
        CHECK(wav::serialize(f) == data);

        // An archive appended after the form is not a RIFF size problem
        warning_tracker tracker;
        parse_options opts;
        opts.strict = false;
        opts.on_warning = std::ref(tracker);
        wav::parse(data, opts);
        CHECK(tracker.warnings.empty());
    }
}

TEST_CASE("WAV structural errors") {
    SUBCASE("not RIFF") {
        try {
            wav::parse(make_png());
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::not_riff);
        }
    }

    SUBCASE("not WAVE") {
        auto data = make_wav();
        data[8] = std::byte('A');
        data[9] = std::byte('V');
        data[10] = std::byte('I');
        data[11] = std::byte(' ');
        try {
            wav::parse(data);
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::not_wave);
            CHECK(std::string(e.what()).find("'AVI '") != std::string::npos);
        }
    }

    SUBCASE("no fmt chunk") {
        auto data = make_wav();
        data[12] = std::byte('j');
        data[13] = std::byte('u');
        data[14] = std::byte('n');
        data[15] = std::byte('k');
        try {
            wav::parse(data);
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::missing_fmt_chunk);
        }
    }

    SUBCASE("no data chunk") {
        auto data = make_wav();
        data[36] = std::byte('D');
        try {
            wav::parse(data);
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::missing_data_chunk);
        }
    }

    SUBCASE("short fmt chunk") {
        auto data = make_wav();
        write_u32le(data, 16, 8);
        CHECK_THROWS_AS(wav::parse(data), parse_error);
    }

    SUBCASE("chunk larger than the form") {
        auto data = make_wav();
        write_u32le(data, 40, 1000);
        try {
            wav::parse(data);
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            CHECK(e.code() == error_code::truncated_chunk);
        }
    }
}

TEST_CASE("RIFF size larger than the buffer") {
    auto data = make_wav();
    write_u32le(data, 4, 4000);

    SUBCASE("strict") {
        try {
            wav::parse(data);
            FAIL("Should have thrown");
        } catch (const integrity_error& e) {
            CHECK(e.code() == error_code::size_mismatch);
        }
    }

    SUBCASE("lenient") {
        warning_tracker tracker;
        parse_options opts;
        opts.strict = false;
        opts.on_warning = std::ref(tracker);

        auto f = wav::parse(data, opts);
        CHECK(tracker.has_warning("riff_size"));
        CHECK(f.chunks.size() == 2);
        CHECK(wav::serialize(f) == data);
    }
}

TEST_CASE("embed_chunk") {
    auto f = wav::parse(make_wav());
    auto payload = to_bytes("odd");

    SUBCASE("appended after the existing chunks") {
        wav::embed_chunk(f, wav::pnG, payload);
        REQUIRE(f.chunks.size() == 3);
        CHECK(f.chunks[2].id == wav::pnG);
        CHECK(f.chunks[2].file_offset == 50);
        CHECK(f.chunks[2].has_pad);
        CHECK(f.riff_size == 42 + 8 + 3 + 1);

        auto bytes = wav::serialize(f);
        CHECK(bytes.size() == f.riff_size + 8);
        auto again = wav::parse(bytes);
        REQUIRE(again.chunks.size() == 3);
        CHECK(again.chunks[2].data == payload);
        CHECK(wav::samples(again) == wav::samples(f));
    }

    SUBCASE("missing pad is restored before appending") {
        auto data = make_wav();
        data.pop_back();
        write_u32le(data, 4, static_cast<std::uint32_t>(data.size() - 8));
        auto g = wav::parse(data);
        wav::embed_chunk(g, wav::pnG, payload);
        CHECK(g.chunks[1].has_pad);
        CHECK(g.chunks[2].file_offset == 50);
        CHECK(wav::parse(wav::serialize(g)).chunks.size() == 3);
    }

    SUBCASE("fmt and data rejected") {
        try {
            wav::embed_chunk(f, wav::data, payload);
            FAIL("Should have thrown");
        } catch (const policy_error& e) {
            CHECK(e.code() == error_code::critical_chunk_rejected);
        }
        CHECK_THROWS_AS(wav::embed_chunk(f, wav::fmt, payload), policy_error);
        CHECK(f.chunks.size() == 2);
    }
}
