//
// Error codes and messages name the record, its offset and the offending values
//

#include <doctest/doctest.h>
#include <polyglot/exceptions.hh>
#include <polyglot/endian.hh>
#include <polyglot/offset_reconciler.hh>
#include <polyglot/png_stream.hh>
#include <polyglot/wav_file.hh>
#include <polyglot/zip_archive.hh>

#include <string>

#include "test_utils.hh"

using namespace polyglot;
using namespace test_utils;

TEST_CASE("Error code names") {
    CHECK(to_string(error_code::eocd_not_found) == "EocdNotFound");
    CHECK(to_string(error_code::chunk_crc_mismatch) == "ChunkCrcMismatch");
    CHECK(to_string(error_code::bidirectional_infeasible) == "BidirectionalInfeasible");
    CHECK(to_string(error_code::no_embedded_payload_found) == "NoEmbeddedPayloadFound");
    CHECK(to_string(error_code::composition_invariant_violated) == "CompositionInvariantViolated");
}

TEST_CASE("Exception hierarchy") {
    try {
        THROW_PARSE(error_code::not_riff, "value ", 42, " at offset ", 7);
    } catch (const polyglot_error& e) {
        CHECK(e.code() == error_code::not_riff);
        CHECK(std::string(e.what()) == "value 42 at offset 7");
        CHECK(dynamic_cast<const parse_error*>(&e) != nullptr);
    }

    CHECK_THROWS_AS(THROW_COMPOSITION("broken"), composition_error);
    CHECK_THROWS_AS(THROW_NOT_FOUND(error_code::no_embedded_payload_found, "none"), not_found_error);
    CHECK_THROWS_AS(THROW_INTEGRITY(error_code::size_mismatch, "size"), std::runtime_error);
}

TEST_CASE("Improved error messages") {
    SUBCASE("PNG truncation shows chunk, offset and sizes") {
        auto data = make_png();
        write_u32be(data, 33, 5000);
        try {
            png::parse(data);
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(msg.find("'IDAT'") != std::string::npos);
            CHECK(msg.find("offset 33") != std::string::npos);
            CHECK(msg.find("5000") != std::string::npos);
        }
    }

    SUBCASE("CRC mismatch shows both values in hex") {
        auto data = make_png();
        write_u32be(data, 8 + 21, 0xDEADBEEF);
        try {
            png::parse(data);
            FAIL("Should have thrown");
        } catch (const integrity_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(msg.find("0xdeadbeef") != std::string::npos);
            CHECK(msg.find("offset 8") != std::string::npos);
        }
    }

    SUBCASE("ZIP offset overflow shows the shift") {
        try {
            reconcile_offsets(zip::parse(make_zip()), -3);
            FAIL("Should have thrown");
        } catch (const policy_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(msg.find("-3") != std::string::npos);
        }
    }

    SUBCASE("WAV chunk overrun shows the chunk id") {
        auto data = make_wav();
        write_u32le(data, 40, 1000);
        try {
            wav::parse(data);
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(msg.find("'data'") != std::string::npos);
            CHECK(msg.find("offset 36") != std::string::npos);
            CHECK(msg.find("1000") != std::string::npos);
        }
    }

    SUBCASE("missing EOCD shows how far the search went") {
        auto data = byte_buffer(100, std::byte{0});
        try {
            zip::find_eocd(data);
            FAIL("Should have thrown");
        } catch (const parse_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(msg.find("100 bytes") != std::string::npos);
        }
    }
}
