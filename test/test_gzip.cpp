#include <doctest/doctest.h>
#include <a2decode/archive/gzip.hpp>
#include <a2decode/archive/inflate.hpp>

#include "test_helpers.hpp"

#include <span>
#include <string>
#include <vector>

namespace {

std::vector<std::uint8_t> make_gzip(const std::vector<std::uint8_t>& payload,
                                    std::uint8_t flags = 0,
                                    std::string_view filename = {}) {
    std::vector<std::uint8_t> out = {0x1F, 0x8B, 0x08, flags};
    test_util::put_le32(out, 0x5F000000);  // mtime
    out.push_back(0x00);                   // XFL
    out.push_back(0x03);                   // OS = Unix
    if (flags & a2decode::gzip_reader::FLAG_FEXTRA) {
        test_util::put_le16(out, 4);
        test_util::put_text(out, std::string_view("AB\0\0", 4));
    }
    if (flags & a2decode::gzip_reader::FLAG_FNAME) {
        test_util::put_text(out, filename);
        out.push_back(0x00);
    }
    if (flags & a2decode::gzip_reader::FLAG_FHCRC) {
        test_util::put_le16(out, 0x1234);
    }

    const auto deflated = test_util::deflate_raw(payload);
    out.insert(out.end(), deflated.begin(), deflated.end());
    test_util::put_le32(out, a2decode::crc32(payload));
    test_util::put_le32(out, static_cast<std::uint32_t>(payload.size()));
    return out;
}

const std::vector<std::uint8_t> PAYLOAD = test_util::bytes_of(
    "10 PRINT \"HELLO\"\n20 GOTO 10\n10 PRINT \"HELLO\"\n20 GOTO 10\n");

} // namespace

TEST_CASE("gzip: sniff") {
    CHECK(a2decode::gzip_reader::sniff(make_gzip(PAYLOAD)));
    CHECK_FALSE(a2decode::gzip_reader::sniff(std::vector<std::uint8_t>{0x1F}));
    CHECK_FALSE(a2decode::gzip_reader::sniff(std::vector<std::uint8_t>{'P', 'K', 3, 4}));
}

TEST_CASE("gzip: decompress") {
    SUBCASE("plain member") {
        std::vector<std::uint8_t> out;
        const auto result = a2decode::gzip_reader::decompress(make_gzip(PAYLOAD), out);
        REQUIRE(result);
        CHECK(out == PAYLOAD);
    }

    SUBCASE("optional header fields are skipped") {
        const auto flags = static_cast<std::uint8_t>(a2decode::gzip_reader::FLAG_FEXTRA |
                                                     a2decode::gzip_reader::FLAG_FNAME |
                                                     a2decode::gzip_reader::FLAG_FHCRC);
        const auto gz = make_gzip(PAYLOAD, flags, "HELLO.BAS");

        a2decode::gzip_header header;
        REQUIRE(a2decode::gzip_reader::read_header(gz, header));
        CHECK(header.filename == "HELLO.BAS");
        CHECK(header.original_size == PAYLOAD.size());
        CHECK(header.os == 3);

        std::vector<std::uint8_t> out;
        REQUIRE(a2decode::gzip_reader::decompress(gz, out));
        CHECK(out == PAYLOAD);
    }
}

TEST_CASE("gzip: failures") {
    std::vector<std::uint8_t> out = {0xAA};

    SUBCASE("CRC mismatch") {
        auto gz = make_gzip(PAYLOAD);
        gz[gz.size() - 8] ^= 0xFF;
        const auto result = a2decode::gzip_reader::decompress(gz, out);
        CHECK_FALSE(result);
        CHECK(result.error == a2decode::decode_error::inflate_failed);
    }

    SUBCASE("size mismatch") {
        auto gz = make_gzip(PAYLOAD);
        test_util::set_le32(gz, gz.size() - 4, static_cast<std::uint32_t>(PAYLOAD.size() + 1));
        const auto result = a2decode::gzip_reader::decompress(gz, out);
        CHECK(result.error == a2decode::decode_error::inflate_failed);
    }

    SUBCASE("unsupported method") {
        auto gz = make_gzip(PAYLOAD);
        gz[2] = 0x07;
        const auto result = a2decode::gzip_reader::decompress(gz, out);
        CHECK(result.error == a2decode::decode_error::unsupported_method);
    }

    SUBCASE("truncated filename") {
        std::vector<std::uint8_t> gz = {0x1F, 0x8B, 0x08, a2decode::gzip_reader::FLAG_FNAME,
                                        0, 0, 0, 0, 0, 3, 'N', 'A', 'M', 'E',
                                        0, 0, 0, 0, 0, 0, 0, 0};
        const auto result = a2decode::gzip_reader::decompress(gz, out);
        CHECK(result.error == a2decode::decode_error::malformed_header);
    }

    SUBCASE("too short") {
        const std::vector<std::uint8_t> gz = {0x1F, 0x8B, 0x08, 0x00, 0, 0};
        CHECK(a2decode::gzip_reader::decompress(gz, out).error == a2decode::decode_error::too_short);
    }

    SUBCASE("not gzip") {
        const auto result = a2decode::gzip_reader::decompress(PAYLOAD, out);
        CHECK(result.error == a2decode::decode_error::unrecognized_format);
    }

    // Output is only written on success
    CHECK(out == std::vector<std::uint8_t>{0xAA});
}

TEST_CASE("gzip: inflate output is capped at the declared size") {
    const std::vector<std::uint8_t> zeros(1u << 20, 0);
    const auto deflated = test_util::deflate_raw(zeros);
    REQUIRE(deflated.size() < 16384);

    std::vector<std::uint8_t> out = {0xAA};
    const auto capped = a2decode::lodepng_inflate_stream(deflated, 100, out);
    CHECK(capped.error == a2decode::decode_error::inflate_failed);
    CHECK(out == std::vector<std::uint8_t>{0xAA});

    REQUIRE(a2decode::lodepng_inflate_stream(deflated, zeros.size(), out));
    CHECK(out == zeros);
}

TEST_CASE("gzip: injected inflate") {
    int calls = 0;
    a2decode::archive_options options;
    options.inflate = [&](std::span<const std::uint8_t>, std::size_t expected,
                          std::vector<std::uint8_t>& out) {
        ++calls;
        CHECK(expected == PAYLOAD.size());
        out = PAYLOAD;
        return a2decode::decode_result::success();
    };

    std::vector<std::uint8_t> out;
    REQUIRE(a2decode::gzip_reader::decompress(make_gzip(PAYLOAD), out, options));
    CHECK(calls == 1);
    CHECK(out == PAYLOAD);

    SUBCASE("failure from the primitive propagates") {
        options.inflate = [](std::span<const std::uint8_t>, std::size_t, std::vector<std::uint8_t>&) {
            return a2decode::decode_result::failure(a2decode::decode_error::inflate_failed, "boom");
        };
        const auto result = a2decode::gzip_reader::decompress(make_gzip(PAYLOAD), out, options);
        CHECK(result.error == a2decode::decode_error::inflate_failed);
        CHECK(result.message == "boom");
    }
}

TEST_CASE("gzip: every prefix and repeat decodes") {
    const auto flags = static_cast<std::uint8_t>(a2decode::gzip_reader::FLAG_FEXTRA |
                                                 a2decode::gzip_reader::FLAG_FNAME);
    const auto gz = make_gzip(PAYLOAD, flags, "HELLO.BAS");
    const std::vector<std::uint8_t> untouched = {0xEE};

    for (const std::size_t size : test_util::prefix_lengths(gz.size())) {
        CAPTURE(size);
        const std::span<const std::uint8_t> prefix(gz.data(), size);

        std::vector<std::uint8_t> out = untouched;
        CHECK_FALSE(a2decode::gzip_reader::decompress(prefix, out));
        CHECK(out == untouched);

        a2decode::gzip_header header;
        header.filename = "unchanged";
        if (!a2decode::gzip_reader::read_header(prefix, header)) {
            CHECK(header.filename == "unchanged");
        }
    }

    std::vector<std::uint8_t> first;
    std::vector<std::uint8_t> second;
    REQUIRE(a2decode::gzip_reader::decompress(gz, first));
    REQUIRE(a2decode::gzip_reader::decompress(gz, second));
    REQUIRE(a2decode::gzip_reader::decompress(gz, first));
    CHECK(first == second);
    CHECK(first == PAYLOAD);
}
