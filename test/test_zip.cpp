#include <doctest/doctest.h>
#include <a2decode/archive/inflate.hpp>
#include <a2decode/archive/zip.hpp>

#include "test_helpers.hpp"

#include <span>
#include <string>
#include <vector>

namespace {

// DOS date 2024-03-15, time 13:45:30
constexpr std::uint16_t DOS_DATE = ((2024 - 1980) << 9) | (3 << 5) | 15;
constexpr std::uint16_t DOS_TIME = (13 << 11) | (45 << 5) | 15;

void add_entry(std::vector<std::uint8_t>& zip, std::string_view name,
               const std::vector<std::uint8_t>& content, std::uint16_t method,
               bool streamed = false) {
    const auto stored = method == 8 ? test_util::deflate_raw(content) : content;
    const std::uint32_t crc = a2decode::crc32(content);

    test_util::put_le32(zip, 0x04034B50);
    test_util::put_le16(zip, 20);                       // version needed
    test_util::put_le16(zip, streamed ? 0x0008 : 0);   // flags
    test_util::put_le16(zip, method);
    test_util::put_le16(zip, DOS_TIME);
    test_util::put_le16(zip, DOS_DATE);
    test_util::put_le32(zip, streamed ? 0 : crc);
    test_util::put_le32(zip, streamed ? 0 : static_cast<std::uint32_t>(stored.size()));
    test_util::put_le32(zip, streamed ? 0 : static_cast<std::uint32_t>(content.size()));
    test_util::put_le16(zip, static_cast<std::uint16_t>(name.size()));
    test_util::put_le16(zip, 0);                        // extra length
    test_util::put_text(zip, name);
    zip.insert(zip.end(), stored.begin(), stored.end());

    if (streamed) {
        test_util::put_le32(zip, 0x08074B50);
        test_util::put_le32(zip, crc);
        test_util::put_le32(zip, static_cast<std::uint32_t>(stored.size()));
        test_util::put_le32(zip, static_cast<std::uint32_t>(content.size()));
    }
}

void add_central_directory_stub(std::vector<std::uint8_t>& zip) {
    test_util::put_le32(zip, 0x02014B50);
    zip.resize(zip.size() + 42, 0);
}

const std::vector<std::uint8_t> TEXT = test_util::bytes_of(
    "APPLE II FOREVER. APPLE II FOREVER. APPLE II FOREVER.\r");

} // namespace

TEST_CASE("zip: DOS date and time") {
    const auto dt = a2decode::decode_dos_date_time(DOS_DATE, DOS_TIME);
    REQUIRE(dt.has_value());
    CHECK(dt->year == 2024);
    CHECK(dt->month == 3);
    CHECK(dt->day == 15);
    CHECK(dt->hour == 13);
    CHECK(dt->minute == 45);
    CHECK(dt->second == 30);

    CHECK_FALSE(a2decode::decode_dos_date_time(0, 0).has_value());
}

TEST_CASE("zip: list and extract") {
    std::vector<std::uint8_t> zip;
    add_entry(zip, "DISKS/", {}, 0);
    add_entry(zip, "DISKS/README.TXT", TEXT, 0);
    add_entry(zip, "DISKS/PACKED.TXT", TEXT, 8);
    add_entry(zip, "DISKS/STREAMED.TXT", TEXT, 8, true);
    add_central_directory_stub(zip);

    CHECK(a2decode::zip_reader::sniff(zip));

    std::vector<a2decode::zip_entry> entries;
    REQUIRE(a2decode::zip_reader::list(zip, entries));
    REQUIRE(entries.size() == 4);

    CHECK(entries[0].is_directory());
    CHECK(entries[0].uncompressed_size == 0);
    CHECK(entries[1].filename == "DISKS/README.TXT");
    CHECK(entries[1].method == a2decode::zip_reader::METHOD_STORED);
    REQUIRE(entries[1].modified.has_value());
    CHECK(entries[1].modified->year == 2024);
    CHECK(entries[2].method == a2decode::zip_reader::METHOD_DEFLATE);
    CHECK(entries[3].uncompressed_size == TEXT.size());
    CHECK(entries[3].crc32 == a2decode::crc32(TEXT));

    for (std::size_t i = 1; i < entries.size(); ++i) {
        CAPTURE(entries[i].filename);
        std::vector<std::uint8_t> out;
        REQUIRE(a2decode::zip_reader::extract(zip, entries[i], out));
        CHECK(out == TEXT);
    }
}

TEST_CASE("zip: extraction failures") {
    std::vector<std::uint8_t> zip;
    add_entry(zip, "A.TXT", TEXT, 0);

    std::vector<a2decode::zip_entry> entries;
    REQUIRE(a2decode::zip_reader::list(zip, entries));
    REQUIRE(entries.size() == 1);
    std::vector<std::uint8_t> out;

    SUBCASE("unsupported method fails only at extraction") {
        auto entry = entries[0];
        entry.method = 12;  // bzip2
        const auto result = a2decode::zip_reader::extract(zip, entry, out);
        CHECK(result.error == a2decode::decode_error::unsupported_method);
    }

    SUBCASE("CRC mismatch") {
        auto entry = entries[0];
        entry.crc32 ^= 1;
        CHECK(a2decode::zip_reader::extract(zip, entry, out).error == a2decode::decode_error::inflate_failed);
    }

    SUBCASE("data past the end") {
        auto entry = entries[0];
        entry.compressed_size = 4096;
        entry.uncompressed_size = 4096;
        CHECK(a2decode::zip_reader::extract(zip, entry, out).error == a2decode::decode_error::out_of_bounds);
    }

    CHECK(out.empty());
}

TEST_CASE("zip: not an archive") {
    std::vector<a2decode::zip_entry> entries;
    const auto data = test_util::bytes_of("NOT A ZIP");
    CHECK_FALSE(a2decode::zip_reader::sniff(data));
    CHECK(a2decode::zip_reader::list(data, entries).error == a2decode::decode_error::unrecognized_format);

    SUBCASE("truncated first header") {
        const std::vector<std::uint8_t> stub = {'P', 'K', 3, 4, 20, 0};
        CHECK(a2decode::zip_reader::list(stub, entries).error == a2decode::decode_error::too_short);
    }
}

TEST_CASE("zip: every prefix and repeat decodes") {
    std::vector<std::uint8_t> zip;
    add_entry(zip, "DISKS/README.TXT", TEXT, 0);
    add_entry(zip, "DISKS/PACKED.TXT", TEXT, 8);
    add_entry(zip, "DISKS/STREAMED.TXT", TEXT, 8, true);
    add_central_directory_stub(zip);

    std::vector<a2decode::zip_entry> full;
    REQUIRE(a2decode::zip_reader::list(zip, full));
    REQUIRE(full.size() == 3);

    const std::vector<a2decode::zip_entry> untouched(1);
    for (const std::size_t size : test_util::prefix_lengths(zip.size())) {
        CAPTURE(size);
        const std::span<const std::uint8_t> prefix(zip.data(), size);

        std::vector<a2decode::zip_entry> entries = untouched;
        if (!a2decode::zip_reader::list(prefix, entries)) {
            CHECK(entries == untouched);
        }

        // Entries read from the whole archive never reach past a shorter buffer
        for (const auto& entry : full) {
            std::vector<std::uint8_t> out = {0xEE};
            if (!a2decode::zip_reader::extract(prefix, entry, out)) {
                CHECK(out == std::vector<std::uint8_t>{0xEE});
            }
        }
    }

    std::vector<a2decode::zip_entry> again;
    REQUIRE(a2decode::zip_reader::list(zip, again));
    REQUIRE(a2decode::zip_reader::list(zip, again));
    CHECK(again == full);
}
