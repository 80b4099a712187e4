#include <doctest/doctest.h>
#include <a2decode/catalog/catalog.hpp>
#include <a2decode/catalog/file_types.hpp>
#include <a2decode/catalog/prodos.hpp>

#include "test_helpers.hpp"

#include <algorithm>
#include <string>
#include <span>
#include <string_view>
#include <vector>

namespace {

constexpr std::size_t BLOCK = 512;
constexpr std::size_t ENTRY_LENGTH = 0x27;
constexpr std::size_t ENTRIES_PER_BLOCK = 0x0D;

// 2024-03-15 13:45
constexpr std::uint16_t DATE_2024 = (24 << 9) | (3 << 5) | 15;
constexpr std::uint16_t TIME_1345 = (13 << 8) | 45;

class prodos_image_builder {
public:
    explicit prodos_image_builder(std::size_t blocks = 280)
        : image_(blocks * BLOCK, 0) {}

    // Directory key block with its header in entry slot 0
    void directory(std::size_t block, std::uint8_t storage, std::string_view name,
                   std::size_t next = 0) {
        std::uint8_t* b = at(block);
        test_util::set_le16(image_, block * BLOCK + 2, static_cast<std::uint16_t>(next));
        b[4] = static_cast<std::uint8_t>((storage << 4) | name.size());
        for (std::size_t i = 0; i < name.size(); ++i) {
            b[5 + i] = static_cast<std::uint8_t>(name[i]);
        }
        test_util::set_le16(image_, block * BLOCK + 0x1C, DATE_2024);
        test_util::set_le16(image_, block * BLOCK + 0x1E, TIME_1345);
        b[0x23] = ENTRY_LENGTH;
        b[0x24] = ENTRIES_PER_BLOCK;
        test_util::set_le16(image_, block * BLOCK + 0x29, static_cast<std::uint16_t>(image_.size() / BLOCK));
    }

    struct file_layout {
        std::string_view name;
        std::uint8_t storage = 1;
        std::uint8_t type = 0x04;
        std::uint16_t key = 0;
        std::uint16_t blocks = 1;
        std::uint32_t eof = 0;
        std::uint16_t aux = 0;
        std::uint8_t access = 0xC3;
        std::uint16_t case_bits = 0;
    };

    void entry(std::size_t dir_block, std::size_t slot, const file_layout& f) {
        const std::size_t off = dir_block * BLOCK + 4 + slot * ENTRY_LENGTH;
        std::uint8_t* e = image_.data() + off;
        e[0x00] = static_cast<std::uint8_t>((f.storage << 4) | f.name.size());
        for (std::size_t i = 0; i < f.name.size(); ++i) {
            e[0x01 + i] = static_cast<std::uint8_t>(f.name[i]);
        }
        e[0x10] = f.type;
        test_util::set_le16(image_, off + 0x11, f.key);
        test_util::set_le16(image_, off + 0x13, f.blocks);
        e[0x15] = static_cast<std::uint8_t>(f.eof & 0xFF);
        e[0x16] = static_cast<std::uint8_t>((f.eof >> 8) & 0xFF);
        e[0x17] = static_cast<std::uint8_t>((f.eof >> 16) & 0xFF);
        test_util::set_le16(image_, off + 0x18, DATE_2024);
        test_util::set_le16(image_, off + 0x1A, TIME_1345);
        test_util::set_le16(image_, off + 0x1C, f.case_bits);
        e[0x1E] = f.access;
        test_util::set_le16(image_, off + 0x1F, f.aux);
        test_util::set_le16(image_, off + 0x21, DATE_2024);
        test_util::set_le16(image_, off + 0x23, TIME_1345);
        test_util::set_le16(image_, off + 0x25, static_cast<std::uint16_t>(dir_block));
    }

    void fill(std::size_t block, std::string_view text) {
        std::copy(text.begin(), text.end(), at(block));
    }

    void fill_byte(std::size_t block, std::uint8_t value) {
        std::fill(at(block), at(block) + BLOCK, value);
    }

    void index_block(std::size_t block, const std::vector<std::uint16_t>& pointers) {
        for (std::size_t i = 0; i < pointers.size(); ++i) {
            at(block)[i] = static_cast<std::uint8_t>(pointers[i] & 0xFF);
            at(block)[256 + i] = static_cast<std::uint8_t>(pointers[i] >> 8);
        }
    }

    void set_next(std::size_t block, std::size_t next) {
        test_util::set_le16(image_, block * BLOCK + 2, static_cast<std::uint16_t>(next));
    }

    std::uint8_t* at(std::size_t block) { return image_.data() + block * BLOCK; }
    std::vector<std::uint8_t>& bytes() { return image_; }

private:
    std::vector<std::uint8_t> image_;
};

// Volume with a seedling, a sparse sapling and a subdirectory
prodos_image_builder sample_volume() {
    prodos_image_builder img;
    img.directory(2, 0xF, "TEST.DISK");

    img.entry(2, 1, {.name = "HELLO", .type = 0x04, .key = 10, .eof = 5,
                     .case_bits = 0xBC00});
    img.fill(10, "HELLO");

    img.entry(2, 2, {.name = "SPARSE", .storage = 2, .type = 0x06, .key = 11, .blocks = 3,
                     .eof = 1200, .aux = 0x2000, .access = 0x01});
    img.index_block(11, {12, 0, 13});
    img.fill_byte(12, 0xAA);
    img.fill_byte(13, 0xBB);

    img.entry(2, 3, {.name = "SUB", .storage = 0xD, .type = 0x0F, .key = 20});
    img.directory(20, 0xE, "SUB");
    img.entry(20, 1, {.name = "INNER", .type = 0x06, .key = 21, .eof = 3, .aux = 0x0803});
    img.fill(21, "ABC");

    return img;
}

} // namespace

TEST_CASE("ProDOS: dates and names") {
    const auto dt = a2decode::decode_prodos_date(DATE_2024, TIME_1345);
    REQUIRE(dt.has_value());
    CHECK(dt->year == 2024);
    CHECK(dt->month == 3);
    CHECK(dt->day == 15);
    CHECK(dt->hour == 13);
    CHECK(dt->minute == 45);

    const auto old = a2decode::decode_prodos_date((85 << 9) | (12 << 5) | 1, 0);
    REQUIRE(old.has_value());
    CHECK(old->year == 1985);

    CHECK_FALSE(a2decode::decode_prodos_date(0, 0).has_value());
    CHECK_FALSE(a2decode::decode_prodos_date((24 << 9) | (13 << 5) | 1, 0).has_value());

    CHECK(a2decode::apply_case_bits("HELLO", 0xBC00) == "Hello");
    CHECK(a2decode::apply_case_bits("HELLO", 0x3C00) == "HELLO");
}

TEST_CASE("ProDOS: catalog walk") {
    auto img = sample_volume();

    a2decode::disk_catalog catalog;
    const auto result = a2decode::walk_catalog(img.bytes(), catalog);
    REQUIRE(result);

    CHECK(catalog.filesystem == a2decode::filesystem_kind::prodos);
    CHECK(catalog.volume_name == "TEST.DISK");
    CHECK(catalog.order == a2decode::sector_order::prodos);
    CHECK(catalog.total_blocks == 280);
    CHECK(catalog.file_count() == 3);
    CHECK(catalog.directory_count() == 1);
    REQUIRE(catalog.entries.size() == 3);

    SUBCASE("seedling") {
        const auto& hello = catalog.entries[0];
        CHECK(hello.name == "Hello");
        CHECK(hello.type_label == "TXT");
        CHECK(hello.size == 5);
        CHECK(hello.content.bytes() == test_util::bytes_of("HELLO"));
        REQUIRE(hello.modified.has_value());
        CHECK(hello.modified->year == 2024);
        CHECK_FALSE(hello.locked);
        REQUIRE(hello.prodos.has_value());
        CHECK(hello.prodos->storage_type == 1);
        CHECK(hello.prodos->key_block == 10);
        CHECK(hello.is_leaf());
    }

    SUBCASE("sparse sapling") {
        const auto& sparse = catalog.entries[1];
        CHECK(sparse.type_label == "BIN");
        CHECK(sparse.load_address == 0x2000);
        CHECK(sparse.locked);

        const auto bytes = sparse.content.bytes();
        REQUIRE(bytes.size() == 1200);
        CHECK(bytes[0] == 0xAA);
        CHECK(bytes[511] == 0xAA);
        CHECK(bytes[512] == 0x00);
        CHECK(bytes[1023] == 0x00);
        CHECK(bytes[1024] == 0xBB);
        CHECK(bytes[1199] == 0xBB);
        CHECK_FALSE(sparse.content.contiguous_view().has_value());
    }

    SUBCASE("subdirectory") {
        const auto& sub = catalog.entries[2];
        CHECK(sub.is_directory);
        REQUIRE(sub.children.size() == 1);
        const auto& inner = sub.children[0];
        CHECK(inner.name == "INNER");
        CHECK(inner.load_address == 0x0803);
        CHECK(inner.content.bytes() == test_util::bytes_of("ABC"));
        REQUIRE(inner.prodos.has_value());
        CHECK(inner.prodos->header_block == 20);
    }
}

TEST_CASE("ProDOS: DOS-ordered image") {
    auto img = sample_volume();
    const auto& prodos = img.bytes();

    // Re-interleave every block into DOS 3.3 logical sector order
    constexpr std::size_t HALF_TO_SECTOR[16] = {0, 14, 13, 12, 11, 10, 9, 8, 7, 6, 5, 4, 3, 2, 1, 15};
    std::vector<std::uint8_t> dos(prodos.size(), 0);
    for (std::size_t block = 0; block < prodos.size() / BLOCK; ++block) {
        const std::size_t track = block / 8;
        for (std::size_t half = 0; half < 2; ++half) {
            const std::size_t sector = HALF_TO_SECTOR[(block % 8) * 2 + half];
            std::copy_n(prodos.begin() + static_cast<std::ptrdiff_t>(block * BLOCK + half * 256), 256,
                        dos.begin() + static_cast<std::ptrdiff_t>(track * 4096 + sector * 256));
        }
    }

    a2decode::disk_catalog catalog;
    REQUIRE(a2decode::walk_catalog(dos, catalog));
    CHECK(catalog.order == a2decode::sector_order::dos);
    CHECK(catalog.volume_name == "TEST.DISK");
    REQUIRE(catalog.entries.size() == 3);
    CHECK(catalog.entries[1].content.bytes()[1024] == 0xBB);
}

TEST_CASE("ProDOS: directory cycles") {
    SUBCASE("volume directory chain loops") {
        auto img = sample_volume();
        img.set_next(2, 2);

        a2decode::disk_catalog catalog;
        const auto result = a2decode::walk_catalog(img.bytes(), catalog);
        CHECK(result.error == a2decode::decode_error::circular_directory);
        CHECK(catalog.entries.empty());
    }

    SUBCASE("subdirectory points at its parent") {
        prodos_image_builder img;
        img.directory(2, 0xF, "LOOP");
        img.entry(2, 1, {.name = "SELF", .storage = 0xD, .type = 0x0F, .key = 2});

        a2decode::disk_catalog catalog;
        const auto result = a2decode::walk_catalog(img.bytes(), catalog);
        CHECK(result.error == a2decode::decode_error::circular_directory);
    }
}

TEST_CASE("ProDOS: malformed subdirectory becomes an empty node") {
    auto img = sample_volume();
    img.entry(2, 4, {.name = "BROKEN", .storage = 0xD, .type = 0x0F, .key = 40});
    img.entry(2, 5, {.name = "AFTER", .type = 0x04, .key = 10, .eof = 5});

    a2decode::disk_catalog catalog;
    REQUIRE(a2decode::walk_catalog(img.bytes(), catalog));
    REQUIRE(catalog.entries.size() == 5);
    CHECK(catalog.entries[3].name == "BROKEN");
    CHECK(catalog.entries[3].is_directory);
    CHECK(catalog.entries[3].children.empty());
    CHECK(catalog.entries[4].name == "AFTER");
}

TEST_CASE("ProDOS: unrecognized image") {
    std::vector<std::uint8_t> blank(143360, 0);
    a2decode::disk_catalog catalog;
    CHECK(a2decode::walk_catalog(blank, catalog).error == a2decode::decode_error::unrecognized_format);

    std::vector<std::uint8_t> tiny(100, 0);
    CHECK(a2decode::walk_catalog(tiny, catalog).error == a2decode::decode_error::too_short);
}

TEST_CASE("ProDOS: GS/OS lowercase flags") {
    SUBCASE("file entry flags are little-endian") {
        auto img = sample_volume();
        const std::size_t off = 2 * BLOCK + 4 + 1 * ENTRY_LENGTH;
        img.bytes()[off + 0x1C] = 0x00;
        img.bytes()[off + 0x1D] = 0xBC;

        a2decode::disk_catalog catalog;
        REQUIRE(a2decode::walk_catalog(img.bytes(), catalog));
        CHECK(catalog.entries[0].name == "Hello");
        REQUIRE(catalog.entries[0].prodos.has_value());
        CHECK(catalog.entries[0].prodos->version == 0x00);
        CHECK(catalog.entries[0].prodos->min_version == 0xBC);
    }

    SUBCASE("volume name flags") {
        auto img = sample_volume();
        test_util::set_le16(img.bytes(), 2 * BLOCK + 0x1A, 0xB9C0);

        a2decode::disk_catalog catalog;
        REQUIRE(a2decode::walk_catalog(img.bytes(), catalog));
        CHECK(catalog.volume_name == "Test.Disk");
    }

    SUBCASE("flags without the enable bit are ignored") {
        auto img = sample_volume();
        test_util::set_le16(img.bytes(), 2 * BLOCK + 0x1A, 0x39C0);

        a2decode::disk_catalog catalog;
        REQUIRE(a2decode::walk_catalog(img.bytes(), catalog));
        CHECK(catalog.volume_name == "TEST.DISK");
    }
}

TEST_CASE("ProDOS: directory nesting limit") {
    // Each level holds a single subdirectory in the next block
    const auto nested = [](std::size_t levels) {
        prodos_image_builder img;
        img.directory(2, 0xF, "DEEP");
        img.entry(2, 1, {.name = "D", .storage = 0xD, .type = 0x0F, .key = 10});
        for (std::size_t i = 0; i < levels; ++i) {
            const std::size_t block = 10 + i;
            img.directory(block, 0xE, "D");
            if (i + 1 < levels) {
                img.entry(block, 1, {.name = "D", .storage = 0xD, .type = 0x0F,
                                     .key = static_cast<std::uint16_t>(block + 1)});
            }
        }
        return img;
    };

    SUBCASE("64 levels walk") {
        auto img = nested(64);
        a2decode::disk_catalog catalog;
        REQUIRE(a2decode::walk_catalog(img.bytes(), catalog));
        CHECK(catalog.directory_count() == 64);
    }

    SUBCASE("deeper trees are reported") {
        auto img = nested(70);
        a2decode::disk_catalog catalog;
        CHECK(a2decode::walk_catalog(img.bytes(), catalog).error ==
              a2decode::decode_error::corrupt_catalog);
        CHECK(catalog.entries.empty());
    }
}

TEST_CASE("ProDOS: extended file forks") {
    auto img = sample_volume();
    img.entry(2, 4, {.name = "LETTER", .storage = 5, .type = 0x50, .key = 30, .blocks = 3,
                     .eof = 512, .aux = 0x5445});

    // Key block: data fork mini-entry at +0, resource fork at +$100
    std::uint8_t* ext = img.at(30);
    ext[0x00] = 1;
    test_util::set_le16(img.bytes(), 30 * BLOCK + 0x01, 31);
    test_util::set_le16(img.bytes(), 30 * BLOCK + 0x03, 1);
    ext[0x05] = 11;
    ext[0x100] = 1;
    test_util::set_le16(img.bytes(), 30 * BLOCK + 0x101, 32);
    test_util::set_le16(img.bytes(), 30 * BLOCK + 0x103, 1);
    ext[0x105] = 4;
    img.fill(31, "Dear reader");
    img.fill(32, "RSRC");

    a2decode::disk_catalog catalog;
    REQUIRE(a2decode::walk_catalog(img.bytes(), catalog));
    REQUIRE(catalog.entries.size() == 4);
    const auto& letter = catalog.entries[3];
    CHECK(letter.name == "LETTER");
    CHECK(letter.size == 11);
    CHECK(letter.content.bytes() == test_util::bytes_of("Dear reader"));
    CHECK(letter.resource.bytes() == test_util::bytes_of("RSRC"));

    CHECK(catalog.entries[0].resource.empty());
}

TEST_CASE("ProDOS: every prefix and repeat walks") {
    const std::vector<std::uint8_t> image = sample_volume().bytes();

    for (const std::size_t size : test_util::prefix_lengths(image.size(), 509, 2048)) {
        CAPTURE(size);
        a2decode::disk_catalog catalog;
        catalog.volume_name = "unchanged";
        const auto result = a2decode::walk_catalog(std::span<const std::uint8_t>(image.data(), size), catalog);
        if (!result) {
            CHECK(catalog.volume_name == "unchanged");
            CHECK(catalog.entries.empty());
            continue;
        }
        for (const auto& entry : catalog.entries) {
            CHECK(entry.content.bytes().size() == entry.content.size());
        }
    }

    const auto shared = a2decode::make_shared_bytes(image);
    a2decode::disk_catalog first;
    a2decode::disk_catalog second;
    REQUIRE(a2decode::walk_catalog(shared, first));
    REQUIRE(a2decode::walk_catalog(shared, second));
    REQUIRE(a2decode::walk_catalog(shared, first));
    CHECK(first == second);
}
