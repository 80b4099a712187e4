#include <doctest/doctest.h>
#include <a2decode/classify.hpp>
#include <a2decode/document/appleworks.hpp>
#include <a2decode/document/resource_fork.hpp>
#include <a2decode/catalog/file_types.hpp>

#include "test_helpers.hpp"

#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace {

constexpr std::uint16_t FAMILY_TIMES = 0x0014;
constexpr std::uint8_t QD_BOLD = 0x01;
constexpr std::uint8_t QD_ITALIC = 0x02;

// Resource fork holding one resource, with a terminated index
std::vector<std::uint8_t> make_fork(std::uint16_t type, std::uint32_t id,
                                    const std::vector<std::uint8_t>& resource) {
    std::vector<std::uint8_t> fork(12 + 128, 0);
    const std::size_t map = fork.size();
    const std::size_t index = map + 0x20;
    fork.resize(index + 2 * 0x14, 0);
    const std::size_t data = fork.size();

    test_util::set_le32(fork, 0x04, static_cast<std::uint32_t>(map));
    test_util::set_le32(fork, 0x08, static_cast<std::uint32_t>(data - map));
    test_util::set_le16(fork, map + 0x0E, 0x20);
    test_util::set_le32(fork, map + 0x14, 2);
    test_util::set_le32(fork, map + 0x18, 1);

    test_util::set_le16(fork, index + 0x00, type);
    test_util::set_le32(fork, index + 0x02, id);
    test_util::set_le32(fork, index + 0x06, static_cast<std::uint32_t>(data));
    test_util::set_le32(fork, index + 0x0C, static_cast<std::uint32_t>(resource.size()));

    fork.insert(fork.end(), resource.begin(), resource.end());
    return fork;
}

struct te_style {
    std::uint16_t family = FAMILY_TIMES;
    std::uint8_t bits = 0;
    std::uint8_t size = 12;
    std::uint16_t foreground = 0;
};

// (length, byte offset into the TEStyle list)
using item = std::pair<std::uint32_t, std::uint32_t>;

std::vector<std::uint8_t> make_style_block(std::uint16_t justification,
                                           const std::vector<te_style>& styles,
                                           const std::vector<item>& items) {
    std::vector<std::uint8_t> out;
    test_util::put_le16(out, 0);             // version

    test_util::put_le32(out, 20);            // ruler with regular tabs
    const std::size_t ruler = out.size();
    out.resize(ruler + 20, 0);
    test_util::set_le16(out, ruler + 6, justification);
    test_util::set_le16(out, ruler + 16, 1);
    test_util::set_le16(out, ruler + 18, 64);

    test_util::put_le32(out, static_cast<std::uint32_t>(styles.size() * 12));
    for (const auto& s : styles) {
        test_util::put_le32(out, s.family | (std::uint32_t{s.bits} << 16) | (std::uint32_t{s.size} << 24));
        test_util::put_le16(out, s.foreground);
        test_util::put_le16(out, 0xFFFF);
        test_util::put_le32(out, 0);
    }

    test_util::put_le32(out, static_cast<std::uint32_t>(items.size()));
    for (const auto& [length, offset] : items) {
        test_util::put_le32(out, length);
        test_util::put_le32(out, offset);
    }
    return out;
}

// "Hello bold world\rCafé\r" in MacRoman
std::vector<std::uint8_t> sample_text() {
    auto text = test_util::bytes_of("Hello bold world\rCaf");
    text.push_back(0x8E);
    text.push_back('\r');
    return text;
}

std::vector<std::uint8_t> sample_fork() {
    const auto block = make_style_block(0x0001,
        {{FAMILY_TIMES, 0, 12}, {FAMILY_TIMES, QD_BOLD, 12, 0x0F00}},
        {{6, 0}, {4, 12}, {0xFFFFFFFF, 0}, {12, 0}});
    return make_fork(a2decode::resource_type::STYLE_BLOCK, 1, block);
}

} // namespace

TEST_CASE("Resource fork: lookup") {
    const std::vector<std::uint8_t> payload = {1, 2, 3, 4};
    const auto fork = make_fork(0x8012, 1, payload);

    std::span<const std::uint8_t> found;
    REQUIRE(a2decode::find_iigs_resource(fork, 0x8012, 1, found));
    CHECK(std::vector<std::uint8_t>(found.begin(), found.end()) == payload);

    CHECK(a2decode::find_iigs_resource(fork, 0x8012, 2, found).error ==
          a2decode::decode_error::unrecognized_format);
    CHECK(a2decode::find_iigs_resource(fork, 0x8006, 1, found).error ==
          a2decode::decode_error::unrecognized_format);

    SUBCASE("Macintosh fork") {
        auto mac = fork;
        mac[3] = 0x01;
        CHECK(a2decode::find_iigs_resource(mac, 0x8012, 1, found).error ==
              a2decode::decode_error::unrecognized_format);
    }

    SUBCASE("bad map and data offsets") {
        auto bad = fork;
        test_util::set_le32(bad, 0x04, 0x10000);
        CHECK(a2decode::find_iigs_resource(bad, 0x8012, 1, found).error ==
              a2decode::decode_error::malformed_header);

        bad = fork;
        test_util::set_le32(bad, 12 + 128 + 0x20 + 0x0C, 1000);
        CHECK(a2decode::find_iigs_resource(bad, 0x8012, 1, found).error ==
              a2decode::decode_error::out_of_bounds);
    }

    SUBCASE("short fork") {
        const std::vector<std::uint8_t> tiny(64, 0);
        CHECK(a2decode::find_iigs_resource(tiny, 0x8012, 1, found).error ==
              a2decode::decode_error::too_short);
    }
}

TEST_CASE("Teach: styled text") {
    a2decode::teach_doc doc;
    REQUIRE(a2decode::teach_decoder::decode(sample_text(), sample_fork(), doc));
    CHECK(doc.styled);
    REQUIRE(doc.lines.size() == 2);

    const auto& first = doc.lines[0];
    CHECK(first.alignment == a2decode::paragraph_alignment::center);
    REQUIRE(first.runs.size() == 3);
    CHECK(first.runs[0].text == "Hello ");
    CHECK_FALSE(first.runs[0].style.bold);
    CHECK(first.runs[0].font_family == FAMILY_TIMES);
    CHECK(first.runs[0].point_size == 12);
    CHECK(first.runs[1].text == "bold");
    CHECK(first.runs[1].style.bold);
    CHECK(first.runs[1].foreground == 0x0F00);
    CHECK(first.runs[2].text == " world");

    CHECK(doc.lines[1].text() == "Caf\xC3\xA9");
    CHECK(a2decode::plain_text(a2decode::appleworks_document{doc}) == "Hello bold world\nCaf\xC3\xA9");
}

TEST_CASE("Teach: style coverage") {
    SUBCASE("text past the last item keeps the last style") {
        const auto block = make_style_block(0, {{FAMILY_TIMES, QD_ITALIC, 10}}, {{3, 0}});
        a2decode::teach_doc doc;
        REQUIRE(a2decode::teach_decoder::decode(test_util::bytes_of("abcdef"),
                                                make_fork(0x8012, 1, block), doc));
        REQUIRE(doc.lines.size() == 1);
        REQUIRE(doc.lines[0].runs.size() == 1);
        CHECK(doc.lines[0].runs[0].text == "abcdef");
        CHECK(doc.lines[0].runs[0].style.italic);
        CHECK(doc.lines[0].runs[0].point_size == 10);
    }

    SUBCASE("items longer than the text are clamped") {
        const auto block = make_style_block(0, {{}}, {{100, 0}, {100, 0}});
        a2decode::teach_doc doc;
        REQUIRE(a2decode::teach_decoder::decode(test_util::bytes_of("short"),
                                                make_fork(0x8012, 1, block), doc));
        REQUIRE(doc.lines.size() == 1);
        CHECK(doc.lines[0].text() == "short");
    }

    SUBCASE("tabs and CR LF") {
        a2decode::teach_doc doc;
        REQUIRE(a2decode::teach_decoder::decode(test_util::bytes_of("A\tB\r\nC"), {}, doc));
        REQUIRE(doc.lines.size() == 2);
        CHECK(doc.lines[0].text() == "A\tB");
        CHECK(doc.lines[1].text() == "C");
    }
}

TEST_CASE("Teach: unstyled fallbacks") {
    const auto text = sample_text();

    SUBCASE("no resource fork") {
        a2decode::teach_doc doc;
        REQUIRE(a2decode::teach_decoder::decode(text, {}, doc));
        CHECK_FALSE(doc.styled);
        REQUIRE(doc.lines.size() == 2);
        REQUIRE(doc.lines[0].runs.size() == 1);
        CHECK(doc.lines[0].runs[0] == a2decode::teach_run{"Hello bold world"});
        CHECK(doc.lines[0].alignment == a2decode::paragraph_alignment::left);
    }

    SUBCASE("fork without a style block") {
        a2decode::teach_doc doc;
        REQUIRE(a2decode::teach_decoder::decode(text, make_fork(0x8006, 1, {0, 0}), doc));
        CHECK_FALSE(doc.styled);
        CHECK(doc.lines.size() == 2);
    }

    SUBCASE("empty data fork") {
        a2decode::teach_doc doc;
        REQUIRE(a2decode::teach_decoder::decode({}, sample_fork(), doc));
        CHECK(doc.lines.empty());
    }
}

TEST_CASE("Teach: malformed style blocks") {
    const auto text = sample_text();
    a2decode::teach_doc doc;
    doc.styled = true;
    const a2decode::teach_doc untouched = doc;

    const auto check_corrupt = [&](const std::vector<std::uint8_t>& block) {
        CHECK(a2decode::teach_decoder::decode(text, make_fork(0x8012, 1, block), doc).error ==
              a2decode::decode_error::corrupt_document);
        CHECK(doc == untouched);
    };

    SUBCASE("offset off a TEStyle boundary") {
        check_corrupt(make_style_block(0, {{}, {}}, {{4, 6}}));
    }

    SUBCASE("offset past the TEStyle list") {
        check_corrupt(make_style_block(0, {{}}, {{4, 24}}));
    }

    SUBCASE("unknown version") {
        auto block = make_style_block(0, {{}}, {{4, 0}});
        block[0] = 1;
        check_corrupt(block);
    }

    SUBCASE("item count larger than the block") {
        auto block = make_style_block(0, {{}}, {{4, 0}});
        test_util::set_le32(block, block.size() - 12, 50);
        check_corrupt(block);
    }

    SUBCASE("TEStyle list length not a multiple of 12") {
        auto block = make_style_block(0, {{}}, {{4, 0}});
        test_util::set_le32(block, 2 + 4 + 20, 10);
        check_corrupt(block);
    }

    SUBCASE("truncated block") {
        check_corrupt({0x00});
    }
}

TEST_CASE("Teach: dispatch and classification") {
    namespace pt = a2decode::prodos_type;
    const auto text = sample_text();

    CHECK(a2decode::is_appleworks_type(pt::GWP, a2decode::teach_decoder::AUX_TYPE));
    CHECK(a2decode::classify(pt::GWP, a2decode::teach_decoder::AUX_TYPE, text) ==
          a2decode::content_kind::teach);
    CHECK(a2decode::classify(pt::GWP, a2decode::GWP_AUX_TYPE, text) ==
          a2decode::content_kind::appleworks_gs_wp);

    a2decode::appleworks_document doc;
    REQUIRE(a2decode::decode_document(text, pt::GWP, a2decode::teach_decoder::AUX_TYPE, doc, sample_fork()));
    REQUIRE(std::holds_alternative<a2decode::teach_doc>(doc));
    CHECK(std::get<a2decode::teach_doc>(doc).styled);
    CHECK(a2decode::plain_text(doc) == "Hello bold world\nCaf\xC3\xA9");

    // Data fork alone
    REQUIRE(a2decode::decode_document(text, pt::GWP, a2decode::teach_decoder::AUX_TYPE, doc));
    CHECK_FALSE(std::get<a2decode::teach_doc>(doc).styled);
}

TEST_CASE("Teach: truncated forks and repeat decodes") {
    const auto text = sample_text();
    const auto fork = sample_fork();

    a2decode::teach_doc marker;
    marker.lines.push_back({{a2decode::teach_run{"unchanged"}}});
    const a2decode::teach_doc untouched = marker;

    SUBCASE("data fork prefixes") {
        for (const std::size_t size : test_util::prefix_lengths(text.size())) {
            CAPTURE(size);
            a2decode::teach_doc doc;
            REQUIRE(a2decode::teach_decoder::decode(std::span<const std::uint8_t>(text.data(), size), fork, doc));
            CHECK(doc.styled);
        }
    }

    SUBCASE("resource fork prefixes") {
        for (const std::size_t size : test_util::prefix_lengths(fork.size())) {
            CAPTURE(size);
            a2decode::teach_doc doc = untouched;
            const auto result = a2decode::teach_decoder::decode(
                text, std::span<const std::uint8_t>(fork.data(), size), doc);
            if (!result) {
                CHECK(doc == untouched);
            }
        }
    }

    SUBCASE("same input twice") {
        a2decode::teach_doc first;
        a2decode::teach_doc second;
        REQUIRE(a2decode::teach_decoder::decode(text, fork, first));
        REQUIRE(a2decode::teach_decoder::decode(text, fork, second));
        CHECK(first == second);
        REQUIRE(a2decode::teach_decoder::decode(text, fork, first));
        CHECK(first == second);
    }
}
