#include <doctest/doctest.h>
#include <a2decode/document/appleworks.hpp>
#include <a2decode/catalog/file_types.hpp>

#include "test_helpers.hpp"

#include <algorithm>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace {

// ----------------------------------------------------------------------------
// Word processor
// ----------------------------------------------------------------------------

std::vector<std::uint8_t> wp_header() {
    std::vector<std::uint8_t> out(a2decode::appleworks_wp_decoder::HEADER_SIZE, 0);
    out[a2decode::appleworks_wp_decoder::SIGNATURE_OFFSET] = a2decode::appleworks_wp_decoder::SIGNATURE;
    return out;
}

void wp_text(std::vector<std::uint8_t>& out, const std::vector<std::uint8_t>& text) {
    out.push_back(static_cast<std::uint8_t>(text.size() + 2));
    out.push_back(0x00);
    out.push_back(0x00);   // tab stop byte
    out.push_back(static_cast<std::uint8_t>(text.size() | 0x80));
    out.insert(out.end(), text.begin(), text.end());
}

void wp_command(std::vector<std::uint8_t>& out, std::uint8_t code) {
    out.push_back(0x00);
    out.push_back(code);
}

void wp_end(std::vector<std::uint8_t>& out) {
    out.push_back(0xFF);
    out.push_back(0xFF);
}

std::vector<std::uint8_t> sample_wp() {
    auto doc = wp_header();

    // "Hello " then bold "world"
    auto first = test_util::bytes_of("Hello ");
    first.push_back(0x01);
    test_util::put_text(first, "world");
    first.push_back(0x02);
    wp_text(doc, first);

    wp_command(doc, 0xD0);

    // Ruler record, no text
    doc.push_back(4);
    doc.push_back(0x00);
    doc.insert(doc.end(), {0xFF, 0x00, 0x00, 0x00});

    wp_command(doc, 0xE1);
    wp_text(doc, test_util::bytes_of("Title"));
    wp_command(doc, 0xE9);
    wp_command(doc, 0xE0);
    wp_text(doc, {'a', 0x16, 'b', 0xE1, 0x0E});
    wp_end(doc);
    return doc;
}

// ----------------------------------------------------------------------------
// AppleWorks GS
// ----------------------------------------------------------------------------

std::vector<std::uint8_t> sample_gwp() {
    using gs = a2decode::appleworks_gs_decoder;
    std::vector<std::uint8_t> doc(gs::HEADER_SIZE + gs::GLOBALS_SIZE, 0);
    test_util::set_le16(doc, 0, gs::VERSION_1011);
    test_util::set_le16(doc, 2, gs::HEADER_SIZE);
    test_util::set_le16(doc, gs::PALETTE_OFFSET + 2, 0x0F00);

    // SaveArray: text, page break, text on ruler 1
    test_util::put_le16(doc, 3);
    const std::uint16_t attributes[3] = {0, 1, 0};
    const std::uint16_t rulers[3] = {0, 0, 1};
    for (int i = 0; i < 3; ++i) {
        std::vector<std::uint8_t> entry(12, 0);
        test_util::set_le16(entry, 4, attributes[i]);
        test_util::set_le16(entry, 6, rulers[i]);
        doc.insert(doc.end(), entry.begin(), entry.end());
    }

    std::vector<std::uint8_t> ruler(gs::RULER_SIZE, 0);
    doc.insert(doc.end(), ruler.begin(), ruler.end());
    test_util::set_le16(ruler, 2, 0x20);
    doc.insert(doc.end(), ruler.begin(), ruler.end());

    std::vector<std::uint8_t> text;
    // Paragraph 1: font $14, plain 12 point
    text.insert(text.end(), {0x14, 0x00, 0x00, 12, 0, 0, 0});
    test_util::put_text(text, "Plain ");
    text.insert(text.end(), {0x02, 0x01});
    test_util::put_text(text, "Bold");
    text.push_back(0x0D);
    // Paragraph 2: italic, default size, colour 1
    text.insert(text.end(), {0x16, 0x00, 0x02, 0, 1, 0, 0});
    test_util::put_text(text, "Red");
    text.push_back(0x8E);
    text.push_back(0x0D);

    test_util::put_le32(doc, static_cast<std::uint32_t>(text.size()));
    test_util::put_le32(doc, 0);
    doc.insert(doc.end(), text.begin(), text.end());
    return doc;
}

// ----------------------------------------------------------------------------
// Database
// ----------------------------------------------------------------------------

constexpr std::size_t DB_HEADER_LENGTH = 357 + 2 * 22;

std::vector<std::uint8_t> sample_db() {
    std::vector<std::uint8_t> doc(DB_HEADER_LENGTH, 0);
    test_util::set_le16(doc, 0, DB_HEADER_LENGTH);
    doc[35] = 2;
    test_util::set_le16(doc, 36, 0x8003);   // 3 records, 3.0 flag set
    doc[38] = 0;

    const auto put_category = [&](std::size_t index, std::string_view name) {
        const std::size_t slot = 357 + index * 22;
        doc[slot] = static_cast<std::uint8_t>(name.size());
        std::copy(name.begin(), name.end(), doc.begin() + static_cast<std::ptrdiff_t>(slot + 1));
    };
    put_category(0, "Name");
    put_category(1, "Dish");

    const auto put_record = [&](const std::vector<std::uint8_t>& record) {
        test_util::put_le16(doc, static_cast<std::uint16_t>(record.size()));
        doc.insert(doc.end(), record.begin(), record.end());
    };

    // Standard values
    put_record({0x01, 'x', 0xFF});

    put_record({5, 'A', 'p', 'p', 'l', 'e', 3, 'P', 'i', 'e', 0xFF});
    put_record({0x81, 3, 'T', 'w', 'o', 0xFF});
    put_record({6, 0xC0, '8', '5', 'C', '1', '5', 4, 0xD4, 'N', '3', '0', 0xFF});
    test_util::put_le16(doc, 0xFFFF);
    return doc;
}

// ----------------------------------------------------------------------------
// Spreadsheet
// ----------------------------------------------------------------------------

void ss_row(std::vector<std::uint8_t>& out, std::uint16_t row, const std::vector<std::uint8_t>& cells) {
    test_util::put_le16(out, static_cast<std::uint16_t>(cells.size() + 2));
    test_util::put_le16(out, row);
    out.insert(out.end(), cells.begin(), cells.end());
}

std::vector<std::uint8_t> sample_ss() {
    std::vector<std::uint8_t> doc(a2decode::appleworks_ss_decoder::HEADER_SIZE, 0);

    std::vector<std::uint8_t> row1 = {5, 0x00, 'I', 't', 'e', 'm'};
    // Constant 42.5
    row1.insert(row1.end(), {10, 0xA0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x40, 0x45, 0x40});
    // Formula with cached result 7
    row1.insert(row1.end(), {12, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x1C, 0x40, 0x00, 0x00});
    row1.push_back(0xFF);
    ss_row(doc, 1, row1);

    // Repeated label in column B
    ss_row(doc, 3, {0x81, 2, 0x20, '-', 0xFF});

    doc.push_back(0xFF);
    doc.push_back(0xFF);
    return doc;
}

} // namespace

TEST_CASE("AppleWorks WP: sniff") {
    CHECK(a2decode::appleworks_wp_decoder::sniff(sample_wp()));
    CHECK_FALSE(a2decode::appleworks_wp_decoder::sniff(std::vector<std::uint8_t>(299, 0)));

    auto bad = sample_wp();
    bad[4] = 0;
    CHECK_FALSE(a2decode::appleworks_wp_decoder::sniff(bad));
}

TEST_CASE("AppleWorks WP: lines, styles and alignment") {
    a2decode::word_processor_doc doc;
    REQUIRE(a2decode::appleworks_wp_decoder::decode(sample_wp(), doc));
    REQUIRE(doc.lines.size() == 5);

    SUBCASE("bold run") {
        const auto& line = doc.lines[0];
        REQUIRE(line.runs.size() == 2);
        CHECK(line.runs[0].text == "Hello ");
        CHECK_FALSE(line.runs[0].style.bold);
        CHECK(line.runs[1].text == "world");
        CHECK(line.runs[1].style.bold);
        CHECK(line.text() == "Hello world");
        CHECK(line.alignment == a2decode::paragraph_alignment::left);
    }

    SUBCASE("carriage return is an empty line") {
        CHECK(doc.lines[1].runs.empty());
        CHECK(doc.lines[1].text().empty());
    }

    SUBCASE("centered title") {
        CHECK(doc.lines[2].text() == "Title");
        CHECK(doc.lines[2].alignment == a2decode::paragraph_alignment::center);
    }

    SUBCASE("page break") {
        CHECK(doc.lines[3].page_break);
        REQUIRE(doc.lines[3].runs.size() == 1);
        CHECK(doc.lines[3].runs[0].text == "--- Page Break ---");
        CHECK(doc.lines[3].text().empty());
    }

    SUBCASE("inline controls and inverse characters") {
        CHECK(doc.lines[4].text() == "a\tba[DATE]");
        CHECK(doc.lines[4].alignment == a2decode::paragraph_alignment::left);
    }
}

TEST_CASE("AppleWorks WP: version 3 header extension") {
    auto doc = wp_header();
    doc[a2decode::appleworks_wp_decoder::MIN_VERSION_OFFSET] = 30;
    doc.insert(doc.end(), {0xAA, 0xAA});
    wp_text(doc, test_util::bytes_of("v3"));
    wp_end(doc);

    a2decode::word_processor_doc decoded;
    REQUIRE(a2decode::appleworks_wp_decoder::decode(doc, decoded));
    REQUIRE(decoded.lines.size() == 1);
    CHECK(decoded.lines[0].text() == "v3");
}

TEST_CASE("AppleWorks WP: failures") {
    a2decode::word_processor_doc doc;
    doc.lines.emplace_back();

    SUBCASE("too short") {
        CHECK(a2decode::appleworks_wp_decoder::decode(std::vector<std::uint8_t>(100, 0), doc).error ==
              a2decode::decode_error::too_short);
    }

    SUBCASE("signature missing") {
        std::vector<std::uint8_t> data(300, 0);
        CHECK(a2decode::appleworks_wp_decoder::decode(data, doc).error ==
              a2decode::decode_error::corrupt_document);
    }

    SUBCASE("text record runs past the file") {
        auto data = wp_header();
        data.insert(data.end(), {40, 0x00, 0x00, 0x85, 'A'});
        CHECK(a2decode::appleworks_wp_decoder::decode(data, doc).error ==
              a2decode::decode_error::corrupt_document);
    }

    SUBCASE("text length exceeds record") {
        auto data = wp_header();
        data.insert(data.end(), {3, 0x00, 0x00, 0x85, 'A'});
        wp_end(data);
        CHECK(a2decode::appleworks_wp_decoder::decode(data, doc).error ==
              a2decode::decode_error::corrupt_document);
    }

    CHECK(doc.lines.size() == 1);
}

TEST_CASE("AppleWorks WP: missing end marker is tolerated") {
    auto data = wp_header();
    wp_text(data, test_util::bytes_of("tail"));

    a2decode::word_processor_doc doc;
    REQUIRE(a2decode::appleworks_wp_decoder::decode(data, doc));
    REQUIRE(doc.lines.size() == 1);
    CHECK(doc.lines[0].text() == "tail");
}

TEST_CASE("AppleWorks GS: paragraphs and runs") {
    const auto data = sample_gwp();
    CHECK(a2decode::appleworks_gs_decoder::sniff(data));

    a2decode::gs_word_processor_doc doc;
    REQUIRE(a2decode::appleworks_gs_decoder::decode(data, doc));

    CHECK(doc.palette[3] == 0xFF);
    CHECK(doc.palette[4] == 0x00);
    CHECK(doc.palette[5] == 0x00);

    REQUIRE(doc.lines.size() == 3);

    const auto& first = doc.lines[0];
    REQUIRE(first.runs.size() == 2);
    CHECK(first.runs[0].text == "Plain ");
    CHECK(first.runs[0].font_family == 0x14);
    CHECK(first.runs[0].point_size == 12);
    CHECK(first.runs[1].text == "Bold");
    CHECK(first.runs[1].style.bold);
    CHECK(first.alignment == a2decode::paragraph_alignment::left);

    CHECK(doc.lines[1].page_break);

    const auto& second = doc.lines[2];
    REQUIRE(second.runs.size() == 1);
    CHECK(second.runs[0].text == "Red\xC3\xA9");
    CHECK(second.runs[0].style.italic);
    CHECK(second.runs[0].point_size == 12);
    CHECK(second.runs[0].color_index == 1);
    CHECK(second.alignment == a2decode::paragraph_alignment::center);
}

TEST_CASE("AppleWorks GS: failures") {
    a2decode::gs_word_processor_doc doc;

    SUBCASE("too short") {
        CHECK(a2decode::appleworks_gs_decoder::decode(std::vector<std::uint8_t>(400, 0), doc).error ==
              a2decode::decode_error::too_short);
    }

    SUBCASE("unknown version") {
        auto data = sample_gwp();
        test_util::set_le16(data, 0, 0x0200);
        CHECK_FALSE(a2decode::appleworks_gs_decoder::sniff(data));
        CHECK(a2decode::appleworks_gs_decoder::decode(data, doc).error ==
              a2decode::decode_error::corrupt_document);
    }

    SUBCASE("text block truncated") {
        auto data = sample_gwp();
        data.resize(data.size() - 4);
        CHECK(a2decode::appleworks_gs_decoder::decode(data, doc).error ==
              a2decode::decode_error::corrupt_document);
    }

    SUBCASE("zero paragraphs") {
        auto data = sample_gwp();
        test_util::set_le16(data, a2decode::appleworks_gs_decoder::HEADER_SIZE +
                                      a2decode::appleworks_gs_decoder::GLOBALS_SIZE, 0);
        CHECK(a2decode::appleworks_gs_decoder::decode(data, doc).error ==
              a2decode::decode_error::corrupt_document);
    }

    CHECK(doc.lines.empty());
}

TEST_CASE("AppleWorks DB: categories and records") {
    const auto data = sample_db();
    CHECK(a2decode::appleworks_db_decoder::sniff(data));

    a2decode::database_doc doc;
    REQUIRE(a2decode::appleworks_db_decoder::decode(data, doc));

    CHECK(doc.categories == std::vector<std::string>{"Name", "Dish"});
    REQUIRE(doc.records.size() == 3);
    CHECK(doc.records[0] == std::vector<std::string>{"Apple", "Pie"});
    CHECK(doc.records[1] == std::vector<std::string>{"", "Two"});
    CHECK(doc.records[2] == std::vector<std::string>{"15-Mar-85", "1:30 PM"});
}

TEST_CASE("AppleWorks DB: failures") {
    a2decode::database_doc doc;

    SUBCASE("too short") {
        CHECK(a2decode::appleworks_db_decoder::decode(std::vector<std::uint8_t>(200, 0), doc).error ==
              a2decode::decode_error::too_short);
    }

    SUBCASE("no categories") {
        auto data = sample_db();
        data[35] = 0;
        CHECK_FALSE(a2decode::appleworks_db_decoder::sniff(data));
        CHECK(a2decode::appleworks_db_decoder::decode(data, doc).error ==
              a2decode::decode_error::corrupt_document);
    }

    SUBCASE("invalid control byte") {
        auto data = sample_db();
        // First byte of the first data record
        data[DB_HEADER_LENGTH + 2 + 3 + 2] = 0xA0;
        CHECK(a2decode::appleworks_db_decoder::decode(data, doc).error ==
              a2decode::decode_error::corrupt_document);
    }

    CHECK(doc.records.empty());
}

TEST_CASE("AppleWorks SS: rows by number") {
    a2decode::spreadsheet_doc doc;
    REQUIRE(a2decode::appleworks_ss_decoder::decode(sample_ss(), doc));

    CHECK(doc.max_row == 3);
    CHECK(doc.max_column == 2);
    REQUIRE(doc.rows.size() == 4);
    for (const auto& row : doc.rows) {
        CHECK(row.size() == 3);
    }
    CHECK(doc.rows[0] == std::vector<std::string>{"", "", ""});
    CHECK(doc.rows[1] == std::vector<std::string>{"Item", "42.5", "7"});
    CHECK(doc.rows[2] == std::vector<std::string>{"", "", ""});
    CHECK(doc.rows[3] == std::vector<std::string>{"", "--------", ""});
}

TEST_CASE("AppleWorks SS: failures") {
    a2decode::spreadsheet_doc doc;

    SUBCASE("too short") {
        CHECK(a2decode::appleworks_ss_decoder::decode(std::vector<std::uint8_t>(10, 0), doc).error ==
              a2decode::decode_error::too_short);
    }

    SUBCASE("cell overruns its row") {
        std::vector<std::uint8_t> data(300, 0);
        ss_row(data, 1, {9, 0x00, 'A'});
        data.insert(data.end(), {0xFF, 0xFF});
        CHECK(a2decode::appleworks_ss_decoder::decode(data, doc).error ==
              a2decode::decode_error::corrupt_document);
    }

    CHECK(doc.rows.empty());
}

TEST_CASE("AppleWorks: dispatch and plain text") {
    using a2decode::prodos_type::ADB;
    using a2decode::prodos_type::ASP;
    using a2decode::prodos_type::AWP;
    using a2decode::prodos_type::GWP;

    CHECK(a2decode::is_appleworks_type(AWP, 0));
    CHECK(a2decode::is_appleworks_type(GWP, a2decode::GWP_AUX_TYPE));
    CHECK_FALSE(a2decode::is_appleworks_type(GWP, 0));
    CHECK_FALSE(a2decode::is_appleworks_type(a2decode::prodos_type::TXT, 0));

    a2decode::appleworks_document doc;

    SUBCASE("word processor") {
        REQUIRE(a2decode::decode_document(sample_wp(), AWP, 0, doc));
        REQUIRE(std::holds_alternative<a2decode::word_processor_doc>(doc));
        CHECK(a2decode::plain_text(doc) == "Hello world\n\nTitle\n\na\tba[DATE]");
    }

    SUBCASE("GS word processor") {
        REQUIRE(a2decode::decode_document(sample_gwp(), GWP, a2decode::GWP_AUX_TYPE, doc));
        REQUIRE(std::holds_alternative<a2decode::gs_word_processor_doc>(doc));
        CHECK(a2decode::plain_text(doc) == "Plain Bold\n\nRed\xC3\xA9");
    }

    SUBCASE("database") {
        REQUIRE(a2decode::decode_document(sample_db(), ADB, 0, doc));
        CHECK(a2decode::plain_text(doc) == "Name\tDish\nApple\tPie\n\tTwo\n15-Mar-85\t1:30 PM");
    }

    SUBCASE("spreadsheet") {
        REQUIRE(a2decode::decode_document(sample_ss(), ASP, 0, doc));
        CHECK(a2decode::plain_text(doc) == "\t\t\nItem\t42.5\t7\n\t\t\n\t--------\t");
    }

    SUBCASE("wrong type") {
        CHECK(a2decode::decode_document(sample_gwp(), GWP, 0, doc).error ==
              a2decode::decode_error::unrecognized_format);
        CHECK(std::holds_alternative<a2decode::word_processor_doc>(doc));
    }
}

TEST_CASE("AppleWorks: truncated files") {
    using namespace a2decode::prodos_type;

    struct sample {
        const char* label;
        std::vector<std::uint8_t> data;
        std::uint8_t type;
        std::uint16_t aux;
    };
    const std::vector<sample> samples = {
        {"word processor", sample_wp(), AWP, 0},
        {"GS word processor", sample_gwp(), GWP, a2decode::GWP_AUX_TYPE},
        {"database", sample_db(), ADB, 0},
        {"spreadsheet", sample_ss(), ASP, 0},
    };

    a2decode::spreadsheet_doc marker;
    marker.rows.push_back({"unchanged"});
    const a2decode::appleworks_document untouched{marker};

    for (const auto& s : samples) {
        CAPTURE(s.label);
        for (const std::size_t size : test_util::prefix_lengths(s.data.size())) {
            CAPTURE(size);
            a2decode::appleworks_document doc = untouched;
            const auto result = a2decode::decode_document(
                std::span<const std::uint8_t>(s.data.data(), size), s.type, s.aux, doc);
            if (!result) {
                CHECK(doc == untouched);
            }
        }
    }
}

TEST_CASE("AppleWorks: decoding is repeatable") {
    using namespace a2decode::prodos_type;

    const auto check_repeatable = [](const std::vector<std::uint8_t>& data, std::uint8_t type,
                                     std::uint16_t aux) {
        a2decode::appleworks_document first;
        a2decode::appleworks_document second;
        REQUIRE(a2decode::decode_document(data, type, aux, first));
        REQUIRE(a2decode::decode_document(data, type, aux, second));
        CHECK(first == second);

        // A reused output is replaced, not appended to
        REQUIRE(a2decode::decode_document(data, type, aux, first));
        CHECK(first == second);
    };

    check_repeatable(sample_wp(), AWP, 0);
    check_repeatable(sample_gwp(), GWP, a2decode::GWP_AUX_TYPE);
    check_repeatable(sample_db(), ADB, 0);
    check_repeatable(sample_ss(), ASP, 0);
}
