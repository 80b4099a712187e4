#ifndef A2DECODE_DOCUMENT_APPLEWORKS_HPP_
#define A2DECODE_DOCUMENT_APPLEWORKS_HPP_

#include <a2decode/a2decode_export.h>
#include <a2decode/types.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace a2decode {

// ============================================================================
// Document Model
// ============================================================================

enum class paragraph_alignment {
    left,
    center,
    right,
    justified
};

struct text_style {
    bool bold = false;
    bool italic = false;
    bool underline = false;
    bool superscript = false;
    bool subscript = false;

    bool operator==(const text_style&) const = default;
};

// Classic AppleWorks run. Rendered in the fixed-pitch screen font.
struct classic_run {
    std::string text;
    text_style style;

    bool operator==(const classic_run&) const = default;
};

// AppleWorks GS run with QuickDraw II font attributes
struct gs_run {
    std::string text;
    text_style style;
    std::uint16_t font_family = 0;
    std::uint8_t point_size = 12;
    std::uint8_t color_index = 0;   // into gs_word_processor_doc::palette

    bool operator==(const gs_run&) const = default;
};

// Teach run: TextEdit style (QuickDraw II font ID and colours)
struct teach_run {
    std::string text;
    text_style style;
    std::uint16_t font_family = 0xFFFE;   // Shaston
    std::uint8_t point_size = 8;
    std::uint16_t foreground = 0;
    std::uint16_t background = 0xFFFF;

    bool operator==(const teach_run&) const = default;
};

template <typename Run>
struct document_line {
    std::vector<Run> runs;
    paragraph_alignment alignment = paragraph_alignment::left;
    bool page_break = false;   // runs hold a visible marker

    /**
     * Concatenated run text. Page breaks render as an empty line.
     */
    [[nodiscard]] std::string text() const {
        std::string out;
        if (!page_break) {
            for (const auto& run : runs) {
                out += run.text;
            }
        }
        return out;
    }

    bool operator==(const document_line&) const = default;
};

struct word_processor_doc {
    std::vector<document_line<classic_run>> lines;

    bool operator==(const word_processor_doc&) const = default;
};

struct gs_word_processor_doc {
    std::vector<document_line<gs_run>> lines;
    std::array<std::uint8_t, 16 * 3> palette{};   // RGB888 triplets

    bool operator==(const gs_word_processor_doc&) const = default;
};

struct teach_doc {
    std::vector<document_line<teach_run>> lines;
    bool styled = false;   // false when no style block was found

    bool operator==(const teach_doc&) const = default;
};

struct database_doc {
    std::vector<std::string> categories;
    std::vector<std::vector<std::string>> records;   // categories.size() fields each

    bool operator==(const database_doc&) const = default;
};

struct spreadsheet_doc {
    int max_column = 0;
    int max_row = 0;
    // Indexed by row number. Every row holds max_column + 1 cells.
    std::vector<std::vector<std::string>> rows;

    bool operator==(const spreadsheet_doc&) const = default;
};

using appleworks_document = std::variant<word_processor_doc,
                                         gs_word_processor_doc,
                                         database_doc,
                                         spreadsheet_doc,
                                         teach_doc>;

// ============================================================================
// Decoders
// ============================================================================

/**
 * AppleWorks word processor (ProDOS type $1A).
 *
 * 300-byte header, then (data, code) line records up to $FF $FF. Code $00
 * is a text line of `data` bytes; codes $D0 and above are carriage returns
 * and formatting commands.
 */
class A2DECODE_EXPORT appleworks_wp_decoder {
public:
    static constexpr std::string_view name = "awp";

    static constexpr std::size_t HEADER_SIZE = 300;
    static constexpr std::size_t SIGNATURE_OFFSET = 4;
    static constexpr std::uint8_t SIGNATURE = 79;
    static constexpr std::size_t MIN_VERSION_OFFSET = 183;

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                              word_processor_doc& doc);
};

/**
 * AppleWorks GS word processor (ProDOS type $50, aux $8010).
 *
 * 282-byte header (with the 16-colour palette at $38), 386 bytes of
 * globals, then the body, header and footer chunks. Only the body is read.
 */
class A2DECODE_EXPORT appleworks_gs_decoder {
public:
    static constexpr std::string_view name = "gwp";

    static constexpr std::size_t HEADER_SIZE = 282;
    static constexpr std::size_t GLOBALS_SIZE = 386;
    static constexpr std::size_t RULER_SIZE = 52;
    static constexpr std::size_t PALETTE_OFFSET = 0x38;
    static constexpr std::uint16_t VERSION_1011 = 0x1011;
    static constexpr std::uint16_t VERSION_0006 = 0x0006;

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                              gs_word_processor_doc& doc);
};

/**
 * AppleWorks database (ProDOS type $19).
 *
 * Category names sit in 22-byte slots from offset 357. Report definitions
 * (600 bytes each) and the standard-values record precede the data records.
 */
class A2DECODE_EXPORT appleworks_db_decoder {
public:
    static constexpr std::string_view name = "adb";

    static constexpr std::size_t MIN_HEADER_SIZE = 379;
    static constexpr std::size_t CATEGORY_OFFSET = 357;
    static constexpr std::size_t CATEGORY_SIZE = 22;
    static constexpr std::size_t REPORT_SIZE = 600;
    static constexpr int MAX_CATEGORIES = 30;

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                              database_doc& doc);
};

/**
 * AppleWorks spreadsheet (ProDOS type $1B).
 *
 * 300-byte header, then rows of (length, row number, cells) up to $FF $FF.
 */
class A2DECODE_EXPORT appleworks_ss_decoder {
public:
    static constexpr std::string_view name = "asp";

    static constexpr std::size_t HEADER_SIZE = 300;
    static constexpr std::size_t MIN_VERSION_OFFSET = 242;

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                              spreadsheet_doc& doc);
};

/**
 * Teach document (ProDOS type $50, aux $5445).
 *
 * The data fork is MacRoman text with CR line ends. Formatting lives in
 * the rStyleBlock resource ($8012, ID 1) of the resource fork: a ruler,
 * a list of 12-byte TEStyles, then style items that each cover the next
 * `length` characters with the style at `offset` in the list.
 *
 * Without a resource fork, or when the fork has no style block, the text
 * decodes as unstyled lines. Text past the last style item keeps the last
 * style.
 */
class A2DECODE_EXPORT teach_decoder {
public:
    static constexpr std::string_view name = "teach";

    static constexpr std::uint16_t AUX_TYPE = 0x5445;   // 'TE'
    static constexpr std::uint32_t STYLE_BLOCK_ID = 1;
    static constexpr std::size_t RULER_MIN_SIZE = 18;
    static constexpr std::size_t STYLE_SIZE = 12;
    static constexpr std::size_t STYLE_ITEM_SIZE = 8;

    /**
     * @param data Data fork
     * @param resource_fork Resource fork, may be empty
     * @param doc Filled on success (untouched on failure)
     * @return Decode result (corrupt_document for a bad style block,
     *         malformed_header or out_of_bounds for a bad resource map)
     */
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                              std::span<const std::uint8_t> resource_fork,
                                              teach_doc& doc);
};

// ============================================================================
// Convenience Functions
// ============================================================================

inline constexpr std::uint16_t GWP_AUX_TYPE = 0x8010;

/**
 * True for the type/aux pairs decode_document() accepts.
 */
[[nodiscard]] A2DECODE_EXPORT bool is_appleworks_type(std::uint8_t type, std::uint16_t aux) noexcept;

/**
 * Decode an AppleWorks or Teach document chosen by ProDOS type and aux type.
 * @param data File contents (data fork)
 * @param type ProDOS file type ($19, $1A, $1B or $50)
 * @param aux Aux type ($8010 or $5445 for $50)
 * @param doc Filled on success (untouched on failure)
 * @param resource_fork Resource fork, used by Teach documents only
 * @return Decode result (unrecognized_format, too_short, corrupt_document)
 */
[[nodiscard]] A2DECODE_EXPORT decode_result decode_document(std::span<const std::uint8_t> data,
                                                            std::uint8_t type,
                                                            std::uint16_t aux,
                                                            appleworks_document& doc,
                                                            std::span<const std::uint8_t> resource_fork = {});

/**
 * Text rendering of any document. Word processor lines are joined with
 * '\n'; database and spreadsheet rows use '\t' between cells.
 */
[[nodiscard]] A2DECODE_EXPORT std::string plain_text(const appleworks_document& doc);

} // namespace a2decode

#endif // A2DECODE_DOCUMENT_APPLEWORKS_HPP_
