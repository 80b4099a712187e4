#include <a2decode/document/appleworks.hpp>
#include <a2decode/document/resource_fork.hpp>
#include <a2decode/byte_reader.hpp>
#include <a2decode/palettes.hpp>
#include "charset.hpp"
#include "../byte_io.hpp"

#include <algorithm>

namespace a2decode {

namespace {

constexpr std::string_view PAGE_BREAK_TEXT = "--- Page Break ---";

// ----------------------------------------------------------------------------
// Classic line records
// ----------------------------------------------------------------------------

constexpr std::uint8_t CODE_TEXT = 0x00;
constexpr std::uint8_t CODE_CARRIAGE_RETURN = 0xD0;
constexpr std::uint8_t CODE_END = 0xFF;
constexpr std::uint8_t CMD_RIGHT_JUSTIFY = 0xD7;
constexpr std::uint8_t CMD_JUSTIFY = 0xDF;
constexpr std::uint8_t CMD_UNJUSTIFY = 0xE0;
constexpr std::uint8_t CMD_CENTER = 0xE1;
constexpr std::uint8_t CMD_NEW_PAGE = 0xE9;
constexpr std::uint8_t RULER_FLAG = 0xFF;
constexpr std::size_t VERSION3_EXTRA = 2;

// Inline controls inside a classic text line
constexpr std::uint8_t CTRL_BOLD_ON = 0x01;
constexpr std::uint8_t CTRL_BOLD_OFF = 0x02;
constexpr std::uint8_t CTRL_SUPER_ON = 0x03;
constexpr std::uint8_t CTRL_SUPER_OFF = 0x04;
constexpr std::uint8_t CTRL_SUB_ON = 0x05;
constexpr std::uint8_t CTRL_SUB_OFF = 0x06;
constexpr std::uint8_t CTRL_UNDERLINE_ON = 0x07;
constexpr std::uint8_t CTRL_UNDERLINE_OFF = 0x08;
constexpr std::uint8_t CTRL_PAGE_NUMBER = 0x09;
constexpr std::uint8_t CTRL_STICKY_SPACE = 0x0B;
constexpr std::uint8_t CTRL_DATE = 0x0E;
constexpr std::uint8_t CTRL_TIME = 0x0F;
constexpr std::uint8_t CTRL_TAB = 0x16;
constexpr std::uint8_t CTRL_TAB_FILL = 0x17;

// ----------------------------------------------------------------------------
// GS paragraphs
// ----------------------------------------------------------------------------

constexpr std::size_t SAVE_ARRAY_ENTRY_SIZE = 12;
constexpr std::size_t TEXT_BLOCK_HEADER_SIZE = 8;
constexpr std::size_t PARAGRAPH_HEADER_SIZE = 7;
constexpr std::uint16_t ATTR_PAGE_BREAK = 1;
constexpr std::uint8_t DEFAULT_POINT_SIZE = 12;

constexpr std::uint8_t GS_FONT = 0x01;
constexpr std::uint8_t GS_STYLE = 0x02;
constexpr std::uint8_t GS_SIZE = 0x03;
constexpr std::uint8_t GS_COLOR = 0x04;
constexpr std::uint8_t GS_PAGE_NUMBER = 0x05;
constexpr std::uint8_t GS_DATE = 0x06;
constexpr std::uint8_t GS_TIME = 0x07;
constexpr std::uint8_t GS_TAB = 0x09;
constexpr std::uint8_t GS_RETURN = 0x0D;

constexpr std::uint8_t STYLE_BOLD = 0x01;
constexpr std::uint8_t STYLE_ITALIC = 0x02;
constexpr std::uint8_t STYLE_UNDERLINE = 0x04;
constexpr std::uint8_t STYLE_SUPER = 0x40;
constexpr std::uint8_t STYLE_SUB = 0x80;

constexpr std::uint16_t RULER_FULL_JUSTIFY = 0x80;
constexpr std::uint16_t RULER_RIGHT_JUSTIFY = 0x40;
constexpr std::uint16_t RULER_CENTER = 0x20;

decode_result corrupt(std::string msg) {
    return decode_result::failure(decode_error::corrupt_document, std::move(msg));
}

// Collects runs for one line; a run closes whenever its attributes change.
template <typename Run>
class run_builder {
public:
    explicit run_builder(Run attributes) : current_(std::move(attributes)) {}

    Run& attributes() {
        flush();
        return current_;
    }

    void append(std::string_view text) { current_.text += text; }
    std::string& text() { return current_.text; }

    std::vector<Run> finish() {
        flush();
        return std::move(runs_);
    }

private:
    void flush() {
        if (!current_.text.empty()) {
            runs_.push_back(current_);
            current_.text.clear();
        }
    }

    std::vector<Run> runs_;
    Run current_;
};

template <typename Run>
document_line<Run> page_break_line() {
    document_line<Run> line;
    Run marker{};
    marker.text = std::string(PAGE_BREAK_TEXT);
    line.runs.push_back(std::move(marker));
    line.alignment = paragraph_alignment::center;
    line.page_break = true;
    return line;
}

document_line<classic_run> decode_classic_text(std::span<const std::uint8_t> text,
                                               paragraph_alignment alignment) {
    run_builder<classic_run> runs(classic_run{});
    for (const std::uint8_t byte : text) {
        switch (byte) {
            case CTRL_BOLD_ON:       runs.attributes().style.bold = true; break;
            case CTRL_BOLD_OFF:      runs.attributes().style.bold = false; break;
            case CTRL_SUPER_ON:      runs.attributes().style.superscript = true; break;
            case CTRL_SUPER_OFF:     runs.attributes().style.superscript = false; break;
            case CTRL_SUB_ON:        runs.attributes().style.subscript = true; break;
            case CTRL_SUB_OFF:       runs.attributes().style.subscript = false; break;
            case CTRL_UNDERLINE_ON:  runs.attributes().style.underline = true; break;
            case CTRL_UNDERLINE_OFF: runs.attributes().style.underline = false; break;
            case CTRL_PAGE_NUMBER:   runs.append("#"); break;
            case CTRL_STICKY_SPACE:  runs.append(" "); break;
            case CTRL_DATE:          runs.append("[DATE]"); break;
            case CTRL_TIME:          runs.append("[TIME]"); break;
            case CTRL_TAB:
            case CTRL_TAB_FILL:      runs.append("\t"); break;
            default:
                if (byte >= 0x20) {
                    append_appleworks_char(runs.text(), byte);
                }
                break;
        }
    }

    document_line<classic_run> line;
    line.runs = runs.finish();
    line.alignment = alignment;
    return line;
}

text_style style_from_bits(std::uint8_t bits) noexcept {
    text_style style;
    style.bold = (bits & STYLE_BOLD) != 0;
    style.italic = (bits & STYLE_ITALIC) != 0;
    style.underline = (bits & STYLE_UNDERLINE) != 0;
    style.superscript = (bits & STYLE_SUPER) != 0;
    style.subscript = (bits & STYLE_SUB) != 0;
    return style;
}

paragraph_alignment ruler_alignment(std::uint16_t status) noexcept {
    if (status & RULER_FULL_JUSTIFY) {
        return paragraph_alignment::justified;
    }
    if (status & RULER_RIGHT_JUSTIFY) {
        return paragraph_alignment::right;
    }
    if (status & RULER_CENTER) {
        return paragraph_alignment::center;
    }
    return paragraph_alignment::left;
}

struct save_array_entry {
    std::uint16_t ruler = 0;
    bool page_break = false;
};

// One paragraph from [pos, end). Stops after the carriage return.
decode_result decode_gs_paragraph(std::span<const std::uint8_t> data, std::size_t& pos, std::size_t end,
                                  paragraph_alignment alignment, document_line<gs_run>& line) {
    if (end - pos < PARAGRAPH_HEADER_SIZE) {
        return corrupt("Paragraph header truncated at offset " + std::to_string(pos));
    }

    gs_run first;
    first.font_family = read_le16(data.data() + pos);
    first.style = style_from_bits(data[pos + 2]);
    first.point_size = data[pos + 3] == 0 ? DEFAULT_POINT_SIZE : data[pos + 3];
    first.color_index = data[pos + 4];
    pos += PARAGRAPH_HEADER_SIZE;

    run_builder<gs_run> runs(first);
    auto need = [&](std::size_t count) { return end - pos >= count; };

    while (pos < end) {
        const std::uint8_t byte = data[pos++];
        switch (byte) {
            case GS_FONT:
                if (!need(2)) {
                    return corrupt("Font change truncated");
                }
                runs.attributes().font_family = read_le16(data.data() + pos);
                pos += 2;
                break;
            case GS_STYLE:
                if (!need(1)) {
                    return corrupt("Style change truncated");
                }
                runs.attributes().style = style_from_bits(data[pos++]);
                break;
            case GS_SIZE:
                if (!need(1)) {
                    return corrupt("Size change truncated");
                }
                runs.attributes().point_size = data[pos] == 0 ? DEFAULT_POINT_SIZE : data[pos];
                ++pos;
                break;
            case GS_COLOR:
                if (!need(1)) {
                    return corrupt("Color change truncated");
                }
                runs.attributes().color_index = data[pos++];
                break;
            case GS_PAGE_NUMBER: runs.append("#"); break;
            case GS_DATE:        runs.append("[DATE]"); break;
            case GS_TIME:        runs.append("[TIME]"); break;
            case GS_TAB:         runs.append("\t"); break;
            case GS_RETURN:
                line.runs = runs.finish();
                line.alignment = alignment;
                return decode_result::success();
            default:
                if (byte >= 0x20) {
                    append_mac_roman_char(runs.text(), byte);
                }
                break;
        }
    }

    line.runs = runs.finish();
    line.alignment = alignment;
    return decode_result::success();
}

} // namespace

// ============================================================================
// Classic Word Processor
// ============================================================================

bool appleworks_wp_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    return data.size() >= HEADER_SIZE && data[SIGNATURE_OFFSET] == SIGNATURE;
}

decode_result appleworks_wp_decoder::decode(std::span<const std::uint8_t> data,
                                            word_processor_doc& doc) {
    if (data.size() < HEADER_SIZE) {
        return decode_result::failure(decode_error::too_short, "AppleWorks WP header truncated");
    }
    if (data[SIGNATURE_OFFSET] != SIGNATURE) {
        return corrupt("AppleWorks WP signature missing");
    }

    std::size_t pos = HEADER_SIZE;
    if (data[MIN_VERSION_OFFSET] != 0) {
        pos += VERSION3_EXTRA;
    }

    word_processor_doc result;
    auto alignment = paragraph_alignment::left;

    while (pos + 2 <= data.size()) {
        const std::uint8_t record_data = data[pos];
        const std::uint8_t code = data[pos + 1];
        pos += 2;
        if (record_data == CODE_END && code == CODE_END) {
            break;
        }

        switch (code) {
            case CODE_TEXT: {
                const std::size_t record_end = pos + record_data;
                if (record_data < 2 || record_end > data.size()) {
                    return corrupt("Text record truncated at offset " + std::to_string(pos - 2));
                }
                if (data[pos] != RULER_FLAG) {
                    const std::size_t count = data[pos + 1] & 0x7F;
                    if (count > record_data - 2u) {
                        return corrupt("Text length exceeds record at offset " + std::to_string(pos - 2));
                    }
                    result.lines.push_back(decode_classic_text(data.subspan(pos + 2, count), alignment));
                }
                pos = record_end;
                break;
            }
            case CODE_CARRIAGE_RETURN:
                result.lines.emplace_back();
                break;
            case CMD_CENTER:
                alignment = paragraph_alignment::center;
                break;
            case CMD_RIGHT_JUSTIFY:
                alignment = paragraph_alignment::right;
                break;
            case CMD_JUSTIFY:
                alignment = paragraph_alignment::justified;
                break;
            case CMD_UNJUSTIFY:
                alignment = paragraph_alignment::left;
                break;
            case CMD_NEW_PAGE:
                result.lines.push_back(page_break_line<classic_run>());
                break;
            default:
                // Margins, spacing and printer commands carry no text
                break;
        }
    }

    doc = std::move(result);
    return decode_result::success();
}

// ============================================================================
// AppleWorks GS Word Processor
// ============================================================================

bool appleworks_gs_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < HEADER_SIZE + GLOBALS_SIZE + 2) {
        return false;
    }
    const std::uint16_t version = read_le16(data.data());
    return (version == VERSION_1011 || version == VERSION_0006) &&
           read_le16(data.data() + 2) == HEADER_SIZE;
}

decode_result appleworks_gs_decoder::decode(std::span<const std::uint8_t> data,
                                            gs_word_processor_doc& doc) {
    if (data.size() < HEADER_SIZE + GLOBALS_SIZE + 2) {
        return decode_result::failure(decode_error::too_short, "AppleWorks GS header truncated");
    }
    if (!sniff(data)) {
        return corrupt("Unknown AppleWorks GS version or header size");
    }

    gs_word_processor_doc result;
    for (std::size_t i = 0; i < 16; ++i) {
        const auto rgb = iigs_color_to_rgb(read_le16(data.data() + PALETTE_OFFSET + i * 2));
        std::copy(rgb.begin(), rgb.end(), result.palette.begin() + static_cast<std::ptrdiff_t>(i * 3));
    }

    // Body chunk: SaveArray, rulers, then text blocks
    std::size_t pos = HEADER_SIZE + GLOBALS_SIZE;
    const std::size_t save_count = read_le16(data.data() + pos);
    pos += 2;
    if (save_count == 0 || save_count == 0xFFFF) {
        return corrupt("Invalid paragraph count " + std::to_string(save_count));
    }
    if ((data.size() - pos) / SAVE_ARRAY_ENTRY_SIZE < save_count) {
        return corrupt("Paragraph table truncated");
    }

    std::vector<save_array_entry> entries(save_count);
    std::uint16_t max_ruler = 0;
    for (auto& entry : entries) {
        entry.page_break = read_le16(data.data() + pos + 4) == ATTR_PAGE_BREAK;
        entry.ruler = read_le16(data.data() + pos + 6);
        max_ruler = std::max(max_ruler, entry.ruler);
        pos += SAVE_ARRAY_ENTRY_SIZE;
    }

    const std::size_t ruler_count = std::size_t{max_ruler} + 1;
    if ((data.size() - pos) / RULER_SIZE < ruler_count) {
        return corrupt("Ruler table truncated");
    }
    std::vector<paragraph_alignment> rulers;
    rulers.reserve(ruler_count);
    for (std::size_t i = 0; i < ruler_count; ++i) {
        rulers.push_back(ruler_alignment(read_le16(data.data() + pos + 2)));
        pos += RULER_SIZE;
    }

    if (data.size() - pos < TEXT_BLOCK_HEADER_SIZE) {
        return corrupt("Text block header truncated");
    }
    const std::uint32_t block_length = read_le32(data.data() + pos);
    pos += TEXT_BLOCK_HEADER_SIZE;
    if (block_length > data.size() - pos) {
        return corrupt("Text block truncated");
    }
    const std::size_t block_end = pos + block_length;

    for (const auto& entry : entries) {
        if (pos >= block_end) {
            break;
        }
        if (entry.page_break) {
            result.lines.push_back(page_break_line<gs_run>());
            continue;
        }
        document_line<gs_run> line;
        auto status = decode_gs_paragraph(data, pos, block_end, rulers[entry.ruler], line);
        if (!status) {
            return status;
        }
        result.lines.push_back(std::move(line));
    }

    doc = std::move(result);
    return decode_result::success();
}

// ============================================================================
// Teach
// ============================================================================

namespace {

// TERuler justification
constexpr std::uint16_t TE_JUST_LEFT = 0x0000;
constexpr std::uint16_t TE_JUST_CENTER = 0x0001;
constexpr std::uint16_t TE_JUST_FULL = 0x0002;
constexpr std::uint16_t TE_JUST_RIGHT = 0xFFFF;
constexpr std::size_t RULER_JUSTIFICATION = 6;

constexpr std::uint32_t UNUSED_STYLE_ITEM = 0xFFFFFFFF;

paragraph_alignment teach_alignment(std::uint16_t just) noexcept {
    switch (just) {
        case TE_JUST_CENTER: return paragraph_alignment::center;
        case TE_JUST_FULL:   return paragraph_alignment::justified;
        case TE_JUST_RIGHT:  return paragraph_alignment::right;
        case TE_JUST_LEFT:
        default:             return paragraph_alignment::left;
    }
}

struct style_item {
    std::uint32_t length = 0;
    std::size_t style = 0;
};

struct style_block {
    paragraph_alignment alignment = paragraph_alignment::left;
    std::vector<teach_run> styles;
    std::vector<style_item> items;
};

decode_result parse_style_block(std::span<const std::uint8_t> data, style_block& out) {
    byte_reader reader(data);

    const auto version = reader.read_u16le();
    if (!version) {
        return corrupt("Style block truncated");
    }
    if (*version != 0) {
        return corrupt("Unknown style block version " + std::to_string(*version));
    }

    // Only the first ruler is ever used
    const auto ruler_length = reader.read_u32le();
    if (!ruler_length || *ruler_length < teach_decoder::RULER_MIN_SIZE) {
        return corrupt("Style block ruler truncated");
    }
    const auto ruler = reader.read_bytes(*ruler_length);
    if (!ruler) {
        return corrupt("Style block ruler runs past end of resource");
    }

    const auto styles_length = reader.read_u32le();
    if (!styles_length || *styles_length % teach_decoder::STYLE_SIZE != 0) {
        return corrupt("Invalid TEStyle list length");
    }
    const auto styles = reader.read_bytes(*styles_length);
    if (!styles) {
        return corrupt("TEStyle list runs past end of resource");
    }

    const auto item_count = reader.read_u32le();
    if (!item_count || *item_count > reader.remaining() / teach_decoder::STYLE_ITEM_SIZE) {
        return corrupt("Style item list truncated");
    }

    style_block result;
    result.alignment = teach_alignment(read_le16(ruler->data() + RULER_JUSTIFICATION));

    for (std::size_t off = 0; off < styles->size(); off += teach_decoder::STYLE_SIZE) {
        const std::uint8_t* p = styles->data() + off;
        const std::uint32_t font_id = read_le32(p);
        teach_run style;
        style.font_family = static_cast<std::uint16_t>(font_id & 0xFFFF);
        style.style = style_from_bits(static_cast<std::uint8_t>((font_id >> 16) & 0xFF));
        style.point_size = static_cast<std::uint8_t>(font_id >> 24);
        style.foreground = read_le16(p + 4);
        style.background = read_le16(p + 6);
        result.styles.push_back(style);
    }

    for (std::uint32_t i = 0; i < *item_count; ++i) {
        const std::uint32_t length = *reader.read_u32le();
        const std::uint32_t offset = *reader.read_u32le();
        if (offset % teach_decoder::STYLE_SIZE != 0) {
            return corrupt("Style item offset " + std::to_string(offset) + " is not a TEStyle boundary");
        }
        if (length == UNUSED_STYLE_ITEM) {
            continue;
        }
        const std::size_t index = offset / teach_decoder::STYLE_SIZE;
        if (index >= result.styles.size()) {
            return corrupt("Style item refers to TEStyle " + std::to_string(index) +
                           " of " + std::to_string(result.styles.size()));
        }
        result.items.push_back({length, index});
    }

    out = std::move(result);
    return decode_result::success();
}

// Splits MacRoman text into lines at CR (a following LF is dropped)
class teach_lines {
public:
    explicit teach_lines(paragraph_alignment alignment)
        : alignment_(alignment), runs_(style_) {}

    void set_style(const teach_run& style) {
        style_ = style;
        runs_.attributes() = style_;
    }

    void feed(std::uint8_t byte) {
        const bool after_cr = last_cr_;
        last_cr_ = byte == '\r';
        if (byte == '\n' && after_cr) {
            return;
        }
        if (byte == '\r' || byte == '\n') {
            end_line();
            return;
        }
        open_ = true;
        if (byte == '\t') {
            runs_.append("\t");
        } else {
            append_mac_roman_char(runs_.text(), byte);
        }
    }

    std::vector<document_line<teach_run>> finish() {
        if (open_) {
            end_line();
        }
        return std::move(lines_);
    }

private:
    void end_line() {
        document_line<teach_run> line;
        line.runs = runs_.finish();
        line.alignment = alignment_;
        lines_.push_back(std::move(line));
        runs_ = run_builder<teach_run>(style_);
        open_ = false;
    }

    paragraph_alignment alignment_;
    teach_run style_;
    run_builder<teach_run> runs_;
    std::vector<document_line<teach_run>> lines_;
    bool open_ = false;
    bool last_cr_ = false;
};

} // namespace

decode_result teach_decoder::decode(std::span<const std::uint8_t> data,
                                    std::span<const std::uint8_t> resource_fork,
                                    teach_doc& doc) {
    style_block block;
    bool styled = false;

    if (!resource_fork.empty()) {
        std::span<const std::uint8_t> raw;
        auto found = find_iigs_resource(resource_fork, resource_type::STYLE_BLOCK, STYLE_BLOCK_ID, raw);
        if (found) {
            auto status = parse_style_block(raw, block);
            if (!status) {
                return status;
            }
            styled = true;
        } else if (found.error != decode_error::unrecognized_format) {
            return found;
        }
    }

    teach_lines lines(block.alignment);
    std::size_t pos = 0;
    for (const auto& item : block.items) {
        lines.set_style(block.styles[item.style]);
        const std::size_t count = std::min<std::size_t>(item.length, data.size() - pos);
        for (std::size_t i = 0; i < count; ++i) {
            lines.feed(data[pos++]);
        }
    }
    while (pos < data.size()) {
        lines.feed(data[pos++]);
    }

    teach_doc result;
    result.lines = lines.finish();
    result.styled = styled;
    doc = std::move(result);
    return decode_result::success();
}

} // namespace a2decode
