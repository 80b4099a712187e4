#include <a2decode/raster/apple2_graphics.hpp>
#include "raster_helpers.hpp"

#include <algorithm>
#include <string>
#include <string_view>

namespace a2decode {

namespace {

constexpr std::size_t SHR_BYTES_PER_LINE = 160;
constexpr std::size_t COLOR_TABLE_SIZE = 32;
constexpr std::uint8_t SCB_640_MODE = 0x80;

// PackBytes flag modes
constexpr std::uint8_t PACK_LITERAL = 0x00;
constexpr std::uint8_t PACK_REPEAT_BYTE = 0x40;
constexpr std::uint8_t PACK_REPEAT_QUAD = 0x80;

// APF block header: length (4), name length (1), name
constexpr std::size_t APF_BLOCK_HEADER = 5;

rgb_table default_color_table() noexcept {
    return iigs_default_palette();
}

decode_result write_rgba_rows(surface& surf, const std::vector<std::uint8_t>& rgba, int width, int height) {
    const std::size_t pitch = static_cast<std::size_t>(width) * 4;
    for (int y = 0; y < height; ++y) {
        surf.write_row(y, std::span<const std::uint8_t>(rgba).subspan(static_cast<std::size_t>(y) * pitch, pitch));
    }
    return decode_result::success();
}

struct apf_block {
    std::string_view name;
    std::span<const std::uint8_t> body;
};

std::vector<apf_block> read_apf_blocks(std::span<const std::uint8_t> data) {
    std::vector<apf_block> blocks;
    std::size_t pos = 0;
    while (data.size() - pos >= APF_BLOCK_HEADER) {
        const std::size_t length = read_le32(data.data() + pos);
        const std::size_t name_length = data[pos + 4];
        if (length < APF_BLOCK_HEADER + name_length || length > data.size() - pos || name_length == 0) {
            break;
        }
        apf_block block;
        block.name = std::string_view(reinterpret_cast<const char*>(data.data() + pos + 5), name_length);
        block.body = data.subspan(pos + APF_BLOCK_HEADER + name_length, length - APF_BLOCK_HEADER - name_length);
        blocks.push_back(block);
        pos += length;
    }
    return blocks;
}

const apf_block* find_block(const std::vector<apf_block>& blocks, std::string_view name) {
    const auto it = std::find_if(blocks.begin(), blocks.end(),
                                 [name](const apf_block& b) { return b.name == name; });
    return it == blocks.end() ? nullptr : &*it;
}

} // namespace

// ============================================================================
// PackBytes
// ============================================================================

std::vector<std::uint8_t> unpack_bytes(std::span<const std::uint8_t> data, std::size_t max_output) {
    std::vector<std::uint8_t> out;
    out.reserve(std::min(max_output, data.size() * 4));

    std::size_t pos = 0;
    while (pos < data.size() && out.size() < max_output) {
        const std::uint8_t flag = data[pos++];
        const std::size_t count = static_cast<std::size_t>(flag & 0x3F) + 1;
        const std::size_t room = max_output - out.size();

        switch (flag & 0xC0) {
            case PACK_LITERAL: {
                const std::size_t n = std::min({count, data.size() - pos, room});
                out.insert(out.end(), data.begin() + static_cast<std::ptrdiff_t>(pos),
                           data.begin() + static_cast<std::ptrdiff_t>(pos + n));
                pos += n;
                break;
            }
            case PACK_REPEAT_BYTE:
                if (pos < data.size()) {
                    out.insert(out.end(), std::min(count, room), data[pos++]);
                }
                break;
            case PACK_REPEAT_QUAD:
                if (data.size() - pos >= 4) {
                    for (std::size_t i = 0; i < count * 4 && out.size() < max_output; ++i) {
                        out.push_back(data[pos + i % 4]);
                    }
                    pos += 4;
                }
                break;
            default:
                if (pos < data.size()) {
                    out.insert(out.end(), std::min(count * 4, room), data[pos++]);
                }
                break;
        }
    }
    return out;
}

// ============================================================================
// Super Hi-Res
// ============================================================================

bool shr_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    return data.size() >= PIXEL_BYTES && data.size() <= MAX_SIZE;
}

decode_result shr_decoder::decode(std::span<const std::uint8_t> data, surface& surf) {
    if (data.size() < PIXEL_BYTES) {
        return decode_result::failure(decode_error::too_short, "SHR screen needs 32000 bytes");
    }

    // Missing SCBs read as 0, missing palettes as a grey ramp
    auto scb = [&](int y) -> std::uint8_t {
        const std::size_t at = SCB_OFFSET + static_cast<std::size_t>(y);
        return at < data.size() ? data[at] : 0;
    };
    std::array<rgb_table, 16> palettes;
    for (std::size_t i = 0; i < palettes.size(); ++i) {
        const std::size_t at = PALETTE_OFFSET + i * COLOR_TABLE_SIZE;
        palettes[i] = at + COLOR_TABLE_SIZE <= data.size() ? read_color_table(data.data() + at)
                                                            : gray_ramp_palette();
    }

    bool wide = false;
    for (int y = 0; y < HEIGHT; ++y) {
        wide = wide || (scb(y) & SCB_640_MODE) != 0;
    }
    const int width = wide ? WIDTH * 2 : WIDTH;

    if (!surf.set_size(width, HEIGHT, pixel_format::rgba8888)) {
        return allocation_failure();
    }

    std::vector<std::uint8_t> rgba(static_cast<std::size_t>(width) * HEIGHT * 4);
    for (int y = 0; y < HEIGHT; ++y) {
        const std::uint8_t control = scb(y);
        const auto line = data.subspan(static_cast<std::size_t>(y) * SHR_BYTES_PER_LINE, SHR_BYTES_PER_LINE);
        std::uint8_t* dst = rgba.data() + static_cast<std::size_t>(y) * width * 4;
        const rgb_table& table = palettes[control & 0x0F];
        if (control & SCB_640_MODE) {
            expand_640_line(line, table, dst);
        } else {
            expand_320_line(line, table, dst, wide ? 2 : 1);
        }
    }
    return write_rgba_rows(surf, rgba, width, HEIGHT);
}

// ============================================================================
// 3200 Colour
// ============================================================================

bool shr3200_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    return data.size() >= MIN_SIZE && data.size() <= MAX_SIZE;
}

decode_result shr3200_decoder::decode(std::span<const std::uint8_t> data, surface& surf) {
    if (data.size() < MIN_SIZE) {
        return decode_result::failure(decode_error::too_short, "3200-colour picture needs 38400 bytes");
    }
    constexpr int width = shr_decoder::WIDTH;
    constexpr int height = shr_decoder::HEIGHT;
    if (!surf.set_size(width, height, pixel_format::rgba8888)) {
        return allocation_failure();
    }

    std::vector<std::uint8_t> rgba(static_cast<std::size_t>(width) * height * 4);
    for (int y = 0; y < height; ++y) {
        const auto table = read_color_table(data.data() + PALETTE_OFFSET + static_cast<std::size_t>(y) * COLOR_TABLE_SIZE,
                                            true);
        expand_320_line(data.subspan(static_cast<std::size_t>(y) * SHR_BYTES_PER_LINE, SHR_BYTES_PER_LINE),
                        table, rgba.data() + static_cast<std::size_t>(y) * width * 4);
    }
    return write_rgba_rows(surf, rgba, width, height);
}

// ============================================================================
// Apple Preferred Format
// ============================================================================

bool apf_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < 20) {
        return false;
    }
    const std::size_t length = read_le32(data.data());
    const std::size_t name_length = data[4];
    if (length < 10 || length > data.size() || name_length < 4 || name_length > 15) {
        return false;
    }
    const std::string_view block_name(reinterpret_cast<const char*>(data.data() + 5), name_length);
    for (const std::string_view known : {"MAIN", "PATS", "SCIB", "PALETTES", "MASK", "MULTIPAL", "NOTE"}) {
        if (block_name == known) {
            return true;
        }
    }
    return false;
}

decode_result apf_decoder::decode(std::span<const std::uint8_t> data, surface& surf) {
    const auto blocks = read_apf_blocks(data);
    const apf_block* main_block = find_block(blocks, "MAIN");
    if (main_block == nullptr) {
        return decode_result::failure(decode_error::unrecognized_format, "APF file has no MAIN block");
    }

    const auto body = main_block->body;
    auto corrupt = [](std::string msg) {
        return decode_result::failure(decode_error::corrupt_document, std::move(msg));
    };
    if (body.size() < 6) {
        return corrupt("APF MAIN block truncated");
    }
    const std::uint16_t master_mode = read_le16(body.data());
    const int width = read_le16(body.data() + 2);
    const std::size_t table_count = read_le16(body.data() + 4);
    if (width <= 0 || width > MAX_WIDTH) {
        return corrupt("APF width " + std::to_string(width) + " out of range");
    }

    std::size_t pos = 6;
    if ((body.size() - pos) / COLOR_TABLE_SIZE < table_count) {
        return corrupt("APF colour tables truncated");
    }
    std::vector<rgb_table> tables;
    for (std::size_t i = 0; i < table_count; ++i) {
        tables.push_back(read_color_table(body.data() + pos));
        pos += COLOR_TABLE_SIZE;
    }

    if (body.size() - pos < 2) {
        return corrupt("APF scan line count missing");
    }
    const int height = read_le16(body.data() + pos);
    pos += 2;
    if (height <= 0 || height > MAX_LINES) {
        return corrupt("APF line count " + std::to_string(height) + " out of range");
    }
    if ((body.size() - pos) / 4 < static_cast<std::size_t>(height)) {
        return corrupt("APF scan line directory truncated");
    }
    std::vector<std::pair<std::size_t, std::uint16_t>> directory;
    for (int y = 0; y < height; ++y) {
        directory.emplace_back(read_le16(body.data() + pos), read_le16(body.data() + pos + 2));
        pos += 4;
    }

    // Per-line palettes when MULTIPAL covers every line
    std::vector<rgb_table> line_tables;
    if (const apf_block* multipal = find_block(blocks, "MULTIPAL"); multipal && multipal->body.size() >= 2) {
        const std::size_t count = read_le16(multipal->body.data());
        for (std::size_t i = 0; i < count && 2 + (i + 1) * COLOR_TABLE_SIZE <= multipal->body.size(); ++i) {
            line_tables.push_back(read_color_table(multipal->body.data() + 2 + i * COLOR_TABLE_SIZE));
        }
        if (line_tables.size() < static_cast<std::size_t>(height)) {
            line_tables.clear();
        }
    }

    const bool mode_640 = (master_mode & SCB_640_MODE) != 0;
    const std::size_t bytes_per_line = static_cast<std::size_t>(width) / (mode_640 ? 4 : 2);
    if (!surf.set_size(width, height, pixel_format::rgba8888)) {
        return allocation_failure();
    }

    std::vector<std::uint8_t> rgba(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4);
    const rgb_table fallback = tables.empty() ? default_color_table() : tables.front();
    for (int y = 0; y < height; ++y) {
        const auto [packed_size, mode] = directory[static_cast<std::size_t>(y)];
        std::vector<std::uint8_t> line;
        if (body.size() - pos >= packed_size) {
            line = unpack_bytes(body.subspan(pos, packed_size), bytes_per_line);
            pos += packed_size;
        }
        line.resize(bytes_per_line, 0);

        const std::size_t table_index = mode & 0x0F;
        const rgb_table& table = !line_tables.empty() ? line_tables[static_cast<std::size_t>(y)]
                                 : table_index < tables.size() ? tables[table_index] : fallback;
        std::uint8_t* dst = rgba.data() + static_cast<std::size_t>(y) * static_cast<std::size_t>(width) * 4;
        if (mode_640) {
            expand_640_line(line, table, dst);
        } else {
            expand_320_line(line, table, dst);
        }
    }
    return write_rgba_rows(surf, rgba, width, height);
}

// ============================================================================
// Paintworks
// ============================================================================

bool paintworks_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < DATA_OFFSET) {
        return false;
    }
    for (std::size_t i = 0; i < 16; ++i) {
        if (data[i * 2 + 1] & 0xF0) {
            return false;
        }
    }
    return true;
}

decode_result paintworks_decoder::decode(std::span<const std::uint8_t> data, surface& surf) {
    if (data.size() <= DATA_OFFSET) {
        return decode_result::failure(decode_error::too_short, "Paintworks header truncated");
    }

    const rgb_table palette = read_color_table(data.data());
    const auto packed = data.subspan(DATA_OFFSET);
    std::vector<std::uint8_t> pixels = unpack_bytes(packed, MAX_UNPACKED);
    int height = 0;
    if (pixels.size() >= shr_decoder::PIXEL_BYTES) {
        height = std::min(static_cast<int>(pixels.size() / SHR_BYTES_PER_LINE), MAX_LINES);
    } else if (packed.size() >= shr_decoder::PIXEL_BYTES && packed.size() <= 33000) {
        // Some files store the screen unpacked
        pixels.assign(packed.begin(), packed.begin() + shr_decoder::PIXEL_BYTES);
        height = shr_decoder::HEIGHT;
    } else {
        return decode_result::failure(decode_error::corrupt_document,
            "Paintworks data unpacks to " + std::to_string(pixels.size()) + " bytes");
    }

    if (!prepare_indexed(surf, shr_decoder::WIDTH, height, palette)) {
        return allocation_failure();
    }
    std::array<std::uint8_t, shr_decoder::WIDTH> line{};
    for (int y = 0; y < height; ++y) {
        const std::uint8_t* src = pixels.data() + static_cast<std::size_t>(y) * SHR_BYTES_PER_LINE;
        for (std::size_t i = 0; i < SHR_BYTES_PER_LINE; ++i) {
            line[i * 2] = src[i] >> 4;
            line[i * 2 + 1] = src[i] & 0x0F;
        }
        surf.write_row(y, line);
    }
    return decode_result::success();
}

} // namespace a2decode
