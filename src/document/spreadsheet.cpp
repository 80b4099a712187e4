#include <a2decode/document/appleworks.hpp>
#include "charset.hpp"
#include "../byte_io.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstdio>

namespace a2decode {

namespace {

constexpr std::size_t VERSION3_EXTRA = 2;
constexpr std::size_t ROW_HEADER_SIZE = 4;
constexpr std::uint8_t ROW_END = 0xFF;
constexpr std::uint8_t FIRST_SKIP = 0x81;
constexpr std::uint8_t LAST_SKIP = 0xFE;
constexpr std::size_t REPEAT_WIDTH = 8;

// Cell flag bits
constexpr std::uint8_t FLAG_VALUE = 0x80;
constexpr std::uint8_t FLAG_CONSTANT = 0x20;     // value constant, or repeated label
constexpr std::uint8_t FLAG_DISPLAY_STRING = 0x08;

decode_result corrupt(std::string msg) {
    return decode_result::failure(decode_error::corrupt_document, std::move(msg));
}

double read_double(const std::uint8_t* p) noexcept {
    std::uint64_t bits = 0;
    for (int i = 7; i >= 0; --i) {
        bits = (bits << 8) | p[i];
    }
    return std::bit_cast<double>(bits);
}

std::string format_number(double value) {
    char buf[64];
    if (value == std::round(value) && std::fabs(value) < 1e10) {
        std::snprintf(buf, sizeof(buf), "%.0f", value);
    } else {
        std::snprintf(buf, sizeof(buf), "%.6g", value);
    }
    return buf;
}

std::string decode_cell(std::span<const std::uint8_t> cell) {
    const std::uint8_t flags = cell[0];

    if (!(flags & FLAG_VALUE)) {
        std::string text;
        if (flags & FLAG_CONSTANT) {
            if (cell.size() >= 2) {
                std::string glyph;
                append_appleworks_char(glyph, cell[1]);
                for (std::size_t i = 0; i < REPEAT_WIDTH; ++i) {
                    text += glyph;
                }
            }
            return text;
        }
        for (std::size_t i = 1; i < cell.size(); ++i) {
            append_appleworks_char(text, cell[i]);
        }
        return text;
    }

    if (cell.size() < 2) {
        return {};
    }
    const bool display_string = !(flags & FLAG_CONSTANT) && (cell[1] & FLAG_DISPLAY_STRING);
    if (display_string) {
        if (cell.size() < 3 || cell.size() < 3u + cell[2]) {
            return {};
        }
        std::string text;
        for (std::size_t i = 0; i < cell[2]; ++i) {
            append_appleworks_char(text, cell[3 + i]);
        }
        return text;
    }

    // Constant, or a formula's cached result
    if (cell.size() < 10) {
        return {};
    }
    return format_number(read_double(cell.data() + 2));
}

} // namespace

bool appleworks_ss_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    return data.size() >= HEADER_SIZE;
}

decode_result appleworks_ss_decoder::decode(std::span<const std::uint8_t> data,
                                            spreadsheet_doc& doc) {
    if (data.size() < HEADER_SIZE) {
        return decode_result::failure(decode_error::too_short, "AppleWorks SS header truncated");
    }

    std::size_t pos = HEADER_SIZE;
    if (data[MIN_VERSION_OFFSET] != 0) {
        pos += VERSION3_EXTRA;
    }

    spreadsheet_doc result;
    while (pos + ROW_HEADER_SIZE <= data.size()) {
        if (data[pos] == 0xFF && data[pos + 1] == 0xFF) {
            break;
        }
        const std::size_t length = read_le16(data.data() + pos);
        const std::size_t row = read_le16(data.data() + pos + 2);
        pos += ROW_HEADER_SIZE;
        if (length == 0) {
            continue;
        }
        // The length counts the row number word
        if (length < 2 || length - 2 > data.size() - pos) {
            return corrupt("Row " + std::to_string(row) + " truncated");
        }
        const std::size_t row_end = pos + length - 2;

        if (result.rows.size() <= row) {
            result.rows.resize(row + 1);
        }
        auto& cells = result.rows[row];
        std::size_t column = 0;

        while (pos < row_end) {
            const std::uint8_t control = data[pos++];
            if (control == ROW_END) {
                break;
            }
            if (control >= FIRST_SKIP && control <= LAST_SKIP) {
                column += control - 0x80u;
            } else if (control >= 0x01 && control <= 0x7F) {
                if (row_end - pos < control) {
                    return corrupt("Cell overruns row " + std::to_string(row));
                }
                if (cells.size() <= column) {
                    cells.resize(column + 1);
                }
                cells[column] = decode_cell(data.subspan(pos, control));
                pos += control;
                result.max_column = std::max(result.max_column, static_cast<int>(column));
                ++column;
            } else {
                return corrupt("Invalid cell control byte in row " + std::to_string(row));
            }
        }
        pos = row_end;
        result.max_row = std::max(result.max_row, static_cast<int>(row));
    }

    for (auto& cells : result.rows) {
        cells.resize(static_cast<std::size_t>(result.max_column) + 1);
    }

    doc = std::move(result);
    return decode_result::success();
}

} // namespace a2decode
