#include <a2decode/raster/macpaint.hpp>
#include "raster_helpers.hpp"

#include <array>
#include <optional>

namespace a2decode {

namespace {

constexpr int SNIFF_ROWS = 10;

// Unpack one PackBits row into `row`. Returns the next source offset, or
// nullopt when a repeat flag has no value byte.
std::optional<std::size_t> unpack_bits_row(std::span<const std::uint8_t> data, std::size_t pos,
                                           std::span<std::uint8_t> row) noexcept {
    std::size_t out = 0;
    while (out < row.size() && pos < data.size()) {
        const auto flag = static_cast<std::int8_t>(data[pos++]);
        if (flag == -128) {
            continue;
        }
        if (flag < 0) {
            if (pos >= data.size()) {
                return std::nullopt;
            }
            const std::uint8_t value = data[pos++];
            for (int i = 0; i < 1 - flag && out < row.size(); ++i) {
                row[out++] = value;
            }
        } else {
            for (int i = 0; i <= flag && out < row.size() && pos < data.size(); ++i) {
                row[out++] = data[pos++];
            }
        }
    }
    for (; out < row.size(); ++out) {
        row[out] = 0;
    }
    return pos;
}

} // namespace

bool macpaint_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < MIN_SIZE) {
        return false;
    }
    const std::uint32_t version = read_be32(data.data());
    if (version != 0 && version != 2 && version != 3) {
        return false;
    }

    std::array<std::uint8_t, ROW_BYTES> row{};
    std::size_t pos = HEADER_SIZE;
    for (int y = 0; y < SNIFF_ROWS; ++y) {
        const auto next = unpack_bits_row(data, pos, row);
        if (!next) {
            return false;
        }
        pos = *next;
    }
    return true;
}

decode_result macpaint_decoder::decode(std::span<const std::uint8_t> data, surface& surf) {
    if (data.size() < MIN_SIZE) {
        return decode_result::failure(decode_error::too_short, "MacPaint file too short");
    }
    if (!prepare_indexed(surf, WIDTH, HEIGHT, paper_ink_palette())) {
        return allocation_failure();
    }

    std::array<std::uint8_t, ROW_BYTES> packed{};
    std::array<std::uint8_t, WIDTH> line{};
    std::size_t pos = HEADER_SIZE;
    for (int y = 0; y < HEIGHT; ++y) {
        const auto next = unpack_bits_row(data, pos, packed);
        if (!next) {
            break;
        }
        pos = *next;
        for (int x = 0; x < WIDTH; ++x) {
            line[static_cast<std::size_t>(x)] = (packed[static_cast<std::size_t>(x / 8)] >> (7 - x % 8)) & 1;
        }
        surf.write_row(y, line);
    }
    return decode_result::success();
}

} // namespace a2decode
