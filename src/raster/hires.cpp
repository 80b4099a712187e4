#include <a2decode/raster/apple2_graphics.hpp>
#include "raster_helpers.hpp"

#include <array>

namespace a2decode {

namespace {

constexpr int BYTES_PER_ROW = 40;
constexpr int BITS_PER_BYTE = 7;

// Artifact colour of a lone set or clear bit next to its neighbour
std::uint8_t artifact_color(bool bit, int column, bool high_bit) noexcept {
    const bool even = (column % 2) == 0;
    if (high_bit) {
        return static_cast<std::uint8_t>((even == bit) ? hgr_color::blue : hgr_color::orange);
    }
    return static_cast<std::uint8_t>((even == bit) ? hgr_color::violet : hgr_color::green);
}

} // namespace

// ============================================================================
// Hi-Res
// ============================================================================

bool hgr_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    return data.size() >= MIN_SIZE && data.size() <= MAX_SIZE;
}

decode_result hgr_decoder::decode(std::span<const std::uint8_t> data,
                                  surface& surf,
                                  bool monochrome) {
    if (data.size() < MIN_SIZE) {
        return decode_result::failure(decode_error::too_short, "HGR screen needs 8184 bytes");
    }

    const bool ok = monochrome ? prepare_indexed(surf, WIDTH, HEIGHT, monochrome_palette())
                               : prepare_indexed(surf, WIDTH, HEIGHT, hgr_palette());
    if (!ok) {
        return allocation_failure();
    }

    std::array<std::uint8_t, WIDTH> line{};
    for (int y = 0; y < HEIGHT; ++y) {
        const std::uint8_t* row = data.data() + row_offset(y);
        for (int xb = 0; xb < BYTES_PER_ROW; ++xb) {
            const std::uint8_t byte = row[xb];
            const std::uint8_t next = xb + 1 < BYTES_PER_ROW ? row[xb + 1] : 0;
            const bool high_bit = (byte & 0x80) != 0;

            for (int bit = 0; bit < BITS_PER_BYTE; ++bit) {
                const int x = xb * BITS_PER_BYTE + bit;
                const bool a = ((byte >> bit) & 1) != 0;
                if (monochrome) {
                    line[x] = a ? 1 : 0;
                    continue;
                }
                const bool b = bit == BITS_PER_BYTE - 1 ? (next & 1) != 0 : ((byte >> (bit + 1)) & 1) != 0;
                if (a == b) {
                    line[x] = static_cast<std::uint8_t>(a ? hgr_color::white : hgr_color::black);
                } else {
                    line[x] = artifact_color(a, x, high_bit);
                }
            }
        }
        surf.write_row(y, line);
    }

    return decode_result::success();
}

// ============================================================================
// Double Hi-Res
// ============================================================================

bool dhgr_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    return data.size() == FILE_SIZE;
}

decode_result dhgr_decoder::decode(std::span<const std::uint8_t> data, surface& surf) {
    if (data.size() < FILE_SIZE) {
        return decode_result::failure(decode_error::too_short, "DHGR screen needs 16384 bytes");
    }
    if (!prepare_indexed(surf, WIDTH, HEIGHT, dhgr_palette())) {
        return allocation_failure();
    }

    const std::uint8_t* aux_bank = data.data();
    const std::uint8_t* main_bank = data.data() + BANK_SIZE;
    std::array<std::uint8_t, WIDTH> line{};

    for (int y = 0; y < HEIGHT; ++y) {
        const std::size_t offset = hgr_decoder::row_offset(y);

        // 80 columns alternate aux and main, seven bits each, LSB first
        std::uint32_t bits = 0;
        int bit_count = 0;
        int x = 0;
        for (int column = 0; column < BYTES_PER_ROW * 2; ++column) {
            const std::uint8_t byte = (column % 2 == 0 ? aux_bank : main_bank)[offset + column / 2];
            bits |= static_cast<std::uint32_t>(byte & 0x7F) << bit_count;
            bit_count += BITS_PER_BYTE;
            while (bit_count >= 4) {
                const auto color = static_cast<std::uint8_t>(bits & 0x0F);
                for (int r = 0; r < 4; ++r) {
                    line[x++] = color;
                }
                bits >>= 4;
                bit_count -= 4;
            }
        }
        surf.write_row(y, line);
    }

    return decode_result::success();
}

} // namespace a2decode
