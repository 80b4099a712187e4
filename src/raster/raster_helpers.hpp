#pragma once

#include <a2decode/palettes.hpp>
#include <a2decode/surface.hpp>
#include <a2decode/types.hpp>
#include "../byte_io.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace a2decode {

using rgb_table = std::array<std::uint8_t, 16 * 3>;

inline decode_result allocation_failure() {
    return decode_result::failure(decode_error::internal_error, "Failed to allocate surface");
}

// Allocate an indexed surface and load its palette
template <std::size_t N>
bool prepare_indexed(surface& surf, int width, int height, const std::array<std::uint8_t, N>& palette) {
    if (!surf.set_size(width, height, pixel_format::indexed8)) {
        return false;
    }
    surf.set_palette(palette);
    return true;
}

// Sixteen IIgs colour words ($0RGB, little-endian)
inline rgb_table read_color_table(const std::uint8_t* p, bool reversed = false) noexcept {
    rgb_table table{};
    for (std::size_t i = 0; i < 16; ++i) {
        const auto rgb = iigs_color_to_rgb(read_le16(p + i * 2));
        const std::size_t slot = reversed ? 15 - i : i;
        table[slot * 3 + 0] = rgb[0];
        table[slot * 3 + 1] = rgb[1];
        table[slot * 3 + 2] = rgb[2];
    }
    return table;
}

inline void put_rgba(std::uint8_t* dst, const rgb_table& table, std::size_t index) noexcept {
    dst[0] = table[index * 3 + 0];
    dst[1] = table[index * 3 + 1];
    dst[2] = table[index * 3 + 2];
    dst[3] = 0xFF;
}

// One 4-bit-per-pixel scan line (high nibble first) to RGBA.
// `repeat` widens each pixel, for 320-mode lines in a 640-wide picture.
inline void expand_320_line(std::span<const std::uint8_t> src, const rgb_table& table,
                            std::uint8_t* dst, int repeat = 1) noexcept {
    for (const std::uint8_t byte : src) {
        for (const int index : {byte >> 4, byte & 0x0F}) {
            for (int r = 0; r < repeat; ++r) {
                put_rgba(dst, table, static_cast<std::size_t>(index));
                dst += 4;
            }
        }
    }
}

// One 2-bit-per-pixel scan line to RGBA. The four pixels of a byte draw
// from palette entries 8-11, 12-15, 0-3 and 4-7 in turn.
inline void expand_640_line(std::span<const std::uint8_t> src, const rgb_table& table,
                            std::uint8_t* dst) noexcept {
    constexpr std::size_t BANK[4] = {8, 12, 0, 4};
    for (const std::uint8_t byte : src) {
        for (int p = 0; p < 4; ++p) {
            const std::size_t value = (byte >> (6 - p * 2)) & 0x03;
            put_rgba(dst, table, BANK[p] + value);
            dst += 4;
        }
    }
}

} // namespace a2decode
