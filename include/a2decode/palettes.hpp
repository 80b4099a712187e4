#ifndef A2DECODE_PALETTES_HPP_
#define A2DECODE_PALETTES_HPP_

#include <a2decode/a2decode_export.h>

#include <array>
#include <cstdint>

namespace a2decode {

// ============================================================================
// Apple II Family Palettes
// ============================================================================
//
// All palettes are RGB888 triplets (3 bytes per color).

// ----------------------------------------------------------------------------
// Hi-Res (HGR) artifact colors
// ----------------------------------------------------------------------------
// Adjacent set bits render white, isolated bits take a color chosen by
// column parity and the byte's high (palette) bit.

enum class hgr_color : std::uint8_t {
    black = 0,
    white = 1,
    green = 2,
    violet = 3,
    orange = 4,
    blue = 5
};

[[nodiscard]] constexpr std::array<std::uint8_t, 6 * 3> hgr_palette() noexcept {
    return {{
        0x00, 0x00, 0x00,  // 0: Black
        0xFF, 0xFF, 0xFF,  // 1: White
        0x20, 0xC0, 0x20,  // 2: Green
        0xA0, 0x20, 0xF0,  // 3: Violet
        0xFF, 0x64, 0x00,  // 4: Orange
        0x3C, 0x3C, 0xFF   // 5: Blue
    }};
}

// ----------------------------------------------------------------------------
// Double Hi-Res (DHGR) - 16 colors, 4 bits per pixel
// ----------------------------------------------------------------------------

[[nodiscard]] constexpr std::array<std::uint8_t, 16 * 3> dhgr_palette() noexcept {
    return {{
        0x00, 0x00, 0x00,  //  0: Black
        0x86, 0x12, 0xC0,  //  1: Magenta
        0x00, 0x65, 0x2B,  //  2: Dark Green
        0x30, 0x30, 0xFF,  //  3: Blue
        0xA5, 0x5F, 0x00,  //  4: Brown
        0xAC, 0xAC, 0xAC,  //  5: Light Gray
        0x00, 0xE2, 0x00,  //  6: Light Green
        0x00, 0xFF, 0x92,  //  7: Aqua
        0xE0, 0x00, 0x27,  //  8: Red
        0xDF, 0x11, 0xD4,  //  9: Purple
        0x51, 0x51, 0x51,  // 10: Dark Gray
        0x4E, 0x9E, 0xFF,  // 11: Light Blue
        0xFF, 0x27, 0x00,  // 12: Orange
        0xFF, 0x96, 0x99,  // 13: Pink
        0xFF, 0xFD, 0x00,  // 14: Yellow
        0xFF, 0xFF, 0xFF   // 15: White
    }};
}

// ----------------------------------------------------------------------------
// Apple IIgs - 12-bit color (4096 colors)
// ----------------------------------------------------------------------------

// Convert a IIgs color word (0x0RGB, little-endian in memory) to RGB888
[[nodiscard]] constexpr std::array<std::uint8_t, 3> iigs_color_to_rgb(std::uint16_t color) noexcept {
    const auto r = static_cast<std::uint8_t>((color >> 8) & 0x0F);
    const auto g = static_cast<std::uint8_t>((color >> 4) & 0x0F);
    const auto b = static_cast<std::uint8_t>(color & 0x0F);
    return {{
        static_cast<std::uint8_t>(r * 17),
        static_cast<std::uint8_t>(g * 17),
        static_cast<std::uint8_t>(b * 17)
    }};
}

// Finder / QuickDraw II default 320-mode palette
[[nodiscard]] constexpr std::array<std::uint8_t, 16 * 3> iigs_default_palette() noexcept {
    return {{
        0x00, 0x00, 0x00,  //  0: Black
        0xDD, 0x00, 0x33,  //  1: Deep Red
        0x00, 0x00, 0x99,  //  2: Dark Blue
        0xDD, 0x22, 0xDD,  //  3: Purple
        0x00, 0x77, 0x22,  //  4: Dark Green
        0x55, 0x55, 0x55,  //  5: Dark Gray
        0x22, 0x22, 0xFF,  //  6: Medium Blue
        0x66, 0xAA, 0xFF,  //  7: Light Blue
        0x88, 0x55, 0x00,  //  8: Brown
        0xFF, 0x66, 0x00,  //  9: Orange
        0xAA, 0xAA, 0xAA,  // 10: Light Gray
        0xFF, 0x99, 0x88,  // 11: Pink
        0x11, 0xDD, 0x00,  // 12: Green
        0xFF, 0xFF, 0x00,  // 13: Yellow
        0x44, 0xFF, 0x99,  // 14: Aquamarine
        0xFF, 0xFF, 0xFF   // 15: White
    }};
}

// 16-level gray ramp, used when a picture omits a color table
[[nodiscard]] constexpr std::array<std::uint8_t, 16 * 3> gray_ramp_palette() noexcept {
    std::array<std::uint8_t, 16 * 3> palette{};
    for (std::size_t i = 0; i < 16; ++i) {
        const auto gray = static_cast<std::uint8_t>(i * 17);
        palette[i * 3 + 0] = gray;
        palette[i * 3 + 1] = gray;
        palette[i * 3 + 2] = gray;
    }
    return palette;
}

// ----------------------------------------------------------------------------
// Monochrome
// ----------------------------------------------------------------------------

// Index 0 = white paper, index 1 = black ink (MacPaint convention)
[[nodiscard]] constexpr std::array<std::uint8_t, 2 * 3> paper_ink_palette() noexcept {
    return {{0xFF, 0xFF, 0xFF, 0x00, 0x00, 0x00}};
}

// Index 0 = black, index 1 = white (monochrome monitor)
[[nodiscard]] constexpr std::array<std::uint8_t, 2 * 3> monochrome_palette() noexcept {
    return {{0x00, 0x00, 0x00, 0xFF, 0xFF, 0xFF}};
}

} // namespace a2decode

#endif // A2DECODE_PALETTES_HPP_
