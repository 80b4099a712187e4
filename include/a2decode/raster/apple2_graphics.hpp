#ifndef A2DECODE_RASTER_APPLE2_GRAPHICS_HPP_
#define A2DECODE_RASTER_APPLE2_GRAPHICS_HPP_

#include <a2decode/a2decode_export.h>
#include <a2decode/surface.hpp>
#include <a2decode/types.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace a2decode {

// ============================================================================
// Raster Model
// ============================================================================

enum class raster_format {
    unknown,
    hgr,          // 280x192, artifact colour or monochrome
    dhgr,         // 560x192, 16 colours
    shr,          // 320x200 (or 640x200), SCB-selected palettes
    shr_3200,     // 320x200, one palette per scan line
    shr_packed,   // PackBytes-compressed SHR screen
    apf,          // Apple Preferred Format
    paintworks,   // Paintworks packed picture
    macpaint      // 576x720 monochrome
};

[[nodiscard]] A2DECODE_EXPORT const char* to_string(raster_format fmt) noexcept;

struct raster_options {
    std::optional<std::uint8_t> type;    // ProDOS file type
    std::optional<std::uint16_t> aux;    // aux type or load address
    bool monochrome = false;             // HGR without colour artifacts
};

struct raster_image {
    raster_format format = raster_format::unknown;
    memory_surface surface;
};

// ============================================================================
// 8-bit Screens
// ============================================================================

/**
 * Hi-Res screen dump (8184..8200 bytes).
 * Writes indexed8 with the 6-entry artifact palette, or the 2-entry
 * monochrome palette when `monochrome` is set.
 */
class A2DECODE_EXPORT hgr_decoder {
public:
    static constexpr std::string_view name = "hgr";
    static constexpr int WIDTH = 280;
    static constexpr int HEIGHT = 192;
    static constexpr std::size_t MIN_SIZE = 8184;
    static constexpr std::size_t MAX_SIZE = 8200;

    /**
     * Offset of a scan line within the screen buffer.
     */
    [[nodiscard]] static constexpr std::size_t row_offset(int y) noexcept {
        return static_cast<std::size_t>((y % 8) * 1024 + ((y / 8) % 8) * 128 + (y / 64) * 40);
    }

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                              surface& surf,
                                              bool monochrome = false);
};

/**
 * Double Hi-Res screen dump: 8 KB auxiliary bank then 8 KB main bank.
 * Writes indexed8, 560x192, one 16-colour pixel per four bits.
 */
class A2DECODE_EXPORT dhgr_decoder {
public:
    static constexpr std::string_view name = "dhgr";
    static constexpr int WIDTH = 560;
    static constexpr int HEIGHT = 192;
    static constexpr std::size_t BANK_SIZE = 8192;
    static constexpr std::size_t FILE_SIZE = 16384;

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                              surface& surf);
};

// ============================================================================
// Super Hi-Res
// ============================================================================

/**
 * Super Hi-Res screen ($C1/$0000): 32000 pixel bytes, 200 SCBs, 16 palettes.
 * Writes RGBA. A scan line whose SCB has bit 7 set is 640-mode; when any
 * line is, the picture is 640 wide and 320-mode lines are pixel-doubled.
 */
class A2DECODE_EXPORT shr_decoder {
public:
    static constexpr std::string_view name = "shr";
    static constexpr int WIDTH = 320;
    static constexpr int HEIGHT = 200;
    static constexpr std::size_t PIXEL_BYTES = 32000;
    static constexpr std::size_t SCB_OFFSET = 32000;
    static constexpr std::size_t PALETTE_OFFSET = 32256;
    static constexpr std::size_t MAX_SIZE = 32768;

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                              surface& surf);
};

/**
 * 3200-colour picture ($C1/$0002): 32000 pixel bytes followed by 200
 * palettes of 16 colours, each stored in reverse order.
 */
class A2DECODE_EXPORT shr3200_decoder {
public:
    static constexpr std::string_view name = "shr3200";
    static constexpr std::size_t PALETTE_OFFSET = 32000;
    static constexpr std::size_t MIN_SIZE = 38400;
    static constexpr std::size_t MAX_SIZE = 39000;

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                              surface& surf);
};

/**
 * Apple Preferred Format ($C0/$0002): a chain of (length, name, data)
 * blocks. MAIN holds the colour tables, scan-line directory and
 * PackBytes lines; an optional MULTIPAL block supplies one palette per line.
 */
class A2DECODE_EXPORT apf_decoder {
public:
    static constexpr std::string_view name = "apf";
    static constexpr int MAX_WIDTH = 1280;
    static constexpr int MAX_LINES = 400;

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                              surface& surf);
};

/**
 * Paintworks packed picture ($C0/$0000): 16-colour palette at 0, PackBytes
 * data at $222. Writes indexed8, 320 wide, up to 396 lines.
 */
class A2DECODE_EXPORT paintworks_decoder {
public:
    static constexpr std::string_view name = "paintworks";
    static constexpr std::size_t DATA_OFFSET = 0x222;
    static constexpr std::size_t MAX_UNPACKED = 64000;
    static constexpr int MAX_LINES = 396;

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                              surface& surf);
};

// ============================================================================
// Convenience Functions
// ============================================================================

/**
 * Expand Apple PackBytes data.
 * Flag byte: bits 7-6 select literal / repeat byte / repeat 4-byte pattern /
 * repeat byte x4, bits 5-0 hold count - 1.
 * @param data Packed bytes
 * @param max_output Output is truncated at this many bytes
 */
[[nodiscard]] A2DECODE_EXPORT std::vector<std::uint8_t> unpack_bytes(std::span<const std::uint8_t> data,
                                                                     std::size_t max_output);

/**
 * Choose a raster format from the type/aux hints and the buffer length.
 * @return raster_format::unknown when nothing matches
 */
[[nodiscard]] A2DECODE_EXPORT raster_format identify_raster(std::span<const std::uint8_t> data,
                                                            const raster_options& options = {}) noexcept;

/**
 * Identify and decode in one step.
 * @param image Filled on success
 * @return Decode result (unrecognized_format when identification fails)
 */
[[nodiscard]] A2DECODE_EXPORT decode_result decode_raster(std::span<const std::uint8_t> data,
                                                          raster_image& image,
                                                          const raster_options& options = {});

} // namespace a2decode

#endif // A2DECODE_RASTER_APPLE2_GRAPHICS_HPP_
