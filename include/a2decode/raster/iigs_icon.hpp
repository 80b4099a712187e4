#ifndef A2DECODE_RASTER_IIGS_ICON_HPP_
#define A2DECODE_RASTER_IIGS_ICON_HPP_

#include <a2decode/a2decode_export.h>
#include <a2decode/surface.hpp>
#include <a2decode/types.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace a2decode {

// ============================================================================
// Icon Model
// ============================================================================

/**
 * One icon bitmap from a Finder icon file.
 *
 * When `decodable` is false the header was read but its size field does
 * not agree with its dimensions or its data runs past the record; `surface`
 * and `mask` are then empty.
 */
struct icon_image {
    std::uint16_t icon_type = 0;     // bit 15 set: colour icon
    int width = 0;
    int height = 0;
    bool decodable = false;
    memory_surface surface;          // RGBA, alpha from the mask
    std::vector<std::uint8_t> mask;  // 1 bpp, MSB first, (width + 7) / 8 bytes per row

    /**
     * Mask bit for a pixel; false outside the icon.
     */
    [[nodiscard]] bool opaque(int x, int y) const noexcept;
};

struct icon_entry {
    std::string pathname;      // display name: name filter, else boss path
    std::string boss_path;     // owning application pathname
    std::string name_filter;   // file name pattern the icon applies to
    std::optional<icon_image> large;
    std::optional<icon_image> small;
};

struct icon_resource {
    std::vector<icon_entry> entries;
};

// ============================================================================
// Decoder
// ============================================================================

/**
 * Apple IIgs Finder icon file (ProDOS type $CA).
 *
 * A 26-byte file header is followed by length-prefixed records, each with a
 * 64-byte boss pathname, a 16-byte name filter and a large then small icon.
 * Icon pixels are 4 bpp in the IIgs default palette; the mask is 4 bpp too,
 * a zero nibble marking a transparent pixel.
 */
class A2DECODE_EXPORT iigs_icon_decoder {
public:
    static constexpr std::string_view name = "iigs_icon";

    static constexpr std::size_t HEADER_SIZE = 0x1A;
    static constexpr std::size_t BOSS_OFFSET = 0x02;
    static constexpr std::size_t BOSS_SIZE = 64;
    static constexpr std::size_t FILTER_OFFSET = 0x42;
    static constexpr std::size_t FILTER_SIZE = 16;
    static constexpr std::size_t LARGE_ICON_OFFSET = 0x56;
    static constexpr std::size_t ICON_HEADER_SIZE = 8;
    static constexpr int MAX_DIMENSION = 128;

    /**
     * Bytes of 4 bpp data an icon of the given width and height occupies.
     */
    [[nodiscard]] static constexpr std::size_t image_size(int width, int height) noexcept {
        return static_cast<std::size_t>(height) * static_cast<std::size_t>(1 + (width - 1) / 2);
    }

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Decode every record of the file.
     * @param resource Filled on success
     * @return unrecognized_format when no record can be read
     */
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                              icon_resource& resource);
};

} // namespace a2decode

#endif // A2DECODE_RASTER_IIGS_ICON_HPP_
