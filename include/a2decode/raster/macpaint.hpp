#ifndef A2DECODE_RASTER_MACPAINT_HPP_
#define A2DECODE_RASTER_MACPAINT_HPP_

#include <a2decode/a2decode_export.h>
#include <a2decode/surface.hpp>
#include <a2decode/types.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace a2decode {

/**
 * MacPaint document.
 *
 * A 512-byte header (big-endian version 0, 2 or 3, then brush patterns)
 * followed by 720 PackBits-compressed rows of 72 bytes. Set bits are black.
 * Writes indexed8 with paper_ink_palette().
 */
class A2DECODE_EXPORT macpaint_decoder {
public:
    static constexpr std::string_view name = "macpaint";

    static constexpr int WIDTH = 576;
    static constexpr int HEIGHT = 720;
    static constexpr std::size_t ROW_BYTES = 72;
    static constexpr std::size_t HEADER_SIZE = 512;
    static constexpr std::size_t MIN_SIZE = HEADER_SIZE + 100;

    /**
     * Version word is 0, 2 or 3 and the first ten rows unpack cleanly.
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Decode the bitmap. Rows past a truncated stream stay white.
     */
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                              surface& surf);
};

} // namespace a2decode

#endif // A2DECODE_RASTER_MACPAINT_HPP_
