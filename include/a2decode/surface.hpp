#ifndef A2DECODE_SURFACE_HPP_
#define A2DECODE_SURFACE_HPP_

#include <a2decode/a2decode_export.h>
#include <a2decode/types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace a2decode {

// ============================================================================
// Surface Interface
// ============================================================================

/**
 * Destination for decoded pictures.
 *
 * Apple II screens are produced one scan line at a time, so a surface
 * receives whole rows. Callers can implement it over their own texture
 * type; memory_surface keeps everything in RAM.
 */
class A2DECODE_EXPORT surface {
public:
    virtual ~surface() = default;

    /**
     * Allocate width x height pixels. Called once before any row is written.
     * @return false if the size is invalid or allocation failed
     */
    virtual bool set_size(int width, int height, pixel_format format) = 0;

    /**
     * Store one scan line. `bytes` holds width pixels in the surface format
     * (1 byte per indexed pixel, 4 per RGBA pixel); extra bytes are ignored.
     */
    virtual void write_row(int y, std::span<const std::uint8_t> bytes) = 0;

    /**
     * Replace the colour table of an indexed surface.
     * @param rgb RGB triplets, at most 256 entries
     */
    virtual void set_palette(std::span<const std::uint8_t> rgb) { (void)rgb; }
};

// ============================================================================
// Memory Surface
// ============================================================================

class A2DECODE_EXPORT memory_surface : public surface {
public:
    memory_surface() = default;
    ~memory_surface() override = default;

    memory_surface(const memory_surface&) = delete;
    memory_surface& operator=(const memory_surface&) = delete;
    memory_surface(memory_surface&&) noexcept = default;
    memory_surface& operator=(memory_surface&&) noexcept = default;

    bool set_size(int width, int height, pixel_format format) override;
    void write_row(int y, std::span<const std::uint8_t> bytes) override;
    void set_palette(std::span<const std::uint8_t> rgb) override;

    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] pixel_format format() const noexcept { return format_; }
    [[nodiscard]] std::size_t pitch() const noexcept { return pitch_; }
    [[nodiscard]] bool empty() const noexcept { return pixels_.empty(); }

    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept { return pixels_; }
    [[nodiscard]] std::span<const std::uint8_t> palette() const noexcept { return palette_; }

    /**
     * One scan line; empty when y is out of range.
     */
    [[nodiscard]] std::span<const std::uint8_t> row(int y) const noexcept;

    /**
     * Resolve one pixel to RGBA, looking indexed pixels up in the palette.
     * Out-of-range coordinates yield transparent black.
     */
    [[nodiscard]] std::array<std::uint8_t, 4> rgba_at(int x, int y) const noexcept;

    [[nodiscard]] bool same_pixels(const memory_surface& other) const noexcept;

private:
    std::vector<std::uint8_t> pixels_;
    std::vector<std::uint8_t> palette_;  // RGB triplets
    int width_ = 0;
    int height_ = 0;
    std::size_t pitch_ = 0;
    pixel_format format_ = pixel_format::rgba8888;
};

} // namespace a2decode

#endif // A2DECODE_SURFACE_HPP_
