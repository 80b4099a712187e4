#ifndef A2DECODE_RASTER_PNG_HPP_
#define A2DECODE_RASTER_PNG_HPP_

#include <a2decode/a2decode_export.h>
#include <a2decode/surface.hpp>

#include <cstdint>
#include <filesystem>
#include <vector>

namespace a2decode {

// ============================================================================
// PNG Export
// ============================================================================

/**
 * Encode a decoded surface as an RGBA PNG.
 * Indexed pixels are resolved through the surface palette.
 * @return PNG bytes, or an empty vector for an empty surface or encoder error
 */
[[nodiscard]] A2DECODE_EXPORT std::vector<std::uint8_t> encode_png(const memory_surface& surf);

/**
 * Encode and write to a file.
 * @return true on success
 */
[[nodiscard]] A2DECODE_EXPORT bool save_png(const memory_surface& surf,
                                            const std::filesystem::path& path);

/**
 * Memory surface that can export itself as PNG.
 */
class A2DECODE_EXPORT png_surface : public memory_surface {
public:
    png_surface() = default;
    ~png_surface() override = default;

    png_surface(const png_surface&) = delete;
    png_surface& operator=(const png_surface&) = delete;
    png_surface(png_surface&&) noexcept = default;
    png_surface& operator=(png_surface&&) noexcept = default;

    [[nodiscard]] std::vector<std::uint8_t> encode() const;
    [[nodiscard]] bool save(const std::filesystem::path& path) const;
};

} // namespace a2decode

#endif // A2DECODE_RASTER_PNG_HPP_
