#include <a2decode/surface.hpp>

#include <algorithm>
#include <cstring>
#include <new>

namespace a2decode {

namespace {

// Largest Apple II picture is a 1280-wide APF or a 640x200 RGBA screen;
// anything far beyond that comes from a corrupt header.
constexpr int MAX_DIMENSION = 4096;
constexpr std::size_t MAX_PALETTE_BYTES = 256 * 3;

} // namespace

bool memory_surface::set_size(int width, int height, pixel_format format) {
    if (width <= 0 || height <= 0 || width > MAX_DIMENSION || height > MAX_DIMENSION) {
        return false;
    }

    const std::size_t pitch = static_cast<std::size_t>(width) * bytes_per_pixel(format);
    try {
        pixels_.assign(pitch * static_cast<std::size_t>(height), 0);
    } catch (const std::bad_alloc&) {
        return false;
    }

    width_ = width;
    height_ = height;
    format_ = format;
    pitch_ = pitch;
    palette_.clear();
    return true;
}

void memory_surface::write_row(int y, std::span<const std::uint8_t> bytes) {
    if (y < 0 || y >= height_ || bytes.empty()) {
        return;
    }
    const std::size_t n = std::min(bytes.size(), pitch_);
    std::memcpy(pixels_.data() + static_cast<std::size_t>(y) * pitch_, bytes.data(), n);
}

void memory_surface::set_palette(std::span<const std::uint8_t> rgb) {
    const std::size_t n = std::min(rgb.size(), MAX_PALETTE_BYTES) / 3 * 3;
    palette_.assign(rgb.begin(), rgb.begin() + static_cast<std::ptrdiff_t>(n));
}

std::span<const std::uint8_t> memory_surface::row(int y) const noexcept {
    if (y < 0 || y >= height_) {
        return {};
    }
    return std::span<const std::uint8_t>(pixels_).subspan(static_cast<std::size_t>(y) * pitch_, pitch_);
}

std::array<std::uint8_t, 4> memory_surface::rgba_at(int x, int y) const noexcept {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        return {0, 0, 0, 0};
    }
    const std::uint8_t* p = pixels_.data() + static_cast<std::size_t>(y) * pitch_ +
                            static_cast<std::size_t>(x) * bytes_per_pixel(format_);

    if (format_ == pixel_format::rgba8888) {
        return {p[0], p[1], p[2], p[3]};
    }
    // Indices past the end of the palette render black
    const std::size_t entry = static_cast<std::size_t>(*p) * 3;
    if (entry + 3 > palette_.size()) {
        return {0, 0, 0, 255};
    }
    return {palette_[entry], palette_[entry + 1], palette_[entry + 2], 255};
}

bool memory_surface::same_pixels(const memory_surface& other) const noexcept {
    return width_ == other.width_ && height_ == other.height_ &&
           format_ == other.format_ && pixels_ == other.pixels_ &&
           palette_ == other.palette_;
}

} // namespace a2decode
