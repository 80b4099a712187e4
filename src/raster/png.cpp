#include <a2decode/raster/png.hpp>
#include <lodepng.h>

#include <fstream>

namespace a2decode {

std::vector<std::uint8_t> encode_png(const memory_surface& surf) {
    if (surf.empty() || surf.width() <= 0 || surf.height() <= 0) {
        return {};
    }

    const auto w = static_cast<unsigned>(surf.width());
    const auto h = static_cast<unsigned>(surf.height());

    std::vector<std::uint8_t> rgba;
    if (surf.format() == pixel_format::rgba8888 && surf.pitch() == w * 4) {
        rgba.assign(surf.pixels().begin(), surf.pixels().end());
    } else {
        rgba.reserve(static_cast<std::size_t>(w) * h * 4);
        for (int y = 0; y < surf.height(); ++y) {
            for (int x = 0; x < surf.width(); ++x) {
                const auto px = surf.rgba_at(x, y);
                rgba.insert(rgba.end(), px.begin(), px.end());
            }
        }
    }

    std::vector<std::uint8_t> png;
    if (lodepng::encode(png, rgba, w, h) != 0) {
        return {};
    }
    return png;
}

bool save_png(const memory_surface& surf, const std::filesystem::path& path) {
    const auto png = encode_png(surf);
    if (png.empty()) {
        return false;
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    file.write(reinterpret_cast<const char*>(png.data()), static_cast<std::streamsize>(png.size()));
    return file.good();
}

std::vector<std::uint8_t> png_surface::encode() const {
    return encode_png(*this);
}

bool png_surface::save(const std::filesystem::path& path) const {
    return save_png(*this, path);
}

} // namespace a2decode
