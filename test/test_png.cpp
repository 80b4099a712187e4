#include <doctest/doctest.h>
#include <a2decode/raster/png.hpp>
#include <a2decode/raster/apple2_graphics.hpp>
#include <a2decode/palettes.hpp>
#include <lodepng.h>

#include <array>
#include <filesystem>
#include <vector>

namespace {

struct decoded_png {
    unsigned error = 0;
    unsigned width = 0;
    unsigned height = 0;
    std::vector<unsigned char> rgba;
};

decoded_png decode(const std::vector<std::uint8_t>& png) {
    decoded_png out;
    out.error = lodepng::decode(out.rgba, out.width, out.height, png);
    return out;
}

} // namespace

TEST_CASE("PNG: indexed surface is resolved through its palette") {
    a2decode::memory_surface surf;
    REQUIRE(surf.set_size(2, 1, a2decode::pixel_format::indexed8));
    surf.set_palette(a2decode::paper_ink_palette());
    const std::array<std::uint8_t, 2> indices = {0, 1};
    surf.write_row(0, indices);

    const auto result = decode(a2decode::encode_png(surf));
    REQUIRE(result.error == 0);
    CHECK(result.width == 2);
    CHECK(result.height == 1);
    CHECK(result.rgba == std::vector<unsigned char>{0xFF, 0xFF, 0xFF, 0xFF, 0x00, 0x00, 0x00, 0xFF});
}

TEST_CASE("PNG: RGBA surface keeps alpha") {
    a2decode::memory_surface surf;
    REQUIRE(surf.set_size(1, 2, a2decode::pixel_format::rgba8888));
    const std::array<std::uint8_t, 4> top = {0x10, 0x20, 0x30, 0x00};
    const std::array<std::uint8_t, 4> bottom = {0xAA, 0xBB, 0xCC, 0xFF};
    surf.write_row(0, top);
    surf.write_row(1, bottom);

    const auto result = decode(a2decode::encode_png(surf));
    REQUIRE(result.error == 0);
    CHECK(result.rgba == std::vector<unsigned char>{0x10, 0x20, 0x30, 0x00, 0xAA, 0xBB, 0xCC, 0xFF});
}

TEST_CASE("PNG: empty surface") {
    const a2decode::memory_surface surf;
    CHECK(a2decode::encode_png(surf).empty());
    CHECK_FALSE(a2decode::save_png(surf, std::filesystem::temp_directory_path() / "a2decode_empty.png"));
}

TEST_CASE("PNG: decoded picture saved to disk") {
    std::vector<std::uint8_t> screen(8192, 0);
    screen[0] = 0x03;

    a2decode::png_surface surf;
    REQUIRE(a2decode::hgr_decoder::decode(screen, surf));

    const auto encoded = surf.encode();
    REQUIRE_FALSE(encoded.empty());
    const auto result = decode(encoded);
    REQUIRE(result.error == 0);
    CHECK(result.width == 280);
    CHECK(result.height == 192);
    CHECK(result.rgba[0] == 0xFF);
    CHECK(result.rgba[3] == 0xFF);

    const auto path = std::filesystem::temp_directory_path() / "a2decode_hgr.png";
    REQUIRE(surf.save(path));
    std::vector<unsigned char> from_file;
    unsigned width = 0;
    unsigned height = 0;
    CHECK(lodepng::decode(from_file, width, height, path.string()) == 0);
    CHECK(width == 280);
    CHECK(from_file == result.rgba);
    std::filesystem::remove(path);
}
