#include <a2decode/raster/iigs_icon.hpp>
#include "raster_helpers.hpp"

#include <utility>

namespace a2decode {

namespace {

// Length-prefixed string in a fixed-size field. Non-printable bytes become '?'.
std::string field_string(const std::uint8_t* p, std::size_t field_size) {
    std::size_t length = p[0];
    if (length >= field_size) {
        length = field_size - 1;
    }
    std::string out;
    out.reserve(length);
    for (std::size_t i = 1; i <= length; ++i) {
        const std::uint8_t c = p[i];
        out += (c >= 0x20 && c < 0x7F) ? static_cast<char>(c) : '?';
    }
    return out;
}

std::uint8_t nibble_at(const std::uint8_t* row, int x) noexcept {
    const std::uint8_t byte = row[x / 2];
    return (x % 2 == 0) ? static_cast<std::uint8_t>(byte >> 4) : static_cast<std::uint8_t>(byte & 0x0F);
}

bool render_icon(icon_image& icon, const std::uint8_t* pixels, const std::uint8_t* mask) {
    if (!icon.surface.set_size(icon.width, icon.height, pixel_format::rgba8888)) {
        return false;
    }

    constexpr auto palette = iigs_default_palette();
    const std::size_t row_bytes = iigs_icon_decoder::image_size(icon.width, 1);
    const std::size_t mask_row_bytes = static_cast<std::size_t>((icon.width + 7) / 8);
    icon.mask.assign(mask_row_bytes * static_cast<std::size_t>(icon.height), 0);

    std::vector<std::uint8_t> line(static_cast<std::size_t>(icon.width) * 4);
    for (int y = 0; y < icon.height; ++y) {
        const std::uint8_t* pixel_row = pixels + static_cast<std::size_t>(y) * row_bytes;
        const std::uint8_t* mask_row = mask + static_cast<std::size_t>(y) * row_bytes;
        std::uint8_t* out_mask = icon.mask.data() + static_cast<std::size_t>(y) * mask_row_bytes;

        for (int x = 0; x < icon.width; ++x) {
            const std::size_t index = nibble_at(pixel_row, x);
            const bool opaque = nibble_at(mask_row, x) != 0;
            std::uint8_t* dst = line.data() + static_cast<std::size_t>(x) * 4;
            dst[0] = palette[index * 3 + 0];
            dst[1] = palette[index * 3 + 1];
            dst[2] = palette[index * 3 + 2];
            dst[3] = opaque ? 0xFF : 0x00;
            if (opaque) {
                out_mask[x / 8] |= static_cast<std::uint8_t>(0x80 >> (x % 8));
            }
        }
        icon.surface.write_row(y, line);
    }
    return true;
}

struct parsed_icon {
    icon_image image;
    std::size_t end = 0;
};

// Read one icon at `offset`. Returns nullopt when its header runs past the
// record; pixel data that overruns the record or disagrees with the
// dimensions yields an undecodable icon.
std::optional<parsed_icon> parse_icon(std::span<const std::uint8_t> data,
                                      std::size_t offset, std::size_t record_end) {
    if (offset + iigs_icon_decoder::ICON_HEADER_SIZE > record_end) {
        return std::nullopt;
    }
    const std::uint8_t* p = data.data() + offset;
    const std::uint16_t icon_type = read_le16(p);
    const std::size_t size = read_le16(p + 2);
    const int height = read_le16(p + 4);
    const int width = read_le16(p + 6);

    const std::size_t pixel_offset = offset + iigs_icon_decoder::ICON_HEADER_SIZE;
    const std::size_t end = pixel_offset + size * 2;

    parsed_icon parsed;
    parsed.image.icon_type = icon_type;
    parsed.image.width = width;
    parsed.image.height = height;
    if (end > record_end) {
        parsed.end = record_end;
        return parsed;
    }
    parsed.end = end;

    const bool dimensions_ok = width >= 1 && width <= iigs_icon_decoder::MAX_DIMENSION &&
                               height >= 1 && height <= iigs_icon_decoder::MAX_DIMENSION;
    if (!dimensions_ok || size != iigs_icon_decoder::image_size(width, height)) {
        return parsed;
    }

    parsed.image.decodable = render_icon(parsed.image, data.data() + pixel_offset,
                                         data.data() + pixel_offset + size);
    if (!parsed.image.decodable) {
        parsed.image.surface = memory_surface{};
        parsed.image.mask.clear();
    }
    return parsed;
}

std::size_t first_record_length(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < iigs_icon_decoder::HEADER_SIZE + 2) {
        return 0;
    }
    return read_le16(data.data() + iigs_icon_decoder::HEADER_SIZE);
}

} // namespace

bool icon_image::opaque(int x, int y) const noexcept {
    if (x < 0 || y < 0 || x >= width || y >= height || mask.empty()) {
        return false;
    }
    const std::size_t row_bytes = static_cast<std::size_t>((width + 7) / 8);
    const std::uint8_t byte = mask[static_cast<std::size_t>(y) * row_bytes + static_cast<std::size_t>(x / 8)];
    return (byte & (0x80 >> (x % 8))) != 0;
}

bool iigs_icon_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    const std::size_t length = first_record_length(data);
    return length >= LARGE_ICON_OFFSET + ICON_HEADER_SIZE &&
           HEADER_SIZE + length <= data.size();
}

decode_result iigs_icon_decoder::decode(std::span<const std::uint8_t> data, icon_resource& resource) {
    if (data.size() < HEADER_SIZE + 2) {
        return decode_result::failure(decode_error::too_short, "Icon file shorter than its header");
    }

    icon_resource result;
    std::size_t pos = HEADER_SIZE;
    while (pos + 2 <= data.size()) {
        const std::size_t length = read_le16(data.data() + pos);
        if (length == 0) {
            break;
        }
        if (length < LARGE_ICON_OFFSET || pos + length > data.size()) {
            break;
        }
        const std::size_t record_end = pos + length;

        icon_entry entry;
        entry.boss_path = field_string(data.data() + pos + BOSS_OFFSET, BOSS_SIZE);
        entry.name_filter = field_string(data.data() + pos + FILTER_OFFSET, FILTER_SIZE);

        if (auto large = parse_icon(data, pos + LARGE_ICON_OFFSET, record_end)) {
            const std::size_t small_offset = large->end;
            entry.large = std::move(large->image);
            if (small_offset + ICON_HEADER_SIZE < record_end) {
                if (auto small = parse_icon(data, small_offset, record_end)) {
                    entry.small = std::move(small->image);
                }
            }
        }

        if (entry.large || entry.small) {
            if (!entry.name_filter.empty()) {
                entry.pathname = entry.name_filter;
            } else if (!entry.boss_path.empty()) {
                entry.pathname = entry.boss_path;
            } else {
                entry.pathname = "Icon " + std::to_string(result.entries.size() + 1);
            }
            result.entries.push_back(std::move(entry));
        }
        pos = record_end;
    }

    if (result.entries.empty()) {
        return decode_result::failure(decode_error::unrecognized_format, "No icon records found");
    }
    resource = std::move(result);
    return decode_result::success();
}

} // namespace a2decode
