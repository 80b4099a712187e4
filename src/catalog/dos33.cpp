#include <a2decode/catalog/dos33.hpp>
#include <a2decode/catalog/file_types.hpp>
#include "../byte_io.hpp"

#include <algorithm>
#include <array>
#include <set>
#include <utility>

namespace a2decode {

namespace {

using sector_buffer = std::array<std::uint8_t, disk_image::SECTOR_SIZE>;
using track_sector = std::pair<std::uint8_t, std::uint8_t>;

constexpr std::size_t SECTOR_SIZE = disk_image::SECTOR_SIZE;

// VTOC
constexpr std::size_t VTOC_CATALOG_TRACK = 0x01;
constexpr std::size_t VTOC_CATALOG_SECTOR = 0x02;
constexpr std::size_t VTOC_VOLUME = 0x06;
constexpr std::size_t VTOC_TRACKS = 0x34;
constexpr std::size_t VTOC_SECTORS_PER_TRACK = 0x35;
constexpr std::size_t VTOC_BYTES_PER_SECTOR = 0x36;
constexpr std::uint8_t MIN_TRACKS = 18;
constexpr std::uint8_t MAX_TRACKS = 50;

// Catalog sector
constexpr std::size_t CAT_NEXT_TRACK = 0x01;
constexpr std::size_t CAT_NEXT_SECTOR = 0x02;
constexpr std::size_t CAT_FIRST_ENTRY = 0x0B;
constexpr std::size_t CAT_ENTRY_SIZE = 35;
constexpr std::size_t CAT_ENTRIES = 7;

// File descriptor
constexpr std::size_t FD_TS_TRACK = 0x00;
constexpr std::size_t FD_TS_SECTOR = 0x01;
constexpr std::size_t FD_TYPE = 0x02;
constexpr std::size_t FD_NAME = 0x03;
constexpr std::size_t FD_NAME_LENGTH = 30;
constexpr std::size_t FD_SECTOR_COUNT = 0x21;
constexpr std::uint8_t FD_DELETED = 0xFF;

// Track/sector list
constexpr std::size_t TSL_NEXT_TRACK = 0x01;
constexpr std::size_t TSL_NEXT_SECTOR = 0x02;
constexpr std::size_t TSL_FIRST_PAIR = 0x0C;
constexpr std::size_t TSL_PAIRS = 122;

std::string read_file_name(const std::uint8_t* p) {
    std::string name;
    for (std::size_t i = 0; i < FD_NAME_LENGTH; ++i) {
        name.push_back(static_cast<char>(p[i] & 0x7F));
    }
    const auto end = name.find_last_not_of(' ');
    name.erase(end == std::string::npos ? 0 : end + 1);
    return name;
}

// Follows the T/S list chain. Holes inside the file become sparse
// sectors; trailing holes are dropped. A repeated list sector ends the walk.
content_ref read_sectors(const disk_image& image, std::uint8_t track, std::uint8_t sector) {
    std::vector<extent> extents;
    std::set<track_sector> seen;
    std::size_t pending_holes = 0;

    while (track != 0 && seen.insert({track, sector}).second) {
        sector_buffer list;
        if (!image.read_sector(track, sector, list)) {
            break;
        }

        for (std::size_t i = 0; i < TSL_PAIRS; ++i) {
            const std::uint8_t t = list[TSL_FIRST_PAIR + i * 2];
            const std::uint8_t s = list[TSL_FIRST_PAIR + i * 2 + 1];
            if (t == 0 && s == 0) {
                ++pending_holes;
                continue;
            }
            const auto location = image.sector_extent(t, s);
            if (!location) {
                return content_ref(image.source(), std::move(extents));
            }
            if (pending_holes > 0) {
                append_extent(extents, {0, pending_holes * SECTOR_SIZE, true});
                pending_holes = 0;
            }
            append_extent(extents, *location);
        }

        track = list[TSL_NEXT_TRACK];
        sector = list[TSL_NEXT_SECTOR];
    }

    return content_ref(image.source(), std::move(extents));
}

void apply_file_header(catalog_entry& entry, const content_ref& raw) {
    std::array<std::uint8_t, 4> header{};
    const std::size_t have = raw.copy_prefix(header);

    switch (entry.file_type) {
        case dos33_volume::TYPE_INTEGER:
        case dos33_volume::TYPE_APPLESOFT: {
            if (have < 2) {
                entry.content = {};
                break;
            }
            const std::size_t length = read_le16(header.data());
            entry.byte_length = length;
            entry.content = raw.subrange(2, length);
            break;
        }

        case dos33_volume::TYPE_BINARY: {
            if (have < 4) {
                entry.content = {};
                break;
            }
            const std::uint16_t address = read_le16(header.data());
            const std::size_t length = read_le16(header.data() + 2);
            entry.load_address = address;
            entry.aux_type = address;
            entry.byte_length = length;
            entry.content = raw.subrange(4, length);
            break;
        }

        case dos33_volume::TYPE_TEXT: {
            const auto bytes = raw.bytes();
            const auto nul = std::find(bytes.begin(), bytes.end(), std::uint8_t{0});
            entry.content = raw.subrange(0, static_cast<std::size_t>(nul - bytes.begin()));
            break;
        }

        default:
            entry.content = raw;
            break;
    }

    entry.size = entry.content.size();
    if (!entry.byte_length) {
        entry.byte_length = entry.size;
    }
}

} // namespace

bool dos33_volume::sniff(const disk_image& image) noexcept {
    if (image.size() < MIN_IMAGE_SIZE) {
        return false;
    }
    sector_buffer vtoc;
    if (!image.read_sector(VTOC_TRACK, VTOC_SECTOR, vtoc)) {
        return false;
    }
    const std::uint8_t tracks = vtoc[VTOC_TRACKS];
    return tracks >= MIN_TRACKS && tracks <= MAX_TRACKS &&
           vtoc[VTOC_SECTORS_PER_TRACK] == disk_image::SECTORS_PER_TRACK &&
           read_le16(vtoc.data() + VTOC_BYTES_PER_SECTOR) == SECTOR_SIZE &&
           vtoc[VTOC_CATALOG_TRACK] < tracks &&
           vtoc[VTOC_CATALOG_SECTOR] < disk_image::SECTORS_PER_TRACK;
}

decode_result dos33_volume::walk(const disk_image& image, disk_catalog& catalog) {
    sector_buffer vtoc;
    if (!sniff(image) || !image.read_sector(VTOC_TRACK, VTOC_SECTOR, vtoc)) {
        return decode_result::failure(decode_error::unrecognized_format, "No DOS 3.3 VTOC");
    }

    disk_catalog result;
    result.volume_name = "DISK VOLUME " + std::to_string(vtoc[VTOC_VOLUME]);
    result.filesystem = filesystem_kind::dos33;
    result.filesystem_name = "DOS 3.3";
    result.order = image.order();
    result.image_size = image.size();
    result.total_blocks = static_cast<std::size_t>(vtoc[VTOC_TRACKS]) *
                          disk_image::SECTORS_PER_TRACK / 2;

    std::set<track_sector> visited;
    std::uint8_t track = vtoc[VTOC_CATALOG_TRACK];
    std::uint8_t sector = vtoc[VTOC_CATALOG_SECTOR];

    while (track != 0) {
        if (!visited.insert({track, sector}).second) {
            return decode_result::failure(decode_error::circular_directory,
                "Catalog chain revisits track " + std::to_string(track) +
                " sector " + std::to_string(sector));
        }

        sector_buffer cat;
        if (!image.read_sector(track, sector, cat)) {
            break;
        }

        for (std::size_t i = 0; i < CAT_ENTRIES; ++i) {
            const std::uint8_t* fd = cat.data() + CAT_FIRST_ENTRY + i * CAT_ENTRY_SIZE;
            const std::uint8_t ts_track = fd[FD_TS_TRACK];
            if (ts_track == 0 || ts_track == FD_DELETED) {
                continue;
            }

            catalog_entry entry;
            entry.name = read_file_name(fd + FD_NAME);
            entry.file_type = fd[FD_TYPE] & 0x7F;
            entry.locked = (fd[FD_TYPE] & TYPE_LOCKED) != 0;
            entry.prodos_type = dos33_to_prodos_type(entry.file_type);
            entry.type_label = std::string(dos33_type_label(entry.file_type));
            entry.blocks = read_le16(fd + FD_SECTOR_COUNT);
            entry.dos33 = dos33_metadata{ts_track, fd[FD_TS_SECTOR]};

            apply_file_header(entry, read_sectors(image, ts_track, fd[FD_TS_SECTOR]));
            entry.is_image = is_nested_image(entry.content);

            result.entries.push_back(std::move(entry));
        }

        track = cat[CAT_NEXT_TRACK];
        sector = cat[CAT_NEXT_SECTOR];
    }

    catalog = std::move(result);
    return decode_result::success();
}

} // namespace a2decode
