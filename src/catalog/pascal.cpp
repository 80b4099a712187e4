#include <a2decode/catalog/pascal.hpp>
#include <a2decode/catalog/file_types.hpp>
#include "../byte_io.hpp"

#include <algorithm>
#include <array>

namespace a2decode {

namespace {

using block_buffer = std::array<std::uint8_t, disk_image::BLOCK_SIZE>;

constexpr std::size_t BLOCK_SIZE = disk_image::BLOCK_SIZE;

// Volume entry
constexpr std::size_t VOL_FIRST_BLOCK = 0x00;
constexpr std::size_t VOL_DIR_END = 0x02;
constexpr std::size_t VOL_KIND = 0x04;
constexpr std::size_t VOL_NAME_LENGTH = 0x06;
constexpr std::size_t VOL_NAME = 0x07;
constexpr std::size_t VOL_TOTAL_BLOCKS = 0x0E;
constexpr std::size_t VOL_FILE_COUNT = 0x10;
constexpr std::size_t VOL_DATE = 0x14;
constexpr std::size_t VOL_MAX_NAME = 7;
constexpr std::size_t MAX_DIR_END = 34;

// File entry
constexpr std::size_t ENT_FIRST_BLOCK = 0x00;
constexpr std::size_t ENT_NEXT_BLOCK = 0x02;
constexpr std::size_t ENT_KIND = 0x04;
constexpr std::size_t ENT_NAME_LENGTH = 0x06;
constexpr std::size_t ENT_NAME = 0x07;
constexpr std::size_t ENT_LAST_BYTES = 0x16;
constexpr std::size_t ENT_DATE = 0x18;
constexpr std::size_t ENT_MAX_NAME = 15;

// TEXT files
constexpr std::size_t TEXT_HEADER_SIZE = 1024;
constexpr std::uint8_t DLE = 0x10;

bool printable(std::uint8_t ch) noexcept {
    return ch >= 0x20 && ch < 0x7F;
}

bool valid_volume_entry(const block_buffer& block) noexcept {
    if (read_le16(block.data() + VOL_FIRST_BLOCK) != 0) {
        return false;
    }
    const std::uint16_t dir_end = read_le16(block.data() + VOL_DIR_END);
    if (dir_end <= pascal_volume::DIRECTORY_BLOCK || dir_end > MAX_DIR_END) {
        return false;
    }
    if (read_le16(block.data() + VOL_KIND) != 0) {
        return false;
    }
    const std::size_t name_length = block[VOL_NAME_LENGTH];
    if (name_length == 0 || name_length > VOL_MAX_NAME) {
        return false;
    }
    for (std::size_t i = 0; i < name_length; ++i) {
        if (!printable(block[VOL_NAME + i])) {
            return false;
        }
    }
    return true;
}

std::string read_name(const std::uint8_t* p, std::size_t length) {
    std::string name;
    for (std::size_t i = 0; i < length; ++i) {
        if (printable(p[i])) {
            name.push_back(static_cast<char>(p[i]));
        }
    }
    return name;
}

} // namespace

std::optional<date_time> decode_pascal_date(std::uint16_t word) noexcept {
    date_time dt;
    dt.month = word & 0x0F;
    dt.day = (word >> 4) & 0x1F;
    const int year = (word >> 9) & 0x7F;
    dt.year = year >= 100 ? 2000 + (year - 100) : 1900 + year;

    if (dt.month < 1 || dt.month > 12 || dt.day < 1) {
        return std::nullopt;
    }
    return dt;
}

std::string pascal_text_to_plain(std::span<const std::uint8_t> data) {
    std::string out;
    const std::size_t start = data.size() > TEXT_HEADER_SIZE ? TEXT_HEADER_SIZE : 0;

    for (std::size_t i = start; i < data.size(); ++i) {
        const std::uint8_t ch = data[i];
        if (ch == DLE) {
            if (i + 1 < data.size()) {
                const std::uint8_t count = data[++i];
                if (count > 32) {
                    out.append(count - 32u, ' ');
                }
            }
        } else if (ch == 0x0D) {
            out.push_back('\n');
        } else if (ch == 0x09 || printable(ch)) {
            out.push_back(static_cast<char>(ch));
        }
    }
    return out;
}

bool pascal_volume::sniff(const disk_image& image) noexcept {
    block_buffer block;
    return image.read_block(DIRECTORY_BLOCK, block) && valid_volume_entry(block);
}

decode_result pascal_volume::walk(const disk_image& image, disk_catalog& catalog) {
    block_buffer first;
    if (!image.read_block(DIRECTORY_BLOCK, first) || !valid_volume_entry(first)) {
        return decode_result::failure(decode_error::unrecognized_format,
            "No UCSD Pascal volume header");
    }

    const std::size_t dir_end = read_le16(first.data() + VOL_DIR_END);
    const std::size_t total_blocks = read_le16(first.data() + VOL_TOTAL_BLOCKS);
    const std::size_t file_count = std::min<std::size_t>(read_le16(first.data() + VOL_FILE_COUNT),
                                                         MAX_FILES);

    // Directory bytes span blocks 2 .. dir_end-1
    std::vector<std::uint8_t> directory(first.begin(), first.end());
    for (std::size_t b = DIRECTORY_BLOCK + 1; b < dir_end; ++b) {
        block_buffer block;
        if (!image.read_block(b, block)) {
            break;
        }
        directory.insert(directory.end(), block.begin(), block.end());
    }

    disk_catalog result;
    result.volume_name = read_name(first.data() + VOL_NAME, first[VOL_NAME_LENGTH]);
    result.filesystem = filesystem_kind::pascal;
    result.filesystem_name = "UCSD Pascal";
    result.order = image.order();
    result.image_size = image.size();
    result.total_blocks = total_blocks;
    result.created = decode_pascal_date(read_le16(first.data() + VOL_DATE));

    for (std::size_t i = 1; i <= file_count; ++i) {
        const std::size_t offset = i * ENTRY_SIZE;
        if (offset + ENTRY_SIZE > directory.size()) {
            break;
        }
        const std::uint8_t* e = directory.data() + offset;

        const std::size_t first_block = read_le16(e + ENT_FIRST_BLOCK);
        const std::size_t next_block = read_le16(e + ENT_NEXT_BLOCK);
        const std::size_t name_length = e[ENT_NAME_LENGTH] & 0x0F;
        if (first_block == 0 && next_block == 0) {
            continue;
        }
        if (name_length == 0 || name_length > ENT_MAX_NAME) {
            continue;
        }
        if (first_block >= next_block || (total_blocks != 0 && next_block > total_blocks)) {
            continue;
        }

        catalog_entry entry;
        entry.name = read_name(e + ENT_NAME, name_length);
        if (entry.name.empty()) {
            continue;
        }

        const std::uint8_t kind = e[ENT_KIND] & 0x0F;
        const std::size_t last_bytes = std::min<std::size_t>(read_le16(e + ENT_LAST_BYTES), BLOCK_SIZE);
        const std::size_t block_count = next_block - first_block;

        entry.file_type = kind;
        entry.prodos_type = pascal_to_prodos_type(kind);
        entry.type_label = std::string(pascal_kind_label(kind));
        entry.blocks = block_count;
        entry.size = (block_count - 1) * BLOCK_SIZE + last_bytes;
        entry.modified = decode_pascal_date(read_le16(e + ENT_DATE));
        entry.pascal = pascal_metadata{static_cast<std::uint16_t>(first_block),
                                       static_cast<std::uint16_t>(next_block),
                                       static_cast<std::uint16_t>(last_bytes)};

        std::vector<extent> extents;
        for (std::size_t b = first_block; b < next_block; ++b) {
            std::vector<extent> parts;
            if (!image.block_extents(b, parts)) {
                break;
            }
            for (const auto& part : parts) {
                append_extent(extents, part);
            }
        }
        entry.content = image.make_content(extents, entry.size);
        entry.byte_length = entry.content.size();
        entry.is_image = is_nested_image(entry.content);

        result.entries.push_back(std::move(entry));
    }

    catalog = std::move(result);
    return decode_result::success();
}

} // namespace a2decode
