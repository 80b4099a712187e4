#include <a2decode/catalog/prodos.hpp>
#include <a2decode/catalog/file_types.hpp>
#include "../byte_io.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <set>

namespace a2decode {

namespace {

using block_buffer = std::array<std::uint8_t, disk_image::BLOCK_SIZE>;

constexpr std::size_t BLOCK_SIZE = disk_image::BLOCK_SIZE;
constexpr std::size_t VOLUME_DIR_BLOCK = 2;
constexpr std::size_t VOLUME_DIR_FALLBACK_BLOCK = 1;
constexpr int MAX_DIRECTORY_DEPTH = 64;

// Directory block layout
constexpr std::size_t DIR_PREV = 0x00;
constexpr std::size_t DIR_NEXT = 0x02;
constexpr std::size_t DIR_ENTRIES = 0x04;

// Directory header, offsets within the key block
constexpr std::size_t HDR_STORAGE_NAME = 0x04;
constexpr std::size_t HDR_NAME = 0x05;
constexpr std::size_t HDR_CASE_BITS = 0x1A;
constexpr std::size_t HDR_CREATED = 0x1C;
constexpr std::size_t HDR_ENTRY_LENGTH = 0x23;
constexpr std::size_t HDR_ENTRIES_PER_BLOCK = 0x24;
constexpr std::size_t HDR_TOTAL_BLOCKS = 0x29;
constexpr std::size_t MIN_ENTRY_LENGTH = 0x27;

// File entry, offsets within the entry
constexpr std::size_t ENT_STORAGE_NAME = 0x00;
constexpr std::size_t ENT_NAME = 0x01;
constexpr std::size_t ENT_TYPE = 0x10;
constexpr std::size_t ENT_KEY = 0x11;
constexpr std::size_t ENT_BLOCKS = 0x13;
constexpr std::size_t ENT_EOF = 0x15;
constexpr std::size_t ENT_CREATED = 0x18;
constexpr std::size_t ENT_VERSION = 0x1C;
constexpr std::size_t ENT_MIN_VERSION = 0x1D;
constexpr std::size_t ENT_CASE_BITS = 0x1C;     // GS/OS lowercase flags, overlaying both version bytes
constexpr std::size_t ENT_ACCESS = 0x1E;
constexpr std::size_t ENT_AUX = 0x1F;
constexpr std::size_t ENT_MODIFIED = 0x21;
constexpr std::size_t ENT_HEADER = 0x25;

// Extended key block: data fork mini-entry at +0, resource fork at +$100
constexpr std::size_t EXT_STORAGE = 0x00;
constexpr std::size_t EXT_KEY = 0x01;
constexpr std::size_t EXT_EOF = 0x05;
constexpr std::size_t EXT_RESOURCE = 0x100;

constexpr std::size_t SAPLING_POINTERS = 256;
constexpr std::size_t TREE_INDEX_POINTERS = 128;

std::uint16_t index_pointer(const block_buffer& index, std::size_t i) noexcept {
    return static_cast<std::uint16_t>(index[i] | (index[256 + i] << 8));
}

std::string read_name(const std::uint8_t* p, std::size_t length) {
    std::string name;
    for (std::size_t i = 0; i < length; ++i) {
        name.push_back(static_cast<char>(p[i] & 0x7F));
    }
    return name;
}

std::optional<date_time> read_date(const std::uint8_t* p) noexcept {
    return decode_prodos_date(read_le16(p), read_le16(p + 2));
}

struct dir_header {
    std::uint8_t storage_type = 0;
    std::string name;
    std::size_t entry_length = 0;
    std::size_t entries_per_block = 0;
};

bool parse_header(const block_buffer& block, std::uint8_t expected_storage, dir_header& out) {
    if (read_le16(block.data() + DIR_PREV) != 0) {
        return false;
    }
    const std::uint8_t storage = block[HDR_STORAGE_NAME] >> 4;
    const std::size_t name_length = block[HDR_STORAGE_NAME] & 0x0F;
    if (storage != expected_storage || name_length == 0) {
        return false;
    }
    for (std::size_t i = 0; i < name_length; ++i) {
        const auto ch = static_cast<unsigned char>(block[HDR_NAME + i] & 0x7F);
        if (!std::isprint(ch) || ch == ' ') {
            return false;
        }
    }

    const std::size_t entry_length = block[HDR_ENTRY_LENGTH];
    const std::size_t per_block = block[HDR_ENTRIES_PER_BLOCK];
    if (entry_length < MIN_ENTRY_LENGTH || per_block == 0 ||
        entry_length * per_block + DIR_ENTRIES > BLOCK_SIZE) {
        return false;
    }

    out.storage_type = storage;
    out.name = read_name(block.data() + HDR_NAME, name_length);
    out.entry_length = entry_length;
    out.entries_per_block = per_block;
    return true;
}

std::optional<std::size_t> find_volume_directory(const disk_image& image) {
    for (const std::size_t candidate : {VOLUME_DIR_BLOCK, VOLUME_DIR_FALLBACK_BLOCK}) {
        block_buffer block;
        dir_header header;
        if (image.read_block(candidate, block) &&
            parse_header(block, prodos_volume::STORAGE_VOLUME_HEADER, header)) {
            return candidate;
        }
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// Catalog walk state
// ----------------------------------------------------------------------------

class prodos_walker {
public:
    explicit prodos_walker(const disk_image& image) : image_(image) {}

    decode_result read_directory(std::size_t key_block, const dir_header& header,
                                 int depth, std::vector<catalog_entry>& out);

private:
    bool append_block(std::size_t block, std::vector<extent>& extents) const;
    std::size_t collect_index(std::size_t index_block, std::size_t wanted,
                              std::vector<extent>& extents) const;
    content_ref file_content(std::uint8_t storage, std::size_t key, std::size_t eof) const;

    decode_result read_entry(const std::uint8_t* entry, int depth,
                             std::vector<catalog_entry>& out);

    const disk_image& image_;
    std::set<std::size_t> visited_;
};

// Zero pointers are sparse; an out-of-range pointer ends the file.
bool prodos_walker::append_block(std::size_t block, std::vector<extent>& extents) const {
    if (block == 0) {
        append_extent(extents, {0, BLOCK_SIZE, true});
        return true;
    }
    std::vector<extent> parts;
    if (!image_.block_extents(block, parts)) {
        return false;
    }
    for (const auto& part : parts) {
        append_extent(extents, part);
    }
    return true;
}

// Returns the number of data blocks appended.
std::size_t prodos_walker::collect_index(std::size_t index_block, std::size_t wanted,
                                         std::vector<extent>& extents) const {
    block_buffer index;
    if (!image_.read_block(index_block, index)) {
        return 0;
    }
    const std::size_t count = std::min(wanted, SAPLING_POINTERS);
    for (std::size_t i = 0; i < count; ++i) {
        if (!append_block(index_pointer(index, i), extents)) {
            return i;
        }
    }
    return count;
}

content_ref prodos_walker::file_content(std::uint8_t storage, std::size_t key,
                                        std::size_t eof) const {
    std::vector<extent> extents;
    const std::size_t blocks_needed = (eof + BLOCK_SIZE - 1) / BLOCK_SIZE;

    switch (storage) {
        case prodos_volume::STORAGE_SEEDLING:
            if (blocks_needed > 0) {
                append_block(key, extents);
            }
            break;

        case prodos_volume::STORAGE_SAPLING:
            if (key != 0) {
                collect_index(key, blocks_needed, extents);
            }
            break;

        case prodos_volume::STORAGE_TREE: {
            block_buffer master;
            if (key == 0 || !image_.read_block(key, master)) {
                break;
            }
            std::set<std::size_t> seen;
            std::size_t remaining = blocks_needed;
            for (std::size_t i = 0; i < TREE_INDEX_POINTERS && remaining > 0; ++i) {
                const std::size_t chunk = std::min(remaining, SAPLING_POINTERS);
                const std::uint16_t index_block = index_pointer(master, i);
                if (index_block == 0) {
                    append_extent(extents, {0, chunk * BLOCK_SIZE, true});
                } else {
                    if (!seen.insert(index_block).second) {
                        break;
                    }
                    if (collect_index(index_block, chunk, extents) < chunk) {
                        break;
                    }
                }
                remaining -= chunk;
            }
            break;
        }

        default:
            break;
    }

    return image_.make_content(extents, eof);
}

decode_result prodos_walker::read_entry(const std::uint8_t* entry, int depth,
                                        std::vector<catalog_entry>& out) {
    const std::uint8_t storage = entry[ENT_STORAGE_NAME] >> 4;
    const std::size_t name_length = entry[ENT_STORAGE_NAME] & 0x0F;
    if (storage == prodos_volume::STORAGE_DELETED || name_length == 0 ||
        storage == prodos_volume::STORAGE_SUBDIR_HEADER ||
        storage == prodos_volume::STORAGE_VOLUME_HEADER) {
        return decode_result::success();
    }

    catalog_entry item;
    item.name = apply_case_bits(read_name(entry + ENT_NAME, name_length),
                                read_le16(entry + ENT_CASE_BITS));
    item.file_type = entry[ENT_TYPE];
    item.prodos_type = item.file_type;
    item.aux_type = read_le16(entry + ENT_AUX);
    item.type_label = file_type_label(item.file_type, item.aux_type);
    item.blocks = read_le16(entry + ENT_BLOCKS);
    item.created = read_date(entry + ENT_CREATED);
    item.modified = read_date(entry + ENT_MODIFIED);

    const std::uint16_t key = read_le16(entry + ENT_KEY);
    const std::uint8_t access = entry[ENT_ACCESS];
    item.locked = (access & access_flags::WRITE) == 0;
    item.prodos = prodos_metadata{storage, key, access, entry[ENT_VERSION], entry[ENT_MIN_VERSION],
                                  read_le16(entry + ENT_HEADER)};

    if (storage == prodos_volume::STORAGE_SUBDIRECTORY) {
        item.is_directory = true;
        item.size = item.blocks * BLOCK_SIZE;

        if (visited_.count(key) != 0) {
            return decode_result::failure(decode_error::circular_directory,
                "Directory " + item.name + " points back to block " + std::to_string(key));
        }

        if (depth >= MAX_DIRECTORY_DEPTH) {
            return decode_result::failure(decode_error::corrupt_catalog,
                "Directory " + item.name + " nested deeper than " +
                std::to_string(MAX_DIRECTORY_DEPTH) + " levels");
        }

        block_buffer block;
        dir_header header;
        if (image_.read_block(key, block) &&
            parse_header(block, prodos_volume::STORAGE_SUBDIR_HEADER, header)) {
            auto result = read_directory(key, header, depth + 1, item.children);
            if (!result) {
                return result;
            }
        }
        out.push_back(std::move(item));
        return decode_result::success();
    }

    std::size_t eof = read_le24(entry + ENT_EOF);
    if (storage == prodos_volume::STORAGE_EXTENDED) {
        block_buffer ext;
        if (image_.read_block(key, ext)) {
            const std::uint8_t data_storage = ext[EXT_STORAGE] & 0x0F;
            eof = read_le24(ext.data() + EXT_EOF);
            item.content = file_content(data_storage, read_le16(ext.data() + EXT_KEY), eof);

            const std::uint8_t* rsrc = ext.data() + EXT_RESOURCE;
            const std::uint8_t rsrc_storage = rsrc[EXT_STORAGE] & 0x0F;
            item.resource = file_content(rsrc_storage, read_le16(rsrc + EXT_KEY), read_le24(rsrc + EXT_EOF));
        } else {
            eof = 0;
        }
    } else {
        item.content = file_content(storage, key, eof);
    }

    item.size = eof;
    item.byte_length = eof;
    if (item.file_type == prodos_type::BIN) {
        item.load_address = item.aux_type;
    }
    item.is_image = is_nested_image(item.content);

    out.push_back(std::move(item));
    return decode_result::success();
}

decode_result prodos_walker::read_directory(std::size_t key_block, const dir_header& header,
                                            int depth, std::vector<catalog_entry>& out) {
    std::vector<catalog_entry> entries;
    std::size_t block_number = key_block;
    bool first = true;

    while (block_number != 0) {
        if (!visited_.insert(block_number).second) {
            return decode_result::failure(decode_error::circular_directory,
                "Directory " + header.name + " revisits block " + std::to_string(block_number));
        }

        block_buffer block;
        if (!image_.read_block(block_number, block)) {
            break;
        }

        for (std::size_t i = first ? 1 : 0; i < header.entries_per_block; ++i) {
            const std::size_t offset = DIR_ENTRIES + i * header.entry_length;
            if (offset + header.entry_length > BLOCK_SIZE) {
                break;
            }
            auto result = read_entry(block.data() + offset, depth, entries);
            if (!result) {
                return result;
            }
        }

        first = false;
        block_number = read_le16(block.data() + DIR_NEXT);
    }

    out = std::move(entries);
    return decode_result::success();
}

} // namespace

// ============================================================================
// Dates and names
// ============================================================================

std::optional<date_time> decode_prodos_date(std::uint16_t date, std::uint16_t time) noexcept {
    if (date == 0) {
        return std::nullopt;
    }
    date_time dt;
    dt.day = date & 0x1F;
    dt.month = (date >> 5) & 0x0F;
    const int year = (date >> 9) & 0x7F;
    dt.year = year < 40 ? 2000 + year : 1900 + year;
    dt.hour = (time >> 8) & 0x1F;
    dt.minute = time & 0x3F;

    if (dt.month < 1 || dt.month > 12 || dt.day < 1) {
        return std::nullopt;
    }
    return dt;
}

std::string apply_case_bits(std::string_view name, std::uint16_t case_bits) {
    std::string out(name);
    if ((case_bits & 0x8000) == 0) {
        return out;
    }
    for (std::size_t i = 0; i < out.size() && i < 15; ++i) {
        if (case_bits & (0x4000 >> i)) {
            out[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(out[i])));
        }
    }
    return out;
}

// ============================================================================
// Volume
// ============================================================================

bool prodos_volume::sniff(const disk_image& image) noexcept {
    return find_volume_directory(image).has_value();
}

decode_result prodos_volume::walk(const disk_image& image, disk_catalog& catalog) {
    const auto volume_block = find_volume_directory(image);
    if (!volume_block) {
        return decode_result::failure(decode_error::unrecognized_format,
            "No ProDOS volume directory");
    }

    block_buffer block;
    dir_header header;
    if (!image.read_block(*volume_block, block) ||
        !parse_header(block, STORAGE_VOLUME_HEADER, header)) {
        return decode_result::failure(decode_error::unrecognized_format,
            "No ProDOS volume directory");
    }

    disk_catalog result;
    result.volume_name = apply_case_bits(header.name, read_le16(block.data() + HDR_CASE_BITS));
    result.filesystem = filesystem_kind::prodos;
    result.filesystem_name = "ProDOS";
    result.order = image.order();
    result.image_size = image.size();
    result.total_blocks = read_le16(block.data() + HDR_TOTAL_BLOCKS);
    result.created = read_date(block.data() + HDR_CREATED);

    prodos_walker walker(image);
    auto status = walker.read_directory(*volume_block, header, 0, result.entries);
    if (!status) {
        return status;
    }

    catalog = std::move(result);
    return decode_result::success();
}

} // namespace a2decode
