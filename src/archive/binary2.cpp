#include <a2decode/archive/binary2.hpp>
#include <a2decode/byte_reader.hpp>
#include <a2decode/catalog/file_types.hpp>
#include <a2decode/catalog/prodos.hpp>
#include "../byte_io.hpp"

#include <algorithm>

namespace a2decode {

namespace {

constexpr std::uint8_t MAGIC[] = {0x0A, 0x47, 0x4C};
constexpr std::uint8_t ID_BYTE = 0x02;
constexpr std::size_t HEADER_SIZE = binary2_archive::HEADER_SIZE;

// Header field offsets
constexpr std::size_t BNY_ACCESS = 3;
constexpr std::size_t BNY_TYPE = 4;
constexpr std::size_t BNY_AUX = 5;
constexpr std::size_t BNY_STORAGE = 7;
constexpr std::size_t BNY_BLOCKS = 8;
constexpr std::size_t BNY_MOD_DATE = 10;
constexpr std::size_t BNY_MOD_TIME = 12;
constexpr std::size_t BNY_CREATE_DATE = 14;
constexpr std::size_t BNY_CREATE_TIME = 16;
constexpr std::size_t BNY_ID = 18;
constexpr std::size_t BNY_EOF = 20;
constexpr std::size_t BNY_NAME_LENGTH = 23;
constexpr std::size_t BNY_NAME = 24;
constexpr std::size_t BNY_AUX_HIGH = 109;
constexpr std::size_t BNY_EOF_HIGH = 116;
constexpr std::size_t BNY_OS_TYPE = 121;
constexpr std::size_t BNY_DATA_FLAGS = 125;
constexpr std::size_t BNY_VERSION = 126;
constexpr std::size_t BNY_FILES_TO_FOLLOW = 127;

// SQ-compressed data begins with this signature
constexpr std::uint8_t SQUEEZE_MAGIC[] = {0x76, 0xFF};

bool is_header(const std::uint8_t* h) noexcept {
    return std::equal(std::begin(MAGIC), std::end(MAGIC), h) && h[BNY_ID] == ID_BYTE;
}

std::size_t padded(std::size_t length) noexcept {
    return (length + HEADER_SIZE - 1) / HEADER_SIZE * HEADER_SIZE;
}

decode_result parse_header(const std::uint8_t* h, std::size_t offset, binary2_entry& entry) {
    const std::size_t name_length = h[BNY_NAME_LENGTH];
    if (name_length == 0 || name_length > binary2_archive::MAX_FILENAME) {
        return decode_result::failure(decode_error::malformed_header,
            "Binary II record at offset " + std::to_string(offset) +
            " has filename length " + std::to_string(name_length));
    }

    std::string name(h + BNY_NAME, h + BNY_NAME + name_length);
    // Pathnames are partial; a leading separator is not allowed
    const auto first = name.find_first_not_of('/');
    if (first == std::string::npos) {
        return decode_result::failure(decode_error::malformed_header,
            "Binary II record at offset " + std::to_string(offset) + " has an empty filename");
    }
    entry.filename = name.substr(first);

    entry.access = h[BNY_ACCESS];
    entry.file_type = h[BNY_TYPE];
    entry.aux_type = read_le16(h + BNY_AUX);
    entry.aux_type_high = read_le16(h + BNY_AUX_HIGH);
    entry.storage_type = h[BNY_STORAGE];
    entry.blocks = read_le16(h + BNY_BLOCKS);
    entry.modified = decode_prodos_date(read_le16(h + BNY_MOD_DATE), read_le16(h + BNY_MOD_TIME));
    entry.created = decode_prodos_date(read_le16(h + BNY_CREATE_DATE), read_le16(h + BNY_CREATE_TIME));
    entry.eof = read_le24(h + BNY_EOF) | (static_cast<std::uint32_t>(h[BNY_EOF_HIGH]) << 24);
    entry.os_type = h[BNY_OS_TYPE];
    entry.data_flags = h[BNY_DATA_FLAGS];
    entry.version = h[BNY_VERSION];
    entry.files_to_follow = h[BNY_FILES_TO_FOLLOW];
    entry.header_offset = offset;
    entry.data_offset = offset + HEADER_SIZE;

    // Directories are given an EOF but carry no data
    if (entry.is_directory()) {
        entry.eof = 0;
    }
    return decode_result::success();
}

// ----------------------------------------------------------------------------
// Catalog tree
// ----------------------------------------------------------------------------

catalog_entry& directory_node(std::vector<catalog_entry>& level, const std::string& name) {
    for (auto& node : level) {
        if (node.is_directory && node.name == name) {
            return node;
        }
    }
    catalog_entry node;
    node.name = name;
    node.file_type = prodos_type::DIR;
    node.prodos_type = prodos_type::DIR;
    node.type_label = file_type_label(prodos_type::DIR);
    node.is_directory = true;
    level.push_back(std::move(node));
    return level.back();
}

void fill_node(catalog_entry& item, const binary2_entry& entry) {
    item.file_type = entry.file_type;
    item.prodos_type = entry.file_type;
    item.aux_type = entry.aux_type;
    item.type_label = file_type_label(entry.file_type, entry.aux_type);
    item.blocks = entry.blocks;
    item.created = entry.created;
    item.modified = entry.modified;
    item.locked = (entry.access & access_flags::WRITE) == 0;
    item.prodos = prodos_metadata{entry.storage_type, 0, entry.access, 0, 0, 0};
}

} // namespace

// ============================================================================
// Archive access
// ============================================================================

bool binary2_archive::sniff(std::span<const std::uint8_t> data) noexcept {
    return data.size() >= HEADER_SIZE && is_header(data.data());
}

decode_result binary2_archive::list(std::span<const std::uint8_t> data,
                                    std::vector<binary2_entry>& entries) {
    if (!sniff(data)) {
        return decode_result::failure(decode_error::unrecognized_format, "Not a Binary II archive");
    }

    const byte_reader reader(data);
    std::vector<binary2_entry> found;
    std::size_t offset = 0;
    std::size_t remaining = 1;

    while (remaining > 0) {
        const auto header = reader.slice(offset, HEADER_SIZE);
        if (!header || !is_header(header->data())) {
            break;
        }

        binary2_entry entry;
        auto result = parse_header(header->data(), offset, entry);
        if (!result) {
            return result;
        }

        const auto payload = reader.slice(entry.data_offset, entry.eof);
        if (!payload) {
            return decode_result::failure(decode_error::too_short,
                "Binary II record " + entry.filename + " runs past end of archive");
        }
        entry.squeezed = payload->size() >= 2 &&
                         std::equal(std::begin(SQUEEZE_MAGIC), std::end(SQUEEZE_MAGIC), payload->begin());

        // The first header's count governs
        if (found.empty()) {
            remaining = static_cast<std::size_t>(entry.files_to_follow) + 1;
        }
        --remaining;

        offset = entry.data_offset + padded(entry.eof);
        found.push_back(std::move(entry));
    }

    entries = std::move(found);
    return decode_result::success();
}

decode_result binary2_archive::extract(std::span<const std::uint8_t> data,
                                       const binary2_entry& entry,
                                       std::vector<std::uint8_t>& out) {
    if (entry.squeezed || (entry.data_flags & (FLAG_COMPRESSED | FLAG_ENCRYPTED)) != 0) {
        return decode_result::failure(decode_error::unsupported_method,
            "Binary II record " + entry.filename + " is compressed or encrypted");
    }

    const byte_reader reader(data);
    const auto payload = reader.slice(entry.data_offset, entry.eof);
    if (!payload) {
        return decode_result::failure(decode_error::out_of_bounds,
            "Binary II record " + entry.filename + " runs past end of archive");
    }

    out.assign(payload->begin(), payload->end());
    return decode_result::success();
}

// ============================================================================
// Catalog filesystem
// ============================================================================

bool binary2_archive::sniff(const disk_image& image) noexcept {
    if (!image.source() || image.size() < HEADER_SIZE) {
        return false;
    }
    return is_header(image.source()->data() + image.offset());
}

decode_result binary2_archive::walk(const disk_image& image, disk_catalog& catalog) {
    if (!sniff(image)) {
        return decode_result::failure(decode_error::unrecognized_format, "Not a Binary II archive");
    }

    const std::span<const std::uint8_t> data(image.source()->data() + image.offset(), image.size());
    std::vector<binary2_entry> records;
    auto result = list(data, records);
    if (!result) {
        return result;
    }

    disk_catalog walked;
    walked.filesystem = filesystem_kind::binary2;
    walked.filesystem_name = "Binary II";
    walked.order = image.order();
    walked.image_size = image.size();

    for (const auto& record : records) {
        // Walk the pathname, creating parents that have no record of their own
        std::vector<catalog_entry>* level = &walked.entries;
        std::size_t start = 0;
        std::size_t slash = 0;
        while ((slash = record.filename.find('/', start)) != std::string::npos) {
            if (slash > start) {
                level = &directory_node(*level, record.filename.substr(start, slash - start)).children;
            }
            start = slash + 1;
        }
        const std::string leaf = record.filename.substr(start);
        if (leaf.empty()) {
            continue;
        }

        walked.total_blocks += record.blocks;

        if (record.is_directory()) {
            fill_node(directory_node(*level, leaf), record);
            continue;
        }

        catalog_entry item;
        item.name = leaf;
        fill_node(item, record);
        item.size = record.eof;
        item.byte_length = record.eof;
        item.content = image.make_content({{image.offset() + record.data_offset, record.eof, false}},
                                          record.eof);
        if (item.file_type == prodos_type::BIN) {
            item.load_address = item.aux_type;
        }
        item.is_image = is_nested_image(item.content);
        level->push_back(std::move(item));
    }

    catalog = std::move(walked);
    return decode_result::success();
}

} // namespace a2decode
