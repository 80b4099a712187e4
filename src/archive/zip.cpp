#include <a2decode/archive/zip.hpp>
#include <a2decode/byte_reader.hpp>
#include "../byte_io.hpp"

namespace a2decode {

namespace {

constexpr std::uint32_t LOCAL_HEADER_SIGNATURE = 0x04034B50;     // "PK\3\4"
constexpr std::uint32_t DATA_DESCRIPTOR_SIGNATURE = 0x08074B50;  // "PK\7\8"
constexpr std::size_t LOCAL_HEADER_SIZE = 30;
constexpr std::size_t DATA_DESCRIPTOR_SIZE = 16;
constexpr std::uint16_t FLAG_DATA_DESCRIPTOR = 0x0008;

// Local file header field offsets
constexpr std::size_t LFH_FLAGS = 6;
constexpr std::size_t LFH_METHOD = 8;
constexpr std::size_t LFH_TIME = 10;
constexpr std::size_t LFH_DATE = 12;
constexpr std::size_t LFH_CRC = 14;
constexpr std::size_t LFH_COMPRESSED = 18;
constexpr std::size_t LFH_UNCOMPRESSED = 22;
constexpr std::size_t LFH_NAME_LENGTH = 26;
constexpr std::size_t LFH_EXTRA_LENGTH = 28;

// Streamed entries carry their sizes in a descriptor after the data.
// Locate it by signature and accept it only when its compressed size
// matches the distance from the data start.
std::optional<std::size_t> find_data_descriptor(const byte_reader& reader, zip_entry& entry) {
    const std::size_t size = reader.size();
    for (std::size_t pos = entry.data_offset; pos + DATA_DESCRIPTOR_SIZE <= size; ++pos) {
        if (*reader.u32le_at(pos) != DATA_DESCRIPTOR_SIGNATURE) {
            continue;
        }
        const std::uint32_t compressed = *reader.u32le_at(pos + 8);
        if (pos - entry.data_offset != compressed) {
            continue;
        }
        entry.crc32 = *reader.u32le_at(pos + 4);
        entry.compressed_size = compressed;
        entry.uncompressed_size = *reader.u32le_at(pos + 12);
        return pos + DATA_DESCRIPTOR_SIZE;
    }
    return std::nullopt;
}

} // namespace

std::optional<date_time> decode_dos_date_time(std::uint16_t date, std::uint16_t time) noexcept {
    date_time dt;
    dt.year = ((date >> 9) & 0x7F) + 1980;
    dt.month = (date >> 5) & 0x0F;
    dt.day = date & 0x1F;
    dt.hour = (time >> 11) & 0x1F;
    dt.minute = (time >> 5) & 0x3F;
    dt.second = (time & 0x1F) * 2;

    if (dt.month < 1 || dt.month > 12 || dt.day < 1) {
        return std::nullopt;
    }
    return dt;
}

bool zip_reader::sniff(std::span<const std::uint8_t> data) noexcept {
    return data.size() >= 4 && read_le32(data.data()) == LOCAL_HEADER_SIGNATURE;
}

decode_result zip_reader::list(std::span<const std::uint8_t> data,
                               std::vector<zip_entry>& entries) {
    if (!sniff(data)) {
        return decode_result::failure(decode_error::unrecognized_format, "Not a ZIP archive");
    }

    const byte_reader reader(data);
    std::vector<zip_entry> found;
    std::size_t offset = 0;

    while (reader.u32le_at(offset) == LOCAL_HEADER_SIGNATURE) {
        const auto fixed = reader.slice(offset, LOCAL_HEADER_SIZE);
        if (!fixed) {
            break;
        }
        const std::uint8_t* h = fixed->data();

        zip_entry entry;
        entry.header_offset = offset;
        entry.flags = read_le16(h + LFH_FLAGS);
        entry.method = read_le16(h + LFH_METHOD);
        entry.modified = decode_dos_date_time(read_le16(h + LFH_DATE), read_le16(h + LFH_TIME));
        entry.crc32 = read_le32(h + LFH_CRC);
        entry.compressed_size = read_le32(h + LFH_COMPRESSED);
        entry.uncompressed_size = read_le32(h + LFH_UNCOMPRESSED);

        const std::size_t name_length = read_le16(h + LFH_NAME_LENGTH);
        const std::size_t extra_length = read_le16(h + LFH_EXTRA_LENGTH);

        const auto name = reader.slice(offset + LOCAL_HEADER_SIZE, name_length);
        if (!name) {
            break;
        }
        entry.filename.assign(name->begin(), name->end());
        entry.data_offset = offset + LOCAL_HEADER_SIZE + name_length + extra_length;
        if (entry.data_offset > data.size()) {
            break;
        }

        std::size_t next = 0;
        if ((entry.flags & FLAG_DATA_DESCRIPTOR) && entry.compressed_size == 0) {
            const auto end = find_data_descriptor(reader, entry);
            if (!end) {
                break;
            }
            next = *end;
        } else {
            next = entry.data_offset + entry.compressed_size;
            if (next > data.size()) {
                break;
            }
            if (entry.flags & FLAG_DATA_DESCRIPTOR) {
                // Optional trailing descriptor, with or without its signature
                if (reader.u32le_at(next) == DATA_DESCRIPTOR_SIGNATURE) {
                    next += DATA_DESCRIPTOR_SIZE;
                } else if (reader.u32le_at(next + 12) == LOCAL_HEADER_SIGNATURE) {
                    next += DATA_DESCRIPTOR_SIZE - 4;
                }
            }
        }

        found.push_back(std::move(entry));
        offset = next;
    }

    if (found.empty()) {
        return decode_result::failure(decode_error::too_short, "ZIP local header truncated");
    }

    entries = std::move(found);
    return decode_result::success();
}

decode_result zip_reader::extract(std::span<const std::uint8_t> data,
                                  const zip_entry& entry,
                                  std::vector<std::uint8_t>& out,
                                  const archive_options& options) {
    const byte_reader reader(data);
    const auto payload = reader.slice(entry.data_offset, entry.compressed_size);
    if (!payload) {
        return decode_result::failure(decode_error::out_of_bounds,
            "ZIP entry data for " + entry.filename + " runs past end of archive");
    }

    if (entry.uncompressed_size > options.max_output_size) {
        return decode_result::failure(decode_error::malformed_header,
            "ZIP entry " + entry.filename + " exceeds size limit");
    }

    std::vector<std::uint8_t> bytes;
    switch (entry.method) {
        case METHOD_STORED:
            if (entry.compressed_size != entry.uncompressed_size) {
                return decode_result::failure(decode_error::malformed_header,
                    "Stored ZIP entry " + entry.filename + " has mismatched sizes");
            }
            bytes.assign(payload->begin(), payload->end());
            break;

        case METHOD_DEFLATE: {
            const auto& inflate = options.inflate ? options.inflate
                                                  : inflate_function(lodepng_inflate_stream);
            auto result = inflate(*payload, entry.uncompressed_size, bytes);
            if (!result) {
                return result;
            }
            break;
        }

        default:
            return decode_result::failure(decode_error::unsupported_method,
                "ZIP compression method " + std::to_string(entry.method) + " is not supported");
    }

    if (options.verify_crc && crc32(bytes) != entry.crc32) {
        return decode_result::failure(decode_error::inflate_failed,
            "ZIP entry " + entry.filename + " CRC-32 mismatch");
    }

    out = std::move(bytes);
    return decode_result::success();
}

} // namespace a2decode
