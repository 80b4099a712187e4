#include <a2decode/archive/gzip.hpp>
#include <a2decode/byte_reader.hpp>

namespace a2decode {

namespace {

constexpr std::uint8_t GZIP_ID1 = 0x1F;
constexpr std::uint8_t GZIP_ID2 = 0x8B;
constexpr std::uint8_t GZIP_METHOD_DEFLATE = 8;
constexpr std::size_t GZIP_HEADER_SIZE = 10;
constexpr std::size_t GZIP_TRAILER_SIZE = 8;

// Reads a NUL-terminated Latin-1 string, leaving the reader past the NUL.
bool read_zero_terminated(byte_reader& reader, std::string& out) {
    std::string text;
    while (true) {
        auto ch = reader.read_u8();
        if (!ch) {
            return false;
        }
        if (*ch == 0) {
            break;
        }
        text.push_back(static_cast<char>(*ch));
    }
    out = std::move(text);
    return true;
}

} // namespace

bool gzip_reader::sniff(std::span<const std::uint8_t> data) noexcept {
    return data.size() >= 2 && data[0] == GZIP_ID1 && data[1] == GZIP_ID2;
}

decode_result gzip_reader::read_header(std::span<const std::uint8_t> data,
                                       gzip_header& header) {
    if (!sniff(data)) {
        return decode_result::failure(decode_error::unrecognized_format, "Not a gzip file");
    }
    if (data.size() < GZIP_HEADER_SIZE + GZIP_TRAILER_SIZE) {
        return decode_result::failure(decode_error::too_short, "Gzip file too short");
    }

    byte_reader reader(data);
    gzip_header hdr;

    // Fixed part: ID1 ID2 CM FLG MTIME(4) XFL OS
    const auto method = reader.u8_at(2);
    if (method != GZIP_METHOD_DEFLATE) {
        return decode_result::failure(decode_error::unsupported_method,
            "Gzip compression method " + std::to_string(method.value_or(0)) + " is not deflate");
    }
    hdr.flags = data[3];
    hdr.mtime = *reader.u32le_at(4);
    hdr.extra_flags = data[8];
    hdr.os = data[9];
    (void)reader.seek(GZIP_HEADER_SIZE);

    // Optional fields must lie before the trailer
    byte_reader fields(data.first(data.size() - GZIP_TRAILER_SIZE));
    (void)fields.seek(GZIP_HEADER_SIZE);

    if (hdr.flags & FLAG_FEXTRA) {
        const auto xlen = fields.read_u16le();
        if (!xlen || !fields.skip(*xlen)) {
            return decode_result::failure(decode_error::malformed_header, "Gzip extra field truncated");
        }
    }
    if (hdr.flags & FLAG_FNAME) {
        if (!read_zero_terminated(fields, hdr.filename)) {
            return decode_result::failure(decode_error::malformed_header, "Gzip filename truncated");
        }
    }
    if (hdr.flags & FLAG_FCOMMENT) {
        if (!read_zero_terminated(fields, hdr.comment)) {
            return decode_result::failure(decode_error::malformed_header, "Gzip comment truncated");
        }
    }
    if (hdr.flags & FLAG_FHCRC) {
        if (!fields.skip(2)) {
            return decode_result::failure(decode_error::malformed_header, "Gzip header CRC truncated");
        }
    }

    hdr.data_offset = fields.position();
    hdr.data_length = fields.remaining();

    const std::size_t trailer = data.size() - GZIP_TRAILER_SIZE;
    hdr.crc32 = *reader.u32le_at(trailer);
    hdr.original_size = *reader.u32le_at(trailer + 4);

    header = std::move(hdr);
    return decode_result::success();
}

decode_result gzip_reader::decompress(std::span<const std::uint8_t> data,
                                      std::vector<std::uint8_t>& out,
                                      const archive_options& options) {
    gzip_header header;
    auto result = read_header(data, header);
    if (!result) {
        return result;
    }

    if (header.original_size > options.max_output_size) {
        return decode_result::failure(decode_error::malformed_header,
            "Gzip declared size exceeds limit");
    }

    const auto& inflate = options.inflate ? options.inflate : inflate_function(lodepng_inflate_stream);

    std::vector<std::uint8_t> inflated;
    result = inflate(data.subspan(header.data_offset, header.data_length),
                     header.original_size, inflated);
    if (!result) {
        return result;
    }

    if (options.verify_crc && crc32(inflated) != header.crc32) {
        return decode_result::failure(decode_error::inflate_failed, "Gzip CRC-32 mismatch");
    }

    out = std::move(inflated);
    return decode_result::success();
}

} // namespace a2decode
