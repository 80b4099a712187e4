#include <a2decode/document/resource_fork.hpp>
#include <a2decode/byte_reader.hpp>

#include <cstdio>

namespace a2decode {

namespace {

constexpr std::size_t HEADER_SIZE = 12 + 128;   // version, map offset, map size, memo

// Header fields
constexpr std::size_t RF_VERSION = 0x00;
constexpr std::size_t RF_TO_MAP = 0x04;

// Map fields, relative to the map
constexpr std::size_t MAP_TO_INDEX = 0x0E;
constexpr std::size_t MAP_INDEX_SIZE = 0x14;
constexpr std::size_t MAP_HEADER_SIZE = 0x20;

// Reference record fields
constexpr std::size_t REF_TYPE = 0x00;
constexpr std::size_t REF_ID = 0x02;
constexpr std::size_t REF_OFFSET = 0x06;
constexpr std::size_t REF_SIZE = 0x0C;
constexpr std::size_t REF_RECORD_SIZE = 0x14;

} // namespace

decode_result find_iigs_resource(std::span<const std::uint8_t> fork, std::uint16_t type,
                                 std::uint32_t id, std::span<const std::uint8_t>& out) {
    if (fork.size() < HEADER_SIZE) {
        return decode_result::failure(decode_error::too_short, "Resource fork header truncated");
    }

    const byte_reader reader(fork);
    if (*reader.u32le_at(RF_VERSION) != 0) {
        return decode_result::failure(decode_error::unrecognized_format,
            "Not an Apple IIgs resource fork");
    }

    const std::size_t map = *reader.u32le_at(RF_TO_MAP);
    if (!reader.slice(map, MAP_HEADER_SIZE)) {
        return decode_result::failure(decode_error::malformed_header,
            "Resource map lies outside the fork");
    }
    const std::size_t index = map + *reader.u16le_at(map + MAP_TO_INDEX);
    const std::size_t index_size = *reader.u32le_at(map + MAP_INDEX_SIZE);

    for (std::size_t i = 0; i < index_size; ++i) {
        const auto ref = reader.slice(index + i * REF_RECORD_SIZE, REF_RECORD_SIZE);
        if (!ref) {
            return decode_result::failure(decode_error::malformed_header,
                "Resource index runs past end of fork");
        }

        const byte_reader record(*ref);
        const std::uint16_t ref_type = *record.u16le_at(REF_TYPE);
        if (ref_type == 0) {
            break;
        }
        if (ref_type != type || *record.u32le_at(REF_ID) != id) {
            continue;
        }

        const auto data = reader.slice(*record.u32le_at(REF_OFFSET), *record.u32le_at(REF_SIZE));
        if (!data) {
            return decode_result::failure(decode_error::out_of_bounds,
                "Resource data runs past end of fork");
        }
        out = *data;
        return decode_result::success();
    }

    char buf[48];
    std::snprintf(buf, sizeof(buf), "Resource $%04X/%u not found", type, static_cast<unsigned>(id));
    return decode_result::failure(decode_error::unrecognized_format, buf);
}

} // namespace a2decode
