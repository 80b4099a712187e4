#include <a2decode/raster/apple2_graphics.hpp>
#include <a2decode/raster/macpaint.hpp>
#include <a2decode/catalog/file_types.hpp>

#include <string>
#include <utility>

namespace a2decode {

namespace {

constexpr std::uint16_t AUX_HGR = 0x4000;
constexpr std::uint16_t AUX_DHGR = 0x4001;
constexpr std::uint16_t AUX_SHR = 0x0000;
constexpr std::uint16_t AUX_SHR_3200 = 0x0002;
constexpr std::uint16_t AUX_PAINTWORKS = 0x0000;
constexpr std::uint16_t AUX_PACKED_SHR = 0x0001;
constexpr std::uint16_t AUX_APF = 0x0002;

// Hi-Res page load addresses used for BIN screen dumps
constexpr std::uint16_t HGR_PAGE1 = 0x2000;
constexpr std::uint16_t HGR_PAGE2 = 0x4000;

raster_format by_length(std::span<const std::uint8_t> data) noexcept {
    if (hgr_decoder::sniff(data)) {
        return raster_format::hgr;
    }
    if (dhgr_decoder::sniff(data)) {
        return raster_format::dhgr;
    }
    if (shr_decoder::sniff(data)) {
        return raster_format::shr;
    }
    if (shr3200_decoder::sniff(data)) {
        return raster_format::shr_3200;
    }
    return raster_format::unknown;
}

raster_format packed_by_content(std::span<const std::uint8_t> data) noexcept {
    if (apf_decoder::sniff(data)) {
        return raster_format::apf;
    }
    if (paintworks_decoder::sniff(data)) {
        return raster_format::paintworks;
    }
    return raster_format::shr_packed;
}

decode_result decode_packed_shr(std::span<const std::uint8_t> data, surface& surf) {
    const auto screen = unpack_bytes(data, shr_decoder::MAX_SIZE);
    if (screen.size() < shr_decoder::PIXEL_BYTES) {
        return decode_result::failure(decode_error::corrupt_document,
            "Packed screen unpacks to " + std::to_string(screen.size()) + " bytes");
    }
    return shr_decoder::decode(screen, surf);
}

} // namespace

const char* to_string(raster_format fmt) noexcept {
    switch (fmt) {
        case raster_format::unknown:    return "unknown";
        case raster_format::hgr:        return "Hi-Res";
        case raster_format::dhgr:       return "Double Hi-Res";
        case raster_format::shr:        return "Super Hi-Res";
        case raster_format::shr_3200:   return "Super Hi-Res 3200";
        case raster_format::shr_packed: return "Packed Super Hi-Res";
        case raster_format::apf:        return "Apple Preferred Format";
        case raster_format::paintworks: return "Paintworks";
        case raster_format::macpaint:   return "MacPaint";
    }
    return "unknown";
}

raster_format identify_raster(std::span<const std::uint8_t> data, const raster_options& options) noexcept {
    const std::uint8_t type = options.type.value_or(prodos_type::NON);
    const std::optional<std::uint16_t> aux = options.aux;

    switch (type) {
        case prodos_type::FOT:
            if (aux == AUX_HGR) {
                return raster_format::hgr;
            }
            if (aux == AUX_DHGR) {
                return raster_format::dhgr;
            }
            return by_length(data);

        case prodos_type::PIC:
            if (aux == AUX_SHR_3200) {
                return raster_format::shr_3200;
            }
            if (aux == AUX_SHR || shr_decoder::sniff(data)) {
                return raster_format::shr;
            }
            return by_length(data);

        case prodos_type::PNT:
            if (aux == AUX_APF) {
                return raster_format::apf;
            }
            if (aux == AUX_PACKED_SHR) {
                return raster_format::shr_packed;
            }
            if (aux == AUX_PAINTWORKS) {
                return raster_format::paintworks;
            }
            return packed_by_content(data);

        case prodos_type::BIN:
            if ((aux == HGR_PAGE1 || aux == HGR_PAGE2) && hgr_decoder::sniff(data)) {
                return raster_format::hgr;
            }
            if (aux && *aux >= 0x2000 && *aux < 0x4000 && dhgr_decoder::sniff(data)) {
                return raster_format::dhgr;
            }
            break;

        default:
            break;
    }

    if (const auto fmt = by_length(data); fmt != raster_format::unknown) {
        return fmt;
    }
    const bool untyped = !options.type || type == prodos_type::NON || type == prodos_type::BIN;
    if (untyped && macpaint_decoder::sniff(data)) {
        return raster_format::macpaint;
    }
    return raster_format::unknown;
}

decode_result decode_raster(std::span<const std::uint8_t> data,
                            raster_image& image,
                            const raster_options& options) {
    const raster_format fmt = identify_raster(data, options);

    memory_surface surf;
    decode_result status;
    switch (fmt) {
        case raster_format::hgr:        status = hgr_decoder::decode(data, surf, options.monochrome); break;
        case raster_format::dhgr:       status = dhgr_decoder::decode(data, surf); break;
        case raster_format::shr:        status = shr_decoder::decode(data, surf); break;
        case raster_format::shr_3200:   status = shr3200_decoder::decode(data, surf); break;
        case raster_format::shr_packed: status = decode_packed_shr(data, surf); break;
        case raster_format::apf:        status = apf_decoder::decode(data, surf); break;
        case raster_format::paintworks: status = paintworks_decoder::decode(data, surf); break;
        case raster_format::macpaint:   status = macpaint_decoder::decode(data, surf); break;
        case raster_format::unknown:
            return decode_result::failure(decode_error::unrecognized_format,
                "No raster format matches " + std::to_string(data.size()) + " bytes");
    }
    if (!status) {
        return status;
    }

    image.format = fmt;
    image.surface = std::move(surf);
    return decode_result::success();
}

} // namespace a2decode
