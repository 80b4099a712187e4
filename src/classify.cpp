#include <a2decode/classify.hpp>
#include <a2decode/archive/gzip.hpp>
#include <a2decode/archive/zip.hpp>
#include <a2decode/archive/binary2.hpp>
#include <a2decode/basic/detokenizer.hpp>
#include <a2decode/catalog/disk_image.hpp>
#include <a2decode/catalog/file_types.hpp>
#include <a2decode/document/appleworks.hpp>
#include <a2decode/document/text.hpp>
#include <a2decode/raster/apple2_graphics.hpp>
#include <a2decode/raster/iigs_icon.hpp>

#include <algorithm>
#include <optional>

namespace a2decode {

namespace {

std::optional<content_kind> by_type(std::uint8_t type, std::optional<std::uint16_t> aux,
                                    std::span<const std::uint8_t> data) noexcept {
    const auto as_raster = [&]() -> std::optional<content_kind> {
        const raster_options options{type, aux, false};
        if (identify_raster(data, options) != raster_format::unknown) {
            return content_kind::raster;
        }
        return std::nullopt;
    };

    switch (type) {
        case prodos_type::BAS:
            return is_valid_applesoft(data) ? content_kind::applesoft : content_kind::binary;
        case prodos_type::INT:
            return is_valid_integer_basic(data) ? content_kind::integer_basic : content_kind::binary;
        case prodos_type::AWP:
            return content_kind::appleworks_wp;
        case prodos_type::ADB:
            return content_kind::appleworks_db;
        case prodos_type::ASP:
            return content_kind::appleworks_ss;
        case prodos_type::GWP:
            if (aux == teach_decoder::AUX_TYPE) {
                return content_kind::teach;
            }
            if (aux && is_appleworks_type(type, *aux)) {
                return content_kind::appleworks_gs_wp;
            }
            return std::nullopt;
        case prodos_type::ICN:
            return content_kind::icon;
        case prodos_type::FOT:
        case prodos_type::PIC:
        case prodos_type::PNT:
            return as_raster().value_or(content_kind::binary);
        case prodos_type::BIN:
        case prodos_type::S16:
            return as_raster();
        case prodos_type::TXT:
            return merlin_decoder::sniff(data) ? content_kind::merlin_source : content_kind::text;
        default:
            return std::nullopt;
    }
}

bool looks_like_disk_image(std::span<const std::uint8_t> data) noexcept {
    return is_standard_image_size(data.size()) || has_2img_magic(data);
}

} // namespace

const char* to_string(content_kind kind) noexcept {
    switch (kind) {
        case content_kind::disk_image:       return "disk image";
        case content_kind::archive_gzip:     return "gzip archive";
        case content_kind::archive_zip:      return "ZIP archive";
        case content_kind::archive_binary2:  return "Binary II archive";
        case content_kind::applesoft:        return "Applesoft BASIC";
        case content_kind::integer_basic:    return "Integer BASIC";
        case content_kind::appleworks_wp:    return "AppleWorks word processor";
        case content_kind::appleworks_gs_wp: return "AppleWorks GS word processor";
        case content_kind::appleworks_db:    return "AppleWorks database";
        case content_kind::appleworks_ss:    return "AppleWorks spreadsheet";
        case content_kind::teach:            return "Teach document";
        case content_kind::raster:           return "picture";
        case content_kind::icon:             return "icon file";
        case content_kind::text:             return "text";
        case content_kind::merlin_source:    return "Merlin source";
        case content_kind::binary:           return "binary";
    }
    return "binary";
}

content_kind classify(std::optional<std::uint8_t> type,
                      std::optional<std::uint16_t> aux,
                      std::span<const std::uint8_t> data) noexcept {
    if (gzip_reader::sniff(data)) {
        return content_kind::archive_gzip;
    }
    if (zip_reader::sniff(data)) {
        return content_kind::archive_zip;
    }
    if (binary2_archive::sniff(data)) {
        return content_kind::archive_binary2;
    }

    if (type) {
        if (const auto kind = by_type(*type, aux, data)) {
            return *kind;
        }
    }

    // Disk sizes first: a blank image also passes the MacPaint sniff
    if (looks_like_disk_image(data)) {
        return content_kind::disk_image;
    }
    if (!type && identify_raster(data) != raster_format::unknown) {
        return content_kind::raster;
    }
    if (merlin_decoder::sniff(data)) {
        return content_kind::merlin_source;
    }
    if (is_likely_text(data)) {
        return content_kind::text;
    }
    return content_kind::binary;
}

} // namespace a2decode
