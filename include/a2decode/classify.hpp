#ifndef A2DECODE_CLASSIFY_HPP_
#define A2DECODE_CLASSIFY_HPP_

#include <a2decode/a2decode_export.h>

#include <cstdint>
#include <optional>
#include <span>

namespace a2decode {

// ============================================================================
// Content Classification
// ============================================================================

enum class content_kind {
    disk_image,
    archive_gzip,
    archive_zip,
    archive_binary2,
    applesoft,
    integer_basic,
    appleworks_wp,
    appleworks_gs_wp,
    appleworks_db,
    appleworks_ss,
    teach,
    raster,
    icon,
    text,
    merlin_source,
    binary
};

[[nodiscard]] A2DECODE_EXPORT const char* to_string(content_kind kind) noexcept;

/**
 * Choose the decoder for a file.
 *
 * Checks run in order: archive magic, the ProDOS type code (BASIC types
 * must pass the program pre-check, picture types must identify as a
 * raster), disk image sizes and the 2IMG magic, raster identification for
 * untyped data, Merlin source, printable text. Anything else is binary.
 *
 * @param type ProDOS file type, when known
 * @param aux Aux type or load address, when known
 * @param data File contents
 */
[[nodiscard]] A2DECODE_EXPORT content_kind classify(std::optional<std::uint8_t> type,
                                                    std::optional<std::uint16_t> aux,
                                                    std::span<const std::uint8_t> data) noexcept;

} // namespace a2decode

#endif // A2DECODE_CLASSIFY_HPP_
