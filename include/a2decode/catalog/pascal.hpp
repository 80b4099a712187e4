#ifndef A2DECODE_CATALOG_PASCAL_HPP_
#define A2DECODE_CATALOG_PASCAL_HPP_

#include <a2decode/a2decode_export.h>
#include <a2decode/types.hpp>
#include <a2decode/catalog/catalog.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace a2decode {

// ============================================================================
// UCSD Pascal Volume
// ============================================================================

/**
 * Apple II UCSD Pascal catalog reader.
 *
 * The directory starts in block 2 with a volume entry followed by 26-byte
 * file entries. Files are contiguous block runs.
 */
class A2DECODE_EXPORT pascal_volume {
public:
    static constexpr std::string_view name = "pascal";
    static constexpr sector_order preferred_order = sector_order::prodos;

    static constexpr std::size_t DIRECTORY_BLOCK = 2;
    static constexpr std::size_t ENTRY_SIZE = 26;
    static constexpr std::size_t MAX_FILES = 77;

    // File kinds
    static constexpr std::uint8_t KIND_XDSK = 0;
    static constexpr std::uint8_t KIND_CODE = 1;
    static constexpr std::uint8_t KIND_TEXT = 2;
    static constexpr std::uint8_t KIND_INFO = 3;
    static constexpr std::uint8_t KIND_DATA = 4;
    static constexpr std::uint8_t KIND_GRAF = 5;
    static constexpr std::uint8_t KIND_FOTO = 6;
    static constexpr std::uint8_t KIND_SDIR = 7;

    /**
     * Check the volume entry in block 2.
     */
    [[nodiscard]] static bool sniff(const disk_image& image) noexcept;

    [[nodiscard]] static decode_result walk(const disk_image& image, disk_catalog& catalog);
};

/**
 * Decode a Pascal date word (month bits 0-3, day 4-8, year 9-15).
 * @return nullopt when the month or day is zero or out of range
 */
[[nodiscard]] A2DECODE_EXPORT std::optional<date_time> decode_pascal_date(std::uint16_t word) noexcept;

/**
 * Convert a Pascal TEXT file to plain text.
 * Skips the 1 KB editor header page, expands DLE space runs, turns CR into
 * LF and drops NULs and other control characters.
 */
[[nodiscard]] A2DECODE_EXPORT std::string pascal_text_to_plain(std::span<const std::uint8_t> data);

} // namespace a2decode

#endif // A2DECODE_CATALOG_PASCAL_HPP_
