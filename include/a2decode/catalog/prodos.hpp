#ifndef A2DECODE_CATALOG_PRODOS_HPP_
#define A2DECODE_CATALOG_PRODOS_HPP_

#include <a2decode/a2decode_export.h>
#include <a2decode/types.hpp>
#include <a2decode/catalog/catalog.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace a2decode {

// ============================================================================
// ProDOS Volume
// ============================================================================

/**
 * ProDOS / GS/OS catalog reader.
 *
 * The volume directory starts at block 2 (block 1 on some non-standard
 * disks). Seedling, sapling, tree and extended files are supported;
 * subdirectories are decoded recursively.
 */
class A2DECODE_EXPORT prodos_volume {
public:
    static constexpr std::string_view name = "prodos";
    static constexpr sector_order preferred_order = sector_order::prodos;

    // Storage types (high nibble of the entry's first byte)
    static constexpr std::uint8_t STORAGE_DELETED = 0x0;
    static constexpr std::uint8_t STORAGE_SEEDLING = 0x1;
    static constexpr std::uint8_t STORAGE_SAPLING = 0x2;
    static constexpr std::uint8_t STORAGE_TREE = 0x3;
    static constexpr std::uint8_t STORAGE_PASCAL_AREA = 0x4;
    static constexpr std::uint8_t STORAGE_EXTENDED = 0x5;
    static constexpr std::uint8_t STORAGE_SUBDIRECTORY = 0xD;
    static constexpr std::uint8_t STORAGE_SUBDIR_HEADER = 0xE;
    static constexpr std::uint8_t STORAGE_VOLUME_HEADER = 0xF;

    /**
     * Check for a plausible volume directory header.
     */
    [[nodiscard]] static bool sniff(const disk_image& image) noexcept;

    /**
     * Build the catalog tree.
     * @return Decode result (circular_directory if a directory block repeats)
     */
    [[nodiscard]] static decode_result walk(const disk_image& image, disk_catalog& catalog);
};

/**
 * Decode a ProDOS date/time pair.
 * @param date yyyyyyym mmmddddd
 * @param time 000hhhhh 00mmmmmm
 * @return nullopt for a zero date or an invalid month
 */
[[nodiscard]] A2DECODE_EXPORT std::optional<date_time> decode_prodos_date(std::uint16_t date,
                                                                           std::uint16_t time) noexcept;

/**
 * Apply GS/OS lowercase flags to a ProDOS name.
 * @param name Name as stored (uppercase)
 * @param case_bits Flag word; bit 15 enables, bit 14 is the first character
 */
[[nodiscard]] A2DECODE_EXPORT std::string apply_case_bits(std::string_view name, std::uint16_t case_bits);

} // namespace a2decode

#endif // A2DECODE_CATALOG_PRODOS_HPP_
