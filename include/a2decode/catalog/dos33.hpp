#ifndef A2DECODE_CATALOG_DOS33_HPP_
#define A2DECODE_CATALOG_DOS33_HPP_

#include <a2decode/a2decode_export.h>
#include <a2decode/types.hpp>
#include <a2decode/catalog/catalog.hpp>

#include <cstdint>
#include <string_view>

namespace a2decode {

// ============================================================================
// DOS 3.3 Volume
// ============================================================================

/**
 * DOS 3.3 catalog reader.
 *
 * The VTOC at track 17 sector 0 points to a chain of catalog sectors, each
 * holding seven 35-byte file descriptors. File data is located through a
 * chain of track/sector list sectors.
 *
 * Applesoft, Integer BASIC and binary files carry a small length header in
 * their first data sector; entry content excludes that header and is
 * truncated to the declared length. Text files end at the first NUL.
 */
class A2DECODE_EXPORT dos33_volume {
public:
    static constexpr std::string_view name = "dos33";
    static constexpr sector_order preferred_order = sector_order::dos;

    static constexpr std::uint8_t VTOC_TRACK = 17;
    static constexpr std::uint8_t VTOC_SECTOR = 0;
    static constexpr std::size_t MIN_IMAGE_SIZE = 143360;

    // Catalog type byte values (bit 7 = locked)
    static constexpr std::uint8_t TYPE_TEXT = 0x00;
    static constexpr std::uint8_t TYPE_INTEGER = 0x01;
    static constexpr std::uint8_t TYPE_APPLESOFT = 0x02;
    static constexpr std::uint8_t TYPE_BINARY = 0x04;
    static constexpr std::uint8_t TYPE_LOCKED = 0x80;

    /**
     * Check the VTOC geometry fields.
     */
    [[nodiscard]] static bool sniff(const disk_image& image) noexcept;

    /**
     * Build the catalog.
     * @return Decode result (circular_directory if the catalog chain loops)
     */
    [[nodiscard]] static decode_result walk(const disk_image& image, disk_catalog& catalog);
};

} // namespace a2decode

#endif // A2DECODE_CATALOG_DOS33_HPP_
