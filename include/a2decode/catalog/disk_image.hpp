#ifndef A2DECODE_CATALOG_DISK_IMAGE_HPP_
#define A2DECODE_CATALOG_DISK_IMAGE_HPP_

#include <a2decode/a2decode_export.h>
#include <a2decode/types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace a2decode {

// ============================================================================
// Content References
// ============================================================================

/**
 * A run of bytes inside a shared buffer, or a run of zeros when sparse.
 */
struct extent {
    std::size_t offset = 0;
    std::size_t length = 0;
    bool sparse = false;

    bool operator==(const extent&) const = default;
};

/**
 * Lazily materialised file content.
 *
 * Holds a reference to the disk image buffer plus the ordered extents that
 * make up the file, so catalog entries do not copy file data until asked.
 */
class A2DECODE_EXPORT content_ref {
public:
    content_ref() = default;
    content_ref(shared_bytes source, std::vector<extent> extents);

    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] const std::vector<extent>& extents() const noexcept { return extents_; }
    [[nodiscard]] const shared_bytes& source() const noexcept { return source_; }

    /**
     * Copy the content out, expanding sparse extents to zeros.
     */
    [[nodiscard]] std::vector<std::uint8_t> bytes() const;

    /**
     * Direct view when the content is a single non-sparse extent.
     */
    [[nodiscard]] std::optional<std::span<const std::uint8_t>> contiguous_view() const noexcept;

    /**
     * Copy up to dst.size() leading bytes.
     * @return Number of bytes copied
     */
    std::size_t copy_prefix(std::span<std::uint8_t> dst) const noexcept;

    /**
     * Sub-range of this content, clamped to the available bytes.
     */
    [[nodiscard]] content_ref subrange(std::size_t offset, std::size_t length) const;

    bool operator==(const content_ref&) const = default;

private:
    shared_bytes source_;
    std::vector<extent> extents_;
    std::size_t size_ = 0;
};

/**
 * Append an extent, merging it with the previous one when they touch.
 */
A2DECODE_EXPORT void append_extent(std::vector<extent>& list, const extent& e);

// ============================================================================
// Disk Image
// ============================================================================

enum class sector_order {
    prodos,  // blocks stored sequentially (.po, .hdv, 2IMG format 1)
    dos      // DOS 3.3 logical sectors stored sequentially (.do, .dsk)
};

[[nodiscard]] A2DECODE_EXPORT const char* to_string(sector_order order) noexcept;

/**
 * Block and sector addressing over a shared image buffer.
 *
 * The image may be a window into a larger buffer (after a 2IMG header is
 * stripped). Block reads honour the sector order: in a DOS-ordered image a
 * 512-byte block is assembled from two non-adjacent 256-byte sectors.
 */
class A2DECODE_EXPORT disk_image {
public:
    static constexpr std::size_t BLOCK_SIZE = 512;
    static constexpr std::size_t SECTOR_SIZE = 256;
    static constexpr std::size_t SECTORS_PER_TRACK = 16;
    static constexpr std::size_t TRACK_SIZE = SECTOR_SIZE * SECTORS_PER_TRACK;

    disk_image() = default;
    disk_image(shared_bytes data, std::size_t offset, std::size_t length,
               sector_order order, bool order_declared = false);

    /**
     * Wrap a raw buffer, stripping a 2IMG header when present.
     * @param data Whole image file
     * @param out Filled on success
     * @param unwrap_2img Recognise the 2IMG container
     * @return Decode result (malformed_header for a bad 2IMG header)
     */
    [[nodiscard]] static decode_result open(shared_bytes data, disk_image& out,
                                            bool unwrap_2img = true);

    [[nodiscard]] disk_image with_order(sector_order order) const;

    [[nodiscard]] std::size_t size() const noexcept { return length_; }
    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }
    [[nodiscard]] sector_order order() const noexcept { return order_; }
    [[nodiscard]] bool order_declared() const noexcept { return order_declared_; }
    [[nodiscard]] std::size_t block_count() const noexcept { return length_ / BLOCK_SIZE; }
    [[nodiscard]] std::size_t track_count() const noexcept { return length_ / TRACK_SIZE; }
    [[nodiscard]] const shared_bytes& source() const noexcept { return data_; }

    /**
     * Locations of a 512-byte block in the source buffer (one extent in
     * ProDOS order, two in DOS order).
     * @return false if the block lies outside the image
     */
    [[nodiscard]] bool block_extents(std::size_t block, std::vector<extent>& out) const;

    [[nodiscard]] bool read_block(std::size_t block, std::array<std::uint8_t, BLOCK_SIZE>& out) const;

    /**
     * Location of a DOS 3.3 logical track/sector in the source buffer.
     */
    [[nodiscard]] std::optional<extent> sector_extent(std::size_t track, std::size_t sector) const noexcept;

    [[nodiscard]] bool read_sector(std::size_t track, std::size_t sector,
                                   std::array<std::uint8_t, SECTOR_SIZE>& out) const;

    /**
     * Build file content from extents, truncated to size bytes.
     */
    [[nodiscard]] content_ref make_content(const std::vector<extent>& extents, std::size_t size) const;

private:
    shared_bytes data_;
    std::size_t offset_ = 0;
    std::size_t length_ = 0;
    sector_order order_ = sector_order::prodos;
    bool order_declared_ = false;
};

/**
 * Sizes of common floppy images, used to flag files that hold a nested image.
 */
[[nodiscard]] A2DECODE_EXPORT bool is_standard_image_size(std::size_t size) noexcept;

// Signature at the start of a 2IMG container
inline constexpr std::array<std::uint8_t, 4> TWO_IMG_MAGIC = {'2', 'I', 'M', 'G'};

[[nodiscard]] A2DECODE_EXPORT bool has_2img_magic(std::span<const std::uint8_t> data) noexcept;

} // namespace a2decode

#endif // A2DECODE_CATALOG_DISK_IMAGE_HPP_
