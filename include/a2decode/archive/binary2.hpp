#ifndef A2DECODE_ARCHIVE_BINARY2_HPP_
#define A2DECODE_ARCHIVE_BINARY2_HPP_

#include <a2decode/a2decode_export.h>
#include <a2decode/types.hpp>
#include <a2decode/catalog/catalog.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace a2decode {

// ============================================================================
// Binary II Entry
// ============================================================================

/**
 * One file record of a Binary II archive (File Type Note $E0/8000).
 */
struct binary2_entry {
    std::string filename;            // ProDOS partial pathname, '/' separated
    std::uint8_t access = 0;
    std::uint8_t file_type = 0;
    std::uint16_t aux_type = 0;
    std::uint16_t aux_type_high = 0; // GS/OS aux type high word
    std::uint8_t storage_type = 0;
    std::uint16_t blocks = 0;        // size in 512-byte blocks on the source disk
    std::optional<date_time> created;
    std::optional<date_time> modified;
    std::uint32_t eof = 0;
    std::uint8_t os_type = 0;        // 0 ProDOS, 1 DOS 3.3, ...
    std::uint8_t data_flags = 0;
    std::uint8_t version = 0;
    std::uint8_t files_to_follow = 0;
    bool squeezed = false;           // data starts with the SQ signature
    std::size_t header_offset = 0;
    std::size_t data_offset = 0;

    [[nodiscard]] bool is_directory() const noexcept {
        return storage_type == 0x0D || file_type == 0x0F;
    }

    bool operator==(const binary2_entry&) const = default;
};

// ============================================================================
// Binary II Reader
// ============================================================================

/**
 * Binary II reader.
 *
 * An archive is a run of 128-byte headers, each followed by the file data
 * padded to a multiple of 128 bytes. The first header's files-to-follow
 * count says how many records come after it. Directories are records with
 * no data; the files inside them carry the full partial pathname.
 *
 * The reader is also registered as a catalog filesystem so a Binary II
 * archive lists through walk_catalog() like a disk image.
 */
class A2DECODE_EXPORT binary2_archive {
public:
    static constexpr std::string_view name = "binary2";
    static constexpr std::string_view extensions[] = {".bny", ".bqy"};
    static constexpr sector_order preferred_order = sector_order::prodos;

    static constexpr std::size_t HEADER_SIZE = 128;
    static constexpr std::size_t MAX_FILENAME = 64;

    // Data flags at +125
    static constexpr std::uint8_t FLAG_COMPRESSED = 0x80;
    static constexpr std::uint8_t FLAG_ENCRYPTED = 0x40;
    static constexpr std::uint8_t FLAG_SPARSE = 0x01;

    /**
     * Check for the $0A 'G' 'L' signature and the $02 ID byte.
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * List records in archive order.
     * The walk stops after the last record the first header announces or at
     * the first block that is not a Binary II header.
     * @param data Whole archive
     * @param entries Filled on success
     * @return Decode result (malformed_header for a bad filename length,
     *         too_short when a record's data runs past the buffer)
     */
    [[nodiscard]] static decode_result list(std::span<const std::uint8_t> data,
                                            std::vector<binary2_entry>& entries);

    /**
     * Copy one record's data fork.
     * @param data Whole archive
     * @param entry Record previously returned by list()
     * @param out Receives the file bytes (untouched on failure)
     * @return Decode result (unsupported_method for squeezed, compressed
     *         or encrypted data)
     */
    [[nodiscard]] static decode_result extract(std::span<const std::uint8_t> data,
                                               const binary2_entry& entry,
                                               std::vector<std::uint8_t>& out);

    // Catalog filesystem hooks
    [[nodiscard]] static bool sniff(const disk_image& image) noexcept;

    /**
     * Build a catalog tree from the record pathnames.
     * Directory records become directory nodes; files whose parent has no
     * record of its own get one created for them.
     */
    [[nodiscard]] static decode_result walk(const disk_image& image, disk_catalog& catalog);
};

} // namespace a2decode

#endif // A2DECODE_ARCHIVE_BINARY2_HPP_
