#ifndef A2DECODE_ARCHIVE_ZIP_HPP_
#define A2DECODE_ARCHIVE_ZIP_HPP_

#include <a2decode/a2decode_export.h>
#include <a2decode/types.hpp>
#include <a2decode/archive/inflate.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace a2decode {

// ============================================================================
// ZIP Entry
// ============================================================================

struct zip_entry {
    std::string filename;
    std::uint32_t compressed_size = 0;
    std::uint32_t uncompressed_size = 0;
    std::uint16_t method = 0;        // 0 = stored, 8 = deflate
    std::uint16_t flags = 0;         // general purpose bit flags
    std::uint32_t crc32 = 0;
    std::size_t header_offset = 0;   // local header position
    std::size_t data_offset = 0;     // first byte of entry data
    std::optional<date_time> modified;

    [[nodiscard]] bool is_directory() const noexcept {
        return !filename.empty() && filename.back() == '/';
    }

    bool operator==(const zip_entry&) const = default;
};

/**
 * Decode an MS-DOS packed date/time pair.
 * @return nullopt if month or day is zero or out of range
 */
[[nodiscard]] A2DECODE_EXPORT std::optional<date_time> decode_dos_date_time(std::uint16_t date,
                                                                             std::uint16_t time) noexcept;

// ============================================================================
// ZIP Reader
// ============================================================================

/**
 * Sequential ZIP reader. Walks local file headers from offset 0 and never
 * consults the central directory.
 */
class A2DECODE_EXPORT zip_reader {
public:
    static constexpr std::string_view name = "zip";
    static constexpr std::string_view extensions[] = {".zip"};

    static constexpr std::uint16_t METHOD_STORED = 0;
    static constexpr std::uint16_t METHOD_DEFLATE = 8;

    /**
     * Check for a local file header signature at offset 0.
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * List entries in archive order.
     * The walk stops at the first record that is not a local file header
     * (normally the central directory) or that runs past the buffer.
     * @param data Whole .zip file
     * @param entries Filled on success
     */
    [[nodiscard]] static decode_result list(std::span<const std::uint8_t> data,
                                            std::vector<zip_entry>& entries);

    /**
     * Extract one entry.
     * @param data Whole .zip file
     * @param entry Entry previously returned by list()
     * @param out Receives the entry bytes (untouched on failure)
     * @param options Inflate primitive and limits
     * @return Decode result (unsupported_method for anything but stored/deflate)
     */
    [[nodiscard]] static decode_result extract(std::span<const std::uint8_t> data,
                                               const zip_entry& entry,
                                               std::vector<std::uint8_t>& out,
                                               const archive_options& options = {});
};

} // namespace a2decode

#endif // A2DECODE_ARCHIVE_ZIP_HPP_
