#ifndef A2DECODE_ARCHIVE_GZIP_HPP_
#define A2DECODE_ARCHIVE_GZIP_HPP_

#include <a2decode/a2decode_export.h>
#include <a2decode/types.hpp>
#include <a2decode/archive/inflate.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace a2decode {

// ============================================================================
// Gzip Member Header
// ============================================================================

struct gzip_header {
    std::uint8_t flags = 0;
    std::uint32_t mtime = 0;
    std::uint8_t extra_flags = 0;
    std::uint8_t os = 0;
    std::string filename;
    std::string comment;

    // Deflate stream location within the member
    std::size_t data_offset = 0;
    std::size_t data_length = 0;

    // Trailer
    std::uint32_t crc32 = 0;
    std::uint32_t original_size = 0;
};

// ============================================================================
// Gzip Reader
// ============================================================================

class A2DECODE_EXPORT gzip_reader {
public:
    static constexpr std::string_view name = "gzip";
    static constexpr std::string_view extensions[] = {".gz", ".gzip"};

    static constexpr std::uint8_t FLAG_FTEXT = 0x01;
    static constexpr std::uint8_t FLAG_FHCRC = 0x02;
    static constexpr std::uint8_t FLAG_FEXTRA = 0x04;
    static constexpr std::uint8_t FLAG_FNAME = 0x08;
    static constexpr std::uint8_t FLAG_FCOMMENT = 0x10;

    /**
     * Check for the gzip magic (1F 8B).
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Parse the member header and trailer without decompressing.
     * @param data Whole .gz file
     * @param header Filled on success
     * @return Decode result (malformed_header if an optional field runs off the end)
     */
    [[nodiscard]] static decode_result read_header(std::span<const std::uint8_t> data,
                                                   gzip_header& header);

    /**
     * Decompress a single-member gzip file.
     * @param data Whole .gz file
     * @param out Receives the original bytes (untouched on failure)
     * @param options Inflate primitive and limits
     * @return Decode result
     */
    [[nodiscard]] static decode_result decompress(std::span<const std::uint8_t> data,
                                                  std::vector<std::uint8_t>& out,
                                                  const archive_options& options = {});
};

} // namespace a2decode

#endif // A2DECODE_ARCHIVE_GZIP_HPP_
