#ifndef A2DECODE_ARCHIVE_INFLATE_HPP_
#define A2DECODE_ARCHIVE_INFLATE_HPP_

#include <a2decode/a2decode_export.h>
#include <a2decode/types.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace a2decode {

// ============================================================================
// Inflate Primitive
// ============================================================================

/**
 * Raw DEFLATE (RFC 1951) decompressor.
 *
 * @param compressed Deflate stream without zlib or gzip framing
 * @param expected_size Size declared by the container (0 = unknown)
 * @param out Receives the decompressed bytes
 * @return Decode result
 */
using inflate_function = std::function<decode_result(std::span<const std::uint8_t> compressed,
                                                      std::size_t expected_size,
                                                      std::vector<std::uint8_t>& out)>;

// Output cap applied when the container does not declare a size
inline constexpr std::size_t DEFAULT_MAX_OUTPUT_SIZE = 256u * 1024u * 1024u;

/**
 * Default inflate primitive, backed by lodepng.
 * Decompression stops once the output exceeds `expected_size`, or
 * DEFAULT_MAX_OUTPUT_SIZE when no size is declared.
 */
[[nodiscard]] A2DECODE_EXPORT decode_result lodepng_inflate_stream(std::span<const std::uint8_t> compressed,
                                                                   std::size_t expected_size,
                                                                   std::vector<std::uint8_t>& out);

// ============================================================================
// Archive Options
// ============================================================================

struct archive_options {
    // Decompressor; empty means lodepng_inflate_stream
    inflate_function inflate;

    // Refuse to produce more output than this
    std::size_t max_output_size = DEFAULT_MAX_OUTPUT_SIZE;

    // Compare the stored CRC-32 with the decompressed data
    bool verify_crc = true;
};

/**
 * CRC-32 (IEEE 802.3), as stored in gzip trailers and ZIP headers.
 */
[[nodiscard]] A2DECODE_EXPORT std::uint32_t crc32(std::span<const std::uint8_t> data) noexcept;

} // namespace a2decode

#endif // A2DECODE_ARCHIVE_INFLATE_HPP_
