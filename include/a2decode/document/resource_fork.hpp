#ifndef A2DECODE_DOCUMENT_RESOURCE_FORK_HPP_
#define A2DECODE_DOCUMENT_RESOURCE_FORK_HPP_

#include <a2decode/a2decode_export.h>
#include <a2decode/types.hpp>

#include <cstdint>
#include <span>

namespace a2decode {

// ============================================================================
// IIgs Resource Fork
// ============================================================================

namespace resource_type {
inline constexpr std::uint16_t STYLE_BLOCK = 0x8012;   // rStyleBlock
} // namespace resource_type

/**
 * Locate one resource in an Apple IIgs resource fork.
 *
 * The fork starts with a little-endian header (version 0, offset and size
 * of the resource map, 128-byte memo). The map's reference index holds
 * 20-byte records of type, ID, file offset, attributes and size; a zero
 * type ends the index.
 *
 * @param fork Whole resource fork
 * @param type Resource type
 * @param id Resource ID
 * @param out View of the resource data on success
 * @return Decode result (unrecognized_format for a Macintosh fork or a
 *         missing resource, malformed_header for a map outside the fork,
 *         out_of_bounds for resource data past the end)
 */
[[nodiscard]] A2DECODE_EXPORT decode_result find_iigs_resource(std::span<const std::uint8_t> fork,
                                                               std::uint16_t type,
                                                               std::uint32_t id,
                                                               std::span<const std::uint8_t>& out);

} // namespace a2decode

#endif // A2DECODE_DOCUMENT_RESOURCE_FORK_HPP_
