#ifndef A2DECODE_TYPES_HPP_
#define A2DECODE_TYPES_HPP_

#include <a2decode/a2decode_export.h>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace a2decode {

// ============================================================================
// Pixel Formats
// ============================================================================

// Fixed-palette screens (HGR, DHGR, MacPaint, Paintworks) stay indexed;
// formats with per-line palettes or masks are expanded to RGBA.
enum class pixel_format {
    indexed8,
    rgba8888
};

[[nodiscard]] constexpr std::size_t bytes_per_pixel(pixel_format fmt) noexcept {
    return fmt == pixel_format::indexed8 ? 1 : 4;
}

// ============================================================================
// Shared Byte Buffers
// ============================================================================

/**
 * Immutable, reference-counted byte buffer.
 * Disk images are held this way so catalog entries can keep views into
 * them after the walk returns.
 */
using shared_bytes = std::shared_ptr<const std::vector<std::uint8_t>>;

[[nodiscard]] inline shared_bytes make_shared_bytes(std::vector<std::uint8_t> data) {
    return std::make_shared<const std::vector<std::uint8_t>>(std::move(data));
}

[[nodiscard]] inline shared_bytes make_shared_bytes(std::span<const std::uint8_t> data) {
    return std::make_shared<const std::vector<std::uint8_t>>(data.begin(), data.end());
}

// ============================================================================
// Timestamps
// ============================================================================

struct date_time {
    int year = 0;
    int month = 0;   // 1-12
    int day = 0;     // 1-31
    int hour = 0;
    int minute = 0;
    int second = 0;

    bool operator==(const date_time&) const = default;
};

// "YYYY-MM-DD HH:MM"
[[nodiscard]] A2DECODE_EXPORT std::string to_string(const date_time& dt);

// ============================================================================
// Decode Errors
// ============================================================================

enum class decode_error {
    none,
    out_of_bounds,
    unrecognized_format,
    circular_directory,
    corrupt_document,
    too_short,
    malformed_header,
    unsupported_method,
    inflate_failed,
    corrupt_catalog,
    internal_error
};

[[nodiscard]] A2DECODE_EXPORT const char* to_string(decode_error err) noexcept;

// ============================================================================
// Decode Result
// ============================================================================

struct decode_result {
    bool ok = false;
    decode_error error = decode_error::none;
    std::string message;

    [[nodiscard]] static decode_result success() {
        return {true, decode_error::none, {}};
    }

    [[nodiscard]] static decode_result failure(decode_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

} // namespace a2decode

#endif // A2DECODE_TYPES_HPP_
