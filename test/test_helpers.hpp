#pragma once

#include <lodepng.h>

#include <cstdint>
#include <cstdlib>
#include <span>
#include <string_view>
#include <vector>

namespace test_util {

inline void put_le16(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
}

inline void put_le32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<std::uint8_t>((v >> (i * 8)) & 0xFF));
    }
}

inline void set_le16(std::vector<std::uint8_t>& out, std::size_t offset, std::uint16_t v) {
    out[offset] = static_cast<std::uint8_t>(v & 0xFF);
    out[offset + 1] = static_cast<std::uint8_t>(v >> 8);
}

inline void set_le32(std::vector<std::uint8_t>& out, std::size_t offset, std::uint32_t v) {
    for (std::size_t i = 0; i < 4; ++i) {
        out[offset + i] = static_cast<std::uint8_t>((v >> (i * 8)) & 0xFF);
    }
}

inline void put_text(std::vector<std::uint8_t>& out, std::string_view text) {
    out.insert(out.end(), text.begin(), text.end());
}

inline std::vector<std::uint8_t> bytes_of(std::string_view text) {
    return {text.begin(), text.end()};
}

// Apple II "high ASCII": every character with bit 7 set
inline std::vector<std::uint8_t> high_ascii(std::string_view text) {
    std::vector<std::uint8_t> out;
    for (const char c : text) {
        out.push_back(static_cast<std::uint8_t>(static_cast<std::uint8_t>(c) | 0x80));
    }
    return out;
}

// Proper prefix lengths of a buffer of `size` bytes, starting with the empty
// buffer: every length below `dense`, then every `step` bytes, then size - 1.
inline std::vector<std::size_t> prefix_lengths(std::size_t size, std::size_t step = 1,
                                               std::size_t dense = 64) {
    std::vector<std::size_t> out;
    for (std::size_t n = 0; n < size && n < dense; ++n) {
        out.push_back(n);
    }
    for (std::size_t n = dense; n < size; n += step) {
        out.push_back(n);
    }
    if (size > 0 && (out.empty() || out.back() != size - 1)) {
        out.push_back(size - 1);
    }
    return out;
}

// Raw DEFLATE stream (no zlib or gzip framing)
inline std::vector<std::uint8_t> deflate_raw(std::span<const std::uint8_t> data) {
    unsigned char* buffer = nullptr;
    std::size_t size = 0;
    const unsigned error = lodepng_deflate(&buffer, &size, data.data(), data.size(),
                                           &lodepng_default_compress_settings);
    std::vector<std::uint8_t> out;
    if (error == 0) {
        out.assign(buffer, buffer + size);
    }
    std::free(buffer);
    return out;
}

} // namespace test_util
