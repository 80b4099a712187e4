#include <a2decode/archive/inflate.hpp>
#include <lodepng.h>

#include <cstdlib>
#include <string>

namespace a2decode {

decode_result lodepng_inflate_stream(std::span<const std::uint8_t> compressed,
                                     std::size_t expected_size,
                                     std::vector<std::uint8_t>& out) {
    unsigned char* buffer = nullptr;
    std::size_t buffer_size = 0;

    LodePNGDecompressSettings settings = lodepng_default_decompress_settings;
    settings.max_output_size = expected_size != 0 ? expected_size : DEFAULT_MAX_OUTPUT_SIZE;

    const unsigned error = lodepng_inflate(&buffer, &buffer_size,
                                           compressed.data(), compressed.size(), &settings);
    if (error) {
        std::free(buffer);
        return decode_result::failure(decode_error::inflate_failed,
            std::string("Inflate error: ") + lodepng_error_text(error));
    }

    std::vector<std::uint8_t> result(buffer, buffer + buffer_size);
    std::free(buffer);

    if (expected_size != 0 && result.size() != expected_size) {
        return decode_result::failure(decode_error::inflate_failed,
            "Inflated size " + std::to_string(result.size()) +
            " does not match declared size " + std::to_string(expected_size));
    }

    out = std::move(result);
    return decode_result::success();
}

std::uint32_t crc32(std::span<const std::uint8_t> data) noexcept {
    return lodepng_crc32(data.data(), data.size());
}

} // namespace a2decode
