#include <a2decode/types.hpp>

#include <cstdio>

namespace a2decode {

const char* to_string(decode_error err) noexcept {
    switch (err) {
        case decode_error::none:                return "none";
        case decode_error::out_of_bounds:       return "out_of_bounds";
        case decode_error::unrecognized_format: return "unrecognized_format";
        case decode_error::circular_directory:  return "circular_directory";
        case decode_error::corrupt_document:    return "corrupt_document";
        case decode_error::too_short:           return "too_short";
        case decode_error::malformed_header:    return "malformed_header";
        case decode_error::unsupported_method:  return "unsupported_method";
        case decode_error::inflate_failed:      return "inflate_failed";
        case decode_error::corrupt_catalog:     return "corrupt_catalog";
        case decode_error::internal_error:      return "internal_error";
    }
    return "unknown";
}

std::string to_string(const date_time& dt) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d",
                  dt.year, dt.month, dt.day, dt.hour, dt.minute);
    return buf;
}

} // namespace a2decode
