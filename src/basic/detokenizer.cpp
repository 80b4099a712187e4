#include <a2decode/basic/detokenizer.hpp>

namespace a2decode {

std::string token_line::text() const {
    std::string out = std::to_string(number);
    out.push_back(' ');
    for (const auto& fragment : fragments) {
        out += fragment.text;
    }
    return out;
}

std::string basic_program::listing() const {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i != 0) {
            out.push_back('\n');
        }
        out += lines[i].text();
    }
    return out;
}

decode_result detokenize(std::span<const std::uint8_t> data,
                         basic_dialect dialect,
                         basic_program& program) {
    switch (dialect) {
        case basic_dialect::applesoft:
            return applesoft_detokenizer::decode(data, program);
        case basic_dialect::integer:
            return integer_basic_detokenizer::decode(data, program);
    }
    return decode_result::failure(decode_error::internal_error, "Unknown BASIC dialect");
}

decode_result detokenize(std::span<const std::uint8_t> data,
                         basic_program& program,
                         const basic_options& options) {
    return detokenize(data, options.dialect, program);
}

std::string listing_or_diagnostic(std::span<const std::uint8_t> data, basic_dialect dialect) {
    basic_program program;
    if (!detokenize(data, dialect, program)) {
        return std::string(INVALID_PROGRAM_TEXT);
    }
    return program.listing();
}

} // namespace a2decode
