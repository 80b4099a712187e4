#include <a2decode/basic/detokenizer.hpp>
#include "line_builder.hpp"
#include "../byte_io.hpp"

#include <array>
#include <cstdio>

namespace a2decode {

namespace {

// Every value below $80 is a token. Several codes share a spelling because
// the tokenizer distinguishes syntactic roles (e.g. "=" in LET vs. IF).
constexpr std::array<std::string_view, 128> TOKENS = {{
    /*$00*/ "HIMEM:",   "",         "_ ",       ":",
            "LOAD ",    "SAVE ",    "CON ",     "RUN ",
    /*$08*/ "RUN ",     "DEL ",     ",",        "NEW ",
            "CLR ",     "AUTO ",    ",",        "MAN ",
    /*$10*/ "HIMEM:",   "LOMEM:",   "+",        "-",
            "*",        "/",        "=",        "#",
    /*$18*/ ">=",       ">",        "<=",       "<>",
            "<",        "AND ",     "OR ",      "MOD ",
    /*$20*/ "^ ",       "+",        "(",        ",",
            "THEN ",    "THEN ",    ",",        ",",
    /*$28*/ "\"",       "\"",       "(",        "!",
            "!",        "(",        "PEEK ",    "RND ",
    /*$30*/ "SGN ",     "ABS ",     "PDL ",     "RNDX ",
            "(",        "+",        "-",        "NOT ",
    /*$38*/ "(",        "=",        "#",        "LEN(",
            "ASC(",     "SCRN(",    ",",        "(",
    /*$40*/ "$",        "$",        "(",        ",",
            ",",        ";",        ";",        ";",
    /*$48*/ ",",        ",",        ",",        "TEXT ",
            "GR ",      "CALL ",    "DIM ",     "DIM ",
    /*$50*/ "TAB ",     "END ",     "INPUT ",   "INPUT ",
            "INPUT ",   "FOR ",     "=",        "TO ",
    /*$58*/ "STEP ",    "NEXT ",    ",",        "RETURN ",
            "GOSUB ",   "REM ",     "LET ",     "GOTO ",
    /*$60*/ "IF ",      "PRINT ",   "PRINT ",   "PRINT ",
            "POKE ",    ",",        "COLOR=",   "PLOT ",
    /*$68*/ ",",        "HLIN ",    ",",        "AT ",
            "VLIN ",    ",",        "AT ",      "VTAB ",
    /*$70*/ "=",        "=",        ")",        ")",
            "LIST ",    ",",        "LIST ",    "POP ",
    /*$78*/ "NODSP ",   "NODSP ",   "NOTRACE ", "DSP ",
            "DSP ",     "TRACE ",   "PR#",      "IN#"
}};

constexpr std::size_t LINE_HEADER_SIZE = 3;   // length byte + line number
constexpr std::size_t MIN_LINE_LENGTH = 4;    // header + EOL
constexpr std::uint8_t FIRST_NUMBER = 0xB0;   // '0' | $80
constexpr std::uint8_t LAST_NUMBER = 0xB9;    // '9' | $80
constexpr std::uint8_t FIRST_LETTER = 0xC1;   // 'A' | $80
constexpr std::uint8_t LAST_LETTER = 0xDA;    // 'Z' | $80
constexpr std::uint8_t LAST_PUNCT_TOKEN = 0x12;

bool is_digit(std::uint8_t b) noexcept { return b >= FIRST_NUMBER && b <= LAST_NUMBER; }
bool is_letter(std::uint8_t b) noexcept { return b >= FIRST_LETTER && b <= LAST_LETTER; }

bool trailing_space(const line_builder& out) noexcept {
    return out.empty() || out.last_char() == ' ';
}

// Decodes the tokens of one line in [pos, end), stopping at the EOL token.
decode_result decode_tokens(std::span<const std::uint8_t> line, line_builder& out) {
    std::size_t pos = 0;
    while (pos < line.size() && line[pos] != integer_basic_detokenizer::TOKEN_EOL) {
        const std::uint8_t byte = line[pos++];

        if (byte == integer_basic_detokenizer::TOKEN_OPEN_QUOTE) {
            std::string literal = "\"";
            while (pos < line.size() && line[pos] != integer_basic_detokenizer::TOKEN_CLOSE_QUOTE &&
                   line[pos] != integer_basic_detokenizer::TOKEN_EOL) {
                literal.push_back(printable_or_dot(line[pos++]));
            }
            if (pos < line.size() && line[pos] == integer_basic_detokenizer::TOKEN_CLOSE_QUOTE) {
                ++pos;
            }
            literal.push_back('"');
            out.append(fragment_kind::string, literal);
        } else if (byte == integer_basic_detokenizer::TOKEN_REM) {
            if (!trailing_space(out)) {
                out.append(fragment_kind::plain, ' ');
            }
            out.append_keyword(TOKENS[byte]);
            std::string comment;
            while (pos < line.size() && line[pos] != integer_basic_detokenizer::TOKEN_EOL) {
                comment.push_back(printable_or_dot(line[pos++]));
            }
            out.append(fragment_kind::comment, comment);
        } else if (is_digit(byte)) {
            if (line.size() - pos < 2) {
                return decode_result::failure(decode_error::corrupt_document,
                    "Integer constant truncated");
            }
            out.append(fragment_kind::plain, std::to_string(read_le16(line.data() + pos)));
            pos += 2;
        } else if (is_letter(byte)) {
            std::string name(1, static_cast<char>(byte & 0x7F));
            while (pos < line.size() && (is_letter(line[pos]) || is_digit(line[pos]))) {
                name.push_back(static_cast<char>(line[pos++] & 0x7F));
            }
            out.append(fragment_kind::plain, name);
        } else if (byte < 0x80) {
            const std::string_view text = TOKENS[byte];
            if (text.empty()) {
                continue;
            }
            const char first = text.front();
            const bool punctuation = (first >= '!' && first <= '?') || byte < LAST_PUNCT_TOKEN;
            if (!punctuation && !trailing_space(out)) {
                out.append(fragment_kind::plain, ' ');
            }
            if (first >= 'A' && first <= 'Z') {
                out.append_keyword(text);
            } else {
                out.append(fragment_kind::plain, text);
            }
        } else {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "[?%02X]", byte);
            out.append(fragment_kind::plain, buf);
        }
    }
    return decode_result::success();
}

} // namespace

std::string_view integer_basic_detokenizer::token_text(std::uint8_t token) noexcept {
    return token < TOKENS.size() ? TOKENS[token] : std::string_view{};
}

bool integer_basic_detokenizer::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < MIN_LINE_LENGTH) {
        return false;
    }
    const std::size_t length = data[0];
    if (length < MIN_LINE_LENGTH || length > data.size()) {
        return false;
    }
    if (data[length - 1] != TOKEN_EOL) {
        return false;
    }
    return read_le16(data.data() + 1) <= MAX_LINE_NUMBER;
}

decode_result integer_basic_detokenizer::decode(std::span<const std::uint8_t> data,
                                                basic_program& program) {
    if (data.size() < MIN_LINE_LENGTH) {
        return decode_result::failure(decode_error::too_short, "Integer BASIC program too short");
    }
    if (!sniff(data)) {
        return decode_result::failure(decode_error::corrupt_document,
            "Not a plausible Integer BASIC program");
    }

    basic_program result;
    std::size_t pos = 0;
    while (pos < data.size()) {
        const std::size_t length = data[pos];
        if (length == 0) {
            break;
        }
        if (length < MIN_LINE_LENGTH || length > data.size() - pos ||
            data[pos + length - 1] != TOKEN_EOL) {
            return decode_result::failure(decode_error::corrupt_document,
                "Line at offset " + std::to_string(pos) + " is truncated");
        }

        const std::uint16_t number = read_le16(data.data() + pos + 1);
        if (number > MAX_LINE_NUMBER) {
            return decode_result::failure(decode_error::corrupt_document,
                "Line number " + std::to_string(number) + " out of range");
        }

        line_builder out(number);
        auto status = decode_tokens(data.subspan(pos + LINE_HEADER_SIZE, length - LINE_HEADER_SIZE), out);
        if (!status) {
            return status;
        }
        result.lines.push_back(out.finish());
        pos += length;
    }

    program = std::move(result);
    return decode_result::success();
}

} // namespace a2decode
