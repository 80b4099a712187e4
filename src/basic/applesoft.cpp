#include <a2decode/basic/detokenizer.hpp>
#include "line_builder.hpp"
#include "../byte_io.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>

namespace a2decode {

namespace {

constexpr std::array<std::string_view, 0xEA - 0x80 + 1> TOKENS = {{
    // $80
    "END", "FOR", "NEXT", "DATA", "INPUT", "DEL", "DIM", "READ",
    "GR", "TEXT", "PR#", "IN#", "CALL", "PLOT", "HLIN", "VLIN",
    // $90
    "HGR2", "HGR", "HCOLOR=", "HPLOT", "DRAW", "XDRAW", "HTAB", "HOME",
    "ROT=", "SCALE=", "SHLOAD", "TRACE", "NOTRACE", "NORMAL", "INVERSE", "FLASH",
    // $A0
    "COLOR=", "POP", "VTAB", "HIMEM:", "LOMEM:", "ONERR", "RESUME", "RECALL",
    "STORE", "SPEED=", "LET", "GOTO", "RUN", "IF", "RESTORE", "&",
    // $B0
    "GOSUB", "RETURN", "REM", "STOP", "ON", "WAIT", "LOAD", "SAVE",
    "DEF", "POKE", "PRINT", "CONT", "LIST", "CLEAR", "GET", "NEW",
    // $C0
    "TAB(", "TO", "FN", "SPC(", "THEN", "AT", "NOT", "STEP",
    "+", "-", "*", "/", "^", "AND", "OR", ">",
    // $D0
    "=", "<", "SGN", "INT", "ABS", "USR", "FRE", "SCRN(",
    "PDL", "POS", "SQR", "RND", "LOG", "EXP", "COS", "SIN",
    // $E0
    "TAN", "ATN", "PEEK", "LEN", "STR$", "VAL", "ASC", "CHR$",
    "LEFT$", "RIGHT$", "MID$"
}};

constexpr std::uint8_t TOKEN_DATA = 0x83;
constexpr std::uint8_t TOKEN_REM = 0xB2;

// Operators printed with no inserted spacing
constexpr std::array<std::string_view, 5> TIGHT_OPERATORS = {{"+", "-", "*", "/", "^"}};

// Comparison and logical operators, surrounded by spaces
constexpr std::array<std::string_view, 6> SPACED_OPERATORS = {{"=", "<", ">", "AND", "OR", "NOT"}};

// Statement keywords followed by one space
constexpr std::array<std::string_view, 48> TRAILING_SPACE_KEYWORDS = {{
    "GOTO", "GOSUB", "THEN", "IF", "FOR", "NEXT", "TO", "STEP",
    "LET", "DIM", "DEF", "ON", "PRINT", "INPUT", "READ", "DATA",
    "POKE", "CALL", "HTAB", "VTAB", "HCOLOR=", "COLOR=", "SPEED=",
    "HPLOT", "PLOT", "DRAW", "XDRAW", "AT", "ONERR", "RESUME",
    "HIMEM:", "LOMEM:", "WAIT", "GET", "HOME", "TEXT", "GR", "HGR", "HGR2",
    "LOAD", "SAVE", "DEL", "RUN", "LIST", "ROT=", "SCALE=", "PR#", "IN#"
}};

constexpr std::uint16_t LOAD_ADDRESS = 0x0801;
constexpr std::uint16_t MIN_LINK = 0x0800;
constexpr std::uint16_t MAX_LINK = 0xC000;

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& set, std::string_view text) noexcept {
    return std::find(set.begin(), set.end(), text) != set.end();
}

// A keyword after an operand or at a statement start gets a leading space.
bool ends_operand(char ch) noexcept {
    return std::isalnum(static_cast<unsigned char>(ch)) || ch == '"' || ch == ')' ||
           ch == '$' || ch == '%';
}

// Some savers keep the $0801 load address in front of the first link.
// No link pointer can equal $0801, so the word is unambiguous.
std::size_t program_start(std::span<const std::uint8_t> data) noexcept {
    if (data.size() >= 4 && read_le16(data.data()) == LOAD_ADDRESS) {
        return 2;
    }
    return 0;
}

enum class lex_state {
    normal,
    quote,
    rem,
    data
};

class line_decoder {
public:
    explicit line_decoder(std::uint16_t number) : out_(number) {}

    void feed(std::uint8_t byte) {
        switch (state_) {
            case lex_state::quote:
                literal_.push_back(printable_or_dot(byte));
                if (byte == '"') {
                    close_literal();
                }
                break;

            case lex_state::rem:
                out_.append(fragment_kind::comment, printable_or_dot(byte));
                break;

            case lex_state::data:
                if (byte == ':') {
                    out_.append(fragment_kind::plain, ':');
                    state_ = lex_state::normal;
                    statement_start_ = true;
                } else if (byte == '"') {
                    open_literal(lex_state::data);
                } else {
                    const std::uint8_t ch = byte & 0x7F;
                    if (ch >= 0x20 && ch < 0x7F) {
                        out_.append(fragment_kind::plain, static_cast<char>(ch));
                    }
                }
                break;

            case lex_state::normal:
                if (byte >= applesoft_detokenizer::FIRST_TOKEN) {
                    token(byte);
                } else if (byte == '"') {
                    open_literal(lex_state::normal);
                } else if (byte == ':') {
                    out_.append(fragment_kind::plain, ':');
                    statement_start_ = true;
                } else if (byte >= 0x20 && byte < 0x7F) {
                    out_.append(fragment_kind::plain, static_cast<char>(byte));
                    statement_start_ = false;
                }
                break;
        }
    }

    token_line finish() {
        if (state_ == lex_state::quote) {
            out_.append(fragment_kind::string, literal_);
        }
        return out_.finish();
    }

private:
    void open_literal(lex_state return_to) {
        literal_ = "\"";
        quote_return_ = return_to;
        state_ = lex_state::quote;
        statement_start_ = false;
    }

    void close_literal() {
        out_.append(fragment_kind::string, literal_);
        literal_.clear();
        state_ = quote_return_;
    }

    void token(std::uint8_t byte) {
        const std::string_view text = applesoft_detokenizer::token_text(byte);
        if (text.empty()) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "[?%02X]", byte);
            out_.append(fragment_kind::plain, buf);
            statement_start_ = false;
            return;
        }

        if (contains(TIGHT_OPERATORS, text)) {
            out_.append(fragment_kind::keyword, text);
        } else if (contains(SPACED_OPERATORS, text)) {
            const char last = out_.last_char();
            if (last != '\0' && last != ' ' && last != '(') {
                out_.append(fragment_kind::plain, ' ');
            }
            out_.append(fragment_kind::keyword, text);
            out_.append(fragment_kind::plain, ' ');
        } else {
            if (statement_start_ || ends_operand(out_.last_char())) {
                out_.append(fragment_kind::plain, ' ');
            }
            out_.append(fragment_kind::keyword, text);
            if (contains(TRAILING_SPACE_KEYWORDS, text)) {
                out_.append(fragment_kind::plain, ' ');
            }
        }
        statement_start_ = false;

        if (byte == TOKEN_REM) {
            state_ = lex_state::rem;
        } else if (byte == TOKEN_DATA) {
            state_ = lex_state::data;
        }
    }

    line_builder out_;
    lex_state state_ = lex_state::normal;
    lex_state quote_return_ = lex_state::normal;
    std::string literal_;
    bool statement_start_ = true;
};

} // namespace

std::string_view applesoft_detokenizer::token_text(std::uint8_t token) noexcept {
    if (token < FIRST_TOKEN || token > LAST_TOKEN) {
        return {};
    }
    return TOKENS[token - FIRST_TOKEN];
}

bool applesoft_detokenizer::sniff(std::span<const std::uint8_t> data) noexcept {
    const std::size_t start = program_start(data);
    if (data.size() < start + 4) {
        return false;
    }
    const std::uint16_t link = read_le16(data.data() + start);
    const std::uint16_t line = read_le16(data.data() + start + 2);
    return link >= MIN_LINK && link <= MAX_LINK && line <= MAX_LINE_NUMBER;
}

decode_result applesoft_detokenizer::decode(std::span<const std::uint8_t> data,
                                            basic_program& program) {
    if (data.size() < 2) {
        return decode_result::failure(decode_error::too_short, "Applesoft program too short");
    }

    std::size_t pos = program_start(data);
    const std::uint16_t first_link = read_le16(data.data() + pos);
    if (first_link != 0 && !sniff(data)) {
        return decode_result::failure(decode_error::corrupt_document,
            "Not a plausible Applesoft program");
    }

    basic_program result;
    // Programs normally end with a zero link; ending cleanly on a line boundary is also accepted.
    while (pos < data.size()) {
        if (pos + 2 > data.size()) {
            return decode_result::failure(decode_error::corrupt_document, "Truncated line link");
        }
        const std::uint16_t link = read_le16(data.data() + pos);
        if (link == 0) {
            break;
        }
        if (pos + 4 > data.size()) {
            return decode_result::failure(decode_error::corrupt_document, "Truncated line header");
        }
        const std::uint16_t number = read_le16(data.data() + pos + 2);
        if (number > MAX_LINE_NUMBER) {
            return decode_result::failure(decode_error::corrupt_document,
                "Line number " + std::to_string(number) + " out of range");
        }
        pos += 4;

        line_decoder line(number);
        bool terminated = false;
        while (pos < data.size()) {
            const std::uint8_t byte = data[pos++];
            if (byte == 0) {
                terminated = true;
                break;
            }
            line.feed(byte);
        }
        if (!terminated) {
            return decode_result::failure(decode_error::corrupt_document,
                "Line " + std::to_string(number) + " has no terminator");
        }
        result.lines.push_back(line.finish());
    }

    program = std::move(result);
    return decode_result::success();
}

} // namespace a2decode
