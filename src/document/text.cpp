#include <a2decode/document/text.hpp>

#include <algorithm>
#include <array>

namespace a2decode {

namespace {

constexpr std::uint8_t HIGH_CR = 0x8D;
constexpr std::uint8_t HIGH_SPACE = 0xA0;
constexpr std::size_t TEXT_SAMPLE_SIZE = 256;

bool is_line_end(std::uint8_t byte) noexcept {
    return byte == HIGH_CR || byte == 0x0D || byte == 0x0A;
}

bool is_printable(std::uint8_t c) noexcept {
    return c >= 0x20 && c < 0x7F;
}

class merlin_line_parser {
public:
    explicit merlin_line_parser(bool high_ascii) noexcept
        : high_ascii_(high_ascii) {}

    merlin_line parse(std::span<const std::uint8_t> text) {
        merlin_line line;
        if (text.empty()) {
            return line;
        }

        const std::uint8_t first = text[0] & 0x7F;
        if (first == '*' || first == ';') {
            line.full_line_comment = true;
            append_field(line.comment, text);
            return line;
        }

        std::array<std::string*, 4> fields = {&line.label, &line.opcode, &line.operand, &line.comment};
        std::size_t field = 0;
        bool in_quote = false;
        std::uint8_t quote = 0;

        std::size_t i = 0;
        while (i < text.size()) {
            const std::uint8_t byte = text[i];
            const std::uint8_t c = byte & 0x7F;

            if (field < 3 && !in_quote && is_separator(byte)) {
                while (i < text.size() && is_separator(text[i])) {
                    ++i;
                }
                ++field;
                continue;
            }

            if (field == 2 && !in_quote && (c == '\'' || c == '"')) {
                in_quote = true;
                quote = c;
            } else if (in_quote && c == quote) {
                in_quote = false;
            } else if (!in_quote && c == ';' && field > 0 && field < 3 && fields[field]->empty()) {
                field = 3;
            }

            if (is_printable(c)) {
                *fields[field] += static_cast<char>(c);
            }
            ++i;
        }
        return line;
    }

private:
    bool is_separator(std::uint8_t byte) const noexcept {
        return byte == HIGH_SPACE || byte == 0x09 || (!high_ascii_ && byte == 0x20);
    }

    static void append_field(std::string& out, std::span<const std::uint8_t> text) {
        for (const std::uint8_t byte : text) {
            const std::uint8_t c = byte & 0x7F;
            if (is_printable(c)) {
                out += static_cast<char>(c);
            }
        }
    }

    bool high_ascii_;
};

void pad_to(std::string& text, std::size_t column) {
    if (text.size() < column) {
        text.append(column - text.size(), ' ');
    }
}

} // namespace

// ============================================================================
// Apple II Text
// ============================================================================

std::string decode_apple_text(std::span<const std::uint8_t> data) {
    std::string out;
    out.reserve(data.size());
    for (const std::uint8_t byte : data) {
        const auto c = static_cast<char>(byte & 0x7F);
        if (c == '\0') {
            continue;
        }
        out += (c == '\r') ? '\n' : c;
    }
    return out;
}

bool is_likely_text(std::span<const std::uint8_t> data) noexcept {
    if (data.empty()) {
        return false;
    }
    const std::size_t sample = std::min(data.size(), TEXT_SAMPLE_SIZE);
    std::size_t printable = 0;
    for (std::size_t i = 0; i < sample; ++i) {
        const std::uint8_t c = data[i] & 0x7F;
        if (is_printable(c) || c == 0x0D || c == 0x0A) {
            ++printable;
        }
    }
    return printable * 10 > sample * 8;
}

// ============================================================================
// Merlin
// ============================================================================

bool merlin_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.empty() || data.size() > MAX_SIZE) {
        return false;
    }

    std::size_t lines = 0;
    std::size_t valid = 0;
    std::size_t indented = 0;
    bool line_start = true;

    for (const std::uint8_t byte : data) {
        if (is_line_end(byte)) {
            line_start = true;
            continue;
        }
        if (!line_start) {
            continue;
        }
        line_start = false;
        ++lines;

        const std::uint8_t c = byte & 0x7F;
        const bool alpha = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        if (c == '*' || c == ';' || alpha || c == '_' || c == ']' || c == ':') {
            ++valid;
        } else if (c == ' ') {
            ++valid;
            ++indented;
        }
    }

    if (lines == 0 || valid * 100 / lines < 90) {
        return false;
    }
    return indented * 100 / lines > 25;
}

std::vector<merlin_line> merlin_decoder::decode(std::span<const std::uint8_t> data) {
    const bool high_ascii = std::any_of(data.begin(), data.end(), [](std::uint8_t b) {
        return (b & 0x80) != 0 && b != HIGH_CR;
    });
    merlin_line_parser parser(high_ascii);

    std::vector<merlin_line> lines;
    std::size_t pos = 0;
    while (pos < data.size()) {
        std::size_t end = pos;
        while (end < data.size() && !is_line_end(data[end])) {
            ++end;
        }
        lines.push_back(parser.parse(data.subspan(pos, end - pos)));

        pos = end + 1;
        if (end < data.size() && data[end] == 0x0D && pos < data.size() && data[pos] == 0x0A) {
            ++pos;
        }
    }
    return lines;
}

std::string merlin_decoder::listing(const std::vector<merlin_line>& lines) {
    std::string out;
    for (const auto& line : lines) {
        if (line.full_line_comment) {
            out += line.comment;
            out += '\n';
            continue;
        }

        std::string text = line.label;
        if (!line.opcode.empty() || !line.operand.empty() || !line.comment.empty()) {
            pad_to(text, COL_OPCODE);
            text += line.opcode;
        }
        if (!line.operand.empty() || !line.comment.empty()) {
            pad_to(text, COL_OPERAND);
            text += line.operand;
        }
        if (!line.comment.empty()) {
            pad_to(text, COL_COMMENT);
            text += line.comment;
        }
        out += text;
        out += '\n';
    }
    return out;
}

} // namespace a2decode
