#include "charset.hpp"

#include <array>

namespace a2decode {

namespace {

// ASCII approximations of the 32 MouseText glyphs
constexpr std::array<std::string_view, 32> MOUSE_TEXT = {{
    "@",   "O",  "v",  ">",  "?",  "?",  "|",  "?",
    "<-",  "...", "v", "^",  "|",  "CR", "?",  "_",
    "->",  "?",  "-",  "?",  "?",  "?",  "+",  "+",
    "{",   "}",  "[",  "]",  "|",  "?",  "?",  " "
}};

constexpr std::array<std::string_view, 128> MAC_ROMAN_HIGH = {{
    // $80
    "Ä", "Å", "Ç", "É", "Ñ", "Ö", "Ü", "á",
    "à", "â", "ä", "ã", "å", "ç", "é", "è",
    // $90
    "ê", "ë", "í", "ì", "î", "ï", "ñ", "ó",
    "ò", "ô", "ö", "õ", "ú", "ù", "û", "ü",
    // $A0
    "†", "°", "¢", "£", "§", "•", "¶", "ß",
    "®", "©", "™", "´", "¨", "≠", "Æ", "Ø",
    // $B0
    "∞", "±", "≤", "≥", "¥", "µ", "∂", "∑",
    "∏", "π", "∫", "ª", "º", "Ω", "æ", "ø",
    // $C0
    "¿", "¡", "¬", "√", "ƒ", "≈", "∆", "«",
    "»", "…", " ", "À", "Ã", "Õ", "Œ", "œ",
    // $D0
    "–", "—", "“", "”", "‘", "’", "÷", "◊",
    "ÿ", "Ÿ", "⁄", "€", "‹", "›", "ﬁ", "ﬂ",
    // $E0
    "‡", "·", "‚", "„", "‰", "Â", "Ê", "Á",
    "Ë", "È", "Í", "Î", "Ï", "Ì", "Ó", "Ô",
    // $F0 ($F0 is the Apple logo, private use)
    "", "Ò", "Ú", "Û", "Ù", "ı", "ˆ", "˜",
    "¯", "˘", "˙", "˚", "¸", "˝", "˛", "ˇ"
}};

} // namespace

std::string_view mouse_text_glyph(std::uint8_t index) noexcept {
    return index < MOUSE_TEXT.size() ? MOUSE_TEXT[index] : std::string_view("?");
}

void append_appleworks_char(std::string& out, std::uint8_t byte) {
    if (byte >= 0x20 && byte < 0x80) {
        out.push_back(static_cast<char>(byte));
    } else if (byte >= 0x80 && byte < 0xA0) {
        out.push_back(static_cast<char>(byte - 0x40));   // inverse @A-Z[\]^_
    } else if (byte >= 0xA0 && byte < 0xC0) {
        out.push_back(static_cast<char>(byte - 0x80));   // inverse symbols and digits
    } else if (byte >= 0xC0 && byte < 0xE0) {
        out += mouse_text_glyph(static_cast<std::uint8_t>(byte - 0xC0));
    } else if (byte >= 0xE0) {
        out.push_back(static_cast<char>(byte - 0x80));   // inverse lowercase
    } else {
        out.push_back('?');
    }
}

void append_mac_roman_char(std::string& out, std::uint8_t byte) {
    if (byte >= 0x20 && byte < 0x80) {
        out.push_back(static_cast<char>(byte));
    } else if (byte >= 0x80) {
        out += MAC_ROMAN_HIGH[byte - 0x80];
    } else {
        out.push_back('?');
    }
}

} // namespace a2decode
