#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace a2decode {

// AppleWorks screen character. $80-$BF and $E0-$FF are the inverse
// forms of the ASCII range; $C0-$DF are MouseText glyphs.
void append_appleworks_char(std::string& out, std::uint8_t byte);

// MacRoman character as UTF-8. Unmapped control bytes become '?'.
void append_mac_roman_char(std::string& out, std::uint8_t byte);

[[nodiscard]] std::string_view mouse_text_glyph(std::uint8_t index) noexcept;

} // namespace a2decode
