#pragma once

#include <a2decode/basic/detokenizer.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace a2decode {

// Accumulates fragments for one listing line. Adjacent plain or comment
// fragments are merged; keywords and string literals stay separate.
class line_builder {
public:
    explicit line_builder(std::uint16_t number) { line_.number = number; }

    void append(fragment_kind kind, std::string_view text) {
        if (text.empty()) {
            return;
        }
        auto& fragments = line_.fragments;
        if (!fragments.empty() && fragments.back().kind == kind &&
            (kind == fragment_kind::plain || kind == fragment_kind::comment)) {
            fragments.back().text.append(text);
        } else {
            fragments.push_back({kind, std::string(text)});
        }
    }

    void append(fragment_kind kind, char ch) {
        append(kind, std::string_view(&ch, 1));
    }

    // Keyword followed by its trailing spaces as a plain fragment
    void append_keyword(std::string_view text) {
        const auto end = text.find_last_not_of(' ');
        if (end == std::string_view::npos) {
            append(fragment_kind::plain, text);
            return;
        }
        append(fragment_kind::keyword, text.substr(0, end + 1));
        append(fragment_kind::plain, text.substr(end + 1));
    }

    [[nodiscard]] bool empty() const noexcept { return line_.fragments.empty(); }

    [[nodiscard]] char last_char() const noexcept {
        return empty() ? '\0' : line_.fragments.back().text.back();
    }

    [[nodiscard]] token_line finish() { return std::move(line_); }

private:
    token_line line_;
};

// High bit stripped; anything unprintable becomes '.'
inline char printable_or_dot(std::uint8_t byte) noexcept {
    const std::uint8_t ch = byte & 0x7F;
    return (ch >= 0x20 && ch < 0x7F) ? static_cast<char>(ch) : '.';
}

} // namespace a2decode
