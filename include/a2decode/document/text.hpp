#ifndef A2DECODE_DOCUMENT_TEXT_HPP_
#define A2DECODE_DOCUMENT_TEXT_HPP_

#include <a2decode/a2decode_export.h>
#include <a2decode/types.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace a2decode {

// ============================================================================
// Apple II Text
// ============================================================================

/**
 * Plain text from an Apple II text file: the high bit is stripped, CR
 * becomes LF and NUL bytes are dropped.
 */
[[nodiscard]] A2DECODE_EXPORT std::string decode_apple_text(std::span<const std::uint8_t> data);

/**
 * More than 80% of the first 256 bytes are printable, CR or LF once the
 * high bit is masked off.
 */
[[nodiscard]] A2DECODE_EXPORT bool is_likely_text(std::span<const std::uint8_t> data) noexcept;

// ============================================================================
// Merlin Assembler Source
// ============================================================================

struct merlin_line {
    std::string label;
    std::string opcode;
    std::string operand;
    std::string comment;
    bool full_line_comment = false;   // line starts with '*' or ';'

    bool operator==(const merlin_line&) const = default;
};

/**
 * Merlin 8/16 source. Lines end in $8D (or CR/LF for files converted to
 * low ASCII); fields are separated by a high-ASCII space, and quotes in
 * the operand field protect the spaces they enclose.
 */
class A2DECODE_EXPORT merlin_decoder {
public:
    static constexpr std::string_view name = "merlin";

    static constexpr std::size_t COL_LABEL = 0;
    static constexpr std::size_t COL_OPCODE = 9;
    static constexpr std::size_t COL_OPERAND = 15;
    static constexpr std::size_t COL_COMMENT = 26;
    static constexpr std::size_t MAX_SIZE = 64 * 1024;

    /**
     * At least 90% of lines start with a label, a comment or a space, and
     * more than a quarter start with a space.
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    [[nodiscard]] static std::vector<merlin_line> decode(std::span<const std::uint8_t> data);

    /**
     * Lines laid out at the standard Merlin tab stops, each ending in '\n'.
     */
    [[nodiscard]] static std::string listing(const std::vector<merlin_line>& lines);
};

} // namespace a2decode

#endif // A2DECODE_DOCUMENT_TEXT_HPP_
