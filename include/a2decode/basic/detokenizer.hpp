#ifndef A2DECODE_BASIC_DETOKENIZER_HPP_
#define A2DECODE_BASIC_DETOKENIZER_HPP_

#include <a2decode/a2decode_export.h>
#include <a2decode/types.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace a2decode {

// ============================================================================
// Program Model
// ============================================================================

enum class fragment_kind {
    plain,     // variables, numbers, punctuation, inserted spacing
    keyword,   // expanded token
    string,    // quoted literal including the quotes
    comment    // REM body
};

struct basic_fragment {
    fragment_kind kind = fragment_kind::plain;
    std::string text;

    bool operator==(const basic_fragment&) const = default;
};

struct token_line {
    std::uint16_t number = 0;
    std::vector<basic_fragment> fragments;

    /**
     * Line number, one space, then the fragments joined.
     */
    [[nodiscard]] A2DECODE_EXPORT std::string text() const;

    bool operator==(const token_line&) const = default;
};

struct basic_program {
    std::vector<token_line> lines;

    /**
     * All lines joined with '\n' (no trailing newline).
     */
    [[nodiscard]] A2DECODE_EXPORT std::string listing() const;

    bool operator==(const basic_program&) const = default;
};

enum class basic_dialect {
    applesoft,
    integer
};

struct basic_options {
    basic_dialect dialect = basic_dialect::applesoft;
};

// Diagnostic text returned by listing_or_diagnostic() for malformed input
inline constexpr std::string_view INVALID_PROGRAM_TEXT = "// Invalid program";

// ============================================================================
// Applesoft BASIC
// ============================================================================

/**
 * Applesoft BASIC (ProDOS type $FC, DOS 3.3 type A).
 *
 * Lines are (next-line pointer, line number, tokens, 0). A zero pointer ends
 * the program. A leading $0801 load address word is skipped when present.
 */
class A2DECODE_EXPORT applesoft_detokenizer {
public:
    static constexpr std::string_view name = "applesoft";

    static constexpr std::uint8_t FIRST_TOKEN = 0x80;
    static constexpr std::uint8_t LAST_TOKEN = 0xEA;
    static constexpr std::uint16_t MAX_LINE_NUMBER = 63999;

    /**
     * Keyword for a token byte.
     * @return Empty view for bytes outside the token table
     */
    [[nodiscard]] static std::string_view token_text(std::uint8_t token) noexcept;

    /**
     * Plausibility check: first pointer in $0800..$C000, line number <= 63999.
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Detokenize a whole program.
     * @param data Program bytes
     * @param program Filled on success
     * @return Decode result (too_short, corrupt_document)
     */
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                              basic_program& program);
};

// ============================================================================
// Integer BASIC
// ============================================================================

/**
 * Integer BASIC (ProDOS type $FA, DOS 3.3 type I).
 *
 * Lines are (length byte, line number, tokens, $01). Every byte below $80
 * is a token; $B0-$B9 introduce a 16-bit constant and $C1-$DA start a
 * variable name.
 */
class A2DECODE_EXPORT integer_basic_detokenizer {
public:
    static constexpr std::string_view name = "integer";

    static constexpr std::uint8_t TOKEN_EOL = 0x01;
    static constexpr std::uint8_t TOKEN_OPEN_QUOTE = 0x28;
    static constexpr std::uint8_t TOKEN_CLOSE_QUOTE = 0x29;
    static constexpr std::uint8_t TOKEN_REM = 0x5D;
    static constexpr std::uint16_t MAX_LINE_NUMBER = 32767;

    /**
     * Token string as LIST prints it, including any trailing space.
     */
    [[nodiscard]] static std::string_view token_text(std::uint8_t token) noexcept;

    /**
     * Plausibility check: first line length sane and terminated by $01.
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                              basic_program& program);
};

// ============================================================================
// Convenience Functions
// ============================================================================

[[nodiscard]] inline bool is_valid_applesoft(std::span<const std::uint8_t> data) noexcept {
    return applesoft_detokenizer::sniff(data);
}

[[nodiscard]] inline bool is_valid_integer_basic(std::span<const std::uint8_t> data) noexcept {
    return integer_basic_detokenizer::sniff(data);
}

/**
 * Detokenize in the given dialect.
 * @param data Program bytes
 * @param dialect Applesoft or Integer BASIC
 * @param program Filled on success (untouched on failure)
 */
[[nodiscard]] A2DECODE_EXPORT decode_result detokenize(std::span<const std::uint8_t> data,
                                                       basic_dialect dialect,
                                                       basic_program& program);

[[nodiscard]] A2DECODE_EXPORT decode_result detokenize(std::span<const std::uint8_t> data,
                                                       basic_program& program,
                                                       const basic_options& options = {});

/**
 * Listing text, or INVALID_PROGRAM_TEXT when the program does not decode.
 */
[[nodiscard]] A2DECODE_EXPORT std::string listing_or_diagnostic(std::span<const std::uint8_t> data,
                                                                basic_dialect dialect);

} // namespace a2decode

#endif // A2DECODE_BASIC_DETOKENIZER_HPP_
