#ifndef A2DECODE_CATALOG_FILE_TYPES_HPP_
#define A2DECODE_CATALOG_FILE_TYPES_HPP_

#include <a2decode/a2decode_export.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace a2decode {

// ============================================================================
// ProDOS File Types
// ============================================================================

enum class file_category {
    unknown,
    general,
    text,
    code,
    data,
    productivity,
    graphics,
    font,
    audio,
    system,
    archive,
    network
};

[[nodiscard]] A2DECODE_EXPORT const char* to_string(file_category cat) noexcept;

struct file_type_info {
    std::string_view short_name;    // empty for unlisted types
    std::string_view description;
    file_category category = file_category::unknown;
    bool is_graphics = false;
};

// Well-known type codes
namespace prodos_type {
inline constexpr std::uint8_t NON = 0x00;
inline constexpr std::uint8_t TXT = 0x04;
inline constexpr std::uint8_t BIN = 0x06;
inline constexpr std::uint8_t FOT = 0x08;
inline constexpr std::uint8_t DIR = 0x0F;
inline constexpr std::uint8_t ADB = 0x19;
inline constexpr std::uint8_t AWP = 0x1A;
inline constexpr std::uint8_t ASP = 0x1B;
inline constexpr std::uint8_t GWP = 0x50;
inline constexpr std::uint8_t S16 = 0xB3;
inline constexpr std::uint8_t PNT = 0xC0;
inline constexpr std::uint8_t PIC = 0xC1;
inline constexpr std::uint8_t FNT = 0xC8;
inline constexpr std::uint8_t ICN = 0xCA;
inline constexpr std::uint8_t LBR = 0xE0;
inline constexpr std::uint8_t INT = 0xFA;
inline constexpr std::uint8_t BAS = 0xFC;
inline constexpr std::uint8_t SYS = 0xFF;
} // namespace prodos_type

/**
 * Look up a ProDOS file type.
 * @param type File type byte
 * @param aux Aux type, refines graphics and AppleWorks GS entries when given
 * @return Info record; short_name is empty for unlisted types
 */
[[nodiscard]] A2DECODE_EXPORT file_type_info describe_file_type(std::uint8_t type,
                                                                std::optional<std::uint16_t> aux = {}) noexcept;

/**
 * Three-letter label ("TXT", "BAS", ...), or "$XX" for unlisted types.
 */
[[nodiscard]] A2DECODE_EXPORT std::string file_type_label(std::uint8_t type,
                                                          std::optional<std::uint16_t> aux = {});

// ============================================================================
// DOS 3.3 and UCSD Pascal Types
// ============================================================================

/**
 * DOS 3.3 catalog type letter ("T", "I", "A", "B", "S", "R", "AA", "BB").
 * @param type Catalog type byte with the lock bit masked off
 */
[[nodiscard]] A2DECODE_EXPORT std::string_view dos33_type_label(std::uint8_t type) noexcept;

/**
 * Equivalent ProDOS type for a DOS 3.3 type byte.
 */
[[nodiscard]] A2DECODE_EXPORT std::uint8_t dos33_to_prodos_type(std::uint8_t type) noexcept;

/**
 * UCSD Pascal file kind name ("CODE", "TEXT", ...).
 */
[[nodiscard]] A2DECODE_EXPORT std::string_view pascal_kind_label(std::uint8_t kind) noexcept;

/**
 * Equivalent ProDOS type for a UCSD Pascal file kind.
 */
[[nodiscard]] A2DECODE_EXPORT std::uint8_t pascal_to_prodos_type(std::uint8_t kind) noexcept;

} // namespace a2decode

#endif // A2DECODE_CATALOG_FILE_TYPES_HPP_
