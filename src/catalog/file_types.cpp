#include <a2decode/catalog/file_types.hpp>

#include <array>
#include <cstdio>

namespace a2decode {

namespace {

struct type_row {
    std::uint8_t type;
    std::string_view short_name;
    std::string_view description;
    file_category category;
    bool is_graphics;
};

using fc = file_category;

constexpr std::array<type_row, 62> TYPE_TABLE = {{
    {0x00, "NON", "Unknown", fc::general, false},
    {0x01, "BAD", "Bad Blocks", fc::system, false},
    {0x02, "PCD", "Pascal Code", fc::code, false},
    {0x03, "PTX", "Pascal Text", fc::text, false},
    {0x04, "TXT", "Text File", fc::text, false},
    {0x05, "PDA", "Pascal Data", fc::data, false},
    {0x06, "BIN", "Binary", fc::code, false},
    {0x07, "FNT", "Apple III Font", fc::font, false},
    {0x08, "FOT", "Apple II Graphics", fc::graphics, true},
    {0x09, "BA3", "Apple III BASIC Program", fc::code, false},
    {0x0A, "DA3", "Apple III BASIC Data", fc::data, false},
    {0x0B, "WPF", "Word Processor", fc::productivity, false},
    {0x0C, "SOS", "SOS System", fc::system, false},
    {0x0F, "DIR", "Folder", fc::system, false},
    {0x19, "ADB", "AppleWorks Database", fc::productivity, false},
    {0x1A, "AWP", "AppleWorks Word Proc", fc::productivity, false},
    {0x1B, "ASP", "AppleWorks Spreadsheet", fc::productivity, false},
    {0x2A, "8SC", "Apple II Source Code", fc::code, false},
    {0x2B, "8OB", "Apple II Object Code", fc::code, false},
    {0x2C, "8IC", "Apple II Interpreted Code", fc::code, false},
    {0x2E, "P8C", "ProDOS 8 Module", fc::code, false},
    {0x50, "GWP", "GS Word Processing", fc::productivity, false},
    {0x51, "GSS", "GS Spreadsheet", fc::productivity, false},
    {0x52, "GDB", "GS Database", fc::productivity, false},
    {0x53, "DRW", "Drawing", fc::graphics, true},
    {0x54, "GDP", "Desktop Publishing", fc::productivity, false},
    {0xB0, "SRC", "Apple IIgs Source", fc::code, false},
    {0xB1, "OBJ", "Apple IIgs Object", fc::code, false},
    {0xB2, "LIB", "Apple IIgs Library", fc::code, false},
    {0xB3, "S16", "GS/OS Application", fc::system, false},
    {0xB4, "RTL", "GS/OS Runtime Library", fc::system, false},
    {0xB5, "EXE", "Shell Command", fc::system, false},
    {0xB6, "PIF", "Permanent Init File", fc::system, false},
    {0xB7, "TIF", "Temporary Init File", fc::system, false},
    {0xB8, "NDA", "New Desk Accessory", fc::system, false},
    {0xB9, "CDA", "Classic Desk Accessory", fc::system, false},
    {0xBA, "TOL", "Tool", fc::system, false},
    {0xBB, "DRV", "Device Driver", fc::system, false},
    {0xBC, "LDF", "Load File", fc::system, false},
    {0xBD, "FST", "File System Translator", fc::system, false},
    {0xBF, "DOC", "GS/OS Document", fc::productivity, false},
    {0xC0, "PNT", "Packed Super Hi-Res", fc::graphics, true},
    {0xC1, "PIC", "Super Hi-Res Picture", fc::graphics, true},
    {0xC2, "ANI", "Paintworks Animation", fc::graphics, true},
    {0xC3, "PAL", "Paintworks Palette", fc::graphics, false},
    {0xC5, "OOG", "Object Graphics", fc::graphics, true},
    {0xC8, "FNT", "IIgs Font", fc::font, false},
    {0xCA, "ICN", "IIgs Icons", fc::graphics, false},
    {0xD5, "MUS", "Music", fc::audio, false},
    {0xD6, "INS", "Instrument", fc::audio, false},
    {0xD7, "MDI", "MIDI", fc::audio, false},
    {0xD8, "SND", "Sound", fc::audio, false},
    {0xE0, "LBR", "Library", fc::archive, false},
    {0xE2, "ATK", "AppleTalk Data", fc::network, false},
    {0xEF, "PAS", "Pascal Area", fc::system, false},
    {0xF0, "CMD", "BASIC Command", fc::system, false},
    {0xFA, "INT", "Integer BASIC", fc::code, false},
    {0xFB, "IVR", "Integer Variables", fc::data, false},
    {0xFC, "BAS", "Applesoft BASIC", fc::code, false},
    {0xFD, "VAR", "Applesoft Variables", fc::data, false},
    {0xFE, "REL", "Relocatable", fc::code, false},
    {0xFF, "SYS", "ProDOS System", fc::system, false},
}};

const type_row* find_row(std::uint8_t type) noexcept {
    for (const auto& row : TYPE_TABLE) {
        if (row.type == type) {
            return &row;
        }
    }
    return nullptr;
}

} // namespace

const char* to_string(file_category cat) noexcept {
    switch (cat) {
        case file_category::unknown:      return "Unknown";
        case file_category::general:      return "General";
        case file_category::text:         return "Text";
        case file_category::code:         return "Code";
        case file_category::data:         return "Data";
        case file_category::productivity: return "Productivity";
        case file_category::graphics:     return "Graphics";
        case file_category::font:         return "Font";
        case file_category::audio:        return "Audio";
        case file_category::system:       return "System";
        case file_category::archive:      return "Archive";
        case file_category::network:      return "Network";
    }
    return "Unknown";
}

file_type_info describe_file_type(std::uint8_t type, std::optional<std::uint16_t> aux) noexcept {
    // Aux-specific refinements
    if (aux) {
        switch (type) {
            case 0x06:
                if (*aux == 0x2000 || *aux == 0x4000) {
                    return {"BIN", "Hi-Res Screen Image", fc::graphics, true};
                }
                break;
            case 0x08:
                switch (*aux) {
                    case 0x4000: return {"FOT", "Packed Hi-Res", fc::graphics, true};
                    case 0x4001: return {"FOT", "Packed Double Hi-Res", fc::graphics, true};
                    case 0x8001: return {"FOT", "Printographer Packed HGR", fc::graphics, true};
                    case 0x8002: return {"FOT", "Printographer Packed DHGR", fc::graphics, true};
                    default: break;
                }
                break;
            case 0x50:
                if (*aux == 0x8010) {
                    return {"GWP", "AppleWorks GS WP", fc::productivity, false};
                }
                break;
            case 0x53:
                if (*aux == 0x8010) {
                    return {"DRW", "AppleWorks GS Graphics", fc::graphics, true};
                }
                break;
            case 0xC0:
                switch (*aux) {
                    case 0x0000: return {"PNT", "Paintworks Packed", fc::graphics, true};
                    case 0x0001: return {"PNT", "Packed Super Hi-Res", fc::graphics, true};
                    case 0x0002: return {"PNT", "Apple Preferred Format", fc::graphics, true};
                    case 0x0003: return {"PNT", "Packed QuickDraw II PICT", fc::graphics, true};
                    default: break;
                }
                break;
            case 0xC1:
                switch (*aux) {
                    case 0x0000: return {"PIC", "Super Hi-Res Screen", fc::graphics, true};
                    case 0x0001: return {"PIC", "QuickDraw PICT", fc::graphics, true};
                    case 0x0002: return {"PIC", "SHR 3200 Color", fc::graphics, true};
                    default: break;
                }
                break;
            default:
                break;
        }
    }

    if (const auto* row = find_row(type)) {
        return {row->short_name, row->description, row->category, row->is_graphics};
    }
    return {{}, "Unknown Type", fc::unknown, false};
}

std::string file_type_label(std::uint8_t type, std::optional<std::uint16_t> aux) {
    const auto info = describe_file_type(type, aux);
    if (!info.short_name.empty()) {
        return std::string(info.short_name);
    }
    char buf[8];
    std::snprintf(buf, sizeof(buf), "$%02X", type);
    return buf;
}

std::string_view dos33_type_label(std::uint8_t type) noexcept {
    switch (type & 0x7F) {
        case 0x00: return "T";
        case 0x01: return "I";
        case 0x02: return "A";
        case 0x04: return "B";
        case 0x08: return "S";
        case 0x10: return "R";
        case 0x20: return "AA";
        case 0x40: return "BB";
        default:   return "?";
    }
}

std::uint8_t dos33_to_prodos_type(std::uint8_t type) noexcept {
    switch (type & 0x7F) {
        case 0x00: return prodos_type::TXT;
        case 0x01: return prodos_type::INT;
        case 0x02: return prodos_type::BAS;
        case 0x04: return prodos_type::BIN;
        case 0x10: return 0xFE;  // REL
        default:   return prodos_type::NON;
    }
}

std::string_view pascal_kind_label(std::uint8_t kind) noexcept {
    switch (kind) {
        case 0: return "XDSK";
        case 1: return "CODE";
        case 2: return "TEXT";
        case 3: return "INFO";
        case 4: return "DATA";
        case 5: return "GRAF";
        case 6: return "FOTO";
        case 7: return "SDIR";
        default: return "????";
    }
}

std::uint8_t pascal_to_prodos_type(std::uint8_t kind) noexcept {
    switch (kind) {
        case 1: return 0x02;  // PCD
        case 2: return 0x03;  // PTX
        case 4: return 0x05;  // PDA
        case 6: return prodos_type::FOT;
        default: return prodos_type::NON;
    }
}

} // namespace a2decode
