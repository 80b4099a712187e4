#include <a2decode/document/appleworks.hpp>
#include "charset.hpp"
#include "../byte_io.hpp"

#include <array>
#include <cstdio>

namespace a2decode {

namespace {

constexpr std::size_t CATEGORY_COUNT_OFFSET = 35;
constexpr std::size_t RECORD_COUNT_OFFSET = 36;
constexpr std::size_t REPORT_COUNT_OFFSET = 38;
constexpr std::size_t MAX_CATEGORY_NAME = 20;
constexpr std::uint16_t RECORD_COUNT_MASK = 0x7FFF;   // bit 15 flags a 3.0 file
constexpr std::uint16_t END_OF_RECORDS = 0xFFFF;

constexpr std::uint8_t FIELD_END = 0xFF;
constexpr std::uint8_t FIRST_SKIP = 0x81;
constexpr std::uint8_t LAST_SKIP = 0x9E;
constexpr std::uint8_t DATE_MARKER = 0xC0;
constexpr std::uint8_t TIME_MARKER = 0xD4;
constexpr std::size_t DATE_FIELD_SIZE = 6;
constexpr std::size_t TIME_FIELD_SIZE = 4;

constexpr std::array<std::string_view, 12> MONTHS = {{
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
}};

decode_result corrupt(std::string msg) {
    return decode_result::failure(decode_error::corrupt_document, std::move(msg));
}

// Stored as $C0, year digits, month letter ('A' = January), day digits
std::string format_date_field(std::span<const std::uint8_t> field) {
    const int month = field[3] - 'A';
    std::string out;
    out.push_back(static_cast<char>(field[4] & 0x7F));
    out.push_back(static_cast<char>(field[5] & 0x7F));
    out.push_back('-');
    out += (month >= 0 && month < 12) ? MONTHS[month] : std::string_view("???");
    out.push_back('-');
    out.push_back(static_cast<char>(field[1] & 0x7F));
    out.push_back(static_cast<char>(field[2] & 0x7F));
    return out;
}

// Stored as $D4, hour letter ('A' = midnight), minute digits
std::string format_time_field(std::span<const std::uint8_t> field) {
    const int hour = field[1] - 'A';
    int hour12 = hour;
    if (hour == 0) {
        hour12 = 12;
    } else if (hour > 12) {
        hour12 = hour - 12;
    }
    std::string out = std::to_string(hour12);
    out.push_back(':');
    out.push_back(static_cast<char>(field[2] & 0x7F));
    out.push_back(static_cast<char>(field[3] & 0x7F));
    out += hour < 12 ? " AM" : " PM";
    return out;
}

std::string format_field(std::span<const std::uint8_t> field) {
    if (field.size() == DATE_FIELD_SIZE && field[0] == DATE_MARKER) {
        return format_date_field(field);
    }
    if (field.size() == TIME_FIELD_SIZE && field[0] == TIME_MARKER) {
        return format_time_field(field);
    }
    std::string text;
    for (const std::uint8_t byte : field) {
        append_appleworks_char(text, byte);
    }
    return text;
}

decode_result decode_record(std::span<const std::uint8_t> record, std::size_t category_count,
                            std::vector<std::string>& fields) {
    fields.assign(category_count, std::string());
    std::size_t pos = 0;
    std::size_t category = 0;

    while (pos < record.size() && category < category_count) {
        const std::uint8_t control = record[pos++];
        if (control == FIELD_END) {
            break;
        }
        if (control >= FIRST_SKIP && control <= LAST_SKIP) {
            category += control - 0x80u;
        } else if (control >= 0x01 && control <= 0x7F) {
            if (record.size() - pos < control) {
                return corrupt("Field overruns its record");
            }
            fields[category] = format_field(record.subspan(pos, control));
            pos += control;
            ++category;
        } else {
            char buf[48];
            std::snprintf(buf, sizeof(buf), "Invalid field control byte $%02X", control);
            return corrupt(buf);
        }
    }
    return decode_result::success();
}

} // namespace

bool appleworks_db_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < MIN_HEADER_SIZE) {
        return false;
    }
    const std::size_t header_length = read_le16(data.data());
    const int categories = data[CATEGORY_COUNT_OFFSET];
    return header_length >= MIN_HEADER_SIZE && header_length <= data.size() &&
           categories >= 1 && categories <= MAX_CATEGORIES;
}

decode_result appleworks_db_decoder::decode(std::span<const std::uint8_t> data,
                                            database_doc& doc) {
    if (data.size() < MIN_HEADER_SIZE) {
        return decode_result::failure(decode_error::too_short, "AppleWorks DB header truncated");
    }
    if (!sniff(data)) {
        return corrupt("AppleWorks DB header inconsistent");
    }

    const std::size_t header_length = read_le16(data.data());
    const std::size_t category_count = data[CATEGORY_COUNT_OFFSET];
    const std::size_t record_count = read_le16(data.data() + RECORD_COUNT_OFFSET) & RECORD_COUNT_MASK;
    const std::size_t report_count = data[REPORT_COUNT_OFFSET];

    database_doc result;
    for (std::size_t i = 0; i < category_count; ++i) {
        const std::size_t slot = CATEGORY_OFFSET + i * CATEGORY_SIZE;
        const std::size_t length = slot < data.size() ? data[slot] : 0;
        if (length > 0 && length <= MAX_CATEGORY_NAME && slot + 1 + length <= data.size()) {
            std::string name;
            for (std::size_t j = 0; j < length; ++j) {
                append_appleworks_char(name, data[slot + 1 + j]);
            }
            result.categories.push_back(std::move(name));
        } else {
            result.categories.push_back("Category " + std::to_string(i + 1));
        }
    }

    std::size_t pos = header_length + report_count * REPORT_SIZE;
    if (pos > data.size()) {
        return corrupt("Report definitions truncated");
    }

    // Standard values record
    if (data.size() - pos >= 2) {
        const std::size_t length = read_le16(data.data() + pos);
        if (length != END_OF_RECORDS) {
            if (data.size() - pos - 2 < length) {
                return corrupt("Standard values record truncated");
            }
            pos += 2 + length;
        }
    }

    for (std::size_t i = 0; i < record_count; ++i) {
        if (data.size() - pos < 2) {
            break;
        }
        const std::size_t length = read_le16(data.data() + pos);
        if (length == END_OF_RECORDS) {
            break;
        }
        pos += 2;
        if (data.size() - pos < length) {
            return corrupt("Record " + std::to_string(i + 1) + " truncated");
        }

        std::vector<std::string> fields;
        auto status = decode_record(data.subspan(pos, length), category_count, fields);
        if (!status) {
            return status;
        }
        result.records.push_back(std::move(fields));
        pos += length;
    }

    doc = std::move(result);
    return decode_result::success();
}

} // namespace a2decode
