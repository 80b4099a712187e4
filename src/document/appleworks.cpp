#include <a2decode/document/appleworks.hpp>
#include <a2decode/catalog/file_types.hpp>

namespace a2decode {

namespace {

template <typename Doc, typename Decoder>
decode_result decode_into(std::span<const std::uint8_t> data, appleworks_document& doc) {
    Doc result;
    auto status = Decoder::decode(data, result);
    if (status) {
        doc = std::move(result);
    }
    return status;
}

template <typename Run>
std::string join_lines(const std::vector<document_line<Run>>& lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i != 0) {
            out.push_back('\n');
        }
        out += lines[i].text();
    }
    return out;
}

void append_row(std::string& out, const std::vector<std::string>& cells) {
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (i != 0) {
            out.push_back('\t');
        }
        out += cells[i];
    }
}

// Overload set for std::visit
template <typename... Fs>
struct overloaded : Fs... {
    using Fs::operator()...;
};
template <typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

} // namespace

bool is_appleworks_type(std::uint8_t type, std::uint16_t aux) noexcept {
    switch (type) {
        case prodos_type::ADB:
        case prodos_type::AWP:
        case prodos_type::ASP:
            return true;
        case prodos_type::GWP:
            return aux == GWP_AUX_TYPE || aux == teach_decoder::AUX_TYPE;
        default:
            return false;
    }
}

decode_result decode_document(std::span<const std::uint8_t> data,
                              std::uint8_t type,
                              std::uint16_t aux,
                              appleworks_document& doc,
                              std::span<const std::uint8_t> resource_fork) {
    switch (type) {
        case prodos_type::AWP:
            return decode_into<word_processor_doc, appleworks_wp_decoder>(data, doc);
        case prodos_type::ADB:
            return decode_into<database_doc, appleworks_db_decoder>(data, doc);
        case prodos_type::ASP:
            return decode_into<spreadsheet_doc, appleworks_ss_decoder>(data, doc);
        case prodos_type::GWP:
            if (aux == GWP_AUX_TYPE) {
                return decode_into<gs_word_processor_doc, appleworks_gs_decoder>(data, doc);
            }
            if (aux == teach_decoder::AUX_TYPE) {
                teach_doc result;
                auto status = teach_decoder::decode(data, resource_fork, result);
                if (status) {
                    doc = std::move(result);
                }
                return status;
            }
            break;
        default:
            break;
    }
    return decode_result::failure(decode_error::unrecognized_format,
        "Not a word processor, database or spreadsheet type: " + file_type_label(type, aux));
}

std::string plain_text(const appleworks_document& doc) {
    return std::visit(overloaded{
        [](const word_processor_doc& wp) { return join_lines(wp.lines); },
        [](const gs_word_processor_doc& gs) { return join_lines(gs.lines); },
        [](const teach_doc& teach) { return join_lines(teach.lines); },
        [](const database_doc& db) {
            std::string out;
            append_row(out, db.categories);
            for (const auto& record : db.records) {
                out.push_back('\n');
                append_row(out, record);
            }
            return out;
        },
        [](const spreadsheet_doc& ss) {
            std::string out;
            for (std::size_t i = 0; i < ss.rows.size(); ++i) {
                if (i != 0) {
                    out.push_back('\n');
                }
                append_row(out, ss.rows[i]);
            }
            return out;
        }
    }, doc);
}

} // namespace a2decode
