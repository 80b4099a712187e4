#include <a2decode/a2decode.hpp>

#include <charconv>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <command> [arguments]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  catalog <image>                      Print the catalog tree of a disk image or Binary II archive\n";
    std::cerr << "  list <file> [type] [aux]             Print a BASIC listing, document or text file\n";
    std::cerr << "  png <file> <out.png> [type] [aux]    Decode a picture or icon and save it as PNG\n";
    std::cerr << "  gunzip <file.gz> <out>               Decompress a gzip file\n";
    std::cerr << "  zip <file.zip>                       List the entries of a ZIP archive\n\n";
    std::cerr << "Type and aux are hexadecimal ProDOS values ($FC, 0xFC or FC).\n";
}

std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return {};
    }

    const auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), size);

    return data;
}

bool write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& data) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return file.good();
}

int report(const a2decode::decode_result& result, std::string_view what) {
    std::cerr << "Error: " << what << ": " << a2decode::to_string(result.error);
    if (!result.message.empty()) {
        std::cerr << " (" << result.message << ")";
    }
    std::cerr << "\n";
    return 1;
}

std::optional<unsigned> parse_hex(std::string_view text) {
    if (text.starts_with("$")) {
        text.remove_prefix(1);
    } else if (text.starts_with("0x") || text.starts_with("0X")) {
        text.remove_prefix(2);
    }
    unsigned value = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value, 16);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

struct type_hints {
    std::optional<std::uint8_t> type;
    std::optional<std::uint16_t> aux;
};

bool parse_hints(int argc, char* argv[], int first, type_hints& hints) {
    if (argc > first) {
        const auto type = parse_hex(argv[first]);
        if (!type || *type > 0xFF) {
            std::cerr << "Error: Bad file type: " << argv[first] << "\n";
            return false;
        }
        hints.type = static_cast<std::uint8_t>(*type);
    }
    if (argc > first + 1) {
        const auto aux = parse_hex(argv[first + 1]);
        if (!aux || *aux > 0xFFFF) {
            std::cerr << "Error: Bad aux type: " << argv[first + 1] << "\n";
            return false;
        }
        hints.aux = static_cast<std::uint16_t>(*aux);
    }
    return true;
}

// ============================================================================
// catalog
// ============================================================================

void print_entry(const a2decode::catalog_entry& entry, int depth) {
    char aux[8];
    std::snprintf(aux, sizeof(aux), "$%04X", entry.aux_type);

    std::cout << std::string(static_cast<std::size_t>(depth) * 2, ' ')
              << (entry.locked ? "*" : " ") << entry.name;
    if (entry.is_directory) {
        std::cout << "/\n";
    } else {
        std::cout << "  " << entry.type_label << "  " << aux << "  " << entry.size << " bytes";
        if (entry.modified) {
            std::cout << "  " << a2decode::to_string(*entry.modified);
        }
        if (entry.is_image) {
            std::cout << "  [disk image]";
        }
        std::cout << "\n";
    }
    for (const auto& child : entry.children) {
        print_entry(child, depth + 1);
    }
}

int cmd_catalog(const std::vector<std::uint8_t>& data) {
    a2decode::disk_catalog catalog;
    const auto result = a2decode::walk_catalog(a2decode::make_shared_bytes(data), catalog);
    if (!result) {
        return report(result, "Catalog walk failed");
    }

    std::cout << "/" << catalog.volume_name << "  (" << catalog.filesystem_name << ", "
              << a2decode::to_string(catalog.order) << " order, " << catalog.total_blocks << " blocks)\n";
    for (const auto& entry : catalog.entries) {
        print_entry(entry, 1);
    }
    std::cout << catalog.file_count() << " files, " << catalog.directory_count() << " directories\n";
    return 0;
}

// ============================================================================
// list
// ============================================================================

int cmd_zip(const std::vector<std::uint8_t>& data);

int cmd_list(const std::vector<std::uint8_t>& data, const type_hints& hints) {
    const auto kind = a2decode::classify(hints.type, hints.aux, data);

    switch (kind) {
        case a2decode::content_kind::applesoft:
            std::cout << a2decode::listing_or_diagnostic(data, a2decode::basic_dialect::applesoft) << "\n";
            return 0;

        case a2decode::content_kind::integer_basic:
            std::cout << a2decode::listing_or_diagnostic(data, a2decode::basic_dialect::integer) << "\n";
            return 0;

        case a2decode::content_kind::appleworks_wp:
        case a2decode::content_kind::appleworks_gs_wp:
        case a2decode::content_kind::appleworks_db:
        case a2decode::content_kind::appleworks_ss:
        case a2decode::content_kind::teach: {
            a2decode::appleworks_document doc;
            const auto result = a2decode::decode_document(data, *hints.type, hints.aux.value_or(0), doc);
            if (!result) {
                return report(result, "Document decode failed");
            }
            std::cout << a2decode::plain_text(doc) << "\n";
            return 0;
        }

        case a2decode::content_kind::merlin_source:
            std::cout << a2decode::merlin_decoder::listing(a2decode::merlin_decoder::decode(data));
            return 0;

        case a2decode::content_kind::text:
            std::cout << a2decode::decode_apple_text(data);
            return 0;

        case a2decode::content_kind::disk_image:
        case a2decode::content_kind::archive_binary2:
            return cmd_catalog(data);

        case a2decode::content_kind::archive_gzip: {
            std::vector<std::uint8_t> inner;
            const auto result = a2decode::gzip_reader::decompress(data, inner);
            if (!result) {
                return report(result, "Decompression failed");
            }
            return cmd_list(inner, hints);
        }

        case a2decode::content_kind::archive_zip:
            return cmd_zip(data);

        case a2decode::content_kind::raster:
        case a2decode::content_kind::icon:
        case a2decode::content_kind::binary:
            break;
    }

    std::cerr << "Error: No text rendering for " << a2decode::to_string(kind) << "\n";
    return 1;
}

// ============================================================================
// png
// ============================================================================

int cmd_png(const std::vector<std::uint8_t>& data, const std::filesystem::path& output,
            const type_hints& hints) {
    if (a2decode::classify(hints.type, hints.aux, data) == a2decode::content_kind::icon) {
        a2decode::icon_resource icons;
        const auto result = a2decode::iigs_icon_decoder::decode(data, icons);
        if (!result) {
            return report(result, "Icon decode failed");
        }
        for (const auto& entry : icons.entries) {
            if (entry.large && entry.large->decodable) {
                std::cout << "Icon: " << entry.pathname << " " << entry.large->width << "x"
                          << entry.large->height << "\n";
                if (!a2decode::save_png(entry.large->surface, output)) {
                    std::cerr << "Error: Failed to save: " << output << "\n";
                    return 1;
                }
                std::cout << "Saved: " << output << "\n";
                return 0;
            }
        }
        std::cerr << "Error: No decodable icon in " << icons.entries.size() << " entries\n";
        return 1;
    }

    a2decode::raster_options options;
    options.type = hints.type;
    options.aux = hints.aux;

    a2decode::raster_image image;
    const auto result = a2decode::decode_raster(data, image, options);
    if (!result) {
        return report(result, "Picture decode failed");
    }

    std::cout << "Detected format: " << a2decode::to_string(image.format) << "\n";
    std::cout << "Decoded: " << image.surface.width() << "x" << image.surface.height() << "\n";

    if (!a2decode::save_png(image.surface, output)) {
        std::cerr << "Error: Failed to save: " << output << "\n";
        return 1;
    }
    std::cout << "Saved: " << output << "\n";
    return 0;
}

// ============================================================================
// gunzip / zip
// ============================================================================

int cmd_gunzip(const std::vector<std::uint8_t>& data, const std::filesystem::path& output) {
    a2decode::gzip_header header;
    auto result = a2decode::gzip_reader::read_header(data, header);
    if (!result) {
        return report(result, "Not a gzip file");
    }

    std::vector<std::uint8_t> out;
    result = a2decode::gzip_reader::decompress(data, out);
    if (!result) {
        return report(result, "Decompression failed");
    }
    if (!write_file(output, out)) {
        std::cerr << "Error: Failed to write: " << output << "\n";
        return 1;
    }

    if (!header.filename.empty()) {
        std::cout << "Original name: " << header.filename << "\n";
    }
    std::cout << "Wrote " << out.size() << " bytes to " << output << "\n";
    return 0;
}

int cmd_zip(const std::vector<std::uint8_t>& data) {
    std::vector<a2decode::zip_entry> entries;
    const auto result = a2decode::zip_reader::list(data, entries);
    if (!result) {
        return report(result, "ZIP listing failed");
    }

    for (const auto& entry : entries) {
        char line[64];
        std::snprintf(line, sizeof(line), "%10u %10u  %-7s %08X  ",
                      entry.uncompressed_size, entry.compressed_size,
                      entry.method == a2decode::zip_reader::METHOD_DEFLATE ? "deflate"
                          : entry.method == a2decode::zip_reader::METHOD_STORED ? "stored" : "other",
                      entry.crc32);
        std::cout << line;
        if (entry.modified) {
            std::cout << a2decode::to_string(*entry.modified) << "  ";
        }
        std::cout << entry.filename << "\n";
    }
    std::cout << entries.size() << " entries\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return argc == 2 && (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) ? 0 : 1;
    }

    const std::string_view command = argv[1];
    const std::filesystem::path input_path(argv[2]);

    if (!std::filesystem::exists(input_path)) {
        std::cerr << "Error: File not found: " << input_path << "\n";
        return 1;
    }

    const auto data = read_file(input_path);
    if (data.empty()) {
        std::cerr << "Error: Failed to read file: " << input_path << "\n";
        return 1;
    }

    if (command == "catalog") {
        return cmd_catalog(data);
    }
    if (command == "list") {
        type_hints hints;
        if (!parse_hints(argc, argv, 3, hints)) {
            return 1;
        }
        return cmd_list(data, hints);
    }
    if (command == "png") {
        if (argc < 4) {
            print_usage(argv[0]);
            return 1;
        }
        type_hints hints;
        if (!parse_hints(argc, argv, 4, hints)) {
            return 1;
        }
        return cmd_png(data, argv[3], hints);
    }
    if (command == "gunzip") {
        if (argc < 4) {
            print_usage(argv[0]);
            return 1;
        }
        return cmd_gunzip(data, argv[3]);
    }
    if (command == "zip") {
        return cmd_zip(data);
    }

    print_usage(argv[0]);
    return 1;
}
