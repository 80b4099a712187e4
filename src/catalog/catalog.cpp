#include <a2decode/catalog/catalog.hpp>
#include <a2decode/catalog/prodos.hpp>
#include <a2decode/catalog/dos33.hpp>
#include <a2decode/catalog/pascal.hpp>
#include <a2decode/archive/binary2.hpp>

#include <algorithm>
#include <array>

namespace a2decode {

// ============================================================================
// Filesystem Wrappers
// ============================================================================

namespace {

template <typename Volume, filesystem_kind Kind>
class filesystem_impl : public filesystem {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return Volume::name;
    }

    [[nodiscard]] filesystem_kind kind() const noexcept override {
        return Kind;
    }

    [[nodiscard]] sector_order preferred_order() const noexcept override {
        return Volume::preferred_order;
    }

    [[nodiscard]] bool sniff(const disk_image& image) const noexcept override {
        return Volume::sniff(image);
    }

    [[nodiscard]] decode_result walk(const disk_image& image,
                                     disk_catalog& catalog) const override {
        return Volume::walk(image, catalog);
    }
};

using prodos_filesystem = filesystem_impl<prodos_volume, filesystem_kind::prodos>;
using dos33_filesystem = filesystem_impl<dos33_volume, filesystem_kind::dos33>;
using pascal_filesystem = filesystem_impl<pascal_volume, filesystem_kind::pascal>;
using binary2_filesystem = filesystem_impl<binary2_archive, filesystem_kind::binary2>;

sector_order other_order(sector_order order) noexcept {
    return order == sector_order::prodos ? sector_order::dos : sector_order::prodos;
}

std::size_t count_entries(const std::vector<catalog_entry>& entries, bool directories) noexcept {
    std::size_t count = 0;
    for (const auto& entry : entries) {
        if (entry.is_directory == directories) {
            ++count;
        }
        count += count_entries(entry.children, directories);
    }
    return count;
}

} // namespace

// ============================================================================
// Catalog Types
// ============================================================================

const char* to_string(filesystem_kind kind) noexcept {
    switch (kind) {
        case filesystem_kind::prodos: return "prodos";
        case filesystem_kind::dos33:  return "dos33";
        case filesystem_kind::pascal: return "pascal";
        case filesystem_kind::binary2: return "binary2";
        case filesystem_kind::other:  return "other";
    }
    return "other";
}

std::size_t disk_catalog::file_count() const noexcept {
    return count_entries(entries, false);
}

std::size_t disk_catalog::directory_count() const noexcept {
    return count_entries(entries, true);
}

bool is_nested_image(const content_ref& content) noexcept {
    if (is_standard_image_size(content.size())) {
        return true;
    }
    std::array<std::uint8_t, TWO_IMG_MAGIC.size()> magic{};
    return content.copy_prefix(magic) == magic.size() && has_2img_magic(magic);
}

// ============================================================================
// Filesystem Registry
// ============================================================================

filesystem_registry& filesystem_registry::instance() {
    static filesystem_registry registry;
    return registry;
}

filesystem_registry::filesystem_registry() {
    register_builtin_filesystems();
}

filesystem_registry::~filesystem_registry() = default;

void filesystem_registry::register_builtin_filesystems() {
    // Detection priority order
    register_filesystem(std::make_unique<prodos_filesystem>());
    register_filesystem(std::make_unique<dos33_filesystem>());
    register_filesystem(std::make_unique<pascal_filesystem>());
    register_filesystem(std::make_unique<binary2_filesystem>());
}

void filesystem_registry::register_filesystem(std::unique_ptr<filesystem> fs) {
    if (fs) {
        filesystems_.push_back(std::move(fs));
    }
}

const filesystem* filesystem_registry::find_filesystem(std::string_view name) const {
    for (const auto& fs : filesystems_) {
        if (fs->name() == name) {
            return fs.get();
        }
    }
    return nullptr;
}

// ============================================================================
// Catalog Walking
// ============================================================================

decode_result walk_catalog(shared_bytes data, disk_catalog& catalog, const walk_options& options) {
    disk_image image;
    auto result = disk_image::open(std::move(data), image, options.unwrap_2img);
    if (!result) {
        return result;
    }
    const auto& registry = filesystem_registry::instance();
    for (std::size_t i = 0; i < registry.filesystem_count(); ++i) {
        const filesystem* fs = registry.filesystem_at(i);
        if (options.format && fs->kind() != *options.format) {
            continue;
        }

        std::array<sector_order, 2> orders{};
        std::size_t order_count = 2;
        if (options.order) {
            orders[0] = *options.order;
            order_count = 1;
        } else if (image.order_declared()) {
            orders = {image.order(), other_order(image.order())};
        } else {
            orders = {fs->preferred_order(), other_order(fs->preferred_order())};
        }

        for (std::size_t o = 0; o < order_count; ++o) {
            const disk_image view = image.with_order(orders[o]);
            if (!fs->sniff(view)) {
                continue;
            }
            disk_catalog walked;
            result = fs->walk(view, walked);
            if (!result) {
                return result;
            }
            catalog = std::move(walked);
            return decode_result::success();
        }
    }

    // Disk filesystems need the boot blocks and a directory block
    if (image.block_count() < 3) {
        return decode_result::failure(decode_error::too_short, "Image too small for a catalog");
    }
    return decode_result::failure(decode_error::unrecognized_format,
        "No known filesystem found on image");
}

decode_result walk_catalog(std::span<const std::uint8_t> data, disk_catalog& catalog,
                           const walk_options& options) {
    return walk_catalog(make_shared_bytes(data), catalog, options);
}

} // namespace a2decode
