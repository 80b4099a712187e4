#ifndef A2DECODE_CATALOG_CATALOG_HPP_
#define A2DECODE_CATALOG_CATALOG_HPP_

#include <a2decode/a2decode_export.h>
#include <a2decode/types.hpp>
#include <a2decode/catalog/disk_image.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace a2decode {

// ============================================================================
// Filesystem-Specific Metadata
// ============================================================================

// ProDOS access bits
namespace access_flags {
inline constexpr std::uint8_t DESTROY = 0x80;
inline constexpr std::uint8_t RENAME = 0x40;
inline constexpr std::uint8_t BACKUP = 0x20;
inline constexpr std::uint8_t INVISIBLE = 0x04;
inline constexpr std::uint8_t WRITE = 0x02;
inline constexpr std::uint8_t READ = 0x01;
} // namespace access_flags

struct prodos_metadata {
    std::uint8_t storage_type = 0;   // 1 seedling, 2 sapling, 3 tree, 5 extended, 0xD directory
    std::uint16_t key_block = 0;
    std::uint8_t access = 0;
    std::uint8_t version = 0;
    std::uint8_t min_version = 0;
    std::uint16_t header_block = 0;  // parent directory key block

    bool operator==(const prodos_metadata&) const = default;
};

struct dos33_metadata {
    std::uint8_t ts_list_track = 0;
    std::uint8_t ts_list_sector = 0;

    bool operator==(const dos33_metadata&) const = default;
};

struct pascal_metadata {
    std::uint16_t first_block = 0;
    std::uint16_t next_block = 0;    // one past the last block
    std::uint16_t last_block_bytes = 0;

    bool operator==(const pascal_metadata&) const = default;
};

// ============================================================================
// Catalog Entry
// ============================================================================

/**
 * One node of a catalog tree.
 *
 * Leaves carry their content as a content_ref into the image buffer;
 * directories carry their children, fully decoded.
 */
struct catalog_entry {
    std::string name;
    std::uint8_t file_type = 0;      // raw code as stored by the filesystem
    std::uint8_t prodos_type = 0;    // equivalent ProDOS type
    std::string type_label;
    std::uint16_t aux_type = 0;
    std::size_t size = 0;            // bytes
    std::size_t blocks = 0;          // blocks or sectors used on disk
    std::optional<std::uint16_t> load_address;
    std::optional<std::size_t> byte_length;
    content_ref content;
    content_ref resource;            // GS/OS resource fork, empty for most files

    bool is_directory = false;
    bool is_image = false;
    bool locked = false;

    std::vector<catalog_entry> children;

    std::optional<date_time> created;
    std::optional<date_time> modified;

    std::optional<prodos_metadata> prodos;
    std::optional<dos33_metadata> dos33;
    std::optional<pascal_metadata> pascal;

    [[nodiscard]] bool is_leaf() const noexcept { return !is_directory; }

    bool operator==(const catalog_entry&) const = default;
};

// ============================================================================
// Disk Catalog
// ============================================================================

enum class filesystem_kind {
    prodos,
    dos33,
    pascal,
    binary2,
    other
};

[[nodiscard]] A2DECODE_EXPORT const char* to_string(filesystem_kind kind) noexcept;

struct disk_catalog {
    std::string volume_name;
    filesystem_kind filesystem = filesystem_kind::other;
    std::string filesystem_name;
    sector_order order = sector_order::prodos;
    std::size_t image_size = 0;
    std::size_t total_blocks = 0;
    std::optional<date_time> created;
    std::vector<catalog_entry> entries;

    // Counts over the whole tree
    [[nodiscard]] A2DECODE_EXPORT std::size_t file_count() const noexcept;
    [[nodiscard]] A2DECODE_EXPORT std::size_t directory_count() const noexcept;

    bool operator==(const disk_catalog&) const = default;
};

/**
 * True when file content is itself a disk image (standard floppy size or
 * a 2IMG container).
 */
[[nodiscard]] A2DECODE_EXPORT bool is_nested_image(const content_ref& content) noexcept;

// ============================================================================
// Filesystem Interface
// ============================================================================

/**
 * Abstract base class for catalog readers.
 * Used by the filesystem registry for runtime polymorphism.
 */
class A2DECODE_EXPORT filesystem {
public:
    virtual ~filesystem() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual filesystem_kind kind() const noexcept = 0;

    /**
     * Sector order the filesystem is normally stored in, tried first when
     * the image does not declare one.
     */
    [[nodiscard]] virtual sector_order preferred_order() const noexcept = 0;

    /**
     * Check fixed-offset signature fields under the image's current order.
     */
    [[nodiscard]] virtual bool sniff(const disk_image& image) const noexcept = 0;

    /**
     * Build the catalog tree.
     * @param image Image whose order already passed sniff()
     * @param catalog Filled on success
     */
    [[nodiscard]] virtual decode_result walk(const disk_image& image,
                                             disk_catalog& catalog) const = 0;
};

// ============================================================================
// Filesystem Registry
// ============================================================================

/**
 * Registry of catalog readers in detection priority order.
 * ProDOS, DOS 3.3 and UCSD Pascal are registered by default.
 * User code can append filesystems at runtime.
 */
class A2DECODE_EXPORT filesystem_registry {
public:
    /**
     * Get the global filesystem registry instance.
     */
    [[nodiscard]] static filesystem_registry& instance();

    /**
     * Register a filesystem after the existing ones.
     * @param fs Unique pointer to filesystem (ownership transferred)
     */
    void register_filesystem(std::unique_ptr<filesystem> fs);

    /**
     * Find a filesystem by name.
     * @param name Filesystem name (e.g., "prodos")
     * @return Pointer to filesystem if found, nullptr otherwise
     */
    [[nodiscard]] const filesystem* find_filesystem(std::string_view name) const;

    [[nodiscard]] std::size_t filesystem_count() const noexcept {
        return filesystems_.size();
    }

    /**
     * Get filesystem at index.
     * @param index Filesystem index (0 to filesystem_count()-1)
     * @return Pointer to filesystem, or nullptr if index out of range
     */
    [[nodiscard]] const filesystem* filesystem_at(std::size_t index) const noexcept {
        return index < filesystems_.size() ? filesystems_[index].get() : nullptr;
    }

private:
    filesystem_registry();
    ~filesystem_registry();

    filesystem_registry(const filesystem_registry&) = delete;
    filesystem_registry& operator=(const filesystem_registry&) = delete;

    void register_builtin_filesystems();

    std::vector<std::unique_ptr<filesystem>> filesystems_;
};

// ============================================================================
// Catalog Walking
// ============================================================================

struct walk_options {
    // Restrict detection to one filesystem kind
    std::optional<filesystem_kind> format;

    // Force a sector order instead of probing both
    std::optional<sector_order> order;

    // Strip a 2IMG header when present
    bool unwrap_2img = true;
};

/**
 * Detect the filesystem on a disk image and build its catalog tree.
 * Entries keep a reference to the buffer for lazy content access.
 * @param data Whole image file
 * @param catalog Filled on success (untouched on failure)
 * @param options Detection hints
 * @return Decode result (unrecognized_format, circular_directory, ...)
 */
[[nodiscard]] A2DECODE_EXPORT decode_result walk_catalog(shared_bytes data,
                                                         disk_catalog& catalog,
                                                         const walk_options& options = {});

/**
 * Walk a catalog over a caller-owned span. The bytes are copied once into
 * a shared buffer so entry content outlives the span.
 */
[[nodiscard]] A2DECODE_EXPORT decode_result walk_catalog(std::span<const std::uint8_t> data,
                                                         disk_catalog& catalog,
                                                         const walk_options& options = {});

} // namespace a2decode

#endif // A2DECODE_CATALOG_CATALOG_HPP_
