#include <a2decode/catalog/disk_image.hpp>
#include <a2decode/byte_reader.hpp>

#include <algorithm>
#include <cstring>

namespace a2decode {

namespace {

// 2IMG container header
constexpr std::size_t IMG2_HEADER_MIN = 64;
constexpr std::size_t IMG2_FORMAT_OFFSET = 12;
constexpr std::size_t IMG2_BLOCKS_OFFSET = 20;
constexpr std::size_t IMG2_DATA_OFFSET = 24;
constexpr std::size_t IMG2_DATA_LENGTH = 28;
constexpr std::uint32_t IMG2_FORMAT_DOS = 0;
constexpr std::uint32_t IMG2_FORMAT_PRODOS = 1;
constexpr std::uint32_t IMG2_FORMAT_NIBBLE = 2;

// Physical position of each half-block within a track, expressed as the
// DOS 3.3 logical sector that lives there. Block b of a track occupies
// positions 2b and 2b+1. The table is its own inverse.
constexpr std::uint8_t BLOCK_HALF_TO_DOS_SECTOR[16] = {
    0, 14, 13, 12, 11, 10, 9, 8, 7, 6, 5, 4, 3, 2, 1, 15
};

} // namespace

// ============================================================================
// content_ref
// ============================================================================

content_ref::content_ref(shared_bytes source, std::vector<extent> extents)
    : source_(std::move(source)), extents_(std::move(extents)) {
    for (const auto& e : extents_) {
        size_ += e.length;
    }
}

std::vector<std::uint8_t> content_ref::bytes() const {
    std::vector<std::uint8_t> out;
    out.reserve(size_);
    for (const auto& e : extents_) {
        if (e.sparse || !source_) {
            out.insert(out.end(), e.length, 0);
        } else {
            const auto first = source_->begin() + static_cast<std::ptrdiff_t>(e.offset);
            out.insert(out.end(), first, first + static_cast<std::ptrdiff_t>(e.length));
        }
    }
    return out;
}

std::optional<std::span<const std::uint8_t>> content_ref::contiguous_view() const noexcept {
    if (!source_) {
        return std::nullopt;
    }
    if (extents_.empty()) {
        return std::span<const std::uint8_t>{};
    }
    if (extents_.size() != 1 || extents_.front().sparse) {
        return std::nullopt;
    }
    return std::span<const std::uint8_t>(*source_).subspan(extents_.front().offset,
                                                           extents_.front().length);
}

std::size_t content_ref::copy_prefix(std::span<std::uint8_t> dst) const noexcept {
    std::size_t copied = 0;
    for (const auto& e : extents_) {
        if (copied == dst.size()) {
            break;
        }
        const std::size_t n = std::min(e.length, dst.size() - copied);
        if (e.sparse || !source_) {
            std::memset(dst.data() + copied, 0, n);
        } else {
            std::memcpy(dst.data() + copied, source_->data() + e.offset, n);
        }
        copied += n;
    }
    return copied;
}

content_ref content_ref::subrange(std::size_t offset, std::size_t length) const {
    std::vector<extent> out;
    std::size_t skip = offset;
    std::size_t want = length;

    for (const auto& e : extents_) {
        if (want == 0) {
            break;
        }
        if (skip >= e.length) {
            skip -= e.length;
            continue;
        }
        extent part = e;
        if (!part.sparse) {
            part.offset += skip;
        }
        part.length = std::min(e.length - skip, want);
        skip = 0;
        want -= part.length;
        out.push_back(part);
    }
    return content_ref(source_, std::move(out));
}

void append_extent(std::vector<extent>& list, const extent& e) {
    if (e.length == 0) {
        return;
    }
    if (!list.empty()) {
        auto& last = list.back();
        if (last.sparse && e.sparse) {
            last.length += e.length;
            return;
        }
        if (!last.sparse && !e.sparse && last.offset + last.length == e.offset) {
            last.length += e.length;
            return;
        }
    }
    list.push_back(e);
}

// ============================================================================
// disk_image
// ============================================================================

const char* to_string(sector_order order) noexcept {
    switch (order) {
        case sector_order::prodos: return "prodos";
        case sector_order::dos:    return "dos";
    }
    return "unknown";
}

disk_image::disk_image(shared_bytes data, std::size_t offset, std::size_t length,
                       sector_order order, bool order_declared)
    : data_(std::move(data)), offset_(offset), length_(length),
      order_(order), order_declared_(order_declared) {
    const std::size_t available = data_ ? data_->size() : 0;
    if (offset_ > available) {
        offset_ = available;
    }
    length_ = std::min(length_, available - offset_);
}

decode_result disk_image::open(shared_bytes data, disk_image& out, bool unwrap_2img) {
    if (!data) {
        data = make_shared_bytes(std::vector<std::uint8_t>{});
    }

    const byte_reader reader(*data);
    const bool is_2img = unwrap_2img && data->size() >= IMG2_HEADER_MIN && has_2img_magic(*data);

    if (!is_2img) {
        const std::size_t size = data->size();
        out = disk_image(std::move(data), 0, size, sector_order::prodos, false);
        return decode_result::success();
    }

    const std::uint32_t format = *reader.u32le_at(IMG2_FORMAT_OFFSET);
    const std::uint32_t blocks = *reader.u32le_at(IMG2_BLOCKS_OFFSET);
    const std::size_t data_offset = *reader.u32le_at(IMG2_DATA_OFFSET);
    std::size_t data_length = *reader.u32le_at(IMG2_DATA_LENGTH);

    if (format == IMG2_FORMAT_NIBBLE) {
        return decode_result::failure(decode_error::unrecognized_format,
            "Nibble-format 2IMG images are not supported");
    }
    if (format != IMG2_FORMAT_DOS && format != IMG2_FORMAT_PRODOS) {
        return decode_result::failure(decode_error::malformed_header,
            "Unknown 2IMG image format " + std::to_string(format));
    }
    if (data_offset < IMG2_HEADER_MIN || data_offset > data->size()) {
        return decode_result::failure(decode_error::malformed_header,
            "2IMG data offset out of range");
    }
    if (data_length == 0) {
        data_length = (format == IMG2_FORMAT_PRODOS && blocks != 0)
                          ? static_cast<std::size_t>(blocks) * BLOCK_SIZE
                          : data->size() - data_offset;
    }
    if (data_length > data->size() - data_offset) {
        return decode_result::failure(decode_error::malformed_header,
            "2IMG data length runs past end of file");
    }

    const auto order = format == IMG2_FORMAT_DOS ? sector_order::dos : sector_order::prodos;
    out = disk_image(std::move(data), data_offset, data_length, order, true);
    return decode_result::success();
}

disk_image disk_image::with_order(sector_order order) const {
    disk_image copy = *this;
    copy.order_ = order;
    return copy;
}

bool disk_image::block_extents(std::size_t block, std::vector<extent>& out) const {
    if (block >= block_count()) {
        return false;
    }

    if (order_ == sector_order::prodos) {
        out.push_back({offset_ + block * BLOCK_SIZE, BLOCK_SIZE, false});
        return true;
    }

    // DOS order: two logical sectors from the same track
    const std::size_t track = block / 8;
    const std::size_t half = (block % 8) * 2;
    for (std::size_t i = 0; i < 2; ++i) {
        const std::size_t sector = BLOCK_HALF_TO_DOS_SECTOR[half + i];
        const std::size_t pos = track * TRACK_SIZE + sector * SECTOR_SIZE;
        if (pos + SECTOR_SIZE > length_) {
            return false;
        }
        out.push_back({offset_ + pos, SECTOR_SIZE, false});
    }
    return true;
}

bool disk_image::read_block(std::size_t block, std::array<std::uint8_t, BLOCK_SIZE>& out) const {
    std::vector<extent> parts;
    if (!block_extents(block, parts)) {
        return false;
    }
    std::size_t pos = 0;
    for (const auto& e : parts) {
        std::memcpy(out.data() + pos, data_->data() + e.offset, e.length);
        pos += e.length;
    }
    return true;
}

std::optional<extent> disk_image::sector_extent(std::size_t track, std::size_t sector) const noexcept {
    if (sector >= SECTORS_PER_TRACK) {
        return std::nullopt;
    }

    std::size_t pos = 0;
    if (order_ == sector_order::dos) {
        pos = track * TRACK_SIZE + sector * SECTOR_SIZE;
    } else {
        pos = track * TRACK_SIZE + BLOCK_HALF_TO_DOS_SECTOR[sector] * SECTOR_SIZE;
    }

    if (pos + SECTOR_SIZE > length_) {
        return std::nullopt;
    }
    return extent{offset_ + pos, SECTOR_SIZE, false};
}

bool disk_image::read_sector(std::size_t track, std::size_t sector,
                             std::array<std::uint8_t, SECTOR_SIZE>& out) const {
    const auto e = sector_extent(track, sector);
    if (!e) {
        return false;
    }
    std::memcpy(out.data(), data_->data() + e->offset, SECTOR_SIZE);
    return true;
}

content_ref disk_image::make_content(const std::vector<extent>& extents, std::size_t size) const {
    return content_ref(data_, extents).subrange(0, size);
}

bool is_standard_image_size(std::size_t size) noexcept {
    switch (size) {
        case 116480:   // 13-sector 5.25"
        case 143360:   // 16-sector 5.25"
        case 409600:   // 400K 3.5"
        case 819200:   // 800K 3.5"
        case 1474560:  // 1.44MB
            return true;
        default:
            return false;
    }
}

bool has_2img_magic(std::span<const std::uint8_t> data) noexcept {
    return data.size() >= TWO_IMG_MAGIC.size() &&
           std::equal(TWO_IMG_MAGIC.begin(), TWO_IMG_MAGIC.end(), data.begin());
}

} // namespace a2decode
