#include <a2decode/byte_reader.hpp>
#include "byte_io.hpp"

namespace a2decode {

bool byte_reader::seek(std::size_t offset) noexcept {
    if (offset > data_.size()) {
        return false;
    }
    pos_ = offset;
    return true;
}

bool byte_reader::skip(std::size_t n) noexcept {
    if (!has(pos_, n)) {
        return false;
    }
    pos_ += n;
    return true;
}

std::optional<std::uint8_t> byte_reader::peek() const noexcept {
    return u8_at(pos_);
}

std::optional<std::uint8_t> byte_reader::read_u8() noexcept {
    auto v = u8_at(pos_);
    if (v) pos_ += 1;
    return v;
}

std::optional<std::uint16_t> byte_reader::read_u16le() noexcept {
    auto v = u16le_at(pos_);
    if (v) pos_ += 2;
    return v;
}

std::optional<std::uint16_t> byte_reader::read_u16be() noexcept {
    auto v = u16be_at(pos_);
    if (v) pos_ += 2;
    return v;
}

std::optional<std::uint32_t> byte_reader::read_u24le() noexcept {
    auto v = u24le_at(pos_);
    if (v) pos_ += 3;
    return v;
}

std::optional<std::uint32_t> byte_reader::read_u32le() noexcept {
    auto v = u32le_at(pos_);
    if (v) pos_ += 4;
    return v;
}

std::optional<std::uint32_t> byte_reader::read_u32be() noexcept {
    if (!has(pos_, 4)) {
        return std::nullopt;
    }
    const std::uint32_t v = read_be32(data_.data() + pos_);
    pos_ += 4;
    return v;
}

std::optional<std::span<const std::uint8_t>> byte_reader::read_bytes(std::size_t n) noexcept {
    auto s = slice(pos_, n);
    if (s) pos_ += n;
    return s;
}

std::optional<std::uint8_t> byte_reader::u8_at(std::size_t offset) const noexcept {
    if (!has(offset, 1)) {
        return std::nullopt;
    }
    return data_[offset];
}

std::optional<std::uint16_t> byte_reader::u16le_at(std::size_t offset) const noexcept {
    if (!has(offset, 2)) {
        return std::nullopt;
    }
    return read_le16(data_.data() + offset);
}

std::optional<std::uint16_t> byte_reader::u16be_at(std::size_t offset) const noexcept {
    if (!has(offset, 2)) {
        return std::nullopt;
    }
    return read_be16(data_.data() + offset);
}

std::optional<std::uint32_t> byte_reader::u24le_at(std::size_t offset) const noexcept {
    if (!has(offset, 3)) {
        return std::nullopt;
    }
    return read_le24(data_.data() + offset);
}

std::optional<std::uint32_t> byte_reader::u32le_at(std::size_t offset) const noexcept {
    if (!has(offset, 4)) {
        return std::nullopt;
    }
    return read_le32(data_.data() + offset);
}

std::optional<std::span<const std::uint8_t>> byte_reader::slice(std::size_t offset,
                                                                std::size_t n) const noexcept {
    if (!has(offset, n)) {
        return std::nullopt;
    }
    return data_.subspan(offset, n);
}

} // namespace a2decode
