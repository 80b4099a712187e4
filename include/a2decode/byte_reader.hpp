#ifndef A2DECODE_BYTE_READER_HPP_
#define A2DECODE_BYTE_READER_HPP_

#include <a2decode/a2decode_export.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace a2decode {

// ============================================================================
// Byte Reader
// ============================================================================

/**
 * Bounds-checked cursor over an immutable byte span.
 *
 * Every read returns an empty optional instead of touching memory past the
 * end of the span. A failed read never moves the cursor, so callers can
 * try alternatives after a failure.
 */
class A2DECODE_EXPORT byte_reader {
public:
    byte_reader() noexcept = default;
    explicit byte_reader(std::span<const std::uint8_t> data) noexcept
        : data_(data) {}

    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] std::size_t position() const noexcept { return pos_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }
    [[nodiscard]] bool at_end() const noexcept { return pos_ >= data_.size(); }
    [[nodiscard]] std::span<const std::uint8_t> data() const noexcept { return data_; }

    /**
     * Move the cursor to an absolute offset.
     * @param offset New position (may equal size())
     * @return false if offset is past the end; the cursor is unchanged
     */
    [[nodiscard]] bool seek(std::size_t offset) noexcept;

    /**
     * Advance the cursor.
     * @return false if fewer than n bytes remain; the cursor is unchanged
     */
    [[nodiscard]] bool skip(std::size_t n) noexcept;

    [[nodiscard]] std::optional<std::uint8_t> peek() const noexcept;

    // Sequential reads
    [[nodiscard]] std::optional<std::uint8_t> read_u8() noexcept;
    [[nodiscard]] std::optional<std::uint16_t> read_u16le() noexcept;
    [[nodiscard]] std::optional<std::uint16_t> read_u16be() noexcept;
    [[nodiscard]] std::optional<std::uint32_t> read_u24le() noexcept;
    [[nodiscard]] std::optional<std::uint32_t> read_u32le() noexcept;
    [[nodiscard]] std::optional<std::uint32_t> read_u32be() noexcept;
    [[nodiscard]] std::optional<std::span<const std::uint8_t>> read_bytes(std::size_t n) noexcept;

    // Absolute reads, cursor is never moved
    [[nodiscard]] std::optional<std::uint8_t> u8_at(std::size_t offset) const noexcept;
    [[nodiscard]] std::optional<std::uint16_t> u16le_at(std::size_t offset) const noexcept;
    [[nodiscard]] std::optional<std::uint16_t> u16be_at(std::size_t offset) const noexcept;
    [[nodiscard]] std::optional<std::uint32_t> u24le_at(std::size_t offset) const noexcept;
    [[nodiscard]] std::optional<std::uint32_t> u32le_at(std::size_t offset) const noexcept;
    [[nodiscard]] std::optional<std::span<const std::uint8_t>> slice(std::size_t offset,
                                                                     std::size_t n) const noexcept;

private:
    [[nodiscard]] bool has(std::size_t offset, std::size_t n) const noexcept {
        return offset <= data_.size() && n <= data_.size() - offset;
    }

    std::span<const std::uint8_t> data_;
    std::size_t pos_ = 0;
};

} // namespace a2decode

#endif // A2DECODE_BYTE_READER_HPP_
