/**
 * @file byte_reader.hpp
 * @brief Sequential bounds-checked byte reading from a request frame.
 *
 * The byte reader walks a borrowed buffer left to right. Every read checks
 * the remaining length before touching memory and leaves the cursor where
 * it was when the check fails.
 */

#ifndef VLESS_BYTE_READER_HPP
#define VLESS_BYTE_READER_HPP

#include "config.hpp"

namespace vless {

/**
 * @brief Sequential byte reader over a borrowed buffer.
 *
 * The reader does not own the buffer; it must outlive the reader.
 */
class ByteReader {
public:
    /**
     * @brief Construct a byte reader.
     *
     * @param data Pointer to source data buffer (may be null when size is 0)
     * @param size Number of valid bytes in buffer
     */
    ByteReader(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size), pos_(0) {}

    /**
     * @brief Check that at least @p count bytes are left.
     */
    [[nodiscard]] bool has(std::size_t count) const noexcept {
        return count <= remaining();
    }

    /**
     * @brief Read one byte.
     *
     * @param[out] value Byte read
     * @return false if no bytes remain
     */
    inline bool read_u8(std::uint8_t& value) noexcept {
        if (pos_ >= size_) [[unlikely]] {
            return false;
        }
        value = data_[pos_++];
        return true;
    }

    /**
     * @brief Read a big-endian (network order) 16-bit value.
     *
     * @param[out] value Host-order value
     * @return false if fewer than 2 bytes remain
     */
    bool read_u16_be(std::uint16_t& value) noexcept {
        if (!has(2)) [[unlikely]] {
            return false;
        }
        value = static_cast<std::uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return true;
    }

    /**
     * @brief Consume @p count bytes and expose them in place.
     *
     * @param count Number of bytes to consume
     * @param[out] bytes Pointer to the first consumed byte
     * @return false if fewer than @p count bytes remain
     */
    bool read_bytes(std::size_t count, const std::uint8_t*& bytes) noexcept {
        if (!has(count)) [[unlikely]] {
            return false;
        }
        bytes = data_ + pos_;
        pos_ += count;
        return true;
    }

    /**
     * @brief Advance past @p count bytes without reading them.
     *
     * @return false if fewer than @p count bytes remain
     */
    bool skip(std::size_t count) noexcept {
        if (!has(count)) [[unlikely]] {
            return false;
        }
        pos_ += count;
        return true;
    }

    /**
     * @brief Get current byte position.
     *
     * @return Number of bytes already consumed
     */
    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    /**
     * @brief Get remaining bytes.
     */
    [[nodiscard]] std::size_t remaining() const noexcept {
        return (pos_ < size_) ? (size_ - pos_) : 0;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return size_;
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
};

} // namespace vless

#endif // VLESS_BYTE_READER_HPP
