/**
 * @file decoder.hpp
 * @brief VLESS request header decoding.
 *
 * Decodes, in order: version (discarded), UUID, addon block (skipped),
 * command, port, address type and address. Bytes after the address belong
 * to the payload stream and are left alone.
 */

#ifndef VLESS_DECODER_HPP
#define VLESS_DECODER_HPP

#include "byte_reader.hpp"
#include "config.hpp"
#include "error.hpp"
#include "header.hpp"

namespace vless {

/**
 * @brief Request header decoder.
 *
 * Holds no state between calls apart from the offset of the last failure,
 * so one instance can be reused for any number of frames by one thread.
 */
class HeaderDecoder {
public:
    HeaderDecoder() noexcept = default;

    /**
     * @brief Decode the header at the start of a frame.
     *
     * @param data Frame bytes (may be null when size is 0)
     * @param size Number of bytes available
     * @param[out] header Filled only when Error::Ok is returned
     * @return Error::Ok on success, otherwise the error naming the field
     *         that could not be decoded
     */
    Error decode(const std::uint8_t* data, std::size_t size, DecodedHeader& header);

    /**
     * @brief Byte offset at which the last failing check was made.
     *
     * For truncation errors this is where the missing field starts; for
     * value errors it is the offset of the offending byte (or the first
     * domain byte for DomainNotUtf8). Zero after a successful decode.
     */
    [[nodiscard]] std::size_t error_offset() const noexcept {
        return error_offset_;
    }

private:
    Error decode_address(ByteReader& reader, AddressType type, std::string& address);

    Error fail(Error error, std::size_t offset) noexcept {
        error_offset_ = offset;
        return error;
    }

    std::size_t error_offset_ = 0;
};

/**
 * @brief Decode a header with a temporary decoder.
 *
 * Safe to call concurrently on independent buffers.
 */
Error decode_header(const std::uint8_t* data, std::size_t size, DecodedHeader& header);

#if !VLESS_NO_EXCEPTIONS

/**
 * @brief Decode a header, throwing on failure.
 *
 * @throws TruncatedException when the buffer ends inside the header
 * @throws InvalidFieldException for an unsupported command or address type
 * @throws EncodingException when the domain is not UTF-8
 */
DecodedHeader decode_header_or_throw(const std::uint8_t* data, std::size_t size);

#endif // !VLESS_NO_EXCEPTIONS

} // namespace vless

#endif // VLESS_DECODER_HPP
