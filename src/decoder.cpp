/**
 * @file decoder.cpp
 * @brief VLESS request header decoding.
 */

#include <vless/decoder.hpp>
#include <vless/format.hpp>

#include <string>
#include <utility>

namespace vless {

Error HeaderDecoder::decode(const std::uint8_t* data, std::size_t size, DecodedHeader& header) {
    error_offset_ = 0;

    if (size < MIN_HEADER_SIZE) {
        return fail(Error::BufferTooSmall, size);
    }

    ByteReader reader(data, size);

    // Version: any value accepted
    std::uint8_t version = 0;
    if (!reader.read_u8(version)) {
        return fail(Error::BufferTooSmall, reader.position());
    }

    const std::uint8_t* uuid_bytes = nullptr;
    if (!reader.read_bytes(UUID_BYTES, uuid_bytes)) {
        return fail(Error::BufferTooSmall, reader.position());
    }

    // Addon block: length-prefixed, skipped uninterpreted
    std::uint8_t addon_length = 0;
    if (!reader.read_u8(addon_length)) {
        return fail(Error::InvalidPayload, reader.position());
    }
    const std::size_t command_offset = reader.position() + addon_length;
    std::uint8_t command_byte = 0;
    if (!reader.skip(addon_length) || !reader.read_u8(command_byte)) {
        return fail(Error::InvalidCommandIndex, command_offset);
    }
    if (command_byte != static_cast<std::uint8_t>(Command::Tcp) &&
        command_byte != static_cast<std::uint8_t>(Command::Udp)) {
        return fail(Error::UnsupportedCommand, command_offset);
    }

    std::uint16_t port = 0;
    if (!reader.read_u16_be(port)) {
        return fail(Error::MissingPort, reader.position());
    }

    const std::size_t type_offset = reader.position();
    std::uint8_t type_byte = 0;
    if (!reader.read_u8(type_byte)) {
        return fail(Error::MissingAddressType, type_offset);
    }
    if (type_byte < static_cast<std::uint8_t>(AddressType::Ipv4) ||
        type_byte > static_cast<std::uint8_t>(AddressType::Ipv6)) {
        return fail(Error::InvalidAddressType, type_offset);
    }
    const AddressType address_type = static_cast<AddressType>(type_byte);

    std::string address;
    Error status = decode_address(reader, address_type, address);
    if (status != Error::Ok) {
        return status;
    }

    std::string uuid = format_uuid(uuid_bytes);

    header.uuid = std::move(uuid);
    header.command = static_cast<Command>(command_byte);
    header.address_type = address_type;
    header.address = std::move(address);
    header.port = port;
    header.payload_offset = reader.position();

    return Error::Ok;
}

Error HeaderDecoder::decode_address(ByteReader& reader, AddressType type, std::string& address) {
    const std::uint8_t* bytes = nullptr;

    switch (type) {
    case AddressType::Ipv4:
        if (!reader.read_bytes(IPV4_BYTES, bytes)) {
            return fail(Error::Ipv4Truncated, reader.position());
        }
        address = format_ipv4(bytes);
        return Error::Ok;

    case AddressType::Domain: {
        std::uint8_t domain_length = 0;
        if (!reader.read_u8(domain_length)) {
            return fail(Error::DomainLengthMissing, reader.position());
        }
        const std::size_t domain_offset = reader.position();
        if (!reader.read_bytes(domain_length, bytes)) {
            return fail(Error::DomainTruncated, domain_offset);
        }
        if (!is_valid_utf8(bytes, domain_length)) {
            return fail(Error::DomainNotUtf8, domain_offset);
        }
        address.assign(reinterpret_cast<const char*>(bytes), domain_length);
        return Error::Ok;
    }

    case AddressType::Ipv6:
        if (!reader.read_bytes(IPV6_BYTES, bytes)) {
            return fail(Error::Ipv6Truncated, reader.position());
        }
        address = format_ipv6(bytes);
        return Error::Ok;
    }

    return fail(Error::InvalidAddressType, reader.position());
}

Error decode_header(const std::uint8_t* data, std::size_t size, DecodedHeader& header) {
    HeaderDecoder decoder;
    return decoder.decode(data, size, header);
}

#if !VLESS_NO_EXCEPTIONS

DecodedHeader decode_header_or_throw(const std::uint8_t* data, std::size_t size) {
    HeaderDecoder decoder;
    DecodedHeader header;
    Error status = decoder.decode(data, size, header);
    if (status == Error::Ok) {
        return header;
    }

    std::string message = std::string(error_string(status)) + " at offset " +
                          std::to_string(decoder.error_offset());

    if (status == Error::DomainNotUtf8) {
        throw EncodingException(message);
    }
    if (is_truncation(status)) {
        throw TruncatedException(message, status);
    }
    throw InvalidFieldException(message, status);
}

#endif // !VLESS_NO_EXCEPTIONS

} // namespace vless
