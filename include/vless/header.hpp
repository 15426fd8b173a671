/**
 * @file header.hpp
 * @brief Decoded VLESS request header record.
 */

#ifndef VLESS_HEADER_HPP
#define VLESS_HEADER_HPP

#include <string>

#include "config.hpp"

namespace vless {

/**
 * @brief Request command carried in the header.
 */
enum class Command : std::uint8_t {
    Tcp = 1, ///< Connect
    Udp = 2  ///< Associate
};

/**
 * @brief Address kind; selects the syntax of DecodedHeader::address.
 */
enum class AddressType : std::uint8_t {
    Ipv4 = 1,   ///< Dotted decimal, e.g. "192.168.0.1"
    Domain = 2, ///< UTF-8 text used verbatim
    Ipv6 = 3    ///< Eight unpadded lowercase hex groups joined by ':'
};

/**
 * @brief Destination request decoded from a frame header.
 *
 * Only filled by a successful decode; a failed decode leaves an existing
 * record untouched.
 */
struct DecodedHeader {
    std::string uuid;                        ///< Canonical 8-4-4-4-12 lowercase form
    Command command = Command::Tcp;
    AddressType address_type = AddressType::Ipv4;
    std::string address;
    std::uint16_t port = 0;
    std::size_t payload_offset = 0;          ///< First byte after the address field
};

inline bool operator==(const DecodedHeader& a, const DecodedHeader& b) {
    return a.uuid == b.uuid && a.command == b.command && a.address_type == b.address_type &&
           a.address == b.address && a.port == b.port && a.payload_offset == b.payload_offset;
}

inline bool operator!=(const DecodedHeader& a, const DecodedHeader& b) {
    return !(a == b);
}

inline const char* command_name(Command command) noexcept {
    switch (command) {
    case Command::Tcp:
        return "tcp";
    case Command::Udp:
        return "udp";
    default:
        return "unknown";
    }
}

inline const char* address_type_name(AddressType type) noexcept {
    switch (type) {
    case AddressType::Ipv4:
        return "ipv4";
    case AddressType::Domain:
        return "domain";
    case AddressType::Ipv6:
        return "ipv6";
    default:
        return "unknown";
    }
}

} // namespace vless

#endif // VLESS_HEADER_HPP
