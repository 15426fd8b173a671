/**
 * @file frame_builder.hpp
 * @brief Request frame construction for decoder tests.
 */

#ifndef VLESS_TESTS_FRAME_BUILDER_HPP
#define VLESS_TESTS_FRAME_BUILDER_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace vless_test {

/**
 * @brief Builds request frames field by field.
 *
 * Defaults describe a well-formed TCP request to 192.168.0.1:443 with no
 * addons and no payload.
 */
struct FrameBuilder {
    std::uint8_t version = 0;
    std::vector<std::uint8_t> uuid = {0x55, 0x0e, 0x84, 0x00, 0xe2, 0x9b, 0x41, 0xd4,
                                      0xa7, 0x16, 0x44, 0x66, 0x55, 0x44, 0x00, 0x00};
    std::vector<std::uint8_t> addons;
    std::uint8_t command = 1;
    std::uint16_t port = 443;
    std::uint8_t address_type = 1;
    std::vector<std::uint8_t> address = {192, 168, 0, 1};
    std::vector<std::uint8_t> payload;

    FrameBuilder& domain(const std::string& name) {
        address_type = 2;
        address.clear();
        address.push_back(static_cast<std::uint8_t>(name.size()));
        address.insert(address.end(), name.begin(), name.end());
        return *this;
    }

    FrameBuilder& ipv6(const std::vector<std::uint8_t>& bytes) {
        address_type = 3;
        address = bytes;
        return *this;
    }

    FrameBuilder& addon_bytes(std::size_t count) {
        addons.assign(count, 0x0A);
        return *this;
    }

    /// Offset of the command byte
    std::size_t command_offset() const {
        return 18 + addons.size();
    }

    /// Offset of the first payload byte
    std::size_t header_size() const {
        return command_offset() + 1 + 2 + 1 + address.size();
    }

    std::vector<std::uint8_t> build() const {
        std::vector<std::uint8_t> frame;
        frame.push_back(version);
        frame.insert(frame.end(), uuid.begin(), uuid.end());
        frame.push_back(static_cast<std::uint8_t>(addons.size()));
        frame.insert(frame.end(), addons.begin(), addons.end());
        frame.push_back(command);
        frame.push_back(static_cast<std::uint8_t>(port >> 8));
        frame.push_back(static_cast<std::uint8_t>(port & 0xFF));
        frame.push_back(address_type);
        frame.insert(frame.end(), address.begin(), address.end());
        frame.insert(frame.end(), payload.begin(), payload.end());
        return frame;
    }
};

} // namespace vless_test

#endif // VLESS_TESTS_FRAME_BUILDER_HPP
