/**
 * @file format.cpp
 * @brief Identifier and address text rendering.
 */

#include <vless/format.hpp>

namespace vless {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

void append_hex_byte(std::string& out, std::uint8_t byte) {
    out.push_back(HEX_DIGITS[byte >> 4]);
    out.push_back(HEX_DIGITS[byte & 0x0FU]);
}

// Lowercase hex without leading zeros; 0 renders as "0".
void append_hex_u16(std::string& out, std::uint16_t value) {
    bool started = false;
    for (int shift = 12; shift >= 0; shift -= 4) {
        unsigned nibble = static_cast<unsigned>(value >> shift) & 0x0FU;
        if (nibble != 0 || started || shift == 0) {
            out.push_back(HEX_DIGITS[nibble]);
            started = true;
        }
    }
}

} // namespace

std::string format_uuid(const std::uint8_t* bytes) {
    std::string out;
    out.reserve(UUID_STRING_LENGTH);

    for (std::size_t i = 0; i < UUID_BYTES; ++i) {
        // 8-4-4-4-12: hyphen before bytes 4, 6, 8 and 10
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        append_hex_byte(out, bytes[i]);
    }

    return out;
}

std::string format_ipv4(const std::uint8_t* bytes) {
    std::string out;
    out.reserve(15);

    for (std::size_t i = 0; i < IPV4_BYTES; ++i) {
        if (i != 0) {
            out.push_back('.');
        }
        out += std::to_string(static_cast<unsigned>(bytes[i]));
    }

    return out;
}

std::string format_ipv6(const std::uint8_t* bytes) {
    std::string out;
    out.reserve(39);

    for (std::size_t g = 0; g < IPV6_GROUPS; ++g) {
        if (g != 0) {
            out.push_back(':');
        }
        std::uint16_t group =
            static_cast<std::uint16_t>((bytes[2 * g] << 8) | bytes[2 * g + 1]);
        append_hex_u16(out, group);
    }

    return out;
}

bool is_valid_utf8(const std::uint8_t* data, std::size_t size) noexcept {
    std::size_t i = 0;

    while (i < size) {
        std::uint8_t lead = data[i];

        if (lead < 0x80U) {
            ++i;
            continue;
        }

        std::size_t length = 0;
        // Allowed range of the first continuation byte (Unicode Table 3-7)
        std::uint8_t lo = 0x80U;
        std::uint8_t hi = 0xBFU;

        if (lead >= 0xC2U && lead <= 0xDFU) {
            length = 2;
        } else if (lead >= 0xE0U && lead <= 0xEFU) {
            length = 3;
            if (lead == 0xE0U) {
                lo = 0xA0U; // overlong
            } else if (lead == 0xEDU) {
                hi = 0x9FU; // surrogates
            }
        } else if (lead >= 0xF0U && lead <= 0xF4U) {
            length = 4;
            if (lead == 0xF0U) {
                lo = 0x90U; // overlong
            } else if (lead == 0xF4U) {
                hi = 0x8FU; // above U+10FFFF
            }
        } else {
            // 0x80..0xC1 and 0xF5..0xFF never start a sequence
            return false;
        }

        if (size - i < length) {
            return false;
        }

        if (data[i + 1] < lo || data[i + 1] > hi) {
            return false;
        }
        for (std::size_t k = 2; k < length; ++k) {
            if ((data[i + k] & 0xC0U) != 0x80U) {
                return false;
            }
        }

        i += length;
    }

    return true;
}

} // namespace vless
