/**
 * @file json.cpp
 * @brief JSON text record for decoded headers.
 */

#include <vless/json.hpp>

namespace vless {

void append_json_string(std::string& out, const std::string& text) {
    static constexpr char HEX_DIGITS[] = "0123456789abcdef";

    out.push_back('"');
    for (char c : text) {
        const auto byte = static_cast<unsigned char>(c);
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (byte < 0x20U) {
                out += "\\u00";
                out.push_back(HEX_DIGITS[byte >> 4]);
                out.push_back(HEX_DIGITS[byte & 0x0FU]);
            } else {
                // UTF-8 passes through unchanged
                out.push_back(c);
            }
            break;
        }
    }
    out.push_back('"');
}

std::string to_json(const DecodedHeader& header) {
    std::string out;
    out.reserve(96 + header.address.size());

    out += "{\"uuid\":";
    append_json_string(out, header.uuid);
    out += ",\"command\":";
    out += std::to_string(static_cast<unsigned>(header.command));
    out += ",\"address_type\":";
    out += std::to_string(static_cast<unsigned>(header.address_type));
    out += ",\"address\":";
    append_json_string(out, header.address);
    out += ",\"port\":";
    out += std::to_string(header.port);
    out.push_back('}');

    return out;
}

} // namespace vless
