/**
 * @file json.hpp
 * @brief JSON text record for decoded headers.
 *
 * Boundary adapter for hosts that consume the header as text. The field
 * names match the record read by existing VLESS relay front ends:
 *
 *     {"uuid":"...","command":1,"address_type":1,"address":"...","port":443}
 *
 * payload_offset is not part of the record.
 */

#ifndef VLESS_JSON_HPP
#define VLESS_JSON_HPP

#include <string>

#include "header.hpp"

namespace vless {

/**
 * @brief Serialize a decoded header as a single-line JSON object.
 */
std::string to_json(const DecodedHeader& header);

/**
 * @brief Append @p text to @p out as a quoted JSON string (RFC 8259).
 */
void append_json_string(std::string& out, const std::string& text);

} // namespace vless

#endif // VLESS_JSON_HPP
