/**
 * @file format.hpp
 * @brief Text renderings of identifier and address fields.
 *
 * Each function takes a pointer to exactly the number of bytes its field
 * occupies on the wire. Callers are responsible for the bounds check.
 */

#ifndef VLESS_FORMAT_HPP
#define VLESS_FORMAT_HPP

#include <string>

#include "config.hpp"

namespace vless {

/**
 * @brief Render 16 identifier bytes as a canonical UUID string.
 *
 * Lowercase hex, hyphens after hex digits 8, 12, 16 and 20.
 *
 * @param bytes UUID_BYTES bytes
 * @return 36-character string
 */
std::string format_uuid(const std::uint8_t* bytes);

/**
 * @brief Render 4 bytes as dotted decimal.
 */
std::string format_ipv4(const std::uint8_t* bytes);

/**
 * @brief Render 16 bytes as eight big-endian hex groups.
 *
 * Groups are lowercase with no zero padding. No "::" compression is
 * applied, so the all-zero address is "0:0:0:0:0:0:0:0".
 */
std::string format_ipv6(const std::uint8_t* bytes);

/**
 * @brief Check that a byte range is well-formed UTF-8.
 *
 * Rejects overlong forms, UTF-16 surrogates (U+D800..U+DFFF), code points
 * above U+10FFFF and truncated sequences. The empty range is valid.
 */
bool is_valid_utf8(const std::uint8_t* data, std::size_t size) noexcept;

} // namespace vless

#endif // VLESS_FORMAT_HPP
