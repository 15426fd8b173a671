/**
 * @file config.hpp
 * @brief VLESS header decoder compile-time configuration.
 *
 * Wire layout constants for the VLESS request header:
 *
 *   +---------+----------+-----------+---------+---------+------+-------+---------+
 *   | version | uuid     | addon len | addons  | command | port | atype | address |
 *   | 1 byte  | 16 bytes | 1 byte    | M bytes | 1 byte  | 2 BE | 1     | varies  |
 *   +---------+----------+-----------+---------+---------+------+-------+---------+
 */

#ifndef VLESS_CONFIG_HPP
#define VLESS_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace vless {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup layout Header Layout Constants
 * @{
 */

/// Smallest buffer accepted before any field is read
#ifndef VLESS_MIN_HEADER_SIZE
#define VLESS_MIN_HEADER_SIZE 24U
#endif

inline constexpr std::size_t MIN_HEADER_SIZE = VLESS_MIN_HEADER_SIZE;

inline constexpr std::size_t VERSION_OFFSET = 0U;
inline constexpr std::size_t UUID_OFFSET = 1U;
inline constexpr std::size_t UUID_BYTES = 16U;
inline constexpr std::size_t ADDON_LENGTH_OFFSET = UUID_OFFSET + UUID_BYTES;

/// 32 hex digits plus 4 hyphens
inline constexpr std::size_t UUID_STRING_LENGTH = 36U;

inline constexpr std::size_t IPV4_BYTES = 4U;
inline constexpr std::size_t IPV6_BYTES = 16U;
inline constexpr std::size_t IPV6_GROUPS = IPV6_BYTES / 2U;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define VLESS_NO_EXCEPTIONS=1 to build without the exception types.
 * @{
 */
#ifndef VLESS_NO_EXCEPTIONS
#define VLESS_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace vless

#endif // VLESS_CONFIG_HPP
