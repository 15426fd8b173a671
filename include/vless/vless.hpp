/**
 * @file vless.hpp
 * @brief VLESS request header decoder public API.
 *
 * Decodes the header at the start of a VLESS request frame into the
 * destination a relay must connect to. The decoder never performs I/O and
 * never authenticates the UUID; both are left to the caller.
 */

#ifndef VLESS_HPP
#define VLESS_HPP

#include "byte_reader.hpp"
#include "config.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "format.hpp"
#include "header.hpp"
#include "json.hpp"

namespace vless {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace vless

#endif // VLESS_HPP
