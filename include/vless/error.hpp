/**
 * @file error.hpp
 * @brief VLESS header decoding errors.
 *
 * Every decode failure maps to exactly one Error value naming the field
 * whose expectation was violated. Exception types wrap the same codes
 * and are compiled out with VLESS_NO_EXCEPTIONS=1.
 */

#ifndef VLESS_ERROR_HPP
#define VLESS_ERROR_HPP

#include "config.hpp"

#if !VLESS_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace vless {

/**
 * @brief Decode error codes.
 */
enum class Error {
    Ok = 0,                    ///< Success
    BufferTooSmall = -1,       ///< Buffer shorter than the minimum header size
    InvalidPayload = -2,       ///< Addon length byte unreadable
    InvalidCommandIndex = -3,  ///< Buffer ends before the command byte
    UnsupportedCommand = -4,   ///< Command is neither TCP nor UDP
    MissingPort = -5,          ///< Fewer than 2 bytes left for the port
    MissingAddressType = -6,   ///< No address type byte
    InvalidAddressType = -7,   ///< Address type is not 1, 2 or 3
    Ipv4Truncated = -8,        ///< Fewer than 4 IPv4 address bytes
    DomainLengthMissing = -9,  ///< No domain length byte
    DomainTruncated = -10,     ///< Fewer domain bytes than declared
    Ipv6Truncated = -11,       ///< Fewer than 16 IPv6 address bytes
    DomainNotUtf8 = -12        ///< Domain bytes are not valid UTF-8
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::BufferTooSmall:
        return "buffer too small";
    case Error::InvalidPayload:
        return "invalid payload";
    case Error::InvalidCommandIndex:
        return "invalid command index";
    case Error::UnsupportedCommand:
        return "unsupported command";
    case Error::MissingPort:
        return "missing port";
    case Error::MissingAddressType:
        return "missing address type";
    case Error::InvalidAddressType:
        return "invalid address type";
    case Error::Ipv4Truncated:
        return "ipv4 missing bytes";
    case Error::DomainLengthMissing:
        return "domain length missing";
    case Error::DomainTruncated:
        return "domain bytes missing";
    case Error::Ipv6Truncated:
        return "ipv6 missing bytes";
    case Error::DomainNotUtf8:
        return "domain utf8 error";
    default:
        return "Unknown error";
    }
}

/**
 * @brief True for errors caused by the buffer ending early.
 *
 * A caller reading from a stream may wait for more bytes and retry on
 * these; every other error is a malformed header.
 */
inline bool is_truncation(Error error) noexcept {
    switch (error) {
    case Error::BufferTooSmall:
    case Error::InvalidPayload:
    case Error::InvalidCommandIndex:
    case Error::MissingPort:
    case Error::MissingAddressType:
    case Error::Ipv4Truncated:
    case Error::DomainLengthMissing:
    case Error::DomainTruncated:
    case Error::Ipv6Truncated:
        return true;
    default:
        return false;
    }
}

#if !VLESS_NO_EXCEPTIONS

/**
 * @brief Base exception for VLESS decode errors.
 */
class VlessException : public std::runtime_error {
public:
    explicit VlessException(const std::string& message, Error code = Error::InvalidPayload)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for a header cut short at some field.
 */
class TruncatedException : public VlessException {
public:
    TruncatedException(const std::string& message, Error code)
        : VlessException(message, code) {}
};

/**
 * @brief Exception for a field holding an unsupported value.
 */
class InvalidFieldException : public VlessException {
public:
    InvalidFieldException(const std::string& message, Error code)
        : VlessException(message, code) {}
};

/**
 * @brief Exception for domain bytes that are not UTF-8.
 */
class EncodingException : public VlessException {
public:
    explicit EncodingException(const std::string& message)
        : VlessException(message, Error::DomainNotUtf8) {}
};

#endif // !VLESS_NO_EXCEPTIONS

} // namespace vless

#endif // VLESS_ERROR_HPP
