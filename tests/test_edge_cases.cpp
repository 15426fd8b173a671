/**
 * @file test_edge_cases.cpp
 * @brief Boundary and truncation tests for request header decoding.
 *
 * Every prefix of a well-formed frame must fail with the error naming the
 * field the prefix stops in.
 */

#include <catch2/catch_message.hpp>
#include <catch2/catch_test_macros.hpp>
#include <vless/vless.hpp>

#include "frame_builder.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using namespace vless;
using vless_test::FrameBuilder;

// ============================================================================
// Minimum Size Gate
// ============================================================================

TEST_CASE("Buffers below the minimum size", "[edge][size]") {
    FrameBuilder fb;
    auto frame = fb.build();
    REQUIRE(frame.size() >= MIN_HEADER_SIZE);

    SECTION("every short prefix") {
        for (std::size_t n = 0; n < MIN_HEADER_SIZE; ++n) {
            // Exact-size heap copy so a read past the end is caught by sanitizers
            std::unique_ptr<std::uint8_t[]> copy(new std::uint8_t[n == 0 ? 1 : n]);
            std::copy(frame.begin(), frame.begin() + static_cast<std::ptrdiff_t>(n), copy.get());

            DecodedHeader header;
            REQUIRE(decode_header(copy.get(), n, header) == Error::BufferTooSmall);
        }
    }

    SECTION("null buffer") {
        DecodedHeader header;
        REQUIRE(decode_header(nullptr, 0, header) == Error::BufferTooSmall);
    }

    SECTION("exactly the minimum size is decoded") {
        // 18 + 1 + 2 + 1 + 1 + 1 = 24: empty domain plus one payload byte
        FrameBuilder small;
        small.domain("");
        small.payload = {0x00};
        auto bytes = small.build();
        REQUIRE(bytes.size() == MIN_HEADER_SIZE);

        DecodedHeader header;
        REQUIRE(decode_header(bytes.data(), bytes.size(), header) == Error::Ok);
        REQUIRE(header.payload_offset == 23);
    }
}

// ============================================================================
// Truncation At Each Field
// ============================================================================

namespace {

// Error expected when a frame is cut to @p length bytes
Error expected_for_prefix(const FrameBuilder& fb, std::size_t length) {
    const std::size_t command = fb.command_offset();
    const std::size_t port = command + 1;
    const std::size_t type = port + 2;
    const std::size_t address = type + 1;

    if (length < MIN_HEADER_SIZE) {
        return Error::BufferTooSmall;
    }
    if (length <= command) {
        return Error::InvalidCommandIndex;
    }
    if (length < type) {
        return Error::MissingPort;
    }
    if (length == type) {
        return Error::MissingAddressType;
    }
    switch (fb.address_type) {
    case 1:
        return Error::Ipv4Truncated;
    case 2:
        return (length == address) ? Error::DomainLengthMissing : Error::DomainTruncated;
    default:
        return Error::Ipv6Truncated;
    }
}

void check_every_prefix(const FrameBuilder& fb) {
    auto frame = fb.build();

    for (std::size_t n = 0; n < frame.size(); ++n) {
        std::unique_ptr<std::uint8_t[]> copy(new std::uint8_t[n == 0 ? 1 : n]);
        std::copy(frame.begin(), frame.begin() + static_cast<std::ptrdiff_t>(n), copy.get());

        DecodedHeader header;
        Error result = decode_header(copy.get(), n, header);
        INFO("prefix length " << n);
        REQUIRE(result == expected_for_prefix(fb, n));
        REQUIRE(is_truncation(result));
    }

    DecodedHeader header;
    REQUIRE(decode_header(frame.data(), frame.size(), header) == Error::Ok);
}

} // namespace

TEST_CASE("Truncated IPv4 frame", "[edge][truncation]") {
    FrameBuilder fb;
    fb.addon_bytes(10);
    check_every_prefix(fb);
}

TEST_CASE("Truncated domain frame", "[edge][truncation]") {
    FrameBuilder fb;
    fb.addon_bytes(10);
    fb.domain("example.com");
    check_every_prefix(fb);
}

TEST_CASE("Truncated IPv6 frame", "[edge][truncation]") {
    FrameBuilder fb;
    fb.addon_bytes(10);
    fb.ipv6({0x20, 0x01, 0x0d, 0xb8, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1});
    check_every_prefix(fb);
}

TEST_CASE("Addon length beyond buffer", "[edge][truncation]") {
    FrameBuilder fb;
    auto frame = fb.build();
    frame[ADDON_LENGTH_OFFSET] = 0xFF;

    DecodedHeader header;
    REQUIRE(decode_header(frame.data(), frame.size(), header) == Error::InvalidCommandIndex);
}

TEST_CASE("Addons ending exactly at the buffer end", "[edge][truncation]") {
    // Addons fill the rest of the buffer; the command byte is missing
    std::vector<std::uint8_t> frame(30, 0x00);
    frame[ADDON_LENGTH_OFFSET] = static_cast<std::uint8_t>(30 - 18);

    DecodedHeader header;
    REQUIRE(decode_header(frame.data(), frame.size(), header) == Error::InvalidCommandIndex);

    frame.push_back(0x01);
    REQUIRE(decode_header(frame.data(), frame.size(), header) == Error::MissingPort);
}

// ============================================================================
// Field Precedence
// ============================================================================

TEST_CASE("Errors are reported in field order", "[edge]") {
    SECTION("bad command before bad address type") {
        FrameBuilder fb;
        fb.command = 3;
        fb.address_type = 4;
        DecodedHeader header;
        auto frame = fb.build();
        REQUIRE(decode_header(frame.data(), frame.size(), header) == Error::UnsupportedCommand);
    }

    SECTION("bad address type before missing address bytes") {
        FrameBuilder fb;
        fb.address_type = 9;
        fb.address.clear();
        fb.payload = {0, 0};
        DecodedHeader header;
        auto frame = fb.build();
        REQUIRE(decode_header(frame.data(), frame.size(), header) == Error::InvalidAddressType);
    }

    SECTION("bounds before UTF-8") {
        FrameBuilder fb;
        fb.addon_bytes(4);
        fb.domain("\xFF\xFF\xFF\xFF");
        auto frame = fb.build();
        frame.pop_back();
        DecodedHeader header;
        REQUIRE(decode_header(frame.data(), frame.size(), header) == Error::DomainTruncated);
    }
}

TEST_CASE("Maximum length domain", "[edge]") {
    FrameBuilder fb;
    fb.domain(std::string(255, 'a'));
    fb.addon_bytes(255);
    auto frame = fb.build();

    DecodedHeader header;
    REQUIRE(decode_header(frame.data(), frame.size(), header) == Error::Ok);
    REQUIRE(header.address.size() == 255);
    REQUIRE(header.payload_offset == frame.size());
}
