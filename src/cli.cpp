/**
 * @file cli.cpp
 * @brief VLESS header decoder command line interface.
 *
 * Decodes the request header of a captured frame and prints it as the
 * JSON record a relay front end consumes.
 */

#include <vless/vless.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

using namespace vless;

static void print_version() {
    std::printf("vless-decode %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("VLESS Request Header Decoder (v%s C++)\n", version());
    std::printf("======================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s <frame.bin>\n", prog_name);
    std::printf("  %s -x <hex>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -x             Read the frame from a hex string argument\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Output:\n");
    std::printf("  JSON header record on stdout, payload offset on stderr\n\n");
    std::printf("Examples:\n");
    std::printf("  %s request.bin\n", prog_name);
    std::printf("  %s -x 00<32 hex uuid>0001005001c0a80001\n\n", prog_name);
}

static std::vector<std::uint8_t> read_file(const std::string& path, bool& ok) {
    ok = false;
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return {};
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        return {};
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return {};
    }

    ok = true;
    return buffer;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

static bool parse_hex(const char* text, std::vector<std::uint8_t>& out) {
    std::size_t len = std::strlen(text);
    if ((len % 2) != 0) {
        return false;
    }

    out.clear();
    out.reserve(len / 2);
    for (std::size_t i = 0; i < len; i += 2) {
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return true;
}

static int do_decode(const std::vector<std::uint8_t>& frame) {
    HeaderDecoder decoder;
    DecodedHeader header;

    Error result = decoder.decode(frame.data(), frame.size(), header);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s (code %d, offset %zu)\n", error_string(result),
                     static_cast<int>(result), decoder.error_offset());
        return 1;
    }

    std::printf("%s\n", to_json(header).c_str());
    std::fprintf(stderr, "Header:      %zu bytes (%s, %s)\n", header.payload_offset,
                 command_name(header.command), address_type_name(header.address_type));
    std::fprintf(stderr, "Payload:     %zu bytes\n", frame.size() - header.payload_offset);

    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    std::vector<std::uint8_t> frame;

    if (std::strcmp(argv[1], "-x") == 0) {
        // Hex mode: -x <hex>
        if (argc != 3) {
            std::fprintf(stderr, "Error: -x requires 1 argument\n");
            std::fprintf(stderr, "Usage: %s -x <hex>\n", argv[0]);
            return 1;
        }
        if (!parse_hex(argv[2], frame)) {
            std::fprintf(stderr, "Error: Invalid hex string\n");
            return 1;
        }
    } else {
        if (argc != 2) {
            std::fprintf(stderr, "Error: Expected a single input file\n");
            std::fprintf(stderr, "Usage: %s <frame.bin>\n", argv[0]);
            return 1;
        }
        bool ok = false;
        frame = read_file(argv[1], ok);
        if (!ok) {
            std::fprintf(stderr, "Error: Cannot read input file: %s\n", argv[1]);
            return 1;
        }
    }

    return do_decode(frame);
}
