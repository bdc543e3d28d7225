#pragma once

#include <cstdint>
#include <string>
#include "types.hpp"

// A container port exposed on a local address:port.
//
// Text form: ADDRESS:LOCAL_PORT:CONTAINER_PORT   ("127.0.0.1:7070:8080", "::1:7070:8080")
struct PortMapping {
    uint16_t container_port = 0;
    uint16_t local_port = 0;
    std::string address;                         // numeric IPv4 or IPv6, no brackets

    bool operator==(const PortMapping& other) const {
        return container_port == other.container_port &&
               local_port == other.local_port &&
               address == other.address;
    }

    std::string to_string() const;

    static Result<PortMapping> parse(const std::string& input);
};

// "host:port" with brackets around IPv6 hosts.
std::string format_host_port(const std::string& address, uint16_t port);

// Parses a decimal u16; false on anything else (sign, overflow, trailing junk).
bool parse_port(const std::string& text, uint16_t& out);
