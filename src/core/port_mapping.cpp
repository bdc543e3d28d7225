#include "port_mapping.hpp"
#include <boost/asio/ip/address.hpp>
#include <fmt/format.h>
#include <cctype>

namespace {

// Numeric address only; hostnames are rejected. Brackets are stripped.
bool normalize_address(std::string text, std::string& out) {
    if (text.size() >= 2 && text.front() == '[' && text.back() == ']')
        text = text.substr(1, text.size() - 2);
    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address(text, ec);
    if (ec) return false;
    out = addr.to_string();
    return true;
}

} // namespace

bool parse_port(const std::string& text, uint16_t& out) {
    if (text.empty() || text.size() > 5) return false;
    unsigned value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + static_cast<unsigned>(c - '0');
    }
    if (value > 65535) return false;
    out = static_cast<uint16_t>(value);
    return true;
}

std::string format_host_port(const std::string& address, uint16_t port) {
    if (address.find(':') != std::string::npos)
        return fmt::format("[{}]:{}", address, port);
    return fmt::format("{}:{}", address, port);
}

std::string PortMapping::to_string() const {
    return fmt::format("{}:{}", format_host_port(address, local_port), container_port);
}

Result<PortMapping> PortMapping::parse(const std::string& input) {
    // Split from the right so IPv6 colons stay in the address part.
    auto last = input.rfind(':');
    if (last == std::string::npos || last == 0) {
        return Result<PortMapping>::Err(fmt::format(
            "Invalid format: expected 'ADDRESS:LOCAL_PORT:CONTAINER_PORT', got '{}'", input));
    }
    auto middle = input.rfind(':', last - 1);
    if (middle == std::string::npos) {
        return Result<PortMapping>::Err(fmt::format(
            "Invalid format: expected 'ADDRESS:LOCAL_PORT:CONTAINER_PORT', got '{}'", input));
    }

    std::string address_part = input.substr(0, middle);
    std::string local_part = input.substr(middle + 1, last - middle - 1);
    std::string container_part = input.substr(last + 1);

    PortMapping mapping;
    if (!parse_port(container_part, mapping.container_port)) {
        return Result<PortMapping>::Err(fmt::format("Invalid port value '{}'", container_part));
    }
    if (!parse_port(local_part, mapping.local_port)) {
        return Result<PortMapping>::Err(fmt::format("Invalid port value '{}'", local_part));
    }
    if (!normalize_address(address_part, mapping.address)) {
        return Result<PortMapping>::Err(fmt::format("Invalid IP address '{}'", address_part));
    }
    return Result<PortMapping>::Ok(mapping);
}
