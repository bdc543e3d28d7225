#pragma once

#include <cstdint>
#include <string>
#include <boost/asio/ip/tcp.hpp>
#include <core/types.hpp>
#include <core/port_mapping.hpp>

// One forwarded port: local bind address -> pod:remote_port.
// Immutable once its listener starts.
struct ForwardSpec {
    std::string pod_name;
    std::string pod_namespace;
    uint16_t remote_port = 0;
    boost::asio::ip::tcp::endpoint local_bind_address;

    static Result<ForwardSpec> from_mapping(const PortMapping& mapping,
                                            const std::string& pod_name,
                                            const std::string& pod_namespace);

    // "pod:port"
    std::string target() const;

    // "forwarder-<local>/<pod>:<port>"
    std::string task_name() const;
};

// "127.0.0.1:8080" / "[::1]:8080"
std::string endpoint_string(const boost::asio::ip::tcp::endpoint& endpoint);
