#include "forward_spec.hpp"
#include <fmt/format.h>

using boost::asio::ip::tcp;

std::string endpoint_string(const tcp::endpoint& endpoint) {
    return format_host_port(endpoint.address().to_string(), endpoint.port());
}

Result<ForwardSpec> ForwardSpec::from_mapping(const PortMapping& mapping,
                                              const std::string& pod_name,
                                              const std::string& pod_namespace) {
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(mapping.address, ec);
    if (ec) {
        return Result<ForwardSpec>::Err(fmt::format("Invalid IP address '{}'", mapping.address));
    }

    ForwardSpec spec;
    spec.pod_name = pod_name;
    spec.pod_namespace = pod_namespace;
    spec.remote_port = mapping.container_port;
    spec.local_bind_address = tcp::endpoint(address, mapping.local_port);
    return Result<ForwardSpec>::Ok(spec);
}

std::string ForwardSpec::target() const {
    return fmt::format("{}:{}", pod_name, remote_port);
}

std::string ForwardSpec::task_name() const {
    return fmt::format("forwarder-{}/{}", endpoint_string(local_bind_address), target());
}
