#pragma once

#include <chrono>
#include <string>
#include <boost/asio/io_context.hpp>
#include "remote_stream_provider.hpp"

// Dials <host_template rendered for the pod>:<remote_port> over plain TCP.
// Usable when the pod network is routable from this machine.
class DirectStreamProvider : public RemoteStreamProvider {
public:
    DirectStreamProvider(boost::asio::io_context& io, std::string host_template,
                         std::chrono::seconds timeout);

    void async_open(const std::string& pod_name, const std::string& pod_namespace,
                    uint16_t remote_port, OpenHandler handler) override;

    std::string name() const override { return "direct"; }

private:
    boost::asio::io_context& io_;
    std::string host_template_;
    std::chrono::seconds timeout_;
};
