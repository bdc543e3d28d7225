#pragma once

#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>
#include <core/types.hpp>
#include <tunnel/remote_stream_provider.hpp>
#include "ssh_session.hpp"

// Opens pod streams as direct-tcpip channels through one SSH gateway.
//
// The gateway session is connected lazily on the first open. Opens that
// arrive while it is connecting are queued; a failed connect fails all of
// them and the next open starts over. A session that drops is replaced the
// same way.
class SshGatewayStreamProvider : public RemoteStreamProvider {
public:
    SshGatewayStreamProvider(boost::asio::io_context& io, GatewayConfig gateway,
                             std::string host_template, std::chrono::seconds timeout);
    ~SshGatewayStreamProvider() override;

    void async_open(const std::string& pod_name, const std::string& pod_namespace,
                    uint16_t remote_port, OpenHandler handler) override;

    std::string name() const override;

    // Disconnects the gateway session; queued opens fail.
    void close();

private:
    struct PendingOpen {
        std::string host;
        uint16_t port;
        OpenHandler handler;
    };

    void connect();
    void on_connected(Result<void> result);
    void open_channel(PendingOpen open);

    boost::asio::io_context& io_;
    GatewayConfig gateway_;
    std::string host_template_;
    std::chrono::seconds timeout_;

    std::shared_ptr<SshSession> session_;
    bool connecting_ = false;
    std::deque<PendingOpen> queued_;
    std::shared_ptr<bool> alive_;
};
