#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio/ip/tcp.hpp>
#include "cancel_signal.hpp"
#include "duplex_stream.hpp"
#include "forward_spec.hpp"
#include "remote_stream_provider.hpp"
#include "supervisor.hpp"

// Copies bytes between one accepted local connection and one remote stream.
//
// Opens the remote stream first; if that fails the local side is closed
// untouched and the outcome is RemoteStreamUnavailable. Both directions then
// run independently with their own buffer. End-of-stream on one side
// half-closes the other; the bridge finishes once both directions are done,
// on the first hard error, or on cancellation. Peer resets count as a normal
// end. Both streams are closed on every exit path.
class ConnectionBridge : public std::enable_shared_from_this<ConnectionBridge> {
public:
    ConnectionBridge(std::shared_ptr<DuplexStream> local,
                     boost::asio::ip::tcp::endpoint peer,
                     ForwardSpec spec,
                     std::shared_ptr<RemoteStreamProvider> provider,
                     CancelToken token,
                     OutcomeHandler done);

    // Supervisor task body for one connection.
    static TaskFn task(std::shared_ptr<DuplexStream> local,
                       boost::asio::ip::tcp::endpoint peer,
                       ForwardSpec spec,
                       std::shared_ptr<RemoteStreamProvider> provider);

    void start();

private:
    struct Direction {
        const char* label;
        std::shared_ptr<DuplexStream> from;
        std::shared_ptr<DuplexStream> to;
        std::vector<char> buffer;
        std::uint64_t total = 0;
        bool done = false;
    };

    void on_remote_opened(Result<std::shared_ptr<DuplexStream>> result);
    void pump(Direction& dir);
    void write_all(Direction& dir, std::size_t offset, std::size_t length);
    void on_io_error(Direction& dir, const boost::system::error_code& ec);
    void finish(TaskOutcome outcome);

    std::shared_ptr<DuplexStream> local_;
    std::shared_ptr<DuplexStream> remote_;
    boost::asio::ip::tcp::endpoint peer_;
    ForwardSpec spec_;
    std::shared_ptr<RemoteStreamProvider> provider_;
    CancelToken token_;
    OutcomeHandler done_;
    CancelSignal::SubscriptionId cancel_subscription_ = 0;

    Direction upstream_;    // local -> remote
    Direction downstream_;  // remote -> local
    bool finished_ = false;
};
