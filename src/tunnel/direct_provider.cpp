#include "direct_provider.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <fmt/format.h>

using boost::asio::ip::tcp;

namespace {

using StreamResult = Result<std::shared_ptr<DuplexStream>>;

// Resolve + connect raced against a timeout. Exactly one finish() wins.
class DialOperation : public std::enable_shared_from_this<DialOperation> {
public:
    DialOperation(boost::asio::io_context& io, std::string host, uint16_t port,
                  RemoteStreamProvider::OpenHandler handler)
        : resolver_(io), socket_(io), timer_(io),
          host_(std::move(host)), port_(port), handler_(std::move(handler)) {}

    void start(std::chrono::seconds timeout) {
        auto self = shared_from_this();

        timer_.expires_after(timeout);
        timer_.async_wait([self, timeout](const boost::system::error_code& ec) {
            if (ec) return;
            self->finish(StreamResult::Err(fmt::format(
                "timed out after {}s connecting to {}:{}", timeout.count(), self->host_, self->port_)));
        });

        resolver_.async_resolve(host_, std::to_string(port_),
            [self](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                if (self->done_) return;
                if (ec) {
                    self->finish(StreamResult::Err(fmt::format(
                        "cannot resolve {}: {}", self->host_, ec.message())));
                    return;
                }
                boost::asio::async_connect(self->socket_, results,
                    [self](const boost::system::error_code& ec, const tcp::endpoint&) {
                        if (self->done_) return;
                        if (ec) {
                            self->finish(StreamResult::Err(fmt::format(
                                "cannot connect to {}:{}: {}", self->host_, self->port_, ec.message())));
                            return;
                        }
                        boost::system::error_code opt_ec;
                        self->socket_.set_option(tcp::no_delay(true), opt_ec);
                        auto stream = std::make_shared<TcpDuplexStream>(std::move(self->socket_));
                        self->finish(StreamResult::Ok(stream));
                    });
            });
    }

private:
    void finish(StreamResult result) {
        if (done_) return;
        done_ = true;
        timer_.cancel();
        resolver_.cancel();
        if (result.is_err()) {
            boost::system::error_code ec;
            socket_.close(ec);
        }
        auto handler = std::move(handler_);
        handler(std::move(result));
    }

    tcp::resolver resolver_;
    tcp::socket socket_;
    boost::asio::steady_timer timer_;
    std::string host_;
    uint16_t port_;
    RemoteStreamProvider::OpenHandler handler_;
    bool done_ = false;
};

} // namespace

DirectStreamProvider::DirectStreamProvider(boost::asio::io_context& io, std::string host_template,
                                           std::chrono::seconds timeout)
    : io_(io), host_template_(std::move(host_template)), timeout_(timeout) {}

void DirectStreamProvider::async_open(const std::string& pod_name,
                                      const std::string& pod_namespace,
                                      uint16_t remote_port, OpenHandler handler) {
    auto host = render_host_template(host_template_, pod_name, pod_namespace);
    if (host.is_err()) {
        boost::asio::post(io_, [handler, error = host.error]() {
            handler(StreamResult::Err(error));
        });
        return;
    }

    log_debug(fmt::format("DirectStreamProvider: dialing {}:{} for {}/{}",
                          host.value, remote_port, pod_namespace, pod_name));
    auto op = std::make_shared<DialOperation>(io_, host.value, remote_port, std::move(handler));
    op->start(timeout_);
}
