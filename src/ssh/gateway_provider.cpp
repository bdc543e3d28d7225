#include "gateway_provider.hpp"
#include "channel_stream.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <boost/asio/post.hpp>
#include <fmt/format.h>

using StreamResult = Result<std::shared_ptr<DuplexStream>>;

SshGatewayStreamProvider::SshGatewayStreamProvider(boost::asio::io_context& io,
                                                   GatewayConfig gateway,
                                                   std::string host_template,
                                                   std::chrono::seconds timeout)
    : io_(io),
      gateway_(std::move(gateway)),
      host_template_(std::move(host_template)),
      timeout_(timeout),
      alive_(std::make_shared<bool>(true)) {}

SshGatewayStreamProvider::~SshGatewayStreamProvider() {
    alive_.reset();
    close();
}

std::string SshGatewayStreamProvider::name() const {
    return fmt::format("ssh-gateway {}@{}:{}", gateway_.user, gateway_.host, gateway_.port);
}

void SshGatewayStreamProvider::async_open(const std::string& pod_name,
                                          const std::string& pod_namespace,
                                          uint16_t remote_port, OpenHandler handler) {
    auto host = render_host_template(host_template_, pod_name, pod_namespace);
    if (host.is_err()) {
        boost::asio::post(io_, [handler, error = host.error]() { handler(StreamResult::Err(error)); });
        return;
    }

    PendingOpen open{host.value, remote_port, std::move(handler)};
    if (session_ && session_->connected()) {
        open_channel(std::move(open));
        return;
    }

    queued_.push_back(std::move(open));
    if (!connecting_) connect();
}

void SshGatewayStreamProvider::connect() {
    SshTarget target;
    target.host = gateway_.host;
    target.port = gateway_.port;
    target.user = gateway_.user;
    target.private_key_path = gateway_.private_key_path;
    target.password = gateway_.password;
    target.timeout_secs = static_cast<int>(timeout_.count());

    connecting_ = true;
    session_ = SshSession::create(io_, target);
    log_info(fmt::format("Connecting to SSH gateway {}", target.describe()));

    std::weak_ptr<bool> alive = alive_;
    SshSession* attempt = session_.get();
    session_->async_connect([this, alive, attempt](Result<void> result) {
        // Ignore a stale attempt that close() already gave up on.
        if (alive.expired() || session_.get() != attempt) return;
        on_connected(std::move(result));
    });
}

void SshGatewayStreamProvider::on_connected(Result<void> result) {
    connecting_ = false;
    auto queued = std::move(queued_);
    queued_.clear();

    if (result.is_err()) {
        log_warn(fmt::format("SSH gateway {}: {}", gateway_.host, result.error));
        session_.reset();
        for (auto& open : queued) {
            open.handler(StreamResult::Err(fmt::format("gateway {}: {}", gateway_.host, result.error)));
        }
        return;
    }

    for (auto& open : queued) open_channel(std::move(open));
}

void SshGatewayStreamProvider::open_channel(PendingOpen open) {
    auto session = session_;
    std::string description = fmt::format("ssh:{}->{}:{}", gateway_.host, open.host, open.port);
    auto handler = std::move(open.handler);

    session->async_direct_tcpip(open.host, open.port,
        [session, description, handler](Result<LIBSSH2_CHANNEL*> channel) {
            if (channel.is_err()) {
                handler(StreamResult::Err(channel.error));
                return;
            }
            auto stream = std::make_shared<SshChannelStream>(session, channel.value, description);
            handler(StreamResult::Ok(stream));
        });
}

void SshGatewayStreamProvider::close() {
    auto queued = std::move(queued_);
    queued_.clear();
    for (auto& open : queued) {
        auto handler = std::move(open.handler);
        boost::asio::post(io_, [handler]() {
            handler(StreamResult::Err("SSH gateway provider closed"));
        });
    }

    if (session_) {
        session_->close("provider closed");
        session_.reset();
    }
    connecting_ = false;
}
