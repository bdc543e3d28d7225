#include <gtest/gtest.h>
#include <tunnel/direct_provider.hpp>
#include <core/utils.hpp>
#include <optional>

using boost::asio::ip::tcp;
using namespace std::chrono_literals;

using StreamResult = Result<std::shared_ptr<DuplexStream>>;

TEST(DirectProvider, DialsRenderedHost) {
    boost::asio::io_context io;
    tcp::acceptor acceptor(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    uint16_t port = acceptor.local_endpoint().port();

    tcp::socket server(io);
    bool accepted = false;
    acceptor.async_accept(server, [&accepted](const boost::system::error_code& ec) {
        accepted = !ec;
    });

    DirectStreamProvider provider(io, "127.0.0.1", 5s);
    std::optional<StreamResult> got;
    provider.async_open("web", "default", port, [&got](StreamResult r) { got = r; });
    io.run();

    ASSERT_TRUE(got.has_value());
    ASSERT_TRUE(got->is_ok()) << got->error;
    EXPECT_TRUE(accepted);
    EXPECT_NE(got->value->describe().find("tcp:127.0.0.1:"), std::string::npos);
    got->value->close();
}

TEST(DirectProvider, RefusedConnectionIsAnError) {
    boost::asio::io_context io;
    uint16_t port = 0;
    {
        // Grab a free port, then release it.
        tcp::acceptor scratch(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        port = scratch.local_endpoint().port();
    }

    DirectStreamProvider provider(io, "127.0.0.1", 5s);
    std::optional<StreamResult> got;
    provider.async_open("web", "default", port, [&got](StreamResult r) { got = r; });
    io.run();

    ASSERT_TRUE(got.has_value());
    ASSERT_TRUE(got->is_err());
    EXPECT_NE(got->error.find("cannot connect to 127.0.0.1"), std::string::npos);
}

TEST(DirectProvider, BadTemplateFailsWithoutDialing) {
    boost::asio::io_context io;
    DirectStreamProvider provider(io, "{pod}.{cluster}", 5s);
    std::optional<StreamResult> got;
    provider.async_open("web", "default", 80, [&got](StreamResult r) { got = r; });
    EXPECT_FALSE(got.has_value());
    io.run();

    ASSERT_TRUE(got.has_value());
    ASSERT_TRUE(got->is_err());
    EXPECT_NE(got->error.find("invalid host template"), std::string::npos);
}

TEST(HostTemplate, Render) {
    auto r = render_host_template("{pod}.{namespace}.svc", "web-0", "prod");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "web-0.prod.svc");

    auto fixed = render_host_template("10.0.0.5", "web-0", "prod");
    ASSERT_TRUE(fixed.is_ok());
    EXPECT_EQ(fixed.value, "10.0.0.5");
}

TEST(HostTemplate, Errors) {
    EXPECT_TRUE(render_host_template("{pod", "a", "b").is_err());
    EXPECT_TRUE(render_host_template("{node}", "a", "b").is_err());
    EXPECT_TRUE(render_host_template("", "a", "b").is_err());
}
