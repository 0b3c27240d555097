#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <cstdint>

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/io_context.hpp>

#include "config.h"
#include "protocol.h"
#include "context_pool.h"
#include "socks_server.h"
#include "authenticator.h"
#include "test_util.h"

namespace socks5d
{

namespace
{

using ::testing::ElementsAre;

std::shared_ptr<const authenticator> default_authenticator() { return std::make_shared<const authenticator>(credentials{}); }

}    // namespace

class socks_server_test : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        boost::system::error_code ec;
        pool_ = std::make_unique<io_context_pool>(1, ec);
        ASSERT_FALSE(ec);
    }

    void TearDown() override
    {
        if (server_ != nullptr)
        {
            server_->stop();
        }
        pool_->shutdown();
        if (runner_.joinable())
        {
            runner_.join();
        }
    }

    void start_server(const std::string& host)
    {
        config::socks_t socks_cfg;
        socks_cfg.host = host;
        socks_cfg.port = 0;
        server_ = std::make_shared<socks_server>(*pool_, socks_cfg, default_authenticator());
        server_->start();
        runner_ = std::thread([this] { pool_->run(); });
    }

    socks_server& server() { return *server_; }

    boost::asio::ip::tcp::socket connect_client()
    {
        boost::asio::ip::tcp::socket socket(client_io_);
        boost::system::error_code ec;
        socket.connect({boost::asio::ip::make_address("127.0.0.1"), server_->listen_port()}, ec);
        EXPECT_FALSE(ec) << ec.message();
        return socket;
    }

    boost::asio::io_context& client_io() { return client_io_; }

   private:
    std::unique_ptr<io_context_pool> pool_;
    std::shared_ptr<socks_server> server_;
    std::thread runner_;
    boost::asio::io_context client_io_;
};

TEST_F(socks_server_test, BindsEphemeralPort)
{
    start_server("127.0.0.1");
    EXPECT_TRUE(server().running());
    EXPECT_NE(server().listen_port(), 0);
}

TEST_F(socks_server_test, InvalidHostDoesNotStart)
{
    start_server("not-an-address");
    EXPECT_FALSE(server().running());
}

TEST_F(socks_server_test, ProxiesAuthenticatedConnect)
{
    boost::asio::ip::tcp::acceptor destination(client_io());
    ASSERT_TRUE(test::open_ephemeral_tcp_acceptor(destination));
    const auto dest_port = destination.local_endpoint().port();

    start_server("127.0.0.1");
    ASSERT_TRUE(server().running());

    auto client = connect_client();
    test::write_bytes(client, socks_codec::encode_greeting({socks::kMethodNoAuth, socks::kMethodPassword}));
    EXPECT_THAT(test::read_bytes(client, 2), ElementsAre(0x05, 0x02));
    test::write_bytes(client, socks_codec::encode_auth_request("user", "password"));
    EXPECT_THAT(test::read_bytes(client, 2), ElementsAre(0x01, 0x00));

    socks_address target;
    target.value = boost::asio::ip::make_address_v4("127.0.0.1");
    test::write_bytes(client, socks_codec::encode_request(socks::kCmdConnect, target, dest_port));

    boost::asio::ip::tcp::socket peer(client_io());
    destination.accept(peer);
    const auto reply = test::read_bytes(client, 10);
    ASSERT_EQ(reply.size(), 10U);
    EXPECT_EQ(reply[1], 0x00);
    EXPECT_EQ(server().live_sessions(), 1U);

    const std::vector<std::uint8_t> payload = {'G', 'E', 'T'};
    test::write_bytes(client, payload);
    EXPECT_EQ(test::read_bytes(peer, 3), payload);
    test::write_bytes(peer, {'O', 'K'});
    EXPECT_THAT(test::read_bytes(client, 2), ElementsAre('O', 'K'));
}

TEST_F(socks_server_test, StopClosesLiveSessions)
{
    start_server("127.0.0.1");
    ASSERT_TRUE(server().running());

    auto client = connect_client();
    test::write_bytes(client, {0x05, 0x01, 0x00});
    EXPECT_THAT(test::read_bytes(client, 2), ElementsAre(0x05, 0x00));

    server().stop();
    EXPECT_TRUE(test::read_until_eof(client).empty());
    EXPECT_FALSE(server().running());
}

TEST_F(socks_server_test, SessionsAreIndependent)
{
    start_server("127.0.0.1");
    ASSERT_TRUE(server().running());

    auto bad = connect_client();
    auto good = connect_client();

    test::write_bytes(bad, {0x04, 0x01});
    EXPECT_TRUE(test::read_until_eof(bad).empty());

    test::write_bytes(good, {0x05, 0x01, 0x00});
    EXPECT_THAT(test::read_bytes(good, 2), ElementsAre(0x05, 0x00));
    EXPECT_TRUE(server().running());
}

}    // namespace socks5d
