#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <cstdint>
#include <optional>
#include <algorithm>

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <boost/asio/post.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/asio/executor_work_guard.hpp>

#include "protocol.h"
#include "statistics.h"
#include "socks_error.h"
#include "socks_session.h"
#include "authenticator.h"
#include "test_util.h"

namespace socks5d
{

namespace
{

using ::testing::ElementsAre;

std::vector<std::uint8_t> bytes_of(const std::string& text) { return {text.begin(), text.end()}; }

std::vector<std::uint8_t> ipv4_request(const std::uint8_t cmd, const std::uint16_t port)
{
    return {0x05, cmd, 0x00, 0x01, 127, 0, 0, 1, static_cast<std::uint8_t>(port >> 8), static_cast<std::uint8_t>(port & 0xFF)};
}

std::vector<std::uint8_t> domain_request(const std::string& host, const std::uint16_t port)
{
    std::vector<std::uint8_t> out = {0x05, 0x01, 0x00, 0x03, static_cast<std::uint8_t>(host.size())};
    out.insert(out.end(), host.begin(), host.end());
    out.push_back(static_cast<std::uint8_t>(port >> 8));
    out.push_back(static_cast<std::uint8_t>(port & 0xFF));
    return out;
}

}    // namespace

class socks_session_test : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        ASSERT_TRUE(test::open_ephemeral_tcp_acceptor(destination_));
        pair_.emplace(test::make_tcp_socket_pair(io_ctx_));
        ASSERT_TRUE(pair_->client.is_open());
        runner_ = std::thread([this] { io_ctx_.run(); });
    }

    void TearDown() override
    {
        boost::system::error_code ec;
        if (pair_.has_value())
        {
            app().close(ec);
        }
        if (session_ != nullptr)
        {
            session_->stop();
        }
        if (pending_.valid())
        {
            (void)pending_.wait_for(std::chrono::seconds(5));
        }
        work_.reset();
        if (runner_.joinable())
        {
            runner_.join();
        }
    }

    // Client application end of the proxied connection.
    boost::asio::ip::tcp::socket& app() { return pair_->client; }

    std::uint16_t destination_port() const { return destination_.local_endpoint().port(); }

    boost::asio::ip::tcp::socket accept_destination()
    {
        boost::asio::ip::tcp::socket peer(io_ctx_);
        boost::system::error_code ec;
        destination_.accept(peer, ec);
        EXPECT_FALSE(ec) << ec.message();
        return peer;
    }

    void start_session(const bool auth_enabled = true)
    {
        std::shared_ptr<const authenticator> auth;
        if (auth_enabled)
        {
            auth = std::make_shared<const authenticator>(credentials{.username = "user", .password = "password"});
        }
        session_ = std::make_shared<socks_session>(std::move(pair_->server), auth, 1);
        pending_ = boost::asio::co_spawn(io_ctx_, session_->run(), boost::asio::use_future);
    }

    boost::system::error_code finish()
    {
        if (pending_.wait_for(std::chrono::seconds(5)) != std::future_status::ready)
        {
            ADD_FAILURE() << "session did not finish";
            return boost::asio::error::timed_out;
        }
        return pending_.get();
    }

    void handshake_no_auth()
    {
        test::write_bytes(app(), {0x05, 0x01, 0x00});
        EXPECT_THAT(test::read_bytes(app(), 2), ElementsAre(0x05, 0x00));
    }

    void handshake_password(const std::string& user, const std::string& pass)
    {
        test::write_bytes(app(), {0x05, 0x01, 0x02});
        EXPECT_THAT(test::read_bytes(app(), 2), ElementsAre(0x05, 0x02));
        test::write_bytes(app(), socks_codec::encode_auth_request(user, pass));
    }

    void shutdown_send(boost::asio::ip::tcp::socket& socket)
    {
        boost::system::error_code ec;
        socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
        EXPECT_FALSE(ec) << ec.message();
    }

    const std::shared_ptr<socks_session>& session() const { return session_; }
    boost::asio::io_context& io_context() { return io_ctx_; }

   private:
    boost::asio::io_context io_ctx_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_ = boost::asio::make_work_guard(io_ctx_);
    boost::asio::ip::tcp::acceptor destination_{io_ctx_};
    std::optional<test::tcp_socket_pair> pair_;
    std::thread runner_;
    std::shared_ptr<socks_session> session_;
    std::future<boost::system::error_code> pending_;
};

TEST_F(socks_session_test, NoAuthConnectRelaysUntilBothSidesClose)
{
    start_session();
    EXPECT_EQ(session()->phase(), session_phase::kGreeting);

    handshake_no_auth();
    test::write_bytes(app(), ipv4_request(0x01, destination_port()));
    auto peer = accept_destination();

    const auto reply = test::read_bytes(app(), 10);
    ASSERT_EQ(reply.size(), 10U);
    EXPECT_THAT(std::vector<std::uint8_t>(reply.begin(), reply.begin() + 8), ElementsAre(0x05, 0x00, 0x00, 0x01, 127, 0, 0, 1));
    const auto bound_port = static_cast<std::uint16_t>((reply[8] << 8) | reply[9]);
    EXPECT_EQ(bound_port, peer.remote_endpoint().port());

    test::write_bytes(app(), bytes_of("ping"));
    EXPECT_EQ(test::read_bytes(peer, 4), bytes_of("ping"));
    test::write_bytes(peer, bytes_of("pong!"));
    EXPECT_EQ(test::read_bytes(app(), 5), bytes_of("pong!"));
    EXPECT_EQ(session()->phase(), session_phase::kRelay);

    shutdown_send(app());
    EXPECT_TRUE(test::read_until_eof(peer).empty());
    shutdown_send(peer);
    EXPECT_TRUE(test::read_until_eof(app()).empty());

    EXPECT_FALSE(finish());
    EXPECT_EQ(session()->phase(), session_phase::kClosed);
    EXPECT_EQ(session()->transferred().client_to_remote, 4U);
    EXPECT_EQ(session()->transferred().remote_to_client, 5U);
    EXPECT_EQ(session()->context().tx_bytes, 4U);
    EXPECT_EQ(session()->context().rx_bytes, 5U);
}

TEST_F(socks_session_test, PasswordAuthThenConnect)
{
    start_session();
    handshake_password("user", "password");
    EXPECT_THAT(test::read_bytes(app(), 2), ElementsAre(0x01, 0x00));

    test::write_bytes(app(), ipv4_request(0x01, destination_port()));
    auto peer = accept_destination();
    const auto reply = test::read_bytes(app(), 10);
    ASSERT_EQ(reply.size(), 10U);
    EXPECT_EQ(reply[1], 0x00);

    peer.close();
    shutdown_send(app());
    EXPECT_TRUE(test::read_until_eof(app()).empty());
    EXPECT_FALSE(finish());
}

TEST_F(socks_session_test, PasswordPreferredOverNoAuth)
{
    start_session();
    test::write_bytes(app(), {0x05, 0x02, 0x00, 0x02});
    EXPECT_THAT(test::read_bytes(app(), 2), ElementsAre(0x05, 0x02));

    shutdown_send(app());
    EXPECT_EQ(finish(), boost::asio::error::eof);
}

TEST_F(socks_session_test, WrongPasswordRejected)
{
    const auto failures = statistics::instance().auth_failures();
    start_session();
    handshake_password("user", "wrong");
    EXPECT_THAT(test::read_bytes(app(), 2), ElementsAre(0x01, 0x01));
    EXPECT_TRUE(test::read_until_eof(app()).empty());

    EXPECT_EQ(finish(), make_error_code(errc::kAuthenticationFailed));
    EXPECT_EQ(statistics::instance().auth_failures(), failures + 1);
    EXPECT_EQ(session()->phase(), session_phase::kClosed);
}

TEST_F(socks_session_test, BadAuthVersionRejected)
{
    start_session();
    test::write_bytes(app(), {0x05, 0x01, 0x02});
    EXPECT_THAT(test::read_bytes(app(), 2), ElementsAre(0x05, 0x02));
    test::write_bytes(app(), {0x05, 0x00});
    EXPECT_THAT(test::read_bytes(app(), 2), ElementsAre(0x01, 0x01));

    EXPECT_EQ(finish(), make_error_code(errc::kAuthenticationFailed));
}

TEST_F(socks_session_test, NoAcceptableMethod)
{
    start_session();
    test::write_bytes(app(), {0x05, 0x01, 0x01});
    EXPECT_THAT(test::read_bytes(app(), 2), ElementsAre(0x05, 0xFF));
    EXPECT_TRUE(test::read_until_eof(app()).empty());

    EXPECT_EQ(finish(), make_error_code(errc::kNoAcceptableMethod));
}

TEST_F(socks_session_test, ZeroMethodsIsNoAcceptableMethod)
{
    start_session();
    test::write_bytes(app(), {0x05, 0x00});
    EXPECT_THAT(test::read_bytes(app(), 2), ElementsAre(0x05, 0xFF));
    EXPECT_EQ(finish(), make_error_code(errc::kNoAcceptableMethod));
}

TEST_F(socks_session_test, WrongGreetingVersionClosesWithoutReply)
{
    start_session();
    test::write_bytes(app(), {0x04, 0x01});
    EXPECT_TRUE(test::read_until_eof(app()).empty());
    EXPECT_EQ(finish(), make_error_code(errc::kProtocolVersion));
}

TEST_F(socks_session_test, BindRejectedWithCommandNotSupported)
{
    const auto rejected = statistics::instance().rejected_commands();
    start_session();
    handshake_no_auth();
    test::write_bytes(app(), ipv4_request(0x02, destination_port()));

    EXPECT_THAT(test::read_until_eof(app()), ElementsAre(0x05, 0x07, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00));
    EXPECT_EQ(finish(), make_error_code(errc::kUnsupportedCommand));
    EXPECT_EQ(statistics::instance().rejected_commands(), rejected + 1);
}

TEST_F(socks_session_test, UnknownCommandRejected)
{
    start_session();
    handshake_no_auth();
    test::write_bytes(app(), ipv4_request(0x09, destination_port()));
    EXPECT_THAT(test::read_until_eof(app()), ElementsAre(0x05, 0x07, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00));
    EXPECT_EQ(finish(), make_error_code(errc::kUnsupportedCommand));
}

TEST_F(socks_session_test, MalformedRequestClosesWithoutReply)
{
    start_session();
    handshake_no_auth();
    test::write_bytes(app(), {0x05, 0x01, 0x01, 0x01});
    EXPECT_TRUE(test::read_until_eof(app()).empty());
    EXPECT_EQ(finish(), make_error_code(errc::kMalformedRequest));
}

TEST_F(socks_session_test, UnknownAddressTypeClosesWithoutReply)
{
    start_session();
    handshake_no_auth();
    test::write_bytes(app(), {0x05, 0x01, 0x00, 0x05});
    EXPECT_TRUE(test::read_until_eof(app()).empty());
    EXPECT_EQ(finish(), make_error_code(errc::kUnsupportedAddressType));
}

TEST_F(socks_session_test, ConnectRefusedRepliesGeneralFailure)
{
    boost::asio::io_context scratch;
    boost::asio::ip::tcp::acceptor closed(scratch);
    ASSERT_TRUE(test::open_ephemeral_tcp_acceptor(closed));
    const auto port = closed.local_endpoint().port();
    closed.close();

    const auto failures = statistics::instance().connect_failures();
    start_session();
    handshake_no_auth();
    test::write_bytes(app(), ipv4_request(0x01, port));

    EXPECT_THAT(test::read_until_eof(app()), ElementsAre(0x05, 0x01, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00));
    EXPECT_EQ(finish(), boost::asio::error::connection_refused);
    EXPECT_EQ(statistics::instance().connect_failures(), failures + 1);
}

TEST_F(socks_session_test, EmptyDomainFailsToConnect)
{
    start_session();
    handshake_no_auth();
    test::write_bytes(app(), domain_request("", 80));

    EXPECT_THAT(test::read_until_eof(app()), ElementsAre(0x05, 0x01, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00));
    EXPECT_EQ(finish(), boost::asio::error::host_not_found);
}

TEST_F(socks_session_test, DomainTargetResolved)
{
    start_session();
    handshake_no_auth();
    test::write_bytes(app(), domain_request("localhost", destination_port()));
    auto peer = accept_destination();

    const auto reply = test::read_bytes(app(), 4);
    ASSERT_EQ(reply.size(), 4U);
    EXPECT_EQ(reply[1], 0x00);

    test::write_bytes(peer, bytes_of("hi"));
    peer.close();
    shutdown_send(app());

    // rest of the bound address, then the relayed bytes
    const auto rest = test::read_until_eof(app());
    ASSERT_GE(rest.size(), 2U);
    EXPECT_EQ(std::vector<std::uint8_t>(rest.end() - 2, rest.end()), bytes_of("hi"));
    EXPECT_FALSE(finish());
    EXPECT_EQ(session()->context().target_info(), "localhost:" + std::to_string(destination_port()));
}

TEST_F(socks_session_test, StopClosesIdleSession)
{
    start_session();
    handshake_no_auth();
    session()->stop();

    EXPECT_TRUE(test::read_until_eof(app()).empty());
    EXPECT_TRUE(finish());
    EXPECT_EQ(session()->phase(), session_phase::kClosed);
}

TEST_F(socks_session_test, AuthDisabledSelectsNoAuth)
{
    start_session(false);
    test::write_bytes(app(), {0x05, 0x02, 0x02, 0x00});
    EXPECT_THAT(test::read_bytes(app(), 2), ElementsAre(0x05, 0x00));

    test::write_bytes(app(), ipv4_request(0x01, destination_port()));
    auto peer = accept_destination();
    const auto reply = test::read_bytes(app(), 10);
    ASSERT_EQ(reply.size(), 10U);
    EXPECT_EQ(reply[1], 0x00);

    peer.close();
    shutdown_send(app());
    EXPECT_TRUE(test::read_until_eof(app()).empty());
    EXPECT_FALSE(finish());
}

TEST_F(socks_session_test, AuthDisabledRejectsPasswordOnlyClient)
{
    start_session(false);
    test::write_bytes(app(), {0x05, 0x01, 0x02});
    EXPECT_THAT(test::read_bytes(app(), 2), ElementsAre(0x05, 0xFF));
    EXPECT_TRUE(test::read_until_eof(app()).empty());
    EXPECT_EQ(finish(), make_error_code(errc::kNoAcceptableMethod));
}

TEST_F(socks_session_test, FailedRejectReplyReportsTransportError)
{
    start_session();
    handshake_no_auth();

    // hold the session until the client has reset, so the 0x07 reply write fails
    std::promise<void> gate;
    boost::asio::post(io_context(), [released = gate.get_future().share()] { released.wait(); });

    boost::system::error_code ec;
    app().set_option(boost::asio::socket_base::linger(true, 0), ec);
    ASSERT_FALSE(ec);
    test::write_bytes(app(), ipv4_request(0x02, destination_port()));
    app().close(ec);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    gate.set_value();

    const auto session_ec = finish();
    EXPECT_TRUE(session_ec);
    EXPECT_NE(session_ec, make_error_code(errc::kUnsupportedCommand));
    EXPECT_NE(session_ec.category(), socks_category());
}

TEST_F(socks_session_test, Ipv6ConnectRepliesWithIpv6Bound)
{
    boost::asio::io_context scratch;
    boost::asio::ip::tcp::acceptor v6_destination(scratch);
    if (!test::open_ephemeral_tcp_acceptor(v6_destination, boost::asio::ip::make_address("::1"), 4))
    {
        GTEST_SKIP() << "ipv6 loopback unavailable";
    }
    const auto port = v6_destination.local_endpoint().port();

    start_session();
    handshake_no_auth();
    socks_address target;
    target.value = boost::asio::ip::make_address_v6("::1");
    test::write_bytes(app(), socks_codec::encode_request(socks::kCmdConnect, target, port));

    boost::asio::ip::tcp::socket peer(scratch);
    v6_destination.accept(peer);
    const auto reply = test::read_bytes(app(), 22);
    ASSERT_EQ(reply.size(), 22U);
    EXPECT_THAT(std::vector<std::uint8_t>(reply.begin(), reply.begin() + 4), ElementsAre(0x05, 0x00, 0x00, 0x04));
    boost::asio::ip::address_v6::bytes_type bound_bytes;
    std::copy(reply.begin() + 4, reply.begin() + 20, bound_bytes.begin());
    EXPECT_EQ(boost::asio::ip::address_v6(bound_bytes), boost::asio::ip::make_address_v6("::1"));
    EXPECT_EQ(static_cast<std::uint16_t>((reply[20] << 8) | reply[21]), peer.remote_endpoint().port());

    test::write_bytes(peer, bytes_of("v6"));
    EXPECT_EQ(test::read_bytes(app(), 2), bytes_of("v6"));

    peer.close();
    shutdown_send(app());
    EXPECT_TRUE(test::read_until_eof(app()).empty());
    EXPECT_FALSE(finish());
}

TEST(SessionPhaseTest, Names)
{
    EXPECT_STREQ(session_phase_name(session_phase::kGreeting), "greeting");
    EXPECT_STREQ(session_phase_name(session_phase::kRelay), "relay");
    EXPECT_STREQ(session_phase_name(session_phase::kClosed), "closed");
}

}    // namespace socks5d
