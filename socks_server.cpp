#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <cstdint>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/system/error_code.hpp>

#include "log.h"
#include "config.h"
#include "context_pool.h"
#include "socks_server.h"
#include "socks_session.h"
#include "authenticator.h"

namespace socks5d
{

namespace
{

void close_acceptor(boost::asio::ip::tcp::acceptor& acceptor)
{
    boost::system::error_code close_ec;
    acceptor.close(close_ec);
    if (close_ec && close_ec != boost::asio::error::bad_descriptor)
    {
        LOG_ERROR("acceptor close failed {}", close_ec.message());
    }
}

bool setup_acceptor(boost::asio::ip::tcp::acceptor& acceptor,
                    const boost::asio::ip::tcp::endpoint& ep,
                    std::uint16_t& bound_port,
                    boost::system::error_code& ec)
{
    acceptor.open(ep.protocol(), ec);
    if (ec)
    {
        return false;
    }
    acceptor.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true), ec);
    if (!ec)
    {
        acceptor.bind(ep, ec);
    }
    if (!ec)
    {
        acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (!ec)
    {
        const auto bound_ep = acceptor.local_endpoint(ec);
        bound_port = bound_ep.port();
    }
    if (ec)
    {
        close_acceptor(acceptor);
        return false;
    }
    return true;
}

bool prepare_listener(boost::asio::ip::tcp::acceptor& acceptor, const std::string& host, const std::uint16_t port, std::uint16_t& bound_port)
{
    boost::system::error_code addr_ec;
    const auto listen_addr = boost::asio::ip::make_address(host, addr_ec);
    if (addr_ec)
    {
        LOG_ERROR("listen address {} invalid {}", host, addr_ec.message());
        return false;
    }

    boost::system::error_code setup_ec;
    if (!setup_acceptor(acceptor, boost::asio::ip::tcp::endpoint{listen_addr, port}, bound_port, setup_ec))
    {
        LOG_ERROR("acceptor setup on {}:{} failed {}", host, port, setup_ec.message());
        return false;
    }
    return true;
}

boost::asio::awaitable<void> wait_retry_delay(boost::asio::io_context& io_context)
{
    boost::asio::steady_timer retry_timer(io_context);
    retry_timer.expires_after(std::chrono::seconds(1));
    boost::system::error_code ignore;
    co_await retry_timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ignore));
}

void set_no_delay_or_log(boost::asio::ip::tcp::socket& socket)
{
    boost::system::error_code ec;
    socket.set_option(boost::asio::ip::tcp::no_delay(true), ec);
    if (ec)
    {
        LOG_WARN("failed to set no delay on accepted socket {}", ec.message());
    }
}

}    // namespace

socks_server::socks_server(io_context_pool& pool, const config::socks_t& socks_config, std::shared_ptr<const authenticator> auth)
    : listen_port_(socks_config.port),
      pool_(pool),
      io_context_(pool.get_io_context()),
      acceptor_(io_context_),
      socks_config_(socks_config),
      auth_(std::move(auth))
{
}

void socks_server::start()
{
    auto expected_state = socks_server_state::kStopped;
    if (!state_.compare_exchange_strong(expected_state, socks_server_state::kRunning, std::memory_order_acq_rel, std::memory_order_acquire))
    {
        LOG_WARN("socks server already started");
        return;
    }

    std::uint16_t bound_port = 0;
    if (!prepare_listener(acceptor_, socks_config_.host, socks_config_.port, bound_port))
    {
        state_.store(socks_server_state::kStopped, std::memory_order_release);
        return;
    }
    listen_port_.store(bound_port, std::memory_order_release);
    LOG_INFO("socks5 listening on {}:{}", socks_config_.host, bound_port);

    boost::asio::co_spawn(io_context_, accept_loop_detached(shared_from_this()), boost::asio::detached);
}

boost::asio::awaitable<void> socks_server::accept_loop_detached(std::shared_ptr<socks_server> self) { co_await self->accept_loop(); }

void socks_server::stop()
{
    LOG_INFO("socks server stopping");
    state_.store(socks_server_state::kStopping, std::memory_order_release);

    boost::asio::post(io_context_,
                      [self = shared_from_this()]()
                      {
                          close_acceptor(self->acceptor_);
                          self->state_.store(socks_server_state::kStopped, std::memory_order_release);
                      });

    std::vector<std::shared_ptr<socks_session>> to_stop;
    {
        const std::lock_guard<std::mutex> lock(sessions_mu_);
        for (const auto& weak_session : sessions_)
        {
            if (auto session = weak_session.lock())
            {
                to_stop.push_back(std::move(session));
            }
        }
        sessions_.clear();
    }
    for (const auto& session : to_stop)
    {
        session->stop();
    }
}

std::size_t socks_server::live_sessions()
{
    const std::lock_guard<std::mutex> lock(sessions_mu_);
    std::size_t count = 0;
    for (const auto& weak_session : sessions_)
    {
        if (!weak_session.expired())
        {
            ++count;
        }
    }
    return count;
}

boost::asio::awaitable<void> socks_server::accept_loop()
{
    while (running())
    {
        boost::asio::ip::tcp::socket socket(pool_.get_io_context());
        boost::system::error_code accept_ec;
        co_await acceptor_.async_accept(socket, boost::asio::redirect_error(boost::asio::use_awaitable, accept_ec));
        if (accept_ec == boost::asio::error::operation_aborted || !running())
        {
            break;
        }
        if (accept_ec)
        {
            LOG_ERROR("accept failed {}", accept_ec.message());
            co_await wait_retry_delay(io_context_);
            continue;
        }

        start_session(std::move(socket));
    }
    LOG_INFO("accept loop exited");
}

void socks_server::start_session(boost::asio::ip::tcp::socket socket)
{
    set_no_delay_or_log(socket);
    const auto conn_id = next_conn_id_.fetch_add(1, std::memory_order_relaxed);
    auto session = std::make_shared<socks_session>(std::move(socket), auth_, conn_id);
    {
        const std::lock_guard<std::mutex> lock(sessions_mu_);
        std::erase_if(sessions_, [](const std::weak_ptr<socks_session>& weak_session) { return weak_session.expired(); });
        sessions_.push_back(session);
    }
    session->start();
}

}    // namespace socks5d
