#ifndef SOCKS_SERVER_H
#define SOCKS_SERVER_H

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include "config.h"
#include "context_pool.h"
#include "authenticator.h"

namespace socks5d
{

class socks_session;

enum class socks_server_state : std::uint8_t
{
    kStopped,
    kRunning,
    kStopping,
};

class socks_server : public std::enable_shared_from_this<socks_server>
{
   public:
    // Sessions share `auth`; null disables username/password authentication.
    socks_server(io_context_pool& pool, const config::socks_t& socks_config, std::shared_ptr<const authenticator> auth);

    void start();

    void stop();

    [[nodiscard]] std::uint16_t listen_port() const { return listen_port_.load(std::memory_order_acquire); }
    [[nodiscard]] bool running() const { return state_.load(std::memory_order_acquire) == socks_server_state::kRunning; }
    [[nodiscard]] std::size_t live_sessions();

   private:
    [[nodiscard]] static boost::asio::awaitable<void> accept_loop_detached(std::shared_ptr<socks_server> self);
    boost::asio::awaitable<void> accept_loop();
    void start_session(boost::asio::ip::tcp::socket socket);

   private:
    std::atomic<socks_server_state> state_{socks_server_state::kStopped};
    std::atomic<std::uint16_t> listen_port_{0};
    std::atomic<std::uint32_t> next_conn_id_{1};
    io_context_pool& pool_;
    boost::asio::io_context& io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    config::socks_t socks_config_;
    std::shared_ptr<const authenticator> auth_;
    std::mutex sessions_mu_;
    std::vector<std::weak_ptr<socks_session>> sessions_;
};

}    // namespace socks5d

#endif
