#ifndef SOCKS_SESSION_H
#define SOCKS_SESSION_H

#include <atomic>
#include <memory>
#include <vector>
#include <cstdint>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/system/error_code.hpp>

#include "relay.h"
#include "protocol.h"
#include "log_context.h"
#include "authenticator.h"

namespace socks5d
{

enum class session_phase : std::uint8_t
{
    kGreeting,
    kAuthentication,
    kRequest,
    kConnect,
    kRelay,
    kClosed,
};

[[nodiscard]] const char* session_phase_name(session_phase phase);

// One accepted client connection. The session owns the client socket for its
// whole life and the outbound socket from a successful connect until the
// relay is over.
class socks_session : public std::enable_shared_from_this<socks_session>
{
   public:
    // A null `auth` turns username/password authentication off.
    socks_session(boost::asio::ip::tcp::socket socket, std::shared_ptr<const authenticator> auth, std::uint32_t conn_id);

    // Runs the session detached on the socket's executor and logs its outcome.
    void start();

    void stop();

    // Drives the session through every phase. Both sockets are closed when
    // the returned awaitable completes.
    [[nodiscard]] boost::asio::awaitable<boost::system::error_code> run();

    [[nodiscard]] session_phase phase() const { return phase_.load(std::memory_order_acquire); }
    [[nodiscard]] const connection_context& context() const { return ctx_; }
    [[nodiscard]] const relay_result& transferred() const { return transferred_; }

   private:
    [[nodiscard]] boost::asio::awaitable<boost::system::error_code> run_phases();
    [[nodiscard]] boost::asio::awaitable<boost::system::error_code> negotiate_method(std::uint8_t& method);
    [[nodiscard]] boost::asio::awaitable<boost::system::error_code> authenticate_client();
    [[nodiscard]] boost::asio::awaitable<boost::system::error_code> reject_command(const socks_request& request);
    [[nodiscard]] boost::asio::awaitable<boost::system::error_code> connect_remote(const socks_request& request);
    [[nodiscard]] boost::asio::awaitable<boost::system::error_code> resolve_and_connect(const socks_request& request);
    [[nodiscard]] boost::asio::awaitable<boost::system::error_code> relay_streams();
    [[nodiscard]] boost::asio::awaitable<boost::system::error_code> write_to_client(std::vector<std::uint8_t> data);

    void set_phase(session_phase phase);
    void close_sockets();

   private:
    std::atomic<session_phase> phase_{session_phase::kGreeting};
    connection_context ctx_;
    boost::asio::ip::tcp::socket client_;
    boost::asio::ip::tcp::socket remote_;
    std::shared_ptr<const authenticator> auth_;
    relay_result transferred_;
};

}    // namespace socks5d

#endif
