#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <variant>
#include <optional>

#include <boost/asio/post.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/system/error_code.hpp>

#include "log.h"
#include "relay.h"
#include "protocol.h"
#include "statistics.h"
#include "socks_error.h"
#include "log_context.h"
#include "socks_session.h"
#include "authenticator.h"

namespace socks5d
{

namespace
{

std::string methods_to_string(const std::vector<std::uint8_t>& methods)
{
    std::string out;
    for (const auto m : methods)
    {
        if (!out.empty())
        {
            out += ' ';
        }
        out += std::to_string(m);
    }
    return out;
}

// With authentication disabled username/password is never selected, even
// when it is the only method offered.
std::uint8_t select_method(const greeting& hello, const bool auth_enabled)
{
    if (auth_enabled && hello.offers(socks::kMethodPassword))
    {
        return socks::kMethodPassword;
    }
    if (hello.offers(socks::kMethodNoAuth))
    {
        return socks::kMethodNoAuth;
    }
    return socks::kMethodNoAcceptable;
}

void close_socket(boost::asio::ip::tcp::socket& socket)
{
    if (!socket.is_open())
    {
        return;
    }
    boost::system::error_code ignore;
    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore);
    socket.close(ignore);
}

}    // namespace

const char* session_phase_name(const session_phase phase)
{
    switch (phase)
    {
        case session_phase::kGreeting:
            return "greeting";
        case session_phase::kAuthentication:
            return "authentication";
        case session_phase::kRequest:
            return "request";
        case session_phase::kConnect:
            return "connect";
        case session_phase::kRelay:
            return "relay";
        case session_phase::kClosed:
            return "closed";
    }
    return "unknown";
}

socks_session::socks_session(boost::asio::ip::tcp::socket socket, std::shared_ptr<const authenticator> auth, const std::uint32_t conn_id)
    : client_(std::move(socket)), remote_(client_.get_executor()), auth_(std::move(auth))
{
    ctx_.new_trace_id();
    ctx_.conn_id = conn_id;
    boost::system::error_code ec;
    const auto ep = client_.remote_endpoint(ec);
    if (!ec)
    {
        ctx_.client_addr = socks_codec::normalize_ip_address(ep.address()).to_string();
        ctx_.client_port = ep.port();
    }
    else
    {
        ctx_.client_addr = "unknown";
    }
}

void socks_session::start()
{
    auto self = shared_from_this();
    boost::asio::co_spawn(client_.get_executor(),
                          [self]() -> boost::asio::awaitable<void>
                          {
                              const auto ec = co_await self->run();
                              if (ec)
                              {
                                  LOG_CTX_WARN(self->ctx_, "{} session ended error {}", log_event::kConnClose, ec.message());
                              }
                          },
                          boost::asio::detached);
}

void socks_session::stop()
{
    boost::asio::post(client_.get_executor(),
                      [self = shared_from_this()]()
                      {
                          LOG_CTX_DEBUG(self->ctx_, "{} stop requested in phase {}", log_event::kConnClose, session_phase_name(self->phase()));
                          self->close_sockets();
                      });
}

boost::asio::awaitable<boost::system::error_code> socks_session::run()
{
    auto& stats = statistics::instance();
    stats.inc_total_connections();
    stats.inc_active_connections();
    LOG_CTX_INFO(ctx_, "{} session started from {}", log_event::kAccept, ctx_.client_info());

    const auto ec = co_await run_phases();

    set_phase(session_phase::kClosed);
    close_sockets();
    stats.dec_active_connections();
    LOG_CTX_INFO(ctx_, "{} closed {} {}", log_event::kConnClose, ctx_.target_info(), ctx_.stats_summary());
    co_return ec;
}

boost::asio::awaitable<boost::system::error_code> socks_session::run_phases()
{
    std::uint8_t method = socks::kMethodNoAcceptable;
    if (auto ec = co_await negotiate_method(method))
    {
        co_return ec;
    }

    if (method == socks::kMethodPassword)
    {
        set_phase(session_phase::kAuthentication);
        if (auto ec = co_await authenticate_client())
        {
            co_return ec;
        }
    }

    set_phase(session_phase::kRequest);
    socks_request request;
    if (auto ec = co_await socks_codec::read_request(client_, request))
    {
        LOG_CTX_WARN(ctx_, "{} read request failed {}", log_event::kRequest, ec.message());
        co_return ec;
    }
    ctx_.set_target(request.address.to_string(), request.port);
    LOG_CTX_INFO(ctx_, "{} cmd {} target {}", log_event::kRequest, command_name(request.command), ctx_.target_info());

    if (request.command != socks_command::kConnect)
    {
        co_return co_await reject_command(request);
    }

    set_phase(session_phase::kConnect);
    if (auto ec = co_await connect_remote(request))
    {
        co_return ec;
    }

    set_phase(session_phase::kRelay);
    co_return co_await relay_streams();
}

boost::asio::awaitable<boost::system::error_code> socks_session::negotiate_method(std::uint8_t& method)
{
    greeting hello;
    if (auto ec = co_await socks_codec::read_greeting(client_, hello))
    {
        LOG_CTX_WARN(ctx_, "{} read greeting failed {}", log_event::kHandshake, ec.message());
        co_return ec;
    }

    method = select_method(hello, auth_ != nullptr);
    LOG_CTX_DEBUG(ctx_, "{} offered methods [{}] selected {}", log_event::kHandshake, methods_to_string(hello.methods), method);

    if (auto ec = co_await write_to_client(socks_codec::encode_method_selection(method)))
    {
        LOG_CTX_WARN(ctx_, "{} write method selection failed {}", log_event::kHandshake, ec.message());
        co_return ec;
    }

    if (method == socks::kMethodNoAcceptable)
    {
        LOG_CTX_WARN(ctx_, "{} no acceptable method in [{}]", log_event::kHandshake, methods_to_string(hello.methods));
        co_return make_error_code(errc::kNoAcceptableMethod);
    }
    co_return boost::system::error_code{};
}

boost::asio::awaitable<boost::system::error_code> socks_session::authenticate_client()
{
    auth_request req;
    const auto read_ec = co_await socks_codec::read_auth_request(client_, req);
    if (read_ec && read_ec != make_error_code(errc::kProtocolVersion))
    {
        LOG_CTX_WARN(ctx_, "{} read auth request failed {}", log_event::kAuth, read_ec.message());
        co_return read_ec;
    }

    const bool accepted = !read_ec && auth_->authenticate(req.username, req.password);
    if (auto ec = co_await write_to_client(socks_codec::encode_auth_result(accepted)))
    {
        LOG_CTX_WARN(ctx_, "{} write auth result failed {}", log_event::kAuth, ec.message());
        co_return ec;
    }

    if (!accepted)
    {
        statistics::instance().inc_auth_failures();
        if (read_ec)
        {
            LOG_CTX_WARN(ctx_, "{} bad sub negotiation version", log_event::kAuth);
        }
        else
        {
            LOG_CTX_WARN(ctx_, "{} rejected user {}", log_event::kAuth, req.username);
        }
        co_return make_error_code(errc::kAuthenticationFailed);
    }

    LOG_CTX_DEBUG(ctx_, "{} accepted user {}", log_event::kAuth, req.username);
    co_return boost::system::error_code{};
}

boost::asio::awaitable<boost::system::error_code> socks_session::reject_command(const socks_request& request)
{
    statistics::instance().inc_rejected_commands();
    LOG_CTX_WARN(ctx_, "{} cmd {} code {} not supported", log_event::kRequest, command_name(request.command), request.command_code);
    if (auto ec = co_await write_to_client(socks_codec::encode_reply(reply_code::kCommandNotSupported, std::nullopt)))
    {
        co_return ec;
    }
    co_return make_error_code(errc::kUnsupportedCommand);
}

boost::asio::awaitable<boost::system::error_code> socks_session::connect_remote(const socks_request& request)
{
    const auto connect_ec = co_await resolve_and_connect(request);
    if (connect_ec)
    {
        statistics::instance().inc_connect_failures();
        LOG_CTX_WARN(ctx_, "{} connect {} failed {}", log_event::kConnect, ctx_.target_info(), connect_ec.message());
        close_socket(remote_);
        if (auto ec = co_await write_to_client(socks_codec::encode_reply(reply_code::kGeneralFailure, std::nullopt)))
        {
            co_return ec;
        }
        co_return connect_ec;
    }

    boost::system::error_code ep_ec;
    std::optional<boost::asio::ip::tcp::endpoint> bound;
    if (const auto local_ep = remote_.local_endpoint(ep_ec); !ep_ec)
    {
        bound = local_ep;
    }

    boost::system::error_code ignore;
    remote_.set_option(boost::asio::ip::tcp::no_delay(true), ignore);

    if (bound.has_value())
    {
        LOG_CTX_INFO(ctx_, "{} connected {} bound {}:{}", log_event::kConnect, ctx_.target_info(), bound->address().to_string(), bound->port());
    }
    else
    {
        LOG_CTX_INFO(ctx_, "{} connected {} bound unknown {}", log_event::kConnect, ctx_.target_info(), ep_ec.message());
    }
    co_return co_await write_to_client(socks_codec::encode_reply(reply_code::kSucceeded, bound));
}

boost::asio::awaitable<boost::system::error_code> socks_session::resolve_and_connect(const socks_request& request)
{
    std::vector<boost::asio::ip::tcp::endpoint> endpoints;
    if (const auto* v4 = std::get_if<boost::asio::ip::address_v4>(&request.address.value))
    {
        endpoints.emplace_back(*v4, request.port);
    }
    else if (const auto* v6 = std::get_if<boost::asio::ip::address_v6>(&request.address.value))
    {
        endpoints.emplace_back(*v6, request.port);
    }
    else
    {
        const auto& host = std::get<std::string>(request.address.value);
        if (host.empty())
        {
            co_return boost::system::error_code(boost::asio::error::host_not_found);
        }
        boost::asio::ip::tcp::resolver resolver(client_.get_executor());
        boost::system::error_code res_ec;
        const auto results =
            co_await resolver.async_resolve(host, std::to_string(request.port), boost::asio::redirect_error(boost::asio::use_awaitable, res_ec));
        if (res_ec)
        {
            co_return res_ec;
        }
        for (const auto& entry : results)
        {
            endpoints.push_back(entry.endpoint());
        }
    }

    boost::system::error_code last_ec = boost::asio::error::host_not_found;
    for (const auto& ep : endpoints)
    {
        close_socket(remote_);
        boost::system::error_code conn_ec;
        co_await remote_.async_connect(ep, boost::asio::redirect_error(boost::asio::use_awaitable, conn_ec));
        if (!conn_ec)
        {
            co_return boost::system::error_code{};
        }
        LOG_CTX_DEBUG(ctx_, "{} connect {}:{} failed {}", log_event::kConnect, ep.address().to_string(), ep.port(), conn_ec.message());
        last_ec = conn_ec;
    }
    co_return last_ec;
}

boost::asio::awaitable<boost::system::error_code> socks_session::relay_streams()
{
    auto& stats = statistics::instance();
    const auto ec = co_await relay(client_,
                                   remote_,
                                   transferred_,
                                   [this, &stats](const relay_direction direction, const std::size_t n)
                                   {
                                       if (direction == relay_direction::kClientToRemote)
                                       {
                                           ctx_.tx_bytes += n;
                                           stats.add_bytes_client_to_remote(n);
                                       }
                                       else
                                       {
                                           ctx_.rx_bytes += n;
                                           stats.add_bytes_remote_to_client(n);
                                       }
                                   });
    LOG_CTX_INFO(ctx_,
                 "{} finished client_to_remote {} remote_to_client {}",
                 log_event::kRelay,
                 transferred_.client_to_remote,
                 transferred_.remote_to_client);
    if (ec)
    {
        LOG_CTX_WARN(ctx_, "{} relay error {}", log_event::kRelay, ec.message());
    }
    co_return ec;
}

boost::asio::awaitable<boost::system::error_code> socks_session::write_to_client(std::vector<std::uint8_t> data)
{
    boost::system::error_code ec;
    (void)co_await boost::asio::async_write(client_, boost::asio::buffer(data), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    co_return ec;
}

void socks_session::set_phase(const session_phase phase)
{
    LOG_CTX_TRACE(ctx_, "phase {} -> {}", session_phase_name(phase_.load(std::memory_order_relaxed)), session_phase_name(phase));
    phase_.store(phase, std::memory_order_release);
}

void socks_session::close_sockets()
{
    close_socket(client_);
    close_socket(remote_);
}

}    // namespace socks5d
