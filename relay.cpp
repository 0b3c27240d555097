#include <memory>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <exception>

#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/system/error_code.hpp>

#include "log.h"
#include "relay.h"
#include "socks_error.h"

namespace socks5d
{

namespace
{

constexpr std::size_t kRelayBufferSize = 16 * 1024;

// Completion of the spawned direction. The timer never expires on its own,
// it is cancelled once the direction is done.
struct spawned_direction
{
    explicit spawned_direction(const boost::asio::any_io_executor& executor)
        : done(executor, boost::asio::steady_timer::time_point::max())
    {
    }

    boost::asio::steady_timer done;
    bool finished = false;
    bool panicked = false;
    boost::system::error_code ec;
    std::uint64_t copied = 0;
};

void shutdown_halves(boost::asio::ip::tcp::socket& from, boost::asio::ip::tcp::socket& to)
{
    boost::system::error_code ignore;
    to.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignore);
    from.shutdown(boost::asio::ip::tcp::socket::shutdown_receive, ignore);
}

boost::asio::awaitable<boost::system::error_code> copy_stream(boost::asio::ip::tcp::socket& from,
                                                              boost::asio::ip::tcp::socket& to,
                                                              const relay_direction direction,
                                                              std::uint64_t& copied,
                                                              const relay_observer& observer)
{
    std::vector<std::uint8_t> buf(kRelayBufferSize);
    for (;;)
    {
        boost::system::error_code ec;
        const auto n = co_await from.async_read_some(boost::asio::buffer(buf), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec == boost::asio::error::eof)
        {
            co_return boost::system::error_code{};
        }
        if (ec)
        {
            co_return ec;
        }

        (void)co_await boost::asio::async_write(to, boost::asio::buffer(buf.data(), n), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec)
        {
            co_return ec;
        }
        copied += n;
        if (observer)
        {
            observer(direction, n);
        }
    }
}

// Runs one direction and always shuts the halves down afterwards, also when
// the copy throws.
boost::asio::awaitable<boost::system::error_code> run_direction(boost::asio::ip::tcp::socket& from,
                                                                boost::asio::ip::tcp::socket& to,
                                                                const relay_direction direction,
                                                                std::uint64_t& copied,
                                                                const relay_observer& observer)
{
    boost::system::error_code ec;
    try
    {
        ec = co_await copy_stream(from, to, direction, copied, observer);
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("relay {} direction exception {}", relay_direction_name(direction), e.what());
        shutdown_halves(from, to);
        throw;
    }
    shutdown_halves(from, to);
    LOG_DEBUG("relay {} direction finished bytes {} error {}", relay_direction_name(direction), copied, ec.message());
    co_return ec;
}

boost::asio::awaitable<boost::system::error_code> run_spawned_direction(boost::asio::ip::tcp::socket& from,
                                                                        boost::asio::ip::tcp::socket& to,
                                                                        std::shared_ptr<spawned_direction> state,
                                                                        std::shared_ptr<const relay_observer> observer)
{
    co_return co_await run_direction(from, to, relay_direction::kClientToRemote, state->copied, *observer);
}

}    // namespace

const char* relay_direction_name(const relay_direction direction)
{
    return direction == relay_direction::kClientToRemote ? "client_to_remote" : "remote_to_client";
}

boost::asio::awaitable<boost::system::error_code> relay(boost::asio::ip::tcp::socket& client,
                                                        boost::asio::ip::tcp::socket& remote,
                                                        relay_result& result,
                                                        relay_observer observer)
{
    const auto executor = client.get_executor();
    auto state = std::make_shared<spawned_direction>(executor);
    auto shared_observer = std::make_shared<const relay_observer>(std::move(observer));

    boost::asio::co_spawn(executor,
                          run_spawned_direction(client, remote, state, shared_observer),
                          boost::asio::bind_executor(executor,
                                                     [state](const std::exception_ptr& ep, const boost::system::error_code ec)
                                                     {
                                                         state->finished = true;
                                                         state->panicked = (ep != nullptr);
                                                         state->ec = ec;
                                                         state->done.cancel();
                                                     }));

    bool panicked = false;
    boost::system::error_code remote_to_client_ec;
    try
    {
        remote_to_client_ec = co_await run_direction(remote, client, relay_direction::kRemoteToClient, result.remote_to_client, *shared_observer);
    }
    catch (const std::exception& e)
    {
        panicked = true;
        LOG_ERROR("relay remote_to_client recovered from {}", e.what());
    }

    if (!state->finished)
    {
        boost::system::error_code wait_ec;
        co_await state->done.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, wait_ec));
    }
    result.client_to_remote = state->copied;

    if (panicked || state->panicked)
    {
        co_return make_error_code(errc::kPanicRecovered);
    }
    if (remote_to_client_ec)
    {
        co_return remote_to_client_ec;
    }
    co_return state->ec;
}

}    // namespace socks5d
