#ifndef RELAY_H
#define RELAY_H

#include <cstddef>
#include <cstdint>
#include <functional>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/system/error_code.hpp>

namespace socks5d
{

enum class relay_direction : std::uint8_t
{
    kClientToRemote,
    kRemoteToClient,
};

[[nodiscard]] const char* relay_direction_name(relay_direction direction);

struct relay_result
{
    std::uint64_t client_to_remote = 0;
    std::uint64_t remote_to_client = 0;
};

// Called after every chunk has been written in full.
using relay_observer = std::function<void(relay_direction, std::size_t)>;

// Copies bytes in both directions until each side reaches end-of-stream or
// fails. The client to remote direction runs in a coroutine spawned on the
// client socket's executor, the caller runs the other one. When a direction
// ends its destination send half and source receive half are shut down.
//
// Returns only after both directions finished. An exception leaving either
// direction is reported as errc::kPanicRecovered, otherwise the remote to
// client error wins over the client to remote one. Byte counts in `result`
// are filled in every case. Both sockets must share a single-threaded
// executor.
[[nodiscard]] boost::asio::awaitable<boost::system::error_code> relay(boost::asio::ip::tcp::socket& client,
                                                                      boost::asio::ip::tcp::socket& remote,
                                                                      relay_result& result,
                                                                      relay_observer observer = {});

}    // namespace socks5d

#endif
