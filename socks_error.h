#ifndef SOCKS_ERROR_H
#define SOCKS_ERROR_H

#include <type_traits>

#include <boost/system/error_code.hpp>

namespace socks5d
{

// Protocol level failures of one session. Transport and connect failures
// are passed through as asio/system error codes.
enum class errc : int
{
    kProtocolVersion = 1,
    kMalformedRequest,
    kUnsupportedAddressType,
    kNoAcceptableMethod,
    kAuthenticationFailed,
    kUnsupportedCommand,
    kPanicRecovered,
};

[[nodiscard]] const boost::system::error_category& socks_category() noexcept;

[[nodiscard]] boost::system::error_code make_error_code(errc e) noexcept;

}    // namespace socks5d

template <>
struct boost::system::is_error_code_enum<socks5d::errc> : std::true_type
{
};

#endif
