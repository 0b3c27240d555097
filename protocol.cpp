#include <array>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <variant>
#include <optional>
#include <algorithm>

#include <boost/asio/read.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/system/error_code.hpp>

#include "protocol.h"
#include "socks_error.h"

namespace socks5d
{

namespace
{

constexpr char kReplacementChar[] = "\xEF\xBF\xBD";

boost::asio::awaitable<boost::system::error_code> read_exact(boost::asio::ip::tcp::socket& socket, const boost::asio::mutable_buffer buffer)
{
    boost::system::error_code ec;
    (void)co_await boost::asio::async_read(socket, buffer, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    co_return ec;
}

void append_port(std::vector<std::uint8_t>& buf, const std::uint16_t port)
{
    buf.push_back(static_cast<std::uint8_t>((port >> 8) & 0xFF));
    buf.push_back(static_cast<std::uint8_t>(port & 0xFF));
}

void append_address(std::vector<std::uint8_t>& buf, const boost::asio::ip::address& addr)
{
    if (addr.is_v4())
    {
        buf.push_back(socks::kAtypIpv4);
        const auto bytes = addr.to_v4().to_bytes();
        buf.insert(buf.end(), bytes.begin(), bytes.end());
        return;
    }
    buf.push_back(socks::kAtypIpv6);
    const auto bytes = addr.to_v6().to_bytes();
    buf.insert(buf.end(), bytes.begin(), bytes.end());
}

// Length of the sequence led by `lead` and the accepted range of its first
// continuation byte. A zero length marks a byte that can never start one.
struct utf8_lead
{
    std::size_t continuation = 0;
    std::uint8_t lower = 0x80;
    std::uint8_t upper = 0xBF;
};

utf8_lead classify_lead(const std::uint8_t lead)
{
    if (lead >= 0xC2 && lead <= 0xDF)
    {
        return {.continuation = 1};
    }
    if (lead == 0xE0)
    {
        return {.continuation = 2, .lower = 0xA0};
    }
    if (lead == 0xED)
    {
        return {.continuation = 2, .upper = 0x9F};
    }
    if (lead >= 0xE1 && lead <= 0xEF)
    {
        return {.continuation = 2};
    }
    if (lead == 0xF0)
    {
        return {.continuation = 3, .lower = 0x90};
    }
    if (lead >= 0xF1 && lead <= 0xF3)
    {
        return {.continuation = 3};
    }
    if (lead == 0xF4)
    {
        return {.continuation = 3, .upper = 0x8F};
    }
    return {};
}

}    // namespace

bool greeting::offers(const std::uint8_t method) const { return std::ranges::find(methods, method) != methods.end(); }

std::uint8_t socks_address::atyp() const
{
    if (std::holds_alternative<boost::asio::ip::address_v4>(value))
    {
        return socks::kAtypIpv4;
    }
    if (std::holds_alternative<boost::asio::ip::address_v6>(value))
    {
        return socks::kAtypIpv6;
    }
    return socks::kAtypDomain;
}

std::string socks_address::to_string() const
{
    if (const auto* v4 = std::get_if<boost::asio::ip::address_v4>(&value))
    {
        return v4->to_string();
    }
    if (const auto* v6 = std::get_if<boost::asio::ip::address_v6>(&value))
    {
        return v6->to_string();
    }
    return std::get<std::string>(value);
}

socks_command command_from_code(const std::uint8_t code)
{
    switch (code)
    {
        case socks::kCmdConnect:
            return socks_command::kConnect;
        case socks::kCmdBind:
            return socks_command::kBind;
        case socks::kCmdUdpAssociate:
            return socks_command::kUdpAssociate;
        default:
            return socks_command::kUnknown;
    }
}

const char* command_name(const socks_command command)
{
    switch (command)
    {
        case socks_command::kConnect:
            return "connect";
        case socks_command::kBind:
            return "bind";
        case socks_command::kUdpAssociate:
            return "udp_associate";
        case socks_command::kUnknown:
            break;
    }
    return "unknown";
}

boost::asio::ip::address socks_codec::normalize_ip_address(const boost::asio::ip::address& addr)
{
    if (addr.is_v6())
    {
        if (const auto v6 = addr.to_v6(); v6.is_v4_mapped())
        {
            return boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, v6);
        }
    }
    return addr;
}

std::string socks_codec::decode_text_lossy(const std::uint8_t* data, const std::size_t len)
{
    std::string out;
    out.reserve(len);
    std::size_t pos = 0;
    while (pos < len)
    {
        const std::uint8_t lead = data[pos];
        if (lead < 0x80)
        {
            out.push_back(static_cast<char>(lead));
            ++pos;
            continue;
        }

        const auto seq = classify_lead(lead);
        if (seq.continuation == 0)
        {
            out.append(kReplacementChar);
            ++pos;
            continue;
        }

        std::size_t next = pos + 1;
        bool complete = true;
        for (std::size_t i = 0; i < seq.continuation; ++i, ++next)
        {
            const std::uint8_t lower = (i == 0) ? seq.lower : static_cast<std::uint8_t>(0x80);
            const std::uint8_t upper = (i == 0) ? seq.upper : static_cast<std::uint8_t>(0xBF);
            if (next >= len || data[next] < lower || data[next] > upper)
            {
                complete = false;
                break;
            }
        }

        if (complete)
        {
            out.append(reinterpret_cast<const char*>(data) + pos, next - pos);
        }
        else
        {
            // the offending byte is not consumed, it may start the next sequence
            out.append(kReplacementChar);
        }
        pos = next;
    }
    return out;
}

boost::asio::awaitable<boost::system::error_code> socks_codec::read_greeting(boost::asio::ip::tcp::socket& socket, greeting& out)
{
    std::uint8_t ver_nmethods[2] = {0};
    if (const auto ec = co_await read_exact(socket, boost::asio::buffer(ver_nmethods)))
    {
        co_return ec;
    }
    if (ver_nmethods[0] != socks::kVer)
    {
        co_return make_error_code(errc::kProtocolVersion);
    }

    out.version = ver_nmethods[0];
    out.methods.assign(ver_nmethods[1], 0);
    co_return co_await read_exact(socket, boost::asio::buffer(out.methods));
}

boost::asio::awaitable<boost::system::error_code> socks_codec::read_auth_request(boost::asio::ip::tcp::socket& socket, auth_request& out)
{
    std::uint8_t ver_ulen[2] = {0};
    if (const auto ec = co_await read_exact(socket, boost::asio::buffer(ver_ulen)))
    {
        co_return ec;
    }
    if (ver_ulen[0] != socks::kAuthVer)
    {
        co_return make_error_code(errc::kProtocolVersion);
    }
    out.version = ver_ulen[0];

    std::vector<std::uint8_t> username(ver_ulen[1]);
    if (const auto ec = co_await read_exact(socket, boost::asio::buffer(username)))
    {
        co_return ec;
    }

    std::uint8_t plen = 0;
    if (const auto ec = co_await read_exact(socket, boost::asio::buffer(&plen, 1)))
    {
        co_return ec;
    }

    std::vector<std::uint8_t> password(plen);
    if (const auto ec = co_await read_exact(socket, boost::asio::buffer(password)))
    {
        co_return ec;
    }

    out.username = decode_text_lossy(username.data(), username.size());
    out.password = decode_text_lossy(password.data(), password.size());
    co_return boost::system::error_code{};
}

boost::asio::awaitable<boost::system::error_code> socks_codec::read_request(boost::asio::ip::tcp::socket& socket, socks_request& out)
{
    std::array<std::uint8_t, 4> head = {0};
    if (const auto ec = co_await read_exact(socket, boost::asio::buffer(head)))
    {
        co_return ec;
    }
    if (head[0] != socks::kVer)
    {
        co_return make_error_code(errc::kProtocolVersion);
    }
    if (head[2] != 0x00)
    {
        co_return make_error_code(errc::kMalformedRequest);
    }

    out.command_code = head[1];
    out.command = command_from_code(head[1]);

    switch (head[3])
    {
        case socks::kAtypIpv4:
        {
            boost::asio::ip::address_v4::bytes_type bytes;
            if (const auto ec = co_await read_exact(socket, boost::asio::buffer(bytes)))
            {
                co_return ec;
            }
            out.address.value = boost::asio::ip::address_v4(bytes);
            break;
        }
        case socks::kAtypDomain:
        {
            std::uint8_t len = 0;
            if (const auto ec = co_await read_exact(socket, boost::asio::buffer(&len, 1)))
            {
                co_return ec;
            }
            std::vector<std::uint8_t> name(len);
            if (const auto ec = co_await read_exact(socket, boost::asio::buffer(name)))
            {
                co_return ec;
            }
            out.address.value = decode_text_lossy(name.data(), name.size());
            break;
        }
        case socks::kAtypIpv6:
        {
            boost::asio::ip::address_v6::bytes_type bytes;
            if (const auto ec = co_await read_exact(socket, boost::asio::buffer(bytes)))
            {
                co_return ec;
            }
            out.address.value = boost::asio::ip::address_v6(bytes);
            break;
        }
        default:
            co_return make_error_code(errc::kUnsupportedAddressType);
    }

    std::uint8_t port[2] = {0};
    if (const auto ec = co_await read_exact(socket, boost::asio::buffer(port)))
    {
        co_return ec;
    }
    out.port = static_cast<std::uint16_t>((port[0] << 8) | port[1]);
    co_return boost::system::error_code{};
}

std::vector<std::uint8_t> socks_codec::encode_method_selection(const std::uint8_t method) { return {socks::kVer, method}; }

std::vector<std::uint8_t> socks_codec::encode_auth_result(const bool success)
{
    return {socks::kAuthVer, success ? socks::kAuthSuccess : socks::kAuthFailure};
}

std::vector<std::uint8_t> socks_codec::encode_reply(const reply_code rep, const std::optional<boost::asio::ip::tcp::endpoint>& bound)
{
    std::vector<std::uint8_t> buf;
    buf.reserve(22);
    buf.push_back(socks::kVer);
    buf.push_back(static_cast<std::uint8_t>(rep));
    buf.push_back(0x00);

    if (!bound.has_value())
    {
        append_address(buf, boost::asio::ip::address_v4::any());
        append_port(buf, 0);
        return buf;
    }

    append_address(buf, bound->address());
    append_port(buf, bound->port());
    return buf;
}

std::vector<std::uint8_t> socks_codec::encode_greeting(const std::vector<std::uint8_t>& methods)
{
    const auto count = std::min<std::size_t>(methods.size(), 255);
    std::vector<std::uint8_t> buf;
    buf.reserve(2 + count);
    buf.push_back(socks::kVer);
    buf.push_back(static_cast<std::uint8_t>(count));
    buf.insert(buf.end(), methods.begin(), methods.begin() + static_cast<std::ptrdiff_t>(count));
    return buf;
}

std::vector<std::uint8_t> socks_codec::encode_auth_request(const std::string& username, const std::string& password)
{
    const auto ulen = std::min<std::size_t>(username.size(), 255);
    const auto plen = std::min<std::size_t>(password.size(), 255);
    std::vector<std::uint8_t> buf;
    buf.reserve(3 + ulen + plen);
    buf.push_back(socks::kAuthVer);
    buf.push_back(static_cast<std::uint8_t>(ulen));
    buf.insert(buf.end(), username.begin(), username.begin() + static_cast<std::ptrdiff_t>(ulen));
    buf.push_back(static_cast<std::uint8_t>(plen));
    buf.insert(buf.end(), password.begin(), password.begin() + static_cast<std::ptrdiff_t>(plen));
    return buf;
}

std::vector<std::uint8_t> socks_codec::encode_request(const std::uint8_t command_code, const socks_address& address, const std::uint16_t port)
{
    std::vector<std::uint8_t> buf;
    buf.reserve(4 + 1 + socks::kMaxDomainLen + 2);
    buf.push_back(socks::kVer);
    buf.push_back(command_code);
    buf.push_back(0x00);

    if (const auto* v4 = std::get_if<boost::asio::ip::address_v4>(&address.value))
    {
        append_address(buf, *v4);
    }
    else if (const auto* v6 = std::get_if<boost::asio::ip::address_v6>(&address.value))
    {
        append_address(buf, *v6);
    }
    else
    {
        const auto& name = std::get<std::string>(address.value);
        const auto len = std::min(name.size(), socks::kMaxDomainLen);
        buf.push_back(socks::kAtypDomain);
        buf.push_back(static_cast<std::uint8_t>(len));
        buf.insert(buf.end(), name.begin(), name.begin() + static_cast<std::ptrdiff_t>(len));
    }

    append_port(buf, port);
    return buf;
}

}    // namespace socks5d
