#ifndef PROTOCOL_H
#define PROTOCOL_H

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <variant>
#include <optional>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/system/error_code.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/address_v6.hpp>

namespace socks5d
{

namespace socks
{
constexpr std::uint8_t kVer = 0x05;
constexpr std::uint8_t kAuthVer = 0x01;

constexpr std::uint8_t kMethodNoAuth = 0x00;
constexpr std::uint8_t kMethodGssapi = 0x01;
constexpr std::uint8_t kMethodPassword = 0x02;
constexpr std::uint8_t kMethodNoAcceptable = 0xFF;

constexpr std::uint8_t kCmdConnect = 0x01;
constexpr std::uint8_t kCmdBind = 0x02;
constexpr std::uint8_t kCmdUdpAssociate = 0x03;

constexpr std::uint8_t kAtypIpv4 = 0x01;
constexpr std::uint8_t kAtypDomain = 0x03;
constexpr std::uint8_t kAtypIpv6 = 0x04;

constexpr std::uint8_t kAuthSuccess = 0x00;
constexpr std::uint8_t kAuthFailure = 0x01;

constexpr std::size_t kMaxDomainLen = 255;
}    // namespace socks

enum class socks_command : std::uint8_t
{
    kConnect,
    kBind,
    kUdpAssociate,
    kUnknown,
};

enum class reply_code : std::uint8_t
{
    kSucceeded = 0x00,
    kGeneralFailure = 0x01,
    kNotAllowed = 0x02,
    kNetworkUnreachable = 0x03,
    kHostUnreachable = 0x04,
    kConnectionRefused = 0x05,
    kTtlExpired = 0x06,
    kCommandNotSupported = 0x07,
    kAddressTypeNotSupported = 0x08,
};

struct greeting
{
    std::uint8_t version = socks::kVer;
    std::vector<std::uint8_t> methods;

    [[nodiscard]] bool offers(std::uint8_t method) const;
};

struct auth_request
{
    std::uint8_t version = socks::kAuthVer;
    std::string username;
    std::string password;
};

// Destination as carried on the wire. Domain names are kept as decoded text
// and resolved only when connecting.
struct socks_address
{
    std::variant<boost::asio::ip::address_v4, boost::asio::ip::address_v6, std::string> value;

    [[nodiscard]] std::uint8_t atyp() const;
    [[nodiscard]] bool is_domain() const { return std::holds_alternative<std::string>(value); }
    [[nodiscard]] std::string to_string() const;
};

struct socks_request
{
    socks_command command = socks_command::kConnect;
    std::uint8_t command_code = socks::kCmdConnect;
    socks_address address;
    std::uint16_t port = 0;
};

[[nodiscard]] socks_command command_from_code(std::uint8_t code);

[[nodiscard]] const char* command_name(socks_command command);

class socks_codec
{
   public:
    [[nodiscard]] static boost::asio::ip::address normalize_ip_address(const boost::asio::ip::address& addr);

    // UTF-8 decoding where every maximal invalid subpart becomes U+FFFD.
    [[nodiscard]] static std::string decode_text_lossy(const std::uint8_t* data, std::size_t len);

    // Each read consumes exactly the bytes of one message or fails. Version
    // bytes are checked before any dependent field is read.
    [[nodiscard]] static boost::asio::awaitable<boost::system::error_code> read_greeting(boost::asio::ip::tcp::socket& socket, greeting& out);
    [[nodiscard]] static boost::asio::awaitable<boost::system::error_code> read_auth_request(boost::asio::ip::tcp::socket& socket,
                                                                                             auth_request& out);
    [[nodiscard]] static boost::asio::awaitable<boost::system::error_code> read_request(boost::asio::ip::tcp::socket& socket,
                                                                                        socks_request& out);

    [[nodiscard]] static std::vector<std::uint8_t> encode_method_selection(std::uint8_t method);
    [[nodiscard]] static std::vector<std::uint8_t> encode_auth_result(bool success);
    [[nodiscard]] static std::vector<std::uint8_t> encode_reply(reply_code rep, const std::optional<boost::asio::ip::tcp::endpoint>& bound);

    [[nodiscard]] static std::vector<std::uint8_t> encode_greeting(const std::vector<std::uint8_t>& methods);
    [[nodiscard]] static std::vector<std::uint8_t> encode_auth_request(const std::string& username, const std::string& password);
    [[nodiscard]] static std::vector<std::uint8_t> encode_request(std::uint8_t command_code, const socks_address& address, std::uint16_t port);
};

}    // namespace socks5d

#endif
